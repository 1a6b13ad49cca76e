/*
 * Copyright 2024 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#ifndef DAP_AGGREGATOR_AUTH_H_
#define DAP_AGGREGATOR_AUTH_H_

#include <optional>
#include <string>
#include <utility>

#include "absl/status/status.h"

namespace dap {
namespace aggregator {

// Credential carried by Leader-to-Helper and Collector-to-Leader requests.
class BearerToken {
 public:
  explicit BearerToken(std::string token) : token_(std::move(token)) {}

  const std::string& value() const { return token_; }

  // Constant time comparison.
  bool operator==(const BearerToken& other) const;
  bool operator!=(const BearerToken& other) const { return !(*this == other); }

 private:
  std::string token_;
};

// Fails with UnauthorizedRequest unless the presented token matches the
// expected one.
absl::Status CheckBearerToken(const std::optional<BearerToken>& presented,
                              const BearerToken& expected);

}  // namespace aggregator
}  // namespace dap

#endif  // DAP_AGGREGATOR_AUTH_H_
