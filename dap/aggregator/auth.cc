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

#include "dap/aggregator/auth.h"

#include <optional>

#include "absl/status/status.h"
#include "dap/aggregator/abort.h"
#include "openssl/mem.h"

namespace dap {
namespace aggregator {

bool BearerToken::operator==(const BearerToken& other) const {
  return token_.size() == other.token_.size() &&
         CRYPTO_memcmp(token_.data(), other.token_.data(), token_.size()) == 0;
}

absl::Status CheckBearerToken(const std::optional<BearerToken>& presented,
                              const BearerToken& expected) {
  if (!presented.has_value()) {
    return Abort(AbortKind::kUnauthorizedRequest, "missing bearer token");
  }
  if (*presented != expected) {
    return Abort(AbortKind::kUnauthorizedRequest, "incorrect bearer token");
  }
  return absl::OkStatus();
}

}  // namespace aggregator
}  // namespace dap
