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
#ifndef DAP_BASE_RANDOM_ID_H_
#define DAP_BASE_RANDOM_ID_H_

#include <cstddef>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace dap {

// Width of task, aggregation job, collect job and batch identifiers.
inline constexpr size_t kIdLength = 32;
// Width of report identifiers.
inline constexpr size_t kReportIdLength = 16;

// Returns `length` bytes from a cryptographically secure RNG.
std::string RandomBytes(size_t length);

// Generates a fresh 32 byte identifier.
inline std::string GenerateId() { return RandomBytes(kIdLength); }

// Identifiers appear in URLs and configuration files in unpadded base64url.
std::string IdToBase64Url(absl::string_view id);
absl::StatusOr<std::string> IdFromBase64Url(absl::string_view encoded,
                                            size_t expected_length = kIdLength);

}  // namespace dap

#endif  // DAP_BASE_RANDOM_ID_H_
