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
#ifndef DAP_BASE_DIGEST_H_
#define DAP_BASE_DIGEST_H_

#include <string>

#include "absl/strings/string_view.h"

namespace dap {

inline constexpr size_t kSha256DigestLength = 32;

// Returns the SHA256 hash for the given data. Note that the return value
// contains raw digest bytes, and not a human-readable hex-encoded string.
std::string ComputeSHA256(absl::string_view data);

// Returns HMAC-SHA256 of `data` under `key`, as raw digest bytes.
std::string ComputeHmacSHA256(absl::string_view key, absl::string_view data);

// XORs `other` into `accumulator`. Both must have the same length.
void XorInto(std::string& accumulator, absl::string_view other);

}  // namespace dap

#endif  // DAP_BASE_DIGEST_H_
