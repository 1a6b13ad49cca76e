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

#include "dap/base/random_id.h"

#include <cstdint>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_format.h"
#include "dap/base/monitoring.h"
#include "openssl/rand.h"

namespace dap {

std::string RandomBytes(size_t length) {
  std::string bytes(length, '\0');
  int r = RAND_bytes(reinterpret_cast<unsigned char*>(bytes.data()), length);
  DAP_CHECK(r == 1);
  return bytes;
}

std::string IdToBase64Url(absl::string_view id) {
  // WebSafeBase64Escape does not emit padding.
  return absl::WebSafeBase64Escape(id);
}

absl::StatusOr<std::string> IdFromBase64Url(absl::string_view encoded,
                                            size_t expected_length) {
  std::string id;
  if (!absl::WebSafeBase64Unescape(encoded, &id)) {
    return absl::InvalidArgumentError(
        absl::StrFormat("'%s' is not valid base64url", encoded));
  }
  if (id.size() != expected_length) {
    return absl::InvalidArgumentError(
        absl::StrFormat("identifier has %d bytes, expected %d", id.size(),
                        expected_length));
  }
  return id;
}

}  // namespace dap
