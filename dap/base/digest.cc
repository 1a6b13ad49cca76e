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

#include "dap/base/digest.h"

#include <cstdint>
#include <string>

#include "absl/strings/string_view.h"
#include "dap/base/monitoring.h"
#include "openssl/base.h"
#include "openssl/digest.h"
#include "openssl/hmac.h"

namespace dap {

std::string ComputeSHA256(absl::string_view data) {
  bssl::ScopedEVP_MD_CTX mdctx;
  const EVP_MD* sha256_md = EVP_sha256();
  DAP_CHECK(EVP_DigestInit_ex(mdctx.get(), sha256_md, nullptr));
  DAP_CHECK(EVP_DigestUpdate(mdctx.get(), data.data(), data.length()));

  std::string result(EVP_MD_size(sha256_md), '\0');
  DAP_CHECK(EVP_DigestFinal_ex(
      mdctx.get(), reinterpret_cast<uint8_t*>(result.data()), nullptr));
  return result;
}

std::string ComputeHmacSHA256(absl::string_view key, absl::string_view data) {
  std::string result(kSha256DigestLength, '\0');
  unsigned int result_len = 0;
  DAP_CHECK(HMAC(EVP_sha256(), key.data(), key.size(),
                 reinterpret_cast<const uint8_t*>(data.data()), data.size(),
                 reinterpret_cast<uint8_t*>(result.data()),
                 &result_len) != nullptr);
  DAP_CHECK(result_len == kSha256DigestLength);
  return result;
}

void XorInto(std::string& accumulator, absl::string_view other) {
  DAP_CHECK(accumulator.size() == other.size())
      << "XOR operands differ in length: " << accumulator.size() << " vs "
      << other.size();
  for (size_t i = 0; i < accumulator.size(); ++i) {
    accumulator[i] ^= other[i];
  }
}

}  // namespace dap
