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

#include "dap/vdaf/field64.h"

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "dap/base/monitoring.h"
#include "dap/base/random_id.h"

namespace dap {
namespace vdaf {

FieldElement RandomElement() {
  // Rejection sampling keeps the distribution uniform.
  while (true) {
    std::string bytes = RandomBytes(kEncodedElementSize);
    FieldElement candidate = 0;
    for (size_t i = 0; i < kEncodedElementSize; ++i) {
      candidate |= static_cast<FieldElement>(static_cast<uint8_t>(bytes[i]))
                   << (8 * i);
    }
    if (candidate < kModulus) return candidate;
  }
}

std::string EncodeVector(const std::vector<FieldElement>& input) {
  std::string out;
  out.reserve(input.size() * kEncodedElementSize);
  for (FieldElement e : input) {
    for (size_t i = 0; i < kEncodedElementSize; ++i) {
      out.push_back(static_cast<char>((e >> (8 * i)) & 0xff));
    }
  }
  return out;
}

absl::StatusOr<std::vector<FieldElement>> DecodeVector(
    absl::string_view input) {
  if (input.size() % kEncodedElementSize != 0) {
    return DAP_STATUS(INVALID_ARGUMENT)
           << "encoded field vector has length " << input.size()
           << ", not a multiple of " << kEncodedElementSize;
  }
  std::vector<FieldElement> out;
  out.reserve(input.size() / kEncodedElementSize);
  for (size_t offset = 0; offset < input.size();
       offset += kEncodedElementSize) {
    FieldElement e = 0;
    for (size_t i = 0; i < kEncodedElementSize; ++i) {
      e |= static_cast<FieldElement>(static_cast<uint8_t>(input[offset + i]))
           << (8 * i);
    }
    if (e >= kModulus) {
      return DAP_STATUS(INVALID_ARGUMENT) << "field element out of range";
    }
    out.push_back(e);
  }
  return out;
}

absl::StatusOr<std::vector<FieldElement>> AddVectors(
    const std::vector<FieldElement>& a, const std::vector<FieldElement>& b) {
  if (a.size() != b.size()) {
    return DAP_STATUS(INVALID_ARGUMENT)
           << "cannot add field vectors of length " << a.size() << " and "
           << b.size();
  }
  std::vector<FieldElement> out(a.size());
  for (size_t i = 0; i < a.size(); ++i) {
    out[i] = AddMod(a[i], b[i]);
  }
  return out;
}

}  // namespace vdaf
}  // namespace dap
