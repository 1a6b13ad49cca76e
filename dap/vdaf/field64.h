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
#ifndef DAP_VDAF_FIELD64_H_
#define DAP_VDAF_FIELD64_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/numeric/int128.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace dap {
namespace vdaf {

// Arithmetic modulo the Goldilocks prime p = 2^64 - 2^32 + 1. Elements are
// kept in canonical form [0, p).
using FieldElement = uint64_t;

inline constexpr FieldElement kModulus = 0xFFFFFFFF00000001ull;
inline constexpr size_t kEncodedElementSize = sizeof(FieldElement);

inline FieldElement AddMod(FieldElement a, FieldElement b) {
  absl::uint128 sum = absl::uint128(a) + b;
  if (sum >= kModulus) sum -= kModulus;
  return absl::Uint128Low64(sum);
}

inline FieldElement SubMod(FieldElement a, FieldElement b) {
  return a >= b ? a - b : absl::Uint128Low64(absl::uint128(a) + kModulus - b);
}

inline FieldElement NegMod(FieldElement a) { return SubMod(0, a); }

inline FieldElement MulMod(FieldElement a, FieldElement b) {
  return absl::Uint128Low64((absl::uint128(a) * b) % kModulus);
}

// Reduces an arbitrary 64 bit value into the field.
inline FieldElement Reduce(uint64_t v) { return v % kModulus; }

// Draws a uniformly random element.
FieldElement RandomElement();

// Little endian, 8 bytes per element.
std::string EncodeVector(const std::vector<FieldElement>& input);
absl::StatusOr<std::vector<FieldElement>> DecodeVector(
    absl::string_view input);

// Elementwise sum. The vectors must be the same length.
absl::StatusOr<std::vector<FieldElement>> AddVectors(
    const std::vector<FieldElement>& a, const std::vector<FieldElement>& b);

}  // namespace vdaf
}  // namespace dap

#endif  // DAP_VDAF_FIELD64_H_
