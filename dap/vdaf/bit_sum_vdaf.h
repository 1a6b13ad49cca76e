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
#ifndef DAP_VDAF_BIT_SUM_VDAF_H_
#define DAP_VDAF_BIT_SUM_VDAF_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "dap/vdaf/field64.h"
#include "dap/vdaf/vdaf.h"

namespace dap {
namespace vdaf {

// Sums integers in [0, 2^bits) (a count when bits == 1).
//
// The Client splits every bit of the measurement into two additive shares and
// attaches shares of the per-bit validity terms b * (b - 1), which cancel for
// a well-formed report. Each aggregator binds its prep share to the verify
// key, nonce and public share with a SHA-256 tag; the prep message is the tag
// itself and is only produced when both tags agree and the random linear
// combination of the validity shares sums to zero.
class BitSumVdaf : public Vdaf {
 public:
  static constexpr size_t kVerifyKeySize = 16;
  static constexpr size_t kTagSize = 32;
  static constexpr size_t kPublicShareSize = 16;

  explicit BitSumVdaf(uint32_t bits) : bits_(bits) {}

  size_t verify_key_size() const override { return kVerifyKeySize; }
  size_t output_length() const override { return 1; }

  absl::StatusOr<ShardResult> Shard(uint64_t measurement,
                                    absl::string_view nonce) const override;

  absl::StatusOr<PrepareInitResult> PrepareInit(
      absl::string_view verify_key, int agg_id, absl::string_view nonce,
      absl::string_view public_share,
      absl::string_view input_share) const override;

  absl::StatusOr<std::string> PrepareSharesToPrepareMessage(
      absl::string_view leader_prep_share,
      absl::string_view helper_prep_share) const override;

  absl::StatusOr<std::vector<FieldElement>> PrepareNext(
      absl::string_view prep_state, absl::string_view prep_msg) const override;

  absl::StatusOr<uint64_t> Unshard(
      const std::vector<std::vector<FieldElement>>& agg_shares,
      uint64_t num_measurements) const override;

 private:
  const uint32_t bits_;
};

}  // namespace vdaf
}  // namespace dap

#endif  // DAP_VDAF_BIT_SUM_VDAF_H_
