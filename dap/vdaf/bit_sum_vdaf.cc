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

#include "dap/vdaf/bit_sum_vdaf.h"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "dap/base/digest.h"
#include "dap/base/monitoring.h"
#include "dap/base/random_id.h"
#include "dap/vdaf/field64.h"

namespace dap {
namespace vdaf {

namespace {

constexpr uint32_t kMaxBits = 63;

std::string ComputeTag(absl::string_view verify_key, absl::string_view nonce,
                       absl::string_view public_share) {
  return ComputeSHA256(absl::StrCat(verify_key, nonce, public_share));
}

// Coefficient applied to the j-th validity term, derived from the tag so
// neither aggregator chooses it alone.
FieldElement ValidityCoefficient(absl::string_view tag, uint32_t j) {
  std::string digest = ComputeSHA256(absl::StrCat(tag, j));
  uint64_t v = 0;
  for (int i = 0; i < 8; ++i) {
    v |= static_cast<uint64_t>(static_cast<uint8_t>(digest[i])) << (8 * i);
  }
  return Reduce(v);
}

}  // namespace

absl::StatusOr<ShardResult> BitSumVdaf::Shard(uint64_t measurement,
                                              absl::string_view nonce) const {
  if (bits_ < 64 && (measurement >> bits_) != 0) {
    return DAP_STATUS(INVALID_ARGUMENT)
           << "measurement " << measurement << " does not fit in " << bits_
           << " bits";
  }

  std::vector<FieldElement> leader(2 * bits_);
  std::vector<FieldElement> helper(2 * bits_);
  for (uint32_t j = 0; j < bits_; ++j) {
    FieldElement bit = (measurement >> j) & 1;
    leader[j] = RandomElement();
    helper[j] = SubMod(bit, leader[j]);

    FieldElement validity = MulMod(bit, SubMod(bit, 1));
    leader[bits_ + j] = RandomElement();
    helper[bits_ + j] = SubMod(validity, leader[bits_ + j]);
  }

  ShardResult result;
  result.public_share = RandomBytes(kPublicShareSize);
  result.input_shares.push_back(EncodeVector(leader));
  result.input_shares.push_back(EncodeVector(helper));
  return result;
}

absl::StatusOr<PrepareInitResult> BitSumVdaf::PrepareInit(
    absl::string_view verify_key, int agg_id, absl::string_view nonce,
    absl::string_view public_share, absl::string_view input_share) const {
  if (verify_key.size() != kVerifyKeySize) {
    return DAP_STATUS(INVALID_ARGUMENT)
           << "verify key has " << verify_key.size() << " bytes";
  }
  if (agg_id != kLeaderId && agg_id != kHelperId) {
    return DAP_STATUS(INVALID_ARGUMENT) << "unknown aggregator id " << agg_id;
  }
  DAP_ASSIGN_OR_RETURN(std::vector<FieldElement> share,
                       DecodeVector(input_share));
  if (share.size() != 2 * bits_) {
    return DAP_STATUS(INVALID_ARGUMENT)
           << "input share has " << share.size() << " elements, expected "
           << 2 * bits_;
  }

  std::string tag = ComputeTag(verify_key, nonce, public_share);
  FieldElement validity = 0;
  for (uint32_t j = 0; j < bits_; ++j) {
    validity = AddMod(validity, MulMod(ValidityCoefficient(tag, j),
                                       share[bits_ + j]));
  }

  std::vector<FieldElement> measurement_share(share.begin(),
                                              share.begin() + bits_);
  PrepareInitResult result;
  result.prep_state = absl::StrCat(tag, EncodeVector(measurement_share));
  result.prep_share = absl::StrCat(tag, EncodeVector({validity}));
  return result;
}

absl::StatusOr<std::string> BitSumVdaf::PrepareSharesToPrepareMessage(
    absl::string_view leader_prep_share,
    absl::string_view helper_prep_share) const {
  constexpr size_t kPrepShareSize = kTagSize + kEncodedElementSize;
  if (leader_prep_share.size() != kPrepShareSize ||
      helper_prep_share.size() != kPrepShareSize) {
    return DAP_STATUS(INVALID_ARGUMENT) << "malformed prep share";
  }
  absl::string_view tag = leader_prep_share.substr(0, kTagSize);
  if (tag != helper_prep_share.substr(0, kTagSize)) {
    return DAP_STATUS(INVALID_ARGUMENT) << "verification tags differ";
  }
  DAP_ASSIGN_OR_RETURN(std::vector<FieldElement> leader_validity,
                       DecodeVector(leader_prep_share.substr(kTagSize)));
  DAP_ASSIGN_OR_RETURN(std::vector<FieldElement> helper_validity,
                       DecodeVector(helper_prep_share.substr(kTagSize)));
  if (AddMod(leader_validity[0], helper_validity[0]) != 0) {
    return DAP_STATUS(INVALID_ARGUMENT) << "validity check failed";
  }
  return std::string(tag);
}

absl::StatusOr<std::vector<FieldElement>> BitSumVdaf::PrepareNext(
    absl::string_view prep_state, absl::string_view prep_msg) const {
  if (prep_state.size() != kTagSize + bits_ * kEncodedElementSize) {
    return DAP_STATUS(INVALID_ARGUMENT) << "malformed prep state";
  }
  if (prep_msg != prep_state.substr(0, kTagSize)) {
    return DAP_STATUS(INVALID_ARGUMENT)
           << "prep message does not match this report";
  }
  DAP_ASSIGN_OR_RETURN(std::vector<FieldElement> bits,
                       DecodeVector(prep_state.substr(kTagSize)));
  FieldElement out = 0;
  for (uint32_t j = 0; j < bits_; ++j) {
    out = AddMod(out, MulMod(bits[j], Reduce(uint64_t{1} << j)));
  }
  return std::vector<FieldElement>{out};
}

absl::StatusOr<uint64_t> BitSumVdaf::Unshard(
    const std::vector<std::vector<FieldElement>>& agg_shares,
    uint64_t num_measurements) const {
  if (agg_shares.empty()) {
    return DAP_STATUS(INVALID_ARGUMENT) << "no aggregate shares";
  }
  std::vector<FieldElement> total(output_length(), 0);
  for (const std::vector<FieldElement>& share : agg_shares) {
    DAP_ASSIGN_OR_RETURN(total, AddVectors(total, share));
  }
  if (bits_ == 1 && total[0] > num_measurements) {
    return DAP_STATUS(INVALID_ARGUMENT)
           << "count " << total[0] << " exceeds number of measurements "
           << num_measurements;
  }
  return total[0];
}

absl::StatusOr<std::unique_ptr<Vdaf>> CreateVdaf(const VdafConfig& config) {
  switch (config.type()) {
    case VdafConfig::COUNT:
      return std::make_unique<BitSumVdaf>(1);
    case VdafConfig::SUM:
      if (config.bits() == 0 || config.bits() > kMaxBits) {
        return DAP_STATUS(INVALID_ARGUMENT)
               << "SUM requires 1 to " << kMaxBits << " bits, got "
               << config.bits();
      }
      return std::make_unique<BitSumVdaf>(config.bits());
    default:
      return DAP_STATUS(INVALID_ARGUMENT)
             << "unsupported VDAF type " << VdafConfig::Type_Name(config.type());
  }
}

}  // namespace vdaf
}  // namespace dap
