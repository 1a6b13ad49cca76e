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
#ifndef DAP_VDAF_VDAF_H_
#define DAP_VDAF_VDAF_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "dap/protos/config.pb.h"
#include "dap/vdaf/field64.h"

namespace dap {
namespace vdaf {

// Aggregator IDs of the two parties.
inline constexpr int kLeaderId = 0;
inline constexpr int kHelperId = 1;

struct ShardResult {
  std::string public_share;
  // One per aggregator, indexed by aggregator ID.
  std::vector<std::string> input_shares;
};

struct PrepareInitResult {
  std::string prep_state;
  std::string prep_share;
};

// A one round verifiable distributed aggregation function.
//
// Client:     Shard
// Aggregator: PrepareInit -> (exchange prep shares) ->
//             PrepareSharesToPrepareMessage (Leader) -> PrepareNext
// Collector:  Unshard
//
// Every method fails with INVALID_ARGUMENT on malformed or invalid input;
// the aggregators treat any failure as a per-report preparation error.
// Implementations must be thread-safe.
class Vdaf {
 public:
  virtual ~Vdaf() = default;

  virtual size_t verify_key_size() const = 0;
  // Number of field elements in an output or aggregate share.
  virtual size_t output_length() const = 0;

  virtual absl::StatusOr<ShardResult> Shard(uint64_t measurement,
                                            absl::string_view nonce) const = 0;

  virtual absl::StatusOr<PrepareInitResult> PrepareInit(
      absl::string_view verify_key, int agg_id, absl::string_view nonce,
      absl::string_view public_share, absl::string_view input_share) const = 0;

  // Combines the two prep shares into the prep message both aggregators
  // consume. Fails if the report is invalid.
  virtual absl::StatusOr<std::string> PrepareSharesToPrepareMessage(
      absl::string_view leader_prep_share,
      absl::string_view helper_prep_share) const = 0;

  // Returns the output share.
  virtual absl::StatusOr<std::vector<FieldElement>> PrepareNext(
      absl::string_view prep_state, absl::string_view prep_msg) const = 0;

  // Recovers the aggregate result from both aggregate shares.
  virtual absl::StatusOr<uint64_t> Unshard(
      const std::vector<std::vector<FieldElement>>& agg_shares,
      uint64_t num_measurements) const = 0;
};

// Returns the implementation for a task's VDAF config.
absl::StatusOr<std::unique_ptr<Vdaf>> CreateVdaf(const VdafConfig& config);

}  // namespace vdaf
}  // namespace dap

#endif  // DAP_VDAF_VDAF_H_
