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
#ifndef DAP_AGGREGATOR_AGGREGATE_SHARE_H_
#define DAP_AGGREGATOR_AGGREGATE_SHARE_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "dap/base/digest.h"
#include "dap/vdaf/field64.h"

namespace dap {
namespace aggregator {

// Accumulated contribution of a set of reports to one aggregator's share of a
// batch. Combination is commutative and associative.
struct AggregateShare {
  uint64_t report_count = 0;
  // XOR of SHA-256(report ID) over the contributing reports.
  std::string checksum = std::string(kSha256DigestLength, '\0');
  // Empty until the first output share is added.
  std::vector<vdaf::FieldElement> data;

  bool empty() const { return report_count == 0; }

  // Adds one report's output share.
  absl::Status AddOutputShare(absl::string_view report_id,
                              const std::vector<vdaf::FieldElement>& share);

  absl::Status Merge(const AggregateShare& other);
};

}  // namespace aggregator
}  // namespace dap

#endif  // DAP_AGGREGATOR_AGGREGATE_SHARE_H_
