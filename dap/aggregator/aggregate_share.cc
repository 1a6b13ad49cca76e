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

#include "dap/aggregator/aggregate_share.h"

#include <vector>

#include "absl/status/status.h"
#include "dap/base/digest.h"
#include "dap/base/monitoring.h"
#include "dap/vdaf/field64.h"

namespace dap {
namespace aggregator {

namespace {

absl::Status AddInto(std::vector<vdaf::FieldElement>& accumulator,
                     const std::vector<vdaf::FieldElement>& other) {
  if (other.empty()) return absl::OkStatus();
  if (accumulator.empty()) {
    accumulator = other;
    return absl::OkStatus();
  }
  DAP_ASSIGN_OR_RETURN(accumulator, vdaf::AddVectors(accumulator, other));
  return absl::OkStatus();
}

}  // namespace

absl::Status AggregateShare::AddOutputShare(
    absl::string_view report_id, const std::vector<vdaf::FieldElement>& share) {
  DAP_RETURN_IF_ERROR(AddInto(data, share));
  report_count++;
  XorInto(checksum, ComputeSHA256(report_id));
  return absl::OkStatus();
}

absl::Status AggregateShare::Merge(const AggregateShare& other) {
  DAP_RETURN_IF_ERROR(AddInto(data, other.data));
  report_count += other.report_count;
  XorInto(checksum, other.checksum);
  return absl::OkStatus();
}

}  // namespace aggregator
}  // namespace dap
