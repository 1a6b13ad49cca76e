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
#ifndef DAP_AGGREGATOR_TASK_CONFIG_H_
#define DAP_AGGREGATOR_TASK_CONFIG_H_

#include <cstdint>
#include <vector>

#include "absl/functional/function_ref.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "dap/aggregator/batch_bucket.h"
#include "dap/protos/config.pb.h"
#include "dap/protos/messages.pb.h"

namespace dap {
namespace aggregator {

// Rounds time down to a multiple of the task's time precision. This is the
// start of the TIME_INTERVAL window containing the time.
uint64_t TruncateTime(const TaskConfig& task, uint64_t time);

// The TIME_INTERVAL query covering the window that contains now.
BatchSelector QueryForCurrentBatchWindow(const TaskConfig& task, uint64_t now);

// A task accepts reports strictly before its expiration.
inline bool IsExpired(const TaskConfig& task, uint64_t time) {
  return time >= task.expiration();
}

// Fails with QueryMismatch unless the query type is the task's.
absl::Status CheckQueryType(const TaskConfig& task, QueryType query_type);

// Checks a TIME_INTERVAL batch interval against the global bounds, in order:
// maximum duration, earliest start, latest end (each a BadRequest with the
// reason the Collector sees), then alignment to the time precision
// (BatchInvalid).
absl::Status ValidateBatchInterval(const TaskConfig& task,
                                   const GlobalConfig& global,
                                   const Interval& interval, uint64_t now);

// Validates a collect query or aggregate-share batch selector. batch_exists
// reports whether a FIXED_SIZE batch ID is known to this aggregator.
absl::Status ValidateQuery(
    const TaskConfig& task, const GlobalConfig& global,
    const BatchSelector& query, uint64_t now,
    absl::FunctionRef<absl::StatusOr<bool>(absl::string_view)> batch_exists);

// Fails with InvalidBatchSize unless report_count fits the task's batch size
// bounds.
absl::Status CheckBatchSize(const TaskConfig& task, uint64_t report_count);

// The bucket a report of an aggregation job is accounted to.
BatchBucket BucketForReport(const TaskConfig& task,
                            const PartialBatchSelector& part_batch_sel,
                            uint64_t report_time);

// Every bucket covered by a validated batch selector.
std::vector<BatchBucket> BucketsForSelector(const TaskConfig& task,
                                            const BatchSelector& batch_sel);

PartialBatchSelector ToPartialBatchSelector(const BatchSelector& batch_sel);

}  // namespace aggregator
}  // namespace dap

#endif  // DAP_AGGREGATOR_TASK_CONFIG_H_
