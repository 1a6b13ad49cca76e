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

#include "dap/aggregator/task_config.h"

#include <cstdint>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "dap/aggregator/abort.h"
#include "dap/base/monitoring.h"

namespace dap {
namespace aggregator {

uint64_t TruncateTime(const TaskConfig& task, uint64_t time) {
  DAP_CHECK(task.time_precision() > 0);
  return time - (time % task.time_precision());
}

BatchSelector QueryForCurrentBatchWindow(const TaskConfig& task,
                                         uint64_t now) {
  BatchSelector query;
  query.set_query_type(TIME_INTERVAL);
  query.mutable_batch_interval()->set_start(TruncateTime(task, now));
  query.mutable_batch_interval()->set_duration(task.time_precision());
  return query;
}

absl::Status CheckQueryType(const TaskConfig& task, QueryType query_type) {
  if (query_type != task.query().type()) {
    return Abort(AbortKind::kQueryMismatch,
                 absl::StrCat("task expects ", QueryType_Name(task.query().type()),
                              " queries, got ", QueryType_Name(query_type)));
  }
  return absl::OkStatus();
}

absl::Status ValidateBatchInterval(const TaskConfig& task,
                                   const GlobalConfig& global,
                                   const Interval& interval, uint64_t now) {
  if (interval.duration() > global.max_batch_duration()) {
    return BadRequest("batch interval too large");
  }
  uint64_t past_bound =
      global.max_batch_duration() + global.min_batch_interval_start();
  uint64_t earliest_start = now > past_bound ? now - past_bound : 0;
  if (interval.start() < earliest_start) {
    return BadRequest("batch interval too far into past");
  }
  uint64_t latest_end = now + global.max_batch_interval_end();
  if (interval.start() > latest_end ||
      interval.duration() > latest_end - interval.start()) {
    return BadRequest("batch interval too far into future");
  }
  uint64_t precision = task.time_precision();
  if (interval.duration() == 0 || interval.start() % precision != 0 ||
      interval.duration() % precision != 0) {
    return Abort(AbortKind::kBatchInvalid,
                 "batch interval is not aligned to the time precision");
  }
  return absl::OkStatus();
}

absl::Status ValidateQuery(
    const TaskConfig& task, const GlobalConfig& global,
    const BatchSelector& query, uint64_t now,
    absl::FunctionRef<absl::StatusOr<bool>(absl::string_view)> batch_exists) {
  DAP_RETURN_IF_ERROR(CheckQueryType(task, query.query_type()));
  switch (query.query_type()) {
    case TIME_INTERVAL:
      return ValidateBatchInterval(task, global, query.batch_interval(), now);
    case FIXED_SIZE: {
      DAP_ASSIGN_OR_RETURN(bool exists, batch_exists(query.batch_id()));
      if (!exists) {
        return Abort(AbortKind::kBatchInvalid, "unrecognized batch ID");
      }
      return absl::OkStatus();
    }
    default:
      return Abort(AbortKind::kQueryMismatch, "query type not set");
  }
}

absl::Status CheckBatchSize(const TaskConfig& task, uint64_t report_count) {
  if (report_count < task.min_batch_size()) {
    return Abort(AbortKind::kInvalidBatchSize,
                 absl::StrCat("batch has ", report_count,
                              " reports, minimum is ", task.min_batch_size()));
  }
  if (task.query().type() == FIXED_SIZE &&
      report_count > task.query().max_batch_size()) {
    return Abort(AbortKind::kInvalidBatchSize,
                 absl::StrCat("batch has ", report_count,
                              " reports, maximum is ",
                              task.query().max_batch_size()));
  }
  return absl::OkStatus();
}

BatchBucket BucketForReport(const TaskConfig& task,
                            const PartialBatchSelector& part_batch_sel,
                            uint64_t report_time) {
  if (part_batch_sel.query_type() == FIXED_SIZE) {
    return BatchBucket::FixedSize(part_batch_sel.batch_id());
  }
  return BatchBucket::TimeWindow(TruncateTime(task, report_time));
}

std::vector<BatchBucket> BucketsForSelector(const TaskConfig& task,
                                            const BatchSelector& batch_sel) {
  std::vector<BatchBucket> buckets;
  if (batch_sel.query_type() == FIXED_SIZE) {
    buckets.push_back(BatchBucket::FixedSize(batch_sel.batch_id()));
    return buckets;
  }
  const Interval& interval = batch_sel.batch_interval();
  uint64_t end = interval.start() + interval.duration();
  for (uint64_t start = TruncateTime(task, interval.start()); start < end;
       start += task.time_precision()) {
    buckets.push_back(BatchBucket::TimeWindow(start));
  }
  return buckets;
}

PartialBatchSelector ToPartialBatchSelector(const BatchSelector& batch_sel) {
  PartialBatchSelector part_batch_sel;
  part_batch_sel.set_query_type(batch_sel.query_type());
  if (batch_sel.query_type() == FIXED_SIZE) {
    part_batch_sel.set_batch_id(batch_sel.batch_id());
  }
  return part_batch_sel;
}

}  // namespace aggregator
}  // namespace dap
