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
#ifndef DAP_AGGREGATOR_STORAGE_H_
#define DAP_AGGREGATOR_STORAGE_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "dap/aggregator/aggregate_share.h"
#include "dap/aggregator/batch_bucket.h"
#include "dap/protos/config.pb.h"
#include "dap/protos/messages.pb.h"
#include "dap/protos/state.pb.h"

namespace dap {
namespace aggregator {

// Storage backends for the aggregator roles. Each store offers the atomic
// check-and-set primitives the roles depend on; the roles never lock.
//
// Any error status returned by a store is a backend failure and is surfaced
// unchanged by the caller.

class TaskStore {
 public:
  virtual ~TaskStore() = default;

  virtual absl::StatusOr<std::optional<TaskConfig>> Get(
      absl::string_view task_id) = 0;

  // Registers a task unless the ID is taken. Returns false, leaving the
  // existing task in place, if it was.
  virtual absl::StatusOr<bool> PutIfAbsent(absl::string_view task_id,
                                           const TaskConfig& config) = 0;
};

class ReportStore {
 public:
  virtual ~ReportStore() = default;

  // Queues an uploaded report for aggregation.
  virtual absl::Status PutPending(absl::string_view task_id,
                                  const Report& report) = 0;

  // Removes and returns up to max_reports queued reports in upload order.
  // max_reports == 0 drains the queue.
  virtual absl::StatusOr<std::vector<Report>> TakePending(
      absl::string_view task_id, size_t max_reports) = 0;

  // Tasks that currently have queued reports.
  virtual absl::StatusOr<std::vector<std::string>> TasksWithPending() = 0;

  // Replay set.
  virtual absl::StatusOr<bool> IsProcessed(absl::string_view task_id,
                                           absl::string_view report_id) = 0;
  // Atomically adds the report ID to the replay set. Returns false if it was
  // already a member.
  virtual absl::StatusOr<bool> TryMarkProcessed(
      absl::string_view task_id, absl::string_view report_id) = 0;
};

class AggregateStore {
 public:
  virtual ~AggregateStore() = default;

  // Adds a share to a bucket. Fails with INTERNAL if the bucket is already
  // collected.
  virtual absl::Status Merge(absl::string_view task_id,
                             const BatchBucket& bucket,
                             const AggregateShare& share) = 0;

  virtual absl::StatusOr<bool> IsCollected(absl::string_view task_id,
                                           const BatchBucket& bucket) = 0;

  virtual absl::StatusOr<bool> AnyCollected(
      absl::string_view task_id, const std::vector<BatchBucket>& buckets) = 0;

  // Sum of the shares accumulated in the given buckets.
  virtual absl::StatusOr<AggregateShare> Get(
      absl::string_view task_id, const std::vector<BatchBucket>& buckets) = 0;

  // Atomically marks every bucket collected. Fails with BatchOverlap, marking
  // nothing, if any of them already is.
  virtual absl::Status MarkCollected(
      absl::string_view task_id, const std::vector<BatchBucket>& buckets) = 0;

  // Whether any share has been accounted to the FIXED_SIZE batch.
  virtual absl::StatusOr<bool> BatchExists(absl::string_view task_id,
                                           absl::string_view batch_id) = 0;
};

class HelperStateStore {
 public:
  virtual ~HelperStateStore() = default;

  // Claims the aggregation job ID. Returns false if it is already claimed.
  virtual absl::StatusOr<bool> PutIfAbsent(absl::string_view task_id,
                                           absl::string_view agg_job_id,
                                           const HelperState& state) = 0;

  // Replaces the state of a claimed job.
  virtual absl::Status Put(absl::string_view task_id,
                           absl::string_view agg_job_id,
                           const HelperState& state) = 0;

  // Removes and returns the state, if any.
  virtual absl::StatusOr<std::optional<HelperState>> Take(
      absl::string_view task_id, absl::string_view agg_job_id) = 0;
};

class CollectJobStore {
 public:
  virtual ~CollectJobStore() = default;

  // Fails with ALREADY_EXISTS if the collect ID is taken.
  virtual absl::Status Create(const CollectJob& job) = 0;

  virtual absl::StatusOr<std::optional<CollectJob>> Get(
      absl::string_view task_id, absl::string_view collect_id) = 0;

  virtual absl::StatusOr<std::vector<CollectJob>> ListPending() = 0;

  // Stores the response and moves the job to DONE. Fails with NOT_FOUND for
  // an unknown job and FAILED_PRECONDITION if it is no longer pending.
  virtual absl::Status Finish(absl::string_view task_id,
                              absl::string_view collect_id,
                              const CollectResp& response,
                              uint64_t completed_time) = 0;

  // Moves a pending job to FAILED with the given error. Same errors as
  // Finish.
  virtual absl::Status Fail(absl::string_view task_id,
                            absl::string_view collect_id,
                            absl::string_view error_type,
                            absl::string_view error_detail,
                            uint64_t completed_time) = 0;

  // Deletes DONE and FAILED jobs completed before the cutoff. Returns how
  // many.
  virtual absl::StatusOr<int> EvictCompleted(uint64_t cutoff) = 0;
};

struct BatchAssignment {
  std::string batch_id;
  uint64_t report_count = 0;
};

// Leader side FIXED_SIZE batch allocation.
class BatchAssignmentStore {
 public:
  virtual ~BatchAssignmentStore() = default;

  // The batch that newly drained reports currently fill, if one is open.
  virtual absl::StatusOr<std::optional<std::string>> CurrentBatchId(
      absl::string_view task_id) = 0;

  // Assigns num_reports reports to batches, filling the open batch up to
  // max_batch_size before opening new ones.
  virtual absl::StatusOr<std::vector<BatchAssignment>> Assign(
      absl::string_view task_id, uint64_t num_reports,
      uint64_t max_batch_size) = 0;
};

// The stores one aggregator uses. Not owned.
struct Storage {
  TaskStore* tasks = nullptr;
  ReportStore* reports = nullptr;
  AggregateStore* aggregates = nullptr;
  HelperStateStore* helper_states = nullptr;
  CollectJobStore* collect_jobs = nullptr;
  BatchAssignmentStore* batches = nullptr;
};

}  // namespace aggregator
}  // namespace dap

#endif  // DAP_AGGREGATOR_STORAGE_H_
