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
#ifndef DAP_AGGREGATOR_IN_MEMORY_STORAGE_H_
#define DAP_AGGREGATOR_IN_MEMORY_STORAGE_H_

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "dap/aggregator/storage.h"

namespace dap {
namespace aggregator {

// Process local stores, each guarded by its own mutex. Suitable for tests and
// single process deployments; nothing survives a restart.

class InMemoryTaskStore : public TaskStore {
 public:
  absl::StatusOr<std::optional<TaskConfig>> Get(
      absl::string_view task_id) override;
  absl::StatusOr<bool> PutIfAbsent(absl::string_view task_id,
                                   const TaskConfig& config) override;

 private:
  absl::Mutex mu_;
  absl::flat_hash_map<std::string, TaskConfig> tasks_ ABSL_GUARDED_BY(mu_);
};

class InMemoryReportStore : public ReportStore {
 public:
  absl::Status PutPending(absl::string_view task_id,
                          const Report& report) override;
  absl::StatusOr<std::vector<Report>> TakePending(absl::string_view task_id,
                                                  size_t max_reports) override;
  absl::StatusOr<std::vector<std::string>> TasksWithPending() override;
  absl::StatusOr<bool> IsProcessed(absl::string_view task_id,
                                   absl::string_view report_id) override;
  absl::StatusOr<bool> TryMarkProcessed(absl::string_view task_id,
                                        absl::string_view report_id) override;

 private:
  using ReportKey = std::pair<std::string, std::string>;

  absl::Mutex mu_;
  absl::flat_hash_map<std::string, std::deque<Report>> pending_
      ABSL_GUARDED_BY(mu_);
  absl::flat_hash_set<ReportKey> processed_ ABSL_GUARDED_BY(mu_);
};

class InMemoryAggregateStore : public AggregateStore {
 public:
  absl::Status Merge(absl::string_view task_id, const BatchBucket& bucket,
                     const AggregateShare& share) override;
  absl::StatusOr<bool> IsCollected(absl::string_view task_id,
                                   const BatchBucket& bucket) override;
  absl::StatusOr<bool> AnyCollected(
      absl::string_view task_id,
      const std::vector<BatchBucket>& buckets) override;
  absl::StatusOr<AggregateShare> Get(
      absl::string_view task_id,
      const std::vector<BatchBucket>& buckets) override;
  absl::Status MarkCollected(absl::string_view task_id,
                             const std::vector<BatchBucket>& buckets) override;
  absl::StatusOr<bool> BatchExists(absl::string_view task_id,
                                   absl::string_view batch_id) override;

 private:
  struct Bucket {
    AggregateShare share;
    bool collected = false;
  };
  using BucketMap = absl::flat_hash_map<BatchBucket, Bucket>;

  bool AnyCollectedLocked(absl::string_view task_id,
                          const std::vector<BatchBucket>& buckets)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

  absl::Mutex mu_;
  absl::flat_hash_map<std::string, BucketMap> buckets_ ABSL_GUARDED_BY(mu_);
};

class InMemoryHelperStateStore : public HelperStateStore {
 public:
  absl::StatusOr<bool> PutIfAbsent(absl::string_view task_id,
                                   absl::string_view agg_job_id,
                                   const HelperState& state) override;
  absl::Status Put(absl::string_view task_id, absl::string_view agg_job_id,
                   const HelperState& state) override;
  absl::StatusOr<std::optional<HelperState>> Take(
      absl::string_view task_id, absl::string_view agg_job_id) override;

 private:
  using JobKey = std::pair<std::string, std::string>;

  absl::Mutex mu_;
  absl::flat_hash_map<JobKey, HelperState> states_ ABSL_GUARDED_BY(mu_);
};

class InMemoryCollectJobStore : public CollectJobStore {
 public:
  absl::Status Create(const CollectJob& job) override;
  absl::StatusOr<std::optional<CollectJob>> Get(
      absl::string_view task_id, absl::string_view collect_id) override;
  absl::StatusOr<std::vector<CollectJob>> ListPending() override;
  absl::Status Finish(absl::string_view task_id, absl::string_view collect_id,
                      const CollectResp& response,
                      uint64_t completed_time) override;
  absl::Status Fail(absl::string_view task_id, absl::string_view collect_id,
                    absl::string_view error_type,
                    absl::string_view error_detail,
                    uint64_t completed_time) override;
  absl::StatusOr<int> EvictCompleted(uint64_t cutoff) override;

 private:
  using JobKey = std::pair<std::string, std::string>;

  absl::Mutex mu_;
  absl::flat_hash_map<JobKey, CollectJob> jobs_ ABSL_GUARDED_BY(mu_);
  // Creation order, for ListPending.
  std::vector<JobKey> order_ ABSL_GUARDED_BY(mu_);

  absl::StatusOr<CollectJob*> FindPending(absl::string_view task_id,
                                          absl::string_view collect_id)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
};

class InMemoryBatchAssignmentStore : public BatchAssignmentStore {
 public:
  absl::StatusOr<std::optional<std::string>> CurrentBatchId(
      absl::string_view task_id) override;
  absl::StatusOr<std::vector<BatchAssignment>> Assign(
      absl::string_view task_id, uint64_t num_reports,
      uint64_t max_batch_size) override;

 private:
  struct OpenBatch {
    std::string batch_id;
    uint64_t report_count = 0;
  };

  absl::Mutex mu_;
  absl::flat_hash_map<std::string, OpenBatch> open_ ABSL_GUARDED_BY(mu_);
};

// Owns one of each in-memory store.
class InMemoryStorage {
 public:
  InMemoryStorage() = default;
  InMemoryStorage(const InMemoryStorage&) = delete;
  InMemoryStorage& operator=(const InMemoryStorage&) = delete;

  Storage storage() {
    return Storage{&tasks_,        &reports_,      &aggregates_,
                   &helper_states_, &collect_jobs_, &batches_};
  }

  InMemoryTaskStore& tasks() { return tasks_; }
  InMemoryReportStore& reports() { return reports_; }
  InMemoryAggregateStore& aggregates() { return aggregates_; }

 private:
  InMemoryTaskStore tasks_;
  InMemoryReportStore reports_;
  InMemoryAggregateStore aggregates_;
  InMemoryHelperStateStore helper_states_;
  InMemoryCollectJobStore collect_jobs_;
  InMemoryBatchAssignmentStore batches_;
};

}  // namespace aggregator
}  // namespace dap

#endif  // DAP_AGGREGATOR_IN_MEMORY_STORAGE_H_
