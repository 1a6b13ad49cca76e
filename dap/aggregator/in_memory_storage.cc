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

#include "dap/aggregator/in_memory_storage.h"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "dap/aggregator/abort.h"
#include "dap/base/monitoring.h"
#include "dap/base/random_id.h"

namespace dap {
namespace aggregator {

absl::StatusOr<std::optional<TaskConfig>> InMemoryTaskStore::Get(
    absl::string_view task_id) {
  absl::MutexLock lock(&mu_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) return std::nullopt;
  return it->second;
}

absl::StatusOr<bool> InMemoryTaskStore::PutIfAbsent(absl::string_view task_id,
                                                    const TaskConfig& config) {
  absl::MutexLock lock(&mu_);
  return tasks_.try_emplace(std::string(task_id), config).second;
}

absl::Status InMemoryReportStore::PutPending(absl::string_view task_id,
                                             const Report& report) {
  absl::MutexLock lock(&mu_);
  pending_[std::string(task_id)].push_back(report);
  return absl::OkStatus();
}

absl::StatusOr<std::vector<Report>> InMemoryReportStore::TakePending(
    absl::string_view task_id, size_t max_reports) {
  absl::MutexLock lock(&mu_);
  std::vector<Report> reports;
  auto it = pending_.find(task_id);
  if (it == pending_.end()) return reports;
  std::deque<Report>& queue = it->second;
  size_t n = max_reports == 0 ? queue.size()
                              : std::min(max_reports, queue.size());
  reports.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    reports.push_back(std::move(queue.front()));
    queue.pop_front();
  }
  if (queue.empty()) pending_.erase(it);
  return reports;
}

absl::StatusOr<std::vector<std::string>>
InMemoryReportStore::TasksWithPending() {
  absl::MutexLock lock(&mu_);
  std::vector<std::string> task_ids;
  for (const auto& [task_id, queue] : pending_) {
    if (!queue.empty()) task_ids.push_back(task_id);
  }
  std::sort(task_ids.begin(), task_ids.end());
  return task_ids;
}

absl::StatusOr<bool> InMemoryReportStore::IsProcessed(
    absl::string_view task_id, absl::string_view report_id) {
  absl::MutexLock lock(&mu_);
  return processed_.contains(
      ReportKey(std::string(task_id), std::string(report_id)));
}

absl::StatusOr<bool> InMemoryReportStore::TryMarkProcessed(
    absl::string_view task_id, absl::string_view report_id) {
  absl::MutexLock lock(&mu_);
  return processed_
      .emplace(std::string(task_id), std::string(report_id))
      .second;
}

bool InMemoryAggregateStore::AnyCollectedLocked(
    absl::string_view task_id, const std::vector<BatchBucket>& buckets) {
  auto task_it = buckets_.find(task_id);
  if (task_it == buckets_.end()) return false;
  for (const BatchBucket& bucket : buckets) {
    auto it = task_it->second.find(bucket);
    if (it != task_it->second.end() && it->second.collected) return true;
  }
  return false;
}

absl::Status InMemoryAggregateStore::Merge(absl::string_view task_id,
                                           const BatchBucket& bucket,
                                           const AggregateShare& share) {
  absl::MutexLock lock(&mu_);
  Bucket& entry = buckets_[std::string(task_id)][bucket];
  if (entry.collected) {
    DAP_LOG(ERROR) << "Refusing to merge " << share.report_count
                   << " reports into collected " << bucket;
    return DAP_STATUS(INTERNAL) << "merge into collected " << bucket;
  }
  return entry.share.Merge(share);
}

absl::StatusOr<bool> InMemoryAggregateStore::IsCollected(
    absl::string_view task_id, const BatchBucket& bucket) {
  absl::MutexLock lock(&mu_);
  return AnyCollectedLocked(task_id, {bucket});
}

absl::StatusOr<bool> InMemoryAggregateStore::AnyCollected(
    absl::string_view task_id, const std::vector<BatchBucket>& buckets) {
  absl::MutexLock lock(&mu_);
  return AnyCollectedLocked(task_id, buckets);
}

absl::StatusOr<AggregateShare> InMemoryAggregateStore::Get(
    absl::string_view task_id, const std::vector<BatchBucket>& buckets) {
  absl::MutexLock lock(&mu_);
  AggregateShare total;
  auto task_it = buckets_.find(task_id);
  if (task_it == buckets_.end()) return total;
  for (const BatchBucket& bucket : buckets) {
    auto it = task_it->second.find(bucket);
    if (it == task_it->second.end()) continue;
    DAP_RETURN_IF_ERROR(total.Merge(it->second.share));
  }
  return total;
}

absl::Status InMemoryAggregateStore::MarkCollected(
    absl::string_view task_id, const std::vector<BatchBucket>& buckets) {
  absl::MutexLock lock(&mu_);
  if (AnyCollectedLocked(task_id, buckets)) {
    return Abort(AbortKind::kBatchOverlap,
                 "batch overlaps a previously collected batch");
  }
  BucketMap& task_buckets = buckets_[std::string(task_id)];
  for (const BatchBucket& bucket : buckets) {
    task_buckets[bucket].collected = true;
  }
  return absl::OkStatus();
}

absl::StatusOr<bool> InMemoryAggregateStore::BatchExists(
    absl::string_view task_id, absl::string_view batch_id) {
  absl::MutexLock lock(&mu_);
  auto task_it = buckets_.find(task_id);
  if (task_it == buckets_.end()) return false;
  return task_it->second.contains(
      BatchBucket::FixedSize(std::string(batch_id)));
}

absl::StatusOr<bool> InMemoryHelperStateStore::PutIfAbsent(
    absl::string_view task_id, absl::string_view agg_job_id,
    const HelperState& state) {
  absl::MutexLock lock(&mu_);
  return states_
      .try_emplace(JobKey(std::string(task_id), std::string(agg_job_id)),
                   state)
      .second;
}

absl::Status InMemoryHelperStateStore::Put(absl::string_view task_id,
                                           absl::string_view agg_job_id,
                                           const HelperState& state) {
  absl::MutexLock lock(&mu_);
  auto it = states_.find(JobKey(std::string(task_id), std::string(agg_job_id)));
  if (it == states_.end()) {
    return DAP_STATUS(NOT_FOUND) << "aggregation job was not claimed";
  }
  it->second = state;
  return absl::OkStatus();
}

absl::StatusOr<std::optional<HelperState>> InMemoryHelperStateStore::Take(
    absl::string_view task_id, absl::string_view agg_job_id) {
  absl::MutexLock lock(&mu_);
  auto node =
      states_.extract(JobKey(std::string(task_id), std::string(agg_job_id)));
  if (node.empty()) return std::nullopt;
  return std::move(node.mapped());
}

absl::Status InMemoryCollectJobStore::Create(const CollectJob& job) {
  absl::MutexLock lock(&mu_);
  JobKey key(job.task_id(), job.collect_id());
  if (!jobs_.try_emplace(key, job).second) {
    return DAP_STATUS(ALREADY_EXISTS)
           << "collect job " << IdToBase64Url(job.collect_id())
           << " already exists";
  }
  order_.push_back(std::move(key));
  return absl::OkStatus();
}

absl::StatusOr<std::optional<CollectJob>> InMemoryCollectJobStore::Get(
    absl::string_view task_id, absl::string_view collect_id) {
  absl::MutexLock lock(&mu_);
  auto it = jobs_.find(JobKey(std::string(task_id), std::string(collect_id)));
  if (it == jobs_.end()) return std::nullopt;
  return it->second;
}

absl::StatusOr<std::vector<CollectJob>> InMemoryCollectJobStore::ListPending() {
  absl::MutexLock lock(&mu_);
  std::vector<CollectJob> pending;
  for (const JobKey& key : order_) {
    const CollectJob& job = jobs_.at(key);
    if (job.status() == CollectJob::PENDING) pending.push_back(job);
  }
  return pending;
}

absl::StatusOr<CollectJob*> InMemoryCollectJobStore::FindPending(
    absl::string_view task_id, absl::string_view collect_id) {
  auto it = jobs_.find(JobKey(std::string(task_id), std::string(collect_id)));
  if (it == jobs_.end()) {
    return DAP_STATUS(NOT_FOUND)
           << "unknown collect job " << IdToBase64Url(collect_id);
  }
  if (it->second.status() != CollectJob::PENDING) {
    return DAP_STATUS(FAILED_PRECONDITION)
           << "collect job " << IdToBase64Url(collect_id)
           << " is no longer pending";
  }
  return &it->second;
}

absl::Status InMemoryCollectJobStore::Finish(absl::string_view task_id,
                                             absl::string_view collect_id,
                                             const CollectResp& response,
                                             uint64_t completed_time) {
  absl::MutexLock lock(&mu_);
  DAP_ASSIGN_OR_RETURN(CollectJob * job, FindPending(task_id, collect_id));
  job->set_status(CollectJob::DONE);
  *job->mutable_response() = response;
  job->set_completed_time(completed_time);
  return absl::OkStatus();
}

absl::Status InMemoryCollectJobStore::Fail(absl::string_view task_id,
                                           absl::string_view collect_id,
                                           absl::string_view error_type,
                                           absl::string_view error_detail,
                                           uint64_t completed_time) {
  absl::MutexLock lock(&mu_);
  DAP_ASSIGN_OR_RETURN(CollectJob * job, FindPending(task_id, collect_id));
  job->set_status(CollectJob::FAILED);
  job->set_error_type(std::string(error_type));
  job->set_error_detail(std::string(error_detail));
  job->set_completed_time(completed_time);
  return absl::OkStatus();
}

absl::StatusOr<int> InMemoryCollectJobStore::EvictCompleted(uint64_t cutoff) {
  absl::MutexLock lock(&mu_);
  int evicted = 0;
  std::vector<JobKey> kept;
  kept.reserve(order_.size());
  for (JobKey& key : order_) {
    auto it = jobs_.find(key);
    if (it->second.status() != CollectJob::PENDING &&
        it->second.completed_time() < cutoff) {
      jobs_.erase(it);
      ++evicted;
    } else {
      kept.push_back(std::move(key));
    }
  }
  order_ = std::move(kept);
  return evicted;
}

absl::StatusOr<std::optional<std::string>>
InMemoryBatchAssignmentStore::CurrentBatchId(absl::string_view task_id) {
  absl::MutexLock lock(&mu_);
  auto it = open_.find(task_id);
  if (it == open_.end()) return std::nullopt;
  return it->second.batch_id;
}

absl::StatusOr<std::vector<BatchAssignment>>
InMemoryBatchAssignmentStore::Assign(absl::string_view task_id,
                                     uint64_t num_reports,
                                     uint64_t max_batch_size) {
  if (max_batch_size == 0) {
    return DAP_STATUS(INVALID_ARGUMENT) << "max_batch_size must be positive";
  }
  absl::MutexLock lock(&mu_);
  std::vector<BatchAssignment> assignments;
  while (num_reports > 0) {
    auto it = open_.find(task_id);
    if (it == open_.end() || it->second.report_count >= max_batch_size) {
      it = open_.insert_or_assign(std::string(task_id),
                                  OpenBatch{GenerateId(), 0})
               .first;
    }
    OpenBatch& batch = it->second;
    uint64_t n = std::min(num_reports, max_batch_size - batch.report_count);
    batch.report_count += n;
    num_reports -= n;
    if (!assignments.empty() &&
        assignments.back().batch_id == batch.batch_id) {
      assignments.back().report_count += n;
    } else {
      assignments.push_back(BatchAssignment{batch.batch_id, n});
    }
  }
  return assignments;
}

}  // namespace aggregator
}  // namespace dap
