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

#include "dap/aggregator/leader.h"

#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "dap/aggregator/abort.h"
#include "dap/aggregator/aggregate_share.h"
#include "dap/aggregator/batch_bucket.h"
#include "dap/aggregator/hpke_binding.h"
#include "dap/aggregator/task_config.h"
#include "dap/base/monitoring.h"
#include "dap/base/random_id.h"
#include "dap/vdaf/vdaf.h"

namespace dap {
namespace aggregator {

namespace {

// Number of aggregators; every report carries one input share for each.
constexpr int kNumAggregators = 2;

constexpr absl::string_view kCollectPathPrefix = "collect/task/";

std::string CollectUri(const TaskConfig& task, absl::string_view task_id,
                       absl::string_view collect_id) {
  return absl::StrCat(task.leader_url(), kCollectPathPrefix,
                      IdToBase64Url(task_id), "/req/",
                      IdToBase64Url(collect_id));
}

// Parses ".../collect/task/<task_id>/req/<collect_id>".
absl::StatusOr<std::pair<std::string, std::string>> ParseCollectUri(
    absl::string_view uri) {
  size_t pos = uri.rfind(kCollectPathPrefix);
  if (pos == absl::string_view::npos) {
    return Abort(AbortKind::kUnrecognizedMessage, "not a collect URI");
  }
  std::vector<absl::string_view> parts = absl::StrSplit(
      uri.substr(pos + kCollectPathPrefix.size()), '/');
  if (parts.size() != 3 || parts[1] != "req") {
    return Abort(AbortKind::kUnrecognizedMessage, "malformed collect URI");
  }
  absl::StatusOr<std::string> task_id = IdFromBase64Url(parts[0]);
  absl::StatusOr<std::string> collect_id = IdFromBase64Url(parts[2]);
  if (!task_id.ok() || !collect_id.ok()) {
    return Abort(AbortKind::kUnrecognizedMessage,
                 "malformed identifier in collect URI");
  }
  return std::make_pair(*std::move(task_id), *std::move(collect_id));
}

template <typename Message>
absl::StatusOr<Message> DecodeHelperResponse(const DapResponse& resp,
                                             absl::string_view media_type) {
  Message message;
  if (resp.media_type != media_type ||
      !message.ParseFromString(resp.payload)) {
    return Abort(AbortKind::kUnrecognizedMessage,
                 absl::StrCat("malformed Helper response, expected ",
                              media_type));
  }
  return message;
}

// Aborts after which driving the job again cannot succeed.
bool IsPermanentCollectFailure(const absl::Status& status) {
  std::optional<AbortKind> kind = GetAbortKind(status);
  if (!kind.has_value()) return false;
  switch (*kind) {
    case AbortKind::kBatchOverlap:
    case AbortKind::kBatchMismatch:
    case AbortKind::kBatchInvalid:
    case AbortKind::kQueryMismatch:
      return true;
    default:
      return false;
  }
}

bool BucketsIntersect(const std::vector<BatchBucket>& a,
                      const std::vector<BatchBucket>& b) {
  absl::flat_hash_set<BatchBucket> seen(a.begin(), a.end());
  for (const BatchBucket& bucket : b) {
    if (seen.contains(bucket)) return true;
  }
  return false;
}

}  // namespace

Leader::Leader(AggregatorConfig config, hpke::HpkeReceiverConfigList receivers,
               Storage storage, HelperTransport* helper, Clock* clock)
    : Aggregator(std::move(config), std::move(receivers), storage, clock),
      helper_(helper) {
  DAP_CHECK(helper_ != nullptr);
  DAP_CHECK(this->storage().collect_jobs != nullptr &&
            this->storage().batches != nullptr);
}

absl::StatusOr<DapResponse> Leader::HandleUpload(const DapRequest& req) {
  DAP_RETURN_IF_ERROR(CheckVersion(req));
  DAP_RETURN_IF_ERROR(CheckMediaType(req, kMediaTypeReport));
  DAP_ASSIGN_OR_RETURN(Report report, DecodePayload<Report>(req));
  DAP_ASSIGN_OR_RETURN(
      TaskConfig task,
      ResolveTask(report.task_id(), req.version, &report.metadata()));
  if (report.encrypted_input_shares_size() != kNumAggregators) {
    return Abort(AbortKind::kUnrecognizedMessage,
                 absl::StrCat("report has ",
                              report.encrypted_input_shares_size(),
                              " input shares, expected ", kNumAggregators));
  }
  if (report.metadata().id().size() != kReportIdLength) {
    return Abort(AbortKind::kUnrecognizedMessage, "malformed report ID");
  }
  if (IsExpired(task, clock()->NowSeconds())) {
    return Abort(AbortKind::kReportTooLate, "task has expired");
  }
  DAP_RETURN_IF_ERROR(storage().reports->PutPending(report.task_id(), report));
  return DapResponse{};
}

absl::StatusOr<std::vector<ReportsForJob>> Leader::GetReports(
    const ReportSelector& selector) {
  std::vector<std::string> task_ids = selector.task_ids;
  if (task_ids.empty()) {
    DAP_ASSIGN_OR_RETURN(task_ids, storage().reports->TasksWithPending());
  }
  std::vector<ReportsForJob> result;
  for (const std::string& task_id : task_ids) {
    DAP_ASSIGN_OR_RETURN(TaskConfig task, GetTaskConfig(task_id));
    DAP_ASSIGN_OR_RETURN(
        std::vector<Report> reports,
        storage().reports->TakePending(task_id, selector.max_reports));
    if (task.query().type() != FIXED_SIZE) {
      ReportsForJob job;
      job.task_id = task_id;
      job.part_batch_sel.set_query_type(TIME_INTERVAL);
      job.reports = std::move(reports);
      result.push_back(std::move(job));
      continue;
    }
    DAP_ASSIGN_OR_RETURN(
        std::vector<BatchAssignment> assignments,
        storage().batches->Assign(task_id, reports.size(),
                                  task.query().max_batch_size()));
    auto next = reports.begin();
    for (const BatchAssignment& assignment : assignments) {
      ReportsForJob job;
      job.task_id = task_id;
      job.part_batch_sel.set_query_type(FIXED_SIZE);
      job.part_batch_sel.set_batch_id(assignment.batch_id);
      auto end = next + assignment.report_count;
      job.reports.assign(std::make_move_iterator(next),
                         std::make_move_iterator(end));
      next = end;
      result.push_back(std::move(job));
    }
  }
  return result;
}

absl::StatusOr<std::optional<LeaderReportShare>> Leader::AcceptReport(
    const TaskConfig& task, absl::string_view task_id,
    const PartialBatchSelector& part_batch_sel, Report report) {
  const std::string report_id = report.metadata().id();
  auto drop = [&](absl::string_view reason) {
    DAP_VLOG(1) << "Dropping report " << IdToBase64Url(report_id) << ": "
                << reason;
    return std::nullopt;
  };
  if (IsExpired(task, report.metadata().time())) {
    return drop("task expired");
  }
  DAP_ASSIGN_OR_RETURN(bool replayed,
                       storage().reports->IsProcessed(task_id, report_id));
  if (replayed) return drop("report replayed");
  DAP_ASSIGN_OR_RETURN(
      bool collected,
      storage().aggregates->IsCollected(
          task_id,
          BucketForReport(task, part_batch_sel, report.metadata().time())));
  if (collected) return drop("batch collected");

  absl::StatusOr<std::string> input_share = DecryptInputShare(
      task, task_id, report.metadata(), report.public_share(),
      report.encrypted_input_shares(0), Role::kLeader);
  if (!input_share.ok()) {
    return drop(input_share.status().message());
  }

  LeaderReportShare share;
  share.metadata = std::move(*report.mutable_metadata());
  share.public_share = std::move(*report.mutable_public_share());
  share.input_share = *std::move(input_share);
  share.helper_share = std::move(*report.mutable_encrypted_input_shares(1));
  return share;
}

DapRequest Leader::HelperRequest(const TaskConfig& task,
                                 absl::string_view task_id,
                                 absl::string_view media_type,
                                 std::string payload,
                                 absl::string_view path) const {
  DapRequest req;
  req.version = task.version();
  req.media_type = std::string(media_type);
  req.task_id = std::string(task_id);
  req.payload = std::move(payload);
  req.url = absl::StrCat(task.helper_url(), path);
  req.sender_auth = LeaderTokenFor(task);
  return req;
}

absl::StatusOr<uint64_t> Leader::RunAggregationJob(
    absl::string_view task_id, const PartialBatchSelector& part_batch_sel,
    std::vector<Report> reports) {
  DAP_ASSIGN_OR_RETURN(TaskConfig task, GetTaskConfig(task_id));
  DAP_ASSIGN_OR_RETURN(std::unique_ptr<vdaf::Vdaf> vdaf,
                       vdaf::CreateVdaf(task.vdaf()));

  std::vector<LeaderReportShare> accepted;
  absl::flat_hash_set<std::string> in_job;
  for (Report& report : reports) {
    if (!in_job.insert(report.metadata().id()).second) {
      DAP_VLOG(1) << "Dropping report " << IdToBase64Url(report.metadata().id())
                  << ": already in this aggregation job";
      continue;
    }
    DAP_ASSIGN_OR_RETURN(
        std::optional<LeaderReportShare> share,
        AcceptReport(task, task_id, part_batch_sel, std::move(report)));
    if (share.has_value()) accepted.push_back(*std::move(share));
  }

  AggregationJob job(task, std::string(task_id), GenerateId(), part_batch_sel,
                     vdaf.get());
  DAP_ASSIGN_OR_RETURN(AggregateInitializeReq init_req,
                       job.Initialize(std::move(accepted)));
  if (init_req.report_shares_size() == 0) {
    DAP_VLOG(1) << "No reports left for aggregation job "
                << IdToBase64Url(job.agg_job_id());
    return 0;
  }

  DAP_ASSIGN_OR_RETURN(
      DapResponse init_resp,
      helper_->PostAggregate(HelperRequest(task, task_id,
                                           kMediaTypeAggregateInitReq,
                                           init_req.SerializeAsString(),
                                           "aggregate")));
  DAP_ASSIGN_OR_RETURN(
      auto agg_resp,
      DecodeHelperResponse<AggregateResp>(init_resp, kMediaTypeAggregateResp));
  DAP_ASSIGN_OR_RETURN(AggregateContinueReq cont_req,
                       job.HandleInitResponse(agg_resp));

  DAP_ASSIGN_OR_RETURN(
      DapResponse cont_resp,
      helper_->PostAggregate(HelperRequest(task, task_id,
                                           kMediaTypeAggregateContReq,
                                           cont_req.SerializeAsString(),
                                           "aggregate")));
  DAP_ASSIGN_OR_RETURN(
      agg_resp,
      DecodeHelperResponse<AggregateResp>(cont_resp, kMediaTypeAggregateResp));
  DAP_RETURN_IF_ERROR(
      job.HandleContinueResponse(agg_resp, *storage().aggregates));
  // Reports enter the replay set once merged. Concurrent jobs over the same
  // report are kept apart by the Helper's replay check at initialization.
  for (const std::string& report_id : job.committed_report_ids()) {
    DAP_ASSIGN_OR_RETURN(
        bool fresh, storage().reports->TryMarkProcessed(task_id, report_id));
    DAP_LOG_IF(WARNING, !fresh)
        << "Report " << IdToBase64Url(report_id)
        << " was already marked processed";
  }
  DAP_LOG(INFO) << "Aggregation job " << IdToBase64Url(job.agg_job_id())
                << " committed " << job.committed_count() << " of "
                << reports.size() << " reports";
  return job.committed_count();
}

absl::StatusOr<uint64_t> Leader::ProcessReports(
    const ReportSelector& selector) {
  DAP_ASSIGN_OR_RETURN(std::vector<ReportsForJob> jobs, GetReports(selector));
  uint64_t committed = 0;
  for (ReportsForJob& job : jobs) {
    if (job.reports.empty()) continue;
    DAP_ASSIGN_OR_RETURN(uint64_t count,
                         RunAggregationJob(job.task_id, job.part_batch_sel,
                                           std::move(job.reports)));
    committed += count;
  }
  return committed;
}

absl::StatusOr<std::string> Leader::HandleCollect(const DapRequest& req) {
  DAP_RETURN_IF_ERROR(AuthorizeRequest(req, Sender::kCollector));
  DAP_RETURN_IF_ERROR(CheckVersion(req));
  DAP_RETURN_IF_ERROR(CheckMediaType(req, kMediaTypeCollectReq));
  DAP_ASSIGN_OR_RETURN(CollectReq collect_req, DecodePayload<CollectReq>(req));
  const std::string& task_id = collect_req.task_id();
  DAP_RETURN_IF_ERROR(BindTaskId(req, task_id, Sender::kCollector));
  DAP_ASSIGN_OR_RETURN(TaskConfig task,
                       ResolveTask(task_id, req.version, nullptr));
  uint64_t now = clock()->NowSeconds();
  DAP_RETURN_IF_ERROR(ValidateQuery(
      task, global_config(), collect_req.query(), now,
      [&](absl::string_view batch_id) {
        return storage().aggregates->BatchExists(task_id, batch_id);
      }));
  std::vector<BatchBucket> buckets =
      BucketsForSelector(task, collect_req.query());
  DAP_ASSIGN_OR_RETURN(bool overlap,
                       storage().aggregates->AnyCollected(task_id, buckets));
  if (overlap) {
    return Abort(AbortKind::kBatchOverlap,
                 "batch overlaps a previously collected batch");
  }
  // A bucket belongs to at most one pending job.
  DAP_ASSIGN_OR_RETURN(std::vector<CollectJob> pending,
                       storage().collect_jobs->ListPending());
  for (const CollectJob& other : pending) {
    if (other.task_id() != task_id) continue;
    if (BucketsIntersect(buckets,
                         BucketsForSelector(task, other.request().query()))) {
      return Abort(AbortKind::kBatchOverlap,
                   "batch overlaps a pending collect job");
    }
  }

  CollectJob job;
  job.set_task_id(task_id);
  job.set_collect_id(GenerateId());
  job.set_status(CollectJob::PENDING);
  *job.mutable_request() = collect_req;
  job.set_created_time(now);
  DAP_RETURN_IF_ERROR(storage().collect_jobs->Create(job));
  DAP_LOG(INFO) << "Queued collect job " << IdToBase64Url(job.collect_id())
                << " for task " << IdToBase64Url(task_id);
  return CollectUri(task, task_id, job.collect_id());
}

absl::StatusOr<std::vector<CollectJob>> Leader::GetPendingCollectJobs() {
  return storage().collect_jobs->ListPending();
}

absl::Status Leader::DriveCollectJob(const CollectJob& job) {
  const std::string& task_id = job.task_id();
  DAP_ASSIGN_OR_RETURN(TaskConfig task, GetTaskConfig(task_id));
  const CollectReq& collect_req = job.request();
  const BatchSelector& batch_sel = collect_req.query();
  std::vector<BatchBucket> buckets = BucketsForSelector(task, batch_sel);

  DAP_ASSIGN_OR_RETURN(AggregateShare leader_share,
                       storage().aggregates->Get(task_id, buckets));
  DAP_RETURN_IF_ERROR(CheckBatchSize(task, leader_share.report_count));
  DAP_ASSIGN_OR_RETURN(std::unique_ptr<vdaf::Vdaf> vdaf,
                       vdaf::CreateVdaf(task.vdaf()));
  DAP_ASSIGN_OR_RETURN(HpkeCiphertext leader_encrypted,
                       EncryptAggregateShare(task, task_id, batch_sel,
                                             leader_share, *vdaf,
                                             Role::kLeader));

  AggregateShareReq share_req;
  share_req.set_task_id(task_id);
  *share_req.mutable_batch_sel() = batch_sel;
  share_req.set_agg_param(collect_req.agg_param());
  share_req.set_report_count(leader_share.report_count);
  share_req.set_checksum(leader_share.checksum);
  DAP_ASSIGN_OR_RETURN(
      DapResponse resp,
      helper_->PostAggregateShare(HelperRequest(
          task, task_id, kMediaTypeAggregateShareReq,
          share_req.SerializeAsString(), "aggregate_share")));
  DAP_ASSIGN_OR_RETURN(auto share_resp,
                       DecodeHelperResponse<AggregateShareResp>(
                           resp, kMediaTypeAggregateShareResp));

  CollectResp collect_resp;
  *collect_resp.mutable_part_batch_sel() = ToPartialBatchSelector(batch_sel);
  collect_resp.set_report_count(leader_share.report_count);
  *collect_resp.add_encrypted_agg_shares() = std::move(leader_encrypted);
  *collect_resp.add_encrypted_agg_shares() =
      std::move(*share_resp.mutable_encrypted_agg_share());

  DAP_RETURN_IF_ERROR(storage().aggregates->MarkCollected(task_id, buckets));
  return FinishCollectJob(task_id, job.collect_id(), collect_resp);
}

absl::Status Leader::FinishCollectJob(absl::string_view task_id,
                                      absl::string_view collect_id,
                                      const CollectResp& response) {
  DAP_RETURN_IF_ERROR(storage().collect_jobs->Finish(
      task_id, collect_id, response, clock()->NowSeconds()));
  DAP_LOG(INFO) << "Collect job " << IdToBase64Url(collect_id)
                << " done with " << response.report_count() << " reports";
  return absl::OkStatus();
}

absl::Status Leader::FailCollectJob(absl::string_view task_id,
                                    absl::string_view collect_id,
                                    const absl::Status& error) {
  std::optional<AbortKind> kind = GetAbortKind(error);
  if (!kind.has_value()) {
    return DAP_STATUS(INVALID_ARGUMENT)
           << "collect job can only fail with an abort, got " << error;
  }
  DAP_RETURN_IF_ERROR(storage().collect_jobs->Fail(
      task_id, collect_id, AbortTypeUri(*kind), error.message(),
      clock()->NowSeconds()));
  DAP_LOG(WARNING) << "Collect job " << IdToBase64Url(collect_id)
                   << " failed: " << error;
  return absl::OkStatus();
}

absl::StatusOr<int> Leader::ProcessPendingCollectJobs() {
  DAP_ASSIGN_OR_RETURN(std::vector<CollectJob> jobs, GetPendingCollectJobs());
  int done = 0;
  for (const CollectJob& job : jobs) {
    absl::Status status = DriveCollectJob(job);
    if (IsPermanentCollectFailure(status)) {
      DAP_RETURN_IF_ERROR(
          FailCollectJob(job.task_id(), job.collect_id(), status));
      continue;
    }
    if (!status.ok()) {
      DAP_LOG(WARNING) << "Collect job " << IdToBase64Url(job.collect_id())
                       << " stays pending: " << status;
      continue;
    }
    ++done;
  }
  return done;
}

absl::StatusOr<CollectJobPoll> Leader::PollCollectJob(
    absl::string_view task_id, absl::string_view collect_id) {
  DAP_ASSIGN_OR_RETURN(std::optional<CollectJob> job,
                       storage().collect_jobs->Get(task_id, collect_id));
  CollectJobPoll poll;
  if (!job.has_value()) return poll;
  if (job->status() == CollectJob::FAILED) {
    std::optional<AbortKind> kind = AbortKindFromTypeUri(job->error_type());
    if (!kind.has_value()) {
      return DAP_STATUS(INTERNAL)
             << "collect job " << IdToBase64Url(collect_id)
             << " failed with unknown error " << job->error_type();
    }
    return Abort(*kind, job->error_detail());
  }
  if (job->status() != CollectJob::DONE) {
    poll.status = CollectJobStatus::kPending;
    return poll;
  }
  poll.status = CollectJobStatus::kDone;
  poll.response = std::move(*job->mutable_response());
  return poll;
}

absl::StatusOr<CollectJobPoll> Leader::HandleCollectPoll(
    const DapRequest& req) {
  DAP_RETURN_IF_ERROR(AuthorizeRequest(req, Sender::kCollector));
  DAP_RETURN_IF_ERROR(CheckVersion(req));
  DAP_ASSIGN_OR_RETURN(auto ids, ParseCollectUri(req.url));
  DAP_RETURN_IF_ERROR(BindTaskId(req, ids.first, Sender::kCollector));
  DAP_RETURN_IF_ERROR(ResolveTask(ids.first, req.version, nullptr).status());
  return PollCollectJob(ids.first, ids.second);
}

absl::StatusOr<std::optional<std::string>> Leader::CurrentBatchId(
    absl::string_view task_id) {
  return storage().batches->CurrentBatchId(task_id);
}

absl::StatusOr<int> Leader::EvictCompletedCollectJobs() {
  uint64_t retention = global_config().collect_job_retention();
  if (retention == 0) return 0;
  uint64_t now = clock()->NowSeconds();
  DAP_ASSIGN_OR_RETURN(
      int evicted,
      storage().collect_jobs->EvictCompleted(now > retention ? now - retention
                                                             : 0));
  DAP_LOG_IF(INFO, evicted > 0)
      << "Evicted " << evicted << " completed collect jobs";
  return evicted;
}

}  // namespace aggregator
}  // namespace dap
