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

#include "dap/aggregator/aggregation_job.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "dap/aggregator/abort.h"
#include "dap/aggregator/aggregate_share.h"
#include "dap/aggregator/batch_bucket.h"
#include "dap/aggregator/task_config.h"
#include "dap/base/monitoring.h"
#include "dap/base/random_id.h"

namespace dap {
namespace aggregator {

namespace {

void LogDropped(absl::string_view report_id, absl::string_view reason) {
  DAP_VLOG(1) << "Dropping report " << IdToBase64Url(report_id) << ": "
              << reason;
}

absl::Status CheckTransitionCount(const AggregateResp& resp, size_t expected) {
  if (static_cast<size_t>(resp.transitions_size()) != expected) {
    return Abort(AbortKind::kUnrecognizedMessage,
                 absl::StrCat("Helper returned ", resp.transitions_size(),
                              " transitions, expected ", expected));
  }
  return absl::OkStatus();
}

}  // namespace

AggregationJob::AggregationJob(TaskConfig task, std::string task_id,
                               std::string agg_job_id,
                               PartialBatchSelector part_batch_sel,
                               const vdaf::Vdaf* vdaf)
    : task_(std::move(task)),
      task_id_(std::move(task_id)),
      agg_job_id_(std::move(agg_job_id)),
      part_batch_sel_(std::move(part_batch_sel)),
      vdaf_(vdaf) {}

absl::string_view AggregationJob::StateDebugString(State state) {
  switch (state) {
    case kStart:
      return "START";
    case kContinue:
      return "CONTINUE";
    case kUncommitted:
      return "UNCOMMITTED";
    case kCommitted:
      return "COMMITTED";
  }
  return "UNKNOWN";
}

absl::Status AggregationJob::CheckState(State state) const {
  if (state_ != state) {
    return absl::FailedPreconditionError(
        absl::StrFormat("The aggregation job is %s, expected %s.",
                        StateDebugString(state_), StateDebugString(state)));
  }
  return absl::OkStatus();
}

void AggregationJob::SetState(State state) {
  DAP_CHECK((state_ == kStart && state == kContinue) ||
            (state_ == kContinue && state == kUncommitted) ||
            (state_ == kUncommitted && state == kCommitted))
      << "Invalid aggregation job transition from " << StateDebugString(state_)
      << " to " << StateDebugString(state) << ".";
  state_ = state;
}

absl::StatusOr<AggregateInitializeReq> AggregationJob::Initialize(
    std::vector<LeaderReportShare> reports) {
  DAP_RETURN_IF_ERROR(CheckState(kStart));
  AggregateInitializeReq req;
  req.set_task_id(task_id_);
  req.set_agg_job_id(agg_job_id_);
  *req.mutable_part_batch_sel() = part_batch_sel_;
  for (LeaderReportShare& report : reports) {
    const std::string& report_id = report.metadata.id();
    absl::StatusOr<vdaf::PrepareInitResult> prep = vdaf_->PrepareInit(
        task_.vdaf_verify_key(), vdaf::kLeaderId, report_id,
        report.public_share, report.input_share);
    if (!prep.ok()) {
      LogDropped(report_id, prep.status().message());
      continue;
    }
    PendingReport pending;
    pending.report_id = report_id;
    pending.time = report.metadata.time();
    pending.prep_state = std::move(prep->prep_state);
    pending.prep_share = std::move(prep->prep_share);
    reports_.push_back(std::move(pending));

    ReportShare* share = req.add_report_shares();
    *share->mutable_metadata() = std::move(report.metadata);
    share->set_public_share(std::move(report.public_share));
    *share->mutable_encrypted_input_share() = std::move(report.helper_share);
  }
  SetState(kContinue);
  return req;
}

absl::StatusOr<AggregateContinueReq> AggregationJob::HandleInitResponse(
    const AggregateResp& resp) {
  DAP_RETURN_IF_ERROR(CheckState(kContinue));
  DAP_RETURN_IF_ERROR(CheckTransitionCount(resp, reports_.size()));

  AggregateContinueReq req;
  req.set_task_id(task_id_);
  req.set_agg_job_id(agg_job_id_);
  std::vector<PendingReport> kept;
  for (size_t i = 0; i < reports_.size(); ++i) {
    PendingReport& report = reports_[i];
    const Transition& transition = resp.transitions(static_cast<int>(i));
    if (transition.report_id() != report.report_id) {
      return Abort(AbortKind::kUnrecognizedMessage,
                   "Helper transitions are out of order");
    }
    switch (transition.var_case()) {
      case Transition::kFailed:
        LogDropped(report.report_id,
                   TransitionFailure_Name(transition.failed()));
        continue;
      case Transition::kContinued:
        break;
      default:
        return Abort(AbortKind::kUnrecognizedMessage,
                     "unexpected transition in initialize response");
    }
    absl::StatusOr<std::string> prep_msg =
        vdaf_->PrepareSharesToPrepareMessage(report.prep_share,
                                             transition.continued());
    if (!prep_msg.ok()) {
      LogDropped(report.report_id, prep_msg.status().message());
      continue;
    }
    absl::StatusOr<std::vector<vdaf::FieldElement>> out_share =
        vdaf_->PrepareNext(report.prep_state, *prep_msg);
    if (!out_share.ok()) {
      LogDropped(report.report_id, out_share.status().message());
      continue;
    }
    report.out_share = *std::move(out_share);
    Transition* next = req.add_transitions();
    next->set_report_id(report.report_id);
    next->set_continued(*std::move(prep_msg));
    kept.push_back(std::move(report));
  }
  reports_ = std::move(kept);
  SetState(kUncommitted);
  return req;
}

absl::Status AggregationJob::HandleContinueResponse(const AggregateResp& resp,
                                                    AggregateStore& store) {
  DAP_RETURN_IF_ERROR(CheckState(kUncommitted));
  DAP_RETURN_IF_ERROR(CheckTransitionCount(resp, reports_.size()));

  absl::flat_hash_map<BatchBucket, AggregateShare> shares;
  absl::flat_hash_map<BatchBucket, std::vector<std::string>> report_ids;
  for (size_t i = 0; i < reports_.size(); ++i) {
    const PendingReport& report = reports_[i];
    const Transition& transition = resp.transitions(static_cast<int>(i));
    if (transition.report_id() != report.report_id) {
      return Abort(AbortKind::kUnrecognizedMessage,
                   "Helper transitions are out of order");
    }
    switch (transition.var_case()) {
      case Transition::kFailed:
        LogDropped(report.report_id,
                   TransitionFailure_Name(transition.failed()));
        continue;
      case Transition::kFinished:
        break;
      default:
        return Abort(AbortKind::kUnrecognizedMessage,
                     "unexpected transition in continue response");
    }
    BatchBucket bucket = BucketForReport(task_, part_batch_sel_, report.time);
    DAP_RETURN_IF_ERROR(
        shares[bucket].AddOutputShare(report.report_id, report.out_share));
    report_ids[bucket].push_back(report.report_id);
  }

  for (const auto& [bucket, share] : shares) {
    DAP_ASSIGN_OR_RETURN(bool collected, store.IsCollected(task_id_, bucket));
    if (collected) {
      DAP_LOG(WARNING) << "Dropping " << share.report_count
                       << " reports of aggregation job "
                       << IdToBase64Url(agg_job_id_) << ": " << bucket
                       << " was collected";
      continue;
    }
    DAP_RETURN_IF_ERROR(store.Merge(task_id_, bucket, share));
    std::vector<std::string>& ids = report_ids[bucket];
    committed_report_ids_.insert(committed_report_ids_.end(), ids.begin(),
                                 ids.end());
  }
  reports_.clear();
  SetState(kCommitted);
  return absl::OkStatus();
}

}  // namespace aggregator
}  // namespace dap
