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

#include "dap/aggregator/helper.h"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "dap/aggregator/abort.h"
#include "dap/aggregator/aggregate_share.h"
#include "dap/aggregator/auth.h"
#include "dap/aggregator/batch_bucket.h"
#include "dap/aggregator/hpke_binding.h"
#include "dap/aggregator/task_config.h"
#include "dap/base/monitoring.h"
#include "dap/base/random_id.h"

namespace dap {
namespace aggregator {

namespace {

constexpr absl::string_view kJobExists =
    "unexpected message for aggregation job (already exists)";

Transition Failed(absl::string_view report_id, TransitionFailure failure) {
  DAP_VLOG(1) << "Report " << IdToBase64Url(report_id) << " failed: "
              << TransitionFailure_Name(failure);
  Transition transition;
  transition.set_report_id(std::string(report_id));
  transition.set_failed(failure);
  return transition;
}

}  // namespace

Helper::Helper(AggregatorConfig config, hpke::HpkeReceiverConfigList receivers,
               Storage storage, Clock* clock)
    : Aggregator(std::move(config), std::move(receivers), storage, clock) {
  DAP_CHECK(this->storage().helper_states != nullptr);
}

absl::StatusOr<DapResponse> Helper::HandleAggregate(const DapRequest& req) {
  DAP_RETURN_IF_ERROR(AuthorizeRequest(req, Sender::kLeader));
  DAP_RETURN_IF_ERROR(CheckVersion(req));
  if (req.media_type == kMediaTypeAggregateInitReq) {
    return HandleAggregateInit(req);
  }
  if (req.media_type == kMediaTypeAggregateContReq) {
    return HandleAggregateContinue(req);
  }
  return Abort(AbortKind::kUnrecognizedMessage,
               absl::StrCat("unexpected media type '", req.media_type, "'"));
}

absl::StatusOr<DapResponse> Helper::HandleAggregateInit(const DapRequest& req) {
  DAP_ASSIGN_OR_RETURN(auto init_req,
                       DecodePayload<AggregateInitializeReq>(req));
  const std::string& task_id = init_req.task_id();
  DAP_RETURN_IF_ERROR(BindTaskId(req, task_id, Sender::kLeader));
  const ReportMetadata* first_metadata =
      init_req.report_shares_size() > 0
          ? &init_req.report_shares(0).metadata()
          : nullptr;
  DAP_ASSIGN_OR_RETURN(TaskConfig task,
                       ResolveTask(task_id, req.version, first_metadata));
  const PartialBatchSelector& part_batch_sel = init_req.part_batch_sel();
  DAP_RETURN_IF_ERROR(CheckQueryType(task, part_batch_sel.query_type()));
  if (part_batch_sel.query_type() == FIXED_SIZE &&
      part_batch_sel.batch_id().size() != kIdLength) {
    return Abort(AbortKind::kUnrecognizedMessage, "malformed batch ID");
  }
  DAP_ASSIGN_OR_RETURN(std::unique_ptr<vdaf::Vdaf> vdaf,
                       vdaf::CreateVdaf(task.vdaf()));

  // Claim the job ID before touching any report so that a duplicate request
  // cannot consume reports of the original one.
  HelperState state;
  *state.mutable_part_batch_sel() = part_batch_sel;
  DAP_ASSIGN_OR_RETURN(bool claimed,
                       storage().helper_states->PutIfAbsent(
                           task_id, init_req.agg_job_id(), state));
  if (!claimed) {
    return BadRequest(kJobExists);
  }

  AggregateResp resp;
  for (const ReportShare& report_share : init_req.report_shares()) {
    DAP_ASSIGN_OR_RETURN(
        *resp.add_transitions(),
        InitReportShare(task, task_id, *vdaf, report_share, state));
  }
  DAP_RETURN_IF_ERROR(
      storage().helper_states->Put(task_id, init_req.agg_job_id(), state));
  DAP_VLOG(1) << "Initialized aggregation job "
              << IdToBase64Url(init_req.agg_job_id()) << " with "
              << state.reports_size() << " of "
              << init_req.report_shares_size() << " reports";
  return DapResponse{std::string(kMediaTypeAggregateResp),
                     resp.SerializeAsString()};
}

absl::StatusOr<Transition> Helper::InitReportShare(
    const TaskConfig& task, absl::string_view task_id, const vdaf::Vdaf& vdaf,
    const ReportShare& report_share, HelperState& state) {
  const ReportMetadata& metadata = report_share.metadata();
  const std::string& report_id = metadata.id();
  if (report_id.size() != kReportIdLength) {
    return Failed(report_id, UNRECOGNIZED_MESSAGE);
  }
  if (IsExpired(task, metadata.time())) {
    return Failed(report_id, TASK_EXPIRED);
  }
  DAP_ASSIGN_OR_RETURN(bool replayed,
                       storage().reports->IsProcessed(task_id, report_id));
  if (replayed) {
    return Failed(report_id, REPORT_REPLAYED);
  }
  BatchBucket bucket =
      BucketForReport(task, state.part_batch_sel(), metadata.time());
  DAP_ASSIGN_OR_RETURN(bool collected,
                       storage().aggregates->IsCollected(task_id, bucket));
  if (collected) {
    return Failed(report_id, BATCH_COLLECTED);
  }

  absl::StatusOr<std::string> input_share = DecryptInputShare(
      task, task_id, metadata, report_share.public_share(),
      report_share.encrypted_input_share(), Role::kHelper);
  if (!input_share.ok()) {
    return Failed(report_id, input_share.status().code() == NOT_FOUND
                                 ? HPKE_UNKNOWN_CONFIG_ID
                                 : HPKE_DECRYPT_ERROR);
  }
  absl::StatusOr<vdaf::PrepareInitResult> prep = vdaf.PrepareInit(
      task.vdaf_verify_key(), vdaf::kHelperId, report_id,
      report_share.public_share(), *input_share);
  if (!prep.ok()) {
    return Failed(report_id, VDAF_PREP_ERROR);
  }

  DAP_ASSIGN_OR_RETURN(bool fresh,
                       storage().reports->TryMarkProcessed(task_id, report_id));
  if (!fresh) {
    return Failed(report_id, REPORT_REPLAYED);
  }
  HelperState::ReportState* report_state = state.add_reports();
  report_state->set_report_id(report_id);
  report_state->set_time(metadata.time());
  report_state->set_prep_state(std::move(prep->prep_state));

  Transition transition;
  transition.set_report_id(report_id);
  transition.set_continued(std::move(prep->prep_share));
  return transition;
}

absl::StatusOr<DapResponse> Helper::HandleAggregateContinue(
    const DapRequest& req) {
  DAP_ASSIGN_OR_RETURN(auto cont_req, DecodePayload<AggregateContinueReq>(req));
  const std::string& task_id = cont_req.task_id();
  DAP_RETURN_IF_ERROR(BindTaskId(req, task_id, Sender::kLeader));
  DAP_ASSIGN_OR_RETURN(TaskConfig task,
                       ResolveTask(task_id, req.version, nullptr));
  DAP_ASSIGN_OR_RETURN(std::unique_ptr<vdaf::Vdaf> vdaf,
                       vdaf::CreateVdaf(task.vdaf()));
  DAP_ASSIGN_OR_RETURN(
      std::optional<HelperState> state,
      storage().helper_states->Take(task_id, cont_req.agg_job_id()));
  if (!state.has_value()) {
    return Abort(AbortKind::kUnrecognizedAggregationJob,
                 absl::StrCat("unrecognized aggregation job ",
                              IdToBase64Url(cont_req.agg_job_id())));
  }

  // The Leader may drop reports but must keep the initialize order.
  std::vector<const HelperState::ReportState*> matched;
  int next = 0;
  for (const Transition& transition : cont_req.transitions()) {
    while (next < state->reports_size() &&
           state->reports(next).report_id() != transition.report_id()) {
      ++next;
    }
    if (next == state->reports_size() || !transition.has_continued()) {
      DAP_ASSIGN_OR_RETURN(bool restored,
                           storage().helper_states->PutIfAbsent(
                               task_id, cont_req.agg_job_id(), *state));
      DAP_LOG_IF(WARNING, !restored)
          << "Aggregation job " << IdToBase64Url(cont_req.agg_job_id())
          << " was reclaimed while its continue request was rejected";
      return Abort(AbortKind::kUnrecognizedMessage,
                   absl::StrCat("unexpected transition for report ",
                                IdToBase64Url(transition.report_id())));
    }
    matched.push_back(&state->reports(next++));
  }

  AggregateResp resp;
  absl::flat_hash_map<BatchBucket, AggregateShare> shares;
  for (int i = 0; i < cont_req.transitions_size(); ++i) {
    const Transition& transition = cont_req.transitions(i);
    const HelperState::ReportState& report = *matched[i];
    absl::StatusOr<std::vector<vdaf::FieldElement>> out_share =
        vdaf->PrepareNext(report.prep_state(), transition.continued());
    if (!out_share.ok()) {
      *resp.add_transitions() = Failed(report.report_id(), VDAF_PREP_ERROR);
      continue;
    }
    BatchBucket bucket =
        BucketForReport(task, state->part_batch_sel(), report.time());
    DAP_ASSIGN_OR_RETURN(bool collected,
                         storage().aggregates->IsCollected(task_id, bucket));
    if (collected) {
      *resp.add_transitions() = Failed(report.report_id(), BATCH_COLLECTED);
      continue;
    }
    DAP_RETURN_IF_ERROR(
        shares[bucket].AddOutputShare(report.report_id(), *out_share));
    Transition* finished = resp.add_transitions();
    finished->set_report_id(report.report_id());
    finished->mutable_finished();
  }
  for (const auto& [bucket, share] : shares) {
    DAP_RETURN_IF_ERROR(storage().aggregates->Merge(task_id, bucket, share));
  }
  return DapResponse{std::string(kMediaTypeAggregateResp),
                     resp.SerializeAsString()};
}

absl::StatusOr<DapResponse> Helper::HandleAggregateShare(
    const DapRequest& req) {
  DAP_RETURN_IF_ERROR(AuthorizeRequest(req, Sender::kLeader));
  DAP_RETURN_IF_ERROR(CheckVersion(req));
  DAP_RETURN_IF_ERROR(CheckMediaType(req, kMediaTypeAggregateShareReq));
  DAP_ASSIGN_OR_RETURN(auto share_req, DecodePayload<AggregateShareReq>(req));
  const std::string& task_id = share_req.task_id();
  DAP_RETURN_IF_ERROR(BindTaskId(req, task_id, Sender::kLeader));
  DAP_ASSIGN_OR_RETURN(TaskConfig task,
                       ResolveTask(task_id, req.version, nullptr));
  const BatchSelector& batch_sel = share_req.batch_sel();
  DAP_RETURN_IF_ERROR(ValidateQuery(
      task, global_config(), batch_sel, clock()->NowSeconds(),
      [&](absl::string_view batch_id) {
        return storage().aggregates->BatchExists(task_id, batch_id);
      }));

  std::vector<BatchBucket> buckets = BucketsForSelector(task, batch_sel);
  DAP_ASSIGN_OR_RETURN(bool overlap,
                       storage().aggregates->AnyCollected(task_id, buckets));
  if (overlap) {
    return Abort(AbortKind::kBatchOverlap,
                 "batch overlaps a previously collected batch");
  }
  DAP_ASSIGN_OR_RETURN(AggregateShare share,
                       storage().aggregates->Get(task_id, buckets));
  if (share.report_count != share_req.report_count() ||
      share.checksum != share_req.checksum()) {
    return Abort(AbortKind::kBatchMismatch,
                 absl::StrCat("Leader counted ", share_req.report_count(),
                              " reports, Helper counted ",
                              share.report_count));
  }
  DAP_RETURN_IF_ERROR(CheckBatchSize(task, share.report_count));

  DAP_ASSIGN_OR_RETURN(std::unique_ptr<vdaf::Vdaf> vdaf,
                       vdaf::CreateVdaf(task.vdaf()));
  AggregateShareResp resp;
  DAP_ASSIGN_OR_RETURN(*resp.mutable_encrypted_agg_share(),
                       EncryptAggregateShare(task, task_id, batch_sel, share,
                                             *vdaf, Role::kHelper));
  DAP_RETURN_IF_ERROR(storage().aggregates->MarkCollected(task_id, buckets));
  return DapResponse{std::string(kMediaTypeAggregateShareResp),
                     resp.SerializeAsString()};
}

}  // namespace aggregator
}  // namespace dap
