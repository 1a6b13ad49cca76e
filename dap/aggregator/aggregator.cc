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

#include "dap/aggregator/aggregator.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/escaping.h"
#include "absl/strings/match.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "dap/base/monitoring.h"
#include "dap/base/random_id.h"
#include "dap/vdaf/field64.h"

namespace dap {
namespace aggregator {

namespace {

// Returns the value of the "task_id" query parameter, if present.
std::optional<absl::string_view> TaskIdQueryParam(absl::string_view url) {
  size_t query_start = url.find('?');
  if (query_start == absl::string_view::npos) return std::nullopt;
  absl::string_view query = url.substr(query_start + 1);
  query = query.substr(0, query.find('#'));
  for (absl::string_view param : absl::StrSplit(query, '&')) {
    if (absl::ConsumePrefix(&param, "task_id=")) return param;
  }
  return std::nullopt;
}

}  // namespace

Aggregator::Aggregator(AggregatorConfig config,
                       hpke::HpkeReceiverConfigList receivers, Storage storage,
                       Clock* clock)
    : config_(std::move(config)),
      receivers_(std::move(receivers)),
      storage_(storage),
      clock_(clock),
      leader_token_(config_.leader_bearer_token()),
      collector_token_(config_.collector_bearer_token()),
      taskprov_verify_key_init_(
          absl::HexStringToBytes(config_.taskprov_vdaf_verify_key_init_hex())) {
  DAP_CHECK(!receivers_.empty()) << "aggregator needs an HPKE receiver config";
  DAP_CHECK(storage_.tasks != nullptr && storage_.reports != nullptr &&
            storage_.aggregates != nullptr);
}

absl::Status Aggregator::AuthorizeSender(const DapRequest& req,
                                         absl::string_view task_id,
                                         Sender sender) {
  const BearerToken& global =
      sender == Sender::kLeader ? leader_token_ : collector_token_;
  std::optional<TaskConfig> task;
  if (!task_id.empty()) {
    DAP_ASSIGN_OR_RETURN(task, storage_.tasks->Get(task_id));
  }
  if (task.has_value()) {
    const std::string& own = sender == Sender::kLeader
                                 ? task->leader_bearer_token()
                                 : task->collector_bearer_token();
    if (!own.empty()) {
      return CheckBearerToken(req.sender_auth, BearerToken(own));
    }
  }
  return CheckBearerToken(req.sender_auth, global);
}

absl::Status Aggregator::AuthorizeRequest(const DapRequest& req,
                                          Sender sender) {
  return AuthorizeSender(req, req.task_id.value_or(""), sender);
}

absl::Status Aggregator::BindTaskId(const DapRequest& req,
                                    absl::string_view task_id, Sender sender) {
  if (!req.task_id.has_value()) return AuthorizeSender(req, task_id, sender);
  if (*req.task_id != task_id) {
    return Abort(AbortKind::kUnrecognizedMessage,
                 "task ID does not match the request");
  }
  return absl::OkStatus();
}

BearerToken Aggregator::LeaderTokenFor(const TaskConfig& task) const {
  if (!task.leader_bearer_token().empty()) {
    return BearerToken(task.leader_bearer_token());
  }
  return leader_token_;
}

absl::Status Aggregator::CheckVersion(const DapRequest& req) const {
  if (req.version == DAP_VERSION_UNKNOWN) {
    return Abort(AbortKind::kInvalidProtocolVersion,
                 "unknown protocol version");
  }
  return absl::OkStatus();
}

absl::Status Aggregator::CheckMediaType(const DapRequest& req,
                                        absl::string_view expected) const {
  if (req.media_type != expected) {
    return Abort(AbortKind::kUnrecognizedMessage,
                 absl::StrCat("unexpected media type '", req.media_type,
                              "', expected '", expected, "'"));
  }
  return absl::OkStatus();
}

absl::StatusOr<DapResponse> Aggregator::HandleHpkeConfig(
    const DapRequest& req) {
  DAP_RETURN_IF_ERROR(CheckVersion(req));
  std::optional<absl::string_view> encoded_task_id = TaskIdQueryParam(req.url);
  if (!encoded_task_id.has_value()) {
    if (config_.global().require_hpke_config_task_id()) {
      return Abort(AbortKind::kMissingTaskId);
    }
  } else {
    absl::StatusOr<std::string> task_id = IdFromBase64Url(*encoded_task_id);
    if (!task_id.ok()) {
      return Abort(AbortKind::kUnrecognizedTask, task_id.status().message());
    }
    DAP_RETURN_IF_ERROR(GetTaskConfig(*task_id).status());
  }
  return DapResponse{std::string(kMediaTypeHpkeConfig),
                     hpke_config().SerializeAsString()};
}

absl::StatusOr<TaskConfig> Aggregator::GetTaskConfig(
    absl::string_view task_id) {
  DAP_ASSIGN_OR_RETURN(std::optional<TaskConfig> task,
                       storage_.tasks->Get(task_id));
  if (!task.has_value()) {
    return Abort(AbortKind::kUnrecognizedTask,
                 absl::StrCat("unrecognized task ", IdToBase64Url(task_id)));
  }
  return *std::move(task);
}

absl::StatusOr<TaskConfig> Aggregator::ResolveTask(
    absl::string_view task_id, DapVersion version,
    const ReportMetadata* metadata) {
  DAP_ASSIGN_OR_RETURN(std::optional<TaskConfig> task,
                       storage_.tasks->Get(task_id));
  const Extension* extension =
      metadata != nullptr ? FindTaskprovExtension(*metadata) : nullptr;
  if (!task.has_value() && extension != nullptr &&
      config_.global().allow_taskprov()) {
    TaskprovSettings settings;
    settings.version = config_.global().taskprov_version() != DAP_VERSION_UNKNOWN
                           ? config_.global().taskprov_version()
                           : version;
    settings.vdaf_verify_key_init = taskprov_verify_key_init_;
    settings.collector_hpke_config = config_.taskprov_collector_hpke_config();
    DAP_ASSIGN_OR_RETURN(
        TaskConfig provisioned,
        TaskConfigFromTaskprov(task_id, extension->payload(), settings));
    DAP_ASSIGN_OR_RETURN(bool inserted,
                         storage_.tasks->PutIfAbsent(task_id, provisioned));
    if (inserted) {
      DAP_LOG(INFO) << "Provisioned task " << IdToBase64Url(task_id)
                    << " from taskprov extension";
      task = std::move(provisioned);
    } else {
      // Lost a race with a concurrent provisioning; the registered task wins.
      DAP_ASSIGN_OR_RETURN(task, storage_.tasks->Get(task_id));
    }
  }
  if (!task.has_value()) {
    return Abort(AbortKind::kUnrecognizedTask,
                 absl::StrCat("unrecognized task ", IdToBase64Url(task_id)));
  }
  if (task->version() != version) {
    return Abort(AbortKind::kInvalidProtocolVersion,
                 absl::StrCat("task runs ", DapVersion_Name(task->version()),
                              ", request uses ", DapVersion_Name(version)));
  }
  return *std::move(task);
}

absl::StatusOr<std::string> Aggregator::DecryptInputShare(
    const TaskConfig& task, absl::string_view task_id,
    const ReportMetadata& metadata, absl::string_view public_share,
    const HpkeCiphertext& ciphertext, Role receiver) const {
  return receivers_.Decrypt(InputShareInfo(task.version(), receiver),
                            InputShareAad(task_id, metadata, public_share),
                            ciphertext);
}

absl::StatusOr<HpkeCiphertext> Aggregator::EncryptAggregateShare(
    const TaskConfig& task, absl::string_view task_id,
    const BatchSelector& batch_sel, const AggregateShare& share,
    const vdaf::Vdaf& vdaf, Role sender) const {
  std::vector<vdaf::FieldElement> data = share.data;
  if (data.empty()) data.assign(vdaf.output_length(), 0);
  return hpke::HpkeEncrypt(task.collector_hpke_config(),
                           AggregateShareInfo(task.version(), sender),
                           AggregateShareAad(task_id, batch_sel),
                           vdaf::EncodeVector(data));
}

}  // namespace aggregator
}  // namespace dap
