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
#ifndef DAP_AGGREGATOR_AGGREGATOR_H_
#define DAP_AGGREGATOR_AGGREGATOR_H_

#include <memory>
#include <optional>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "dap/aggregator/abort.h"
#include "dap/aggregator/aggregate_share.h"
#include "dap/aggregator/auth.h"
#include "dap/aggregator/hpke_binding.h"
#include "dap/aggregator/request.h"
#include "dap/aggregator/storage.h"
#include "dap/aggregator/taskprov.h"
#include "dap/base/clock.h"
#include "dap/hpke/hpke.h"
#include "dap/protos/config.pb.h"
#include "dap/protos/messages.pb.h"
#include "dap/vdaf/vdaf.h"

namespace dap {
namespace aggregator {

// State and request plumbing shared by the Leader and the Helper.
//
// Request handlers run in this order: sender authorization, protocol
// version, media type, payload decoding, task ID binding, task resolution.
// The first failing check aborts the request.
//
// A sender is authorized with the task's own token for its role if the task
// has one, and with the aggregator-wide token otherwise. Unknown tasks use
// the aggregator-wide token, so an unauthorized sender sees
// UnauthorizedRequest whether or not the task exists.
class Aggregator {
 public:
  virtual ~Aggregator() = default;

  Aggregator(const Aggregator&) = delete;
  Aggregator& operator=(const Aggregator&) = delete;

  // GET hpke_config. The task is named by the "task_id" URL query parameter.
  absl::StatusOr<DapResponse> HandleHpkeConfig(const DapRequest& req);

  // The HPKE config Clients encrypt this aggregator's input shares to.
  const HpkeConfig& hpke_config() const { return receivers_.primary(); }

  // Returns the config of a registered (or already provisioned) task, or
  // UnrecognizedTask.
  absl::StatusOr<TaskConfig> GetTaskConfig(absl::string_view task_id);

  const GlobalConfig& global_config() const { return config_.global(); }

 protected:
  // Who must have sent a request.
  enum class Sender {
    kLeader,
    kCollector,
  };

  Aggregator(AggregatorConfig config, hpke::HpkeReceiverConfigList receivers,
             Storage storage, Clock* clock);

  // Authorizes the sender for the task named by the request's task ID, if
  // it has one.
  absl::Status AuthorizeRequest(const DapRequest& req, Sender sender);

  // Binds the request to the task its payload acts on. A request that named
  // another task fails with UnrecognizedMessage; one that named none is
  // authorized for `task_id` now.
  absl::Status BindTaskId(const DapRequest& req, absl::string_view task_id,
                          Sender sender);

  // Checks the sender's token for `task_id`, empty for none.
  absl::Status AuthorizeSender(const DapRequest& req,
                               absl::string_view task_id, Sender sender);

  // The token this aggregator presents to the Helper for the task.
  BearerToken LeaderTokenFor(const TaskConfig& task) const;

  absl::Status CheckVersion(const DapRequest& req) const;
  absl::Status CheckMediaType(const DapRequest& req,
                              absl::string_view expected) const;

  // Parses the request payload, failing with UnrecognizedMessage.
  template <typename Message>
  absl::StatusOr<Message> DecodePayload(const DapRequest& req) const {
    Message message;
    if (!message.ParseFromString(req.payload)) {
      return Abort(AbortKind::kUnrecognizedMessage,
                   absl::StrCat("malformed ", req.media_type));
    }
    return message;
  }

  // Looks the task up. If it is unknown, taskprov is enabled and the report
  // metadata carries a taskprov extension, the task is provisioned from it.
  // Fails with InvalidProtocolVersion if the task runs another version.
  absl::StatusOr<TaskConfig> ResolveTask(absl::string_view task_id,
                                         DapVersion version,
                                         const ReportMetadata* metadata);

  absl::StatusOr<std::string> DecryptInputShare(
      const TaskConfig& task, absl::string_view task_id,
      const ReportMetadata& metadata, absl::string_view public_share,
      const HpkeCiphertext& ciphertext, Role receiver) const;

  // Encrypts this aggregator's share of a batch to the Collector.
  absl::StatusOr<HpkeCiphertext> EncryptAggregateShare(
      const TaskConfig& task, absl::string_view task_id,
      const BatchSelector& batch_sel, const AggregateShare& share,
      const vdaf::Vdaf& vdaf, Role sender) const;

  const AggregatorConfig& config() const { return config_; }
  Storage& storage() { return storage_; }
  Clock* clock() const { return clock_; }

 private:
  const AggregatorConfig config_;
  const hpke::HpkeReceiverConfigList receivers_;
  Storage storage_;
  Clock* const clock_;
  const BearerToken leader_token_;
  const BearerToken collector_token_;
  const std::string taskprov_verify_key_init_;
};

}  // namespace aggregator
}  // namespace dap

#endif  // DAP_AGGREGATOR_AGGREGATOR_H_
