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

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/initialize.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "dap/aggregator/aggregator_config.h"
#include "dap/aggregator/client.h"
#include "dap/aggregator/collector.h"
#include "dap/aggregator/helper.h"
#include "dap/aggregator/in_memory_storage.h"
#include "dap/aggregator/in_process_transport.h"
#include "dap/aggregator/leader.h"
#include "dap/aggregator/request.h"
#include "dap/base/clock.h"
#include "dap/base/monitoring.h"
#include "dap/base/random_id.h"
#include "dap/hpke/hpke.h"

ABSL_FLAG(std::string, leader_config, "",
          "Path to a text format AggregatorConfig for the Leader.");
ABSL_FLAG(std::string, helper_config, "",
          "Path to a text format AggregatorConfig for the Helper.");
ABSL_FLAG(std::string, task_id, "",
          "Base64url task ID. Must be configured in both aggregators.");
ABSL_FLAG(std::string, collector_private_key_hex, "",
          "X25519 private key matching the task's collector HPKE config.");
ABSL_FLAG(int, num_reports, 10, "Number of reports to upload.");
ABSL_FLAG(int64_t, measurement, 1, "Measurement each client submits.");

static constexpr char kUsageString[] =
    "Runs a Leader and a Helper in one process.\n\n"
    "Uploads --num_reports reports for --task_id, runs aggregation, collects\n"
    "the current batch and prints the aggregate result.";

namespace dap {
namespace aggregator {
namespace {

class Simulation {
 public:
  absl::Status Init(const AggregatorConfig& leader_config,
                    const AggregatorConfig& helper_config) {
    leader_config_ = leader_config;
    DAP_RETURN_IF_ERROR(
        ValidateAggregatorConfig(helper_config, AggregatorRole::kHelper));
    DAP_RETURN_IF_ERROR(
        ValidateAggregatorConfig(leader_config, AggregatorRole::kLeader));

    DAP_RETURN_IF_ERROR(RegisterTasks(helper_config, helper_storage_.tasks()));
    DAP_ASSIGN_OR_RETURN(hpke::HpkeReceiverConfigList helper_receivers,
                         LoadHpkeReceivers(helper_config));
    helper_ = std::make_unique<Helper>(
        helper_config, std::move(helper_receivers), helper_storage_.storage());
    transport_ = std::make_unique<InProcessHelperTransport>(helper_.get());

    DAP_RETURN_IF_ERROR(RegisterTasks(leader_config, leader_storage_.tasks()));
    DAP_ASSIGN_OR_RETURN(hpke::HpkeReceiverConfigList leader_receivers,
                         LoadHpkeReceivers(leader_config));
    leader_ = std::make_unique<Leader>(leader_config,
                                       std::move(leader_receivers),
                                       leader_storage_.storage(),
                                       transport_.get());
    return absl::OkStatus();
  }

  absl::Status Upload(const std::string& task_id, const TaskConfig& task,
                      uint64_t measurement) {
    DAP_ASSIGN_OR_RETURN(
        Report report,
        ProduceReport(task_id, task,
                      {leader_->hpke_config(), helper_->hpke_config()},
                      Clock::RealClock()->NowSeconds(), measurement));
    DapRequest req;
    req.version = task.version();
    req.media_type = std::string(kMediaTypeReport);
    req.task_id = task_id;
    req.payload = report.SerializeAsString();
    req.url = absl::StrCat(task.leader_url(), "upload");
    return leader_->HandleUpload(req).status();
  }

  absl::StatusOr<BatchSelector> CurrentBatch(const std::string& task_id,
                                             const TaskConfig& task) {
    BatchSelector query;
    query.set_query_type(task.query().type());
    if (task.query().type() == FIXED_SIZE) {
      DAP_ASSIGN_OR_RETURN(std::optional<std::string> batch_id,
                           leader_->CurrentBatchId(task_id));
      if (!batch_id.has_value()) {
        return DAP_STATUS(FAILED_PRECONDITION) << "no batch has been filled";
      }
      query.set_batch_id(*batch_id);
      return query;
    }
    uint64_t now = Clock::RealClock()->NowSeconds();
    query.mutable_batch_interval()->set_start(now - now % task.time_precision());
    query.mutable_batch_interval()->set_duration(task.time_precision());
    return query;
  }

  absl::StatusOr<CollectResp> Collect(const std::string& task_id,
                                      const TaskConfig& task,
                                      const BatchSelector& query) {
    CollectReq collect_req;
    collect_req.set_task_id(task_id);
    *collect_req.mutable_query() = query;
    DapRequest req;
    req.version = task.version();
    req.media_type = std::string(kMediaTypeCollectReq);
    req.task_id = task_id;
    req.payload = collect_req.SerializeAsString();
    req.url = absl::StrCat(task.leader_url(), "collect");
    req.sender_auth = BearerToken(leader_config_.collector_bearer_token());
    DAP_ASSIGN_OR_RETURN(std::string uri, leader_->HandleCollect(req));
    DAP_LOG(INFO) << "Collect job created at " << uri;

    DAP_ASSIGN_OR_RETURN(int done, leader_->ProcessPendingCollectJobs());
    DAP_LOG(INFO) << done << " collect job(s) completed";

    req.media_type.clear();
    req.payload.clear();
    req.url = uri;
    DAP_ASSIGN_OR_RETURN(CollectJobPoll poll, leader_->HandleCollectPoll(req));
    if (poll.status != CollectJobStatus::kDone || !poll.response.has_value()) {
      return DAP_STATUS(FAILED_PRECONDITION)
             << "collect job is still pending; is the batch large enough?";
    }
    return *std::move(poll.response);
  }

  Leader& leader() { return *leader_; }

 private:
  AggregatorConfig leader_config_;
  InMemoryStorage leader_storage_;
  InMemoryStorage helper_storage_;
  std::unique_ptr<Helper> helper_;
  std::unique_ptr<InProcessHelperTransport> transport_;
  std::unique_ptr<Leader> leader_;
};

absl::Status Run() {
  DAP_ASSIGN_OR_RETURN(AggregatorConfig leader_config,
                       LoadAggregatorConfig(absl::GetFlag(FLAGS_leader_config)));
  DAP_ASSIGN_OR_RETURN(AggregatorConfig helper_config,
                       LoadAggregatorConfig(absl::GetFlag(FLAGS_helper_config)));
  DAP_ASSIGN_OR_RETURN(std::string task_id,
                       IdFromBase64Url(absl::GetFlag(FLAGS_task_id)));

  Simulation simulation;
  DAP_RETURN_IF_ERROR(simulation.Init(leader_config, helper_config));
  DAP_ASSIGN_OR_RETURN(TaskConfig task,
                       simulation.leader().GetTaskConfig(task_id));

  std::string private_key;
  if (!absl::HexStringToBytes(absl::GetFlag(FLAGS_collector_private_key_hex),
                              &private_key)) {
    return DAP_STATUS(INVALID_ARGUMENT)
           << "--collector_private_key_hex is not a hex string";
  }
  DAP_ASSIGN_OR_RETURN(
      hpke::HpkeReceiverConfig collector_key,
      hpke::HpkeReceiverConfig::FromPrivateKey(
          task.collector_hpke_config().id(), private_key));
  std::vector<hpke::HpkeReceiverConfig> collector_keys;
  collector_keys.push_back(std::move(collector_key));
  hpke::HpkeReceiverConfigList collector(std::move(collector_keys));

  int num_reports = absl::GetFlag(FLAGS_num_reports);
  auto measurement = static_cast<uint64_t>(absl::GetFlag(FLAGS_measurement));
  for (int i = 0; i < num_reports; ++i) {
    DAP_RETURN_IF_ERROR(simulation.Upload(task_id, task, measurement));
  }
  DAP_LOG(INFO) << "Uploaded " << num_reports << " reports";

  DAP_ASSIGN_OR_RETURN(uint64_t aggregated,
                       simulation.leader().ProcessReports(ReportSelector{}));
  DAP_LOG(INFO) << "Aggregated " << aggregated << " reports";

  DAP_ASSIGN_OR_RETURN(BatchSelector query,
                       simulation.CurrentBatch(task_id, task));
  DAP_ASSIGN_OR_RETURN(CollectResp resp,
                       simulation.Collect(task_id, task, query));
  DAP_ASSIGN_OR_RETURN(CollectResult result,
                       ConsumeCollectResp(collector, task_id, task, query,
                                          resp));
  DAP_LOG(INFO) << "Collected " << result.report_count
                << " reports, aggregate " << result.aggregate;
  return absl::OkStatus();
}

}  // namespace
}  // namespace aggregator
}  // namespace dap

int main(int argc, char** argv) {
  absl::SetProgramUsageMessage(kUsageString);
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  absl::Status status = dap::aggregator::Run();
  if (!status.ok()) {
    DAP_LOG(ERROR) << "Simulation failed: " << status;
    return 1;
  }
  return 0;
}
