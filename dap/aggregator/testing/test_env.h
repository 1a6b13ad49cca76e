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
#ifndef DAP_AGGREGATOR_TESTING_TEST_ENV_H_
#define DAP_AGGREGATOR_TESTING_TEST_ENV_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "dap/aggregator/collector.h"
#include "dap/aggregator/helper.h"
#include "dap/aggregator/in_memory_storage.h"
#include "dap/aggregator/in_process_transport.h"
#include "dap/aggregator/leader.h"
#include "dap/aggregator/request.h"
#include "dap/base/simulated_clock.h"
#include "dap/hpke/hpke.h"
#include "dap/protos/config.pb.h"
#include "dap/protos/messages.pb.h"

namespace dap {
namespace aggregator {

// A Leader and a Helper wired together in process, sharing one simulated
// clock, with three registered tasks:
//
//   time_interval_task_id()  TIME_INTERVAL, expires in an hour
//   fixed_size_task_id()     FIXED_SIZE with max_batch_size 2
//   expired_task_id()        TIME_INTERVAL, expiration is now
//   own_tokens_task_id()     TIME_INTERVAL with its own bearer tokens
//
// All tasks count 0/1 measurements with a minimum batch size of 1 and a time
// precision of an hour. Taskprov is enabled on both aggregators.
class DapTestEnv {
 public:
  static constexpr uint64_t kNow = 1700001234;
  static constexpr uint64_t kTimePrecision = 3600;
  static constexpr absl::string_view kLeaderToken = "this is a bearer token!";
  static constexpr absl::string_view kCollectorToken =
      "This is a DIFFERENT token.";
  static constexpr absl::string_view kTaskLeaderToken =
      "leader token of one task";
  static constexpr absl::string_view kTaskCollectorToken =
      "collector token of one task";
  static constexpr absl::string_view kLeaderUrl = "https://leader.biz/v02/";
  static constexpr absl::string_view kHelperUrl = "http://helper.com:8788/v02/";

  static absl::StatusOr<std::unique_ptr<DapTestEnv>> Create(
      DapVersion version);

  DapTestEnv(const DapTestEnv&) = delete;
  DapTestEnv& operator=(const DapTestEnv&) = delete;

  DapVersion version() const { return version_; }
  uint64_t now() { return clock_.NowSeconds(); }
  SimulatedClock& clock() { return clock_; }

  Leader& leader() { return *leader_; }
  Helper& helper() { return *helper_; }
  InMemoryStorage& leader_storage() { return leader_storage_; }
  InMemoryStorage& helper_storage() { return helper_storage_; }
  const hpke::HpkeReceiverConfigList& collector_receivers() const {
    return *collector_receivers_;
  }
  const AggregatorConfig& leader_config() const { return leader_config_; }

  const std::string& time_interval_task_id() const {
    return time_interval_task_id_;
  }
  const std::string& fixed_size_task_id() const { return fixed_size_task_id_; }
  const std::string& expired_task_id() const { return expired_task_id_; }
  const std::string& own_tokens_task_id() const { return own_tokens_task_id_; }

  // Config of a registered task.
  const TaskConfig& task(absl::string_view task_id) const;

  // A Client report encrypted to both aggregators' current HPKE configs.
  absl::StatusOr<Report> GenerateReport(
      absl::string_view task_id, const TaskConfig& task, uint64_t time,
      uint64_t measurement, const std::vector<Extension>& extensions = {});
  // A report for a registered task timestamped now.
  absl::StatusOr<Report> GenerateReport(absl::string_view task_id,
                                        uint64_t measurement);

  DapRequest UploadRequest(const Report& report) const;
  // A request from the Leader to the Helper, carrying the Leader's token.
  DapRequest LeaderRequest(absl::string_view task_id,
                           absl::string_view media_type, std::string payload,
                           absl::string_view path) const;
  // A request from the Collector to the Leader, carrying its token.
  DapRequest CollectorRequest(absl::string_view task_id,
                              absl::string_view media_type,
                              std::string payload) const;

  // The Helper's view of a report.
  static ReportShare HelperReportShare(const Report& report);
  // An aggregation job initialization carrying the given reports.
  static AggregateInitializeReq InitRequest(
      absl::string_view task_id, absl::string_view agg_job_id,
      const PartialBatchSelector& part_batch_sel,
      const std::vector<Report>& reports);

  // Uploads a report through the Leader's upload handler.
  absl::Status Upload(const Report& report);

  // Runs aggregation jobs over every queued report. Returns the number
  // committed.
  absl::StatusOr<uint64_t> RunAggregation();

  // Issues a collect request, drives it, polls the result and decrypts it.
  absl::StatusOr<CollectResult> Collect(absl::string_view task_id,
                                        const BatchSelector& query);

 private:
  explicit DapTestEnv(DapVersion version);

  absl::Status Init();
  TaskConfig MakeTask(QueryType query_type, uint64_t expiration) const;

  const DapVersion version_;
  SimulatedClock clock_;
  InMemoryStorage leader_storage_;
  InMemoryStorage helper_storage_;
  AggregatorConfig leader_config_;
  AggregatorConfig helper_config_;
  std::unique_ptr<hpke::HpkeReceiverConfigList> collector_receivers_;
  std::unique_ptr<Helper> helper_;
  std::unique_ptr<InProcessHelperTransport> transport_;
  std::unique_ptr<Leader> leader_;
  std::string time_interval_task_id_;
  std::string fixed_size_task_id_;
  std::string expired_task_id_;
  std::string own_tokens_task_id_;
  absl::flat_hash_map<std::string, TaskConfig> tasks_;
};

}  // namespace aggregator
}  // namespace dap

#endif  // DAP_AGGREGATOR_TESTING_TEST_ENV_H_
