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
#ifndef DAP_AGGREGATOR_LEADER_H_
#define DAP_AGGREGATOR_LEADER_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "dap/aggregator/aggregation_job.h"
#include "dap/aggregator/aggregator.h"
#include "dap/aggregator/helper_transport.h"
#include "dap/aggregator/request.h"
#include "dap/aggregator/storage.h"
#include "dap/base/clock.h"
#include "dap/hpke/hpke.h"
#include "dap/protos/config.pb.h"
#include "dap/protos/messages.pb.h"
#include "dap/protos/state.pb.h"

namespace dap {
namespace aggregator {

struct ReportSelector {
  // Tasks to drain. Empty selects every task with queued reports.
  std::vector<std::string> task_ids;
  // Per task limit; 0 drains the queue.
  size_t max_reports = 0;
};

// Queued reports that can go into one aggregation job.
struct ReportsForJob {
  std::string task_id;
  PartialBatchSelector part_batch_sel;
  std::vector<Report> reports;
};

enum class CollectJobStatus {
  kUnknown,
  kPending,
  kDone,
};

struct CollectJobPoll {
  CollectJobStatus status = CollectJobStatus::kUnknown;
  // Set when status is kDone.
  std::optional<CollectResp> response;
};

// The Leader role: accepts uploads, drives aggregation jobs against the
// Helper, and runs collect jobs on behalf of the Collector.
//
// This class is thread-safe; all shared state lives in the stores.
class Leader : public Aggregator {
 public:
  // The stores and the transport must outlive the Leader.
  Leader(AggregatorConfig config, hpke::HpkeReceiverConfigList receivers,
         Storage storage, HelperTransport* helper,
         Clock* clock = Clock::RealClock());

  // PUT upload.
  absl::StatusOr<DapResponse> HandleUpload(const DapRequest& req);

  // Drains queued reports. Reports of a FIXED_SIZE task are split into the
  // batches they are assigned to. Draining an empty TIME_INTERVAL queue
  // yields an entry without reports.
  absl::StatusOr<std::vector<ReportsForJob>> GetReports(
      const ReportSelector& selector);

  // Runs one aggregation job over the reports. Returns the number of reports
  // committed to the batch accounting store.
  absl::StatusOr<uint64_t> RunAggregationJob(
      absl::string_view task_id, const PartialBatchSelector& part_batch_sel,
      std::vector<Report> reports);

  // GetReports followed by one aggregation job per entry. Returns the number
  // of reports committed.
  absl::StatusOr<uint64_t> ProcessReports(const ReportSelector& selector);

  // POST collect. Returns the URI the Collector polls.
  absl::StatusOr<std::string> HandleCollect(const DapRequest& req);

  absl::StatusOr<std::vector<CollectJob>> GetPendingCollectJobs();

  // Assembles the collect response from both aggregate shares, marks the
  // batch collected and completes the job. Leaves the job untouched on
  // failure.
  absl::Status DriveCollectJob(const CollectJob& job);

  absl::Status FinishCollectJob(absl::string_view task_id,
                                absl::string_view collect_id,
                                const CollectResp& response);

  // Moves a pending job to FAILED. Polling it returns the abort in `error`,
  // which must carry an AbortKind.
  absl::Status FailCollectJob(absl::string_view task_id,
                              absl::string_view collect_id,
                              const absl::Status& error);

  // Drives every pending collect job. A job whose batch can never be
  // collected fails; other errors leave it pending for the next pass.
  // Returns the number completed.
  absl::StatusOr<int> ProcessPendingCollectJobs();

  // A FAILED job is reported as the abort it failed with.
  absl::StatusOr<CollectJobPoll> PollCollectJob(absl::string_view task_id,
                                                absl::string_view collect_id);

  // GET on a collect URI returned by HandleCollect.
  absl::StatusOr<CollectJobPoll> HandleCollectPoll(const DapRequest& req);

  // The FIXED_SIZE batch the Leader is currently filling.
  absl::StatusOr<std::optional<std::string>> CurrentBatchId(
      absl::string_view task_id);

  // Removes completed collect jobs older than the configured retention.
  absl::StatusOr<int> EvictCompletedCollectJobs();

 private:
  // Early rejection and decryption of the Leader's input share. Returns
  // nullopt if the report is dropped.
  absl::StatusOr<std::optional<LeaderReportShare>> AcceptReport(
      const TaskConfig& task, absl::string_view task_id,
      const PartialBatchSelector& part_batch_sel, Report report);

  DapRequest HelperRequest(const TaskConfig& task, absl::string_view task_id,
                           absl::string_view media_type, std::string payload,
                           absl::string_view path) const;

  HelperTransport* const helper_;
};

}  // namespace aggregator
}  // namespace dap

#endif  // DAP_AGGREGATOR_LEADER_H_
