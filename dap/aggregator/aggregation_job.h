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
#ifndef DAP_AGGREGATOR_AGGREGATION_JOB_H_
#define DAP_AGGREGATOR_AGGREGATION_JOB_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "dap/aggregator/storage.h"
#include "dap/protos/config.pb.h"
#include "dap/protos/messages.pb.h"
#include "dap/vdaf/vdaf.h"

namespace dap {
namespace aggregator {

// A report the Leader accepted into an aggregation job, with its own input
// share already decrypted.
struct LeaderReportShare {
  ReportMetadata metadata;
  std::string public_share;
  std::string input_share;
  // Forwarded to the Helper untouched.
  HpkeCiphertext helper_share;
};

// The Leader's side of one aggregation job:
//
//   kStart --Initialize--> kContinue --HandleInitResponse--> kUncommitted
//          --HandleContinueResponse--> kCommitted
//
// Reports that fail at any step are dropped from the job; only reports both
// aggregators finished are merged. Output shares reach the aggregate store
// only on the last transition, so a job abandoned earlier leaves no Leader
// side aggregate behind.
//
// This class is not thread-safe.
class AggregationJob {
 public:
  enum State {
    kStart,
    kContinue,
    kUncommitted,
    kCommitted,
  };

  // The VDAF must outlive the job.
  AggregationJob(TaskConfig task, std::string task_id, std::string agg_job_id,
                 PartialBatchSelector part_batch_sel, const vdaf::Vdaf* vdaf);

  AggregationJob(const AggregationJob&) = delete;
  AggregationJob& operator=(const AggregationJob&) = delete;

  // Runs the Leader's preparation of each report and builds the initialize
  // request carrying the Helper's shares.
  absl::StatusOr<AggregateInitializeReq> Initialize(
      std::vector<LeaderReportShare> reports);

  // Combines the prep shares, computes the Leader's output shares and builds
  // the continue request. Fails with UnrecognizedMessage if the response
  // does not answer the initialize request.
  absl::StatusOr<AggregateContinueReq> HandleInitResponse(
      const AggregateResp& resp);

  // Merges the output shares of the reports the Helper finished.
  absl::Status HandleContinueResponse(const AggregateResp& resp,
                                      AggregateStore& store);

  State state() const { return state_; }
  const std::string& agg_job_id() const { return agg_job_id_; }
  // Reports merged by HandleContinueResponse.
  uint64_t committed_count() const { return committed_report_ids_.size(); }
  const std::vector<std::string>& committed_report_ids() const {
    return committed_report_ids_;
  }

 private:
  struct PendingReport {
    std::string report_id;
    uint64_t time = 0;
    std::string prep_state;
    std::string prep_share;
    std::vector<vdaf::FieldElement> out_share;
  };

  static absl::string_view StateDebugString(State state);
  absl::Status CheckState(State state) const;
  void SetState(State state);

  const TaskConfig task_;
  const std::string task_id_;
  const std::string agg_job_id_;
  const PartialBatchSelector part_batch_sel_;
  const vdaf::Vdaf* const vdaf_;
  State state_ = kStart;
  // Reports still in the job, in request order.
  std::vector<PendingReport> reports_;
  std::vector<std::string> committed_report_ids_;
};

}  // namespace aggregator
}  // namespace dap

#endif  // DAP_AGGREGATOR_AGGREGATION_JOB_H_
