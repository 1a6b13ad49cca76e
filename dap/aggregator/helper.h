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
#ifndef DAP_AGGREGATOR_HELPER_H_
#define DAP_AGGREGATOR_HELPER_H_

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "dap/aggregator/aggregator.h"
#include "dap/aggregator/request.h"
#include "dap/aggregator/storage.h"
#include "dap/base/clock.h"
#include "dap/hpke/hpke.h"
#include "dap/protos/config.pb.h"
#include "dap/protos/messages.pb.h"
#include "dap/protos/state.pb.h"
#include "dap/vdaf/vdaf.h"

namespace dap {
namespace aggregator {

// The Helper role: answers the Leader's aggregation and aggregate-share
// requests. Every request must carry the Leader's bearer token.
//
// This class is thread-safe; all shared state lives in the stores.
class Helper : public Aggregator {
 public:
  // The stores must outlive the Helper.
  Helper(AggregatorConfig config, hpke::HpkeReceiverConfigList receivers,
         Storage storage, Clock* clock = Clock::RealClock());

  // POST aggregate. Dispatches on the media type to the initialize or the
  // continue step of an aggregation job.
  absl::StatusOr<DapResponse> HandleAggregate(const DapRequest& req);

  // POST aggregate_share.
  absl::StatusOr<DapResponse> HandleAggregateShare(const DapRequest& req);

 private:
  absl::StatusOr<DapResponse> HandleAggregateInit(const DapRequest& req);
  absl::StatusOr<DapResponse> HandleAggregateContinue(const DapRequest& req);

  // Runs the Helper's preparation of one report share. Returns the
  // transition for the response; on success the report is added to state.
  absl::StatusOr<Transition> InitReportShare(const TaskConfig& task,
                                             absl::string_view task_id,
                                             const vdaf::Vdaf& vdaf,
                                             const ReportShare& report_share,
                                             HelperState& state);
};

}  // namespace aggregator
}  // namespace dap

#endif  // DAP_AGGREGATOR_HELPER_H_
