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
#ifndef DAP_AGGREGATOR_IN_PROCESS_TRANSPORT_H_
#define DAP_AGGREGATOR_IN_PROCESS_TRANSPORT_H_

#include "absl/status/statusor.h"
#include "dap/aggregator/helper.h"
#include "dap/aggregator/helper_transport.h"
#include "dap/aggregator/request.h"

namespace dap {
namespace aggregator {

// Hands the Leader's requests straight to a Helper in the same process.
class InProcessHelperTransport : public HelperTransport {
 public:
  // The Helper must outlive the transport.
  explicit InProcessHelperTransport(Helper* helper) : helper_(helper) {}

  absl::StatusOr<DapResponse> PostAggregate(const DapRequest& req) override {
    return helper_->HandleAggregate(req);
  }

  absl::StatusOr<DapResponse> PostAggregateShare(
      const DapRequest& req) override {
    return helper_->HandleAggregateShare(req);
  }

 private:
  Helper* const helper_;
};

}  // namespace aggregator
}  // namespace dap

#endif  // DAP_AGGREGATOR_IN_PROCESS_TRANSPORT_H_
