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
#ifndef DAP_AGGREGATOR_HELPER_TRANSPORT_H_
#define DAP_AGGREGATOR_HELPER_TRANSPORT_H_

#include "absl/status/statusor.h"
#include "dap/aggregator/request.h"

namespace dap {
namespace aggregator {

// Delivers the Leader's requests to the Helper. Implementations own
// connection handling and retries; an error status is returned to the
// operation that issued the request.
class HelperTransport {
 public:
  virtual ~HelperTransport() = default;

  // POST <helper_url>aggregate
  virtual absl::StatusOr<DapResponse> PostAggregate(const DapRequest& req) = 0;

  // POST <helper_url>aggregate_share
  virtual absl::StatusOr<DapResponse> PostAggregateShare(
      const DapRequest& req) = 0;
};

}  // namespace aggregator
}  // namespace dap

#endif  // DAP_AGGREGATOR_HELPER_TRANSPORT_H_
