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
#ifndef DAP_AGGREGATOR_COLLECTOR_H_
#define DAP_AGGREGATOR_COLLECTOR_H_

#include <cstdint>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "dap/hpke/hpke.h"
#include "dap/protos/config.pb.h"
#include "dap/protos/messages.pb.h"

namespace dap {
namespace aggregator {

struct CollectResult {
  uint64_t report_count = 0;
  uint64_t aggregate = 0;
};

// Decrypts both aggregate shares of a collect response and recovers the
// aggregate. batch_sel is the query the collect job was created with.
absl::StatusOr<CollectResult> ConsumeCollectResp(
    const hpke::HpkeDecrypter& decrypter, absl::string_view task_id,
    const TaskConfig& task, const BatchSelector& batch_sel,
    const CollectResp& resp);

}  // namespace aggregator
}  // namespace dap

#endif  // DAP_AGGREGATOR_COLLECTOR_H_
