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
#ifndef DAP_AGGREGATOR_HPKE_BINDING_H_
#define DAP_AGGREGATOR_HPKE_BINDING_H_

#include <cstdint>
#include <string>

#include "absl/strings/string_view.h"
#include "dap/protos/config.pb.h"
#include "dap/protos/messages.pb.h"

namespace dap {
namespace aggregator {

enum class Role : uint8_t {
  kCollector = 0,
  kClient = 1,
  kLeader = 2,
  kHelper = 3,
};

// HPKE info and associated data binding each ciphertext to its purpose,
// protocol version and context, so a share cannot be replayed elsewhere.

// info = "dap-XX input share" || client role || receiver role
std::string InputShareInfo(DapVersion version, Role receiver);
// aad = task ID || report metadata || public share
std::string InputShareAad(absl::string_view task_id,
                          const ReportMetadata& metadata,
                          absl::string_view public_share);

// info = "dap-XX aggregate share" || sender role || collector role
std::string AggregateShareInfo(DapVersion version, Role sender);
// aad = task ID || batch selector
std::string AggregateShareAad(absl::string_view task_id,
                              const BatchSelector& batch_sel);

}  // namespace aggregator
}  // namespace dap

#endif  // DAP_AGGREGATOR_HPKE_BINDING_H_
