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
#ifndef DAP_AGGREGATOR_TASKPROV_H_
#define DAP_AGGREGATOR_TASKPROV_H_

#include <cstddef>
#include <cstdint>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "dap/protos/config.pb.h"
#include "dap/protos/messages.pb.h"

namespace dap {
namespace aggregator {

// In-band task provisioning. A Client attaches a serialized TaskprovConfig as
// a report extension; an aggregator that does not know the task derives the
// full TaskConfig from it on first sight.

inline constexpr uint32_t kTaskprovExtensionType = 0xff00;

// Local parameters of the provisioned tasks that are not carried in-band.
struct TaskprovSettings {
  DapVersion version = DAP_VERSION_UNKNOWN;
  std::string vdaf_verify_key_init;
  HpkeConfig collector_hpke_config;
};

// The task ID is the SHA-256 of the serialized extension payload.
std::string ComputeTaskprovTaskId(absl::string_view payload);

// HMAC-SHA256(init, "dap-taskprov" || task_id), truncated to key_size.
std::string DeriveVdafVerifyKey(absl::string_view verify_key_init,
                                absl::string_view task_id, size_t key_size);

// Returns the taskprov extension of the report, or nullptr.
const Extension* FindTaskprovExtension(const ReportMetadata& metadata);

// Serializes a taskprov config into a report extension.
Extension MakeTaskprovExtension(const TaskprovConfig& taskprov);

// Builds the config of the task provisioned by the extension payload. Fails
// with UnrecognizedTask if task_id was not derived from the payload and with
// UnrecognizedMessage if the payload is malformed or describes parameters
// this aggregator cannot run.
absl::StatusOr<TaskConfig> TaskConfigFromTaskprov(
    absl::string_view task_id, absl::string_view payload,
    const TaskprovSettings& settings);

}  // namespace aggregator
}  // namespace dap

#endif  // DAP_AGGREGATOR_TASKPROV_H_
