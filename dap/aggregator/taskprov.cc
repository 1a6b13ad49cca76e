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

#include "dap/aggregator/taskprov.h"

#include <cstddef>
#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "dap/aggregator/abort.h"
#include "dap/base/digest.h"
#include "dap/base/monitoring.h"
#include "dap/vdaf/vdaf.h"

namespace dap {
namespace aggregator {

namespace {

constexpr absl::string_view kVerifyKeySalt = "dap-taskprov";

}  // namespace

std::string ComputeTaskprovTaskId(absl::string_view payload) {
  return ComputeSHA256(payload);
}

std::string DeriveVdafVerifyKey(absl::string_view verify_key_init,
                                absl::string_view task_id, size_t key_size) {
  DAP_CHECK(key_size <= kSha256DigestLength);
  std::string key = ComputeHmacSHA256(verify_key_init,
                                      absl::StrCat(kVerifyKeySalt, task_id));
  key.resize(key_size);
  return key;
}

const Extension* FindTaskprovExtension(const ReportMetadata& metadata) {
  for (const Extension& extension : metadata.extensions()) {
    if (extension.type() == kTaskprovExtensionType) return &extension;
  }
  return nullptr;
}

Extension MakeTaskprovExtension(const TaskprovConfig& taskprov) {
  Extension extension;
  extension.set_type(kTaskprovExtensionType);
  extension.set_payload(taskprov.SerializeAsString());
  return extension;
}

absl::StatusOr<TaskConfig> TaskConfigFromTaskprov(
    absl::string_view task_id, absl::string_view payload,
    const TaskprovSettings& settings) {
  if (ComputeTaskprovTaskId(payload) != task_id) {
    return Abort(AbortKind::kUnrecognizedTask,
                 "task ID does not match the taskprov extension");
  }
  TaskprovConfig taskprov;
  if (!taskprov.ParseFromString(std::string(payload))) {
    return Abort(AbortKind::kUnrecognizedMessage,
                 "malformed taskprov extension");
  }
  if (taskprov.time_precision() == 0) {
    return Abort(AbortKind::kUnrecognizedMessage,
                 "taskprov time precision must be positive");
  }
  if (taskprov.query().type() != TIME_INTERVAL &&
      taskprov.query().type() != FIXED_SIZE) {
    return Abort(AbortKind::kUnrecognizedMessage,
                 "taskprov query type not set");
  }
  if (taskprov.query().type() == FIXED_SIZE &&
      taskprov.query().max_batch_size() == 0) {
    return Abort(AbortKind::kUnrecognizedMessage,
                 "taskprov fixed size query needs a max batch size");
  }
  absl::StatusOr<std::unique_ptr<vdaf::Vdaf>> vdaf =
      vdaf::CreateVdaf(taskprov.vdaf());
  if (!vdaf.ok()) {
    return Abort(AbortKind::kUnrecognizedMessage,
                 absl::StrCat("unsupported taskprov VDAF: ",
                              vdaf.status().message()));
  }

  TaskConfig config;
  config.set_version(settings.version);
  config.set_leader_url(taskprov.leader_url());
  config.set_helper_url(taskprov.helper_url());
  *config.mutable_collector_hpke_config() = settings.collector_hpke_config;
  config.set_time_precision(taskprov.time_precision());
  config.set_expiration(taskprov.task_expiration());
  config.set_min_batch_size(taskprov.min_batch_size());
  *config.mutable_query() = taskprov.query();
  *config.mutable_vdaf() = taskprov.vdaf();
  config.set_vdaf_verify_key(DeriveVdafVerifyKey(
      settings.vdaf_verify_key_init, task_id, (*vdaf)->verify_key_size()));
  return config;
}

}  // namespace aggregator
}  // namespace dap
