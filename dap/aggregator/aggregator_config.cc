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

#include "dap/aggregator/aggregator_config.h"

#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "dap/base/monitoring.h"
#include "dap/base/random_id.h"
#include "dap/vdaf/vdaf.h"
#include "google/protobuf/text_format.h"

namespace dap {
namespace aggregator {

namespace {

bool IsHex(absl::string_view s) {
  if (s.size() % 2 != 0) return false;
  for (char c : s) {
    if (!absl::ascii_isxdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

absl::Status ValidateTask(const AggregatorConfig::Task& entry) {
  absl::StatusOr<std::string> task_id = IdFromBase64Url(entry.task_id());
  if (!task_id.ok()) {
    return DAP_STATUS(INVALID_ARGUMENT)
           << "task " << entry.task_id() << ": " << task_id.status().message();
  }
  const TaskConfig& task = entry.config();
  auto invalid = [&]() {
    return DAP_STATUS(INVALID_ARGUMENT) << "task " << entry.task_id() << ": ";
  };
  if (task.version() == DAP_VERSION_UNKNOWN) {
    return invalid() << "version not set";
  }
  if (task.time_precision() == 0) {
    return invalid() << "time_precision must be positive";
  }
  if (task.query().type() != TIME_INTERVAL &&
      task.query().type() != FIXED_SIZE) {
    return invalid() << "query type not set";
  }
  if (task.query().type() == FIXED_SIZE &&
      task.query().max_batch_size() == 0) {
    return invalid() << "FIXED_SIZE query needs max_batch_size";
  }
  absl::StatusOr<std::unique_ptr<vdaf::Vdaf>> vdaf =
      vdaf::CreateVdaf(task.vdaf());
  if (!vdaf.ok()) {
    return invalid() << vdaf.status().message();
  }
  if (task.vdaf_verify_key().size() != (*vdaf)->verify_key_size()) {
    return invalid() << "vdaf_verify_key has " << task.vdaf_verify_key().size()
                     << " bytes, expected " << (*vdaf)->verify_key_size();
  }
  if (task.collector_hpke_config().public_key().empty()) {
    return invalid() << "collector_hpke_config not set";
  }
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<AggregatorConfig> LoadAggregatorConfig(absl::string_view path) {
  std::ifstream file{std::string(path)};
  if (!file) {
    return DAP_STATUS(NOT_FOUND) << "cannot open " << path;
  }
  std::stringstream contents;
  contents << file.rdbuf();
  AggregatorConfig config;
  if (!google::protobuf::TextFormat::ParseFromString(contents.str(),
                                                     &config)) {
    return DAP_STATUS(INVALID_ARGUMENT)
           << path << " is not a text format AggregatorConfig";
  }
  return config;
}

absl::Status ValidateAggregatorConfig(const AggregatorConfig& config,
                                      AggregatorRole role) {
  const GlobalConfig& global = config.global();
  if (global.max_batch_duration() == 0) {
    return DAP_STATUS(INVALID_ARGUMENT) << "max_batch_duration must be positive";
  }
  if (config.leader_bearer_token().empty()) {
    return DAP_STATUS(INVALID_ARGUMENT) << "leader_bearer_token not set";
  }
  if (role == AggregatorRole::kLeader &&
      config.collector_bearer_token().empty()) {
    return DAP_STATUS(INVALID_ARGUMENT) << "collector_bearer_token not set";
  }
  for (const AggregatorConfig::HpkeReceiverKey& key :
       config.hpke_receiver_keys()) {
    if (!IsHex(key.private_key_hex())) {
      return DAP_STATUS(INVALID_ARGUMENT)
             << "HPKE receiver key " << key.config_id() << " is not hex";
    }
  }
  if (global.allow_taskprov()) {
    if (!IsHex(config.taskprov_vdaf_verify_key_init_hex()) ||
        config.taskprov_vdaf_verify_key_init_hex().size() != 64) {
      return DAP_STATUS(INVALID_ARGUMENT)
             << "taskprov_vdaf_verify_key_init_hex must be 32 hex bytes";
    }
    if (config.taskprov_collector_hpke_config().public_key().empty()) {
      return DAP_STATUS(INVALID_ARGUMENT)
             << "taskprov_collector_hpke_config not set";
    }
  }
  for (const AggregatorConfig::Task& task : config.tasks()) {
    DAP_RETURN_IF_ERROR(ValidateTask(task));
  }
  return absl::OkStatus();
}

absl::StatusOr<hpke::HpkeReceiverConfigList> LoadHpkeReceivers(
    const AggregatorConfig& config) {
  std::vector<hpke::HpkeReceiverConfig> receivers;
  for (const AggregatorConfig::HpkeReceiverKey& key :
       config.hpke_receiver_keys()) {
    DAP_ASSIGN_OR_RETURN(
        hpke::HpkeReceiverConfig receiver,
        hpke::HpkeReceiverConfig::FromPrivateKey(
            key.config_id(), absl::HexStringToBytes(key.private_key_hex())));
    receivers.push_back(std::move(receiver));
  }
  if (receivers.empty()) {
    uint32_t config_id = static_cast<uint8_t>(RandomBytes(1)[0]);
    DAP_ASSIGN_OR_RETURN(hpke::HpkeReceiverConfig receiver,
                         hpke::HpkeReceiverConfig::Generate(config_id));
    DAP_LOG(INFO) << "No HPKE receiver key configured, generated config "
                  << config_id;
    receivers.push_back(std::move(receiver));
  }
  return hpke::HpkeReceiverConfigList(std::move(receivers));
}

absl::Status RegisterTasks(const AggregatorConfig& config, TaskStore& store) {
  for (const AggregatorConfig::Task& entry : config.tasks()) {
    DAP_ASSIGN_OR_RETURN(std::string task_id, IdFromBase64Url(entry.task_id()));
    DAP_ASSIGN_OR_RETURN(bool inserted,
                         store.PutIfAbsent(task_id, entry.config()));
    if (!inserted) {
      return DAP_STATUS(ALREADY_EXISTS)
             << "task " << entry.task_id() << " is already registered";
    }
  }
  return absl::OkStatus();
}

}  // namespace aggregator
}  // namespace dap
