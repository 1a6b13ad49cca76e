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
#ifndef DAP_AGGREGATOR_AGGREGATOR_CONFIG_H_
#define DAP_AGGREGATOR_AGGREGATOR_CONFIG_H_

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "dap/aggregator/storage.h"
#include "dap/hpke/hpke.h"
#include "dap/protos/config.pb.h"

namespace dap {
namespace aggregator {

enum class AggregatorRole {
  kLeader,
  kHelper,
};

// Reads a text format AggregatorConfig.
absl::StatusOr<AggregatorConfig> LoadAggregatorConfig(absl::string_view path);

// Returns INVALID_ARGUMENT describing the first invalid setting.
absl::Status ValidateAggregatorConfig(const AggregatorConfig& config,
                                      AggregatorRole role);

// The configured HPKE receiver keys, or a freshly generated one if none is
// configured.
absl::StatusOr<hpke::HpkeReceiverConfigList> LoadHpkeReceivers(
    const AggregatorConfig& config);

// Adds the configured tasks to the store. Fails with ALREADY_EXISTS if a task
// ID is registered already.
absl::Status RegisterTasks(const AggregatorConfig& config, TaskStore& store);

}  // namespace aggregator
}  // namespace dap

#endif  // DAP_AGGREGATOR_AGGREGATOR_CONFIG_H_
