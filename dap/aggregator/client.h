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
#ifndef DAP_AGGREGATOR_CLIENT_H_
#define DAP_AGGREGATOR_CLIENT_H_

#include <cstdint>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "dap/protos/config.pb.h"
#include "dap/protos/messages.pb.h"

namespace dap {
namespace aggregator {

// Shards a measurement and encrypts one input share to each aggregator.
// hpke_configs holds the Leader's config followed by the Helper's.
absl::StatusOr<Report> ProduceReport(absl::string_view task_id,
                                     const TaskConfig& task,
                                     const std::vector<HpkeConfig>& hpke_configs,
                                     uint64_t time, uint64_t measurement,
                                     const std::vector<Extension>& extensions =
                                         {});

}  // namespace aggregator
}  // namespace dap

#endif  // DAP_AGGREGATOR_CLIENT_H_
