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

#include "dap/aggregator/client.h"

#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "dap/aggregator/hpke_binding.h"
#include "dap/base/monitoring.h"
#include "dap/base/random_id.h"
#include "dap/hpke/hpke.h"
#include "dap/vdaf/vdaf.h"

namespace dap {
namespace aggregator {

absl::StatusOr<Report> ProduceReport(absl::string_view task_id,
                                     const TaskConfig& task,
                                     const std::vector<HpkeConfig>& hpke_configs,
                                     uint64_t time, uint64_t measurement,
                                     const std::vector<Extension>& extensions) {
  if (hpke_configs.size() != 2) {
    return DAP_STATUS(INVALID_ARGUMENT)
           << "need the Leader's and the Helper's HPKE config, got "
           << hpke_configs.size();
  }
  DAP_ASSIGN_OR_RETURN(std::unique_ptr<vdaf::Vdaf> vdaf,
                       vdaf::CreateVdaf(task.vdaf()));

  Report report;
  report.set_task_id(std::string(task_id));
  ReportMetadata* metadata = report.mutable_metadata();
  metadata->set_id(RandomBytes(kReportIdLength));
  metadata->set_time(time);
  for (const Extension& extension : extensions) {
    *metadata->add_extensions() = extension;
  }

  DAP_ASSIGN_OR_RETURN(vdaf::ShardResult shards,
                       vdaf->Shard(measurement, metadata->id()));
  report.set_public_share(shards.public_share);
  std::string aad = InputShareAad(task_id, *metadata, shards.public_share);
  const Role receivers[] = {Role::kLeader, Role::kHelper};
  for (int i = 0; i < 2; ++i) {
    DAP_ASSIGN_OR_RETURN(
        *report.add_encrypted_input_shares(),
        hpke::HpkeEncrypt(hpke_configs[i],
                          InputShareInfo(task.version(), receivers[i]), aad,
                          shards.input_shares[i]));
  }
  return report;
}

}  // namespace aggregator
}  // namespace dap
