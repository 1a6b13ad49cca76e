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

#include "dap/aggregator/collector.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "dap/aggregator/hpke_binding.h"
#include "dap/base/monitoring.h"
#include "dap/vdaf/field64.h"
#include "dap/vdaf/vdaf.h"

namespace dap {
namespace aggregator {

absl::StatusOr<CollectResult> ConsumeCollectResp(
    const hpke::HpkeDecrypter& decrypter, absl::string_view task_id,
    const TaskConfig& task, const BatchSelector& batch_sel,
    const CollectResp& resp) {
  if (resp.encrypted_agg_shares_size() != 2) {
    return DAP_STATUS(INVALID_ARGUMENT)
           << "collect response has " << resp.encrypted_agg_shares_size()
           << " aggregate shares, expected 2";
  }
  DAP_ASSIGN_OR_RETURN(std::unique_ptr<vdaf::Vdaf> vdaf,
                       vdaf::CreateVdaf(task.vdaf()));
  std::string aad = AggregateShareAad(task_id, batch_sel);
  const Role senders[] = {Role::kLeader, Role::kHelper};
  std::vector<std::vector<vdaf::FieldElement>> agg_shares;
  for (int i = 0; i < 2; ++i) {
    DAP_ASSIGN_OR_RETURN(
        std::string plaintext,
        decrypter.Decrypt(AggregateShareInfo(task.version(), senders[i]), aad,
                          resp.encrypted_agg_shares(i)));
    DAP_ASSIGN_OR_RETURN(std::vector<vdaf::FieldElement> share,
                         vdaf::DecodeVector(plaintext));
    if (share.size() != vdaf->output_length()) {
      return DAP_STATUS(INVALID_ARGUMENT)
             << "aggregate share has " << share.size() << " elements, expected "
             << vdaf->output_length();
    }
    agg_shares.push_back(std::move(share));
  }

  CollectResult result;
  result.report_count = resp.report_count();
  DAP_ASSIGN_OR_RETURN(result.aggregate,
                       vdaf->Unshard(agg_shares, resp.report_count()));
  return result;
}

}  // namespace aggregator
}  // namespace dap
