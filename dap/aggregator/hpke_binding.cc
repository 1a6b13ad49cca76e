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

#include "dap/aggregator/hpke_binding.h"

#include <cstdint>
#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

namespace dap {
namespace aggregator {

namespace {

absl::string_view VersionTag(DapVersion version) {
  return version == DAP_VERSION_DRAFT03 ? "dap-03" : "dap-02";
}

void AppendUint(std::string& out, uint64_t value, int bytes) {
  for (int i = bytes - 1; i >= 0; --i) {
    out.push_back(static_cast<char>((value >> (8 * i)) & 0xff));
  }
}

// Length-prefixed so that adjacent variable length fields cannot be confused.
void AppendOpaque(std::string& out, absl::string_view bytes) {
  AppendUint(out, bytes.size(), 4);
  out.append(bytes.data(), bytes.size());
}

}  // namespace

std::string InputShareInfo(DapVersion version, Role receiver) {
  std::string info = absl::StrCat(VersionTag(version), " input share");
  info.push_back(static_cast<char>(Role::kClient));
  info.push_back(static_cast<char>(receiver));
  return info;
}

std::string InputShareAad(absl::string_view task_id,
                          const ReportMetadata& metadata,
                          absl::string_view public_share) {
  std::string aad;
  AppendOpaque(aad, task_id);
  AppendOpaque(aad, metadata.id());
  AppendUint(aad, metadata.time(), 8);
  AppendUint(aad, metadata.extensions_size(), 4);
  for (const Extension& extension : metadata.extensions()) {
    AppendUint(aad, extension.type(), 4);
    AppendOpaque(aad, extension.payload());
  }
  AppendOpaque(aad, public_share);
  return aad;
}

std::string AggregateShareInfo(DapVersion version, Role sender) {
  std::string info = absl::StrCat(VersionTag(version), " aggregate share");
  info.push_back(static_cast<char>(sender));
  info.push_back(static_cast<char>(Role::kCollector));
  return info;
}

std::string AggregateShareAad(absl::string_view task_id,
                              const BatchSelector& batch_sel) {
  std::string aad;
  AppendOpaque(aad, task_id);
  AppendUint(aad, batch_sel.query_type(), 1);
  if (batch_sel.query_type() == FIXED_SIZE) {
    AppendOpaque(aad, batch_sel.batch_id());
  } else {
    AppendUint(aad, batch_sel.batch_interval().start(), 8);
    AppendUint(aad, batch_sel.batch_interval().duration(), 8);
  }
  return aad;
}

}  // namespace aggregator
}  // namespace dap
