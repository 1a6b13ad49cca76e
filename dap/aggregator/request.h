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
#ifndef DAP_AGGREGATOR_REQUEST_H_
#define DAP_AGGREGATOR_REQUEST_H_

#include <optional>
#include <string>

#include "absl/strings/string_view.h"
#include "dap/aggregator/auth.h"
#include "dap/protos/config.pb.h"

namespace dap {
namespace aggregator {

inline constexpr absl::string_view kMediaTypeReport = "application/dap-report";
inline constexpr absl::string_view kMediaTypeHpkeConfig =
    "application/dap-hpke-config";
inline constexpr absl::string_view kMediaTypeAggregateInitReq =
    "application/dap-aggregate-initialize-req";
inline constexpr absl::string_view kMediaTypeAggregateContReq =
    "application/dap-aggregate-continue-req";
inline constexpr absl::string_view kMediaTypeAggregateResp =
    "application/dap-aggregate-resp";
inline constexpr absl::string_view kMediaTypeAggregateShareReq =
    "application/dap-aggregate-share-req";
inline constexpr absl::string_view kMediaTypeAggregateShareResp =
    "application/dap-aggregate-share-resp";
inline constexpr absl::string_view kMediaTypeCollectReq =
    "application/dap-collect-req";
inline constexpr absl::string_view kMediaTypeCollectResp =
    "application/dap-collect-resp";

// A protocol request with the transport stripped away.
struct DapRequest {
  DapVersion version = DAP_VERSION_UNKNOWN;
  std::string media_type;
  std::optional<std::string> task_id;
  // Serialized protocol message.
  std::string payload;
  std::string url;
  std::optional<BearerToken> sender_auth;
};

struct DapResponse {
  std::string media_type;
  std::string payload;
};

}  // namespace aggregator
}  // namespace dap

#endif  // DAP_AGGREGATOR_REQUEST_H_
