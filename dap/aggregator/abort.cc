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

#include "dap/aggregator/abort.h"

#include <optional>
#include <ostream>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/string_view.h"
#include "dap/base/monitoring.h"

namespace dap {
namespace aggregator {

namespace {

constexpr absl::string_view kAbortPayloadUrl = "type.googleapis.com/dap.Abort";

constexpr AbortKind kAllKinds[] = {
    AbortKind::kUnrecognizedTask,
    AbortKind::kMissingTaskId,
    AbortKind::kUnauthorizedRequest,
    AbortKind::kInvalidProtocolVersion,
    AbortKind::kUnrecognizedMessage,
    AbortKind::kQueryMismatch,
    AbortKind::kBatchInvalid,
    AbortKind::kBatchOverlap,
    AbortKind::kBatchMismatch,
    AbortKind::kInvalidBatchSize,
    AbortKind::kUnrecognizedAggregationJob,
    AbortKind::kReportTooLate,
    AbortKind::kBadRequest,
};

absl::StatusCode CodeFor(AbortKind kind) {
  switch (kind) {
    case AbortKind::kUnrecognizedTask:
    case AbortKind::kUnrecognizedAggregationJob:
      return absl::StatusCode::kNotFound;
    case AbortKind::kUnauthorizedRequest:
      return absl::StatusCode::kUnauthenticated;
    case AbortKind::kBatchOverlap:
    case AbortKind::kReportTooLate:
      return absl::StatusCode::kFailedPrecondition;
    default:
      return absl::StatusCode::kInvalidArgument;
  }
}

}  // namespace

absl::string_view AbortTypeUri(AbortKind kind) {
  switch (kind) {
    case AbortKind::kUnrecognizedTask:
      return "urn:ietf:params:ppm:dap:error:unrecognizedTask";
    case AbortKind::kMissingTaskId:
      return "urn:ietf:params:ppm:dap:error:missingTaskID";
    case AbortKind::kUnauthorizedRequest:
      return "urn:ietf:params:ppm:dap:error:unauthorizedRequest";
    case AbortKind::kInvalidProtocolVersion:
      return "urn:ietf:params:ppm:dap:error:invalidProtocolVersion";
    case AbortKind::kUnrecognizedMessage:
      return "urn:ietf:params:ppm:dap:error:unrecognizedMessage";
    case AbortKind::kQueryMismatch:
      return "urn:ietf:params:ppm:dap:error:queryMismatch";
    case AbortKind::kBatchInvalid:
      return "urn:ietf:params:ppm:dap:error:batchInvalid";
    case AbortKind::kBatchOverlap:
      return "urn:ietf:params:ppm:dap:error:batchOverlap";
    case AbortKind::kBatchMismatch:
      return "urn:ietf:params:ppm:dap:error:batchMismatch";
    case AbortKind::kInvalidBatchSize:
      return "urn:ietf:params:ppm:dap:error:invalidBatchSize";
    case AbortKind::kUnrecognizedAggregationJob:
      return "urn:ietf:params:ppm:dap:error:unrecognizedAggregationJob";
    case AbortKind::kReportTooLate:
      return "urn:ietf:params:ppm:dap:error:reportTooLate";
    case AbortKind::kBadRequest:
      return "urn:ietf:params:ppm:dap:error:badRequest";
  }
  return "urn:ietf:params:ppm:dap:error:unknown";
}

std::optional<AbortKind> AbortKindFromTypeUri(absl::string_view uri) {
  for (AbortKind kind : kAllKinds) {
    if (uri == AbortTypeUri(kind)) return kind;
  }
  return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, AbortKind kind) {
  return os << AbortTypeUri(kind);
}

absl::Status Abort(AbortKind kind, absl::string_view detail) {
  // The message is sent to the peer as the problem detail.
  return DAP_STATUS(CodeFor(kind))
             .WithoutLocation()
             .WithPayload(kAbortPayloadUrl, absl::Cord(AbortTypeUri(kind)))
         << (detail.empty() ? AbortTypeUri(kind) : detail);
}

std::optional<AbortKind> GetAbortKind(const absl::Status& status) {
  if (status.ok()) return std::nullopt;
  std::optional<absl::Cord> payload = status.GetPayload(kAbortPayloadUrl);
  if (!payload.has_value()) return std::nullopt;
  return AbortKindFromTypeUri(std::string(*payload));
}

}  // namespace aggregator
}  // namespace dap
