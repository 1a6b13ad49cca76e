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
#ifndef DAP_AGGREGATOR_ABORT_H_
#define DAP_AGGREGATOR_ABORT_H_

#include <optional>
#include <ostream>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace dap {
namespace aggregator {

// Request-level failures. A request that fails with one of these is rejected
// as a whole and leaves no durable state behind.
enum class AbortKind {
  kUnrecognizedTask,
  kMissingTaskId,
  kUnauthorizedRequest,
  kInvalidProtocolVersion,
  kUnrecognizedMessage,
  kQueryMismatch,
  kBatchInvalid,
  kBatchOverlap,
  kBatchMismatch,
  kInvalidBatchSize,
  kUnrecognizedAggregationJob,
  kReportTooLate,
  kBadRequest,
};

// Protocol error type, e.g. "urn:ietf:params:ppm:dap:error:unrecognizedTask".
absl::string_view AbortTypeUri(AbortKind kind);
// Inverse of AbortTypeUri; nullopt for an unknown URI.
std::optional<AbortKind> AbortKindFromTypeUri(absl::string_view uri);
std::ostream& operator<<(std::ostream& os, AbortKind kind);

// Builds the status for an abort. The message is the detail if one is given,
// otherwise the abort type.
absl::Status Abort(AbortKind kind, absl::string_view detail = "");

// An abort whose message is exactly the given reason.
inline absl::Status BadRequest(absl::string_view reason) {
  return Abort(AbortKind::kBadRequest, reason);
}

// Returns the abort carried by a status, or nullopt for OK and internal
// errors.
std::optional<AbortKind> GetAbortKind(const absl::Status& status);

inline bool IsAbort(const absl::Status& status, AbortKind kind) {
  return GetAbortKind(status) == kind;
}

}  // namespace aggregator
}  // namespace dap

#endif  // DAP_AGGREGATOR_ABORT_H_
