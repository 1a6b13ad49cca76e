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
#ifndef DAP_BASE_MONITORING_H_
#define DAP_BASE_MONITORING_H_

#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/attributes.h"
#include "absl/base/optimization.h"
#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/cord.h"
#include "absl/strings/string_view.h"

namespace dap {

// Logging
// =======

/**
 * DAP_LOG(severity) streams a message to Abseil logging. Request handlers log
 * aborts at INFO and per-report failures at DAP_VLOG(1):
 *
 *     DAP_LOG(INFO) << "collect job " << id << " created";
 *     DAP_VLOG(1) << "report " << id << " rejected: " << failure;
 *
 * DAP_VLOG arguments are evaluated whatever the verbosity.
 */
#define DAP_LOG(severity) ABSL_LOG(severity)
#define DAP_LOG_IF(severity, condition) ABSL_LOG_IF(severity, condition)
#define DAP_VLOG(verbosity) ABSL_LOG(INFO).WithVerbosity(verbosity)

/**
 * Dies when an internal invariant is violated. Never use it on input that a
 * client, a peer aggregator or a config file controls; return a status
 * instead.
 *
 *     DAP_CHECK(step_ == Step::kContinue) << "job already finished";
 */
#define DAP_CHECK(condition)                            \
  DAP_LOG_IF(FATAL, ABSL_PREDICT_FALSE(!(condition))) \
      << ("Check failed: " #condition ". ")

// Status
// ======

using Status = absl::Status;
using StatusCode = absl::StatusCode;
template <typename T>
using StatusOr = absl::StatusOr<T>;

constexpr auto OK = StatusCode::kOk;
constexpr auto UNKNOWN = StatusCode::kUnknown;
constexpr auto INVALID_ARGUMENT = StatusCode::kInvalidArgument;
constexpr auto NOT_FOUND = StatusCode::kNotFound;
constexpr auto ALREADY_EXISTS = StatusCode::kAlreadyExists;
constexpr auto FAILED_PRECONDITION = StatusCode::kFailedPrecondition;
constexpr auto INTERNAL = StatusCode::kInternal;
constexpr auto UNAUTHENTICATED = StatusCode::kUnauthenticated;

/**
 * Builds a status whose message is streamed into it. A non-OK status message
 * is prefixed with "(at file:line)" unless WithoutLocation() is called, which
 * is what messages that travel to a peer want:
 *
 *     return DAP_STATUS(NOT_FOUND) << "no task " << task_id;
 *     return DAP_STATUS(INVALID_ARGUMENT).WithoutLocation()
 *            .WithPayload(kUrl, absl::Cord(kind)) << reason;
 *
 * Converts to Status and to any StatusOr<T>.
 */
#define DAP_STATUS(code) \
  ::dap::internal::MakeStatusBuilder(code, __FILE__, __LINE__)

namespace internal {

inline const Status& AsStatus(const Status& status) { return status; }
template <typename T>
inline const Status& AsStatus(const StatusOr<T>& status_or) {
  return status_or.status();
}

}  // namespace internal

/**
 * Returns from the enclosing function if expr, a Status or a StatusOr, is not
 * OK.
 */
#define DAP_RETURN_IF_ERROR(expr)                                 \
  do {                                                            \
    ::dap::Status __dap_status = ::dap::internal::AsStatus(expr); \
    if (ABSL_PREDICT_FALSE(!__dap_status.ok())) {                 \
      return __dap_status;                                        \
    }                                                             \
  } while (false)

/**
 * Evaluates expr, a StatusOr, and either moves its value into lhs (which may
 * be a declaration) or returns its status:
 *
 *     DAP_ASSIGN_OR_RETURN(TaskConfig task, GetTaskConfig(task_id));
 */
#define DAP_ASSIGN_OR_RETURN(lhs, expr) \
  DAP_ASSIGN_OR_RETURN_IMPL_(           \
      DAP_STATUS_CONCAT_(__dap_statusor, __LINE__), lhs, expr)

#define DAP_ASSIGN_OR_RETURN_IMPL_(statusor, lhs, expr) \
  auto statusor = (expr);                               \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) {             \
    return statusor.status();                           \
  }                                                     \
  lhs = std::move(statusor).value()

#define DAP_STATUS_CONCAT_(x, y) DAP_STATUS_CONCAT_INNER_(x, y)
#define DAP_STATUS_CONCAT_INNER_(x, y) x##y

namespace internal {

class ABSL_MUST_USE_RESULT StatusBuilder {
 public:
  StatusBuilder(StatusCode code, const char* file, int line);
  StatusBuilder(const StatusBuilder& other);

  bool ok() const { return code_ == OK; }
  StatusCode code() const { return code_; }

  // Leaves the source location out of the message.
  StatusBuilder& WithoutLocation() {
    with_location_ = false;
    return *this;
  }

  // Attaches a payload to the built status. Ignored for OK.
  StatusBuilder& WithPayload(absl::string_view type_url, absl::Cord payload) {
    payloads_.emplace_back(std::string(type_url), std::move(payload));
    return *this;
  }

  template <typename T>
  StatusBuilder& operator<<(const T& x) {
    message_ << x;
    return *this;
  }

  operator Status() const;  // NOLINT

  template <typename T>
  operator StatusOr<T>() const {  // NOLINT
    return StatusOr<T>(static_cast<Status>(*this));
  }

 private:
  const char* const file_;
  const int line_;
  const StatusCode code_;
  bool with_location_ = true;
  std::vector<std::pair<std::string, absl::Cord>> payloads_;
  std::ostringstream message_;
};

inline StatusBuilder MakeStatusBuilder(StatusCode code, const char* file,
                                       int line) {
  return StatusBuilder(code, file, line);
}

}  // namespace internal
}  // namespace dap

#endif  // DAP_BASE_MONITORING_H_
