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

#include "dap/base/monitoring.h"

#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

namespace dap {
namespace internal {

namespace {

absl::string_view BaseName(absl::string_view path) {
  size_t pos = path.find_last_of('/');
  return pos == absl::string_view::npos ? path : path.substr(pos + 1);
}

}  // namespace

StatusBuilder::StatusBuilder(StatusCode code, const char* file, int line)
    : file_(file), line_(line), code_(code) {}

StatusBuilder::StatusBuilder(const StatusBuilder& other)
    : file_(other.file_),
      line_(other.line_),
      code_(other.code_),
      with_location_(other.with_location_),
      payloads_(other.payloads_),
      message_(other.message_.str()) {}

StatusBuilder::operator Status() const {
  if (code_ == OK) return Status();
  std::string message = message_.str();
  if (with_location_) {
    message = absl::StrCat("(at ", BaseName(file_), ":", line_, ") ", message);
  }
  Status status(code_, message);
  for (const auto& [type_url, payload] : payloads_) {
    status.SetPayload(type_url, payload);
  }
  return status;
}

}  // namespace internal
}  // namespace dap
