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
#ifndef DAP_TESTING_PARSE_TEXT_PROTO_H_
#define DAP_TESTING_PARSE_TEXT_PROTO_H_

#include <string>
#include <type_traits>

#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"
#include "absl/strings/string_view.h"
#include "dap/base/monitoring.h"

namespace dap {

// Converts to any message type by parsing the text format it was built from.
// Dies on parse errors, reporting the location of the PARSE_TEXT_PROTO use.
class ParseProtoHelper {
 public:
  ParseProtoHelper(absl::string_view text, const char* file, int line)
      : text_(text), file_(file), line_(line) {}

  template <typename T,
            typename = std::enable_if_t<
                std::is_base_of<google::protobuf::Message, T>::value>>
  operator T() const {  // NOLINT
    T message;
    DAP_CHECK(google::protobuf::TextFormat::ParseFromString(text_, &message))
        << "Failed to parse " << T::descriptor()->full_name() << " at "
        << file_ << ":" << line_ << ": " << text_;
    return message;
  }

 private:
  const std::string text_;
  const char* const file_;
  const int line_;
};

}  // namespace dap

#define PARSE_TEXT_PROTO(text) ::dap::ParseProtoHelper(text, __FILE__, __LINE__)

#endif  // DAP_TESTING_PARSE_TEXT_PROTO_H_
