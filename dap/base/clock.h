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
#ifndef DAP_BASE_CLOCK_H_
#define DAP_BASE_CLOCK_H_

#include <cstdint>

#include "absl/time/time.h"

namespace dap {

// Abstract clock interface so that time dependent validation (task
// expiration, batch interval bounds) can be driven deterministically in tests.
class Clock {
 public:
  // Returns a pointer to the global realtime clock. The caller does not own
  // the returned pointer.
  static Clock* RealClock();

  virtual ~Clock() = default;

  // Returns current time.
  virtual absl::Time Now() = 0;

  // Current time in whole seconds since the UNIX epoch, the unit of every
  // protocol timestamp.
  uint64_t NowSeconds() {
    return static_cast<uint64_t>(absl::ToUnixSeconds(Now()));
  }
};

}  // namespace dap

#endif  // DAP_BASE_CLOCK_H_
