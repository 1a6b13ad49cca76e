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
#ifndef DAP_AGGREGATOR_BATCH_BUCKET_H_
#define DAP_AGGREGATOR_BATCH_BUCKET_H_

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

#include "absl/strings/escaping.h"
#include "dap/protos/messages.pb.h"

namespace dap {
namespace aggregator {

// The smallest collectible partition of a task's reports: one time window of
// width time_precision (TIME_INTERVAL) or one batch (FIXED_SIZE).
struct BatchBucket {
  QueryType query_type = QUERY_TYPE_UNSPECIFIED;
  uint64_t window_start = 0;
  std::string batch_id;

  static BatchBucket TimeWindow(uint64_t start) {
    return BatchBucket{TIME_INTERVAL, start, ""};
  }
  static BatchBucket FixedSize(std::string batch_id) {
    return BatchBucket{FIXED_SIZE, 0, std::move(batch_id)};
  }

  friend bool operator==(const BatchBucket& a, const BatchBucket& b) {
    return a.query_type == b.query_type && a.window_start == b.window_start &&
           a.batch_id == b.batch_id;
  }
  friend bool operator!=(const BatchBucket& a, const BatchBucket& b) {
    return !(a == b);
  }

  template <typename H>
  friend H AbslHashValue(H h, const BatchBucket& bucket) {
    return H::combine(std::move(h), bucket.query_type, bucket.window_start,
                      bucket.batch_id);
  }

  friend std::ostream& operator<<(std::ostream& os,
                                  const BatchBucket& bucket) {
    if (bucket.query_type == FIXED_SIZE) {
      return os << "batch " << absl::WebSafeBase64Escape(bucket.batch_id);
    }
    return os << "window " << bucket.window_start;
  }
};

}  // namespace aggregator
}  // namespace dap

#endif  // DAP_AGGREGATOR_BATCH_BUCKET_H_
