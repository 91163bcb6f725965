// Copyright 2017 Google Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SPANLAB_BASE_CLOCK_H_
#define SPANLAB_BASE_CLOCK_H_

#include <time.h>

#include "spanlab/base/types.h"

namespace spanlab {

// Monotonic clock for timing program evaluation.
class Clock {
 public:
  // Nanosecond timestamp.
  typedef int64 Timestamp;

  // Return current timestamp from the monotonic system clock.
  static inline Timestamp now() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<Timestamp>(ts.tv_sec) * 1000000000LL + ts.tv_nsec;
  }

  // Start clock.
  void start() { start_ = now(); }

  // Stop clock.
  void stop() { end_ = now(); }

  // Return nanoseconds elapsed since start.
  Timestamp elapsed() const { return now() - start_; }

  // Return nanoseconds between start and stop.
  Timestamp duration() const { return end_ - start_; }

  // Return time in seconds.
  double secs() const { return duration() / 1e9; }

  // Return time in milliseconds.
  double ms() const { return duration() / 1e6; }

  // Return time in microseconds.
  double us() const { return duration() / 1e3; }

 private:
  Timestamp start_ = 0;  // start timestamp
  Timestamp end_ = 0;    // end timestamp
};

}  // namespace spanlab

#endif  // SPANLAB_BASE_CLOCK_H_
