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

#include "spanlab/base/logging.h"

#include <stdio.h>
#include <stdlib.h>
#include <sys/time.h>
#include <time.h>

#include "spanlab/base/flags.h"

DEFINE_int32(v, 0, "Verbosity level for VLOG messages");
DEFINE_int32(loglevel, 0, "Minimum severity of messages written to the log");
DEFINE_bool(logtostderr, false, "Write log messages to stderr, not stdout");

namespace spanlab {

int LogMessage::log_level() { return FLAGS_loglevel; }

int LogMessage::vlog_level() { return FLAGS_v; }

LogMessage::LogMessage(const char *file, int line, int severity)
    : file_(file), line_(line), severity_(severity) {}

LogMessage::~LogMessage() {
  if (severity_ >= log_level()) Emit();
}

void LogMessage::Emit() {
  struct timeval now;
  gettimeofday(&now, nullptr);
  struct tm local;
  localtime_r(&now.tv_sec, &local);
  char stamp[32];
  strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

  FILE *out = FLAGS_logtostderr ? stderr : stdout;
  fprintf(out, "[%s.%06d: %c %s:%d] %s\n",
          stamp, static_cast<int>(now.tv_usec), "IWEF"[severity_],
          file_, line_, str().c_str());
  fflush(out);
}

LogMessageFatal::LogMessageFatal(const char *file, int line)
    : LogMessage(file, line, FATAL) {}

LogMessageFatal::~LogMessageFatal() {
  Emit();
  abort();
}

}  // namespace spanlab
