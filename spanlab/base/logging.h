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

#ifndef SPANLAB_BASE_LOGGING_H_
#define SPANLAB_BASE_LOGGING_H_

#include <stddef.h>
#include <sstream>

#include "spanlab/base/macros.h"
#include "spanlab/base/types.h"

namespace spanlab {

// Log severities. Messages below --loglevel are discarded.
enum LogSeverity {INFO = 0, WARNING = 1, ERROR = 2, FATAL = 3};

// A log message is collected in the stream and emitted when the message
// object goes out of scope at the end of the LOG statement.
class LogMessage : public std::ostringstream {
 public:
  LogMessage(const char *file, int line, int severity);
  ~LogMessage();

  // Severity threshold for LOG and verbosity threshold for VLOG.
  static int log_level();
  static int vlog_level();

 protected:
  // Writes the collected message with a time and source location prefix.
  void Emit();

 private:
  const char *file_;
  int line_;
  int severity_;
};

// Fatal messages are always emitted and terminate the process.
class LogMessageFatal : public LogMessage {
 public:
  LogMessageFatal(const char *file, int line) SPANLAB_ATTRIBUTE_COLD;
  SPANLAB_ATTRIBUTE_NORETURN ~LogMessageFatal();
};

#define SPANLAB_LOG_INFO \
  ::spanlab::LogMessage(__FILE__, __LINE__, ::spanlab::INFO)
#define SPANLAB_LOG_WARNING \
  ::spanlab::LogMessage(__FILE__, __LINE__, ::spanlab::WARNING)
#define SPANLAB_LOG_ERROR \
  ::spanlab::LogMessage(__FILE__, __LINE__, ::spanlab::ERROR)
#define SPANLAB_LOG_FATAL ::spanlab::LogMessageFatal(__FILE__, __LINE__)

#define LOG(severity) SPANLAB_LOG_##severity

#define VLOG_IS_ON(level) ((level) <= ::spanlab::LogMessage::vlog_level())

#define VLOG(level)                     \
  if (PREDICT_FALSE(VLOG_IS_ON(level))) \
  ::spanlab::LogMessage(__FILE__, __LINE__, ::spanlab::INFO)

// CHECK is evaluated in all build modes.
#define CHECK(condition)           \
  if (PREDICT_FALSE(!(condition))) \
  LOG(FATAL) << "Check failed: " #condition " "

// Returns a new message "Check failed: expr (v1 vs. v2) " for a failed
// comparison. The caller logs it and dies, so it is never freed.
template <typename T1, typename T2>
string *CheckOpFailure(const T1 &v1, const T2 &v2,
                       const char *expr) SPANLAB_ATTRIBUTE_NOINLINE;

template <typename T1, typename T2>
string *CheckOpFailure(const T1 &v1, const T2 &v2, const char *expr) {
  std::ostringstream msg;
  msg << "Check failed: " << expr << " (" << v1 << " vs. " << v2 << ") ";
  return new string(msg.str());
}

// Comparison helpers for CHECK_XX. They return null when the comparison
// holds. Container sizes are often compared with int literals, so the
// (size_t, int) form orders a negative int below every size.
#define SPANLAB_CHECK_OP_FUNCTION(name, op)                              \
  template <typename T1, typename T2>                                    \
  inline string *Check##name(const T1 &v1, const T2 &v2,                 \
                             const char *expr) {                         \
    if (PREDICT_TRUE(v1 op v2)) return nullptr;                          \
    return CheckOpFailure(v1, v2, expr);                                 \
  }                                                                      \
  inline string *Check##name(size_t v1, int v2, const char *expr) {      \
    bool holds = v2 < 0 ? (1 op 0) : (v1 op static_cast<size_t>(v2));   \
    if (PREDICT_TRUE(holds)) return nullptr;                             \
    return CheckOpFailure(v1, v2, expr);                                 \
  }

SPANLAB_CHECK_OP_FUNCTION(EQ, ==)
SPANLAB_CHECK_OP_FUNCTION(NE, !=)
SPANLAB_CHECK_OP_FUNCTION(LE, <=)
SPANLAB_CHECK_OP_FUNCTION(LT, <)
SPANLAB_CHECK_OP_FUNCTION(GE, >=)
SPANLAB_CHECK_OP_FUNCTION(GT, >)
#undef SPANLAB_CHECK_OP_FUNCTION

#define CHECK_OP(name, op, val1, val2)                                    \
  while (string *_check_failure =                                         \
             ::spanlab::Check##name(val1, val2, #val1 " " #op " " #val2)) \
  ::spanlab::LogMessageFatal(__FILE__, __LINE__) << *_check_failure

#define CHECK_EQ(val1, val2) CHECK_OP(EQ, ==, val1, val2)
#define CHECK_NE(val1, val2) CHECK_OP(NE, !=, val1, val2)
#define CHECK_LE(val1, val2) CHECK_OP(LE, <=, val1, val2)
#define CHECK_LT(val1, val2) CHECK_OP(LT, <, val1, val2)
#define CHECK_GE(val1, val2) CHECK_OP(GE, >=, val1, val2)
#define CHECK_GT(val1, val2) CHECK_OP(GT, >, val1, val2)

#ifndef NDEBUG

#define DCHECK(condition) CHECK(condition)
#define DCHECK_EQ(val1, val2) CHECK_EQ(val1, val2)
#define DCHECK_NE(val1, val2) CHECK_NE(val1, val2)
#define DCHECK_LE(val1, val2) CHECK_LE(val1, val2)
#define DCHECK_LT(val1, val2) CHECK_LT(val1, val2)
#define DCHECK_GE(val1, val2) CHECK_GE(val1, val2)
#define DCHECK_GT(val1, val2) CHECK_GT(val1, val2)

#else

// Debug checks still type-check their arguments in optimized builds.
#define DCHECK(condition) while (false && (condition)) LOG(FATAL)
#define SPANLAB_DCHECK_NOP(x, y) \
  while (false && ((void) (x), (void) (y), 0)) LOG(FATAL)
#define DCHECK_EQ(x, y) SPANLAB_DCHECK_NOP(x, y)
#define DCHECK_NE(x, y) SPANLAB_DCHECK_NOP(x, y)
#define DCHECK_LE(x, y) SPANLAB_DCHECK_NOP(x, y)
#define DCHECK_LT(x, y) SPANLAB_DCHECK_NOP(x, y)
#define DCHECK_GE(x, y) SPANLAB_DCHECK_NOP(x, y)
#define DCHECK_GT(x, y) SPANLAB_DCHECK_NOP(x, y)

#endif

}  // namespace spanlab

#endif  // SPANLAB_BASE_LOGGING_H_
