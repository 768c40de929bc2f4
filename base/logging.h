// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BASE_LOGGING_H_
#define BASE_LOGGING_H_

#include <stddef.h>
#include <stdint.h>

#include <sstream>
#include <string>
#include <type_traits>

#include "base/base_export.h"
#include "base/dcheck_is_on.h"

// Instructions
// ------------
//
// Stream things to LOG(<a particular severity level>). E.g.,
//
//   LOG(INFO) << "Resolved " << count << " tags";
//
// You can also do conditional logging:
//
//   LOG_IF(WARNING, arcs.size() > 32) << "Unusually long identifier";
//
// The CHECK(condition) macro is active in both debug and release builds and
// terminates the process after logging if the condition is false. DCHECK is
// the "debug mode" variant; it is compiled in when DCHECK_IS_ON().
//
// Comparison forms print both operands on failure:
//
//   CHECK_EQ(2u, arcs.size()) << "Expected a root arc pair";
//   DCHECK_LT(unused_bits, 8);
//
// Verbose logging is gated on the minimum log level. VLOG(n) logs at
// severity -n, so SetMinLogLevel(-2) enables VLOG(1) and VLOG(2):
//
//   VLOG(1) << "Rejected object identifier " << text;
//
// The DLOG/DVLOG forms are compiled away to nothing when !DCHECK_IS_ON().

namespace logging {

// A bitmask of potential logging destinations.
using LoggingDestination = uint32_t;
// Unless destination is LOG_NONE, all logs with severity ERROR and above will
// be written to stderr.
enum : uint32_t {
  LOG_NONE = 0,
  LOG_TO_STDERR = 1 << 0,

  LOG_DEFAULT = LOG_TO_STDERR,
};

struct BASE_EXPORT LoggingSettings {
  LoggingDestination logging_dest = LOG_DEFAULT;
};

// Sets the global logging state. Calling this is optional; the defaults log
// everything at INFO and above to stderr.
BASE_EXPORT bool InitLogging(const LoggingSettings& settings);

// Sets the log level. Anything at or above this level will be written to the
// log destination. Anything below this level will be silently ignored. The
// log level defaults to 0 (everything is logged up to level INFO).
// Note that log messages for VLOG(x) are logged at level -x, so setting
// the min log level to negative values enables verbose logging.
BASE_EXPORT void SetMinLogLevel(int level);

// Gets the current log level.
BASE_EXPORT int GetMinLogLevel();

// Used by LOG_IS_ON to lazy-evaluate stream arguments.
BASE_EXPORT bool ShouldCreateLogMessage(int severity);

// Gets the VLOG default verbosity level.
BASE_EXPORT int GetVlogVerbosity();

// Sets the Log Message Handler that gets passed every log message before
// it's sent to other log destinations (if any).
// Returns true to signal that it handled the message and the message
// should not be sent to other log destinations. FATAL messages terminate the
// process even when handled.
typedef bool (*LogMessageHandlerFunction)(int severity,
                                          const char* file,
                                          int line,
                                          size_t message_start,
                                          const std::string& str);
BASE_EXPORT void SetLogMessageHandler(LogMessageHandlerFunction handler);
BASE_EXPORT LogMessageHandlerFunction GetLogMessageHandler();

using LogSeverity = int;
constexpr LogSeverity LOGGING_VERBOSE = -1;  // This is level 1 verbosity
// Note: the log severities are used to index into the array of names,
// see log_severity_names.
constexpr LogSeverity LOGGING_INFO = 0;
constexpr LogSeverity LOGGING_WARNING = 1;
constexpr LogSeverity LOGGING_ERROR = 2;
constexpr LogSeverity LOGGING_FATAL = 3;
constexpr LogSeverity LOGGING_NUM_SEVERITIES = 4;

// LOGGING_DFATAL is LOGGING_FATAL when DCHECKs are on, LOGGING_ERROR otherwise.
#if DCHECK_IS_ON()
constexpr LogSeverity LOGGING_DFATAL = LOGGING_FATAL;
#else
constexpr LogSeverity LOGGING_DFATAL = LOGGING_ERROR;
#endif

constexpr LogSeverity LOGGING_DCHECK = LOGGING_FATAL;

#define LOG_STREAM(severity) \
  ::logging::LogMessage(__FILE__, __LINE__, ::logging::LOGGING_##severity).stream()

#define LOG_IS_ON(severity) \
  (::logging::ShouldCreateLogMessage(::logging::LOGGING_##severity))

#define VLOG_IS_ON(verbose_level) \
  ((verbose_level) <= ::logging::GetVlogVerbosity())

// Helper macro which avoids evaluating the arguments to a stream if
// the condition doesn't hold. Condition is evaluated once and only once.
#define LAZY_STREAM(stream, condition) \
  !(condition) ? (void)0 : ::logging::LogMessageVoidify() & (stream)

#define LOG(severity) LAZY_STREAM(LOG_STREAM(severity), LOG_IS_ON(severity))
#define LOG_IF(severity, condition) \
  LAZY_STREAM(LOG_STREAM(severity), LOG_IS_ON(severity) && (condition))

#define VLOG_STREAM(verbose_level) \
  ::logging::LogMessage(__FILE__, __LINE__, -(verbose_level)).stream()

#define VLOG(verbose_level) \
  LAZY_STREAM(VLOG_STREAM(verbose_level), VLOG_IS_ON(verbose_level))

// Uses but does not evaluate the stream parameters, so code guarded by a
// disabled DCHECK still compiles.
#define EAT_STREAM_PARAMETERS \
  true ? (void)0 : ::logging::LogMessageVoidify() & LOG_STREAM(FATAL)

// CHECK dies with a fatal error if condition is not true. It is not
// controlled by NDEBUG, so the check will be executed regardless of
// compilation mode.
#define CHECK(condition)                                                  \
  LAZY_STREAM(::logging::LogMessage(__FILE__, __LINE__, #condition).stream(), \
              !(condition))

// Helper macro for binary operators.
// Don't use this macro directly in your code, use CHECK_EQ et al below.
// The 'switch' is used to prevent the 'else' from being ambiguous when the
// macro is used in an 'if' clause such as:
// if (a == 1)
//   CHECK_EQ(2, a);
#define CHECK_OP(name, op, val1, val2)                                     \
  switch (0)                                                               \
  case 0:                                                                  \
  default:                                                                 \
    if (::logging::CheckOpResult true_if_passed =                          \
            ::logging::Check##name##Impl((val1), (val2),                   \
                                         #val1 " " #op " " #val2))         \
      ;                                                                    \
    else                                                                   \
      ::logging::LogMessage(__FILE__, __LINE__, true_if_passed.message())  \
          .stream()

// Holds the result of a CHECK_OP comparison. |message| is non-null if and only
// if the comparison failed, in which case it owns the failure description.
class CheckOpResult {
 public:
  // |message| must be non-null if and only if the check failed.
  constexpr CheckOpResult(std::string* message) : message_(message) {}
  // Returns true if the check succeeded.
  constexpr operator bool() const { return !message_; }
  // Returns the message.
  std::string* message() { return message_; }

 private:
  std::string* message_;
};

template <typename T>
void MakeCheckOpValueString(std::ostream* os, const T& v) {
  if constexpr (std::is_enum_v<T>) {
    (*os) << static_cast<std::underlying_type_t<T>>(v);
  } else {
    (*os) << v;
  }
}

// Build the error message string. Specify no inlining for code size.
template <class t1, class t2>
std::string* MakeCheckOpString(const t1& v1, const t2& v2, const char* names) {
  std::ostringstream ss;
  ss << names << " (";
  MakeCheckOpValueString(&ss, v1);
  ss << " vs. ";
  MakeCheckOpValueString(&ss, v2);
  ss << ")";
  return new std::string(ss.str());
}

// Helper functions for CHECK_OP macro.
// The (int, int) specialization works around the issue that the compiler
// will not instantiate the template version of the function on values of
// unnamed enum type.
#define DEFINE_CHECK_OP_IMPL(name, op)                                 \
  template <class t1, class t2>                                        \
  inline std::string* Check##name##Impl(const t1& v1, const t2& v2,    \
                                        const char* names) {           \
    if (v1 op v2)                                                      \
      return nullptr;                                                  \
    return MakeCheckOpString(v1, v2, names);                           \
  }                                                                    \
  inline std::string* Check##name##Impl(int v1, int v2,                \
                                        const char* names) {           \
    if (v1 op v2)                                                      \
      return nullptr;                                                  \
    return MakeCheckOpString(v1, v2, names);                           \
  }
DEFINE_CHECK_OP_IMPL(EQ, ==)
DEFINE_CHECK_OP_IMPL(NE, !=)
DEFINE_CHECK_OP_IMPL(LE, <=)
DEFINE_CHECK_OP_IMPL(LT, < )
DEFINE_CHECK_OP_IMPL(GE, >=)
DEFINE_CHECK_OP_IMPL(GT, > )
#undef DEFINE_CHECK_OP_IMPL

#define CHECK_EQ(val1, val2) CHECK_OP(EQ, ==, val1, val2)
#define CHECK_NE(val1, val2) CHECK_OP(NE, !=, val1, val2)
#define CHECK_LE(val1, val2) CHECK_OP(LE, <=, val1, val2)
#define CHECK_LT(val1, val2) CHECK_OP(LT, < , val1, val2)
#define CHECK_GE(val1, val2) CHECK_OP(GE, >=, val1, val2)
#define CHECK_GT(val1, val2) CHECK_OP(GT, > , val1, val2)

#if DCHECK_IS_ON()

#define DLOG(severity) LOG(severity)
#define DLOG_IF(severity, condition) LOG_IF(severity, condition)
#define DVLOG(verbose_level) VLOG(verbose_level)

#define DCHECK(condition)                                                 \
  LAZY_STREAM(::logging::LogMessage(__FILE__, __LINE__, #condition).stream(), \
              !(condition))

#define DCHECK_OP(name, op, val1, val2) CHECK_OP(name, op, val1, val2)

#else  // DCHECK_IS_ON()

// The condition and stream arguments are still referenced so that variables
// used only by DCHECKs do not trigger unused warnings.
#define DLOG(severity) EAT_STREAM_PARAMETERS
#define DLOG_IF(severity, condition) EAT_STREAM_PARAMETERS << !(condition)
#define DVLOG(verbose_level) EAT_STREAM_PARAMETERS

#define DCHECK(condition) EAT_STREAM_PARAMETERS << !(condition)

#define DCHECK_OP(name, op, val1, val2) \
  EAT_STREAM_PARAMETERS << ((val1) op (val2))

#endif  // DCHECK_IS_ON()

#define DCHECK_EQ(val1, val2) DCHECK_OP(EQ, ==, val1, val2)
#define DCHECK_NE(val1, val2) DCHECK_OP(NE, !=, val1, val2)
#define DCHECK_LE(val1, val2) DCHECK_OP(LE, <=, val1, val2)
#define DCHECK_LT(val1, val2) DCHECK_OP(LT, < , val1, val2)
#define DCHECK_GE(val1, val2) DCHECK_OP(GE, >=, val1, val2)
#define DCHECK_GT(val1, val2) DCHECK_OP(GT, > , val1, val2)

#define NOTREACHED() DCHECK(false)

// This class more or less represents a particular log message. You
// create an instance of LogMessage and then stream stuff to it.
// When you finish streaming to it, ~LogMessage is called and the
// full message gets streamed to the appropriate destination.
//
// You shouldn't actually use LogMessage's constructor to log things,
// though. You should use the LOG() macro (and variants thereof)
// above.
class BASE_EXPORT LogMessage {
 public:
  // Used for LOG(severity).
  LogMessage(const char* file, int line, LogSeverity severity);

  // Used for CHECK(). Implied severity = LOGGING_FATAL.
  LogMessage(const char* file, int line, const char* condition);

  // Used for CHECK_EQ(), etc. Takes ownership of the given string.
  // Implied severity = LOGGING_FATAL.
  LogMessage(const char* file, int line, std::string* result);

  LogMessage(const LogMessage&) = delete;
  LogMessage& operator=(const LogMessage&) = delete;
  ~LogMessage();

  std::ostream& stream() { return stream_; }

  LogSeverity severity() const { return severity_; }
  std::string str() const { return stream_.str(); }

 private:
  void Init(const char* file, int line);

  const LogSeverity severity_;
  std::ostringstream stream_;
  size_t message_start_;  // Offset of the start of the message (past prefix
                          // info).
  // The file and line information passed in to the constructor.
  const char* const file_;
  const int line_;
};

// This class is used to explicitly ignore values in the conditional
// logging macros. This avoids compiler warnings like "value computed
// is not used" and "statement has no effect".
class LogMessageVoidify {
 public:
  LogMessageVoidify() = default;
  // This has to be an operator with a precedence lower than << but
  // higher than ?:
  void operator&(std::ostream&) {}
};

}  // namespace logging

#endif  // BASE_LOGGING_H_
