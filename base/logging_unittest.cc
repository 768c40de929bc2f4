// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "base/logging.h"

#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace logging {

namespace {

using ::testing::Return;

// Class to make sure any manipulations we do to the logging state are
// contained (i.e., do not affect other unit tests).
class LogStateSaver {
 public:
  LogStateSaver()
      : old_min_log_level_(GetMinLogLevel()),
        old_handler_(GetLogMessageHandler()) {}
  LogStateSaver(const LogStateSaver&) = delete;
  LogStateSaver& operator=(const LogStateSaver&) = delete;

  ~LogStateSaver() {
    SetMinLogLevel(old_min_log_level_);
    SetLogMessageHandler(old_handler_);
    InitLogging(LoggingSettings());
  }

 private:
  int old_min_log_level_;
  LogMessageHandlerFunction old_handler_;
};

class LoggingTest : public testing::Test {
 private:
  LogStateSaver log_state_saver_;
};

class MockLogSource {
 public:
  MOCK_METHOD(const char*, Log, ());
};

// Captures the last message routed through the handler.
int g_captured_severity = 0;
std::string* g_captured_message = nullptr;
std::string* g_captured_body = nullptr;

bool CaptureHandler(int severity,
                    const char* file,
                    int line,
                    size_t message_start,
                    const std::string& str) {
  g_captured_severity = severity;
  *g_captured_message = str;
  *g_captured_body = str.substr(message_start);
  return true;
}

TEST_F(LoggingTest, BasicLogging) {
  MockLogSource mock_log_source;
  EXPECT_CALL(mock_log_source, Log())
      .Times(DCHECK_IS_ON() ? 6 : 3)
      .WillRepeatedly(Return("log message"));

  SetMinLogLevel(LOGGING_INFO);

  EXPECT_TRUE(LOG_IS_ON(INFO));
  EXPECT_TRUE(VLOG_IS_ON(0));

  LOG(INFO) << mock_log_source.Log();
  LOG_IF(INFO, true) << mock_log_source.Log();
  VLOG(0) << mock_log_source.Log();

  DLOG(INFO) << mock_log_source.Log();
  DLOG_IF(INFO, true) << mock_log_source.Log();
  DVLOG(0) << mock_log_source.Log();
}

TEST_F(LoggingTest, LogIsOn) {
  SetMinLogLevel(LOGGING_WARNING);
  EXPECT_FALSE(LOG_IS_ON(INFO));
  EXPECT_TRUE(LOG_IS_ON(WARNING));
  EXPECT_TRUE(LOG_IS_ON(ERROR));
  EXPECT_TRUE(LOG_IS_ON(FATAL));

  // LOG_IS_ON(FATAL) should always be true.
  SetMinLogLevel(LOGGING_FATAL + 1);
  EXPECT_FALSE(LOG_IS_ON(ERROR));
  EXPECT_TRUE(LOG_IS_ON(FATAL));
  EXPECT_EQ(DCHECK_IS_ON(), LOG_IS_ON(DFATAL));
}

TEST_F(LoggingTest, LoggingIsLazyBySeverity) {
  MockLogSource mock_log_source;
  EXPECT_CALL(mock_log_source, Log()).Times(0);

  SetMinLogLevel(LOGGING_WARNING);

  EXPECT_FALSE(LOG_IS_ON(INFO));
  EXPECT_FALSE(VLOG_IS_ON(1));

  LOG(INFO) << mock_log_source.Log();
  LOG_IF(INFO, false) << mock_log_source.Log();
  VLOG(1) << mock_log_source.Log();

  DLOG(INFO) << mock_log_source.Log();
  DLOG_IF(INFO, true) << mock_log_source.Log();
  DVLOG(1) << mock_log_source.Log();
}

TEST_F(LoggingTest, LoggingIsLazyByDestination) {
  MockLogSource mock_log_source;
  EXPECT_CALL(mock_log_source, Log()).Times(0);

  LoggingSettings settings;
  settings.logging_dest = LOG_NONE;
  EXPECT_TRUE(InitLogging(settings));

  LOG(INFO) << mock_log_source.Log();
  LOG(WARNING) << mock_log_source.Log();
  EXPECT_TRUE(LOG_IS_ON(ERROR));
}

TEST_F(LoggingTest, VerboseLevels) {
  SetMinLogLevel(-2);
  EXPECT_EQ(2, GetVlogVerbosity());
  EXPECT_TRUE(VLOG_IS_ON(1));
  EXPECT_TRUE(VLOG_IS_ON(2));
  EXPECT_FALSE(VLOG_IS_ON(3));

  // Levels above FATAL are clamped.
  SetMinLogLevel(LOGGING_FATAL + 5);
  EXPECT_EQ(LOGGING_FATAL, GetMinLogLevel());
  EXPECT_EQ(-1, GetVlogVerbosity());
}

TEST_F(LoggingTest, MessageHandlerSeesPrefixAndBody) {
  std::string message;
  std::string body;
  g_captured_message = &message;
  g_captured_body = &body;
  SetLogMessageHandler(&CaptureHandler);

  LOG(WARNING) << "tag " << 42;
  EXPECT_EQ(LOGGING_WARNING, g_captured_severity);
  EXPECT_THAT(message, ::testing::StartsWith("[WARNING:logging_unittest.cc("));
  EXPECT_EQ("tag 42\n", body);

  SetMinLogLevel(-1);
  VLOG(1) << "verbose";
  EXPECT_EQ(-1, g_captured_severity);
  EXPECT_THAT(message, ::testing::StartsWith("[VERBOSE1:"));

  g_captured_message = nullptr;
  g_captured_body = nullptr;
}

TEST_F(LoggingTest, ChecksAreLazy) {
  MockLogSource mock_log_source;
  EXPECT_CALL(mock_log_source, Log()).Times(0);

  CHECK(true) << mock_log_source.Log();
  CHECK_EQ(1, 1) << mock_log_source.Log();
  CHECK_LT(1u, 2u) << mock_log_source.Log();
  DCHECK(true) << mock_log_source.Log();
  DCHECK_NE(1, 2) << mock_log_source.Log();
}

TEST(CheckDeathTest, Check) {
  EXPECT_DEATH(CHECK(false) << "extra", "Check failed: false. extra");
}

TEST(CheckDeathTest, CheckOp) {
  int a = 1;
  EXPECT_DEATH(CHECK_EQ(a, 2), "Check failed: a == 2 \\(1 vs. 2\\)");
  EXPECT_DEATH(CHECK_GT(a, 5) << "context", "a > 5 \\(1 vs. 5\\)context");
}

TEST(CheckDeathTest, FatalLog) {
  EXPECT_DEATH(LOG(FATAL) << "fatal message", "fatal message");
}

#if DCHECK_IS_ON()
TEST(CheckDeathTest, Dcheck) {
  EXPECT_DEATH(DCHECK(1 + 1 == 3), "Check failed: 1 \\+ 1 == 3");
  EXPECT_DEATH(NOTREACHED(), "Check failed: false");
}
#endif  // DCHECK_IS_ON()

}  // namespace

}  // namespace logging
