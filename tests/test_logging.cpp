// Copyright 2026 The dxcapture Authors
// Tests for: dxcapture_set_log_level, dxcapture_set_log_callback,
//            dxcapture_log

#include <memory>
#include <string>
#include <vector>

#include "core/capture_session.h"
#include "dxcapture/dxcapture.h"
#include "fake_capture.h"
#include "gtest/gtest.h"

using dxcapture::internal::CaptureSession;
using dxcapture::test::FakeCaptureSource;
using dxcapture::test::FakeSourceState;
using dxcapture::test::FakeTexture;

// ---------------------------------------------------------------------------
// Helper: capture log messages via callback
// ---------------------------------------------------------------------------

struct LogEntry {
  DxCaptureLogLevel level;
  std::string message;
};

static void TestLogCallback(DxCaptureLogLevel level, const char* message,
                            void* userdata) {
  auto* entries = static_cast<std::vector<LogEntry>*>(userdata);
  entries->push_back({level, message ? message : ""});
}

class LoggingTest : public ::testing::Test {
 protected:
  void SetUp() override {
    entries_.clear();
    dxcapture_set_log_level(kDxCaptureLogTrace);
    dxcapture_set_log_callback(TestLogCallback, &entries_);
  }

  void TearDown() override {
    dxcapture_set_log_callback(nullptr, nullptr);
    dxcapture_set_log_level(kDxCaptureLogInfo);
  }

  bool Contains(const std::string& needle) const {
    for (const auto& e : entries_) {
      if (e.message.find(needle) != std::string::npos) return true;
    }
    return false;
  }

  std::vector<LogEntry> entries_;
};

// ---------------------------------------------------------------------------
// Tests
// ---------------------------------------------------------------------------

TEST_F(LoggingTest, SetLogLevelDoesNotCrash) {
  dxcapture_set_log_level(kDxCaptureLogTrace);
  dxcapture_set_log_level(kDxCaptureLogDebug);
  dxcapture_set_log_level(kDxCaptureLogInfo);
  dxcapture_set_log_level(kDxCaptureLogWarn);
  dxcapture_set_log_level(kDxCaptureLogError);
  dxcapture_set_log_level(kDxCaptureLogFatal);
}

TEST_F(LoggingTest, LogCallbackReceivesMessage) {
  dxcapture_log(kDxCaptureLogInfo, "test message");
  ASSERT_GE(entries_.size(), 1u);
  EXPECT_TRUE(Contains("test message"));
}

TEST_F(LoggingTest, LogCallbackReceivesCorrectLevel) {
  dxcapture_log(kDxCaptureLogWarn, "warn msg");

  bool found = false;
  for (const auto& e : entries_) {
    if (e.level == kDxCaptureLogWarn &&
        e.message.find("warn msg") != std::string::npos) {
      found = true;
      break;
    }
  }
  EXPECT_TRUE(found);
}

TEST_F(LoggingTest, CallbackMessageHasNoTrailingNewline) {
  dxcapture_log(kDxCaptureLogInfo, "line");
  ASSERT_FALSE(entries_.empty());
  const std::string& msg = entries_.back().message;
  ASSERT_FALSE(msg.empty());
  EXPECT_NE(msg.back(), '\n');
}

TEST_F(LoggingTest, LogLevelFiltering) {
  dxcapture_set_log_level(kDxCaptureLogWarn);

  dxcapture_log(kDxCaptureLogInfo, "should be filtered");
  dxcapture_log(kDxCaptureLogWarn, "should appear");

  EXPECT_FALSE(Contains("should be filtered"));
  EXPECT_TRUE(Contains("should appear"));
}

TEST_F(LoggingTest, UnregisterCallback) {
  dxcapture_set_log_callback(nullptr, nullptr);
  dxcapture_log(kDxCaptureLogInfo, "after unregister");
  EXPECT_FALSE(Contains("after unregister"));
}

TEST_F(LoggingTest, ContextErrorsAreLogged) {
  DxCaptureContext* ctx = dxcapture_context_create();
  ASSERT_NE(ctx, nullptr);
  EXPECT_EQ(dxcapture_session_create(ctx, nullptr, nullptr), nullptr);
  EXPECT_TRUE(Contains("target is NULL"));
  dxcapture_context_destroy(ctx);
}

TEST_F(LoggingTest, MessagesCarryLoggerName) {
  dxcapture_log(kDxCaptureLogInfo, "named");
  ASSERT_FALSE(entries_.empty());
  EXPECT_EQ(entries_.back().message, "[dxcapture][info] named");
}

TEST_F(LoggingTest, DebugMessagesAreForwarded) {
  DxCaptureContext* ctx = dxcapture_context_create();
  ASSERT_NE(ctx, nullptr);
  DxCaptureTarget target = {kDxCaptureTargetMonitor, 1};
  DxCaptureSession* session = dxcapture_session_create(ctx, &target, nullptr);
  dxcapture_session_destroy(session);
  dxcapture_context_destroy(ctx);

  bool found = false;
  for (const auto& e : entries_) {
    if (e.level == kDxCaptureLogDebug &&
        e.message.find("CreateSession(") != std::string::npos) {
      found = true;
    }
  }
  EXPECT_TRUE(found);
}

TEST_F(LoggingTest, LateFrameIsLoggedByWorker) {
  auto state = std::make_shared<FakeSourceState>();
  std::unique_ptr<CaptureSession> session;
  ASSERT_TRUE(CaptureSession::Create(
                  std::make_unique<FakeCaptureSource>(state, 4, 4), &session)
                  .ok());
  session->Close();
  state->Deliver(FakeTexture::MakeStaging(4, 4, 16, 0x01));

  bool found = false;
  for (const auto& e : entries_) {
    if (e.level == kDxCaptureLogTrace &&
        e.message.find("[dxcapture:worker]") == 0 &&
        e.message.find("Dropping frame delivered after close") !=
            std::string::npos) {
      found = true;
    }
  }
  EXPECT_TRUE(found);
}

TEST_F(LoggingTest, WorkerFollowsLogLevel) {
  dxcapture_set_log_level(kDxCaptureLogInfo);
  auto state = std::make_shared<FakeSourceState>();
  std::unique_ptr<CaptureSession> session;
  ASSERT_TRUE(CaptureSession::Create(
                  std::make_unique<FakeCaptureSource>(state, 4, 4), &session)
                  .ok());
  session->Close();
  state->Deliver(FakeTexture::MakeStaging(4, 4, 16, 0x01));
  EXPECT_FALSE(Contains("[dxcapture:worker]"));
}

TEST_F(LoggingTest, StubBackendLogsRejectedSession) {
#ifdef _WIN32
  GTEST_SKIP() << "Windows uses the capture backend";
#else
  DxCaptureContext* ctx = dxcapture_context_create();
  ASSERT_NE(ctx, nullptr);
  DxCaptureTarget target = {kDxCaptureTargetWindow, 1};
  EXPECT_EQ(dxcapture_session_create(ctx, &target, nullptr), nullptr);
  EXPECT_EQ(dxcapture_get_last_error(ctx), kDxCaptureErrorNotSupported);
  EXPECT_TRUE(Contains("No capture backend on this platform"));
  dxcapture_context_destroy(ctx);
#endif
}

TEST_F(LoggingTest, LogNullMessage) {
  // Should not crash.
  dxcapture_log(kDxCaptureLogInfo, nullptr);
}
