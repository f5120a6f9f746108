// Copyright 2026 The dxcapture Authors
// Tests for: dxcapture_context_create, dxcapture_context_destroy,
//            dxcapture_get_last_error, dxcapture_get_last_error_message,
//            dxcapture_error_string, target lookup through a context

#include <cstring>
#include <memory>
#include <utility>
#include <vector>

#include "core/dxcapture_context.h"
#include "dxcapture/dxcapture.h"
#include "fake_capture.h"
#include "gtest/gtest.h"

// ---------------------------------------------------------------------------
// Context lifecycle
// ---------------------------------------------------------------------------

TEST(ContextTest, CreateReturnsNonNull) {
  DxCaptureContext* ctx = dxcapture_context_create();
  ASSERT_NE(ctx, nullptr);
  dxcapture_context_destroy(ctx);
}

TEST(ContextTest, DestroyNullIsSafe) {
  // Must not crash.
  dxcapture_context_destroy(nullptr);
}

TEST(ContextTest, CreateMultipleContexts) {
  DxCaptureContext* a = dxcapture_context_create();
  DxCaptureContext* b = dxcapture_context_create();
  ASSERT_NE(a, nullptr);
  ASSERT_NE(b, nullptr);
  EXPECT_NE(a, b);
  dxcapture_context_destroy(b);
  dxcapture_context_destroy(a);
}

// ---------------------------------------------------------------------------
// Error state
// ---------------------------------------------------------------------------

TEST(ContextTest, InitialErrorIsOk) {
  DxCaptureContext* ctx = dxcapture_context_create();
  ASSERT_NE(ctx, nullptr);
  EXPECT_EQ(dxcapture_get_last_error(ctx), kDxCaptureOk);
  EXPECT_STREQ(dxcapture_get_last_error_message(ctx), "No error");
  dxcapture_context_destroy(ctx);
}

TEST(ContextTest, GetLastErrorWithNullCtx) {
  EXPECT_EQ(dxcapture_get_last_error(nullptr), kDxCaptureErrorInvalidParam);
  EXPECT_NE(dxcapture_get_last_error_message(nullptr), nullptr);
}

TEST(ContextTest, ErrorIsClearedBySuccess) {
  DxCaptureContext* ctx = dxcapture_context_create();
  ASSERT_NE(ctx, nullptr);
  EXPECT_EQ(dxcapture_enumerate_windows(ctx, nullptr, 4), -1);
  EXPECT_EQ(dxcapture_get_last_error(ctx), kDxCaptureErrorInvalidParam);

  EXPECT_GE(dxcapture_get_display_count(ctx), 0);
  EXPECT_EQ(dxcapture_get_last_error(ctx), kDxCaptureOk);
  dxcapture_context_destroy(ctx);
}

TEST(ContextTest, ErrorStringCoversEveryCode) {
  const DxCaptureError codes[] = {
      kDxCaptureOk,
      kDxCaptureErrorNotActive,
      kDxCaptureErrorNoTexture,
      kDxCaptureErrorDeniedAccessCpuRead,
      kDxCaptureErrorBackend,
      kDxCaptureErrorUnsupportedBufferType,
      kDxCaptureErrorUnsupportedPixelFormat,
      kDxCaptureErrorInvalidParam,
      kDxCaptureErrorNotFound,
      kDxCaptureErrorNotSupported,
      kDxCaptureErrorUnknown,
  };
  for (DxCaptureError code : codes) {
    const char* s = dxcapture_error_string(code);
    ASSERT_NE(s, nullptr);
    EXPECT_GT(std::strlen(s), 0u);
  }
  EXPECT_STREQ(dxcapture_error_string(kDxCaptureErrorNotActive),
               "Capture is not active.");
}

// ---------------------------------------------------------------------------
// Target lookup (fake backend)
// ---------------------------------------------------------------------------

namespace {

using dxcapture::internal::CaptureBackend;
using dxcapture::internal::CaptureSession;
using dxcapture::internal::CaptureSource;
using dxcapture::internal::DxCaptureContextImpl;
using dxcapture::internal::Status;
using dxcapture::test::FakeCaptureSource;
using dxcapture::test::FakeSourceState;

class FakeBackend : public CaptureBackend {
 public:
  bool Initialize() override { return true; }
  void Shutdown() override {}
  bool IsCaptureSupported() override { return true; }

  std::vector<DxCaptureDisplayInfo> EnumerateDisplays() override {
    return displays;
  }
  std::vector<DxCaptureWindowInfo> EnumerateWindows() override {
    return windows;
  }

  Status CreateSource(const DxCaptureTarget& target,
                      const DxCaptureSessionOptions& options,
                      std::unique_ptr<CaptureSource>* out) override {
    last_target = target;
    last_options = options;
    *out = std::make_unique<FakeCaptureSource>(
        std::make_shared<FakeSourceState>(), 16, 9);
    return dxcapture::internal::OkStatus();
  }

  void AddDisplay(DxCaptureHandle handle, bool primary) {
    DxCaptureDisplayInfo info = {};
    info.index = static_cast<int>(displays.size());
    info.handle = handle;
    info.is_primary = primary ? 1 : 0;
    displays.push_back(info);
  }

  void AddWindow(DxCaptureHandle id, const char* title) {
    DxCaptureWindowInfo info = {};
    info.id = id;
    std::strncpy(info.title, title, sizeof(info.title) - 1);
    windows.push_back(info);
  }

  std::vector<DxCaptureDisplayInfo> displays;
  std::vector<DxCaptureWindowInfo> windows;
  DxCaptureTarget last_target = {};
  DxCaptureSessionOptions last_options = {};
};

class ContextLookupTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto backend = std::make_unique<FakeBackend>();
    backend_ = backend.get();
    backend_->AddDisplay(0x100, false);
    backend_->AddDisplay(0x200, true);
    backend_->AddWindow(0xA, "Untitled - Notepad");
    backend_->AddWindow(0xB, "Calculator");
    backend_->AddWindow(0xC, "notes.txt - NOTEPAD++");
    ctx_ = std::make_unique<DxCaptureContextImpl>(std::move(backend));
    ASSERT_TRUE(ctx_->Initialize());
  }

  FakeBackend* backend_ = nullptr;
  std::unique_ptr<DxCaptureContextImpl> ctx_;
};

}  // namespace

TEST_F(ContextLookupTest, FindWindowsIsCaseInsensitiveSubstring) {
  DxCaptureWindowInfo out[8] = {};
  int n = ctx_->FindWindows("notepad", out, 8);
  ASSERT_EQ(n, 2);
  EXPECT_EQ(out[0].id, 0xAu);
  EXPECT_EQ(out[1].id, 0xCu);
}

TEST_F(ContextLookupTest, FindWindowsRespectsMaxCount) {
  DxCaptureWindowInfo out[1] = {};
  EXPECT_EQ(ctx_->FindWindows("NOTEPAD", out, 1), 1);
}

TEST_F(ContextLookupTest, FindWindowsNoMatch) {
  DxCaptureWindowInfo out[4] = {};
  EXPECT_EQ(ctx_->FindWindows("Paint", out, 4), 0);
  EXPECT_EQ(ctx_->last_error(), kDxCaptureOk);
}

TEST_F(ContextLookupTest, NegativeDisplayIndexSelectsPrimary) {
  auto session = ctx_->CreateSessionForDisplay(-1, nullptr);
  ASSERT_NE(session, nullptr);
  EXPECT_EQ(backend_->last_target.kind, kDxCaptureTargetMonitor);
  EXPECT_EQ(backend_->last_target.handle, 0x200u);
}

TEST_F(ContextLookupTest, DisplayByIndex) {
  auto session = ctx_->CreateSessionForDisplay(0, nullptr);
  ASSERT_NE(session, nullptr);
  EXPECT_EQ(backend_->last_target.handle, 0x100u);
  EXPECT_TRUE(session->is_active());
}

TEST_F(ContextLookupTest, DisplayIndexOutOfRange) {
  EXPECT_EQ(ctx_->CreateSessionForDisplay(2, nullptr), nullptr);
  EXPECT_EQ(ctx_->last_error(), kDxCaptureErrorInvalidParam);
}

TEST_F(ContextLookupTest, WindowByTitle) {
  DxCaptureSessionOptions opts = {};
  opts.hide_cursor = 1;
  auto session = ctx_->CreateSessionForWindowTitle("calc", &opts);
  ASSERT_NE(session, nullptr);
  EXPECT_EQ(backend_->last_target.kind, kDxCaptureTargetWindow);
  EXPECT_EQ(backend_->last_target.handle, 0xBu);
  EXPECT_EQ(backend_->last_options.hide_cursor, 1);
  EXPECT_EQ(backend_->last_options.hide_border, 0);
}

TEST_F(ContextLookupTest, WindowTitleNotFound) {
  EXPECT_EQ(ctx_->CreateSessionForWindowTitle("Paint", nullptr), nullptr);
  EXPECT_EQ(ctx_->last_error(), kDxCaptureErrorNotFound);
}

TEST_F(ContextLookupTest, RejectsNullHandle) {
  DxCaptureTarget target = {};
  target.kind = kDxCaptureTargetWindow;
  EXPECT_EQ(ctx_->CreateSession(target, nullptr), nullptr);
  EXPECT_EQ(ctx_->last_error(), kDxCaptureErrorInvalidParam);
}
