// Copyright 2026 The dxcapture Authors
// Tests for: SessionErrorState (per-session last error, cross-thread reads)

#include <atomic>
#include <string>
#include <thread>

#include "core/session_error.h"
#include "gtest/gtest.h"

using dxcapture::internal::NoTextureError;
using dxcapture::internal::OkStatus;
using dxcapture::internal::SessionErrorState;
using dxcapture::internal::Status;
using dxcapture::internal::UnsupportedPixelFormatError;

TEST(SessionErrorStateTest, InitiallyNoError) {
  SessionErrorState errors;
  EXPECT_STREQ(errors.message(), "No error");
  EXPECT_EQ(errors.last_pixel_format(), 0u);
}

TEST(SessionErrorStateTest, RecordReturnsCodeAndStoresMessage) {
  SessionErrorState errors;
  EXPECT_EQ(errors.Record(NoTextureError()), kDxCaptureErrorNoTexture);
  EXPECT_STREQ(errors.message(), NoTextureError().message().c_str());

  EXPECT_EQ(errors.Record(OkStatus()), kDxCaptureOk);
  EXPECT_STREQ(errors.message(), "No error");
}

TEST(SessionErrorStateTest, PixelFormatSurvivesLaterSuccess) {
  SessionErrorState errors;
  EXPECT_EQ(errors.Record(UnsupportedPixelFormatError(10)),
            kDxCaptureErrorUnsupportedPixelFormat);
  EXPECT_EQ(errors.last_pixel_format(), 10u);
  errors.Record(OkStatus());
  EXPECT_EQ(errors.last_pixel_format(), 10u);
}

TEST(SessionErrorStateTest, MessageStaysValidWhileAnotherThreadRecords) {
  SessionErrorState errors;
  const std::string first(200, 'a');
  const std::string second(300, 'b');
  errors.Record(Status(kDxCaptureErrorBackend, first));

  const char* held = errors.message();
  ASSERT_EQ(std::string(held), first);

  std::atomic<bool> done{false};
  std::thread writer([&] {
    for (int i = 0; i < 5000; ++i) {
      errors.Record(Status(kDxCaptureErrorBackend, i % 2 ? first : second));
    }
    done.store(true);
  });

  int changed = 0;
  while (!done.load()) {
    if (std::string(held) != first) ++changed;
  }
  writer.join();

  EXPECT_EQ(changed, 0);
  EXPECT_EQ(std::string(errors.message()), first);
}
