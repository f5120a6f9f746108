// Copyright 2026 The dxcapture Authors

#include "core/session_error.h"

#include "core/logger.h"

namespace dxcapture {
namespace internal {

DxCaptureError SessionErrorState::Record(const Status& status) {
  std::lock_guard<std::mutex> lock(mu_);
  if (status.ok()) {
    message_ = "No error";
    return kDxCaptureOk;
  }
  message_ = status.message();
  if (status.code() == kDxCaptureErrorUnsupportedPixelFormat) {
    last_pixel_format_ = status.pixel_format();
  }
  // NoTexture is the normal "poll again" result.
  if (status.code() != kDxCaptureErrorNoTexture) {
    DXCAPTURE_LOG_DEBUG("Session error {}: {}", static_cast<int>(status.code()),
                        status.message());
  }
  return status.code();
}

const char* SessionErrorState::message() const {
  thread_local std::string copy;
  std::lock_guard<std::mutex> lock(mu_);
  copy = message_;
  return copy.c_str();
}

uint32_t SessionErrorState::last_pixel_format() const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_pixel_format_;
}

}  // namespace internal
}  // namespace dxcapture
