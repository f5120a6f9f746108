// Copyright 2026 The dxcapture Authors
//
// Result type for internal capture operations.

#ifndef DXCAPTURE_CORE_STATUS_H_
#define DXCAPTURE_CORE_STATUS_H_

#include <cstdint>
#include <string>
#include <utility>

#include "dxcapture/dxcapture.h"

namespace dxcapture {
namespace internal {

/// Outcome of an internal operation: kDxCaptureOk, or an error code with a
/// message.  UnsupportedPixelFormat failures also carry the rejected format.
class Status {
 public:
  Status() = default;
  Status(DxCaptureError code, std::string message, uint32_t pixel_format = 0)
      : code_(code),
        message_(std::move(message)),
        pixel_format_(pixel_format) {}

  bool ok() const { return code_ == kDxCaptureOk; }
  DxCaptureError code() const { return code_; }
  const std::string& message() const { return message_; }
  uint32_t pixel_format() const { return pixel_format_; }

 private:
  DxCaptureError code_ = kDxCaptureOk;
  std::string message_;
  uint32_t pixel_format_ = 0;
};

inline Status OkStatus() { return Status(); }

inline Status NotActiveError() {
  return Status(kDxCaptureErrorNotActive, "Capture is not active");
}

inline Status NoTextureError() {
  return Status(kDxCaptureErrorNoTexture, "No frame has arrived yet");
}

inline Status DeniedAccessCpuReadError() {
  return Status(kDxCaptureErrorDeniedAccessCpuRead,
                "CPU read access required");
}

inline Status UnsupportedBufferTypeError() {
  return Status(kDxCaptureErrorUnsupportedBufferType,
                "Unsupported buffer type, must be a staging texture");
}

Status UnsupportedPixelFormatError(uint32_t format);

inline Status BackendError(std::string message) {
  return Status(kDxCaptureErrorBackend, std::move(message));
}

/// Backend error with an HRESULT (or other platform code) appended.
Status BackendError(const std::string& what, int32_t code);

}  // namespace internal
}  // namespace dxcapture

#endif  // DXCAPTURE_CORE_STATUS_H_
