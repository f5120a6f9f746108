// Copyright 2026 The dxcapture Authors

#ifndef DXCAPTURE_CORE_SESSION_ERROR_H_
#define DXCAPTURE_CORE_SESSION_ERROR_H_

#include <cstdint>
#include <mutex>
#include <string>

#include "core/status.h"
#include "dxcapture/dxcapture.h"

namespace dxcapture {
namespace internal {

/// Last-error state of one capture session.  Pulls from any thread may
/// Record() while others read.
class SessionErrorState {
 public:
  SessionErrorState() = default;

  SessionErrorState(const SessionErrorState&) = delete;
  SessionErrorState& operator=(const SessionErrorState&) = delete;

  /// Store the outcome of a pull and return its code.
  DxCaptureError Record(const Status& status);

  /// Copy of the current message in storage owned by the calling thread.
  /// Valid until the same thread calls message() again.
  const char* message() const;

  /// Format rejected by the last UnsupportedPixelFormat failure, or 0.
  uint32_t last_pixel_format() const;

 private:
  mutable std::mutex mu_;
  std::string message_ = "No error";
  uint32_t last_pixel_format_ = 0;
};

}  // namespace internal
}  // namespace dxcapture

#endif  // DXCAPTURE_CORE_SESSION_ERROR_H_
