// Copyright 2026 The dxcapture Authors

#ifndef DXCAPTURE_CORE_CAPTURE_BACKEND_H_
#define DXCAPTURE_CORE_CAPTURE_BACKEND_H_

#include <memory>
#include <vector>

#include "core/capture_source.h"
#include "core/status.h"
#include "dxcapture/dxcapture.h"

namespace dxcapture {
namespace internal {

/// Abstract interface for platform-specific capture backends.
///
/// The Windows implementation drives Windows.Graphics.Capture on a Direct3D
/// 11 device.  Other platforms build a stub that reports
/// kDxCaptureErrorNotSupported.  Only the implementation for the current
/// build platform is compiled.
class CaptureBackend {
 public:
  virtual ~CaptureBackend() = default;

  // Non-copyable.
  CaptureBackend(const CaptureBackend&) = delete;
  CaptureBackend& operator=(const CaptureBackend&) = delete;

  /// Initialize the backend.  Must be called before any other operation.
  /// @return true on success.
  virtual bool Initialize() = 0;

  /// Shut down and release platform resources.
  virtual void Shutdown() = 0;

  /// Whether the OS capture service is available.
  virtual bool IsCaptureSupported() = 0;

  // -- Target enumeration --

  /// Connected displays, in enumeration order.
  virtual std::vector<DxCaptureDisplayInfo> EnumerateDisplays() = 0;

  /// Top-level windows the capture service can capture.
  virtual std::vector<DxCaptureWindowInfo> EnumerateWindows() = 0;

  // -- Capture --

  /// Create a device, capture item, frame pool and session for @p target.
  /// The returned source is not started yet.
  virtual Status CreateSource(const DxCaptureTarget& target,
                              const DxCaptureSessionOptions& options,
                              std::unique_ptr<CaptureSource>* out) = 0;

 protected:
  CaptureBackend() = default;
};

/// Factory function implemented per-platform (one per build target).
/// Defined in platform/<os>/xxx_capture_backend.cpp.
std::unique_ptr<CaptureBackend> CreatePlatformBackend();

}  // namespace internal
}  // namespace dxcapture

#endif  // DXCAPTURE_CORE_CAPTURE_BACKEND_H_
