// Copyright 2026 The dxcapture Authors

#ifndef DXCAPTURE_PLATFORM_WINDOWS_WIN_CAPTURE_BACKEND_H_
#define DXCAPTURE_PLATFORM_WINDOWS_WIN_CAPTURE_BACKEND_H_

#include <memory>
#include <vector>

#include "core/capture_backend.h"

namespace dxcapture {
namespace internal {

/// Windows capture backend using Windows.Graphics.Capture on a Direct3D 11
/// device.  Each session gets its own device.
class WinCaptureBackend : public CaptureBackend {
 public:
  WinCaptureBackend();
  ~WinCaptureBackend() override;

  bool Initialize() override;
  void Shutdown() override;

  bool IsCaptureSupported() override;

  std::vector<DxCaptureDisplayInfo> EnumerateDisplays() override;
  std::vector<DxCaptureWindowInfo> EnumerateWindows() override;

  Status CreateSource(const DxCaptureTarget& target,
                      const DxCaptureSessionOptions& options,
                      std::unique_ptr<CaptureSource>* out) override;

 private:
  bool initialized_ = false;
  bool owns_apartment_ = false;
};

}  // namespace internal
}  // namespace dxcapture

#endif  // DXCAPTURE_PLATFORM_WINDOWS_WIN_CAPTURE_BACKEND_H_
