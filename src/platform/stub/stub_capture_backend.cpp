// Copyright 2026 The dxcapture Authors
//
// Stub capture backend for platforms without Windows.Graphics.Capture.

#include "core/capture_backend.h"
#include "core/logger.h"

namespace dxcapture {
namespace internal {

class StubCaptureBackend : public CaptureBackend {
 public:
  bool Initialize() override { return true; }
  void Shutdown() override {}

  bool IsCaptureSupported() override { return false; }

  std::vector<DxCaptureDisplayInfo> EnumerateDisplays() override { return {}; }
  std::vector<DxCaptureWindowInfo> EnumerateWindows() override { return {}; }

  Status CreateSource(const DxCaptureTarget& target,
                      const DxCaptureSessionOptions&,
                      std::unique_ptr<CaptureSource>*) override {
    DXCAPTURE_LOG_WARN("No capture backend on this platform (target kind {})",
                       static_cast<int>(target.kind));
    return Status(kDxCaptureErrorNotSupported,
                  "Screen capture requires Windows.Graphics.Capture");
  }
};

std::unique_ptr<CaptureBackend> CreatePlatformBackend() {
  return std::make_unique<StubCaptureBackend>();
}

}  // namespace internal
}  // namespace dxcapture
