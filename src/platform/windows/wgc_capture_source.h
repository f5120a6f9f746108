// Copyright 2026 The dxcapture Authors

#ifndef DXCAPTURE_PLATFORM_WINDOWS_WGC_CAPTURE_SOURCE_H_
#define DXCAPTURE_PLATFORM_WINDOWS_WGC_CAPTURE_SOURCE_H_

#ifdef _WIN32

#include <memory>
#include <mutex>

#include <winrt/Windows.Foundation.h>
#include <winrt/Windows.Graphics.Capture.h>

#include "core/capture_source.h"
#include "dxcapture/dxcapture.h"
#include "platform/windows/d3d11_graphics_device.h"

namespace dxcapture {
namespace internal {

/// Windows.Graphics.Capture frame source: a free-threaded frame pool and a
/// capture session for one GraphicsCaptureItem.
///
/// FrameArrived runs on a thread owned by the capture service.  Each arrived
/// frame is copied into a fresh staging texture on the shared device and
/// handed to the registered FrameCallback.  Frames that fail to copy are
/// logged and dropped.
class WgcCaptureSource : public CaptureSource {
 public:
  /// Create the frame pool (one buffer, B8G8R8A8) and session for @p item
  /// and apply @p options.  Capture does not start until Start().
  static Status Create(
      std::shared_ptr<D3D11GraphicsDevice> device,
      const winrt::Windows::Graphics::Capture::GraphicsCaptureItem& item,
      const DxCaptureSessionOptions& options,
      std::unique_ptr<CaptureSource>* out);

  ~WgcCaptureSource() override;

  Status Start(FrameCallback on_frame) override;
  void Close() override;

  const GraphicsDevice& device() const override { return *device_; }
  int width() const override { return width_; }
  int height() const override { return height_; }

 private:
  explicit WgcCaptureSource(std::shared_ptr<D3D11GraphicsDevice> device);

  void ApplyOptions(const DxCaptureSessionOptions& options);

  static void OnFrameArrived(
      const D3D11GraphicsDevice& device,
      const winrt::Windows::Graphics::Capture::Direct3D11CaptureFramePool&
          pool,
      const FrameCallback& on_frame);

  std::shared_ptr<D3D11GraphicsDevice> device_;
  winrt::Windows::Graphics::Capture::GraphicsCaptureItem item_{nullptr};
  winrt::Windows::Graphics::Capture::Direct3D11CaptureFramePool frame_pool_{
      nullptr};
  winrt::Windows::Graphics::Capture::GraphicsCaptureSession session_{nullptr};
  winrt::event_token frame_arrived_token_{};
  int width_ = 0;
  int height_ = 0;

  std::mutex mu_;
  bool closed_ = false;
};

}  // namespace internal
}  // namespace dxcapture

#endif  // _WIN32

#endif  // DXCAPTURE_PLATFORM_WINDOWS_WGC_CAPTURE_SOURCE_H_
