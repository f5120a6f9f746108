// Copyright 2026 The dxcapture Authors

#include "platform/windows/wgc_capture_source.h"

#ifdef _WIN32

#include <utility>

#include <winrt/Windows.Foundation.Metadata.h>
#include <winrt/Windows.Graphics.DirectX.h>

#include "core/logger.h"

using Microsoft::WRL::ComPtr;
using winrt::Windows::Foundation::Metadata::ApiInformation;
using winrt::Windows::Graphics::Capture::Direct3D11CaptureFrame;
using winrt::Windows::Graphics::Capture::Direct3D11CaptureFramePool;
using winrt::Windows::Graphics::Capture::GraphicsCaptureItem;
using winrt::Windows::Graphics::Capture::GraphicsCaptureSession;
using winrt::Windows::Graphics::DirectX::DirectXPixelFormat;

namespace dxcapture {
namespace internal {

namespace {

constexpr int32_t kFramePoolBuffers = 1;
constexpr wchar_t kSessionTypeName[] =
    L"Windows.Graphics.Capture.GraphicsCaptureSession";

}  // namespace

WgcCaptureSource::WgcCaptureSource(std::shared_ptr<D3D11GraphicsDevice> device)
    : device_(std::move(device)) {}

WgcCaptureSource::~WgcCaptureSource() { Close(); }

// static
Status WgcCaptureSource::Create(std::shared_ptr<D3D11GraphicsDevice> device,
                                const GraphicsCaptureItem& item,
                                const DxCaptureSessionOptions& options,
                                std::unique_ptr<CaptureSource>* out) {
  std::unique_ptr<WgcCaptureSource> source(
      new WgcCaptureSource(std::move(device)));
  try {
    auto size = item.Size();
    source->item_ = item;
    source->width_ = size.Width;
    source->height_ = size.Height;
    source->frame_pool_ = Direct3D11CaptureFramePool::CreateFreeThreaded(
        source->device_->ToAbstractDevice(),
        DirectXPixelFormat::B8G8R8A8UIntNormalized, kFramePoolBuffers, size);
    source->session_ = source->frame_pool_.CreateCaptureSession(item);
  } catch (const winrt::hresult_error& e) {
    return HresultErrorStatus("Failed to create capture frame pool/session",
                              e);
  }

  source->ApplyOptions(options);

  DXCAPTURE_LOG_DEBUG("Capture source created ({}x{})", source->width_,
                      source->height_);
  *out = std::move(source);
  return OkStatus();
}

void WgcCaptureSource::ApplyOptions(const DxCaptureSessionOptions& options) {
  try {
    if (options.hide_cursor) {
      if (ApiInformation::IsPropertyPresent(kSessionTypeName,
                                            L"IsCursorCaptureEnabled")) {
        session_.IsCursorCaptureEnabled(false);
      } else {
        DXCAPTURE_LOG_WARN("Cursor exclusion not supported on this system");
      }
    }
    if (options.hide_border) {
      if (ApiInformation::IsPropertyPresent(kSessionTypeName,
                                            L"IsBorderRequired")) {
        session_.IsBorderRequired(false);
      } else {
        DXCAPTURE_LOG_WARN("Border removal not supported on this system");
      }
    }
  } catch (const winrt::hresult_error& e) {
    DXCAPTURE_LOG_WARN("Failed to apply session options: {} (0x{:08X})",
                       winrt::to_string(e.message()),
                       static_cast<uint32_t>(e.code().value));
  }
}

Status WgcCaptureSource::Start(FrameCallback on_frame) {
  std::lock_guard<std::mutex> lock(mu_);
  if (closed_) return NotActiveError();

  // The handler may run after this object is gone, so it owns what it uses.
  std::shared_ptr<D3D11GraphicsDevice> device = device_;
  try {
    frame_arrived_token_ = frame_pool_.FrameArrived(
        [device, on_frame](const Direct3D11CaptureFramePool& pool,
                           const winrt::Windows::Foundation::IInspectable&) {
          OnFrameArrived(*device, pool, on_frame);
        });
    session_.StartCapture();
  } catch (const winrt::hresult_error& e) {
    return HresultErrorStatus("Failed to start capture", e);
  }
  return OkStatus();
}

// static
void WgcCaptureSource::OnFrameArrived(const D3D11GraphicsDevice& device,
                                      const Direct3D11CaptureFramePool& pool,
                                      const FrameCallback& on_frame) {
  std::shared_ptr<Texture> staging;
  Status status;
  try {
    Direct3D11CaptureFrame frame = pool.TryGetNextFrame();
    if (!frame) return;

    ComPtr<ID3D11Texture2D> texture;
    status = device.ResolveSurface(frame.Surface(), &texture);
    if (status.ok()) {
      status = device.CreateStagingCopy(texture.Get(), &staging);
    }
    // Return the buffer to the pool before publishing.
    frame.Close();
  } catch (const winrt::hresult_error& e) {
    status = HresultErrorStatus("Frame arrival failed", e);
  }

  if (!status.ok()) {
    DXCAPTURE_WORKER_LOG_WARN("Dropping frame: {}", status.message());
    return;
  }
  on_frame(std::move(staging));
}

void WgcCaptureSource::Close() {
  std::lock_guard<std::mutex> lock(mu_);
  if (closed_) return;
  closed_ = true;

  try {
    if (frame_pool_ && frame_arrived_token_) {
      frame_pool_.FrameArrived(frame_arrived_token_);
      frame_arrived_token_ = {};
    }
    if (session_) session_.Close();
    if (frame_pool_) frame_pool_.Close();
  } catch (const winrt::hresult_error& e) {
    DXCAPTURE_LOG_WARN("Error while closing capture: {} (0x{:08X})",
                       winrt::to_string(e.message()),
                       static_cast<uint32_t>(e.code().value));
  }
  session_ = nullptr;
  frame_pool_ = nullptr;
  item_ = nullptr;
}

}  // namespace internal
}  // namespace dxcapture

#endif  // _WIN32
