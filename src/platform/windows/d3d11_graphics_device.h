// Copyright 2026 The dxcapture Authors
//
// Direct3D 11 implementation of the graphics device seam, plus the WinRT
// Direct3D interop used by Windows.Graphics.Capture.

#ifndef DXCAPTURE_PLATFORM_WINDOWS_D3D11_GRAPHICS_DEVICE_H_
#define DXCAPTURE_PLATFORM_WINDOWS_D3D11_GRAPHICS_DEVICE_H_

#ifdef _WIN32

#include <memory>
#include <utility>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <d3d11.h>
#include <dxgi1_2.h>

#include <wrl/client.h>

#include <winrt/Windows.Foundation.h>
#include <winrt/Windows.Graphics.DirectX.Direct3D11.h>

#include "core/graphics_device.h"
#include "core/status.h"
#include "core/texture.h"

namespace dxcapture {
namespace internal {

/// Convert a WinRT exception into a BackendError carrying its HRESULT.
Status HresultErrorStatus(const char* what, const winrt::hresult_error& e);

/// An ID3D11Texture2D read through the owning device's immediate context.
class D3D11Texture : public Texture {
 public:
  D3D11Texture(Microsoft::WRL::ComPtr<ID3D11Texture2D> texture,
               Microsoft::WRL::ComPtr<ID3D11DeviceContext> context);
  ~D3D11Texture() override;

  TextureDesc GetDesc() const override;
  Status Map(MappedTexture* out) override;
  void Unmap() override;

  ID3D11Texture2D* native() const { return texture_.Get(); }

 private:
  Microsoft::WRL::ComPtr<ID3D11Texture2D> texture_;
  Microsoft::WRL::ComPtr<ID3D11DeviceContext> context_;
};

/// The WinRT IDirect3DSurface form of a texture, as handed out by the
/// capture API.
class WinRtSurface : public Surface {
 public:
  explicit WinRtSurface(
      winrt::Windows::Graphics::DirectX::Direct3D11::IDirect3DSurface surface)
      : surface_(std::move(surface)) {}

  const winrt::Windows::Graphics::DirectX::Direct3D11::IDirect3DSurface&
  native() const {
    return surface_;
  }

 private:
  winrt::Windows::Graphics::DirectX::Direct3D11::IDirect3DSurface surface_;
};

/// Hardware D3D11 device with BGRA support and its immediate context.
///
/// Frames arrive on a capture worker thread while readback runs on the
/// caller's thread, so the device is created multithread-protected and both
/// use the same immediate context.
class D3D11GraphicsDevice : public GraphicsDevice {
 public:
  /// Create the device (feature levels 11.1 down to 10.0).
  static Status Create(std::shared_ptr<D3D11GraphicsDevice>* out);

  ~D3D11GraphicsDevice() override = default;

  ID3D11Device* device() const { return device_.Get(); }
  ID3D11DeviceContext* context() const { return context_.Get(); }
  D3D_FEATURE_LEVEL feature_level() const { return feature_level_; }

  /// The WinRT IDirect3DDevice wrapping this device, for frame pool creation.
  const winrt::Windows::Graphics::DirectX::Direct3D11::IDirect3DDevice&
  ToAbstractDevice() const {
    return winrt_device_;
  }

  Status ToAbstractSurface(const std::shared_ptr<Texture>& texture,
                           std::unique_ptr<Surface>* out) const override;
  Status FromAbstractSurface(const Surface& surface,
                             std::shared_ptr<Texture>* out) const override;

  /// Resolve a WinRT surface to its backing D3D11 texture.
  Status ResolveSurface(
      const winrt::Windows::Graphics::DirectX::Direct3D11::IDirect3DSurface&
          surface,
      Microsoft::WRL::ComPtr<ID3D11Texture2D>* out) const;

  /// Copy @p frame_texture into a new CPU-readable staging texture of the
  /// same size and format.
  Status CreateStagingCopy(ID3D11Texture2D* frame_texture,
                           std::shared_ptr<Texture>* out) const;

 private:
  D3D11GraphicsDevice() = default;

  Microsoft::WRL::ComPtr<ID3D11Device> device_;
  Microsoft::WRL::ComPtr<ID3D11DeviceContext> context_;
  winrt::Windows::Graphics::DirectX::Direct3D11::IDirect3DDevice winrt_device_{
      nullptr};
  D3D_FEATURE_LEVEL feature_level_ = static_cast<D3D_FEATURE_LEVEL>(0);
};

}  // namespace internal
}  // namespace dxcapture

#endif  // _WIN32

#endif  // DXCAPTURE_PLATFORM_WINDOWS_D3D11_GRAPHICS_DEVICE_H_
