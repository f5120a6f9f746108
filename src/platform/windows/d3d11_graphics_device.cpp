// Copyright 2026 The dxcapture Authors
//
// D3D11 graphics device implementation.

#include "platform/windows/d3d11_graphics_device.h"

#ifdef _WIN32

#include <d3d11_4.h>
#include <inspectable.h>
#include <windows.graphics.directx.direct3d11.interop.h>

#include <string>
#include <utility>

#include "core/logger.h"
#include "spdlog/fmt/fmt.h"

#pragma comment(lib, "d3d11.lib")
#pragma comment(lib, "dxgi.lib")

using Microsoft::WRL::ComPtr;
using winrt::Windows::Graphics::DirectX::Direct3D11::IDirect3DDevice;
using winrt::Windows::Graphics::DirectX::Direct3D11::IDirect3DSurface;

namespace dxcapture {
namespace internal {

Status HresultErrorStatus(const char* what, const winrt::hresult_error& e) {
  return BackendError(
      fmt::format("{} ({})", what, winrt::to_string(e.message())),
      e.code().value);
}

// ---------------------------------------------------------------------------
// D3D11Texture
// ---------------------------------------------------------------------------

D3D11Texture::D3D11Texture(ComPtr<ID3D11Texture2D> texture,
                           ComPtr<ID3D11DeviceContext> context)
    : texture_(std::move(texture)), context_(std::move(context)) {}

D3D11Texture::~D3D11Texture() = default;

TextureDesc D3D11Texture::GetDesc() const {
  D3D11_TEXTURE2D_DESC native{};
  texture_->GetDesc(&native);

  TextureDesc desc;
  desc.width = native.Width;
  desc.height = native.Height;
  desc.format = static_cast<uint32_t>(native.Format);
  desc.usage = static_cast<TextureUsage>(native.Usage);
  desc.cpu_access_flags = native.CPUAccessFlags;
  return desc;
}

Status D3D11Texture::Map(MappedTexture* out) {
  D3D11_MAPPED_SUBRESOURCE mapped{};
  HRESULT hr = context_->Map(texture_.Get(), 0, D3D11_MAP_READ, 0, &mapped);
  if (FAILED(hr)) {
    return BackendError("ID3D11DeviceContext::Map failed", hr);
  }
  out->data = static_cast<const uint8_t*>(mapped.pData);
  out->row_pitch = mapped.RowPitch;
  return OkStatus();
}

void D3D11Texture::Unmap() { context_->Unmap(texture_.Get(), 0); }

// ---------------------------------------------------------------------------
// D3D11GraphicsDevice::Create
// ---------------------------------------------------------------------------

// static
Status D3D11GraphicsDevice::Create(std::shared_ptr<D3D11GraphicsDevice>* out) {
  // Feature levels to try, in descending order of preference.
  D3D_FEATURE_LEVEL feature_levels[] = {
      D3D_FEATURE_LEVEL_11_1, D3D_FEATURE_LEVEL_11_0,
      D3D_FEATURE_LEVEL_10_1, D3D_FEATURE_LEVEL_10_0,
  };

  // Flags: the capture frame pool produces B8G8R8A8 surfaces.
  UINT flags = D3D11_CREATE_DEVICE_BGRA_SUPPORT;

  ComPtr<ID3D11Device> device;
  ComPtr<ID3D11DeviceContext> context;
  D3D_FEATURE_LEVEL achieved_level{};

  HRESULT hr = D3D11CreateDevice(
      nullptr,                    // Default adapter
      D3D_DRIVER_TYPE_HARDWARE,   // Hardware GPU
      nullptr,                    // No software rasterizer
      flags,                      // Creation flags
      feature_levels,             // Feature levels to try
      ARRAYSIZE(feature_levels),  // Number of feature levels
      D3D11_SDK_VERSION,          // SDK version
      &device,                    // [out] Device
      &achieved_level,            // [out] Achieved feature level
      &context);                  // [out] Immediate context

  if (FAILED(hr)) {
    return BackendError("D3D11CreateDevice failed", hr);
  }

  DXCAPTURE_LOG_INFO("D3D11 device created (feature level: 0x{:04X})",
                     static_cast<int>(achieved_level));

  ComPtr<ID3D11Multithread> multithread;
  if (SUCCEEDED(context.As(&multithread))) {
    multithread->SetMultithreadProtected(TRUE);
  } else {
    DXCAPTURE_LOG_WARN("ID3D11Multithread unavailable; device is not "
                       "multithread protected");
  }

  ComPtr<IDXGIDevice> dxgi_device;
  hr = device.As(&dxgi_device);
  if (FAILED(hr)) {
    return BackendError("Failed to get IDXGIDevice", hr);
  }

  winrt::com_ptr<::IInspectable> inspectable;
  hr = CreateDirect3D11DeviceFromDXGIDevice(dxgi_device.Get(),
                                            inspectable.put());
  if (FAILED(hr)) {
    return BackendError("CreateDirect3D11DeviceFromDXGIDevice failed", hr);
  }

  auto mgr = std::shared_ptr<D3D11GraphicsDevice>(new D3D11GraphicsDevice());
  try {
    mgr->winrt_device_ = inspectable.as<IDirect3DDevice>();
  } catch (const winrt::hresult_error& e) {
    return HresultErrorStatus("IDirect3DDevice query failed", e);
  }
  mgr->device_ = std::move(device);
  mgr->context_ = std::move(context);
  mgr->feature_level_ = achieved_level;

  *out = std::move(mgr);
  return OkStatus();
}

// ---------------------------------------------------------------------------
// Surface conversions
// ---------------------------------------------------------------------------

Status D3D11GraphicsDevice::ToAbstractSurface(
    const std::shared_ptr<Texture>& texture,
    std::unique_ptr<Surface>* out) const {
  auto* d3d_texture = dynamic_cast<D3D11Texture*>(texture.get());
  if (!d3d_texture) {
    return BackendError("Texture does not belong to a D3D11 device");
  }

  ComPtr<IDXGISurface> dxgi_surface;
  HRESULT hr = d3d_texture->native()->QueryInterface(IID_PPV_ARGS(&dxgi_surface));
  if (FAILED(hr)) {
    return BackendError("Failed to get IDXGISurface", hr);
  }

  winrt::com_ptr<::IInspectable> inspectable;
  hr = CreateDirect3D11SurfaceFromDXGISurface(dxgi_surface.Get(),
                                              inspectable.put());
  if (FAILED(hr)) {
    return BackendError("CreateDirect3D11SurfaceFromDXGISurface failed", hr);
  }

  auto surface = inspectable.try_as<IDirect3DSurface>();
  if (!surface) {
    return BackendError("Object is not an IDirect3DSurface");
  }
  *out = std::make_unique<WinRtSurface>(std::move(surface));
  return OkStatus();
}

Status D3D11GraphicsDevice::FromAbstractSurface(
    const Surface& surface, std::shared_ptr<Texture>* out) const {
  auto* winrt_surface = dynamic_cast<const WinRtSurface*>(&surface);
  if (!winrt_surface) {
    return BackendError("Surface is not a WinRT Direct3D surface");
  }

  ComPtr<ID3D11Texture2D> texture;
  Status status = ResolveSurface(winrt_surface->native(), &texture);
  if (!status.ok()) return status;

  *out = std::make_shared<D3D11Texture>(std::move(texture), context_);
  return OkStatus();
}

Status D3D11GraphicsDevice::ResolveSurface(
    const IDirect3DSurface& surface, ComPtr<ID3D11Texture2D>* out) const {
  auto access = surface.try_as<
      ::Windows::Graphics::DirectX::Direct3D11::IDirect3DDxgiInterfaceAccess>();
  if (!access) {
    return BackendError("Surface does not expose IDirect3DDxgiInterfaceAccess");
  }

  HRESULT hr = access->GetInterface(IID_PPV_ARGS(out->ReleaseAndGetAddressOf()));
  if (FAILED(hr)) {
    return BackendError("Failed to get ID3D11Texture2D from surface", hr);
  }
  return OkStatus();
}

// ---------------------------------------------------------------------------
// CreateStagingCopy
// ---------------------------------------------------------------------------

Status D3D11GraphicsDevice::CreateStagingCopy(
    ID3D11Texture2D* frame_texture, std::shared_ptr<Texture>* out) const {
  D3D11_TEXTURE2D_DESC desc{};
  frame_texture->GetDesc(&desc);
  desc.Usage = D3D11_USAGE_STAGING;
  desc.BindFlags = 0;
  desc.CPUAccessFlags = D3D11_CPU_ACCESS_READ;
  desc.MiscFlags = 0;

  ComPtr<ID3D11Texture2D> staging;
  HRESULT hr = device_->CreateTexture2D(&desc, nullptr, &staging);
  if (FAILED(hr)) {
    return BackendError("CreateTexture2D (staging) failed", hr);
  }

  context_->CopyResource(staging.Get(), frame_texture);

  *out = std::make_shared<D3D11Texture>(std::move(staging), context_);
  return OkStatus();
}

}  // namespace internal
}  // namespace dxcapture

#endif  // _WIN32
