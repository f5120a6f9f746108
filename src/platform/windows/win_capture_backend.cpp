// Copyright 2026 The dxcapture Authors

#include "platform/windows/win_capture_backend.h"

#ifdef _WIN32

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <dwmapi.h>
#include <objbase.h>

#include <windows.graphics.capture.interop.h>
#include <winrt/Windows.Foundation.h>
#include <winrt/Windows.Graphics.Capture.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

#include "core/logger.h"
#include "platform/windows/d3d11_graphics_device.h"
#include "platform/windows/wgc_capture_source.h"

#pragma comment(lib, "dwmapi.lib")
#pragma comment(lib, "windowsapp.lib")

using winrt::Windows::Graphics::Capture::GraphicsCaptureItem;
using winrt::Windows::Graphics::Capture::GraphicsCaptureSession;

namespace dxcapture {
namespace internal {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

namespace {

/// Convert a wide string to UTF-8.
std::string WideToUtf8(const wchar_t* wide) {
  if (!wide || !wide[0]) return "";
  int len = WideCharToMultiByte(CP_UTF8, 0, wide, -1, nullptr, 0, nullptr,
                                nullptr);
  if (len <= 0) return "";
  std::string result(len - 1, '\0');
  WideCharToMultiByte(CP_UTF8, 0, wide, -1, &result[0], len, nullptr, nullptr);
  return result;
}

/// Safe string copy into a fixed-size char buffer.
void SafeCopy(char* dst, size_t dst_size, const std::string& src) {
  size_t copy_len = (std::min)(src.size(), dst_size - 1);
  std::memcpy(dst, src.data(), copy_len);
  dst[copy_len] = '\0';
}

/// Gives the console window a unique title for the duration of a window
/// enumeration and restores the previous title afterwards.
class ScopedConsoleTitle {
 public:
  ScopedConsoleTitle() {
    if (!GetConsoleWindow()) return;

    wchar_t saved[256] = {};
    DWORD len = GetConsoleTitleW(saved, 256);
    saved_.assign(saved, len);

    GUID guid{};
    wchar_t guid_str[64] = {};
    if (FAILED(CoCreateGuid(&guid)) ||
        StringFromGUID2(guid, guid_str, 64) == 0) {
      return;
    }
    if (!SetConsoleTitleW(guid_str)) return;
    active_ = true;

    // Give the console host time to apply the new title.
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
  }

  ~ScopedConsoleTitle() {
    if (active_) SetConsoleTitleW(saved_.c_str());
  }

  ScopedConsoleTitle(const ScopedConsoleTitle&) = delete;
  ScopedConsoleTitle& operator=(const ScopedConsoleTitle&) = delete;

 private:
  std::wstring saved_;
  bool active_ = false;
};

/// Data passed to EnumDisplayMonitors callback.
struct MonitorEnumData {
  std::vector<DxCaptureDisplayInfo>* displays;
};

BOOL CALLBACK MonitorEnumProc(HMONITOR monitor, HDC /*hdc*/,
                              LPRECT /*rect*/, LPARAM lparam) {
  auto* data = reinterpret_cast<MonitorEnumData*>(lparam);

  MONITORINFOEXW mi = {};
  mi.cbSize = sizeof(mi);
  if (!GetMonitorInfoW(monitor, &mi)) {
    DXCAPTURE_LOG_WARN("GetMonitorInfoW failed: {}", GetLastError());
    return TRUE;
  }

  DxCaptureDisplayInfo info = {};
  info.index = static_cast<int>(data->displays->size());
  info.handle = reinterpret_cast<DxCaptureHandle>(monitor);
  info.x = mi.rcMonitor.left;
  info.y = mi.rcMonitor.top;
  info.width = mi.rcMonitor.right - mi.rcMonitor.left;
  info.height = mi.rcMonitor.bottom - mi.rcMonitor.top;
  info.is_primary = (mi.dwFlags & MONITORINFOF_PRIMARY) ? 1 : 0;
  SafeCopy(info.name, sizeof(info.name), WideToUtf8(mi.szDevice));

  data->displays->push_back(info);
  return TRUE;
}

bool IsKnownBlockedWindow(const std::string& title,
                          const std::string& class_name) {
  static const struct {
    const char* title;
    const char* class_name;
  } kBlocked[] = {
      {"Task View", "Windows.UI.Core.CoreWindow"},
      {"DesktopWindowXamlSource", "Windows.UI.Core.CoreWindow"},
      {"PopupHost", "Xaml_WindowedPopupClass"},
  };
  for (const auto& b : kBlocked) {
    if (title == b.title && class_name == b.class_name) return true;
  }
  return false;
}

/// Whether the capture service can produce frames for @p hwnd.
bool IsCapturableWindow(HWND hwnd, const std::string& title,
                        const std::string& class_name) {
  if (title.empty() || hwnd == GetShellWindow() || !IsWindowVisible(hwnd) ||
      GetAncestor(hwnd, GA_ROOT) != hwnd) {
    return false;
  }

  LONG style = GetWindowLongW(hwnd, GWL_STYLE);
  if (style & WS_DISABLED) return false;

  LONG ex_style = GetWindowLongW(hwnd, GWL_EXSTYLE);
  if (ex_style & WS_EX_TOOLWINDOW) return false;

  // UWP frames hidden by the shell (suspended apps, other desktops).
  if (class_name == "Windows.UI.Core.CoreWindow" ||
      class_name == "ApplicationFrameWindow") {
    DWORD cloaked = 0;
    if (SUCCEEDED(DwmGetWindowAttribute(hwnd, DWMWA_CLOAKED, &cloaked,
                                        sizeof(cloaked))) &&
        cloaked == DWM_CLOAKED_SHELL) {
      return false;
    }
  }

  return !IsKnownBlockedWindow(title, class_name);
}

/// Data passed to EnumWindows callback.
struct WindowEnumData {
  std::vector<DxCaptureWindowInfo>* windows;
};

BOOL CALLBACK WindowEnumProc(HWND hwnd, LPARAM lparam) {
  auto* data = reinterpret_cast<WindowEnumData*>(lparam);

  int title_len = GetWindowTextLengthW(hwnd);
  if (title_len <= 0) return TRUE;

  std::wstring title_buf(static_cast<size_t>(title_len) + 1, L'\0');
  GetWindowTextW(hwnd, &title_buf[0], title_len + 1);
  wchar_t class_buf[256] = {};
  GetClassNameW(hwnd, class_buf, 256);

  std::string title = WideToUtf8(title_buf.c_str());
  std::string class_name = WideToUtf8(class_buf);
  if (!IsCapturableWindow(hwnd, title, class_name)) return TRUE;

  DxCaptureWindowInfo info = {};
  info.id = reinterpret_cast<DxCaptureHandle>(hwnd);
  SafeCopy(info.title, sizeof(info.title), title);
  SafeCopy(info.class_name, sizeof(info.class_name), class_name);

  data->windows->push_back(info);
  return TRUE;
}

Status CreateCaptureItem(const DxCaptureTarget& target,
                         GraphicsCaptureItem* out) {
  try {
    auto interop = winrt::get_activation_factory<GraphicsCaptureItem,
                                                 IGraphicsCaptureItemInterop>();
    HRESULT hr = E_INVALIDARG;
    if (target.kind == kDxCaptureTargetMonitor) {
      hr = interop->CreateForMonitor(
          reinterpret_cast<HMONITOR>(target.handle),
          winrt::guid_of<GraphicsCaptureItem>(), winrt::put_abi(*out));
    } else {
      hr = interop->CreateForWindow(
          reinterpret_cast<HWND>(target.handle),
          winrt::guid_of<GraphicsCaptureItem>(), winrt::put_abi(*out));
    }
    if (FAILED(hr)) {
      return BackendError("Failed to create capture item", hr);
    }
  } catch (const winrt::hresult_error& e) {
    return HresultErrorStatus("Failed to create capture item", e);
  }
  return OkStatus();
}

}  // namespace

// ---------------------------------------------------------------------------
// WinCaptureBackend implementation
// ---------------------------------------------------------------------------

WinCaptureBackend::WinCaptureBackend() = default;
WinCaptureBackend::~WinCaptureBackend() { Shutdown(); }

bool WinCaptureBackend::Initialize() {
  if (initialized_) return true;

  try {
    winrt::init_apartment(winrt::apartment_type::multi_threaded);
    owns_apartment_ = true;
  } catch (const winrt::hresult_error& e) {
    // The host already initialized COM as single-threaded; free-threaded
    // frame pools work from there as well.
    if (e.code() != RPC_E_CHANGED_MODE) {
      DXCAPTURE_LOG_ERROR("init_apartment failed: {} (0x{:08X})",
                          winrt::to_string(e.message()),
                          static_cast<uint32_t>(e.code().value));
      return false;
    }
    DXCAPTURE_LOG_DEBUG("COM already initialized in another apartment mode");
  }

  initialized_ = true;
  return true;
}

void WinCaptureBackend::Shutdown() {
  if (!initialized_) return;
  if (owns_apartment_) {
    winrt::uninit_apartment();
    owns_apartment_ = false;
  }
  initialized_ = false;
}

bool WinCaptureBackend::IsCaptureSupported() {
  try {
    return GraphicsCaptureSession::IsSupported();
  } catch (const winrt::hresult_error& e) {
    DXCAPTURE_LOG_WARN("GraphicsCaptureSession::IsSupported failed: {}",
                       winrt::to_string(e.message()));
    return false;
  }
}

std::vector<DxCaptureDisplayInfo> WinCaptureBackend::EnumerateDisplays() {
  std::vector<DxCaptureDisplayInfo> displays;
  MonitorEnumData data{&displays};
  if (!EnumDisplayMonitors(nullptr, nullptr, MonitorEnumProc,
                           reinterpret_cast<LPARAM>(&data))) {
    DXCAPTURE_LOG_ERROR("EnumDisplayMonitors failed: {}", GetLastError());
  }
  return displays;
}

std::vector<DxCaptureWindowInfo> WinCaptureBackend::EnumerateWindows() {
  ScopedConsoleTitle console_title;

  std::vector<DxCaptureWindowInfo> windows;
  WindowEnumData data{&windows};
  if (!::EnumWindows(WindowEnumProc, reinterpret_cast<LPARAM>(&data))) {
    DXCAPTURE_LOG_ERROR("EnumWindows failed: {}", GetLastError());
  }
  return windows;
}

Status WinCaptureBackend::CreateSource(const DxCaptureTarget& target,
                                       const DxCaptureSessionOptions& options,
                                       std::unique_ptr<CaptureSource>* out) {
  if (target.kind == kDxCaptureTargetWindow &&
      !IsWindow(reinterpret_cast<HWND>(target.handle))) {
    return Status(kDxCaptureErrorNotFound, "Window handle is not valid");
  }

  std::shared_ptr<D3D11GraphicsDevice> device;
  Status status = D3D11GraphicsDevice::Create(&device);
  if (!status.ok()) return status;

  GraphicsCaptureItem item{nullptr};
  status = CreateCaptureItem(target, &item);
  if (!status.ok()) return status;

  return WgcCaptureSource::Create(std::move(device), item, options, out);
}

// ---------------------------------------------------------------------------
// Factory
// ---------------------------------------------------------------------------

std::unique_ptr<CaptureBackend> CreatePlatformBackend() {
  return std::make_unique<WinCaptureBackend>();
}

}  // namespace internal
}  // namespace dxcapture

#endif  // _WIN32
