// Copyright 2026 The dxcapture Authors

#include "core/dxcapture_context.h"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>
#include <vector>

#include "core/logger.h"

namespace dxcapture {
namespace internal {

namespace {

bool ContainsIgnoreCase(const char* haystack, const std::string& needle) {
  std::string text(haystack);
  auto it = std::search(text.begin(), text.end(), needle.begin(), needle.end(),
                        [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                        });
  return it != text.end();
}

}  // namespace

DxCaptureContextImpl::DxCaptureContextImpl(
    std::unique_ptr<CaptureBackend> backend)
    : backend_(std::move(backend)) {}

DxCaptureContextImpl::~DxCaptureContextImpl() {
  if (backend_) {
    backend_->Shutdown();
  }
}

bool DxCaptureContextImpl::Initialize() {
  std::lock_guard<std::mutex> lock(mu_);
  if (initialized_) {
    return true;
  }

  DXCAPTURE_LOG_INFO("Initializing dxcapture context...");

  if (!backend_) backend_ = CreatePlatformBackend();
  if (!backend_) {
    SetError(kDxCaptureErrorNotSupported,
             "Failed to create platform capture backend");
    return false;
  }

  if (!backend_->Initialize()) {
    SetError(kDxCaptureErrorBackend,
             "Failed to initialize platform capture backend");
    backend_.reset();
    return false;
  }

  initialized_ = true;
  DXCAPTURE_LOG_INFO("dxcapture context initialized successfully");
  ClearError();
  return true;
}

void DxCaptureContextImpl::SetError(DxCaptureError code,
                                    const std::string& message) {
  last_error_ = code;
  last_error_message_ = message;
  DXCAPTURE_LOG_ERROR("Error {}: {}", static_cast<int>(code), message);
}

void DxCaptureContextImpl::ClearError() {
  last_error_ = kDxCaptureOk;
  last_error_message_ = "No error";
}

bool DxCaptureContextImpl::CheckInitialized() {
  if (initialized_) return true;
  SetError(kDxCaptureErrorNotSupported, "Context not initialized");
  return false;
}

// ---------------------------------------------------------------------------
// Enumeration
// ---------------------------------------------------------------------------

bool DxCaptureContextImpl::IsSupported() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!CheckInitialized()) return false;
  ClearError();
  return backend_->IsCaptureSupported();
}

int DxCaptureContextImpl::GetDisplayCount() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!CheckInitialized()) return -1;
  ClearError();
  return static_cast<int>(backend_->EnumerateDisplays().size());
}

int DxCaptureContextImpl::EnumerateDisplays(DxCaptureDisplayInfo* out_displays,
                                            int max_count) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!CheckInitialized()) return -1;
  if (!out_displays || max_count <= 0) {
    SetError(kDxCaptureErrorInvalidParam,
             "Invalid output buffer or max_count");
    return -1;
  }

  auto displays = backend_->EnumerateDisplays();
  int count = std::min(static_cast<int>(displays.size()), max_count);
  for (int i = 0; i < count; ++i) {
    out_displays[i] = displays[i];
  }

  ClearError();
  return count;
}

int DxCaptureContextImpl::EnumerateWindows(DxCaptureWindowInfo* out_windows,
                                           int max_count) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!CheckInitialized()) return -1;
  if (!out_windows || max_count <= 0) {
    SetError(kDxCaptureErrorInvalidParam,
             "Invalid output buffer or max_count");
    return -1;
  }

  auto windows = backend_->EnumerateWindows();
  int count = std::min(static_cast<int>(windows.size()), max_count);
  for (int i = 0; i < count; ++i) {
    out_windows[i] = windows[i];
  }

  ClearError();
  return count;
}

int DxCaptureContextImpl::FindWindows(const char* title,
                                      DxCaptureWindowInfo* out_windows,
                                      int max_count) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!CheckInitialized()) return -1;
  if (!title || !out_windows || max_count <= 0) {
    SetError(kDxCaptureErrorInvalidParam,
             "Invalid title, output buffer or max_count");
    return -1;
  }

  const std::string needle(title);
  int count = 0;
  for (const auto& window : backend_->EnumerateWindows()) {
    if (count >= max_count) break;
    if (ContainsIgnoreCase(window.title, needle)) {
      out_windows[count++] = window;
    }
  }

  ClearError();
  return count;
}

// ---------------------------------------------------------------------------
// Sessions
// ---------------------------------------------------------------------------

std::unique_ptr<CaptureSession> DxCaptureContextImpl::CreateSession(
    const DxCaptureTarget& target, const DxCaptureSessionOptions* options) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!CheckInitialized()) return nullptr;

  if (target.kind != kDxCaptureTargetMonitor &&
      target.kind != kDxCaptureTargetWindow) {
    SetError(kDxCaptureErrorInvalidParam, "Unknown capture target kind");
    return nullptr;
  }
  if (target.handle == 0) {
    SetError(kDxCaptureErrorInvalidParam, "Capture target handle is NULL");
    return nullptr;
  }

  DxCaptureSessionOptions opts = {};
  if (options) opts = *options;

  DXCAPTURE_LOG_DEBUG("CreateSession(kind={}, handle=0x{:X})",
                      static_cast<int>(target.kind), target.handle);

  std::unique_ptr<CaptureSource> source;
  Status status = backend_->CreateSource(target, opts, &source);
  if (!status.ok()) {
    SetError(status.code(), status.message());
    return nullptr;
  }

  std::unique_ptr<CaptureSession> session;
  status = CaptureSession::Create(std::move(source), &session);
  if (!status.ok()) {
    SetError(status.code(), status.message());
    return nullptr;
  }

  ClearError();
  return session;
}

std::unique_ptr<CaptureSession> DxCaptureContextImpl::CreateSessionForDisplay(
    int display_index, const DxCaptureSessionOptions* options) {
  DxCaptureTarget target = {};
  target.kind = kDxCaptureTargetMonitor;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!CheckInitialized()) return nullptr;

    auto displays = backend_->EnumerateDisplays();
    if (displays.empty()) {
      SetError(kDxCaptureErrorNotFound, "No displays found");
      return nullptr;
    }
    if (display_index < 0) {
      auto primary = std::find_if(
          displays.begin(), displays.end(),
          [](const DxCaptureDisplayInfo& d) { return d.is_primary != 0; });
      target.handle = (primary != displays.end() ? *primary : displays[0])
                          .handle;
    } else if (display_index < static_cast<int>(displays.size())) {
      target.handle = displays[display_index].handle;
    } else {
      SetError(kDxCaptureErrorInvalidParam, "Display index out of range");
      return nullptr;
    }
  }
  return CreateSession(target, options);
}

std::unique_ptr<CaptureSession>
DxCaptureContextImpl::CreateSessionForWindowTitle(
    const char* title, const DxCaptureSessionOptions* options) {
  DxCaptureWindowInfo match = {};
  int found = FindWindows(title, &match, 1);
  if (found < 0) return nullptr;
  if (found == 0) {
    std::lock_guard<std::mutex> lock(mu_);
    SetError(kDxCaptureErrorNotFound,
             std::string("No window title contains \"") + title + "\"");
    return nullptr;
  }

  DXCAPTURE_LOG_INFO("Capturing window \"{}\"", match.title);

  DxCaptureTarget target = {};
  target.kind = kDxCaptureTargetWindow;
  target.handle = match.id;
  return CreateSession(target, options);
}

}  // namespace internal
}  // namespace dxcapture
