// Copyright 2026 The dxcapture Authors
//
// This file implements all public C API functions declared in dxcapture.h.
// It bridges the extern "C" interface to the internal C++ implementation.

#include "dxcapture/dxcapture.h"

#include <memory>
#include <new>
#include <utility>

#include "core/capture_session.h"
#include "core/dxcapture_context.h"
#include "core/logger.h"
#include "core/raw_frame.h"
#include "core/session_error.h"
#include "core/status.h"

using dxcapture::internal::CaptureSession;
using dxcapture::internal::DxCaptureContextImpl;
using dxcapture::internal::RawFrame;
using dxcapture::internal::SessionErrorState;
using dxcapture::internal::Status;

// ---------------------------------------------------------------------------
// The opaque DxCaptureContext struct wraps the C++ implementation.
// ---------------------------------------------------------------------------
struct DxCaptureContext {
  DxCaptureContextImpl impl;
};

// ---------------------------------------------------------------------------
// The opaque DxCaptureSession struct wraps a CaptureSession plus the
// per-session error state.
// ---------------------------------------------------------------------------
struct DxCaptureSession {
  std::unique_ptr<CaptureSession> impl;
  SessionErrorState errors;

  explicit DxCaptureSession(std::unique_ptr<CaptureSession> s)
      : impl(std::move(s)) {}

  DxCaptureError Record(const Status& status) { return errors.Record(status); }
};

// ---------------------------------------------------------------------------
// The opaque DxCaptureFrame struct wraps the C++ RawFrame object.
// ---------------------------------------------------------------------------
struct DxCaptureFrame {
  std::unique_ptr<RawFrame> impl;

  explicit DxCaptureFrame(std::unique_ptr<RawFrame> raw)
      : impl(std::move(raw)) {}
};

// Wrap a CaptureSession into a heap-allocated DxCaptureSession*.
static DxCaptureSession* WrapSession(std::unique_ptr<CaptureSession> raw) {
  if (!raw) return nullptr;
  return new (std::nothrow) DxCaptureSession(std::move(raw));
}

// Hand a pulled frame to the caller as a heap-allocated DxCaptureFrame*.
static DxCaptureError WrapFrame(DxCaptureSession* session, const Status& status,
                                std::unique_ptr<RawFrame> raw,
                                DxCaptureFrame** out_frame) {
  DxCaptureError err = session->Record(status);
  if (err != kDxCaptureOk) return err;

  auto* frame = new (std::nothrow) DxCaptureFrame(std::move(raw));
  if (!frame) {
    return session->Record(Status(kDxCaptureErrorUnknown, "Out of memory"));
  }
  *out_frame = frame;
  return kDxCaptureOk;
}

// ---------------------------------------------------------------------------
// Context management
// ---------------------------------------------------------------------------

DxCaptureContext* dxcapture_context_create(void) {
  auto* ctx = new (std::nothrow) DxCaptureContext();
  if (!ctx) return nullptr;

  if (!ctx->impl.Initialize()) {
    delete ctx;
    return nullptr;
  }
  return ctx;
}

void dxcapture_context_destroy(DxCaptureContext* ctx) {
  delete ctx;
}

// ---------------------------------------------------------------------------
// Error handling
// ---------------------------------------------------------------------------

DxCaptureError dxcapture_get_last_error(const DxCaptureContext* ctx) {
  if (!ctx) return kDxCaptureErrorInvalidParam;
  return ctx->impl.last_error();
}

const char* dxcapture_get_last_error_message(const DxCaptureContext* ctx) {
  if (!ctx) return "Invalid context (NULL)";
  return ctx->impl.last_error_message();
}

const char* dxcapture_error_string(DxCaptureError error) {
  switch (error) {
    case kDxCaptureOk:
      return "No error";
    case kDxCaptureErrorNotActive:
      return "Capture is not active.";
    case kDxCaptureErrorNoTexture:
      return "No texture available yet.";
    case kDxCaptureErrorDeniedAccessCpuRead:
      return "CPU read access required.";
    case kDxCaptureErrorBackend:
      return "Graphics or capture backend failure.";
    case kDxCaptureErrorUnsupportedBufferType:
      return "Unsupported buffer type, must be a staging texture.";
    case kDxCaptureErrorUnsupportedPixelFormat:
      return "Unsupported pixel format, must be B8G8R8A8_UNORM.";
    case kDxCaptureErrorInvalidParam:
      return "Invalid parameter.";
    case kDxCaptureErrorNotFound:
      return "No matching display or window.";
    case kDxCaptureErrorNotSupported:
      return "Capture is not supported on this system.";
    case kDxCaptureErrorUnknown:
      return "Unknown error.";
  }
  return "Unknown error.";
}

int dxcapture_is_supported(DxCaptureContext* ctx) {
  if (!ctx) return 0;
  return ctx->impl.IsSupported() ? 1 : 0;
}

// ---------------------------------------------------------------------------
// Display / window enumeration
// ---------------------------------------------------------------------------

int dxcapture_get_display_count(DxCaptureContext* ctx) {
  if (!ctx) return -1;
  return ctx->impl.GetDisplayCount();
}

int dxcapture_enumerate_displays(DxCaptureContext* ctx,
                                 DxCaptureDisplayInfo* out_displays,
                                 int max_count) {
  if (!ctx) return -1;
  return ctx->impl.EnumerateDisplays(out_displays, max_count);
}

int dxcapture_enumerate_windows(DxCaptureContext* ctx,
                                DxCaptureWindowInfo* out_windows,
                                int max_count) {
  if (!ctx) return -1;
  return ctx->impl.EnumerateWindows(out_windows, max_count);
}

int dxcapture_find_windows(DxCaptureContext* ctx, const char* title,
                           DxCaptureWindowInfo* out_windows, int max_count) {
  if (!ctx) return -1;
  return ctx->impl.FindWindows(title, out_windows, max_count);
}

// ---------------------------------------------------------------------------
// Capture sessions
// ---------------------------------------------------------------------------

DxCaptureSession* dxcapture_session_create(
    DxCaptureContext* ctx, const DxCaptureTarget* target,
    const DxCaptureSessionOptions* options) {
  if (!ctx) return nullptr;
  if (!target) {
    ctx->impl.SetError(kDxCaptureErrorInvalidParam, "target is NULL");
    return nullptr;
  }
  return WrapSession(ctx->impl.CreateSession(*target, options));
}

DxCaptureSession* dxcapture_session_create_for_display(
    DxCaptureContext* ctx, int display_index,
    const DxCaptureSessionOptions* options) {
  if (!ctx) return nullptr;
  return WrapSession(ctx->impl.CreateSessionForDisplay(display_index, options));
}

DxCaptureSession* dxcapture_session_create_for_window_title(
    DxCaptureContext* ctx, const char* title,
    const DxCaptureSessionOptions* options) {
  if (!ctx) return nullptr;
  if (!title) {
    ctx->impl.SetError(kDxCaptureErrorInvalidParam, "title is NULL");
    return nullptr;
  }
  return WrapSession(ctx->impl.CreateSessionForWindowTitle(title, options));
}

void dxcapture_session_destroy(DxCaptureSession* session) {
  delete session;
}

void dxcapture_session_close(DxCaptureSession* session) {
  if (!session || !session->impl) return;
  session->impl->Close();
}

int dxcapture_session_is_active(const DxCaptureSession* session) {
  if (!session || !session->impl) return 0;
  return session->impl->is_active() ? 1 : 0;
}

DxCaptureError dxcapture_session_get_size(const DxCaptureSession* session,
                                          int* out_width, int* out_height) {
  if (!session || !session->impl || !out_width || !out_height) {
    return kDxCaptureErrorInvalidParam;
  }
  *out_width = session->impl->width();
  *out_height = session->impl->height();
  return kDxCaptureOk;
}

DxCaptureError dxcapture_session_get_raw_frame(DxCaptureSession* session,
                                               DxCaptureFrame** out_frame) {
  if (!session || !session->impl || !out_frame) {
    return kDxCaptureErrorInvalidParam;
  }
  *out_frame = nullptr;

  std::unique_ptr<RawFrame> raw;
  Status status = session->impl->GetRawFrame(&raw);
  return WrapFrame(session, status, std::move(raw), out_frame);
}

DxCaptureError dxcapture_session_wait_raw_frame(DxCaptureSession* session,
                                                int timeout_ms,
                                                DxCaptureFrame** out_frame) {
  if (!session || !session->impl || !out_frame) {
    return kDxCaptureErrorInvalidParam;
  }
  *out_frame = nullptr;

  std::unique_ptr<RawFrame> raw;
  Status status = session->impl->WaitRawFrame(timeout_ms, &raw);
  return WrapFrame(session, status, std::move(raw), out_frame);
}

const char* dxcapture_session_get_last_error_message(
    const DxCaptureSession* session) {
  if (!session) return "Invalid session (NULL)";
  return session->errors.message();
}

uint32_t dxcapture_session_get_last_pixel_format(
    const DxCaptureSession* session) {
  if (!session) return 0;
  return session->errors.last_pixel_format();
}

uint64_t dxcapture_session_get_frame_count(const DxCaptureSession* session) {
  if (!session || !session->impl) return 0;
  return session->impl->frame_count();
}

// ---------------------------------------------------------------------------
// Frames
// ---------------------------------------------------------------------------

int dxcapture_frame_get_width(const DxCaptureFrame* frame) {
  if (!frame || !frame->impl) return 0;
  return frame->impl->width();
}

int dxcapture_frame_get_height(const DxCaptureFrame* frame) {
  if (!frame || !frame->impl) return 0;
  return frame->impl->height();
}

const uint8_t* dxcapture_frame_get_data(const DxCaptureFrame* frame) {
  if (!frame || !frame->impl) return nullptr;
  return frame->impl->data();
}

size_t dxcapture_frame_get_data_size(const DxCaptureFrame* frame) {
  if (!frame || !frame->impl) return 0;
  return frame->impl->data_size();
}

void dxcapture_frame_destroy(DxCaptureFrame* frame) {
  delete frame;
}

// ---------------------------------------------------------------------------
// Version information
// ---------------------------------------------------------------------------

const char* dxcapture_version_string(void) {
  return DXCAPTURE_VERSION_STRING;
}

int dxcapture_version_major(void) { return DXCAPTURE_VERSION_MAJOR; }
int dxcapture_version_minor(void) { return DXCAPTURE_VERSION_MINOR; }
int dxcapture_version_patch(void) { return DXCAPTURE_VERSION_PATCH; }

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

void dxcapture_set_log_level(DxCaptureLogLevel level) {
  dxcapture::internal::SetLogLevel(level);
}

void dxcapture_set_log_callback(dxcapture_log_callback_t callback,
                                void* userdata) {
  dxcapture::internal::SetLogCallback(callback, userdata);
}

void dxcapture_log(DxCaptureLogLevel level, const char* message) {
  if (!message) return;
  dxcapture::internal::GetLogger()->log(
      dxcapture::internal::ToSpdlogLevel(level), "{}", message);
}
