// Copyright 2026 The dxcapture Authors

#ifndef DXCAPTURE_CORE_DXCAPTURE_CONTEXT_H_
#define DXCAPTURE_CORE_DXCAPTURE_CONTEXT_H_

#include <memory>
#include <mutex>
#include <string>

#include "core/capture_backend.h"
#include "core/capture_session.h"
#include "dxcapture/dxcapture.h"

namespace dxcapture {
namespace internal {

/// Internal implementation of the opaque DxCaptureContext handle.
///
/// Owns the platform backend and resolves public targets (display index,
/// window title) to capture sessions.
class DxCaptureContextImpl {
 public:
  explicit DxCaptureContextImpl(
      std::unique_ptr<CaptureBackend> backend = nullptr);
  ~DxCaptureContextImpl();

  // Non-copyable.
  DxCaptureContextImpl(const DxCaptureContextImpl&) = delete;
  DxCaptureContextImpl& operator=(const DxCaptureContextImpl&) = delete;

  /// Initialize the context.  Creates the platform backend unless one was
  /// supplied to the constructor.
  bool Initialize();

  bool is_initialized() const { return initialized_; }

  // -- Error state --

  DxCaptureError last_error() const { return last_error_; }
  const char* last_error_message() const { return last_error_message_.c_str(); }

  void SetError(DxCaptureError code, const std::string& message);
  void ClearError();

  // -- Enumeration --

  bool IsSupported();
  int GetDisplayCount();
  int EnumerateDisplays(DxCaptureDisplayInfo* out_displays, int max_count);
  int EnumerateWindows(DxCaptureWindowInfo* out_windows, int max_count);

  /// Windows whose title contains @p title, compared case-insensitively.
  int FindWindows(const char* title, DxCaptureWindowInfo* out_windows,
                  int max_count);

  // -- Sessions --

  /// Start a session for @p target.  Returns nullptr and sets the error
  /// state on failure.
  std::unique_ptr<CaptureSession> CreateSession(
      const DxCaptureTarget& target, const DxCaptureSessionOptions* options);

  /// Display by enumeration index; a negative index selects the primary.
  std::unique_ptr<CaptureSession> CreateSessionForDisplay(
      int display_index, const DxCaptureSessionOptions* options);

  /// First window whose title contains @p title.
  std::unique_ptr<CaptureSession> CreateSessionForWindowTitle(
      const char* title, const DxCaptureSessionOptions* options);

 private:
  bool CheckInitialized();

  std::unique_ptr<CaptureBackend> backend_;
  bool initialized_ = false;
  std::mutex mu_;

  // Error state (per-context, so thread-safe across contexts).
  DxCaptureError last_error_ = kDxCaptureOk;
  std::string last_error_message_ = "No error";
};

}  // namespace internal
}  // namespace dxcapture

#endif  // DXCAPTURE_CORE_DXCAPTURE_CONTEXT_H_
