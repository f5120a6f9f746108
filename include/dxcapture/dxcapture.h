// Copyright 2026 The dxcapture Authors
//
// Licensed under the MIT License. See LICENSE file in the project root for
// full license information.

#ifndef DXCAPTURE_DXCAPTURE_H_
#define DXCAPTURE_DXCAPTURE_H_

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ---------------------------------------------------------------------------
// Export macro
// ---------------------------------------------------------------------------
#if defined(DXCAPTURE_STATIC)
#define DXCAPTURE_API
#elif defined(_WIN32)
#if defined(DXCAPTURE_BUILDING)
#define DXCAPTURE_API __declspec(dllexport)
#else
#define DXCAPTURE_API __declspec(dllimport)
#endif
#elif defined(__GNUC__) || defined(__clang__)
#define DXCAPTURE_API __attribute__((visibility("default")))
#else
#define DXCAPTURE_API
#endif

// ---------------------------------------------------------------------------
// Version (auto-generated from CMakeLists.txt via configure_file)
// ---------------------------------------------------------------------------
#include "dxcapture/version.h"

// ---------------------------------------------------------------------------
// Thread safety
// ---------------------------------------------------------------------------
//
// General rules:
//   - Each DxCaptureContext is independent.  Operations on the SAME context
//     are NOT thread-safe; serialize access if it is shared across threads.
//   - A DxCaptureSession receives frames on a worker thread owned by the OS
//     capture service.  dxcapture_session_get_raw_frame() and
//     dxcapture_session_wait_raw_frame() may be called from any thread, and
//     concurrently with frame arrival.
//   - dxcapture_session_close() may race with the pull functions; pulls that
//     start after the close returns fail with kDxCaptureErrorNotActive.
//   - DxCaptureFrame objects are immutable after creation; reading frame
//     properties and data is safe from multiple threads simultaneously.
//   - dxcapture_set_log_level() and dxcapture_set_log_callback() are
//     process-global and internally synchronized.
//

// ---------------------------------------------------------------------------
// Opaque handles
// ---------------------------------------------------------------------------
typedef struct DxCaptureContext DxCaptureContext;
typedef struct DxCaptureSession DxCaptureSession;
typedef struct DxCaptureFrame DxCaptureFrame;

// ---------------------------------------------------------------------------
// Types
// ---------------------------------------------------------------------------

/// Native handle of a capture target.
/// Monitors: HMONITOR cast to uint64_t
/// Windows:  HWND cast to uint64_t
typedef uint64_t DxCaptureHandle;

/// Error codes returned by dxcapture functions.
typedef enum DxCaptureError {
  kDxCaptureOk = 0,
  kDxCaptureErrorNotActive = -1,            ///< Session already closed
  kDxCaptureErrorNoTexture = -2,            ///< No frame arrived yet (retry)
  kDxCaptureErrorDeniedAccessCpuRead = -3,  ///< Staging texture lacks CPU read
  kDxCaptureErrorBackend = -4,              ///< Graphics/capture API failure
  kDxCaptureErrorUnsupportedBufferType = -5,   ///< Not a staging texture
  kDxCaptureErrorUnsupportedPixelFormat = -6,  ///< Not B8G8R8A8 UNORM
  kDxCaptureErrorInvalidParam = -10,
  kDxCaptureErrorNotFound = -11,            ///< No matching display/window
  kDxCaptureErrorNotSupported = -12,        ///< Capture unavailable on this OS
  kDxCaptureErrorUnknown = -99,
} DxCaptureError;

/// Log severity levels for the internal logging system.
typedef enum DxCaptureLogLevel {
  kDxCaptureLogTrace = 0,   ///< Very detailed diagnostic info
  kDxCaptureLogDebug = 1,   ///< Debug-level messages
  kDxCaptureLogInfo = 2,    ///< Informational messages (default)
  kDxCaptureLogWarn = 3,    ///< Warnings
  kDxCaptureLogError = 4,   ///< Errors
  kDxCaptureLogFatal = 5,   ///< Fatal / critical errors
} DxCaptureLogLevel;

/// User-defined log callback function type.
///
/// @param level  The severity level of the message.
/// @param message  Null-terminated UTF-8 log message.
/// @param userdata  The opaque pointer passed to dxcapture_set_log_callback.
typedef void (*dxcapture_log_callback_t)(DxCaptureLogLevel level,
                                         const char* message,
                                         void* userdata);

/// What a capture target refers to.
typedef enum DxCaptureTargetKind {
  kDxCaptureTargetMonitor = 0,
  kDxCaptureTargetWindow = 1,
} DxCaptureTargetKind;

/// A monitor or window to capture.
typedef struct DxCaptureTarget {
  DxCaptureTargetKind kind;
  DxCaptureHandle handle;
} DxCaptureTarget;

/// Information about a display monitor.
typedef struct DxCaptureDisplayInfo {
  int index;               ///< Display index (0-based, enumeration order)
  DxCaptureHandle handle;  ///< Native monitor handle
  int x;                   ///< Left edge X in virtual screen coordinates
  int y;                   ///< Top edge Y in virtual screen coordinates
  int width;               ///< Width in pixels
  int height;              ///< Height in pixels
  int is_primary;          ///< Non-zero if this is the primary display
  char name[128];          ///< Device name (UTF-8, null-terminated)
} DxCaptureDisplayInfo;

/// Information about a capturable top-level window.
typedef struct DxCaptureWindowInfo {
  DxCaptureHandle id;    ///< Native window handle
  char title[256];       ///< Window title (UTF-8, null-terminated)
  char class_name[256];  ///< Window class name (UTF-8, null-terminated)
} DxCaptureWindowInfo;

/// Session options.  A zero-initialized struct selects the defaults.
typedef struct DxCaptureSessionOptions {
  int hide_cursor;  ///< Non-zero: exclude the mouse cursor from frames
  int hide_border;  ///< Non-zero: ask the OS not to draw the capture border
                    ///< (ignored where the OS does not support it)
} DxCaptureSessionOptions;

// ---------------------------------------------------------------------------
// Context management
// ---------------------------------------------------------------------------

/// Create a new dxcapture context. The context initializes the platform
/// capture backend.
/// @return A new context, or NULL on failure.
DXCAPTURE_API DxCaptureContext* dxcapture_context_create(void);

/// Destroy a context.  Sessions created from it stay valid and must be
/// destroyed separately.  NULL is ignored.
DXCAPTURE_API void dxcapture_context_destroy(DxCaptureContext* ctx);

/// Get the last error code recorded on @p ctx.
DXCAPTURE_API DxCaptureError dxcapture_get_last_error(
    const DxCaptureContext* ctx);

/// Get a human-readable description of the last error on @p ctx.
/// The returned string is valid until the next call on the same context.
DXCAPTURE_API const char* dxcapture_get_last_error_message(
    const DxCaptureContext* ctx);

/// Get a static description of an error code.
DXCAPTURE_API const char* dxcapture_error_string(DxCaptureError error);

/// Non-zero if frame capture is available on this system.
DXCAPTURE_API int dxcapture_is_supported(DxCaptureContext* ctx);

// ---------------------------------------------------------------------------
// Display / window enumeration
// ---------------------------------------------------------------------------

/// Get the number of connected displays, or -1 on error.
DXCAPTURE_API int dxcapture_get_display_count(DxCaptureContext* ctx);

/// Fill @p out_displays with up to @p max_count displays.
/// @return Number of entries written, or -1 on error.
DXCAPTURE_API int dxcapture_enumerate_displays(
    DxCaptureContext* ctx, DxCaptureDisplayInfo* out_displays, int max_count);

/// Fill @p out_windows with up to @p max_count capturable windows.
/// @return Number of entries written, or -1 on error.
DXCAPTURE_API int dxcapture_enumerate_windows(
    DxCaptureContext* ctx, DxCaptureWindowInfo* out_windows, int max_count);

/// Find capturable windows whose title contains @p title (case-insensitive).
/// @return Number of entries written, or -1 on error.
DXCAPTURE_API int dxcapture_find_windows(DxCaptureContext* ctx,
                                         const char* title,
                                         DxCaptureWindowInfo* out_windows,
                                         int max_count);

// ---------------------------------------------------------------------------
// Capture sessions
// ---------------------------------------------------------------------------

/// Start capturing @p target.  The returned session is already active.
/// @param options  Session options, or NULL for defaults.
/// @return A new session, or NULL on failure (see dxcapture_get_last_error).
DXCAPTURE_API DxCaptureSession* dxcapture_session_create(
    DxCaptureContext* ctx, const DxCaptureTarget* target,
    const DxCaptureSessionOptions* options);

/// Start capturing a display by index.  A negative index selects the primary
/// display.
DXCAPTURE_API DxCaptureSession* dxcapture_session_create_for_display(
    DxCaptureContext* ctx, int display_index,
    const DxCaptureSessionOptions* options);

/// Start capturing the first capturable window whose title contains
/// @p title (case-insensitive).
DXCAPTURE_API DxCaptureSession* dxcapture_session_create_for_window_title(
    DxCaptureContext* ctx, const char* title,
    const DxCaptureSessionOptions* options);

/// Close (if still active) and free a session.  NULL is ignored.
DXCAPTURE_API void dxcapture_session_destroy(DxCaptureSession* session);

/// Stop capturing.  Idempotent; subsequent pulls fail with
/// kDxCaptureErrorNotActive.
DXCAPTURE_API void dxcapture_session_close(DxCaptureSession* session);

/// Non-zero while the session has not been closed.
DXCAPTURE_API int dxcapture_session_is_active(const DxCaptureSession* session);

/// Get the pixel size of the capture target at session creation.
DXCAPTURE_API DxCaptureError dxcapture_session_get_size(
    const DxCaptureSession* session, int* out_width, int* out_height);

/// Copy the most recent frame into a new DxCaptureFrame.
///
/// Never blocks waiting for a frame: returns kDxCaptureErrorNoTexture when
/// no frame has arrived yet.  The same frame may be returned again if no
/// newer frame arrived in between.
/// @param out_frame  Receives the new frame (caller destroys it).
DXCAPTURE_API DxCaptureError dxcapture_session_get_raw_frame(
    DxCaptureSession* session, DxCaptureFrame** out_frame);

/// Like dxcapture_session_get_raw_frame(), but retries while the result is
/// kDxCaptureErrorNoTexture, for at most @p timeout_ms milliseconds
/// (negative = no limit).
DXCAPTURE_API DxCaptureError dxcapture_session_wait_raw_frame(
    DxCaptureSession* session, int timeout_ms, DxCaptureFrame** out_frame);

/// Get the message describing the last failed operation on @p session.
/// The returned string is a per-thread copy, valid until the calling thread
/// calls this function again.  Pulls on other threads do not invalidate it.
DXCAPTURE_API const char* dxcapture_session_get_last_error_message(
    const DxCaptureSession* session);

/// Get the DXGI format code rejected by the last
/// kDxCaptureErrorUnsupportedPixelFormat failure (0 if none).
DXCAPTURE_API uint32_t dxcapture_session_get_last_pixel_format(
    const DxCaptureSession* session);

/// Number of frames the session has received from the OS so far.
DXCAPTURE_API uint64_t dxcapture_session_get_frame_count(
    const DxCaptureSession* session);

// ---------------------------------------------------------------------------
// Frames
// ---------------------------------------------------------------------------

/// Frame width in pixels (0 for NULL).
DXCAPTURE_API int dxcapture_frame_get_width(const DxCaptureFrame* frame);

/// Frame height in pixels (0 for NULL).
DXCAPTURE_API int dxcapture_frame_get_height(const DxCaptureFrame* frame);

/// Tightly packed B8G8R8A8 pixel data (row stride == width * 4).
DXCAPTURE_API const uint8_t* dxcapture_frame_get_data(
    const DxCaptureFrame* frame);

/// Size of the pixel data in bytes (width * height * 4).
DXCAPTURE_API size_t dxcapture_frame_get_data_size(
    const DxCaptureFrame* frame);

/// Free a frame.  NULL is ignored.
DXCAPTURE_API void dxcapture_frame_destroy(DxCaptureFrame* frame);

// ---------------------------------------------------------------------------
// Version information
// ---------------------------------------------------------------------------

/// Get the library version as a string (e.g. "1.0.0").
DXCAPTURE_API const char* dxcapture_version_string(void);

/// Get the major version number.
DXCAPTURE_API int dxcapture_version_major(void);

/// Get the minor version number.
DXCAPTURE_API int dxcapture_version_minor(void);

/// Get the patch version number.
DXCAPTURE_API int dxcapture_version_patch(void);

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

/// Set the minimum log level. Messages below this level are discarded.
/// Default level is kDxCaptureLogInfo.
DXCAPTURE_API void dxcapture_set_log_level(DxCaptureLogLevel level);

/// Set a user-defined log callback.
///
/// When a callback is registered, all log messages (at or above the current
/// level) are forwarded to the callback in addition to the default stderr
/// output.  Pass NULL as @p callback to unregister a previous callback.
///
/// Frame-arrival failures are reported here from the capture worker thread.
///
/// @param callback  The callback function, or NULL to unregister.
/// @param userdata  Opaque pointer passed through to the callback.
DXCAPTURE_API void dxcapture_set_log_callback(
    dxcapture_log_callback_t callback, void* userdata);

/// Emit a log message at the given level through the dxcapture logging
/// system.
///
/// @param level    Severity level.
/// @param message  Null-terminated UTF-8 string.
DXCAPTURE_API void dxcapture_log(DxCaptureLogLevel level, const char* message);

#ifdef __cplusplus
}  // extern "C"
#endif

#endif  // DXCAPTURE_DXCAPTURE_H_
