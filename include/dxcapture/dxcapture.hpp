// Copyright 2026 The dxcapture Authors
//
// C++ RAII wrapper for the dxcapture C API.
// Header-only: just include this file.  Requires C++17 or later.
//
// Usage:
//   #include "dxcapture/dxcapture.hpp"
//   dxcapture::Context ctx;
//   auto session = ctx.CaptureDisplay();
//   auto frame = session.WaitRawFrame(std::chrono::seconds(1));
//   printf("Size: %dx%d\n", frame.width(), frame.height());

#ifndef DXCAPTURE_DXCAPTURE_HPP_
#define DXCAPTURE_DXCAPTURE_HPP_

#include "dxcapture/dxcapture.h"

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace dxcapture {

// ---------------------------------------------------------------------------
// Exception
// ---------------------------------------------------------------------------

class Error : public std::runtime_error {
 public:
  Error(DxCaptureError code, const char* msg)
      : std::runtime_error((msg && msg[0]) ? msg
                                           : dxcapture_error_string(code)),
        code_(code) {}
  DxCaptureError code() const noexcept { return code_; }

  /// True for the transient "no frame yet" condition.
  bool is_no_texture() const noexcept {
    return code_ == kDxCaptureErrorNoTexture;
  }

 private:
  DxCaptureError code_;
};

// ---------------------------------------------------------------------------
// Frame  (move-only RAII wrapper)
// ---------------------------------------------------------------------------

class Frame {
 public:
  Frame() noexcept = default;
  explicit Frame(DxCaptureFrame* raw) noexcept : raw_(raw) {}
  ~Frame() { dxcapture_frame_destroy(raw_); }

  Frame(Frame&& o) noexcept : raw_(o.raw_) { o.raw_ = nullptr; }
  Frame& operator=(Frame&& o) noexcept {
    if (this != &o) {
      dxcapture_frame_destroy(raw_);
      raw_ = o.raw_;
      o.raw_ = nullptr;
    }
    return *this;
  }
  Frame(const Frame&) = delete;
  Frame& operator=(const Frame&) = delete;

  explicit operator bool() const noexcept { return raw_ != nullptr; }
  DxCaptureFrame* get() const noexcept { return raw_; }

  int width() const noexcept { return dxcapture_frame_get_width(raw_); }
  int height() const noexcept { return dxcapture_frame_get_height(raw_); }
  const uint8_t* data() const noexcept {
    return dxcapture_frame_get_data(raw_);
  }
  size_t data_size() const noexcept {
    return dxcapture_frame_get_data_size(raw_);
  }

 private:
  DxCaptureFrame* raw_ = nullptr;
};

// ---------------------------------------------------------------------------
// Session  (move-only RAII wrapper)
// ---------------------------------------------------------------------------

class Session {
 public:
  Session() noexcept = default;
  explicit Session(DxCaptureSession* raw) noexcept : raw_(raw) {}
  ~Session() { dxcapture_session_destroy(raw_); }

  Session(Session&& o) noexcept : raw_(o.raw_) { o.raw_ = nullptr; }
  Session& operator=(Session&& o) noexcept {
    if (this != &o) {
      dxcapture_session_destroy(raw_);
      raw_ = o.raw_;
      o.raw_ = nullptr;
    }
    return *this;
  }
  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  explicit operator bool() const noexcept { return raw_ != nullptr; }
  DxCaptureSession* get() const noexcept { return raw_; }

  bool active() const noexcept {
    return dxcapture_session_is_active(raw_) != 0;
  }
  void Close() noexcept { dxcapture_session_close(raw_); }

  int width() const {
    int w = 0, h = 0;
    check(dxcapture_session_get_size(raw_, &w, &h));
    return w;
  }
  int height() const {
    int w = 0, h = 0;
    check(dxcapture_session_get_size(raw_, &w, &h));
    return h;
  }

  uint64_t frame_count() const noexcept {
    return dxcapture_session_get_frame_count(raw_);
  }

  /// Pull the current frame.  Throws Error (is_no_texture() == true) when
  /// no frame has arrived yet.
  Frame GetRawFrame() {
    DxCaptureFrame* f = nullptr;
    check(dxcapture_session_get_raw_frame(raw_, &f));
    return Frame(f);
  }

  /// Pull the current frame without throwing.
  DxCaptureError TryGetRawFrame(Frame* out) {
    DxCaptureFrame* f = nullptr;
    DxCaptureError err = dxcapture_session_get_raw_frame(raw_, &f);
    if (err == kDxCaptureOk && out) *out = Frame(f);
    else dxcapture_frame_destroy(f);
    return err;
  }

  /// Pull the current frame, retrying while none has arrived yet.
  Frame WaitRawFrame(std::chrono::milliseconds timeout) {
    DxCaptureFrame* f = nullptr;
    check(dxcapture_session_wait_raw_frame(
        raw_, static_cast<int>(timeout.count()), &f));
    return Frame(f);
  }

  /// Pull the current frame, retrying with no time limit.
  Frame WaitRawFrame() {
    DxCaptureFrame* f = nullptr;
    check(dxcapture_session_wait_raw_frame(raw_, -1, &f));
    return Frame(f);
  }

  uint32_t last_pixel_format() const noexcept {
    return dxcapture_session_get_last_pixel_format(raw_);
  }

 private:
  void check(DxCaptureError err) const {
    if (err != kDxCaptureOk)
      throw Error(err, dxcapture_session_get_last_error_message(raw_));
  }

  DxCaptureSession* raw_ = nullptr;
};

// ---------------------------------------------------------------------------
// Context  (move-only RAII wrapper)
// ---------------------------------------------------------------------------

class Context {
 public:
  Context() : raw_(dxcapture_context_create()) {
    if (!raw_) throw Error(kDxCaptureErrorNotSupported, "Context creation failed");
  }
  ~Context() { dxcapture_context_destroy(raw_); }

  Context(Context&& o) noexcept : raw_(o.raw_) { o.raw_ = nullptr; }
  Context& operator=(Context&& o) noexcept {
    if (this != &o) {
      dxcapture_context_destroy(raw_);
      raw_ = o.raw_;
      o.raw_ = nullptr;
    }
    return *this;
  }
  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  DxCaptureContext* get() const noexcept { return raw_; }

  DxCaptureError last_error() const {
    return dxcapture_get_last_error(raw_);
  }
  const char* last_error_message() const {
    return dxcapture_get_last_error_message(raw_);
  }

  bool supported() { return dxcapture_is_supported(raw_) != 0; }

  // -- Enumeration --

  std::vector<DxCaptureDisplayInfo> EnumerateDisplays(int max_count = 16) {
    std::vector<DxCaptureDisplayInfo> buf(max_count);
    int n = dxcapture_enumerate_displays(raw_, buf.data(), max_count);
    if (n < 0) throw_last("EnumerateDisplays failed");
    buf.resize(n);
    return buf;
  }

  std::vector<DxCaptureWindowInfo> EnumerateWindows(int max_count = 256) {
    std::vector<DxCaptureWindowInfo> buf(max_count);
    int n = dxcapture_enumerate_windows(raw_, buf.data(), max_count);
    if (n < 0) throw_last("EnumerateWindows failed");
    buf.resize(n);
    return buf;
  }

  std::vector<DxCaptureWindowInfo> FindWindows(const std::string& title,
                                               int max_count = 64) {
    std::vector<DxCaptureWindowInfo> buf(max_count);
    int n = dxcapture_find_windows(raw_, title.c_str(), buf.data(), max_count);
    if (n < 0) throw_last("FindWindows failed");
    buf.resize(n);
    return buf;
  }

  // -- Sessions --

  Session Capture(const DxCaptureTarget& target,
                  const DxCaptureSessionOptions* options = nullptr) {
    auto* s = dxcapture_session_create(raw_, &target, options);
    if (!s) throw_last("Session creation failed");
    return Session(s);
  }

  /// Capture a display by index; -1 selects the primary display.
  Session CaptureDisplay(int display_index = -1,
                         const DxCaptureSessionOptions* options = nullptr) {
    auto* s = dxcapture_session_create_for_display(raw_, display_index, options);
    if (!s) throw_last("Display capture failed");
    return Session(s);
  }

  Session CaptureWindow(const std::string& title,
                        const DxCaptureSessionOptions* options = nullptr) {
    auto* s = dxcapture_session_create_for_window_title(raw_, title.c_str(),
                                                        options);
    if (!s) throw_last("Window capture failed");
    return Session(s);
  }

 private:
  [[noreturn]] void throw_last(const char* fallback) {
    auto err = dxcapture_get_last_error(raw_);
    const char* msg = dxcapture_get_last_error_message(raw_);
    throw Error(err != kDxCaptureOk ? err : kDxCaptureErrorUnknown,
                (msg && msg[0]) ? msg : fallback);
  }

  DxCaptureContext* raw_ = nullptr;
};

inline const char* version_string() { return dxcapture_version_string(); }

}  // namespace dxcapture

#endif  // DXCAPTURE_DXCAPTURE_HPP_
