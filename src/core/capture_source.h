// Copyright 2026 The dxcapture Authors

#ifndef DXCAPTURE_CORE_CAPTURE_SOURCE_H_
#define DXCAPTURE_CORE_CAPTURE_SOURCE_H_

#include <functional>
#include <memory>

#include "core/graphics_device.h"
#include "core/status.h"
#include "core/texture.h"

namespace dxcapture {
namespace internal {

/// Receives the staging copy of each arrived frame.  Called on a worker
/// thread owned by the capture service.
using FrameCallback = std::function<void(std::shared_ptr<Texture>)>;

/// Platform frame source: a frame pool and capture session bound to one
/// target and one graphics device.
///
/// The factory that creates a source performs the setup (target size, frame
/// pool, session binding).  Start() registers the arrival callback and starts
/// delivery.  Implementations copy each arrived frame into a fresh
/// CPU-readable staging texture before invoking the callback, and drop
/// frames they fail to copy.
class CaptureSource {
 public:
  virtual ~CaptureSource() = default;

  // Non-copyable.
  CaptureSource(const CaptureSource&) = delete;
  CaptureSource& operator=(const CaptureSource&) = delete;

  /// Register @p on_frame and start capturing.
  virtual Status Start(FrameCallback on_frame) = 0;

  /// Unregister the callback and close the session and frame pool.
  /// Must tolerate repeated calls.
  virtual void Close() = 0;

  /// The device that owns the staging textures handed to the callback.
  virtual const GraphicsDevice& device() const = 0;

  /// Target size at creation, in pixels.
  virtual int width() const = 0;
  virtual int height() const = 0;

 protected:
  CaptureSource() = default;
};

}  // namespace internal
}  // namespace dxcapture

#endif  // DXCAPTURE_CORE_CAPTURE_SOURCE_H_
