// Copyright 2026 The dxcapture Authors

#ifndef DXCAPTURE_CORE_CAPTURE_SESSION_H_
#define DXCAPTURE_CORE_CAPTURE_SESSION_H_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

#include "core/capture_source.h"
#include "core/frame_slot.h"
#include "core/raw_frame.h"
#include "core/status.h"
#include "core/texture.h"

namespace dxcapture {
namespace internal {

/// An active capture of one target with a pull-based frame API.
///
/// States: Active -> Closed.  Create() returns an already started session;
/// Close() (or the destructor) moves it to Closed exactly once.  Frames
/// arriving on the capture worker are published into a latest-wins
/// FrameSlot; the pull functions read whatever is there at call time.
class CaptureSession {
 public:
  /// Start @p source and wrap it in a session.  On failure the source is
  /// closed and nothing is returned.
  static Status Create(std::unique_ptr<CaptureSource> source,
                       std::unique_ptr<CaptureSession>* out);

  ~CaptureSession();

  // Non-copyable.
  CaptureSession(const CaptureSession&) = delete;
  CaptureSession& operator=(const CaptureSession&) = delete;

  /// Stop capturing and release the held frame.  Idempotent.
  void Close();

  bool is_active() const { return active_.load(); }

  int width() const { return source_->width(); }
  int height() const { return source_->height(); }

  /// Number of frames published by the arrival callback.
  uint64_t frame_count() const { return slot_->generation(); }

  /// Wrap the most recent staging texture as a capture surface.  The slot
  /// keeps its texture, so a later call may return the same frame.
  /// Fails with NotActive after Close(), NoTexture before the first frame.
  Status TakeCurrentSurface(std::unique_ptr<Surface>* out) const;

  /// Read a surface back into a tightly packed frame.
  Status SurfaceToRawFrame(const Surface& surface,
                           std::unique_ptr<RawFrame>* out) const;

  /// TakeCurrentSurface() followed by SurfaceToRawFrame().
  Status GetRawFrame(std::unique_ptr<RawFrame>* out) const;

  /// GetRawFrame(), retried while it reports NoTexture.  A negative
  /// @p timeout_ms waits without limit.  Times out with NoTexture.
  Status WaitRawFrame(int timeout_ms, std::unique_ptr<RawFrame>* out) const;

 private:
  explicit CaptureSession(std::unique_ptr<CaptureSource> source);

  std::unique_ptr<CaptureSource> source_;
  std::shared_ptr<FrameSlot> slot_;
  std::atomic<bool> active_{false};

  // Serializes map/unmap of a shared staging texture between consumers.
  mutable std::mutex readback_mu_;
};

}  // namespace internal
}  // namespace dxcapture

#endif  // DXCAPTURE_CORE_CAPTURE_SESSION_H_
