// Copyright 2026 The dxcapture Authors

#ifndef DXCAPTURE_CORE_FRAME_SLOT_H_
#define DXCAPTURE_CORE_FRAME_SLOT_H_

#include <cstdint>
#include <memory>
#include <mutex>

#include "core/texture.h"

namespace dxcapture {
namespace internal {

/// Single-slot, latest-wins mailbox between the frame-arrival callback
/// (producer) and the pull path (consumer).
///
/// Publish() replaces the held staging texture unconditionally; Peek() hands
/// out a reference to the current one without removing it.  The mutex is
/// held only for the pointer swap or copy, never across GPU or CPU copies.
/// Replacing a texture drops the slot's reference to the old one; a consumer
/// still holding it keeps it alive until it is done.
class FrameSlot {
 public:
  FrameSlot() = default;

  // Non-copyable.
  FrameSlot(const FrameSlot&) = delete;
  FrameSlot& operator=(const FrameSlot&) = delete;

  /// Replace the held texture.  Returns false (and drops @p texture) once
  /// the slot has been closed.
  bool Publish(std::shared_ptr<Texture> texture);

  /// Current texture, or nullptr if nothing was published yet.
  std::shared_ptr<Texture> Peek() const;

  /// Number of successful Publish() calls.
  uint64_t generation() const;

  /// Release the held texture and reject further publishes.
  void Close();

 private:
  mutable std::mutex mu_;
  std::shared_ptr<Texture> texture_;
  uint64_t generation_ = 0;
  bool closed_ = false;
};

}  // namespace internal
}  // namespace dxcapture

#endif  // DXCAPTURE_CORE_FRAME_SLOT_H_
