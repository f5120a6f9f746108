// Copyright 2026 The dxcapture Authors

#include "core/frame_slot.h"

#include <utility>

namespace dxcapture {
namespace internal {

bool FrameSlot::Publish(std::shared_ptr<Texture> texture) {
  std::shared_ptr<Texture> previous;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) return false;
    previous = std::move(texture_);
    texture_ = std::move(texture);
    ++generation_;
  }
  // |previous| is released here, outside the lock.
  return true;
}

std::shared_ptr<Texture> FrameSlot::Peek() const {
  std::lock_guard<std::mutex> lock(mu_);
  return texture_;
}

uint64_t FrameSlot::generation() const {
  std::lock_guard<std::mutex> lock(mu_);
  return generation_;
}

void FrameSlot::Close() {
  std::shared_ptr<Texture> previous;
  {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = true;
    previous = std::move(texture_);
  }
}

}  // namespace internal
}  // namespace dxcapture
