// Copyright 2026 The dxcapture Authors

#ifndef DXCAPTURE_CORE_RAW_FRAME_H_
#define DXCAPTURE_CORE_RAW_FRAME_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace dxcapture {
namespace internal {

/// A captured frame: tightly packed B8G8R8A8 pixels, stride == width * 4.
class RawFrame {
 public:
  RawFrame(int width, int height, std::vector<uint8_t> data);
  ~RawFrame() = default;

  // Non-copyable, movable.
  RawFrame(const RawFrame&) = delete;
  RawFrame& operator=(const RawFrame&) = delete;
  RawFrame(RawFrame&&) = default;
  RawFrame& operator=(RawFrame&&) = default;

  int width() const { return width_; }
  int height() const { return height_; }
  int stride() const { return width_ * 4; }
  const uint8_t* data() const { return data_.data(); }
  size_t data_size() const { return data_.size(); }

  /// Create a zero-filled frame (to be filled by the caller).
  /// Returns nullptr for empty or oversized dimensions.
  static std::unique_ptr<RawFrame> Create(int width, int height);

  /// Get a mutable pointer to pixel data (for the extractor to fill).
  uint8_t* mutable_data() { return data_.data(); }

 private:
  int width_;
  int height_;
  std::vector<uint8_t> data_;
};

}  // namespace internal
}  // namespace dxcapture

#endif  // DXCAPTURE_CORE_RAW_FRAME_H_
