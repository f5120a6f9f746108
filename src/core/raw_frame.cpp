// Copyright 2026 The dxcapture Authors

#include "core/raw_frame.h"

#include <utility>

namespace dxcapture {
namespace internal {

namespace {

// Largest frame we are willing to allocate (a 16K x 4K BGRA surface).
constexpr size_t kMaxFrameBytes = 256ULL * 1024 * 1024;  // 256 MB

}  // namespace

RawFrame::RawFrame(int width, int height, std::vector<uint8_t> data)
    : width_(width), height_(height), data_(std::move(data)) {}

// static
std::unique_ptr<RawFrame> RawFrame::Create(int width, int height) {
  if (width <= 0 || height <= 0) return nullptr;
  size_t total = static_cast<size_t>(width) * static_cast<size_t>(height) * 4;
  if (total > kMaxFrameBytes) return nullptr;
  std::vector<uint8_t> data(total, 0);
  return std::make_unique<RawFrame>(width, height, std::move(data));
}

}  // namespace internal
}  // namespace dxcapture
