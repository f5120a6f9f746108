// Copyright 2026 The dxcapture Authors
//
// In-memory fakes of the platform seams (texture, graphics device, capture
// source) for testing the readback pipeline without a GPU.

#ifndef DXCAPTURE_TESTS_FAKE_CAPTURE_H_
#define DXCAPTURE_TESTS_FAKE_CAPTURE_H_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "core/capture_source.h"
#include "core/graphics_device.h"
#include "core/status.h"
#include "core/texture.h"

namespace dxcapture {
namespace test {

using internal::CaptureSource;
using internal::FrameCallback;
using internal::GraphicsDevice;
using internal::MappedTexture;
using internal::Status;
using internal::Surface;
using internal::Texture;
using internal::TextureDesc;
using internal::TextureUsage;

/// A CPU-memory texture.  Row r of the image lives at r * row_pitch.
class FakeTexture : public Texture {
 public:
  /// Staging B8G8R8A8 texture with CPU read, every pixel byte set to
  /// @p fill and padding bytes set to @p padding.
  static std::shared_ptr<FakeTexture> MakeStaging(uint32_t width,
                                                  uint32_t height,
                                                  uint32_t row_pitch,
                                                  uint8_t fill,
                                                  uint8_t padding = 0xEE) {
    TextureDesc desc;
    desc.width = width;
    desc.height = height;
    desc.format = internal::kPixelFormatB8G8R8A8Unorm;
    desc.usage = TextureUsage::kStaging;
    desc.cpu_access_flags = internal::kCpuAccessRead;
    auto texture = std::make_shared<FakeTexture>(desc, row_pitch);
    texture->Fill(fill, padding);
    return texture;
  }

  FakeTexture(const TextureDesc& desc, uint32_t row_pitch)
      : desc_(desc),
        row_pitch_(row_pitch),
        memory_(static_cast<size_t>(row_pitch) * desc.height) {}

  TextureDesc GetDesc() const override { return desc_; }

  Status Map(MappedTexture* out) override {
    ++map_calls;
    if (fail_map) {
      return internal::BackendError("Map failed",
                                    static_cast<int32_t>(0x887A0005));
    }
    if (mapped_.exchange(true)) {
      ++overlapping_maps;
      return internal::BackendError("Texture is already mapped");
    }
    out->data = memory_.empty() ? nullptr : memory_.data();
    out->row_pitch = report_row_pitch ? report_row_pitch : row_pitch_;
    return internal::OkStatus();
  }

  void Unmap() override {
    ++unmap_calls;
    mapped_.store(false);
  }

  void Fill(uint8_t fill, uint8_t padding) {
    const size_t row_bytes = static_cast<size_t>(desc_.width) * 4;
    for (uint32_t row = 0; row < desc_.height; ++row) {
      for (size_t col = 0; col < row_pitch_; ++col) {
        memory_[row * row_pitch_ + col] = col < row_bytes ? fill : padding;
      }
    }
  }

  std::vector<uint8_t>& memory() { return memory_; }

  std::atomic<int> map_calls{0};
  std::atomic<int> unmap_calls{0};
  std::atomic<int> overlapping_maps{0};
  bool fail_map = false;
  uint32_t report_row_pitch = 0;  // Overrides the reported pitch if set.
  uint64_t generation = 0;        // Producer-assigned sequence number.

 private:
  TextureDesc desc_;
  uint32_t row_pitch_;
  std::vector<uint8_t> memory_;
  std::atomic<bool> mapped_{false};
};

/// Surface wrapper produced by FakeGraphicsDevice.
class FakeSurface : public Surface {
 public:
  explicit FakeSurface(std::shared_ptr<Texture> texture)
      : texture_(std::move(texture)) {}
  const std::shared_ptr<Texture>& texture() const { return texture_; }

 private:
  std::shared_ptr<Texture> texture_;
};

/// A surface type no device recognizes.
class ForeignSurface : public Surface {};

class FakeGraphicsDevice : public GraphicsDevice {
 public:
  Status ToAbstractSurface(const std::shared_ptr<Texture>& texture,
                           std::unique_ptr<Surface>* out) const override {
    if (!texture) return internal::BackendError("Null texture");
    *out = std::make_unique<FakeSurface>(texture);
    return internal::OkStatus();
  }

  Status FromAbstractSurface(const Surface& surface,
                             std::shared_ptr<Texture>* out) const override {
    auto* fake = dynamic_cast<const FakeSurface*>(&surface);
    if (!fake) return internal::BackendError("Surface type mismatch");
    *out = fake->texture();
    return internal::OkStatus();
  }
};

/// Test-side view of a FakeCaptureSource, valid after the source is gone.
struct FakeSourceState {
  std::mutex mu;
  FrameCallback callback;
  Status start_status;
  int start_calls = 0;
  int close_calls = 0;

  /// Invoke the registered callback as the capture worker would.
  void Deliver(std::shared_ptr<Texture> texture) {
    FrameCallback cb;
    {
      std::lock_guard<std::mutex> lock(mu);
      cb = callback;
    }
    if (cb) cb(std::move(texture));
  }
};

class FakeCaptureSource : public CaptureSource {
 public:
  FakeCaptureSource(std::shared_ptr<FakeSourceState> state, int width,
                    int height)
      : state_(std::move(state)), width_(width), height_(height) {}

  Status Start(FrameCallback on_frame) override {
    std::lock_guard<std::mutex> lock(state_->mu);
    ++state_->start_calls;
    if (!state_->start_status.ok()) return state_->start_status;
    state_->callback = std::move(on_frame);
    return internal::OkStatus();
  }

  // Keeps the callback registered so tests can simulate a late delivery
  // racing with close.
  void Close() override {
    std::lock_guard<std::mutex> lock(state_->mu);
    ++state_->close_calls;
  }

  const GraphicsDevice& device() const override { return device_; }
  int width() const override { return width_; }
  int height() const override { return height_; }

 private:
  std::shared_ptr<FakeSourceState> state_;
  FakeGraphicsDevice device_;
  int width_;
  int height_;
};

}  // namespace test
}  // namespace dxcapture

#endif  // DXCAPTURE_TESTS_FAKE_CAPTURE_H_
