// Copyright 2026 The dxcapture Authors
//
// Backend-neutral view of GPU textures and capture surfaces.

#ifndef DXCAPTURE_CORE_TEXTURE_H_
#define DXCAPTURE_CORE_TEXTURE_H_

#include <cstdint>

#include "core/status.h"

namespace dxcapture {
namespace internal {

// Numeric values match DXGI_FORMAT, D3D11_USAGE and D3D11_CPU_ACCESS_FLAG so
// the Direct3D backend can pass descriptions through unchanged.
constexpr uint32_t kPixelFormatB8G8R8A8Unorm = 87;
constexpr int kBytesPerPixel = 4;

enum class TextureUsage : uint32_t {
  kDefault = 0,
  kImmutable = 1,
  kDynamic = 2,
  kStaging = 3,
};

constexpr uint32_t kCpuAccessWrite = 0x10000;
constexpr uint32_t kCpuAccessRead = 0x20000;

struct TextureDesc {
  uint32_t width = 0;
  uint32_t height = 0;
  uint32_t format = 0;
  TextureUsage usage = TextureUsage::kDefault;
  uint32_t cpu_access_flags = 0;
};

/// CPU view of a mapped texture.  Row r starts at data + r * row_pitch.
struct MappedTexture {
  const uint8_t* data = nullptr;
  uint32_t row_pitch = 0;
};

/// A 2-D GPU texture owned by a graphics device.
class Texture {
 public:
  virtual ~Texture() = default;

  Texture(const Texture&) = delete;
  Texture& operator=(const Texture&) = delete;

  virtual TextureDesc GetDesc() const = 0;

  /// Map subresource 0 for CPU read.  On success the caller must Unmap().
  virtual Status Map(MappedTexture* out) = 0;

  virtual void Unmap() = 0;

 protected:
  Texture() = default;
};

/// The capture API's format-agnostic surface handle.  Concrete types are
/// defined by each GraphicsDevice implementation.
class Surface {
 public:
  virtual ~Surface() = default;

  Surface(const Surface&) = delete;
  Surface& operator=(const Surface&) = delete;

 protected:
  Surface() = default;
};

/// Maps a texture for reading and unmaps it when destroyed.
class ScopedMap {
 public:
  explicit ScopedMap(Texture* texture) : texture_(texture) {}
  ~ScopedMap() {
    if (mapped_) texture_->Unmap();
  }

  ScopedMap(const ScopedMap&) = delete;
  ScopedMap& operator=(const ScopedMap&) = delete;

  Status Map() {
    Status status = texture_->Map(&view_);
    mapped_ = status.ok();
    return status;
  }

  const MappedTexture& view() const { return view_; }

 private:
  Texture* texture_;
  MappedTexture view_;
  bool mapped_ = false;
};

}  // namespace internal
}  // namespace dxcapture

#endif  // DXCAPTURE_CORE_TEXTURE_H_
