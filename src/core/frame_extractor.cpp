// Copyright 2026 The dxcapture Authors

#include "core/frame_extractor.h"

#include <cstring>
#include <string>
#include <utility>

#include "core/logger.h"

namespace dxcapture {
namespace internal {

// static
Status FrameExtractor::SurfaceToRawFrame(const GraphicsDevice& device,
                                         const Surface& surface,
                                         std::unique_ptr<RawFrame>* out) {
  std::shared_ptr<Texture> texture;
  Status status = device.FromAbstractSurface(surface, &texture);
  if (!status.ok()) return status;
  return TextureToRawFrame(texture.get(), out);
}

// static
Status FrameExtractor::Validate(const TextureDesc& desc) {
  if (desc.format != kPixelFormatB8G8R8A8Unorm) {
    return UnsupportedPixelFormatError(desc.format);
  }
  if (desc.usage != TextureUsage::kStaging) {
    return UnsupportedBufferTypeError();
  }
  if ((desc.cpu_access_flags & kCpuAccessRead) != kCpuAccessRead) {
    return DeniedAccessCpuReadError();
  }
  return OkStatus();
}

// static
Status FrameExtractor::TextureToRawFrame(Texture* texture,
                                         std::unique_ptr<RawFrame>* out) {
  if (!texture || !out) return BackendError("No texture to read back");

  const TextureDesc desc = texture->GetDesc();
  Status status = Validate(desc);
  if (!status.ok()) return status;

  ScopedMap map(texture);
  status = map.Map();
  if (!status.ok()) return status;

  const MappedTexture& mapped = map.view();
  const size_t row_bytes = static_cast<size_t>(desc.width) * kBytesPerPixel;
  if (!mapped.data || mapped.row_pitch < row_bytes) {
    return BackendError("Mapped texture has an invalid row pitch");
  }

  auto frame = RawFrame::Create(static_cast<int>(desc.width),
                                static_cast<int>(desc.height));
  if (!frame) {
    return BackendError("Cannot allocate frame buffer for " +
                        std::to_string(desc.width) + "x" +
                        std::to_string(desc.height));
  }

  // Copy row by row (mapped pitch may exceed width * 4).
  uint8_t* dst = frame->mutable_data();
  for (uint32_t row = 0; row < desc.height; ++row) {
    const uint8_t* src =
        mapped.data + static_cast<size_t>(row) * mapped.row_pitch;
    std::memcpy(dst + static_cast<size_t>(row) * row_bytes, src, row_bytes);
  }

  DXCAPTURE_LOG_TRACE("Read back {}x{} frame (row pitch {})", desc.width,
                      desc.height, mapped.row_pitch);
  *out = std::move(frame);
  return OkStatus();
}

}  // namespace internal
}  // namespace dxcapture
