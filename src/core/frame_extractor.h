// Copyright 2026 The dxcapture Authors

#ifndef DXCAPTURE_CORE_FRAME_EXTRACTOR_H_
#define DXCAPTURE_CORE_FRAME_EXTRACTOR_H_

#include <memory>

#include "core/graphics_device.h"
#include "core/raw_frame.h"
#include "core/status.h"
#include "core/texture.h"

namespace dxcapture {
namespace internal {

/// Reads staging textures back into tightly packed CPU frames.
class FrameExtractor {
 public:
  /// Resolve @p surface through @p device and read it back.
  static Status SurfaceToRawFrame(const GraphicsDevice& device,
                                  const Surface& surface,
                                  std::unique_ptr<RawFrame>* out);

  /// Validate and read back a native texture.
  ///
  /// Checks run in a fixed order: pixel format (B8G8R8A8_UNORM), usage
  /// (staging), then CPU read access.  The texture is mapped only after all
  /// checks pass and is always unmapped before returning.  Row-pitch
  /// padding is dropped so the result has stride == width * 4.
  static Status TextureToRawFrame(Texture* texture,
                                  std::unique_ptr<RawFrame>* out);

  /// Check a description against the readback requirements.
  static Status Validate(const TextureDesc& desc);
};

}  // namespace internal
}  // namespace dxcapture

#endif  // DXCAPTURE_CORE_FRAME_EXTRACTOR_H_
