// Copyright 2026 The dxcapture Authors

#ifndef DXCAPTURE_CORE_GRAPHICS_DEVICE_H_
#define DXCAPTURE_CORE_GRAPHICS_DEVICE_H_

#include <memory>

#include "core/status.h"
#include "core/texture.h"

namespace dxcapture {
namespace internal {

/// Conversions between a device's native textures and the capture API's
/// surface abstraction.
///
/// The capture service hands out surfaces while copy and map operations need
/// native textures, so every frame crosses this boundary.  Conversions are
/// fallible and report kDxCaptureErrorBackend when the object does not
/// belong to this device type.
class GraphicsDevice {
 public:
  virtual ~GraphicsDevice() = default;

  // Non-copyable.
  GraphicsDevice(const GraphicsDevice&) = delete;
  GraphicsDevice& operator=(const GraphicsDevice&) = delete;

  /// Wrap a native texture as a capture surface.
  virtual Status ToAbstractSurface(const std::shared_ptr<Texture>& texture,
                                   std::unique_ptr<Surface>* out) const = 0;

  /// Resolve a capture surface to the native texture backing it.
  virtual Status FromAbstractSurface(const Surface& surface,
                                     std::shared_ptr<Texture>* out) const = 0;

 protected:
  GraphicsDevice() = default;
};

}  // namespace internal
}  // namespace dxcapture

#endif  // DXCAPTURE_CORE_GRAPHICS_DEVICE_H_
