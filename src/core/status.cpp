// Copyright 2026 The dxcapture Authors

#include "core/status.h"

#include "spdlog/fmt/fmt.h"

namespace dxcapture {
namespace internal {

Status UnsupportedPixelFormatError(uint32_t format) {
  return Status(kDxCaptureErrorUnsupportedPixelFormat,
                fmt::format("Unsupported pixel format {} (expected "
                            "B8G8R8A8_UNORM)",
                            format),
                format);
}

Status BackendError(const std::string& what, int32_t code) {
  return Status(kDxCaptureErrorBackend,
                fmt::format("{}: 0x{:08X}", what, static_cast<uint32_t>(code)));
}

}  // namespace internal
}  // namespace dxcapture
