// Copyright 2026 The dxcapture Authors
//
// dxcapture_poll -- pulls frames from a window (or the primary display) at a
// fixed interval and prints what it got.
//
// Usage: dxcapture_poll [window-title] [frame-count]

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>

#include "dxcapture/dxcapture.hpp"

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(16);
constexpr int kDefaultFrames = 120;

}  // namespace

int main(int argc, char** argv) {
  std::string title = argc > 1 ? argv[1] : "";
  int wanted = argc > 2 ? std::atoi(argv[2]) : kDefaultFrames;
  if (wanted <= 0) wanted = kDefaultFrames;

  try {
    dxcapture::Context ctx;
    if (!ctx.supported()) {
      std::fprintf(stderr, "Windows.Graphics.Capture is not available.\n");
      return 1;
    }

    dxcapture::Session session =
        title.empty() ? ctx.CaptureDisplay() : ctx.CaptureWindow(title);
    std::printf("Capturing %s (%dx%d)\n",
                title.empty() ? "primary display" : title.c_str(),
                session.width(), session.height());

    int received = 0;
    int empty_polls = 0;
    while (received < wanted) {
      dxcapture::Frame frame;
      DxCaptureError err = session.TryGetRawFrame(&frame);
      if (err == kDxCaptureErrorNoTexture) {
        // Frames arrive asynchronously; the first few polls may be empty.
        ++empty_polls;
      } else if (err != kDxCaptureOk) {
        throw dxcapture::Error(
            err, dxcapture_session_get_last_error_message(session.get()));
      } else {
        ++received;
        if (received % 30 == 1) {
          const uint8_t* px = frame.data();
          std::printf("frame %d: %dx%d, %zu bytes, first pixel "
                      "BGRA=%02X%02X%02X%02X\n",
                      received, frame.width(), frame.height(),
                      frame.data_size(), px[0], px[1], px[2], px[3]);
        }
      }
      std::this_thread::sleep_for(kPollInterval);
    }

    std::printf("Done: %d frames pulled, %llu delivered, %d empty polls\n",
                received,
                static_cast<unsigned long long>(session.frame_count()),
                empty_polls);
    session.Close();
  } catch (const dxcapture::Error& e) {
    std::fprintf(stderr, "dxcapture error %d: %s\n", static_cast<int>(e.code()),
                 e.what());
    return 1;
  }
  return 0;
}
