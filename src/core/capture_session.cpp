// Copyright 2026 The dxcapture Authors

#include "core/capture_session.h"

#include <chrono>
#include <thread>
#include <utility>

#include "core/frame_extractor.h"
#include "core/logger.h"

namespace dxcapture {
namespace internal {

namespace {

constexpr auto kWaitPollInterval = std::chrono::milliseconds(2);

}  // namespace

CaptureSession::CaptureSession(std::unique_ptr<CaptureSource> source)
    : source_(std::move(source)), slot_(std::make_shared<FrameSlot>()) {}

// static
Status CaptureSession::Create(std::unique_ptr<CaptureSource> source,
                              std::unique_ptr<CaptureSession>* out) {
  if (!source || !out) return BackendError("No capture source");

  std::unique_ptr<CaptureSession> session(
      new CaptureSession(std::move(source)));

  // The callback may outlive the session on the worker thread, so it holds
  // the slot, not the session.
  std::shared_ptr<FrameSlot> slot = session->slot_;
  Status status = session->source_->Start(
      [slot](std::shared_ptr<Texture> staging) {
        if (!slot->Publish(std::move(staging))) {
          DXCAPTURE_WORKER_LOG_TRACE("Dropping frame delivered after close");
        }
      });
  if (!status.ok()) {
    session->source_->Close();
    slot->Close();
    return status;
  }

  session->active_.store(true);
  DXCAPTURE_LOG_INFO("Capture session started ({}x{})", session->width(),
                     session->height());
  *out = std::move(session);
  return OkStatus();
}

CaptureSession::~CaptureSession() { Close(); }

void CaptureSession::Close() {
  if (!active_.exchange(false)) return;
  source_->Close();
  slot_->Close();
  DXCAPTURE_LOG_INFO("Capture session closed after {} frames",
                     slot_->generation());
}

Status CaptureSession::TakeCurrentSurface(
    std::unique_ptr<Surface>* out) const {
  if (!active_.load()) return NotActiveError();

  std::shared_ptr<Texture> texture = slot_->Peek();
  if (!texture) {
    // Close() clears the active flag before the slot, so an empty slot seen
    // after a concurrent Close() still reads as NotActive.
    return active_.load() ? NoTextureError() : NotActiveError();
  }

  return source_->device().ToAbstractSurface(texture, out);
}

Status CaptureSession::SurfaceToRawFrame(
    const Surface& surface, std::unique_ptr<RawFrame>* out) const {
  std::lock_guard<std::mutex> lock(readback_mu_);
  return FrameExtractor::SurfaceToRawFrame(source_->device(), surface, out);
}

Status CaptureSession::GetRawFrame(std::unique_ptr<RawFrame>* out) const {
  std::unique_ptr<Surface> surface;
  Status status = TakeCurrentSurface(&surface);
  if (!status.ok()) return status;
  return SurfaceToRawFrame(*surface, out);
}

Status CaptureSession::WaitRawFrame(int timeout_ms,
                                    std::unique_ptr<RawFrame>* out) const {
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(timeout_ms);
  for (;;) {
    Status status = GetRawFrame(out);
    if (status.code() != kDxCaptureErrorNoTexture) return status;
    if (timeout_ms >= 0 && std::chrono::steady_clock::now() >= deadline) {
      return status;
    }
    std::this_thread::sleep_for(kWaitPollInterval);
  }
}

}  // namespace internal
}  // namespace dxcapture
