// Copyright 2026 The dxcapture Authors
//
// Process-wide spdlog loggers.
//
// Library calls log through "dxcapture".  Work done on the capture worker
// thread (frame arrival, staging copies) logs through "dxcapture:worker" so
// its lines are tagged with the thread they came from.  Both loggers write to
// the same stderr and user-callback sinks and share one level.

#ifndef DXCAPTURE_CORE_LOGGER_H_
#define DXCAPTURE_CORE_LOGGER_H_

#include <memory>

#include "spdlog/spdlog.h"

#include "dxcapture/dxcapture.h"

namespace dxcapture {
namespace internal {

std::shared_ptr<spdlog::logger> GetLogger();
std::shared_ptr<spdlog::logger> GetWorkerLogger();

/// Applies to both loggers.
void SetLogLevel(DxCaptureLogLevel level);

/// Forward formatted lines to @p callback.  nullptr stops forwarding.
void SetLogCallback(dxcapture_log_callback_t callback, void* userdata);

spdlog::level::level_enum ToSpdlogLevel(DxCaptureLogLevel level);
DxCaptureLogLevel FromSpdlogLevel(spdlog::level::level_enum level);

}  // namespace internal
}  // namespace dxcapture

#define DXCAPTURE_LOG_TRACE(...)  SPDLOG_LOGGER_TRACE(::dxcapture::internal::GetLogger(), __VA_ARGS__)
#define DXCAPTURE_LOG_DEBUG(...)  SPDLOG_LOGGER_DEBUG(::dxcapture::internal::GetLogger(), __VA_ARGS__)
#define DXCAPTURE_LOG_INFO(...)   SPDLOG_LOGGER_INFO(::dxcapture::internal::GetLogger(), __VA_ARGS__)
#define DXCAPTURE_LOG_WARN(...)   SPDLOG_LOGGER_WARN(::dxcapture::internal::GetLogger(), __VA_ARGS__)
#define DXCAPTURE_LOG_ERROR(...)  SPDLOG_LOGGER_ERROR(::dxcapture::internal::GetLogger(), __VA_ARGS__)
#define DXCAPTURE_LOG_FATAL(...)  SPDLOG_LOGGER_CRITICAL(::dxcapture::internal::GetLogger(), __VA_ARGS__)

// Capture worker thread only.
#define DXCAPTURE_WORKER_LOG_TRACE(...)  SPDLOG_LOGGER_TRACE(::dxcapture::internal::GetWorkerLogger(), __VA_ARGS__)
#define DXCAPTURE_WORKER_LOG_WARN(...)   SPDLOG_LOGGER_WARN(::dxcapture::internal::GetWorkerLogger(), __VA_ARGS__)

#endif  // DXCAPTURE_CORE_LOGGER_H_
