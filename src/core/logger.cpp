// Copyright 2026 The dxcapture Authors

#include "core/logger.h"

#include <mutex>
#include <string>

#include "spdlog/sinks/base_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

namespace dxcapture {
namespace internal {

namespace {

// %n is the logger name, so worker lines read [dxcapture:worker][warn] ...
constexpr char kPattern[] = "[%n][%l] %v";

struct LevelMapping {
  DxCaptureLogLevel level;
  spdlog::level::level_enum spdlog_level;
};

constexpr LevelMapping kLevels[] = {
    {kDxCaptureLogTrace, spdlog::level::trace},
    {kDxCaptureLogDebug, spdlog::level::debug},
    {kDxCaptureLogInfo, spdlog::level::info},
    {kDxCaptureLogWarn, spdlog::level::warn},
    {kDxCaptureLogError, spdlog::level::err},
    {kDxCaptureLogFatal, spdlog::level::critical},
};

// Hands each formatted line, without its line ending, to the user callback.
class CallbackSink : public spdlog::sinks::base_sink<std::mutex> {
 public:
  void SetCallback(dxcapture_log_callback_t callback, void* userdata) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = callback;
    userdata_ = userdata;
  }

 protected:
  void sink_it_(const spdlog::details::log_msg& msg) override {
    if (!callback_) return;
    spdlog::memory_buf_t formatted;
    formatter_->format(msg, formatted);
    size_t size = formatted.size();
    while (size > 0 &&
           (formatted[size - 1] == '\n' || formatted[size - 1] == '\r')) {
      --size;
    }
    const std::string line(formatted.data(), size);
    callback_(FromSpdlogLevel(msg.level), line.c_str(), userdata_);
  }

  void flush_() override {}

 private:
  dxcapture_log_callback_t callback_ = nullptr;
  void* userdata_ = nullptr;
};

struct Loggers {
  std::shared_ptr<CallbackSink> callback_sink;
  std::shared_ptr<spdlog::logger> library;
  std::shared_ptr<spdlog::logger> worker;
};

const Loggers& GetLoggers() {
  static const Loggers loggers = [] {
    Loggers l;
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    l.callback_sink = std::make_shared<CallbackSink>();
    spdlog::sinks_init_list sinks = {console, l.callback_sink};
    l.library = std::make_shared<spdlog::logger>("dxcapture", sinks);
    l.worker = std::make_shared<spdlog::logger>("dxcapture:worker", sinks);
    for (const auto& logger : {l.library, l.worker}) {
      logger->set_pattern(kPattern);
      logger->set_level(spdlog::level::info);
      logger->flush_on(spdlog::level::warn);
    }
    return l;
  }();
  return loggers;
}

}  // namespace

std::shared_ptr<spdlog::logger> GetLogger() { return GetLoggers().library; }

std::shared_ptr<spdlog::logger> GetWorkerLogger() {
  return GetLoggers().worker;
}

void SetLogLevel(DxCaptureLogLevel level) {
  const Loggers& loggers = GetLoggers();
  loggers.library->set_level(ToSpdlogLevel(level));
  loggers.worker->set_level(ToSpdlogLevel(level));
}

void SetLogCallback(dxcapture_log_callback_t callback, void* userdata) {
  GetLoggers().callback_sink->SetCallback(callback, userdata);
}

spdlog::level::level_enum ToSpdlogLevel(DxCaptureLogLevel level) {
  for (const LevelMapping& m : kLevels) {
    if (m.level == level) return m.spdlog_level;
  }
  return spdlog::level::info;
}

DxCaptureLogLevel FromSpdlogLevel(spdlog::level::level_enum level) {
  for (const LevelMapping& m : kLevels) {
    if (m.spdlog_level == level) return m.level;
  }
  return level == spdlog::level::off ? kDxCaptureLogFatal : kDxCaptureLogInfo;
}

}  // namespace internal
}  // namespace dxcapture
