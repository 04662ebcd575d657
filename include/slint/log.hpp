// Copyright (c) 2024 liudegui. MIT License.
//
// slint logging -- one named spdlog logger shared by the ORM layer.
//
// Design:
//   - Logger "slint" writes to stderr; an application may register its own
//     "slint" logger in the spdlog registry before first use
//   - SetLogger() lets an application route ORM output into its own sinks
//   - Log() and SetLogger() are safe to call from several threads
//   - Drivers stay silent; Error values carry their failures upward

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace slint {

constexpr const char* kLoggerName = "slint";

namespace detail {

// Built once; not registered, so creating it never collides with the
// registry.
inline std::shared_ptr<spdlog::logger> DefaultLogger() {
  static const std::shared_ptr<spdlog::logger> logger = [] {
    std::shared_ptr<spdlog::logger> registered = spdlog::get(kLoggerName);
    if (registered != nullptr) { return registered; }
    return std::make_shared<spdlog::logger>(
        kLoggerName, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }();
  return logger;
}

struct LoggerSlot {
  std::mutex mutex;
  std::shared_ptr<spdlog::logger> logger;
};

inline LoggerSlot& Slot() {
  static LoggerSlot slot;
  return slot;
}

}  // namespace detail

/// Current ORM logger. The returned handle stays valid across SetLogger().
inline std::shared_ptr<spdlog::logger> Log() {
  detail::LoggerSlot& slot = detail::Slot();
  std::lock_guard<std::mutex> lock(slot.mutex);
  if (slot.logger == nullptr) { slot.logger = detail::DefaultLogger(); }
  return slot.logger;
}

/// Replaces the ORM logger. A null logger restores the default one.
inline void SetLogger(std::shared_ptr<spdlog::logger> logger) {
  detail::LoggerSlot& slot = detail::Slot();
  std::lock_guard<std::mutex> lock(slot.mutex);
  slot.logger = std::move(logger);
}

/// Applies a level name (trace, debug, info, warn, error, critical, off).
/// Empty names leave the current level alone.
inline void SetLogLevel(const std::string& level) {
  if (level.empty()) { return; }
  Log()->set_level(spdlog::level::from_str(level));
}

}  // namespace slint
