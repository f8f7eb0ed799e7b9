#pragma once

#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace islr::core {

enum class LogLevel {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
  Off = 4,
};

/// Parses "debug", "info", "warn", "error", "off" (case-insensitive); Info otherwise.
[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

/// Thread-safe leveled logger writing "[HH:MM:SS.mmm] [LEVEL] message" to stderr.
/// Initial level comes from ISLR_LOG_LEVEL (default Info).
/// Avoid in per-timestep inner loops; one line per call is fine.
class Logger {
 public:
  static void set_level(LogLevel level) noexcept;
  [[nodiscard]] static LogLevel level() noexcept;
  [[nodiscard]] static bool enabled(LogLevel level) noexcept;

  static void log(LogLevel level, const std::string& message);

  template <typename... Args>
  static void debug(const Args&... args) {
    if (enabled(LogLevel::Debug)) log(LogLevel::Debug, concat(args...));
  }

  template <typename... Args>
  static void info(const Args&... args) {
    if (enabled(LogLevel::Info)) log(LogLevel::Info, concat(args...));
  }

  template <typename... Args>
  static void warn(const Args&... args) {
    if (enabled(LogLevel::Warn)) log(LogLevel::Warn, concat(args...));
  }

  template <typename... Args>
  static void error(const Args&... args) {
    if (enabled(LogLevel::Error)) log(LogLevel::Error, concat(args...));
  }

 private:
  template <typename... Args>
  static std::string concat(const Args&... args) {
    std::ostringstream ss;
    (ss << ... << args);
    return ss.str();
  }

  static std::mutex mutex_;
};

}  // namespace islr::core
