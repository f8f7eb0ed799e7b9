#include <islr/core/logger.hpp>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace islr::core {

namespace {

LogLevel initial_level() {
  const char* env = std::getenv("ISLR_LOG_LEVEL");
  if (!env) return LogLevel::Info;
  return parse_log_level(env);
}

std::atomic<LogLevel>& current_level() {
  static std::atomic<LogLevel> level{initial_level()};
  return level;
}

const char* level_tag(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Off:
      break;
  }
  return "INFO";
}

}  // namespace

std::mutex Logger::mutex_;

LogLevel parse_log_level(std::string_view name) noexcept {
  std::string lower;
  lower.reserve(name.size());
  for (char c : name) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "debug") return LogLevel::Debug;
  if (lower == "warn" || lower == "warning") return LogLevel::Warn;
  if (lower == "error") return LogLevel::Error;
  if (lower == "off") return LogLevel::Off;
  return LogLevel::Info;
}

void Logger::set_level(LogLevel level) noexcept { current_level().store(level); }

LogLevel Logger::level() noexcept { return current_level().load(); }

bool Logger::enabled(LogLevel level) noexcept {
  return level != LogLevel::Off &&
         static_cast<int>(level) >= static_cast<int>(current_level().load());
}

void Logger::log(LogLevel level, const std::string& message) {
  if (!enabled(level)) return;

  const auto now = std::chrono::system_clock::now();
  const auto t = std::chrono::system_clock::to_time_t(now);
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
  std::tm tm{};
  localtime_r(&t, &tm);

  std::lock_guard lock(mutex_);
  std::cerr << '[' << std::put_time(&tm, "%H:%M:%S") << '.' << std::setfill('0')
            << std::setw(3) << ms.count() << "] [" << level_tag(level) << "] "
            << message << '\n';
}

}  // namespace islr::core
