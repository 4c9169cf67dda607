#include "logger.hpp"
#include "common/errors.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>

namespace MiniKV {

static std::mutex log_mutex;
static std::atomic<LogLevel> current_level{LogLevel::Info};

static const char *level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Debug:
    return "DEBUG";
  }
  return "UNKNOWN";
}

void set_log_level(LogLevel level) { current_level = level; }

LogLevel get_log_level() { return current_level; }

LogLevel parse_log_level(const std::string &level) {
  if (level == "error")
    return LogLevel::Error;
  if (level == "warn" || level == "warning")
    return LogLevel::Warn;
  if (level == "info")
    return LogLevel::Info;
  if (level == "debug")
    return LogLevel::Debug;
  throw ConfigError(std::format("unknown log level '{}'", level));
}

void log(LogLevel level, const std::string &message) {
  if (!log_enabled(level))
    return;

  std::time_t now = std::chrono::system_clock::to_time_t(
      std::chrono::system_clock::now());
  std::tm tm_buf{};
  localtime_r(&now, &tm_buf);

  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);

  std::lock_guard<std::mutex> lock(log_mutex);
  std::cerr << std::format("[{}] [{}] {}\n", ts, level_name(level), message);
}

} // namespace MiniKV
