#pragma once

#include <format>
#include <string>
#include <utility>

namespace MiniKV {

enum class LogLevel {
  Error = 0,
  Warn = 1,
  Info = 2,
  Debug = 3,
};

void set_log_level(LogLevel level);
LogLevel get_log_level();
// throws ConfigError on an unknown level name
LogLevel parse_log_level(const std::string &level);
void log(LogLevel level, const std::string &message);

inline bool log_enabled(LogLevel level) {
  return static_cast<int>(level) <= static_cast<int>(get_log_level());
}

template <typename... Args>
void log_error(std::format_string<Args...> fmt, Args &&...args) {
  log(LogLevel::Error, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void log_warn(std::format_string<Args...> fmt, Args &&...args) {
  if (log_enabled(LogLevel::Warn))
    log(LogLevel::Warn, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void log_info(std::format_string<Args...> fmt, Args &&...args) {
  if (log_enabled(LogLevel::Info))
    log(LogLevel::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void log_debug(std::format_string<Args...> fmt, Args &&...args) {
  if (log_enabled(LogLevel::Debug))
    log(LogLevel::Debug, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace MiniKV
