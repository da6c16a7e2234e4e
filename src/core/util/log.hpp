#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace hogpen::util {

enum class LogLevel {
  Debug,
  Info,
  Warn,
  Error,
};

using LogSink = std::function<void(LogLevel level, std::string_view line)>;

void set_log_level(LogLevel level);
[[nodiscard]] LogLevel log_level();
bool parse_log_level(std::string_view text, LogLevel& out);
std::string_view log_level_name(LogLevel level);

// An empty sink restores the default std::clog writer.
void set_log_sink(LogSink sink);

void log(LogLevel level, std::string_view component, std::string_view message);

inline void log_debug(std::string_view component, std::string_view message) {
  log(LogLevel::Debug, component, message);
}
inline void log_info(std::string_view component, std::string_view message) {
  log(LogLevel::Info, component, message);
}
inline void log_warn(std::string_view component, std::string_view message) {
  log(LogLevel::Warn, component, message);
}
inline void log_error(std::string_view component, std::string_view message) {
  log(LogLevel::Error, component, message);
}

}  // namespace hogpen::util
