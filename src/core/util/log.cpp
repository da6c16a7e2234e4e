#include "core/util/log.hpp"

#include <atomic>
#include <ctime>
#include <iostream>
#include <mutex>

#include "core/util/canonical.hpp"

namespace hogpen::util {
namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_sink_mutex;
LogSink g_sink;

std::string utc_stamp() {
  const std::time_t now = static_cast<std::time_t>(unix_timestamp_now());
  std::tm tm{};
  gmtime_r(&now, &tm);
  char buffer[32] = {};
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buffer;
}

}  // namespace

void set_log_level(LogLevel level) {
  g_level.store(level);
}

LogLevel log_level() {
  return g_level.load();
}

bool parse_log_level(std::string_view text, LogLevel& out) {
  const std::string lowered = lowercase_copy(trim_copy(text));
  if (lowered == "debug") {
    out = LogLevel::Debug;
  } else if (lowered == "info") {
    out = LogLevel::Info;
  } else if (lowered == "warn" || lowered == "warning") {
    out = LogLevel::Warn;
  } else if (lowered == "error") {
    out = LogLevel::Error;
  } else {
    return false;
  }
  return true;
}

std::string_view log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
  }
  return "INFO";
}

void set_log_sink(LogSink sink) {
  std::lock_guard lock{g_sink_mutex};
  g_sink = std::move(sink);
}

void log(LogLevel level, std::string_view component, std::string_view message) {
  if (level < g_level.load()) {
    return;
  }

  std::string line = "[" + utc_stamp() + "] [" + std::string{log_level_name(level)} + "] [";
  line.append(component);
  line.append("] ");
  line.append(message);

  std::lock_guard lock{g_sink_mutex};
  if (g_sink) {
    g_sink(level, line);
    return;
  }
  std::clog << line << '\n';
}

}  // namespace hogpen::util
