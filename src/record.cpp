#include "loglyzer/record.hpp"

#include <cstdio>

namespace loglyzer {

std::optional<LogLevel> parse_level(std::string_view raw) {
  if (raw == "INFO") {
    return LogLevel::Info;
  }
  if (raw == "WARNING") {
    return LogLevel::Warning;
  }
  if (raw == "ERROR") {
    return LogLevel::Error;
  }
  if (raw == "DEBUG") {
    return LogLevel::Debug;
  }
  return std::nullopt;
}

std::string_view level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warning:
      return "WARNING";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Debug:
      return "DEBUG";
  }
  return "UNKNOWN";
}

std::string format_timestamp(const Timestamp& ts) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02d:%02d:%02d", ts.year, ts.month, ts.day, ts.hour,
                ts.minute, ts.second);
  return buffer;
}

}  // namespace loglyzer
