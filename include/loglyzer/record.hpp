#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace loglyzer {

enum class LogLevel {
  Info = 0,
  Warning = 1,
  Error = 2,
  Debug = 3,
};

inline constexpr std::size_t kLevelCount = 4;

// Stable presentation order used by every renderer.
inline constexpr std::array<LogLevel, kLevelCount> kAllLevels{
    LogLevel::Info, LogLevel::Warning, LogLevel::Error, LogLevel::Debug};

std::optional<LogLevel> parse_level(std::string_view raw);
std::string_view level_name(LogLevel level);

inline std::size_t level_index(LogLevel level) { return static_cast<std::size_t>(level); }

// Wall-clock time as written in the log, no timezone attached.
struct Timestamp {
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
};

std::string format_timestamp(const Timestamp& ts);

struct LogRecord {
  Timestamp timestamp;
  LogLevel level = LogLevel::Info;
  std::string message;
};

}  // namespace loglyzer
