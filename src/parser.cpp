#include "loglyzer/parser.hpp"

#include <cctype>
#include <cstddef>
#include <optional>
#include <utility>

namespace loglyzer {
namespace {

// `YYYY-MM-DD HH:MM:SS ` followed by `[`.
constexpr std::size_t kTimestampLength = 19;
constexpr std::size_t kLevelOpenPos = kTimestampLength + 1;

bool parse_fixed_int(std::string_view input, std::size_t pos, std::size_t len, int& value) {
  if (pos + len > input.size()) {
    return false;
  }

  int out = 0;
  for (std::size_t i = 0; i < len; ++i) {
    const unsigned char ch = static_cast<unsigned char>(input[pos + i]);
    if (std::isdigit(ch) == 0) {
      return false;
    }
    out = out * 10 + (ch - static_cast<unsigned char>('0'));
  }

  value = out;
  return true;
}

bool is_leap_year(int year) {
  if (year % 400 == 0) {
    return true;
  }
  if (year % 100 == 0) {
    return false;
  }
  return year % 4 == 0;
}

int days_in_month(int year, int month) {
  static constexpr int kDaysByMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) {
    return 0;
  }
  if (month == 2 && is_leap_year(year)) {
    return 29;
  }
  return kDaysByMonth[month - 1];
}

std::string_view trim(std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && std::isspace(static_cast<unsigned char>(input[start])) != 0) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
    --end;
  }

  return input.substr(start, end - start);
}

std::optional<Timestamp> parse_timestamp(std::string_view input) {
  if (input.size() < kTimestampLength) {
    return std::nullopt;
  }

  if (input[4] != '-' || input[7] != '-' || input[10] != ' ' || input[13] != ':' || input[16] != ':') {
    return std::nullopt;
  }

  Timestamp ts;
  if (!parse_fixed_int(input, 0, 4, ts.year) || !parse_fixed_int(input, 5, 2, ts.month) ||
      !parse_fixed_int(input, 8, 2, ts.day) || !parse_fixed_int(input, 11, 2, ts.hour) ||
      !parse_fixed_int(input, 14, 2, ts.minute) || !parse_fixed_int(input, 17, 2, ts.second)) {
    return std::nullopt;
  }

  if (ts.month < 1 || ts.month > 12) {
    return std::nullopt;
  }
  if (ts.day < 1 || ts.day > days_in_month(ts.year, ts.month)) {
    return std::nullopt;
  }
  if (ts.hour > 23 || ts.minute > 59 || ts.second > 59) {
    return std::nullopt;
  }

  return ts;
}

ParseOutcome malformed(std::string_view line) { return MalformedLine{std::string{line}}; }

}  // namespace

ParseOutcome parse_line(std::string_view line) {
  const auto timestamp = parse_timestamp(line);
  if (!timestamp.has_value()) {
    return malformed(line);
  }

  if (line.size() <= kLevelOpenPos || line[kTimestampLength] != ' ' || line[kLevelOpenPos] != '[') {
    return malformed(line);
  }

  const std::size_t close = line.find(']', kLevelOpenPos + 1);
  if (close == std::string_view::npos) {
    return malformed(line);
  }

  const auto level = parse_level(line.substr(kLevelOpenPos + 1, close - kLevelOpenPos - 1));
  if (!level.has_value()) {
    return malformed(line);
  }

  // Exactly one separator after the closing bracket; the message may be empty.
  if (close + 1 >= line.size() || line[close + 1] != ' ') {
    return malformed(line);
  }

  LogRecord record;
  record.timestamp = *timestamp;
  record.level = *level;
  record.message = std::string{trim(line.substr(close + 2))};
  return record;
}

}  // namespace loglyzer
