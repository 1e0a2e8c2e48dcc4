#pragma once

#include <string>
#include <string_view>
#include <variant>

#include "loglyzer/record.hpp"

namespace loglyzer {

struct MalformedLine {
  std::string raw;
};

using ParseOutcome = std::variant<LogRecord, MalformedLine>;

// Matches `YYYY-MM-DD HH:MM:SS [LEVEL] message` anchored at both ends.
// Level tokens are case-sensitive; the message is trimmed and may be empty.
ParseOutcome parse_line(std::string_view line);

inline bool is_malformed(const ParseOutcome& outcome) {
  return std::holds_alternative<MalformedLine>(outcome);
}

}  // namespace loglyzer
