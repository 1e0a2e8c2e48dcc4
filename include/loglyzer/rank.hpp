#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace loglyzer {

using FrequencyTable = std::unordered_map<std::string, std::uint64_t>;

struct ErrorFrequency {
  std::string message;
  std::uint64_t count = 0;
};

// Top n entries ordered by count descending, then message ascending.
std::vector<ErrorFrequency> select_top(const FrequencyTable& frequency, std::size_t n);

}  // namespace loglyzer
