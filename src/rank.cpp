#include "loglyzer/rank.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace loglyzer {

std::vector<ErrorFrequency> select_top(const FrequencyTable& frequency, std::size_t n) {
  std::vector<ErrorFrequency> entries;
  entries.reserve(frequency.size());
  for (const auto& [message, count] : frequency) {
    entries.push_back(ErrorFrequency{message, count});
  }

  const auto cmp = [](const ErrorFrequency& lhs, const ErrorFrequency& rhs) {
    if (lhs.count != rhs.count) {
      return lhs.count > rhs.count;
    }
    return lhs.message < rhs.message;
  };

  const std::size_t limit = std::min(n, entries.size());
  if (limit == 0) {
    return {};
  }

  std::partial_sort(entries.begin(), entries.begin() + static_cast<std::ptrdiff_t>(limit), entries.end(), cmp);
  entries.resize(limit);
  return entries;
}

}  // namespace loglyzer
