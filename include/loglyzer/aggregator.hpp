#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "loglyzer/rank.hpp"
#include "loglyzer/record.hpp"

namespace loglyzer {

struct Statistics {
  std::uint64_t total = 0;
  std::array<std::uint64_t, kLevelCount> counts_by_level{0, 0, 0, 0};
  std::vector<ErrorFrequency> top_errors;

  std::uint64_t count(LogLevel level) const { return counts_by_level[level_index(level)]; }
};

class Aggregator {
 public:
  void add(const LogRecord& record);

  std::uint64_t total() const { return total_; }
  const std::array<std::uint64_t, kLevelCount>& counts_by_level() const { return counts_by_level_; }
  const FrequencyTable& error_frequency() const { return error_frequency_; }

  Statistics statistics(std::size_t top_n) const;

 private:
  std::uint64_t total_ = 0;
  std::array<std::uint64_t, kLevelCount> counts_by_level_{0, 0, 0, 0};
  FrequencyTable error_frequency_;
};

}  // namespace loglyzer
