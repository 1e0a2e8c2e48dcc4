#include "loglyzer/aggregator.hpp"

namespace loglyzer {

void Aggregator::add(const LogRecord& record) {
  ++total_;
  ++counts_by_level_[level_index(record.level)];

  if (record.level == LogLevel::Error) {
    ++error_frequency_[record.message];
  }
}

Statistics Aggregator::statistics(std::size_t top_n) const {
  Statistics stats;
  stats.total = total_;
  stats.counts_by_level = counts_by_level_;
  stats.top_errors = select_top(error_frequency_, top_n);
  return stats;
}

}  // namespace loglyzer
