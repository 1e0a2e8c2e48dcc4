#include "loglyzer/filter.hpp"

#include <utility>

#include "loglyzer/text.hpp"

namespace loglyzer {

FilterStage::FilterStage(FilterCriteria criteria) : criteria_(std::move(criteria)) {
  if (criteria_.search_term.has_value()) {
    needle_ = to_lower_copy(*criteria_.search_term);
  }
}

bool FilterStage::accepts(const LogRecord& record) const {
  if (criteria_.errors_only && record.level != LogLevel::Error) {
    return false;
  }
  if (needle_.has_value() && to_lower_copy(record.message).find(*needle_) == std::string::npos) {
    return false;
  }
  return true;
}

}  // namespace loglyzer
