#pragma once

#include <optional>
#include <string>

#include "loglyzer/record.hpp"

namespace loglyzer {

struct FilterCriteria {
  bool errors_only = false;
  std::optional<std::string> search_term;
};

// Per-record predicate; the pipeline pulls records through it one at a time,
// so input order is kept and nothing is buffered.
class FilterStage {
 public:
  explicit FilterStage(FilterCriteria criteria);

  bool accepts(const LogRecord& record) const;
  bool active() const { return criteria_.errors_only || needle_.has_value(); }

 private:
  FilterCriteria criteria_;
  std::optional<std::string> needle_;
};

}  // namespace loglyzer
