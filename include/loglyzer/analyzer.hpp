#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

#include "loglyzer/filter.hpp"
#include "loglyzer/renderer.hpp"

namespace loglyzer {

struct AnalysisOptions {
  FilterCriteria criteria;
  std::size_t top_n = 5;
  OutputFormat format = OutputFormat::Text;
  bool include_details = false;
};

struct AnalysisResult {
  std::string rendered;
  std::uint64_t lines_read = 0;
  std::uint64_t malformed_lines = 0;
  std::uint64_t records_kept = 0;
};

// Single pass over `lines`: parse, filter, aggregate, rank, render.
AnalysisResult analyze(std::istream& lines, const AnalysisOptions& options);

// Throws std::runtime_error when the file cannot be opened or read.
AnalysisResult analyze_file(const std::string& path, const AnalysisOptions& options);

}  // namespace loglyzer
