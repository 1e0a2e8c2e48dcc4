#include "loglyzer/analyzer.hpp"

#include <fstream>
#include <istream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "loglyzer/aggregator.hpp"
#include "loglyzer/logging.hpp"
#include "loglyzer/parser.hpp"

namespace loglyzer {

AnalysisResult analyze(std::istream& lines, const AnalysisOptions& options) {
  // Resolve the renderer up front so a bad format fails before any work.
  const std::unique_ptr<Renderer> renderer = make_renderer(options.format);
  const FilterStage filter{options.criteria};
  const bool keep_details = options.include_details && options.format == OutputFormat::Text;
  auto log = logger();

  AnalysisResult result;
  Aggregator aggregator;
  std::vector<LogRecord> details;

  std::string line;
  while (std::getline(lines, line)) {
    ++result.lines_read;

    ParseOutcome outcome = parse_line(line);
    if (is_malformed(outcome)) {
      ++result.malformed_lines;
      log->debug("skipping malformed line {}: {}", result.lines_read, std::get<MalformedLine>(outcome).raw);
      continue;
    }

    LogRecord& record = std::get<LogRecord>(outcome);
    if (!filter.accepts(record)) {
      continue;
    }

    aggregator.add(record);
    if (keep_details) {
      details.push_back(std::move(record));
    }
  }

  if (lines.bad()) {
    throw std::runtime_error("failed while reading log input");
  }

  result.records_kept = aggregator.total();
  const Statistics stats = aggregator.statistics(options.top_n);
  result.rendered = renderer->render(stats, keep_details ? &details : nullptr);

  log->debug("lines read: {}, malformed: {}, records kept: {}", result.lines_read, result.malformed_lines,
             result.records_kept);
  return result;
}

AnalysisResult analyze_file(const std::string& path, const AnalysisOptions& options) {
  std::ifstream in(path, std::ios::in);
  if (!in.is_open()) {
    throw std::runtime_error("failed to open file: " + path);
  }
  return analyze(in, options);
}

}  // namespace loglyzer
