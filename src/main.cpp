#include <CLI/CLI.hpp>

#include <cstddef>
#include <exception>
#include <iostream>
#include <string>

#include "loglyzer/analyzer.hpp"
#include "loglyzer/logging.hpp"

int main(int argc, char** argv) {
  CLI::App app{"loglyzer: analyze log files and extract patterns"};
  app.set_version_flag("--version", "loglyzer 1.0");

  loglyzer::AnalysisOptions options;
  std::string input;
  std::string format_raw = "text";
  std::string search_raw;
  bool verbose = false;

  app.add_option("FILE", input, "Path to the log file to analyze.")->required()->check(CLI::ExistingFile);
  app.add_option("-f,--format", format_raw, "Output format: text|json|csv.")
      ->default_val("text")
      ->check(CLI::IsMember({"text", "json", "csv"}, CLI::ignore_case));
  app.add_flag("-e,--errors-only", options.criteria.errors_only, "Keep only ERROR-level records.");
  app.add_flag("-v,--verbose", verbose, "Report configuration and skipped lines on stderr.");
  app.add_option("--top", options.top_n, "Show the top N most frequent errors.")
      ->default_val(5)
      ->check(CLI::NonNegativeNumber);
  auto* search_opt = app.add_option("--search", search_raw, "Keep records whose message contains TEXT (case-insensitive).");
  app.add_flag("--details", options.include_details, "List the matching records (text format only).");

  CLI11_PARSE(app, argc, argv);

  loglyzer::init_logging(verbose);
  auto log = loglyzer::logger();

  if (search_opt->count() > 0) {
    options.criteria.search_term = search_raw;
  }
  const auto format = loglyzer::parse_format(format_raw);
  if (!format.has_value()) {
    log->error("invalid --format value: {}", format_raw);
    return 1;
  }
  options.format = *format;

  log->info("analysing file: {}", input);
  log->info("format: {}", loglyzer::format_name(options.format));
  log->info("top errors: {}", options.top_n);
  log->info("search filter: {}", options.criteria.search_term.value_or("<none>"));

  try {
    const loglyzer::AnalysisResult result = loglyzer::analyze_file(input, options);
    if (result.malformed_lines > 0) {
      log->info("skipped {} malformed line(s) of {}", result.malformed_lines, result.lines_read);
    }
    std::cout << result.rendered;
  } catch (const std::exception& ex) {
    log->error("{}", ex.what());
    return 1;
  }

  return 0;
}
