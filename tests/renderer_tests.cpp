#include "loglyzer/renderer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace {

loglyzer::Statistics sample_stats() {
  loglyzer::Statistics stats;
  stats.total = 6;
  stats.counts_by_level = {3, 0, 3, 0};
  stats.top_errors = {{"disk full", 2}, {"bad \"quote\", comma", 1}};
  return stats;
}

}  // namespace

TEST_CASE("json output lists totals, levels and ranked errors", "[renderer]") {
  const loglyzer::JsonRenderer renderer;
  const std::string expected =
      "{\n"
      "  \"total\": 6,\n"
      "  \"countsByLevel\": {\n"
      "    \"INFO\": 3,\n"
      "    \"WARNING\": 0,\n"
      "    \"ERROR\": 3,\n"
      "    \"DEBUG\": 0\n"
      "  },\n"
      "  \"topErrors\": [\n"
      "    {\"message\": \"disk full\", \"count\": 2},\n"
      "    {\"message\": \"bad \\\"quote\\\", comma\", \"count\": 1}\n"
      "  ]\n"
      "}\n";

  REQUIRE(renderer.render(sample_stats(), nullptr) == expected);
}

TEST_CASE("json output for empty statistics uses an empty array", "[renderer]") {
  const loglyzer::JsonRenderer renderer;
  const std::string expected =
      "{\n"
      "  \"total\": 0,\n"
      "  \"countsByLevel\": {\n"
      "    \"INFO\": 0,\n"
      "    \"WARNING\": 0,\n"
      "    \"ERROR\": 0,\n"
      "    \"DEBUG\": 0\n"
      "  },\n"
      "  \"topErrors\": []\n"
      "}\n";

  REQUIRE(renderer.render(loglyzer::Statistics{}, nullptr) == expected);
}

TEST_CASE("json escaping covers control characters", "[renderer]") {
  REQUIRE(loglyzer::escape_json_string("a\\b\n\t\x01") == "a\\\\b\\n\\t\\u0001");
}

TEST_CASE("csv output has one row per fact with quoting", "[renderer]") {
  const loglyzer::CsvRenderer renderer;
  const std::string expected =
      "section,key,count\n"
      "total,,6\n"
      "level,INFO,3\n"
      "level,WARNING,0\n"
      "level,ERROR,3\n"
      "level,DEBUG,0\n"
      "top_error,disk full,2\n"
      "top_error,\"bad \"\"quote\"\", comma\",1\n";

  REQUIRE(renderer.render(sample_stats(), nullptr) == expected);
}

TEST_CASE("csv field escaping quotes newlines", "[renderer]") {
  REQUIRE(loglyzer::escape_csv_field("plain") == "plain");
  REQUIRE(loglyzer::escape_csv_field("two\nlines") == "\"two\nlines\"");
}

TEST_CASE("text output shows levels in stable order and top errors", "[renderer]") {
  const loglyzer::TextRenderer renderer;
  const std::string out = renderer.render(sample_stats(), nullptr);

  REQUIRE(out.find("Total entries: 6") != std::string::npos);
  const auto info = out.find("| INFO ");
  const auto warning = out.find("| WARNING ");
  const auto error = out.find("| ERROR ");
  const auto debug = out.find("| DEBUG ");
  REQUIRE(info != std::string::npos);
  REQUIRE(info < warning);
  REQUIRE(warning < error);
  REQUIRE(error < debug);
  REQUIRE(out.find("| 1    | 2     | disk full ") != std::string::npos);
  REQUIRE(out.find("Records:") == std::string::npos);
}

TEST_CASE("text output reports missing errors and lists details", "[renderer]") {
  loglyzer::LogRecord record;
  record.timestamp = loglyzer::Timestamp{2024, 1, 15, 10, 31, 15};
  record.level = loglyzer::LogLevel::Info;
  record.message = "Server started";
  const std::vector<loglyzer::LogRecord> details{record};

  const loglyzer::TextRenderer renderer;
  const std::string out = renderer.render(loglyzer::Statistics{}, &details);

  REQUIRE(out.find("(no errors)") != std::string::npos);
  REQUIRE(out.find("Records:") != std::string::npos);
  REQUIRE(out.find("| 2024-01-15 10:31:15 | INFO  | Server started |") != std::string::npos);
}

TEST_CASE("rendering is deterministic", "[renderer]") {
  for (const auto format : {loglyzer::OutputFormat::Text, loglyzer::OutputFormat::Json, loglyzer::OutputFormat::Csv}) {
    const auto renderer = loglyzer::make_renderer(format);
    REQUIRE(renderer->render(sample_stats(), nullptr) == renderer->render(sample_stats(), nullptr));
  }
}

TEST_CASE("format names parse case-insensitively", "[renderer]") {
  REQUIRE(loglyzer::parse_format("JSON") == loglyzer::OutputFormat::Json);
  REQUIRE(loglyzer::parse_format("csv") == loglyzer::OutputFormat::Csv);
  REQUIRE(loglyzer::parse_format("Text") == loglyzer::OutputFormat::Text);
  REQUIRE_FALSE(loglyzer::parse_format("xml").has_value());
}

TEST_CASE("json escaping replaces invalid utf-8 bytes", "[renderer]") {
  REQUIRE(loglyzer::escape_json_string("bad \xff\xfe byte") == "bad \\ufffd\\ufffd byte");
  REQUIRE(loglyzer::escape_json_string("caf\xc3\xa9") == "caf\xc3\xa9");
  REQUIRE(loglyzer::escape_json_string("cut \xe2\x82") == "cut \\ufffd\\ufffd");
}

TEST_CASE("json output stays ascii-safe for a message with invalid bytes", "[renderer]") {
  loglyzer::Statistics stats;
  stats.total = 1;
  stats.counts_by_level = {0, 0, 1, 0};
  stats.top_errors = {{"bad \xff\xfe byte", 1}};

  const loglyzer::JsonRenderer renderer;
  const std::string out = renderer.render(stats, nullptr);

  REQUIRE(out.find("{\"message\": \"bad \\ufffd\\ufffd byte\", \"count\": 1}") != std::string::npos);
  REQUIRE(out.find('\xff') == std::string::npos);
  REQUIRE(out.find('\xfe') == std::string::npos);
}

TEST_CASE("text table aligns multibyte messages by code point", "[renderer]") {
  loglyzer::Statistics stats;
  stats.total = 2;
  stats.counts_by_level = {0, 0, 2, 0};
  stats.top_errors = {{"caf\xc3\xa9 down", 1}, {"cafe down", 1}};

  const loglyzer::TextRenderer renderer;
  const std::string out = renderer.render(stats, nullptr);

  REQUIRE(out.find("| 1    | 1     | caf\xc3\xa9 down |") != std::string::npos);
  REQUIRE(out.find("| 2    | 1     | cafe down |") != std::string::npos);
}
