#include "loglyzer/renderer.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "loglyzer/text.hpp"

namespace loglyzer {
namespace {

using Row = std::vector<std::string>;

void write_rule(std::ostringstream& out, const std::vector<std::size_t>& widths) {
  out << '+';
  for (const std::size_t width : widths) {
    out << std::string(width + 2, '-') << '+';
  }
  out << '\n';
}

void write_row(std::ostringstream& out, const Row& row, const std::vector<std::size_t>& widths) {
  out << '|';
  for (std::size_t i = 0; i < widths.size(); ++i) {
    const std::string& cell = row[i];
    out << ' ' << cell << std::string(widths[i] - display_width(cell), ' ') << " |";
  }
  out << '\n';
}

// Boxed table with a header row; every row must have header.size() cells.
void write_table(std::ostringstream& out, const Row& header, const std::vector<Row>& rows) {
  std::vector<std::size_t> widths;
  widths.reserve(header.size());
  for (const std::string& cell : header) {
    widths.push_back(display_width(cell));
  }
  for (const Row& row : rows) {
    for (std::size_t i = 0; i < widths.size(); ++i) {
      widths[i] = std::max(widths[i], display_width(row[i]));
    }
  }

  write_rule(out, widths);
  write_row(out, header, widths);
  write_rule(out, widths);
  for (const Row& row : rows) {
    write_row(out, row, widths);
  }
  write_rule(out, widths);
}

void write_csv_row(std::ostringstream& out, std::string_view section, std::string_view key,
                   std::uint64_t count) {
  out << escape_csv_field(section) << ',' << escape_csv_field(key) << ',' << count << '\n';
}

}  // namespace

std::optional<OutputFormat> parse_format(std::string_view raw) {
  const std::string lower = to_lower_copy(raw);
  if (lower == "text") {
    return OutputFormat::Text;
  }
  if (lower == "json") {
    return OutputFormat::Json;
  }
  if (lower == "csv") {
    return OutputFormat::Csv;
  }
  return std::nullopt;
}

std::string_view format_name(OutputFormat format) {
  switch (format) {
    case OutputFormat::Text:
      return "text";
    case OutputFormat::Json:
      return "json";
    case OutputFormat::Csv:
      return "csv";
  }
  return "unknown";
}

std::string escape_json_string(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  std::size_t pos = 0;
  while (pos < value.size()) {
    const unsigned char ch = static_cast<unsigned char>(value[pos]);
    if (ch >= 0x80) {
      const std::size_t length = utf8_sequence_length(value, pos);
      if (length == 0) {
        out += "\\ufffd";
        ++pos;
      } else {
        out.append(value.substr(pos, length));
        pos += length;
      }
      continue;
    }

    ++pos;
    switch (ch) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (ch < 0x20) {
          char buffer[8];
          std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned int>(ch));
          out += buffer;
        } else {
          out.push_back(static_cast<char>(ch));
        }
    }
  }
  return out;
}

std::string escape_csv_field(std::string_view value) {
  if (value.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string{value};
  }

  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('"');
  for (const char ch : value) {
    if (ch == '"') {
      out.push_back('"');
    }
    out.push_back(ch);
  }
  out.push_back('"');
  return out;
}

std::string TextRenderer::render(const Statistics& stats, const std::vector<LogRecord>* details) const {
  std::ostringstream out;
  out << "Log Analysis Results\n";
  out << "====================\n";
  out << "Total entries: " << stats.total << "\n\n";

  std::vector<Row> level_rows;
  for (const LogLevel level : kAllLevels) {
    level_rows.push_back({std::string{level_name(level)}, std::to_string(stats.count(level))});
  }
  write_table(out, {"Level", "Count"}, level_rows);

  out << "\nTop errors:\n";
  if (stats.top_errors.empty()) {
    out << "(no errors)\n";
  } else {
    std::vector<Row> error_rows;
    for (std::size_t i = 0; i < stats.top_errors.size(); ++i) {
      const auto& entry = stats.top_errors[i];
      error_rows.push_back({std::to_string(i + 1), std::to_string(entry.count), entry.message});
    }
    write_table(out, {"Rank", "Count", "Message"}, error_rows);
  }

  if (details != nullptr) {
    out << "\nRecords:\n";
    if (details->empty()) {
      out << "(no records)\n";
    } else {
      std::vector<Row> record_rows;
      record_rows.reserve(details->size());
      for (const LogRecord& record : *details) {
        record_rows.push_back(
            {format_timestamp(record.timestamp), std::string{level_name(record.level)}, record.message});
      }
      write_table(out, {"Timestamp", "Level", "Message"}, record_rows);
    }
  }

  return out.str();
}

std::string JsonRenderer::render(const Statistics& stats, const std::vector<LogRecord>* /*details*/) const {
  std::ostringstream out;
  out << "{\n";
  out << "  \"total\": " << stats.total << ",\n";
  out << "  \"countsByLevel\": {\n";
  for (std::size_t i = 0; i < kAllLevels.size(); ++i) {
    const LogLevel level = kAllLevels[i];
    out << "    \"" << level_name(level) << "\": " << stats.count(level);
    if (i + 1 < kAllLevels.size()) {
      out << ',';
    }
    out << '\n';
  }
  out << "  },\n";

  if (stats.top_errors.empty()) {
    out << "  \"topErrors\": []\n";
  } else {
    out << "  \"topErrors\": [\n";
    for (std::size_t i = 0; i < stats.top_errors.size(); ++i) {
      const auto& entry = stats.top_errors[i];
      out << "    {\"message\": \"" << escape_json_string(entry.message) << "\", \"count\": " << entry.count
          << "}";
      if (i + 1 < stats.top_errors.size()) {
        out << ',';
      }
      out << '\n';
    }
    out << "  ]\n";
  }

  out << "}\n";
  return out.str();
}

std::string CsvRenderer::render(const Statistics& stats, const std::vector<LogRecord>* /*details*/) const {
  std::ostringstream out;
  out << "section,key,count\n";
  write_csv_row(out, "total", "", stats.total);
  for (const LogLevel level : kAllLevels) {
    write_csv_row(out, "level", level_name(level), stats.count(level));
  }
  for (const auto& entry : stats.top_errors) {
    write_csv_row(out, "top_error", entry.message, entry.count);
  }
  return out.str();
}

std::unique_ptr<Renderer> make_renderer(OutputFormat format) {
  switch (format) {
    case OutputFormat::Text:
      return std::make_unique<TextRenderer>();
    case OutputFormat::Json:
      return std::make_unique<JsonRenderer>();
    case OutputFormat::Csv:
      return std::make_unique<CsvRenderer>();
  }
  throw std::invalid_argument("unsupported output format");
}

}  // namespace loglyzer
