#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "loglyzer/aggregator.hpp"
#include "loglyzer/record.hpp"

namespace loglyzer {

enum class OutputFormat {
  Text,
  Json,
  Csv,
};

std::optional<OutputFormat> parse_format(std::string_view raw);
std::string_view format_name(OutputFormat format);

class Renderer {
 public:
  virtual ~Renderer() = default;

  // `details` may be null. Only the text renderer lists records.
  virtual std::string render(const Statistics& stats, const std::vector<LogRecord>* details) const = 0;
};

class TextRenderer : public Renderer {
 public:
  std::string render(const Statistics& stats, const std::vector<LogRecord>* details) const override;
};

class JsonRenderer : public Renderer {
 public:
  std::string render(const Statistics& stats, const std::vector<LogRecord>* details) const override;
};

// Rows: `section,key,count` header, a `total` row, one `level` row per level,
// one `top_error` row per ranked message.
class CsvRenderer : public Renderer {
 public:
  std::string render(const Statistics& stats, const std::vector<LogRecord>* details) const override;
};

std::unique_ptr<Renderer> make_renderer(OutputFormat format);

std::string escape_json_string(std::string_view value);
std::string escape_csv_field(std::string_view value);

}  // namespace loglyzer
