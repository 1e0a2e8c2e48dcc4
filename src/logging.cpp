#include "loglyzer/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace loglyzer {
namespace {

constexpr const char* kLoggerName = "loglyzer";

}  // namespace

void init_logging(bool verbose) {
  auto log = logger();
  log->set_pattern("[%l] %v");
  log->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

std::shared_ptr<spdlog::logger> logger() {
  if (auto existing = spdlog::get(kLoggerName)) {
    return existing;
  }
  auto created = spdlog::stderr_color_mt(kLoggerName);
  created->set_level(spdlog::level::warn);
  return created;
}

}  // namespace loglyzer
