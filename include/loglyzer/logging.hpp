#pragma once

#include <memory>

#include <spdlog/logger.h>

namespace loglyzer {

// Installs the stderr logger; `verbose` enables debug output.
void init_logging(bool verbose);

std::shared_ptr<spdlog::logger> logger();

}  // namespace loglyzer
