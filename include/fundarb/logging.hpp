// Funding Arb Engine - Logging
// Installs the process-wide spdlog logger

#pragma once

#include <fundarb/config.hpp>
#include <spdlog/common.h>
#include <string_view>

namespace fundarb {

// "trace" .. "critical"; throws ConfigError on an unknown name
spdlog::level::level_enum parse_log_level(std::string_view name);

// Console sink plus an optional rotating file sink, as the default logger
void init_logging(const GeneralConfig& config);

}  // namespace fundarb
