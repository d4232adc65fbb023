// Funding Arb Engine - Logging Implementation

#include <fundarb/logging.hpp>
#include <fundarb/errors.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <vector>

namespace fundarb {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
constexpr size_t kMaxFileBytes = 10 * 1024 * 1024;
constexpr size_t kMaxFiles = 5;

}  // namespace

spdlog::level::level_enum parse_log_level(std::string_view name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    throw ConfigError("Unknown log level: " + std::string(name));
}

void init_logging(const GeneralConfig& config) {
    auto level = parse_log_level(config.log_level);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!config.log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file, kMaxFileBytes, kMaxFiles));
    }

    auto logger = std::make_shared<spdlog::logger>("fundarb", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern(kPattern);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    spdlog::info("Logging initialised at level {}", config.log_level);
}

}  // namespace fundarb
