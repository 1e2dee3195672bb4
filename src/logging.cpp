#include "logging.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace quotadash {

void init_logging(const Config& config) {
    std::shared_ptr<spdlog::logger> logger;
    if (config.snapshot_mode) {
        logger = spdlog::stderr_color_mt("quotadash");
    } else {
        logger = spdlog::basic_logger_mt("quotadash", config.log_file);
    }

    auto level = spdlog::level::from_str(config.log_level);
    // from_str maps unknown names to off
    const bool unknown_level = level == spdlog::level::off && config.log_level != "off";
    if (unknown_level) level = spdlog::level::info;

    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (unknown_level) {
        spdlog::warn("unknown log level '{}', using info", config.log_level);
    }
    for (const auto& warning : config.warnings) {
        spdlog::warn("config: {}", warning);
    }
}

} // namespace quotadash
