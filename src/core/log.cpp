#include "core/log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace tilemap::log {

static constexpr const char* LOGGER_NAME = "tilemap";
static constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

static void install(std::vector<spdlog::sink_ptr> sinks) {
    auto logger = std::make_shared<spdlog::logger>(
        LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_pattern(LOG_PATTERN);
    logger->set_level(spdlog::level::info);

    // Re-initialising replaces the previous default logger
    spdlog::drop(LOGGER_NAME);
    spdlog::set_default_logger(logger);
}

void init() {
    install({std::make_shared<spdlog::sinks::stdout_color_sink_mt>()});
}

void init(const std::filesystem::path& log_file) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        log_file.string(), true);
    install({console_sink, file_sink});
    spdlog::info("Logging to {}", log_file.string());
}

void set_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

void shutdown() {
    spdlog::shutdown();
}

} // namespace tilemap::log
