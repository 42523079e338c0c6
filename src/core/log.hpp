#pragma once

#include <filesystem>
#include <spdlog/spdlog.h>

namespace tilemap::log {

/// Install a console-only logger as the spdlog default.
void init();

/// Install a logger writing to the console and to log_file (truncated).
/// Throws spdlog::spdlog_ex if the file cannot be opened.
void init(const std::filesystem::path& log_file);

/// Change the level of the default logger.
void set_level(spdlog::level::level_enum level);

/// Flush and shutdown logging.
void shutdown();

} // namespace tilemap::log
