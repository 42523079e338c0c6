#include "core/log.hpp"
#include "demo/demo.hpp"

#include <iostream>
#include <spdlog/spdlog.h>

using tilemap::demo::ExitCode;

int main(int argc, char* argv[]) {
    auto parsed = tilemap::demo::parse_args(argc, argv);
    if (!parsed) {
        std::cerr << parsed.error().message << "\n\n";
        tilemap::demo::print_usage(std::cerr);
        return static_cast<int>(ExitCode::BadArgs);
    }
    const auto& config = parsed.value();
    if (config.show_help) {
        tilemap::demo::print_usage(std::cout);
        return static_cast<int>(ExitCode::Ok);
    }

    if (config.log_file.empty()) {
        tilemap::log::init();
    } else {
        try {
            tilemap::log::init(config.log_file);
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Cannot open log file " << config.log_file.string() << ": "
                      << e.what() << "\n";
            return static_cast<int>(ExitCode::BadArgs);
        }
    }
    if (config.verbose) tilemap::log::set_level(spdlog::level::debug);

    ExitCode code = tilemap::demo::run(config, std::cout);
    tilemap::log::shutdown();
    return static_cast<int>(code);
}
