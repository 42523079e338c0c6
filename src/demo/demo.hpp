#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "hex/axial.hpp"
#include "map/tile.hpp"

#include <iosfwd>
#include <optional>
#include <vector>

namespace tilemap::demo {

/// Process exit status of tilemap_demo.
enum class ExitCode : int {
    Ok = 0,
    BadArgs = 1,
    NoPath = 2,
};

struct DemoConfig {
    i32 radius = 3;
    std::optional<hex::AxialCoords> from; // default (-radius, radius)
    std::optional<hex::AxialCoords> to;   // default (radius, -radius)
    std::vector<hex::AxialCoords> blocked;
    std::vector<hex::AxialCoords> road;
    map::Cost ground_cost = 1;
    fs::path log_file;
    bool verbose = false;
    bool show_help = false;
};

void print_usage(std::ostream& out);

/// Parse command line arguments. argv[0] is skipped. from/to are always
/// set in the returned config.
Result<DemoConfig> parse_args(int argc, const char* const argv[]);

/// Build the map described by config, search it and print the path to out.
/// Returns ExitCode::Ok or ExitCode::NoPath.
ExitCode run(const DemoConfig& config, std::ostream& out);

} // namespace tilemap::demo
