#include "demo/demo.hpp"
#include "map/pathfinder.hpp"
#include "map/tile_map.hpp"

#include <cstdlib>
#include <cstring>
#include <ostream>
#include <sstream>
#include <string>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace tilemap::demo {

using hex::AxialCoords;

void print_usage(std::ostream& out) {
    out << "tilemap_demo\n"
        << "Find the cheapest path across a hexagonal map.\n\n"
        << "Usage:\n"
        << "  tilemap_demo [options]\n\n"
        << "Options:\n"
        << "  --radius <n>        Map radius around (0,0) (default: 3)\n"
        << "  --from <q,r>        Start tile (default: -radius,radius)\n"
        << "  --to <q,r>          End tile (default: radius,-radius)\n"
        << "  --block <q,r>       Remove a tile from the map (repeatable)\n"
        << "  --road <q,r>        Make a tile cost 1 (repeatable)\n"
        << "  --ground-cost <n>   Cost of every non-road tile (default: 1)\n"
        << "  --log <path>        Also write the log to a file\n"
        << "  --verbose           Enable debug logging\n"
        << "  --help              Show this help message\n";
}

static Result<i32> parse_int(const char* flag, const char* text, long min, long max) {
    char* end = nullptr;
    long val = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || val < min || val > max) {
        return Error(ErrorKind::InvalidArgument,
                     std::string("Invalid ") + flag + " value: " + text);
    }
    return static_cast<i32>(val);
}

Result<DemoConfig> parse_args(int argc, const char* const argv[]) {
    DemoConfig config;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;

        if (std::strcmp(arg, "--help") == 0) {
            config.show_help = true;
        } else if (std::strcmp(arg, "--verbose") == 0) {
            config.verbose = true;
        } else if (std::strcmp(arg, "--radius") == 0 && has_value) {
            auto radius = parse_int(arg, argv[++i], 0, 1000);
            if (!radius) return radius.error();
            config.radius = radius.value();
        } else if (std::strcmp(arg, "--ground-cost") == 0 && has_value) {
            auto cost = parse_int(arg, argv[++i], 0, 1'000'000);
            if (!cost) return cost.error();
            config.ground_cost = cost.value();
        } else if (std::strcmp(arg, "--log") == 0 && has_value) {
            config.log_file = argv[++i];
        } else if ((std::strcmp(arg, "--from") == 0 || std::strcmp(arg, "--to") == 0 ||
                    std::strcmp(arg, "--block") == 0 || std::strcmp(arg, "--road") == 0) &&
                   has_value) {
            auto coords = hex::parse_axial(argv[++i]);
            if (!coords) return coords.error();

            if (std::strcmp(arg, "--from") == 0) config.from = coords.value();
            else if (std::strcmp(arg, "--to") == 0) config.to = coords.value();
            else if (std::strcmp(arg, "--block") == 0) config.blocked.push_back(coords.value());
            else config.road.push_back(coords.value());
        } else {
            return Error(ErrorKind::InvalidArgument,
                         std::string("Unknown or incomplete option: ") + arg);
        }
    }

    if (!config.from) config.from = AxialCoords{-config.radius, config.radius};
    if (!config.to) config.to = AxialCoords{config.radius, -config.radius};
    return config;
}

static std::string format_path(const std::vector<AxialCoords>& path) {
    std::ostringstream out;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) out << " -> ";
        out << path[i];
    }
    return out.str();
}

ExitCode run(const DemoConfig& config, std::ostream& out) {
    const AxialCoords from = config.from.value_or(AxialCoords{-config.radius, config.radius});
    const AxialCoords to = config.to.value_or(AxialCoords{config.radius, -config.radius});

    const std::unordered_set<AxialCoords> blocked(config.blocked.begin(), config.blocked.end());
    const std::unordered_set<AxialCoords> road(config.road.begin(), config.road.end());

    map::HexMap<map::WeightedTile> tiles;
    size_t blocked_count = 0;
    for (const auto& coords : AxialCoords{}.area_coords(config.radius)) {
        // Blocking wins over road
        if (blocked.contains(coords)) {
            ++blocked_count;
            continue;
        }
        tiles.insert(coords, {road.contains(coords) ? map::Cost{1} : config.ground_cost});
    }
    for (const auto& coords : road) {
        if (coords.distance(AxialCoords{}) > config.radius)
            spdlog::warn("Road tile {},{} is outside the map, ignored", coords.q, coords.r);
    }

    spdlog::info("Map: radius {}, {} tiles ({} blocked)", config.radius, tiles.count(),
                 blocked_count);

    map::Pathfinder<AxialCoords> pathfinder;
    auto path = pathfinder.find_path(tiles, from, to);
    const auto& stats = pathfinder.last_stats();

    if (!path) {
        spdlog::error("No path from {},{} to {},{} ({}, {} nodes explored)", from.q, from.r,
                      to.q, to.r, map::stop_reason_name(stats.stop_reason),
                      stats.nodes_explored);
        return ExitCode::NoPath;
    }

    spdlog::info("Path: {} tiles, cost {}, {} nodes explored", path->size(), stats.path_cost,
                 stats.nodes_explored);
    out << format_path(*path) << "\n";
    return ExitCode::Ok;
}

} // namespace tilemap::demo
