#include <catch2/catch_test_macros.hpp>

#include "hex/axial.hpp"
#include "map/pathfinder.hpp"
#include "map/tile.hpp"
#include "map/tile_map.hpp"
#include "square/square_coords.hpp"

#include <functional>
#include <optional>
#include <random>
#include <string>
#include <unordered_set>
#include <vector>

using namespace tilemap;
using namespace tilemap::map;
using tilemap::hex::AxialCoords;
using tilemap::square::SquareCoords;

namespace {

/// Tile with no pathfind_cost(), so it costs the default of 1.
struct EmptyTile {};

HexMap<EmptyTile> uniform_hex_map(i32 radius) {
    HexMap<EmptyTile> map;
    for (const auto& c : AxialCoords{}.area_coords(radius))
        map.insert(c, EmptyTile{});
    return map;
}

/// Exhaustive search over simple paths. Only usable on tiny maps.
template <typename C, typename T>
std::optional<Cost> brute_force_cost(const TileMap<C, T>& map, const C& start, const C& end) {
    std::optional<Cost> best;
    std::unordered_set<C> visited{start};

    std::function<void(const C&, Cost)> walk = [&](const C& cur, Cost cost) {
        if (best && cost >= *best) return;
        if (cur == end) {
            best = cost;
            return;
        }
        for (const C& adj : cur.adjacent_coords()) {
            const T* tile = map.get(adj);
            if (!tile || visited.contains(adj)) continue;
            visited.insert(adj);
            walk(adj, cost + tile_cost(*tile));
            visited.erase(adj);
        }
    };
    walk(start, 0);
    return best;
}

/// Check a found path against the exhaustive answer: endpoints, contiguity
/// and cost must all agree.
template <typename C, typename T>
void check_against_brute_force(const TileMap<C, T>& map, const C& start, const C& end) {
    Pathfinder<C> pathfinder;
    auto path = pathfinder.find_path(map, start, end);
    auto expected = brute_force_cost(map, start, end);

    REQUIRE(path.has_value() == expected.has_value());
    if (!path) {
        CHECK(pathfinder.last_stats().stop_reason == StopReason::Exhausted);
        return;
    }

    REQUIRE_FALSE(path->empty());
    CHECK(path->front() == start);
    CHECK(path->back() == end);

    auto cost = path_cost(map, *path);
    REQUIRE(cost.has_value());
    CHECK(*cost == *expected);
    CHECK(pathfinder.last_stats().path_cost == *expected);
    CHECK(pathfinder.last_stats().stop_reason == StopReason::Found);
}

} // namespace

// ================================================================
// Reference scenarios
// ================================================================

TEST_CASE("Uniform cost hex map finds a shortest path", "[pathfinder]") {
    auto map = uniform_hex_map(2);
    REQUIRE(map.count() == 19);

    Pathfinder<AxialCoords> pathfinder;
    auto path = pathfinder.find_path(map, {-2, 1}, {1, -1});

    REQUIRE(path.has_value());
    CHECK(path->size() == 4);
    CHECK(path->front() == AxialCoords{-2, 1});
    CHECK(path->back() == AxialCoords{1, -1});
    CHECK(path_cost(map, *path) == std::optional<Cost>(3));
    CHECK(pathfinder.last_stats().path_cost == 3);
}

TEST_CASE("Cheap road is preferred over expensive ground", "[pathfinder]") {
    const std::vector<AxialCoords> road = {
        {-2, 2}, {-2, 1}, {-1, 0}, {0, 0}, {0, 1}, {1, 1}, {2, 0}, {2, -1}, {2, -2},
    };

    HexMap<WeightedTile> map;
    for (const auto& c : AxialCoords{}.area_coords(3))
        map.insert(c, WeightedTile{5});
    for (const auto& c : road)
        map.insert(c, WeightedTile{1});

    auto path = find_path(map, {-2, 2}, {2, -2});

    REQUIRE(path.has_value());
    CHECK(path->size() == 9);
    CHECK(*path == road);
    CHECK(path_cost(map, *path) == std::optional<Cost>(8));
    // The straight route is only 4 steps but crosses ground
    CHECK(AxialCoords{-2, 2}.distance({2, -2}) == 4);
}

TEST_CASE("Start equals end on a single tile map", "[pathfinder]") {
    HexMap<EmptyTile> map;
    map.insert({3, -1}, EmptyTile{});

    Pathfinder<AxialCoords> pathfinder;
    auto path = pathfinder.find_path(map, {3, -1}, {3, -1});

    REQUIRE(path.has_value());
    CHECK(*path == std::vector<AxialCoords>{{3, -1}});
    CHECK(pathfinder.last_stats().path_cost == 0);
    CHECK(pathfinder.last_stats().nodes_explored == 0);
}

TEST_CASE("Disconnected regions have no path", "[pathfinder]") {
    HexMap<EmptyTile> map;
    map.insert({0, 0}, EmptyTile{});
    map.insert({5, -2}, EmptyTile{});

    Pathfinder<AxialCoords> pathfinder;
    CHECK_FALSE(pathfinder.find_path(map, {0, 0}, {5, -2}).has_value());
    CHECK(pathfinder.last_stats().stop_reason == StopReason::Exhausted);
    CHECK(pathfinder.last_stats().nodes_explored == 1);
}

// ================================================================
// Properties
// ================================================================

TEST_CASE("Trivial path needs no tile at the coordinate", "[pathfinder]") {
    HexMap<EmptyTile> empty;
    auto path = find_path(empty, {7, 7}, {7, 7});
    REQUIRE(path.has_value());
    CHECK(*path == std::vector<AxialCoords>{{7, 7}});

    SquareMap<WeightedTile> squares;
    squares.insert({0, 0}, WeightedTile{9});
    auto square_path = find_path(squares, {0, 0}, {0, 0});
    REQUIRE(square_path.has_value());
    CHECK(square_path->size() == 1);
}

TEST_CASE("Start without a tile is still searched from", "[pathfinder]") {
    HexMap<WeightedTile> map;
    map.insert({1, 0}, WeightedTile{3});
    map.insert({2, 0}, WeightedTile{4});

    Pathfinder<AxialCoords> pathfinder;
    auto path = pathfinder.find_path(map, {0, 0}, {2, 0});

    REQUIRE(path.has_value());
    CHECK(*path == std::vector<AxialCoords>{{0, 0}, {1, 0}, {2, 0}});
    CHECK(pathfinder.last_stats().path_cost == 7);

    // The start is never treated as a traversable tile on the way back
    CHECK_FALSE(find_path(map, {2, 0}, {0, 0}).has_value());
}

TEST_CASE("Missing end tile means no path", "[pathfinder]") {
    auto map = uniform_hex_map(2);
    CHECK_FALSE(find_path(map, {0, 0}, {3, 0}).has_value());
}

TEST_CASE("Uniform cost path length equals hop distance", "[pathfinder]") {
    SECTION("hex") {
        auto map = uniform_hex_map(3);
        Pathfinder<AxialCoords> pathfinder;
        auto coords = AxialCoords{}.area_coords(3);
        for (const auto& start : coords) {
            for (const auto& end : coords) {
                auto path = pathfinder.find_path(map, start, end);
                REQUIRE(path.has_value());
                CHECK(path->size() == static_cast<size_t>(start.distance(end)) + 1);
            }
        }
    }

    SECTION("square with diagonals") {
        SquareMap<EmptyTile> map;
        for (i32 x = 0; x < 5; ++x)
            for (i32 y = 0; y < 5; ++y)
                map.insert({x, y}, EmptyTile{});

        Pathfinder<SquareCoords> pathfinder;
        for (i32 x = 0; x < 5; ++x) {
            for (i32 y = 0; y < 5; ++y) {
                SquareCoords end{x, y};
                auto path = pathfinder.find_path(map, {0, 0}, end);
                REQUIRE(path.has_value());
                CHECK(path->size() == static_cast<size_t>(end.distance({0, 0})) + 1);
            }
        }
    }
}

TEST_CASE("Cheaper detour wins even with more steps", "[pathfinder]") {
    // 5x3 board: the two lower rows are expensive in the middle, the top
    // row is cheap. Going around costs 6 over 6 steps, going straight
    // costs 31 over 4 steps.
    SquareMap<WeightedTile> map;
    for (i32 x = 0; x < 5; ++x) {
        for (i32 y = 0; y < 3; ++y) {
            bool edge = x == 0 || x == 4 || y == 2;
            map.insert({x, y}, WeightedTile{edge ? 1 : 10});
        }
    }

    Pathfinder<SquareCoords> pathfinder;
    auto path = pathfinder.find_path(map, {0, 0}, {4, 0});

    REQUIRE(path.has_value());
    std::vector<SquareCoords> expected = {{0, 0}, {0, 1}, {1, 2}, {2, 2}, {3, 2}, {4, 1}, {4, 0}};
    CHECK(*path == expected);
    CHECK(pathfinder.last_stats().path_cost == 6);
}

TEST_CASE("Optimal cost matches exhaustive search", "[pathfinder]") {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<Cost> cost_dist(0, 5);
    std::bernoulli_distribution hole(0.25);

    SECTION("hex") {
        auto coords = AxialCoords{}.area_coords(2);
        std::uniform_int_distribution<size_t> pick(0, coords.size() - 1);
        for (int trial = 0; trial < 25; ++trial) {
            HexMap<WeightedTile> map;
            for (const auto& c : coords) {
                if (!hole(rng)) map.insert(c, WeightedTile{cost_dist(rng)});
            }
            for (int i = 0; i < 8; ++i)
                check_against_brute_force(map, coords[pick(rng)], coords[pick(rng)]);
        }
    }

    SECTION("square") {
        std::uniform_int_distribution<i32> pick_x(0, 3);
        std::uniform_int_distribution<i32> pick_y(0, 2);
        for (int trial = 0; trial < 25; ++trial) {
            SquareMap<WeightedTile> map;
            for (i32 x = 0; x < 4; ++x)
                for (i32 y = 0; y < 3; ++y)
                    if (!hole(rng)) map.insert({x, y}, WeightedTile{cost_dist(rng)});
            for (int i = 0; i < 8; ++i) {
                SquareCoords start{pick_x(rng), pick_y(rng)};
                SquareCoords end{pick_x(rng), pick_y(rng)};
                check_against_brute_force(map, start, end);
            }
        }
    }
}

TEST_CASE("Large tile costs accumulate without overflow", "[pathfinder]") {
    SECTION("cheaper of two expensive routes") {
        // Either route sums past the 32-bit range
        SquareMap<WeightedTile> map;
        map.insert({1, -1}, WeightedTile{2'000'000'000});
        map.insert({1, 1}, WeightedTile{1'900'000'000});
        map.insert({2, 0}, WeightedTile{200'000'000});

        Pathfinder<SquareCoords> pathfinder;
        auto path = pathfinder.find_path(map, {0, 0}, {2, 0});

        REQUIRE(path.has_value());
        CHECK(*path == std::vector<SquareCoords>{{0, 0}, {1, 1}, {2, 0}});
        CHECK(pathfinder.last_stats().path_cost == 2'100'000'000);
        CHECK(path_cost(map, *path) == std::optional<Cost>(2'100'000'000));
    }

    SECTION("long expensive corridor") {
        HexMap<WeightedTile> map;
        for (i32 q = 1; q <= 6; ++q)
            map.insert({q, 0}, WeightedTile{3'000'000'000});

        auto path = find_path(map, {0, 0}, {6, 0});
        REQUIRE(path.has_value());
        CHECK(path->size() == 7);
        CHECK(path_cost(map, *path) == std::optional<Cost>(18'000'000'000));
    }

    SECTION("matches exhaustive search") {
        std::mt19937 rng(99);
        std::uniform_int_distribution<Cost> cost_dist(1'000'000'000, 4'000'000'000);
        for (int trial = 0; trial < 10; ++trial) {
            SquareMap<WeightedTile> map;
            for (i32 x = 0; x < 3; ++x)
                for (i32 y = 0; y < 3; ++y)
                    map.insert({x, y}, WeightedTile{cost_dist(rng)});
            check_against_brute_force(map, SquareCoords{0, 0}, SquareCoords{2, 2});
            check_against_brute_force(map, SquareCoords{2, 0}, SquareCoords{0, 1});
        }
    }
}

TEST_CASE("Zero cost tiles are free to cross", "[pathfinder]") {
    HexMap<WeightedTile> map;
    for (const auto& c : AxialCoords{}.area_coords(2))
        map.insert(c, WeightedTile{0});
    map.insert({2, -2}, WeightedTile{3});

    Pathfinder<AxialCoords> pathfinder;
    auto path = pathfinder.find_path(map, {-2, 2}, {2, -2});
    REQUIRE(path.has_value());
    CHECK(pathfinder.last_stats().path_cost == 3);
    CHECK(path_cost(map, *path) == std::optional<Cost>(3));
}

// ================================================================
// Search state and options
// ================================================================

TEST_CASE("Pathfinder can be reused between searches", "[pathfinder]") {
    auto map = uniform_hex_map(2);
    map.insert({6, 0}, EmptyTile{});

    Pathfinder<AxialCoords> pathfinder;

    auto first = pathfinder.find_path(map, {-2, 1}, {1, -1});
    REQUIRE(first.has_value());
    CHECK(pathfinder.node({1, -1}) != nullptr);

    CHECK_FALSE(pathfinder.find_path(map, {0, 0}, {6, 0}).has_value());
    CHECK(pathfinder.node({6, 0}) == nullptr);
    CHECK(pathfinder.frontier_size() == 0);
    CHECK(pathfinder.finalized_size() == 19);

    auto again = pathfinder.find_path(map, {-2, 1}, {1, -1});
    REQUIRE(again.has_value());
    CHECK(*again == *first);

    const auto* start_node = pathfinder.node({-2, 1});
    REQUIRE(start_node != nullptr);
    CHECK(start_node->total_cost == 0);
    CHECK_FALSE(start_node->predecessor.has_value());
}

TEST_CASE("Predecessor chain follows the returned path", "[pathfinder]") {
    auto map = uniform_hex_map(3);
    Pathfinder<AxialCoords> pathfinder;
    auto path = pathfinder.find_path(map, {-3, 0}, {3, 0});
    REQUIRE(path.has_value());

    for (size_t i = 1; i < path->size(); ++i) {
        const auto* node = pathfinder.node((*path)[i]);
        REQUIRE(node != nullptr);
        REQUIRE(node->predecessor.has_value());
        CHECK(*node->predecessor == (*path)[i - 1]);
        CHECK(node->total_cost == static_cast<Cost>(i));
    }
}

TEST_CASE("Node limit stops the search", "[pathfinder]") {
    auto map = uniform_hex_map(10);

    SearchOptions options;
    options.max_nodes_explored = 5;

    Pathfinder<AxialCoords> pathfinder;
    CHECK_FALSE(pathfinder.find_path(map, {-10, 0}, {10, 0}, options).has_value());
    CHECK(pathfinder.last_stats().stop_reason == StopReason::NodeLimit);
    CHECK(pathfinder.last_stats().nodes_explored == 5);

    // A generous limit does not change the answer
    options.max_nodes_explored = 10'000;
    auto path = pathfinder.find_path(map, {-10, 0}, {10, 0}, options);
    REQUIRE(path.has_value());
    CHECK(path->size() == 21);
}

TEST_CASE("Cancellation hook stops the search", "[pathfinder]") {
    auto map = uniform_hex_map(6);

    int polls = 0;
    SearchOptions options;
    options.cancel = [&polls] { return ++polls > 3; };

    Pathfinder<AxialCoords> pathfinder;
    CHECK_FALSE(pathfinder.find_path(map, {-6, 0}, {6, 0}, options).has_value());
    CHECK(pathfinder.last_stats().stop_reason == StopReason::Cancelled);
    CHECK(pathfinder.last_stats().nodes_explored == 3);
    CHECK(polls == 4);
}

TEST_CASE("Stop reasons have names", "[pathfinder]") {
    CHECK(std::string(stop_reason_name(StopReason::Found)) == "Found");
    CHECK(std::string(stop_reason_name(StopReason::Exhausted)) == "Exhausted");
    CHECK(std::string(stop_reason_name(StopReason::NodeLimit)) == "NodeLimit");
    CHECK(std::string(stop_reason_name(StopReason::Cancelled)) == "Cancelled");
}

TEST_CASE("path_cost rejects broken paths", "[pathfinder]") {
    auto map = uniform_hex_map(1);
    CHECK(path_cost(map, std::vector<AxialCoords>{{0, 0}}) == std::optional<Cost>(0));
    CHECK(path_cost(map, std::vector<AxialCoords>{{0, 0}, {1, 0}}) == std::optional<Cost>(1));
    // Not adjacent
    CHECK_FALSE(path_cost(map, std::vector<AxialCoords>{{-1, 0}, {1, 0}}).has_value());
    // Off the map
    CHECK_FALSE(path_cost(map, std::vector<AxialCoords>{{1, 0}, {2, 0}}).has_value());
}
