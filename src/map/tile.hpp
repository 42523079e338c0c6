#pragma once

#include "core/types.hpp"

#include <concepts>
#include <limits>
#include <type_traits>
#include <utility>

namespace tilemap::map {

/// Traversal cost of a tile. Must be non-negative. Path costs are sums of
/// tile costs and need the extra width.
using Cost = i64;

static constexpr Cost DEFAULT_TILE_COST = 1;

/// Cost of moving onto tile. Tile types opt in by providing
/// `pathfind_cost() const` returning an integer type no wider than Cost;
/// any other type costs DEFAULT_TILE_COST.
/// Negative costs are a precondition violation and are not checked.
template <typename T>
Cost tile_cost(const T& tile) {
    if constexpr (requires { tile.pathfind_cost(); }) {
        using Raw = std::remove_cvref_t<decltype(tile.pathfind_cost())>;
        static_assert(std::integral<Raw> && !std::same_as<Raw, bool>,
                      "pathfind_cost() must return an integer");
        static_assert(std::cmp_less_equal(std::numeric_limits<Raw>::max(),
                                          std::numeric_limits<Cost>::max()),
                      "pathfind_cost() return type does not fit in Cost");
        return static_cast<Cost>(tile.pathfind_cost());
    } else {
        return DEFAULT_TILE_COST;
    }
}

/// Plain tile carrying only a movement cost.
struct WeightedTile {
    Cost cost = DEFAULT_TILE_COST;

    Cost pathfind_cost() const { return cost; }

    bool operator==(const WeightedTile&) const = default;
};

} // namespace tilemap::map
