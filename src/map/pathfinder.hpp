#pragma once

#include "core/types.hpp"
#include "map/tile.hpp"
#include "map/tile_map.hpp"

#include <algorithm>
#include <cassert>
#include <functional>
#include <optional>
#include <queue>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <spdlog/spdlog.h>

namespace tilemap::map {

enum class StopReason : u8 {
    Found,     // end was reached
    Exhausted, // frontier ran dry, end is unreachable
    NodeLimit, // SearchOptions::max_nodes_explored was hit
    Cancelled, // SearchOptions::cancel returned true
};

const char* stop_reason_name(StopReason reason);

struct SearchOptions {
    /// Give up after expanding this many coordinates. 0 means no limit.
    u32 max_nodes_explored = 0;

    /// Polled once per expanded coordinate. Returning true abandons the
    /// search, which then reports no path.
    std::function<bool()> cancel;
};

struct SearchStats {
    u32 nodes_explored = 0;   // coordinates expanded (finalized)
    u32 nodes_discovered = 0; // coordinates given a node, start excluded
    Cost path_cost = 0;       // valid when stop_reason == Found
    StopReason stop_reason = StopReason::Exhausted;
};

/// Best known route to one coordinate during a search.
template <typename C>
struct PathfindNode {
    Cost total_cost = 0;
    std::optional<C> predecessor; // empty only for the start node
};

/// Uniform-cost (Dijkstra) search over a TileMap.
///
/// Moving from a tile onto a neighbour costs the neighbour's tile_cost(), so
/// the cost of a path is the sum of its tiles' costs excluding the start.
/// Neighbours come from C::adjacent_coords() and only coordinates holding a
/// tile are traversable; the start itself needs no tile.
///
/// Search state lives in the instance and is reset by every find_path()
/// call, so one Pathfinder can be reused but must not be shared between
/// threads. Distinct instances may search the same map concurrently while
/// the map is not being modified.
template <typename C>
class Pathfinder {
public:
    /// Minimum-cost path from start to end, both included, or nullopt when
    /// end cannot be reached (or the search was stopped by options).
    /// Among equal-cost paths the first one discovered wins.
    template <typename T>
    std::optional<std::vector<C>> find_path(const TileMap<C, T>& map,
                                            const C& start, const C& end,
                                            const SearchOptions& options = {});

    /// Statistics of the most recent find_path() call.
    const SearchStats& last_stats() const { return stats_; }

    /// Node left behind by the most recent search, nullptr if the
    /// coordinate was never discovered.
    const PathfindNode<C>* node(const C& coords) const {
        auto it = nodes_.find(coords);
        return it == nodes_.end() ? nullptr : &it->second;
    }

    size_t frontier_size() const { return frontier_.size(); }
    size_t finalized_size() const { return finalized_.size(); }

private:
    struct FrontierEntry {
        Cost cost;
        u64 order; // insertion sequence, breaks cost ties first-come
        C coords;
    };

    struct EntryAfter {
        bool operator()(const FrontierEntry& a, const FrontierEntry& b) const {
            if (a.cost != b.cost) return a.cost > b.cost;
            return a.order > b.order;
        }
    };

    void reset(const C& start);
    void push(const C& coords, Cost cost);
    std::optional<C> pop_cheapest();
    std::vector<C> reconstruct(const C& end) const;
    const PathfindNode<C>& node_at(const C& coords) const;

    std::unordered_set<C> frontier_;
    std::unordered_set<C> finalized_;
    std::unordered_map<C, PathfindNode<C>> nodes_;
    // May hold stale entries for relaxed or finalized coordinates; those
    // are skipped when popped.
    std::priority_queue<FrontierEntry, std::vector<FrontierEntry>, EntryAfter> queue_;
    u64 next_order_ = 0;
    SearchStats stats_;
};

template <typename C>
template <typename T>
std::optional<std::vector<C>> Pathfinder<C>::find_path(const TileMap<C, T>& map,
                                                       const C& start, const C& end,
                                                       const SearchOptions& options) {
    reset(start);
    C current = start;

    while (true) {
        if (current == end) {
            stats_.path_cost = node_at(end).total_cost;
            stats_.stop_reason = StopReason::Found;
            return reconstruct(end);
        }

        if (options.cancel && options.cancel()) {
            stats_.stop_reason = StopReason::Cancelled;
            spdlog::debug("Pathfinder: search cancelled after {} nodes",
                          stats_.nodes_explored);
            return std::nullopt;
        }
        if (options.max_nodes_explored != 0 &&
            stats_.nodes_explored >= options.max_nodes_explored) {
            stats_.stop_reason = StopReason::NodeLimit;
            spdlog::debug("Pathfinder: hit search limit ({} nodes)",
                          options.max_nodes_explored);
            return std::nullopt;
        }

        frontier_.erase(current);
        finalized_.insert(current);
        ++stats_.nodes_explored;

        const Cost base_cost = node_at(current).total_cost;

        for (const C& adj : current.adjacent_coords()) {
            const T* tile = map.get(adj);
            if (!tile) continue; // off the map

            // Finalized nodes are never reopened. This is only sound
            // because tile costs are non-negative: nothing found later can
            // undercut a settled cost.
            if (finalized_.contains(adj)) continue;

            const Cost candidate = base_cost + tile_cost(*tile);
            auto it = nodes_.find(adj);
            if (it == nodes_.end()) {
                nodes_.emplace(adj, PathfindNode<C>{candidate, current});
                frontier_.insert(adj);
                push(adj, candidate);
                ++stats_.nodes_discovered;
            } else if (candidate < it->second.total_cost) {
                it->second.total_cost = candidate;
                it->second.predecessor = current;
                push(adj, candidate);
            }
        }

        auto next = pop_cheapest();
        if (!next) {
            stats_.stop_reason = StopReason::Exhausted;
            spdlog::debug("Pathfinder: no path, frontier exhausted after {} nodes",
                          stats_.nodes_explored);
            return std::nullopt;
        }
        current = *next;
    }
}

template <typename C>
void Pathfinder<C>::reset(const C& start) {
    frontier_.clear();
    finalized_.clear();
    nodes_.clear();
    queue_ = decltype(queue_)();
    next_order_ = 0;
    stats_ = SearchStats{};

    nodes_.emplace(start, PathfindNode<C>{0, std::nullopt});
}

template <typename C>
void Pathfinder<C>::push(const C& coords, Cost cost) {
    queue_.push(FrontierEntry{cost, next_order_++, coords});
}

template <typename C>
std::optional<C> Pathfinder<C>::pop_cheapest() {
    while (!queue_.empty()) {
        FrontierEntry entry = queue_.top();
        queue_.pop();

        if (finalized_.contains(entry.coords)) continue;
        if (entry.cost != node_at(entry.coords).total_cost) continue; // relaxed since

        assert(frontier_.contains(entry.coords) && "queued coordinate left the frontier");
        return entry.coords;
    }
    return std::nullopt;
}

template <typename C>
std::vector<C> Pathfinder<C>::reconstruct(const C& end) const {
    std::vector<C> path;
    std::optional<C> cur = end;
    while (cur) {
        path.push_back(*cur);
        cur = node_at(*cur).predecessor;
    }
    std::reverse(path.begin(), path.end());
    return path;
}

template <typename C>
const PathfindNode<C>& Pathfinder<C>::node_at(const C& coords) const {
    auto it = nodes_.find(coords);
    // Every coordinate reachable through the frontier or a predecessor
    // chain has a node; anything else is a bookkeeping bug.
    assert(it != nodes_.end() && "pathfinder node missing");
    return it->second;
}

/// One-shot search with a temporary Pathfinder.
template <typename C, typename T>
std::optional<std::vector<C>> find_path(const TileMap<C, T>& map,
                                        const std::type_identity_t<C>& start,
                                        const std::type_identity_t<C>& end,
                                        const SearchOptions& options = {}) {
    Pathfinder<C> pathfinder;
    return pathfinder.find_path(map, start, end, options);
}

/// Cost of walking path on map: the sum of tile costs of every coordinate
/// after the first. Returns nullopt if a step is not between adjacent
/// coordinates or lands where there is no tile.
template <typename C, typename T>
std::optional<Cost> path_cost(const TileMap<C, T>& map, const std::vector<C>& path) {
    Cost total = 0;
    for (size_t i = 1; i < path.size(); ++i) {
        const auto adjacent = path[i - 1].adjacent_coords();
        if (std::find(adjacent.begin(), adjacent.end(), path[i]) == adjacent.end())
            return std::nullopt;

        const T* tile = map.get(path[i]);
        if (!tile) return std::nullopt;
        total += tile_cost(*tile);
    }
    return total;
}

} // namespace tilemap::map
