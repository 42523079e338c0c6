#pragma once

#include "hex/axial.hpp"
#include "square/square_coords.hpp"

#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tilemap::map {

/// Sparse map of tiles keyed by coordinate. Any coordinate without a tile
/// is off the map (and untraversable).
///
/// C must be equality comparable, have a std::hash specialisation and
/// provide adjacent_coords(). Not synchronised: concurrent readers are fine
/// as long as nobody writes.
template <typename C, typename T>
class TileMap {
public:
    /// Tile at coords, or nullptr if there is none.
    const T* get(const C& coords) const {
        auto it = tiles_.find(coords);
        return it == tiles_.end() ? nullptr : &it->second;
    }

    T* get_mut(const C& coords) {
        auto it = tiles_.find(coords);
        return it == tiles_.end() ? nullptr : &it->second;
    }

    /// Place tile at coords. Returns the tile it replaced, if any.
    std::optional<T> insert(const C& coords, T tile) {
        auto it = tiles_.find(coords);
        if (it == tiles_.end()) {
            tiles_.emplace(coords, std::move(tile));
            return std::nullopt;
        }
        std::optional<T> previous(std::move(it->second));
        it->second = std::move(tile);
        return previous;
    }

    bool contains(const C& coords) const { return tiles_.contains(coords); }

    /// Number of tiles.
    size_t count() const { return tiles_.size(); }
    bool empty() const { return tiles_.empty(); }

    /// Tiles stored next to coords (missing neighbours are skipped).
    std::vector<const T*> get_adjacent(const C& coords) const {
        std::vector<const T*> result;
        for (const auto& adj : coords.adjacent_coords()) {
            if (const T* tile = get(adj))
                result.push_back(tile);
        }
        return result;
    }

    template <typename F>
    void for_each(F&& fn) const {
        for (const auto& [coords, tile] : tiles_)
            fn(coords, tile);
    }

private:
    std::unordered_map<C, T> tiles_;
};

/// Tile map using axial hexagonal coordinates.
template <typename T>
using HexMap = TileMap<hex::AxialCoords, T>;

template <typename T>
using SquareMap = TileMap<square::SquareCoords, T>;

} // namespace tilemap::map
