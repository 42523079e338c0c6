#pragma once

#include "core/hash.hpp"
#include "core/types.hpp"

#include <array>
#include <iosfwd>

namespace tilemap::square {

/// Square grid coordinates. Each tile has 4 side neighbours and 8
/// neighbours in total once corners are counted.
struct SquareCoords {
    i32 x = 0;
    i32 y = 0;

    static constexpr SquareCoords splat(i32 v) { return {v, v}; }

    /// Side and corner neighbours (8). Diagonal steps cost the same as
    /// side steps when pathfinding.
    std::array<SquareCoords, 8> adjacent_coords() const;

    /// Side neighbours only (4).
    std::array<SquareCoords, 4> side_coords() const;

    /// Chebyshev distance: steps needed when diagonal moves are allowed.
    i32 distance(const SquareCoords& other) const;

    bool operator==(const SquareCoords&) const = default;

    SquareCoords operator+(const SquareCoords& o) const { return {x + o.x, y + o.y}; }
    SquareCoords operator-(const SquareCoords& o) const { return {x - o.x, y - o.y}; }
};

std::ostream& operator<<(std::ostream& os, const SquareCoords& c);

} // namespace tilemap::square

template <>
struct std::hash<tilemap::square::SquareCoords> {
    size_t operator()(const tilemap::square::SquareCoords& c) const noexcept {
        return tilemap::hash_components(c.x, c.y);
    }
};
