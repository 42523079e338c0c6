#pragma once

#include "core/hash.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <array>
#include <iosfwd>
#include <string_view>
#include <vector>

namespace tilemap::hex {

struct CubeCoords;

/// Axial hex coordinates. Two components, the third cube axis is implied
/// (s = -q - r). This is the coordinate system HexMap is keyed by.
struct AxialCoords {
    i32 q = 0;
    i32 r = 0;

    static constexpr AxialCoords splat(i32 v) { return {v, v}; }

    /// The six neighbours, in the order (+1,0) (0,+1) (-1,+1) (-1,0) (0,-1) (+1,-1).
    std::array<AxialCoords, 6> adjacent_coords() const;

    /// Number of single-tile steps between this tile and other.
    i32 distance(const AxialCoords& other) const;

    CubeCoords to_cube() const;

    /// All coordinates at most radius steps away, centre included.
    /// Yields 3r(r+1)+1 coordinates; empty for a negative radius.
    std::vector<AxialCoords> area_coords(i32 radius) const;

    /// Coordinates exactly radius steps away (6r of them).
    /// Radius 0 yields the centre alone; negative radius yields nothing.
    std::vector<AxialCoords> ring_coords(i32 radius) const;

    /// Tiles crossed by the straight line to other, both ends included.
    std::vector<AxialCoords> line_to(const AxialCoords& other) const;

    bool operator==(const AxialCoords&) const = default;

    AxialCoords operator+(const AxialCoords& o) const { return {q + o.q, r + o.r}; }
    AxialCoords operator-(const AxialCoords& o) const { return {q - o.q, r - o.r}; }
    AxialCoords operator*(i32 k) const { return {q * k, r * k}; }
};

/// Parse "q,r" (whitespace around either number is allowed).
Result<AxialCoords> parse_axial(std::string_view text);

std::ostream& operator<<(std::ostream& os, const AxialCoords& c);

} // namespace tilemap::hex

template <>
struct std::hash<tilemap::hex::AxialCoords> {
    size_t operator()(const tilemap::hex::AxialCoords& c) const noexcept {
        return tilemap::hash_components(c.q, c.r);
    }
};
