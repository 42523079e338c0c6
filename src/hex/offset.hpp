#pragma once

#include "core/hash.hpp"
#include "core/types.hpp"
#include "hex/axial.hpp"

#include <array>
#include <iosfwd>

namespace tilemap::hex {

/// "Odd-r" offset coordinates: rows are horizontal, every odd row is shoved
/// half a tile to the right. Gives rectangular-looking maps at the cost of
/// parity-dependent neighbour math.
struct OffsetCoords {
    i32 col = 0;
    i32 row = 0;

    static constexpr OffsetCoords splat(i32 v) { return {v, v}; }

    static OffsetCoords from_axial(const AxialCoords& a);
    AxialCoords to_axial() const;

    /// Neighbour deltas differ between even and odd rows.
    std::array<OffsetCoords, 6> adjacent_coords() const;
    i32 distance(const OffsetCoords& other) const;

    bool operator==(const OffsetCoords&) const = default;
};

std::ostream& operator<<(std::ostream& os, const OffsetCoords& c);

} // namespace tilemap::hex

template <>
struct std::hash<tilemap::hex::OffsetCoords> {
    size_t operator()(const tilemap::hex::OffsetCoords& c) const noexcept {
        return tilemap::hash_components(c.col, c.row);
    }
};
