#pragma once

#include "core/hash.hpp"
#include "core/types.hpp"
#include "hex/axial.hpp"

#include <array>
#include <iosfwd>

namespace tilemap::hex {

/// Double-width coordinates: horizontal steps move col by 2, so valid
/// coordinates always have an even col + row.
struct DoubledCoords {
    i32 col = 0;
    i32 row = 0;

    static constexpr DoubledCoords splat(i32 v) { return {v, v}; }

    static DoubledCoords from_axial(const AxialCoords& a) { return {2 * a.q + a.r, a.r}; }
    AxialCoords to_axial() const { return {(col - row) / 2, row}; }

    std::array<DoubledCoords, 6> adjacent_coords() const;
    i32 distance(const DoubledCoords& other) const;

    bool operator==(const DoubledCoords&) const = default;

    DoubledCoords operator+(const DoubledCoords& o) const { return {col + o.col, row + o.row}; }
};

std::ostream& operator<<(std::ostream& os, const DoubledCoords& c);

} // namespace tilemap::hex

template <>
struct std::hash<tilemap::hex::DoubledCoords> {
    size_t operator()(const tilemap::hex::DoubledCoords& c) const noexcept {
        return tilemap::hash_components(c.col, c.row);
    }
};
