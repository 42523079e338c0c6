#pragma once

#include "core/hash.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "hex/axial.hpp"

#include <array>
#include <iosfwd>

namespace tilemap::hex {

/// Cube hex coordinates. Valid coordinates satisfy q + r + s == 0; use
/// make() when the components come from outside and need checking.
struct CubeCoords {
    i32 q = 0;
    i32 r = 0;
    i32 s = 0;

    /// Validating constructor. Fails with ErrorKind::InvalidCoords when
    /// q + r + s != 0.
    static Result<CubeCoords> make(i32 q, i32 r, i32 s);

    static CubeCoords from_axial(const AxialCoords& a) { return {a.q, a.r, -a.q - a.r}; }
    AxialCoords to_axial() const { return {q, r}; }

    bool is_valid() const { return q + r + s == 0; }

    std::array<CubeCoords, 6> adjacent_coords() const;
    i32 distance(const CubeCoords& other) const;

    bool operator==(const CubeCoords&) const = default;

    CubeCoords operator+(const CubeCoords& o) const { return {q + o.q, r + o.r, s + o.s}; }
    CubeCoords operator-(const CubeCoords& o) const { return {q - o.q, r - o.r, s - o.s}; }
};

std::ostream& operator<<(std::ostream& os, const CubeCoords& c);

} // namespace tilemap::hex

// s is implied by q and r for every valid coordinate
template <>
struct std::hash<tilemap::hex::CubeCoords> {
    size_t operator()(const tilemap::hex::CubeCoords& c) const noexcept {
        return tilemap::hash_components(c.q, c.r);
    }
};
