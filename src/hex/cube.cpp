#include "hex/cube.hpp"

#include <algorithm>
#include <cstdlib>
#include <ostream>
#include <string>

namespace tilemap::hex {

static constexpr std::array<CubeCoords, 6> DIRECTIONS = {{
    {1, -1, 0}, {1, 0, -1}, {0, 1, -1}, {-1, 1, 0}, {-1, 0, 1}, {0, -1, 1},
}};

Result<CubeCoords> CubeCoords::make(i32 q, i32 r, i32 s) {
    CubeCoords c{q, r, s};
    if (!c.is_valid()) {
        return Error(ErrorKind::InvalidCoords,
                     "Cube coordinates must sum to zero, got (" +
                         std::to_string(q) + ", " + std::to_string(r) + ", " +
                         std::to_string(s) + ")");
    }
    return c;
}

std::array<CubeCoords, 6> CubeCoords::adjacent_coords() const {
    std::array<CubeCoords, 6> result;
    for (size_t i = 0; i < DIRECTIONS.size(); ++i)
        result[i] = *this + DIRECTIONS[i];
    return result;
}

i32 CubeCoords::distance(const CubeCoords& other) const {
    return std::max({std::abs(q - other.q), std::abs(r - other.r),
                     std::abs(s - other.s)});
}

std::ostream& operator<<(std::ostream& os, const CubeCoords& c) {
    return os << '(' << c.q << ", " << c.r << ", " << c.s << ')';
}

} // namespace tilemap::hex
