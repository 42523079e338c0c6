#include "hex/doubled.hpp"

#include <algorithm>
#include <cstdlib>
#include <ostream>

namespace tilemap::hex {

static constexpr std::array<DoubledCoords, 6> DIRECTIONS = {{
    {2, 0}, {1, -1}, {-1, -1}, {-2, 0}, {-1, 1}, {1, 1},
}};

std::array<DoubledCoords, 6> DoubledCoords::adjacent_coords() const {
    std::array<DoubledCoords, 6> result;
    for (size_t i = 0; i < DIRECTIONS.size(); ++i)
        result[i] = *this + DIRECTIONS[i];
    return result;
}

i32 DoubledCoords::distance(const DoubledCoords& other) const {
    i32 dcol = std::abs(col - other.col);
    i32 drow = std::abs(row - other.row);
    return drow + std::max(0, (dcol - drow) / 2);
}

std::ostream& operator<<(std::ostream& os, const DoubledCoords& c) {
    return os << "[col " << c.col << ", row " << c.row << ']';
}

} // namespace tilemap::hex
