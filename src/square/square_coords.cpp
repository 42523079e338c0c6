#include "square/square_coords.hpp"

#include <algorithm>
#include <cstdlib>
#include <ostream>

namespace tilemap::square {

static constexpr std::array<SquareCoords, 4> SIDES = {{
    {1, 0}, {0, 1}, {-1, 0}, {0, -1},
}};

static constexpr std::array<SquareCoords, 4> CORNERS = {{
    {1, 1}, {-1, 1}, {-1, -1}, {1, -1},
}};

std::array<SquareCoords, 8> SquareCoords::adjacent_coords() const {
    std::array<SquareCoords, 8> result;
    for (size_t i = 0; i < SIDES.size(); ++i) {
        result[i] = *this + SIDES[i];
        result[i + SIDES.size()] = *this + CORNERS[i];
    }
    return result;
}

std::array<SquareCoords, 4> SquareCoords::side_coords() const {
    std::array<SquareCoords, 4> result;
    for (size_t i = 0; i < SIDES.size(); ++i)
        result[i] = *this + SIDES[i];
    return result;
}

i32 SquareCoords::distance(const SquareCoords& other) const {
    return std::max(std::abs(x - other.x), std::abs(y - other.y));
}

std::ostream& operator<<(std::ostream& os, const SquareCoords& c) {
    return os << '(' << c.x << ", " << c.y << ')';
}

} // namespace tilemap::square
