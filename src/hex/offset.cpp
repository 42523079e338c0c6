#include "hex/offset.hpp"

#include <ostream>

namespace tilemap::hex {

// [parity][direction] as (dcol, drow)
static constexpr i32 NEIGHBOR_DELTAS[2][6][2] = {
    // even rows
    {{1, 0}, {0, -1}, {-1, -1}, {-1, 0}, {-1, 1}, {0, 1}},
    // odd rows
    {{1, 0}, {1, -1}, {0, -1}, {-1, 0}, {0, 1}, {1, 1}},
};

OffsetCoords OffsetCoords::from_axial(const AxialCoords& a) {
    return {a.q + (a.r - (a.r & 1)) / 2, a.r};
}

AxialCoords OffsetCoords::to_axial() const {
    return {col - (row - (row & 1)) / 2, row};
}

std::array<OffsetCoords, 6> OffsetCoords::adjacent_coords() const {
    // row & 1 is 1 for negative odd rows too (two's complement)
    const auto& deltas = NEIGHBOR_DELTAS[row & 1];
    std::array<OffsetCoords, 6> result;
    for (size_t i = 0; i < 6; ++i)
        result[i] = {col + deltas[i][0], row + deltas[i][1]};
    return result;
}

i32 OffsetCoords::distance(const OffsetCoords& other) const {
    return to_axial().distance(other.to_axial());
}

std::ostream& operator<<(std::ostream& os, const OffsetCoords& c) {
    return os << "[col " << c.col << ", row " << c.row << ']';
}

} // namespace tilemap::hex
