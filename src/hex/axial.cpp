#include "hex/axial.hpp"
#include "hex/cube.hpp"
#include "hex/hex_util.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <ostream>
#include <string>

namespace tilemap::hex {

// Consecutive entries are neighbours of each other, so walking them in
// order traces a ring.
static constexpr std::array<AxialCoords, 6> DIRECTIONS = {{
    {1, 0}, {0, 1}, {-1, 1}, {-1, 0}, {0, -1}, {1, -1},
}};

std::array<AxialCoords, 6> AxialCoords::adjacent_coords() const {
    std::array<AxialCoords, 6> result;
    for (size_t i = 0; i < DIRECTIONS.size(); ++i)
        result[i] = *this + DIRECTIONS[i];
    return result;
}

i32 AxialCoords::distance(const AxialCoords& other) const {
    i32 dq = q - other.q;
    i32 dr = r - other.r;
    return (std::abs(dq) + std::abs(dq + dr) + std::abs(dr)) / 2;
}

CubeCoords AxialCoords::to_cube() const {
    return CubeCoords::from_axial(*this);
}

std::vector<AxialCoords> AxialCoords::area_coords(i32 radius) const {
    std::vector<AxialCoords> result;
    if (radius < 0) return result;

    result.reserve(static_cast<size_t>(3 * radius * (radius + 1) + 1));
    for (i32 dq = -radius; dq <= radius; ++dq) {
        i32 dr_min = std::max(-radius, -dq - radius);
        i32 dr_max = std::min(radius, -dq + radius);
        for (i32 dr = dr_min; dr <= dr_max; ++dr)
            result.push_back({q + dq, r + dr});
    }
    return result;
}

std::vector<AxialCoords> AxialCoords::ring_coords(i32 radius) const {
    std::vector<AxialCoords> result;
    if (radius < 0) return result;
    if (radius == 0) {
        result.push_back(*this);
        return result;
    }

    result.reserve(static_cast<size_t>(6 * radius));
    // Start on the corner two directions "behind" the first edge we walk
    AxialCoords cur = *this + DIRECTIONS[4] * radius;
    for (const auto& dir : DIRECTIONS) {
        for (i32 step = 0; step < radius; ++step) {
            result.push_back(cur);
            cur = cur + dir;
        }
    }
    return result;
}

std::vector<AxialCoords> AxialCoords::line_to(const AxialCoords& other) const {
    i32 n = distance(other);
    std::vector<AxialCoords> result;
    result.reserve(static_cast<size_t>(n) + 1);
    if (n == 0) {
        result.push_back(*this);
        return result;
    }

    CubeCoords a = to_cube();
    CubeCoords b = other.to_cube();
    // Nudge the start off tile edges so rounding never lands on a tie
    constexpr f32 EPS_Q = 1e-6f, EPS_R = 2e-6f, EPS_S = -3e-6f;
    for (i32 i = 0; i <= n; ++i) {
        f32 t = static_cast<f32>(i) / static_cast<f32>(n);
        FractionalCube p = cube_lerp(a, b, t);
        result.push_back(cube_round(p.q + EPS_Q, p.r + EPS_R, p.s + EPS_S).to_axial());
    }
    return result;
}

static bool parse_component(std::string_view text, i32& out) {
    auto first = text.find_first_not_of(" \t");
    auto last = text.find_last_not_of(" \t");
    if (first == std::string_view::npos) return false;
    text = text.substr(first, last - first + 1);
    // from_chars rejects a leading '+', accept it for symmetry with '-'
    if (text.size() > 1 && text.front() == '+') text.remove_prefix(1);

    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

Result<AxialCoords> parse_axial(std::string_view text) {
    auto comma = text.find(',');
    if (comma == std::string_view::npos) {
        return Error(ErrorKind::Parse,
                     "Expected 'q,r' but found no comma in '" + std::string(text) + "'");
    }

    AxialCoords c;
    if (!parse_component(text.substr(0, comma), c.q) ||
        !parse_component(text.substr(comma + 1), c.r)) {
        return Error(ErrorKind::Parse,
                     "Invalid axial coordinates '" + std::string(text) + "'");
    }
    return c;
}

std::ostream& operator<<(std::ostream& os, const AxialCoords& c) {
    return os << '(' << c.q << ", " << c.r << ')';
}

} // namespace tilemap::hex
