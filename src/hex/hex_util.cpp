#include "hex/hex_util.hpp"

#include <cmath>

namespace tilemap::hex {

CubeCoords cube_round(f32 q, f32 r, f32 s) {
    f32 rq = std::round(q);
    f32 rr = std::round(r);
    f32 rs = std::round(s);

    f32 q_diff = std::fabs(rq - q);
    f32 r_diff = std::fabs(rr - r);
    f32 s_diff = std::fabs(rs - s);

    i32 iq = static_cast<i32>(rq);
    i32 ir = static_cast<i32>(rr);
    i32 is = static_cast<i32>(rs);

    if (q_diff > r_diff && q_diff > s_diff) {
        iq = -ir - is;
    } else if (r_diff > s_diff) {
        ir = -iq - is;
    } else {
        is = -iq - ir;
    }
    return {iq, ir, is};
}

CubeCoords cube_round(const FractionalCube& c) {
    return cube_round(c.q, c.r, c.s);
}

FractionalCube cube_lerp(const CubeCoords& a, const CubeCoords& b, f32 t) {
    auto lerp = [t](i32 from, i32 to) {
        return static_cast<f32>(from) + static_cast<f32>(to - from) * t;
    };
    return {lerp(a.q, b.q), lerp(a.r, b.r), lerp(a.s, b.s)};
}

} // namespace tilemap::hex
