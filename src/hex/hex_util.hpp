#pragma once

#include "core/types.hpp"
#include "hex/cube.hpp"

namespace tilemap::hex {

/// A point in continuous cube space (not necessarily a tile centre).
struct FractionalCube {
    f32 q = 0, r = 0, s = 0;
};

/// Round continuous cube coordinates to the containing tile.
/// The component with the largest rounding error is recomputed from the
/// other two, so the result always satisfies q + r + s == 0.
CubeCoords cube_round(f32 q, f32 r, f32 s);
CubeCoords cube_round(const FractionalCube& c);

/// Linear interpolation between two tile centres, t in [0, 1].
FractionalCube cube_lerp(const CubeCoords& a, const CubeCoords& b, f32 t);

} // namespace tilemap::hex
