#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <functional>

namespace tilemap {

/// Pack two 32-bit coordinate components into one 64-bit key and hash it.
/// Distinct (a, b) pairs always produce distinct keys.
inline size_t hash_components(i32 a, i32 b) {
    u64 key = (static_cast<u64>(static_cast<u32>(a)) << 32) |
              static_cast<u64>(static_cast<u32>(b));
    return std::hash<u64>{}(key);
}

} // namespace tilemap
