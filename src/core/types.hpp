#pragma once

#include <cstdint>
#include <filesystem>

namespace tilemap {

namespace fs = std::filesystem;

using u8 = uint8_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i32 = int32_t;
using i64 = int64_t;
using f32 = float;

} // namespace tilemap
