#pragma once
// Types.hpp - Fixed-width aliases shared across the project

#include <cstdint>

namespace ks {

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i32 = std::int32_t;
using i64 = std::int64_t;
using f32 = float;
using f64 = double;

// Timeline positions and durations, in seconds
using Seconds = f64;

} // namespace ks
