#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace rangecat::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    inline constexpr u64 kU64Max = std::numeric_limits<u64>::max();

    // Clamps at zero instead of wrapping.
    [[nodiscard]] constexpr u64 saturating_sub(u64 a, u64 b) noexcept {
        return a > b ? a - b : 0;
    }

    // Returns false when a + b does not fit in u64.
    [[nodiscard]] constexpr bool checked_add(u64 a, u64 b, u64* out) noexcept {
        if (b > kU64Max - a) {
            return false;
        }
        *out = a + b;
        return true;
    }

} // namespace rangecat::core
