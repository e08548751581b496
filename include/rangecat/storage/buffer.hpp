#pragma once

#include <type_traits>

#include "rangecat/core/types.hpp"

namespace rangecat::storage {
    using u8 = rangecat::core::u8;
    using u32 = rangecat::core::u32;

    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    struct BufferMut {
        u8* data{nullptr};
        u32 len{0};
    };

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<BufferMut>);
    static_assert(std::is_standard_layout_v<BufferMut>);
} // namespace rangecat::storage
