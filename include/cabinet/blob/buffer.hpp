#pragma once

#include <type_traits>

#include "cabinet/core/types.hpp"

namespace cabinet::blob {
    using u8 = cabinet::core::u8;
    using u64 = cabinet::core::u64;

    struct BufferView {
        const u8* data{nullptr};
        u64 len{0};
    };

    [[nodiscard]] constexpr bool buffer_ok(BufferView b) noexcept {
        return b.len == 0 || b.data != nullptr;
    }

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
} // namespace cabinet::blob
