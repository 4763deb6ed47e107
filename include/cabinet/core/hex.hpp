#pragma once

#include <cstddef>
#include <string>

#include "cabinet/core/types.hpp"

namespace cabinet::core {
    // Lowercase hex of len bytes.
    [[nodiscard]] std::string hex_encode(const u8* data, std::size_t len);

    // Decodes exactly out_len bytes; rejects odd length, wrong length and non-hex input.
    [[nodiscard]] bool hex_decode(const char* hex, u8* out, std::size_t out_len) noexcept;
} // namespace cabinet::core
