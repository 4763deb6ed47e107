#pragma once

#include <cstddef>
#include <string>

#include "cabinet/core/errors.hpp"
#include "cabinet/core/types.hpp"

namespace cabinet::security {
    using u8 = cabinet::core::u8;

    inline constexpr std::size_t kPublicTokenBytes = 32;
    inline constexpr std::size_t kPublicTokenChars = kPublicTokenBytes * 2;

    // Fills out with len bytes from the libsodium CSPRNG.
    cabinet::core::Status random_bytes(u8* out, std::size_t len) noexcept;

    // 256 random bits as lowercase hex.
    cabinet::core::Status token_generate(std::string* out) noexcept;

    [[nodiscard]] bool token_well_formed(const std::string& token) noexcept;

} // namespace cabinet::security
