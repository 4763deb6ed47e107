#pragma once

#include <string>
#include <type_traits>

#include "cabinet/core/errors.hpp"
#include "cabinet/core/types.hpp"

namespace cabinet::security {
    using u8 = cabinet::core::u8;

    struct Key256 {
        u8 b[32]{};
    };

    struct Tag16 {
        u8 b[16]{};
    };

    // A download grant for one blob, valid until expires_at (unix seconds).
    struct DownloadGrant {
        std::string blob_key;
        cabinet::core::Timestamp expires_at{0};
        Tag16 proof{}; // MAC over blob_key and expires_at
    };

    cabinet::core::Status download_seal(const Key256& key,
        const DownloadGrant& grant,
        Tag16* out_tag) noexcept;

    // Invalid on a bad MAC, Gone once now > expires_at.
    cabinet::core::Status download_verify(const Key256& key,
        const DownloadGrant& grant,
        cabinet::core::Timestamp now) noexcept;

    [[nodiscard]] std::string tag_to_hex(const Tag16& tag);
    [[nodiscard]] bool tag_from_hex(const std::string& hex, Tag16* out) noexcept;

    static_assert(std::is_trivially_copyable_v<Key256>);
    static_assert(std::is_trivially_copyable_v<Tag16>);

} // namespace cabinet::security
