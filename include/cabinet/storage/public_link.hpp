#pragma once

#include <string>

#include "cabinet/core/errors.hpp"
#include "cabinet/core/models.hpp"
#include "cabinet/storage/context.hpp"
#include "cabinet/storage/file_registry.hpp"

namespace cabinet::storage {

    inline constexpr u32 kMaxLinkTtlHours = 24u * 365u * 10u;
    inline constexpr cabinet::core::Timestamp kMaxLinkTtlSeconds =
        static_cast<cabinet::core::Timestamp>(kMaxLinkTtlHours) * 3600;

    struct PublicLink {
        std::string token;
        std::string url;                        // {public_base_url}/public/{token}
        cabinet::core::Timestamp expires_at{0}; // 0 means no expiry
    };

    // The anonymous view of a public file. Never carries the blob key.
    struct PublicFileInfo {
        std::string name;
        u64 size_bytes{0};
        std::string file_type;
        std::string mime_type;
        cabinet::core::Timestamp expires_at{0};
        std::string shared_by;
        cabinet::core::Timestamp created_at{0};
    };

    // ttl_seconds == 0 issues a link without expiry. Issuing again replaces the
    // previous token.
    cabinet::core::Status public_link_issue(const StorageContext& ctx,
        cabinet::core::FileId id,
        cabinet::core::UserId owner,
        cabinet::core::Timestamp ttl_seconds,
        PublicLink* out) noexcept;

    // Succeeds on a file that is already private.
    cabinet::core::Status public_link_revoke(const StorageContext& ctx,
        cabinet::core::FileId id,
        cabinet::core::UserId owner) noexcept;

    // NotFound for an unknown or revoked token, Gone once the expiry has
    // passed. Expiry is checked on every read; nothing sweeps old links.
    cabinet::core::Status public_link_resolve(const StorageContext& ctx,
        const std::string& token,
        PublicFileInfo* out) noexcept;

    cabinet::core::Status public_link_resolve_download(const StorageContext& ctx,
        const std::string& token,
        DownloadTarget* out) noexcept;

} // namespace cabinet::storage
