#pragma once

#include <string>

#include "cabinet/blob/blob_store.hpp"
#include "cabinet/core/config.hpp"
#include "cabinet/core/errors.hpp"
#include "cabinet/core/types.hpp"
#include "cabinet/db/db.hpp"

namespace cabinet::storage {
    using u32 = cabinet::core::u32;
    using u64 = cabinet::core::u64;

    using Clock = cabinet::core::Timestamp (*)() noexcept;

    // Wall clock, unix seconds.
    cabinet::core::Timestamp system_now() noexcept;

    // Everything a storage operation needs. Not owning; the blob store and
    // the database outlive the context.
    struct StorageContext {
        cabinet::db::DbHandle db{};
        cabinet::blob::BlobStore* blobs{nullptr};
        u64 max_upload_bytes{cabinet::core::kDefaultMaxUploadBytes};
        std::string public_base_url{"/api/storage"};
        Clock now{&system_now};
    };

    [[nodiscard]] inline bool context_valid(const StorageContext& ctx) noexcept {
        return cabinet::db::db_handle_valid(ctx.db) && ctx.blobs != nullptr && ctx.now != nullptr;
    }

    inline constexpr std::size_t kMaxNameBytes = 255;

    // aux of a NotFound raised for a referenced row rather than the subject
    // of the call: a parent or destination folder, or a share grantee.
    inline constexpr u32 kMissingFolderRef = 1;
    inline constexpr u32 kMissingUserRef = 2;

    // Trims surrounding whitespace and rejects names that are empty, longer
    // than kMaxNameBytes, "." or "..", or that contain '/' or control bytes.
    // Folder paths are built from names, so '/' can never appear in one.
    cabinet::core::Status normalize_name(const std::string& raw, std::string* out);

} // namespace cabinet::storage
