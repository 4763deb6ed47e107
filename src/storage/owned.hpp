#pragma once

#include "cabinet/core/errors.hpp"
#include "cabinet/core/models.hpp"
#include "cabinet/storage/context.hpp"

// Helpers shared by the storage translation units; not installed.
namespace cabinet::storage::detail {

    // NotFound when the row is missing or owned by someone else; the two
    // cases are indistinguishable to the caller.
    cabinet::core::Status load_owned_folder(const StorageContext& ctx,
        cabinet::core::FolderId id,
        cabinet::core::UserId owner,
        cabinet::core::Folder* out) noexcept;

    cabinet::core::Status load_owned_file(const StorageContext& ctx,
        cabinet::core::FileId id,
        cabinet::core::UserId owner,
        cabinet::core::File* out) noexcept;

    // Best-effort blob delete for a file whose metadata is being removed.
    // Failure is logged at warning level and reported as false.
    [[nodiscard]] bool remove_blob_logged(const StorageContext& ctx,
        const cabinet::core::File& file) noexcept;

    // A required blob call failed; callers see Unavailable with the backend
    // code kept in aux.
    [[nodiscard]] constexpr cabinet::core::Status backend_unavailable(cabinet::core::Status cause) noexcept {
        return cabinet::core::make_status(cabinet::core::StatusDomain::Blob,
            cabinet::core::StatusCode::Unavailable,
            static_cast<cabinet::core::u32>(cause.code));
    }

    // Tags a NotFound from loading a referenced row with which reference it was.
    [[nodiscard]] constexpr cabinet::core::Status missing_ref(cabinet::core::Status s, u32 which) noexcept {
        if (s.code != cabinet::core::StatusCode::NotFound) {
            return s;
        }
        return cabinet::core::make_status(cabinet::core::StatusDomain::Storage,
            cabinet::core::StatusCode::NotFound, which);
    }

} // namespace cabinet::storage::detail
