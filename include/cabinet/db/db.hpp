#pragma once

#include <string>
#include <type_traits>
#include <vector>

#include "cabinet/core/errors.hpp"
#include "cabinet/core/models.hpp"
#include "cabinet/core/types.hpp"

namespace cabinet::db {
    using u32 = cabinet::core::u32;
    using u64 = cabinet::core::u64;

    struct DbConfig {
        const char* path{nullptr};          // nullptr opens ":memory:"
        const char* journal_mode{nullptr};  // nullptr means WAL
    };

    struct DbHandle {
        u32 id{0};
    };

    [[nodiscard]] constexpr bool db_handle_valid(DbHandle h) noexcept {
        return h.id != 0;
    }

    struct DbStats {
        u64 total_bytes{0};
        u64 file_count{0};
        u64 folder_count{0};
    };

    cabinet::core::Status db_open(const DbConfig& cfg, DbHandle* out) noexcept;
    cabinet::core::Status db_close(DbHandle db) noexcept;

    // ========================================================================
    // Users
    // ========================================================================

    // Email must be unique; a duplicate fails with Conflict.
    cabinet::core::Status db_user_create(DbHandle db, const cabinet::core::User& user,
        cabinet::core::UserId* out_id) noexcept;
    cabinet::core::Status db_user_get(DbHandle db, cabinet::core::UserId id,
        cabinet::core::User* out) noexcept;
    cabinet::core::Status db_user_list_active(DbHandle db,
        std::vector<cabinet::core::User>* out) noexcept;

    // ========================================================================
    // Folders
    // ========================================================================

    // Sibling name collision fails with Conflict.
    cabinet::core::Status db_folder_create(DbHandle db, const cabinet::core::Folder& folder,
        cabinet::core::FolderId* out_id) noexcept;
    cabinet::core::Status db_folder_get(DbHandle db, cabinet::core::FolderId id,
        cabinet::core::Folder* out) noexcept;
    // Direct children of parent (kRootFolder for the root level), ordered by name.
    cabinet::core::Status db_folder_list(DbHandle db, cabinet::core::UserId owner,
        cabinet::core::FolderId parent, std::vector<cabinet::core::Folder>* out) noexcept;
    // Every folder of owner, ordered by path.
    cabinet::core::Status db_folder_list_all(DbHandle db, cabinet::core::UserId owner,
        std::vector<cabinet::core::Folder>* out) noexcept;

    // Renames the folder and rewrites the path prefix of every descendant in a
    // single transaction. Either all rows change or none do.
    cabinet::core::Status db_folder_rename_subtree(DbHandle db,
        cabinet::core::FolderId id,
        cabinet::core::UserId owner,
        const std::string& new_name,
        cabinet::core::Timestamp now,
        cabinet::core::Folder* out) noexcept;

    // Deletes the subtree rooted at id together with its files and every share
    // on them, in a single transaction. out_folders (root first, by path) and
    // out_files receive the rows the transaction actually removed.
    cabinet::core::Status db_folder_delete_subtree(DbHandle db,
        cabinet::core::FolderId id,
        cabinet::core::UserId owner,
        std::vector<cabinet::core::FolderId>* out_folders,
        std::vector<cabinet::core::File>* out_files) noexcept;

    // ========================================================================
    // Files
    // ========================================================================

    cabinet::core::Status db_file_create(DbHandle db, const cabinet::core::File& file,
        cabinet::core::FileId* out_id) noexcept;
    cabinet::core::Status db_file_get(DbHandle db, cabinet::core::FileId id,
        cabinet::core::File* out) noexcept;
    // Only matches rows with is_public set.
    cabinet::core::Status db_file_get_by_token(DbHandle db, const std::string& token,
        cabinet::core::File* out) noexcept;
    cabinet::core::Status db_file_list(DbHandle db, cabinet::core::UserId owner,
        cabinet::core::FolderId folder, std::vector<cabinet::core::File>* out) noexcept;

    cabinet::core::Status db_file_rename(DbHandle db, cabinet::core::FileId id,
        cabinet::core::UserId owner, const std::string& name, const std::string& file_type,
        cabinet::core::Timestamp now) noexcept;
    cabinet::core::Status db_file_move(DbHandle db, cabinet::core::FileId id,
        cabinet::core::UserId owner, cabinet::core::FolderId folder,
        cabinet::core::Timestamp now) noexcept;
    // Removes the row and any share on it. out_removed, when given, receives
    // the row as it was when the transaction deleted it.
    cabinet::core::Status db_file_delete(DbHandle db, cabinet::core::FileId id,
        cabinet::core::UserId owner, cabinet::core::File* out_removed) noexcept;

    // expires_at == 0 stores no expiry. A token already held by another file
    // fails with Conflict.
    cabinet::core::Status db_file_set_public(DbHandle db, cabinet::core::FileId id,
        cabinet::core::UserId owner, const std::string& token,
        cabinet::core::Timestamp expires_at, cabinet::core::Timestamp now) noexcept;
    cabinet::core::Status db_file_clear_public(DbHandle db, cabinet::core::FileId id,
        cabinet::core::UserId owner, cabinet::core::Timestamp now) noexcept;

    cabinet::core::Status db_stats(DbHandle db, cabinet::core::UserId owner,
        DbStats* out) noexcept;

    // ========================================================================
    // Shares
    // ========================================================================

    // Inserts a share, or updates the permission of the existing share on the
    // same (target, shared_with). out receives the stored row.
    cabinet::core::Status db_share_upsert(DbHandle db, const cabinet::core::Share& share,
        cabinet::core::Share* out) noexcept;
    cabinet::core::Status db_share_get(DbHandle db, cabinet::core::ShareId id,
        cabinet::core::Share* out) noexcept;
    // Only deletes when shared_by matches; otherwise NotFound.
    cabinet::core::Status db_share_delete(DbHandle db, cabinet::core::ShareId id,
        cabinet::core::UserId shared_by) noexcept;
    cabinet::core::Status db_share_find(DbHandle db, cabinet::core::ShareTarget target,
        cabinet::core::UserId shared_with, cabinet::core::Share* out) noexcept;
    cabinet::core::Status db_share_list_for_target(DbHandle db, cabinet::core::ShareTarget target,
        std::vector<cabinet::core::Share>* out) noexcept;
    // Newest first.
    cabinet::core::Status db_share_list_for_grantee(DbHandle db, cabinet::core::UserId shared_with,
        std::vector<cabinet::core::Share>* out) noexcept;

    static_assert(std::is_trivially_copyable_v<DbConfig>);
    static_assert(std::is_trivially_copyable_v<DbHandle>);
    static_assert(std::is_trivially_copyable_v<DbStats>);

} // namespace cabinet::db
