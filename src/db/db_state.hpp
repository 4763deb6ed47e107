#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

#include "cabinet/core/errors.hpp"
#include "cabinet/core/models.hpp"

// Shared by the db translation units only; not installed.
namespace cabinet::db::detail {

    struct DbState {
        sqlite3* db = nullptr;
        std::mutex mutex;
    };

    DbState& db_state() noexcept;

    inline constexpr const char* kFolderColumns =
        "id, name, parent_id, owner_id, path, created_at, updated_at";
    inline constexpr const char* kFileColumns =
        "id, name, folder_id, owner_id, blob_key, size_bytes, file_type, mime_type, "
        "is_public, public_token, public_expires_at, created_at, updated_at";
    inline constexpr const char* kShareColumns =
        "id, file_id, folder_id, shared_with, shared_by, permission, created_at";

    // Maps a failed sqlite3 result code (extended codes enabled) onto Status.
    [[nodiscard]] cabinet::core::Status status_from_rc(int rc) noexcept;

    [[nodiscard]] bool exec_sql(sqlite3* db, const char* sql) noexcept;

    void bind_text(sqlite3_stmt* stmt, int idx, const std::string& value) noexcept;
    // Root (invalid id) binds NULL.
    void bind_folder(sqlite3_stmt* stmt, int idx, cabinet::core::FolderId folder) noexcept;

    [[nodiscard]] std::string column_string(sqlite3_stmt* stmt, int col);
    void read_user(sqlite3_stmt* stmt, cabinet::core::User* out);
    void read_folder(sqlite3_stmt* stmt, cabinet::core::Folder* out);
    void read_file(sqlite3_stmt* stmt, cabinet::core::File* out);
    void read_share(sqlite3_stmt* stmt, cabinet::core::Share* out);

    // BEGIN IMMEDIATE on construction; rolls back on destruction unless
    // commit() succeeded. The caller holds DbState::mutex for the lifetime.
    class ScopedTxn {
    public:
        explicit ScopedTxn(sqlite3* db) noexcept;
        ~ScopedTxn();

        ScopedTxn(const ScopedTxn&) = delete;
        ScopedTxn& operator=(const ScopedTxn&) = delete;

        [[nodiscard]] bool active() const noexcept { return active_; }
        [[nodiscard]] cabinet::core::Status commit() noexcept;

    private:
        sqlite3* db_;
        bool active_;
    };

} // namespace cabinet::db::detail
