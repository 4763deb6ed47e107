#include "cabinet/db/db.hpp"
#include "db_state.hpp"

#include <sqlite3.h>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace cabinet::db {

using namespace cabinet::core;

namespace {
    // Runs a single-row UPDATE/DELETE scoped by (id, owner); no matching row
    // is NotFound. Caller holds the state mutex.
    template <typename Bind>
    [[nodiscard]] Status exec_owned(sqlite3* db, const char* sql, Bind&& bind) {
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            return detail::status_from_rc(rc);
        }

        bind(stmt);

        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            return detail::status_from_rc(rc);
        }
        if (sqlite3_changes(db) == 0) {
            return make_status(StatusDomain::Db, StatusCode::NotFound);
        }
        return ok_status();
    }

    [[nodiscard]] Status select_one_file(sqlite3* db, const std::string& sql,
                                         const std::string* text_key, FileId id_key,
                                         File* out) {
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            return detail::status_from_rc(rc);
        }

        if (text_key) {
            detail::bind_text(stmt, 1, *text_key);
        } else {
            sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id_key.v));
        }

        rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            detail::read_file(stmt, out);
            sqlite3_finalize(stmt);
            return ok_status();
        }

        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return detail::status_from_rc(rc);
        }
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }
}

// ============================================================================
// File Operations
// ============================================================================

Status db_file_create(DbHandle db, const File& file, FileId* out_id) noexcept {
    if (!db_handle_valid(db) || !out_id || file.name.empty() || file.blob_key.empty()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    auto& state = detail::db_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (!state.db) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    // New files are always private; exposure goes through db_file_set_public.
    const char* sql = "INSERT INTO files (name, folder_id, owner_id, blob_key, size_bytes, "
                      "file_type, mime_type, is_public, public_token, public_expires_at, "
                      "created_at, updated_at) "
                      "VALUES (?, ?, ?, ?, ?, ?, ?, 0, NULL, NULL, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(state.db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return detail::status_from_rc(rc);
    }

    detail::bind_text(stmt, 1, file.name);
    detail::bind_folder(stmt, 2, file.folder);
    sqlite3_bind_int64(stmt, 3, file.owner.v);
    detail::bind_text(stmt, 4, file.blob_key);
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(file.size_bytes));
    detail::bind_text(stmt, 6, file.file_type);
    detail::bind_text(stmt, 7, file.mime_type);
    sqlite3_bind_int64(stmt, 8, file.created_at);
    sqlite3_bind_int64(stmt, 9, file.updated_at);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return detail::status_from_rc(rc);
    }

    *out_id = FileId{static_cast<u64>(sqlite3_last_insert_rowid(state.db))};
    return ok_status();
}

Status db_file_get(DbHandle db, FileId id, File* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (!id.is_valid()) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }

    auto& state = detail::db_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (!state.db) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql = "SELECT ";
    sql += detail::kFileColumns;
    sql += " FROM files WHERE id = ?";

    return select_one_file(state.db, sql, nullptr, id, out);
}

Status db_file_get_by_token(DbHandle db, const std::string& token, File* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (token.empty()) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }

    auto& state = detail::db_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (!state.db) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql = "SELECT ";
    sql += detail::kFileColumns;
    sql += " FROM files WHERE public_token = ? AND is_public = 1";

    return select_one_file(state.db, sql, &token, FileId::invalid(), out);
}

Status db_file_list(DbHandle db, UserId owner, FolderId folder, std::vector<File>* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    auto& state = detail::db_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (!state.db) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql = "SELECT ";
    sql += detail::kFileColumns;
    sql += " FROM files WHERE owner_id = ?1 AND folder_id IS ?2 ORDER BY name, id";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(state.db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return detail::status_from_rc(rc);
    }

    sqlite3_bind_int64(stmt, 1, owner.v);
    detail::bind_folder(stmt, 2, folder);

    out->clear();
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        File f;
        detail::read_file(stmt, &f);
        out->push_back(std::move(f));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return detail::status_from_rc(rc);
    }
    return ok_status();
}

Status db_file_rename(DbHandle db, FileId id, UserId owner, const std::string& name,
                      const std::string& file_type, Timestamp now) noexcept {
    if (!db_handle_valid(db) || name.empty()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    auto& state = detail::db_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (!state.db) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    return exec_owned(state.db,
        "UPDATE files SET name = ?, file_type = ?, updated_at = ? WHERE id = ? AND owner_id = ?",
        [&](sqlite3_stmt* stmt) {
            detail::bind_text(stmt, 1, name);
            detail::bind_text(stmt, 2, file_type);
            sqlite3_bind_int64(stmt, 3, now);
            sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(id.v));
            sqlite3_bind_int64(stmt, 5, owner.v);
        });
}

Status db_file_move(DbHandle db, FileId id, UserId owner, FolderId folder, Timestamp now) noexcept {
    if (!db_handle_valid(db)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    auto& state = detail::db_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (!state.db) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    // The destination must still belong to the owner at write time.
    const char* sql = folder_is_root(folder)
        ? "UPDATE files SET folder_id = NULL, updated_at = ?3 WHERE id = ?4 AND owner_id = ?5"
        : "UPDATE files SET folder_id = ?1, updated_at = ?3 WHERE id = ?4 AND owner_id = ?5 "
          "AND EXISTS (SELECT 1 FROM folders WHERE id = ?1 AND owner_id = ?5)";

    return exec_owned(state.db, sql, [&](sqlite3_stmt* stmt) {
        if (!folder_is_root(folder)) {
            sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(folder.v));
        }
        sqlite3_bind_int64(stmt, 3, now);
        sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(id.v));
        sqlite3_bind_int64(stmt, 5, owner.v);
    });
}

Status db_file_delete(DbHandle db, FileId id, UserId owner, File* out_removed) noexcept {
    if (!db_handle_valid(db)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    auto& state = detail::db_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (!state.db) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    detail::ScopedTxn txn(state.db);
    if (!txn.active()) {
        return detail::status_from_rc(sqlite3_extended_errcode(state.db));
    }

    std::string select_sql = "SELECT ";
    select_sql += detail::kFileColumns;
    select_sql += " FROM files WHERE id = ?";
    File row;
    Status s = select_one_file(state.db, select_sql, nullptr, id, &row);
    if (!is_ok(s)) {
        return s;
    }
    if (row.owner != owner) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }

    s = exec_owned(state.db, "DELETE FROM files WHERE id = ? AND owner_id = ?",
        [&](sqlite3_stmt* stmt) {
            sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id.v));
            sqlite3_bind_int64(stmt, 2, owner.v);
        });
    if (!is_ok(s)) {
        return s;
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(state.db, "DELETE FROM shares WHERE file_id = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return detail::status_from_rc(rc);
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id.v));
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return detail::status_from_rc(rc);
    }

    s = txn.commit();
    if (!is_ok(s)) {
        return s;
    }

    if (out_removed) {
        *out_removed = std::move(row);
    }
    return ok_status();
}

Status db_file_set_public(DbHandle db, FileId id, UserId owner, const std::string& token,
                          Timestamp expires_at, Timestamp now) noexcept {
    if (!db_handle_valid(db) || token.empty()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    auto& state = detail::db_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (!state.db) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    return exec_owned(state.db,
        "UPDATE files SET is_public = 1, public_token = ?, public_expires_at = ?, updated_at = ? "
        "WHERE id = ? AND owner_id = ?",
        [&](sqlite3_stmt* stmt) {
            detail::bind_text(stmt, 1, token);
            if (expires_at == 0) {
                sqlite3_bind_null(stmt, 2);
            } else {
                sqlite3_bind_int64(stmt, 2, expires_at);
            }
            sqlite3_bind_int64(stmt, 3, now);
            sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(id.v));
            sqlite3_bind_int64(stmt, 5, owner.v);
        });
}

Status db_file_clear_public(DbHandle db, FileId id, UserId owner, Timestamp now) noexcept {
    if (!db_handle_valid(db)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    auto& state = detail::db_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (!state.db) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    return exec_owned(state.db,
        "UPDATE files SET is_public = 0, public_token = NULL, public_expires_at = NULL, "
        "updated_at = ? WHERE id = ? AND owner_id = ?",
        [&](sqlite3_stmt* stmt) {
            sqlite3_bind_int64(stmt, 1, now);
            sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(id.v));
            sqlite3_bind_int64(stmt, 3, owner.v);
        });
}

} // namespace cabinet::db
