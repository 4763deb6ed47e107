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
    [[nodiscard]] const char* target_column(ShareTarget target) noexcept {
        return target.kind == TargetKind::File ? "file_id" : "folder_id";
    }

    // Caller holds the state mutex.
    [[nodiscard]] Status find_share(sqlite3* db, ShareTarget target, UserId shared_with, Share* out) {
        std::string sql = "SELECT ";
        sql += detail::kShareColumns;
        sql += " FROM shares WHERE ";
        sql += target_column(target);
        sql += " = ? AND shared_with = ?";

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            return detail::status_from_rc(rc);
        }

        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(target.id));
        sqlite3_bind_int64(stmt, 2, shared_with.v);

        rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            detail::read_share(stmt, out);
            sqlite3_finalize(stmt);
            return ok_status();
        }

        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return detail::status_from_rc(rc);
        }
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }

    [[nodiscard]] Status list_shares(sqlite3* db, const std::string& sql, sqlite3_int64 key,
                                     std::vector<Share>* out) {
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            return detail::status_from_rc(rc);
        }

        sqlite3_bind_int64(stmt, 1, key);

        out->clear();
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            Share sh;
            detail::read_share(stmt, &sh);
            out->push_back(sh);
        }
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            return detail::status_from_rc(rc);
        }
        return ok_status();
    }
}

// ============================================================================
// Share Operations
// ============================================================================

Status db_share_upsert(DbHandle db, const Share& share, Share* out) noexcept {
    if (!db_handle_valid(db) || !out || !share_target_valid(share)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (share.shared_with == share.shared_by) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    auto& state = detail::db_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (!state.db) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const ShareTarget target = share.file.is_valid()
        ? ShareTarget::of_file(share.file)
        : ShareTarget::of_folder(share.folder);

    detail::ScopedTxn txn(state.db);
    if (!txn.active()) {
        return detail::status_from_rc(sqlite3_extended_errcode(state.db));
    }

    Share existing;
    Status s = find_share(state.db, target, share.shared_with, &existing);
    if (is_ok(s)) {
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(state.db, "UPDATE shares SET permission = ? WHERE id = ?",
                                    -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            return detail::status_from_rc(rc);
        }
        sqlite3_bind_int(stmt, 1, static_cast<int>(share.permission));
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(existing.id.v));
        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return detail::status_from_rc(rc);
        }

        s = txn.commit();
        if (!is_ok(s)) {
            return s;
        }
        existing.permission = share.permission;
        *out = existing;
        return ok_status();
    }
    if (s.code != StatusCode::NotFound) {
        return s;
    }

    const char* sql = "INSERT INTO shares (file_id, folder_id, shared_with, shared_by, permission, created_at) "
                      "VALUES (?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(state.db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return detail::status_from_rc(rc);
    }

    if (share.file.is_valid()) {
        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(share.file.v));
        sqlite3_bind_null(stmt, 2);
    } else {
        sqlite3_bind_null(stmt, 1);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(share.folder.v));
    }
    sqlite3_bind_int64(stmt, 3, share.shared_with.v);
    sqlite3_bind_int64(stmt, 4, share.shared_by.v);
    sqlite3_bind_int(stmt, 5, static_cast<int>(share.permission));
    sqlite3_bind_int64(stmt, 6, share.created_at);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return detail::status_from_rc(rc);
    }

    const ShareId new_id{static_cast<u64>(sqlite3_last_insert_rowid(state.db))};

    s = txn.commit();
    if (!is_ok(s)) {
        return s;
    }

    *out = share;
    out->id = new_id;
    return ok_status();
}

Status db_share_get(DbHandle db, ShareId id, Share* out) noexcept {
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
    sql += detail::kShareColumns;
    sql += " FROM shares WHERE id = ?";

    std::vector<Share> rows;
    Status s = list_shares(state.db, sql, static_cast<sqlite3_int64>(id.v), &rows);
    if (!is_ok(s)) {
        return s;
    }
    if (rows.empty()) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }
    *out = rows.front();
    return ok_status();
}

Status db_share_delete(DbHandle db, ShareId id, UserId shared_by) noexcept {
    if (!db_handle_valid(db)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    auto& state = detail::db_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (!state.db) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "DELETE FROM shares WHERE id = ? AND shared_by = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(state.db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return detail::status_from_rc(rc);
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id.v));
    sqlite3_bind_int64(stmt, 2, shared_by.v);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return detail::status_from_rc(rc);
    }

    if (sqlite3_changes(state.db) == 0) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }

    return ok_status();
}

Status db_share_find(DbHandle db, ShareTarget target, UserId shared_with, Share* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    auto& state = detail::db_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (!state.db) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    return find_share(state.db, target, shared_with, out);
}

Status db_share_list_for_target(DbHandle db, ShareTarget target, std::vector<Share>* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    auto& state = detail::db_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (!state.db) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql = "SELECT ";
    sql += detail::kShareColumns;
    sql += " FROM shares WHERE ";
    sql += target_column(target);
    sql += " = ? ORDER BY created_at, id";

    return list_shares(state.db, sql, static_cast<sqlite3_int64>(target.id), out);
}

Status db_share_list_for_grantee(DbHandle db, UserId shared_with, std::vector<Share>* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    auto& state = detail::db_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (!state.db) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql = "SELECT ";
    sql += detail::kShareColumns;
    sql += " FROM shares WHERE shared_with = ? ORDER BY created_at DESC, id DESC";

    return list_shares(state.db, sql, shared_with.v, out);
}

} // namespace cabinet::db
