#include "cabinet/db/db.hpp"
#include "db_state.hpp"

#include <sqlite3.h>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "cabinet/core/log.hpp"

namespace cabinet::db {

using namespace cabinet::core;

namespace {
    // parent_id/folder_id foreign keys are deferred so a subtree can be
    // removed in any statement order inside one transaction.
    constexpr const char* kSchemaSQL = R"SQL(
        PRAGMA foreign_keys = ON;

        CREATE TABLE IF NOT EXISTS users (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            first_name TEXT NOT NULL DEFAULT '',
            last_name TEXT NOT NULL DEFAULT '',
            email TEXT NOT NULL UNIQUE,
            active INTEGER NOT NULL DEFAULT 1,
            created_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS folders (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL,
            parent_id INTEGER REFERENCES folders(id) DEFERRABLE INITIALLY DEFERRED,
            owner_id INTEGER NOT NULL,
            path TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );
        CREATE UNIQUE INDEX IF NOT EXISTS idx_folders_sibling
            ON folders(owner_id, IFNULL(parent_id, 0), name);
        CREATE INDEX IF NOT EXISTS idx_folders_owner_path ON folders(owner_id, path);

        CREATE TABLE IF NOT EXISTS files (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL,
            folder_id INTEGER REFERENCES folders(id) DEFERRABLE INITIALLY DEFERRED,
            owner_id INTEGER NOT NULL,
            blob_key TEXT NOT NULL UNIQUE,
            size_bytes INTEGER NOT NULL,
            file_type TEXT NOT NULL DEFAULT '',
            mime_type TEXT NOT NULL DEFAULT '',
            is_public INTEGER NOT NULL DEFAULT 0,
            public_token TEXT,
            public_expires_at INTEGER,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            CHECK ((is_public = 1) = (public_token IS NOT NULL)),
            CHECK (is_public = 1 OR public_expires_at IS NULL)
        );
        CREATE UNIQUE INDEX IF NOT EXISTS idx_files_public_token ON files(public_token);
        CREATE INDEX IF NOT EXISTS idx_files_owner_folder ON files(owner_id, folder_id);

        CREATE TABLE IF NOT EXISTS shares (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            file_id INTEGER REFERENCES files(id) DEFERRABLE INITIALLY DEFERRED,
            folder_id INTEGER REFERENCES folders(id) DEFERRABLE INITIALLY DEFERRED,
            shared_with INTEGER NOT NULL REFERENCES users(id),
            shared_by INTEGER NOT NULL,
            permission INTEGER NOT NULL CHECK (permission IN (0, 1)),
            created_at INTEGER NOT NULL,
            CHECK ((file_id IS NULL) <> (folder_id IS NULL)),
            CHECK (shared_with <> shared_by)
        );
        CREATE UNIQUE INDEX IF NOT EXISTS idx_shares_file_grantee ON shares(file_id, shared_with);
        CREATE UNIQUE INDEX IF NOT EXISTS idx_shares_folder_grantee ON shares(folder_id, shared_with);
        CREATE INDEX IF NOT EXISTS idx_shares_grantee ON shares(shared_with);
    )SQL";

    detail::DbState g_db_state;
}

namespace detail {

DbState& db_state() noexcept {
    return g_db_state;
}

Status status_from_rc(int rc) noexcept {
    switch (rc) {
        case SQLITE_CONSTRAINT_UNIQUE:
        case SQLITE_CONSTRAINT_PRIMARYKEY:
            return make_status(StatusDomain::Db, StatusCode::Conflict, static_cast<u32>(rc));
        case SQLITE_CONSTRAINT_FOREIGNKEY:
            return make_status(StatusDomain::Db, StatusCode::NotFound, static_cast<u32>(rc));
        case SQLITE_CONSTRAINT_CHECK:
        case SQLITE_CONSTRAINT_NOTNULL:
            return make_status(StatusDomain::Db, StatusCode::Invalid, static_cast<u32>(rc));
        default:
            break;
    }
    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return make_status(StatusDomain::Db, StatusCode::Busy, static_cast<u32>(rc));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return make_status(StatusDomain::Db, StatusCode::Corrupt, static_cast<u32>(rc));
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
            return make_status(StatusDomain::Db, StatusCode::Io, static_cast<u32>(rc));
        default:
            return make_status(StatusDomain::Db, StatusCode::Unknown, static_cast<u32>(rc));
    }
}

bool exec_sql(sqlite3* db, const char* sql) noexcept {
    if (!db || !sql) return false;
    char* err_msg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
    if (err_msg) sqlite3_free(err_msg);
    return rc == SQLITE_OK;
}

void bind_text(sqlite3_stmt* stmt, int idx, const std::string& value) noexcept {
    sqlite3_bind_text(stmt, idx, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void bind_folder(sqlite3_stmt* stmt, int idx, FolderId folder) noexcept {
    if (folder_is_root(folder)) {
        sqlite3_bind_null(stmt, idx);
    } else {
        sqlite3_bind_int64(stmt, idx, static_cast<sqlite3_int64>(folder.v));
    }
}

std::string column_string(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    if (!text) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

namespace {
    [[nodiscard]] FolderId column_folder(sqlite3_stmt* stmt, int col) noexcept {
        if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
            return kRootFolder;
        }
        return FolderId{static_cast<u64>(sqlite3_column_int64(stmt, col))};
    }
}

void read_user(sqlite3_stmt* stmt, User* out) {
    out->id = UserId{static_cast<u32>(sqlite3_column_int64(stmt, 0))};
    out->first_name = column_string(stmt, 1);
    out->last_name = column_string(stmt, 2);
    out->email = column_string(stmt, 3);
    out->active = sqlite3_column_int(stmt, 4) != 0;
    out->created_at = sqlite3_column_int64(stmt, 5);
}

void read_folder(sqlite3_stmt* stmt, Folder* out) {
    out->id = FolderId{static_cast<u64>(sqlite3_column_int64(stmt, 0))};
    out->name = column_string(stmt, 1);
    out->parent = column_folder(stmt, 2);
    out->owner = UserId{static_cast<u32>(sqlite3_column_int64(stmt, 3))};
    out->path = column_string(stmt, 4);
    out->created_at = sqlite3_column_int64(stmt, 5);
    out->updated_at = sqlite3_column_int64(stmt, 6);
}

void read_file(sqlite3_stmt* stmt, File* out) {
    out->id = FileId{static_cast<u64>(sqlite3_column_int64(stmt, 0))};
    out->name = column_string(stmt, 1);
    out->folder = column_folder(stmt, 2);
    out->owner = UserId{static_cast<u32>(sqlite3_column_int64(stmt, 3))};
    out->blob_key = column_string(stmt, 4);
    out->size_bytes = static_cast<u64>(sqlite3_column_int64(stmt, 5));
    out->file_type = column_string(stmt, 6);
    out->mime_type = column_string(stmt, 7);
    out->is_public = sqlite3_column_int(stmt, 8) != 0;
    out->public_token = column_string(stmt, 9);
    out->public_expires_at = sqlite3_column_type(stmt, 10) == SQLITE_NULL
        ? Timestamp{0}
        : sqlite3_column_int64(stmt, 10);
    out->created_at = sqlite3_column_int64(stmt, 11);
    out->updated_at = sqlite3_column_int64(stmt, 12);
}

void read_share(sqlite3_stmt* stmt, Share* out) {
    out->id = ShareId{static_cast<u64>(sqlite3_column_int64(stmt, 0))};
    out->file = sqlite3_column_type(stmt, 1) == SQLITE_NULL
        ? FileId::invalid()
        : FileId{static_cast<u64>(sqlite3_column_int64(stmt, 1))};
    out->folder = sqlite3_column_type(stmt, 2) == SQLITE_NULL
        ? FolderId::invalid()
        : FolderId{static_cast<u64>(sqlite3_column_int64(stmt, 2))};
    out->shared_with = UserId{static_cast<u32>(sqlite3_column_int64(stmt, 3))};
    out->shared_by = UserId{static_cast<u32>(sqlite3_column_int64(stmt, 4))};
    out->permission = sqlite3_column_int(stmt, 5) == 1 ? Permission::Edit : Permission::View;
    out->created_at = sqlite3_column_int64(stmt, 6);
}

ScopedTxn::ScopedTxn(sqlite3* db) noexcept
    : db_(db), active_(exec_sql(db, "BEGIN IMMEDIATE")) {}

ScopedTxn::~ScopedTxn() {
    if (active_) {
        if (!exec_sql(db_, "ROLLBACK")) {
            CABINET_LOG_ERROR << "db: rollback failed: " << sqlite3_errmsg(db_);
        }
    }
}

Status ScopedTxn::commit() noexcept {
    if (!active_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    char* err_msg = nullptr;
    const int rc = sqlite3_exec(db_, "COMMIT", nullptr, nullptr, &err_msg);
    if (err_msg) sqlite3_free(err_msg);
    if (rc != SQLITE_OK) {
        // A deferred foreign key failing at COMMIT leaves the transaction open.
        return status_from_rc(sqlite3_extended_errcode(db_));
    }
    active_ = false;
    return ok_status();
}

} // namespace detail

// ============================================================================
// Database Lifecycle
// ============================================================================

Status db_open(const DbConfig& cfg, DbHandle* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(g_db_state.mutex);

    // Close existing connection if any
    if (g_db_state.db) {
        sqlite3_close(g_db_state.db);
        g_db_state.db = nullptr;
    }

    const char* path = cfg.path ? cfg.path : ":memory:";
    int rc = sqlite3_open(path, &g_db_state.db);
    if (rc != SQLITE_OK) {
        CABINET_LOG_ERROR << "db: cannot open " << path << ": "
                          << (g_db_state.db ? sqlite3_errmsg(g_db_state.db) : "out of memory");
        if (g_db_state.db) {
            sqlite3_close(g_db_state.db);
            g_db_state.db = nullptr;
        }
        return make_status(StatusDomain::Db, StatusCode::Io, static_cast<u32>(rc));
    }

    sqlite3_extended_result_codes(g_db_state.db, 1);
    sqlite3_busy_timeout(g_db_state.db, 5000);

    const char* journal_mode = cfg.journal_mode;
    if (!journal_mode || journal_mode[0] == '\0') {
        journal_mode = "WAL";
    }
    std::string journal_sql = "PRAGMA journal_mode=";
    journal_sql += journal_mode;
    if (!detail::exec_sql(g_db_state.db, journal_sql.c_str())) {
        // In-memory databases reject WAL; keep going with the default journal.
        CABINET_LOG_DEBUG << "db: journal_mode " << journal_mode << " not applied";
    }

    (void)detail::exec_sql(g_db_state.db, "PRAGMA synchronous=NORMAL");
    (void)detail::exec_sql(g_db_state.db, "PRAGMA temp_store=MEMORY");

    char* err_msg = nullptr;
    rc = sqlite3_exec(g_db_state.db, kSchemaSQL, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        CABINET_LOG_ERROR << "db: schema failed: " << (err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
        sqlite3_close(g_db_state.db);
        g_db_state.db = nullptr;
        return make_status(StatusDomain::Db, StatusCode::Unknown, static_cast<u32>(rc));
    }

    CABINET_LOG_DEBUG << "db: opened " << path;
    out->id = 1;
    return ok_status();
}

Status db_close(DbHandle db) noexcept {
    if (!db_handle_valid(db)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(g_db_state.mutex);

    if (g_db_state.db) {
        sqlite3_close(g_db_state.db);
        g_db_state.db = nullptr;
    }

    return ok_status();
}

// ============================================================================
// User Operations
// ============================================================================

Status db_user_create(DbHandle db, const User& user, UserId* out_id) noexcept {
    if (!db_handle_valid(db) || !out_id || user.email.empty()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(g_db_state.mutex);

    if (!g_db_state.db) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "INSERT INTO users (first_name, last_name, email, active, created_at) "
                      "VALUES (?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(g_db_state.db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return detail::status_from_rc(rc);
    }

    detail::bind_text(stmt, 1, user.first_name);
    detail::bind_text(stmt, 2, user.last_name);
    detail::bind_text(stmt, 3, user.email);
    sqlite3_bind_int(stmt, 4, user.active ? 1 : 0);
    sqlite3_bind_int64(stmt, 5, user.created_at);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return detail::status_from_rc(rc);
    }

    *out_id = UserId{static_cast<u32>(sqlite3_last_insert_rowid(g_db_state.db))};
    return ok_status();
}

Status db_user_get(DbHandle db, UserId id, User* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (!id.is_valid()) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }

    std::lock_guard<std::mutex> lock(g_db_state.mutex);

    if (!g_db_state.db) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "SELECT id, first_name, last_name, email, active, created_at "
                      "FROM users WHERE id = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(g_db_state.db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return detail::status_from_rc(rc);
    }

    sqlite3_bind_int64(stmt, 1, id.v);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        detail::read_user(stmt, out);
        sqlite3_finalize(stmt);
        return ok_status();
    }

    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return detail::status_from_rc(rc);
    }
    return make_status(StatusDomain::Db, StatusCode::NotFound);
}

Status db_user_list_active(DbHandle db, std::vector<User>* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(g_db_state.mutex);

    if (!g_db_state.db) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "SELECT id, first_name, last_name, email, active, created_at "
                      "FROM users WHERE active = 1 ORDER BY first_name, last_name, id";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(g_db_state.db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return detail::status_from_rc(rc);
    }

    out->clear();
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        User u;
        detail::read_user(stmt, &u);
        out->push_back(std::move(u));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return detail::status_from_rc(rc);
    }
    return ok_status();
}

// ============================================================================
// Stats
// ============================================================================

Status db_stats(DbHandle db, UserId owner, DbStats* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(g_db_state.mutex);

    if (!g_db_state.db) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "SELECT "
                      "(SELECT IFNULL(SUM(size_bytes), 0) FROM files WHERE owner_id = ?1), "
                      "(SELECT COUNT(*) FROM files WHERE owner_id = ?1), "
                      "(SELECT COUNT(*) FROM folders WHERE owner_id = ?1)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(g_db_state.db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return detail::status_from_rc(rc);
    }

    sqlite3_bind_int64(stmt, 1, owner.v);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        out->total_bytes = static_cast<u64>(sqlite3_column_int64(stmt, 0));
        out->file_count = static_cast<u64>(sqlite3_column_int64(stmt, 1));
        out->folder_count = static_cast<u64>(sqlite3_column_int64(stmt, 2));
        sqlite3_finalize(stmt);
        return ok_status();
    }

    sqlite3_finalize(stmt);
    return detail::status_from_rc(rc);
}

} // namespace cabinet::db
