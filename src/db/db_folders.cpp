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
    // ?1 owner, ?2 root folder id, ?3 root path + "/". Prefix comparison via
    // substr so '%' and '_' in names match literally.
    constexpr const char* kSubtreeIds =
        "SELECT id FROM folders WHERE owner_id = ?1 "
        "AND (id = ?2 OR substr(path, 1, length(?3)) = ?3)";

    void bind_subtree(sqlite3_stmt* stmt, const Folder& root) noexcept {
        sqlite3_bind_int64(stmt, 1, root.owner.v);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(root.id.v));
        detail::bind_text(stmt, 3, root.path + "/");
    }

    // Caller holds the state mutex.
    [[nodiscard]] Status load_owned_folder(sqlite3* db, FolderId id, UserId owner, Folder* out) {
        std::string sql = "SELECT ";
        sql += detail::kFolderColumns;
        sql += " FROM folders WHERE id = ? AND owner_id = ?";

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            return detail::status_from_rc(rc);
        }

        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id.v));
        sqlite3_bind_int64(stmt, 2, owner.v);

        rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            detail::read_folder(stmt, out);
            sqlite3_finalize(stmt);
            return ok_status();
        }

        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return detail::status_from_rc(rc);
        }
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }

    [[nodiscard]] Status collect_subtree(sqlite3* db,
                                         const Folder& root,
                                         std::vector<FolderId>* out_folders,
                                         std::vector<File>* out_files) {
        if (out_folders) {
            std::string sql = kSubtreeIds;
            sql += " ORDER BY path";

            sqlite3_stmt* stmt = nullptr;
            int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
            if (rc != SQLITE_OK) {
                return detail::status_from_rc(rc);
            }
            bind_subtree(stmt, root);

            out_folders->clear();
            while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
                out_folders->push_back(FolderId{static_cast<u64>(sqlite3_column_int64(stmt, 0))});
            }
            sqlite3_finalize(stmt);
            if (rc != SQLITE_DONE) {
                return detail::status_from_rc(rc);
            }
        }

        if (out_files) {
            std::string sql = "SELECT ";
            sql += detail::kFileColumns;
            sql += " FROM files WHERE folder_id IN (";
            sql += kSubtreeIds;
            sql += ") ORDER BY id";

            sqlite3_stmt* stmt = nullptr;
            int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
            if (rc != SQLITE_OK) {
                return detail::status_from_rc(rc);
            }
            bind_subtree(stmt, root);

            out_files->clear();
            while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
                File f;
                detail::read_file(stmt, &f);
                out_files->push_back(std::move(f));
            }
            sqlite3_finalize(stmt);
            if (rc != SQLITE_DONE) {
                return detail::status_from_rc(rc);
            }
        }

        return ok_status();
    }

    [[nodiscard]] Status exec_subtree(sqlite3* db, const std::string& sql, const Folder& root) {
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            return detail::status_from_rc(rc);
        }
        bind_subtree(stmt, root);
        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return detail::status_from_rc(rc);
        }
        return ok_status();
    }

    [[nodiscard]] Status list_folders(sqlite3* db, const std::string& sql, UserId owner,
                                      FolderId parent, bool bind_parent,
                                      std::vector<Folder>* out) {
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            return detail::status_from_rc(rc);
        }

        sqlite3_bind_int64(stmt, 1, owner.v);
        if (bind_parent) {
            detail::bind_folder(stmt, 2, parent);
        }

        out->clear();
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            Folder f;
            detail::read_folder(stmt, &f);
            out->push_back(std::move(f));
        }
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            return detail::status_from_rc(rc);
        }
        return ok_status();
    }
}

// ============================================================================
// Folder Operations
// ============================================================================

Status db_folder_create(DbHandle db, const Folder& folder, FolderId* out_id) noexcept {
    if (!db_handle_valid(db) || !out_id || folder.name.empty() || folder.path.empty()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    auto& state = detail::db_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (!state.db) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "INSERT INTO folders (name, parent_id, owner_id, path, created_at, updated_at) "
                      "VALUES (?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(state.db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return detail::status_from_rc(rc);
    }

    detail::bind_text(stmt, 1, folder.name);
    detail::bind_folder(stmt, 2, folder.parent);
    sqlite3_bind_int64(stmt, 3, folder.owner.v);
    detail::bind_text(stmt, 4, folder.path);
    sqlite3_bind_int64(stmt, 5, folder.created_at);
    sqlite3_bind_int64(stmt, 6, folder.updated_at);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return detail::status_from_rc(rc);
    }

    *out_id = FolderId{static_cast<u64>(sqlite3_last_insert_rowid(state.db))};
    return ok_status();
}

Status db_folder_get(DbHandle db, FolderId id, Folder* out) noexcept {
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
    sql += detail::kFolderColumns;
    sql += " FROM folders WHERE id = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(state.db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return detail::status_from_rc(rc);
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id.v));

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        detail::read_folder(stmt, out);
        sqlite3_finalize(stmt);
        return ok_status();
    }

    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return detail::status_from_rc(rc);
    }
    return make_status(StatusDomain::Db, StatusCode::NotFound);
}

Status db_folder_list(DbHandle db, UserId owner, FolderId parent, std::vector<Folder>* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    auto& state = detail::db_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (!state.db) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql = "SELECT ";
    sql += detail::kFolderColumns;
    sql += " FROM folders WHERE owner_id = ?1 AND parent_id IS ?2 ORDER BY name, id";

    return list_folders(state.db, sql, owner, parent, true, out);
}

Status db_folder_list_all(DbHandle db, UserId owner, std::vector<Folder>* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    auto& state = detail::db_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (!state.db) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql = "SELECT ";
    sql += detail::kFolderColumns;
    sql += " FROM folders WHERE owner_id = ?1 ORDER BY path, id";

    return list_folders(state.db, sql, owner, kRootFolder, false, out);
}

Status db_folder_rename_subtree(DbHandle db,
                                FolderId id,
                                UserId owner,
                                const std::string& new_name,
                                Timestamp now,
                                Folder* out) noexcept {
    if (!db_handle_valid(db) || !out || new_name.empty()) {
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

    // Re-read inside the transaction so the prefix rewrite works from the
    // committed path rather than whatever the caller saw earlier.
    Folder current;
    Status s = load_owned_folder(state.db, id, owner, &current);
    if (!is_ok(s)) {
        return s;
    }

    if (current.name == new_name) {
        s = txn.commit();
        if (is_ok(s)) {
            *out = std::move(current);
        }
        return s;
    }

    const std::string old_path = current.path;
    const auto cut = old_path.rfind('/');
    const std::string new_path =
        (cut == std::string::npos ? std::string("/") : old_path.substr(0, cut + 1)) + new_name;

    const char* self_sql = "UPDATE folders SET name = ?, path = ?, updated_at = ? "
                           "WHERE id = ? AND owner_id = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(state.db, self_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return detail::status_from_rc(rc);
    }

    detail::bind_text(stmt, 1, new_name);
    detail::bind_text(stmt, 2, new_path);
    sqlite3_bind_int64(stmt, 3, now);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(id.v));
    sqlite3_bind_int64(stmt, 5, owner.v);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return detail::status_from_rc(rc);
    }

    const char* subtree_sql =
        "UPDATE folders SET path = ?1 || substr(path, length(?2) + 1), updated_at = ?3 "
        "WHERE owner_id = ?4 AND substr(path, 1, length(?2) + 1) = ?2 || '/'";

    rc = sqlite3_prepare_v2(state.db, subtree_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return detail::status_from_rc(rc);
    }

    detail::bind_text(stmt, 1, new_path);
    detail::bind_text(stmt, 2, old_path);
    sqlite3_bind_int64(stmt, 3, now);
    sqlite3_bind_int64(stmt, 4, owner.v);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return detail::status_from_rc(rc);
    }
    const int descendants = sqlite3_changes(state.db);

    s = txn.commit();
    if (!is_ok(s)) {
        return s;
    }

    CABINET_LOG_DEBUG << "db: folder " << id.v << " renamed, " << descendants
                      << " descendant paths rewritten";

    current.name = new_name;
    current.path = new_path;
    current.updated_at = now;
    *out = std::move(current);
    return ok_status();
}

Status db_folder_delete_subtree(DbHandle db,
                                FolderId id,
                                UserId owner,
                                std::vector<FolderId>* out_folders,
                                std::vector<File>* out_files) noexcept {
    if (!db_handle_valid(db) || !out_folders || !out_files) {
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

    Folder root;
    Status s = load_owned_folder(state.db, id, owner, &root);
    if (!is_ok(s)) {
        return s;
    }

    std::vector<FolderId> folders;
    std::vector<File> files;
    s = collect_subtree(state.db, root, &folders, &files);
    if (!is_ok(s)) {
        return s;
    }

    std::string shares_sql = "DELETE FROM shares WHERE folder_id IN (";
    shares_sql += kSubtreeIds;
    shares_sql += ") OR file_id IN (SELECT id FROM files WHERE folder_id IN (";
    shares_sql += kSubtreeIds;
    shares_sql += "))";
    s = exec_subtree(state.db, shares_sql, root);
    if (!is_ok(s)) {
        return s;
    }

    std::string files_sql = "DELETE FROM files WHERE folder_id IN (";
    files_sql += kSubtreeIds;
    files_sql += ")";
    s = exec_subtree(state.db, files_sql, root);
    if (!is_ok(s)) {
        return s;
    }

    const std::string folders_sql =
        "DELETE FROM folders WHERE owner_id = ?1 "
        "AND (id = ?2 OR substr(path, 1, length(?3)) = ?3)";
    s = exec_subtree(state.db, folders_sql, root);
    if (!is_ok(s)) {
        return s;
    }

    s = txn.commit();
    if (!is_ok(s)) {
        return s;
    }

    *out_folders = std::move(folders);
    *out_files = std::move(files);
    return ok_status();
}

} // namespace cabinet::db
