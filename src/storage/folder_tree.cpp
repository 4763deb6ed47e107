#include "cabinet/storage/folder_tree.hpp"

#include <algorithm>
#include <utility>

#include "cabinet/core/log.hpp"
#include "owned.hpp"

namespace cabinet::storage {

using namespace cabinet::core;

namespace {
    // Parent links are acyclic by construction; the bound only protects the
    // walk against a corrupted table.
    constexpr std::size_t kMaxDepth = 4096;

    [[nodiscard]] Status invalid() noexcept {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
}

Status folder_create(const StorageContext& ctx, UserId owner, const std::string& name,
                     FolderId parent, Folder* out) noexcept {
    if (!context_valid(ctx) || !out || !owner.is_valid()) {
        return invalid();
    }

    std::string clean;
    Status s = normalize_name(name, &clean);
    if (!is_ok(s)) {
        return s;
    }

    Folder folder;
    folder.name = clean;
    folder.owner = owner;
    folder.parent = parent;

    if (folder_is_root(parent)) {
        folder.path = "/" + clean;
    } else {
        Folder parent_row;
        s = detail::load_owned_folder(ctx, parent, owner, &parent_row);
        if (!is_ok(s)) {
            return detail::missing_ref(s, kMissingFolderRef);
        }
        folder.path = parent_row.path + "/" + clean;
    }

    folder.created_at = ctx.now();
    folder.updated_at = folder.created_at;

    // The sibling index rejects a duplicate name with Conflict.
    s = cabinet::db::db_folder_create(ctx.db, folder, &folder.id);
    if (!is_ok(s)) {
        return s;
    }

    CABINET_LOG_INFO << "storage: user " << owner.v << " created folder " << folder.id.v;
    *out = std::move(folder);
    return ok_status();
}

Status folder_rename(const StorageContext& ctx, FolderId id, UserId owner,
                     const std::string& new_name, Folder* out) noexcept {
    if (!context_valid(ctx) || !out || !owner.is_valid()) {
        return invalid();
    }

    std::string clean;
    Status s = normalize_name(new_name, &clean);
    if (!is_ok(s)) {
        return s;
    }

    s = cabinet::db::db_folder_rename_subtree(ctx.db, id, owner, clean, ctx.now(), out);
    if (!is_ok(s)) {
        return s;
    }

    CABINET_LOG_INFO << "storage: user " << owner.v << " renamed folder " << id.v;
    return ok_status();
}

Status folder_delete(const StorageContext& ctx, FolderId id, UserId owner,
                     FolderDeleteReport* report) noexcept {
    if (!context_valid(ctx) || !owner.is_valid()) {
        return invalid();
    }

    // Metadata commits first; only files the transaction removed lose their blob.
    std::vector<FolderId> folders;
    std::vector<File> removed;
    Status s = cabinet::db::db_folder_delete_subtree(ctx.db, id, owner, &folders, &removed);
    if (!is_ok(s)) {
        return s;
    }

    FolderDeleteReport r;
    for (const File& f : removed) {
        if (!detail::remove_blob_logged(ctx, f)) {
            ++r.blob_failures;
        }
    }

    r.folders_removed = folders.size();
    r.files_removed = removed.size();

    CABINET_LOG_INFO << "storage: user " << owner.v << " deleted folder " << id.v << " ("
                     << r.folders_removed << " folders, " << r.files_removed << " files, "
                     << r.blob_failures << " blob failures)";

    if (report) {
        *report = r;
    }
    return ok_status();
}

Status folder_get_with_breadcrumb(const StorageContext& ctx, FolderId id, UserId owner,
                                  FolderView* out) noexcept {
    if (!context_valid(ctx) || !out) {
        return invalid();
    }

    FolderView view;
    Status s = detail::load_owned_folder(ctx, id, owner, &view.folder);
    if (!is_ok(s)) {
        return s;
    }

    view.breadcrumb.push_back(Breadcrumb{view.folder.id, view.folder.name});
    FolderId next = view.folder.parent;
    while (!folder_is_root(next)) {
        if (view.breadcrumb.size() >= kMaxDepth) {
            return make_status(StatusDomain::Storage, StatusCode::Corrupt);
        }
        Folder ancestor;
        s = cabinet::db::db_folder_get(ctx.db, next, &ancestor);
        if (!is_ok(s)) {
            return s.code == StatusCode::NotFound
                ? make_status(StatusDomain::Storage, StatusCode::Corrupt)
                : s;
        }
        view.breadcrumb.push_back(Breadcrumb{ancestor.id, ancestor.name});
        next = ancestor.parent;
    }
    std::reverse(view.breadcrumb.begin(), view.breadcrumb.end());

    *out = std::move(view);
    return ok_status();
}

Status folder_list(const StorageContext& ctx, UserId owner, FolderId parent,
                   std::vector<Folder>* out) noexcept {
    if (!context_valid(ctx) || !out) {
        return invalid();
    }
    return cabinet::db::db_folder_list(ctx.db, owner, parent, out);
}

Status folder_list_all(const StorageContext& ctx, UserId owner, std::vector<Folder>* out) noexcept {
    if (!context_valid(ctx) || !out) {
        return invalid();
    }
    return cabinet::db::db_folder_list_all(ctx.db, owner, out);
}

} // namespace cabinet::storage
