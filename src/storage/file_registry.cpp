#include "cabinet/storage/file_registry.hpp"

#include <utility>

#include "cabinet/core/log.hpp"
#include "cabinet/storage/mime.hpp"
#include "cabinet/storage/sharing.hpp"
#include "owned.hpp"

namespace cabinet::storage {

using namespace cabinet::core;

namespace {
    [[nodiscard]] Status invalid() noexcept {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
}

Status file_upload(const StorageContext& ctx, UserId owner, const UploadRequest& req, File* out) noexcept {
    if (!context_valid(ctx) || !out || !owner.is_valid() || !cabinet::blob::buffer_ok(req.content)) {
        return invalid();
    }

    if (req.content.len > ctx.max_upload_bytes) {
        return make_status(StatusDomain::Storage, StatusCode::TooLarge);
    }

    std::string name;
    Status s = normalize_name(req.name, &name);
    if (!is_ok(s)) {
        return s;
    }

    if (!folder_is_root(req.folder)) {
        Folder folder;
        s = detail::load_owned_folder(ctx, req.folder, owner, &folder);
        if (!is_ok(s)) {
            return detail::missing_ref(s, kMissingFolderRef);
        }
    }

    File file;
    file.name = name;
    file.folder = req.folder;
    file.owner = owner;
    file.size_bytes = req.content.len;
    file.file_type = file_extension(name);
    file.mime_type = req.mime_type.empty() ? std::string("application/octet-stream") : req.mime_type;

    s = ctx.blobs->put(owner, req.content, &file.blob_key);
    if (!is_ok(s)) {
        CABINET_LOG_ERROR << "storage: blob write failed for user " << owner.v << " ("
                          << status_code_name(s.code) << ")";
        return detail::backend_unavailable(s);
    }

    file.created_at = ctx.now();
    file.updated_at = file.created_at;

    s = cabinet::db::db_file_create(ctx.db, file, &file.id);
    if (!is_ok(s)) {
        CABINET_LOG_ERROR << "storage: file row insert failed for user " << owner.v << " ("
                          << status_code_name(s.code) << "), reclaiming blob";
        const Status cleanup = ctx.blobs->remove(file.blob_key);
        if (!is_ok(cleanup)) {
            CABINET_LOG_WARN << "storage: orphaned blob left behind for user " << owner.v;
        }
        return s;
    }

    CABINET_LOG_INFO << "storage: user " << owner.v << " uploaded file " << file.id.v
                     << " (" << file.size_bytes << " bytes)";
    *out = std::move(file);
    return ok_status();
}

Status file_rename(const StorageContext& ctx, FileId id, UserId owner, const std::string& new_name,
                   File* out) noexcept {
    if (!context_valid(ctx) || !out) {
        return invalid();
    }

    std::string name;
    Status s = normalize_name(new_name, &name);
    if (!is_ok(s)) {
        return s;
    }

    File file;
    s = detail::load_owned_file(ctx, id, owner, &file);
    if (!is_ok(s)) {
        return s;
    }

    const Timestamp now = ctx.now();
    const std::string file_type = file_extension(name);
    s = cabinet::db::db_file_rename(ctx.db, id, owner, name, file_type, now);
    if (!is_ok(s)) {
        return s;
    }

    file.name = name;
    file.file_type = file_type;
    file.updated_at = now;
    *out = std::move(file);
    return ok_status();
}

Status file_move(const StorageContext& ctx, FileId id, UserId owner, FolderId folder, File* out) noexcept {
    if (!context_valid(ctx) || !out) {
        return invalid();
    }

    File file;
    Status s = detail::load_owned_file(ctx, id, owner, &file);
    if (!is_ok(s)) {
        return s;
    }

    if (!folder_is_root(folder)) {
        Folder dest;
        s = detail::load_owned_folder(ctx, folder, owner, &dest);
        if (!is_ok(s)) {
            return detail::missing_ref(s, kMissingFolderRef);
        }
    }

    const Timestamp now = ctx.now();
    s = cabinet::db::db_file_move(ctx.db, id, owner, folder, now);
    if (!is_ok(s)) {
        return s;
    }

    file.folder = folder;
    file.updated_at = now;
    *out = std::move(file);
    return ok_status();
}

Status file_delete(const StorageContext& ctx, FileId id, UserId owner) noexcept {
    if (!context_valid(ctx)) {
        return invalid();
    }

    File file;
    Status s = cabinet::db::db_file_delete(ctx.db, id, owner, &file);
    if (!is_ok(s)) {
        return s;
    }

    (void)detail::remove_blob_logged(ctx, file);

    CABINET_LOG_INFO << "storage: user " << owner.v << " deleted file " << id.v;
    return ok_status();
}

Status file_list(const StorageContext& ctx, UserId owner, FolderId folder, std::vector<File>* out) noexcept {
    if (!context_valid(ctx) || !out) {
        return invalid();
    }
    return cabinet::db::db_file_list(ctx.db, owner, folder, out);
}

Status file_download_target(const StorageContext& ctx, FileId id, UserId requester,
                            DownloadTarget* out) noexcept {
    if (!context_valid(ctx) || !out) {
        return invalid();
    }

    File file;
    Status s = cabinet::db::db_file_get(ctx.db, id, &file);
    if (!is_ok(s)) {
        return s;
    }

    if (file.owner != requester) {
        bool allowed = false;
        s = share_can_access(ctx, ShareTarget::of_file(id), requester, &allowed);
        if (!is_ok(s)) {
            return s;
        }
        if (!allowed) {
            return make_status(StatusDomain::Storage, StatusCode::PermissionDenied);
        }
    }

    cabinet::blob::SignedDownload signed_url;
    s = ctx.blobs->sign_download(file.blob_key, ctx.now(), &signed_url);
    if (!is_ok(s)) {
        CABINET_LOG_ERROR << "storage: signing failed for file " << id.v << " ("
                          << status_code_name(s.code) << ")";
        return detail::backend_unavailable(s);
    }

    out->url = std::move(signed_url.url);
    out->expires_at = signed_url.expires_at;
    out->file_name = file.name;
    return ok_status();
}

Status storage_stats(const StorageContext& ctx, UserId owner, StorageStats* out) noexcept {
    if (!context_valid(ctx) || !out) {
        return invalid();
    }

    cabinet::db::DbStats raw;
    Status s = cabinet::db::db_stats(ctx.db, owner, &raw);
    if (!is_ok(s)) {
        return s;
    }

    out->total_bytes = raw.total_bytes;
    out->file_count = raw.file_count;
    out->folder_count = raw.folder_count;
    return ok_status();
}

} // namespace cabinet::storage
