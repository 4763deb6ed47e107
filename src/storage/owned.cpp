#include "owned.hpp"

#include <utility>

#include "cabinet/core/log.hpp"

namespace cabinet::storage::detail {

using namespace cabinet::core;

Status load_owned_folder(const StorageContext& ctx, FolderId id, UserId owner, Folder* out) noexcept {
    Folder f;
    Status s = cabinet::db::db_folder_get(ctx.db, id, &f);
    if (!is_ok(s)) {
        return s;
    }
    if (f.owner != owner) {
        return make_status(StatusDomain::Storage, StatusCode::NotFound);
    }
    *out = std::move(f);
    return ok_status();
}

Status load_owned_file(const StorageContext& ctx, FileId id, UserId owner, File* out) noexcept {
    File f;
    Status s = cabinet::db::db_file_get(ctx.db, id, &f);
    if (!is_ok(s)) {
        return s;
    }
    if (f.owner != owner) {
        return make_status(StatusDomain::Storage, StatusCode::NotFound);
    }
    *out = std::move(f);
    return ok_status();
}

bool remove_blob_logged(const StorageContext& ctx, const File& file) noexcept {
    const Status s = ctx.blobs->remove(file.blob_key);
    if (!is_ok(s)) {
        CABINET_LOG_WARN << "storage: blob delete failed for file " << file.id.v
                         << " (" << status_domain_name(s.domain) << "/" << status_code_name(s.code)
                         << "), metadata removed anyway";
        return false;
    }
    return true;
}

} // namespace cabinet::storage::detail
