#include "cabinet/storage/sharing.hpp"

#include <utility>

#include "cabinet/core/log.hpp"
#include "owned.hpp"

namespace cabinet::storage {

using namespace cabinet::core;

namespace {
    [[nodiscard]] Status invalid() noexcept {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    [[nodiscard]] Status target_owner(const StorageContext& ctx, ShareTarget target, UserId* out) {
        if (target.kind == TargetKind::File) {
            File f;
            Status s = cabinet::db::db_file_get(ctx.db, target.file(), &f);
            if (!is_ok(s)) {
                return s;
            }
            *out = f.owner;
        } else {
            Folder f;
            Status s = cabinet::db::db_folder_get(ctx.db, target.folder(), &f);
            if (!is_ok(s)) {
                return s;
            }
            *out = f.owner;
        }
        return ok_status();
    }

    // A missing user renders as "Unknown" rather than failing the listing.
    [[nodiscard]] Status load_user_or_blank(const StorageContext& ctx, UserId id, User* out) {
        Status s = cabinet::db::db_user_get(ctx.db, id, out);
        if (s.code == StatusCode::NotFound) {
            *out = User{};
            return ok_status();
        }
        return s;
    }
}

Status share_grant(const StorageContext& ctx, UserId owner, ShareTarget target, UserId grantee,
                   Permission permission, Share* out, bool* created) noexcept {
    if (!context_valid(ctx) || !out || !owner.is_valid() || !grantee.is_valid()) {
        return invalid();
    }
    if (grantee == owner) {
        return invalid();
    }

    User grantee_row;
    Status s = cabinet::db::db_user_get(ctx.db, grantee, &grantee_row);
    if (!is_ok(s)) {
        return detail::missing_ref(s, kMissingUserRef);
    }

    UserId actual_owner;
    s = target_owner(ctx, target, &actual_owner);
    if (!is_ok(s)) {
        return s;
    }
    if (actual_owner != owner) {
        return make_status(StatusDomain::Storage, StatusCode::NotFound);
    }

    Share before;
    const bool existed = is_ok(cabinet::db::db_share_find(ctx.db, target, grantee, &before));

    Share share;
    share.file = target.file();
    share.folder = target.folder();
    share.shared_with = grantee;
    share.shared_by = owner;
    share.permission = permission;
    share.created_at = ctx.now();

    s = cabinet::db::db_share_upsert(ctx.db, share, out);
    if (!is_ok(s)) {
        return s;
    }

    CABINET_LOG_INFO << "storage: user " << owner.v << (existed ? " updated" : " granted")
                     << " share " << out->id.v << " to user " << grantee.v
                     << " (" << permission_name(permission) << ")";
    if (created) {
        *created = !existed;
    }
    return ok_status();
}

Status share_revoke(const StorageContext& ctx, ShareId id, UserId requester) noexcept {
    if (!context_valid(ctx)) {
        return invalid();
    }

    Status s = cabinet::db::db_share_delete(ctx.db, id, requester);
    if (!is_ok(s)) {
        return s;
    }

    CABINET_LOG_INFO << "storage: user " << requester.v << " revoked share " << id.v;
    return ok_status();
}

Status share_list_shared_with_me(const StorageContext& ctx, UserId principal,
                                 std::vector<SharedItem>* out) noexcept {
    if (!context_valid(ctx) || !out) {
        return invalid();
    }

    std::vector<Share> shares;
    Status s = cabinet::db::db_share_list_for_grantee(ctx.db, principal, &shares);
    if (!is_ok(s)) {
        return s;
    }

    out->clear();
    for (const Share& sh : shares) {
        SharedItem item;
        item.share = sh;

        UserId owner;
        if (sh.file.is_valid()) {
            s = cabinet::db::db_file_get(ctx.db, sh.file, &item.file);
            owner = item.file.owner;
        } else {
            s = cabinet::db::db_folder_get(ctx.db, sh.folder, &item.folder);
            owner = item.folder.owner;
        }
        if (s.code == StatusCode::NotFound) {
            // Target removed after the share list was read.
            continue;
        }
        if (!is_ok(s)) {
            return s;
        }

        s = load_user_or_blank(ctx, owner, &item.owner);
        if (!is_ok(s)) {
            return s;
        }
        s = load_user_or_blank(ctx, sh.shared_by, &item.shared_by);
        if (!is_ok(s)) {
            return s;
        }
        out->push_back(std::move(item));
    }
    return ok_status();
}

Status share_list_for_target(const StorageContext& ctx, ShareTarget target, UserId owner,
                             std::vector<ShareEntry>* out) noexcept {
    if (!context_valid(ctx) || !out) {
        return invalid();
    }

    UserId actual_owner;
    Status s = target_owner(ctx, target, &actual_owner);
    if (!is_ok(s)) {
        return s;
    }
    if (actual_owner != owner) {
        return make_status(StatusDomain::Storage, StatusCode::NotFound);
    }

    std::vector<Share> shares;
    s = cabinet::db::db_share_list_for_target(ctx.db, target, &shares);
    if (!is_ok(s)) {
        return s;
    }

    out->clear();
    for (const Share& sh : shares) {
        ShareEntry entry;
        entry.share = sh;
        s = load_user_or_blank(ctx, sh.shared_with, &entry.shared_with);
        if (!is_ok(s)) {
            return s;
        }
        out->push_back(std::move(entry));
    }
    return ok_status();
}

Status share_can_access(const StorageContext& ctx, ShareTarget target, UserId principal, bool* out) noexcept {
    if (!context_valid(ctx) || !out) {
        return invalid();
    }

    UserId owner;
    Status s = target_owner(ctx, target, &owner);
    if (!is_ok(s)) {
        return s;
    }
    if (owner == principal) {
        *out = true;
        return ok_status();
    }

    Share share;
    s = cabinet::db::db_share_find(ctx.db, target, principal, &share);
    if (is_ok(s)) {
        *out = true;
        return ok_status();
    }
    if (s.code == StatusCode::NotFound) {
        *out = false;
        return ok_status();
    }
    return s;
}

} // namespace cabinet::storage
