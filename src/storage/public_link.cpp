#include "cabinet/storage/public_link.hpp"

#include <utility>

#include "cabinet/core/log.hpp"
#include "cabinet/security/token.hpp"
#include "owned.hpp"

namespace cabinet::storage {

using namespace cabinet::core;

namespace {
    // A token collision on set_public is retried with a fresh token.
    constexpr int kIssueAttempts = 3;

    [[nodiscard]] Status invalid() noexcept {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    [[nodiscard]] Status load_live_link(const StorageContext& ctx, const std::string& token, File* out) {
        if (!cabinet::security::token_well_formed(token)) {
            return make_status(StatusDomain::Storage, StatusCode::NotFound);
        }

        File file;
        Status s = cabinet::db::db_file_get_by_token(ctx.db, token, &file);
        if (!is_ok(s)) {
            return s;
        }

        if (file.public_expires_at != 0 && ctx.now() > file.public_expires_at) {
            return make_status(StatusDomain::Storage, StatusCode::Gone);
        }

        *out = std::move(file);
        return ok_status();
    }
}

Status public_link_issue(const StorageContext& ctx, FileId id, UserId owner, Timestamp ttl_seconds,
                         PublicLink* out) noexcept {
    if (!context_valid(ctx) || !out || ttl_seconds < 0 || ttl_seconds > kMaxLinkTtlSeconds) {
        return invalid();
    }

    File file;
    Status s = detail::load_owned_file(ctx, id, owner, &file);
    if (!is_ok(s)) {
        return s;
    }

    const Timestamp now = ctx.now();
    const Timestamp expires_at = ttl_seconds == 0 ? Timestamp{0} : now + ttl_seconds;

    std::string token;
    for (int attempt = 0; attempt < kIssueAttempts; ++attempt) {
        s = cabinet::security::token_generate(&token);
        if (!is_ok(s)) {
            return s;
        }
        s = cabinet::db::db_file_set_public(ctx.db, id, owner, token, expires_at, now);
        if (s.code != StatusCode::Conflict) {
            break;
        }
    }
    if (!is_ok(s)) {
        return s;
    }

    if (expires_at == 0) {
        CABINET_LOG_INFO << "storage: user " << owner.v << " published file " << id.v << " without expiry";
    } else {
        CABINET_LOG_INFO << "storage: user " << owner.v << " published file " << id.v << " until " << expires_at;
    }
    out->url = ctx.public_base_url + "/public/" + token;
    out->token = std::move(token);
    out->expires_at = expires_at;
    return ok_status();
}

Status public_link_revoke(const StorageContext& ctx, FileId id, UserId owner) noexcept {
    if (!context_valid(ctx)) {
        return invalid();
    }

    File file;
    Status s = detail::load_owned_file(ctx, id, owner, &file);
    if (!is_ok(s)) {
        return s;
    }

    s = cabinet::db::db_file_clear_public(ctx.db, id, owner, ctx.now());
    if (!is_ok(s)) {
        return s;
    }

    if (file.is_public) {
        CABINET_LOG_INFO << "storage: user " << owner.v << " revoked public link of file " << id.v;
    }
    return ok_status();
}

Status public_link_resolve(const StorageContext& ctx, const std::string& token, PublicFileInfo* out) noexcept {
    if (!context_valid(ctx) || !out) {
        return invalid();
    }

    File file;
    Status s = load_live_link(ctx, token, &file);
    if (!is_ok(s)) {
        return s;
    }

    User owner;
    s = cabinet::db::db_user_get(ctx.db, file.owner, &owner);
    if (!is_ok(s) && s.code != StatusCode::NotFound) {
        return s;
    }

    out->name = file.name;
    out->size_bytes = file.size_bytes;
    out->file_type = file.file_type;
    out->mime_type = file.mime_type;
    out->expires_at = file.public_expires_at;
    out->shared_by = user_display_name(owner);
    out->created_at = file.created_at;
    return ok_status();
}

Status public_link_resolve_download(const StorageContext& ctx, const std::string& token,
                                    DownloadTarget* out) noexcept {
    if (!context_valid(ctx) || !out) {
        return invalid();
    }

    File file;
    Status s = load_live_link(ctx, token, &file);
    if (!is_ok(s)) {
        return s;
    }

    cabinet::blob::SignedDownload signed_url;
    s = ctx.blobs->sign_download(file.blob_key, ctx.now(), &signed_url);
    if (!is_ok(s)) {
        CABINET_LOG_ERROR << "storage: signing failed for public file " << file.id.v << " ("
                          << status_code_name(s.code) << ")";
        return detail::backend_unavailable(s);
    }

    out->url = std::move(signed_url.url);
    out->expires_at = signed_url.expires_at;
    out->file_name = file.name;
    return ok_status();
}

} // namespace cabinet::storage
