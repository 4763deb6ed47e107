#include "cabinet/bindings/http.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstring>
#include <ctime>
#include <exception>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "cabinet/core/log.hpp"
#include "cabinet/storage/file_registry.hpp"
#include "cabinet/storage/folder_tree.hpp"
#include "cabinet/storage/mime.hpp"
#include "cabinet/storage/public_link.hpp"
#include "cabinet/storage/sharing.hpp"

namespace cabinet::bindings::http {

using namespace cabinet::core;
using namespace cabinet::storage;
using json = nlohmann::json;

namespace {

// ========================================================================
// Request parsing
// ========================================================================

struct Route {
    std::vector<std::string> segments;
    std::map<std::string, std::string> query;
};

[[nodiscard]] int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// '+' stays literal outside query strings.
[[nodiscard]] bool percent_decode(std::string_view in, bool plus_is_space, std::string* out) {
    out->clear();
    out->reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        const char c = in[i];
        if (c == '%') {
            if (i + 2 >= in.size()) {
                return false;
            }
            const int hi = hex_value(in[i + 1]);
            const int lo = hex_value(in[i + 2]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            out->push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else if (c == '+' && plus_is_space) {
            out->push_back(' ');
        } else {
            out->push_back(c);
        }
    }
    return true;
}

// Path component of the public base URL, without a trailing slash.
[[nodiscard]] std::string mount_path(const std::string& base) {
    std::string path = base;
    const auto scheme = base.find("://");
    if (scheme != std::string::npos) {
        const auto slash = base.find('/', scheme + 3);
        path = slash == std::string::npos ? std::string() : base.substr(slash);
    }
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

[[nodiscard]] bool parse_target(const std::string& target, const std::string& mount, Route* out) {
    const auto qmark = target.find('?');
    std::string_view path(target.data(), qmark == std::string::npos ? target.size() : qmark);

    if (!mount.empty() && path.size() >= mount.size() && path.compare(0, mount.size(), mount) == 0 &&
        (path.size() == mount.size() || path[mount.size()] == '/')) {
        path.remove_prefix(mount.size());
    }

    out->segments.clear();
    std::size_t pos = 0;
    while (pos < path.size()) {
        auto next = path.find('/', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }
        if (next > pos) {
            std::string seg;
            if (!percent_decode(path.substr(pos, next - pos), false, &seg)) {
                return false;
            }
            out->segments.push_back(std::move(seg));
        }
        pos = next + 1;
    }

    out->query.clear();
    if (qmark == std::string::npos) {
        return true;
    }
    std::string_view qs(target.data() + qmark + 1, target.size() - qmark - 1);
    while (!qs.empty()) {
        auto amp = qs.find('&');
        const std::string_view pair = qs.substr(0, amp);
        if (!pair.empty()) {
            const auto eq = pair.find('=');
            std::string key;
            std::string value;
            if (!percent_decode(pair.substr(0, eq), true, &key)) {
                return false;
            }
            if (eq != std::string_view::npos && !percent_decode(pair.substr(eq + 1), true, &value)) {
                return false;
            }
            out->query[key] = std::move(value);
        }
        if (amp == std::string_view::npos) {
            break;
        }
        qs.remove_prefix(amp + 1);
    }
    return true;
}

[[nodiscard]] bool method_is(const HttpRequest& req, const char* expected) noexcept {
    return req.method == expected;
}

[[nodiscard]] const std::string* header_value(const HttpRequest& req, const char* name) noexcept {
    const std::size_t len = std::strlen(name);
    for (const HttpHeader& h : req.headers) {
        if (h.name.size() != len) {
            continue;
        }
        bool same = true;
        for (std::size_t i = 0; i < len && same; ++i) {
            const char a = static_cast<char>(h.name[i] | 0x20);
            const char b = static_cast<char>(name[i] | 0x20);
            same = a == b;
        }
        if (same) {
            return &h.value;
        }
    }
    return nullptr;
}

[[nodiscard]] const std::string* query_value(const Route& r, const char* key) {
    const auto it = r.query.find(key);
    return it == r.query.end() ? nullptr : &it->second;
}

[[nodiscard]] bool parse_u64(std::string_view s, u64* out) noexcept {
    if (s.empty()) {
        return false;
    }
    u64 v = 0;
    const auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || end != s.data() + s.size()) {
        return false;
    }
    *out = v;
    return true;
}

template <typename IdT>
[[nodiscard]] bool parse_id(std::string_view s, IdT* out) noexcept {
    u64 v = 0;
    if (!parse_u64(s, &v)) {
        return false;
    }
    if (v >= static_cast<u64>(IdT::invalid().v)) {
        return false;
    }
    out->v = static_cast<decltype(out->v)>(v);
    return true;
}

// Absent, empty or "null" is the root level.
[[nodiscard]] bool parse_folder_param(const std::string* raw, FolderId* out) noexcept {
    if (raw == nullptr || raw->empty() || *raw == "null") {
        *out = kRootFolder;
        return true;
    }
    return parse_id(*raw, out);
}

// Empty body reads as {}. Anything but an object is rejected.
[[nodiscard]] bool parse_body(const HttpRequest& req, json* out) {
    if (req.body.empty()) {
        *out = json::object();
        return true;
    }
    json parsed = json::parse(req.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return false;
    }
    *out = std::move(parsed);
    return true;
}

[[nodiscard]] bool body_string(const json& body, const char* key, std::string* out) {
    const auto it = body.find(key);
    if (it == body.end() || !it->is_string()) {
        return false;
    }
    *out = it->get<std::string>();
    return true;
}

enum class Field { Absent, Present, Malformed };

// Ids arrive as JSON numbers or numeric strings; null counts as absent.
template <typename IdT>
[[nodiscard]] Field body_id(const json& body, const char* key, IdT* out) {
    const auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return Field::Absent;
    }
    if (it->is_number_unsigned()) {
        const u64 v = it->get<u64>();
        if (v >= static_cast<u64>(IdT::invalid().v)) {
            return Field::Malformed;
        }
        out->v = static_cast<decltype(out->v)>(v);
        return Field::Present;
    }
    if (it->is_string()) {
        return parse_id(it->get_ref<const std::string&>(), out) ? Field::Present : Field::Malformed;
    }
    return Field::Malformed;
}

// ========================================================================
// JSON rendering
// ========================================================================

[[nodiscard]] json time_json(Timestamp t) {
    if (t == 0) {
        return nullptr;
    }
    const std::time_t tt = static_cast<std::time_t>(t);
    std::tm tm{};
    if (gmtime_r(&tt, &tm) == nullptr) {
        return nullptr;
    }
    char buf[32];
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf, n);
}

[[nodiscard]] json folder_ref_json(FolderId id) {
    if (folder_is_root(id)) {
        return nullptr;
    }
    return id.v;
}

[[nodiscard]] json user_json(const User& u) {
    if (!u.id.is_valid()) {
        return nullptr;
    }
    return json{
        {"id", u.id.v},
        {"firstName", u.first_name},
        {"lastName", u.last_name},
        {"email", u.email},
    };
}

[[nodiscard]] json folder_json(const Folder& f) {
    return json{
        {"id", f.id.v},
        {"name", f.name},
        {"parentId", folder_ref_json(f.parent)},
        {"ownerId", f.owner.v},
        {"path", f.path},
        {"createdAt", time_json(f.created_at)},
        {"updatedAt", time_json(f.updated_at)},
    };
}

// blob_key stays internal.
[[nodiscard]] json file_json(const File& f) {
    json j{
        {"id", f.id.v},
        {"name", f.name},
        {"folderId", folder_ref_json(f.folder)},
        {"ownerId", f.owner.v},
        {"fileSize", f.size_bytes},
        {"fileType", f.file_type},
        {"mimeType", f.mime_type},
        {"category", file_category(f.mime_type)},
        {"isPublic", f.is_public},
        {"createdAt", time_json(f.created_at)},
        {"updatedAt", time_json(f.updated_at)},
    };
    if (f.is_public) {
        j["publicToken"] = f.public_token;
        j["publicExpiresAt"] = time_json(f.public_expires_at);
    } else {
        j["publicToken"] = nullptr;
        j["publicExpiresAt"] = nullptr;
    }
    return j;
}

[[nodiscard]] json share_json(const Share& s) {
    return json{
        {"id", s.id.v},
        {"fileId", s.file.is_valid() ? json(s.file.v) : json(nullptr)},
        {"folderId", s.folder.is_valid() ? json(s.folder.v) : json(nullptr)},
        {"sharedWith", s.shared_with.v},
        {"sharedBy", s.shared_by.v},
        {"permission", permission_name(s.permission)},
        {"createdAt", time_json(s.created_at)},
    };
}

// ========================================================================
// Responses
// ========================================================================

void write_json(HttpResponse* out, u16 status, const json& body) {
    out->status = status;
    out->content_type = "application/json";
    out->body = body.dump(-1, ' ', false, json::error_handler_t::replace);
}

Status reply(HttpResponse* out, json data, u16 status = 200) {
    write_json(out, status, json{{"success", true}, {"data", std::move(data)}});
    return ok_status();
}

Status reply_message(HttpResponse* out, const char* message, json data = nullptr) {
    json body{{"success", true}, {"message", message}};
    if (!data.is_null()) {
        body["data"] = std::move(data);
    }
    write_json(out, 200, body);
    return ok_status();
}

Status reject(HttpResponse* out, u16 status, const std::string& message, Status cause) {
    write_json(out, status, json{{"success", false}, {"message", message}});
    return cause;
}

Status bad_request(HttpResponse* out, const char* message) {
    return reject(out, 400, message, make_status(StatusDomain::Http, StatusCode::Invalid));
}

// Per-handler wording for each failure class. A null entry falls back to
// failure.
struct Messages {
    const char* failure;
    const char* not_found{nullptr};
    const char* invalid{nullptr};
    const char* conflict{nullptr};
    const char* missing_folder{nullptr};
    const char* missing_user{nullptr};
};

Status fail(HttpResponse* out, Status s, const Messages& m) {
    const char* text = nullptr;
    switch (s.code) {
        case StatusCode::NotFound:
            if (s.aux == kMissingFolderRef && m.missing_folder) {
                text = m.missing_folder;
            } else if (s.aux == kMissingUserRef && m.missing_user) {
                text = m.missing_user;
            } else {
                text = m.not_found;
            }
            break;
        case StatusCode::Invalid:          text = m.invalid; break;
        case StatusCode::Conflict:         text = m.conflict; break;
        case StatusCode::PermissionDenied: text = "Access denied"; break;
        case StatusCode::Gone:             text = "Public link has expired"; break;
        default: break;
    }

    const u16 status = http_status_for(s.code);
    if (status == 500) {
        CABINET_LOG_ERROR << "http: " << m.failure << " (" << status_domain_name(s.domain) << "/"
                          << status_code_name(s.code) << ")";
        text = m.failure;
    }
    return reject(out, status, text ? text : m.failure, s);
}

// ========================================================================
// Folders
// ========================================================================

Status handle_folder_list(const HttpContext& ctx, const Route& r, const HttpRequest& req, HttpResponse* out) {
    FolderId parent;
    if (!parse_folder_param(query_value(r, "parentId"), &parent)) {
        return bad_request(out, "Invalid folder id");
    }

    std::vector<Folder> folders;
    Status s = folder_list(ctx.storage, req.principal, parent, &folders);
    if (!is_ok(s)) {
        return fail(out, s, {"Failed to fetch folders"});
    }

    json data = json::array();
    for (const Folder& f : folders) {
        data.push_back(folder_json(f));
    }
    return reply(out, std::move(data));
}

Status handle_folder_list_all(const HttpContext& ctx, const HttpRequest& req, HttpResponse* out) {
    std::vector<Folder> folders;
    Status s = folder_list_all(ctx.storage, req.principal, &folders);
    if (!is_ok(s)) {
        return fail(out, s, {"Failed to fetch folders"});
    }

    json data = json::array();
    for (const Folder& f : folders) {
        data.push_back(folder_json(f));
    }
    return reply(out, std::move(data));
}

Status handle_folder_get(const HttpContext& ctx, FolderId id, const HttpRequest& req, HttpResponse* out) {
    FolderView view;
    Status s = folder_get_with_breadcrumb(ctx.storage, id, req.principal, &view);
    if (!is_ok(s)) {
        return fail(out, s, {"Failed to fetch folder", "Folder not found"});
    }

    json crumbs = json::array();
    for (const Breadcrumb& b : view.breadcrumb) {
        crumbs.push_back(json{{"id", b.id.v}, {"name", b.name}});
    }
    return reply(out, json{{"folder", folder_json(view.folder)}, {"breadcrumb", std::move(crumbs)}});
}

Status handle_folder_create(const HttpContext& ctx, const HttpRequest& req, HttpResponse* out) {
    json body;
    if (!parse_body(req, &body)) {
        return bad_request(out, "Invalid JSON body");
    }

    std::string name;
    if (!body_string(body, "name", &name)) {
        return bad_request(out, "Folder name is required");
    }

    FolderId parent = kRootFolder;
    if (body_id(body, "parentId", &parent) == Field::Malformed) {
        return bad_request(out, "Invalid folder id");
    }

    Folder folder;
    Status s = folder_create(ctx.storage, req.principal, name, parent, &folder);
    if (!is_ok(s)) {
        Messages m{"Failed to create folder"};
        m.not_found = "Parent folder not found";
        m.missing_folder = "Parent folder not found";
        m.invalid = "Invalid folder name";
        m.conflict = "A folder with this name already exists";
        return fail(out, s, m);
    }
    return reply(out, folder_json(folder), 201);
}

Status handle_folder_rename(const HttpContext& ctx, FolderId id, const HttpRequest& req, HttpResponse* out) {
    json body;
    if (!parse_body(req, &body)) {
        return bad_request(out, "Invalid JSON body");
    }

    std::string name;
    if (!body_string(body, "name", &name)) {
        return bad_request(out, "Folder name is required");
    }

    Folder folder;
    Status s = folder_rename(ctx.storage, id, req.principal, name, &folder);
    if (!is_ok(s)) {
        Messages m{"Failed to rename folder"};
        m.not_found = "Folder not found";
        m.invalid = "Invalid folder name";
        m.conflict = "A folder with this name already exists";
        return fail(out, s, m);
    }
    return reply(out, folder_json(folder));
}

Status handle_folder_delete(const HttpContext& ctx, FolderId id, const HttpRequest& req, HttpResponse* out) {
    FolderDeleteReport report;
    Status s = folder_delete(ctx.storage, id, req.principal, &report);
    if (!is_ok(s)) {
        return fail(out, s, {"Failed to delete folder", "Folder not found"});
    }
    return reply_message(out, "Folder deleted successfully",
                         json{{"foldersRemoved", report.folders_removed},
                              {"filesRemoved", report.files_removed}});
}

// ========================================================================
// Files
// ========================================================================

Status handle_file_list(const HttpContext& ctx, const Route& r, const HttpRequest& req, HttpResponse* out) {
    FolderId folder;
    if (!parse_folder_param(query_value(r, "folderId"), &folder)) {
        return bad_request(out, "Invalid folder id");
    }

    std::vector<File> files;
    Status s = file_list(ctx.storage, req.principal, folder, &files);
    if (!is_ok(s)) {
        return fail(out, s, {"Failed to fetch files"});
    }

    json data = json::array();
    for (const File& f : files) {
        data.push_back(file_json(f));
    }
    return reply(out, std::move(data));
}

// The body is the raw file content. The name comes from ?name= or
// X-File-Name, the MIME type from Content-Type.
Status handle_file_upload(const HttpContext& ctx, const Route& r, const HttpRequest& req, HttpResponse* out) {
    UploadRequest up;

    const std::string* name = query_value(r, "name");
    if (name == nullptr || name->empty()) {
        name = header_value(req, "X-File-Name");
    }
    if (name == nullptr || name->empty()) {
        return bad_request(out, "No file uploaded");
    }
    up.name = *name;

    if (!parse_folder_param(query_value(r, "folderId"), &up.folder)) {
        return bad_request(out, "Invalid folder id");
    }
    if (const std::string* mime = header_value(req, "Content-Type")) {
        up.mime_type = *mime;
    }
    up.content.data = reinterpret_cast<const u8*>(req.body.data());
    up.content.len = req.body.size();

    File file;
    Status s = file_upload(ctx.storage, req.principal, up, &file);
    if (!is_ok(s)) {
        if (s.code == StatusCode::TooLarge) {
            return reject(out, 413,
                          "File size exceeds maximum limit of " + format_size(ctx.storage.max_upload_bytes), s);
        }
        Messages m{"Failed to upload file"};
        m.not_found = "Folder not found";
        m.invalid = "Invalid file name";
        return fail(out, s, m);
    }
    return reply(out, file_json(file), 201);
}

Status handle_file_rename(const HttpContext& ctx, FileId id, const HttpRequest& req, HttpResponse* out) {
    json body;
    if (!parse_body(req, &body)) {
        return bad_request(out, "Invalid JSON body");
    }

    std::string name;
    if (!body_string(body, "name", &name)) {
        return bad_request(out, "File name is required");
    }

    File file;
    Status s = file_rename(ctx.storage, id, req.principal, name, &file);
    if (!is_ok(s)) {
        Messages m{"Failed to rename file"};
        m.not_found = "File not found";
        m.invalid = "Invalid file name";
        return fail(out, s, m);
    }
    return reply(out, file_json(file));
}

Status handle_file_move(const HttpContext& ctx, FileId id, const HttpRequest& req, HttpResponse* out) {
    json body;
    if (!parse_body(req, &body)) {
        return bad_request(out, "Invalid JSON body");
    }

    FolderId folder = kRootFolder;
    if (body_id(body, "folderId", &folder) == Field::Malformed) {
        return bad_request(out, "Invalid folder id");
    }

    File file;
    Status s = file_move(ctx.storage, id, req.principal, folder, &file);
    if (!is_ok(s)) {
        Messages m{"Failed to move file"};
        m.not_found = "File not found";
        m.missing_folder = "Target folder not found";
        return fail(out, s, m);
    }
    return reply(out, file_json(file));
}

Status handle_file_delete(const HttpContext& ctx, FileId id, const HttpRequest& req, HttpResponse* out) {
    Status s = file_delete(ctx.storage, id, req.principal);
    if (!is_ok(s)) {
        return fail(out, s, {"Failed to delete file", "File not found"});
    }
    return reply_message(out, "File deleted successfully");
}

Status handle_file_download(const HttpContext& ctx, FileId id, const HttpRequest& req, HttpResponse* out) {
    DownloadTarget target;
    Status s = file_download_target(ctx.storage, id, req.principal, &target);
    if (!is_ok(s)) {
        return fail(out, s, {"Failed to get download URL", "File not found"});
    }
    return reply(out, json{
        {"downloadUrl", target.url},
        {"fileName", target.file_name},
        {"expiresAt", time_json(target.expires_at)},
    });
}

// expiresIn is in hours; absent or null issues a link without expiry.
Status handle_link_issue(const HttpContext& ctx, FileId id, const HttpRequest& req, HttpResponse* out) {
    json body;
    if (!parse_body(req, &body)) {
        return bad_request(out, "Invalid JSON body");
    }

    Timestamp ttl_seconds = 0;
    const auto it = body.find("expiresIn");
    if (it != body.end() && !it->is_null()) {
        const double hours = it->is_number() ? it->get<double>() : 0.0;
        if (!(hours > 0.0) || hours > static_cast<double>(kMaxLinkTtlHours)) {
            return bad_request(out, "expiresIn must be a positive number of hours");
        }
        // Rounded to whole seconds, at least one.
        ttl_seconds = std::max<Timestamp>(1, std::llround(hours * 3600.0));
    }

    PublicLink link;
    Status s = public_link_issue(ctx.storage, id, req.principal, ttl_seconds, &link);
    if (!is_ok(s)) {
        return fail(out, s, {"Failed to generate public link", "File not found"});
    }
    return reply(out, json{
        {"publicToken", link.token},
        {"publicUrl", link.url},
        {"expiresAt", time_json(link.expires_at)},
    });
}

Status handle_link_revoke(const HttpContext& ctx, FileId id, const HttpRequest& req, HttpResponse* out) {
    Status s = public_link_revoke(ctx.storage, id, req.principal);
    if (!is_ok(s)) {
        return fail(out, s, {"Failed to revoke public link", "File not found"});
    }
    return reply_message(out, "Public link revoked");
}

// ========================================================================
// Shares
// ========================================================================

// Exactly one of fileId/folderId, read from body or, when body is null, from
// the query string. *message is set on failure.
[[nodiscard]] bool share_target_from(const json* body, const Route& r, ShareTarget* target,
                                     const char** message) {
    FileId file = FileId::invalid();
    FolderId folder = FolderId::invalid();
    Field ff = Field::Absent;
    Field fd = Field::Absent;

    if (body != nullptr) {
        ff = body_id(*body, "fileId", &file);
        fd = body_id(*body, "folderId", &folder);
    } else {
        if (const std::string* v = query_value(r, "fileId"); v && !v->empty()) {
            ff = parse_id(*v, &file) ? Field::Present : Field::Malformed;
        }
        if (const std::string* v = query_value(r, "folderId"); v && !v->empty()) {
            fd = parse_id(*v, &folder) ? Field::Present : Field::Malformed;
        }
    }

    if (ff == Field::Malformed || fd == Field::Malformed) {
        *message = "Invalid file or folder id";
        return false;
    }
    if (ff == Field::Absent && fd == Field::Absent) {
        *message = "File ID or Folder ID is required";
        return false;
    }
    if (ff == Field::Present && fd == Field::Present) {
        *message = "Provide either File ID or Folder ID, not both";
        return false;
    }
    *target = ff == Field::Present ? ShareTarget::of_file(file) : ShareTarget::of_folder(folder);
    return true;
}

[[nodiscard]] const char* target_not_found(ShareTarget target) noexcept {
    return target.kind == TargetKind::File ? "File not found" : "Folder not found";
}

Status handle_share_grant(const HttpContext& ctx, const Route& r, const HttpRequest& req, HttpResponse* out) {
    json body;
    if (!parse_body(req, &body)) {
        return bad_request(out, "Invalid JSON body");
    }

    ShareTarget target;
    const char* message = nullptr;
    if (!share_target_from(&body, r, &target, &message)) {
        return bad_request(out, message);
    }

    UserId grantee = UserId::invalid();
    const Field gf = body_id(body, "sharedWith", &grantee);
    if (gf == Field::Absent) {
        return bad_request(out, "User to share with is required");
    }
    if (gf == Field::Malformed) {
        return bad_request(out, "Invalid user id");
    }

    Permission permission = Permission::View;
    std::string perm_text;
    if (body_string(body, "permission", &perm_text)) {
        if (!permission_parse(perm_text.c_str(), &permission)) {
            return bad_request(out, "Permission must be view or edit");
        }
    } else if (body.contains("permission") && !body["permission"].is_null()) {
        return bad_request(out, "Permission must be view or edit");
    }

    Share share;
    bool created = false;
    Status s = share_grant(ctx.storage, req.principal, target, grantee, permission, &share, &created);
    if (!is_ok(s)) {
        Messages m{"Failed to share"};
        m.not_found = target_not_found(target);
        m.missing_user = "User not found";
        m.invalid = "Cannot share with yourself";
        return fail(out, s, m);
    }

    if (created) {
        return reply(out, share_json(share), 201);
    }
    return reply_message(out, "Share updated", share_json(share));
}

Status handle_share_list_for_target(const HttpContext& ctx, const Route& r, const HttpRequest& req,
                                    HttpResponse* out) {
    ShareTarget target;
    const char* message = nullptr;
    if (!share_target_from(nullptr, r, &target, &message)) {
        return bad_request(out, message);
    }

    std::vector<ShareEntry> entries;
    Status s = share_list_for_target(ctx.storage, target, req.principal, &entries);
    if (!is_ok(s)) {
        return fail(out, s, {"Failed to fetch shares", target_not_found(target)});
    }

    json data = json::array();
    for (const ShareEntry& e : entries) {
        json j = share_json(e.share);
        j["sharedWithUser"] = user_json(e.shared_with);
        data.push_back(std::move(j));
    }
    return reply(out, std::move(data));
}

Status handle_share_revoke(const HttpContext& ctx, ShareId id, const HttpRequest& req, HttpResponse* out) {
    Status s = share_revoke(ctx.storage, id, req.principal);
    if (!is_ok(s)) {
        return fail(out, s, {"Failed to remove share", "Share not found"});
    }
    return reply_message(out, "Share removed successfully");
}

Status handle_shared_with_me(const HttpContext& ctx, const HttpRequest& req, HttpResponse* out) {
    std::vector<SharedItem> items;
    Status s = share_list_shared_with_me(ctx.storage, req.principal, &items);
    if (!is_ok(s)) {
        return fail(out, s, {"Failed to fetch shared items"});
    }

    json data = json::array();
    for (const SharedItem& item : items) {
        json j = share_json(item.share);
        if (item.share.file.is_valid()) {
            json f = file_json(item.file);
            f["owner"] = user_json(item.owner);
            j["file"] = std::move(f);
            j["folder"] = nullptr;
        } else {
            json f = folder_json(item.folder);
            f["owner"] = user_json(item.owner);
            j["file"] = nullptr;
            j["folder"] = std::move(f);
        }
        j["sharedByUser"] = user_json(item.shared_by);
        data.push_back(std::move(j));
    }
    return reply(out, std::move(data));
}

// ========================================================================
// Public links (no principal required)
// ========================================================================

Status handle_public_info(const HttpContext& ctx, const std::string& token, HttpResponse* out) {
    PublicFileInfo info;
    Status s = public_link_resolve(ctx.storage, token, &info);
    if (!is_ok(s)) {
        return fail(out, s, {"Failed to get file info", "File not found or link expired"});
    }
    return reply(out, json{
        {"name", info.name},
        {"fileSize", info.size_bytes},
        {"fileType", info.file_type},
        {"mimeType", info.mime_type},
        {"expiresAt", time_json(info.expires_at)},
        {"sharedBy", info.shared_by},
        {"createdAt", time_json(info.created_at)},
    });
}

Status handle_public_download(const HttpContext& ctx, const std::string& token, HttpResponse* out) {
    DownloadTarget target;
    Status s = public_link_resolve_download(ctx.storage, token, &target);
    if (!is_ok(s)) {
        return fail(out, s, {"Failed to download file", "File not found or link expired"});
    }
    return reply(out, json{{"downloadUrl", target.url}, {"fileName", target.file_name}});
}

// GET /blob/<owner>/<name>?expires=&sig=, the URLs minted by sign_download.
Status handle_blob_fetch(const HttpContext& ctx, const Route& r, HttpResponse* out) {
    if (ctx.blob_server == nullptr || r.segments.size() != 3) {
        return reject(out, 404, "Not found", make_status(StatusDomain::Http, StatusCode::NotFound));
    }

    const std::string key = r.segments[1] + "/" + r.segments[2];
    const std::string* expires = query_value(r, "expires");
    const std::string* sig = query_value(r, "sig");
    u64 expires_at = 0;
    if (expires == nullptr || sig == nullptr || !parse_u64(*expires, &expires_at)) {
        return bad_request(out, "Invalid download link");
    }

    Status s = ctx.blob_server->verify_download(key, static_cast<Timestamp>(expires_at), *sig, ctx.storage.now());
    if (s.code == StatusCode::Gone) {
        return reject(out, 410, "Download link has expired", s);
    }
    if (!is_ok(s)) {
        return reject(out, 403, "Invalid download link", s);
    }

    std::vector<u8> bytes;
    s = ctx.blob_server->read(key, &bytes);
    if (!is_ok(s)) {
        return fail(out, s, {"Failed to read file", "File not found"});
    }

    out->status = 200;
    out->content_type = "application/octet-stream";
    out->body.assign(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    return ok_status();
}

// ========================================================================
// Misc
// ========================================================================

Status handle_stats(const HttpContext& ctx, const HttpRequest& req, HttpResponse* out) {
    StorageStats stats;
    Status s = storage_stats(ctx.storage, req.principal, &stats);
    if (!is_ok(s)) {
        return fail(out, s, {"Failed to get storage stats"});
    }
    return reply(out, json{
        {"totalSize", stats.total_bytes},
        {"totalSizeFormatted", format_size(stats.total_bytes)},
        {"fileCount", stats.file_count},
        {"folderCount", stats.folder_count},
    });
}

Status handle_users(const HttpContext& ctx, HttpResponse* out) {
    std::vector<User> users;
    Status s = cabinet::db::db_user_list_active(ctx.storage.db, &users);
    if (!is_ok(s)) {
        return fail(out, s, {"Failed to fetch users"});
    }

    json data = json::array();
    for (const User& u : users) {
        data.push_back(user_json(u));
    }
    return reply(out, std::move(data));
}

// ========================================================================
// Routing
// ========================================================================

Status method_not_allowed(HttpResponse* out) {
    return reject(out, 405, "Method not allowed", make_status(StatusDomain::Http, StatusCode::Unsupported));
}

Status route_not_found(HttpResponse* out) {
    return reject(out, 404, "Route not found", make_status(StatusDomain::Http, StatusCode::NotFound));
}

Status route_public(const HttpContext& ctx, const Route& r, const HttpRequest& req, HttpResponse* out) {
    if (!method_is(req, "GET")) {
        return method_not_allowed(out);
    }
    const std::string& token = r.segments[1];
    if (r.segments.size() == 2) {
        return handle_public_info(ctx, token, out);
    }
    if (r.segments.size() == 3 && r.segments[2] == "info") {
        return handle_public_info(ctx, token, out);
    }
    if (r.segments.size() == 3 && r.segments[2] == "download") {
        return handle_public_download(ctx, token, out);
    }
    return route_not_found(out);
}

Status route_folders(const HttpContext& ctx, const Route& r, const HttpRequest& req, HttpResponse* out) {
    const auto& seg = r.segments;
    if (seg.size() == 1) {
        if (method_is(req, "GET")) return handle_folder_list(ctx, r, req, out);
        if (method_is(req, "POST")) return handle_folder_create(ctx, req, out);
        return method_not_allowed(out);
    }
    if (seg.size() != 2) {
        return route_not_found(out);
    }
    if (seg[1] == "all") {
        if (method_is(req, "GET")) return handle_folder_list_all(ctx, req, out);
        return method_not_allowed(out);
    }

    FolderId id;
    if (!parse_id(seg[1], &id)) {
        return bad_request(out, "Invalid folder id");
    }
    if (method_is(req, "GET")) return handle_folder_get(ctx, id, req, out);
    if (method_is(req, "PATCH")) return handle_folder_rename(ctx, id, req, out);
    if (method_is(req, "DELETE")) return handle_folder_delete(ctx, id, req, out);
    return method_not_allowed(out);
}

Status route_files(const HttpContext& ctx, const Route& r, const HttpRequest& req, HttpResponse* out) {
    const auto& seg = r.segments;
    if (seg.size() == 1) {
        if (method_is(req, "GET")) return handle_file_list(ctx, r, req, out);
        return method_not_allowed(out);
    }
    if (seg.size() == 2 && seg[1] == "upload") {
        if (method_is(req, "POST")) return handle_file_upload(ctx, r, req, out);
        return method_not_allowed(out);
    }
    if (seg.size() > 3) {
        return route_not_found(out);
    }

    FileId id;
    if (!parse_id(seg[1], &id)) {
        return bad_request(out, "Invalid file id");
    }

    if (seg.size() == 2) {
        if (method_is(req, "PATCH")) return handle_file_rename(ctx, id, req, out);
        if (method_is(req, "DELETE")) return handle_file_delete(ctx, id, req, out);
        return method_not_allowed(out);
    }
    if (seg[2] == "move") {
        if (method_is(req, "PATCH")) return handle_file_move(ctx, id, req, out);
        return method_not_allowed(out);
    }
    if (seg[2] == "download") {
        if (method_is(req, "GET")) return handle_file_download(ctx, id, req, out);
        return method_not_allowed(out);
    }
    if (seg[2] == "public") {
        if (method_is(req, "POST")) return handle_link_issue(ctx, id, req, out);
        if (method_is(req, "DELETE")) return handle_link_revoke(ctx, id, req, out);
        return method_not_allowed(out);
    }
    return route_not_found(out);
}

Status dispatch(const HttpContext& ctx, const HttpRequest& req, HttpResponse* out) {
    Route r;
    if (!parse_target(req.path, mount_path(ctx.storage.public_base_url), &r)) {
        return bad_request(out, "Malformed request path");
    }
    if (r.segments.empty()) {
        return route_not_found(out);
    }

    const std::string& head = r.segments[0];

    if (head == "public" && r.segments.size() >= 2) {
        return route_public(ctx, r, req, out);
    }
    if (head == "blob") {
        if (!method_is(req, "GET")) return method_not_allowed(out);
        return handle_blob_fetch(ctx, r, out);
    }

    if (!req.principal.is_valid()) {
        return reject(out, 401, "Authentication required",
                      make_status(StatusDomain::Http, StatusCode::PermissionDenied));
    }

    if (head == "folders") {
        return route_folders(ctx, r, req, out);
    }
    if (head == "files") {
        return route_files(ctx, r, req, out);
    }
    if (head == "share") {
        if (r.segments.size() == 1) {
            if (method_is(req, "POST")) return handle_share_grant(ctx, r, req, out);
            return method_not_allowed(out);
        }
        if (r.segments.size() == 2) {
            ShareId id;
            if (!parse_id(r.segments[1], &id)) {
                return bad_request(out, "Invalid share id");
            }
            if (method_is(req, "DELETE")) return handle_share_revoke(ctx, id, req, out);
            return method_not_allowed(out);
        }
        return route_not_found(out);
    }
    if (r.segments.size() == 1) {
        if (head == "shares") {
            if (method_is(req, "GET")) return handle_share_list_for_target(ctx, r, req, out);
            return method_not_allowed(out);
        }
        if (head == "shared-with-me") {
            if (method_is(req, "GET")) return handle_shared_with_me(ctx, req, out);
            return method_not_allowed(out);
        }
        if (head == "stats") {
            if (method_is(req, "GET")) return handle_stats(ctx, req, out);
            return method_not_allowed(out);
        }
        if (head == "users") {
            if (method_is(req, "GET")) return handle_users(ctx, out);
            return method_not_allowed(out);
        }
    }
    return route_not_found(out);
}

} // namespace

u16 http_status_for(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::Ok:               return 200;
        case StatusCode::Invalid:          return 400;
        case StatusCode::PermissionDenied: return 403;
        case StatusCode::NotFound:         return 404;
        case StatusCode::Conflict:         return 409;
        case StatusCode::Gone:             return 410;
        case StatusCode::TooLarge:         return 413;
        default:                           return 500;
    }
}

Status handle_http_request(const HttpContext& ctx, const HttpRequest& req, HttpResponse* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Http, StatusCode::Invalid);
    }

    out->status = 500;
    out->content_type = "application/json";
    out->body.clear();

    if (!context_valid(ctx.storage)) {
        out->body = R"({"success":false,"message":"Storage unavailable"})";
        return make_status(StatusDomain::Http, StatusCode::Unavailable);
    }

    try {
        const Status s = dispatch(ctx, req, out);
        CABINET_LOG_DEBUG << "http: " << req.method << " " << req.path << " -> " << out->status;
        return s;
    } catch (const std::exception& e) {
        CABINET_LOG_ERROR << "http: " << req.method << " " << req.path << " failed: " << e.what();
        out->status = 500;
        out->content_type = "application/json";
        out->body = R"({"success":false,"message":"Internal server error"})";
        return make_status(StatusDomain::Http, StatusCode::Unknown);
    }
}

} // namespace cabinet::bindings::http
