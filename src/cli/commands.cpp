#include "cabinet/cli/commands.hpp"

#include <charconv>
#include <cstring>
#include <exception>
#include <string>
#include <vector>

#include "cabinet/bindings/http.hpp"
#include "cabinet/core/log.hpp"
#include "cabinet/db/db.hpp"
#include "cabinet/storage/file_registry.hpp"
#include "cabinet/storage/folder_tree.hpp"
#include "cabinet/storage/mime.hpp"
#include "cabinet/storage/public_link.hpp"
#include "cabinet/storage/sharing.hpp"

namespace cabinet::cli {

using namespace cabinet::core;
using namespace cabinet::storage;

// ========================================================================
// Parsing
// ========================================================================

Status parse_command(const CliArgs& args,
    const CommandSpec* specs,
    u32 spec_count,
    CommandInvocation* out,
    u32* consumed) noexcept {
    if (out == nullptr || consumed == nullptr) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    *consumed = 0;
    out->id = CommandId::None;
    out->args = CliArgs{};

    if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    if (spec_count > 0 && specs == nullptr) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }

    const char* cmd = args.argv[0];
    if (cmd[0] == '-') {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }

    for (u32 i = 0; i < spec_count; ++i) {
        const CommandSpec& s = specs[i];
        if (s.name != nullptr && std::strcmp(s.name, cmd) == 0) {
            out->id = s.id;
            out->args.argv = args.argv + 1;
            out->args.argc = args.argc - 1;
            *consumed = 1;
            return ok_status();
        }
    }
    return make_status(StatusDomain::Cli, StatusCode::Invalid);
}

const CommandSpec* command_table(u32* count) noexcept {
    static constexpr CommandSpec kCommands[] = {
        {CommandId::Help, "help"},
        {CommandId::Init, "init"},
        {CommandId::UserAdd, "user-add"},
        {CommandId::Mkdir, "mkdir"},
        {CommandId::List, "ls"},
        {CommandId::Rename, "rename"},
        {CommandId::Rmdir, "rmdir"},
        {CommandId::Put, "put"},
        {CommandId::Move, "mv"},
        {CommandId::Remove, "rm"},
        {CommandId::Share, "share"},
        {CommandId::Unshare, "unshare"},
        {CommandId::Link, "link"},
        {CommandId::Unlink, "unlink"},
        {CommandId::Stats, "stats"},
        {CommandId::Request, "request"},
    };
    if (count != nullptr) {
        *count = static_cast<u32>(sizeof(kCommands) / sizeof(kCommands[0]));
    }
    return kCommands;
}

void print_usage(std::FILE* out) {
    std::fprintf(out, "usage: cabinet [--db PATH] [--data DIR] <command> [options] [args]\n\n");
    std::fprintf(out, "Commands:\n");
    std::fprintf(out, "  init                                  Create the database and data root\n");
    std::fprintf(out, "  user-add <email> [--name \"First Last\"] Add a user\n");
    std::fprintf(out, "  mkdir <name> -u U [--parent F]        Create a folder\n");
    std::fprintf(out, "  ls -u U [--folder F]                  List a folder level\n");
    std::fprintf(out, "  rename <folder|file> <id> <name> -u U Rename a folder or file\n");
    std::fprintf(out, "  rmdir <id> -u U                       Delete a folder and everything below it\n");
    std::fprintf(out, "  put <path> -u U [--folder F] [--name N] Upload a local file\n");
    std::fprintf(out, "  mv <file-id> -u U [--folder F]        Move a file (no --folder: root)\n");
    std::fprintf(out, "  rm <file-id> -u U                     Delete a file\n");
    std::fprintf(out, "  share <file|folder> <id> <user> -u U [--perm view|edit]\n");
    std::fprintf(out, "  unshare <share-id> -u U               Revoke a share\n");
    std::fprintf(out, "  link <file-id> -u U [--ttl HOURS]     Publish a file\n");
    std::fprintf(out, "  unlink <file-id> -u U                 Revoke a public link\n");
    std::fprintf(out, "  stats -u U                            Storage usage\n");
    std::fprintf(out, "  request <METHOD> <PATH> [-u U] [--body JSON] Dispatch through the REST bridge\n");
    std::fprintf(out, "  help                                  Show this help\n");
}

// ========================================================================
// Helpers
// ========================================================================

namespace {

[[nodiscard]] Status usage(const CliEnv& env, const char* msg) {
    std::fprintf(env.err, "error: %s\n", msg);
    return make_status(StatusDomain::Cli, StatusCode::Invalid);
}

Status report(const CliEnv& env, const char* context, Status s) {
    std::fprintf(env.err, "error: %s failed (%s, %s, aux=%u)\n",
                 context, status_code_name(s.code), status_domain_name(s.domain), s.aux);
    if (s.code == StatusCode::Io && s.aux != 0) {
        std::fprintf(env.err, "error: %s: %s\n", context, std::strerror(static_cast<int>(s.aux)));
    }
    return s;
}

template <typename IdT>
[[nodiscard]] bool parse_id(const char* s, IdT* out) noexcept {
    if (s == nullptr || *s == '\0') {
        return false;
    }
    const char* end = s + std::strlen(s);
    u64 v = 0;
    auto r = std::from_chars(s, end, v, 10);
    if (r.ec != std::errc() || r.ptr != end || v >= static_cast<u64>(IdT::invalid().v)) {
        return false;
    }
    out->v = static_cast<decltype(out->v)>(v);
    return true;
}

template <typename IdT>
[[nodiscard]] bool option_id(const ParsedOptions& opts, OptionId id, IdT* out) noexcept {
    const ParsedOption* o = find_option(opts, id);
    if (o == nullptr || o->value.i64v < 0 ||
        static_cast<u64>(o->value.i64v) >= static_cast<u64>(IdT::invalid().v)) {
        return false;
    }
    out->v = static_cast<decltype(out->v)>(o->value.i64v);
    return true;
}

[[nodiscard]] const char* option_str(const ParsedOptions& opts, OptionId id) noexcept {
    const ParsedOption* o = find_option(opts, id);
    return o ? o->value.str : nullptr;
}

[[nodiscard]] bool require_user(const CliEnv& env, const ParsedOptions& opts, const char* cmd, UserId* out) {
    if (option_id(opts, OptionId::User, out)) {
        return true;
    }
    std::fprintf(env.err, "error: %s: --user <id> is required\n", cmd);
    return false;
}

// A folder option that is absent selects the root level.
[[nodiscard]] bool folder_option(const ParsedOptions& opts, OptionId id, FolderId* out) noexcept {
    if (find_option(opts, id) == nullptr) {
        *out = kRootFolder;
        return true;
    }
    return option_id(opts, id, out);
}

[[nodiscard]] Status read_local_file(const char* path, std::vector<u8>* out) {
    std::FILE* f = std::fopen(path, "rb");
    if (!f) {
        return make_status(StatusDomain::Cli, StatusCode::NotFound);
    }

    out->clear();
    u8 buf[64 * 1024];
    std::size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
        out->insert(out->end(), buf, buf + n);
    }
    const bool failed = std::ferror(f) != 0;
    std::fclose(f);

    if (failed) {
        return make_status(StatusDomain::Cli, StatusCode::Io);
    }
    return ok_status();
}

[[nodiscard]] const char* base_name(const char* path) noexcept {
    const char* last_slash = std::strrchr(path, '/');
    return last_slash ? last_slash + 1 : path;
}

[[nodiscard]] const char* guess_mime_type(const std::string& ext) noexcept {
    if (ext == "txt") return "text/plain";
    if (ext == "md") return "text/markdown";
    if (ext == "csv") return "text/csv";
    if (ext == "html" || ext == "htm") return "text/html";
    if (ext == "json") return "application/json";
    if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
    if (ext == "png") return "image/png";
    if (ext == "gif") return "image/gif";
    if (ext == "mp4") return "video/mp4";
    if (ext == "mp3") return "audio/mpeg";
    if (ext == "pdf") return "application/pdf";
    if (ext == "zip") return "application/zip";
    if (ext == "docx") return "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
    if (ext == "xlsx") return "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet";
    if (ext == "pptx") return "application/vnd.openxmlformats-officedocument.presentationml.presentation";
    return "application/octet-stream";
}

[[nodiscard]] bool parse_kind(const char* s, TargetKind* out) noexcept {
    if (s != nullptr && std::strcmp(s, "file") == 0) {
        *out = TargetKind::File;
        return true;
    }
    if (s != nullptr && std::strcmp(s, "folder") == 0) {
        *out = TargetKind::Folder;
        return true;
    }
    return false;
}

// ========================================================================
// Command Handlers
// ========================================================================

Status handle_init(const CliEnv& env) {
    std::fprintf(env.out, "db=%s\n", env.db_path.c_str());
    if (env.blob_server != nullptr) {
        std::fprintf(env.out, "data=%s\n", env.blob_server->data_root().c_str());
    }
    return ok_status();
}

Status handle_user_add(const CliEnv& env, const ParsedOptions& opts, const CliArgs& pos) {
    if (pos.argc < 1) {
        return usage(env, "user-add: missing email");
    }

    User user;
    user.email = pos.argv[0];
    user.created_at = env.storage.now();
    if (const char* name = option_str(opts, OptionId::Name)) {
        const std::string full = name;
        const auto space = full.find(' ');
        user.first_name = full.substr(0, space);
        if (space != std::string::npos) {
            user.last_name = full.substr(space + 1);
        }
    }

    UserId id;
    Status s = cabinet::db::db_user_create(env.storage.db, user, &id);
    if (!is_ok(s)) {
        return report(env, "user-add", s);
    }
    std::fprintf(env.out, "user %u %s\n", id.v, user.email.c_str());
    return ok_status();
}

Status handle_mkdir(const CliEnv& env, const ParsedOptions& opts, const CliArgs& pos) {
    UserId user;
    if (!require_user(env, opts, "mkdir", &user)) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    if (pos.argc < 1) {
        return usage(env, "mkdir: missing folder name");
    }
    FolderId parent;
    if (!folder_option(opts, OptionId::Parent, &parent)) {
        return usage(env, "mkdir: bad --parent");
    }

    Folder folder;
    Status s = folder_create(env.storage, user, pos.argv[0], parent, &folder);
    if (!is_ok(s)) {
        return report(env, "mkdir", s);
    }
    std::fprintf(env.out, "folder %llu %s\n", static_cast<unsigned long long>(folder.id.v), folder.path.c_str());
    return ok_status();
}

Status handle_list(const CliEnv& env, const ParsedOptions& opts) {
    UserId user;
    if (!require_user(env, opts, "ls", &user)) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    FolderId folder;
    if (!folder_option(opts, OptionId::Folder, &folder)) {
        return usage(env, "ls: bad --folder");
    }

    std::vector<Folder> folders;
    Status s = folder_list(env.storage, user, folder, &folders);
    if (!is_ok(s)) {
        return report(env, "ls", s);
    }
    std::vector<File> files;
    s = file_list(env.storage, user, folder, &files);
    if (!is_ok(s)) {
        return report(env, "ls", s);
    }

    for (const Folder& f : folders) {
        std::fprintf(env.out, "d %6llu  %10s  %s/\n", static_cast<unsigned long long>(f.id.v), "-", f.name.c_str());
    }
    for (const File& f : files) {
        std::fprintf(env.out, "f %6llu  %10s  %s%s\n", static_cast<unsigned long long>(f.id.v),
                     format_size(f.size_bytes).c_str(), f.name.c_str(), f.is_public ? "  (public)" : "");
    }
    return ok_status();
}

Status handle_rename(const CliEnv& env, const ParsedOptions& opts, const CliArgs& pos) {
    UserId user;
    if (!require_user(env, opts, "rename", &user)) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    TargetKind kind;
    if (pos.argc < 3 || !parse_kind(pos.argv[0], &kind)) {
        return usage(env, "rename: expected <folder|file> <id> <new-name>");
    }

    if (kind == TargetKind::Folder) {
        FolderId id;
        if (!parse_id(pos.argv[1], &id)) {
            return usage(env, "rename: bad folder id");
        }
        Folder folder;
        Status s = folder_rename(env.storage, id, user, pos.argv[2], &folder);
        if (!is_ok(s)) {
            return report(env, "rename", s);
        }
        std::fprintf(env.out, "folder %llu %s\n", static_cast<unsigned long long>(folder.id.v), folder.path.c_str());
        return ok_status();
    }

    FileId id;
    if (!parse_id(pos.argv[1], &id)) {
        return usage(env, "rename: bad file id");
    }
    File file;
    Status s = file_rename(env.storage, id, user, pos.argv[2], &file);
    if (!is_ok(s)) {
        return report(env, "rename", s);
    }
    std::fprintf(env.out, "file %llu %s\n", static_cast<unsigned long long>(file.id.v), file.name.c_str());
    return ok_status();
}

Status handle_rmdir(const CliEnv& env, const ParsedOptions& opts, const CliArgs& pos) {
    UserId user;
    if (!require_user(env, opts, "rmdir", &user)) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    FolderId id;
    if (pos.argc < 1 || !parse_id(pos.argv[0], &id)) {
        return usage(env, "rmdir: expected <folder-id>");
    }

    FolderDeleteReport rep;
    Status s = folder_delete(env.storage, id, user, &rep);
    if (!is_ok(s)) {
        return report(env, "rmdir", s);
    }
    std::fprintf(env.out, "removed %llu folders, %llu files\n",
                 static_cast<unsigned long long>(rep.folders_removed),
                 static_cast<unsigned long long>(rep.files_removed));
    if (rep.blob_failures > 0) {
        std::fprintf(env.err, "warning: %llu blobs could not be deleted\n",
                     static_cast<unsigned long long>(rep.blob_failures));
    }
    return ok_status();
}

Status handle_put(const CliEnv& env, const ParsedOptions& opts, const CliArgs& pos) {
    UserId user;
    if (!require_user(env, opts, "put", &user)) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    if (pos.argc < 1) {
        return usage(env, "put: missing path");
    }

    UploadRequest req;
    if (!folder_option(opts, OptionId::Folder, &req.folder)) {
        return usage(env, "put: bad --folder");
    }
    const char* path = pos.argv[0];
    const char* name = option_str(opts, OptionId::Name);
    req.name = name ? name : base_name(path);
    req.mime_type = guess_mime_type(file_extension(req.name));

    std::vector<u8> content;
    Status s = read_local_file(path, &content);
    if (!is_ok(s)) {
        std::fprintf(env.err, "error: put: failed to read %s\n", path);
        return s;
    }
    req.content.data = content.data();
    req.content.len = content.size();

    File file;
    s = file_upload(env.storage, user, req, &file);
    if (!is_ok(s)) {
        return report(env, "put", s);
    }
    std::fprintf(env.out, "file %llu %s %s\n", static_cast<unsigned long long>(file.id.v),
                 format_size(file.size_bytes).c_str(), file.name.c_str());
    return ok_status();
}

Status handle_move(const CliEnv& env, const ParsedOptions& opts, const CliArgs& pos) {
    UserId user;
    if (!require_user(env, opts, "mv", &user)) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    FileId id;
    if (pos.argc < 1 || !parse_id(pos.argv[0], &id)) {
        return usage(env, "mv: expected <file-id>");
    }
    FolderId folder;
    if (!folder_option(opts, OptionId::Folder, &folder)) {
        return usage(env, "mv: bad --folder");
    }

    File file;
    Status s = file_move(env.storage, id, user, folder, &file);
    if (!is_ok(s)) {
        return report(env, "mv", s);
    }
    std::fprintf(env.out, "file %llu moved\n", static_cast<unsigned long long>(file.id.v));
    return ok_status();
}

Status handle_remove(const CliEnv& env, const ParsedOptions& opts, const CliArgs& pos) {
    UserId user;
    if (!require_user(env, opts, "rm", &user)) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    FileId id;
    if (pos.argc < 1 || !parse_id(pos.argv[0], &id)) {
        return usage(env, "rm: expected <file-id>");
    }

    Status s = file_delete(env.storage, id, user);
    if (!is_ok(s)) {
        return report(env, "rm", s);
    }
    std::fprintf(env.out, "file %llu deleted\n", static_cast<unsigned long long>(id.v));
    return ok_status();
}

Status handle_share(const CliEnv& env, const ParsedOptions& opts, const CliArgs& pos) {
    UserId user;
    if (!require_user(env, opts, "share", &user)) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    TargetKind kind;
    if (pos.argc < 3 || !parse_kind(pos.argv[0], &kind)) {
        return usage(env, "share: expected <file|folder> <id> <user-id>");
    }
    // File and folder ids share a representation.
    FileId target_id;
    UserId grantee;
    if (!parse_id(pos.argv[1], &target_id) || !parse_id(pos.argv[2], &grantee)) {
        return usage(env, "share: bad id");
    }

    Permission perm = Permission::View;
    if (const char* p = option_str(opts, OptionId::Perm); p && !permission_parse(p, &perm)) {
        return usage(env, "share: --perm must be view or edit");
    }

    const ShareTarget target = kind == TargetKind::File
        ? ShareTarget::of_file(target_id)
        : ShareTarget::of_folder(FolderId{target_id.v});

    Share share;
    bool created = false;
    Status s = share_grant(env.storage, user, target, grantee, perm, &share, &created);
    if (!is_ok(s)) {
        return report(env, "share", s);
    }
    std::fprintf(env.out, "share %llu %s (%s)\n", static_cast<unsigned long long>(share.id.v),
                 created ? "created" : "updated", permission_name(share.permission));
    return ok_status();
}

Status handle_unshare(const CliEnv& env, const ParsedOptions& opts, const CliArgs& pos) {
    UserId user;
    if (!require_user(env, opts, "unshare", &user)) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    ShareId id;
    if (pos.argc < 1 || !parse_id(pos.argv[0], &id)) {
        return usage(env, "unshare: expected <share-id>");
    }

    Status s = share_revoke(env.storage, id, user);
    if (!is_ok(s)) {
        return report(env, "unshare", s);
    }
    std::fprintf(env.out, "share %llu removed\n", static_cast<unsigned long long>(id.v));
    return ok_status();
}

Status handle_link(const CliEnv& env, const ParsedOptions& opts, const CliArgs& pos) {
    UserId user;
    if (!require_user(env, opts, "link", &user)) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    FileId id;
    if (pos.argc < 1 || !parse_id(pos.argv[0], &id)) {
        return usage(env, "link: expected <file-id>");
    }

    Timestamp ttl_seconds = 0;
    if (const ParsedOption* ttl = find_option(opts, OptionId::Ttl)) {
        if (ttl->value.i64v <= 0 || ttl->value.i64v > static_cast<i64>(kMaxLinkTtlHours)) {
            return usage(env, "link: --ttl must be a positive number of hours");
        }
        ttl_seconds = static_cast<Timestamp>(ttl->value.i64v) * 3600;
    }

    PublicLink link;
    Status s = public_link_issue(env.storage, id, user, ttl_seconds, &link);
    if (!is_ok(s)) {
        return report(env, "link", s);
    }
    std::fprintf(env.out, "%s\n", link.url.c_str());
    if (link.expires_at != 0) {
        std::fprintf(env.out, "expires_at=%lld\n", static_cast<long long>(link.expires_at));
    }
    return ok_status();
}

Status handle_unlink(const CliEnv& env, const ParsedOptions& opts, const CliArgs& pos) {
    UserId user;
    if (!require_user(env, opts, "unlink", &user)) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    FileId id;
    if (pos.argc < 1 || !parse_id(pos.argv[0], &id)) {
        return usage(env, "unlink: expected <file-id>");
    }

    Status s = public_link_revoke(env.storage, id, user);
    if (!is_ok(s)) {
        return report(env, "unlink", s);
    }
    std::fprintf(env.out, "file %llu is private\n", static_cast<unsigned long long>(id.v));
    return ok_status();
}

Status handle_stats(const CliEnv& env, const ParsedOptions& opts) {
    UserId user;
    if (!require_user(env, opts, "stats", &user)) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }

    StorageStats stats;
    Status s = storage_stats(env.storage, user, &stats);
    if (!is_ok(s)) {
        return report(env, "stats", s);
    }
    std::fprintf(env.out, "total=%s files=%llu folders=%llu\n", format_size(stats.total_bytes).c_str(),
                 static_cast<unsigned long long>(stats.file_count),
                 static_cast<unsigned long long>(stats.folder_count));
    return ok_status();
}

Status handle_request(const CliEnv& env, const ParsedOptions& opts, const CliArgs& pos) {
    if (pos.argc < 2) {
        return usage(env, "request: expected <METHOD> <PATH>");
    }

    cabinet::bindings::http::HttpRequest req;
    req.method = pos.argv[0];
    req.path = pos.argv[1];
    if (const char* body = option_str(opts, OptionId::Body)) {
        req.body = body;
        req.headers.push_back({"Content-Type", "application/json"});
    }
    if (find_option(opts, OptionId::User) != nullptr && !option_id(opts, OptionId::User, &req.principal)) {
        return usage(env, "request: bad --user");
    }

    cabinet::bindings::http::HttpContext http_ctx;
    http_ctx.storage = env.storage;
    http_ctx.blob_server = env.blob_server;

    cabinet::bindings::http::HttpResponse resp;
    const Status s = cabinet::bindings::http::handle_http_request(http_ctx, req, &resp);
    std::fprintf(env.out, "HTTP %u %s\n", static_cast<unsigned>(resp.status), resp.content_type.c_str());
    std::fwrite(resp.body.data(), 1, resp.body.size(), env.out);
    std::fputc('\n', env.out);
    return s;
}

} // namespace

Status run_command(const CliEnv& env, CommandId id, const ParsedOptions& opts, const CliArgs& positional) noexcept {
    if (!context_valid(env.storage) || env.out == nullptr || env.err == nullptr) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }

    try {
        switch (id) {
            case CommandId::Help:
                print_usage(env.out);
                return ok_status();
            case CommandId::Init:    return handle_init(env);
            case CommandId::UserAdd: return handle_user_add(env, opts, positional);
            case CommandId::Mkdir:   return handle_mkdir(env, opts, positional);
            case CommandId::List:    return handle_list(env, opts);
            case CommandId::Rename:  return handle_rename(env, opts, positional);
            case CommandId::Rmdir:   return handle_rmdir(env, opts, positional);
            case CommandId::Put:     return handle_put(env, opts, positional);
            case CommandId::Move:    return handle_move(env, opts, positional);
            case CommandId::Remove:  return handle_remove(env, opts, positional);
            case CommandId::Share:   return handle_share(env, opts, positional);
            case CommandId::Unshare: return handle_unshare(env, opts, positional);
            case CommandId::Link:    return handle_link(env, opts, positional);
            case CommandId::Unlink:  return handle_unlink(env, opts, positional);
            case CommandId::Stats:   return handle_stats(env, opts);
            case CommandId::Request: return handle_request(env, opts, positional);
            case CommandId::None:    break;
        }
    } catch (const std::exception& e) {
        CABINET_LOG_ERROR << "cli: command failed: " << e.what();
        return make_status(StatusDomain::Cli, StatusCode::Unknown);
    }
    return make_status(StatusDomain::Cli, StatusCode::Invalid);
}

} // namespace cabinet::cli
