#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include "cabinet/blob/fs_blob_store.hpp"
#include "cabinet/cli/commands.hpp"
#include "cabinet/cli/options.hpp"
#include "cabinet/core/config.hpp"
#include "cabinet/core/errors.hpp"
#include "cabinet/core/log.hpp"
#include "cabinet/db/db.hpp"
#include "cabinet/security/token.hpp"

// ========================================================================
// Exit codes
// ========================================================================

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

constexpr cabinet::core::u32 kMaxOptions = 32;

void print_status_error(const char* context, cabinet::core::Status s) {
    std::fprintf(stderr, "error: %s failed (%s, %s, aux=%u)\n",
                 context,
                 cabinet::core::status_code_name(s.code),
                 cabinet::core::status_domain_name(s.domain),
                 s.aux);
}

// Makes sure the parent directory of path exists.
void ensure_parent_dir(const std::string& path) {
    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        CABINET_LOG_WARN << "cli: cannot create " << parent.string() << ": " << ec.message();
    }
}

} // namespace

int main(int argc, char** argv) {
    using namespace cabinet;

    core::Config cfg;
    core::Status s = core::config_load_env(&cfg);
    if (!core::is_ok(s)) {
        print_status_error("configuration", s);
        return kExitUsage;
    }

    core::u32 option_count = 0;
    const cli::OptionSpec* options = cli::option_table(&option_count);
    core::u32 command_count = 0;
    const cli::CommandSpec* commands = cli::command_table(&command_count);

    // Options before the command name.
    cli::ParsedOption global_buf[kMaxOptions]{};
    cli::ParsedOptions global{global_buf, 0, kMaxOptions};
    core::u32 consumed = 0;
    const cli::CliArgs all{argv + 1, static_cast<core::u32>(argc > 0 ? argc - 1 : 0)};
    s = cli::parse_options(all, options, option_count, &global, &consumed);
    if (!core::is_ok(s)) {
        std::fprintf(stderr, "error: bad option\n");
        cli::print_usage(stderr);
        return kExitUsage;
    }

    cli::CommandInvocation cmd;
    const cli::CliArgs rest{all.argv + consumed, all.argc - consumed};
    core::u32 cmd_consumed = 0;
    s = cli::parse_command(rest, commands, command_count, &cmd, &cmd_consumed);
    if (!core::is_ok(s)) {
        if (rest.argc > 0) {
            std::fprintf(stderr, "error: unknown command '%s'\n", rest.argv[0]);
        }
        cli::print_usage(stderr);
        return kExitUsage;
    }
    if (cmd.id == cli::CommandId::Help) {
        cli::print_usage(stdout);
        return kExitOk;
    }

    // Options after the command name, merged behind the global ones so they win.
    cli::ParsedOption merged_buf[kMaxOptions * 2]{};
    for (core::u32 i = 0; i < global.len; ++i) {
        merged_buf[i] = global.data[i];
    }
    cli::ParsedOptions local{merged_buf + global.len, 0, kMaxOptions};
    s = cli::parse_options(cmd.args, options, option_count, &local, &consumed);
    if (!core::is_ok(s)) {
        std::fprintf(stderr, "error: bad option\n");
        cli::print_usage(stderr);
        return kExitUsage;
    }
    const cli::ParsedOptions merged{merged_buf, global.len + local.len, kMaxOptions * 2};
    const cli::CliArgs positional{cmd.args.argv + consumed, cmd.args.argc - consumed};

    if (const cli::ParsedOption* opt = cli::find_option(merged, cli::OptionId::Db)) {
        cfg.db_path = opt->value.str;
    }
    if (const cli::ParsedOption* opt = cli::find_option(merged, cli::OptionId::Data)) {
        cfg.data_root = opt->value.str;
    }

    core::init_logging(cfg.log_file, cfg.log_level);

    if (cfg.db_path != ":memory:") {
        ensure_parent_dir(cfg.db_path);
    }
    std::error_code ec;
    std::filesystem::create_directories(cfg.data_root, ec);
    if (ec) {
        std::fprintf(stderr, "error: cannot create data root %s: %s\n", cfg.data_root.c_str(), ec.message().c_str());
        return kExitFailure;
    }

    db::DbHandle handle;
    s = db::db_open(db::DbConfig{cfg.db_path.c_str(), cfg.journal_mode.c_str()}, &handle);
    if (!core::is_ok(s)) {
        print_status_error("database open", s);
        return kExitFailure;
    }

    blob::FsBlobStoreConfig store_cfg;
    store_cfg.data_root = cfg.data_root;
    store_cfg.base_url = cfg.public_base_url;
    store_cfg.ttl_seconds = cfg.download_ttl_seconds;
    if (cfg.has_signing_key) {
        std::memcpy(store_cfg.signing_key.b, cfg.signing_key.data(), sizeof(store_cfg.signing_key.b));
    } else {
        s = security::random_bytes(store_cfg.signing_key.b, sizeof(store_cfg.signing_key.b));
        if (!core::is_ok(s)) {
            print_status_error("signing key", s);
            (void)db::db_close(handle);
            return kExitFailure;
        }
        CABINET_LOG_DEBUG << "cli: no CABINET_SIGNING_KEY, download URLs are valid for this process only";
    }
    blob::FsBlobStore store(std::move(store_cfg));

    cli::CliEnv env;
    env.storage.db = handle;
    env.storage.blobs = &store;
    env.storage.max_upload_bytes = cfg.max_upload_bytes;
    env.storage.public_base_url = cfg.public_base_url;
    env.blob_server = &store;
    env.db_path = cfg.db_path;

    s = cli::run_command(env, cmd.id, merged, positional);

    const core::Status close_status = db::db_close(handle);
    if (!core::is_ok(close_status)) {
        print_status_error("database close", close_status);
    }

    if (core::is_ok(s)) {
        return kExitOk;
    }
    if (s.domain == core::StatusDomain::Cli && s.code == core::StatusCode::Invalid) {
        return kExitUsage;
    }
    return kExitFailure;
}
