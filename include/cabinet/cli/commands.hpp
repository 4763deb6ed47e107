#pragma once

#include <cstdio>
#include <string>
#include <type_traits>

#include "cabinet/blob/fs_blob_store.hpp"
#include "cabinet/cli/options.hpp"
#include "cabinet/core/errors.hpp"
#include "cabinet/storage/context.hpp"

namespace cabinet::cli {
    using u32 = cabinet::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Init = 2,
        UserAdd = 3,
        Mkdir = 4,
        List = 5,
        Rename = 6,
        Rmdir = 7,
        Put = 8,
        Move = 9,
        Remove = 10,
        Share = 11,
        Unshare = 12,
        Link = 13,
        Unlink = 14,
        Stats = 15,
        Request = 16,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    cabinet::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    // The command table of the cabinet executable.
    [[nodiscard]] const CommandSpec* command_table(u32* count) noexcept;

    // What a command runs against. Nothing here is owned.
    struct CliEnv {
        cabinet::storage::StorageContext storage;
        const cabinet::blob::FsBlobStore* blob_server{nullptr};
        std::string db_path;
        std::FILE* out{stdout};
        std::FILE* err{stderr};
    };

    // Runs one command. opts holds the options given before and after the
    // command name; positional is what follows them. Usage errors are Invalid
    // in the Cli domain and are reported on env.err.
    cabinet::core::Status run_command(const CliEnv& env,
        CommandId id,
        const ParsedOptions& opts,
        const CliArgs& positional) noexcept;

    void print_usage(std::FILE* out);

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace cabinet::cli
