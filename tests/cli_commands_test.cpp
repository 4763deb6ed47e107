#include <array>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <unistd.h>

#include "test_support.hpp"

#include "cabinet/cli/commands.hpp"
#include "cabinet/cli/options.hpp"

TEST(CliCommands, ParsesKnownCommandAndReturnsRemainingArgs) {
    const std::array<cabinet::cli::CommandSpec, 3> specs = {{
        {cabinet::cli::CommandId::Help, "help"},
        {cabinet::cli::CommandId::Put, "put"},
        {cabinet::cli::CommandId::Mkdir, "mkdir"},
    }};

    const char* argv[] = {"put", "file.txt", "--folder", "3"};
    const cabinet::cli::CliArgs args{argv, 4};

    cabinet::cli::CommandInvocation out{};
    cabinet::cli::u32 consumed = 0;
    const cabinet::core::Status s = cabinet::cli::parse_command(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, cabinet::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 1u);
    EXPECT_EQ(out.id, cabinet::cli::CommandId::Put);
    ASSERT_EQ(out.args.argc, 3u);
    EXPECT_STREQ(out.args.argv[0], "file.txt");
}

TEST(CliCommands, InvalidOnUnknownCommandOrLeadingDash) {
    const std::array<cabinet::cli::CommandSpec, 1> specs = {{{cabinet::cli::CommandId::Help, "help"}}};
    cabinet::cli::CommandInvocation out{};
    cabinet::cli::u32 consumed = 0;

    const char* unknown[] = {"nope"};
    EXPECT_EQ(cabinet::cli::parse_command({unknown, 1}, specs.data(), specs.size(), &out, &consumed).code,
              cabinet::core::StatusCode::Invalid);

    const char* dashed[] = {"-help"};
    EXPECT_EQ(cabinet::cli::parse_command({dashed, 1}, specs.data(), specs.size(), &out, &consumed).code,
              cabinet::core::StatusCode::Invalid);

    EXPECT_EQ(cabinet::cli::parse_command({nullptr, 0}, specs.data(), specs.size(), &out, &consumed).code,
              cabinet::core::StatusCode::Invalid);
}

TEST(CliCommands, CommandTableNamesEveryCommand) {
    cabinet::cli::u32 count = 0;
    const cabinet::cli::CommandSpec* table = cabinet::cli::command_table(&count);
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(count, 16u);

    const char* argv[] = {"share"};
    cabinet::cli::CommandInvocation out{};
    cabinet::cli::u32 consumed = 0;
    ASSERT_EQ(cabinet::cli::parse_command({argv, 1}, table, count, &out, &consumed).code,
              cabinet::core::StatusCode::Ok);
    EXPECT_EQ(out.id, cabinet::cli::CommandId::Share);
}

// ============================================================================
// run_command
// ============================================================================

namespace {

using cabinet::core::is_ok;
using cabinet::core::Status;
using cabinet::core::StatusCode;

std::string drain(std::FILE* f) {
    std::fflush(f);
    std::rewind(f);
    std::string text;
    char buf[512];
    std::size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
        text.append(buf, n);
    }
    return text;
}

class CliRunTest : public cabinet::test::StorageTest {
protected:
    void SetUp() override {
        StorageTest::SetUp();
        env.storage = ctx;
        env.db_path = ":memory:";
    }

    // Splits argv the way the executable does: command name, then its
    // options, then positionals.
    Status run(std::initializer_list<const char*> words) {
        std::vector<const char*> argv(words);
        cabinet::cli::u32 command_count = 0;
        const cabinet::cli::CommandSpec* commands = cabinet::cli::command_table(&command_count);
        cabinet::cli::u32 option_count = 0;
        const cabinet::cli::OptionSpec* options = cabinet::cli::option_table(&option_count);

        cabinet::cli::CommandInvocation cmd;
        cabinet::cli::u32 consumed = 0;
        const cabinet::cli::CliArgs all{argv.data(), static_cast<cabinet::cli::u32>(argv.size())};
        Status s = cabinet::cli::parse_command(all, commands, command_count, &cmd, &consumed);
        if (!is_ok(s)) {
            return s;
        }

        opts_.assign(16, cabinet::cli::ParsedOption{});
        cabinet::cli::ParsedOptions parsed{opts_.data(), 0, static_cast<cabinet::cli::u32>(opts_.size())};
        s = cabinet::cli::parse_options(cmd.args, options, option_count, &parsed, &consumed);
        if (!is_ok(s)) {
            return s;
        }
        const cabinet::cli::CliArgs positional{cmd.args.argv + consumed, cmd.args.argc - consumed};

        std::FILE* out_file = std::tmpfile();
        std::FILE* err_file = std::tmpfile();
        EXPECT_NE(out_file, nullptr);
        EXPECT_NE(err_file, nullptr);
        env.out = out_file;
        env.err = err_file;
        s = cabinet::cli::run_command(env, cmd.id, parsed, positional);
        out = drain(out_file);
        err = drain(err_file);
        std::fclose(out_file);
        std::fclose(err_file);
        return s;
    }

    bool out_has(const std::string& needle) const {
        return out.find(needle) != std::string::npos;
    }

    cabinet::cli::CliEnv env;
    std::string out;
    std::string err;

private:
    std::vector<cabinet::cli::ParsedOption> opts_;
};

} // namespace

TEST_F(CliRunTest, UserAddSplitsName) {
    ASSERT_TRUE(is_ok(run({"user-add", "--name", "Ann Lee", "ann@example.com"})));
    EXPECT_EQ(out, "user 1 ann@example.com\n");

    cabinet::core::User u;
    ASSERT_TRUE(is_ok(cabinet::db::db_user_get(db, cabinet::core::UserId{1}, &u)));
    EXPECT_EQ(u.first_name, "Ann");
    EXPECT_EQ(u.last_name, "Lee");

    EXPECT_EQ(run({"user-add", "ann@example.com"}).code, StatusCode::Conflict);
    EXPECT_NE(err.find("user-add failed (conflict"), std::string::npos);
}

TEST_F(CliRunTest, MkdirListAndRename) {
    add_user("ann@example.com");
    ASSERT_TRUE(is_ok(run({"mkdir", "-u", "1", "Docs"})));
    EXPECT_EQ(out, "folder 1 /Docs\n");
    ASSERT_TRUE(is_ok(run({"mkdir", "-u", "1", "--parent", "1", "2024"})));
    EXPECT_EQ(out, "folder 2 /Docs/2024\n");

    ASSERT_TRUE(is_ok(run({"ls", "-u", "1"})));
    EXPECT_TRUE(out_has("Docs/"));
    EXPECT_FALSE(out_has("2024/"));

    ASSERT_TRUE(is_ok(run({"rename", "-u", "1", "folder", "1", "Papers"})));
    EXPECT_EQ(out, "folder 1 /Papers\n");
    ASSERT_TRUE(is_ok(run({"ls", "-u", "1", "--folder", "1"})));
    EXPECT_TRUE(out_has("2024/"));
}

TEST_F(CliRunTest, UsageErrorsAreInvalidInCliDomain) {
    add_user("ann@example.com");

    Status s = run({"mkdir", "Docs"});
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(s.domain, cabinet::core::StatusDomain::Cli);
    EXPECT_NE(err.find("--user <id> is required"), std::string::npos);

    s = run({"rename", "-u", "1", "thing", "1", "x"});
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_NE(err.find("expected <folder|file>"), std::string::npos);

    EXPECT_EQ(run({"rm", "-u", "1", "abc"}).code, StatusCode::Invalid);
    EXPECT_EQ(run({"link", "-u", "1", "--ttl", "0", "1"}).code, StatusCode::Invalid);
}

TEST_F(CliRunTest, PutMoveShareLinkAndRemove) {
    add_user("ann@example.com", "Ann", "Lee");
    add_user("bob@example.com", "Bob", "Ray");

    const std::string path =
        (std::filesystem::temp_directory_path() / ("cabinet_cli_" + std::to_string(::getpid()) + ".txt")).string();
    {
        std::ofstream f(path, std::ios::binary);
        f << "hello";
    }

    ASSERT_TRUE(is_ok(run({"put", "-u", "1", path.c_str()})));
    EXPECT_TRUE(out_has("file 1 5 Bytes cabinet_cli_"));
    ASSERT_EQ(blobs.blobs.size(), 1u);
    EXPECT_EQ(blobs.blobs.begin()->second, "hello");

    ASSERT_TRUE(is_ok(run({"put", "-u", "1", "--name", "notes.md", path.c_str()})));
    EXPECT_EQ(out, "file 2 5 Bytes notes.md\n");
    cabinet::core::File f2;
    ASSERT_TRUE(is_ok(cabinet::db::db_file_get(db, cabinet::core::FileId{2}, &f2)));
    EXPECT_EQ(f2.mime_type, "text/markdown");
    std::filesystem::remove(path);

    ASSERT_TRUE(is_ok(run({"mkdir", "-u", "1", "Inbox"})));
    ASSERT_TRUE(is_ok(run({"mv", "-u", "1", "--folder", "1", "2"})));
    EXPECT_EQ(out, "file 2 moved\n");

    ASSERT_TRUE(is_ok(run({"share", "-u", "1", "--perm", "edit", "file", "2", "2"})));
    EXPECT_EQ(out, "share 1 created (edit)\n");
    ASSERT_TRUE(is_ok(run({"share", "-u", "1", "file", "2", "2"})));
    EXPECT_EQ(out, "share 1 updated (view)\n");
    EXPECT_EQ(run({"share", "-u", "1", "--perm", "admin", "file", "2", "2"}).code, StatusCode::Invalid);

    ASSERT_TRUE(is_ok(run({"link", "-u", "1", "--ttl", "2", "2"})));
    EXPECT_TRUE(out_has("/api/storage/public/"));
    EXPECT_TRUE(out_has("expires_at=" + std::to_string(cabinet::test::g_now + 7200)));
    ASSERT_TRUE(is_ok(run({"unlink", "-u", "1", "2"})));
    EXPECT_EQ(out, "file 2 is private\n");

    EXPECT_EQ(run({"unshare", "-u", "2", "1"}).code, StatusCode::NotFound);
    ASSERT_TRUE(is_ok(run({"unshare", "-u", "1", "1"})));

    ASSERT_TRUE(is_ok(run({"stats", "-u", "1"})));
    EXPECT_EQ(out, "total=10 Bytes files=2 folders=1\n");

    ASSERT_TRUE(is_ok(run({"rmdir", "-u", "1", "1"})));
    EXPECT_EQ(out, "removed 1 folders, 1 files\n");
    ASSERT_TRUE(is_ok(run({"rm", "-u", "1", "1"})));
    EXPECT_EQ(out, "file 1 deleted\n");
    EXPECT_TRUE(blobs.blobs.empty());
}

TEST_F(CliRunTest, PutOfMissingLocalFileFails) {
    add_user("ann@example.com");
    const Status s = run({"put", "-u", "1", "/nonexistent/cabinet/file.txt"});
    EXPECT_EQ(s.code, StatusCode::NotFound);
    EXPECT_NE(err.find("failed to read"), std::string::npos);
    EXPECT_EQ(blobs.put_calls, 0);
}

TEST_F(CliRunTest, RequestGoesThroughTheRestBridge) {
    add_user("ann@example.com");
    ASSERT_TRUE(is_ok(run({"request", "-u", "1", "--body", "{\"name\":\"Docs\"}", "POST", "/api/storage/folders"})));
    EXPECT_TRUE(out_has("HTTP 201 application/json"));
    EXPECT_TRUE(out_has("\"name\":\"Docs\""));

    EXPECT_EQ(run({"request", "GET", "/api/storage/stats"}).code, StatusCode::PermissionDenied);
    EXPECT_TRUE(out_has("HTTP 401"));
}

TEST_F(CliRunTest, HelpPrintsUsage) {
    ASSERT_TRUE(is_ok(run({"help"})));
    EXPECT_TRUE(out_has("usage: cabinet"));
}

TEST_F(CliRunTest, InvalidEnvironmentIsRejected) {
    env.storage.blobs = nullptr;
    EXPECT_EQ(run({"help"}).code, StatusCode::Invalid);
}
