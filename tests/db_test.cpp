#include <gtest/gtest.h>
#include "cabinet/db/db.hpp"
#include <string>
#include <vector>

using namespace cabinet::db;
using namespace cabinet::core;

namespace {

class DbTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(is_ok(db_open(DbConfig{}, &handle)));
        owner = add_user("owner@example.com");
        other = add_user("other@example.com");
    }

    void TearDown() override {
        (void)db_close(handle);
    }

    UserId add_user(const std::string& email) {
        User u;
        u.first_name = "Test";
        u.email = email;
        u.created_at = 100;
        UserId id{};
        EXPECT_TRUE(is_ok(db_user_create(handle, u, &id)));
        return id;
    }

    // Inserts a folder the way the storage layer does, path included.
    FolderId add_folder(const std::string& name, FolderId parent, UserId who) {
        Folder f;
        f.name = name;
        f.parent = parent;
        f.owner = who;
        if (folder_is_root(parent)) {
            f.path = "/" + name;
        } else {
            Folder p;
            EXPECT_TRUE(is_ok(db_folder_get(handle, parent, &p)));
            f.path = p.path + "/" + name;
        }
        f.created_at = 100;
        f.updated_at = 100;
        FolderId id{};
        EXPECT_TRUE(is_ok(db_folder_create(handle, f, &id)));
        return id;
    }

    FileId add_file(const std::string& name, FolderId folder, UserId who, const std::string& key) {
        File f;
        f.name = name;
        f.folder = folder;
        f.owner = who;
        f.blob_key = key;
        f.size_bytes = 10;
        f.mime_type = "text/plain";
        f.created_at = 100;
        f.updated_at = 100;
        FileId id{};
        EXPECT_TRUE(is_ok(db_file_create(handle, f, &id)));
        return id;
    }

    DbHandle handle{};
    UserId owner{};
    UserId other{};
};

} // namespace

//=============================================================================
// Database Lifecycle Tests
//=============================================================================

TEST(Database, OpenClose) {
    DbConfig cfg{};
    DbHandle handle;

    Status s = db_open(cfg, &handle);
    EXPECT_TRUE(is_ok(s));
    EXPECT_TRUE(db_handle_valid(handle));

    s = db_close(handle);
    EXPECT_TRUE(is_ok(s));
}

TEST(Database, OpenWithNullOut) {
    DbConfig cfg{};
    Status s = db_open(cfg, nullptr);
    EXPECT_FALSE(is_ok(s));
    EXPECT_EQ(s.code, StatusCode::Invalid);
}

TEST(Database, CloseInvalidHandle) {
    DbHandle invalid{0};
    Status s = db_close(invalid);
    EXPECT_FALSE(is_ok(s));
}

TEST(Database, MultipleOpenClose) {
    DbConfig cfg{};
    DbHandle handle;

    for (int i = 0; i < 3; ++i) {
        Status s = db_open(cfg, &handle);
        EXPECT_TRUE(is_ok(s));

        s = db_close(handle);
        EXPECT_TRUE(is_ok(s));
    }
}

//=============================================================================
// Users
//=============================================================================

TEST_F(DbTest, DuplicateEmailConflicts) {
    User u;
    u.email = "owner@example.com";
    UserId id{};
    EXPECT_EQ(db_user_create(handle, u, &id).code, StatusCode::Conflict);
}

TEST_F(DbTest, UserRoundTrip) {
    User u;
    ASSERT_TRUE(is_ok(db_user_get(handle, owner, &u)));
    EXPECT_EQ(u.email, "owner@example.com");
    EXPECT_TRUE(u.active);
    EXPECT_EQ(db_user_get(handle, UserId{999}, &u).code, StatusCode::NotFound);
}

TEST_F(DbTest, ListsActiveUsers) {
    std::vector<User> users;
    ASSERT_TRUE(is_ok(db_user_list_active(handle, &users)));
    EXPECT_EQ(users.size(), 2u);
}

//=============================================================================
// Folders
//=============================================================================

TEST_F(DbTest, SiblingNamesAreUnique) {
    const FolderId docs = add_folder("Docs", kRootFolder, owner);

    Folder dup;
    dup.name = "Docs";
    dup.owner = owner;
    dup.path = "/Docs";
    FolderId id{};
    EXPECT_EQ(db_folder_create(handle, dup, &id).code, StatusCode::Conflict);

    // Same name under a different parent, or for another user, is fine.
    add_folder("Docs", docs, owner);
    add_folder("Docs", kRootFolder, other);
}

TEST_F(DbTest, MissingParentIsRejected) {
    Folder f;
    f.name = "Orphan";
    f.owner = owner;
    f.parent = FolderId{4242};
    f.path = "/ghost/Orphan";
    FolderId id{};
    EXPECT_FALSE(is_ok(db_folder_create(handle, f, &id)));
}

TEST_F(DbTest, ListsChildrenByName) {
    const FolderId root = add_folder("Root", kRootFolder, owner);
    add_folder("b", root, owner);
    add_folder("a", root, owner);
    add_folder("Top", kRootFolder, owner);

    std::vector<Folder> children;
    ASSERT_TRUE(is_ok(db_folder_list(handle, owner, root, &children)));
    ASSERT_EQ(children.size(), 2u);
    EXPECT_EQ(children[0].name, "a");
    EXPECT_EQ(children[1].name, "b");

    std::vector<Folder> top;
    ASSERT_TRUE(is_ok(db_folder_list(handle, owner, kRootFolder, &top)));
    EXPECT_EQ(top.size(), 2u);
}

TEST_F(DbTest, RenameRewritesDescendantPaths) {
    const FolderId a = add_folder("A", kRootFolder, owner);
    const FolderId b = add_folder("B", a, owner);
    const FolderId c = add_folder("C", b, owner);
    const FolderId ab = add_folder("AB", kRootFolder, owner);

    Folder renamed;
    ASSERT_TRUE(is_ok(db_folder_rename_subtree(handle, a, owner, "Z", 200, &renamed)));
    EXPECT_EQ(renamed.path, "/Z");
    EXPECT_EQ(renamed.updated_at, 200);

    Folder f;
    ASSERT_TRUE(is_ok(db_folder_get(handle, b, &f)));
    EXPECT_EQ(f.path, "/Z/B");
    ASSERT_TRUE(is_ok(db_folder_get(handle, c, &f)));
    EXPECT_EQ(f.path, "/Z/B/C");

    // A sibling sharing the old prefix is left alone.
    ASSERT_TRUE(is_ok(db_folder_get(handle, ab, &f)));
    EXPECT_EQ(f.path, "/AB");
}

TEST_F(DbTest, RenameConflictChangesNothing) {
    const FolderId a = add_folder("A", kRootFolder, owner);
    const FolderId b = add_folder("B", a, owner);
    add_folder("Taken", kRootFolder, owner);

    Folder out;
    EXPECT_EQ(db_folder_rename_subtree(handle, a, owner, "Taken", 200, &out).code, StatusCode::Conflict);

    Folder f;
    ASSERT_TRUE(is_ok(db_folder_get(handle, a, &f)));
    EXPECT_EQ(f.name, "A");
    ASSERT_TRUE(is_ok(db_folder_get(handle, b, &f)));
    EXPECT_EQ(f.path, "/A/B");
}

TEST_F(DbTest, RenameForeignFolderIsNotFound) {
    const FolderId a = add_folder("A", kRootFolder, owner);
    Folder out;
    EXPECT_EQ(db_folder_rename_subtree(handle, a, other, "Mine", 200, &out).code, StatusCode::NotFound);
}

TEST_F(DbTest, DeleteSubtreeRemovesFilesAndShares) {
    const FolderId a = add_folder("A", kRootFolder, owner);
    const FolderId b = add_folder("B", a, owner);
    const FolderId keep = add_folder("Keep", kRootFolder, owner);
    add_file("one.txt", a, owner, "1/k1");
    const FileId deep = add_file("two.txt", b, owner, "1/k2");
    const FileId kept = add_file("three.txt", keep, owner, "1/k3");

    Share s;
    s.file = deep;
    s.shared_with = other;
    s.shared_by = owner;
    Share stored;
    ASSERT_TRUE(is_ok(db_share_upsert(handle, s, &stored)));

    std::vector<FolderId> folders;
    std::vector<File> removed;
    ASSERT_TRUE(is_ok(db_folder_delete_subtree(handle, a, owner, &folders, &removed)));
    ASSERT_EQ(folders.size(), 2u);
    EXPECT_EQ(folders[0], a);
    EXPECT_EQ(folders[1], b);
    EXPECT_EQ(removed.size(), 2u);

    Folder f;
    EXPECT_EQ(db_folder_get(handle, b, &f).code, StatusCode::NotFound);
    File file;
    EXPECT_EQ(db_file_get(handle, deep, &file).code, StatusCode::NotFound);
    EXPECT_TRUE(is_ok(db_file_get(handle, kept, &file)));
    Share gone;
    EXPECT_EQ(db_share_get(handle, stored.id, &gone).code, StatusCode::NotFound);
}

//=============================================================================
// Files
//=============================================================================

TEST_F(DbTest, BlobKeyIsUnique) {
    add_file("a.txt", kRootFolder, owner, "1/same");
    File f;
    f.name = "b.txt";
    f.owner = owner;
    f.blob_key = "1/same";
    FileId id{};
    EXPECT_EQ(db_file_create(handle, f, &id).code, StatusCode::Conflict);
}

TEST_F(DbTest, PublicTokenLifecycle) {
    const FileId id = add_file("a.txt", kRootFolder, owner, "1/a");
    const std::string token(64, 'c');

    File f;
    EXPECT_EQ(db_file_get_by_token(handle, token, &f).code, StatusCode::NotFound);

    ASSERT_TRUE(is_ok(db_file_set_public(handle, id, owner, token, 500, 200)));
    ASSERT_TRUE(is_ok(db_file_get_by_token(handle, token, &f)));
    EXPECT_TRUE(f.is_public);
    EXPECT_EQ(f.public_expires_at, 500);

    ASSERT_TRUE(is_ok(db_file_clear_public(handle, id, owner, 300)));
    EXPECT_EQ(db_file_get_by_token(handle, token, &f).code, StatusCode::NotFound);
    ASSERT_TRUE(is_ok(db_file_get(handle, id, &f)));
    EXPECT_FALSE(f.is_public);
    EXPECT_TRUE(f.public_token.empty());
    EXPECT_EQ(f.public_expires_at, 0);
}

TEST_F(DbTest, TokenHeldByAnotherFileConflicts) {
    const FileId a = add_file("a.txt", kRootFolder, owner, "1/a");
    const FileId b = add_file("b.txt", kRootFolder, owner, "1/b");
    const std::string token(64, 'd');
    ASSERT_TRUE(is_ok(db_file_set_public(handle, a, owner, token, 0, 200)));
    EXPECT_EQ(db_file_set_public(handle, b, owner, token, 0, 200).code, StatusCode::Conflict);
}

TEST_F(DbTest, StatsCountOnlyOwner) {
    const FolderId a = add_folder("A", kRootFolder, owner);
    add_file("a.txt", a, owner, "1/a");
    add_file("b.txt", kRootFolder, owner, "1/b");
    add_file("c.txt", kRootFolder, other, "2/c");

    DbStats st;
    ASSERT_TRUE(is_ok(db_stats(handle, owner, &st)));
    EXPECT_EQ(st.file_count, 2u);
    EXPECT_EQ(st.folder_count, 1u);
    EXPECT_EQ(st.total_bytes, 20u);
}

//=============================================================================
// Shares
//=============================================================================

TEST_F(DbTest, ShareUpsertUpdatesPermission) {
    const FileId id = add_file("a.txt", kRootFolder, owner, "1/a");
    Share s;
    s.file = id;
    s.shared_with = other;
    s.shared_by = owner;
    s.created_at = 100;

    Share first;
    ASSERT_TRUE(is_ok(db_share_upsert(handle, s, &first)));
    EXPECT_EQ(first.permission, Permission::View);

    s.permission = Permission::Edit;
    Share second;
    ASSERT_TRUE(is_ok(db_share_upsert(handle, s, &second)));
    EXPECT_EQ(second.id, first.id);
    EXPECT_EQ(second.permission, Permission::Edit);

    std::vector<Share> all;
    ASSERT_TRUE(is_ok(db_share_list_for_target(handle, ShareTarget::of_file(id), &all)));
    EXPECT_EQ(all.size(), 1u);
}

TEST_F(DbTest, ShareRejectsSelfAndUnknownGrantee) {
    const FileId id = add_file("a.txt", kRootFolder, owner, "1/a");
    Share s;
    s.file = id;
    s.shared_with = owner;
    s.shared_by = owner;
    Share out;
    EXPECT_EQ(db_share_upsert(handle, s, &out).code, StatusCode::Invalid);

    s.shared_with = UserId{777};
    EXPECT_FALSE(is_ok(db_share_upsert(handle, s, &out)));
}

TEST_F(DbTest, ShareDeleteRequiresGrantor) {
    const FileId id = add_file("a.txt", kRootFolder, owner, "1/a");
    Share s;
    s.file = id;
    s.shared_with = other;
    s.shared_by = owner;
    Share stored;
    ASSERT_TRUE(is_ok(db_share_upsert(handle, s, &stored)));

    EXPECT_EQ(db_share_delete(handle, stored.id, other).code, StatusCode::NotFound);
    EXPECT_TRUE(is_ok(db_share_delete(handle, stored.id, owner)));
    EXPECT_EQ(db_share_delete(handle, stored.id, owner).code, StatusCode::NotFound);
}

TEST_F(DbTest, FileDeleteDropsShares) {
    const FileId id = add_file("a.txt", kRootFolder, owner, "1/a");
    Share s;
    s.file = id;
    s.shared_with = other;
    s.shared_by = owner;
    Share stored;
    ASSERT_TRUE(is_ok(db_share_upsert(handle, s, &stored)));

    EXPECT_EQ(db_file_delete(handle, id, other, nullptr).code, StatusCode::NotFound);

    File removed;
    ASSERT_TRUE(is_ok(db_file_delete(handle, id, owner, &removed)));
    EXPECT_EQ(removed.id, id);
    EXPECT_EQ(removed.blob_key, "1/a");
    std::vector<Share> mine;
    ASSERT_TRUE(is_ok(db_share_list_for_grantee(handle, other, &mine)));
    EXPECT_TRUE(mine.empty());
}
