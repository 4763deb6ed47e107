#include "test_support.hpp"

#include "cabinet/storage/file_registry.hpp"
#include "cabinet/storage/folder_tree.hpp"
#include "cabinet/storage/sharing.hpp"

using namespace cabinet::storage;
using namespace cabinet::core;

namespace {

class FileRegistryTest : public cabinet::test::StorageTest {
protected:
    void SetUp() override {
        StorageTest::SetUp();
        alice = add_user("alice@example.com", "Alice", "A");
        bob = add_user("bob@example.com", "Bob", "B");
        carol = add_user("carol@example.com", "Carol", "C");
    }

    UploadRequest request(const std::string& name, const std::string& body, FolderId folder = kRootFolder) {
        payload_ = body;
        UploadRequest req;
        req.folder = folder;
        req.name = name;
        req.mime_type = "application/pdf";
        req.content = bytes(payload_);
        return req;
    }

    UserId alice{};
    UserId bob{};
    UserId carol{};

private:
    std::string payload_;
};

} // namespace

// ============================================================================
// Upload
// ============================================================================

TEST_F(FileRegistryTest, UploadStoresBlobAndRow) {
    File f;
    ASSERT_TRUE(is_ok(file_upload(ctx, alice, request("Report.PDF", "%PDF-1.7"), &f)));
    EXPECT_TRUE(f.id.is_valid());
    EXPECT_EQ(f.name, "Report.PDF");
    EXPECT_EQ(f.file_type, "pdf");
    EXPECT_EQ(f.size_bytes, 8u);
    EXPECT_FALSE(f.is_public);
    EXPECT_EQ(blobs.blobs.at(f.blob_key), "%PDF-1.7");

    std::vector<File> listed;
    ASSERT_TRUE(is_ok(file_list(ctx, alice, kRootFolder, &listed)));
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0].blob_key, f.blob_key);
}

TEST_F(FileRegistryTest, MissingMimeFallsBackToOctetStream) {
    UploadRequest req = request("blob", "x");
    req.mime_type.clear();
    File f;
    ASSERT_TRUE(is_ok(file_upload(ctx, alice, req, &f)));
    EXPECT_EQ(f.mime_type, "application/octet-stream");
    EXPECT_EQ(f.file_type, "");
}

TEST_F(FileRegistryTest, OversizeIsTooLargeAndTouchesNothing) {
    ctx.max_upload_bytes = 4;
    File f;
    EXPECT_EQ(file_upload(ctx, alice, request("big.bin", "12345"), &f).code, StatusCode::TooLarge);
    EXPECT_EQ(blobs.put_calls, 0);

    EXPECT_TRUE(is_ok(file_upload(ctx, alice, request("ok.bin", "1234"), &f)));
}

TEST_F(FileRegistryTest, ForeignFolderIsNotFound) {
    Folder theirs;
    ASSERT_TRUE(is_ok(folder_create(ctx, bob, "Bob's", kRootFolder, &theirs)));
    File f;
    const Status s = file_upload(ctx, alice, request("a.txt", "a", theirs.id), &f);
    EXPECT_EQ(s.code, StatusCode::NotFound);
    EXPECT_EQ(s.aux, kMissingFolderRef);
    EXPECT_EQ(blobs.put_calls, 0);
}

TEST_F(FileRegistryTest, BlobFailureIsUnavailableAndWritesNoRow) {
    blobs.fail_put = true;
    File f;
    EXPECT_EQ(file_upload(ctx, alice, request("a.txt", "a"), &f).code, StatusCode::Unavailable);

    std::vector<File> listed;
    ASSERT_TRUE(is_ok(file_list(ctx, alice, kRootFolder, &listed)));
    EXPECT_TRUE(listed.empty());
}

TEST_F(FileRegistryTest, RowFailureReclaimsBlob) {
    blobs.fixed_key = "1/duplicate";
    File first;
    ASSERT_TRUE(is_ok(file_upload(ctx, alice, request("a.txt", "a"), &first)));
    ASSERT_TRUE(blobs.removed.empty());

    // The second row collides on blob_key, so its blob is deleted again.
    File second;
    EXPECT_EQ(file_upload(ctx, alice, request("b.txt", "b"), &second).code, StatusCode::Conflict);
    ASSERT_EQ(blobs.removed.size(), 1u);
    EXPECT_EQ(blobs.removed[0], "1/duplicate");

    std::vector<File> listed;
    ASSERT_TRUE(is_ok(file_list(ctx, alice, kRootFolder, &listed)));
    EXPECT_EQ(listed.size(), 1u);
}

// ============================================================================
// Rename / Move / Delete
// ============================================================================

TEST_F(FileRegistryTest, RenameUpdatesExtension) {
    File f;
    ASSERT_TRUE(is_ok(file_upload(ctx, alice, request("draft.txt", "x"), &f)));
    const std::string key = f.blob_key;

    cabinet::test::g_now += 5;
    File renamed;
    ASSERT_TRUE(is_ok(file_rename(ctx, f.id, alice, "final.MD", &renamed)));
    EXPECT_EQ(renamed.name, "final.MD");
    EXPECT_EQ(renamed.file_type, "md");
    EXPECT_EQ(renamed.blob_key, key);
    EXPECT_EQ(renamed.updated_at, cabinet::test::g_now);

    EXPECT_EQ(file_rename(ctx, f.id, bob, "stolen.txt", &renamed).code, StatusCode::NotFound);
}

TEST_F(FileRegistryTest, MoveBetweenFoldersAndRoot) {
    Folder dest;
    ASSERT_TRUE(is_ok(folder_create(ctx, alice, "Dest", kRootFolder, &dest)));
    File f;
    ASSERT_TRUE(is_ok(file_upload(ctx, alice, request("a.txt", "x"), &f)));

    File moved;
    ASSERT_TRUE(is_ok(file_move(ctx, f.id, alice, dest.id, &moved)));
    EXPECT_EQ(moved.folder, dest.id);

    std::vector<File> in_dest;
    ASSERT_TRUE(is_ok(file_list(ctx, alice, dest.id, &in_dest)));
    EXPECT_EQ(in_dest.size(), 1u);

    ASSERT_TRUE(is_ok(file_move(ctx, f.id, alice, kRootFolder, &moved)));
    EXPECT_TRUE(folder_is_root(moved.folder));
}

TEST_F(FileRegistryTest, MoveToMissingFolderIsTaggedNotFound) {
    File f;
    ASSERT_TRUE(is_ok(file_upload(ctx, alice, request("a.txt", "x"), &f)));
    File moved;
    const Status s = file_move(ctx, f.id, alice, FolderId{999}, &moved);
    EXPECT_EQ(s.code, StatusCode::NotFound);
    EXPECT_EQ(s.aux, kMissingFolderRef);

    const Status missing_file = file_move(ctx, FileId{999}, alice, kRootFolder, &moved);
    EXPECT_EQ(missing_file.code, StatusCode::NotFound);
    EXPECT_NE(missing_file.aux, kMissingFolderRef);
}

TEST_F(FileRegistryTest, DeleteIsBestEffortOnBlob) {
    File f;
    ASSERT_TRUE(is_ok(file_upload(ctx, alice, request("a.txt", "x"), &f)));
    blobs.fail_remove = true;
    ASSERT_TRUE(is_ok(file_delete(ctx, f.id, alice)));

    File gone;
    EXPECT_EQ(cabinet::db::db_file_get(db, f.id, &gone).code, StatusCode::NotFound);
    EXPECT_EQ(file_delete(ctx, f.id, alice).code, StatusCode::NotFound);
}

TEST_F(FileRegistryTest, DeleteByStrangerKeepsRowAndBlob) {
    File f;
    ASSERT_TRUE(is_ok(file_upload(ctx, alice, request("a.txt", "x"), &f)));
    EXPECT_EQ(file_delete(ctx, f.id, bob).code, StatusCode::NotFound);

    EXPECT_TRUE(blobs.removed.empty());
    EXPECT_EQ(blobs.blobs.count(f.blob_key), 1u);
    File still;
    EXPECT_TRUE(is_ok(cabinet::db::db_file_get(db, f.id, &still)));
}

TEST_F(FileRegistryTest, DeleteRemovesBlobOfTheDeletedRow) {
    File f;
    ASSERT_TRUE(is_ok(file_upload(ctx, alice, request("a.txt", "x"), &f)));
    ASSERT_TRUE(is_ok(file_delete(ctx, f.id, alice)));
    ASSERT_EQ(blobs.removed.size(), 1u);
    EXPECT_EQ(blobs.removed[0], f.blob_key);
    EXPECT_TRUE(blobs.blobs.empty());
}

// ============================================================================
// Downloads
// ============================================================================

TEST_F(FileRegistryTest, DownloadForOwnerAndGranteeOnly) {
    File f;
    ASSERT_TRUE(is_ok(file_upload(ctx, alice, request("a.pdf", "x"), &f)));

    DownloadTarget t;
    ASSERT_TRUE(is_ok(file_download_target(ctx, f.id, alice, &t)));
    EXPECT_EQ(t.file_name, "a.pdf");
    EXPECT_EQ(t.expires_at, cabinet::test::g_now + 3600);
    EXPECT_NE(t.url.find(f.blob_key), std::string::npos);

    EXPECT_EQ(file_download_target(ctx, f.id, bob, &t).code, StatusCode::PermissionDenied);

    Share share;
    ASSERT_TRUE(is_ok(share_grant(ctx, alice, ShareTarget::of_file(f.id), bob, Permission::View, &share, nullptr)));
    EXPECT_TRUE(is_ok(file_download_target(ctx, f.id, bob, &t)));
    EXPECT_EQ(file_download_target(ctx, f.id, carol, &t).code, StatusCode::PermissionDenied);
}

TEST_F(FileRegistryTest, FolderShareDoesNotReachFiles) {
    Folder folder;
    ASSERT_TRUE(is_ok(folder_create(ctx, alice, "Shared", kRootFolder, &folder)));
    File f;
    ASSERT_TRUE(is_ok(file_upload(ctx, alice, request("inside.txt", "x", folder.id), &f)));

    Share share;
    ASSERT_TRUE(is_ok(share_grant(ctx, alice, ShareTarget::of_folder(folder.id), bob, Permission::Edit, &share, nullptr)));

    DownloadTarget t;
    EXPECT_EQ(file_download_target(ctx, f.id, bob, &t).code, StatusCode::PermissionDenied);
}

TEST_F(FileRegistryTest, SigningFailureIsUnavailable) {
    File f;
    ASSERT_TRUE(is_ok(file_upload(ctx, alice, request("a.txt", "x"), &f)));
    blobs.fail_sign = true;
    DownloadTarget t;
    EXPECT_EQ(file_download_target(ctx, f.id, alice, &t).code, StatusCode::Unavailable);
}

TEST_F(FileRegistryTest, StatsFollowUploadsAndDeletes) {
    File a, b;
    ASSERT_TRUE(is_ok(file_upload(ctx, alice, request("a.txt", "12345"), &a)));
    ASSERT_TRUE(is_ok(file_upload(ctx, alice, request("b.txt", "123"), &b)));
    Folder folder;
    ASSERT_TRUE(is_ok(folder_create(ctx, alice, "F", kRootFolder, &folder)));

    StorageStats st;
    ASSERT_TRUE(is_ok(storage_stats(ctx, alice, &st)));
    EXPECT_EQ(st.total_bytes, 8u);
    EXPECT_EQ(st.file_count, 2u);
    EXPECT_EQ(st.folder_count, 1u);

    ASSERT_TRUE(is_ok(file_delete(ctx, a.id, alice)));
    ASSERT_TRUE(is_ok(storage_stats(ctx, alice, &st)));
    EXPECT_EQ(st.total_bytes, 3u);
    EXPECT_EQ(st.file_count, 1u);
}
