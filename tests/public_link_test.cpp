#include "test_support.hpp"

#include "cabinet/security/token.hpp"
#include "cabinet/storage/file_registry.hpp"
#include "cabinet/storage/public_link.hpp"

using namespace cabinet::storage;
using namespace cabinet::core;

namespace {

constexpr Timestamp kHour = 3600;

class PublicLinkTest : public cabinet::test::StorageTest {
protected:
    void SetUp() override {
        StorageTest::SetUp();
        alice = add_user("alice@example.com", "Alice", "Archer");
        bob = add_user("bob@example.com", "Bob", "Baker");

        UploadRequest req;
        req.name = "photo.jpg";
        req.mime_type = "image/jpeg";
        req.content = bytes(content_);
        ASSERT_TRUE(is_ok(file_upload(ctx, alice, req, &file)));
    }

    UserId alice{};
    UserId bob{};
    File file;

private:
    std::string content_{"jpegdata"};
};

} // namespace

TEST_F(PublicLinkTest, IssueAndResolve) {
    PublicLink link;
    ASSERT_TRUE(is_ok(public_link_issue(ctx, file.id, alice, 24 * kHour, &link)));
    EXPECT_TRUE(cabinet::security::token_well_formed(link.token));
    EXPECT_EQ(link.url, "/api/storage/public/" + link.token);
    EXPECT_EQ(link.expires_at, cabinet::test::g_now + 24 * 3600);

    PublicFileInfo info;
    ASSERT_TRUE(is_ok(public_link_resolve(ctx, link.token, &info)));
    EXPECT_EQ(info.name, "photo.jpg");
    EXPECT_EQ(info.size_bytes, 8u);
    EXPECT_EQ(info.mime_type, "image/jpeg");
    EXPECT_EQ(info.shared_by, "Alice Archer");
    EXPECT_EQ(info.expires_at, link.expires_at);

    DownloadTarget t;
    ASSERT_TRUE(is_ok(public_link_resolve_download(ctx, link.token, &t)));
    EXPECT_EQ(t.file_name, "photo.jpg");
    EXPECT_NE(t.url.find(file.blob_key), std::string::npos);
}

TEST_F(PublicLinkTest, NoTtlNeverExpires) {
    PublicLink link;
    ASSERT_TRUE(is_ok(public_link_issue(ctx, file.id, alice, 0, &link)));
    EXPECT_EQ(link.expires_at, 0);

    cabinet::test::g_now += 10ll * 365 * 24 * 3600;
    PublicFileInfo info;
    EXPECT_TRUE(is_ok(public_link_resolve(ctx, link.token, &info)));
}

TEST_F(PublicLinkTest, ExpiredLinkIsGone) {
    PublicLink link;
    ASSERT_TRUE(is_ok(public_link_issue(ctx, file.id, alice, kHour, &link)));

    cabinet::test::g_now += 3600;
    PublicFileInfo info;
    EXPECT_TRUE(is_ok(public_link_resolve(ctx, link.token, &info)));

    cabinet::test::g_now += 1;
    EXPECT_EQ(public_link_resolve(ctx, link.token, &info).code, StatusCode::Gone);
    DownloadTarget t;
    EXPECT_EQ(public_link_resolve_download(ctx, link.token, &t).code, StatusCode::Gone);
}

TEST_F(PublicLinkTest, ReissueReplacesToken) {
    PublicLink first, second;
    ASSERT_TRUE(is_ok(public_link_issue(ctx, file.id, alice, kHour, &first)));
    ASSERT_TRUE(is_ok(public_link_issue(ctx, file.id, alice, 2 * kHour, &second)));
    EXPECT_NE(first.token, second.token);

    PublicFileInfo info;
    EXPECT_EQ(public_link_resolve(ctx, first.token, &info).code, StatusCode::NotFound);
    EXPECT_TRUE(is_ok(public_link_resolve(ctx, second.token, &info)));
}

TEST_F(PublicLinkTest, RevokeIsIdempotent) {
    PublicLink link;
    ASSERT_TRUE(is_ok(public_link_issue(ctx, file.id, alice, kHour, &link)));
    ASSERT_TRUE(is_ok(public_link_revoke(ctx, file.id, alice)));
    ASSERT_TRUE(is_ok(public_link_revoke(ctx, file.id, alice)));

    PublicFileInfo info;
    EXPECT_EQ(public_link_resolve(ctx, link.token, &info).code, StatusCode::NotFound);

    File row;
    ASSERT_TRUE(is_ok(cabinet::db::db_file_get(db, file.id, &row)));
    EXPECT_FALSE(row.is_public);
    EXPECT_TRUE(row.public_token.empty());
}

TEST_F(PublicLinkTest, OnlyOwnerPublishes) {
    PublicLink link;
    EXPECT_EQ(public_link_issue(ctx, file.id, bob, kHour, &link).code, StatusCode::NotFound);
    EXPECT_EQ(public_link_revoke(ctx, file.id, bob).code, StatusCode::NotFound);
}

TEST_F(PublicLinkTest, TtlAboveLimitIsInvalid) {
    PublicLink link;
    EXPECT_EQ(public_link_issue(ctx, file.id, alice, kMaxLinkTtlSeconds + 1, &link).code, StatusCode::Invalid);
    EXPECT_EQ(public_link_issue(ctx, file.id, alice, -1, &link).code, StatusCode::Invalid);
    EXPECT_TRUE(is_ok(public_link_issue(ctx, file.id, alice, kMaxLinkTtlSeconds, &link)));
    EXPECT_EQ(link.expires_at, cabinet::test::g_now + kMaxLinkTtlHours * kHour);
}

TEST_F(PublicLinkTest, SubHourTtlExpiresOnTheSecond) {
    PublicLink link;
    ASSERT_TRUE(is_ok(public_link_issue(ctx, file.id, alice, 90, &link)));
    EXPECT_EQ(link.expires_at, cabinet::test::g_now + 90);

    cabinet::test::g_now += 90;
    PublicFileInfo info;
    EXPECT_TRUE(is_ok(public_link_resolve(ctx, link.token, &info)));
    cabinet::test::g_now += 1;
    EXPECT_EQ(public_link_resolve(ctx, link.token, &info).code, StatusCode::Gone);
}

TEST_F(PublicLinkTest, UnknownOrMalformedTokenIsNotFound) {
    PublicFileInfo info;
    EXPECT_EQ(public_link_resolve(ctx, "short", &info).code, StatusCode::NotFound);
    EXPECT_EQ(public_link_resolve(ctx, std::string(64, 'e'), &info).code, StatusCode::NotFound);
}

TEST_F(PublicLinkTest, DeletedFileTakesLinkWithIt) {
    PublicLink link;
    ASSERT_TRUE(is_ok(public_link_issue(ctx, file.id, alice, 0, &link)));
    ASSERT_TRUE(is_ok(file_delete(ctx, file.id, alice)));
    PublicFileInfo info;
    EXPECT_EQ(public_link_resolve(ctx, link.token, &info).code, StatusCode::NotFound);
}
