#include <cstddef>
#include <set>
#include <string>

#include <gtest/gtest.h>

#include "cabinet/core/errors.hpp"
#include "cabinet/core/types.hpp"
#include "cabinet/security/signing.hpp"
#include "cabinet/security/token.hpp"

namespace {
static cabinet::security::Key256 make_key256_seq(cabinet::core::u8 start) {
    cabinet::security::Key256 k{};
    for (size_t i = 0; i < 32; ++i) {
        k.b[i] = static_cast<cabinet::core::u8>(start + static_cast<cabinet::core::u8>(i));
    }
    return k;
}

static cabinet::security::DownloadGrant make_grant() {
    cabinet::security::DownloadGrant g;
    g.blob_key = "7/" + std::string(64, 'a') + "-" + std::string(32, 'b');
    g.expires_at = 200;
    return g;
}
} // namespace

TEST(SecurityToken, GeneratesWellFormedDistinctTokens) {
    std::set<std::string> seen;
    for (int i = 0; i < 32; ++i) {
        std::string t;
        ASSERT_EQ(cabinet::security::token_generate(&t).code, cabinet::core::StatusCode::Ok);
        EXPECT_EQ(t.size(), cabinet::security::kPublicTokenChars);
        EXPECT_TRUE(cabinet::security::token_well_formed(t));
        seen.insert(t);
    }
    EXPECT_EQ(seen.size(), 32u);
}

TEST(SecurityToken, RejectsMalformedTokens) {
    EXPECT_FALSE(cabinet::security::token_well_formed(""));
    EXPECT_FALSE(cabinet::security::token_well_formed(std::string(63, 'a')));
    EXPECT_FALSE(cabinet::security::token_well_formed(std::string(64, 'A')));
    EXPECT_FALSE(cabinet::security::token_well_formed(std::string(64, 'g')));
    EXPECT_TRUE(cabinet::security::token_well_formed(std::string(64, '0')));
}

TEST(SecurityToken, NullOutIsInvalid) {
    EXPECT_EQ(cabinet::security::token_generate(nullptr).code, cabinet::core::StatusCode::Invalid);
}

TEST(SecuritySigning, SealAndVerifyRoundTrip) {
    const auto key = make_key256_seq(9);
    auto grant = make_grant();

    cabinet::security::Tag16 tag{};
    ASSERT_EQ(cabinet::security::download_seal(key, grant, &tag).code, cabinet::core::StatusCode::Ok);

    grant.proof = tag;
    EXPECT_EQ(cabinet::security::download_verify(key, grant, 150).code, cabinet::core::StatusCode::Ok);
    EXPECT_EQ(cabinet::security::download_verify(key, grant, 200).code, cabinet::core::StatusCode::Ok);
}

TEST(SecuritySigning, ExpiredGrantIsGone) {
    const auto key = make_key256_seq(9);
    auto grant = make_grant();
    ASSERT_EQ(cabinet::security::download_seal(key, grant, &grant.proof).code, cabinet::core::StatusCode::Ok);
    EXPECT_EQ(cabinet::security::download_verify(key, grant, 201).code, cabinet::core::StatusCode::Gone);
}

TEST(SecuritySigning, TamperingBreaksTheMac) {
    const auto key = make_key256_seq(9);
    auto grant = make_grant();
    ASSERT_EQ(cabinet::security::download_seal(key, grant, &grant.proof).code, cabinet::core::StatusCode::Ok);

    auto later = grant;
    later.expires_at = 10'000;
    EXPECT_EQ(cabinet::security::download_verify(key, later, 150).code, cabinet::core::StatusCode::Invalid);

    auto other_blob = grant;
    other_blob.blob_key[0] = '8';
    EXPECT_EQ(cabinet::security::download_verify(key, other_blob, 150).code, cabinet::core::StatusCode::Invalid);

    const auto wrong_key = make_key256_seq(10);
    EXPECT_EQ(cabinet::security::download_verify(wrong_key, grant, 150).code, cabinet::core::StatusCode::Invalid);
}

TEST(SecuritySigning, TagHexRoundTrip) {
    const auto key = make_key256_seq(1);
    auto grant = make_grant();
    cabinet::security::Tag16 tag{};
    ASSERT_EQ(cabinet::security::download_seal(key, grant, &tag).code, cabinet::core::StatusCode::Ok);

    const std::string hex = cabinet::security::tag_to_hex(tag);
    EXPECT_EQ(hex.size(), 32u);

    cabinet::security::Tag16 back{};
    ASSERT_TRUE(cabinet::security::tag_from_hex(hex, &back));
    for (size_t i = 0; i < sizeof(tag.b); ++i) {
        EXPECT_EQ(back.b[i], tag.b[i]);
    }
    EXPECT_FALSE(cabinet::security::tag_from_hex("nothex", &back));
}

TEST(SecuritySigning, RejectsEmptyGrant) {
    const auto key = make_key256_seq(1);
    cabinet::security::DownloadGrant grant;
    cabinet::security::Tag16 tag{};
    EXPECT_EQ(cabinet::security::download_seal(key, grant, &tag).code, cabinet::core::StatusCode::Invalid);
}
