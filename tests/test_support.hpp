#pragma once

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include "cabinet/blob/blob_store.hpp"
#include "cabinet/core/errors.hpp"
#include "cabinet/core/models.hpp"
#include "cabinet/db/db.hpp"
#include "cabinet/storage/context.hpp"

namespace cabinet::test {
    using namespace cabinet::core;

    // Settable clock shared by every StorageContext built in a test.
    inline Timestamp g_now = 1700000000;

    inline Timestamp fake_now() noexcept {
        return g_now;
    }

    // In-memory blob backend that records calls and fails on request.
    class FakeBlobStore final : public cabinet::blob::BlobStore {
    public:
        Status put(UserId owner, cabinet::blob::BufferView content, std::string* out_key) noexcept override {
            ++put_calls;
            if (fail_put) {
                return make_status(StatusDomain::Blob, StatusCode::Unavailable);
            }
            std::string key = fixed_key.empty()
                ? std::to_string(owner.v) + "/blob-" + std::to_string(next_++)
                : fixed_key;
            blobs[key] = std::string(reinterpret_cast<const char*>(content.data),
                                     static_cast<std::size_t>(content.len));
            *out_key = key;
            return ok_status();
        }

        Status remove(const std::string& key) noexcept override {
            removed.push_back(key);
            if (fail_remove) {
                return make_status(StatusDomain::Blob, StatusCode::Io);
            }
            blobs.erase(key);
            return ok_status();
        }

        Status sign_download(const std::string& key, Timestamp now,
                             cabinet::blob::SignedDownload* out) noexcept override {
            if (fail_sign) {
                return make_status(StatusDomain::Blob, StatusCode::Unavailable);
            }
            out->url = "https://blobs.test/" + key + "?expires=" + std::to_string(now + 3600);
            out->expires_at = now + 3600;
            return ok_status();
        }

        std::map<std::string, std::string> blobs;
        std::vector<std::string> removed;
        // When set, every put returns this key.
        std::string fixed_key;
        int put_calls{0};
        bool fail_put{false};
        bool fail_remove{false};
        bool fail_sign{false};

    private:
        unsigned next_{1};
    };

    // Fresh in-memory database and fake blob store per test.
    class StorageTest : public ::testing::Test {
    protected:
        void SetUp() override {
            g_now = 1700000000;
            ASSERT_TRUE(is_ok(cabinet::db::db_open(cabinet::db::DbConfig{":memory:", nullptr}, &db)));
            ctx.db = db;
            ctx.blobs = &blobs;
            ctx.now = &fake_now;
        }

        void TearDown() override {
            (void)cabinet::db::db_close(db);
        }

        UserId add_user(const std::string& email,
                        const std::string& first = "Test",
                        const std::string& last = "User") {
            User u;
            u.first_name = first;
            u.last_name = last;
            u.email = email;
            u.created_at = g_now;
            UserId id{};
            EXPECT_TRUE(is_ok(cabinet::db::db_user_create(db, u, &id)));
            return id;
        }

        cabinet::blob::BufferView bytes(const std::string& s) const {
            return cabinet::blob::BufferView{reinterpret_cast<const u8*>(s.data()), s.size()};
        }

        cabinet::db::DbHandle db{};
        FakeBlobStore blobs;
        cabinet::storage::StorageContext ctx;
    };

} // namespace cabinet::test
