#include "cabinet/security/signing.hpp"

#include <cstddef>

#include <blake3.h>

#include "cabinet/core/hex.hpp"

namespace cabinet::security {
    namespace {
        using cabinet::core::u32;
        using cabinet::core::u64;

        void put_u32_be(u8 out[4], u32 v) noexcept {
            out[0] = static_cast<u8>((v >> 24) & 0xffu);
            out[1] = static_cast<u8>((v >> 16) & 0xffu);
            out[2] = static_cast<u8>((v >> 8) & 0xffu);
            out[3] = static_cast<u8>((v >> 0) & 0xffu);
        }

        void put_u64_be(u8 out[8], u64 v) noexcept {
            for (int i = 0; i < 8; ++i) {
                out[i] = static_cast<u8>((v >> (56 - 8 * i)) & 0xffu);
            }
        }

        [[nodiscard]] bool tag16_equal_ct(const Tag16& a, const Tag16& b) noexcept {
            u8 acc = 0;
            for (size_t i = 0; i < sizeof(a.b); ++i) {
                acc = static_cast<u8>(acc | static_cast<u8>(a.b[i] ^ b.b[i]));
            }
            return acc == 0;
        }

        void download_mac(const Key256& key, const DownloadGrant& grant, Tag16* out) noexcept {
            blake3_hasher h;
            blake3_hasher_init_keyed(&h, key.b);

            static constexpr char kLabel[] = "cabinet.download.mac.v1";
            blake3_hasher_update(&h, kLabel, sizeof(kLabel) - 1);

            // Length prefix keeps (key, expiry) pairs unambiguous.
            u8 buf4[4];
            put_u32_be(buf4, static_cast<u32>(grant.blob_key.size()));
            blake3_hasher_update(&h, buf4, sizeof(buf4));
            blake3_hasher_update(&h, grant.blob_key.data(), grant.blob_key.size());

            u8 buf8[8];
            put_u64_be(buf8, static_cast<u64>(grant.expires_at));
            blake3_hasher_update(&h, buf8, sizeof(buf8));

            blake3_hasher_finalize(&h, out->b, sizeof(out->b));
        }
    } // namespace

    cabinet::core::Status download_seal(const Key256& key, const DownloadGrant& grant, Tag16* out_tag) noexcept {
        if (out_tag == nullptr || grant.blob_key.empty() || grant.expires_at <= 0) {
            return cabinet::core::make_status(cabinet::core::StatusDomain::Security, cabinet::core::StatusCode::Invalid);
        }

        Tag16 tag{};
        download_mac(key, grant, &tag);
        *out_tag = tag;
        return cabinet::core::ok_status();
    }

    cabinet::core::Status download_verify(const Key256& key, const DownloadGrant& grant, cabinet::core::Timestamp now) noexcept {
        if (grant.blob_key.empty() || grant.expires_at <= 0) {
            return cabinet::core::make_status(cabinet::core::StatusDomain::Security, cabinet::core::StatusCode::Invalid);
        }

        Tag16 expected{};
        download_mac(key, grant, &expected);
        if (!tag16_equal_ct(expected, grant.proof)) {
            return cabinet::core::make_status(cabinet::core::StatusDomain::Security, cabinet::core::StatusCode::Invalid);
        }
        if (now > grant.expires_at) {
            return cabinet::core::make_status(cabinet::core::StatusDomain::Security, cabinet::core::StatusCode::Gone);
        }
        return cabinet::core::ok_status();
    }

    std::string tag_to_hex(const Tag16& tag) {
        return cabinet::core::hex_encode(tag.b, sizeof(tag.b));
    }

    bool tag_from_hex(const std::string& hex, Tag16* out) noexcept {
        if (out == nullptr) {
            return false;
        }
        return cabinet::core::hex_decode(hex.c_str(), out->b, sizeof(out->b));
    }
} // namespace cabinet::security
