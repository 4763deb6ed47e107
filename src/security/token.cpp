#include "cabinet/security/token.hpp"

#include <sodium.h>

#include "cabinet/core/hex.hpp"

namespace cabinet::security {
    namespace {
        cabinet::core::Status ensure_sodium() noexcept {
            // sodium_init is idempotent and thread-safe; 1 means already initialised.
            if (sodium_init() < 0) {
                return cabinet::core::make_status(cabinet::core::StatusDomain::External, cabinet::core::StatusCode::Unavailable);
            }
            return cabinet::core::ok_status();
        }
    } // namespace

    cabinet::core::Status random_bytes(u8* out, std::size_t len) noexcept {
        if (out == nullptr && len > 0) {
            return cabinet::core::make_status(cabinet::core::StatusDomain::Security, cabinet::core::StatusCode::Invalid);
        }
        const cabinet::core::Status init = ensure_sodium();
        if (!cabinet::core::is_ok(init)) {
            return init;
        }
        randombytes_buf(out, len);
        return cabinet::core::ok_status();
    }

    cabinet::core::Status token_generate(std::string* out) noexcept {
        if (out == nullptr) {
            return cabinet::core::make_status(cabinet::core::StatusDomain::Security, cabinet::core::StatusCode::Invalid);
        }

        u8 raw[kPublicTokenBytes];
        const cabinet::core::Status s = random_bytes(raw, sizeof(raw));
        if (!cabinet::core::is_ok(s)) {
            return s;
        }

        *out = cabinet::core::hex_encode(raw, sizeof(raw));
        sodium_memzero(raw, sizeof(raw));
        return cabinet::core::ok_status();
    }

    bool token_well_formed(const std::string& token) noexcept {
        if (token.size() != kPublicTokenChars) {
            return false;
        }
        for (char c : token) {
            const bool digit = c >= '0' && c <= '9';
            const bool lower = c >= 'a' && c <= 'f';
            if (!digit && !lower) {
                return false;
            }
        }
        return true;
    }
} // namespace cabinet::security
