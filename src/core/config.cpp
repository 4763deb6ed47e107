#include "cabinet/core/config.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <utility>

#include "cabinet/core/hex.hpp"

namespace cabinet::core {
    namespace {
        [[nodiscard]] const char* env_or_null(const char* name) noexcept {
            const char* v = std::getenv(name);
            if (v == nullptr || v[0] == '\0') {
                return nullptr;
            }
            return v;
        }

        [[nodiscard]] bool parse_u64(const char* s, u64* out) noexcept {
            const char* end = s + std::strlen(s);
            u64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] Status invalid() noexcept {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
    } // namespace

    Status config_load_env(Config* cfg) noexcept {
        if (cfg == nullptr) {
            return invalid();
        }

        Config next = *cfg;

        if (const char* v = env_or_null("CABINET_DATA_ROOT")) {
            next.data_root = v;
        }
        if (const char* v = env_or_null("CABINET_DB_PATH")) {
            next.db_path = v;
        }
        if (const char* v = env_or_null("CABINET_DB_JOURNAL_MODE")) {
            next.journal_mode = v;
        }
        if (const char* v = env_or_null("CABINET_MAX_UPLOAD_BYTES")) {
            u64 n = 0;
            if (!parse_u64(v, &n) || n == 0) {
                return invalid();
            }
            next.max_upload_bytes = n;
        }
        if (const char* v = env_or_null("CABINET_DOWNLOAD_TTL_SECONDS")) {
            u64 n = 0;
            if (!parse_u64(v, &n) || n == 0 || n > 7u * 24 * 3600) {
                return invalid();
            }
            next.download_ttl_seconds = static_cast<u32>(n);
        }
        if (const char* v = env_or_null("CABINET_PUBLIC_BASE_URL")) {
            next.public_base_url = v;
            while (!next.public_base_url.empty() && next.public_base_url.back() == '/') {
                next.public_base_url.pop_back();
            }
        }
        if (const char* v = env_or_null("CABINET_SIGNING_KEY")) {
            if (!hex_decode(v, next.signing_key.data(), next.signing_key.size())) {
                return invalid();
            }
            next.has_signing_key = true;
        }
        if (const char* v = env_or_null("CABINET_LOG_LEVEL")) {
            if (!parse_severity(v, &next.log_level)) {
                return invalid();
            }
        }
        if (const char* v = env_or_null("CABINET_LOG_FILE")) {
            next.log_file = v;
        }

        *cfg = std::move(next);
        return ok_status();
    }
} // namespace cabinet::core
