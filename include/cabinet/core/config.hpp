#pragma once

#include <array>
#include <string>

#include "cabinet/core/errors.hpp"
#include "cabinet/core/log.hpp"
#include "cabinet/core/types.hpp"

namespace cabinet::core {

    inline constexpr u64 kDefaultMaxUploadBytes = 10ull * 1024 * 1024;
    inline constexpr u32 kDefaultDownloadTtlSeconds = 3600;

    struct Config {
        std::string data_root{"./cabinet-data/blobs"};
        std::string db_path{"./cabinet-data/cabinet.db"};
        std::string journal_mode{"WAL"};
        u64 max_upload_bytes{kDefaultMaxUploadBytes};
        u32 download_ttl_seconds{kDefaultDownloadTtlSeconds};
        std::string public_base_url{"/api/storage"};
        // Left unset, a random key is drawn at startup and signed URLs
        // do not survive a restart.
        std::array<u8, 32> signing_key{};
        bool has_signing_key{false};
        severity_level log_level{severity_level::info};
        std::string log_file;
    };

    // Overlays CABINET_* environment variables onto *cfg.
    // A variable that is set but malformed fails with Invalid and leaves *cfg untouched.
    [[nodiscard]] Status config_load_env(Config* cfg) noexcept;

} // namespace cabinet::core
