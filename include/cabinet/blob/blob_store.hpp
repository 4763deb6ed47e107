#pragma once

#include <string>

#include "cabinet/blob/buffer.hpp"
#include "cabinet/core/errors.hpp"
#include "cabinet/core/types.hpp"

namespace cabinet::blob {

    struct SignedDownload {
        std::string url;
        cabinet::core::Timestamp expires_at{0};
    };

    // Narrow client for the external blob backend. Keys are opaque to callers
    // and globally unique; a failing call reports Unavailable or Io.
    class BlobStore {
    public:
        virtual ~BlobStore() = default;

        // owner only namespaces the key; it grants nothing.
        virtual cabinet::core::Status put(cabinet::core::UserId owner,
            BufferView content,
            std::string* out_key) noexcept = 0;

        // Removing a key that is already gone is not an error.
        virtual cabinet::core::Status remove(const std::string& key) noexcept = 0;

        virtual cabinet::core::Status sign_download(const std::string& key,
            cabinet::core::Timestamp now,
            SignedDownload* out) noexcept = 0;
    };

} // namespace cabinet::blob
