#pragma once

#include <string>
#include <vector>

#include "cabinet/blob/blob_store.hpp"
#include "cabinet/core/errors.hpp"
#include "cabinet/core/types.hpp"
#include "cabinet/security/signing.hpp"

namespace cabinet::blob {

    struct FsBlobStoreConfig {
        std::string data_root;
        // Prefix of signed URLs; the bridge serves them under {base_url}/blob/.
        std::string base_url;
        cabinet::core::u32 ttl_seconds{3600};
        cabinet::security::Key256 signing_key{};
    };

    // Keys look like "<owner>/<blake3 hex>-<random hex>".
    [[nodiscard]] bool blob_key_valid(const std::string& key) noexcept;

    // Blob backend on the local filesystem.
    // Layout: {data_root}/{owner}/{hash[0:2]}/{hash[2:4]}/{hash}-{nonce}.dat
    class FsBlobStore final : public BlobStore {
    public:
        explicit FsBlobStore(FsBlobStoreConfig cfg);

        cabinet::core::Status put(cabinet::core::UserId owner,
            BufferView content,
            std::string* out_key) noexcept override;

        cabinet::core::Status remove(const std::string& key) noexcept override;

        cabinet::core::Status sign_download(const std::string& key,
            cabinet::core::Timestamp now,
            SignedDownload* out) noexcept override;

        // Checks the expires/sig query pair of a URL minted by sign_download.
        cabinet::core::Status verify_download(const std::string& key,
            cabinet::core::Timestamp expires_at,
            const std::string& sig_hex,
            cabinet::core::Timestamp now) const noexcept;

        cabinet::core::Status read(const std::string& key,
            std::vector<cabinet::core::u8>* out) const noexcept;

        cabinet::core::Status exists(const std::string& key, bool* out) const noexcept;

        [[nodiscard]] const std::string& data_root() const noexcept { return cfg_.data_root; }

    private:
        [[nodiscard]] std::string path_for(const std::string& key) const;

        FsBlobStoreConfig cfg_;
    };

} // namespace cabinet::blob
