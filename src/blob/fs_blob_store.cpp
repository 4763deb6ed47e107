#include "cabinet/blob/fs_blob_store.hpp"
#include "cabinet/blob/hashing.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <utility>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "cabinet/core/hex.hpp"
#include "cabinet/core/log.hpp"
#include "cabinet/security/token.hpp"

namespace cabinet::blob {

using namespace cabinet::core;

// ========================================================================
// Internal Helpers
// ========================================================================

namespace {
    constexpr std::size_t kHashHexChars = 64;
    constexpr std::size_t kNonceBytes = 16;
    constexpr std::size_t kNonceHexChars = kNonceBytes * 2;

    [[nodiscard]] bool is_lower_hex(char c) noexcept {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    }

    [[nodiscard]] Status io_error(int err) noexcept {
        return make_status(StatusDomain::Blob, StatusCode::Io, static_cast<u32>(err));
    }

    // Create the parent directory chain of path.
    Status create_directories(const std::string& path) {
        const auto last_slash = path.rfind('/');
        if (last_slash == std::string::npos || last_slash == 0) {
            return ok_status();
        }

        const std::string dir = path.substr(0, last_slash);

        if (mkdir(dir.c_str(), 0755) == 0 || errno == EEXIST) {
            return ok_status();
        }

        if (errno == ENOENT) {
            // Parent doesn't exist, recurse
            Status s = create_directories(dir);
            if (!is_ok(s)) return s;

            if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
                return io_error(errno);
            }
            return ok_status();
        }

        return io_error(errno);
    }

    [[nodiscard]] Status write_all(const std::string& path, BufferView content) {
        int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
        if (fd < 0) {
            return io_error(errno);
        }

        u64 written = 0;
        while (written < content.len) {
            ssize_t n = write(fd, content.data + written, static_cast<size_t>(content.len - written));
            if (n < 0) {
                if (errno == EINTR) continue;
                const int err = errno;
                close(fd);
                unlink(path.c_str());  // Cleanup partial write
                return io_error(err);
            }
            written += static_cast<u64>(n);
        }

        if (fsync(fd) != 0) {
            const int err = errno;
            close(fd);
            unlink(path.c_str());
            return io_error(err);
        }

        if (close(fd) != 0) {
            const int err = errno;
            unlink(path.c_str());
            return io_error(err);
        }
        return ok_status();
    }
} // namespace

bool blob_key_valid(const std::string& key) noexcept {
    const auto slash = key.find('/');
    if (slash == std::string::npos || slash == 0 || slash > 10) {
        return false;
    }
    for (std::size_t i = 0; i < slash; ++i) {
        if (key[i] < '0' || key[i] > '9') {
            return false;
        }
    }

    const std::size_t name_len = key.size() - slash - 1;
    if (name_len != kHashHexChars + 1 + kNonceHexChars) {
        return false;
    }
    for (std::size_t i = 0; i < name_len; ++i) {
        const char c = key[slash + 1 + i];
        if (i == kHashHexChars) {
            if (c != '-') return false;
        } else if (!is_lower_hex(c)) {
            return false;
        }
    }
    return true;
}

// ========================================================================
// FsBlobStore
// ========================================================================

FsBlobStore::FsBlobStore(FsBlobStoreConfig cfg) : cfg_(std::move(cfg)) {
    while (cfg_.data_root.size() > 1 && cfg_.data_root.back() == '/') {
        cfg_.data_root.pop_back();
    }
    while (!cfg_.base_url.empty() && cfg_.base_url.back() == '/') {
        cfg_.base_url.pop_back();
    }
}

std::string FsBlobStore::path_for(const std::string& key) const {
    const auto slash = key.find('/');
    const std::string owner = key.substr(0, slash);
    const std::string name = key.substr(slash + 1);

    std::string path = cfg_.data_root;
    path += '/';
    path += owner;
    path += '/';
    path += name.substr(0, 2);
    path += '/';
    path += name.substr(2, 2);
    path += '/';
    path += name;
    path += ".dat";
    return path;
}

Status FsBlobStore::put(UserId owner, BufferView content, std::string* out_key) noexcept {
    if (out_key == nullptr || !owner.is_valid() || !buffer_ok(content)) {
        return make_status(StatusDomain::Blob, StatusCode::Invalid);
    }

    Hash256 content_hash;
    Status s = hash_compute(content, &content_hash);
    if (!is_ok(s)) {
        return s;
    }

    // Identical content uploaded twice still gets two blobs; a key is owned
    // by exactly one file row.
    u8 nonce[kNonceBytes];
    s = cabinet::security::random_bytes(nonce, sizeof(nonce));
    if (!is_ok(s)) {
        return s;
    }

    std::string key = std::to_string(owner.v);
    key += '/';
    key += hex_encode(content_hash.b.data(), content_hash.b.size());
    key += '-';
    key += hex_encode(nonce, sizeof(nonce));

    const std::string fs_path = path_for(key);

    s = create_directories(fs_path);
    if (!is_ok(s)) {
        CABINET_LOG_ERROR << "blob: mkdir failed for owner " << owner.v << ": "
                          << std::strerror(static_cast<int>(s.aux));
        return s;
    }

    s = write_all(fs_path, content);
    if (!is_ok(s)) {
        CABINET_LOG_ERROR << "blob: write failed for owner " << owner.v << ": "
                          << std::strerror(static_cast<int>(s.aux));
        return s;
    }

    CABINET_LOG_DEBUG << "blob: stored " << content.len << " bytes as " << key;
    *out_key = std::move(key);
    return ok_status();
}

Status FsBlobStore::remove(const std::string& key) noexcept {
    if (!blob_key_valid(key)) {
        return make_status(StatusDomain::Blob, StatusCode::Invalid);
    }

    const std::string fs_path = path_for(key);
    if (unlink(fs_path.c_str()) != 0) {
        if (errno == ENOENT) {
            return ok_status();
        }
        return io_error(errno);
    }
    return ok_status();
}

Status FsBlobStore::sign_download(const std::string& key, Timestamp now, SignedDownload* out) noexcept {
    if (out == nullptr || !blob_key_valid(key)) {
        return make_status(StatusDomain::Blob, StatusCode::Invalid);
    }

    bool present = false;
    Status s = exists(key, &present);
    if (!is_ok(s)) {
        return s;
    }
    if (!present) {
        return make_status(StatusDomain::Blob, StatusCode::NotFound);
    }

    cabinet::security::DownloadGrant grant;
    grant.blob_key = key;
    grant.expires_at = now + static_cast<Timestamp>(cfg_.ttl_seconds);

    cabinet::security::Tag16 tag{};
    s = cabinet::security::download_seal(cfg_.signing_key, grant, &tag);
    if (!is_ok(s)) {
        return s;
    }

    std::string url = cfg_.base_url;
    url += "/blob/";
    url += key;
    url += "?expires=";
    url += std::to_string(grant.expires_at);
    url += "&sig=";
    url += cabinet::security::tag_to_hex(tag);

    out->url = std::move(url);
    out->expires_at = grant.expires_at;
    return ok_status();
}

Status FsBlobStore::verify_download(const std::string& key,
                                    Timestamp expires_at,
                                    const std::string& sig_hex,
                                    Timestamp now) const noexcept {
    if (!blob_key_valid(key)) {
        return make_status(StatusDomain::Blob, StatusCode::Invalid);
    }

    cabinet::security::DownloadGrant grant;
    grant.blob_key = key;
    grant.expires_at = expires_at;
    if (!cabinet::security::tag_from_hex(sig_hex, &grant.proof)) {
        return make_status(StatusDomain::Security, StatusCode::Invalid);
    }
    return cabinet::security::download_verify(cfg_.signing_key, grant, now);
}

Status FsBlobStore::read(const std::string& key, std::vector<u8>* out) const noexcept {
    if (out == nullptr || !blob_key_valid(key)) {
        return make_status(StatusDomain::Blob, StatusCode::Invalid);
    }

    const std::string fs_path = path_for(key);
    int fd = open(fs_path.c_str(), O_RDONLY);
    if (fd < 0) {
        if (errno == ENOENT) {
            return make_status(StatusDomain::Blob, StatusCode::NotFound);
        }
        return io_error(errno);
    }

    struct stat st{};
    if (fstat(fd, &st) != 0) {
        const int err = errno;
        close(fd);
        return io_error(err);
    }

    out->resize(static_cast<size_t>(st.st_size));
    u64 bytes_read = 0;
    while (bytes_read < out->size()) {
        ssize_t n = ::read(fd, out->data() + bytes_read, out->size() - bytes_read);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            close(fd);
            return io_error(err);
        }
        if (n == 0) break;  // EOF
        bytes_read += static_cast<u64>(n);
    }

    close(fd);

    if (bytes_read != out->size()) {
        return make_status(StatusDomain::Blob, StatusCode::Corrupt);
    }
    return ok_status();
}

Status FsBlobStore::exists(const std::string& key, bool* out) const noexcept {
    if (out == nullptr || !blob_key_valid(key)) {
        return make_status(StatusDomain::Blob, StatusCode::Invalid);
    }

    struct stat st{};
    if (stat(path_for(key).c_str(), &st) == 0) {
        *out = S_ISREG(st.st_mode);
        return ok_status();
    }
    if (errno == ENOENT) {
        *out = false;
        return ok_status();
    }
    return io_error(errno);
}

} // namespace cabinet::blob
