#include "cabinet/blob/hashing.hpp"

#include <cstddef>

#include <blake3.h>

namespace cabinet::blob {
    cabinet::core::Status hash_compute(BufferView data, cabinet::core::Hash256* out) noexcept {
        if (out == nullptr || !buffer_ok(data)) {
            return cabinet::core::make_status(cabinet::core::StatusDomain::Blob, cabinet::core::StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        if (data.len > 0) {
            blake3_hasher_update(&hasher, data.data, static_cast<size_t>(data.len));
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return cabinet::core::ok_status();
    }
} // namespace cabinet::blob
