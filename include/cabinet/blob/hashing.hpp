#pragma once

#include "cabinet/blob/buffer.hpp"
#include "cabinet/core/errors.hpp"
#include "cabinet/core/types.hpp"

namespace cabinet::blob {
    // BLAKE3-256 of the buffer.
    cabinet::core::Status hash_compute(BufferView data, cabinet::core::Hash256* out) noexcept;

} // namespace cabinet::blob
