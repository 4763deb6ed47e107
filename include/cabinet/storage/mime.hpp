#pragma once

#include <string>

#include "cabinet/core/types.hpp"

namespace cabinet::storage {

    // Lower-cased text after the last '.', empty when the name has no dot.
    [[nodiscard]] std::string file_extension(const std::string& name);

    // Coarse bucket for a MIME type: image, video, audio, pdf, document,
    // spreadsheet, presentation, archive, text or other.
    [[nodiscard]] const char* file_category(const std::string& mime_type) noexcept;

    // "0 Bytes", "512 Bytes", "1.5 KB", "10 MB": base 1024, at most two
    // decimals with trailing zeros dropped, capped at GB.
    [[nodiscard]] std::string format_size(cabinet::core::u64 bytes);

} // namespace cabinet::storage
