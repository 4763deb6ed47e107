#include "cabinet/storage/mime.hpp"

#include <cctype>
#include <cstdio>

namespace cabinet::storage {

namespace {
    [[nodiscard]] bool starts_with(const std::string& s, const char* prefix) noexcept {
        return s.rfind(prefix, 0) == 0;
    }
}

std::string file_extension(const std::string& name) {
    const auto dot = name.rfind('.');
    if (dot == std::string::npos) {
        return {};
    }
    std::string ext = name.substr(dot + 1);
    for (char& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
}

const char* file_category(const std::string& mime_type) noexcept {
    if (starts_with(mime_type, "image/")) return "image";
    if (starts_with(mime_type, "video/")) return "video";
    if (starts_with(mime_type, "audio/")) return "audio";
    if (mime_type == "application/pdf") return "pdf";
    if (mime_type == "application/msword" ||
        mime_type == "application/vnd.openxmlformats-officedocument.wordprocessingml.document") {
        return "document";
    }
    if (mime_type == "application/vnd.ms-excel" ||
        mime_type == "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet") {
        return "spreadsheet";
    }
    if (mime_type == "application/vnd.ms-powerpoint" ||
        mime_type == "application/vnd.openxmlformats-officedocument.presentationml.presentation") {
        return "presentation";
    }
    if (mime_type == "application/zip" ||
        mime_type == "application/x-rar-compressed" ||
        mime_type == "application/x-7z-compressed") {
        return "archive";
    }
    if (starts_with(mime_type, "text/")) return "text";
    return "other";
}

std::string format_size(cabinet::core::u64 bytes) {
    if (bytes == 0) {
        return "0 Bytes";
    }

    static const char* const kUnits[] = {"Bytes", "KB", "MB", "GB"};
    constexpr int kLastUnit = 3;

    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < kLastUnit) {
        value /= 1024.0;
        ++unit;
    }

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    std::string out = buf;
    while (out.back() == '0') {
        out.pop_back();
    }
    if (out.back() == '.') {
        out.pop_back();
    }

    out += ' ';
    out += kUnits[unit];
    return out;
}

} // namespace cabinet::storage
