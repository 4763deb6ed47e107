#include "cabinet/core/hex.hpp"

#include <cstring>

namespace cabinet::core {
    namespace {
        [[nodiscard]] int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }
    } // namespace

    std::string hex_encode(const u8* data, std::size_t len) {
        static const char hex[] = "0123456789abcdef";
        std::string out;
        out.resize(len * 2);
        for (std::size_t i = 0; i < len; ++i) {
            out[i * 2] = hex[(data[i] >> 4) & 0xF];
            out[i * 2 + 1] = hex[data[i] & 0xF];
        }
        return out;
    }

    bool hex_decode(const char* hex, u8* out, std::size_t out_len) noexcept {
        if (hex == nullptr || (out == nullptr && out_len > 0)) {
            return false;
        }
        if (std::strlen(hex) != out_len * 2) {
            return false;
        }
        for (std::size_t i = 0; i < out_len; ++i) {
            const int hi = hex_value(hex[i * 2]);
            const int lo = hex_value(hex[i * 2 + 1]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            out[i] = static_cast<u8>((hi << 4) | lo);
        }
        return true;
    }
} // namespace cabinet::core
