#include "cabinet/storage/context.hpp"

#include <ctime>
#include <utility>

namespace cabinet::storage {

using namespace cabinet::core;

Timestamp system_now() noexcept {
    return static_cast<Timestamp>(std::time(nullptr));
}

Status normalize_name(const std::string& raw, std::string* out) {
    if (out == nullptr) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    const char* ws = " \t\r\n";
    const auto first = raw.find_first_not_of(ws);
    if (first == std::string::npos) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    const auto last = raw.find_last_not_of(ws);
    std::string name = raw.substr(first, last - first + 1);

    if (name.size() > kMaxNameBytes || name == "." || name == "..") {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    for (unsigned char c : name) {
        if (c == '/' || c < 0x20 || c == 0x7f) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
    }

    *out = std::move(name);
    return ok_status();
}

} // namespace cabinet::storage
