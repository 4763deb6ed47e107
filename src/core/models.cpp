#include "cabinet/core/models.hpp"

#include <cstring>

namespace cabinet::core {
    const char* permission_name(Permission p) noexcept {
        switch (p) {
            case Permission::View: return "view";
            case Permission::Edit: return "edit";
        }
        return "view";
    }

    bool permission_parse(const char* s, Permission* out) noexcept {
        if (s == nullptr || out == nullptr) {
            return false;
        }
        if (std::strcmp(s, "view") == 0) {
            *out = Permission::View;
            return true;
        }
        if (std::strcmp(s, "edit") == 0) {
            *out = Permission::Edit;
            return true;
        }
        return false;
    }

    std::string user_display_name(const User& u) {
        if (!u.id.is_valid()) {
            return "Unknown";
        }
        std::string out = u.first_name;
        if (!u.last_name.empty()) {
            if (!out.empty()) {
                out += ' ';
            }
            out += u.last_name;
        }
        return out.empty() ? u.email : out;
    }
} // namespace cabinet::core
