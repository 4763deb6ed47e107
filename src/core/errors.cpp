#include "cabinet/core/errors.hpp"

namespace cabinet::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok:               return "ok";
            case StatusCode::Unknown:          return "unknown";
            case StatusCode::Invalid:          return "invalid";
            case StatusCode::NotFound:         return "not_found";
            case StatusCode::PermissionDenied: return "permission_denied";
            case StatusCode::Conflict:         return "conflict";
            case StatusCode::Gone:             return "gone";
            case StatusCode::TooLarge:         return "too_large";
            case StatusCode::Busy:             return "busy";
            case StatusCode::Corrupt:          return "corrupt";
            case StatusCode::Io:               return "io";
            case StatusCode::Crypto:           return "crypto";
            case StatusCode::Unsupported:      return "unsupported";
            case StatusCode::Unavailable:      return "unavailable";
        }
        return "unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core:     return "core";
            case StatusDomain::Db:       return "db";
            case StatusDomain::Blob:     return "blob";
            case StatusDomain::Storage:  return "storage";
            case StatusDomain::Security: return "security";
            case StatusDomain::Http:     return "http";
            case StatusDomain::Cli:      return "cli";
            case StatusDomain::External: return "external";
        }
        return "unknown";
    }
} // namespace cabinet::core
