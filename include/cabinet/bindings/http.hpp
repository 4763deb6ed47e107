#pragma once

#include <string>
#include <vector>

#include "cabinet/blob/fs_blob_store.hpp"
#include "cabinet/core/errors.hpp"
#include "cabinet/core/types.hpp"
#include "cabinet/storage/context.hpp"

namespace cabinet::bindings::http {
    using u16 = cabinet::core::u16;

    struct HttpHeader {
        std::string name;
        std::string value;
    };

    // path may carry a query string ("/folders?parentId=3"). principal is the
    // user the transport authenticated; invalid means anonymous.
    struct HttpRequest {
        std::string method;
        std::string path;
        std::string body;
        std::vector<HttpHeader> headers;
        cabinet::core::UserId principal{cabinet::core::UserId::invalid()};
    };

    struct HttpResponse {
        u16 status{200};
        std::string content_type{"application/json"};
        std::string body;
    };

    struct HttpContext {
        cabinet::storage::StorageContext storage;
        // Serves the signed /blob/ URLs; nullptr leaves that route unmounted.
        const cabinet::blob::FsBlobStore* blob_server{nullptr};
    };

    // Routes are matched after stripping the path component of
    // storage.public_base_url, so "/api/storage/folders" and "/folders" are
    // the same route. out is always filled; the returned status is the one
    // the handler failed with, Ok for any 2xx.
    cabinet::core::Status handle_http_request(const HttpContext& ctx,
        const HttpRequest& req,
        HttpResponse* out) noexcept;

    // Invalid 400, PermissionDenied 403, NotFound 404, Conflict 409, Gone 410,
    // TooLarge 413, anything else 500.
    [[nodiscard]] u16 http_status_for(cabinet::core::StatusCode code) noexcept;

} // namespace cabinet::bindings::http
