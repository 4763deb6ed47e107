#pragma once

#include <string>
#include <vector>

#include "cabinet/blob/buffer.hpp"
#include "cabinet/core/errors.hpp"
#include "cabinet/core/models.hpp"
#include "cabinet/storage/context.hpp"

namespace cabinet::storage {

    struct UploadRequest {
        cabinet::core::FolderId folder{cabinet::core::kRootFolder};
        std::string name;
        std::string mime_type;
        cabinet::blob::BufferView content{};
    };

    struct DownloadTarget {
        std::string url;
        cabinet::core::Timestamp expires_at{0};
        std::string file_name;
    };

    struct StorageStats {
        u64 total_bytes{0};
        u64 file_count{0};
        u64 folder_count{0};
    };

    // Content goes to the blob store first, the row second. Oversize content
    // is TooLarge, a foreign or missing folder NotFound, a failed blob write
    // Unavailable. If the row cannot be written the blob is deleted again.
    cabinet::core::Status file_upload(const StorageContext& ctx,
        cabinet::core::UserId owner,
        const UploadRequest& req,
        cabinet::core::File* out) noexcept;

    cabinet::core::Status file_rename(const StorageContext& ctx,
        cabinet::core::FileId id,
        cabinet::core::UserId owner,
        const std::string& new_name,
        cabinet::core::File* out) noexcept;

    // folder == kRootFolder moves the file to the owner's root.
    cabinet::core::Status file_move(const StorageContext& ctx,
        cabinet::core::FileId id,
        cabinet::core::UserId owner,
        cabinet::core::FolderId folder,
        cabinet::core::File* out) noexcept;

    // The blob delete is best effort; the row goes either way.
    cabinet::core::Status file_delete(const StorageContext& ctx,
        cabinet::core::FileId id,
        cabinet::core::UserId owner) noexcept;

    cabinet::core::Status file_list(const StorageContext& ctx,
        cabinet::core::UserId owner,
        cabinet::core::FolderId folder,
        std::vector<cabinet::core::File>* out) noexcept;

    // Owner, or a user holding a share on this file. Anyone else is
    // PermissionDenied. Shares on folders do not reach the files inside.
    cabinet::core::Status file_download_target(const StorageContext& ctx,
        cabinet::core::FileId id,
        cabinet::core::UserId requester,
        DownloadTarget* out) noexcept;

    cabinet::core::Status storage_stats(const StorageContext& ctx,
        cabinet::core::UserId owner,
        StorageStats* out) noexcept;

} // namespace cabinet::storage
