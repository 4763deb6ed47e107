#pragma once

#include <string>
#include <vector>

#include "cabinet/core/errors.hpp"
#include "cabinet/core/models.hpp"
#include "cabinet/storage/context.hpp"

namespace cabinet::storage {

    struct Breadcrumb {
        cabinet::core::FolderId id{cabinet::core::FolderId::invalid()};
        std::string name;
    };

    struct FolderView {
        cabinet::core::Folder folder;
        // Root first, the folder itself last.
        std::vector<Breadcrumb> breadcrumb;
    };

    struct FolderDeleteReport {
        u64 folders_removed{0};
        u64 files_removed{0};
        // Blob deletions that failed; the metadata is gone regardless.
        u64 blob_failures{0};
    };

    // parent == kRootFolder creates at the owner's root. A parent that is
    // missing or belongs to someone else is NotFound; a sibling with the same
    // name is Conflict.
    cabinet::core::Status folder_create(const StorageContext& ctx,
        cabinet::core::UserId owner,
        const std::string& name,
        cabinet::core::FolderId parent,
        cabinet::core::Folder* out) noexcept;

    // Renames in place and rewrites every descendant path atomically.
    cabinet::core::Status folder_rename(const StorageContext& ctx,
        cabinet::core::FolderId id,
        cabinet::core::UserId owner,
        const std::string& new_name,
        cabinet::core::Folder* out) noexcept;

    // Removes the folder, every descendant folder, their files and the shares
    // on all of them. Blob deletion is attempted once per removed file;
    // failures are logged and counted, never fatal.
    cabinet::core::Status folder_delete(const StorageContext& ctx,
        cabinet::core::FolderId id,
        cabinet::core::UserId owner,
        FolderDeleteReport* report) noexcept;

    cabinet::core::Status folder_get_with_breadcrumb(const StorageContext& ctx,
        cabinet::core::FolderId id,
        cabinet::core::UserId owner,
        FolderView* out) noexcept;

    cabinet::core::Status folder_list(const StorageContext& ctx,
        cabinet::core::UserId owner,
        cabinet::core::FolderId parent,
        std::vector<cabinet::core::Folder>* out) noexcept;

    cabinet::core::Status folder_list_all(const StorageContext& ctx,
        cabinet::core::UserId owner,
        std::vector<cabinet::core::Folder>* out) noexcept;

} // namespace cabinet::storage
