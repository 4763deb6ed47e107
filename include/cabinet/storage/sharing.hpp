#pragma once

#include <vector>

#include "cabinet/core/errors.hpp"
#include "cabinet/core/models.hpp"
#include "cabinet/storage/context.hpp"

namespace cabinet::storage {

    // A share addressed to the caller, resolved to its target and the people
    // involved. Exactly one of file/folder is filled, per share.file/folder.
    struct SharedItem {
        cabinet::core::Share share;
        cabinet::core::File file;
        cabinet::core::Folder folder;
        cabinet::core::User owner;
        cabinet::core::User shared_by;
    };

    struct ShareEntry {
        cabinet::core::Share share;
        cabinet::core::User shared_with;
    };

    // Checks run in this order: grantee == owner is Invalid, an unknown
    // grantee NotFound, a target the owner does not hold NotFound. A repeat
    // grant on the same (target, grantee) updates the permission; *created
    // tells the two apart.
    cabinet::core::Status share_grant(const StorageContext& ctx,
        cabinet::core::UserId owner,
        cabinet::core::ShareTarget target,
        cabinet::core::UserId grantee,
        cabinet::core::Permission permission,
        cabinet::core::Share* out,
        bool* created) noexcept;

    // Only the user who granted the share may revoke it; for anyone else the
    // share is NotFound.
    cabinet::core::Status share_revoke(const StorageContext& ctx,
        cabinet::core::ShareId id,
        cabinet::core::UserId requester) noexcept;

    // Newest first.
    cabinet::core::Status share_list_shared_with_me(const StorageContext& ctx,
        cabinet::core::UserId principal,
        std::vector<SharedItem>* out) noexcept;

    cabinet::core::Status share_list_for_target(const StorageContext& ctx,
        cabinet::core::ShareTarget target,
        cabinet::core::UserId owner,
        std::vector<ShareEntry>* out) noexcept;

    // Owner of the target, or holder of a share on exactly this target.
    cabinet::core::Status share_can_access(const StorageContext& ctx,
        cabinet::core::ShareTarget target,
        cabinet::core::UserId principal,
        bool* out) noexcept;

} // namespace cabinet::storage
