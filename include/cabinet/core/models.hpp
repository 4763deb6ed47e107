#pragma once

#include <string>

#include "cabinet/core/types.hpp"

namespace cabinet::core {

    struct User {
        UserId id{UserId::invalid()};
        std::string first_name;
        std::string last_name;
        std::string email;
        bool active{true};
        Timestamp created_at{0};
    };

    // path caches the ancestor chain: "/" + name at the root,
    // parent.path + "/" + name below it.
    struct Folder {
        FolderId id{FolderId::invalid()};
        std::string name;
        FolderId parent{kRootFolder};
        UserId owner{UserId::invalid()};
        std::string path;
        Timestamp created_at{0};
        Timestamp updated_at{0};
    };

    // blob_key is immutable once set. public_token is non-empty iff is_public.
    // public_expires_at == 0 means the link never expires.
    struct File {
        FileId id{FileId::invalid()};
        std::string name;
        FolderId folder{kRootFolder};
        UserId owner{UserId::invalid()};
        std::string blob_key;
        u64 size_bytes{0};
        std::string file_type;
        std::string mime_type;
        bool is_public{false};
        std::string public_token;
        Timestamp public_expires_at{0};
        Timestamp created_at{0};
        Timestamp updated_at{0};
    };

    enum class Permission : u8 {
        View = 0,
        Edit = 1,
    };

    enum class TargetKind : u8 {
        File = 0,
        Folder = 1,
    };

    // Exactly one of file/folder is addressed, selected by kind.
    struct ShareTarget {
        TargetKind kind{TargetKind::File};
        u64 id{~u64{0}};

        [[nodiscard]] static constexpr ShareTarget of_file(FileId f) noexcept {
            return ShareTarget{TargetKind::File, f.v};
        }
        [[nodiscard]] static constexpr ShareTarget of_folder(FolderId f) noexcept {
            return ShareTarget{TargetKind::Folder, f.v};
        }
        [[nodiscard]] constexpr FileId file() const noexcept {
            return kind == TargetKind::File ? FileId{id} : FileId::invalid();
        }
        [[nodiscard]] constexpr FolderId folder() const noexcept {
            return kind == TargetKind::Folder ? FolderId{id} : FolderId::invalid();
        }
    };

    struct Share {
        ShareId id{ShareId::invalid()};
        FileId file{FileId::invalid()};
        FolderId folder{FolderId::invalid()};
        UserId shared_with{UserId::invalid()};
        UserId shared_by{UserId::invalid()};
        Permission permission{Permission::View};
        Timestamp created_at{0};
    };

    [[nodiscard]] constexpr bool share_target_valid(const Share& s) noexcept {
        return s.file.is_valid() != s.folder.is_valid();
    }

    [[nodiscard]] const char* permission_name(Permission p) noexcept;
    [[nodiscard]] bool permission_parse(const char* s, Permission* out) noexcept;

    [[nodiscard]] std::string user_display_name(const User& u);

} // namespace cabinet::core
