#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <compare>

namespace cabinet::core{

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Unix seconds
    using Timestamp = i64;

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(Hash256, Hash256) noexcept = default;
        friend constexpr auto operator<=>(Hash256, Hash256) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);


    template <typename Tag, typename Repr>
    struct Id {
        Repr v{};

        static constexpr Id invalid() noexcept { return Id{Repr(~Repr{0})}; }
        [[nodiscard]] constexpr bool is_valid() const noexcept { return v != invalid().v; }

        friend constexpr bool operator==(Id, Id) noexcept = default;
        friend constexpr auto operator<=>(Id, Id) noexcept = default;
    };

    struct UserIdTag {};
    using UserId = Id<UserIdTag, u32>;

    struct FolderIdTag {};
    using FolderId = Id<FolderIdTag, u64>;

    struct FileIdTag {};
    using FileId = Id<FileIdTag, u64>;

    struct ShareIdTag {};
    using ShareId = Id<ShareIdTag, u64>;

    // An invalid FolderId stands for the owner's root level:
    // a folder without a parent, or a file outside any folder.
    inline constexpr FolderId kRootFolder = FolderId::invalid();

    [[nodiscard]] constexpr bool folder_is_root(FolderId f) noexcept {
        return !f.is_valid();
    }

    static_assert(std::is_trivially_copyable_v<UserId>);
    static_assert(std::is_trivially_copyable_v<FolderId>);
    static_assert(std::is_trivially_copyable_v<FileId>);
    static_assert(std::is_trivially_copyable_v<ShareId>);
    static_assert(sizeof(FolderId) == 8);

} // namespace cabinet::core
