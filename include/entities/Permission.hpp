/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PERMISSION_HPP
#define PERMISSION_HPP

#include <cstdint>
#include <initializer_list>
#include <ostream>
#include <vector>

namespace Chorus {

/**
 * @brief Guild-level permissions, valued by their bit offset in the raw
 *        permission mask sent by the platform
 */
enum class Permission : uint8_t {
    CreateInstantInvite = 0,
    KickMembers = 1,
    BanMembers = 2,
    Administrator = 3,
    ManageChannels = 4,
    ManageServer = 5,
    MessageAddReaction = 6,
    ViewAuditLogs = 7,
    ViewChannel = 10,
    MessageWrite = 11,
    MessageManage = 13,
    MessageExtEmoji = 18,
    NicknameChange = 26,
    NicknameManage = 27,
    ManageRoles = 28,
    ManageWebhooks = 29,
    ManageEmotes = 30
};

namespace PermissionUtil {

constexpr uint64_t ALL_PERMISSIONS = ~0ULL;

[[nodiscard]] constexpr uint64_t getRaw(Permission permission) noexcept {
    return 1ULL << static_cast<uint8_t>(permission);
}

[[nodiscard]] constexpr uint64_t getRaw(std::initializer_list<Permission> permissions) noexcept {
    uint64_t raw = 0;
    for (const Permission permission : permissions) {
        raw |= getRaw(permission);
    }
    return raw;
}

/**
 * @brief Checks a raw mask, treating Administrator as every permission
 */
[[nodiscard]] constexpr bool hasPermission(uint64_t raw, Permission permission) noexcept {
    if ((raw & getRaw(Permission::Administrator)) != 0) {
        return true;
    }
    return (raw & getRaw(permission)) != 0;
}

// Display name, e.g. "Manage Emojis"
const char* getName(Permission permission) noexcept;

// Permissions whose bits are set in raw, in ascending bit order
std::vector<Permission> toPermissions(uint64_t raw);

} // namespace PermissionUtil

inline std::ostream& operator<<(std::ostream& os, Permission permission) {
    return os << PermissionUtil::getName(permission);
}

} // namespace Chorus

#endif // PERMISSION_HPP
