/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Permission.hpp"
#include <array>

namespace Chorus::PermissionUtil {

namespace {
constexpr std::array<Permission, 17> KNOWN_PERMISSIONS = {
    Permission::CreateInstantInvite, Permission::KickMembers,
    Permission::BanMembers,          Permission::Administrator,
    Permission::ManageChannels,      Permission::ManageServer,
    Permission::MessageAddReaction,  Permission::ViewAuditLogs,
    Permission::ViewChannel,         Permission::MessageWrite,
    Permission::MessageManage,       Permission::MessageExtEmoji,
    Permission::NicknameChange,      Permission::NicknameManage,
    Permission::ManageRoles,         Permission::ManageWebhooks,
    Permission::ManageEmotes};
} // anonymous namespace

const char* getName(Permission permission) noexcept {
    switch (permission) {
        case Permission::CreateInstantInvite: return "Create Instant Invite";
        case Permission::KickMembers:         return "Kick Members";
        case Permission::BanMembers:          return "Ban Members";
        case Permission::Administrator:       return "Administrator";
        case Permission::ManageChannels:      return "Manage Channels";
        case Permission::ManageServer:        return "Manage Server";
        case Permission::MessageAddReaction:  return "Add Reactions";
        case Permission::ViewAuditLogs:       return "View Audit Logs";
        case Permission::ViewChannel:         return "Read Text Channels & See Voice Channels";
        case Permission::MessageWrite:        return "Send Messages";
        case Permission::MessageManage:       return "Manage Messages";
        case Permission::MessageExtEmoji:     return "Use External Emojis";
        case Permission::NicknameChange:      return "Change Nickname";
        case Permission::NicknameManage:      return "Manage Nicknames";
        case Permission::ManageRoles:         return "Manage Roles";
        case Permission::ManageWebhooks:      return "Manage Webhooks";
        case Permission::ManageEmotes:        return "Manage Emojis";
        default:                              return "Unknown";
    }
}

std::vector<Permission> toPermissions(uint64_t raw) {
    std::vector<Permission> permissions;
    for (const Permission permission : KNOWN_PERMISSIONS) {
        if ((raw & getRaw(permission)) != 0) {
            permissions.push_back(permission);
        }
    }
    return permissions;
}

} // namespace Chorus::PermissionUtil
