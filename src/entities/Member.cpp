/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Member.hpp"
#include "entities/Guild.hpp"
#include "entities/Role.hpp"
#include "entities/User.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace Chorus {

Member::Member(Guild& guild, std::shared_ptr<User> user, std::vector<Snowflake> roleIds)
    : m_guild(guild), m_user(std::move(user)), m_roleIds(std::move(roleIds)) {
    if (!m_user) {
        throw std::invalid_argument("Member requires a user");
    }
}

Snowflake Member::getId() const noexcept {
    return m_user->getId();
}

std::vector<std::shared_ptr<Role>> Member::getRoles() const {
    std::vector<std::shared_ptr<Role>> roles;
    roles.reserve(m_roleIds.size());
    for (const Snowflake roleId : m_roleIds) {
        if (roleId == m_guild.getId()) {
            continue;
        }
        if (auto role = m_guild.getRoleById(roleId)) {
            roles.push_back(std::move(role));
        }
    }
    std::sort(roles.begin(), roles.end(),
              [](const std::shared_ptr<Role>& a, const std::shared_ptr<Role>& b) {
                  return a->getPosition() > b->getPosition();
              });
    return roles;
}

bool Member::hasRole(Snowflake roleId) const {
    return std::find(m_roleIds.begin(), m_roleIds.end(), roleId) != m_roleIds.end();
}

bool Member::isOwner() const {
    return m_guild.getOwnerId() == getId();
}

uint64_t Member::getPermissionsRaw() const {
    if (isOwner()) {
        return PermissionUtil::ALL_PERMISSIONS;
    }

    uint64_t raw = 0;
    if (auto publicRole = m_guild.getPublicRole()) {
        raw |= publicRole->getPermissionsRaw();
    }
    for (const auto& role : getRoles()) {
        raw |= role->getPermissionsRaw();
    }
    return raw;
}

bool Member::hasPermission(Permission permission) const {
    return PermissionUtil::hasPermission(getPermissionsRaw(), permission);
}

bool Member::hasPermission(std::initializer_list<Permission> permissions) const {
    const uint64_t raw = getPermissionsRaw();
    return std::all_of(permissions.begin(), permissions.end(),
                       [raw](Permission permission) {
                           return PermissionUtil::hasPermission(raw, permission);
                       });
}

std::string Member::toString() const {
    return std::format("MB:{}({})", m_user->getName(), m_guild.toString());
}

} // namespace Chorus
