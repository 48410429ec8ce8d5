/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ROLE_HPP
#define ROLE_HPP

#include "entities/Permission.hpp"
#include "entities/Snowflake.hpp"
#include <cstdint>
#include <ostream>
#include <string>

namespace Chorus {

/**
 * @brief Guild role, immutable once built
 *
 * The public role (@everyone) shares its id with the guild.
 */
class Role {
public:
    Role(Snowflake id, Snowflake guildId, std::string name, uint64_t permissions, int position);

    [[nodiscard]] Snowflake getId() const noexcept { return m_id; }
    [[nodiscard]] Snowflake getGuildId() const noexcept { return m_guildId; }
    [[nodiscard]] const std::string& getName() const noexcept { return m_name; }
    [[nodiscard]] uint64_t getPermissionsRaw() const noexcept { return m_permissions; }
    [[nodiscard]] int getPosition() const noexcept { return m_position; }
    [[nodiscard]] bool isPublicRole() const noexcept { return m_id == m_guildId; }

    [[nodiscard]] bool hasPermission(Permission permission) const noexcept {
        return PermissionUtil::hasPermission(m_permissions, permission);
    }

    [[nodiscard]] std::string getAsMention() const;
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] bool operator==(const Role& other) const noexcept { return m_id == other.m_id; }

private:
    Snowflake m_id;
    Snowflake m_guildId;
    std::string m_name;
    uint64_t m_permissions;
    int m_position;
};

inline std::ostream& operator<<(std::ostream& os, const Role& role) {
    return os << role.toString();
}

} // namespace Chorus

#endif // ROLE_HPP
