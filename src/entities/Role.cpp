/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Role.hpp"
#include <format>

namespace Chorus {

Role::Role(Snowflake id, Snowflake guildId, std::string name, uint64_t permissions, int position)
    : m_id(id), m_guildId(guildId), m_name(std::move(name)), m_permissions(permissions),
      m_position(position) {}

std::string Role::getAsMention() const {
    if (isPublicRole()) {
        return "@everyone";
    }
    return std::format("<@&{}>", m_id.toString());
}

std::string Role::toString() const {
    return std::format("R:{}({})", m_name, m_id.toString());
}

} // namespace Chorus
