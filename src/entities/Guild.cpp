/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Guild.hpp"
#include "entities/Emote.hpp"
#include "entities/Member.hpp"
#include "entities/Role.hpp"
#include <format>

namespace Chorus {

Guild::Guild(ChatClient& client, Snowflake id, std::string name, Snowflake ownerId)
    : m_client(client), m_id(id), m_name(std::move(name)), m_ownerId(ownerId) {}

Guild::~Guild() = default;

std::shared_ptr<Role> Guild::getPublicRole() const {
    return m_roles.getElementById(m_id);
}

std::shared_ptr<Role> Guild::getRoleById(Snowflake id) const {
    return m_roles.getElementById(id);
}

std::vector<std::shared_ptr<Role>> Guild::getRoles() const {
    return m_roles.asList();
}

std::shared_ptr<Emote> Guild::getEmoteById(Snowflake id) const {
    return m_emotes.getElementById(id);
}

std::vector<std::shared_ptr<Emote>> Guild::getEmotes() const {
    return m_emotes.asList();
}

std::vector<std::shared_ptr<Emote>> Guild::getEmotesByName(const std::string& name,
                                                          bool ignoreCase) const {
    return m_emotes.getElementsByName(name, ignoreCase);
}

std::shared_ptr<Member> Guild::getSelfMember() const {
    return m_selfMember.load(std::memory_order_acquire);
}

void Guild::setSelfMember(std::shared_ptr<Member> member) {
    m_selfMember.store(std::move(member), std::memory_order_release);
}

std::string Guild::toString() const {
    return std::format("G:{}({})", m_name, m_id.toString());
}

} // namespace Chorus
