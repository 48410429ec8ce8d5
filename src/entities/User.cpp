/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/User.hpp"
#include <format>

namespace Chorus {

User::User(Snowflake id, std::string name, std::string discriminator, bool bot)
    : m_id(id), m_name(std::move(name)), m_discriminator(std::move(discriminator)), m_bot(bot) {}

std::string User::getAsTag() const {
    if (m_discriminator.empty() || m_discriminator == "0") {
        return m_name;
    }
    return std::format("{}#{}", m_name, m_discriminator);
}

std::string User::getAsMention() const {
    return std::format("<@{}>", m_id.toString());
}

std::string User::toString() const {
    return std::format("U:{}({})", m_name, m_id.toString());
}

} // namespace Chorus
