/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/ChatClient.hpp"
#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include "entities/EntityBuilder.hpp"
#include "entities/Guild.hpp"
#include "entities/User.hpp"
#include "requests/Requester.hpp"
#include <format>
#include <stdexcept>

namespace Chorus {

ChatClient::ChatClient(std::shared_ptr<Requester> requester)
    : m_requester(std::move(requester)),
      m_entityBuilder(std::make_unique<EntityBuilder>(*this)) {
    if (!m_requester) {
        throw std::invalid_argument("ChatClient requires a Requester");
    }
    CLIENT_INFO("ChatClient created");
}

ChatClient::~ChatClient() {
    // Entities refer back to the client; drop them before the members they use
    m_guilds.clear();
    m_users.clear();
}

bool ChatClient::startWorkers() {
    const size_t capacity = m_config.getQueueCapacity();
    const unsigned int workers = m_config.getWorkerCount();
    if (!ThreadSystem::Instance().init(capacity, workers)) {
        CLIENT_ERROR("Failed to start ThreadSystem workers");
        return false;
    }
    CLIENT_INFO(std::format("Workers running: {} threads, queue capacity {}",
                            ThreadSystem::Instance().getThreadCount(), capacity));
    return true;
}

std::shared_ptr<Guild> ChatClient::getGuildById(Snowflake id) const {
    return m_guilds.getElementById(id);
}

std::vector<std::shared_ptr<Guild>> ChatClient::getGuilds() const {
    return m_guilds.asList();
}

void ChatClient::addGuild(std::shared_ptr<Guild> guild) {
    if (!guild) {
        throw std::invalid_argument("Cannot cache a null guild");
    }
    if (&guild->getClient() != this) {
        throw std::invalid_argument("Guild belongs to a different client");
    }
    const std::string description = guild->toString();
    if (!m_guilds.put(std::move(guild))) {
        CACHE_DEBUG(std::format("Replaced cached guild {}", description));
    }
}

std::shared_ptr<Guild> ChatClient::removeGuild(Snowflake id) {
    std::shared_ptr<Guild> removed = m_guilds.remove(id);
    if (removed) {
        CACHE_INFO(std::format("Evicted guild {}", removed->toString()));
    } else {
        CACHE_WARN(std::format("Guild {} was not cached", id.toString()));
    }
    return removed;
}

SnowflakeReference<Guild> ChatClient::referenceGuild(Snowflake id) const {
    return SnowflakeReference<Guild>(id, [this](Snowflake guildId) {
        return getGuildById(guildId);
    });
}

std::shared_ptr<User> ChatClient::getUserById(Snowflake id) const {
    return m_users.getElementById(id);
}

std::shared_ptr<User> ChatClient::getSelfUser() const {
    return m_selfUser.load(std::memory_order_acquire);
}

void ChatClient::setSelfUser(std::shared_ptr<User> user) {
    m_selfUser.store(std::move(user), std::memory_order_release);
}

} // namespace Chorus
