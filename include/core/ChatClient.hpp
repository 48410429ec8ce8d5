/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CHAT_CLIENT_HPP
#define CHAT_CLIENT_HPP

#include "cache/SnowflakeCacheView.hpp"
#include "core/ClientConfig.hpp"
#include "entities/Snowflake.hpp"
#include "entities/SnowflakeReference.hpp"
#include <atomic>
#include <memory>
#include <vector>

namespace Chorus {

class EntityBuilder;
class Guild;
class Requester;
class User;

/**
 * @brief Root of the entity graph
 *
 * Owns the transport, the configuration and the central guild and user
 * caches. Every cached entity keeps a reference to its client, so the client
 * must outlive all entities and actions created from it.
 *
 * Usage:
 *   ChatClient client(std::make_shared<MyHttpRequester>());
 *   client.getConfig().loadFromFile("chorus.json");
 *   client.startWorkers();
 *   auto guild = client.getEntityBuilder().createGuild(guildJson);
 */
class ChatClient {
public:
    explicit ChatClient(std::shared_ptr<Requester> requester);
    ~ChatClient();

    ChatClient(const ChatClient&) = delete;
    ChatClient& operator=(const ChatClient&) = delete;

    [[nodiscard]] const std::shared_ptr<Requester>& getRequester() const noexcept { return m_requester; }
    [[nodiscard]] ClientConfig& getConfig() noexcept { return m_config; }
    [[nodiscard]] const ClientConfig& getConfig() const noexcept { return m_config; }
    [[nodiscard]] EntityBuilder& getEntityBuilder() noexcept { return *m_entityBuilder; }

    /**
     * @brief Starts the shared ThreadSystem with the configured worker count
     *        and queue capacity
     * @return false if the ThreadSystem could not be started
     */
    bool startWorkers();

    // Guild cache
    [[nodiscard]] std::shared_ptr<Guild> getGuildById(Snowflake id) const;
    [[nodiscard]] std::vector<std::shared_ptr<Guild>> getGuilds() const;
    void addGuild(std::shared_ptr<Guild> guild);

    /**
     * @brief Evicts a guild; references to it resolve to nullptr from now on
     * @return The evicted guild, nullptr if it was not cached
     */
    std::shared_ptr<Guild> removeGuild(Snowflake id);

    // Reference that resolves through getGuildById on every access
    [[nodiscard]] SnowflakeReference<Guild> referenceGuild(Snowflake id) const;

    // User cache
    [[nodiscard]] std::shared_ptr<User> getUserById(Snowflake id) const;
    [[nodiscard]] SnowflakeCacheView<User>& getUserCache() noexcept { return m_users; }

    [[nodiscard]] std::shared_ptr<User> getSelfUser() const;
    void setSelfUser(std::shared_ptr<User> user);

private:
    std::shared_ptr<Requester> m_requester;
    ClientConfig m_config;
    SnowflakeCacheView<Guild> m_guilds;
    SnowflakeCacheView<User> m_users;
    std::atomic<std::shared_ptr<User>> m_selfUser;
    std::unique_ptr<EntityBuilder> m_entityBuilder;
};

} // namespace Chorus

#endif // CHAT_CLIENT_HPP
