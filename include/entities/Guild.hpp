/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GUILD_HPP
#define GUILD_HPP

#include "cache/SnowflakeCacheView.hpp"
#include "entities/Snowflake.hpp"
#include <atomic>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace Chorus {

class ChatClient;
class Emote;
class Member;
class Role;

/**
 * @brief Cached guild: the owning container of roles and emotes
 *
 * Guilds are owned by the client's guild cache. Entities inside a guild refer
 * back to it by id (see SnowflakeReference) and never hold it directly, so
 * removing the guild from the client releases it together with its caches.
 */
class Guild {
public:
    Guild(ChatClient& client, Snowflake id, std::string name, Snowflake ownerId);
    ~Guild();

    Guild(const Guild&) = delete;
    Guild& operator=(const Guild&) = delete;

    [[nodiscard]] ChatClient& getClient() const noexcept { return m_client; }
    [[nodiscard]] Snowflake getId() const noexcept { return m_id; }
    [[nodiscard]] const std::string& getName() const noexcept { return m_name; }
    [[nodiscard]] Snowflake getOwnerId() const noexcept { return m_ownerId; }

    // @everyone; nullptr until the role has been cached
    [[nodiscard]] std::shared_ptr<Role> getPublicRole() const;
    [[nodiscard]] std::shared_ptr<Role> getRoleById(Snowflake id) const;
    [[nodiscard]] std::vector<std::shared_ptr<Role>> getRoles() const;
    [[nodiscard]] SnowflakeCacheView<Role>& getRoleCache() noexcept { return m_roles; }

    [[nodiscard]] std::shared_ptr<Emote> getEmoteById(Snowflake id) const;
    [[nodiscard]] std::vector<std::shared_ptr<Emote>> getEmotes() const;
    [[nodiscard]] std::vector<std::shared_ptr<Emote>> getEmotesByName(const std::string& name,
                                                                      bool ignoreCase) const;
    [[nodiscard]] SnowflakeCacheView<Emote>& getEmoteCache() noexcept { return m_emotes; }

    /**
     * @brief The client's own membership in this guild
     * @return nullptr until the member has been received
     */
    [[nodiscard]] std::shared_ptr<Member> getSelfMember() const;
    void setSelfMember(std::shared_ptr<Member> member);

    [[nodiscard]] std::string toString() const;

    [[nodiscard]] bool operator==(const Guild& other) const noexcept { return m_id == other.m_id; }

private:
    ChatClient& m_client;
    Snowflake m_id;
    std::string m_name;
    Snowflake m_ownerId;

    SnowflakeCacheView<Role> m_roles;
    SnowflakeCacheView<Emote> m_emotes;
    std::atomic<std::shared_ptr<Member>> m_selfMember;
};

inline std::ostream& operator<<(std::ostream& os, const Guild& guild) {
    return os << guild.toString();
}

} // namespace Chorus

#endif // GUILD_HPP
