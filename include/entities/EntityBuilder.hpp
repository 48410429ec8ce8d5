/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_BUILDER_HPP
#define ENTITY_BUILDER_HPP

#include "entities/Snowflake.hpp"
#include <memory>
#include <string>

namespace Chorus {

class ChatClient;
class Emote;
class Guild;
class JsonValue;
class Member;
class Role;
class User;

/**
 * @brief Turns platform JSON payloads into cached entities
 *
 * Every create* call stores its result in the matching cache, replacing or
 * updating what was there. Malformed payloads (missing or non-numeric ids,
 * wrong types) throw std::invalid_argument and leave the caches unchanged.
 */
class EntityBuilder {
public:
    explicit EntityBuilder(ChatClient& client);

    EntityBuilder(const EntityBuilder&) = delete;
    EntityBuilder& operator=(const EntityBuilder&) = delete;

    // {"id", "username", "discriminator", "bot"}; cached in the client
    std::shared_ptr<User> createUser(const JsonValue& json);

    // {"id", "name", "owner_id", "roles": [...], "emojis": [...]}; cached in the client
    std::shared_ptr<Guild> createGuild(const JsonValue& json);

    // {"id", "name", "permissions", "position"}; cached in the guild
    std::shared_ptr<Role> createRole(Guild& guild, const JsonValue& json);

    // {"user": {...}, "roles": ["id", ...]}; not cached
    std::shared_ptr<Member> createMember(Guild& guild, const JsonValue& json);

    /**
     * @brief Creates or refreshes a guild emote
     *
     * {"id", "name", "roles": ["id", ...], "user": {...}, "managed", "animated"}.
     * An emote already cached under the same id is updated in place and
     * returned, so existing references stay valid.
     */
    std::shared_ptr<Emote> createEmote(Guild& guild, const JsonValue& json);

    // Emote known by id only, e.g. from a reaction; not cached
    std::shared_ptr<Emote> createFakeEmote(Snowflake id, const std::string& name, bool animated);

    /**
     * @brief Applies the fields present in json to a cached emote
     *
     * Absent fields are left untouched. "roles" replaces the whole role set;
     * ids of roles not cached in the guild are skipped.
     */
    void updateEmote(Emote& emote, const JsonValue& json);

private:
    ChatClient& m_client;

    // guild may be null when the emote's guild is no longer cached
    void applyEmoteFields(Emote& emote, Guild* guild, const JsonValue& json);
};

} // namespace Chorus

#endif // ENTITY_BUILDER_HPP
