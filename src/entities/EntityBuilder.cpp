/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/EntityBuilder.hpp"
#include "core/ChatClient.hpp"
#include "core/Logger.hpp"
#include "entities/Emote.hpp"
#include "entities/Guild.hpp"
#include "entities/Member.hpp"
#include "entities/Role.hpp"
#include "entities/User.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <charconv>
#include <format>
#include <optional>
#include <stdexcept>
#include <vector>

namespace Chorus {

namespace {

// Snowflakes arrive as decimal strings; numbers are accepted as well
std::optional<Snowflake> readSnowflake(const JsonValue& value) {
    if (value.isString()) {
        return Snowflake::parse(value.asString());
    }
    if (std::optional<uint64_t> raw = value.tryAsUInt64()) {
        return Snowflake(static_cast<Snowflake::IDType>(*raw));
    }
    return std::nullopt;
}

Snowflake requireSnowflake(const JsonValue& json, const char* key, const char* entity) {
    std::optional<Snowflake> id = readSnowflake(json[key]);
    if (!id || !id->isValid()) {
        BUILDER_ERROR(std::format("{} payload has no valid '{}'", entity, key));
        throw std::invalid_argument(std::format("{} payload has no valid '{}'", entity, key));
    }
    return *id;
}

void requireObject(const JsonValue& json, const char* entity) {
    if (!json.isObject()) {
        BUILDER_ERROR(std::format("{} payload is not an object", entity));
        throw std::invalid_argument(std::format("{} payload is not an object", entity));
    }
}

std::string readString(const JsonValue& json, const char* key, const std::string& fallback = "") {
    return json[key].tryAsString().value_or(fallback);
}

bool readBool(const JsonValue& json, const char* key, bool fallback = false) {
    return json[key].tryAsBool().value_or(fallback);
}

uint64_t readPermissions(const JsonValue& value) {
    if (value.isString()) {
        const std::string& text = value.asString();
        uint64_t raw = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), raw);
        if (ec == std::errc() && ptr == text.data() + text.size()) {
            return raw;
        }
        BUILDER_WARN(std::format("Ignoring malformed permissions '{}'", text));
        return 0;
    }
    if (std::optional<uint64_t> raw = value.tryAsUInt64()) {
        return *raw;
    }
    if (value.isNumber()) {
        BUILDER_WARN(std::format("Ignoring out of range permissions {}", value.asNumber()));
    }
    return 0;
}

std::vector<Snowflake> readSnowflakeArray(const JsonValue& value) {
    std::vector<Snowflake> ids;
    const JsonArray* array = value.tryAsArray();
    if (array == nullptr) {
        return ids;
    }
    ids.reserve(array->size());
    for (const JsonValue& element : *array) {
        if (std::optional<Snowflake> id = readSnowflake(element)) {
            ids.push_back(*id);
        } else {
            BUILDER_WARN(std::format("Skipping malformed id {}", element.toString()));
        }
    }
    return ids;
}

// Brings roleSet to exactly the cached roles among ids without emptying it in between
void replaceRoles(Guild& guild, SnowflakeCacheView<Role>& roleSet, const std::vector<Snowflake>& ids) {
    std::vector<std::shared_ptr<Role>> roles;
    roles.reserve(ids.size());
    for (const Snowflake roleId : ids) {
        if (auto role = guild.getRoleById(roleId)) {
            roles.push_back(std::move(role));
        } else {
            BUILDER_WARN(std::format("Role {} of guild {} is not cached", roleId.toString(),
                                     guild.getId().toString()));
        }
    }

    for (const Snowflake staleId : roleSet.getIds()) {
        if (std::find(ids.begin(), ids.end(), staleId) == ids.end()) {
            roleSet.remove(staleId);
        }
    }
    for (auto& role : roles) {
        roleSet.put(std::move(role));
    }
}

} // anonymous namespace

EntityBuilder::EntityBuilder(ChatClient& client) : m_client(client) {}

std::shared_ptr<User> EntityBuilder::createUser(const JsonValue& json) {
    requireObject(json, "User");
    const Snowflake id = requireSnowflake(json, "id", "User");

    auto user = std::make_shared<User>(id, readString(json, "username"),
                                       readString(json, "discriminator", "0"),
                                       readBool(json, "bot"));
    m_client.getUserCache().put(user);
    return user;
}

std::shared_ptr<Guild> EntityBuilder::createGuild(const JsonValue& json) {
    requireObject(json, "Guild");
    const Snowflake id = requireSnowflake(json, "id", "Guild");
    const Snowflake ownerId = readSnowflake(json["owner_id"]).value_or(Snowflake());

    auto guild = std::make_shared<Guild>(m_client, id, readString(json, "name"), ownerId);

    if (const JsonArray* roles = json["roles"].tryAsArray()) {
        for (const JsonValue& role : *roles) {
            createRole(*guild, role);
        }
    }
    // Roles first: emotes resolve their role ids against the guild
    if (const JsonArray* emotes = json["emojis"].tryAsArray()) {
        for (const JsonValue& emote : *emotes) {
            createEmote(*guild, emote);
        }
    }

    m_client.addGuild(guild);
    BUILDER_DEBUG(std::format("Built guild {} with {} roles and {} emotes", guild->toString(),
                              guild->getRoleCache().size(), guild->getEmoteCache().size()));
    return guild;
}

std::shared_ptr<Role> EntityBuilder::createRole(Guild& guild, const JsonValue& json) {
    requireObject(json, "Role");
    const Snowflake id = requireSnowflake(json, "id", "Role");

    auto role = std::make_shared<Role>(id, guild.getId(), readString(json, "name"),
                                       readPermissions(json["permissions"]),
                                       json["position"].tryAsInt().value_or(0));
    guild.getRoleCache().put(role);
    return role;
}

std::shared_ptr<Member> EntityBuilder::createMember(Guild& guild, const JsonValue& json) {
    requireObject(json, "Member");
    std::shared_ptr<User> user = createUser(json["user"]);
    return std::make_shared<Member>(guild, std::move(user), readSnowflakeArray(json["roles"]));
}

std::shared_ptr<Emote> EntityBuilder::createEmote(Guild& guild, const JsonValue& json) {
    requireObject(json, "Emote");
    const Snowflake id = requireSnowflake(json, "id", "Emote");

    std::shared_ptr<Emote> emote = guild.getEmoteById(id);
    const bool created = !emote;
    if (created) {
        emote = std::make_shared<Emote>(id, guild);
    }

    applyEmoteFields(*emote, &guild, json);

    if (created) {
        guild.getEmoteCache().put(emote);
        BUILDER_DEBUG(std::format("Cached emote {} in {}", emote->toString(), guild.toString()));
    }
    return emote;
}

std::shared_ptr<Emote> EntityBuilder::createFakeEmote(Snowflake id, const std::string& name,
                                                      bool animated) {
    auto emote = std::make_shared<Emote>(id, m_client);
    emote->setName(name).setAnimated(animated);
    return emote;
}

void EntityBuilder::updateEmote(Emote& emote, const JsonValue& json) {
    requireObject(json, "Emote");
    std::shared_ptr<Guild> guild = emote.getGuild();
    applyEmoteFields(emote, guild.get(), json);
}

void EntityBuilder::applyEmoteFields(Emote& emote, Guild* guild, const JsonValue& json) {
    if (std::optional<std::string> name = json["name"].tryAsString()) {
        emote.setName(std::move(*name));
    }
    if (std::optional<bool> managed = json["managed"].tryAsBool()) {
        emote.setManaged(*managed);
    }
    if (std::optional<bool> animated = json["animated"].tryAsBool()) {
        emote.setAnimated(*animated);
    }
    if (json["user"].isObject()) {
        emote.setUser(createUser(json["user"]));
    }

    if (!json.hasKey("roles")) {
        return;
    }
    if (emote.isFake()) {
        BUILDER_WARN(std::format("Ignoring roles for fake emote {}", emote.toString()));
        return;
    }
    if (guild == nullptr) {
        BUILDER_WARN(std::format("Guild of emote {} is no longer cached, roles not updated",
                                 emote.toString()));
        return;
    }
    replaceRoles(*guild, emote.getRoleSet(), readSnowflakeArray(json["roles"]));
}

} // namespace Chorus
