/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/EmoteManager.hpp"
#include "core/ChatClient.hpp"
#include "core/ClientError.hpp"
#include "core/Logger.hpp"
#include "entities/Emote.hpp"
#include "entities/Guild.hpp"
#include "entities/Role.hpp"
#include "requests/Route.hpp"
#include "utils/JsonReader.hpp"
#include <format>
#include <stdexcept>

namespace Chorus {

namespace {
// Code points, not bytes
size_t utf8Length(const std::string& text) {
    size_t length = 0;
    for (const char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++length;
        }
    }
    return length;
}
} // anonymous namespace

EmoteManager::EmoteManager(Emote& emote)
    : m_emote(emote), m_pending(std::make_shared<PendingChanges>()) {}

std::shared_ptr<Guild> EmoteManager::getGuild() const {
    return m_emote.getGuild();
}

EmoteManager& EmoteManager::setName(const std::string& name) {
    const size_t length = utf8Length(name);
    if (length < MIN_NAME_LENGTH || length > MAX_NAME_LENGTH) {
        throw std::invalid_argument(std::format(
            "Emote name must be between {} and {} characters long, got {}",
            MIN_NAME_LENGTH, MAX_NAME_LENGTH, length));
    }

    std::lock_guard<std::mutex> lock(m_pending->mutex);
    m_pending->name = name;
    m_pending->set |= NAME;
    return *this;
}

EmoteManager& EmoteManager::setRoles(const std::vector<std::shared_ptr<Role>>& roles) {
    if (m_emote.isFake()) {
        throw StateError(std::format("Cannot restrict roles of fake emote {}", m_emote.toString()));
    }

    const Snowflake guildId = m_emote.getGuildId();
    std::vector<Snowflake> ids;
    ids.reserve(roles.size());
    for (const auto& role : roles) {
        if (!role) {
            throw std::invalid_argument("Roles must not contain null entries");
        }
        if (role->getGuildId() != guildId) {
            throw std::invalid_argument(std::format(
                "Role {} is not from the guild of emote {}", role->toString(), m_emote.toString()));
        }
        ids.push_back(role->getId());
    }

    std::lock_guard<std::mutex> lock(m_pending->mutex);
    m_pending->roles = std::move(ids);
    m_pending->set |= ROLES;
    return *this;
}

EmoteManager& EmoteManager::reset() {
    return reset(NAME | ROLES);
}

EmoteManager& EmoteManager::reset(uint8_t fields) {
    std::lock_guard<std::mutex> lock(m_pending->mutex);
    m_pending->set &= static_cast<uint8_t>(~fields);
    if ((fields & NAME) != 0) {
        m_pending->name.clear();
    }
    if ((fields & ROLES) != 0) {
        m_pending->roles.clear();
    }
    return *this;
}

bool EmoteManager::isSet(uint8_t fields) const {
    std::lock_guard<std::mutex> lock(m_pending->mutex);
    return (m_pending->set & fields) != 0;
}

std::string EmoteManager::getRequestBody() const {
    std::lock_guard<std::mutex> lock(m_pending->mutex);
    return buildRequestBody(*m_pending);
}

std::string EmoteManager::buildRequestBody(const PendingChanges& pending) {
    JsonObject body;
    if ((pending.set & NAME) != 0) {
        body["name"] = JsonValue(pending.name);
    }
    if ((pending.set & ROLES) != 0) {
        JsonArray roles;
        roles.reserve(pending.roles.size());
        for (const Snowflake roleId : pending.roles) {
            roles.emplace_back(roleId.toString());
        }
        body["roles"] = JsonValue(std::move(roles));
    }
    return JsonValue(std::move(body)).toString();
}

RestAction<bool> EmoteManager::update() {
    std::shared_ptr<Guild> guild = m_emote.checkModifiable("modify");

    uint8_t sentFields = 0;
    std::string sentName;
    std::vector<Snowflake> sentRoles;
    std::string body;
    {
        std::lock_guard<std::mutex> lock(m_pending->mutex);
        sentFields = m_pending->set;
        sentName = m_pending->name;
        sentRoles = m_pending->roles;
        body = buildRequestBody(*m_pending);
    }
    if (sentFields == 0) {
        EMOTE_MANAGER_WARN(std::format("Updating {} without pending changes", m_emote.toString()));
    }

    Route::CompiledRoute route =
        Routes::Emotes::MODIFY_EMOTE.compile({guild->getId().toString(), m_emote.getId().toString()});

    // Owns the pending state so the handler stays valid after the emote is evicted
    std::shared_ptr<PendingChanges> pending = m_pending;
    auto handler = [pending, sentFields, sentName = std::move(sentName),
                    sentRoles = std::move(sentRoles)](const Response& response,
                                                      Request<bool>& request) {
        if (!response.isOk()) {
            request.onFailure(response);
            return;
        }
        {
            // Values set again after the request was built stay pending
            std::lock_guard<std::mutex> lock(pending->mutex);
            if ((sentFields & pending->set & NAME) != 0 && pending->name == sentName) {
                pending->set &= static_cast<uint8_t>(~NAME);
                pending->name.clear();
            }
            if ((sentFields & pending->set & ROLES) != 0 && pending->roles == sentRoles) {
                pending->set &= static_cast<uint8_t>(~ROLES);
                pending->roles.clear();
            }
        }
        request.onSuccess(true);
    };

    return RestAction<bool>(m_emote.getClient().getRequester(), std::move(route), std::move(handler),
                            std::move(body));
}

} // namespace Chorus
