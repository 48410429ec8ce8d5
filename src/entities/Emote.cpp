/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Emote.hpp"
#include "core/ChatClient.hpp"
#include "core/ClientError.hpp"
#include "core/Logger.hpp"
#include "entities/Guild.hpp"
#include "entities/Member.hpp"
#include "entities/Role.hpp"
#include "entities/User.hpp"
#include "managers/EmoteManager.hpp"
#include "requests/ErrorResponse.hpp"
#include "requests/Route.hpp"
#include <format>

namespace Chorus {

namespace {
const std::shared_ptr<const std::string> EMPTY_NAME = std::make_shared<const std::string>();

void classifyDeleteResponse(const Response& response, Request<bool>& request) {
    if (response.isOk()) {
        request.onSuccess(true);
    } else if (response.getCode() == 404 &&
               ErrorResponses::fromResponse(response) == ErrorResponse::UnknownEmoji) {
        // Already gone
        request.onSuccess(false);
    } else {
        request.onFailure(response);
    }
}
} // anonymous namespace

Emote::Emote(Snowflake id, Guild& guild)
    : m_id(id), m_client(guild.getClient()), m_fake(false),
      m_guildRef(guild.getClient().referenceGuild(guild.getId())),
      m_roles(std::make_unique<SnowflakeCacheView<Role>>()),
      m_name(EMPTY_NAME) {}

Emote::Emote(Snowflake id, ChatClient& client)
    : m_id(id), m_client(client), m_fake(true), m_guildRef(std::nullopt), m_roles(nullptr),
      m_name(EMPTY_NAME) {}

Emote::Emote(const Emote& source, CloneTag)
    : m_id(source.m_id), m_client(source.m_client), m_fake(false),
      m_guildRef(source.m_guildRef),
      m_roles(std::make_unique<SnowflakeCacheView<Role>>()),
      m_name(source.m_name.load()), m_user(source.m_user.load()),
      m_managed(source.isManaged()), m_animated(source.isAnimated()) {
    for (auto& role : source.m_roles->asList()) {
        m_roles->put(std::move(role));
    }
}

Emote::~Emote() = default;

std::shared_ptr<Guild> Emote::getGuild() const {
    return m_guildRef ? m_guildRef->resolve() : nullptr;
}

Snowflake Emote::getGuildId() const noexcept {
    return m_guildRef ? m_guildRef->getId() : Snowflake();
}

std::vector<std::shared_ptr<Role>> Emote::getRoles() const {
    if (!m_roles) {
        throw StateError(std::format("Unable to return roles of fake emote {}", toString()));
    }
    return m_roles->asList();
}

SnowflakeCacheView<Role>& Emote::getRoleSet() {
    if (!m_roles) {
        throw StateError(std::format("Fake emote {} has no role set", toString()));
    }
    return *m_roles;
}

std::string Emote::getName() const {
    return *m_name.load();
}

bool Emote::hasUser() const {
    return m_user.load() != nullptr;
}

std::shared_ptr<User> Emote::getUser() const {
    std::shared_ptr<User> user = m_user.load();
    if (!user) {
        throw StateError(std::format("Creator of emote {} is unknown; it is only available "
                                     "with the Manage Emojis permission", toString()));
    }
    return user;
}

EmoteManager& Emote::getManager() {
    return m_manager.get([this] {
        EMOTE_DEBUG(std::format("Creating manager for {}", toString()));
        return std::make_unique<EmoteManager>(*this);
    });
}

std::shared_ptr<Guild> Emote::checkModifiable(const char* action) const {
    std::shared_ptr<Guild> guild = getGuild();
    if (!guild) {
        throw StateError(std::format("Cannot {} emote {}: it is fake or its guild is no longer cached",
                                     action, toString()));
    }
    if (isManaged()) {
        throw UnsupportedOperationError(
            std::format("Cannot {} emote {}: it is managed by an integration", action, toString()));
    }
    std::shared_ptr<Member> self = guild->getSelfMember();
    if (!self || !self->hasPermission(Permission::ManageEmotes)) {
        throw InsufficientPermissionError(guild, Permission::ManageEmotes);
    }
    return guild;
}

RestAction<bool> Emote::deleteEmote() const {
    std::shared_ptr<Guild> guild = checkModifiable("delete");

    Route::CompiledRoute route =
        Routes::Emotes::DELETE_EMOTE.compile({guild->getId().toString(), m_id.toString()});
    EMOTE_DEBUG(std::format("Prepared {} for {}", route.toString(), toString()));
    return RestAction<bool>(m_client.getRequester(), std::move(route), classifyDeleteResponse);
}

bool Emote::canInteract(const Member& issuer) const {
    if (!canProvideRoles()) {
        return false;
    }
    if (issuer.getGuild().getId() != getGuildId()) {
        return false;
    }
    if (m_roles->isEmpty()) {
        return true;
    }
    return m_roles->anyMatch([&issuer](const std::shared_ptr<Role>& role) {
        return issuer.hasRole(role->getId());
    });
}

std::string Emote::getAsMention() const {
    return std::format("<{}:{}:{}>", isAnimated() ? "a" : "", getName(), m_id.toString());
}

std::string Emote::getImageUrl() const {
    return std::format("{}emojis/{}.{}", m_client.getConfig().getCdnBase(), m_id.toString(),
                       isAnimated() ? "gif" : "png");
}

Emote& Emote::setName(std::string name) {
    m_name.store(std::make_shared<const std::string>(std::move(name)));
    return *this;
}

Emote& Emote::setAnimated(bool animated) {
    m_animated.store(animated, std::memory_order_relaxed);
    return *this;
}

Emote& Emote::setManaged(bool managed) {
    m_managed.store(managed, std::memory_order_relaxed);
    return *this;
}

Emote& Emote::setUser(std::shared_ptr<User> user) {
    m_user.store(std::move(user));
    return *this;
}

std::shared_ptr<Emote> Emote::clone() const {
    if (m_fake) {
        return nullptr;
    }
    return std::make_shared<Emote>(*this, CloneTag{});
}

std::string Emote::toString() const {
    return std::format("E:{}({})", getName(), m_id.toString());
}

} // namespace Chorus
