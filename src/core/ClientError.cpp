/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/ClientError.hpp"
#include "entities/Guild.hpp"
#include <format>

namespace Chorus {

const char* errorKindToString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::State:                return "State";
        case ErrorKind::Permission:           return "Permission";
        case ErrorKind::UnsupportedOperation: return "UnsupportedOperation";
        case ErrorKind::RemoteFailure:        return "RemoteFailure";
        default:                              return "Unknown";
    }
}

namespace {
Snowflake guildIdOf(const std::shared_ptr<Guild>& guild) {
    return guild ? guild->getId() : Snowflake();
}
} // anonymous namespace

InsufficientPermissionError::InsufficientPermissionError(std::shared_ptr<Guild> guild,
                                                         Permission permission)
    : ClientError(ErrorKind::Permission,
                  std::format("Cannot perform action due to a lack of Permission. "
                              "Missing permission: {} (guild {})",
                              PermissionUtil::getName(permission), guildIdOf(guild).toString())),
      m_guild(std::move(guild)), m_guildId(guildIdOf(m_guild)), m_permission(permission) {}

RemoteFailureError::RemoteFailureError(Response response)
    : ClientError(ErrorKind::RemoteFailure,
                  std::format("Request failed: {}", response.toString())),
      m_response(std::move(response)),
      m_errorResponse(ErrorResponses::fromResponse(m_response)) {}

} // namespace Chorus
