/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CLIENT_ERROR_HPP
#define CLIENT_ERROR_HPP

#include "entities/Permission.hpp"
#include "entities/Snowflake.hpp"
#include "requests/ErrorResponse.hpp"
#include "requests/Response.hpp"
#include <cstdint>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace Chorus {

class Guild;

enum class ErrorKind : uint8_t {
    State = 0,                // Entity cannot perform the operation in its current state
    Permission = 1,           // Self member lacks a permission
    UnsupportedOperation = 2, // Operation is never allowed for this kind of entity
    RemoteFailure = 3         // Remote call completed with a non-success outcome
};

const char* errorKindToString(ErrorKind kind) noexcept;

inline std::ostream& operator<<(std::ostream& os, ErrorKind kind) {
    return os << errorKindToString(kind);
}

/**
 * @brief Base of every error raised by the client
 *
 * State, Permission and UnsupportedOperation errors are thrown synchronously
 * before any request is built. RemoteFailure errors are only ever delivered
 * to the failure callback of a queued action, or thrown by complete().
 */
class ClientError : public std::runtime_error {
public:
    ClientError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    [[nodiscard]] ErrorKind getKind() const noexcept { return m_kind; }

private:
    ErrorKind m_kind;
};

class StateError : public ClientError {
public:
    explicit StateError(const std::string& message)
        : ClientError(ErrorKind::State, message) {}
};

class UnsupportedOperationError : public ClientError {
public:
    explicit UnsupportedOperationError(const std::string& message)
        : ClientError(ErrorKind::UnsupportedOperation, message) {}
};

class InsufficientPermissionError : public ClientError {
public:
    InsufficientPermissionError(std::shared_ptr<Guild> guild, Permission permission);

    [[nodiscard]] Permission getPermission() const noexcept { return m_permission; }
    [[nodiscard]] const std::shared_ptr<Guild>& getGuild() const noexcept { return m_guild; }
    [[nodiscard]] Snowflake getGuildId() const noexcept { return m_guildId; }

private:
    std::shared_ptr<Guild> m_guild;
    Snowflake m_guildId;
    Permission m_permission;
};

class RemoteFailureError : public ClientError {
public:
    explicit RemoteFailureError(Response response);

    [[nodiscard]] const Response& getResponse() const noexcept { return m_response; }

    // Decoded error code of the body, ErrorResponse::ServerError if there is none
    [[nodiscard]] ErrorResponse getErrorResponse() const noexcept { return m_errorResponse; }

private:
    Response m_response;
    ErrorResponse m_errorResponse;
};

} // namespace Chorus

#endif // CLIENT_ERROR_HPP
