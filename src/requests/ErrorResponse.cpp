/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "requests/ErrorResponse.hpp"
#include "requests/Response.hpp"
#include "utils/JsonReader.hpp"

namespace Chorus::ErrorResponses {

const char* getMeaning(ErrorResponse error) noexcept {
    switch (error) {
        case ErrorResponse::UnknownAccount:     return "Unknown Account";
        case ErrorResponse::UnknownChannel:     return "Unknown Channel";
        case ErrorResponse::UnknownGuild:       return "Unknown Guild";
        case ErrorResponse::UnknownMember:      return "Unknown Member";
        case ErrorResponse::UnknownMessage:     return "Unknown Message";
        case ErrorResponse::UnknownRole:        return "Unknown Role";
        case ErrorResponse::UnknownUser:        return "Unknown User";
        case ErrorResponse::UnknownEmoji:       return "Unknown Emoji";
        case ErrorResponse::MaxEmojisReached:   return "Maximum number of Emojis reached";
        case ErrorResponse::MissingAccess:      return "Missing Access";
        case ErrorResponse::MissingPermissions: return "Missing Permissions";
        case ErrorResponse::InvalidFormBody:    return "Invalid Form Body";
        case ErrorResponse::ServerError:
        default:                                return "Server Error";
    }
}

ErrorResponse fromCode(int code) noexcept {
    switch (static_cast<ErrorResponse>(code)) {
        case ErrorResponse::UnknownAccount:
        case ErrorResponse::UnknownChannel:
        case ErrorResponse::UnknownGuild:
        case ErrorResponse::UnknownMember:
        case ErrorResponse::UnknownMessage:
        case ErrorResponse::UnknownRole:
        case ErrorResponse::UnknownUser:
        case ErrorResponse::UnknownEmoji:
        case ErrorResponse::MaxEmojisReached:
        case ErrorResponse::MissingAccess:
        case ErrorResponse::MissingPermissions:
        case ErrorResponse::InvalidFormBody:
            return static_cast<ErrorResponse>(code);
        default:
            return ErrorResponse::ServerError;
    }
}

ErrorResponse fromJson(const JsonValue& body) noexcept {
    const auto code = body["code"].tryAsInt();
    return code ? fromCode(*code) : ErrorResponse::ServerError;
}

ErrorResponse fromResponse(const Response& response) {
    const auto body = response.getObject();
    return body ? fromJson(*body) : ErrorResponse::ServerError;
}

} // namespace Chorus::ErrorResponses
