/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ERROR_RESPONSE_HPP
#define ERROR_RESPONSE_HPP

#include <ostream>

namespace Chorus {

class JsonValue;
class Response;

/**
 * @brief Known error codes carried in the "code" field of an error body
 *
 * Values are the platform's numeric codes. ServerError stands in for bodies
 * that carry no code or one this client does not know.
 */
enum class ErrorResponse : int {
    ServerError = 0,
    UnknownAccount = 10001,
    UnknownChannel = 10003,
    UnknownGuild = 10004,
    UnknownMember = 10007,
    UnknownMessage = 10008,
    UnknownRole = 10011,
    UnknownUser = 10013,
    UnknownEmoji = 10014,
    MaxEmojisReached = 30008,
    MissingAccess = 50001,
    MissingPermissions = 50013,
    InvalidFormBody = 50035
};

namespace ErrorResponses {

[[nodiscard]] constexpr int getCode(ErrorResponse error) noexcept {
    return static_cast<int>(error);
}

const char* getMeaning(ErrorResponse error) noexcept;

// Unknown codes map to ServerError
ErrorResponse fromCode(int code) noexcept;

// Reads the "code" member of an error body
ErrorResponse fromJson(const JsonValue& body) noexcept;

ErrorResponse fromResponse(const Response& response);

} // namespace ErrorResponses

inline std::ostream& operator<<(std::ostream& os, ErrorResponse error) {
    return os << ErrorResponses::getCode(error) << ": " << ErrorResponses::getMeaning(error);
}

} // namespace Chorus

#endif // ERROR_RESPONSE_HPP
