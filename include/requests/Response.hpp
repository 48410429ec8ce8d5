/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RESPONSE_HPP
#define RESPONSE_HPP

#include "utils/JsonReader.hpp"
#include <exception>
#include <optional>
#include <ostream>
#include <string>

namespace Chorus {

/**
 * @brief Result of one transport round trip
 *
 * A response built from a transport exception carries ERROR_CODE and the
 * exception text instead of a body.
 */
class Response {
public:
    static constexpr int ERROR_CODE = -1;

    Response(int code, std::string body);

    static Response fromException(const std::exception& e);

    [[nodiscard]] int getCode() const noexcept { return m_code; }
    [[nodiscard]] const std::string& getBody() const noexcept { return m_body; }
    [[nodiscard]] const std::string& getErrorMessage() const noexcept { return m_errorMessage; }

    [[nodiscard]] bool isOk() const noexcept { return m_code >= 200 && m_code < 300; }
    [[nodiscard]] bool isError() const noexcept { return m_code == ERROR_CODE; }

    /**
     * @brief Parses the body as JSON
     * @return std::nullopt when the body is empty or not valid JSON
     */
    [[nodiscard]] std::optional<JsonValue> getObject() const;

    [[nodiscard]] std::string toString() const;

private:
    int m_code;
    std::string m_body;
    std::string m_errorMessage;
};

inline std::ostream& operator<<(std::ostream& os, const Response& response) {
    return os << response.toString();
}

} // namespace Chorus

#endif // RESPONSE_HPP
