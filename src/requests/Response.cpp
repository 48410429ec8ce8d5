/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "requests/Response.hpp"
#include "core/Logger.hpp"
#include <format>

namespace Chorus {

Response::Response(int code, std::string body)
    : m_code(code), m_body(std::move(body)) {}

Response Response::fromException(const std::exception& e) {
    Response response(ERROR_CODE, "");
    response.m_errorMessage = e.what();
    return response;
}

std::optional<JsonValue> Response::getObject() const {
    if (m_body.empty()) {
        return std::nullopt;
    }

    JsonReader reader;
    if (!reader.parse(m_body)) {
        REST_WARN(std::format("Response body is not valid JSON: {}", reader.getLastError()));
        return std::nullopt;
    }
    return reader.getRoot();
}

std::string Response::toString() const {
    if (isError()) {
        return std::format("HTTPResponse[exception: {}]", m_errorMessage);
    }
    return std::format("HTTPResponse[{}{}{}]", m_code, m_body.empty() ? "" : ", ", m_body);
}

} // namespace Chorus
