/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "requests/Route.hpp"
#include <format>
#include <stdexcept>

namespace Chorus {

namespace {
// Parameters that identify the rate-limit bucket of a route
bool isMajorParameter(const std::string& name) {
    return name == "guild_id" || name == "channel_id" || name == "webhook_id";
}
} // anonymous namespace

const char* methodToString(Method method) noexcept {
    switch (method) {
        case Method::Get:    return "GET";
        case Method::Post:   return "POST";
        case Method::Put:    return "PUT";
        case Method::Patch:  return "PATCH";
        case Method::Delete: return "DELETE";
        default:             return "UNKNOWN";
    }
}

Route::Route(Method method, std::string route)
    : m_method(method), m_route(std::move(route)) {
    size_t pos = 0;
    while ((pos = m_route.find('{', pos)) != std::string::npos) {
        const size_t end = m_route.find('}', pos);
        if (end == std::string::npos) {
            throw std::invalid_argument(std::format("Unterminated parameter in route: {}", m_route));
        }
        m_paramNames.push_back(m_route.substr(pos + 1, end - pos - 1));
        pos = end + 1;
    }
}

Route::CompiledRoute Route::compile(std::initializer_list<std::string> params) const {
    if (params.size() != m_paramNames.size()) {
        throw std::invalid_argument(std::format(
            "Incorrect amount of parameters for route {} {}: expected {}, got {}",
            methodToString(m_method), m_route, m_paramNames.size(), params.size()));
    }

    std::string compiled;
    compiled.reserve(m_route.size() + 32);
    std::string majorParameters;

    size_t cursor = 0;
    size_t index = 0;
    for (const std::string& value : params) {
        const size_t open = m_route.find('{', cursor);
        const size_t close = m_route.find('}', open);
        compiled.append(m_route, cursor, open - cursor);
        compiled += value;
        cursor = close + 1;

        const std::string& name = m_paramNames[index++];
        if (isMajorParameter(name)) {
            if (!majorParameters.empty()) {
                majorParameters += '&';
            }
            majorParameters += name + '=' + value;
        }
    }
    compiled.append(m_route, cursor, std::string::npos);

    return CompiledRoute(m_method, std::move(compiled), std::move(majorParameters));
}

std::string Route::CompiledRoute::toString() const {
    return std::format("{} /{}", methodToString(m_method), m_path);
}

} // namespace Chorus
