/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ROUTE_HPP
#define ROUTE_HPP

#include <cstdint>
#include <initializer_list>
#include <ostream>
#include <string>
#include <vector>

namespace Chorus {

enum class Method : uint8_t { Get, Post, Put, Patch, Delete };

const char* methodToString(Method method) noexcept;

/**
 * @brief REST endpoint template such as "guilds/{guild_id}/emojis/{emoji_id}"
 *
 * compile() substitutes the {placeholders} in order and yields the
 * CompiledRoute handed to the Requester.
 */
class Route {
public:
    class CompiledRoute {
    public:
        CompiledRoute(Method method, std::string compiledPath, std::string majorParameters)
            : m_method(method), m_path(std::move(compiledPath)),
              m_majorParameters(std::move(majorParameters)) {}

        [[nodiscard]] Method getMethod() const noexcept { return m_method; }
        [[nodiscard]] const std::string& getCompiledRoute() const noexcept { return m_path; }

        // "guild_id=..." for the rate-limit bucket; empty if the route has none
        [[nodiscard]] const std::string& getMajorParameters() const noexcept {
            return m_majorParameters;
        }

        // apiBase must end with '/'
        [[nodiscard]] std::string getUrl(const std::string& apiBase) const {
            return apiBase + m_path;
        }

        [[nodiscard]] bool operator==(const CompiledRoute& other) const {
            return m_method == other.m_method && m_path == other.m_path;
        }

        [[nodiscard]] std::string toString() const;

    private:
        Method m_method;
        std::string m_path;
        std::string m_majorParameters;
    };

    Route(Method method, std::string route);

    /**
     * @brief Fills in the route parameters
     * @throws std::invalid_argument if the number of parameters does not match
     */
    [[nodiscard]] CompiledRoute compile(std::initializer_list<std::string> params) const;

    [[nodiscard]] Method getMethod() const noexcept { return m_method; }
    [[nodiscard]] const std::string& getRoute() const noexcept { return m_route; }
    [[nodiscard]] size_t getParamCount() const noexcept { return m_paramNames.size(); }

private:
    Method m_method;
    std::string m_route;
    std::vector<std::string> m_paramNames;
};

inline std::ostream& operator<<(std::ostream& os, const Route::CompiledRoute& route) {
    return os << route.toString();
}

namespace Routes::Emotes {
inline const Route GET_EMOTES{Method::Get, "guilds/{guild_id}/emojis"};
inline const Route GET_EMOTE{Method::Get, "guilds/{guild_id}/emojis/{emoji_id}"};
inline const Route CREATE_EMOTE{Method::Post, "guilds/{guild_id}/emojis"};
inline const Route MODIFY_EMOTE{Method::Patch, "guilds/{guild_id}/emojis/{emoji_id}"};
inline const Route DELETE_EMOTE{Method::Delete, "guilds/{guild_id}/emojis/{emoji_id}"};
} // namespace Routes::Emotes

} // namespace Chorus

#endif // ROUTE_HPP
