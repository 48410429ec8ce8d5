/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef USER_HPP
#define USER_HPP

#include "entities/Snowflake.hpp"
#include <ostream>
#include <string>

namespace Chorus {

/**
 * @brief Platform account, immutable once built
 *
 * Updates replace the cached instance instead of mutating it.
 */
class User {
public:
    User(Snowflake id, std::string name, std::string discriminator, bool bot = false);

    [[nodiscard]] Snowflake getId() const noexcept { return m_id; }
    [[nodiscard]] const std::string& getName() const noexcept { return m_name; }
    [[nodiscard]] const std::string& getDiscriminator() const noexcept { return m_discriminator; }
    [[nodiscard]] bool isBot() const noexcept { return m_bot; }

    // "name#discriminator", or just the name for accounts without one
    [[nodiscard]] std::string getAsTag() const;
    [[nodiscard]] std::string getAsMention() const;
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] bool operator==(const User& other) const noexcept { return m_id == other.m_id; }

private:
    Snowflake m_id;
    std::string m_name;
    std::string m_discriminator;
    bool m_bot;
};

inline std::ostream& operator<<(std::ostream& os, const User& user) {
    return os << user.toString();
}

} // namespace Chorus

#endif // USER_HPP
