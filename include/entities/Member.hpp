/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MEMBER_HPP
#define MEMBER_HPP

#include "entities/Permission.hpp"
#include "entities/Snowflake.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Chorus {

class Guild;
class Role;
class User;

/**
 * @brief A user's membership in one guild
 *
 * Roles are stored by id and resolved through the guild's role cache on every
 * access, so permission checks always see the latest cached roles. Ids whose
 * role is no longer cached are ignored.
 *
 * A Member must not outlive its Guild.
 */
class Member {
public:
    Member(Guild& guild, std::shared_ptr<User> user, std::vector<Snowflake> roleIds);

    [[nodiscard]] Guild& getGuild() const noexcept { return m_guild; }
    [[nodiscard]] const std::shared_ptr<User>& getUser() const noexcept { return m_user; }
    [[nodiscard]] Snowflake getId() const noexcept;

    // Cached roles, highest position first; excludes the public role
    [[nodiscard]] std::vector<std::shared_ptr<Role>> getRoles() const;
    [[nodiscard]] const std::vector<Snowflake>& getRoleIds() const noexcept { return m_roleIds; }
    [[nodiscard]] bool hasRole(Snowflake roleId) const;

    [[nodiscard]] bool isOwner() const;

    // Union of the public role and every cached role; owners get everything
    [[nodiscard]] uint64_t getPermissionsRaw() const;

    [[nodiscard]] bool hasPermission(Permission permission) const;
    [[nodiscard]] bool hasPermission(std::initializer_list<Permission> permissions) const;

    [[nodiscard]] std::string toString() const;

private:
    Guild& m_guild;
    std::shared_ptr<User> m_user;
    std::vector<Snowflake> m_roleIds;
};

} // namespace Chorus

#endif // MEMBER_HPP
