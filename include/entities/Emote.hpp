/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EMOTE_HPP
#define EMOTE_HPP

#include "cache/SnowflakeCacheView.hpp"
#include "entities/Snowflake.hpp"
#include "entities/SnowflakeReference.hpp"
#include "requests/RestAction.hpp"
#include "utils/LazyInstance.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace Chorus {

class ChatClient;
class EmoteManager;
class Guild;
class Member;
class Role;
class User;

/**
 * @brief Cached custom emote of a guild
 *
 * A mutable cache record, updated in place by EntityBuilder::updateEmote.
 * A real emote knows its guild (by id, resolved through the client's guild
 * cache) and the roles allowed to use it. A fake emote is built from an id
 * alone, e.g. from a reaction in a guild the client cannot see: it has no
 * guild and no role set, and cannot be deleted, modified or cloned.
 *
 * Threading: every accessor may be called from any thread. Name and user are
 * swapped as whole immutable snapshots and the flags are atomics, so readers
 * never observe a torn value; concurrent writers are not ordered against each
 * other and the last write wins. The role set is a concurrent set and
 * getRoles() returns an independent snapshot. getManager() constructs the
 * manager exactly once.
 *
 * Equality and hashing use the id only.
 */
class Emote {
public:
    // Only Emote can create one, so the clone constructor stays internal
    class CloneTag {
        friend class Emote;
        CloneTag() = default;
    };

    // Real emote belonging to guild
    Emote(Snowflake id, Guild& guild);

    // Fake emote, known by id only
    Emote(Snowflake id, ChatClient& client);

    // Used by clone()
    Emote(const Emote& source, CloneTag);

    ~Emote();

    Emote(const Emote&) = delete;
    Emote& operator=(const Emote&) = delete;

    [[nodiscard]] Snowflake getId() const noexcept { return m_id; }
    [[nodiscard]] ChatClient& getClient() const noexcept { return m_client; }
    [[nodiscard]] bool isFake() const noexcept { return m_fake; }

    /**
     * @brief Resolves the owning guild through the client's guild cache
     * @return nullptr for fake emotes and once the guild has been evicted
     */
    [[nodiscard]] std::shared_ptr<Guild> getGuild() const;

    // Id of the owning guild; invalid for fake emotes
    [[nodiscard]] Snowflake getGuildId() const noexcept;

    /**
     * @brief Roles allowed to use this emote, ordered by id
     *
     * Empty means everyone may use it. The returned vector is a snapshot and
     * does not change with the emote.
     *
     * @throws StateError for fake emotes
     */
    [[nodiscard]] std::vector<std::shared_ptr<Role>> getRoles() const;

    [[nodiscard]] bool canProvideRoles() const noexcept { return !m_fake; }

    /**
     * @brief Live role set, for the cache layer
     * @throws StateError for fake emotes
     */
    [[nodiscard]] SnowflakeCacheView<Role>& getRoleSet();

    [[nodiscard]] std::string getName() const;
    [[nodiscard]] bool isManaged() const noexcept { return m_managed.load(std::memory_order_relaxed); }
    [[nodiscard]] bool isAnimated() const noexcept { return m_animated.load(std::memory_order_relaxed); }

    [[nodiscard]] bool hasUser() const;

    /**
     * @brief Account that uploaded the emote
     * @throws StateError when the creator is unknown; only visible with
     *         Manage Emojis and never for fake emotes
     */
    [[nodiscard]] std::shared_ptr<User> getUser() const;

    /**
     * @brief Manager for pending modifications, created on first use
     *
     * Every call returns the same instance, including concurrent first calls.
     */
    [[nodiscard]] EmoteManager& getManager();

    /**
     * @brief Builds the request deleting this emote from its guild
     *
     * No request is sent until the action is queued or completed. Succeeds
     * with true once deleted and with false when the emote was already gone.
     *
     * @throws StateError if the emote is fake or its guild is no longer cached
     * @throws UnsupportedOperationError if the emote is managed by an integration
     * @throws InsufficientPermissionError without Manage Emojis in the guild
     */
    [[nodiscard]] RestAction<bool> deleteEmote() const;

    // Whether issuer may use this emote: same guild and a matching role
    [[nodiscard]] bool canInteract(const Member& issuer) const;

    [[nodiscard]] std::string getAsMention() const;
    [[nodiscard]] std::string getImageUrl() const;
    [[nodiscard]] std::chrono::system_clock::time_point getTimeCreated() const noexcept {
        return m_id.getTimeCreated();
    }

    Emote& setName(std::string name);
    Emote& setAnimated(bool animated);
    Emote& setManaged(bool managed);
    Emote& setUser(std::shared_ptr<User> user);

    /**
     * @brief Detached copy sharing the id and guild reference
     *
     * Flags, name and user are copied; the role set is copied into new storage.
     * @return nullptr for fake emotes
     */
    [[nodiscard]] std::shared_ptr<Emote> clone() const;

    [[nodiscard]] bool operator==(const Emote& other) const noexcept { return m_id == other.m_id; }
    [[nodiscard]] bool operator!=(const Emote& other) const noexcept { return m_id != other.m_id; }
    [[nodiscard]] std::size_t hash() const noexcept { return m_id.hash(); }

    // "E:name(id)"
    [[nodiscard]] std::string toString() const;

private:
    friend class EmoteManager;

    const Snowflake m_id;
    ChatClient& m_client;
    const bool m_fake;
    const std::optional<SnowflakeReference<Guild>> m_guildRef;
    const std::unique_ptr<SnowflakeCacheView<Role>> m_roles;

    std::atomic<std::shared_ptr<const std::string>> m_name;
    std::atomic<std::shared_ptr<User>> m_user;
    std::atomic<bool> m_managed{false};
    std::atomic<bool> m_animated{false};

    LazyInstance<EmoteManager> m_manager;

    // Local checks shared by delete and update; returns the resolved guild
    std::shared_ptr<Guild> checkModifiable(const char* action) const;
};

inline std::ostream& operator<<(std::ostream& os, const Emote& emote) {
    return os << emote.toString();
}

} // namespace Chorus

namespace std {
template <>
struct hash<Chorus::Emote> {
    std::size_t operator()(const Chorus::Emote& emote) const noexcept {
        return emote.hash();
    }
};
} // namespace std

#endif // EMOTE_HPP
