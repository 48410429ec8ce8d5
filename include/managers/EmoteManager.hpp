/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EMOTE_MANAGER_HPP
#define EMOTE_MANAGER_HPP

#include "entities/Snowflake.hpp"
#include "requests/RestAction.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Chorus {

class Emote;
class Guild;
class Role;

/**
 * @brief Collects pending changes to an emote and sends them in one PATCH
 *
 * Obtained through Emote::getManager(); one per emote. Setters only record
 * the change locally. update() snapshots the pending changes into the
 * request; once it succeeds, each sent field is cleared unless it was set to
 * a different value in the meantime.
 *
 * Usage:
 *   emote.getManager().setName("party_parrot").setRoles({modRole}).update().queue();
 */
class EmoteManager {
public:
    enum Field : uint8_t {
        NAME = 1 << 0,
        ROLES = 1 << 1
    };

    static constexpr size_t MIN_NAME_LENGTH = 2;
    static constexpr size_t MAX_NAME_LENGTH = 32;

    explicit EmoteManager(Emote& emote);

    EmoteManager(const EmoteManager&) = delete;
    EmoteManager& operator=(const EmoteManager&) = delete;

    [[nodiscard]] Emote& getEmote() const noexcept { return m_emote; }
    [[nodiscard]] std::shared_ptr<Guild> getGuild() const;

    /**
     * @throws std::invalid_argument unless name has 2 to 32 characters
     */
    EmoteManager& setName(const std::string& name);

    /**
     * @brief Restricts the emote to the given roles; empty allows everyone
     * @throws StateError for fake emotes
     * @throws std::invalid_argument for null roles or roles of another guild
     */
    EmoteManager& setRoles(const std::vector<std::shared_ptr<Role>>& roles);

    // Discards every pending change, or only those in fields
    EmoteManager& reset();
    EmoteManager& reset(uint8_t fields);

    [[nodiscard]] bool isSet(uint8_t fields) const;

    /**
     * @brief Builds the request applying the pending changes
     *
     * @throws StateError if the emote is fake or its guild is no longer cached
     * @throws UnsupportedOperationError if the emote is managed by an integration
     * @throws InsufficientPermissionError without Manage Emojis in the guild
     */
    [[nodiscard]] RestAction<bool> update();

    // JSON body update() would send right now
    [[nodiscard]] std::string getRequestBody() const;

private:
    struct PendingChanges {
        mutable std::mutex mutex;
        uint8_t set{0};
        std::string name;
        std::vector<Snowflake> roles;
    };

    Emote& m_emote;
    std::shared_ptr<PendingChanges> m_pending;

    // Caller holds pending.mutex
    static std::string buildRequestBody(const PendingChanges& pending);
};

} // namespace Chorus

#endif // EMOTE_MANAGER_HPP
