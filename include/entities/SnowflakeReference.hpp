/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SNOWFLAKE_REFERENCE_HPP
#define SNOWFLAKE_REFERENCE_HPP

#include "entities/Snowflake.hpp"
#include <functional>
#include <memory>
#include <stdexcept>

namespace Chorus {

/**
 * @brief Non-owning reference to a cached entity, resolved by id
 *
 * Stores only the id and a lookup into the owning cache. Every resolve()
 * runs the lookup again and never memoizes the result, so once the target
 * is evicted from the cache resolve() returns nullptr on the very next call.
 * The returned shared_ptr keeps the target alive only for as long as the
 * caller holds it.
 *
 * resolve() is as thread-safe as the lookup it was given; the lookups the
 * client installs go through SnowflakeCacheView and may block briefly on its
 * shared lock.
 */
template <typename T>
class SnowflakeReference {
public:
    using Lookup = std::function<std::shared_ptr<T>(Snowflake)>;

    SnowflakeReference(Snowflake id, Lookup lookup)
        : m_id(id), m_lookup(std::move(lookup)) {
        if (!m_lookup) {
            throw std::invalid_argument("SnowflakeReference requires a lookup function");
        }
    }

    [[nodiscard]] std::shared_ptr<T> resolve() const { return m_lookup(m_id); }

    [[nodiscard]] Snowflake getId() const noexcept { return m_id; }

    [[nodiscard]] bool operator==(const SnowflakeReference& other) const noexcept {
        return m_id == other.m_id;
    }

private:
    Snowflake m_id;
    Lookup m_lookup;
};

} // namespace Chorus

#endif // SNOWFLAKE_REFERENCE_HPP
