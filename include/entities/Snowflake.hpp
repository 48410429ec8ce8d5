/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SNOWFLAKE_HPP
#define SNOWFLAKE_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace Chorus {

/**
 * @brief 64-bit platform identifier
 *
 * The upper 42 bits hold milliseconds since the platform epoch
 * (2015-01-01T00:00:00Z), which is how creation times are derived.
 * Snowflakes are cheap to copy and are the identity key of every cached
 * entity.
 */
struct Snowflake {
    using IDType = uint64_t;

    static constexpr IDType INVALID_ID = 0;
    static constexpr int64_t EPOCH_MS = 1420070400000LL;
    static constexpr int TIMESTAMP_SHIFT = 22;

    IDType id{INVALID_ID};

    constexpr Snowflake() noexcept = default;
    constexpr explicit Snowflake(IDType value) noexcept : id(value) {}

    [[nodiscard]] constexpr bool isValid() const noexcept { return id != INVALID_ID; }
    [[nodiscard]] constexpr IDType getId() const noexcept { return id; }

    [[nodiscard]] constexpr int64_t getTimestampMs() const noexcept {
        return static_cast<int64_t>(id >> TIMESTAMP_SHIFT) + EPOCH_MS;
    }

    [[nodiscard]] std::chrono::system_clock::time_point getTimeCreated() const noexcept {
        return std::chrono::system_clock::time_point(
            std::chrono::milliseconds(getTimestampMs()));
    }

    [[nodiscard]] constexpr bool operator==(const Snowflake& other) const noexcept {
        return id == other.id;
    }
    [[nodiscard]] constexpr bool operator!=(const Snowflake& other) const noexcept {
        return id != other.id;
    }
    [[nodiscard]] constexpr bool operator<(const Snowflake& other) const noexcept {
        return id < other.id;
    }

    [[nodiscard]] std::size_t hash() const noexcept {
        return std::hash<IDType>{}(id);
    }

    // Decimal form, as sent on the wire
    [[nodiscard]] std::string toString() const { return std::to_string(id); }

    /**
     * @brief Parses the decimal wire form
     * @return std::nullopt for empty input, non-digits or overflow
     */
    static std::optional<Snowflake> parse(std::string_view text);

    // Smallest snowflake that could have been created at the given time
    static Snowflake fromTimestamp(std::chrono::system_clock::time_point time);
};

inline std::ostream& operator<<(std::ostream& os, const Snowflake& snowflake) {
    return os << snowflake.id;
}

} // namespace Chorus

namespace std {
template <>
struct hash<Chorus::Snowflake> {
    std::size_t operator()(const Chorus::Snowflake& snowflake) const noexcept {
        return snowflake.hash();
    }
};
} // namespace std

#endif // SNOWFLAKE_HPP
