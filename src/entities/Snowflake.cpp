/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Snowflake.hpp"
#include <charconv>

namespace Chorus {

std::optional<Snowflake> Snowflake::parse(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }

    IDType value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return Snowflake(value);
}

Snowflake Snowflake::fromTimestamp(std::chrono::system_clock::time_point time) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        time.time_since_epoch()).count();
    if (ms <= EPOCH_MS) {
        return Snowflake();
    }
    return Snowflake(static_cast<IDType>(ms - EPOCH_MS) << TIMESTAMP_SHIFT);
}

} // namespace Chorus
