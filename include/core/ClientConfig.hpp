/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef CLIENT_CONFIG_HPP
#define CLIENT_CONFIG_HPP

#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Chorus {

class JsonValue;

/**
 * @brief Thread-safe client configuration organised by category
 *
 * Every ChatClient owns one. Values come from built-in defaults, optionally
 * overridden by a JSON file of the form:
 *
 *   {
 *     "rest":    { "api_base": "https://discord.com/api/v10/",
 *                  "cdn_base": "https://cdn.discordapp.com/" },
 *     "threads": { "workers": 4, "queue_capacity": 1024 }
 *   }
 *
 * Usage:
 *   ClientConfig config;
 *   config.loadFromFile("chorus.json");
 *   std::string api = config.get<std::string>("rest", "api_base");
 */
class ClientConfig {
public:
    using ConfigValue = std::variant<int, float, bool, std::string>;

    // Built-in defaults
    static constexpr const char* DEFAULT_API_BASE = "https://discord.com/api/v10/";
    static constexpr const char* DEFAULT_CDN_BASE = "https://cdn.discordapp.com/";
    static constexpr int DEFAULT_QUEUE_CAPACITY = 1024;

    ClientConfig();

    /**
     * @brief Overrides values from a JSON file
     * @return false if the file cannot be read or its root is not an object;
     *         values already present are kept in that case
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Overrides values from a JSON document held in memory
     */
    bool loadFromString(const std::string& json);

    /**
     * @brief Typed lookup, returning defaultValue when the key is missing or
     *        holds another type. Thread-safe for concurrent reads.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    template<typename T>
    void set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;

    std::vector<std::string> getKeys(const std::string& category) const;

    // Restores the built-in defaults
    void reset();

    // Convenience accessors for the keys the client reads
    std::string getApiBase() const;
    std::string getCdnBase() const;
    unsigned int getWorkerCount() const;
    size_t getQueueCapacity() const;

private:
    using CategoryValues = std::unordered_map<std::string, ConfigValue>;
    std::unordered_map<std::string, CategoryValues> m_values;
    mutable std::shared_mutex m_mutex;

    bool apply(const JsonValue& root, const std::string& source);
    void applyDefaults();
};

template<typename T>
T ClientConfig::get(const std::string& category, const std::string& key, T defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    auto categoryIt = m_values.find(category);
    if (categoryIt == m_values.end()) {
        return defaultValue;
    }
    auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return defaultValue;
    }

    if (const T* value = std::get_if<T>(&keyIt->second)) {
        return *value;
    }
    return defaultValue;
}

template<typename T>
void ClientConfig::set(const std::string& category, const std::string& key, const T& value) {
    static_assert(std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_convertible_v<T, std::string>,
                  "ClientConfig values must be int, float, bool or string");

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> || std::is_same_v<T, bool>) {
        m_values[category][key] = value;
    } else {
        m_values[category][key] = std::string(value);
    }
}

} // namespace Chorus

#endif // CLIENT_CONFIG_HPP
