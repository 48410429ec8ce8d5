/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/ClientConfig.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <format>
#include <mutex>

namespace Chorus {

ClientConfig::ClientConfig() {
    applyDefaults();
}

void ClientConfig::applyDefaults() {
    m_values.clear();
    m_values["rest"]["api_base"] = std::string(DEFAULT_API_BASE);
    m_values["rest"]["cdn_base"] = std::string(DEFAULT_CDN_BASE);
    m_values["threads"]["workers"] = 0;
    m_values["threads"]["queue_capacity"] = DEFAULT_QUEUE_CAPACITY;
}

void ClientConfig::reset() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    applyDefaults();
}

bool ClientConfig::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        CONFIG_ERROR("Failed to load config from file: " + filepath + " - " + reader.getLastError());
        return false;
    }
    return apply(reader.getRoot(), filepath);
}

bool ClientConfig::loadFromString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        CONFIG_ERROR("Failed to parse config: " + reader.getLastError());
        return false;
    }
    return apply(reader.getRoot(), "<memory>");
}

bool ClientConfig::apply(const JsonValue& root, const std::string& source) {
    const JsonObject* rootObject = root.tryAsObject();
    if (rootObject == nullptr) {
        CONFIG_ERROR("Config root is not a JSON object: " + source);
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);

    for (const auto& [category, categoryValue] : *rootObject) {
        const JsonObject* entries = categoryValue.tryAsObject();
        if (entries == nullptr) {
            CONFIG_WARN("Category '" + category + "' is not an object, skipping");
            continue;
        }

        for (const auto& [key, value] : *entries) {
            if (value.isBool()) {
                m_values[category][key] = value.asBool();
            } else if (value.isNumber()) {
                const double number = value.asNumber();
                if (number == static_cast<int>(number)) {
                    m_values[category][key] = static_cast<int>(number);
                } else {
                    m_values[category][key] = static_cast<float>(number);
                }
            } else if (value.isString()) {
                m_values[category][key] = value.asString();
            } else {
                CONFIG_WARN(std::format("Unsupported value type for '{}.{}', skipping", category, key));
            }
        }
    }

    CONFIG_INFO("Loaded config from " + source);
    return true;
}

bool ClientConfig::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    auto categoryIt = m_values.find(category);
    return categoryIt != m_values.end() &&
           categoryIt->second.find(key) != categoryIt->second.end();
}

std::vector<std::string> ClientConfig::getKeys(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    auto categoryIt = m_values.find(category);
    if (categoryIt == m_values.end()) {
        return {};
    }

    std::vector<std::string> keys;
    keys.reserve(categoryIt->second.size());
    for (const auto& [key, _] : categoryIt->second) {
        keys.push_back(key);
    }
    return keys;
}

namespace {
std::string withTrailingSlash(std::string url) {
    if (!url.empty() && url.back() != '/') {
        url += '/';
    }
    return url;
}
} // anonymous namespace

std::string ClientConfig::getApiBase() const {
    return withTrailingSlash(get<std::string>("rest", "api_base", DEFAULT_API_BASE));
}

std::string ClientConfig::getCdnBase() const {
    return withTrailingSlash(get<std::string>("rest", "cdn_base", DEFAULT_CDN_BASE));
}

unsigned int ClientConfig::getWorkerCount() const {
    const int workers = get<int>("threads", "workers", 0);
    return workers > 0 ? static_cast<unsigned int>(workers) : 0u;
}

size_t ClientConfig::getQueueCapacity() const {
    const int capacity = get<int>("threads", "queue_capacity", DEFAULT_QUEUE_CAPACITY);
    return capacity > 0 ? static_cast<size_t>(capacity)
                        : static_cast<size_t>(DEFAULT_QUEUE_CAPACITY);
}

} // namespace Chorus
