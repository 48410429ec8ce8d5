/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SNOWFLAKE_CACHE_VIEW_HPP
#define SNOWFLAKE_CACHE_VIEW_HPP

#include "entities/Snowflake.hpp"
#include <algorithm>
#include <cctype>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Chorus {

/**
 * @brief Thread-safe set of entities keyed by snowflake
 *
 * Holds shared ownership of its elements. Readers take a shared lock;
 * put/remove take an exclusive lock. Iteration always works on a snapshot
 * (asList) or under the shared lock (forEach), so concurrent mutation never
 * invalidates a reader.
 *
 * T must provide `Snowflake getId() const`; getElementsByName additionally
 * needs `std::string getName() const`.
 */
template <typename T>
class SnowflakeCacheView {
public:
    using Element = std::shared_ptr<T>;

    SnowflakeCacheView() = default;
    SnowflakeCacheView(const SnowflakeCacheView&) = delete;
    SnowflakeCacheView& operator=(const SnowflakeCacheView&) = delete;

    /**
     * @brief Inserts or replaces the element with the same id
     * @return true if the id was not present before
     */
    bool put(Element element) {
        if (!element) {
            return false;
        }
        const Snowflake id = element->getId();
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        return m_elements.insert_or_assign(id, std::move(element)).second;
    }

    // Removes and returns the element, nullptr if absent
    Element remove(Snowflake id) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_elements.find(id);
        if (it == m_elements.end()) {
            return nullptr;
        }
        Element removed = std::move(it->second);
        m_elements.erase(it);
        return removed;
    }

    void clear() {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_elements.clear();
    }

    [[nodiscard]] Element getElementById(Snowflake id) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_elements.find(id);
        return it != m_elements.end() ? it->second : nullptr;
    }

    [[nodiscard]] bool contains(Snowflake id) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_elements.find(id) != m_elements.end();
    }

    [[nodiscard]] size_t size() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_elements.size();
    }

    [[nodiscard]] bool isEmpty() const { return size() == 0; }

    // Independent copy of the current elements, ordered by id
    [[nodiscard]] std::vector<Element> asList() const {
        std::vector<Element> list;
        {
            std::shared_lock<std::shared_mutex> lock(m_mutex);
            list.reserve(m_elements.size());
            for (const auto& [id, element] : m_elements) {
                list.push_back(element);
            }
        }
        std::sort(list.begin(), list.end(),
                  [](const Element& a, const Element& b) { return a->getId() < b->getId(); });
        return list;
    }

    [[nodiscard]] std::vector<Snowflake> getIds() const {
        std::vector<Snowflake> ids;
        {
            std::shared_lock<std::shared_mutex> lock(m_mutex);
            ids.reserve(m_elements.size());
            for (const auto& [id, element] : m_elements) {
                ids.push_back(id);
            }
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    // Runs action under the shared lock; action must not modify this view
    void forEach(const std::function<void(const Element&)>& action) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        for (const auto& [id, element] : m_elements) {
            action(element);
        }
    }

    [[nodiscard]] bool anyMatch(const std::function<bool(const Element&)>& predicate) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return std::any_of(m_elements.begin(), m_elements.end(),
                           [&predicate](const auto& entry) { return predicate(entry.second); });
    }

    [[nodiscard]] std::vector<Element> getElementsByName(const std::string& name,
                                                         bool ignoreCase = false) const {
        std::vector<Element> matches;
        for (const Element& element : asList()) {
            if (namesEqual(element->getName(), name, ignoreCase)) {
                matches.push_back(element);
            }
        }
        return matches;
    }

private:
    std::unordered_map<Snowflake, Element> m_elements;
    mutable std::shared_mutex m_mutex;

    static bool namesEqual(const std::string& a, const std::string& b, bool ignoreCase) {
        if (!ignoreCase) {
            return a == b;
        }
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x)) ==
                          std::tolower(static_cast<unsigned char>(y));
               });
    }
};

} // namespace Chorus

#endif // SNOWFLAKE_CACHE_VIEW_HPP
