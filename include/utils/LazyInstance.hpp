/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LAZY_INSTANCE_HPP
#define LAZY_INSTANCE_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace Chorus {

/**
 * @brief Owns a T that is constructed on first access, exactly once
 *
 * get() checks the published pointer without locking (acquire load). On a
 * miss it locks, checks again so concurrent first callers collapse onto one
 * construction, builds the value with the factory and publishes it with a
 * release store. Once published the value is never replaced, and every
 * caller receives the same object.
 *
 * Usage:
 *   LazyInstance<EmoteManager> m_manager;
 *   EmoteManager& manager = m_manager.get([this] {
 *       return std::make_unique<EmoteManager>(*this);
 *   });
 */
template <typename T>
class LazyInstance {
public:
    LazyInstance() = default;
    LazyInstance(const LazyInstance&) = delete;
    LazyInstance& operator=(const LazyInstance&) = delete;

    /**
     * @param factory Callable returning std::unique_ptr<T>; runs at most once
     * @throws std::runtime_error if the factory returns nullptr
     *         (nothing is published and a later get() retries)
     */
    template <typename Factory>
    T& get(Factory&& factory) {
        T* instance = m_instance.load(std::memory_order_acquire);
        if (instance != nullptr) {
            return *instance;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        instance = m_instance.load(std::memory_order_relaxed);
        if (instance == nullptr) {
            std::unique_ptr<T> created = factory();
            if (!created) {
                throw std::runtime_error("LazyInstance factory returned null");
            }
            m_storage = std::move(created);
            instance = m_storage.get();
            m_instance.store(instance, std::memory_order_release);
        }
        return *instance;
    }

    [[nodiscard]] bool isInitialized() const noexcept {
        return m_instance.load(std::memory_order_acquire) != nullptr;
    }

    // Published value or nullptr; never constructs
    [[nodiscard]] T* tryGet() const noexcept {
        return m_instance.load(std::memory_order_acquire);
    }

private:
    std::atomic<T*> m_instance{nullptr};
    std::mutex m_mutex;
    std::unique_ptr<T> m_storage;
};

} // namespace Chorus

#endif // LAZY_INSTANCE_HPP
