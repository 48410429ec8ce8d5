/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REQUEST_HPP
#define REQUEST_HPP

#include "core/ClientError.hpp"
#include "core/Logger.hpp"
#include "requests/Response.hpp"
#include "requests/Route.hpp"
#include <atomic>
#include <format>
#include <functional>
#include <string>
#include <utility>

namespace Chorus {

/**
 * @brief One in-flight execution of a RestAction
 *
 * Completes exactly once: the first of onSuccess/onFailure wins and invokes
 * the matching callback; later calls are logged and dropped. Completion may
 * happen on any thread.
 */
template <typename T>
class Request {
public:
    using SuccessCallback = std::function<void(const T&)>;
    using FailureCallback = std::function<void(const RemoteFailureError&)>;

    Request(Route::CompiledRoute route, SuccessCallback onSuccess, FailureCallback onFailure)
        : m_route(std::move(route)), m_onSuccess(std::move(onSuccess)),
          m_onFailure(std::move(onFailure)) {}

    Request(const Request&) = delete;
    Request& operator=(const Request&) = delete;

    void onSuccess(const T& value) {
        if (!markCompleted("success")) {
            return;
        }
        if (!m_onSuccess) {
            return;
        }
        try {
            m_onSuccess(value);
        } catch (const std::exception& e) {
            REST_ERROR(std::format("Success callback for {} threw: {}", m_route.toString(), e.what()));
        }
    }

    void onFailure(const Response& response) { onFailure(RemoteFailureError(response)); }

    void onFailure(const RemoteFailureError& error) {
        if (!markCompleted("failure")) {
            return;
        }
        if (!m_onFailure) {
            return;
        }
        try {
            m_onFailure(error);
        } catch (const std::exception& e) {
            REST_ERROR(std::format("Failure callback for {} threw: {}", m_route.toString(), e.what()));
        }
    }

    [[nodiscard]] bool isCompleted() const noexcept {
        return m_completed.load(std::memory_order_acquire);
    }

    [[nodiscard]] const Route::CompiledRoute& getRoute() const noexcept { return m_route; }

private:
    Route::CompiledRoute m_route;
    SuccessCallback m_onSuccess;
    FailureCallback m_onFailure;
    std::atomic<bool> m_completed{false};

    bool markCompleted(const char* outcome) {
        if (m_completed.exchange(true, std::memory_order_acq_rel)) {
            REST_ERROR(std::format("Dropping {} for already completed request {}",
                                   outcome, m_route.toString()));
            return false;
        }
        return true;
    }
};

} // namespace Chorus

#endif // REQUEST_HPP
