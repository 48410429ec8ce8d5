/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REST_ACTION_HPP
#define REST_ACTION_HPP

#include "core/ClientError.hpp"
#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include "requests/Request.hpp"
#include "requests/Requester.hpp"
#include "requests/Response.hpp"
#include "requests/Route.hpp"
#include <format>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace Chorus {

/**
 * @brief Deferred remote call returning T
 *
 * Building a RestAction performs no I/O. Nothing is sent until queue() or
 * complete() is called, and each call performs one independent round trip.
 * The response handler classifies the Response and completes the Request
 * with exactly one of success(value) or failure(error).
 *
 * Usage:
 *   emote.deleteEmote().queue(
 *       [](const bool& deleted) { ... },
 *       [](const RemoteFailureError& error) { ... });
 *
 *   bool deleted = emote.deleteEmote().complete(); // blocks, throws RemoteFailureError
 */
template <typename T>
class RestAction {
public:
    using SuccessCallback = typename Request<T>::SuccessCallback;
    using FailureCallback = typename Request<T>::FailureCallback;
    using ResponseHandler = std::function<void(const Response&, Request<T>&)>;

    RestAction(std::shared_ptr<Requester> requester, Route::CompiledRoute route,
               ResponseHandler handler, std::string body = "")
        : m_requester(std::move(requester)), m_route(std::move(route)),
          m_handler(std::move(handler)), m_body(std::move(body)) {
        if (!m_requester) {
            throw std::invalid_argument("RestAction requires a Requester");
        }
        if (!m_handler) {
            throw std::invalid_argument("RestAction requires a response handler");
        }
    }

    /**
     * @brief Runs the action on a ThreadSystem worker
     *
     * Falls back to the calling thread when the ThreadSystem is not running.
     * If the ThreadSystem shuts down while the action is still queued, the
     * failure callback receives a Response with Response::ERROR_CODE. Either
     * way exactly one callback fires. A missing failure callback logs the error.
     */
    void queue(SuccessCallback success = nullptr, FailureCallback failure = nullptr) const {
        if (!failure) {
            failure = [route = m_route](const RemoteFailureError& error) {
                REST_ERROR(std::format("RestAction queue returned failure for {}: {}",
                                       route.toString(), error.what()));
            };
        }

        // Exactly one of task and cancel runs for a queued action
        std::function<void()> cancel = [route = m_route, success, failure]() {
            Request<T> request(route, success, failure);
            request.onFailure(Response::fromException(
                std::runtime_error("ThreadSystem shut down before the request was sent")));
        };
        std::function<void()> task = [action = *this, success = std::move(success),
                                      failure = std::move(failure)]() {
            Request<T> request(action.m_route, success, failure);
            action.execute(request);
        };

        if (!ThreadSystem::Instance().enqueueTask(task, TaskPriority::Normal,
                                                  m_route.toString(), std::move(cancel))) {
            REST_DEBUG(std::format("ThreadSystem not running, executing {} inline",
                                   m_route.toString()));
            task();
        }
    }

    /**
     * @brief Runs the action on the calling thread and waits for the result
     * @throws RemoteFailureError if the response is classified as a failure
     */
    T complete() const {
        std::optional<T> result;
        std::optional<RemoteFailureError> error;

        Request<T> request(
            m_route,
            [&result](const T& value) { result = value; },
            [&error](const RemoteFailureError& failure) { error.emplace(failure); });
        execute(request);

        if (error) {
            throw *error;
        }
        return *result;
    }

    [[nodiscard]] const Route::CompiledRoute& getRoute() const noexcept { return m_route; }
    [[nodiscard]] const std::string& getBody() const noexcept { return m_body; }

private:
    std::shared_ptr<Requester> m_requester;
    Route::CompiledRoute m_route;
    ResponseHandler m_handler;
    std::string m_body;

    void execute(Request<T>& request) const {
        std::optional<Response> response;
        try {
            response.emplace(m_requester->execute(m_route, m_body));
        } catch (const std::exception& e) {
            REST_WARN(std::format("Transport failed for {}: {}", m_route.toString(), e.what()));
            request.onFailure(Response::fromException(e));
            return;
        }

        REST_DEBUG(std::format("{} -> {}", m_route.toString(), response->getCode()));

        try {
            m_handler(*response, request);
        } catch (const std::exception& e) {
            REST_ERROR(std::format("Response handler for {} threw: {}", m_route.toString(), e.what()));
            if (!request.isCompleted()) {
                request.onFailure(Response::fromException(e));
            }
            return;
        }

        if (!request.isCompleted()) {
            REST_ERROR(std::format("Response handler for {} did not complete the request",
                                   m_route.toString()));
            request.onFailure(*response);
        }
    }
};

} // namespace Chorus

#endif // REST_ACTION_HPP
