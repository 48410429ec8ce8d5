/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOCK_REQUESTER_HPP
#define MOCK_REQUESTER_HPP

#include "requests/Requester.hpp"
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace Chorus {

/**
 * @brief Requester that records every call and answers with a scripted response
 */
class MockRequester : public Requester {
public:
    struct Call {
        Method method;
        std::string path;
        std::string body;
    };

    Response execute(const Route::CompiledRoute& route, const std::string& body) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_calls.push_back({route.getMethod(), route.getCompiledRoute(), body});
        }
        m_callCount.fetch_add(1, std::memory_order_relaxed);

        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_transportError.empty()) {
            throw std::runtime_error(m_transportError);
        }
        return m_response;
    }

    void respondWith(int code, const std::string& body = "") {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_response = Response(code, body);
        m_transportError.clear();
    }

    void failWith(const std::string& message) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_transportError = message;
    }

    int getCallCount() const { return m_callCount.load(std::memory_order_relaxed); }

    std::vector<Call> getCalls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }

    Call getLastCall() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_calls.empty()) {
            throw std::logic_error("MockRequester was never called");
        }
        return m_calls.back();
    }

private:
    mutable std::mutex m_mutex;
    Response m_response{200, ""};
    std::string m_transportError;
    std::vector<Call> m_calls;
    std::atomic<int> m_callCount{0};
};

} // namespace Chorus

#endif // MOCK_REQUESTER_HPP
