/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE RestActionTests
#include <boost/test/unit_test.hpp>

#include "core/ClientError.hpp"
#include "core/ThreadSystem.hpp"
#include "mocks/MockRequester.hpp"
#include "requests/Request.hpp"
#include "requests/RestAction.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace Chorus;

// The ThreadSystem only runs inside ShutdownTests, the last suite; everywhere
// else queue() runs on the calling thread
struct RestActionFixture {
    std::shared_ptr<MockRequester> requester = std::make_shared<MockRequester>();
    Route::CompiledRoute route = Routes::Emotes::GET_EMOTE.compile({"100", "300"});

    RestAction<int> makeAction(RestAction<int>::ResponseHandler handler, std::string body = "") {
        return RestAction<int>(requester, route, std::move(handler), std::move(body));
    }

    static void codeHandler(const Response& response, Request<int>& request) {
        if (response.isOk()) {
            request.onSuccess(response.getCode());
        } else {
            request.onFailure(response);
        }
    }
};

BOOST_FIXTURE_TEST_SUITE(RequestTests, RestActionFixture)

BOOST_AUTO_TEST_CASE(FirstCompletionWins) {
    int successes = 0;
    int failures = 0;
    Request<int> request(route, [&](const int&) { ++successes; },
                         [&](const RemoteFailureError&) { ++failures; });

    BOOST_CHECK(!request.isCompleted());
    request.onSuccess(1);
    request.onSuccess(2);
    request.onFailure(Response(500, ""));

    BOOST_CHECK(request.isCompleted());
    BOOST_CHECK_EQUAL(successes, 1);
    BOOST_CHECK_EQUAL(failures, 0);
}

BOOST_AUTO_TEST_CASE(ConcurrentCompletionFiresOnce) {
    std::atomic<int> calls{0};
    Request<int> request(route, [&](const int&) { calls.fetch_add(1); },
                         [&](const RemoteFailureError&) { calls.fetch_add(1); });

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&request, i]() {
            if (i % 2 == 0) {
                request.onSuccess(i);
            } else {
                request.onFailure(Response(500, ""));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    BOOST_CHECK_EQUAL(calls.load(), 1);
}

BOOST_AUTO_TEST_CASE(ThrowingCallbackIsContained) {
    Request<int> request(route, [](const int&) { throw std::runtime_error("callback bug"); }, nullptr);
    BOOST_CHECK_NO_THROW(request.onSuccess(1));
    BOOST_CHECK(request.isCompleted());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(RestActionTestSuite, RestActionFixture)

BOOST_AUTO_TEST_CASE(ConstructionRequiresRequesterAndHandler) {
    BOOST_CHECK_THROW(RestAction<int>(nullptr, route, codeHandler), std::invalid_argument);
    BOOST_CHECK_THROW(RestAction<int>(requester, route, nullptr), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(NothingIsSentUntilInvoked) {
    RestAction<int> action = makeAction(codeHandler, R"({"name": "x"})");
    BOOST_CHECK_EQUAL(requester->getCallCount(), 0);
    BOOST_CHECK(action.getRoute() == route);
    BOOST_CHECK_EQUAL(action.getBody(), R"({"name": "x"})");

    requester->respondWith(201);
    BOOST_CHECK_EQUAL(action.complete(), 201);
    BOOST_CHECK_EQUAL(requester->getCallCount(), 1);
    BOOST_CHECK_EQUAL(requester->getLastCall().body, R"({"name": "x"})");
}

BOOST_AUTO_TEST_CASE(CompleteThrowsOnFailure) {
    requester->respondWith(502, "bad gateway");
    RestAction<int> action = makeAction(codeHandler);
    try {
        static_cast<void>(action.complete());
        BOOST_FAIL("Expected RemoteFailureError");
    } catch (const RemoteFailureError& e) {
        BOOST_CHECK_EQUAL(e.getResponse().getCode(), 502);
        BOOST_CHECK_EQUAL(e.getResponse().getBody(), "bad gateway");
    }
}

BOOST_AUTO_TEST_CASE(QueueRunsInlineWithoutWorkers) {
    BOOST_REQUIRE(!ThreadSystem::Instance().isInitialized());
    requester->respondWith(200);

    std::optional<int> result;
    const std::thread::id caller = std::this_thread::get_id();
    std::thread::id ranOn;
    makeAction(codeHandler).queue([&](const int& value) {
        result = value;
        ranOn = std::this_thread::get_id();
    });

    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK_EQUAL(*result, 200);
    BOOST_CHECK(ranOn == caller);
}

BOOST_AUTO_TEST_CASE(QueueWithoutFailureCallbackLogs) {
    requester->respondWith(500);
    int successes = 0;
    BOOST_CHECK_NO_THROW(makeAction(codeHandler).queue([&](const int&) { ++successes; }));
    BOOST_CHECK_EQUAL(successes, 0);
    BOOST_CHECK_EQUAL(requester->getCallCount(), 1);
}

BOOST_AUTO_TEST_CASE(TransportExceptionBecomesFailure) {
    requester->failWith("socket closed");
    int handlerCalls = 0;
    RestAction<int> action = makeAction([&](const Response& response, Request<int>& request) {
        ++handlerCalls;
        codeHandler(response, request);
    });

    std::optional<int> failedCode;
    action.queue(nullptr, [&](const RemoteFailureError& e) { failedCode = e.getResponse().getCode(); });
    BOOST_REQUIRE(failedCode.has_value());
    BOOST_CHECK_EQUAL(*failedCode, Response::ERROR_CODE);
    BOOST_CHECK_EQUAL(handlerCalls, 0);
}

BOOST_AUTO_TEST_CASE(ThrowingHandlerBecomesFailure) {
    RestAction<int> action = makeAction([](const Response&, Request<int>&) {
        throw std::runtime_error("cannot decode");
    });
    BOOST_CHECK_THROW(static_cast<void>(action.complete()), RemoteFailureError);
}

BOOST_AUTO_TEST_CASE(HandlerThatNeverCompletesFails) {
    requester->respondWith(200);
    RestAction<int> action = makeAction([](const Response&, Request<int>&) {});
    BOOST_CHECK_THROW(static_cast<void>(action.complete()), RemoteFailureError);
}

BOOST_AUTO_TEST_CASE(EachQueueIsIndependent) {
    requester->respondWith(200);
    RestAction<int> action = makeAction(codeHandler);
    int successes = 0;
    action.queue([&](const int&) { ++successes; });
    action.queue([&](const int&) { ++successes; });
    BOOST_CHECK_EQUAL(successes, 2);
    BOOST_CHECK_EQUAL(requester->getCallCount(), 2);
}

BOOST_AUTO_TEST_SUITE_END()

namespace {
// Holds the first call until released so later actions stay queued
class GatedRequester : public Requester {
public:
    Response execute(const Route::CompiledRoute&, const std::string&) override {
        if (m_calls.fetch_add(1) == 0) {
            m_entered.set_value();
            m_gate.wait();
        }
        return Response(204, "");
    }

    void waitUntilEntered() { m_entered.get_future().wait(); }
    void release() { m_release.set_value(); }
    int getCallCount() const { return m_calls.load(); }

private:
    std::atomic<int> m_calls{0};
    std::promise<void> m_entered;
    std::promise<void> m_release;
    std::shared_future<void> m_gate{m_release.get_future().share()};
};
} // anonymous namespace

BOOST_AUTO_TEST_SUITE(ShutdownTests)

BOOST_AUTO_TEST_CASE(ActionsQueuedAtShutdownStillComplete) {
    BOOST_REQUIRE(ThreadSystem::Instance().init(16, 1));

    auto requester = std::make_shared<GatedRequester>();
    RestAction<int> action(requester, Routes::Emotes::DELETE_EMOTE.compile({"100", "300"}),
                           RestActionFixture::codeHandler);

    std::atomic<int> successes{0};
    std::atomic<int> canceled{0};
    std::atomic<int> otherFailures{0};
    for (int i = 0; i < 3; ++i) {
        action.queue([&](const int&) { ++successes; },
                     [&](const RemoteFailureError& e) {
                         if (e.getResponse().getCode() == Response::ERROR_CODE) {
                             ++canceled;
                         } else {
                             ++otherFailures;
                         }
                     });
    }
    requester->waitUntilEntered();

    std::thread cleaner([] { ThreadSystem::Instance().clean(); });

    // Queued actions are canceled before the running one is joined
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (canceled.load() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    requester->release();
    cleaner.join();

    BOOST_CHECK_EQUAL(canceled.load(), 2);
    BOOST_CHECK_EQUAL(successes.load(), 1);
    BOOST_CHECK_EQUAL(otherFailures.load(), 0);
    BOOST_CHECK_EQUAL(successes.load() + canceled.load() + otherFailures.load(), 3);
    BOOST_CHECK_EQUAL(requester->getCallCount(), 1);
}

BOOST_AUTO_TEST_CASE(QueueAfterShutdownRunsInline) {
    BOOST_REQUIRE(ThreadSystem::Instance().isShutdown());
    auto requester = std::make_shared<MockRequester>();
    requester->respondWith(204);
    RestAction<int> action(requester, Routes::Emotes::DELETE_EMOTE.compile({"100", "300"}),
                           RestActionFixture::codeHandler);

    std::optional<int> code;
    action.queue([&](const int& value) { code = value; });
    BOOST_REQUIRE(code.has_value());
    BOOST_CHECK_EQUAL(*code, 204);
}

BOOST_AUTO_TEST_SUITE_END()
