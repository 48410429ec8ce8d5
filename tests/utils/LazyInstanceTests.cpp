/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE LazyInstanceTests
#include <boost/test/unit_test.hpp>

#include "utils/LazyInstance.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace Chorus;

namespace {
struct Counted {
    static std::atomic<int> constructions;
    int value;

    explicit Counted(int v) : value(v) {
        constructions.fetch_add(1, std::memory_order_relaxed);
        // Widen the window for concurrent first callers
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
};
std::atomic<int> Counted::constructions{0};
} // anonymous namespace

struct LazyInstanceFixture {
    LazyInstanceFixture() { Counted::constructions.store(0); }
};

BOOST_FIXTURE_TEST_SUITE(LazyInstanceTestSuite, LazyInstanceFixture)

BOOST_AUTO_TEST_CASE(NotConstructedUntilFirstGet) {
    LazyInstance<Counted> lazy;
    BOOST_CHECK(!lazy.isInitialized());
    BOOST_CHECK(lazy.tryGet() == nullptr);
    BOOST_CHECK_EQUAL(Counted::constructions.load(), 0);

    Counted& value = lazy.get([] { return std::make_unique<Counted>(7); });
    BOOST_CHECK_EQUAL(value.value, 7);
    BOOST_CHECK(lazy.isInitialized());
    BOOST_CHECK(lazy.tryGet() == &value);
    BOOST_CHECK_EQUAL(Counted::constructions.load(), 1);
}

BOOST_AUTO_TEST_CASE(LaterFactoriesAreIgnored) {
    LazyInstance<Counted> lazy;
    Counted& first = lazy.get([] { return std::make_unique<Counted>(1); });
    Counted& second = lazy.get([] { return std::make_unique<Counted>(2); });

    BOOST_CHECK(&first == &second);
    BOOST_CHECK_EQUAL(second.value, 1);
    BOOST_CHECK_EQUAL(Counted::constructions.load(), 1);
}

BOOST_AUTO_TEST_CASE(ConcurrentFirstCallsConstructOnce) {
    constexpr int NUM_THREADS = 32;
    LazyInstance<Counted> lazy;
    std::vector<Counted*> results(NUM_THREADS, nullptr);
    std::atomic<int> ready{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;

    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([&, i]() {
            ready.fetch_add(1);
            while (!go.load(std::memory_order_acquire)) {
                std::this_thread::yield();
            }
            results[i] = &lazy.get([i] { return std::make_unique<Counted>(i); });
        });
    }

    while (ready.load() < NUM_THREADS) {
        std::this_thread::yield();
    }
    go.store(true, std::memory_order_release);
    for (auto& thread : threads) {
        thread.join();
    }

    BOOST_CHECK_EQUAL(Counted::constructions.load(), 1);
    for (Counted* result : results) {
        BOOST_CHECK(result == results[0]);
    }
}

BOOST_AUTO_TEST_CASE(NullFactoryResultIsNotPublished) {
    LazyInstance<Counted> lazy;
    BOOST_CHECK_THROW(lazy.get([] { return std::unique_ptr<Counted>(); }), std::runtime_error);
    BOOST_CHECK(!lazy.isInitialized());

    Counted& value = lazy.get([] { return std::make_unique<Counted>(3); });
    BOOST_CHECK_EQUAL(value.value, 3);
}

BOOST_AUTO_TEST_CASE(ThrowingFactoryAllowsRetry) {
    LazyInstance<Counted> lazy;
    BOOST_CHECK_THROW(lazy.get([]() -> std::unique_ptr<Counted> {
                          throw std::runtime_error("construction failed");
                      }),
                      std::runtime_error);
    BOOST_CHECK(!lazy.isInitialized());

    BOOST_CHECK_EQUAL(lazy.get([] { return std::make_unique<Counted>(4); }).value, 4);
}

BOOST_AUTO_TEST_SUITE_END()
