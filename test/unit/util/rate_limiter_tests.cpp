// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for logging rate limiter

#include <catch2/catch_test_macros.hpp>

#include "util/rate_limiter.hpp"
#include "util/time.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace sniffer::util;

TEST_CASE("RateLimiter: Burst capacity per callsite", "[rate_limiter]") {
    RateLimiter limiter;

    SECTION("First N messages allowed") {
        for (int i = 0; i < 200; ++i) {
            REQUIRE(limiter.should_log("test:1", 200, 3600));
        }
        REQUIRE_FALSE(limiter.should_log("test:1", 200, 3600));
    }

    SECTION("Different callsites have independent buckets") {
        for (int i = 0; i < 200; ++i) {
            limiter.should_log("test:1", 200, 3600);
        }
        REQUIRE_FALSE(limiter.should_log("test:1", 200, 3600));
        REQUIRE(limiter.should_log("test:2", 200, 3600));
    }

    SECTION("reset() refills every bucket") {
        for (int i = 0; i < 5; ++i) {
            limiter.should_log("test:reset", 5, 3600);
        }
        REQUIRE_FALSE(limiter.should_log("test:reset", 5, 3600));
        limiter.reset();
        REQUIRE(limiter.should_log("test:reset", 5, 3600));
    }
}

TEST_CASE("RateLimiter: Token refill follows mock time", "[rate_limiter]") {
    MockTimeScope mock_time(1000000);
    RateLimiter limiter;

    SECTION("One token after a tenth of the period") {
        for (int i = 0; i < 10; ++i) {
            limiter.should_log("test:refill", 10, 100);
        }
        REQUIRE_FALSE(limiter.should_log("test:refill", 10, 100));

        SetMockTime(1000010);
        REQUIRE(limiter.should_log("test:refill", 10, 100));
        REQUIRE_FALSE(limiter.should_log("test:refill", 10, 100));
    }

    SECTION("Tokens cap at burst limit") {
        for (int i = 0; i < 5; ++i) {
            limiter.should_log("test:cap", 5, 1);
        }

        SetMockTime(1000010);
        for (int i = 0; i < 5; ++i) {
            REQUIRE(limiter.should_log("test:cap", 5, 1));
        }
        REQUIRE_FALSE(limiter.should_log("test:cap", 5, 1));
    }
}

TEST_CASE("RateLimiter: Malformed capture line flood", "[rate_limiter]") {
    RateLimiter limiter;

    int logged_count = 0;
    for (int i = 0; i < 1000; ++i) {
        if (limiter.should_log("capture:malformed", 200, 3600)) {
            logged_count++;
        }
    }
    REQUIRE(logged_count == 200);
}

TEST_CASE("RateLimiter: Dropped lines are reported on the next admission", "[rate_limiter]") {
    MockTimeScope mock_time(1000000);
    RateLimiter limiter;

    for (int i = 0; i < 3; ++i) {
        REQUIRE(limiter.admit("test:suppressed", 3, 30).suppressed == 0);
    }
    for (int i = 0; i < 7; ++i) {
        REQUIRE_FALSE(limiter.admit("test:suppressed", 3, 30).allowed);
    }

    SetMockTime(1000010);
    auto admission = limiter.admit("test:suppressed", 3, 30);
    REQUIRE(admission.allowed);
    REQUIRE(admission.suppressed == 7);

    // Counter restarts after being reported
    REQUIRE_FALSE(limiter.admit("test:suppressed", 3, 30).allowed);
    SetMockTime(1000020);
    REQUIRE(limiter.admit("test:suppressed", 3, 30).suppressed == 1);
}

TEST_CASE("RateLimiter: Thread safety", "[rate_limiter][threading]") {
    RateLimiter limiter;
    const int num_threads = 4;
    const int attempts_per_thread = 100;
    std::atomic<int> logged_count{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&limiter, &logged_count]() {
            for (int i = 0; i < attempts_per_thread; ++i) {
                if (limiter.should_log("thread_test", 200, 3600)) {
                    logged_count++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(logged_count == 200);
}
