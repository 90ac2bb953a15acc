#include <catch2/catch_test_macros.hpp>
#include "anchor/rate_limiter.hpp"
#include <thread>

using namespace anchor;
using namespace std::chrono_literals;

TEST_CASE("RateLimiter allows bursts then throttles", "[rate_limiter]")
{
    RateLimiter::Config cfg{
        10.0, // tokens per second
        5.0   // burst
    };
    RateLimiter rl(cfg);

    int allowed = 0;
    for (int i = 0; i < 5; ++i)
    {
        if (rl.allow("https://a.pool.opentimestamps.org"))
            ++allowed;
    }
    REQUIRE(allowed == 5);
    REQUIRE_FALSE(rl.allow("https://a.pool.opentimestamps.org"));

    // 250ms at 10/s refills about two tokens
    std::this_thread::sleep_for(250ms);
    int post = 0;
    for (int i = 0; i < 3; ++i)
    {
        if (rl.allow("https://a.pool.opentimestamps.org"))
            ++post;
    }
    REQUIRE(post >= 1);
}

TEST_CASE("Buckets are independent per calendar", "[rate_limiter]")
{
    RateLimiter rl(RateLimiter::Config{1.0, 1.0});
    REQUIRE(rl.allow("https://alice.example"));
    REQUIRE_FALSE(rl.allow("https://alice.example"));
    REQUIRE(rl.allow("https://bob.example"));
}

TEST_CASE("wait_time reports the refill deficit", "[rate_limiter]")
{
    RateLimiter rl(RateLimiter::Config{2.0, 1.0});
    REQUIRE(rl.wait_time("k") == std::chrono::steady_clock::duration::zero());
    REQUIRE(rl.allow("k"));

    auto wait = rl.wait_time("k");
    REQUIRE(wait > 0ms);
    REQUIRE(wait <= 500ms);
}

TEST_CASE("acquire blocks until a token is available", "[rate_limiter]")
{
    RateLimiter rl(RateLimiter::Config{20.0, 1.0});
    rl.acquire("k");

    auto start = std::chrono::steady_clock::now();
    rl.acquire("k");
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(elapsed >= 40ms);
    REQUIRE(elapsed < 2s);

    SECTION("A zero rate never throttles")
    {
        RateLimiter unlimited(RateLimiter::Config{0.0, 1.0});
        for (int i = 0; i < 5; ++i)
            unlimited.acquire("k");
        SUCCEED();
    }
}
