#pragma once

#include "types.hpp"
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace anchor
{
    /**
     * Thread-safe token bucket keyed by calendar URI, so one upgrade run never
     * hammers a single calendar operator.
     */
    class RateLimiter
    {
    public:
        struct Config
        {
            double tokens_per_second{2.0};
            double burst_capacity{10.0};
        };

        RateLimiter();
        explicit RateLimiter(const Config &cfg);

        /** Take a token if one is available right now */
        bool allow(const std::string &key);

        /** Block until a token is available, then take it */
        void acquire(const std::string &key);

        /** Time until the next token for `key` becomes available (zero if one is) */
        std::chrono::steady_clock::duration wait_time(const std::string &key);

    private:
        struct Bucket
        {
            double tokens{0.0};
            std::chrono::steady_clock::time_point last_refill{};
        };

        void refill(Bucket &bucket, std::chrono::steady_clock::time_point now);
        std::chrono::steady_clock::duration deficit(const Bucket &bucket) const;

        Config cfg_;
        std::unordered_map<std::string, Bucket> buckets_;
        std::mutex mutex_;
    };
}
