#include "anchor/rate_limiter.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

namespace anchor
{
    RateLimiter::RateLimiter() : cfg_{} {}

    RateLimiter::RateLimiter(const Config &cfg) : cfg_(cfg) {}

    void RateLimiter::refill(Bucket &bucket, std::chrono::steady_clock::time_point now)
    {
        if (bucket.last_refill.time_since_epoch().count() == 0)
        {
            bucket.last_refill = now;
            bucket.tokens = cfg_.burst_capacity;
            return;
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::duration<double>>(now - bucket.last_refill).count();
        if (elapsed <= 0)
            return;
        bucket.tokens = std::min(cfg_.burst_capacity, bucket.tokens + elapsed * cfg_.tokens_per_second);
        bucket.last_refill = now;
    }

    std::chrono::steady_clock::duration RateLimiter::deficit(const Bucket &bucket) const
    {
        if (bucket.tokens >= 1.0 || cfg_.tokens_per_second <= 0)
            return std::chrono::steady_clock::duration::zero();
        std::chrono::duration<double> secs((1.0 - bucket.tokens) / cfg_.tokens_per_second);
        return std::chrono::ceil<std::chrono::steady_clock::duration>(secs);
    }

    bool RateLimiter::allow(const std::string &key)
    {
        auto now = std::chrono::steady_clock::now();
        std::lock_guard lock(mutex_);
        auto &bucket = buckets_[key];
        refill(bucket, now);
        if (bucket.tokens < 1.0)
        {
            return false;
        }
        bucket.tokens -= 1.0;
        return true;
    }

    std::chrono::steady_clock::duration RateLimiter::wait_time(const std::string &key)
    {
        auto now = std::chrono::steady_clock::now();
        std::lock_guard lock(mutex_);
        auto &bucket = buckets_[key];
        refill(bucket, now);
        return deficit(bucket);
    }

    void RateLimiter::acquire(const std::string &key)
    {
        // A zero rate would never refill; treat it as unlimited
        if (cfg_.tokens_per_second <= 0)
            return;

        while (!allow(key))
        {
            auto wait = wait_time(key);
            spdlog::trace("Throttling requests to {} for {}ms", key,
                          std::chrono::duration_cast<std::chrono::milliseconds>(wait).count());
            std::this_thread::sleep_for(wait);
        }
    }

} // namespace anchor
