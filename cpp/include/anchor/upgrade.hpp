#pragma once

#include "calendar.hpp"
#include "calendar_whitelist.hpp"
#include "rate_limiter.hpp"
#include "timestamp.hpp"
#include "timestamp_cache.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace anchor
{

    struct UpgradeOptions
    {
        /** When set, these calendars are asked instead of each pending URI */
        std::vector<std::string> calendar_urls;
        CalendarWhitelist whitelist{CalendarWhitelist::defaults()};
        bool wait{false};
        std::chrono::milliseconds wait_interval{std::chrono::seconds(30)};
        std::chrono::milliseconds request_timeout{std::chrono::seconds(10)};
    };

    /**
     * Turns pending attestations into chain attestations: first from the local
     * cache, then by asking calendars, optionally waiting until the proof is
     * complete.
     */
    class Upgrader
    {
    public:
        using Sleeper = std::function<void(std::chrono::milliseconds)>;

        /**
         * `cache` and `limiter` may be null. `sleeper` defaults to
         * std::this_thread::sleep_for.
         */
        Upgrader(CalendarFactory factory,
                 std::shared_ptr<TimestampCache> cache,
                 std::shared_ptr<RateLimiter> limiter = nullptr,
                 Sleeper sleeper = {});

        /**
         * Upgrade `ts` in place. Returns true when new attestations were
         * learned. An incomplete result is not an error; check is_complete().
         */
        bool upgrade(Timestamp &ts, const UpgradeOptions &options);

    private:
        bool merge_from_cache(Timestamp &ts, std::set<Attestation> &known);
        bool query_calendars(Timestamp &ts, const UpgradeOptions &options, std::set<Attestation> &known);

        CalendarFactory factory_;
        std::shared_ptr<TimestampCache> cache_;
        std::shared_ptr<RateLimiter> limiter_;
        Sleeper sleeper_;
    };

} // namespace anchor
