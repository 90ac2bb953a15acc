#pragma once

#include "calendar.hpp"
#include "quorum_submitter.hpp"
#include "rate_limiter.hpp"
#include "timestamp.hpp"
#include "timestamp_cache.hpp"
#include "types.hpp"
#include "upgrade.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace anchor
{

    /**
     * Batches detached proofs under one Merkle tip, submits the tip to a
     * calendar quorum and optionally waits for the result to reach the chain.
     */
    class Stamper
    {
    public:
        Stamper(CalendarFactory factory,
                std::shared_ptr<TimestampCache> cache,
                std::shared_ptr<RateLimiter> limiter = nullptr,
                Upgrader::Sleeper sleeper = {});

        /**
         * Stamp every proof in place. Returns the number of calendars that
         * accepted the batch. When `wait` is set the tip is upgraded from the
         * calendars in `quorum`, whatever `wait->calendar_urls` holds.
         */
        Result<std::size_t> stamp(std::vector<DetachedTimestampFile> &proofs,
                                  const QuorumConfig &quorum,
                                  std::optional<UpgradeOptions> wait = std::nullopt);

    private:
        CalendarFactory factory_;
        std::shared_ptr<TimestampCache> cache_;
        std::shared_ptr<RateLimiter> limiter_;
        Upgrader::Sleeper sleeper_;
    };

} // namespace anchor
