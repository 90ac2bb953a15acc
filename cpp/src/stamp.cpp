#include "anchor/stamp.hpp"
#include "anchor/merkle.hpp"
#include <spdlog/spdlog.h>

namespace anchor
{

    Stamper::Stamper(CalendarFactory factory,
                     std::shared_ptr<TimestampCache> cache,
                     std::shared_ptr<RateLimiter> limiter,
                     Upgrader::Sleeper sleeper)
        : factory_(std::move(factory)), cache_(std::move(cache)),
          limiter_(std::move(limiter)), sleeper_(std::move(sleeper))
    {
    }

    Result<std::size_t> Stamper::stamp(std::vector<DetachedTimestampFile> &proofs,
                                       const QuorumConfig &quorum,
                                       std::optional<UpgradeOptions> wait)
    {
        if (proofs.empty())
            return std::unexpected(AnchorError::invalid_input("Nothing to stamp"));

        std::vector<Timestamp::Ptr> leaves;
        leaves.reserve(proofs.size());
        for (auto &proof : proofs)
        {
            auto leaf = make_leaf(*proof.timestamp);
            if (!leaf)
                return std::unexpected(leaf.error());
            leaves.push_back(*leaf);
        }

        auto tip = make_merkle_tree(leaves);
        if (!tip)
            return std::unexpected(tip.error());

        QuorumSubmitter submitter(factory_);
        auto merged = submitter.submit(**tip, quorum);
        if (!merged)
            return merged;
        spdlog::debug("{} calendar(s) accepted the batch", *merged);

        if (wait)
        {
            // The pending URIs just came from calendars we chose ourselves
            wait->calendar_urls = quorum.calendar_urls;
            wait->wait = true;
            Upgrader upgrader(factory_, cache_, limiter_, sleeper_);
            upgrader.upgrade(**tip, *wait);
            spdlog::info("Timestamp complete; saving");
        }
        return merged;
    }

} // namespace anchor
