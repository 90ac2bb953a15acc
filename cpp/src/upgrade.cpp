#include "anchor/upgrade.hpp"
#include "anchor/crypto.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>
#include <unordered_set>

namespace anchor
{

    namespace
    {
        void walk(Timestamp &node, std::vector<Timestamp *> &out, std::unordered_set<const Timestamp *> &seen)
        {
            if (!seen.insert(&node).second)
                return;
            out.push_back(&node);
            for (auto &[op, child] : node.ops)
                walk(*child, out, seen);
        }

        // Nodes holding attestations that are not below another such node
        void directly_verified(Timestamp &node, std::vector<Timestamp *> &out, std::unordered_set<const Timestamp *> &seen)
        {
            if (!seen.insert(&node).second)
                return;
            if (!node.attestations.empty())
            {
                out.push_back(&node);
                return;
            }
            for (auto &[op, child] : node.ops)
                directly_verified(*child, out, seen);
        }

        std::size_t count_new(const std::set<Attestation> &incoming, std::set<Attestation> &known)
        {
            std::size_t added = 0;
            for (const auto &att : incoming)
            {
                if (known.insert(att).second)
                {
                    spdlog::debug("    {}", att.to_string());
                    ++added;
                }
            }
            return added;
        }
    } // namespace

    Upgrader::Upgrader(CalendarFactory factory,
                       std::shared_ptr<TimestampCache> cache,
                       std::shared_ptr<RateLimiter> limiter,
                       Sleeper sleeper)
        : factory_(std::move(factory)),
          cache_(std::move(cache)),
          limiter_(std::move(limiter)),
          sleeper_(std::move(sleeper))
    {
        if (!sleeper_)
        {
            sleeper_ = [](std::chrono::milliseconds d)
            { std::this_thread::sleep_for(d); };
        }
    }

    bool Upgrader::merge_from_cache(Timestamp &ts, std::set<Attestation> &known)
    {
        if (!cache_)
            return false;

        std::vector<Timestamp *> nodes;
        std::unordered_set<const Timestamp *> seen;
        walk(ts, nodes, seen);

        for (auto *node : nodes)
        {
            auto cached = cache_->get(node->msg());
            if (!cached)
                continue;
            if (auto res = node->merge(**cached); !res)
                spdlog::warn("Ignoring cached proof for {}: {}", crypto::Hex::encode(node->msg()), res.error().what());
        }

        auto added = count_new(ts.attestation_set(), known);
        if (added > 0)
            spdlog::info("Got {} attestation(s) from cache", added);
        return added > 0;
    }

    bool Upgrader::query_calendars(Timestamp &ts, const UpgradeOptions &options, std::set<Attestation> &known)
    {
        bool found_new = false;

        std::vector<Timestamp *> candidates;
        std::unordered_set<const Timestamp *> seen;
        directly_verified(ts, candidates, seen);

        for (auto *node : candidates)
        {
            // Merges below may add attestations to this node
            const auto attestations = node->attestations;
            for (const auto &att : attestations)
            {
                const auto *pending = att.as_pending();
                if (!pending)
                    continue;

                std::vector<std::string> urls = options.calendar_urls;
                if (!urls.empty())
                {
                    spdlog::debug("Attestation URI {} overridden by user-specified calendar(s)", pending->uri);
                }
                else if (options.whitelist.contains(pending->uri))
                {
                    urls.push_back(pending->uri);
                }
                else
                {
                    spdlog::warn("Ignoring attestation from calendar {}: Calendar not in whitelist", pending->uri);
                    continue;
                }

                const Bytes &commitment = node->msg();
                for (const auto &url : urls)
                {
                    spdlog::debug("Checking calendar {} for {}", url, crypto::Hex::encode(commitment));
                    if (limiter_)
                        limiter_->acquire(url);

                    auto calendar = factory_(url);
                    auto upgraded = calendar->get_timestamp(commitment, options.request_timeout);
                    if (!upgraded)
                    {
                        spdlog::warn("Calendar {}: {}", url, upgraded.error().what());
                        continue;
                    }

                    auto remote = (*upgraded)->attestation_set();
                    if (!remote.empty())
                        spdlog::info("Got {} attestation(s) from {}", remote.size(), url);

                    bool anything_new = std::any_of(remote.begin(), remote.end(), [&](const Attestation &a)
                                                    { return !known.contains(a); });
                    if (!anything_new)
                        continue;

                    if (auto res = node->merge(**upgraded); !res)
                    {
                        spdlog::warn("Calendar {}: {}", url, res.error().what());
                        continue;
                    }
                    count_new(remote, known);
                    if (cache_)
                        cache_->merge(**upgraded);
                    found_new = true;
                }
            }
        }
        return found_new;
    }

    bool Upgrader::upgrade(Timestamp &ts, const UpgradeOptions &options)
    {
        auto known = ts.attestation_set();
        bool changed = merge_from_cache(ts, known);

        while (!ts.is_complete())
        {
            bool found_new = query_calendars(ts, options, known);
            changed = changed || found_new;

            if (!options.wait)
                break;
            if (found_new)
                continue;

            spdlog::info("Timestamp not complete; waiting {} sec before trying again",
                         std::chrono::duration_cast<std::chrono::seconds>(options.wait_interval).count());
            sleeper_(options.wait_interval);
        }
        return changed;
    }

} // namespace anchor
