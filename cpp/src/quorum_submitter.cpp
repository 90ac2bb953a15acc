#include "anchor/quorum_submitter.hpp"
#include "anchor/crypto.hpp"
#include <spdlog/spdlog.h>
#include <format>
#include <memory>
#include <thread>

namespace anchor
{

    namespace
    {
        struct SubmissionResult
        {
            std::string uri;
            Result<Timestamp::Ptr> proof;
        };
    } // namespace

    std::vector<std::string> default_calendar_urls()
    {
        return {"https://a.pool.opentimestamps.org",
                "https://b.pool.opentimestamps.org",
                "https://a.pool.eternitywall.com",
                "https://ots.btc.catallaxy.com"};
    }

    QuorumSubmitter::QuorumSubmitter(CalendarFactory factory) : factory_(std::move(factory)) {}

    Result<std::size_t> QuorumSubmitter::submit(Timestamp &root, const QuorumConfig &cfg)
    {
        const std::size_t n = cfg.calendar_urls.size();
        if (cfg.m < 1 || cfg.m > n)
        {
            return std::unexpected(AnchorError::invalid_input(std::format(
                "Quorum of {} can't be met by {} calendar(s)", cfg.m, n)));
        }

        auto channel = std::make_shared<ResultChannel<SubmissionResult>>();
        const Bytes digest = root.msg();
        const auto deadline = std::chrono::steady_clock::now() + cfg.timeout;

        for (const auto &uri : cfg.calendar_urls)
        {
            auto calendar = factory_(uri);
            spdlog::debug("Submitting {} to {}", crypto::Hex::encode(digest), uri);
            std::thread([channel, calendar, uri, digest, timeout = cfg.timeout]
                        { channel->push(SubmissionResult{uri, calendar->submit(digest, timeout)}); })
                .detach();
        }

        std::size_t merged = 0;
        for (std::size_t i = 0; i < n; ++i)
        {
            auto result = channel->receive_until(deadline);
            if (!result)
            {
                spdlog::debug("Deadline reached with {} of {} calendar(s) answered", i, n);
                break;
            }

            if (!result->proof)
            {
                spdlog::debug("Calendar {} failed: {}", result->uri, result->proof.error().what());
                continue;
            }
            if (auto res = root.merge(**result->proof); !res)
            {
                spdlog::debug("Calendar {} returned an unusable proof: {}", result->uri, res.error().what());
                continue;
            }
            ++merged;
            spdlog::debug("Calendar {} accepted the submission", result->uri);
        }

        if (merged < cfg.m)
        {
            return std::unexpected(AnchorError::quorum(std::format(
                "Failed to create timestamp: need at least {} attestation(s) but received {}", cfg.m, merged)));
        }
        return merged;
    }

} // namespace anchor
