#include "anchor/verify.hpp"
#include "anchor/crypto.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <format>
#include <limits>

namespace anchor
{

    namespace
    {
        uint64_t sort_key(const Attestation &att)
        {
            if (auto h = att.height())
                return *h;
            return std::numeric_limits<uint64_t>::max();
        }

        void manual_instructions(const Bytes &msg, const ChainBlockHeaderAttestation &att)
        {
            spdlog::info("To verify manually, check that {} block {} has merkleroot {}",
                         chain_to_string(att.chain), att.height, crypto::Hex::encode_reversed(msg));
        }

        std::optional<int64_t> ask_explorer(BlockExplorer &explorer, const Bytes &msg, uint64_t height)
        {
            auto hash = explorer.block_hash_at(height);
            if (!hash)
            {
                spdlog::error("Couldn't query {} for Bitcoin block {}: {}", explorer.name(), height, hash.error().what());
                return std::nullopt;
            }
            auto info = explorer.block_info(*hash);
            if (!info)
            {
                spdlog::error("Couldn't query {} for Bitcoin block {}: {}", explorer.name(), *hash, info.error().what());
                return std::nullopt;
            }

            auto expected = crypto::Hex::encode_reversed(msg);
            if (info->merkle_root != expected)
            {
                spdlog::error("{} says block {} has merkle root {} but it should be {}",
                              explorer.name(), height, info->merkle_root, expected);
                return std::nullopt;
            }
            spdlog::info("{} confirms merkle root {} of block {} and {}={}",
                         explorer.name(), info->merkle_root, height, info->time_field, format_block_time(info->time));
            return info->time;
        }
    } // namespace

    std::string format_block_time(int64_t unix_time)
    {
        std::chrono::sys_seconds tp{std::chrono::seconds{unix_time}};
        return std::format("{:%Y-%m-%d %H:%M:%S} UTC", tp);
    }

    std::optional<int64_t> verify_timestamp(const Timestamp &ts, const VerifyOptions &options)
    {
        if (!options.node)
            spdlog::info("Not checking Bitcoin attestation with local node, specify --query-local-node");
        if (!options.explorer || options.explorer_queries == 0)
            spdlog::info("Not checking a block explorer for Bitcoin attestation, specify --query-explorer N");

        auto attestations = ts.all_attestations();
        std::stable_sort(attestations.begin(), attestations.end(), [](const auto &a, const auto &b)
                         { return sort_key(a.second) < sort_key(b.second); });

        std::optional<int64_t> earliest;
        std::size_t explorer_confirmed = 0;
        bool explorer_enabled = options.explorer && options.explorer_queries > 0;

        for (const auto &[msg, att] : attestations)
        {
            const auto *chain_att = att.as_chain();
            if (!chain_att)
                continue;

            std::optional<int64_t> attested;
            if (chain_att->chain == Chain::Bitcoin && explorer_enabled)
            {
                // Only confirmed blocks count against the limit
                if (explorer_confirmed >= options.explorer_queries)
                {
                    manual_instructions(msg, *chain_att);
                    continue;
                }
                attested = ask_explorer(*options.explorer, msg, chain_att->height);
                if (attested)
                    ++explorer_confirmed;
            }
            else if (options.node && options.node->supports(chain_att->chain))
            {
                auto time = options.node->verify(chain_att->chain, msg, chain_att->height);
                if (time)
                {
                    attested = *time;
                    spdlog::info("{} block {} attests existence as of {}",
                                 chain_to_string(chain_att->chain), chain_att->height, format_block_time(*time));
                }
                else
                {
                    spdlog::error("{} verification failed: {}", chain_to_string(chain_att->chain), time.error().what());
                }
            }

            if (!attested)
            {
                manual_instructions(msg, *chain_att);
                continue;
            }
            if (!earliest || *attested < *earliest)
                earliest = attested;
        }

        if (earliest)
            spdlog::info("Earliest attested time is {}", format_block_time(*earliest));
        return earliest;
    }

} // namespace anchor
