#pragma once

#include "chain_verifier.hpp"
#include "timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace anchor
{

    struct VerifyOptions
    {
        /** Local node used for chain attestations; may be null */
        ChainVerifier *node{nullptr};
        /** Block explorer; may be null */
        BlockExplorer *explorer{nullptr};
        /**
         * When non-zero with an explorer set, Bitcoin attestations go to the
         * explorer instead of the node until this many blocks were confirmed.
         * The rest only get manual instructions.
         */
        std::size_t explorer_queries{0};
    };

    /** "YYYY-MM-DD HH:MM:SS UTC" for a unix time */
    std::string format_block_time(int64_t unix_time);

    /**
     * Resolve chain attestations to block times, lowest height first. Pending
     * and unknown attestations are skipped. Returns the earliest attested time,
     * or nullopt when nothing could be checked; per-attestation failures are
     * logged together with instructions for checking by hand.
     */
    std::optional<int64_t> verify_timestamp(const Timestamp &ts, const VerifyOptions &options);

} // namespace anchor
