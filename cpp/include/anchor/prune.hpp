#pragma once

#include "attestation.hpp"
#include "chain_verifier.hpp"
#include "timestamp.hpp"
#include "types.hpp"
#include <set>
#include <string>
#include <vector>

namespace anchor
{

    /**
     * Which attestations `prune` drops. Parsed from NOTARYSPEC strings:
     * btc, ltc, unknown, pending:* and pending:<uri>.
     */
    struct DiscardSpec
    {
        std::set<AttestationKind> kinds;
        std::set<std::string> pending_uris;

        bool matches(const Attestation &att) const;
    };

    struct PruneOptions
    {
        /** Kinds that must be checked against the chain before pruning */
        std::set<AttestationKind> verify{AttestationKind::Bitcoin};
        DiscardSpec discard{{AttestationKind::Pending}, {}};
    };

    struct PruneOutcome
    {
        /** No attestation survived anywhere; the proof would be worthless */
        bool prunable{false};
        bool changed{false};
    };

    /** Parse --verify values; only "btc" can be verified */
    Result<std::set<AttestationKind>> parse_verify_specs(const std::vector<std::string> &specs);

    /** Parse --discard values */
    Result<DiscardSpec> parse_discard_specs(const std::vector<std::string> &specs);

    /**
     * Check every attestation of the requested kinds. Any failure, including a
     * kind `verifier` can't check, is fatal.
     */
    Result<void> verify_all_attestations(const Timestamp &ts,
                                         const std::set<AttestationKind> &kinds,
                                         ChainVerifier *verifier);

    /** Remove matching attestations everywhere; returns how many were removed */
    std::size_t discard_attestations(Timestamp &ts, const DiscardSpec &spec);

    /**
     * Keep only the best attestation of `chain` in the whole DAG: the lowest
     * height, and among equals the one with the cheapest path from the root.
     * Nodes shared by several parents are copied first so each path keeps its
     * own attestations. Returns how many attestations were removed.
     */
    std::size_t discard_suboptimal(Timestamp &ts, Chain chain);

    /**
     * Drop every subtree without attestations. Each node's op map is rebuilt
     * once all of its children have been visited.
     */
    PruneOutcome prune_tree(Timestamp &ts);

    /** verify, discard, discard_suboptimal (Bitcoin, then Litecoin), prune_tree */
    Result<PruneOutcome> prune_timestamp(Timestamp &ts, const PruneOptions &options, ChainVerifier *verifier);

} // namespace anchor
