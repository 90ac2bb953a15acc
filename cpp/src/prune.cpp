#include "anchor/prune.hpp"
#include "anchor/crypto.hpp"
#include <spdlog/spdlog.h>
#include <format>
#include <optional>
#include <unordered_set>

namespace anchor
{

    namespace
    {
        // Best attestation of one chain found in a subtree, where it lives, and
        // the cost of the path down to it
        struct Candidate
        {
            std::optional<Attestation> att;
            Timestamp *node{nullptr};
            std::size_t depth{0};
        };

        bool on_chain(const Attestation &att, Chain chain)
        {
            const auto *c = att.as_chain();
            return c && c->chain == chain;
        }

        void drop(Candidate &loser, const Candidate &winner, std::size_t &removed)
        {
            if (loser.node == winner.node && *loser.att == *winner.att)
                return;
            if (loser.node->attestations.erase(*loser.att) > 0)
                ++removed;
        }

        Candidate select_optimal(Timestamp &node, Chain chain, std::size_t &removed)
        {
            Candidate best;

            for (auto &[op, child] : node.ops)
            {
                auto cur = select_optimal(*child, chain, removed);
                if (!cur.att)
                    continue;
                cur.depth += op.cost();

                if (!best.att)
                {
                    best = std::move(cur);
                    continue;
                }

                auto order = *cur.att <=> *best.att;
                bool cur_wins = order < 0 || (order == 0 && cur.depth < best.depth);
                if (cur_wins)
                {
                    drop(best, cur, removed);
                    best = std::move(cur);
                }
                else
                {
                    drop(cur, best, removed);
                }
            }

            std::vector<Attestation> own;
            for (const auto &att : node.attestations)
            {
                if (on_chain(att, chain))
                    own.push_back(att);
            }

            // Attestations on this node sit at depth 0, so they win ties
            for (auto &att : own)
            {
                Candidate here{att, &node, 0};
                if (!best.att)
                {
                    best = std::move(here);
                }
                else if (att > *best.att)
                {
                    node.attestations.erase(att);
                    ++removed;
                }
                else
                {
                    drop(best, here, removed);
                    best = std::move(here);
                }
            }
            return best;
        }

        // Give every node reachable twice its own copy, turning the DAG into a tree
        void unshare(Timestamp &node, std::unordered_set<const Timestamp *> &seen)
        {
            for (auto &[op, child] : node.ops)
            {
                if (!seen.insert(child.get()).second)
                {
                    child = child->clone();
                    seen.insert(child.get());
                }
                unshare(*child, seen);
            }
        }
    } // namespace

    bool DiscardSpec::matches(const Attestation &att) const
    {
        if (kinds.contains(att.kind()))
            return true;
        if (const auto *p = att.as_pending())
            return pending_uris.contains(p->uri);
        return false;
    }

    Result<std::set<AttestationKind>> parse_verify_specs(const std::vector<std::string> &specs)
    {
        std::set<AttestationKind> kinds;
        for (const auto &s : specs)
        {
            if (s == "btc")
                kinds.insert(AttestationKind::Bitcoin);
            else
                return std::unexpected(AnchorError::invalid_input(
                    std::format("argument --verify: invalid choice: '{}' (choose from 'btc')", s)));
        }
        return kinds;
    }

    Result<DiscardSpec> parse_discard_specs(const std::vector<std::string> &specs)
    {
        DiscardSpec spec;
        for (const auto &s : specs)
        {
            if (s == "btc")
                spec.kinds.insert(AttestationKind::Bitcoin);
            else if (s == "ltc")
                spec.kinds.insert(AttestationKind::Litecoin);
            else if (s == "unknown")
                spec.kinds.insert(AttestationKind::Unknown);
            else if (s == "pending:*")
                spec.kinds.insert(AttestationKind::Pending);
            else if (s.starts_with("pending:") && s.size() > 8)
                spec.pending_uris.insert(s.substr(8));
            else
                return std::unexpected(AnchorError::invalid_input(std::format(
                    "argument --discard: invalid choice: '{}' (choose from 'btc', 'ltc', 'unknown', "
                    "'pending:*', 'pending:uri')",
                    s)));
        }
        return spec;
    }

    Result<void> verify_all_attestations(const Timestamp &ts,
                                         const std::set<AttestationKind> &kinds,
                                         ChainVerifier *verifier)
    {
        for (const auto &[msg, att] : ts.all_attestations())
        {
            if (!kinds.contains(att.kind()))
                continue;

            const auto *chain_att = att.as_chain();
            if (!chain_att)
            {
                return std::unexpected(AnchorError::verification(
                    "Could not verify; verification of " + att.to_string() + " not supported"));
            }
            if (!verifier || !verifier->supports(chain_att->chain))
            {
                return std::unexpected(AnchorError::verification(std::format(
                    "Local {} lookup disabled, could not check attestations", chain_to_string(chain_att->chain))));
            }

            auto time = verifier->verify(chain_att->chain, msg, chain_att->height);
            if (!time)
            {
                return std::unexpected(AnchorError::verification(std::format(
                    "{} verification failed: {}", chain_to_string(chain_att->chain), time.error().what())));
            }
            spdlog::debug("Verified {} (block time {})", att.to_string(), *time);
        }
        return {};
    }

    std::size_t discard_attestations(Timestamp &ts, const DiscardSpec &spec)
    {
        std::size_t removed = std::erase_if(ts.attestations, [&](const Attestation &a)
                                            { return spec.matches(a); });
        for (auto &[op, child] : ts.ops)
            removed += discard_attestations(*child, spec);
        return removed;
    }

    std::size_t discard_suboptimal(Timestamp &ts, Chain chain)
    {
        std::unordered_set<const Timestamp *> seen{&ts};
        unshare(ts, seen);

        std::size_t removed = 0;
        select_optimal(ts, chain, removed);
        return removed;
    }

    PruneOutcome prune_tree(Timestamp &ts)
    {
        PruneOutcome outcome{ts.attestations.empty(), false};

        Timestamp::OpMap kept;
        for (auto &[op, child] : ts.ops)
        {
            auto sub = prune_tree(*child);
            outcome.changed = outcome.changed || sub.changed || sub.prunable;
            if (sub.prunable)
                continue;
            outcome.prunable = false;
            kept.emplace(op, child);
        }
        ts.ops = std::move(kept);
        return outcome;
    }

    Result<PruneOutcome> prune_timestamp(Timestamp &ts, const PruneOptions &options, ChainVerifier *verifier)
    {
        if (auto res = verify_all_attestations(ts, options.verify, verifier); !res)
            return std::unexpected(res.error());

        std::size_t removed = discard_attestations(ts, options.discard);
        removed += discard_suboptimal(ts, Chain::Bitcoin);
        removed += discard_suboptimal(ts, Chain::Litecoin);
        spdlog::debug("Removed {} attestation(s)", removed);

        auto outcome = prune_tree(ts);
        outcome.changed = outcome.changed || removed > 0;
        return outcome;
    }

} // namespace anchor
