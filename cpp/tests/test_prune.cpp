#include <catch2/catch_test_macros.hpp>
#include "anchor/prune.hpp"
#include "fakes.hpp"

using namespace anchor;
using namespace anchor::testing;

namespace
{
    // root -> append(suffix) -> sha256 -> node carrying `att`
    Timestamp::Ptr branch(Timestamp &root, const Bytes &suffix, Attestation att)
    {
        auto appended = root.add_op(Op::append(suffix)).value();
        auto node = appended->add_op(Op::sha256()).value();
        node->attestations.insert(std::move(att));
        return node;
    }

    std::size_t count_attestations(const Timestamp &ts)
    {
        return ts.all_attestations().size();
    }
}

TEST_CASE("The lowest block height survives", "[prune]")
{
    auto root = Timestamp::make(digest_of("file"));
    branch(*root, bytes_of("a"), Attestation::bitcoin(100));
    branch(*root, bytes_of("b"), Attestation::bitcoin(90));

    REQUIRE(discard_suboptimal(*root, Chain::Bitcoin) == 1);
    auto remaining = root->attestation_set();
    REQUIRE(remaining == std::set<Attestation>{Attestation::bitcoin(90)});

    auto outcome = prune_tree(*root);
    REQUIRE(outcome.changed);
    REQUIRE_FALSE(outcome.prunable);
    REQUIRE(root->ops.size() == 1);
    REQUIRE(root->ops.contains(Op::append(bytes_of("b"))));
}

TEST_CASE("Among equal heights the cheaper path survives", "[prune]")
{
    auto root = Timestamp::make(digest_of("file"));
    branch(*root, bytes_of("long suffix"), Attestation::bitcoin(100));
    auto near = branch(*root, bytes_of("s"), Attestation::bitcoin(100));

    REQUIRE(discard_suboptimal(*root, Chain::Bitcoin) == 1);
    REQUIRE(near->attestations.size() == 1);

    prune_tree(*root);
    REQUIRE(root->ops.size() == 1);
    REQUIRE(root->ops.contains(Op::append(bytes_of("s"))));
}

TEST_CASE("An attestation on the node itself beats an equal one below it", "[prune]")
{
    auto root = Timestamp::make(digest_of("file"));
    root->attestations.insert(Attestation::bitcoin(100));
    branch(*root, bytes_of("a"), Attestation::bitcoin(100));

    REQUIRE(discard_suboptimal(*root, Chain::Bitcoin) == 1);
    REQUIRE(root->attestations.contains(Attestation::bitcoin(100)));

    prune_tree(*root);
    REQUIRE(root->ops.empty());
    REQUIRE(count_attestations(*root) == 1);
}

TEST_CASE("A node shared by two parents keeps a surviving attestation", "[prune]")
{
    auto root = Timestamp::make(digest_of("file"));
    auto shared = branch(*root, bytes_of("a"), Attestation::bitcoin(100));

    // Second parent reaches the same node and an equally good sibling
    auto other = root->add_op(Op::append(bytes_of("b"))).value();
    auto sibling = other->add_op(Op::sha1()).value();
    sibling->attestations.insert(Attestation::bitcoin(100));
    other->ops.emplace(Op::sha256(), shared);

    REQUIRE(discard_suboptimal(*root, Chain::Bitcoin) == 2);
    REQUIRE(root->is_complete());
    REQUIRE(count_attestations(*root) == 1);
    REQUIRE(root->attestation_set() == std::set<Attestation>{Attestation::bitcoin(100)});

    auto outcome = prune_tree(*root);
    REQUIRE_FALSE(outcome.prunable);
    REQUIRE(root->ops.size() == 1);
    REQUIRE(root->ops.contains(Op::append(bytes_of("a"))));
}

TEST_CASE("Chains are optimised independently", "[prune]")
{
    auto root = Timestamp::make(digest_of("file"));
    branch(*root, bytes_of("a"), Attestation::bitcoin(100));
    branch(*root, bytes_of("b"), Attestation::litecoin(5));
    branch(*root, bytes_of("c"), Attestation::litecoin(7));

    REQUIRE(discard_suboptimal(*root, Chain::Bitcoin) == 0);
    REQUIRE(discard_suboptimal(*root, Chain::Litecoin) == 1);
    auto remaining = root->attestation_set();
    REQUIRE(remaining.contains(Attestation::bitcoin(100)));
    REQUIRE(remaining.contains(Attestation::litecoin(5)));
    REQUIRE(remaining.size() == 2);
}

TEST_CASE("Discard selectors", "[prune]")
{
    auto root = Timestamp::make(digest_of("file"));
    branch(*root, bytes_of("a"), Attestation::pending("https://alice.example"));
    branch(*root, bytes_of("b"), Attestation::pending("https://bob.example"));
    branch(*root, bytes_of("c"), Attestation::bitcoin(1));

    SECTION("pending:* drops every pending attestation")
    {
        auto spec = parse_discard_specs({"pending:*"}).value();
        REQUIRE(discard_attestations(*root, spec) == 2);
        REQUIRE(root->attestation_set() == std::set<Attestation>{Attestation::bitcoin(1)});
    }

    SECTION("pending:<uri> drops only that calendar")
    {
        auto spec = parse_discard_specs({"pending:https://alice.example"}).value();
        REQUIRE(discard_attestations(*root, spec) == 1);
        REQUIRE(root->attestation_set().contains(Attestation::pending("https://bob.example")));
    }

    SECTION("btc drops chain attestations")
    {
        auto spec = parse_discard_specs({"btc"}).value();
        REQUIRE(discard_attestations(*root, spec) == 1);
        REQUIRE_FALSE(root->is_complete());
    }
}

TEST_CASE("Selector parsing", "[prune]")
{
    REQUIRE(parse_verify_specs({"btc"}).value() == std::set<AttestationKind>{AttestationKind::Bitcoin});
    REQUIRE(parse_verify_specs({}).value().empty());
    REQUIRE_FALSE(parse_verify_specs({"ltc"}).has_value());

    auto spec = parse_discard_specs({"ltc", "unknown"}).value();
    REQUIRE(spec.kinds == std::set<AttestationKind>{AttestationKind::Litecoin, AttestationKind::Unknown});

    auto bad = parse_discard_specs({"pending:"});
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == ErrorCode::InvalidInput);
    REQUIRE_FALSE(parse_discard_specs({"eth"}).has_value());
}

TEST_CASE("Pruning a complete proof", "[prune]")
{
    auto root = Timestamp::make(digest_of("file"));
    branch(*root, bytes_of("p"), Attestation::pending("https://alice.btc.calendar.opentimestamps.org"));
    auto anchored = branch(*root, bytes_of("q"), Attestation::bitcoin(500000));
    branch(*root, bytes_of("r"), Attestation::bitcoin(500001));

    FakeChainVerifier verifier;
    verifier.add_block(500000, anchored->msg(), 1500000000);

    SECTION("Verified chain attestations keep, pending and worse ones go")
    {
        auto later = root->ops.at(Op::append(bytes_of("r")))->ops.at(Op::sha256());
        verifier.add_block(500001, later->msg(), 1500000600);

        auto outcome = prune_timestamp(*root, PruneOptions{}, &verifier);
        REQUIRE(outcome.has_value());
        REQUIRE(outcome->changed);
        REQUIRE_FALSE(outcome->prunable);
        REQUIRE(root->attestation_set() == std::set<Attestation>{Attestation::bitcoin(500000)});
        REQUIRE(root->ops.size() == 1);

        // Nothing left to do the second time round
        auto again = prune_timestamp(*root, PruneOptions{}, &verifier);
        REQUIRE(again.has_value());
        REQUIRE_FALSE(again->changed);
    }

    SECTION("A failed check aborts before anything is removed")
    {
        auto outcome = prune_timestamp(*root, PruneOptions{}, &verifier);
        REQUIRE_FALSE(outcome.has_value());
        REQUIRE(outcome.error().code == ErrorCode::ChainVerificationFailed);
        REQUIRE(count_attestations(*root) == 3);
    }

    SECTION("Verification needs a verifier")
    {
        auto outcome = prune_timestamp(*root, PruneOptions{}, nullptr);
        REQUIRE_FALSE(outcome.has_value());
        REQUIRE(outcome.error().code == ErrorCode::ChainVerificationFailed);
    }

    SECTION("Skipping verification")
    {
        PruneOptions options;
        options.verify.clear();
        auto outcome = prune_timestamp(*root, options, nullptr);
        REQUIRE(outcome.has_value());
        REQUIRE(root->attestation_set() == std::set<Attestation>{Attestation::bitcoin(500000)});
    }
}

TEST_CASE("A proof left without attestations is prunable", "[prune]")
{
    auto root = Timestamp::make(digest_of("file"));
    branch(*root, bytes_of("p"), Attestation::pending("https://alice.example"));

    PruneOptions options;
    options.verify.clear();
    auto outcome = prune_timestamp(*root, options, nullptr);
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->prunable);
    REQUIRE(outcome->changed);
    REQUIRE(root->ops.empty());
}
