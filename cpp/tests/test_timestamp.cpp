#include <catch2/catch_test_macros.hpp>
#include "anchor/timestamp.hpp"
#include "fakes.hpp"
#include <sstream>

using namespace anchor;
using namespace anchor::testing;

namespace
{
    // Two fragments for the same msg learned from different sources
    std::pair<Timestamp::Ptr, Timestamp::Ptr> divergent_fragments()
    {
        auto msg = digest_of("hello");
        auto a = attested_via(msg, bytes_of("a"), Attestation::pending("https://a.example.org"));
        auto b = attested_via(msg, bytes_of("b"), Attestation::bitcoin(500000));
        b->attestations.insert(Attestation::pending("https://b.example.org"));
        return {a, b};
    }

    std::set<Op> reachable_ops(const Timestamp &ts)
    {
        std::set<Op> out;
        for (const auto &[op, child] : ts.ops)
        {
            out.insert(op);
            for (const auto &o : reachable_ops(*child))
                out.insert(o);
        }
        return out;
    }
}

TEST_CASE("Merge is commutative", "[timestamp][merge]")
{
    auto [a, b] = divergent_fragments();

    auto ab = a->clone();
    REQUIRE(ab->merge(*b).has_value());
    auto ba = b->clone();
    REQUIRE(ba->merge(*a).has_value());

    REQUIRE(ab->attestation_set() == ba->attestation_set());
    REQUIRE(reachable_ops(*ab) == reachable_ops(*ba));
    REQUIRE(ab->equals(*ba));
    REQUIRE(ab->attestation_set().size() == 3);
}

TEST_CASE("Merge is idempotent", "[timestamp][merge]")
{
    auto [a, b] = divergent_fragments();
    auto merged = a->clone();
    REQUIRE(merged->merge(*b).has_value());
    auto snapshot = merged->clone();

    REQUIRE(merged->merge(*merged).has_value());
    REQUIRE(merged->equals(*snapshot));

    REQUIRE(merged->merge(*b).has_value());
    REQUIRE(merged->equals(*snapshot));
}

TEST_CASE("Merge copies children instead of sharing them", "[timestamp][merge]")
{
    auto [a, b] = divergent_fragments();
    auto root = Timestamp::make(a->msg());
    REQUIRE(root->merge(*b).has_value());

    for (const auto &[op, child] : root->ops)
        REQUIRE(child != b->ops.at(op));

    // Mutating the merged copy leaves the source untouched
    root->ops.begin()->second->attestations.insert(Attestation::litecoin(1));
    REQUIRE(b->attestation_set().size() == 2);
}

TEST_CASE("Merge rejects timestamps for different messages", "[timestamp][merge]")
{
    auto a = Timestamp::make(digest_of("one"));
    auto b = attested(digest_of("two"), Attestation::bitcoin(1));
    auto res = a->merge(*b);
    REQUIRE_FALSE(res.has_value());
    REQUIRE(a->attestations.empty());
}

TEST_CASE("add_op returns the existing child for a repeated op", "[timestamp]")
{
    auto ts = Timestamp::make(bytes_of("msg"));
    auto first = ts->add_op(Op::append(bytes_of("x"))).value();
    auto second = ts->add_op(Op::append(bytes_of("x"))).value();
    REQUIRE(first == second);
    REQUIRE(first->msg() == bytes_of("msgx"));
    REQUIRE(ts->ops.size() == 1);
}

TEST_CASE("Completeness needs a chain attestation", "[timestamp]")
{
    auto ts = attested_via(digest_of("x"), bytes_of("n"), Attestation::pending("https://a.example.org"));
    REQUIRE_FALSE(ts->is_complete());

    auto leaf = ts->ops.begin()->second->ops.begin()->second;
    leaf->attestations.insert(Attestation::bitcoin(358391));
    REQUIRE(ts->is_complete());
}

TEST_CASE("Detached proof round-trips every op and attestation kind", "[timestamp][codec]")
{
    std::istringstream content("The quick brown fox");
    auto proof = DetachedTimestampFile::from_stream(content).value();
    auto &root = *proof.timestamp;

    auto appended = root.add_op(Op::append(bytes_of("nonce"))).value();
    auto prepended = root.add_op(Op::prepend(bytes_of("pre"))).value();
    auto hexed = prepended->add_op(Op::hexlify()).value();
    auto sha1 = hexed->add_op(Op::sha1()).value();
    auto ripe = sha1->add_op(Op::ripemd160()).value();
    ripe->attestations.insert(Attestation::litecoin(42));
    auto hashed = appended->add_op(Op::sha256()).value();
    hashed->attestations.insert(Attestation::pending("https://alice.btc.calendar.opentimestamps.org"));
    hashed->attestations.insert(Attestation::bitcoin(358391));
    hashed->attestations.insert(Attestation(UnknownAttestation{Bytes{1, 2, 3, 4, 5, 6, 7, 8}, Bytes{0xde, 0xad}}));

    auto bytes = proof.serialize().value();
    auto decoded = DetachedTimestampFile::deserialize(bytes).value();

    REQUIRE(decoded.file_hash_op == Op::sha256());
    REQUIRE(decoded.file_digest() == proof.file_digest());
    REQUIRE(decoded.timestamp->equals(root));
    REQUIRE(decoded.serialize().value() == bytes);
}

TEST_CASE("Detached proof rejects malformed input", "[timestamp][codec]")
{
    auto proof = DetachedTimestampFile{Op::sha256(), attested(digest_of("f"), Attestation::bitcoin(1))};
    auto bytes = proof.serialize().value();

    SECTION("Bad magic")
    {
        auto bad = bytes;
        bad[1] = 'X';
        auto res = DetachedTimestampFile::deserialize(bad);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::MalformedProof);
    }

    SECTION("Trailing garbage")
    {
        auto bad = bytes;
        bad.push_back(0x00);
        auto res = DetachedTimestampFile::deserialize(bad);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::MalformedProof);
    }

    SECTION("Truncated")
    {
        auto bad = bytes;
        bad.pop_back();
        REQUIRE_FALSE(DetachedTimestampFile::deserialize(bad).has_value());
    }

    SECTION("Unsupported major version")
    {
        auto bad = bytes;
        bad[31] = 0x02;
        REQUIRE_FALSE(DetachedTimestampFile::deserialize(bad).has_value());
    }
}

TEST_CASE("Timestamp decoding rejects unknown and unsupported op tags", "[timestamp][codec]")
{
    auto msg = digest_of("m");

    SECTION("Unknown tag")
    {
        Bytes data{0x42};
        auto res = Timestamp::deserialize(data, msg);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::MalformedProof);
    }

    SECTION("Keccak-256 is recognised but not supported")
    {
        Bytes data{0x67};
        auto res = Timestamp::deserialize(data, msg);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::MalformedProof);
    }
}

TEST_CASE("Empty timestamps can't be serialized", "[timestamp][codec]")
{
    auto ts = Timestamp::make(digest_of("x"));
    REQUIRE_FALSE(ts->serialize().has_value());
}

TEST_CASE("Proof tree rendering", "[timestamp][info]")
{
    Bytes root_msg(32, 0x11);
    auto root = Timestamp::make(root_msg);
    auto a = root->add_op(Op::append(Bytes{0xaa})).value();
    auto b = root->add_op(Op::prepend(Bytes{0xbb})).value();
    a->attestations.insert(Attestation::pending("https://a.example.org"));
    auto hashed = b->add_op(Op::sha256()).value();
    hashed->attestations.insert(Attestation::bitcoin(123));

    auto tree = root->str_tree();
    REQUIRE(tree.find(" -> append aa\n") != std::string::npos);
    REQUIRE(tree.find(" -> prepend bb\n") != std::string::npos);
    REQUIRE(tree.find("    verify PendingAttestation('https://a.example.org')\n") != std::string::npos);
    REQUIRE(tree.find("    sha256\n") != std::string::npos);
    REQUIRE(tree.find("    verify BitcoinBlockHeaderAttestation(123)\n") != std::string::npos);
    REQUIRE(tree.find("# Bitcoin block merkle root " + crypto::Hex::encode_reversed(hashed->msg())) != std::string::npos);

    auto verbose = root->str_tree(0, 1);
    REQUIRE(verbose.find(" == " + crypto::Hex::encode(a->msg())) != std::string::npos);
}
