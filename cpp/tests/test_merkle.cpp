#include <catch2/catch_test_macros.hpp>
#include "anchor/merkle.hpp"
#include "fakes.hpp"

using namespace anchor;
using namespace anchor::testing;

namespace
{
    // Follow single-op chains and fork edges until `target` is reached
    bool leads_to(const Timestamp &from, const Bytes &target)
    {
        if (from.msg() == target)
            return true;
        for (const auto &[op, child] : from.ops)
        {
            if (leads_to(*child, target))
                return true;
        }
        return false;
    }
}

TEST_CASE("Leaf appends the nonce and hashes", "[merkle]")
{
    auto file = Timestamp::make(digest_of("file contents"));
    Bytes nonce(kLeafNonceSize, 0x5a);
    auto leaf = make_leaf(*file, nonce).value();

    Bytes expected_input = file->msg();
    expected_input.insert(expected_input.end(), nonce.begin(), nonce.end());
    auto expected = crypto::SHA256::hash(expected_input);
    REQUIRE(leaf->msg() == Bytes(expected.begin(), expected.end()));
    REQUIRE(file->ops.contains(Op::append(nonce)));
}

TEST_CASE("Random nonces differ between leaves of the same file", "[merkle]")
{
    auto a = Timestamp::make(digest_of("same"));
    auto b = Timestamp::make(digest_of("same"));
    REQUIRE(make_leaf(*a).value()->msg() != make_leaf(*b).value()->msg());
}

TEST_CASE("cat_sha256 shares the joined node between both parents", "[merkle]")
{
    auto left = Timestamp::make(digest_of("left"));
    auto right = Timestamp::make(digest_of("right"));
    auto parent = cat_sha256(left, right).value();

    auto joined_left = left->ops.at(Op::append(right->msg()));
    auto joined_right = right->ops.at(Op::prepend(left->msg()));
    REQUIRE(joined_left == joined_right);

    Bytes cat = left->msg();
    cat.insert(cat.end(), right->msg().begin(), right->msg().end());
    auto expected = crypto::SHA256::hash(cat);
    REQUIRE(parent->msg() == Bytes(expected.begin(), expected.end()));
}

TEST_CASE("Merkle tree connects every leaf to one root", "[merkle]")
{
    for (std::size_t n : {1u, 2u, 3u, 5u, 8u})
    {
        std::vector<Timestamp::Ptr> leaves;
        for (std::size_t i = 0; i < n; ++i)
            leaves.push_back(Timestamp::make(digest_of("leaf" + std::to_string(i))));

        auto root = make_merkle_tree(leaves).value();
        for (const auto &leaf : leaves)
            REQUIRE(leads_to(*leaf, root->msg()));
        if (n == 1)
            REQUIRE(root == leaves.front());
    }
}

TEST_CASE("Attestations on the root are seen from every file", "[merkle]")
{
    std::vector<Timestamp::Ptr> files{Timestamp::make(digest_of("a")), Timestamp::make(digest_of("b")),
                                      Timestamp::make(digest_of("c"))};
    std::vector<Timestamp::Ptr> leaves;
    for (auto &f : files)
        leaves.push_back(make_leaf(*f).value());

    auto root = make_merkle_tree(leaves).value();
    root->attestations.insert(Attestation::pending("https://a.example.org"));

    for (auto &f : files)
    {
        auto all = f->all_attestations();
        REQUIRE(all.size() == 1);
        REQUIRE(all.front().first == root->msg());
    }
}

TEST_CASE("Merkle tree of nothing is an error", "[merkle]")
{
    auto res = make_merkle_tree({});
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::InvalidInput);
}
