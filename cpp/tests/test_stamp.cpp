#include <catch2/catch_test_macros.hpp>
#include "anchor/stamp.hpp"
#include "fakes.hpp"

using namespace anchor;
using namespace anchor::testing;
using namespace std::chrono_literals;

namespace
{
    const std::string kMine = "https://my.calendar.example";

    DetachedTimestampFile proof_of(const std::string &content)
    {
        return DetachedTimestampFile{Op::sha256(), Timestamp::make(digest_of(content))};
    }

    // Accepts digests as pending at its own URI and later answers with a block
    std::shared_ptr<FakeCalendar> private_calendar(const std::string &uri, uint64_t height)
    {
        return std::make_shared<FakeCalendar>(
            uri,
            [uri](const Bytes &digest) -> Result<Timestamp::Ptr>
            { return attested_via(digest, bytes_of("nonce"), Attestation::pending(uri)); },
            [height](const Bytes &commitment) -> Result<Timestamp::Ptr>
            { return attested_via(commitment, bytes_of("block"), Attestation::bitcoin(height)); });
    }
}

TEST_CASE("Stamping attaches every file to the calendar answer", "[stamp]")
{
    auto mine = private_calendar(kMine, 500000);
    Stamper stamper(factory_of({{kMine, mine}}), nullptr);

    std::vector<DetachedTimestampFile> proofs{proof_of("one"), proof_of("two"), proof_of("three")};
    QuorumConfig quorum{{kMine}, 1, 1s};

    auto merged = stamper.stamp(proofs, quorum);
    REQUIRE(merged.has_value());
    REQUIRE(*merged == 1);
    REQUIRE(mine->submit_calls == 1);
    REQUIRE(mine->get_calls == 0);
    for (const auto &proof : proofs)
    {
        REQUIRE(proof.timestamp->attestation_set().contains(Attestation::pending(kMine)));
        REQUIRE_FALSE(proof.timestamp->is_complete());
    }
}

TEST_CASE("Waiting upgrades from the calendars that were stamped with", "[stamp]")
{
    auto mine = private_calendar(kMine, 500000);
    int sleeps = 0;
    Stamper stamper(factory_of({{kMine, mine}}), nullptr, nullptr,
                    [&sleeps](std::chrono::milliseconds)
                    { ++sleeps; });

    std::vector<DetachedTimestampFile> proofs{proof_of("one"), proof_of("two")};
    QuorumConfig quorum{{kMine}, 1, 1s};

    // The calendar is not on the default whitelist
    UpgradeOptions wait;
    REQUIRE_FALSE(wait.whitelist.contains(kMine));

    auto merged = stamper.stamp(proofs, quorum, wait);
    REQUIRE(merged.has_value());
    REQUIRE(mine->get_calls >= 1);
    REQUIRE(sleeps == 0);
    for (const auto &proof : proofs)
    {
        REQUIRE(proof.timestamp->is_complete());
        REQUIRE(proof.timestamp->attestation_set().contains(Attestation::bitcoin(500000)));
    }
}

TEST_CASE("Stamping fails without a quorum", "[stamp]")
{
    std::vector<DetachedTimestampFile> proofs{proof_of("one")};

    SECTION("Calendar unreachable")
    {
        Stamper stamper(factory_of({}), nullptr);
        auto merged = stamper.stamp(proofs, QuorumConfig{{kMine}, 1, 1s});
        REQUIRE_FALSE(merged.has_value());
        REQUIRE(merged.error().code == ErrorCode::QuorumNotMet);
        REQUIRE(proofs.front().timestamp->attestation_set().empty());
    }

    SECTION("Nothing to stamp")
    {
        auto mine = private_calendar(kMine, 1);
        Stamper stamper(factory_of({{kMine, mine}}), nullptr);
        std::vector<DetachedTimestampFile> none;
        auto merged = stamper.stamp(none, QuorumConfig{{kMine}, 1, 1s});
        REQUIRE_FALSE(merged.has_value());
        REQUIRE(merged.error().code == ErrorCode::InvalidInput);
        REQUIRE(mine->submit_calls == 0);
    }
}
