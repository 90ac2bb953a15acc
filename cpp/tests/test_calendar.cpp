#include <catch2/catch_test_macros.hpp>
#include "anchor/calendar.hpp"
#include "fakes.hpp"

using namespace anchor;
using namespace anchor::testing;
using namespace std::chrono_literals;

namespace
{
    std::string wire(const Timestamp &ts)
    {
        auto bytes = ts.serialize().value();
        return std::string(bytes.begin(), bytes.end());
    }
}

TEST_CASE("Submitting a digest", "[calendar]")
{
    auto digest = digest_of("file");
    auto proof = attested_via(digest, bytes_of("nonce"), Attestation::pending("https://alice.btc.calendar.opentimestamps.org"));
    auto http = std::make_shared<FakeHttpClient>([&](const HttpRequest &) -> Result<HttpResponse>
                                                 { return HttpResponse{200, wire(*proof)}; });

    RemoteCalendar calendar("https://alice.btc.calendar.opentimestamps.org/", http);
    REQUIRE(calendar.uri() == "https://alice.btc.calendar.opentimestamps.org");

    auto res = calendar.submit(digest, 2s);
    REQUIRE(res.has_value());
    REQUIRE((*res)->equals(*proof));

    REQUIRE(http->requests.size() == 1);
    const auto &req = http->requests.front();
    REQUIRE(req.method == HttpRequest::Method::Post);
    REQUIRE(req.url == "https://alice.btc.calendar.opentimestamps.org/digest");
    REQUIRE(req.body == std::string(digest.begin(), digest.end()));
    REQUIRE(header_value(req, "Accept") == "application/vnd.opentimestamps.v1");
    REQUIRE(req.timeout == 2s);
    REQUIRE(req.max_response_bytes == kMaxCalendarResponse);
}

TEST_CASE("Fetching an upgraded timestamp", "[calendar]")
{
    Bytes commitment(32, 0xab);
    auto proof = attested_via(commitment, bytes_of("x"), Attestation::bitcoin(500000));
    int status = 200;
    std::string body = wire(*proof);
    auto http = std::make_shared<FakeHttpClient>([&](const HttpRequest &) -> Result<HttpResponse>
                                                 { return HttpResponse{status, body}; });
    RemoteCalendar calendar("https://calendar.example", http);

    SECTION("Success")
    {
        auto res = calendar.get_timestamp(commitment, 1s);
        REQUIRE(res.has_value());
        REQUIRE((*res)->is_complete());
        std::string hex;
        for (int i = 0; i < 32; ++i)
            hex += "ab";
        REQUIRE(http->requests.front().url == "https://calendar.example/timestamp/" + hex);
        REQUIRE(http->requests.front().method == HttpRequest::Method::Get);
    }

    SECTION("Not found")
    {
        status = 404;
        body = "Pending confirmation in Bitcoin blockchain";
        auto res = calendar.get_timestamp(commitment, 1s);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::CommitmentNotFound);
        REQUIRE(std::string(res.error().what()) == "Pending confirmation in Bitcoin blockchain");
    }

    SECTION("Server error")
    {
        status = 503;
        auto res = calendar.get_timestamp(commitment, 1s);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::CalendarUnreachable);
    }

    SECTION("Garbage body")
    {
        body = "\xff\xff\xff";
        auto res = calendar.get_timestamp(commitment, 1s);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::MalformedProof);
    }
}

TEST_CASE("Transport errors pass through", "[calendar]")
{
    auto http = std::make_shared<FakeHttpClient>([](const HttpRequest &) -> Result<HttpResponse>
                                                 { return std::unexpected(AnchorError::unreachable("Connection refused")); });
    auto factory = remote_calendar_factory(http);
    auto calendar = factory("https://calendar.example");

    auto res = calendar->submit(digest_of("file"), 1s);
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::CalendarUnreachable);
}
