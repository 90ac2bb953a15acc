#include "anchor/calendar.hpp"
#include "anchor/crypto.hpp"
#include <spdlog/spdlog.h>
#include <format>

namespace anchor
{

    namespace
    {
        const std::pair<std::string, std::string> kAcceptHeader{"Accept", "application/vnd.opentimestamps.v1"};

        std::string strip_trailing_slash(std::string uri)
        {
            while (!uri.empty() && uri.back() == '/')
                uri.pop_back();
            return uri;
        }
    } // namespace

    RemoteCalendar::RemoteCalendar(std::string uri, std::shared_ptr<HttpClient> http)
        : uri_(strip_trailing_slash(std::move(uri))), http_(std::move(http))
    {
    }

    Result<Timestamp::Ptr> RemoteCalendar::decode_response(const HttpResponse &response, const Bytes &msg) const
    {
        Bytes body(response.body.begin(), response.body.end());
        auto ts = Timestamp::deserialize(body, msg);
        if (!ts)
        {
            return std::unexpected(AnchorError::malformed(
                std::format("Calendar {} returned an invalid proof: {}", uri_, ts.error().what())));
        }
        return ts;
    }

    Result<Timestamp::Ptr> RemoteCalendar::submit(const Bytes &digest, std::chrono::milliseconds timeout)
    {
        HttpRequest req;
        req.method = HttpRequest::Method::Post;
        req.url = uri_ + "/digest";
        req.body.assign(digest.begin(), digest.end());
        req.headers.push_back(kAcceptHeader);
        req.headers.emplace_back("Content-Type", "application/x-www-form-urlencoded");
        req.timeout = timeout;
        req.max_response_bytes = kMaxCalendarResponse;

        auto resp = http_->send(req);
        if (!resp)
            return std::unexpected(resp.error());
        if (resp->status != 200)
        {
            return std::unexpected(AnchorError::unreachable(
                std::format("Calendar {} answered submission with HTTP {}", uri_, resp->status)));
        }
        return decode_response(*resp, digest);
    }

    Result<Timestamp::Ptr> RemoteCalendar::get_timestamp(const Bytes &commitment,
                                                         std::chrono::milliseconds timeout)
    {
        HttpRequest req;
        req.url = uri_ + "/timestamp/" + crypto::Hex::encode(commitment);
        req.headers.push_back(kAcceptHeader);
        req.timeout = timeout;
        req.max_response_bytes = kMaxCalendarResponse;

        auto resp = http_->send(req);
        if (!resp)
            return std::unexpected(resp.error());
        if (resp->status == 404)
        {
            spdlog::debug("Calendar {} has no record of {}: {}", uri_, crypto::Hex::encode(commitment), resp->body);
            return std::unexpected(AnchorError::not_found(resp->body));
        }
        if (resp->status != 200)
        {
            return std::unexpected(AnchorError::unreachable(
                std::format("Calendar {} answered with HTTP {}", uri_, resp->status)));
        }
        return decode_response(*resp, commitment);
    }

    CalendarFactory remote_calendar_factory(std::shared_ptr<HttpClient> http)
    {
        return [http = std::move(http)](const std::string &uri) -> std::shared_ptr<Calendar>
        {
            return std::make_shared<RemoteCalendar>(uri, http);
        };
    }

} // namespace anchor
