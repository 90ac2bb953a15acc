#pragma once

#include "http_client.hpp"
#include "timestamp.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace anchor
{

    /**
     * A remote notary that accepts digests and later hands back proofs for them.
     */
    class Calendar
    {
    public:
        virtual ~Calendar() = default;

        virtual const std::string &uri() const = 0;

        /** Submit a digest; the answer is usually just a pending attestation */
        virtual Result<Timestamp::Ptr> submit(const Bytes &digest, std::chrono::milliseconds timeout) = 0;

        /**
         * Fetch the calendar's current proof for a commitment. Fails with
         * CommitmentNotFound when the calendar has no record of it.
         */
        virtual Result<Timestamp::Ptr> get_timestamp(const Bytes &commitment,
                                                     std::chrono::milliseconds timeout) = 0;
    };

    /** Builds the Calendar used to talk to a given URI */
    using CalendarFactory = std::function<std::shared_ptr<Calendar>(const std::string &uri)>;

    inline constexpr std::size_t kMaxCalendarResponse = 10000;

    /**
     * Calendar server speaking the OpenTimestamps HTTP API:
     * POST <uri>/digest and GET <uri>/timestamp/<hex>.
     */
    class RemoteCalendar : public Calendar
    {
    public:
        RemoteCalendar(std::string uri, std::shared_ptr<HttpClient> http);

        const std::string &uri() const override { return uri_; }

        Result<Timestamp::Ptr> submit(const Bytes &digest, std::chrono::milliseconds timeout) override;

        Result<Timestamp::Ptr> get_timestamp(const Bytes &commitment,
                                             std::chrono::milliseconds timeout) override;

    private:
        Result<Timestamp::Ptr> decode_response(const HttpResponse &response, const Bytes &msg) const;

        std::string uri_;
        std::shared_ptr<HttpClient> http_;
    };

    /** Factory producing RemoteCalendar instances sharing one transport */
    CalendarFactory remote_calendar_factory(std::shared_ptr<HttpClient> http);

} // namespace anchor
