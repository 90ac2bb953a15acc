#pragma once

#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace anchor
{

    /**
     * Parsed absolute URL: scheme://[userinfo@]host[:port]/path[?query][#fragment]
     */
    struct Url
    {
        std::string scheme;
        std::string userinfo;
        std::string host;
        std::string port; // empty when not given
        std::string path;
        std::string query;
        std::string fragment;

        /** host[:port] as written */
        std::string netloc() const;

        /** Explicit port or the scheme default (80/443) */
        std::string effective_port() const;

        /** Request target: path (at least "/") plus query */
        std::string target() const;

        static Result<Url> parse(const std::string &url);
    };

    /** SOCKS5 proxy endpoint; host names are resolved by the proxy */
    struct Socks5Proxy
    {
        std::string host;
        std::uint16_t port{1080};

        /** Parse "host[:port]" */
        static Result<Socks5Proxy> parse(const std::string &spec);
    };

    struct HttpRequest
    {
        enum class Method
        {
            Get,
            Post
        };

        Method method{Method::Get};
        std::string url;
        std::string body;
        std::vector<std::pair<std::string, std::string>> headers;
        std::chrono::milliseconds timeout{std::chrono::seconds(30)};
        std::size_t max_response_bytes{1024 * 1024};
    };

    struct HttpResponse
    {
        int status{0};
        std::string body;
    };

    struct HttpClientConfig
    {
        std::string user_agent{"anchor"};
        std::optional<Socks5Proxy> proxy;
    };

    /**
     * Transport seam for every network collaborator. Implementations report
     * connection, TLS, timeout and size-limit failures as CalendarUnreachable;
     * any HTTP status is a successful exchange.
     */
    class HttpClient
    {
    public:
        virtual ~HttpClient() = default;

        virtual Result<HttpResponse> send(const HttpRequest &request) = 0;
    };

    /**
     * Blocking HTTP/1.1 client on Boost.Beast with TLS (OpenSSL) and optional
     * SOCKS5. Each request owns its own io_context so concurrent calls from
     * several threads are independent.
     */
    class BeastHttpClient : public HttpClient
    {
    public:
        explicit BeastHttpClient(HttpClientConfig cfg = HttpClientConfig{});
        ~BeastHttpClient() override;

        Result<HttpResponse> send(const HttpRequest &request) override;

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

} // namespace anchor
