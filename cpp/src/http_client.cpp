#include "anchor/http_client.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <format>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace anchor
{
    namespace
    {
        using Clock = std::chrono::steady_clock;

        AnchorError transport_error(const std::string &what, const beast::error_code &ec)
        {
            return AnchorError::unreachable(std::format("{}: {}", what, ec.message()));
        }

        // Runs one asynchronous step to completion; the stream's expiry turns a
        // stalled step into a timeout error.
        template <class Initiate>
        beast::error_code run_step(net::io_context &ioc, Initiate &&initiate)
        {
            beast::error_code result = net::error::would_block;
            initiate([&result](beast::error_code ec, auto &&...)
                     { result = ec; });
            ioc.restart();
            ioc.run();
            return result;
        }

        Result<void> socks5_handshake(net::io_context &ioc,
                                      beast::tcp_stream &stream,
                                      const std::string &host,
                                      std::uint16_t port)
        {
            if (host.empty() || host.size() > 255)
                return std::unexpected(AnchorError::invalid_input("SOCKS5 destination host name too long"));

            // Greeting: version 5, one method, no authentication
            std::array<uint8_t, 3> greeting{0x05, 0x01, 0x00};
            if (auto ec = run_step(ioc, [&](auto h)
                                   { net::async_write(stream, net::buffer(greeting), std::move(h)); });
                ec)
                return std::unexpected(transport_error("SOCKS5 greeting", ec));

            std::array<uint8_t, 2> choice{};
            if (auto ec = run_step(ioc, [&](auto h)
                                   { net::async_read(stream, net::buffer(choice), std::move(h)); });
                ec)
                return std::unexpected(transport_error("SOCKS5 greeting reply", ec));
            if (choice[0] != 0x05 || choice[1] != 0x00)
                return std::unexpected(AnchorError::unreachable("SOCKS5 proxy refused unauthenticated access"));

            // CONNECT by domain name so DNS resolution happens at the proxy
            std::vector<uint8_t> request{0x05, 0x01, 0x00, 0x03, static_cast<uint8_t>(host.size())};
            request.insert(request.end(), host.begin(), host.end());
            request.push_back(static_cast<uint8_t>(port >> 8));
            request.push_back(static_cast<uint8_t>(port & 0xff));
            if (auto ec = run_step(ioc, [&](auto h)
                                   { net::async_write(stream, net::buffer(request), std::move(h)); });
                ec)
                return std::unexpected(transport_error("SOCKS5 connect request", ec));

            std::array<uint8_t, 4> reply{};
            if (auto ec = run_step(ioc, [&](auto h)
                                   { net::async_read(stream, net::buffer(reply), std::move(h)); });
                ec)
                return std::unexpected(transport_error("SOCKS5 connect reply", ec));
            if (reply[0] != 0x05 || reply[1] != 0x00)
                return std::unexpected(AnchorError::unreachable(
                    std::format("SOCKS5 proxy could not connect to {}:{} (reply {})", host, port, reply[1])));

            std::size_t bound_len = 0;
            switch (reply[3])
            {
            case 0x01:
                bound_len = 4 + 2;
                break;
            case 0x04:
                bound_len = 16 + 2;
                break;
            case 0x03:
            {
                std::array<uint8_t, 1> len{};
                if (auto ec = run_step(ioc, [&](auto h)
                                       { net::async_read(stream, net::buffer(len), std::move(h)); });
                    ec)
                    return std::unexpected(transport_error("SOCKS5 bound address", ec));
                bound_len = len[0] + 2u;
                break;
            }
            default:
                return std::unexpected(AnchorError::unreachable("SOCKS5 proxy sent an unknown address type"));
            }

            std::vector<uint8_t> bound(bound_len);
            if (auto ec = run_step(ioc, [&](auto h)
                                   { net::async_read(stream, net::buffer(bound), std::move(h)); });
                ec)
                return std::unexpected(transport_error("SOCKS5 bound address", ec));
            return {};
        }

        template <class Stream>
        Result<HttpResponse> exchange(net::io_context &ioc,
                                      Stream &stream,
                                      const http::request<http::string_body> &req,
                                      std::size_t max_body)
        {
            if (auto ec = run_step(ioc, [&](auto h)
                                   { http::async_write(stream, req, std::move(h)); });
                ec)
                return std::unexpected(transport_error("HTTP write", ec));

            beast::flat_buffer buffer;
            http::response_parser<http::string_body> parser;
            parser.body_limit(max_body);
            if (auto ec = run_step(ioc, [&](auto h)
                                   { http::async_read(stream, buffer, parser, std::move(h)); });
                ec)
                return std::unexpected(transport_error("HTTP read", ec));

            auto &res = parser.get();
            return HttpResponse{static_cast<int>(res.result_int()), std::move(res.body())};
        }
    } // namespace

    // ========== Url / Socks5Proxy ==========

    std::string Url::netloc() const
    {
        return port.empty() ? host : host + ":" + port;
    }

    std::string Url::effective_port() const
    {
        if (!port.empty())
            return port;
        return scheme == "https" ? "443" : "80";
    }

    std::string Url::target() const
    {
        std::string t = path.empty() ? "/" : path;
        if (!query.empty())
            t += "?" + query;
        return t;
    }

    Result<Url> Url::parse(const std::string &url)
    {
        auto scheme_end = url.find("://");
        if (scheme_end == std::string::npos || scheme_end == 0)
            return std::unexpected(AnchorError::invalid_input("URL has no scheme: " + url));

        Url out;
        out.scheme = url.substr(0, scheme_end);
        std::transform(out.scheme.begin(), out.scheme.end(), out.scheme.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        std::string rest = url.substr(scheme_end + 3);
        auto netloc_end = rest.find_first_of("/?#");
        std::string netloc = rest.substr(0, netloc_end);
        rest = netloc_end == std::string::npos ? "" : rest.substr(netloc_end);

        if (auto at = netloc.rfind('@'); at != std::string::npos)
        {
            out.userinfo = netloc.substr(0, at);
            netloc = netloc.substr(at + 1);
        }

        std::size_t port_sep = std::string::npos;
        if (!netloc.empty() && netloc.front() == '[')
        {
            auto close = netloc.find(']');
            if (close == std::string::npos)
                return std::unexpected(AnchorError::invalid_input("Unterminated IPv6 host in URL: " + url));
            out.host = netloc.substr(1, close - 1);
            if (close + 1 < netloc.size() && netloc[close + 1] == ':')
                port_sep = close + 1;
        }
        else
        {
            port_sep = netloc.find(':');
            out.host = netloc.substr(0, port_sep);
        }
        if (port_sep != std::string::npos)
            out.port = netloc.substr(port_sep + 1);

        if (out.host.empty())
            return std::unexpected(AnchorError::invalid_input("URL has no host: " + url));
        if (!std::all_of(out.port.begin(), out.port.end(), [](unsigned char c)
                         { return std::isdigit(c); }))
            return std::unexpected(AnchorError::invalid_input("URL port must be numeric: " + url));

        if (auto hash = rest.find('#'); hash != std::string::npos)
        {
            out.fragment = rest.substr(hash + 1);
            rest = rest.substr(0, hash);
        }
        if (auto q = rest.find('?'); q != std::string::npos)
        {
            out.query = rest.substr(q + 1);
            rest = rest.substr(0, q);
        }
        out.path = rest;
        return out;
    }

    Result<Socks5Proxy> Socks5Proxy::parse(const std::string &spec)
    {
        Socks5Proxy proxy;
        auto sep = spec.find(':');
        proxy.host = spec.substr(0, sep);
        if (proxy.host.empty())
            return std::unexpected(AnchorError::invalid_input("SOCKS5 proxy host is empty"));

        if (sep != std::string::npos)
        {
            auto port_str = spec.substr(sep + 1);
            unsigned value = 0;
            auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), value);
            if (ec != std::errc() || ptr != port_str.data() + port_str.size() || value == 0 || value > 65535)
                return std::unexpected(AnchorError::invalid_input(
                    std::format("SOCKS5 proxy port must be an integer; got {}", port_str)));
            proxy.port = static_cast<std::uint16_t>(value);
        }
        return proxy;
    }

    // ========== BeastHttpClient ==========

    class BeastHttpClient::Impl
    {
    public:
        explicit Impl(HttpClientConfig cfg)
            : cfg_(std::move(cfg)),
              tls_(ssl::context::tls_client)
        {
            tls_.set_default_verify_paths();
            tls_.set_verify_mode(ssl::verify_peer);
        }

        Result<HttpResponse> send(const HttpRequest &request)
        {
            auto url = Url::parse(request.url);
            if (!url)
                return std::unexpected(url.error());
            if (url->scheme != "http" && url->scheme != "https")
                return std::unexpected(AnchorError::invalid_input("Unsupported URL scheme: " + url->scheme));

            http::request<http::string_body> req{
                request.method == HttpRequest::Method::Post ? http::verb::post : http::verb::get,
                url->target(),
                11};
            req.set(http::field::host, url->host);
            req.set(http::field::user_agent, cfg_.user_agent);
            for (const auto &[name, value] : request.headers)
                req.set(name, value);
            req.body() = request.body;
            req.prepare_payload();

            const auto deadline = Clock::now() + request.timeout;
            net::io_context ioc;

            if (url->scheme == "http")
            {
                beast::tcp_stream stream(ioc);
                stream.expires_at(deadline);
                if (auto res = connect(ioc, stream, *url); !res)
                    return std::unexpected(res.error());
                auto res = exchange(ioc, stream, req, request.max_response_bytes);
                beast::error_code ec;
                stream.socket().shutdown(tcp::socket::shutdown_both, ec);
                return res;
            }

            beast::ssl_stream<beast::tcp_stream> stream(ioc, tls_);
            if (!SSL_set_tlsext_host_name(stream.native_handle(), url->host.c_str()))
            {
                return std::unexpected(AnchorError::unreachable("Failed to set TLS SNI host name"));
            }
            stream.set_verify_callback(ssl::host_name_verification(url->host));

            auto &lowest = beast::get_lowest_layer(stream);
            lowest.expires_at(deadline);
            if (auto res = connect(ioc, lowest, *url); !res)
                return std::unexpected(res.error());

            if (auto ec = run_step(ioc, [&](auto h)
                                   { stream.async_handshake(ssl::stream_base::client, std::move(h)); });
                ec)
                return std::unexpected(transport_error("TLS handshake with " + url->host, ec));

            auto res = exchange(ioc, stream, req, request.max_response_bytes);
            beast::error_code ec;
            lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
            return res;
        }

    private:
        Result<void> connect(net::io_context &ioc, beast::tcp_stream &stream, const Url &url)
        {
            const std::string &host = cfg_.proxy ? cfg_.proxy->host : url.host;
            const std::string port = cfg_.proxy ? std::to_string(cfg_.proxy->port) : url.effective_port();

            tcp::resolver resolver(ioc);
            beast::error_code ec;
            auto endpoints = resolver.resolve(host, port, ec);
            if (ec)
                return std::unexpected(transport_error("Resolving " + host, ec));

            if (auto cec = run_step(ioc, [&](auto h)
                                    { stream.async_connect(endpoints, std::move(h)); });
                cec)
                return std::unexpected(transport_error(std::format("Connecting to {}:{}", host, port), cec));

            if (!cfg_.proxy)
                return {};

            unsigned dest_port = 0;
            auto dest = url.effective_port();
            std::from_chars(dest.data(), dest.data() + dest.size(), dest_port);
            return socks5_handshake(ioc, stream, url.host, static_cast<std::uint16_t>(dest_port));
        }

        HttpClientConfig cfg_;
        ssl::context tls_;
    };

    BeastHttpClient::BeastHttpClient(HttpClientConfig cfg) : impl_(std::make_unique<Impl>(std::move(cfg))) {}
    BeastHttpClient::~BeastHttpClient() = default;

    Result<HttpResponse> BeastHttpClient::send(const HttpRequest &request)
    {
        return impl_->send(request);
    }

} // namespace anchor
