#include "anchor/calendar_whitelist.hpp"
#include "anchor/http_client.hpp"
#include <spdlog/spdlog.h>

namespace anchor
{

    bool glob_match(const std::string &pattern, const std::string &text)
    {
        std::size_t p = 0, t = 0;
        std::size_t star = std::string::npos, mark = 0;
        while (t < text.size())
        {
            if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t]))
            {
                ++p;
                ++t;
            }
            else if (p < pattern.size() && pattern[p] == '*')
            {
                star = p++;
                mark = t;
            }
            else if (star != std::string::npos)
            {
                p = star + 1;
                t = ++mark;
            }
            else
            {
                return false;
            }
        }
        while (p < pattern.size() && pattern[p] == '*')
            ++p;
        return p == pattern.size();
    }

    Result<void> CalendarWhitelist::add(const std::string &url)
    {
        if (url.find("://") == std::string::npos)
        {
            if (auto res = add("http://" + url); !res)
                return res;
            return add("https://" + url);
        }

        auto parsed = Url::parse(url);
        if (!parsed)
            return std::unexpected(parsed.error());
        if (!parsed->query.empty() || !parsed->fragment.empty())
        {
            return std::unexpected(AnchorError::invalid_input(
                "Calendar whitelist entries can't have a query or fragment: " + url));
        }

        parsed_.push_back(Pattern{parsed->scheme, parsed->netloc(), parsed->path});
        patterns_.push_back(url);
        spdlog::trace("Whitelisted calendar pattern {}", url);
        return {};
    }

    bool CalendarWhitelist::contains(const std::string &url) const
    {
        auto parsed = Url::parse(url);
        if (!parsed)
            return false;
        if (!parsed->query.empty() || !parsed->fragment.empty())
            return false;

        const auto netloc = parsed->netloc();
        for (const auto &pattern : parsed_)
        {
            if (pattern.scheme == parsed->scheme &&
                pattern.path == parsed->path &&
                glob_match(pattern.netloc, netloc))
                return true;
        }
        return false;
    }

    CalendarWhitelist CalendarWhitelist::defaults()
    {
        CalendarWhitelist wl;
        for (const char *url : {"https://*.calendar.opentimestamps.org",
                                "https://*.calendar.eternitywall.com",
                                "https://*.calendar.catallaxy.com",
                                "https://ots.btc.catallaxy.com"})
        {
            // Built-in patterns are well formed
            if (auto res = wl.add(url); !res)
                spdlog::error("Bad built-in whitelist pattern {}: {}", url, res.error().what());
        }
        return wl;
    }

} // namespace anchor
