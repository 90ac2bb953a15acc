#include "anchor/config.hpp"
#include <toml++/toml.h>
#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

namespace anchor
{
    namespace
    {
        std::vector<std::string> split_list(const std::string &value)
        {
            std::vector<std::string> out;
            std::stringstream ss(value);
            std::string item;
            while (std::getline(ss, item, ','))
            {
                if (!item.empty())
                    out.push_back(item);
            }
            return out;
        }

        bool parse_flag(const std::string &value)
        {
            return value != "0" && value != "false" && value != "no";
        }

        Result<std::size_t> parse_count(const char *name, const std::string &value)
        {
            std::size_t out = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
            if (ec != std::errc() || ptr != value.data() + value.size())
                return std::unexpected(AnchorError::config(std::format("{} must be a non-negative integer; got '{}'", name, value)));
            return out;
        }

        Result<double> parse_seconds(const char *name, const std::string &value)
        {
            double out = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
            if (ec != std::errc() || ptr != value.data() + value.size())
                return std::unexpected(AnchorError::config(std::format("{} must be a number; got '{}'", name, value)));
            return out;
        }

        std::vector<std::string> string_array(const toml::node_view<const toml::node> &node)
        {
            std::vector<std::string> out;
            if (auto arr = node.as_array())
            {
                for (const auto &el : *arr)
                {
                    if (auto s = el.value<std::string>())
                        out.push_back(*s);
                }
            }
            return out;
        }

        AnchorConfig parse_toml(const toml::table &tbl, AnchorConfig cfg)
        {
            if (auto cal = tbl["calendars"].as_table())
            {
                const auto &c = *cal;
                if (c.contains("urls"))
                    cfg.calendars.urls = string_array(c["urls"]);
                if (c.contains("whitelist"))
                    cfg.calendars.whitelist = string_array(c["whitelist"]);
                if (auto v = c["no_default_whitelist"].value<bool>())
                    cfg.calendars.no_default_whitelist = *v;
                if (auto v = c["timeout_seconds"].value<double>())
                    cfg.calendars.timeout_seconds = *v;
                if (auto v = c["m"].value<int64_t>())
                    cfg.calendars.m = static_cast<std::size_t>(std::max<int64_t>(*v, 0));
                if (auto v = c["requests_per_second"].value<double>())
                    cfg.calendars.requests_per_second = *v;
                if (auto v = c["burst"].value<double>())
                    cfg.calendars.burst = *v;
            }

            if (auto up = tbl["upgrade"].as_table())
            {
                if (auto v = (*up)["wait"].value<bool>())
                    cfg.upgrade.wait = *v;
                if (auto v = (*up)["wait_interval_seconds"].value<double>())
                    cfg.upgrade.wait_interval_seconds = *v;
            }

            if (auto cache = tbl["cache"].as_table())
            {
                if (auto v = (*cache)["enabled"].value<bool>())
                    cfg.cache.enabled = *v;
                if (auto v = (*cache)["path"].value<std::string>())
                    cfg.cache.path = *v;
            }

            if (auto btc = tbl["bitcoin"].as_table())
            {
                const auto &b = *btc;
                if (auto v = b["network"].value<std::string>())
                    cfg.bitcoin.network = *v;
                if (auto v = b["node_url"].value<std::string>())
                    cfg.bitcoin.node_url = *v;
                if (auto v = b["cookie_file"].value<std::string>())
                    cfg.bitcoin.cookie_file = *v;
                if (auto v = b["query_local_node"].value<bool>())
                    cfg.bitcoin.query_local_node = *v;
                if (auto v = b["query_explorer"].value<int64_t>())
                    cfg.bitcoin.query_explorer = static_cast<std::size_t>(std::max<int64_t>(*v, 0));
                if (auto v = b["explorer_url"].value<std::string>())
                    cfg.bitcoin.explorer_url = *v;
            }

            if (auto net = tbl["network"].as_table())
            {
                if (auto v = (*net)["socks5_proxy"].value<std::string>())
                    cfg.network.socks5_proxy = *v;
                if (auto v = (*net)["user_agent"].value<std::string>())
                    cfg.network.user_agent = *v;
            }

            return cfg;
        }

    } // namespace

    Result<AnchorConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(AnchorError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<AnchorConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        AnchorConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            cfg = parse_toml(tbl, cfg);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(AnchorError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        if (auto res = apply_env_overrides(cfg); !res)
            return std::unexpected(res.error());
        if (auto res = validate(cfg); !res)
            return std::unexpected(res.error());
        return cfg;
    }

    Result<AnchorConfig> ConfigLoader::defaults()
    {
        return from_string("");
    }

    Result<void> ConfigLoader::apply_env_overrides(AnchorConfig &cfg)
    {
        if (const char *v = std::getenv("ANCHOR_CALENDARS"))
            cfg.calendars.urls = split_list(v);
        if (const char *v = std::getenv("ANCHOR_WHITELIST"))
            cfg.calendars.whitelist = split_list(v);
        if (const char *v = std::getenv("ANCHOR_NO_DEFAULT_WHITELIST"))
            cfg.calendars.no_default_whitelist = parse_flag(v);
        if (const char *v = std::getenv("ANCHOR_TIMEOUT"))
        {
            auto secs = parse_seconds("ANCHOR_TIMEOUT", v);
            if (!secs)
                return std::unexpected(secs.error());
            cfg.calendars.timeout_seconds = *secs;
        }
        if (const char *v = std::getenv("ANCHOR_M"))
        {
            auto m = parse_count("ANCHOR_M", v);
            if (!m)
                return std::unexpected(m.error());
            cfg.calendars.m = *m;
        }
        if (const char *v = std::getenv("ANCHOR_WAIT"))
            cfg.upgrade.wait = parse_flag(v);
        if (const char *v = std::getenv("ANCHOR_WAIT_INTERVAL"))
        {
            auto secs = parse_seconds("ANCHOR_WAIT_INTERVAL", v);
            if (!secs)
                return std::unexpected(secs.error());
            cfg.upgrade.wait_interval_seconds = *secs;
        }
        if (const char *v = std::getenv("ANCHOR_CACHE_ENABLED"))
            cfg.cache.enabled = parse_flag(v);
        if (const char *v = std::getenv("ANCHOR_CACHE_PATH"))
            cfg.cache.path = v;
        if (const char *v = std::getenv("ANCHOR_BTC_NETWORK"))
            cfg.bitcoin.network = v;
        if (const char *v = std::getenv("ANCHOR_BITCOIN_NODE"))
            cfg.bitcoin.node_url = v;
        if (const char *v = std::getenv("ANCHOR_BITCOIN_COOKIE"))
            cfg.bitcoin.cookie_file = v;
        if (const char *v = std::getenv("ANCHOR_QUERY_LOCAL_NODE"))
            cfg.bitcoin.query_local_node = parse_flag(v);
        if (const char *v = std::getenv("ANCHOR_QUERY_EXPLORER"))
        {
            auto n = parse_count("ANCHOR_QUERY_EXPLORER", v);
            if (!n)
                return std::unexpected(n.error());
            cfg.bitcoin.query_explorer = *n;
        }
        if (const char *v = std::getenv("ANCHOR_EXPLORER_URL"))
            cfg.bitcoin.explorer_url = v;
        if (const char *v = std::getenv("ANCHOR_SOCKS5_PROXY"))
            cfg.network.socks5_proxy = v;
        if (const char *v = std::getenv("ANCHOR_USER_AGENT"))
            cfg.network.user_agent = v;
        return {};
    }

    Result<void> ConfigLoader::validate(const AnchorConfig &cfg)
    {
        if (cfg.calendars.m < 1)
            return std::unexpected(AnchorError::config("calendars.m must be at least 1"));
        if (!(cfg.calendars.timeout_seconds > 0 && cfg.calendars.timeout_seconds <= kMaxSeconds))
        {
            return std::unexpected(AnchorError::config(std::format(
                "calendars.timeout_seconds must be positive and at most {}; got {}", kMaxSeconds, cfg.calendars.timeout_seconds)));
        }
        if (!(cfg.upgrade.wait_interval_seconds > 0 && cfg.upgrade.wait_interval_seconds <= kMaxSeconds))
        {
            return std::unexpected(AnchorError::config(std::format(
                "upgrade.wait_interval_seconds must be positive and at most {}; got {}", kMaxSeconds, cfg.upgrade.wait_interval_seconds)));
        }
        // A bucket capped below one token never refills enough to allow a request
        if (cfg.calendars.requests_per_second > 0 && cfg.calendars.burst < 1.0)
        {
            return std::unexpected(AnchorError::config(std::format(
                "calendars.burst must be at least 1 when rate limiting is on; got {}", cfg.calendars.burst)));
        }
        if (cfg.bitcoin.network != "mainnet" && cfg.bitcoin.network != "testnet" && cfg.bitcoin.network != "regtest")
        {
            return std::unexpected(AnchorError::config(
                "bitcoin.network must be mainnet, testnet or regtest; got '" + cfg.bitcoin.network + "'"));
        }
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const AnchorConfig &cfg)
    {
        nlohmann::json j;
        j["calendars"] = {
            {"urls", cfg.calendars.urls},
            {"whitelist", cfg.calendars.whitelist},
            {"no_default_whitelist", cfg.calendars.no_default_whitelist},
            {"timeout_seconds", cfg.calendars.timeout_seconds},
            {"m", cfg.calendars.m},
            {"requests_per_second", cfg.calendars.requests_per_second},
            {"burst", cfg.calendars.burst}};
        j["upgrade"] = {
            {"wait", cfg.upgrade.wait},
            {"wait_interval_seconds", cfg.upgrade.wait_interval_seconds}};
        j["cache"] = {{"enabled", cfg.cache.enabled}, {"path", cfg.cache.path}};
        j["bitcoin"] = {
            {"network", cfg.bitcoin.network},
            {"node_url", cfg.bitcoin.node_url},
            {"cookie_file", cfg.bitcoin.cookie_file},
            {"query_local_node", cfg.bitcoin.query_local_node},
            {"query_explorer", cfg.bitcoin.query_explorer},
            {"explorer_url", cfg.bitcoin.explorer_url}};
        j["network"] = {
            {"socks5_proxy", cfg.network.socks5_proxy},
            {"user_agent", cfg.network.user_agent}};
        return j;
    }

} // namespace anchor
