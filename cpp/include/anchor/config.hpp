#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace anchor
{

    struct CalendarConfig
    {
        /** Calendars for stamping; empty means the built-in pool list */
        std::vector<std::string> urls;
        std::vector<std::string> whitelist;
        bool no_default_whitelist{false};
        double timeout_seconds{5.0};
        std::size_t m{2};
        double requests_per_second{2.0};
        double burst{10.0};
    };

    struct UpgradeConfig
    {
        bool wait{false};
        double wait_interval_seconds{30.0};
    };

    struct CacheConfig
    {
        bool enabled{true};
        std::string path{"~/.cache/anchor"};
    };

    struct BitcoinConfig
    {
        std::string network{"mainnet"};
        std::string node_url;
        std::string cookie_file;
        bool query_local_node{true};
        std::size_t query_explorer{0};
        std::string explorer_url{"https://blockstream.info/api"};
    };

    struct NetworkConfig
    {
        /** host[:port]; empty disables the proxy */
        std::string socks5_proxy;
        std::string user_agent{"anchor/0.1.0"};
    };

    struct AnchorConfig
    {
        CalendarConfig calendars{};
        UpgradeConfig upgrade{};
        CacheConfig cache{};
        BitcoinConfig bitcoin{};
        NetworkConfig network{};
    };

    /**
     * ConfigLoader reads TOML configs; ANCHOR_* environment variables take
     * precedence over the file.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<AnchorConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<AnchorConfig> from_string(const std::string &toml_content);

        /** Defaults plus environment overrides, for running without a file */
        static Result<AnchorConfig> defaults();

        /** Effective config as JSON (config-print). */
        static nlohmann::json to_json(const AnchorConfig &cfg);

        /**
         * Range checks shared by file, environment and command-line values.
         * Durations must lie in (0, kMaxSeconds].
         */
        static Result<void> validate(const AnchorConfig &cfg);

        static constexpr double kMaxSeconds = 1e6;

    private:
        static Result<void> apply_env_overrides(AnchorConfig &cfg);
    };

} // namespace anchor
