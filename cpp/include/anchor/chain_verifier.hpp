#pragma once

#include "attestation.hpp"
#include "http_client.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace anchor
{

    /**
     * Checks a chain attestation against the authoritative block header.
     */
    class ChainVerifier
    {
    public:
        virtual ~ChainVerifier() = default;

        virtual bool supports(Chain chain) const = 0;

        /**
         * Confirm that `msg` is the merkle root of block `height` and return the
         * block time (seconds since the epoch). Fails with
         * ChainVerificationFailed on a mismatch or unknown height, and with
         * CalendarUnreachable when the source can't be reached.
         */
        virtual Result<int64_t> verify(Chain chain, const Bytes &msg, uint64_t height) = 0;
    };

    enum class BitcoinNetwork
    {
        Mainnet,
        Testnet,
        Regtest
    };

    Result<BitcoinNetwork> parse_bitcoin_network(const std::string &name);
    std::string bitcoin_network_to_string(BitcoinNetwork network);

    struct BitcoinNodeConfig
    {
        BitcoinNetwork network{BitcoinNetwork::Mainnet};
        /** http://[user:pass@]host:port; empty means localhost on the network's port */
        std::string url;
        /** Cookie file; empty means the bitcoind default for the network */
        std::string cookie_file;
    };

    /**
     * Verifier backed by a local Bitcoin Core node over JSON-RPC.
     * Credentials come from the URL user-info, else from the cookie file.
     */
    class BitcoinRpcVerifier : public ChainVerifier
    {
    public:
        BitcoinRpcVerifier(BitcoinNodeConfig cfg, std::shared_ptr<HttpClient> http);

        bool supports(Chain chain) const override { return chain == Chain::Bitcoin; }

        Result<int64_t> verify(Chain chain, const Bytes &msg, uint64_t height) override;

        /** One JSON-RPC call; returns the `result` member */
        Result<nlohmann::json> call(const std::string &method, nlohmann::json params);

        const std::string &url() const { return url_; }

    private:
        Result<std::string> authorization() const;

        BitcoinNodeConfig cfg_;
        std::string url_;
        std::shared_ptr<HttpClient> http_;
        uint64_t next_id_{0};
    };

    struct BlockInfo
    {
        std::string hash;
        std::string merkle_root; // display (byte-reversed) hex
        int64_t time{0};
        std::string time_field; // "timestamp" or "mediantime"
    };

    /**
     * Third-party view of the chain: height -> hash -> block details.
     */
    class BlockExplorer
    {
    public:
        virtual ~BlockExplorer() = default;

        virtual const std::string &name() const = 0;
        virtual Result<std::string> block_hash_at(uint64_t height) = 0;
        virtual Result<BlockInfo> block_info(const std::string &hash) = 0;
    };

    /** Esplora REST API (blockstream.info and compatible servers) */
    class EsploraExplorer : public BlockExplorer
    {
    public:
        static constexpr const char *kDefaultUrl = "https://blockstream.info/api";

        EsploraExplorer(std::string base_url, std::shared_ptr<HttpClient> http);

        const std::string &name() const override { return base_url_; }
        Result<std::string> block_hash_at(uint64_t height) override;
        Result<BlockInfo> block_info(const std::string &hash) override;

    private:
        Result<std::string> get(const std::string &path);

        std::string base_url_;
        std::shared_ptr<HttpClient> http_;
    };

} // namespace anchor
