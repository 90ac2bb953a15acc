#include "anchor/chain_verifier.hpp"
#include "anchor/crypto.hpp"
#include "anchor/timestamp_cache.hpp"
#include <spdlog/spdlog.h>
#include <format>
#include <fstream>
#include <sstream>

namespace anchor
{

    namespace
    {
        constexpr std::size_t kMaxRpcResponse = 1024 * 1024;

        uint16_t default_rpc_port(BitcoinNetwork network)
        {
            switch (network)
            {
            case BitcoinNetwork::Mainnet:
                return 8332;
            case BitcoinNetwork::Testnet:
                return 18332;
            case BitcoinNetwork::Regtest:
                return 18443;
            }
            return 8332;
        }

        std::string default_cookie_file(BitcoinNetwork network)
        {
            switch (network)
            {
            case BitcoinNetwork::Mainnet:
                return expand_home("~/.bitcoin/.cookie");
            case BitcoinNetwork::Testnet:
                return expand_home("~/.bitcoin/testnet3/.cookie");
            case BitcoinNetwork::Regtest:
                return expand_home("~/.bitcoin/regtest/.cookie");
            }
            return expand_home("~/.bitcoin/.cookie");
        }

        std::string trim(std::string s)
        {
            while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' '))
                s.pop_back();
            return s;
        }
    } // namespace

    Result<BitcoinNetwork> parse_bitcoin_network(const std::string &name)
    {
        if (name == "mainnet")
            return BitcoinNetwork::Mainnet;
        if (name == "testnet")
            return BitcoinNetwork::Testnet;
        if (name == "regtest")
            return BitcoinNetwork::Regtest;
        return std::unexpected(AnchorError::invalid_input(
            std::format("Unknown Bitcoin network '{}' (choose from mainnet, testnet, regtest)", name)));
    }

    std::string bitcoin_network_to_string(BitcoinNetwork network)
    {
        switch (network)
        {
        case BitcoinNetwork::Mainnet:
            return "mainnet";
        case BitcoinNetwork::Testnet:
            return "testnet";
        case BitcoinNetwork::Regtest:
            return "regtest";
        }
        return "mainnet";
    }

    // ========== BitcoinRpcVerifier ==========

    BitcoinRpcVerifier::BitcoinRpcVerifier(BitcoinNodeConfig cfg, std::shared_ptr<HttpClient> http)
        : cfg_(std::move(cfg)), http_(std::move(http))
    {
        url_ = cfg_.url.empty()
                   ? std::format("http://127.0.0.1:{}", default_rpc_port(cfg_.network))
                   : cfg_.url;
    }

    Result<std::string> BitcoinRpcVerifier::authorization() const
    {
        auto url = Url::parse(url_);
        if (!url)
            return std::unexpected(url.error());

        std::string credentials = url->userinfo;
        if (credentials.empty())
        {
            auto path = cfg_.cookie_file.empty() ? default_cookie_file(cfg_.network) : expand_home(cfg_.cookie_file);
            std::ifstream file(path);
            if (!file.is_open())
            {
                return std::unexpected(AnchorError::unreachable(
                    "No RPC credentials: node URL has none and cookie file " + path + " can't be read"));
            }
            std::stringstream buffer;
            buffer << file.rdbuf();
            credentials = trim(buffer.str());
        }
        return "Basic " + crypto::Base64::encode(Bytes(credentials.begin(), credentials.end()));
    }

    Result<nlohmann::json> BitcoinRpcVerifier::call(const std::string &method, nlohmann::json params)
    {
        auto auth = authorization();
        if (!auth)
            return std::unexpected(auth.error());

        nlohmann::json body{
            {"version", "1.1"},
            {"id", ++next_id_},
            {"method", method},
            {"params", std::move(params)}};

        HttpRequest req;
        req.method = HttpRequest::Method::Post;
        req.url = url_;
        req.body = body.dump();
        req.headers.emplace_back("Authorization", *auth);
        req.headers.emplace_back("Content-Type", "application/json");
        req.max_response_bytes = kMaxRpcResponse;

        auto resp = http_->send(req);
        if (!resp)
        {
            return std::unexpected(AnchorError::unreachable(
                "Could not connect to local Bitcoin node: " + std::string(resp.error().what())));
        }
        if (resp->status == 401 || resp->status == 403)
        {
            return std::unexpected(AnchorError::unreachable(
                std::format("Bitcoin node rejected the RPC credentials (HTTP {})", resp->status)));
        }

        nlohmann::json reply;
        try
        {
            reply = nlohmann::json::parse(resp->body);
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(AnchorError::unreachable(
                std::format("Bitcoin node sent invalid JSON for {} (HTTP {}): {}", method, resp->status, e.what())));
        }

        if (reply.contains("error") && !reply["error"].is_null())
        {
            const auto &err = reply["error"];
            std::string message = err.value("message", err.dump());
            return std::unexpected(AnchorError::verification(
                std::format("RPC {} failed: {} (code {})", method, message, err.value("code", 0))));
        }
        if (!reply.contains("result"))
            return std::unexpected(AnchorError::unreachable("RPC reply without a result for " + method));
        return reply["result"];
    }

    Result<int64_t> BitcoinRpcVerifier::verify(Chain chain, const Bytes &msg, uint64_t height)
    {
        if (!supports(chain))
        {
            return std::unexpected(AnchorError::verification(
                "Verification of " + chain_to_string(chain) + " attestations is not supported"));
        }
        if (msg.size() != 32)
        {
            return std::unexpected(AnchorError::verification(
                std::format("Expected digest with length 32 bytes; got {} bytes", msg.size())));
        }

        auto count = call("getblockcount", nlohmann::json::array());
        if (!count)
            return std::unexpected(count.error());

        auto hash = call("getblockhash", nlohmann::json::array({height}));
        if (!hash)
        {
            if (hash.error().code == ErrorCode::ChainVerificationFailed)
            {
                return std::unexpected(AnchorError::verification(std::format(
                    "Bitcoin block height {} not found; {} is highest known block", height, count->dump())));
            }
            return std::unexpected(hash.error());
        }
        spdlog::debug("Attestation block hash: {}", hash->dump());

        auto header = call("getblockheader", nlohmann::json::array({*hash, true}));
        if (!header)
            return std::unexpected(header.error());

        try
        {
            auto merkle_root = header->at("merkleroot").get<std::string>();
            if (merkle_root != crypto::Hex::encode_reversed(msg))
                return std::unexpected(AnchorError::verification("Digest does not match merkleroot"));
            return header->at("time").get<int64_t>();
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(AnchorError::verification(
                std::string("Malformed block header from node: ") + e.what()));
        }
    }

    // ========== EsploraExplorer ==========

    EsploraExplorer::EsploraExplorer(std::string base_url, std::shared_ptr<HttpClient> http)
        : base_url_(std::move(base_url)), http_(std::move(http))
    {
        while (!base_url_.empty() && base_url_.back() == '/')
            base_url_.pop_back();
    }

    Result<std::string> EsploraExplorer::get(const std::string &path)
    {
        HttpRequest req;
        req.url = base_url_ + path;
        auto resp = http_->send(req);
        if (!resp)
            return std::unexpected(resp.error());
        if (resp->status != 200)
        {
            return std::unexpected(AnchorError::unreachable(
                std::format("Couldn't query {}: HTTP {} {}", req.url, resp->status, trim(resp->body))));
        }
        return std::move(resp->body);
    }

    Result<std::string> EsploraExplorer::block_hash_at(uint64_t height)
    {
        auto body = get(std::format("/block-height/{}", height));
        if (!body)
            return std::unexpected(body.error());
        return trim(std::move(*body));
    }

    Result<BlockInfo> EsploraExplorer::block_info(const std::string &hash)
    {
        auto body = get("/block/" + hash);
        if (!body)
            return std::unexpected(body.error());

        try
        {
            auto j = nlohmann::json::parse(*body);
            BlockInfo info;
            info.hash = hash;
            info.merkle_root = j.value("merkle_root", "");
            if (j.contains("timestamp") && j["timestamp"].is_number_integer() && j["timestamp"].get<int64_t>() != 0)
            {
                info.time = j["timestamp"].get<int64_t>();
                info.time_field = "timestamp";
            }
            else if (j.contains("mediantime") && j["mediantime"].is_number_integer())
            {
                info.time = j["mediantime"].get<int64_t>();
                info.time_field = "mediantime";
            }
            else
            {
                return std::unexpected(AnchorError::malformed(
                    "Block explorer returned no usable time for block " + hash));
            }
            return info;
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(AnchorError::malformed(
                std::format("Can't interpret block explorer response for {} as JSON: {}", hash, e.what())));
        }
    }

} // namespace anchor
