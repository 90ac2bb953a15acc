#include "anchor/crypto.hpp"
#include <sodium.h>
#include <openssl/evp.h>
#include <algorithm>
#include <format>
#include <memory>

namespace anchor::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    namespace
    {
        template <std::size_t N>
        Result<std::array<uint8_t, N>> evp_digest(const EVP_MD *md, const Bytes &data, const char *name)
        {
            if (md == nullptr)
            {
                return std::unexpected(AnchorError::crypto(std::format("{} not available in OpenSSL", name)));
            }

            std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
            if (!ctx)
                return std::unexpected(AnchorError::crypto("EVP_MD_CTX_new failed"));

            std::array<uint8_t, N> out{};
            unsigned int out_len = 0;
            if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
                EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
                EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1 ||
                out_len != N)
            {
                return std::unexpected(AnchorError::crypto(std::format("{} digest failed", name)));
            }
            return out;
        }
    } // namespace

    // ============================================================================
    // SHA256 Implementation
    // ============================================================================

    SHA256Hash SHA256::hash(const Bytes &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(), data.data(), data.size());
        return output;
    }

    SHA256Hash SHA256::hash(const std::string &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(),
                           reinterpret_cast<const uint8_t *>(data.data()),
                           data.size());
        return output;
    }

    Result<SHA256Hash> SHA256::hash(std::istream &in)
    {
        crypto_hash_sha256_state state;
        crypto_hash_sha256_init(&state);

        std::array<char, 65536> chunk;
        while (in)
        {
            in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
            auto got = in.gcount();
            if (got > 0)
            {
                crypto_hash_sha256_update(&state, reinterpret_cast<const uint8_t *>(chunk.data()),
                                          static_cast<unsigned long long>(got));
            }
        }
        if (in.bad())
        {
            return std::unexpected(AnchorError::io("Read error while hashing input"));
        }

        SHA256Hash output;
        crypto_hash_sha256_final(&state, output.data());
        return output;
    }

    // ============================================================================
    // OpenSSL digests
    // ============================================================================

    Result<SHA1Hash> SHA1::hash(const Bytes &data)
    {
        return evp_digest<20>(EVP_sha1(), data, "SHA-1");
    }

    Result<RIPEMD160Hash> RIPEMD160::hash(const Bytes &data)
    {
        return evp_digest<20>(EVP_ripemd160(), data, "RIPEMD-160");
    }

    // ============================================================================
    // Hex Implementation
    // ============================================================================

    std::string Hex::encode(const Bytes &data)
    {
        std::string hex;
        hex.reserve(data.size() * 2);
        for (uint8_t byte : data)
        {
            hex += std::format("{:02x}", byte);
        }
        return hex;
    }

    std::string Hex::encode_reversed(const Bytes &data)
    {
        Bytes reversed(data.rbegin(), data.rend());
        return encode(reversed);
    }

    Result<Bytes> Hex::decode(std::string_view hex)
    {
        if (hex.size() % 2 != 0)
        {
            return std::unexpected(AnchorError::invalid_input("Hex string has odd length"));
        }

        Bytes out(hex.size() / 2);
        std::size_t bin_len = 0;
        if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr, &bin_len, nullptr) != 0 ||
            bin_len != out.size())
        {
            return std::unexpected(AnchorError::invalid_input("Invalid hex character"));
        }
        return out;
    }

    // ============================================================================
    // Base64 Implementation
    // ============================================================================

    std::string Base64::encode(const Bytes &data)
    {
        size_t b64_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
        std::string encoded(b64_len, '\0');

        sodium_bin2base64(
            encoded.data(),
            b64_len,
            data.data(),
            data.size(),
            sodium_base64_VARIANT_ORIGINAL);

        // Remove null terminator
        encoded.resize(b64_len - 1);
        return encoded;
    }

    Result<Bytes> Base64::decode(const std::string &encoded)
    {
        Bytes decoded(encoded.size());
        size_t decoded_len;

        if (sodium_base642bin(
                decoded.data(),
                decoded.size(),
                encoded.c_str(),
                encoded.size(),
                nullptr,
                &decoded_len,
                nullptr,
                sodium_base64_VARIANT_ORIGINAL) != 0)
        {
            return std::unexpected(AnchorError::crypto("Invalid base64 encoding"));
        }

        decoded.resize(decoded_len);
        return decoded;
    }

    // ============================================================================
    // SecureRandom Implementation
    // ============================================================================

    Bytes SecureRandom::generate_bytes(std::size_t n)
    {
        Bytes buffer(n);
        randombytes_buf(buffer.data(), buffer.size());
        return buffer;
    }

} // namespace anchor::crypto
