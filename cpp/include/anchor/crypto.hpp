#pragma once

#include "types.hpp"
#include <array>
#include <istream>
#include <string>
#include <string_view>

namespace anchor::crypto
{

    using SHA256Hash = std::array<uint8_t, 32>;
    using SHA1Hash = std::array<uint8_t, 20>;
    using RIPEMD160Hash = std::array<uint8_t, 20>;

    /**
     * SHA-256 hashing (libsodium)
     */
    class SHA256
    {
    public:
        static SHA256Hash hash(const Bytes &data);

        static SHA256Hash hash(const std::string &data);

        /**
         * Hash everything readable from a stream (file contents, stdin)
         */
        static Result<SHA256Hash> hash(std::istream &in);
    };

    /**
     * SHA-1 (OpenSSL EVP). Only used to evaluate legacy proof operations.
     */
    class SHA1
    {
    public:
        static Result<SHA1Hash> hash(const Bytes &data);
    };

    /**
     * RIPEMD-160 (OpenSSL EVP)
     */
    class RIPEMD160
    {
    public:
        static Result<RIPEMD160Hash> hash(const Bytes &data);
    };

    /**
     * Lower-case hex codec
     */
    class Hex
    {
    public:
        static std::string encode(const Bytes &data);

        /**
         * Hex of the byte-reversed input, the way Bitcoin displays hashes
         */
        static std::string encode_reversed(const Bytes &data);

        static Result<Bytes> decode(std::string_view hex);
    };

    /**
     * Base64 encoding/decoding (libsodium, standard alphabet)
     */
    class Base64
    {
    public:
        static std::string encode(const Bytes &data);

        static Result<Bytes> decode(const std::string &encoded);
    };

    /**
     * Cryptographically secure random number generation
     */
    class SecureRandom
    {
    public:
        static Bytes generate_bytes(std::size_t n);
    };

} // namespace anchor::crypto
