#pragma once

#include "types.hpp"
#include "serialize.hpp"
#include <compare>
#include <string>
#include <variant>

namespace anchor
{

    /** Wire tags of the supported operations */
    enum class OpTag : uint8_t
    {
        Sha1 = 0x02,
        Ripemd160 = 0x03,
        Sha256 = 0x08,
        Keccak256 = 0x67,
        Append = 0xf0,
        Prepend = 0xf1,
        Hexlify = 0xf3
    };

    /** Operation results and inputs are bounded to this many bytes */
    inline constexpr std::size_t kMaxOpLength = 4096;

    struct OpAppend
    {
        Bytes suffix;
    };

    struct OpPrepend
    {
        Bytes prefix;
    };

    struct OpSha256
    {
    };

    struct OpSha1
    {
    };

    struct OpRipemd160
    {
    };

    struct OpHexlify
    {
    };

    /**
     * A deterministic transform of one message into another. Operations label
     * the edges of a proof DAG and are ordered (tag first, then argument) so
     * they can key an ordered map.
     */
    class Op
    {
    public:
        using Variant = std::variant<OpAppend, OpPrepend, OpSha256, OpSha1, OpRipemd160, OpHexlify>;

        Op(Variant v) : v_(std::move(v)) {}

        static Op append(Bytes suffix) { return Op(OpAppend{std::move(suffix)}); }
        static Op prepend(Bytes prefix) { return Op(OpPrepend{std::move(prefix)}); }
        static Op sha256() { return Op(OpSha256{}); }
        static Op sha1() { return Op(OpSha1{}); }
        static Op ripemd160() { return Op(OpRipemd160{}); }
        static Op hexlify() { return Op(OpHexlify{}); }

        OpTag tag() const;

        /** Argument of a binary op, nullptr for unary ops */
        const Bytes *argument() const;

        /** True for the hash operations usable as a file hash */
        bool is_crypto() const;

        /** Digest length of a crypto op, 0 otherwise */
        std::size_t digest_length() const;

        /** Apply to a message; fails if input or output exceeds kMaxOpLength */
        Result<Bytes> apply(const Bytes &msg) const;

        /** Serialized size proxy used to prefer shorter proofs */
        std::size_t cost() const;

        /** e.g. "sha256", "append 0a1b" */
        std::string to_string() const;

        void serialize(ByteWriter &w) const;

        /** Parse the remainder of an op whose tag byte has already been read */
        static Result<Op> deserialize_from_tag(ByteReader &r, uint8_t tag);

        const Variant &variant() const { return v_; }

        bool operator==(const Op &other) const;
        std::strong_ordering operator<=>(const Op &other) const;

    private:
        Variant v_;
    };

} // namespace anchor
