#include "anchor/op.hpp"
#include "anchor/crypto.hpp"
#include <algorithm>
#include <format>

namespace anchor
{

    namespace
    {
        template <class... Ts>
        struct overloaded : Ts...
        {
            using Ts::operator()...;
        };

        template <std::size_t N>
        Bytes to_bytes(const std::array<uint8_t, N> &a)
        {
            return Bytes(a.begin(), a.end());
        }
    } // namespace

    OpTag Op::tag() const
    {
        return std::visit(overloaded{
                              [](const OpAppend &) { return OpTag::Append; },
                              [](const OpPrepend &) { return OpTag::Prepend; },
                              [](const OpSha256 &) { return OpTag::Sha256; },
                              [](const OpSha1 &) { return OpTag::Sha1; },
                              [](const OpRipemd160 &) { return OpTag::Ripemd160; },
                              [](const OpHexlify &) { return OpTag::Hexlify; }},
                          v_);
    }

    const Bytes *Op::argument() const
    {
        if (auto *a = std::get_if<OpAppend>(&v_))
            return &a->suffix;
        if (auto *p = std::get_if<OpPrepend>(&v_))
            return &p->prefix;
        return nullptr;
    }

    bool Op::is_crypto() const
    {
        return digest_length() != 0;
    }

    std::size_t Op::digest_length() const
    {
        switch (tag())
        {
        case OpTag::Sha256:
            return 32;
        case OpTag::Sha1:
        case OpTag::Ripemd160:
            return 20;
        default:
            return 0;
        }
    }

    Result<Bytes> Op::apply(const Bytes &msg) const
    {
        if (msg.size() > kMaxOpLength)
        {
            return std::unexpected(AnchorError::invalid_input(
                std::format("Message too long for {}: {} > {}", to_string(), msg.size(), kMaxOpLength)));
        }

        Result<Bytes> result = std::visit(
            overloaded{
                [&](const OpAppend &op) -> Result<Bytes>
                {
                    Bytes out = msg;
                    out.insert(out.end(), op.suffix.begin(), op.suffix.end());
                    return out;
                },
                [&](const OpPrepend &op) -> Result<Bytes>
                {
                    Bytes out = op.prefix;
                    out.insert(out.end(), msg.begin(), msg.end());
                    return out;
                },
                [&](const OpSha256 &) -> Result<Bytes>
                { return to_bytes(crypto::SHA256::hash(msg)); },
                [&](const OpSha1 &) -> Result<Bytes>
                {
                    auto h = crypto::SHA1::hash(msg);
                    if (!h)
                        return std::unexpected(h.error());
                    return to_bytes(*h);
                },
                [&](const OpRipemd160 &) -> Result<Bytes>
                {
                    auto h = crypto::RIPEMD160::hash(msg);
                    if (!h)
                        return std::unexpected(h.error());
                    return to_bytes(*h);
                },
                [&](const OpHexlify &) -> Result<Bytes>
                {
                    if (msg.empty())
                        return std::unexpected(AnchorError::invalid_input("Can't hexlify an empty message"));
                    auto hex = crypto::Hex::encode(msg);
                    return Bytes(hex.begin(), hex.end());
                }},
            v_);

        if (result && result->size() > kMaxOpLength)
        {
            return std::unexpected(AnchorError::invalid_input(
                std::format("Result of {} too long: {} > {}", to_string(), result->size(), kMaxOpLength)));
        }
        return result;
    }

    std::size_t Op::cost() const
    {
        auto *arg = argument();
        return 1 + (arg ? arg->size() : 0);
    }

    std::string Op::to_string() const
    {
        return std::visit(overloaded{
                              [](const OpAppend &op) { return "append " + crypto::Hex::encode(op.suffix); },
                              [](const OpPrepend &op) { return "prepend " + crypto::Hex::encode(op.prefix); },
                              [](const OpSha256 &) { return std::string("sha256"); },
                              [](const OpSha1 &) { return std::string("sha1"); },
                              [](const OpRipemd160 &) { return std::string("ripemd160"); },
                              [](const OpHexlify &) { return std::string("hexlify"); }},
                          v_);
    }

    void Op::serialize(ByteWriter &w) const
    {
        w.write_byte(static_cast<uint8_t>(tag()));
        if (auto *arg = argument())
            w.write_varbytes(*arg);
    }

    Result<Op> Op::deserialize_from_tag(ByteReader &r, uint8_t tag)
    {
        switch (static_cast<OpTag>(tag))
        {
        case OpTag::Append:
        case OpTag::Prepend:
        {
            auto arg = r.read_varbytes(kMaxOpLength, 1);
            if (!arg)
                return std::unexpected(arg.error());
            if (static_cast<OpTag>(tag) == OpTag::Append)
                return Op::append(std::move(*arg));
            return Op::prepend(std::move(*arg));
        }
        case OpTag::Sha256:
            return Op::sha256();
        case OpTag::Sha1:
            return Op::sha1();
        case OpTag::Ripemd160:
            return Op::ripemd160();
        case OpTag::Hexlify:
            return Op::hexlify();
        case OpTag::Keccak256:
            return std::unexpected(AnchorError::malformed("Unsupported operation: keccak256"));
        }
        return std::unexpected(AnchorError::malformed(std::format("Unknown operation tag 0x{:02x}", tag)));
    }

    bool Op::operator==(const Op &other) const
    {
        return (*this <=> other) == std::strong_ordering::equal;
    }

    std::strong_ordering Op::operator<=>(const Op &other) const
    {
        if (auto c = static_cast<uint8_t>(tag()) <=> static_cast<uint8_t>(other.tag()); c != 0)
            return c;

        auto *a = argument();
        auto *b = other.argument();
        if (!a || !b)
            return std::strong_ordering::equal;
        return std::lexicographical_compare_three_way(a->begin(), a->end(), b->begin(), b->end());
    }

} // namespace anchor
