#include "anchor/attestation.hpp"
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

        const Bytes kPendingTag{0x83, 0xdf, 0xe3, 0x0d, 0x2e, 0xf9, 0x0c, 0x8e};
        const Bytes kBitcoinTag{0x05, 0x88, 0x96, 0x0d, 0x73, 0xd7, 0x19, 0x01};
        const Bytes kLitecoinTag{0x06, 0x86, 0x9a, 0x0d, 0x73, 0xd7, 0x1b, 0x45};

        const Bytes &chain_tag(Chain chain)
        {
            return chain == Chain::Bitcoin ? kBitcoinTag : kLitecoinTag;
        }

        Bytes payload_of(const Attestation::Variant &v)
        {
            ByteWriter w;
            std::visit(overloaded{
                           [&](const PendingAttestation &a)
                           { w.write_varbytes(Bytes(a.uri.begin(), a.uri.end())); },
                           [&](const ChainBlockHeaderAttestation &a)
                           { w.write_varuint(a.height); },
                           [&](const UnknownAttestation &a)
                           { w.write_bytes(a.payload); }},
                       v);
            return w.take();
        }
    } // namespace

    std::string chain_to_string(Chain chain)
    {
        switch (chain)
        {
        case Chain::Bitcoin:
            return "Bitcoin";
        case Chain::Litecoin:
            return "Litecoin";
        }
        return "Unknown";
    }

    bool is_valid_pending_uri(const std::string &uri)
    {
        if (uri.size() > kMaxPendingUriLength)
            return false;
        return std::all_of(uri.begin(), uri.end(), [](char c)
                           { return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                                    c == '-' || c == '.' || c == '_' || c == '/' || c == ':'; });
    }

    AttestationKind Attestation::kind() const
    {
        return std::visit(overloaded{
                              [](const PendingAttestation &) { return AttestationKind::Pending; },
                              [](const ChainBlockHeaderAttestation &a)
                              { return a.chain == Chain::Bitcoin ? AttestationKind::Bitcoin : AttestationKind::Litecoin; },
                              [](const UnknownAttestation &) { return AttestationKind::Unknown; }},
                          v_);
    }

    Bytes Attestation::tag() const
    {
        return std::visit(overloaded{
                              [](const PendingAttestation &) { return kPendingTag; },
                              [](const ChainBlockHeaderAttestation &a) { return chain_tag(a.chain); },
                              [](const UnknownAttestation &a) { return a.tag; }},
                          v_);
    }

    std::optional<uint64_t> Attestation::height() const
    {
        if (auto *c = as_chain())
            return c->height;
        return std::nullopt;
    }

    std::string Attestation::to_string() const
    {
        return std::visit(overloaded{
                              [](const PendingAttestation &a)
                              { return std::format("PendingAttestation('{}')", a.uri); },
                              [](const ChainBlockHeaderAttestation &a)
                              { return std::format("{}BlockHeaderAttestation({})", chain_to_string(a.chain), a.height); },
                              [](const UnknownAttestation &a)
                              { return std::format("UnknownAttestation({}, {})", crypto::Hex::encode(a.tag),
                                                   crypto::Hex::encode(a.payload)); }},
                          v_);
    }

    void Attestation::serialize(ByteWriter &w) const
    {
        w.write_bytes(tag());
        w.write_varbytes(payload_of(v_));
    }

    Result<Attestation> Attestation::deserialize(ByteReader &r)
    {
        auto tag = r.read_bytes(kAttestationTagSize);
        if (!tag)
            return std::unexpected(tag.error());
        auto payload = r.read_varbytes(kMaxAttestationPayload);
        if (!payload)
            return std::unexpected(payload.error());

        ByteReader pr(*payload);
        if (*tag == kPendingTag)
        {
            auto raw = pr.read_varbytes(kMaxPendingUriLength);
            if (!raw)
                return std::unexpected(raw.error());
            std::string uri(raw->begin(), raw->end());
            if (!is_valid_pending_uri(uri))
                return std::unexpected(AnchorError::malformed("Invalid URI in pending attestation"));
            if (auto eof = pr.assert_eof(); !eof)
                return std::unexpected(eof.error());
            return Attestation::pending(std::move(uri));
        }
        if (*tag == kBitcoinTag || *tag == kLitecoinTag)
        {
            auto height = pr.read_varuint();
            if (!height)
                return std::unexpected(height.error());
            if (auto eof = pr.assert_eof(); !eof)
                return std::unexpected(eof.error());
            return *tag == kBitcoinTag ? Attestation::bitcoin(*height) : Attestation::litecoin(*height);
        }
        return Attestation(UnknownAttestation{std::move(*tag), std::move(*payload)});
    }

    bool Attestation::operator==(const Attestation &other) const
    {
        return (*this <=> other) == std::strong_ordering::equal;
    }

    std::strong_ordering Attestation::operator<=>(const Attestation &other) const
    {
        auto ta = tag();
        auto tb = other.tag();
        if (auto c = std::lexicographical_compare_three_way(ta.begin(), ta.end(), tb.begin(), tb.end()); c != 0)
            return c;
        if (v_.index() != other.v_.index())
            return v_.index() <=> other.v_.index();

        if (auto *a = as_pending())
            return a->uri <=> other.as_pending()->uri;
        if (auto *a = as_chain())
            return a->height <=> other.as_chain()->height;

        const auto &pa = std::get<UnknownAttestation>(v_).payload;
        const auto &pb = std::get<UnknownAttestation>(other.v_).payload;
        return std::lexicographical_compare_three_way(pa.begin(), pa.end(), pb.begin(), pb.end());
    }

} // namespace anchor
