#pragma once

#include "types.hpp"
#include "serialize.hpp"
#include <compare>
#include <optional>
#include <string>
#include <variant>

namespace anchor
{

    enum class Chain
    {
        Bitcoin,
        Litecoin
    };

    std::string chain_to_string(Chain chain);

    /** Attestation kinds, used by prune/verify selectors */
    enum class AttestationKind
    {
        Pending,
        Bitcoin,
        Litecoin,
        Unknown
    };

    inline constexpr std::size_t kAttestationTagSize = 8;
    inline constexpr std::size_t kMaxAttestationPayload = 8192;
    inline constexpr std::size_t kMaxPendingUriLength = 1000;

    /** Provisional attestation: the calendar at `uri` will later upgrade it */
    struct PendingAttestation
    {
        std::string uri;
    };

    /** Terminal attestation: msg is the merkle root of block `height` */
    struct ChainBlockHeaderAttestation
    {
        Chain chain;
        uint64_t height;
    };

    /** Attestation with an unrecognised tag, preserved verbatim */
    struct UnknownAttestation
    {
        Bytes tag;
        Bytes payload;
    };

    /**
     * A claim that a node's msg is anchored somewhere. Attestations are totally
     * ordered by wire tag, then by URI, height or payload; for two attestations
     * of the same chain the lower (earlier) block height orders first and is
     * the better one.
     */
    class Attestation
    {
    public:
        using Variant = std::variant<PendingAttestation, ChainBlockHeaderAttestation, UnknownAttestation>;

        Attestation(Variant v) : v_(std::move(v)) {}

        static Attestation pending(std::string uri) { return Attestation(PendingAttestation{std::move(uri)}); }
        static Attestation bitcoin(uint64_t height) { return Attestation(ChainBlockHeaderAttestation{Chain::Bitcoin, height}); }
        static Attestation litecoin(uint64_t height) { return Attestation(ChainBlockHeaderAttestation{Chain::Litecoin, height}); }

        AttestationKind kind() const;
        Bytes tag() const;

        bool is_pending() const { return std::holds_alternative<PendingAttestation>(v_); }
        const PendingAttestation *as_pending() const { return std::get_if<PendingAttestation>(&v_); }
        const ChainBlockHeaderAttestation *as_chain() const { return std::get_if<ChainBlockHeaderAttestation>(&v_); }

        /** Block height of a chain attestation */
        std::optional<uint64_t> height() const;

        /** e.g. "PendingAttestation('https://...')", "BitcoinBlockHeaderAttestation(358391)" */
        std::string to_string() const;

        void serialize(ByteWriter &w) const;
        static Result<Attestation> deserialize(ByteReader &r);

        const Variant &variant() const { return v_; }

        bool operator==(const Attestation &other) const;
        std::strong_ordering operator<=>(const Attestation &other) const;

    private:
        Variant v_;
    };

    /** URIs are restricted to a conservative character set */
    bool is_valid_pending_uri(const std::string &uri);

} // namespace anchor
