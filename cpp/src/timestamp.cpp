#include "anchor/timestamp.hpp"
#include "anchor/crypto.hpp"
#include <format>
#include <unordered_set>

namespace anchor
{

    namespace
    {
        const Bytes kHeaderMagic{
            0x00, 'O', 'p', 'e', 'n', 'T', 'i', 'm', 'e', 's', 't', 'a', 'm', 'p', 's', 0x00,
            0x00, 'P', 'r', 'o', 'o', 'f', 0x00,
            0xbf, 0x89, 0xe2, 0xe8, 0x84, 0xe8, 0x92, 0x94};

        constexpr uint64_t kMajorVersion = 1;

        constexpr uint8_t kTagAttestation = 0x00;
        constexpr uint8_t kTagFork = 0xff;

        void collect_attestations(const Timestamp &node,
                                  std::vector<std::pair<Bytes, Attestation>> &out,
                                  std::unordered_set<const Timestamp *> &seen)
        {
            if (!seen.insert(&node).second)
                return;
            for (const auto &att : node.attestations)
                out.emplace_back(node.msg(), att);
            for (const auto &[op, child] : node.ops)
                collect_attestations(*child, out, seen);
        }

        std::string str_result(int verbosity, const Bytes &result)
        {
            if (verbosity <= 0)
                return "";
            return " == " + crypto::Hex::encode(result);
        }
    } // namespace

    // ========== Timestamp Implementation ==========

    Result<Timestamp::Ptr> Timestamp::add_op(const Op &op)
    {
        if (auto it = ops.find(op); it != ops.end())
            return it->second;

        auto result = op.apply(msg_);
        if (!result)
            return std::unexpected(result.error());

        auto child = Timestamp::make(std::move(*result));
        ops.emplace(op, child);
        return child;
    }

    Result<void> Timestamp::merge(const Timestamp &other)
    {
        if (this == &other)
            return {};

        if (msg_ != other.msg_)
        {
            return std::unexpected(AnchorError::invalid_input(std::format(
                "Can't merge timestamps for different messages: {} != {}",
                crypto::Hex::encode(msg_), crypto::Hex::encode(other.msg_))));
        }

        attestations.insert(other.attestations.begin(), other.attestations.end());

        for (const auto &[op, other_child] : other.ops)
        {
            auto it = ops.find(op);
            if (it == ops.end())
            {
                it = ops.emplace(op, Timestamp::make(other_child->msg())).first;
            }
            if (auto res = it->second->merge(*other_child); !res)
                return res;
        }
        return {};
    }

    Timestamp::Ptr Timestamp::clone() const
    {
        auto copy = Timestamp::make(msg_);
        copy->attestations = attestations;
        for (const auto &[op, child] : ops)
            copy->ops.emplace(op, child->clone());
        return copy;
    }

    std::vector<std::pair<Bytes, Attestation>> Timestamp::all_attestations() const
    {
        std::vector<std::pair<Bytes, Attestation>> out;
        std::unordered_set<const Timestamp *> seen;
        collect_attestations(*this, out, seen);
        return out;
    }

    std::set<Attestation> Timestamp::attestation_set() const
    {
        std::set<Attestation> out;
        for (auto &[msg, att] : all_attestations())
            out.insert(std::move(att));
        return out;
    }

    bool Timestamp::is_complete() const
    {
        for (const auto &[msg, att] : all_attestations())
        {
            if (att.as_chain())
                return true;
        }
        return false;
    }

    bool Timestamp::equals(const Timestamp &other) const
    {
        if (msg_ != other.msg_ || attestations != other.attestations || ops.size() != other.ops.size())
            return false;

        auto it = other.ops.begin();
        for (const auto &[op, child] : ops)
        {
            if (!(op == it->first) || !child->equals(*it->second))
                return false;
            ++it;
        }
        return true;
    }

    std::string Timestamp::str_tree(int indent, int verbosity) const
    {
        const std::string pad(static_cast<std::size_t>(indent), ' ');
        std::string r;

        for (const auto &att : attestations)
        {
            r += pad + "verify " + att.to_string() + "\n";
            if (att.kind() == AttestationKind::Bitcoin)
                r += pad + "# Bitcoin block merkle root " + crypto::Hex::encode_reversed(msg_) + "\n";
        }

        if (ops.size() > 1)
        {
            for (const auto &[op, child] : ops)
            {
                r += pad + " -> " + op.to_string() + str_result(verbosity, child->msg()) + "\n";
                r += child->str_tree(indent + 4, verbosity);
            }
        }
        else if (ops.size() == 1)
        {
            const auto &[op, child] = *ops.begin();
            r += pad + op.to_string() + str_result(verbosity, child->msg()) + "\n";
            r += child->str_tree(indent, verbosity);
        }
        return r;
    }

    Result<void> Timestamp::serialize(ByteWriter &w) const
    {
        if (empty())
        {
            return std::unexpected(AnchorError::malformed("An empty timestamp can't be serialized"));
        }

        // Every item but the last is prefixed with a fork marker
        std::size_t items = attestations.size() + ops.size();
        std::size_t written = 0;
        auto fork_if_more = [&]
        {
            if (++written < items)
                w.write_byte(kTagFork);
        };

        for (const auto &att : attestations)
        {
            fork_if_more();
            w.write_byte(kTagAttestation);
            att.serialize(w);
        }
        for (const auto &[op, child] : ops)
        {
            fork_if_more();
            op.serialize(w);
            if (auto res = child->serialize(w); !res)
                return res;
        }
        return {};
    }

    Result<Bytes> Timestamp::serialize() const
    {
        ByteWriter w;
        if (auto res = serialize(w); !res)
            return std::unexpected(res.error());
        return w.take();
    }

    Result<Timestamp::Ptr> Timestamp::deserialize(ByteReader &r, Bytes msg, int recursion_limit)
    {
        if (recursion_limit <= 0)
        {
            return std::unexpected(AnchorError::malformed("Reached timestamp recursion depth limit while deserializing"));
        }

        auto self = Timestamp::make(std::move(msg));

        auto do_tag_or_attestation = [&](uint8_t tag) -> Result<void>
        {
            if (tag == kTagAttestation)
            {
                auto att = Attestation::deserialize(r);
                if (!att)
                    return std::unexpected(att.error());
                self->attestations.insert(std::move(*att));
                return {};
            }

            auto op = Op::deserialize_from_tag(r, tag);
            if (!op)
                return std::unexpected(op.error());
            auto result = op->apply(self->msg());
            if (!result)
                return std::unexpected(AnchorError::malformed(result.error().what()));
            auto child = Timestamp::deserialize(r, std::move(*result), recursion_limit - 1);
            if (!child)
                return std::unexpected(child.error());
            self->ops[*op] = *child;
            return {};
        };

        auto tag = r.read_byte();
        if (!tag)
            return std::unexpected(tag.error());
        while (*tag == kTagFork)
        {
            auto current = r.read_byte();
            if (!current)
                return std::unexpected(current.error());
            if (auto res = do_tag_or_attestation(*current); !res)
                return std::unexpected(res.error());
            tag = r.read_byte();
            if (!tag)
                return std::unexpected(tag.error());
        }
        if (auto res = do_tag_or_attestation(*tag); !res)
            return std::unexpected(res.error());

        return self;
    }

    Result<Timestamp::Ptr> Timestamp::deserialize(const Bytes &data, Bytes msg)
    {
        ByteReader r(data);
        auto ts = deserialize(r, std::move(msg));
        if (!ts)
            return ts;
        if (auto eof = r.assert_eof(); !eof)
            return std::unexpected(eof.error());
        return ts;
    }

    // ========== DetachedTimestampFile Implementation ==========

    Result<DetachedTimestampFile> DetachedTimestampFile::from_stream(std::istream &in)
    {
        auto digest = crypto::SHA256::hash(in);
        if (!digest)
            return std::unexpected(digest.error());
        return DetachedTimestampFile{Op::sha256(), Timestamp::make(Bytes(digest->begin(), digest->end()))};
    }

    Result<Bytes> DetachedTimestampFile::serialize() const
    {
        ByteWriter w;
        w.write_bytes(kHeaderMagic);
        w.write_varuint(kMajorVersion);
        file_hash_op.serialize(w);
        w.write_bytes(file_digest());
        if (auto res = timestamp->serialize(w); !res)
            return std::unexpected(res.error());
        return w.take();
    }

    Result<DetachedTimestampFile> DetachedTimestampFile::deserialize(const Bytes &data)
    {
        ByteReader r(data);
        if (auto magic = r.expect_bytes(kHeaderMagic, "magic: not a timestamp file"); !magic)
            return std::unexpected(magic.error());

        auto major = r.read_varuint();
        if (!major)
            return std::unexpected(major.error());
        if (*major != kMajorVersion)
        {
            return std::unexpected(AnchorError::malformed(std::format("Unsupported major version {}", *major)));
        }

        auto tag = r.read_byte();
        if (!tag)
            return std::unexpected(tag.error());
        auto op = Op::deserialize_from_tag(r, *tag);
        if (!op)
            return std::unexpected(op.error());
        if (!op->is_crypto())
        {
            return std::unexpected(AnchorError::malformed(
                std::format("File hash op {} is not a hash function", op->to_string())));
        }

        auto digest = r.read_bytes(op->digest_length());
        if (!digest)
            return std::unexpected(digest.error());

        auto ts = Timestamp::deserialize(r, std::move(*digest));
        if (!ts)
            return std::unexpected(ts.error());
        if (auto eof = r.assert_eof(); !eof)
            return std::unexpected(eof.error());

        return DetachedTimestampFile{std::move(*op), std::move(*ts)};
    }

} // namespace anchor
