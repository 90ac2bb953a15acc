#pragma once

#include "types.hpp"
#include "op.hpp"
#include "attestation.hpp"
#include "serialize.hpp"
#include <istream>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace anchor
{

    /**
     * Proof DAG node: a claim that `msg` existed.
     *
     * Each entry of `ops` maps an operation to the node holding op(msg); at most
     * one child per distinct operation. Children are shared so the Merkle
     * aggregator can hang the same node under two parents. `attestations` are
     * independent claims that `msg` itself is anchored.
     */
    class Timestamp
    {
    public:
        using Ptr = std::shared_ptr<Timestamp>;
        using OpMap = std::map<Op, Ptr>;

        static constexpr int kMaxRecursion = 256;

        explicit Timestamp(Bytes msg) : msg_(std::move(msg)) {}

        Timestamp(const Timestamp &) = delete;
        Timestamp &operator=(const Timestamp &) = delete;

        static Ptr make(Bytes msg) { return std::make_shared<Timestamp>(std::move(msg)); }

        const Bytes &msg() const { return msg_; }

        std::set<Attestation> attestations;
        OpMap ops;

        /** Child reached through `op`, created on first use */
        Result<Ptr> add_op(const Op &op);

        /**
         * Merge everything `other` knows into this node. Both must commit to the
         * same msg. Children that only exist in `other` are copied, never shared.
         */
        Result<void> merge(const Timestamp &other);

        /** Deep copy */
        Ptr clone() const;

        /** Every (msg, attestation) pair reachable from this node */
        std::vector<std::pair<Bytes, Attestation>> all_attestations() const;

        std::set<Attestation> attestation_set() const;

        /** True once a chain block-header attestation exists anywhere below */
        bool is_complete() const;

        bool empty() const { return attestations.empty() && ops.empty(); }

        /** Structural equality of the whole subtree */
        bool equals(const Timestamp &other) const;

        /** Human-readable proof tree, one line per op or attestation */
        std::string str_tree(int indent = 0, int verbosity = 0) const;

        Result<void> serialize(ByteWriter &w) const;
        Result<Bytes> serialize() const;

        static Result<Ptr> deserialize(ByteReader &r, Bytes msg, int recursion_limit = kMaxRecursion);
        static Result<Ptr> deserialize(const Bytes &data, Bytes msg);

    private:
        Bytes msg_;
    };

    /**
     * A proof for one file: the hash op used on the file, and the timestamp
     * whose msg is the file digest.
     */
    struct DetachedTimestampFile
    {
        Op file_hash_op;
        Timestamp::Ptr timestamp;

        const Bytes &file_digest() const { return timestamp->msg(); }

        /** Hash a stream with SHA-256 and start an empty proof on the digest */
        static Result<DetachedTimestampFile> from_stream(std::istream &in);

        Result<Bytes> serialize() const;

        static Result<DetachedTimestampFile> deserialize(const Bytes &data);
    };

} // namespace anchor
