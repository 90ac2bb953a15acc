#pragma once

#include "timestamp.hpp"
#include <vector>

namespace anchor
{

    /** Bytes of random nonce appended to each file digest before aggregation */
    inline constexpr std::size_t kLeafNonceSize = 16;

    /**
     * Append a fresh random nonce to a file's proof root and hash the result.
     * The nonce keeps a detached proof from revealing the digests of the files
     * it was batched with. Returns the leaf node.
     */
    Result<Timestamp::Ptr> make_leaf(Timestamp &file_root);

    /** As make_leaf, with a caller-chosen nonce */
    Result<Timestamp::Ptr> make_leaf(Timestamp &file_root, const Bytes &nonce);

    /**
     * Join two nodes: left.append(right.msg) and right.prepend(left.msg) produce
     * the same message, so one shared node is registered under both parents.
     * Returns sha256 of that node.
     */
    Result<Timestamp::Ptr> cat_sha256(const Timestamp::Ptr &left, const Timestamp::Ptr &right);

    /**
     * Binary Merkle reduction of the leaves; an odd leftover is promoted
     * unchanged. Returns the root every leaf now leads to.
     */
    Result<Timestamp::Ptr> make_merkle_tree(const std::vector<Timestamp::Ptr> &leaves);

} // namespace anchor
