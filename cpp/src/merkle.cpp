#include "anchor/merkle.hpp"
#include "anchor/crypto.hpp"

namespace anchor
{

    Result<Timestamp::Ptr> make_leaf(Timestamp &file_root)
    {
        return make_leaf(file_root, crypto::SecureRandom::generate_bytes(kLeafNonceSize));
    }

    Result<Timestamp::Ptr> make_leaf(Timestamp &file_root, const Bytes &nonce)
    {
        auto nonced = file_root.add_op(Op::append(nonce));
        if (!nonced)
            return nonced;
        return (*nonced)->add_op(Op::sha256());
    }

    Result<Timestamp::Ptr> cat_sha256(const Timestamp::Ptr &left, const Timestamp::Ptr &right)
    {
        auto joined = left->add_op(Op::append(right->msg()));
        if (!joined)
            return joined;

        auto prepend = Op::prepend(left->msg());
        right->ops.insert_or_assign(prepend, *joined);

        return (*joined)->add_op(Op::sha256());
    }

    Result<Timestamp::Ptr> make_merkle_tree(const std::vector<Timestamp::Ptr> &leaves)
    {
        if (leaves.empty())
        {
            return std::unexpected(AnchorError::invalid_input("Need at least one timestamp to build a merkle tree"));
        }

        std::vector<Timestamp::Ptr> level = leaves;
        while (level.size() > 1)
        {
            std::vector<Timestamp::Ptr> next;
            next.reserve(level.size() / 2 + 1);
            for (std::size_t i = 0; i + 1 < level.size(); i += 2)
            {
                auto parent = cat_sha256(level[i], level[i + 1]);
                if (!parent)
                    return parent;
                next.push_back(std::move(*parent));
            }
            if (level.size() % 2 == 1)
                next.push_back(level.back());
            level = std::move(next);
        }
        return level.front();
    }

} // namespace anchor
