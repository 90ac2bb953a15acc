#pragma once

#include "config.hpp"
#include "timestamp.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>

namespace anchor
{

    /**
     * Local store of the best proof fragment known for each digest. Lookups
     * never touch the network; writes are best-effort.
     */
    class TimestampCache
    {
    public:
        virtual ~TimestampCache() = default;

        /** Fragment previously learned for `digest`, if any */
        virtual std::optional<Timestamp::Ptr> get(const Bytes &digest) = 0;

        /** Fold a fragment into whatever is stored under its msg */
        virtual void merge(const Timestamp &fragment) = 0;
    };

    /**
     * RocksDB-backed cache: key is the raw digest, value the serialized
     * timestamp for that digest.
     */
    class RocksDbTimestampCache : public TimestampCache
    {
    public:
        static Result<std::unique_ptr<RocksDbTimestampCache>> open(const CacheConfig &cfg);
        ~RocksDbTimestampCache() override;

        std::optional<Timestamp::Ptr> get(const Bytes &digest) override;
        void merge(const Timestamp &fragment) override;

    private:
        class Impl;
        explicit RocksDbTimestampCache(std::unique_ptr<Impl> impl);

        std::unique_ptr<Impl> impl_;
    };

    /** Expand a leading `~/` using $HOME */
    std::string expand_home(const std::string &path);

} // namespace anchor
