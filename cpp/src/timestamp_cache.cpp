#include "anchor/timestamp_cache.hpp"
#include "anchor/crypto.hpp"
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <filesystem>

namespace anchor
{

    std::string expand_home(const std::string &path)
    {
        if (path == "~" || path.starts_with("~/"))
        {
            if (const char *home = std::getenv("HOME"))
                return std::string(home) + path.substr(1);
        }
        return path;
    }

    class RocksDbTimestampCache::Impl
    {
    public:
        explicit Impl(rocksdb::DB *db) : db(db) {}

        ~Impl()
        {
            delete db;
        }

        std::optional<Timestamp::Ptr> get(const Bytes &digest)
        {
            std::string value;
            rocksdb::Slice key(reinterpret_cast<const char *>(digest.data()), digest.size());
            auto status = db->Get(rocksdb::ReadOptions(), key, &value);
            if (status.IsNotFound())
                return std::nullopt;
            if (!status.ok())
            {
                spdlog::warn("Cache lookup for {} failed: {}", crypto::Hex::encode(digest), status.ToString());
                return std::nullopt;
            }

            auto ts = Timestamp::deserialize(Bytes(value.begin(), value.end()), digest);
            if (!ts)
            {
                spdlog::warn("Ignoring corrupt cache entry for {}: {}", crypto::Hex::encode(digest), ts.error().what());
                return std::nullopt;
            }
            return *ts;
        }

        Result<void> put(const Timestamp &ts)
        {
            auto bytes = ts.serialize();
            if (!bytes)
                return std::unexpected(bytes.error());

            rocksdb::Slice key(reinterpret_cast<const char *>(ts.msg().data()), ts.msg().size());
            rocksdb::Slice value(reinterpret_cast<const char *>(bytes->data()), bytes->size());
            auto status = db->Put(rocksdb::WriteOptions(), key, value);
            if (!status.ok())
            {
                return std::unexpected(AnchorError::storage("RocksDB Put failed: " + status.ToString()));
            }
            return {};
        }

    private:
        rocksdb::DB *db{nullptr};
    };

    Result<std::unique_ptr<RocksDbTimestampCache>> RocksDbTimestampCache::open(const CacheConfig &cfg)
    {
        auto path = expand_home(cfg.path);
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec)
        {
            return std::unexpected(AnchorError::storage("Can't create cache directory " + path + ": " + ec.message()));
        }

        rocksdb::Options options;
        options.create_if_missing = true;
        rocksdb::DB *db = nullptr;
        auto status = rocksdb::DB::Open(options, path, &db);
        if (!status.ok())
        {
            return std::unexpected(AnchorError::storage("RocksDB open failed: " + status.ToString()));
        }
        spdlog::debug("Opened timestamp cache at {}", path);
        return std::unique_ptr<RocksDbTimestampCache>(new RocksDbTimestampCache(std::make_unique<Impl>(db)));
    }

    RocksDbTimestampCache::RocksDbTimestampCache(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}
    RocksDbTimestampCache::~RocksDbTimestampCache() = default;

    std::optional<Timestamp::Ptr> RocksDbTimestampCache::get(const Bytes &digest)
    {
        return impl_->get(digest);
    }

    void RocksDbTimestampCache::merge(const Timestamp &fragment)
    {
        Timestamp::Ptr stored;
        if (auto existing = impl_->get(fragment.msg()))
        {
            if ((*existing)->equals(fragment))
                return;
            stored = *existing;
        }
        else
        {
            stored = Timestamp::make(fragment.msg());
        }

        if (auto res = stored->merge(fragment); !res)
        {
            spdlog::warn("Not caching fragment: {}", res.error().what());
            return;
        }
        if (auto res = impl_->put(*stored); !res)
            spdlog::warn("Cache write failed: {}", res.error().what());
    }

} // namespace anchor
