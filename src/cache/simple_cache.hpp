#ifndef TAGGEDFILECACHE_SRC_CACHE_SIMPLE_CACHE_HPP_
#define TAGGEDFILECACHE_SRC_CACHE_SIMPLE_CACHE_HPP_

#include "cache/cache_types.hpp"
#include "cache/file_system_cache_pool.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace TaggedFileCache::Cache
{

/// Key/value shortcuts over a pool for callers that never need items or tags.
class SimpleCache
{
    public:
    using Ttl = std::optional<std::chrono::seconds>;

    explicit SimpleCache(FileSystemCachePool &pool) : pool_(pool) {}

    Value Get(const std::string &key, const Value &default_value = nullptr);
    bool Set(const std::string &key, Value value, Ttl ttl = std::nullopt);
    bool Delete(const std::string &key);
    bool Clear();
    bool Has(const std::string &key);

    /// Pairs come back in the order of keys.
    std::vector<std::pair<std::string, Value>> GetMultiple(
        const std::vector<std::string> &keys, const Value &default_value = nullptr
    );
    bool SetMultiple(const std::vector<std::pair<std::string, Value>> &values, Ttl ttl = std::nullopt);
    bool DeleteMultiple(const std::vector<std::string> &keys);

    private:
    FileSystemCachePool &pool_;
};

}  // namespace TaggedFileCache::Cache

#endif  // TAGGEDFILECACHE_SRC_CACHE_SIMPLE_CACHE_HPP_
