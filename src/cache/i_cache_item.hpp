#ifndef TAGGEDFILECACHE_SRC_CACHE_I_CACHE_ITEM_HPP_
#define TAGGEDFILECACHE_SRC_CACHE_I_CACHE_ITEM_HPP_

#include "cache/cache_types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace TaggedFileCache::Cache
{

class ICacheItem
{
    public:
    virtual ~ICacheItem() = default;

    [[nodiscard]] virtual const std::string &GetKey() const = 0;

    /// Null when the item is not a hit.
    virtual Value Get() = 0;
    virtual ICacheItem &Set(Value value) = 0;
    virtual bool IsHit() = 0;

    /// std::nullopt means the item never expires.
    virtual ICacheItem &ExpiresAt(std::optional<Timestamp> expiration) = 0;
    virtual ICacheItem &ExpiresAfter(std::optional<std::chrono::seconds> ttl) = 0;
};

}  // namespace TaggedFileCache::Cache

#endif  // TAGGEDFILECACHE_SRC_CACHE_I_CACHE_ITEM_HPP_
