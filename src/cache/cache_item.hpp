#ifndef TAGGEDFILECACHE_SRC_CACHE_CACHE_ITEM_HPP_
#define TAGGEDFILECACHE_SRC_CACHE_CACHE_ITEM_HPP_

#include "cache/cache_types.hpp"
#include "cache/i_cache_item.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace TaggedFileCache::Cache
{

class FileSystemCachePool;

/// What a lazy fetch learned about the stored item.
struct FetchResult {
    bool hit = false;
    Value value;
    TagSet tags;
    Expiration expiration;
};

using FetchFunction = std::function<FetchResult()>;

class CacheItem : public ICacheItem
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//

    /// A miss placeholder.
    explicit CacheItem(std::string key);
    /// Resolved from fetch on first use.
    CacheItem(std::string key, FetchFunction fetch);
    /// A hit holding value.
    CacheItem(std::string key, Value value);

    CacheItem(const CacheItem &)            = default;
    CacheItem &operator=(const CacheItem &) = default;
    CacheItem(CacheItem &&)                 = default;
    CacheItem &operator=(CacheItem &&)      = default;
    ~CacheItem() override                   = default;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    [[nodiscard]] const std::string &GetKey() const override { return key_; }

    Value Get() override;
    CacheItem &Set(Value value) override;
    bool IsHit() override;

    CacheItem &ExpiresAt(std::optional<Timestamp> expiration) override;
    CacheItem &ExpiresAfter(std::optional<std::chrono::seconds> ttl) override;

    /// Sub-second precision is dropped.
    template <typename Duration>
    CacheItem &ExpiresAt(std::chrono::time_point<Clock, Duration> expiration)
    {
        return ExpiresAt(std::optional<Timestamp>(std::chrono::floor<std::chrono::seconds>(expiration)));
    }

    /// Replaces the tags that will be written on the next save.
    CacheItem &SetTags(const std::vector<std::string> &tags);
    [[nodiscard]] const TagSet &GetTags() const { return tags_; }

    /// Tags the item carried in storage when it was fetched.
    const TagSet &GetPreviousTags();

    Expiration GetExpirationTimestamp();

    private:
    //------------------------------------------------------------------------------//
    // Internal Types
    //------------------------------------------------------------------------------//

    struct PendingFetch {
        FetchFunction fetch;
    };
    struct ResolvedHit {
        Value value;
    };
    struct ResolvedMiss {
    };

    using State = std::variant<PendingFetch, ResolvedHit, ResolvedMiss>;

    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//

    friend class FileSystemCachePool;

    void Resolve();
    void MoveCurrentTagsToPrevious();

    /// False when the stored tags were never fetched: the item was built without a
    /// fetch, or Set() discarded the fetch before it ran.
    [[nodiscard]] bool ArePreviousTagsKnown() const { return previous_tags_known_; }

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//

    std::string key_;
    State state_;
    TagSet tags_;
    TagSet previous_tags_;
    Expiration expiration_;
    bool previous_tags_known_;
};

}  // namespace TaggedFileCache::Cache

#endif  // TAGGEDFILECACHE_SRC_CACHE_CACHE_ITEM_HPP_
