#ifndef TAGGEDFILECACHE_SRC_CACHE_DEFERRED_QUEUE_HPP_
#define TAGGEDFILECACHE_SRC_CACHE_DEFERRED_QUEUE_HPP_

#include "boost/multi_index/hashed_index.hpp"
#include "boost/multi_index/indexed_by.hpp"
#include "boost/multi_index/mem_fun.hpp"
#include "boost/multi_index/sequenced_index.hpp"
#include "boost/multi_index_container.hpp"

#include "cache/cache_item.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace TaggedFileCache::Cache
{

namespace bmi = boost::multi_index;

/// Items waiting for a commit, unique by key and kept in insertion order.
class DeferredQueue
{
    private:
    //------------------------------------------------------------------------------//
    // Internal Types
    //------------------------------------------------------------------------------//
    struct by_sequence {
    };
    struct by_key {
    };

    using ItemContainer = bmi::multi_index_container<
        CacheItem,
        bmi::indexed_by<
            bmi::sequenced<bmi::tag<by_sequence>>,
            bmi::hashed_unique<
                bmi::tag<by_key>,
                bmi::const_mem_fun<CacheItem, const std::string &, &CacheItem::GetKey>>>>;

    public:
    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    /// Appends item, or replaces the pending item with the same key in its queue slot.
    void Put(const CacheItem &item)
    {
        auto &by_key_index = items_.get<by_key>();
        auto it            = by_key_index.find(item.GetKey());
        if (it != by_key_index.end()) {
            by_key_index.replace(it, item);
            return;
        }
        items_.get<by_sequence>().push_back(item);
    }

    /// nullptr when no item is pending under key.
    [[nodiscard]] const CacheItem *Find(const std::string &key) const
    {
        const auto &by_key_index = items_.get<by_key>();
        auto it                  = by_key_index.find(key);
        return it == by_key_index.end() ? nullptr : &*it;
    }

    bool Erase(const std::string &key) { return items_.get<by_key>().erase(key) > 0; }

    /// Empties the queue and returns its items oldest first.
    std::vector<CacheItem> TakeAll()
    {
        const auto &sequence = items_.get<by_sequence>();
        std::vector<CacheItem> taken(sequence.begin(), sequence.end());
        items_.clear();
        return taken;
    }

    void Clear() { items_.clear(); }

    [[nodiscard]] std::size_t Size() const { return items_.size(); }
    [[nodiscard]] bool Empty() const { return items_.empty(); }

    private:
    ItemContainer items_;
};

}  // namespace TaggedFileCache::Cache

#endif  // TAGGEDFILECACHE_SRC_CACHE_DEFERRED_QUEUE_HPP_
