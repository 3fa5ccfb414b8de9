#include "cache/simple_cache.hpp"

#include "cache/key_validation.hpp"

namespace TaggedFileCache::Cache
{

Value SimpleCache::Get(const std::string &key, const Value &default_value)
{
    CacheItem item = pool_.GetItem(key);
    if (!item.IsHit()) {
        return default_value;
    }
    return item.Get();
}

bool SimpleCache::Set(const std::string &key, Value value, Ttl ttl)
{
    CacheItem item = pool_.GetItem(key);
    item.Set(std::move(value)).ExpiresAfter(ttl);
    return pool_.Save(item);
}

bool SimpleCache::Delete(const std::string &key) { return pool_.DeleteItem(key); }

bool SimpleCache::Clear() { return pool_.Clear(); }

bool SimpleCache::Has(const std::string &key) { return pool_.HasItem(key); }

std::vector<std::pair<std::string, Value>> SimpleCache::GetMultiple(
    const std::vector<std::string> &keys, const Value &default_value
)
{
    std::vector<CacheItem> items = pool_.GetItems(keys);

    std::vector<std::pair<std::string, Value>> values;
    values.reserve(items.size());
    for (auto &item : items) {
        values.emplace_back(item.GetKey(), item.IsHit() ? item.Get() : default_value);
    }
    return values;
}

bool SimpleCache::SetMultiple(const std::vector<std::pair<std::string, Value>> &values, Ttl ttl)
{
    std::vector<std::string> keys;
    keys.reserve(values.size());
    for (const auto &[key, value] : values) {
        ValidateKey(key);
        keys.push_back(key);
    }

    std::vector<CacheItem> items = pool_.GetItems(keys);
    bool deferred = true;
    for (std::size_t i = 0; i < items.size(); ++i) {
        items[i].Set(values[i].second).ExpiresAfter(ttl);
        deferred = pool_.SaveDeferred(items[i]) && deferred;
    }
    return deferred && pool_.Commit();
}

bool SimpleCache::DeleteMultiple(const std::vector<std::string> &keys) { return pool_.DeleteItems(keys); }

}  // namespace TaggedFileCache::Cache
