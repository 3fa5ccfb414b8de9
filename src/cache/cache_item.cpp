#include "cache/cache_item.hpp"

#include "cache/cache_error.hpp"
#include "cache/key_validation.hpp"

#include <limits>
#include <utility>

namespace TaggedFileCache::Cache
{

// Items built without a fetch never saw the stored record, so its tags are unknown.
CacheItem::CacheItem(std::string key)
    : key_(std::move(key)), state_(ResolvedMiss{}), previous_tags_known_(false)
{
}

CacheItem::CacheItem(std::string key, FetchFunction fetch)
    : key_(std::move(key)), state_(PendingFetch{std::move(fetch)}), previous_tags_known_(true)
{
}

CacheItem::CacheItem(std::string key, Value value)
    : key_(std::move(key)), state_(ResolvedHit{std::move(value)}), previous_tags_known_(false)
{
}

void CacheItem::Resolve()
{
    auto *pending = std::get_if<PendingFetch>(&state_);
    if (pending == nullptr) {
        return;
    }

    // A throwing fetch leaves the item pending.
    FetchResult result = pending->fetch();
    if (result.hit) {
        state_ = ResolvedHit{std::move(result.value)};
    } else {
        state_ = ResolvedMiss{};
    }
    previous_tags_ = std::move(result.tags);
    expiration_    = result.expiration;
}

Value CacheItem::Get()
{
    if (!IsHit()) {
        return nullptr;
    }
    return std::get<ResolvedHit>(state_).value;
}

CacheItem &CacheItem::Set(Value value)
{
    if (std::holds_alternative<PendingFetch>(state_)) {
        previous_tags_known_ = false;
    }
    state_ = ResolvedHit{std::move(value)};
    return *this;
}

bool CacheItem::IsHit()
{
    Resolve();
    if (!std::holds_alternative<ResolvedHit>(state_)) {
        return false;
    }
    return !expiration_ || *expiration_ > Now();
}

CacheItem &CacheItem::ExpiresAt(std::optional<Timestamp> expiration)
{
    Resolve();
    expiration_ = expiration;
    return *this;
}

CacheItem &CacheItem::ExpiresAfter(std::optional<std::chrono::seconds> ttl)
{
    Resolve();
    if (!ttl) {
        expiration_.reset();
        return *this;
    }

    using Rep          = std::chrono::seconds::rep;
    const Rep now      = Now().time_since_epoch().count();
    const Rep ttl_secs = ttl->count();
    if ((ttl_secs > 0 && now > std::numeric_limits<Rep>::max() - ttl_secs) ||
        (ttl_secs < 0 && now < std::numeric_limits<Rep>::min() - ttl_secs)) {
        throw InvalidArgumentException(
            CacheErrc::InvalidExpiration, "Cache item ttl/expiresAfter overflows the expiration timestamp"
        );
    }
    expiration_ = Timestamp(std::chrono::seconds(now + ttl_secs));
    return *this;
}

CacheItem &CacheItem::SetTags(const std::vector<std::string> &tags)
{
    Resolve();

    TagSet validated;
    for (const auto &tag : tags) {
        ValidateTag(tag);
        validated.insert(tag);
    }
    tags_ = std::move(validated);
    return *this;
}

const TagSet &CacheItem::GetPreviousTags()
{
    Resolve();
    return previous_tags_;
}

Expiration CacheItem::GetExpirationTimestamp()
{
    Resolve();
    return expiration_;
}

void CacheItem::MoveCurrentTagsToPrevious()
{
    Resolve();
    previous_tags_ = std::move(tags_);
    tags_.clear();
}

}  // namespace TaggedFileCache::Cache
