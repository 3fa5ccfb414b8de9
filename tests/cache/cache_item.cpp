#include "cache/cache_item.hpp"

#include "cache/cache_error.hpp"
#include "support/testing.hpp"

#include <chrono>
#include <stdexcept>

using namespace TaggedFileCache;
using namespace TaggedFileCache::Cache;

namespace
{

FetchFunction CountingFetch(int &calls, FetchResult result)
{
    return [&calls, result]() {
        ++calls;
        return result;
    };
}

}  // namespace

TEST_CASE("a placeholder item is a miss", "[cache_item]")
{
    CacheItem item("key");
    REQUIRE(item.GetKey() == "key");
    REQUIRE_FALSE(item.IsHit());
    REQUIRE(item.Get().is_null());
    REQUIRE(item.GetTags().empty());
    REQUIRE(item.GetPreviousTags().empty());
    REQUIRE_FALSE(item.GetExpirationTimestamp().has_value());
}

TEST_CASE("setting a value makes the item a hit", "[cache_item]")
{
    CacheItem item("key");
    REQUIRE(&item.Set("value") == &item);
    REQUIRE(item.IsHit());
    REQUIRE(item.Get() == "value");

    SECTION("null is a legitimate value")
    {
        item.Set(nullptr);
        REQUIRE(item.IsHit());
        REQUIRE(item.Get().is_null());
    }
}

TEST_CASE("an item built with a value is a hit", "[cache_item]")
{
    CacheItem item("key", Value{{"answer", 42}});
    REQUIRE(item.IsHit());
    REQUIRE(item.Get()["answer"] == 42);
}

TEST_CASE("lazy items fetch exactly once", "[cache_item]")
{
    int calls = 0;
    FetchResult stored{true, "stored", {"a", "b"}, std::nullopt};
    CacheItem item("key", CountingFetch(calls, stored));

    REQUIRE(calls == 0);
    REQUIRE(item.IsHit());
    REQUIRE(item.Get() == "stored");
    REQUIRE(item.GetPreviousTags() == TagSet{"a", "b"});
    REQUIRE(item.IsHit());
    REQUIRE(calls == 1);

    // Stored tags are never current tags
    REQUIRE(item.GetTags().empty());
}

TEST_CASE("lazy misses stay misses", "[cache_item]")
{
    int calls = 0;
    CacheItem item("key", CountingFetch(calls, FetchResult{}));

    REQUIRE_FALSE(item.IsHit());
    REQUIRE(item.Get().is_null());
    REQUIRE(calls == 1);
}

TEST_CASE("setting a value cancels the pending fetch", "[cache_item]")
{
    int calls = 0;
    FetchResult stored{true, "stored", {"a"}, std::nullopt};
    CacheItem item("key", CountingFetch(calls, stored));

    item.Set("fresh");
    REQUIRE(item.Get() == "fresh");
    REQUIRE(item.GetPreviousTags().empty());
    REQUIRE(calls == 0);
}

TEST_CASE("a failing fetch is retried by the next call", "[cache_item]")
{
    int calls = 0;
    CacheItem item("key", [&calls]() -> FetchResult {
        ++calls;
        if (calls == 1) {
            throw InvalidArgumentException(CacheErrc::InvalidKey, "bad key");
        }
        return FetchResult{true, "second", {}, std::nullopt};
    });

    REQUIRE_THROWS_AS(item.IsHit(), InvalidArgumentException);
    REQUIRE(item.Get() == "second");
    REQUIRE(calls == 2);
}

TEST_CASE("expired fetch results are not hits", "[cache_item]")
{
    int calls = 0;
    FetchResult stored{true, "stored", {}, Now() - std::chrono::seconds(5)};
    CacheItem item("key", CountingFetch(calls, stored));

    REQUIRE_FALSE(item.IsHit());
    REQUIRE(item.Get().is_null());
    REQUIRE(item.GetExpirationTimestamp() == stored.expiration);
}

TEST_CASE("expiration", "[cache_item]")
{
    CacheItem item("key", Value("value"));

    SECTION("no expiration means the item never expires")
    {
        item.ExpiresAfter(std::nullopt);
        REQUIRE_FALSE(item.GetExpirationTimestamp().has_value());
        REQUIRE(item.IsHit());
    }

    SECTION("a relative expiration is counted from now")
    {
        const auto before = Now();
        item.ExpiresAfter(std::chrono::seconds(10));
        const auto after = Now();

        const auto expiration = item.GetExpirationTimestamp();
        REQUIRE(expiration.has_value());
        REQUIRE(*expiration >= before + std::chrono::seconds(10));
        REQUIRE(*expiration <= after + std::chrono::seconds(10));
        REQUIRE(item.IsHit());
    }

    SECTION("zero and negative lifetimes expire at once")
    {
        item.ExpiresAfter(std::chrono::seconds(0));
        REQUIRE_FALSE(item.IsHit());

        item.ExpiresAfter(std::chrono::seconds(-1));
        REQUIRE_FALSE(item.IsHit());
    }

    SECTION("longer durations convert to seconds")
    {
        item.ExpiresAfter(std::chrono::minutes(2));
        REQUIRE(*item.GetExpirationTimestamp() >= Now() + std::chrono::seconds(119));
    }

    SECTION("absolute expirations in the past are misses")
    {
        item.ExpiresAt(Now() - std::chrono::seconds(1));
        REQUIRE_FALSE(item.IsHit());
        REQUIRE(item.Get().is_null());
    }

    SECTION("absolute expirations drop sub-second precision")
    {
        const auto target = Clock::now() + std::chrono::milliseconds(60'500);
        item.ExpiresAt(target);
        REQUIRE(*item.GetExpirationTimestamp() == std::chrono::floor<std::chrono::seconds>(target));
        REQUIRE(item.IsHit());
    }

    SECTION("clearing an absolute expiration")
    {
        item.ExpiresAt(Now() - std::chrono::seconds(1));
        item.ExpiresAt(std::nullopt);
        REQUIRE(item.IsHit());
    }

    SECTION("lifetimes that overflow the timestamp are rejected")
    {
        item.ExpiresAfter(std::chrono::seconds(30));
        REQUIRE_THROWS_AS(
            item.ExpiresAfter(std::chrono::seconds::max()), InvalidArgumentException
        );
        REQUIRE(item.IsHit());
    }
}

TEST_CASE("setting tags", "[cache_item]")
{
    CacheItem item("key", Value("value"));

    SECTION("duplicates collapse")
    {
        item.SetTags({"a", "b", "a"});
        REQUIRE(item.GetTags() == TagSet{"a", "b"});
    }

    SECTION("new tags replace old ones")
    {
        item.SetTags({"a"});
        item.SetTags({"b", "c"});
        REQUIRE(item.GetTags() == TagSet{"b", "c"});

        item.SetTags({});
        REQUIRE(item.GetTags().empty());
    }

    SECTION("empty tags are rejected")
    {
        REQUIRE_THROWS_AS(item.SetTags({""}), InvalidArgumentException);
    }

    SECTION("reserved characters are rejected without touching the current tags")
    {
        item.SetTags({"keep"});
        for (const char *tag : {"{a", "a}", "(a", "a)", "a/b", "a\\b", "a@b", "a:b"}) {
            INFO(tag);
            try {
                item.SetTags({"valid", tag});
                FAIL("SetTags accepted a reserved character");
            } catch (const InvalidArgumentException &e) {
                REQUIRE(e.errc() == CacheErrc::InvalidTag);
            }
            REQUIRE(item.GetTags() == TagSet{"keep"});
        }
    }
}

TEST_CASE("copies of an item are independent", "[cache_item]")
{
    CacheItem original("key", Value("one"));
    original.SetTags({"a"});

    CacheItem copy(original);
    copy.Set("two");
    copy.SetTags({"b"});

    REQUIRE(original.Get() == "one");
    REQUIRE(original.GetTags() == TagSet{"a"});
    REQUIRE(copy.Get() == "two");
    REQUIRE(copy.GetTags() == TagSet{"b"});
}

TEST_CASE("items are usable through the abstract interface", "[cache_item]")
{
    CacheItem item("key");
    ICacheItem &abstract = item;

    abstract.Set(3.5).ExpiresAfter(std::chrono::seconds(60));
    REQUIRE(abstract.IsHit());
    REQUIRE(abstract.Get() == 3.5);
    REQUIRE(abstract.GetKey() == "key");
}
