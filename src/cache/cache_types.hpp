#ifndef TAGGEDFILECACHE_SRC_CACHE_CACHE_TYPES_HPP_
#define TAGGEDFILECACHE_SRC_CACHE_CACHE_TYPES_HPP_

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>

namespace TaggedFileCache::Cache
{

using Value     = nlohmann::json;
using TagSet    = std::set<std::string>;
using Clock     = std::chrono::system_clock;
using Timestamp = std::chrono::sys_seconds;

using Expiration = std::optional<Timestamp>;

inline Timestamp Now() { return std::chrono::floor<std::chrono::seconds>(Clock::now()); }

}  // namespace TaggedFileCache::Cache

#endif  // TAGGEDFILECACHE_SRC_CACHE_CACHE_TYPES_HPP_
