#ifndef TAGGEDFILECACHE_SRC_CODEC_RECORD_CODEC_HPP_
#define TAGGEDFILECACHE_SRC_CODEC_RECORD_CODEC_HPP_

#include "cache/cache_types.hpp"

#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace TaggedFileCache::Codec
{

/// What is persisted for a single cache item.
struct ItemRecord {
    Cache::Value value;
    Cache::TagSet tags;
    Cache::Expiration expiration;
};

template <typename T>
using CodecResult = std::expected<T, std::error_code>;

//------------------------------------------------------------------------------//
// MessagePack encoding
//
// Item record: [value, [tag...], expiration-seconds | nil]
// Key list:    [key...]
//
// Decoding never throws; any malformed input is reported as CacheErrc::CorruptRecord.
//------------------------------------------------------------------------------//

std::vector<std::byte> EncodeRecord(const ItemRecord &record);
CodecResult<ItemRecord> DecodeRecord(std::span<const std::byte> bytes);

std::vector<std::byte> EncodeKeyList(const std::vector<std::string> &keys);
CodecResult<std::vector<std::string>> DecodeKeyList(std::span<const std::byte> bytes);

}  // namespace TaggedFileCache::Codec

#endif  // TAGGEDFILECACHE_SRC_CODEC_RECORD_CODEC_HPP_
