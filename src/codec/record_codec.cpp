#include "codec/record_codec.hpp"

#include "cache/cache_error.hpp"

#include <cstdint>
#include <cstring>
#include <limits>

namespace TaggedFileCache::Codec
{

using json = nlohmann::json;

namespace
{

constexpr std::size_t kRecordFieldCount = 3;

std::vector<std::byte> ToBytes(const std::vector<std::uint8_t> &raw)
{
    std::vector<std::byte> bytes(raw.size());
    if (!raw.empty()) {
        std::memcpy(bytes.data(), raw.data(), raw.size());
    }
    return bytes;
}

json ParseMsgpack(std::span<const std::byte> bytes)
{
    const auto *first = reinterpret_cast<const std::uint8_t *>(bytes.data());
    return json::from_msgpack(first, first + bytes.size(), true, false);
}

std::unexpected<std::error_code> Corrupt()
{
    return std::unexpected(Cache::make_error_code(Cache::CacheErrc::CorruptRecord));
}

}  // namespace

std::vector<std::byte> EncodeRecord(const ItemRecord &record)
{
    json tags = json::array();
    for (const auto &tag : record.tags) {
        tags.push_back(tag);
    }

    json doc = json::array();
    doc.push_back(record.value);
    doc.push_back(std::move(tags));
    if (record.expiration) {
        doc.push_back(static_cast<std::int64_t>(record.expiration->time_since_epoch().count()));
    } else {
        doc.push_back(nullptr);
    }

    return ToBytes(json::to_msgpack(doc));
}

CodecResult<ItemRecord> DecodeRecord(std::span<const std::byte> bytes)
{
    json doc = ParseMsgpack(bytes);
    if (doc.is_discarded() || !doc.is_array() || doc.size() != kRecordFieldCount) {
        return Corrupt();
    }

    ItemRecord record;
    record.value = std::move(doc[0]);

    const json &tags = doc[1];
    if (!tags.is_array()) {
        return Corrupt();
    }
    for (const auto &tag : tags) {
        if (!tag.is_string()) {
            return Corrupt();
        }
        record.tags.insert(tag.get<std::string>());
    }

    const json &expiration = doc[2];
    if (expiration.is_number_unsigned()) {
        const auto seconds = expiration.get<std::uint64_t>();
        if (seconds > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return Corrupt();
        }
        record.expiration = Cache::Timestamp(std::chrono::seconds(static_cast<std::int64_t>(seconds)));
    } else if (expiration.is_number_integer()) {
        record.expiration = Cache::Timestamp(std::chrono::seconds(expiration.get<std::int64_t>()));
    } else if (!expiration.is_null()) {
        return Corrupt();
    }

    return record;
}

std::vector<std::byte> EncodeKeyList(const std::vector<std::string> &keys)
{
    return ToBytes(json::to_msgpack(json(keys)));
}

CodecResult<std::vector<std::string>> DecodeKeyList(std::span<const std::byte> bytes)
{
    json doc = ParseMsgpack(bytes);
    if (doc.is_discarded() || !doc.is_array()) {
        return Corrupt();
    }

    std::vector<std::string> keys;
    keys.reserve(doc.size());
    for (const auto &entry : doc) {
        if (!entry.is_string()) {
            return Corrupt();
        }
        keys.push_back(entry.get<std::string>());
    }
    return keys;
}

}  // namespace TaggedFileCache::Codec
