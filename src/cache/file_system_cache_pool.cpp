#include "cache/file_system_cache_pool.hpp"

#include "cache/cache_error.hpp"
#include "cache/key_validation.hpp"
#include "codec/record_codec.hpp"

#include <spdlog/sinks/null_sink.h>
#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace TaggedFileCache::Cache
{

namespace
{

std::shared_ptr<spdlog::logger> MakeSilentLogger()
{
    return std::make_shared<spdlog::logger>(
        std::string(Constants::POOL_LOGGER_NAME), std::make_shared<spdlog::sinks::null_sink_mt>()
    );
}

}  // namespace

//------------------------------------------------------------------------------//
// Class Creation and Destruction
//------------------------------------------------------------------------------//

FileSystemCachePool::FileSystemCachePool(
    std::shared_ptr<Storage::IStorage> storage, std::string folder,
    std::shared_ptr<spdlog::logger> logger
)
    : storage_(std::move(storage)),
      folder_(std::move(folder)),
      logger_(logger ? std::move(logger) : MakeSilentLogger())
{
    if (!storage_) {
        throw std::runtime_error("FileSystemCachePool requires a storage instance");
    }
    ValidateFolderOrThrow(folder_);

    auto create_res = storage_->CreateDirectory(folder_, Constants::DEFAULT_DIRECTORY_MODE);
    if (!create_res) {
        logger_->critical(
            "Failed to create cache folder '{}': {}", folder_, create_res.error().message()
        );
        throw CachePoolException(create_res.error(), "FileSystemCachePool");
    }
}

FileSystemCachePool::~FileSystemCachePool()
{
    try {
        if (!Commit()) {
            logger_->error("Failed to commit deferred items on pool destruction");
        }
    } catch (const std::exception &e) {
        logger_->error("Exception while committing deferred items on pool destruction: {}", e.what());
    }
}

//------------------------------------------------------------------------------//
// Public Methods
//------------------------------------------------------------------------------//

CacheItem FileSystemCachePool::GetItem(const std::string &key)
{
    ValidateKeyOrThrow(key);

    if (const CacheItem *pending = deferred_.Find(key)) {
        CacheItem clone(*pending);
        clone.MoveCurrentTagsToPrevious();
        return clone;
    }

    return CacheItem(key, [this, key]() { return FetchObjectFromCache(key); });
}

std::vector<CacheItem> FileSystemCachePool::GetItems(const std::vector<std::string> &keys)
{
    for (const auto &key : keys) {
        ValidateKeyOrThrow(key);
    }

    std::vector<CacheItem> items;
    items.reserve(keys.size());
    for (const auto &key : keys) {
        items.push_back(GetItem(key));
    }
    return items;
}

bool FileSystemCachePool::HasItem(const std::string &key) { return GetItem(key).IsHit(); }

bool FileSystemCachePool::Save(ICacheItem &item)
{
    CacheItem &cache_item = AsCacheItemOrThrow(item);
    const std::string &key = cache_item.GetKey();

    // Reject bad names before any tag list is touched.
    ValidateKeyOrThrow(key);
    GetFilePath(key);
    for (const auto &tag : cache_item.GetTags()) {
        GetFilePath(TagListKey(tag));
    }

    TagSet stale_tags;
    try {
        stale_tags = cache_item.GetPreviousTags();
    } catch (const CachePoolException &e) {
        logger_->critical("Failed to resolve item '{}' before saving: {}", key, e.what());
        return false;
    }
    if (!cache_item.ArePreviousTagsKnown()) {
        stale_tags.merge(ReadStoredTags(key));
    }

    if (!RemoveTagEntries(key, stale_tags)) {
        return false;
    }
    if (!SaveTags(cache_item)) {
        return false;
    }

    const auto expiration = cache_item.GetExpirationTimestamp();
    if (expiration && *expiration <= Now()) {
        logger_->debug("Item '{}' saved already expired, deleting it", key);
        if (!RemoveTagEntries(key, cache_item.GetTags())) {
            return false;
        }
        return DeleteItem(key);
    }

    return StoreItemInCache(cache_item);
}

bool FileSystemCachePool::SaveDeferred(const ICacheItem &item)
{
    const auto *cache_item = dynamic_cast<const CacheItem *>(&item);
    if (cache_item == nullptr) {
        ThrowForeignItem();
    }
    ValidateKeyOrThrow(cache_item->GetKey());

    deferred_.Put(*cache_item);
    return true;
}

bool FileSystemCachePool::Commit()
{
    // Saving may delete, and deleting commits again; the queue must already be empty then.
    std::vector<CacheItem> pending = deferred_.TakeAll();

    bool saved = true;
    for (auto &item : pending) {
        if (!Save(item)) {
            saved = false;
        }
    }
    return saved;
}

bool FileSystemCachePool::DeleteItem(const std::string &key) { return DeleteItems({key}); }

bool FileSystemCachePool::DeleteItems(const std::vector<std::string> &keys)
{
    for (const auto &key : keys) {
        ValidateKeyOrThrow(key);
    }

    bool deleted = true;
    for (const auto &key : keys) {
        deferred_.Erase(key);

        // Tag side effects of the other pending items must land before this cleanup runs.
        if (!Commit()) {
            logger_->warn("Committing deferred items before deleting '{}' failed", key);
        }

        if (!PreRemoveItem(key)) {
            deleted = false;
        }
        if (!ForceClear(key)) {
            deleted = false;
        }
    }
    return deleted;
}

bool FileSystemCachePool::Clear()
{
    deferred_.Clear();
    return ClearAllObjectsFromCache();
}

bool FileSystemCachePool::InvalidateTag(const std::string &tag)
{
    return InvalidateTags({tag});
}

bool FileSystemCachePool::InvalidateTags(const std::vector<std::string> &tags)
{
    for (const auto &tag : tags) {
        ValidateTagOrThrow(tag);
    }

    std::vector<std::string> keys;
    std::unordered_set<std::string> seen;
    for (const auto &tag : tags) {
        auto list_res = GetList(TagListKey(tag));
        if (!list_res) {
            logger_->critical(
                "Failed to read the list of tag '{}': {}", tag, list_res.error().message()
            );
            return false;
        }
        for (auto &key : *list_res) {
            if (seen.insert(key).second) {
                keys.push_back(std::move(key));
            }
        }
    }

    if (!DeleteItems(keys)) {
        logger_->error("Failed to delete every item of the invalidated tags; tag lists kept");
        return false;
    }

    bool success = true;
    for (const auto &tag : tags) {
        if (auto remove_res = RemoveList(TagListKey(tag)); !remove_res) {
            logger_->critical(
                "Failed to remove the list of tag '{}': {}", tag, remove_res.error().message()
            );
            success = false;
        }
    }

    logger_->debug("Invalidated {} tag(s) covering {} item(s)", tags.size(), keys.size());
    return success;
}

void FileSystemCachePool::SetFolder(std::string folder)
{
    ValidateFolderOrThrow(folder);
    folder_ = std::move(folder);
}

void FileSystemCachePool::SetLogger(std::shared_ptr<spdlog::logger> logger)
{
    logger_ = logger ? std::move(logger) : MakeSilentLogger();
}

//------------------------------------------------------------------------------//
// Private Methods
//------------------------------------------------------------------------------//

void FileSystemCachePool::ValidateKeyOrThrow(std::string_view key) const
{
    try {
        ValidateKey(key);
    } catch (const InvalidArgumentException &e) {
        logger_->warn("{}", e.what());
        throw;
    }
}

void FileSystemCachePool::ValidateTagOrThrow(std::string_view tag) const
{
    try {
        ValidateTag(tag);
    } catch (const InvalidArgumentException &e) {
        logger_->warn("{}", e.what());
        throw;
    }
}

void FileSystemCachePool::ValidateFolderOrThrow(std::string_view folder) const
{
    try {
        ValidateFolder(folder);
    } catch (const InvalidArgumentException &e) {
        logger_->warn("{}", e.what());
        throw;
    }
}

void FileSystemCachePool::ThrowForeignItem() const
{
    InvalidArgumentException e(
        CacheErrc::ForeignItem,
        "Cache items are not transferable between pools. Item MUST be a CacheItem."
    );
    logger_->warn("{}", e.what());
    throw e;
}

CacheItem &FileSystemCachePool::AsCacheItemOrThrow(ICacheItem &item) const
{
    auto *cache_item = dynamic_cast<CacheItem *>(&item);
    if (cache_item == nullptr) {
        ThrowForeignItem();
    }
    return *cache_item;
}

fs::path FileSystemCachePool::GetFilePath(std::string_view key) const
{
    try {
        ValidateFileName(key);
    } catch (const InvalidArgumentException &e) {
        logger_->warn("{}", e.what());
        throw;
    }
    return fs::path(folder_) / std::string(key);
}

FetchResult FileSystemCachePool::FetchObjectFromCache(const std::string &key)
{
    const fs::path file = GetFilePath(key);

    auto bytes_res = storage_->ReadFile(file);
    if (!bytes_res) {
        logger_->debug("Miss for '{}': {}", key, bytes_res.error().message());
        return {};
    }

    auto record_res = Codec::DecodeRecord(*bytes_res);
    if (!record_res) {
        logger_->debug("Miss for '{}': {}", key, record_res.error().message());
        return {};
    }
    Codec::ItemRecord &record = *record_res;

    if (record.expiration && *record.expiration <= Now()) {
        logger_->debug("Evicting expired item '{}'", key);
        for (const auto &tag : record.tags) {
            if (auto remove_res = RemoveListItem(TagListKey(tag), key); !remove_res) {
                logger_->critical(
                    "Failed to purge expired '{}' from tag '{}': {}", key, tag,
                    remove_res.error().message()
                );
                throw CachePoolException(remove_res.error(), "FetchObjectFromCache");
            }
        }
        if (auto remove_res = storage_->Remove(file); !remove_res) {
            logger_->critical(
                "Failed to delete expired '{}': {}", key, remove_res.error().message()
            );
            throw CachePoolException(remove_res.error(), "FetchObjectFromCache");
        }
        return {};
    }

    return FetchResult{true, std::move(record.value), std::move(record.tags), record.expiration};
}

bool FileSystemCachePool::StoreItemInCache(CacheItem &item)
{
    Codec::ItemRecord record{item.Get(), item.GetTags(), item.GetExpirationTimestamp()};
    const auto bytes = Codec::EncodeRecord(record);

    if (auto write_res = storage_->WriteFile(GetFilePath(item.GetKey()), bytes); !write_res) {
        logger_->critical(
            "Failed to store item '{}': {}", item.GetKey(), write_res.error().message()
        );
        return false;
    }
    return true;
}

TagSet FileSystemCachePool::ReadStoredTags(const std::string &key)
{
    auto bytes_res = storage_->ReadFile(GetFilePath(key));
    if (!bytes_res) {
        return {};
    }
    auto record_res = Codec::DecodeRecord(*bytes_res);
    if (!record_res) {
        return {};
    }
    return std::move(record_res->tags);
}

bool FileSystemCachePool::RemoveTagEntries(const std::string &key, const TagSet &tags)
{
    for (const auto &tag : tags) {
        if (auto remove_res = RemoveListItem(TagListKey(tag), key); !remove_res) {
            logger_->critical(
                "Failed to remove '{}' from tag '{}': {}", key, tag, remove_res.error().message()
            );
            return false;
        }
    }
    return true;
}

bool FileSystemCachePool::SaveTags(const CacheItem &item)
{
    for (const auto &tag : item.GetTags()) {
        if (auto append_res = AppendListItem(TagListKey(tag), item.GetKey()); !append_res) {
            logger_->critical(
                "Failed to add '{}' to tag '{}': {}", item.GetKey(), tag,
                append_res.error().message()
            );
            return false;
        }
    }
    return true;
}

bool FileSystemCachePool::PreRemoveItem(const std::string &key)
{
    CacheItem item = GetItem(key);
    try {
        return RemoveTagEntries(key, item.GetPreviousTags());
    } catch (const CachePoolException &e) {
        logger_->critical("Failed to resolve item '{}' before deleting it: {}", key, e.what());
        return false;
    }
}

bool FileSystemCachePool::ForceClear(const std::string &key)
{
    if (auto remove_res = storage_->Remove(GetFilePath(key)); !remove_res) {
        logger_->critical("Failed to delete item '{}': {}", key, remove_res.error().message());
        return false;
    }
    return true;
}

bool FileSystemCachePool::ClearAllObjectsFromCache()
{
    if (auto remove_res = storage_->RemoveDirectory(folder_); !remove_res) {
        logger_->critical(
            "Failed to remove cache folder '{}': {}", folder_, remove_res.error().message()
        );
        return false;
    }
    if (auto create_res = storage_->CreateDirectory(folder_, Constants::DEFAULT_DIRECTORY_MODE);
        !create_res) {
        logger_->critical(
            "Failed to recreate cache folder '{}': {}", folder_, create_res.error().message()
        );
        return false;
    }
    logger_->info("Cleared cache folder '{}'", folder_);
    return true;
}

Storage::StorageResult<std::vector<std::string>> FileSystemCachePool::GetList(
    const std::string &name
)
{
    const fs::path file = GetFilePath(name);

    auto exists_res = storage_->CheckIfFileExists(file);
    if (!exists_res) {
        return std::unexpected(exists_res.error());
    }
    if (!*exists_res) {
        if (auto write_res = storage_->WriteFile(file, Codec::EncodeKeyList({})); !write_res) {
            return std::unexpected(write_res.error());
        }
    }

    auto bytes_res = storage_->ReadFile(file);
    if (!bytes_res) {
        return std::unexpected(bytes_res.error());
    }
    return Codec::DecodeKeyList(*bytes_res);
}

Storage::StorageResult<void> FileSystemCachePool::AppendListItem(
    const std::string &name, const std::string &key
)
{
    auto list_res = GetList(name);
    if (!list_res) {
        return std::unexpected(list_res.error());
    }
    list_res->push_back(key);
    return storage_->WriteFile(GetFilePath(name), Codec::EncodeKeyList(*list_res));
}

Storage::StorageResult<void> FileSystemCachePool::RemoveListItem(
    const std::string &name, const std::string &key
)
{
    auto list_res = GetList(name);
    if (!list_res) {
        return std::unexpected(list_res.error());
    }
    std::erase(*list_res, key);
    return storage_->WriteFile(GetFilePath(name), Codec::EncodeKeyList(*list_res));
}

Storage::StorageResult<void> FileSystemCachePool::RemoveList(const std::string &name)
{
    return storage_->Remove(GetFilePath(name));
}

}  // namespace TaggedFileCache::Cache
