#ifndef TAGGEDFILECACHE_SRC_CACHE_FILE_SYSTEM_CACHE_POOL_HPP_
#define TAGGEDFILECACHE_SRC_CACHE_FILE_SYSTEM_CACHE_POOL_HPP_

#include "app_constants.hpp"
#include "cache/cache_item.hpp"
#include "cache/cache_types.hpp"
#include "cache/deferred_queue.hpp"
#include "storage/i_storage.hpp"
#include "storage/storage_error.hpp"

#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace TaggedFileCache::Cache
{

namespace fs = std::filesystem;

/// Persistent key/value pool over an IStorage. Every item is one file under the
/// pool folder; each tag is a list file ("tag!<name>") holding the keys that carry it.
///
/// Items handed out by GetItem() resolve lazily through this pool, so the pool must
/// outlive them. Not thread safe.
class FileSystemCachePool
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    explicit FileSystemCachePool(
        std::shared_ptr<Storage::IStorage> storage,
        std::string folder                      = std::string(Constants::DEFAULT_POOL_FOLDER),
        std::shared_ptr<spdlog::logger> logger  = nullptr
    );
    /// Commits whatever is still deferred.
    ~FileSystemCachePool();

    FileSystemCachePool(const FileSystemCachePool &)            = delete;
    FileSystemCachePool &operator=(const FileSystemCachePool &) = delete;
    FileSystemCachePool(FileSystemCachePool &&)                 = delete;
    FileSystemCachePool &operator=(FileSystemCachePool &&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    CacheItem GetItem(const std::string &key);
    std::vector<CacheItem> GetItems(const std::vector<std::string> &keys);
    bool HasItem(const std::string &key);

    bool Save(ICacheItem &item);
    bool SaveDeferred(const ICacheItem &item);
    bool Commit();

    bool DeleteItem(const std::string &key);
    bool DeleteItems(const std::vector<std::string> &keys);
    bool Clear();

    bool InvalidateTag(const std::string &tag);
    bool InvalidateTags(const std::vector<std::string> &tags);

    /// Throws InvalidArgumentException unless folder stays strictly below the storage root.
    void SetFolder(std::string folder);
    [[nodiscard]] const std::string &GetFolder() const { return folder_; }

    void SetLogger(std::shared_ptr<spdlog::logger> logger);

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//

    void ValidateKeyOrThrow(std::string_view key) const;
    void ValidateTagOrThrow(std::string_view tag) const;
    void ValidateFolderOrThrow(std::string_view folder) const;
    [[noreturn]] void ThrowForeignItem() const;
    CacheItem &AsCacheItemOrThrow(ICacheItem &item) const;

    /// Throws InvalidArgumentException when key cannot name a file.
    fs::path GetFilePath(std::string_view key) const;

    FetchResult FetchObjectFromCache(const std::string &key);
    bool StoreItemInCache(CacheItem &item);
    TagSet ReadStoredTags(const std::string &key);

    bool RemoveTagEntries(const std::string &key, const TagSet &tags);
    bool SaveTags(const CacheItem &item);
    bool PreRemoveItem(const std::string &key);
    bool ForceClear(const std::string &key);
    bool ClearAllObjectsFromCache();

    Storage::StorageResult<std::vector<std::string>> GetList(const std::string &name);
    Storage::StorageResult<void> AppendListItem(const std::string &name, const std::string &key);
    Storage::StorageResult<void> RemoveListItem(const std::string &name, const std::string &key);
    Storage::StorageResult<void> RemoveList(const std::string &name);

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//

    std::shared_ptr<Storage::IStorage> storage_;
    std::string folder_;
    std::shared_ptr<spdlog::logger> logger_;
    DeferredQueue deferred_;
};

}  // namespace TaggedFileCache::Cache

#endif  // TAGGEDFILECACHE_SRC_CACHE_FILE_SYSTEM_CACHE_POOL_HPP_
