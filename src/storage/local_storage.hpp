#ifndef TAGGEDFILECACHE_SRC_STORAGE_LOCAL_STORAGE_HPP_
#define TAGGEDFILECACHE_SRC_STORAGE_LOCAL_STORAGE_HPP_

#include "config/config_types.hpp"
#include "storage/i_storage.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <system_error>

namespace TaggedFileCache::Storage
{

namespace fs = std::filesystem;

class LocalStorage : public IStorage
{
    public:
    explicit LocalStorage(const Config::StorageDefinition& definition);
    ~LocalStorage() override = default;

    LocalStorage(const LocalStorage&)            = delete;
    LocalStorage& operator=(const LocalStorage&) = delete;
    LocalStorage(LocalStorage&&)                 = delete;
    LocalStorage& operator=(LocalStorage&&)      = delete;

    Config::StorageType GetType() const override;
    const std::filesystem::path& GetPath() const override;

    StorageResult<void> Initialize() override;

    StorageResult<std::vector<std::byte>> ReadFile(const std::filesystem::path& relative_path
    ) const override;
    StorageResult<void> WriteFile(
        const std::filesystem::path& relative_path, std::span<const std::byte> data
    ) override;
    StorageResult<void> Remove(const std::filesystem::path& relative_path) override;

    StorageResult<bool> CheckIfFileExists(const std::filesystem::path& relative_path
    ) const override;

    StorageResult<void> CreateDirectory(
        const std::filesystem::path& relative_path,
        mode_t mode = Constants::DEFAULT_DIRECTORY_MODE
    ) override;
    StorageResult<void> RemoveDirectory(const std::filesystem::path& relative_path) override;
    StorageResult<bool> CheckIfDirectoryExists(const std::filesystem::path& relative_path
    ) const override;

    std::filesystem::path RelativeToAbsPath(const std::filesystem::path& relative_path
    ) const override;

    private:
    std::filesystem::path GetValidatedFullPath(const std::filesystem::path& relative_path) const;
    std::error_code MapFilesystemError(const std::error_code& ec, const std::string& operation = "")
        const;
    StorageResult<void> EnsureParentDirectory(const std::filesystem::path& full_path);

    const Config::StorageDefinition definition_;
    fs::path base_path_;
    mutable std::recursive_mutex storage_mutex_;
};

}  // namespace TaggedFileCache::Storage

#endif  // TAGGEDFILECACHE_SRC_STORAGE_LOCAL_STORAGE_HPP_
