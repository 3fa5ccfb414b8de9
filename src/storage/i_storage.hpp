#ifndef TAGGEDFILECACHE_SRC_STORAGE_I_STORAGE_HPP_
#define TAGGEDFILECACHE_SRC_STORAGE_I_STORAGE_HPP_

#include "app_constants.hpp"
#include "config/config_types.hpp"
#include "storage/storage_error.hpp"

#include <sys/types.h>
#include <cstddef>
#include <filesystem>
#include <span>
#include <vector>

namespace TaggedFileCache::Storage
{

namespace fs = std::filesystem;

/// Whole-file byte store rooted at a single directory. Every path argument is
/// relative to that root.
class IStorage
{
    public:
    virtual ~IStorage() = default;

    [[nodiscard]] virtual Config::StorageType GetType() const = 0;
    [[nodiscard]] virtual const std::filesystem::path& GetPath() const = 0;

    virtual StorageResult<void> Initialize() = 0;

    virtual StorageResult<std::vector<std::byte>> ReadFile(
        const std::filesystem::path& relative_path
    ) const = 0;

    /// Replaces the whole file atomically, creating parent directories.
    virtual StorageResult<void> WriteFile(
        const std::filesystem::path& relative_path, std::span<const std::byte> data
    ) = 0;

    /// Succeeds when the file is already absent.
    virtual StorageResult<void> Remove(const std::filesystem::path& relative_path) = 0;

    virtual StorageResult<bool> CheckIfFileExists(const std::filesystem::path& relative_path
    ) const = 0;

    virtual StorageResult<void> CreateDirectory(
        const std::filesystem::path& relative_path,
        mode_t mode = Constants::DEFAULT_DIRECTORY_MODE
    ) = 0;

    /// Recursive. Succeeds when the directory is already absent.
    virtual StorageResult<void> RemoveDirectory(const std::filesystem::path& relative_path) = 0;

    virtual StorageResult<bool> CheckIfDirectoryExists(const std::filesystem::path& relative_path
    ) const = 0;

    /// Returns an empty path when relative_path escapes the root.
    virtual std::filesystem::path RelativeToAbsPath(const std::filesystem::path& relative_path
    ) const = 0;
};

}  // namespace TaggedFileCache::Storage

#endif  // TAGGEDFILECACHE_SRC_STORAGE_I_STORAGE_HPP_
