#ifndef TAGGEDFILECACHE_SRC_STORAGE_STORAGE_ERROR_HPP_
#define TAGGEDFILECACHE_SRC_STORAGE_STORAGE_ERROR_HPP_

#include <cerrno>
#include <expected>
#include <string>
#include <system_error>
#include <type_traits>

namespace TaggedFileCache::Storage
{

//------------------------------------------------------------------------------//
// Error Codes declared for Storage Operations
//------------------------------------------------------------------------------//

// clang-format off
enum class StorageErrc {
    Success = 0,       // Not an error
    FileNotFound,      // Path does not exist
    PermissionDenied,  // Operation not permitted
    IOError,           // General I/O error during read/write/etc.
    NotSupported,      // Operation is not supported by this storage type/backend
    OutOfSpace,        // No space left on the storage medium
    AlreadyExists,     // Attempted to create something that already exists
    NotADirectory,     // Expected a directory, found a file
    IsADirectory,      // Expected a file, found a directory
    InvalidPath,       // Path format or content is invalid for the storage
    UnknownError,      // An unspecified error occurred
};
// clang-format on

std::error_code make_error_code(StorageErrc e);

inline StorageErrc ErrnoToStorageErrc(int err_no)
{
    switch (err_no) {
        case 0:
            return StorageErrc::Success;
        case ENOENT:
            return StorageErrc::FileNotFound;
        case EACCES:
        case EPERM:
            return StorageErrc::PermissionDenied;
        case EIO:
            return StorageErrc::IOError;
        case ENOSPC:
            return StorageErrc::OutOfSpace;
        case EEXIST:
            return StorageErrc::AlreadyExists;
        case ENOTDIR:
            return StorageErrc::NotADirectory;
        case EISDIR:
            return StorageErrc::IsADirectory;
        case EOPNOTSUPP:
            return StorageErrc::NotSupported;
        case ENAMETOOLONG:
            return StorageErrc::InvalidPath;

        default:
            return StorageErrc::UnknownError;
    }
}

//------------------------------------------------------------------------------//
// Error Category Definition (Private Implementation Detail)
//------------------------------------------------------------------------------//
namespace detail
{
class StorageErrorCategory : public std::error_category
{
    public:
    const char* name() const noexcept override { return "TaggedFileCache::Storage"; }
    std::string message(int ev) const override
    {
        switch (static_cast<StorageErrc>(ev)) {
            case StorageErrc::Success:
                return "Success";
            case StorageErrc::FileNotFound:
                return "File or directory not found";
            case StorageErrc::PermissionDenied:
                return "Permission denied";
            case StorageErrc::IOError:
                return "Input/output error";
            case StorageErrc::NotSupported:
                return "Operation not supported";
            case StorageErrc::OutOfSpace:
                return "No space left on device";
            case StorageErrc::AlreadyExists:
                return "File or directory already exists";
            case StorageErrc::NotADirectory:
                return "Path is not a directory";
            case StorageErrc::IsADirectory:
                return "Path is a directory";
            case StorageErrc::InvalidPath:
                return "Invalid path";
            case StorageErrc::UnknownError:
                return "Unknown storage error";
            default:
                return "Unrecognized error code";
        }
    }
};
}  // namespace detail

// Global instance of the category
inline const detail::StorageErrorCategory storage_error_category;

// Make the enum usable with std::error_code
inline std::error_code make_error_code(StorageErrc e)
{
    return {static_cast<int>(e), storage_error_category};
}

//------------------------------------------------------------------------------//
// Result Type Alias
//------------------------------------------------------------------------------//
template <typename T>
using StorageResult = std::expected<T, std::error_code>;

}  // namespace TaggedFileCache::Storage

// Enable std::error_code implicit conversion for StorageErrc
namespace std
{
template <>
struct is_error_code_enum<TaggedFileCache::Storage::StorageErrc> : true_type {
};
}  // namespace std

#endif  // TAGGEDFILECACHE_SRC_STORAGE_STORAGE_ERROR_HPP_
