#ifndef TAGGEDFILECACHE_SRC_CACHE_CACHE_ERROR_HPP_
#define TAGGEDFILECACHE_SRC_CACHE_CACHE_ERROR_HPP_

#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace TaggedFileCache::Cache
{

//------------------------------------------------------------------------------//
// Error Codes declared for Cache Operations
//------------------------------------------------------------------------------//

// clang-format off
enum class CacheErrc {
    Success = 0,        // Not an error
    InvalidKey,         // Key is empty, uses a reserved character or is not a valid file name
    InvalidTag,         // Tag is empty or uses a reserved character
    InvalidExpiration,  // Expiration cannot be represented
    ForeignItem,        // Item was not created by this pool implementation
    InvalidFolder,      // Pool folder is empty, absolute or leaves the storage root
    CorruptRecord,      // Stored bytes could not be decoded
};
// clang-format on

std::error_code make_error_code(CacheErrc e);

//------------------------------------------------------------------------------//
// Error Category Definition (Private Implementation Detail)
//------------------------------------------------------------------------------//
namespace detail
{
class CacheErrorCategory : public std::error_category
{
    public:
    const char* name() const noexcept override { return "TaggedFileCache::Cache"; }
    std::string message(int ev) const override
    {
        switch (static_cast<CacheErrc>(ev)) {
            case CacheErrc::Success:
                return "Success";
            case CacheErrc::InvalidKey:
                return "Invalid cache key";
            case CacheErrc::InvalidTag:
                return "Invalid tag";
            case CacheErrc::InvalidExpiration:
                return "Invalid expiration";
            case CacheErrc::ForeignItem:
                return "Item does not belong to this cache pool implementation";
            case CacheErrc::InvalidFolder:
                return "Invalid pool folder";
            case CacheErrc::CorruptRecord:
                return "Corrupt cache record";
            default:
                return "Unrecognized error code";
        }
    }
};
}  // namespace detail

inline const detail::CacheErrorCategory cache_error_category;

inline std::error_code make_error_code(CacheErrc e) { return {static_cast<int>(e), cache_error_category}; }

//------------------------------------------------------------------------------//
// Exception Types
//------------------------------------------------------------------------------//

/// Raised for caller mistakes such as bad keys, tags, expirations or folders.
class InvalidArgumentException : public std::invalid_argument
{
    private:
    CacheErrc errc_;

    public:
    InvalidArgumentException(CacheErrc errc, const std::string& what)
        : std::invalid_argument(what), errc_(errc)
    {
    }

    CacheErrc errc() const noexcept { return errc_; }
    std::error_code code() const noexcept { return make_error_code(errc_); }
};

/// Raised when a non-boolean pool operation cannot reach its storage.
class CachePoolException : public std::runtime_error
{
    private:
    std::error_code ec_;
    std::string operation_;

    public:
    CachePoolException(std::error_code ec, std::string operation)
        : std::runtime_error(operation + ": " + ec.message()), ec_(ec), operation_(std::move(operation))
    {
    }

    const std::error_code& code() const noexcept { return ec_; }
    const std::string& operation() const noexcept { return operation_; }
};

}  // namespace TaggedFileCache::Cache

namespace std
{
template <>
struct is_error_code_enum<TaggedFileCache::Cache::CacheErrc> : true_type {
};
}  // namespace std

#endif  // TAGGEDFILECACHE_SRC_CACHE_CACHE_ERROR_HPP_
