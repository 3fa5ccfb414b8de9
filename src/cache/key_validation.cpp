#include "cache/key_validation.hpp"

#include "app_constants.hpp"
#include "cache/cache_error.hpp"

#include <algorithm>
#include <filesystem>
#include <spdlog/fmt/fmt.h>

namespace TaggedFileCache::Cache
{

namespace
{

bool IsFileNameCharacter(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '.' || c == Constants::TAG_SEPARATOR || c == ' ';
}

}  // namespace

bool HasReservedCharacters(std::string_view s)
{
    return s.find_first_of(Constants::RESERVED_KEY_CHARACTERS) != std::string_view::npos;
}

void ValidateKey(std::string_view key)
{
    if (key.empty()) {
        throw InvalidArgumentException(CacheErrc::InvalidKey, "Cache key must not be empty");
    }
    if (HasReservedCharacters(key)) {
        throw InvalidArgumentException(
            CacheErrc::InvalidKey,
            fmt::format(
                "Invalid key \"{}\". Keys must not contain any of: {}", key,
                Constants::RESERVED_KEY_CHARACTERS
            )
        );
    }
}

void ValidateTag(std::string_view tag)
{
    if (tag.empty()) {
        throw InvalidArgumentException(CacheErrc::InvalidTag, "Tag must not be empty");
    }
    if (HasReservedCharacters(tag)) {
        throw InvalidArgumentException(
            CacheErrc::InvalidTag,
            fmt::format(
                "Invalid tag \"{}\". Tags must not contain any of: {}", tag,
                Constants::RESERVED_KEY_CHARACTERS
            )
        );
    }
}

bool IsValidFileName(std::string_view key)
{
    if (key.empty() || key == "." || key == "..") {
        return false;
    }
    return std::all_of(key.begin(), key.end(), IsFileNameCharacter);
}

void ValidateFileName(std::string_view key)
{
    if (!IsValidFileName(key)) {
        throw InvalidArgumentException(
            CacheErrc::InvalidKey,
            fmt::format(
                "Invalid key \"{}\". Valid file names may only contain letters, digits, "
                "'_', '.', '{}' and spaces",
                key, Constants::TAG_SEPARATOR
            )
        );
    }
}

void ValidateFolder(std::string_view folder)
{
    const std::filesystem::path folder_path(folder);
    const std::filesystem::path normal = folder_path.lexically_normal();

    bool escapes = false;
    for (const auto &component : folder_path) {
        if (component == "..") {
            escapes = true;
        }
    }
    if (folder.empty() || folder_path.is_absolute() || escapes || normal.empty() ||
        normal == ".") {
        throw InvalidArgumentException(
            CacheErrc::InvalidFolder,
            fmt::format(
                "Invalid folder \"{}\". The pool folder must be a relative path below the "
                "storage root",
                folder
            )
        );
    }
}

std::string TagListKey(std::string_view tag)
{
    std::string key(Constants::TAG_LIST_PREFIX);
    key += Constants::TAG_SEPARATOR;
    key += tag;
    return key;
}

}  // namespace TaggedFileCache::Cache
