#ifndef TAGGEDFILECACHE_SRC_CACHE_KEY_VALIDATION_HPP_
#define TAGGEDFILECACHE_SRC_CACHE_KEY_VALIDATION_HPP_

#include <string>
#include <string_view>

namespace TaggedFileCache::Cache
{

/// True when s contains one of the characters reserved for keys and tags.
bool HasReservedCharacters(std::string_view s);

/// Throws InvalidArgumentException(InvalidKey) for empty keys or reserved characters.
void ValidateKey(std::string_view key);

/// Throws InvalidArgumentException(InvalidTag) for empty tags or reserved characters.
void ValidateTag(std::string_view tag);

/// Whether key may be used verbatim as a file name inside the pool folder.
bool IsValidFileName(std::string_view key);

/// Throws InvalidArgumentException(InvalidKey) when IsValidFileName(key) is false.
void ValidateFileName(std::string_view key);

/// Throws InvalidArgumentException(InvalidFolder) unless folder names a directory strictly
/// below the storage root.
void ValidateFolder(std::string_view folder);

/// Storage key of the list indexing every item carrying tag.
std::string TagListKey(std::string_view tag);

}  // namespace TaggedFileCache::Cache

#endif  // TAGGEDFILECACHE_SRC_CACHE_KEY_VALIDATION_HPP_
