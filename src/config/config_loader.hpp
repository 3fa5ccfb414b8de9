#ifndef TAGGEDFILECACHE_SRC_CONFIG_CONFIG_LOADER_HPP_
#define TAGGEDFILECACHE_SRC_CONFIG_CONFIG_LOADER_HPP_

#include "config/config_types.hpp"

#include <expected>
#include <filesystem>
#include <string>

namespace TaggedFileCache::Config
{

//------------------------------------------------------------------------------//
// Error Handling for Configuration Loading
//------------------------------------------------------------------------------//

enum class LoadError {
    FileNotFound,
    JsonParseError,
    ValidationError,
};

using LoadResult   = std::expected<PoolConfig, LoadError>;
using LoadErrorMsg = std::expected<PoolConfig, std::string>;

LoadResult loadConfigFromFile(const std::filesystem::path &file_path);
LoadErrorMsg loadConfigFromFileVerbose(const std::filesystem::path &file_path);

}  // namespace TaggedFileCache::Config

#endif  // TAGGEDFILECACHE_SRC_CONFIG_CONFIG_LOADER_HPP_
