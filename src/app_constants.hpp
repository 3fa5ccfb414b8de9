#ifndef TAGGEDFILECACHE_SRC_APP_CONSTANTS_HPP_
#define TAGGEDFILECACHE_SRC_APP_CONSTANTS_HPP_

#include <spdlog/common.h>
#include <sys/types.h>
#include <string_view>

namespace TaggedFileCache::Constants
{
// Application Info
constexpr std::string_view APP_NAME = "tagged-file-cache";
// TODO: Derive from cmake
constexpr std::string_view APP_VERSION_STRING = "tagged-file-cache version 0.1.0";

// Logging
constexpr spdlog::level::level_enum DEFAULT_LOG_LEVEL   = spdlog::level::info;
constexpr spdlog::level::level_enum DEFAULT_FLUSH_LEVEL = spdlog::level::warn;
constexpr std::string_view DEFAULT_CONSOLE_LOG_PATTERN  = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
constexpr std::string_view POOL_LOGGER_NAME             = "cache_pool";

// Pool layout
constexpr std::string_view DEFAULT_POOL_FOLDER = "cache";
constexpr std::string_view TAG_LIST_PREFIX     = "tag";
constexpr char TAG_SEPARATOR                   = '!';

// Characters reserved in keys and tags
constexpr std::string_view RESERVED_KEY_CHARACTERS = "{}()/\\@:";

// File modes
constexpr mode_t DEFAULT_DIRECTORY_MODE = 0700;
constexpr mode_t DEFAULT_FILE_MODE      = 0600;

}  // namespace TaggedFileCache::Constants

#endif  // TAGGEDFILECACHE_SRC_APP_CONSTANTS_HPP_
