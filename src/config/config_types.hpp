#ifndef TAGGEDFILECACHE_SRC_CONFIG_CONFIG_TYPES_HPP_
#define TAGGEDFILECACHE_SRC_CONFIG_CONFIG_TYPES_HPP_

#include "app_constants.hpp"

#include <spdlog/spdlog.h>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace TaggedFileCache::Config
{

//------------------------------------------------------------------------------//
// Enumerations for Configuration Types
//------------------------------------------------------------------------------//

enum class StorageType : std::uint8_t { Local };

std::optional<StorageType> StringToStorageType(const std::string &type_str);
const char *StorageTypeToString(StorageType type);

// Function to convert string to spdlog::level::level_enum
std::optional<spdlog::level::level_enum> StringToLogLevel(const std::string &level_str);

//------------------------------------------------------------------------------//
// Structs for Configuration Types
//------------------------------------------------------------------------------//

struct GlobalSettings {
    spdlog::level::level_enum log_level = Constants::DEFAULT_LOG_LEVEL;
};

struct StorageDefinition {
    std::filesystem::path path;  ///< Root directory of the storage
    StorageType type = StorageType::Local;

    bool IsValid() const;
};

struct PoolSettings {
    std::string folder = std::string(Constants::DEFAULT_POOL_FOLDER);  ///< Relative to the root

    bool IsValid() const;
};

struct PoolConfig {
    StorageDefinition storage_definition;
    PoolSettings pool_settings;
    GlobalSettings global_settings;

    bool IsValid() const { return storage_definition.IsValid() && pool_settings.IsValid(); }
};

//------------------------------------------------------------------------------//
// Implementation of Enum / Logging Conversion Functions
//------------------------------------------------------------------------------//

inline std::optional<spdlog::level::level_enum> StringToLogLevel(const std::string &level_str)
{
    if (level_str == "trace") {
        return spdlog::level::trace;
    }
    if (level_str == "debug") {
        return spdlog::level::debug;
    }
    if (level_str == "info") {
        return spdlog::level::info;
    }
    if (level_str == "warn") {
        return spdlog::level::warn;
    }
    if (level_str == "error") {
        return spdlog::level::err;
    }
    if (level_str == "fatal" || level_str == "critical") {
        return spdlog::level::critical;
    }
    if (level_str == "off") {
        return spdlog::level::off;
    }
    return std::nullopt;
}

inline std::optional<StorageType> StringToStorageType(const std::string &type_str)
{
    if (type_str == "local") {
        return StorageType::Local;
    }
    return std::nullopt;
}

inline const char *StorageTypeToString(StorageType type)
{
    switch (type) {
        case StorageType::Local:
            return "Local";
        default:
            return "Unknown";
    }
}

//------------------------------------------------------------------------------//
// Implementation of Configuration Structs Functions
//------------------------------------------------------------------------------//

inline bool StorageDefinition::IsValid() const { return !path.empty(); }

inline bool PoolSettings::IsValid() const
{
    if (folder.empty()) {
        return false;
    }
    const std::filesystem::path folder_path(folder);
    if (folder_path.is_absolute()) {
        spdlog::error("Pool folder '{}' must be relative to the storage root.", folder);
        return false;
    }
    for (const auto &component : folder_path) {
        if (component == "..") {
            spdlog::error("Pool folder '{}' must not leave the storage root.", folder);
            return false;
        }
    }
    const auto normal = folder_path.lexically_normal();
    if (normal.empty() || normal == ".") {
        spdlog::error("Pool folder '{}' must not be the storage root itself.", folder);
        return false;
    }
    return true;
}

}  // namespace TaggedFileCache::Config

#endif  // TAGGEDFILECACHE_SRC_CONFIG_CONFIG_TYPES_HPP_
