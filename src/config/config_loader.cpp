#include "config_loader.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include "config_types.hpp"

#define TRY_ASSIGN(target, json_obj, key, type)                            \
    try {                                                                  \
        if (json_obj.contains(key)) {                                      \
            target = json_obj.at(key).get<type>();                         \
        }                                                                  \
    } catch (const nlohmann::json::exception &e) {                         \
        spdlog::error("JSON parse error for key '{}': {}", key, e.what()); \
        return std::unexpected(LoadError::JsonParseError);                 \
    }

#define TRY_ASSIGN_REQUIRED(target, json_obj, key, type)                            \
    try {                                                                           \
        if (!json_obj.contains(key)) {                                              \
            spdlog::error("Missing required JSON key: '{}'", key);                  \
            return std::unexpected(LoadError::ValidationError);                     \
        }                                                                           \
        target = json_obj.at(key).get<type>();                                      \
    } catch (const nlohmann::json::exception &e) {                                  \
        spdlog::error("JSON parse error for required key '{}': {}", key, e.what()); \
        return std::unexpected(LoadError::JsonParseError);                          \
    }

namespace TaggedFileCache::Config
{

LoadResult loadConfigFromFile(const std::filesystem::path &file_path)
{
    spdlog::info("Attempting to load configuration from: {}", file_path.string());

    std::ifstream config_stream(file_path);
    if (!config_stream.is_open()) {
        spdlog::error("Failed to open config file: {}", file_path.string());
        return std::unexpected(LoadError::FileNotFound);
    }

    nlohmann::json j;
    try {
        config_stream >> j;
    } catch (const nlohmann::json::parse_error &e) {
        spdlog::error("Failed to parse JSON config file: {}", e.what());
        return std::unexpected(LoadError::JsonParseError);
    }

    if (!j.is_object()) {
        spdlog::error("Configuration root must be a JSON object.");
        return std::unexpected(LoadError::ValidationError);
    }

    PoolConfig config;

    if (!j.contains("storage") || !j.at("storage").is_object()) {
        spdlog::error("'storage' object is missing or not an object.");
        return std::unexpected(LoadError::ValidationError);
    }
    const auto &storage_json = j.at("storage");
    {
        std::string storage_type_str;
        std::string storage_path_str;
        TRY_ASSIGN_REQUIRED(storage_type_str, storage_json, "type", std::string);
        TRY_ASSIGN_REQUIRED(storage_path_str, storage_json, "path", std::string);

        auto storage_type_opt = StringToStorageType(storage_type_str);
        if (!storage_type_opt) {
            spdlog::error("Invalid 'type' value in storage definition: {}", storage_type_str);
            return std::unexpected(LoadError::ValidationError);
        }

        config.storage_definition.type = *storage_type_opt;
        config.storage_definition.path = storage_path_str;
    }

    if (!config.storage_definition.IsValid()) {
        spdlog::error("Parsed storage definition is invalid.");
        return std::unexpected(LoadError::ValidationError);
    }
    spdlog::info(
        "Parsed storage: type='{}', path='{}'",
        StorageTypeToString(config.storage_definition.type),
        config.storage_definition.path.string()
    );

    if (j.contains("pool")) {
        const auto &ps = j.at("pool");
        if (!ps.is_object()) {
            spdlog::error("'pool' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        TRY_ASSIGN(config.pool_settings.folder, ps, "folder", std::string);
    }
    if (!config.pool_settings.IsValid()) {
        spdlog::error("Pool settings are invalid (folder '{}').", config.pool_settings.folder);
        return std::unexpected(LoadError::ValidationError);
    }
    spdlog::info("Pool settings: folder='{}'", config.pool_settings.folder);

    if (j.contains("global_settings")) {
        const auto &gs = j.at("global_settings");
        if (!gs.is_object()) {
            spdlog::error("'global_settings' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        std::string log_level_str;
        TRY_ASSIGN(log_level_str, gs, "log_level", std::string);
        if (!log_level_str.empty()) {
            auto level_opt = StringToLogLevel(log_level_str);
            if (!level_opt) {
                spdlog::error(
                    "Invalid 'log_level' value: {}. Using default '{}'.", log_level_str,
                    spdlog::level::to_string_view(config.global_settings.log_level)
                );
                // Keep the default already set in config.global_settings
            } else {
                config.global_settings.log_level = *level_opt;
            }
        }
    }
    spdlog::info(
        "Global settings: log_level='{}'",
        spdlog::level::to_string_view(config.global_settings.log_level)
    );

    if (!config.IsValid()) {
        spdlog::error("Overall pool configuration is invalid after parsing.");
        return std::unexpected(LoadError::ValidationError);
    }

    spdlog::info("Configuration loaded successfully from: {}", file_path.string());
    return config;
}

LoadErrorMsg loadConfigFromFileVerbose(const std::filesystem::path &file_path)
{
    auto result = loadConfigFromFile(file_path);
    if (result.has_value()) {
        return result.value();
    } else {
        std::string error_message = "Failed to load config (" + file_path.string() + "): ";
        switch (result.error()) {
            case LoadError::FileNotFound:
                error_message += "File not found.";
                break;
            case LoadError::JsonParseError:
                error_message += "JSON parsing failed.";
                break;
            case LoadError::ValidationError:
                error_message += "Configuration validation failed.";
                break;
            default:
                error_message += "Unknown error.";
                break;
        }
        return std::unexpected(error_message);
    }
}

}  // namespace TaggedFileCache::Config
