#include "app_constants.hpp"
#include "cache/cache_error.hpp"
#include "cache/file_system_cache_pool.hpp"
#include "config/config_loader.hpp"
#include "config/config_types.hpp"
#include "storage/storage_factory.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace
{

namespace tfc = TaggedFileCache;

struct CommandOptions {
    std::string key;
    std::string value;
    long long ttl_seconds = 0;
    bool has_ttl          = false;
    std::vector<std::string> keys;
    std::vector<std::string> tags;
};

// Anything that is not valid JSON is stored as a plain string.
tfc::Cache::Value ParseValue(const std::string &raw)
{
    auto parsed = nlohmann::json::parse(raw, nullptr, false);
    if (parsed.is_discarded()) {
        return raw;
    }
    return parsed;
}

int RunGet(tfc::Cache::FileSystemCachePool &pool, const CommandOptions &options)
{
    auto item = pool.GetItem(options.key);
    if (!item.IsHit()) {
        spdlog::info("Miss for key '{}'", options.key);
        return EXIT_FAILURE;
    }
    std::cout << item.Get().dump() << std::endl;
    return EXIT_SUCCESS;
}

int RunSet(tfc::Cache::FileSystemCachePool &pool, const CommandOptions &options)
{
    auto item = pool.GetItem(options.key);
    item.Set(ParseValue(options.value));
    if (options.has_ttl) {
        item.ExpiresAfter(std::chrono::seconds(options.ttl_seconds));
    }
    item.SetTags(options.tags);

    if (!pool.Save(item)) {
        spdlog::error("Failed to save key '{}'", options.key);
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int RunHas(tfc::Cache::FileSystemCachePool &pool, const CommandOptions &options)
{
    std::cout << (pool.HasItem(options.key) ? "true" : "false") << std::endl;
    return EXIT_SUCCESS;
}

int RunDelete(tfc::Cache::FileSystemCachePool &pool, const CommandOptions &options)
{
    if (!pool.DeleteItems(options.keys)) {
        spdlog::error("Failed to delete every requested key");
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int RunInvalidate(tfc::Cache::FileSystemCachePool &pool, const CommandOptions &options)
{
    if (!pool.InvalidateTags(options.tags)) {
        spdlog::error("Failed to invalidate the requested tags");
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int RunClear(tfc::Cache::FileSystemCachePool &pool, const CommandOptions &)
{
    if (!pool.Clear()) {
        spdlog::error("Failed to clear folder '{}'", pool.GetFolder());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char *argv[])
{
    // Command Line argument parsing
    CLI::App app{std::string(tfc::Constants::APP_NAME)};
    app.require_subcommand(1);

    std::string config_path_str;
    std::string root_path_str;
    std::string folder_str;
    std::string log_level_str;

    auto *source = app.add_option_group("source", "Where the cache lives");
    source->add_option("-c,--config", config_path_str, "Path to the configuration JSON file")
        ->check(CLI::ExistingFile);
    source->add_option("-r,--root", root_path_str, "Storage root directory");
    source->require_option(1);

    app.add_option("--folder", folder_str, "Pool folder relative to the storage root");
    app.add_option("--log-level", log_level_str, "Overrides the configured log level")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "fatal", "off"}));

    app.set_version_flag("-v,--version", std::string(tfc::Constants::APP_VERSION_STRING));

    CommandOptions options;

    auto *get_cmd = app.add_subcommand("get", "Print the value stored under KEY as JSON");
    get_cmd->add_option("key", options.key, "Item key")->required();

    auto *set_cmd = app.add_subcommand("set", "Store VALUE under KEY");
    set_cmd->add_option("key", options.key, "Item key")->required();
    set_cmd->add_option("value", options.value, "JSON value, or a plain string")->required();
    auto *ttl_opt = set_cmd->add_option("--ttl", options.ttl_seconds, "Time to live in seconds");
    set_cmd->add_option("--tag", options.tags, "Tag to attach (repeatable)");

    auto *has_cmd = app.add_subcommand("has", "Print whether KEY is a hit");
    has_cmd->add_option("key", options.key, "Item key")->required();

    auto *delete_cmd = app.add_subcommand("delete", "Delete items");
    delete_cmd->add_option("keys", options.keys, "Item keys")->required();

    auto *invalidate_cmd = app.add_subcommand("invalidate", "Delete every item carrying a tag");
    invalidate_cmd->add_option("tags", options.tags, "Tags")->required();

    auto *clear_cmd = app.add_subcommand("clear", "Remove every item and tag list");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }
    options.has_ttl = ttl_opt->count() > 0;

    // Logs go to stderr so command output stays machine readable
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern(std::string(tfc::Constants::DEFAULT_CONSOLE_LOG_PATTERN));
        auto main_logger =
            std::make_shared<spdlog::logger>(std::string(tfc::Constants::APP_NAME), console_sink);
        spdlog::set_default_logger(main_logger);
        spdlog::set_level(tfc::Constants::DEFAULT_LOG_LEVEL);
        spdlog::flush_on(tfc::Constants::DEFAULT_FLUSH_LEVEL);
    } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    // Load Configuration
    tfc::Config::PoolConfig config;
    if (!config_path_str.empty()) {
        auto config_result =
            tfc::Config::loadConfigFromFileVerbose(std::filesystem::path(config_path_str));
        if (!config_result) {
            spdlog::critical("Error loading configuration: {}", config_result.error());
            return EXIT_FAILURE;
        }
        config = std::move(config_result.value());
    } else {
        config.storage_definition.type = tfc::Config::StorageType::Local;
        config.storage_definition.path = root_path_str;
    }

    if (!folder_str.empty()) {
        config.pool_settings.folder = folder_str;
    }
    if (!log_level_str.empty()) {
        // Already restricted to known names by CLI::IsMember
        config.global_settings.log_level =
            tfc::Config::StringToLogLevel(log_level_str).value_or(tfc::Constants::DEFAULT_LOG_LEVEL);
    }
    if (!config.IsValid()) {
        spdlog::critical("Invalid configuration for folder '{}'", config.pool_settings.folder);
        return EXIT_FAILURE;
    }

    spdlog::set_level(config.global_settings.log_level);
    spdlog::debug(
        "Logging level set to: {}", spdlog::level::to_string_view(config.global_settings.log_level)
    );

    // Setup Core Components
    auto storage_res = tfc::Storage::StorageFactory::Create(config.storage_definition);
    if (!storage_res) {
        spdlog::critical(
            "Error initializing storage at '{}': {}", config.storage_definition.path.string(),
            storage_res.error().message()
        );
        return EXIT_FAILURE;
    }

    int exit_code = EXIT_FAILURE;
    try {
        tfc::Cache::FileSystemCachePool pool(
            std::move(storage_res.value()), config.pool_settings.folder, spdlog::default_logger()
        );

        if (*get_cmd) {
            exit_code = RunGet(pool, options);
        } else if (*set_cmd) {
            exit_code = RunSet(pool, options);
        } else if (*has_cmd) {
            exit_code = RunHas(pool, options);
        } else if (*delete_cmd) {
            exit_code = RunDelete(pool, options);
        } else if (*invalidate_cmd) {
            exit_code = RunInvalidate(pool, options);
        } else if (*clear_cmd) {
            exit_code = RunClear(pool, options);
        }
    } catch (const tfc::Cache::InvalidArgumentException &e) {
        spdlog::critical("Invalid argument: {}", e.what());
        exit_code = EXIT_FAILURE;
    } catch (const tfc::Cache::CachePoolException &e) {
        spdlog::critical("Cache pool failure in {}: {}", e.operation(), e.code().message());
        exit_code = EXIT_FAILURE;
    }

    spdlog::shutdown();
    return exit_code;
}
