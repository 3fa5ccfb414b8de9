#ifndef TAGGEDFILECACHE_TESTS_SUPPORT_TESTING_HPP_
#define TAGGEDFILECACHE_TESTS_SUPPORT_TESTING_HPP_

#include <catch2/catch.hpp>

#include "cache/file_system_cache_pool.hpp"
#include "config/config_types.hpp"
#include "storage/local_storage.hpp"

#include <stdlib.h>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace TaggedFileCache::Testing
{

namespace fs = std::filesystem;

// A fresh directory under the system temp dir, removed with everything in it.
class ScopedTempDirectory
{
    public:
    ScopedTempDirectory()
    {
        std::string pattern = (fs::temp_directory_path() / "tagged_file_cache_XXXXXX").string();
        REQUIRE(::mkdtemp(pattern.data()) != nullptr);
        path_ = pattern;
    }
    ~ScopedTempDirectory()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    ScopedTempDirectory(const ScopedTempDirectory &)            = delete;
    ScopedTempDirectory &operator=(const ScopedTempDirectory &) = delete;

    const fs::path &path() const { return path_; }

    private:
    fs::path path_;
};

inline std::shared_ptr<Storage::LocalStorage> MakeLocalStorage(const fs::path &root)
{
    Config::StorageDefinition definition;
    definition.path = root;
    definition.type = Config::StorageType::Local;

    auto storage = std::make_shared<Storage::LocalStorage>(definition);
    REQUIRE(storage->Initialize().has_value());
    return storage;
}

inline std::vector<std::byte> ToBytes(std::string_view text)
{
    std::vector<std::byte> bytes(text.size());
    if (!text.empty()) {
        std::memcpy(bytes.data(), text.data(), text.size());
    }
    return bytes;
}

inline std::vector<std::byte> ToBytes(const std::vector<std::uint8_t> &raw)
{
    std::vector<std::byte> bytes(raw.size());
    if (!raw.empty()) {
        std::memcpy(bytes.data(), raw.data(), raw.size());
    }
    return bytes;
}

inline void WriteRawFile(const fs::path &path, std::string_view contents)
{
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    REQUIRE(out.is_open());
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
}

inline void WriteRawFile(const fs::path &path, const std::vector<std::byte> &contents)
{
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    REQUIRE(out.is_open());
    out.write(
        reinterpret_cast<const char *>(contents.data()),
        static_cast<std::streamsize>(contents.size())
    );
}

inline std::vector<std::byte> ReadRawFile(const fs::path &path)
{
    std::ifstream in(path, std::ios::binary);
    REQUIRE(in.is_open());
    std::vector<char> chars((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::vector<std::byte> bytes(chars.size());
    if (!chars.empty()) {
        std::memcpy(bytes.data(), chars.data(), chars.size());
    }
    return bytes;
}

// A storage root with one pool on the default "cache" folder.
struct PoolFixture {
    ScopedTempDirectory root;
    std::shared_ptr<Storage::LocalStorage> storage = MakeLocalStorage(root.path());
    std::unique_ptr<Cache::FileSystemCachePool> pool =
        std::make_unique<Cache::FileSystemCachePool>(storage);

    // Destroys the current pool (committing it) and opens a new one on the same root.
    void ReopenPool()
    {
        pool.reset();
        pool = std::make_unique<Cache::FileSystemCachePool>(storage);
    }

    fs::path FilePath(const std::string &key) const { return root.path() / "cache" / key; }
};

}  // namespace TaggedFileCache::Testing

#endif  // TAGGEDFILECACHE_TESTS_SUPPORT_TESTING_HPP_
