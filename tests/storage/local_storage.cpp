#include "storage/local_storage.hpp"

#include "support/testing.hpp"

#include <cerrno>
#include <filesystem>
#include <string>

using namespace TaggedFileCache;
using namespace TaggedFileCache::Testing;

namespace
{

std::size_t CountEntries(const fs::path &dir)
{
    std::size_t count = 0;
    for ([[maybe_unused]] const auto &entry : fs::directory_iterator(dir)) {
        ++count;
    }
    return count;
}

}  // namespace

TEST_CASE("initialize creates the storage root", "[local_storage]")
{
    ScopedTempDirectory dir;
    const auto root = dir.path() / "nested" / "root";

    Config::StorageDefinition definition;
    definition.path = root;
    Storage::LocalStorage storage(definition);

    REQUIRE(storage.Initialize().has_value());
    REQUIRE(fs::is_directory(root));
    REQUIRE(storage.GetType() == Config::StorageType::Local);
    REQUIRE(storage.GetPath() == root);
}

TEST_CASE("initialize refuses a root that is a regular file", "[local_storage]")
{
    ScopedTempDirectory dir;
    const auto root = dir.path() / "file";
    WriteRawFile(root, "not a directory");

    Config::StorageDefinition definition;
    definition.path = root;
    Storage::LocalStorage storage(definition);

    auto res = storage.Initialize();
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error() == Storage::make_error_code(Storage::StorageErrc::NotADirectory));
}

TEST_CASE("written files read back byte for byte", "[local_storage]")
{
    ScopedTempDirectory dir;
    auto storage = MakeLocalStorage(dir.path());

    std::vector<std::byte> data;
    for (int i = 0; i < 256; ++i) {
        data.push_back(static_cast<std::byte>(i));
    }

    REQUIRE(storage->WriteFile("a/b/record", data).has_value());
    REQUIRE(fs::is_regular_file(dir.path() / "a" / "b" / "record"));

    auto read = storage->ReadFile("a/b/record");
    REQUIRE(read.has_value());
    REQUIRE(*read == data);
}

TEST_CASE("empty files read back empty", "[local_storage]")
{
    ScopedTempDirectory dir;
    auto storage = MakeLocalStorage(dir.path());

    REQUIRE(storage->WriteFile("empty", std::vector<std::byte>{}).has_value());
    auto read = storage->ReadFile("empty");
    REQUIRE(read.has_value());
    REQUIRE(read->empty());
}

TEST_CASE("overwriting replaces the file and leaves no temporary files", "[local_storage]")
{
    ScopedTempDirectory dir;
    auto storage = MakeLocalStorage(dir.path());

    REQUIRE(storage->WriteFile("cache/key", ToBytes("a much longer first version")).has_value());
    REQUIRE(storage->WriteFile("cache/key", ToBytes("short")).has_value());

    auto read = storage->ReadFile("cache/key");
    REQUIRE(read.has_value());
    REQUIRE(*read == ToBytes("short"));
    REQUIRE(CountEntries(dir.path() / "cache") == 1);
}

TEST_CASE("written files are private to the owner", "[local_storage]")
{
    ScopedTempDirectory dir;
    auto storage = MakeLocalStorage(dir.path());

    REQUIRE(storage->WriteFile("secret", ToBytes("value")).has_value());

    const auto perms = fs::status(dir.path() / "secret").permissions();
    REQUIRE(perms == (fs::perms::owner_read | fs::perms::owner_write));
}

TEST_CASE("reading a missing file reports FileNotFound", "[local_storage]")
{
    ScopedTempDirectory dir;
    auto storage = MakeLocalStorage(dir.path());

    auto read = storage->ReadFile("missing");
    REQUIRE_FALSE(read.has_value());
    REQUIRE(read.error() == Storage::make_error_code(Storage::StorageErrc::FileNotFound));
}

TEST_CASE("removing files", "[local_storage]")
{
    ScopedTempDirectory dir;
    auto storage = MakeLocalStorage(dir.path());

    SECTION("an existing file is deleted")
    {
        REQUIRE(storage->WriteFile("doomed", ToBytes("x")).has_value());
        REQUIRE(storage->Remove("doomed").has_value());
        REQUIRE_FALSE(fs::exists(dir.path() / "doomed"));
    }

    SECTION("an absent file is not an error")
    {
        REQUIRE(storage->Remove("never_written").has_value());
    }

    SECTION("the root itself is left alone")
    {
        REQUIRE(storage->Remove(".").has_value());
        REQUIRE(fs::is_directory(dir.path()));
    }
}

TEST_CASE("file existence only counts regular files", "[local_storage]")
{
    ScopedTempDirectory dir;
    auto storage = MakeLocalStorage(dir.path());

    REQUIRE(storage->CreateDirectory("folder").has_value());
    REQUIRE(storage->WriteFile("folder/file", ToBytes("x")).has_value());

    REQUIRE(storage->CheckIfFileExists("folder/file").value());
    REQUIRE_FALSE(storage->CheckIfFileExists("folder").value());
    REQUIRE_FALSE(storage->CheckIfFileExists("folder/other").value());

    REQUIRE(storage->CheckIfDirectoryExists("folder").value());
    REQUIRE_FALSE(storage->CheckIfDirectoryExists("folder/file").value());
    REQUIRE_FALSE(storage->CheckIfDirectoryExists("nowhere").value());
}

TEST_CASE("directories are created with the requested mode", "[local_storage]")
{
    ScopedTempDirectory dir;
    auto storage = MakeLocalStorage(dir.path());

    REQUIRE(storage->CreateDirectory("one/two").has_value());
    REQUIRE(fs::status(dir.path() / "one" / "two").permissions() == fs::perms::owner_all);

    // Creating it again is fine
    REQUIRE(storage->CreateDirectory("one/two", 0750).has_value());
    REQUIRE(
        fs::status(dir.path() / "one" / "two").permissions() ==
        (fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec)
    );
}

TEST_CASE("removing directories is recursive", "[local_storage]")
{
    ScopedTempDirectory dir;
    auto storage = MakeLocalStorage(dir.path());

    REQUIRE(storage->WriteFile("tree/a/b/c", ToBytes("x")).has_value());
    REQUIRE(storage->WriteFile("tree/d", ToBytes("y")).has_value());

    REQUIRE(storage->RemoveDirectory("tree").has_value());
    REQUIRE_FALSE(fs::exists(dir.path() / "tree"));

    // Already gone
    REQUIRE(storage->RemoveDirectory("tree").has_value());
}

TEST_CASE("paths escaping the root are rejected", "[local_storage]")
{
    ScopedTempDirectory dir;
    auto storage = MakeLocalStorage(dir.path() / "root");
    const auto invalid_path = Storage::make_error_code(Storage::StorageErrc::InvalidPath);

    REQUIRE(storage->RelativeToAbsPath("../outside").empty());
    REQUIRE(storage->RelativeToAbsPath("/etc/passwd").empty());
    REQUIRE_FALSE(storage->RelativeToAbsPath("inside/file").empty());

    auto write = storage->WriteFile("../outside", ToBytes("x"));
    REQUIRE_FALSE(write.has_value());
    REQUIRE(write.error() == invalid_path);
    REQUIRE_FALSE(fs::exists(dir.path() / "outside"));

    auto read = storage->ReadFile("a/../../outside");
    REQUIRE_FALSE(read.has_value());
    REQUIRE(read.error() == invalid_path);

    auto remove_dir = storage->RemoveDirectory("..");
    REQUIRE_FALSE(remove_dir.has_value());
    REQUIRE(remove_dir.error() == invalid_path);
    REQUIRE(fs::is_directory(dir.path()));
}

TEST_CASE("storage is reachable through the interface", "[local_storage]")
{
    ScopedTempDirectory dir;
    std::shared_ptr<Storage::IStorage> storage = MakeLocalStorage(dir.path());

    REQUIRE(storage->CreateDirectory("folder").has_value());
    REQUIRE(storage->WriteFile("folder/file", ToBytes("payload")).has_value());
    REQUIRE(storage->ReadFile("folder/file").value() == ToBytes("payload"));
}

TEST_CASE("errno values map to storage codes", "[local_storage]")
{
    REQUIRE(Storage::ErrnoToStorageErrc(0) == Storage::StorageErrc::Success);
    REQUIRE(Storage::ErrnoToStorageErrc(ENOENT) == Storage::StorageErrc::FileNotFound);
    REQUIRE(Storage::ErrnoToStorageErrc(EACCES) == Storage::StorageErrc::PermissionDenied);
    REQUIRE(Storage::ErrnoToStorageErrc(EISDIR) == Storage::StorageErrc::IsADirectory);
    REQUIRE(Storage::ErrnoToStorageErrc(ENOTEMPTY) == Storage::StorageErrc::UnknownError);

    const std::error_code ec = Storage::StorageErrc::InvalidPath;
    REQUIRE(ec.category().name() == std::string("TaggedFileCache::Storage"));
    REQUIRE(ec.message() == "Invalid path");
}
