#include "storage/local_storage.hpp"

#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#include <array>
#include <cerrno>
#include <string>
#include <system_error>
#include <utility>

namespace TaggedFileCache::Storage
{

namespace fs = std::filesystem;

namespace
{

constexpr std::size_t kReadChunkSize = 64 * 1024;

class FileDescriptorGuard
{
    private:
    int fd_;

    public:
    explicit FileDescriptorGuard(int fd = -1) noexcept : fd_(fd) {}
    ~FileDescriptorGuard()
    {
        if (fd_ >= 0) {
            if (::close(fd_) == -1) {
            }
        }
    }
    FileDescriptorGuard(const FileDescriptorGuard&)            = delete;
    FileDescriptorGuard& operator=(const FileDescriptorGuard&) = delete;
    FileDescriptorGuard(FileDescriptorGuard&& other) noexcept : fd_(other.release()) {}
    FileDescriptorGuard& operator=(FileDescriptorGuard&& other) noexcept
    {
        reset(other.release());
        return *this;
    }
    int get() const noexcept { return fd_; }
    int release() noexcept { return std::exchange(fd_, -1); }
    void reset(int new_fd = -1) noexcept
    {
        if (fd_ >= 0 && fd_ != new_fd) {
            if (::close(fd_) == -1) {
            }
        }
        fd_ = new_fd;
    }
    explicit operator bool() const noexcept { return fd_ >= 0; }
};

// Unlinks the temporary file of an unfinished write.
class TempFileGuard
{
    private:
    fs::path path_;
    bool armed_ = true;

    public:
    explicit TempFileGuard(fs::path path) : path_(std::move(path)) {}
    ~TempFileGuard()
    {
        if (armed_) {
            ::unlink(path_.c_str());
        }
    }
    TempFileGuard(const TempFileGuard&)            = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    void Disarm() noexcept { armed_ = false; }
};

std::error_code ErrnoToErrorCode(int err_no) { return make_error_code(ErrnoToStorageErrc(err_no)); }

}  // namespace

LocalStorage::LocalStorage(const Config::StorageDefinition& definition)
    : definition_(definition), base_path_(definition.path)
{
}

Config::StorageType LocalStorage::GetType() const { return definition_.type; }

const std::filesystem::path& LocalStorage::GetPath() const { return base_path_; }

std::filesystem::path LocalStorage::RelativeToAbsPath(
    const std::filesystem::path& relative_path
) const
{
    if (relative_path.is_absolute()) {
        return {};
    }

    std::error_code ec;
    auto full = fs::weakly_canonical(base_path_ / relative_path, ec);
    if (ec)
        return {};

    auto base_can = fs::weakly_canonical(base_path_, ec);
    if (ec)
        return {};

    const auto rel = full.lexically_relative(base_can);
    if (rel.empty() || *rel.begin() == "..") {
        return {};
    }
    return full;
}

std::filesystem::path LocalStorage::GetValidatedFullPath(
    const std::filesystem::path& relative_path
) const
{
    auto full_path = RelativeToAbsPath(relative_path);
    if (full_path.empty()) {
        spdlog::debug("Rejected path outside storage root: '{}'", relative_path.string());
        return {};
    }
    return full_path;
}

std::error_code LocalStorage::MapFilesystemError(
    const std::error_code& ec, const std::string& operation
) const
{
    if (!ec)
        return {};
    Storage::StorageErrc storage_errc = Storage::StorageErrc::UnknownError;
    if (ec.category() == std::generic_category()) {
        storage_errc = ErrnoToStorageErrc(ec.value());
    } else if (ec.category() == std::system_category()) {
        storage_errc = ErrnoToStorageErrc(ec.value());
    }
    spdlog::debug("LocalStorage {} failed: {}", operation, ec.message());
    return Storage::make_error_code(storage_errc);
}

StorageResult<void> LocalStorage::EnsureParentDirectory(const std::filesystem::path& full_path)
{
    const auto parent_path = full_path.parent_path();
    std::error_code ec;
    if (std::filesystem::is_directory(parent_path, ec)) {
        return {};
    }
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return std::unexpected(MapFilesystemError(ec, "check_parent"));
    }

    auto rel_parent = parent_path.lexically_relative(fs::weakly_canonical(base_path_));
    return CreateDirectory(rel_parent, Constants::DEFAULT_DIRECTORY_MODE);
}

StorageResult<void> LocalStorage::Initialize()
{
    std::lock_guard<std::recursive_mutex> lock(storage_mutex_);
    std::error_code ec;

    if (!std::filesystem::exists(base_path_, ec)) {
        if (!std::filesystem::create_directories(base_path_, ec)) {
            if (ec) {
                return std::unexpected(MapFilesystemError(ec, "init_create_dir"));
            }
            if (!std::filesystem::is_directory(base_path_, ec)) {
                return std::unexpected(MapFilesystemError(
                    ec ? ec : std::make_error_code(std::errc::io_error), "init_verify_dir"
                ));
            }
        }
        if (ec) {
            return std::unexpected(MapFilesystemError(ec, "init_create_dir"));
        }
    } else if (ec) {
        return std::unexpected(MapFilesystemError(ec, "init_check_exists"));
    } else if (!std::filesystem::is_directory(base_path_, ec)) {
        return std::unexpected(make_error_code(StorageErrc::NotADirectory));
    } else if (ec) {
        return std::unexpected(MapFilesystemError(ec, "init_check_type"));
    }

    spdlog::debug("Local storage initialized at '{}'", base_path_.string());
    return {};
}

StorageResult<std::vector<std::byte>> LocalStorage::ReadFile(
    const std::filesystem::path& relative_path
) const
{
    std::lock_guard<std::recursive_mutex> lock(storage_mutex_);
    auto full_path = GetValidatedFullPath(relative_path);
    if (full_path.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));

    int fd = ::open(full_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        int open_errno = errno;
        if (open_errno == EISDIR)
            return std::unexpected(make_error_code(Storage::StorageErrc::IsADirectory));
        if (open_errno == ENOENT)
            return std::unexpected(make_error_code(Storage::StorageErrc::FileNotFound));
        return std::unexpected(ErrnoToErrorCode(open_errno));
    }
    FileDescriptorGuard fd_guard(fd);

    if (::flock(fd, LOCK_SH) == -1) {
        return std::unexpected(ErrnoToErrorCode(errno));
    }

    struct stat st{};
    if (::fstat(fd, &st) == -1) {
        return std::unexpected(ErrnoToErrorCode(errno));
    }
    if (S_ISDIR(st.st_mode)) {
        return std::unexpected(make_error_code(StorageErrc::IsADirectory));
    }

    std::vector<std::byte> contents;
    contents.reserve(static_cast<std::size_t>(st.st_size));

    std::array<std::byte, kReadChunkSize> chunk{};
    while (true) {
        const ssize_t bytes_read = ::read(fd, chunk.data(), chunk.size());
        if (bytes_read < 0) {
            if (errno == EINTR)
                continue;
            return std::unexpected(ErrnoToErrorCode(errno));
        }
        if (bytes_read == 0)
            break;
        contents.insert(contents.end(), chunk.begin(), chunk.begin() + bytes_read);
    }

    return contents;
}

StorageResult<void> LocalStorage::WriteFile(
    const std::filesystem::path& relative_path, std::span<const std::byte> data
)
{
    std::lock_guard<std::recursive_mutex> lock(storage_mutex_);

    const auto full_path = GetValidatedFullPath(relative_path);
    if (full_path.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));

    std::error_code ec;
    if (std::filesystem::is_directory(full_path, ec)) {
        return std::unexpected(make_error_code(StorageErrc::IsADirectory));
    }

    if (auto parent_res = EnsureParentDirectory(full_path); !parent_res) {
        return std::unexpected(parent_res.error());
    }

    // The record only becomes visible once rename() swaps it in.
    std::string tmp_template =
        (full_path.parent_path() / ("." + full_path.filename().string() + ".XXXXXX")).string();
    const int fd = ::mkstemp(tmp_template.data());
    if (fd < 0) {
        return std::unexpected(ErrnoToErrorCode(errno));
    }
    FileDescriptorGuard fd_guard(fd);
    TempFileGuard tmp_guard(tmp_template);

    if (::flock(fd, LOCK_EX) == -1) {
        return std::unexpected(ErrnoToErrorCode(errno));
    }
    if (::fchmod(fd, Constants::DEFAULT_FILE_MODE) == -1) {
        return std::unexpected(ErrnoToErrorCode(errno));
    }

    std::size_t total_written = 0;
    while (total_written < data.size()) {
        const ssize_t bytes_written =
            ::write(fd, data.data() + total_written, data.size() - total_written);
        if (bytes_written < 0) {
            if (errno == EINTR)
                continue;
            return std::unexpected(ErrnoToErrorCode(errno));
        }
        total_written += static_cast<std::size_t>(bytes_written);
    }

    if (::rename(tmp_template.c_str(), full_path.c_str()) == -1) {
        return std::unexpected(ErrnoToErrorCode(errno));
    }
    tmp_guard.Disarm();

    return {};
}

StorageResult<void> LocalStorage::Remove(const std::filesystem::path& relative_path)
{
    std::lock_guard<std::recursive_mutex> lock(storage_mutex_);

    const auto full_path = GetValidatedFullPath(relative_path);
    if (full_path.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));

    std::string full_path_str = full_path.string();
    std::string base_path_str = fs::weakly_canonical(base_path_).string();
    if (!full_path_str.empty() && full_path_str.back() == fs::path::preferred_separator)
        full_path_str.pop_back();
    if (!base_path_str.empty() && base_path_str.back() == fs::path::preferred_separator)
        base_path_str.pop_back();
    if (full_path_str == base_path_str) {
        return {};
    }

    std::error_code ec;
    if (!std::filesystem::remove(full_path, ec)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return std::unexpected(MapFilesystemError(ec, "remove"));
        }
    }

    return {};
}

StorageResult<bool> LocalStorage::CheckIfFileExists(
    const std::filesystem::path& relative_path
) const
{
    std::lock_guard<std::recursive_mutex> lock(storage_mutex_);
    auto full_path = GetValidatedFullPath(relative_path);
    if (full_path.empty()) {
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }

    std::error_code ec;
    bool exists = std::filesystem::is_regular_file(full_path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return std::unexpected(MapFilesystemError(ec, "probe_file"));
    }
    return exists;
}

StorageResult<void> LocalStorage::CreateDirectory(
    const std::filesystem::path& relative_path, mode_t mode
)
{
    std::lock_guard<std::recursive_mutex> lock(storage_mutex_);

    auto full_path = GetValidatedFullPath(relative_path);
    if (full_path.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));

    std::error_code ec;
    if (!std::filesystem::create_directories(full_path, ec) && ec)
        return std::unexpected(MapFilesystemError(ec, "create_directory"));

    if (::chmod(full_path.c_str(), mode) == -1)
        return std::unexpected(ErrnoToErrorCode(errno));

    return {};
}

StorageResult<void> LocalStorage::RemoveDirectory(const std::filesystem::path& relative_path)
{
    std::lock_guard<std::recursive_mutex> lock(storage_mutex_);

    auto full_path = GetValidatedFullPath(relative_path);
    if (full_path.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));

    std::error_code ec;
    if (!std::filesystem::exists(full_path, ec)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return std::unexpected(MapFilesystemError(ec, "remove_directory_probe"));
        }
        return {};
    }
    if (!std::filesystem::is_directory(full_path, ec)) {
        return std::unexpected(
            ec ? MapFilesystemError(ec, "remove_directory_probe")
               : make_error_code(StorageErrc::NotADirectory)
        );
    }

    std::filesystem::remove_all(full_path, ec);
    if (ec) {
        return std::unexpected(MapFilesystemError(ec, "remove_directory"));
    }
    return {};
}

StorageResult<bool> LocalStorage::CheckIfDirectoryExists(
    const std::filesystem::path& relative_path
) const
{
    std::lock_guard<std::recursive_mutex> lock(storage_mutex_);
    auto full_path = GetValidatedFullPath(relative_path);
    if (full_path.empty()) {
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }

    std::error_code ec;
    bool exists = std::filesystem::is_directory(full_path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return std::unexpected(MapFilesystemError(ec, "probe_directory"));
    }
    return exists;
}

}  // namespace TaggedFileCache::Storage
