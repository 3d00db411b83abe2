#include "storage/posix_storage_adapter.hpp"

#include "storage/virtual_path.hpp"

#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <utility>

namespace TierFS::Storage
{

namespace
{

class FileDescriptorGuard
{
    private:
    int fd_;

    public:
    explicit FileDescriptorGuard(int fd = -1) noexcept : fd_(fd) {}
    ~FileDescriptorGuard() { reset(); }
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
                spdlog::warn("close({}) failed: {}", fd_, std::strerror(errno));
            }
        }
        fd_ = new_fd;
    }
    explicit operator bool() const noexcept { return fd_ >= 0; }
};

std::unexpected<std::error_code> ErrnoError(int err_no)
{
    return std::unexpected(MakeErrnoError(err_no));
}

std::unexpected<std::error_code> Errc(StorageErrc errc)
{
    return std::unexpected(make_error_code(errc));
}

StorageResult<void> WriteAll(int fd, std::span<const std::byte> data, off_t offset, bool positional)
{
    size_t written = 0;
    while (written < data.size()) {
        const ssize_t n =
            positional ? ::pwrite(fd, data.data() + written, data.size() - written,
                                  offset + static_cast<off_t>(written))
                       : ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return ErrnoError(errno);
        }
        written += static_cast<size_t>(n);
    }
    return {};
}

}  // namespace

TimePoint FromTimespec(const struct timespec& ts)
{
    return TimePoint{std::chrono::duration_cast<Clock::duration>(
        std::chrono::seconds{ts.tv_sec} + std::chrono::nanoseconds{ts.tv_nsec}
    )};
}

struct timespec ToTimespec(TimePoint tp)
{
    const auto since_epoch = tp.time_since_epoch();
    const auto secs        = std::chrono::floor<std::chrono::seconds>(since_epoch);
    const auto nanos       = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs);
    struct timespec ts{};
    ts.tv_sec  = static_cast<time_t>(secs.count());
    ts.tv_nsec = static_cast<long>(nanos.count());
    return ts;
}

PosixStorageAdapter::PosixStorageAdapter(fs::path root, bool create_root)
    : root_(std::move(root)), create_root_(create_root)
{
    std::error_code ec;
    canonical_root_ = fs::weakly_canonical(root_, ec);
    if (ec) {
        canonical_root_ = root_.lexically_normal();
    }
}

//------------------------------------------------------------------------------//
// Helpers
//------------------------------------------------------------------------------//

FileStat PosixStorageAdapter::ToFileStat(const struct stat& st)
{
    FileStat out;
    out.size         = S_ISREG(st.st_mode) ? static_cast<std::uint64_t>(st.st_size) : 0;
    out.is_directory = S_ISDIR(st.st_mode);
    out.is_symlink   = S_ISLNK(st.st_mode);
    out.mode         = st.st_mode & 07777;
    out.uid          = st.st_uid;
    out.gid          = st.st_gid;
    out.accessed     = FromTimespec(st.st_atim);
    out.modified     = FromTimespec(st.st_mtim);
    out.created      = FromTimespec(st.st_ctim);
    return out;
}

std::error_code PosixStorageAdapter::MapFilesystemError(const std::error_code& ec)
{
    if (!ec) {
        return {};
    }
    if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
        return MakeErrnoError(ec.value());
    }
    return make_error_code(StorageErrc::IOError);
}

StorageResult<fs::path> PosixStorageAdapter::ResolvePath(const std::string& path) const
{
    auto resolved = ResolveVirtualPath(path);
    if (!resolved) {
        spdlog::warn("Rejected path '{}' outside of root {}", path, root_.string());
        return std::unexpected(resolved.error());
    }
    const std::string key = VirtualPathToKey(*resolved);
    if (key.empty()) {
        return root_;
    }
    fs::path full = root_ / key;

    // Symlinked parent directories must not lead out of the root.
    std::error_code ec;
    const fs::path parent = fs::weakly_canonical(full.parent_path(), ec);
    if (ec || !IsUnderRoot(parent)) {
        spdlog::warn("Rejected path '{}' resolving outside of root {}", path, root_.string());
        return Errc(StorageErrc::InvalidPath);
    }
    return full;
}

StorageResult<fs::path> PosixStorageAdapter::ResolveTargetPath(const std::string& path) const
{
    auto full = ResolvePath(path);
    if (!full) {
        return full;
    }
    // The final component is followed by open(2) and friends, dangling links included.
    fs::path current = *full;
    std::error_code ec;
    for (int hops = 0; fs::is_symlink(fs::symlink_status(current, ec)); ++hops) {
        if (hops >= kMaxSymlinkHops) {
            return ErrnoError(ELOOP);
        }
        const fs::path target = fs::read_symlink(current, ec);
        if (ec) {
            return std::unexpected(MapFilesystemError(ec));
        }
        current = fs::weakly_canonical(
            target.is_absolute() ? target : current.parent_path() / target, ec
        );
        if (ec) {
            break;
        }
    }
    if (ec || !IsUnderRoot(current)) {
        spdlog::warn("Rejected symlink '{}' leading outside of root {}", path, root_.string());
        return Errc(StorageErrc::InvalidPath);
    }
    return full;
}

bool PosixStorageAdapter::IsUnderRoot(const fs::path& canonical_path) const
{
    const std::string path_str = canonical_path.string();
    const std::string root_str = canonical_root_.string();
    if (path_str.compare(0, root_str.size(), root_str) != 0) {
        return false;
    }
    return path_str.size() == root_str.size() || root_str.back() == '/' ||
           path_str[root_str.size()] == '/';
}

StorageResult<FileStat> PosixStorageAdapter::LstatPath(const fs::path& full_path) const
{
    struct stat st{};
    if (::lstat(full_path.c_str(), &st) == -1) {
        return ErrnoError(errno);
    }
    return ToFileStat(st);
}

StorageResult<void> PosixStorageAdapter::EnsureParentExists(const fs::path& full_path) const
{
    const auto parent = full_path.parent_path();
    std::error_code ec;
    if (fs::exists(parent, ec)) {
        if (!fs::is_directory(parent, ec)) {
            return Errc(StorageErrc::NotADirectory);
        }
        return {};
    }
    fs::create_directories(parent, ec);
    if (ec) {
        return std::unexpected(MapFilesystemError(ec));
    }
    return {};
}

TierStatus PosixStorageAdapter::DetectTierFor(
    const std::string& /*virtual_path*/, const FileStat& stat
) const
{
    TierProbe probe;
    probe.last_accessed = stat.accessed;
    return DetectTier(GetTierStrategy(), probe);
}

VirtualFile PosixStorageAdapter::BuildVirtualFile(
    const std::string& virtual_path, const FileStat& stat
) const
{
    VirtualFile file = MakeVirtualFile(virtual_path, stat);
    file.tier_status = DetectTierFor(file.path, stat);
    return file;
}

//------------------------------------------------------------------------------//
// Lifecycle
//------------------------------------------------------------------------------//

StorageResult<void> PosixStorageAdapter::Initialize()
{
    std::error_code ec;
    if (!fs::exists(root_, ec)) {
        if (ec) {
            return std::unexpected(MapFilesystemError(ec));
        }
        if (!create_root_) {
            spdlog::error("Storage root {} does not exist", root_.string());
            return Errc(StorageErrc::NotFound);
        }
        fs::create_directories(root_, ec);
        if (ec) {
            return std::unexpected(MapFilesystemError(ec));
        }
    } else if (!fs::is_directory(root_, ec)) {
        return Errc(StorageErrc::NotADirectory);
    }
    canonical_root_ = fs::weakly_canonical(root_, ec);
    if (ec) {
        return std::unexpected(MapFilesystemError(ec));
    }
    spdlog::debug("Initialized POSIX storage at {}", canonical_root_.string());
    return {};
}

StorageResult<void> PosixStorageAdapter::Shutdown() { return {}; }

//------------------------------------------------------------------------------//
// Basic Contract
//------------------------------------------------------------------------------//

StorageResult<std::vector<VirtualFile>> PosixStorageAdapter::List(const std::string& path)
{
    spdlog::trace("List({}) under {}", path, root_.string());
    if (auto res = EnsureAvailable(); !res) {
        return std::unexpected(res.error());
    }
    auto full = ResolveTargetPath(path);
    if (!full) {
        return std::unexpected(full.error());
    }
    auto dir_stat = LstatPath(*full);
    if (!dir_stat) {
        return std::unexpected(dir_stat.error());
    }
    if (!dir_stat->is_directory) {
        return Errc(StorageErrc::NotADirectory);
    }

    const std::string base = NormalizeVirtualPath(path);
    std::vector<VirtualFile> entries;
    std::error_code ec;
    for (fs::directory_iterator it(*full, ec), end; !ec && it != end; it.increment(ec)) {
        const auto entry_stat = LstatPath(it->path());
        if (!entry_stat) {
            spdlog::debug("Skipping {}: {}", it->path().string(), entry_stat.error().message());
            continue;
        }
        entries.push_back(
            BuildVirtualFile(JoinVirtualPath(base, it->path().filename().string()), *entry_stat)
        );
    }
    if (ec) {
        return std::unexpected(MapFilesystemError(ec));
    }
    SortDirectoryListing(entries);
    return entries;
}

StorageResult<Bytes> PosixStorageAdapter::Read(const std::string& path)
{
    spdlog::trace("Read({}) under {}", path, root_.string());
    if (auto res = EnsureAvailable(); !res) {
        return std::unexpected(res.error());
    }
    auto full = ResolveTargetPath(path);
    if (!full) {
        return std::unexpected(full.error());
    }
    const int fd = ::open(full->c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return ErrnoError(errno);
    }
    FileDescriptorGuard fd_guard(fd);

    struct stat st{};
    if (::fstat(fd, &st) == -1) {
        return ErrnoError(errno);
    }
    if (S_ISDIR(st.st_mode)) {
        return Errc(StorageErrc::IsADirectory);
    }

    Bytes data(static_cast<size_t>(st.st_size));
    size_t total = 0;
    while (true) {
        if (total == data.size()) {
            data.resize(data.size() + 64 * 1024);  // file grew since fstat
        }
        const ssize_t n = ::read(fd, data.data() + total, data.size() - total);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return ErrnoError(errno);
        }
        if (n == 0) {
            break;
        }
        total += static_cast<size_t>(n);
    }
    data.resize(total);
    return data;
}

StorageResult<Bytes> PosixStorageAdapter::ReadRange(
    const std::string& path, std::uint64_t offset, std::uint64_t length
)
{
    if (auto res = EnsureAvailable(); !res) {
        return std::unexpected(res.error());
    }
    auto full = ResolveTargetPath(path);
    if (!full) {
        return std::unexpected(full.error());
    }
    const int fd = ::open(full->c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return ErrnoError(errno);
    }
    FileDescriptorGuard fd_guard(fd);

    Bytes data(static_cast<size_t>(length));
    size_t total = 0;
    while (total < data.size()) {
        const ssize_t n = ::pread(
            fd, data.data() + total, data.size() - total, static_cast<off_t>(offset + total)
        );
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return ErrnoError(errno);
        }
        if (n == 0) {
            break;
        }
        total += static_cast<size_t>(n);
    }
    data.resize(total);
    return data;
}

StorageResult<void> PosixStorageAdapter::WriteFile(
    const fs::path& full_path, std::span<const std::byte> data, int flags
)
{
    if (auto res = EnsureParentExists(full_path); !res) {
        return res;
    }
    constexpr mode_t default_mode = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;
    const int fd = ::open(full_path.c_str(), flags | O_CLOEXEC, default_mode);
    if (fd < 0) {
        return ErrnoError(errno);
    }
    FileDescriptorGuard fd_guard(fd);
    return WriteAll(fd, data, 0, false);
}

StorageResult<void> PosixStorageAdapter::Write(
    const std::string& path, std::span<const std::byte> data
)
{
    spdlog::trace("Write({}, {} bytes) under {}", path, data.size(), root_.string());
    if (auto res = EnsureAvailable(); !res) {
        return res;
    }
    auto full = ResolveTargetPath(path);
    if (!full) {
        return std::unexpected(full.error());
    }
    if (*full == root_) {
        return Errc(StorageErrc::IsADirectory);
    }
    return WriteFile(*full, data, O_WRONLY | O_CREAT | O_TRUNC);
}

StorageResult<void> PosixStorageAdapter::Delete(const std::string& path)
{
    spdlog::trace("Delete({}) under {}", path, root_.string());
    if (auto res = EnsureAvailable(); !res) {
        return res;
    }
    auto full = ResolvePath(path);
    if (!full) {
        return std::unexpected(full.error());
    }
    if (*full == root_) {
        return Errc(StorageErrc::InvalidPath);
    }
    auto st = LstatPath(*full);
    if (!st) {
        return std::unexpected(st.error());
    }
    std::error_code ec;
    if (st->is_directory) {
        fs::remove_all(*full, ec);
    } else {
        fs::remove(*full, ec);
    }
    if (ec) {
        return std::unexpected(MapFilesystemError(ec));
    }
    return {};
}

StorageResult<void> PosixStorageAdapter::CreateDirectory(const std::string& path)
{
    return CreateDirectories(path);
}

StorageResult<bool> PosixStorageAdapter::Exists(const std::string& path)
{
    if (auto res = EnsureAvailable(); !res) {
        return std::unexpected(res.error());
    }
    auto full = ResolvePath(path);
    if (!full) {
        return std::unexpected(full.error());
    }
    struct stat st{};
    if (::lstat(full->c_str(), &st) == -1) {
        if (errno == ENOENT || errno == ENOTDIR) {
            return false;
        }
        return ErrnoError(errno);
    }
    return true;
}

StorageResult<VirtualFile> PosixStorageAdapter::Stat(const std::string& path)
{
    auto st = StatEntry(path);
    if (!st) {
        return std::unexpected(st.error());
    }
    return BuildVirtualFile(path, *st);
}

StorageResult<std::uint64_t> PosixStorageAdapter::FileSize(const std::string& path)
{
    auto st = StatEntry(path);
    if (!st) {
        return std::unexpected(st.error());
    }
    if (st->is_directory) {
        return Errc(StorageErrc::IsADirectory);
    }
    return st->size;
}

StorageResult<bool> PosixStorageAdapter::TestConnection()
{
    if (auto res = EnsureAvailable(); !res) {
        return false;
    }
    std::error_code ec;
    const bool ok = fs::is_directory(root_, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return std::unexpected(MapFilesystemError(ec));
    }
    return ok;
}

//------------------------------------------------------------------------------//
// File Operations Surface
//------------------------------------------------------------------------------//

StorageResult<FileStat> PosixStorageAdapter::StatEntry(const std::string& path)
{
    if (auto res = EnsureAvailable(); !res) {
        return std::unexpected(res.error());
    }
    auto full = ResolvePath(path);
    if (!full) {
        return std::unexpected(full.error());
    }
    return LstatPath(*full);
}

StorageResult<void> PosixStorageAdapter::Rename(const std::string& from, const std::string& to)
{
    if (auto res = EnsureAvailable(); !res) {
        return res;
    }
    auto from_full = ResolvePath(from);
    if (!from_full) {
        return std::unexpected(from_full.error());
    }
    auto to_full = ResolvePath(to);
    if (!to_full) {
        return std::unexpected(to_full.error());
    }
    if (auto res = EnsureParentExists(*to_full); !res) {
        return res;
    }
    if (::rename(from_full->c_str(), to_full->c_str()) == -1) {
        return ErrnoError(errno);
    }
    return {};
}

StorageResult<void> PosixStorageAdapter::ApplyAttributes(
    const fs::path& to_full, const FileStat& source
) const
{
    if (::chmod(to_full.c_str(), source.mode) == -1) {
        return ErrnoError(errno);
    }
    const struct timespec times[2] = {ToTimespec(source.accessed), ToTimespec(source.modified)};
    if (::utimensat(AT_FDCWD, to_full.c_str(), times, AT_SYMLINK_NOFOLLOW) == -1) {
        return ErrnoError(errno);
    }
    return {};
}

StorageResult<void> PosixStorageAdapter::CopyEntry(
    const fs::path& from_full, const fs::path& to_full, const CopyOptions& options
)
{
    struct stat st{};
    const int stat_res = options.follow_symlinks ? ::stat(from_full.c_str(), &st)
                                                 : ::lstat(from_full.c_str(), &st);
    if (stat_res == -1) {
        return ErrnoError(errno);
    }
    const FileStat source = ToFileStat(st);

    std::error_code ec;
    const bool dest_exists = fs::exists(fs::symlink_status(to_full, ec));
    if (source.is_directory && !options.recursive) {
        return Errc(StorageErrc::IsADirectory);
    }
    if (dest_exists && !options.overwrite) {
        return Errc(StorageErrc::AlreadyExists);
    }

    if (source.is_directory) {
        if (dest_exists && !fs::is_directory(to_full, ec)) {
            return Errc(StorageErrc::NotADirectory);
        }
        fs::create_directories(to_full, ec);
        if (ec) {
            return std::unexpected(MapFilesystemError(ec));
        }
        for (fs::directory_iterator it(from_full, ec), end; !ec && it != end; it.increment(ec)) {
            if (auto res = CopyEntry(it->path(), to_full / it->path().filename(), options); !res) {
                return res;
            }
        }
        if (ec) {
            return std::unexpected(MapFilesystemError(ec));
        }
    } else if (source.is_symlink) {
        const fs::path target = fs::read_symlink(from_full, ec);
        if (ec) {
            return std::unexpected(MapFilesystemError(ec));
        }
        if (dest_exists) {
            fs::remove(to_full, ec);
            if (ec) {
                return std::unexpected(MapFilesystemError(ec));
            }
        }
        fs::create_symlink(target, to_full, ec);
        if (ec) {
            return std::unexpected(MapFilesystemError(ec));
        }
        return {};
    } else {
        if (auto res = EnsureParentExists(to_full); !res) {
            return res;
        }
        fs::copy_file(
            from_full, to_full,
            options.overwrite ? fs::copy_options::overwrite_existing : fs::copy_options::none, ec
        );
        if (ec) {
            return std::unexpected(MapFilesystemError(ec));
        }
    }

    if (options.preserve_attributes) {
        return ApplyAttributes(to_full, source);
    }
    return {};
}

StorageResult<void> PosixStorageAdapter::Copy(
    const std::string& from, const std::string& to, const CopyOptions& options
)
{
    spdlog::trace("Copy({} -> {}) under {}", from, to, root_.string());
    if (auto res = EnsureAvailable(); !res) {
        return res;
    }
    auto from_full = options.follow_symlinks ? ResolveTargetPath(from) : ResolvePath(from);
    if (!from_full) {
        return std::unexpected(from_full.error());
    }
    auto to_full = ResolvePath(to);
    if (!to_full) {
        return std::unexpected(to_full.error());
    }
    if (IsWithinVirtualPath(to, from)) {
        return Errc(StorageErrc::InvalidArgument);
    }
    return CopyEntry(*from_full, *to_full, options);
}

StorageResult<void> PosixStorageAdapter::Move(
    const std::string& from, const std::string& to, const MoveOptions& options
)
{
    if (auto res = EnsureAvailable(); !res) {
        return res;
    }
    auto from_full = ResolvePath(from);
    if (!from_full) {
        return std::unexpected(from_full.error());
    }
    auto to_full = ResolvePath(to);
    if (!to_full) {
        return std::unexpected(to_full.error());
    }
    auto source = LstatPath(*from_full);
    if (!source) {
        return std::unexpected(source.error());
    }
    std::error_code ec;
    if (fs::exists(fs::symlink_status(*to_full, ec))) {
        if (!options.overwrite) {
            return Errc(StorageErrc::AlreadyExists);
        }
        fs::remove_all(*to_full, ec);
        if (ec) {
            return std::unexpected(MapFilesystemError(ec));
        }
    }
    if (auto res = EnsureParentExists(*to_full); !res) {
        return res;
    }
    if (::rename(from_full->c_str(), to_full->c_str()) == 0) {
        return {};
    }
    if (errno != EXDEV) {
        return ErrnoError(errno);
    }
    // Different filesystems below one root: copy, then remove the source.
    CopyOptions copy_options;
    copy_options.recursive           = true;
    copy_options.preserve_attributes = true;
    if (auto res = CopyEntry(*from_full, *to_full, copy_options); !res) {
        return res;
    }
    fs::remove_all(*from_full, ec);
    if (ec) {
        return std::unexpected(MapFilesystemError(ec));
    }
    return {};
}

StorageResult<void> PosixStorageAdapter::RemoveDirectory(const std::string& path)
{
    if (auto res = EnsureAvailable(); !res) {
        return res;
    }
    auto full = ResolvePath(path);
    if (!full) {
        return std::unexpected(full.error());
    }
    if (*full == root_) {
        return Errc(StorageErrc::InvalidPath);
    }
    if (::rmdir(full->c_str()) == -1) {
        return ErrnoError(errno);
    }
    return {};
}

StorageResult<void> PosixStorageAdapter::RemoveRecursive(const std::string& path)
{
    if (auto res = EnsureAvailable(); !res) {
        return res;
    }
    auto full = ResolvePath(path);
    if (!full) {
        return std::unexpected(full.error());
    }
    if (*full == root_) {
        return Errc(StorageErrc::InvalidPath);
    }
    std::error_code ec;
    fs::remove_all(*full, ec);
    if (ec) {
        return std::unexpected(MapFilesystemError(ec));
    }
    return {};
}

StorageResult<void> PosixStorageAdapter::CreateDirectories(const std::string& path)
{
    if (auto res = EnsureAvailable(); !res) {
        return res;
    }
    auto full = ResolveTargetPath(path);
    if (!full) {
        return std::unexpected(full.error());
    }
    std::error_code ec;
    fs::create_directories(*full, ec);
    if (ec) {
        return std::unexpected(MapFilesystemError(ec));
    }
    if (!fs::is_directory(*full, ec)) {
        return Errc(StorageErrc::AlreadyExists);
    }
    return {};
}

StorageResult<void> PosixStorageAdapter::Append(
    const std::string& path, std::span<const std::byte> data
)
{
    if (auto res = EnsureAvailable(); !res) {
        return res;
    }
    auto full = ResolveTargetPath(path);
    if (!full) {
        return std::unexpected(full.error());
    }
    return WriteFile(*full, data, O_WRONLY | O_CREAT | O_APPEND);
}

StorageResult<std::size_t> PosixStorageAdapter::WriteAt(
    const std::string& path, std::uint64_t offset, std::span<const std::byte> data
)
{
    if (auto res = EnsureAvailable(); !res) {
        return std::unexpected(res.error());
    }
    auto full = ResolveTargetPath(path);
    if (!full) {
        return std::unexpected(full.error());
    }
    if (auto res = EnsureParentExists(*full); !res) {
        return std::unexpected(res.error());
    }
    constexpr mode_t default_mode = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;
    const int fd = ::open(full->c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, default_mode);
    if (fd < 0) {
        return ErrnoError(errno);
    }
    FileDescriptorGuard fd_guard(fd);
    if (auto res = WriteAll(fd, data, static_cast<off_t>(offset), true); !res) {
        return std::unexpected(res.error());
    }
    return data.size();
}

StorageResult<void> PosixStorageAdapter::Truncate(const std::string& path, std::uint64_t size)
{
    if (auto res = EnsureAvailable(); !res) {
        return res;
    }
    auto full = ResolveTargetPath(path);
    if (!full) {
        return std::unexpected(full.error());
    }
    if (::truncate(full->c_str(), static_cast<off_t>(size)) == -1) {
        return ErrnoError(errno);
    }
    return {};
}

StorageResult<void> PosixStorageAdapter::CreateSymlink(
    const std::string& target, const std::string& link_path
)
{
    if (auto res = EnsureAvailable(); !res) {
        return res;
    }
    auto link_full = ResolvePath(link_path);
    if (!link_full) {
        return std::unexpected(link_full.error());
    }
    if (auto res = EnsureParentExists(*link_full); !res) {
        return res;
    }
    if (::symlink(target.c_str(), link_full->c_str()) == -1) {
        return ErrnoError(errno);
    }
    return {};
}

StorageResult<std::string> PosixStorageAdapter::ReadSymlink(const std::string& path)
{
    if (auto res = EnsureAvailable(); !res) {
        return std::unexpected(res.error());
    }
    auto full = ResolvePath(path);
    if (!full) {
        return std::unexpected(full.error());
    }
    std::error_code ec;
    const fs::path target = fs::read_symlink(*full, ec);
    if (ec) {
        return std::unexpected(MapFilesystemError(ec));
    }
    return target.string();
}

StorageResult<void> PosixStorageAdapter::SetPermissions(const std::string& path, mode_t mode)
{
    if (auto res = EnsureAvailable(); !res) {
        return res;
    }
    auto full = ResolveTargetPath(path);
    if (!full) {
        return std::unexpected(full.error());
    }
    if (::chmod(full->c_str(), mode) == -1) {
        return ErrnoError(errno);
    }
    return {};
}

StorageResult<void> PosixStorageAdapter::SetOwner(const std::string& path, uid_t uid, gid_t gid)
{
    if (auto res = EnsureAvailable(); !res) {
        return res;
    }
    auto full = ResolvePath(path);
    if (!full) {
        return std::unexpected(full.error());
    }
    if (::lchown(full->c_str(), uid, gid) == -1) {
        return ErrnoError(errno);
    }
    return {};
}

StorageResult<void> PosixStorageAdapter::Touch(const std::string& path)
{
    if (auto res = EnsureAvailable(); !res) {
        return res;
    }
    auto full = ResolveTargetPath(path);
    if (!full) {
        return std::unexpected(full.error());
    }
    struct stat st{};
    if (::lstat(full->c_str(), &st) == -1) {
        if (errno != ENOENT) {
            return ErrnoError(errno);
        }
        return WriteFile(*full, {}, O_WRONLY | O_CREAT);
    }
    if (::utimensat(AT_FDCWD, full->c_str(), nullptr, 0) == -1) {
        return ErrnoError(errno);
    }
    return {};
}

StorageResult<void> PosixStorageAdapter::SetTimes(
    const std::string& path, TimePoint accessed, TimePoint modified
)
{
    if (auto res = EnsureAvailable(); !res) {
        return res;
    }
    auto full = ResolvePath(path);
    if (!full) {
        return std::unexpected(full.error());
    }
    const struct timespec times[2] = {ToTimespec(accessed), ToTimespec(modified)};
    if (::utimensat(AT_FDCWD, full->c_str(), times, AT_SYMLINK_NOFOLLOW) == -1) {
        return ErrnoError(errno);
    }
    return {};
}

StorageResult<std::uint64_t> PosixStorageAdapter::AvailableSpace()
{
    if (auto res = EnsureAvailable(); !res) {
        return std::unexpected(res.error());
    }
    std::error_code ec;
    const fs::space_info space = fs::space(root_, ec);
    if (ec) {
        return std::unexpected(MapFilesystemError(ec));
    }
    return space.available;
}

StorageResult<std::uint64_t> PosixStorageAdapter::TotalSpace()
{
    if (auto res = EnsureAvailable(); !res) {
        return std::unexpected(res.error());
    }
    std::error_code ec;
    const fs::space_info space = fs::space(root_, ec);
    if (ec) {
        return std::unexpected(MapFilesystemError(ec));
    }
    return space.capacity;
}

bool PosixStorageAdapter::IsReadOnly() const
{
    struct statvfs st{};
    if (::statvfs(root_.c_str(), &st) == -1) {
        return false;
    }
    return (st.f_flag & ST_RDONLY) != 0;
}

}  // namespace TierFS::Storage
