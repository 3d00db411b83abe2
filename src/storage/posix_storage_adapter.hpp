#ifndef TIERFS_SRC_STORAGE_POSIX_STORAGE_ADAPTER_HPP_
#define TIERFS_SRC_STORAGE_POSIX_STORAGE_ADAPTER_HPP_

#include "storage/i_storage_adapter.hpp"

#include <sys/stat.h>
#include <filesystem>
#include <string>
#include <system_error>

namespace TierFS::Storage
{

namespace fs = std::filesystem;

TimePoint FromTimespec(const struct timespec& ts);
struct timespec ToTimespec(TimePoint tp);

/**
 * @brief Shared implementation for backends reachable as a directory tree.
 *
 * Local disks, mounted network shares and the block view of hybrid storage
 * all expose a POSIX directory; they differ only in tier detection and in how
 * availability is established, which derived classes provide.
 */
class PosixStorageAdapter : public IStorageAdapter
{
    public:
    explicit PosixStorageAdapter(fs::path root, bool create_root = true);
    ~PosixStorageAdapter() override = default;

    PosixStorageAdapter(const PosixStorageAdapter&)            = delete;
    PosixStorageAdapter& operator=(const PosixStorageAdapter&) = delete;
    PosixStorageAdapter(PosixStorageAdapter&&)                 = delete;
    PosixStorageAdapter& operator=(PosixStorageAdapter&&)      = delete;

    const fs::path& GetRoot() const { return root_; }
    bool SupportsFileOperations() const override { return true; }

    StorageResult<void> Initialize() override;
    StorageResult<void> Shutdown() override;

    StorageResult<std::vector<VirtualFile>> List(const std::string& path) override;
    StorageResult<Bytes> Read(const std::string& path) override;
    StorageResult<Bytes> ReadRange(
        const std::string& path, std::uint64_t offset, std::uint64_t length
    ) override;
    StorageResult<void> Write(const std::string& path, std::span<const std::byte> data) override;
    StorageResult<void> Delete(const std::string& path) override;
    StorageResult<void> CreateDirectory(const std::string& path) override;
    StorageResult<bool> Exists(const std::string& path) override;
    StorageResult<VirtualFile> Stat(const std::string& path) override;
    StorageResult<std::uint64_t> FileSize(const std::string& path) override;
    StorageResult<bool> TestConnection() override;

    StorageResult<FileStat> StatEntry(const std::string& path) override;
    StorageResult<void> Rename(const std::string& from, const std::string& to) override;
    StorageResult<void> Copy(
        const std::string& from, const std::string& to, const CopyOptions& options
    ) override;
    StorageResult<void> Move(
        const std::string& from, const std::string& to, const MoveOptions& options
    ) override;
    StorageResult<void> RemoveDirectory(const std::string& path) override;
    StorageResult<void> RemoveRecursive(const std::string& path) override;
    StorageResult<void> CreateDirectories(const std::string& path) override;
    StorageResult<void> Append(const std::string& path, std::span<const std::byte> data) override;
    StorageResult<std::size_t> WriteAt(
        const std::string& path, std::uint64_t offset, std::span<const std::byte> data
    ) override;
    StorageResult<void> Truncate(const std::string& path, std::uint64_t size) override;
    StorageResult<void> CreateSymlink(const std::string& target, const std::string& link_path)
        override;
    StorageResult<std::string> ReadSymlink(const std::string& path) override;
    StorageResult<void> SetPermissions(const std::string& path, mode_t mode) override;
    StorageResult<void> SetOwner(const std::string& path, uid_t uid, gid_t gid) override;
    StorageResult<void> Touch(const std::string& path) override;
    StorageResult<void> SetTimes(const std::string& path, TimePoint accessed, TimePoint modified)
        override;
    StorageResult<std::uint64_t> AvailableSpace() override;
    StorageResult<std::uint64_t> TotalSpace() override;
    bool IsReadOnly() const override;

    /// Absolute backend path for a virtual path, or InvalidPath when it escapes the root.
    /// A final symlink component is not followed.
    StorageResult<fs::path> ResolvePath(const std::string& path) const;
    /// As ResolvePath, and a final symlink must also resolve inside the root.
    StorageResult<fs::path> ResolveTargetPath(const std::string& path) const;

    protected:
    /// Gate run before every backend access.
    virtual StorageResult<void> EnsureAvailable() { return {}; }

    /// Tier status for one entry; derived classes with extra knowledge override.
    virtual TierStatus DetectTierFor(const std::string& virtual_path, const FileStat& stat) const;

    static FileStat ToFileStat(const struct stat& st);
    static std::error_code MapFilesystemError(const std::error_code& ec);

    private:
    static constexpr int kMaxSymlinkHops = 40;

    bool IsUnderRoot(const fs::path& canonical_path) const;
    StorageResult<FileStat> LstatPath(const fs::path& full_path) const;
    StorageResult<void> EnsureParentExists(const fs::path& full_path) const;
    StorageResult<void> WriteFile(
        const fs::path& full_path, std::span<const std::byte> data, int flags
    );
    StorageResult<void> CopyEntry(
        const fs::path& from_full, const fs::path& to_full, const CopyOptions& options
    );
    StorageResult<void> ApplyAttributes(const fs::path& to_full, const FileStat& source) const;
    VirtualFile BuildVirtualFile(const std::string& virtual_path, const FileStat& stat) const;

    fs::path root_;
    fs::path canonical_root_;
    const bool create_root_;
};

}  // namespace TierFS::Storage

#endif  // TIERFS_SRC_STORAGE_POSIX_STORAGE_ADAPTER_HPP_
