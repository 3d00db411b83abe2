#ifndef TIERFS_SRC_STORAGE_I_STORAGE_ADAPTER_HPP_
#define TIERFS_SRC_STORAGE_I_STORAGE_ADAPTER_HPP_

#include "storage/storage_error.hpp"
#include "storage/storage_types.hpp"
#include "storage/tier_detection.hpp"

#include <sys/types.h>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace TierFS::Storage
{

/// Uniform contract over one physical backend. Paths are virtual paths.
class IStorageAdapter
{
    public:
    virtual ~IStorageAdapter() = default;

    [[nodiscard]] virtual StorageSourceType GetKind() const   = 0;
    [[nodiscard]] virtual TierStrategy GetTierStrategy() const = 0;

    /// True when the richer file-operation surface is implemented.
    [[nodiscard]] virtual bool SupportsFileOperations() const { return false; }

    virtual StorageResult<void> Initialize() = 0;
    virtual StorageResult<void> Shutdown()   = 0;

    //------------------------------------------------------------------------------//
    // Basic Contract
    //------------------------------------------------------------------------------//

    virtual StorageResult<std::vector<VirtualFile>> List(const std::string& path) = 0;
    virtual StorageResult<Bytes> Read(const std::string& path)                   = 0;
    virtual StorageResult<Bytes> ReadRange(
        const std::string& path, std::uint64_t offset, std::uint64_t length
    )                                                                                      = 0;
    virtual StorageResult<void> Write(const std::string& path, std::span<const std::byte> data) = 0;
    virtual StorageResult<void> Delete(const std::string& path)                                 = 0;
    virtual StorageResult<void> CreateDirectory(const std::string& path)                        = 0;
    virtual StorageResult<bool> Exists(const std::string& path)                                 = 0;
    virtual StorageResult<VirtualFile> Stat(const std::string& path)                            = 0;
    virtual StorageResult<std::uint64_t> FileSize(const std::string& path)                      = 0;
    virtual StorageResult<bool> TestConnection()                                                = 0;

    /// Current connection state; adapters without a connection are always Connected.
    virtual ConnectionStatus GetConnectionStatus() const { return ConnectionStatus::Connected(); }

    //------------------------------------------------------------------------------//
    // File Operations Surface
    //------------------------------------------------------------------------------//

    virtual StorageResult<FileStat> StatEntry(const std::string& /*path*/)
    {
        return std::unexpected(make_error_code(StorageErrc::Unsupported));
    }
    virtual StorageResult<void> Rename(const std::string& /*from*/, const std::string& /*to*/)
    {
        return std::unexpected(make_error_code(StorageErrc::Unsupported));
    }
    virtual StorageResult<void> Copy(
        const std::string& /*from*/, const std::string& /*to*/, const CopyOptions& /*options*/
    )
    {
        return std::unexpected(make_error_code(StorageErrc::Unsupported));
    }
    virtual StorageResult<void> Move(
        const std::string& /*from*/, const std::string& /*to*/, const MoveOptions& /*options*/
    )
    {
        return std::unexpected(make_error_code(StorageErrc::Unsupported));
    }
    virtual StorageResult<void> RemoveDirectory(const std::string& /*path*/)
    {
        return std::unexpected(make_error_code(StorageErrc::Unsupported));
    }
    virtual StorageResult<void> RemoveRecursive(const std::string& /*path*/)
    {
        return std::unexpected(make_error_code(StorageErrc::Unsupported));
    }
    virtual StorageResult<void> CreateDirectories(const std::string& /*path*/)
    {
        return std::unexpected(make_error_code(StorageErrc::Unsupported));
    }
    virtual StorageResult<void> Append(
        const std::string& /*path*/, std::span<const std::byte> /*data*/
    )
    {
        return std::unexpected(make_error_code(StorageErrc::Unsupported));
    }
    virtual StorageResult<std::size_t> WriteAt(
        const std::string& /*path*/, std::uint64_t /*offset*/, std::span<const std::byte> /*data*/
    )
    {
        return std::unexpected(make_error_code(StorageErrc::Unsupported));
    }
    virtual StorageResult<void> Truncate(const std::string& /*path*/, std::uint64_t /*size*/)
    {
        return std::unexpected(make_error_code(StorageErrc::Unsupported));
    }
    virtual StorageResult<void> CreateSymlink(
        const std::string& /*target*/, const std::string& /*link_path*/
    )
    {
        return std::unexpected(make_error_code(StorageErrc::Unsupported));
    }
    virtual StorageResult<std::string> ReadSymlink(const std::string& /*path*/)
    {
        return std::unexpected(make_error_code(StorageErrc::Unsupported));
    }
    virtual StorageResult<void> SetPermissions(const std::string& /*path*/, mode_t /*mode*/)
    {
        return std::unexpected(make_error_code(StorageErrc::Unsupported));
    }
    virtual StorageResult<void> SetOwner(const std::string& /*path*/, uid_t /*uid*/, gid_t /*gid*/)
    {
        return std::unexpected(make_error_code(StorageErrc::Unsupported));
    }
    virtual StorageResult<void> Touch(const std::string& /*path*/)
    {
        return std::unexpected(make_error_code(StorageErrc::Unsupported));
    }
    virtual StorageResult<void> SetTimes(
        const std::string& /*path*/, TimePoint /*accessed*/, TimePoint /*modified*/
    )
    {
        return std::unexpected(make_error_code(StorageErrc::Unsupported));
    }
    virtual StorageResult<std::uint64_t> AvailableSpace()
    {
        return std::unexpected(make_error_code(StorageErrc::Unsupported));
    }
    virtual StorageResult<std::uint64_t> TotalSpace()
    {
        return std::unexpected(make_error_code(StorageErrc::Unsupported));
    }
    virtual bool IsReadOnly() const { return false; }
};

}  // namespace TierFS::Storage

#endif  // TIERFS_SRC_STORAGE_I_STORAGE_ADAPTER_HPP_
