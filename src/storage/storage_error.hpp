#ifndef TIERFS_SRC_STORAGE_STORAGE_ERROR_HPP_
#define TIERFS_SRC_STORAGE_STORAGE_ERROR_HPP_

#include <cerrno>
#include <expected>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

namespace TierFS::Storage
{

//------------------------------------------------------------------------------//
// Error Codes declared for Storage/Cache Operations
//------------------------------------------------------------------------------//

// clang-format off
enum class StorageErrc {
    Success = 0,       // Not an error
    NotFound,          // Path does not exist on the backend or in the cache
    PermissionDenied,  // Operation not permitted by the backend
    Unsupported,       // Operation is not implemented by this backend
    Unavailable,       // Backend unreachable or timed out
    AlreadyExists,     // Non-overwrite conflict
    CapacityExceeded,  // Cache (or backend) cannot make room for the data
    Internal,          // Serialization, configuration or invariant failure
    NotADirectory,     // Expected a directory, found a file
    IsADirectory,      // Expected a file, found a directory
    NotEmpty,          // Attempted to remove a non-empty directory
    InvalidPath,       // Path escapes the source root or is malformed
    InvalidArgument,   // Invalid offset, size or option combination
    IOError,           // General I/O error during read/write
    Cancelled,         // Job was cancelled before the operation ran
};
// clang-format on

/// Coarse error kinds callers branch on.
enum class ErrorKind {
    None,
    NotFound,
    PermissionDenied,
    Unsupported,
    Unavailable,
    AlreadyExists,
    CapacityExceeded,
    Internal,
};

std::error_code make_error_code(StorageErrc e);

inline StorageErrc ErrnoToStorageErrc(int err_no)
{
    switch (err_no) {
        case 0:
            return StorageErrc::Success;
        case ENOENT:
            return StorageErrc::NotFound;
        case EACCES:
        case EPERM:
        case EROFS:
            return StorageErrc::PermissionDenied;
        case EIO:
            return StorageErrc::IOError;
        case ENOSPC:
        case EDQUOT:
            return StorageErrc::CapacityExceeded;
        case EINVAL:
            return StorageErrc::InvalidArgument;
        case EEXIST:
            return StorageErrc::AlreadyExists;
        case ENOTDIR:
            return StorageErrc::NotADirectory;
        case EISDIR:
            return StorageErrc::IsADirectory;
        case ENOTEMPTY:
            return StorageErrc::NotEmpty;
        case EOPNOTSUPP:
        case ENOSYS:
        case EXDEV:
            return StorageErrc::Unsupported;
        case ETIMEDOUT:
        case EHOSTDOWN:
        case EHOSTUNREACH:
        case ENOTCONN:
        case ESTALE:
        case ENETDOWN:
        case ENETUNREACH:
            return StorageErrc::Unavailable;
        case ENAMETOOLONG:
        case ELOOP:
            return StorageErrc::InvalidPath;

        default:
            return StorageErrc::IOError;
    }
}

//------------------------------------------------------------------------------//
// Error Category Definition (Private Implementation Detail)
//------------------------------------------------------------------------------//
namespace detail
{
class StorageErrorCategory : public std::error_category
{
    public:
    const char* name() const noexcept override { return "TierFS::Storage"; }
    std::string message(int ev) const override
    {
        switch (static_cast<StorageErrc>(ev)) {
            case StorageErrc::Success:
                return "Success";
            case StorageErrc::NotFound:
                return "File or directory not found";
            case StorageErrc::PermissionDenied:
                return "Permission denied";
            case StorageErrc::Unsupported:
                return "Operation not supported by this storage backend";
            case StorageErrc::Unavailable:
                return "Storage backend unavailable";
            case StorageErrc::AlreadyExists:
                return "File or directory already exists";
            case StorageErrc::CapacityExceeded:
                return "Capacity exceeded";
            case StorageErrc::Internal:
                return "Internal error";
            case StorageErrc::NotADirectory:
                return "Path is not a directory";
            case StorageErrc::IsADirectory:
                return "Path is a directory";
            case StorageErrc::NotEmpty:
                return "Directory not empty";
            case StorageErrc::InvalidPath:
                return "Invalid path";
            case StorageErrc::InvalidArgument:
                return "Invalid argument";
            case StorageErrc::IOError:
                return "Input/output error";
            case StorageErrc::Cancelled:
                return "Operation cancelled";
            default:
                return "Unrecognized error code";
        }
    }
};
}  // namespace detail

// Global instance of the category
inline const detail::StorageErrorCategory storage_error_category;

// Make the enum usable with std::error_code
inline std::error_code make_error_code(StorageErrc e)
{
    return {static_cast<int>(e), storage_error_category};
}

inline std::error_code MakeErrnoError(int err_no)
{
    return make_error_code(ErrnoToStorageErrc(err_no));
}

/// Maps any error code onto the coarse taxonomy.
inline ErrorKind ErrorKindOf(const std::error_code& ec)
{
    if (!ec) {
        return ErrorKind::None;
    }
    StorageErrc errc = StorageErrc::IOError;
    if (ec.category() == storage_error_category) {
        errc = static_cast<StorageErrc>(ec.value());
    } else if (ec.category() == std::generic_category() ||
               ec.category() == std::system_category()) {
        errc = ErrnoToStorageErrc(ec.value());
    }
    switch (errc) {
        case StorageErrc::Success:
            return ErrorKind::None;
        case StorageErrc::NotFound:
            return ErrorKind::NotFound;
        case StorageErrc::PermissionDenied:
            return ErrorKind::PermissionDenied;
        case StorageErrc::Unsupported:
            return ErrorKind::Unsupported;
        case StorageErrc::Unavailable:
            return ErrorKind::Unavailable;
        case StorageErrc::AlreadyExists:
            return ErrorKind::AlreadyExists;
        case StorageErrc::CapacityExceeded:
            return ErrorKind::CapacityExceeded;
        case StorageErrc::NotADirectory:
        case StorageErrc::IsADirectory:
        case StorageErrc::NotEmpty:
        case StorageErrc::InvalidPath:
        case StorageErrc::InvalidArgument:
        case StorageErrc::IOError:
        case StorageErrc::Cancelled:
        case StorageErrc::Internal:
        default:
            return ErrorKind::Internal;
    }
}

//------------------------------------------------------------------------------//
// Custom Exception Type
//------------------------------------------------------------------------------//
class StorageException : public std::runtime_error
{
    private:
    std::error_code ec_;

    public:
    explicit StorageException(std::error_code ec) : std::runtime_error(ec.message()), ec_(ec) {}

    const std::error_code& code() const noexcept { return ec_; }
};

//------------------------------------------------------------------------------//
// Result Type Alias
//------------------------------------------------------------------------------//
template <typename T>
using StorageResult = std::expected<T, std::error_code>;

//------------------------------------------------------------------------------//
// Helper Function to Convert StorageResult to FUSE errno
//------------------------------------------------------------------------------//

inline int ErrorCodeToErrno(const std::error_code& ec)
{
    if (!ec) {
        return 0;
    }
    if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
        return -ec.value();  // ensure negative errno
    }
    if (ec.category() != storage_error_category) {
        return -EIO;
    }
    switch (static_cast<StorageErrc>(ec.value())) {
        case StorageErrc::Success:
            return 0;
        case StorageErrc::NotFound:
            return -ENOENT;
        case StorageErrc::PermissionDenied:
            return -EACCES;
        case StorageErrc::Unsupported:
            return -ENOTSUP;
        case StorageErrc::Unavailable:
            return -EHOSTDOWN;
        case StorageErrc::AlreadyExists:
            return -EEXIST;
        case StorageErrc::CapacityExceeded:
            return -ENOSPC;
        case StorageErrc::NotADirectory:
            return -ENOTDIR;
        case StorageErrc::IsADirectory:
            return -EISDIR;
        case StorageErrc::NotEmpty:
            return -ENOTEMPTY;
        case StorageErrc::InvalidPath:
        case StorageErrc::InvalidArgument:
            return -EINVAL;
        case StorageErrc::Cancelled:
            return -ECANCELED;
        case StorageErrc::IOError:
        case StorageErrc::Internal:
        default:
            return -EIO;
    }
}

template <typename T>
int StorageResultToErrno(const StorageResult<T>& result)
{
    if (result.has_value()) {
        return 0;
    }
    return ErrorCodeToErrno(result.error());
}

}  // namespace TierFS::Storage

// Enable std::error_code implicit conversion for StorageErrc
namespace std
{
template <>
struct is_error_code_enum<TierFS::Storage::StorageErrc> : true_type {
};
}  // namespace std

#endif  // TIERFS_SRC_STORAGE_STORAGE_ERROR_HPP_
