#ifndef TIERFS_SRC_STORAGE_OBJECT_CLIENT_HPP_
#define TIERFS_SRC_STORAGE_OBJECT_CLIENT_HPP_

#include "storage/storage_error.hpp"
#include "storage/storage_types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace TierFS::Storage
{

struct ObjectInfo {
    std::string key;
    std::uint64_t size = 0;
    TimePoint last_modified{};
    std::string storage_class = "STANDARD";
    std::string etag;
};

/// Minimal flat-keyspace object API the object adapter is written against.
class IObjectClient
{
    public:
    virtual ~IObjectClient() = default;

    /// Establishes the session or loads local state; default is a no-op.
    virtual StorageResult<void> Open() { return {}; }

    virtual StorageResult<void> PutObject(
        const std::string& key, std::span<const std::byte> data, const std::string& storage_class
    )                                                                            = 0;
    virtual StorageResult<Bytes> GetObject(const std::string& key)              = 0;
    virtual StorageResult<Bytes> GetObjectRange(
        const std::string& key, std::uint64_t offset, std::uint64_t length
    )                                                                            = 0;
    virtual StorageResult<ObjectInfo> HeadObject(const std::string& key)        = 0;
    virtual StorageResult<void> DeleteObject(const std::string& key)            = 0;
    /// Every object whose key starts with `prefix`, in key order.
    virtual StorageResult<std::vector<ObjectInfo>> ListObjects(const std::string& prefix) = 0;
    /// Server-side copy; keeps the source class unless `storage_class` is given.
    virtual StorageResult<void> CopyObject(
        const std::string& source_key, const std::string& destination_key,
        const std::optional<std::string>& storage_class
    )                                       = 0;
    virtual StorageResult<bool> Ping()      = 0;
};

}  // namespace TierFS::Storage

#endif  // TIERFS_SRC_STORAGE_OBJECT_CLIENT_HPP_
