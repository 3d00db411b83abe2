#ifndef TIERFS_SRC_STORAGE_FILESYSTEM_OBJECT_CLIENT_HPP_
#define TIERFS_SRC_STORAGE_FILESYSTEM_OBJECT_CLIENT_HPP_

#include "persistence/json_record_store.hpp"
#include "storage/object_client.hpp"

#include <filesystem>
#include <mutex>

namespace TierFS::Storage
{

namespace fs = std::filesystem;

/**
 * @brief Object client over a bucket directory (a mounted bucket or a local
 * stand-in for one).
 *
 * Object bodies are stored as files named by the MD5 of their key, so keys
 * such as "a" and "a/b" can coexist. Object metadata (size, storage class,
 * etag, modification time) lives in a JSON manifest beside the bodies.
 */
class FilesystemObjectClient : public IObjectClient
{
    public:
    explicit FilesystemObjectClient(fs::path bucket_dir);
    ~FilesystemObjectClient() override = default;

    FilesystemObjectClient(const FilesystemObjectClient&)            = delete;
    FilesystemObjectClient& operator=(const FilesystemObjectClient&) = delete;

    StorageResult<void> Open() override;
    StorageResult<void> PutObject(
        const std::string& key, std::span<const std::byte> data, const std::string& storage_class
    ) override;
    StorageResult<Bytes> GetObject(const std::string& key) override;
    StorageResult<Bytes> GetObjectRange(
        const std::string& key, std::uint64_t offset, std::uint64_t length
    ) override;
    StorageResult<ObjectInfo> HeadObject(const std::string& key) override;
    StorageResult<void> DeleteObject(const std::string& key) override;
    StorageResult<std::vector<ObjectInfo>> ListObjects(const std::string& prefix) override;
    StorageResult<void> CopyObject(
        const std::string& source_key, const std::string& destination_key,
        const std::optional<std::string>& storage_class
    ) override;
    StorageResult<bool> Ping() override;

    const fs::path& GetBucketDir() const { return bucket_dir_; }

    private:
    fs::path BlobPathFor(const std::string& key) const;
    StorageResult<void> WriteBlob(const fs::path& blob_path, std::span<const std::byte> data) const;
    static ObjectInfo InfoFromRecord(const std::string& key, const nlohmann::json& record);
    static nlohmann::json RecordFromInfo(const ObjectInfo& info);

    const fs::path bucket_dir_;
    const fs::path blob_dir_;
    Persistence::JsonRecordStore manifest_;
    std::mutex mutex_;
};

}  // namespace TierFS::Storage

#endif  // TIERFS_SRC_STORAGE_FILESYSTEM_OBJECT_CLIENT_HPP_
