#ifndef TIERFS_SRC_STORAGE_OBJECT_STORAGE_ADAPTER_HPP_
#define TIERFS_SRC_STORAGE_OBJECT_STORAGE_ADAPTER_HPP_

#include "storage/i_storage_adapter.hpp"
#include "storage/object_client.hpp"

#include <memory>
#include <optional>
#include <string>

namespace TierFS::Storage
{

/**
 * @brief Adapter over a flat object key space.
 *
 * Directories do not exist as such: a directory is any common key prefix,
 * optionally materialised by a zero-byte "dir/" marker object. The tier of an
 * object follows its storage-class label.
 */
class ObjectStorageAdapter : public IStorageAdapter
{
    public:
    ObjectStorageAdapter(
        std::shared_ptr<IObjectClient> client, std::string bucket, std::string prefix = "",
        std::string default_storage_class = "STANDARD"
    );
    ~ObjectStorageAdapter() override = default;

    ObjectStorageAdapter(const ObjectStorageAdapter&)            = delete;
    ObjectStorageAdapter& operator=(const ObjectStorageAdapter&) = delete;

    StorageSourceType GetKind() const override { return StorageSourceType::ObjectStorage; }
    TierStrategy GetTierStrategy() const override { return StorageClassTier{}; }
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
    StorageResult<void> Touch(const std::string& path) override;

    /// Rewrites the object under a new storage-class label.
    StorageResult<void> ChangeStorageClass(const std::string& path, const std::string& storage_class);

    const std::string& GetBucket() const { return bucket_; }
    const std::string& GetPrefix() const { return prefix_; }

    private:
    enum class EntryKind { Missing, Object, Prefix };

    struct Location {
        std::string virtual_path;
        std::string key;  ///< object key, or the prefix itself for the root
        bool is_root = false;
    };

    StorageResult<Location> Locate(const std::string& path) const;
    std::string DirPrefixOf(const Location& loc) const;
    StorageResult<EntryKind> Classify(const Location& loc);
    StorageResult<std::optional<ObjectInfo>> HeadIfExists(const std::string& key);
    StorageResult<void> DeletePrefix(const std::string& dir_prefix);
    StorageResult<void> PutPreservingClass(const std::string& key, std::span<const std::byte> data);
    VirtualFile BuildFile(const std::string& virtual_path, const ObjectInfo& info) const;
    VirtualFile BuildDirectory(const std::string& virtual_path) const;

    std::shared_ptr<IObjectClient> client_;
    const std::string bucket_;
    std::string prefix_;  ///< "" or "some/prefix/"
    const std::string default_storage_class_;
};

}  // namespace TierFS::Storage

#endif  // TIERFS_SRC_STORAGE_OBJECT_STORAGE_ADAPTER_HPP_
