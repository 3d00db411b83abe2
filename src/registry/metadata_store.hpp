#ifndef TIERFS_SRC_REGISTRY_METADATA_STORE_HPP_
#define TIERFS_SRC_REGISTRY_METADATA_STORE_HPP_

#include "persistence/json_record_store.hpp"
#include "storage/storage_types.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace TierFS::Registry
{

namespace fs = std::filesystem;

template <typename T>
using StorageResult = Storage::StorageResult<T>;

/// User-assigned metadata kept beside, not inside, the file.
struct FileMetadata {
    std::vector<std::string> tags;
    bool is_favorite = false;
    std::optional<std::string> color_label;
    std::optional<std::uint8_t> rating;  ///< 0..5
    std::optional<std::string> comment;

    bool IsEmpty() const
    {
        return tags.empty() && !is_favorite && !color_label && !rating && !comment;
    }
};

/// Copies user metadata onto a listing entry.
void ApplyMetadata(Storage::VirtualFile &file, const FileMetadata &metadata);

class IFileMetadataProvider
{
    public:
    virtual ~IFileMetadataProvider() = default;

    virtual std::optional<FileMetadata> Get(
        const std::string &source_id, const std::string &path
    ) const = 0;
};

/// Metadata for every source in one JSON file, keyed by "source:path".
class JsonMetadataStore : public IFileMetadataProvider
{
    public:
    explicit JsonMetadataStore(fs::path file_path);
    ~JsonMetadataStore() override = default;

    JsonMetadataStore(const JsonMetadataStore &)            = delete;
    JsonMetadataStore &operator=(const JsonMetadataStore &) = delete;

    StorageResult<void> Load();

    std::optional<FileMetadata> Get(
        const std::string &source_id, const std::string &path
    ) const override;
    /// Empty metadata removes the record.
    StorageResult<void> Set(
        const std::string &source_id, const std::string &path, const FileMetadata &metadata
    );
    StorageResult<void> Delete(const std::string &source_id, const std::string &path);

    StorageResult<void> AddTag(
        const std::string &source_id, const std::string &path, const std::string &tag
    );
    StorageResult<void> RemoveTag(
        const std::string &source_id, const std::string &path, const std::string &tag
    );
    StorageResult<bool> ToggleFavorite(const std::string &source_id, const std::string &path);
    StorageResult<void> SetRating(
        const std::string &source_id, const std::string &path, std::optional<std::uint8_t> rating
    );

    std::vector<std::string> ListFavorites(const std::string &source_id) const;
    std::vector<std::string> ListByTag(const std::string &source_id, const std::string &tag) const;

    private:
    StorageResult<void> Modify_(
        const std::string &source_id, const std::string &path,
        const std::function<void(FileMetadata &)> &change
    );
    template <typename Pred>
    std::vector<std::string> Select_(const std::string &source_id, Pred pred) const;

    Persistence::JsonRecordStore store_;
};

}  // namespace TierFS::Registry

#endif  // TIERFS_SRC_REGISTRY_METADATA_STORE_HPP_
