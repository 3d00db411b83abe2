#ifndef TIERFS_SRC_PERSISTENCE_JSON_RECORD_STORE_HPP_
#define TIERFS_SRC_PERSISTENCE_JSON_RECORD_STORE_HPP_

#include "storage/storage_error.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace TierFS::Persistence
{

namespace fs = std::filesystem;

template <typename T>
using StorageResult = Storage::StorageResult<T>;

/**
 * @brief Keyed set of JSON records backed by a single file.
 *
 * Layout on disk is {"version": 1, "records": {key: record}}. Every mutation
 * rewrites the file through a temporary sibling and rename(2), so a crash
 * leaves either the old or the new content, never a torn file.
 */
class JsonRecordStore
{
    public:
    explicit JsonRecordStore(fs::path file_path);
    ~JsonRecordStore() = default;

    JsonRecordStore(const JsonRecordStore&)            = delete;
    JsonRecordStore& operator=(const JsonRecordStore&) = delete;
    JsonRecordStore(JsonRecordStore&&)                 = delete;
    JsonRecordStore& operator=(JsonRecordStore&&)      = delete;

    /// Loads the file; a missing file is an empty store. Corrupt content fails Internal.
    StorageResult<void> Load();

    StorageResult<void> Put(const std::string& key, nlohmann::json record);
    StorageResult<void> Remove(const std::string& key);
    /// Applies several changes and persists once.
    StorageResult<void> Update(
        const std::function<void(std::map<std::string, nlohmann::json>&)>& fn
    );

    std::optional<nlohmann::json> Get(const std::string& key) const;
    std::map<std::string, nlohmann::json> Snapshot() const;
    std::vector<std::string> Keys() const;
    size_t Size() const;

    const fs::path& GetPath() const { return file_path_; }

    private:
    StorageResult<void> Persist_() const;

    const fs::path file_path_;
    mutable std::mutex mutex_;
    std::map<std::string, nlohmann::json> records_;
};

}  // namespace TierFS::Persistence

#endif  // TIERFS_SRC_PERSISTENCE_JSON_RECORD_STORE_HPP_
