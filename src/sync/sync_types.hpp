#ifndef TIERFS_SRC_SYNC_SYNC_TYPES_HPP_
#define TIERFS_SRC_SYNC_SYNC_TYPES_HPP_

#include "storage/storage_types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace TierFS::Sync
{

//------------------------------------------------------------------------------//
// Enumerations
//------------------------------------------------------------------------------//

enum class SyncDirection : std::uint8_t {
    ObjectToBlock,
    BlockToObject,
    ToHot,
    FromHot,
    Bidirectional,
};

/// Conflict policy when the destination already holds the file.
enum class SyncMode : std::uint8_t {
    NewerWins,
    LargerWins,
    ForceOverwrite,
    SkipExisting,
    Merge,  ///< keep both, new copy named "name (n).ext"
};

enum class SyncPriority : std::uint8_t { Background, Normal, High, Critical };

enum class SyncOperation : std::uint8_t {
    Comparing,
    Copying,
    Moving,
    Caching,
    Deleting,
    UpdatingMetadata,
};

const char *SyncDirectionToString(SyncDirection direction);
std::optional<SyncDirection> StringToSyncDirection(const std::string &str);
const char *SyncModeToString(SyncMode mode);
std::optional<SyncMode> StringToSyncMode(const std::string &str);
const char *SyncPriorityToString(SyncPriority priority);
std::optional<SyncPriority> StringToSyncPriority(const std::string &str);
const char *SyncOperationToString(SyncOperation operation);

//------------------------------------------------------------------------------//
// Requests and Results
//------------------------------------------------------------------------------//

struct SyncRequest {
    std::string source_id;
    std::string destination_id;
    std::vector<std::string> paths;
    std::string destination_path = "/";
    SyncDirection direction      = SyncDirection::ObjectToBlock;
    SyncMode mode                = SyncMode::NewerWins;
    SyncPriority priority        = SyncPriority::Normal;
    bool use_cache               = true;   ///< stage through the local cache
    bool delete_orphans          = false;  ///< only honored when no file failed
    bool preserve_tier           = false;
    bool recursive               = true;
};

struct SyncResult {
    std::string job_id;
    std::uint64_t files_synced      = 0;
    std::uint64_t files_skipped     = 0;
    std::uint64_t files_failed      = 0;
    std::uint64_t files_deleted     = 0;
    std::uint64_t bytes_transferred = 0;
    std::vector<std::string> errors;
    std::uint64_t duration_ms = 0;
    bool used_cache           = false;
    std::optional<double> cache_hit_rate;  ///< 0..100, set when the cache was used
    bool cancelled = false;
};

struct SyncProgress {
    std::string job_id;
    std::string current_file;
    SyncOperation operation       = SyncOperation::Comparing;
    std::uint64_t files_completed = 0;
    std::uint64_t total_files     = 0;
    std::uint64_t bytes_completed = 0;
    std::uint64_t total_bytes     = 0;
    double percent                = 0.0;
};

using ProgressSink = std::function<void(const SyncProgress &)>;

struct TieringRequest {
    std::string source_id;
    std::vector<std::string> paths;
    Storage::StorageTier target_tier = Storage::StorageTier::Hot;
    SyncPriority priority            = SyncPriority::Normal;
    bool recursive                   = false;
};

struct SyncEstimate {
    std::uint64_t total_files             = 0;
    std::uint64_t total_bytes             = 0;
    std::uint64_t files_to_cache          = 0;
    std::uint64_t estimated_duration_secs = 0;
};

struct SyncTarget {
    std::string source_id;
    std::string name;
    Storage::StorageSourceType type   = Storage::StorageSourceType::Local;
    Storage::StorageCategory category = Storage::StorageCategory::Local;
    std::optional<Storage::StorageTier> tier;  ///< default tier of new files, if fixed
    std::vector<SyncDirection> supported_directions;
    bool available = false;
};

//------------------------------------------------------------------------------//
// Cross-Storage Transfers
//------------------------------------------------------------------------------//

struct CrossStorageOptions {
    bool overwrite         = false;
    bool preserve_metadata = true;
    bool recursive         = true;
    bool delete_source     = false;

    static CrossStorageOptions Copy() { return {}; }
    static CrossStorageOptions Move()
    {
        CrossStorageOptions options;
        options.delete_source = true;
        return options;
    }
};

struct CrossStorageResult {
    std::uint64_t files_transferred   = 0;
    std::uint64_t directories_created = 0;
    std::uint64_t bytes_transferred   = 0;
    std::uint64_t files_failed        = 0;
    std::vector<std::string> transferred_paths;
    std::vector<std::string> errors;
    bool source_deleted = false;
};

//------------------------------------------------------------------------------//
// JSON
//------------------------------------------------------------------------------//

void to_json(nlohmann::json &j, const SyncRequest &request);
void from_json(const nlohmann::json &j, SyncRequest &request);
void to_json(nlohmann::json &j, const SyncResult &result);
void to_json(nlohmann::json &j, const TieringRequest &request);

}  // namespace TierFS::Sync

#endif  // TIERFS_SRC_SYNC_SYNC_TYPES_HPP_
