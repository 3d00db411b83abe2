#include "sync/sync_types.hpp"

namespace TierFS::Sync
{

const char *SyncDirectionToString(SyncDirection direction)
{
    switch (direction) {
        case SyncDirection::ObjectToBlock:
            return "object_to_block";
        case SyncDirection::BlockToObject:
            return "block_to_object";
        case SyncDirection::ToHot:
            return "to_hot";
        case SyncDirection::FromHot:
            return "from_hot";
        case SyncDirection::Bidirectional:
            return "bidirectional";
    }
    return "unknown";
}

std::optional<SyncDirection> StringToSyncDirection(const std::string &str)
{
    if (str == "object_to_block") {
        return SyncDirection::ObjectToBlock;
    }
    if (str == "block_to_object") {
        return SyncDirection::BlockToObject;
    }
    if (str == "to_hot") {
        return SyncDirection::ToHot;
    }
    if (str == "from_hot") {
        return SyncDirection::FromHot;
    }
    if (str == "bidirectional") {
        return SyncDirection::Bidirectional;
    }
    return std::nullopt;
}

const char *SyncModeToString(SyncMode mode)
{
    switch (mode) {
        case SyncMode::NewerWins:
            return "newer_wins";
        case SyncMode::LargerWins:
            return "larger_wins";
        case SyncMode::ForceOverwrite:
            return "force_overwrite";
        case SyncMode::SkipExisting:
            return "skip_existing";
        case SyncMode::Merge:
            return "merge";
    }
    return "unknown";
}

std::optional<SyncMode> StringToSyncMode(const std::string &str)
{
    if (str == "newer_wins") {
        return SyncMode::NewerWins;
    }
    if (str == "larger_wins") {
        return SyncMode::LargerWins;
    }
    if (str == "force_overwrite") {
        return SyncMode::ForceOverwrite;
    }
    if (str == "skip_existing") {
        return SyncMode::SkipExisting;
    }
    if (str == "merge") {
        return SyncMode::Merge;
    }
    return std::nullopt;
}

const char *SyncPriorityToString(SyncPriority priority)
{
    switch (priority) {
        case SyncPriority::Background:
            return "background";
        case SyncPriority::Normal:
            return "normal";
        case SyncPriority::High:
            return "high";
        case SyncPriority::Critical:
            return "critical";
    }
    return "unknown";
}

std::optional<SyncPriority> StringToSyncPriority(const std::string &str)
{
    if (str == "background") {
        return SyncPriority::Background;
    }
    if (str == "normal") {
        return SyncPriority::Normal;
    }
    if (str == "high") {
        return SyncPriority::High;
    }
    if (str == "critical") {
        return SyncPriority::Critical;
    }
    return std::nullopt;
}

const char *SyncOperationToString(SyncOperation operation)
{
    switch (operation) {
        case SyncOperation::Comparing:
            return "comparing";
        case SyncOperation::Copying:
            return "copying";
        case SyncOperation::Moving:
            return "moving";
        case SyncOperation::Caching:
            return "caching";
        case SyncOperation::Deleting:
            return "deleting";
        case SyncOperation::UpdatingMetadata:
            return "updating_metadata";
    }
    return "unknown";
}

//------------------------------------------------------------------------------//
// JSON
//------------------------------------------------------------------------------//

void to_json(nlohmann::json &j, const SyncRequest &request)
{
    j = nlohmann::json{
        {"source_id", request.source_id},
        {"destination_id", request.destination_id},
        {"paths", request.paths},
        {"destination_path", request.destination_path},
        {"direction", SyncDirectionToString(request.direction)},
        {"mode", SyncModeToString(request.mode)},
        {"priority", SyncPriorityToString(request.priority)},
        {"use_cache", request.use_cache},
        {"delete_orphans", request.delete_orphans},
        {"preserve_tier", request.preserve_tier},
        {"recursive", request.recursive},
    };
}

void from_json(const nlohmann::json &j, SyncRequest &request)
{
    const SyncRequest defaults;
    request.source_id        = j.at("source_id").get<std::string>();
    request.destination_id   = j.at("destination_id").get<std::string>();
    request.paths            = j.value("paths", std::vector<std::string>{});
    request.destination_path = j.value("destination_path", defaults.destination_path);
    request.direction = StringToSyncDirection(j.value("direction", std::string{}))
                            .value_or(defaults.direction);
    request.mode     = StringToSyncMode(j.value("mode", std::string{})).value_or(defaults.mode);
    request.priority = StringToSyncPriority(j.value("priority", std::string{}))
                           .value_or(defaults.priority);
    request.use_cache      = j.value("use_cache", defaults.use_cache);
    request.delete_orphans = j.value("delete_orphans", defaults.delete_orphans);
    request.preserve_tier  = j.value("preserve_tier", defaults.preserve_tier);
    request.recursive      = j.value("recursive", defaults.recursive);
}

void to_json(nlohmann::json &j, const SyncResult &result)
{
    j = nlohmann::json{
        {"files_synced", result.files_synced},
        {"files_skipped", result.files_skipped},
        {"files_failed", result.files_failed},
        {"files_deleted", result.files_deleted},
        {"bytes_transferred", result.bytes_transferred},
        {"errors", result.errors},
        {"duration_ms", result.duration_ms},
        {"used_cache", result.used_cache},
        {"cancelled", result.cancelled},
    };
    if (result.cache_hit_rate) {
        j["cache_hit_rate"] = *result.cache_hit_rate;
    }
}

void to_json(nlohmann::json &j, const TieringRequest &request)
{
    j = nlohmann::json{
        {"source_id", request.source_id},
        {"paths", request.paths},
        {"target_tier", Storage::StorageTierToString(request.target_tier)},
        {"priority", SyncPriorityToString(request.priority)},
        {"recursive", request.recursive},
    };
}

}  // namespace TierFS::Sync
