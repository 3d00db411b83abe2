#ifndef TIERFS_SRC_CONFIG_CONFIG_TYPES_HPP_
#define TIERFS_SRC_CONFIG_CONFIG_TYPES_HPP_

#include "app_constants.hpp"
#include "cache/cache_types.hpp"
#include "storage/storage_types.hpp"

#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace TierFS::Config
{

// Function to convert string to spdlog::level::level_enum
std::optional<spdlog::level::level_enum> StringToLogLevel(const std::string &level_str);

//------------------------------------------------------------------------------//
// Structs for Configuration Types
//------------------------------------------------------------------------------//

struct GlobalSettings {
    spdlog::level::level_enum log_level = Constants::DEFAULT_LOG_LEVEL;
    std::filesystem::path state_dir     = std::string(Constants::DEFAULT_STATE_DIR);
    std::size_t io_threads              = Constants::DEFAULT_IO_THREADS;

    bool IsValid() const;
};

struct CacheSettings {
    std::filesystem::path path;
    std::uint64_t max_size                = Constants::DEFAULT_CACHE_MAX_SIZE;  ///< 0 = unlimited
    Cache::EvictionPolicy eviction_policy = Cache::EvictionPolicy::Lru;

    bool IsValid() const { return !path.empty(); }
    Cache::CacheConfig ToCacheConfig() const { return {path, max_size, eviction_policy}; }
};

struct SyncSettings {
    std::uint64_t cache_stage_threshold = Constants::DEFAULT_CACHE_STAGE_LIMIT;
    std::size_t max_job_history         = Constants::DEFAULT_MAX_JOB_HISTORY;
};

struct NetworkSettings {
    std::chrono::milliseconds probe_timeout = Constants::DEFAULT_PROBE_TIMEOUT;
    std::uint32_t max_reconnect_attempts    = Constants::DEFAULT_MAX_RECONNECT_ATTEMPTS;
    std::chrono::milliseconds backoff_base  = Constants::DEFAULT_BACKOFF_BASE;

    bool IsValid() const { return probe_timeout.count() > 0 && max_reconnect_attempts > 0; }
};

/// One configured storage source.
struct SourceDefinition {
    std::string id;
    std::string name;
    Storage::StorageSourceType type = Storage::StorageSourceType::Local;
    std::filesystem::path path;  ///< Root, mount point or bucket directory

    // Network shares
    std::optional<Storage::NetworkProtocol> protocol;
    std::string host;
    std::optional<std::string> share_name;

    // Object storage
    std::string bucket;
    std::string prefix;
    std::string storage_class = "STANDARD";

    bool IsValid() const;
};

struct AppConfig {
    GlobalSettings global_settings;
    CacheSettings cache;
    SyncSettings sync;
    NetworkSettings network;
    std::vector<SourceDefinition> sources;

    bool IsValid() const;
    const SourceDefinition *FindSource(const std::string &id) const;
};

//------------------------------------------------------------------------------//
// Implementation of Enum / Logging Conversion Functions
//------------------------------------------------------------------------------//

inline std::optional<spdlog::level::level_enum> StringToLogLevel(const std::string &level_str)
{
    if (level_str == "trace") {
        return spdlog::level::trace;
    }
    if (level_str == "debug") {
        return spdlog::level::debug;
    }
    if (level_str == "info") {
        return spdlog::level::info;
    }
    if (level_str == "warn") {
        return spdlog::level::warn;
    }
    if (level_str == "error") {
        return spdlog::level::err;
    }
    if (level_str == "fatal" || level_str == "critical") {
        return spdlog::level::critical;
    }
    if (level_str == "off") {
        return spdlog::level::off;
    }
    return std::nullopt;
}

//------------------------------------------------------------------------------//
// Implementation of Configuration Structs Functions
//------------------------------------------------------------------------------//

inline bool GlobalSettings::IsValid() const { return !state_dir.empty() && io_threads > 0; }

inline bool SourceDefinition::IsValid() const
{
    if (id.empty() || path.empty()) {
        return false;
    }
    if (type == Storage::StorageSourceType::Custom) {
        spdlog::error("Source '{}': custom sources cannot be configured from a file.", id);
        return false;
    }
    if (type != Storage::StorageSourceType::NetworkShare &&
        (protocol.has_value() || !host.empty())) {
        spdlog::warn("Protocol or host specified for non-network source '{}'.", id);
    }
    if (type != Storage::StorageSourceType::ObjectStorage && !bucket.empty()) {
        spdlog::warn("Bucket specified for non-object source '{}'.", id);
    }
    return true;
}

inline bool AppConfig::IsValid() const
{
    if (!global_settings.IsValid() || !cache.IsValid() || !network.IsValid()) {
        return false;
    }
    for (size_t i = 0; i < sources.size(); ++i) {
        if (!sources[i].IsValid()) {
            return false;
        }
        for (size_t k = i + 1; k < sources.size(); ++k) {
            if (sources[i].id == sources[k].id) {
                spdlog::error("Duplicate source id '{}'.", sources[i].id);
                return false;
            }
        }
    }
    return true;
}

inline const SourceDefinition *AppConfig::FindSource(const std::string &id) const
{
    for (const auto &source : sources) {
        if (source.id == id) {
            return &source;
        }
    }
    return nullptr;
}

}  // namespace TierFS::Config

#endif  // TIERFS_SRC_CONFIG_CONFIG_TYPES_HPP_
