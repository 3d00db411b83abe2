#ifndef TIERFS_SRC_EVENTS_DOMAIN_EVENTS_HPP_
#define TIERFS_SRC_EVENTS_DOMAIN_EVENTS_HPP_

#include "storage/storage_types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

namespace TierFS::Events
{

using Storage::Clock;
using Storage::StorageTier;
using Storage::TimePoint;

enum class EvictionReason : std::uint8_t { CacheFull, Expired, Manual };

const char *EvictionReasonToString(EvictionReason reason);

//------------------------------------------------------------------------------//
// Hydration
//------------------------------------------------------------------------------//

struct HydrationStarted {
    std::string source_id;
    std::string path;
    StorageTier from_tier = StorageTier::Cold;
    TimePoint timestamp   = Clock::now();
};

struct HydrationCompleted {
    std::string source_id;
    std::string path;
    std::uint64_t bytes = 0;
    std::chrono::milliseconds duration{0};
    StorageTier from_tier = StorageTier::Cold;
    StorageTier to_tier   = StorageTier::Hot;
    TimePoint timestamp   = Clock::now();
};

struct HydrationFailed {
    std::string source_id;
    std::string path;
    std::string reason;
    TimePoint timestamp = Clock::now();
};

//------------------------------------------------------------------------------//
// Storage Sources
//------------------------------------------------------------------------------//

struct StorageMounted {
    std::string source_id;
    std::string name;
    Storage::StorageSourceType type = Storage::StorageSourceType::Local;
    TimePoint timestamp             = Clock::now();
};

struct StorageUnmounted {
    std::string source_id;
    TimePoint timestamp = Clock::now();
};

//------------------------------------------------------------------------------//
// Transcoding (published by an external media pipeline)
//------------------------------------------------------------------------------//

struct TranscodeStarted {
    std::string path;
    std::string target_format;
    TimePoint timestamp = Clock::now();
};

struct TranscodeProgress {
    std::string path;
    double percent      = 0.0;
    TimePoint timestamp = Clock::now();
};

struct TranscodeCompleted {
    std::string path;
    std::string output_path;
    std::chrono::milliseconds duration{0};
    TimePoint timestamp = Clock::now();
};

//------------------------------------------------------------------------------//
// Cache and Sync
//------------------------------------------------------------------------------//

struct CacheEviction {
    std::string path;
    std::uint64_t bytes   = 0;
    EvictionReason reason = EvictionReason::CacheFull;
    TimePoint timestamp   = Clock::now();
};

struct SyncProgressed {
    std::string job_id;
    std::string current_file;
    std::uint64_t files_completed = 0;
    std::uint64_t total_files     = 0;
    double percent                = 0.0;
    TimePoint timestamp           = Clock::now();
};

struct SyncCompleted {
    std::string job_id;
    std::uint64_t files_synced = 0;
    std::uint64_t files_failed = 0;
    bool cancelled             = false;
    TimePoint timestamp        = Clock::now();
};

using DomainEvent = std::variant<
    HydrationStarted, HydrationCompleted, HydrationFailed, StorageMounted, StorageUnmounted,
    TranscodeStarted, TranscodeProgress, TranscodeCompleted, CacheEviction, SyncProgressed,
    SyncCompleted>;

/// Dotted event name, e.g. "file.hydration.started".
const char *EventTypeName(const DomainEvent &event);
TimePoint EventTimestamp(const DomainEvent &event);

}  // namespace TierFS::Events

#endif  // TIERFS_SRC_EVENTS_DOMAIN_EVENTS_HPP_
