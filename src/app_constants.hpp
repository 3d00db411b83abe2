#ifndef TIERFS_SRC_APP_CONSTANTS_HPP_
#define TIERFS_SRC_APP_CONSTANTS_HPP_

#include <spdlog/common.h>
#include <chrono>
#include <cstdint>
#include <string_view>

namespace TierFS::Constants
{
// Application Info
constexpr std::string_view APP_NAME           = "TierFS";
constexpr std::string_view APP_VERSION_STRING = "TierFS version 0.2.0";
constexpr std::string_view APP_VERSION_SHORT  = "0.2.0";

// Logging
constexpr spdlog::level::level_enum DEFAULT_LOG_LEVEL   = spdlog::level::info;
constexpr spdlog::level::level_enum DEFAULT_FLUSH_LEVEL = spdlog::level::warn;
constexpr std::string_view DEFAULT_CONSOLE_LOG_PATTERN =
    "[%Y-%m-%d %H:%M:%S.%e] [ThreadID:%t] [%^%l%$] [%n] %v";

// Cache
constexpr std::uint64_t DEFAULT_CACHE_MAX_SIZE   = 10ULL * 1024 * 1024 * 1024;
constexpr std::string_view CACHE_INDEX_FILE_NAME = "index.json";
constexpr std::string_view CACHE_RETIRED_SUFFIX  = ".retired";

// State
constexpr std::string_view DEFAULT_STATE_DIR   = "/var/lib/tierfs";
constexpr std::string_view JOBS_FILE_NAME      = "jobs.json";
constexpr std::string_view TIER_LEDGER_FILE    = "tiers.json";
constexpr std::string_view METADATA_FILE_NAME  = "metadata.json";
constexpr std::size_t DEFAULT_MAX_JOB_HISTORY  = 100;
constexpr std::size_t DEFAULT_IO_THREADS       = 4;

// Network shares
constexpr std::chrono::milliseconds DEFAULT_PROBE_TIMEOUT{5000};
constexpr std::chrono::milliseconds DEFAULT_BACKOFF_BASE{1000};
constexpr std::uint32_t DEFAULT_MAX_RECONNECT_ATTEMPTS = 3;

// Tier heuristics
constexpr std::chrono::hours COLD_AFTER{24 * 30};
constexpr std::chrono::hours ARCHIVE_AFTER{24 * 90};

// Sync estimation
constexpr std::uint64_t TRANSFER_BYTES_PER_SEC    = 100ULL * 1024 * 1024;
constexpr std::uint64_t CACHE_BYTES_PER_SEC       = 500ULL * 1024 * 1024;
constexpr std::uint64_t DEFAULT_CACHE_STAGE_LIMIT = 1024ULL * 1024 * 1024;
constexpr std::size_t PROGRESS_QUEUE_CAPACITY     = 256;

// Object storage
constexpr std::string_view OBJECT_MANIFEST_FILE = ".tierfs-objects.json";

}  // namespace TierFS::Constants

// FUSE
#define FUSE_USE_VERSION 31

#endif  // TIERFS_SRC_APP_CONSTANTS_HPP_
