#ifndef TIERFS_SRC_CACHE_CACHE_TYPES_HPP_
#define TIERFS_SRC_CACHE_CACHE_TYPES_HPP_

#include "app_constants.hpp"
#include "storage/storage_types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace TierFS::Cache
{

namespace fs = std::filesystem;

using Storage::TimePoint;

enum class EvictionPolicy : std::uint8_t { Lru, Lfu, Fifo };

const char *EvictionPolicyToString(EvictionPolicy policy);
std::optional<EvictionPolicy> StringToEvictionPolicy(const std::string &policy_str);

struct CacheConfig {
    fs::path cache_dir;
    std::uint64_t max_size         = Constants::DEFAULT_CACHE_MAX_SIZE;  ///< 0 = unlimited
    EvictionPolicy eviction_policy = EvictionPolicy::Lru;
};

struct CacheEntry {
    std::string path;  ///< cache key (namespaced virtual path)
    fs::path cache_path;
    std::uint64_t size = 0;
    TimePoint cached_at{};
    TimePoint last_accessed{};
    std::uint64_t access_count = 0;
    std::optional<TimePoint> source_modified;
};

struct CacheStats {
    std::uint64_t total_size     = 0;
    std::uint64_t max_size       = 0;
    std::uint64_t entry_count    = 0;
    std::uint64_t hit_count      = 0;
    std::uint64_t miss_count     = 0;
    std::uint64_t eviction_count = 0;

    double HitRate() const
    {
        const auto lookups = hit_count + miss_count;
        return lookups == 0 ? 0.0 : static_cast<double>(hit_count) / static_cast<double>(lookups);
    }

    double UsagePercent() const
    {
        return max_size == 0
                   ? 0.0
                   : static_cast<double>(total_size) * 100.0 / static_cast<double>(max_size);
    }
};

}  // namespace TierFS::Cache

#endif  // TIERFS_SRC_CACHE_CACHE_TYPES_HPP_
