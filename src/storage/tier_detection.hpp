#ifndef TIERFS_SRC_STORAGE_TIER_DETECTION_HPP_
#define TIERFS_SRC_STORAGE_TIER_DETECTION_HPP_

#include "app_constants.hpp"
#include "storage/storage_types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <variant>

namespace TierFS::Storage
{

//------------------------------------------------------------------------------//
// Tier Detection Strategies
//------------------------------------------------------------------------------//

/// Local or attached disk, always Hot.
struct FixedTier {
};

/// Mounted network share, always Warm.
struct NetworkShareTier {
    std::chrono::seconds retrieval_estimate{1};
};

/// Object storage; tier follows the object's storage-class label.
struct StorageClassTier {
};

/// Hybrid block/object storage; tier inferred from last-access age.
struct AccessAgeTier {
    std::chrono::hours cold_after    = Constants::COLD_AFTER;
    std::chrono::hours archive_after = Constants::ARCHIVE_AFTER;
};

using TierStrategy = std::variant<FixedTier, NetworkShareTier, StorageClassTier, AccessAgeTier>;

/// What a backend knows about one file when its tier is detected.
struct TierProbe {
    std::optional<std::string> storage_class;
    TimePoint last_accessed{};
    TimePoint now = Clock::now();
};

TierStatus DetectTier(const TierStrategy &strategy, const TierProbe &probe);

const char *TierStrategyName(const TierStrategy &strategy);

//------------------------------------------------------------------------------//
// Storage Class Labels
//------------------------------------------------------------------------------//

StorageTier TierForStorageClass(const std::string &storage_class);
std::string StorageClassForTier(StorageTier tier);

}  // namespace TierFS::Storage

#endif  // TIERFS_SRC_STORAGE_TIER_DETECTION_HPP_
