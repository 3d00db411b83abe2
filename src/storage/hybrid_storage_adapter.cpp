#include "storage/hybrid_storage_adapter.hpp"

#include <spdlog/spdlog.h>

namespace TierFS::Storage
{

HybridStorageAdapter::HybridStorageAdapter(fs::path mount_point, AccessAgeTier heuristic)
    : PosixStorageAdapter(std::move(mount_point), false), heuristic_(heuristic)
{
}

StorageResult<void> HybridStorageAdapter::ChangeTier(const std::string& path, StorageTier tier)
{
    auto data = Read(path);
    if (!data) {
        return std::unexpected(data.error());
    }
    if (auto res = Write(path, *data); !res) {
        return res;
    }

    const auto now = Clock::now();
    TimePoint accessed = now;
    switch (tier) {
        case StorageTier::Hot:
        case StorageTier::Warm:
            break;
        case StorageTier::Cold:
        case StorageTier::Nearline:
            // Midway between the thresholds, so it reads back as Cold and not Archive.
            accessed = now - heuristic_.cold_after -
                       std::chrono::minutes{heuristic_.archive_after - heuristic_.cold_after} / 2;
            break;
        case StorageTier::Archive:
            accessed = now - heuristic_.archive_after - std::chrono::hours{24};
            break;
    }
    spdlog::debug("Hybrid tier change {} -> {}", path, StorageTierToString(tier));
    return SetTimes(path, accessed, now);
}

}  // namespace TierFS::Storage
