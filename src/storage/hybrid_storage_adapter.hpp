#ifndef TIERFS_SRC_STORAGE_HYBRID_STORAGE_ADAPTER_HPP_
#define TIERFS_SRC_STORAGE_HYBRID_STORAGE_ADAPTER_HPP_

#include "storage/posix_storage_adapter.hpp"

namespace TierFS::Storage
{

/**
 * @brief Block view of a hybrid block/object filesystem (FSx ONTAP style).
 *
 * The backend tiers cold blocks to object storage on its own and does not
 * report it, so the tier is inferred from the last-access age.
 */
class HybridStorageAdapter : public PosixStorageAdapter
{
    public:
    explicit HybridStorageAdapter(fs::path mount_point, AccessAgeTier heuristic = {});
    ~HybridStorageAdapter() override = default;

    StorageSourceType GetKind() const override { return StorageSourceType::HybridStorage; }
    TierStrategy GetTierStrategy() const override { return heuristic_; }

    /// Rewrites the file and ages its access time so detection reports `tier`.
    StorageResult<void> ChangeTier(const std::string& path, StorageTier tier);

    private:
    AccessAgeTier heuristic_;
};

}  // namespace TierFS::Storage

#endif  // TIERFS_SRC_STORAGE_HYBRID_STORAGE_ADAPTER_HPP_
