#ifndef TIERFS_SRC_STORAGE_LOCAL_STORAGE_ADAPTER_HPP_
#define TIERFS_SRC_STORAGE_LOCAL_STORAGE_ADAPTER_HPP_

#include "storage/posix_storage_adapter.hpp"

namespace TierFS::Storage
{

/// Local or directly attached disk. Every entry is Hot.
class LocalStorageAdapter : public PosixStorageAdapter
{
    public:
    explicit LocalStorageAdapter(fs::path root) : PosixStorageAdapter(std::move(root), true) {}
    ~LocalStorageAdapter() override = default;

    StorageSourceType GetKind() const override { return StorageSourceType::Local; }
    TierStrategy GetTierStrategy() const override { return FixedTier{}; }
};

}  // namespace TierFS::Storage

#endif  // TIERFS_SRC_STORAGE_LOCAL_STORAGE_ADAPTER_HPP_
