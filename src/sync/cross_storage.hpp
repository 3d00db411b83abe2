#ifndef TIERFS_SRC_SYNC_CROSS_STORAGE_HPP_
#define TIERFS_SRC_SYNC_CROSS_STORAGE_HPP_

#include "hydration/hydration_orchestrator.hpp"
#include "sync/sync_types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace TierFS::Sync
{

template <typename T>
using StorageResult = Storage::StorageResult<T>;

/**
 * @brief Copies or moves entries between two mounted sources.
 *
 * Each entry of `from_paths` lands under `to_dir` with its own name.
 * Directories are walked depth-first and created before anything inside
 * them is written. With `delete_source` an entry's source is removed only
 * when every descendant was copied; a partial failure leaves both sides in
 * place. Per-file failures are collected in the result. The call itself
 * fails only for unusable arguments.
 */
class CrossStorageTransfer
{
    public:
    CrossStorageTransfer(
        Hydration::HydrationOrchestrator &from, Hydration::HydrationOrchestrator &to
    );

    CrossStorageTransfer(const CrossStorageTransfer &)            = delete;
    CrossStorageTransfer &operator=(const CrossStorageTransfer &) = delete;

    StorageResult<CrossStorageResult> Run(
        const std::vector<std::string> &from_paths, const std::string &to_dir,
        const CrossStorageOptions &options
    );

    private:
    /// Returns true when the entry and all its descendants were transferred.
    bool TransferEntry_(
        const Storage::VirtualFile &entry, const std::string &to_path,
        const CrossStorageOptions &options, CrossStorageResult &result
    );
    bool TransferFile_(
        const Storage::VirtualFile &entry, const std::string &to_path,
        const CrossStorageOptions &options, CrossStorageResult &result
    );
    void RecordError_(
        CrossStorageResult &result, const std::string &path, const std::error_code &ec
    );

    Hydration::HydrationOrchestrator &from_;
    Hydration::HydrationOrchestrator &to_;
};

}  // namespace TierFS::Sync

#endif  // TIERFS_SRC_SYNC_CROSS_STORAGE_HPP_
