#ifndef TIERFS_SRC_SYNC_TIER_LEDGER_HPP_
#define TIERFS_SRC_SYNC_TIER_LEDGER_HPP_

#include "persistence/json_record_store.hpp"
#include "storage/storage_types.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace TierFS::Sync
{

namespace fs = std::filesystem;

template <typename T>
using StorageResult = Storage::StorageResult<T>;

/**
 * @brief Last tier each file was explicitly moved to.
 *
 * A record is only trusted while the file's modification time still equals
 * the one recorded with it. Anything else is stale and the caller falls back
 * to the backend's own detection.
 */
class TierLedger
{
    public:
    explicit TierLedger(fs::path file_path);

    TierLedger(const TierLedger &)            = delete;
    TierLedger &operator=(const TierLedger &) = delete;

    StorageResult<void> Load();

    StorageResult<void> Record(
        const std::string &source_id, const std::string &path, Storage::StorageTier tier,
        Storage::TimePoint modified
    );
    std::optional<Storage::StorageTier> Lookup(
        const std::string &source_id, const std::string &path, Storage::TimePoint modified
    ) const;
    StorageResult<void> Forget(const std::string &source_id, const std::string &path);
    StorageResult<void> ForgetSource(const std::string &source_id);

    size_t Size() const { return store_.Size(); }

    private:
    static std::string KeyFor(const std::string &source_id, const std::string &path);

    Persistence::JsonRecordStore store_;
};

}  // namespace TierFS::Sync

#endif  // TIERFS_SRC_SYNC_TIER_LEDGER_HPP_
