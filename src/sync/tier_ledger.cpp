#include "sync/tier_ledger.hpp"

#include "common/time_util.hpp"
#include "storage/virtual_path.hpp"

#include <spdlog/spdlog.h>

namespace TierFS::Sync
{

TierLedger::TierLedger(fs::path file_path) : store_(std::move(file_path)) {}

StorageResult<void> TierLedger::Load() { return store_.Load(); }

std::string TierLedger::KeyFor(const std::string &source_id, const std::string &path)
{
    return source_id + ":" + Storage::NormalizeVirtualPath(path);
}

StorageResult<void> TierLedger::Record(
    const std::string &source_id, const std::string &path, Storage::StorageTier tier,
    Storage::TimePoint modified
)
{
    spdlog::debug(
        "Recording tier {} for {}:{}", Storage::StorageTierToString(tier), source_id, path
    );
    return store_.Put(
        KeyFor(source_id, path),
        nlohmann::json{
            {"source_id", source_id},
            {"path", Storage::NormalizeVirtualPath(path)},
            {"tier", Storage::StorageTierToString(tier)},
            {"modified_ms", Common::ToUnixMillis(modified)},
        }
    );
}

std::optional<Storage::StorageTier> TierLedger::Lookup(
    const std::string &source_id, const std::string &path, Storage::TimePoint modified
) const
{
    auto record = store_.Get(KeyFor(source_id, path));
    if (!record) {
        return std::nullopt;
    }
    if (record->value("modified_ms", std::int64_t{-1}) != Common::ToUnixMillis(modified)) {
        spdlog::trace("Stale tier record for {}:{}", source_id, path);
        return std::nullopt;
    }
    return Storage::StringToStorageTier(record->value("tier", std::string{}));
}

StorageResult<void> TierLedger::Forget(const std::string &source_id, const std::string &path)
{
    return store_.Remove(KeyFor(source_id, path));
}

StorageResult<void> TierLedger::ForgetSource(const std::string &source_id)
{
    const auto prefix = source_id + ":";
    return store_.Update([&prefix](std::map<std::string, nlohmann::json> &records) {
        std::erase_if(records, [&prefix](const auto &entry) {
            return entry.first.starts_with(prefix);
        });
    });
}

}  // namespace TierFS::Sync
