#include "hydration/hydration_orchestrator.hpp"

#include "storage/virtual_path.hpp"

#include <spdlog/spdlog.h>

#include <mutex>

namespace TierFS::Hydration
{

using Storage::Bytes;
using Storage::StorageErrc;
using Storage::VirtualFile;

HydrationOrchestrator::HydrationOrchestrator(
    std::string source_id, std::shared_ptr<Storage::IStorageAdapter> adapter,
    std::shared_ptr<Cache::CacheEngine> cache, std::shared_ptr<Events::IEventBus> events,
    std::shared_ptr<Common::NonFatalLedger> ledger
)
    : source_id_(std::move(source_id)),
      key_namespace_(source_id_.empty() ? std::string{} : "/" + source_id_),
      adapter_(std::move(adapter)),
      cache_(std::move(cache)),
      events_(std::move(events)),
      ledger_(ledger ? std::move(ledger) : std::make_shared<Common::NonFatalLedger>())
{
}

std::string HydrationOrchestrator::CacheKeyFor(const std::string& path) const
{
    const auto normalized = Storage::NormalizeVirtualPath(path);
    if (key_namespace_.empty()) {
        return normalized;
    }
    return normalized == "/" ? key_namespace_ : key_namespace_ + normalized;
}

void HydrationOrchestrator::Publish_(const Events::DomainEvent& event)
{
    if (events_) {
        events_->Publish(event);
    }
}

void HydrationOrchestrator::PublishFailed_(const std::string& path, const std::string& reason)
{
    Publish_(Events::HydrationFailed{source_id_, path, reason, Storage::Clock::now()});
}

void HydrationOrchestrator::PublishCompleted_(const std::string& path, const Fetched& fetched)
{
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - fetched.started
    );
    spdlog::debug(
        "Hydrated {}:{} ({} bytes, {}ms)", source_id_, path, fetched.data.size(), elapsed.count()
    );
    Events::HydrationCompleted event;
    event.source_id = source_id_;
    event.path      = path;
    event.bytes     = fetched.data.size();
    event.duration  = elapsed;
    event.from_tier = fetched.meta.tier_status.current_tier;
    event.to_tier   = Storage::StorageTier::Hot;
    Publish_(event);
}

StorageResult<HydrationOrchestrator::Fetched> HydrationOrchestrator::FetchRemote_(
    const std::string& path
)
{
    auto meta = adapter_->Stat(path);
    if (!meta) {
        return std::unexpected(meta.error());
    }
    if (meta->is_directory) {
        return std::unexpected(make_error_code(StorageErrc::IsADirectory));
    }

    Fetched fetched;
    fetched.meta    = std::move(*meta);
    fetched.started = std::chrono::steady_clock::now();
    Publish_(Events::HydrationStarted{
        source_id_, path, fetched.meta.tier_status.current_tier, Storage::Clock::now()
    });

    auto data = adapter_->Read(path);
    if (!data) {
        spdlog::warn("Hydration of {}:{} failed: {}", source_id_, path, data.error().message());
        PublishFailed_(path, data.error().message());
        return std::unexpected(data.error());
    }
    fetched.data = std::move(*data);
    return fetched;
}

//------------------------------------------------------------------------------//
// Reads and Writes
//------------------------------------------------------------------------------//

StorageResult<Bytes> HydrationOrchestrator::Read(const std::string& path)
{
    auto resolved = Storage::ResolveVirtualPath(path);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    const auto key = CacheKeyFor(*resolved);

    auto cached = cache_->ReadFromCache(key);
    if (cached) {
        return cached;
    }
    if (cached.error() != StorageErrc::NotFound) {
        Common::Attempt(*ledger_, "hydration.cache_read", cached);
    }

    auto lock_ptr = locks_.GetFileLock(key);
    std::lock_guard lock(*lock_ptr);

    // Another reader may have hydrated the file while we waited.
    if (cache_->IsCached(key)) {
        if (auto again = cache_->ReadFromCache(key); again) {
            return again;
        }
    }

    auto fetched = FetchRemote_(*resolved);
    if (!fetched) {
        return std::unexpected(fetched.error());
    }
    auto cache_res = cache_->CacheFile(key, fetched->data, fetched->meta.last_modified);
    if (Common::Attempt(*ledger_, "hydration.cache_populate", cache_res)) {
        PublishCompleted_(*resolved, *fetched);
    } else {
        PublishFailed_(*resolved, "cache population failed: " + cache_res.error().message());
    }
    return std::move(fetched->data);
}

StorageResult<Bytes> HydrationOrchestrator::ReadRange(
    const std::string& path, std::uint64_t offset, std::uint64_t length
)
{
    auto resolved = Storage::ResolveVirtualPath(path);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    const auto key = CacheKeyFor(*resolved);
    if (cache_->IsCached(key)) {
        auto cached = cache_->ReadRangeFromCache(key, offset, length);
        if (cached) {
            return cached;
        }
        Common::Attempt(*ledger_, "hydration.cache_read", cached);
    } else {
        cache_->RecordMiss();
    }
    return adapter_->ReadRange(*resolved, offset, length);
}

StorageResult<void> HydrationOrchestrator::Write(
    const std::string& path, std::span<const std::byte> data
)
{
    auto resolved = Storage::ResolveVirtualPath(path);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    const auto key = CacheKeyFor(*resolved);
    auto lock_ptr  = locks_.GetFileLock(key);
    std::lock_guard lock(*lock_ptr);

    // The local copy is written first so reads see the new bytes even if the
    // backend write fails.
    auto cache_res = cache_->CacheFile(key, data, Storage::Clock::now());
    if (!Common::Attempt(*ledger_, "hydration.write_through", cache_res)) {
        // A stale copy must not outlive a failed refresh.
        cache_->Invalidate(key);
    }
    if (auto res = adapter_->Write(*resolved, data); !res) {
        spdlog::warn(
            "Backend write of {}:{} failed, cached copy kept: {}", source_id_, *resolved,
            res.error().message()
        );
        return res;
    }
    return {};
}

StorageResult<void> HydrationOrchestrator::Delete(const std::string& path)
{
    auto resolved = Storage::ResolveVirtualPath(path);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    if (auto res = adapter_->Delete(*resolved); !res) {
        return res;
    }
    const auto removed = cache_->InvalidatePrefix(CacheKeyFor(*resolved));
    if (removed > 0) {
        spdlog::debug("Dropped {} cached entries under {}:{}", removed, source_id_, *resolved);
    }
    return {};
}

//------------------------------------------------------------------------------//
// Metadata
//------------------------------------------------------------------------------//

Storage::TierStatus HydrationOrchestrator::TierStatusFor(const VirtualFile& file) const
{
    if (!file.is_directory && cache_->IsCached(CacheKeyFor(file.path))) {
        return Storage::TierStatus::Hot();
    }
    return file.tier_status;
}

StorageResult<VirtualFile> HydrationOrchestrator::Metadata(const std::string& path)
{
    auto file = adapter_->Stat(path);
    if (!file) {
        return std::unexpected(file.error());
    }
    file->tier_status = TierStatusFor(*file);
    return file;
}

StorageResult<std::vector<VirtualFile>> HydrationOrchestrator::ListDir(const std::string& path)
{
    auto entries = adapter_->List(path);
    if (!entries) {
        return std::unexpected(entries.error());
    }
    for (auto& entry : *entries) {
        entry.tier_status = TierStatusFor(entry);
    }
    return entries;
}

//------------------------------------------------------------------------------//
// Hydration
//------------------------------------------------------------------------------//

StorageResult<fs::path> HydrationOrchestrator::Hydrate(const std::string& path)
{
    auto resolved = Storage::ResolveVirtualPath(path);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    const auto key = CacheKeyFor(*resolved);

    auto lock_ptr = locks_.GetFileLock(key);
    std::lock_guard lock(*lock_ptr);

    if (auto entry = cache_->GetEntry(key)) {
        cache_->Touch(key);
        cache_->RecordHit();
        return entry->cache_path;
    }
    cache_->RecordMiss();

    auto fetched = FetchRemote_(*resolved);
    if (!fetched) {
        return std::unexpected(fetched.error());
    }
    auto entry = cache_->CacheFile(key, fetched->data, fetched->meta.last_modified);
    if (!entry) {
        spdlog::warn(
            "Cannot hydrate {}:{}: {}", source_id_, *resolved, entry.error().message()
        );
        PublishFailed_(*resolved, entry.error().message());
        return std::unexpected(entry.error());
    }
    PublishCompleted_(*resolved, *fetched);
    return entry->cache_path;
}

bool HydrationOrchestrator::IsHydrated(const std::string& path) const
{
    return cache_->IsCached(CacheKeyFor(path));
}

void HydrationOrchestrator::Dehydrate(const std::string& path)
{
    cache_->Invalidate(CacheKeyFor(path));
}

}  // namespace TierFS::Hydration
