#ifndef TIERFS_SRC_HYDRATION_HYDRATION_ORCHESTRATOR_HPP_
#define TIERFS_SRC_HYDRATION_HYDRATION_ORCHESTRATOR_HPP_

#include "cache/cache_engine.hpp"
#include "cache/file_lock_manager.hpp"
#include "common/non_fatal.hpp"
#include "events/event_bus.hpp"
#include "storage/i_storage_adapter.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace TierFS::Hydration
{

namespace fs = std::filesystem;

template <typename T>
using StorageResult = Storage::StorageResult<T>;

/**
 * @brief Cache-aside reads and write-through writes for one storage source.
 *
 * Cache keys are the source's namespace followed by the virtual path, so many
 * sources can share one CacheEngine. Concurrent misses on the same path are
 * serialized, so the backend is read once. Failing to populate the cache never
 * fails a read; the failure is recorded in the non-fatal ledger instead.
 */
class HydrationOrchestrator
{
    public:
    HydrationOrchestrator(
        std::string source_id, std::shared_ptr<Storage::IStorageAdapter> adapter,
        std::shared_ptr<Cache::CacheEngine> cache,
        std::shared_ptr<Events::IEventBus> events      = nullptr,
        std::shared_ptr<Common::NonFatalLedger> ledger = nullptr
    );
    ~HydrationOrchestrator() = default;

    HydrationOrchestrator(const HydrationOrchestrator&)            = delete;
    HydrationOrchestrator& operator=(const HydrationOrchestrator&) = delete;

    StorageResult<Storage::Bytes> Read(const std::string& path);
    /// Served from the cache when cached, otherwise straight from the backend without hydrating.
    StorageResult<Storage::Bytes> ReadRange(
        const std::string& path, std::uint64_t offset, std::uint64_t length
    );
    StorageResult<void> Write(const std::string& path, std::span<const std::byte> data);
    StorageResult<void> Delete(const std::string& path);

    StorageResult<Storage::VirtualFile> Metadata(const std::string& path);
    StorageResult<std::vector<Storage::VirtualFile>> ListDir(const std::string& path);

    /// Makes sure the file is cached and returns its local cache path.
    StorageResult<fs::path> Hydrate(const std::string& path);
    bool IsHydrated(const std::string& path) const;
    /// Drops the cached copy, if any.
    void Dehydrate(const std::string& path);

    /// Backend tier status with the cache folded in: a cached file is Hot.
    Storage::TierStatus TierStatusFor(const Storage::VirtualFile& file) const;

    std::string CacheKeyFor(const std::string& path) const;

    const std::string& GetSourceId() const { return source_id_; }
    const std::shared_ptr<Storage::IStorageAdapter>& GetAdapter() const { return adapter_; }
    const Common::NonFatalLedger& Failures() const { return *ledger_; }

    private:
    struct Fetched {
        Storage::Bytes data;
        Storage::VirtualFile meta;
        std::chrono::steady_clock::time_point started;
    };

    /// Stat and read from the backend, publishing started/failed events.
    StorageResult<Fetched> FetchRemote_(const std::string& path);
    void PublishCompleted_(const std::string& path, const Fetched& fetched);
    void PublishFailed_(const std::string& path, const std::string& reason);
    void Publish_(const Events::DomainEvent& event);

    const std::string source_id_;
    const std::string key_namespace_;
    std::shared_ptr<Storage::IStorageAdapter> adapter_;
    std::shared_ptr<Cache::CacheEngine> cache_;
    std::shared_ptr<Events::IEventBus> events_;
    std::shared_ptr<Common::NonFatalLedger> ledger_;
    Cache::FileLockManager locks_;
};

}  // namespace TierFS::Hydration

#endif  // TIERFS_SRC_HYDRATION_HYDRATION_ORCHESTRATOR_HPP_
