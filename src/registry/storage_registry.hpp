#ifndef TIERFS_SRC_REGISTRY_STORAGE_REGISTRY_HPP_
#define TIERFS_SRC_REGISTRY_STORAGE_REGISTRY_HPP_

#include "app_constants.hpp"
#include "async_io_manager.hpp"
#include "cache/cache_engine.hpp"
#include "common/non_fatal.hpp"
#include "config/config_types.hpp"
#include "events/event_bus.hpp"
#include "hydration/hydration_orchestrator.hpp"
#include "registry/metadata_store.hpp"
#include "sync/job_tracker.hpp"
#include "sync/source_resolver.hpp"
#include "sync/sync_service.hpp"
#include "sync/tier_ledger.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace TierFS::Registry
{

namespace fs = std::filesystem;

/// A mounted, named storage source as seen by callers.
struct StorageSource {
    std::string id;
    std::string name;
    Storage::StorageSourceType type   = Storage::StorageSourceType::Local;
    Storage::StorageCategory category = Storage::StorageCategory::Local;
    fs::path path;
    std::string storage_class;  ///< object sources only
    Storage::ConnectionStatus status;
    Storage::TimePoint mounted_at{};
};

struct RegistrySettings {
    Cache::CacheConfig cache;
    fs::path state_dir                = std::string(Constants::DEFAULT_STATE_DIR);
    std::size_t io_threads            = Constants::DEFAULT_IO_THREADS;
    std::uint64_t cache_stage_limit   = Constants::DEFAULT_CACHE_STAGE_LIMIT;
    std::size_t max_job_history       = Constants::DEFAULT_MAX_JOB_HISTORY;
    Config::NetworkSettings network;

    static RegistrySettings FromConfig(const Config::AppConfig &config);
};

/**
 * @brief Owns every mounted source, the shared cache and the sync machinery.
 *
 * Built once at startup and passed by reference to front ends. All file
 * calls are routed through the source's Hydration Orchestrator, so the
 * cache stays coherent with writes made through the registry. Backend
 * errors are returned unchanged.
 */
class StorageRegistry : public Sync::ISourceResolver
{
    public:
    explicit StorageRegistry(
        RegistrySettings settings, std::shared_ptr<Events::IEventBus> events = nullptr,
        std::shared_ptr<IFileMetadataProvider> metadata = nullptr
    );
    ~StorageRegistry() override;

    StorageRegistry(const StorageRegistry &)            = delete;
    StorageRegistry &operator=(const StorageRegistry &) = delete;
    StorageRegistry(StorageRegistry &&)                 = delete;
    StorageRegistry &operator=(StorageRegistry &&)      = delete;

    /// Prepares the state directory, the cache and the persisted job/tier state.
    StorageResult<void> Initialize();
    /// Shuts every adapter down and persists the cache index. Idempotent.
    StorageResult<void> Shutdown();

    //------------------------------------------------------------------------------//
    // Sources
    //------------------------------------------------------------------------------//

    StorageResult<StorageSource> AddSource(const Config::SourceDefinition &definition);
    /// Mounts an already constructed adapter, e.g. a custom backend.
    StorageResult<StorageSource> AddSource(
        const Config::SourceDefinition &definition,
        std::shared_ptr<Storage::IStorageAdapter> adapter
    );
    /// Mounts every definition; failures are logged and skipped. Returns the mounted count.
    size_t AddSources(const std::vector<Config::SourceDefinition> &definitions);
    StorageResult<void> RemoveSource(const std::string &source_id);
    std::vector<StorageSource> ListSources() const;
    StorageResult<StorageSource> GetSource(const std::string &source_id) const;
    /// Probes the backend and returns its fresh connection status.
    StorageResult<Storage::ConnectionStatus> RefreshStatus(const std::string &source_id);

    //------------------------------------------------------------------------------//
    // Files
    //------------------------------------------------------------------------------//

    StorageResult<std::vector<Storage::VirtualFile>> ListFiles(
        const std::string &source_id, const std::string &path
    ) const;
    StorageResult<Storage::VirtualFile> Stat(
        const std::string &source_id, const std::string &path
    ) const;
    StorageResult<Storage::Bytes> Read(const std::string &source_id, const std::string &path);
    StorageResult<Storage::Bytes> ReadRange(
        const std::string &source_id, const std::string &path, std::uint64_t offset,
        std::uint64_t length
    );
    StorageResult<void> Write(
        const std::string &source_id, const std::string &path, std::span<const std::byte> data
    );
    StorageResult<void> Delete(const std::string &source_id, const std::string &path);
    StorageResult<void> Mkdir(const std::string &source_id, const std::string &path);
    /// Removes a file or an empty directory.
    StorageResult<void> Rm(const std::string &source_id, const std::string &path);
    StorageResult<void> RmRf(const std::string &source_id, const std::string &path);
    StorageResult<void> Rename(
        const std::string &source_id, const std::string &from, const std::string &to
    );
    StorageResult<void> Copy(
        const std::string &source_id, const std::string &from, const std::string &to,
        const Storage::CopyOptions &options = {}
    );
    StorageResult<void> Mv(
        const std::string &source_id, const std::string &from, const std::string &to,
        const Storage::MoveOptions &options = {}
    );
    StorageResult<void> Chmod(const std::string &source_id, const std::string &path, mode_t mode);
    StorageResult<void> Touch(const std::string &source_id, const std::string &path);
    StorageResult<bool> Exists(const std::string &source_id, const std::string &path);
    /// Returns the local cache path holding the file's bytes.
    StorageResult<fs::path> Hydrate(const std::string &source_id, const std::string &path);

    //------------------------------------------------------------------------------//
    // Cross-Storage
    //------------------------------------------------------------------------------//

    StorageResult<Sync::CrossStorageResult> CopyToSource(
        const std::string &from_id, const std::vector<std::string> &from_paths,
        const std::string &to_id, const std::string &to_dir,
        const Sync::CrossStorageOptions &options = Sync::CrossStorageOptions::Copy()
    );
    StorageResult<Sync::CrossStorageResult> MoveToSource(
        const std::string &from_id, const std::vector<std::string> &from_paths,
        const std::string &to_id, const std::string &to_dir,
        const Sync::CrossStorageOptions &options = Sync::CrossStorageOptions::Move()
    );
    /// Available sources, optionally without `exclude_id`.
    std::vector<Sync::SyncTarget> GetTransferTargets(
        const std::optional<std::string> &exclude_id = std::nullopt
    ) const;

    //------------------------------------------------------------------------------//
    // Cache
    //------------------------------------------------------------------------------//

    Cache::CacheStats CacheStats() const { return cache_->Stats(); }
    StorageResult<void> ClearCache();

    //------------------------------------------------------------------------------//
    // Sync
    //------------------------------------------------------------------------------//

    StorageResult<Sync::SyncResult> Sync(
        const Sync::SyncRequest &request, const Sync::ProgressSink &progress = {}
    );
    StorageResult<Sync::SyncJobHandle> StartSync(const Sync::SyncRequest &request);
    StorageResult<bool> CancelJob(const std::string &job_id);
    StorageResult<Sync::SyncResult> ChangeTier(const Sync::TieringRequest &request);
    StorageResult<Sync::SyncEstimate> EstimateSync(const Sync::SyncRequest &request);
    std::vector<Sync::JobRecord> ListJobs() const { return jobs_->List(); }
    std::vector<Sync::JobRecord> ListResumableJobs() const { return jobs_->ListResumable(); }
    /// Restarts an interrupted sync job under its original id.
    StorageResult<Sync::SyncJobHandle> ResumeJob(const std::string &job_id);

    //------------------------------------------------------------------------------//
    // ISourceResolver
    //------------------------------------------------------------------------------//

    std::shared_ptr<Hydration::HydrationOrchestrator> ResolveSource(
        const std::string &source_id
    ) const override;
    std::vector<Sync::SyncTarget> DescribeTargets() const override;

    const std::shared_ptr<Cache::CacheEngine> &GetCache() const { return cache_; }
    const Common::NonFatalLedger &Failures() const { return *ledger_; }

    private:
    struct Mount {
        StorageSource info;
        std::shared_ptr<Hydration::HydrationOrchestrator> orchestrator;
    };

    StorageResult<std::shared_ptr<Hydration::HydrationOrchestrator>> Find_(
        const std::string &source_id
    ) const;
    StorageResult<StorageSource> Mount_(
        const Config::SourceDefinition &definition,
        std::shared_ptr<Storage::IStorageAdapter> adapter
    );
    void Annotate_(
        const Hydration::HydrationOrchestrator &orchestrator, Storage::VirtualFile &file
    ) const;
    void InvalidateSubtree_(
        const Hydration::HydrationOrchestrator &orchestrator, const std::string &path
    );
    Sync::SyncTarget TargetFor_(const Mount &mount) const;
    StorageResult<Sync::CrossStorageResult> Transfer_(
        const std::string &from_id, const std::vector<std::string> &from_paths,
        const std::string &to_id, const std::string &to_dir,
        const Sync::CrossStorageOptions &options
    );

    template <typename T>
    StorageResult<T> Propagate_(
        const char *operation, const std::string &source_id, const std::string &path,
        StorageResult<T> result
    ) const;

    const RegistrySettings settings_;
    std::shared_ptr<Events::IEventBus> events_;
    std::shared_ptr<IFileMetadataProvider> metadata_;
    std::shared_ptr<Common::NonFatalLedger> ledger_;
    std::shared_ptr<Cache::CacheEngine> cache_;
    std::shared_ptr<Sync::JobTracker> jobs_;
    std::shared_ptr<Sync::TierLedger> tiers_;

    mutable std::shared_mutex sources_mutex_;
    std::map<std::string, Mount> sources_;

    std::unique_ptr<Sync::SyncService> sync_;
    /// Declared last so queued jobs drain before anything they use goes away.
    std::unique_ptr<AsyncIoManager> io_;
    bool shut_down_ = false;
};

}  // namespace TierFS::Registry

#endif  // TIERFS_SRC_REGISTRY_STORAGE_REGISTRY_HPP_
