#ifndef TIERFS_SRC_SYNC_SYNC_SERVICE_HPP_
#define TIERFS_SRC_SYNC_SYNC_SERVICE_HPP_

#include "app_constants.hpp"
#include "async_io_manager.hpp"
#include "common/non_fatal.hpp"
#include "events/event_bus.hpp"
#include "sync/job_tracker.hpp"
#include "sync/progress_stream.hpp"
#include "sync/source_resolver.hpp"
#include "sync/sync_types.hpp"
#include "sync/tier_ledger.hpp"

#include <future>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace TierFS::Sync
{

template <typename T>
using StorageResult = Storage::StorageResult<T>;

struct SyncJobHandle {
    std::string job_id;
    SyncProgressStream progress;
    std::future<StorageResult<SyncResult>> result;
};

/**
 * @brief Multi-file sync, tier changes and sizing between mounted sources.
 *
 * Work is planned up front by walking the requested paths, so an estimate
 * sees exactly the file set a real run would. Runs iterate the plan one file
 * at a time and check for cancellation before each file; per-file failures
 * are collected in the result instead of aborting the batch.
 */
class SyncService
{
    public:
    SyncService(
        const ISourceResolver &sources, std::shared_ptr<JobTracker> jobs,
        std::shared_ptr<TierLedger> tiers, AsyncIoManager &io,
        std::shared_ptr<Events::IEventBus> events      = nullptr,
        std::shared_ptr<Common::NonFatalLedger> ledger = nullptr,
        std::uint64_t cache_stage_limit                = Constants::DEFAULT_CACHE_STAGE_LIMIT
    );
    ~SyncService() = default;

    SyncService(const SyncService &)            = delete;
    SyncService &operator=(const SyncService &) = delete;

    /// Runs the sync on the calling thread. A new job is created unless `job_id` names one.
    StorageResult<SyncResult> Sync(
        const SyncRequest &request, const ProgressSink &progress = {},
        std::optional<std::string> job_id = std::nullopt
    );
    /// Queues the sync on the I/O pool and returns immediately. `job_id` resumes a persisted job.
    StorageResult<SyncJobHandle> StartSync(
        const SyncRequest &request, std::optional<std::string> job_id = std::nullopt
    );
    StorageResult<bool> Cancel(const std::string &job_id);

    StorageResult<SyncResult> ChangeTier(const TieringRequest &request);
    StorageResult<SyncEstimate> EstimateSync(const SyncRequest &request);
    std::vector<SyncTarget> GetSyncTargets() const;

    /// Tier recorded by ChangeTier, if still valid for the file's current content.
    std::optional<Storage::StorageTier> RecordedTier(
        const std::string &source_id, const Storage::VirtualFile &file
    ) const;

    private:
    using Orchestrator = Hydration::HydrationOrchestrator;

    struct PlanItem {
        Orchestrator *from = nullptr;
        Orchestrator *to   = nullptr;  ///< nullptr for in-place passes
        Storage::VirtualFile source;
        std::string dest_path;
    };

    struct Plan {
        std::vector<PlanItem> items;  ///< depth-first, directories before contents
        std::vector<std::string> errors;
        std::uint64_t total_files = 0;
        std::uint64_t total_bytes = 0;
        /// Destination roots eligible for orphan cleanup.
        std::vector<std::pair<Orchestrator *, std::string>> dest_roots;
    };

    struct Sides {
        std::shared_ptr<Orchestrator> from;
        std::shared_ptr<Orchestrator> to;
    };

    struct RunState {
        SyncResult result;
        std::uint64_t files_completed = 0;
        std::uint64_t bytes_completed = 0;
        std::uint64_t staged          = 0;
        std::uint64_t staged_hits     = 0;
        std::set<std::string> kept_dest_paths;
    };

    StorageResult<Sides> ResolveSides_(const SyncRequest &request) const;
    Plan BuildPlan_(const SyncRequest &request, const Sides &sides) const;
    void PlanEntry_(
        Orchestrator &from, Orchestrator *to, const Storage::VirtualFile &entry,
        const std::string &dest_path, bool recursive, bool top_level, Plan &plan
    ) const;
    bool ShouldStage_(const SyncRequest &request, const PlanItem &item) const;

    StorageResult<SyncResult> Run_(
        const SyncRequest &request, const Sides &sides, const ProgressSink &progress,
        const std::string &job_id
    );
    void TransferItem_(
        const SyncRequest &request, const PlanItem &item, const Plan &plan, RunState &state,
        const ProgressSink &progress
    );
    void InPlaceItem_(
        const SyncRequest &request, const PlanItem &item, const Plan &plan, RunState &state,
        const ProgressSink &progress
    );
    void DeleteOrphans_(
        const Plan &plan, RunState &state, const ProgressSink &progress
    );
    void DeleteOrphansUnder_(
        Orchestrator &to, const std::string &dir, const Plan &plan, RunState &state,
        const ProgressSink &progress
    );

    /// Moves one file of `orchestrator` to `tier` at the backend and records it.
    StorageResult<void> ApplyTier_(
        Orchestrator &orchestrator, const Storage::VirtualFile &file, Storage::StorageTier tier
    );
    Storage::StorageTier CurrentTier_(
        const Orchestrator &orchestrator, const Storage::VirtualFile &file
    ) const;

    static StorageResult<void> EnsureDirectory_(
        Storage::IStorageAdapter &adapter, const std::string &path
    );
    static StorageResult<std::string> MergeName_(
        Storage::IStorageAdapter &adapter, const std::string &path
    );

    void Report_(
        const ProgressSink &progress, const std::string &job_id, const std::string &file,
        SyncOperation operation, const RunState &state, const Plan &plan
    ) const;
    void Publish_(const Events::DomainEvent &event) const;

    const ISourceResolver &sources_;
    std::shared_ptr<JobTracker> jobs_;
    std::shared_ptr<TierLedger> tiers_;
    AsyncIoManager &io_;
    std::shared_ptr<Events::IEventBus> events_;
    std::shared_ptr<Common::NonFatalLedger> ledger_;
    const std::uint64_t cache_stage_limit_;
};

}  // namespace TierFS::Sync

#endif  // TIERFS_SRC_SYNC_SYNC_SERVICE_HPP_
