#include "sync/sync_service.hpp"

#include "storage/hybrid_storage_adapter.hpp"
#include "storage/object_storage_adapter.hpp"
#include "storage/tier_detection.hpp"
#include "storage/virtual_path.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>

namespace TierFS::Sync
{

using Storage::StorageErrc;
using Storage::StorageTier;

namespace
{

std::unexpected<std::error_code> Errc(StorageErrc errc)
{
    return std::unexpected(make_error_code(errc));
}

std::string Describe(const std::string &path, const std::error_code &ec)
{
    return path + ": " + ec.message();
}

bool IsInPlace(SyncDirection direction)
{
    return direction == SyncDirection::ToHot || direction == SyncDirection::FromHot;
}

}  // namespace

SyncService::SyncService(
    const ISourceResolver &sources, std::shared_ptr<JobTracker> jobs,
    std::shared_ptr<TierLedger> tiers, AsyncIoManager &io,
    std::shared_ptr<Events::IEventBus> events, std::shared_ptr<Common::NonFatalLedger> ledger,
    std::uint64_t cache_stage_limit
)
    : sources_(sources),
      jobs_(std::move(jobs)),
      tiers_(std::move(tiers)),
      io_(io),
      events_(std::move(events)),
      ledger_(ledger ? std::move(ledger) : std::make_shared<Common::NonFatalLedger>()),
      cache_stage_limit_(cache_stage_limit)
{
}

//------------------------------------------------------------------------------//
// Public API
//------------------------------------------------------------------------------//

StorageResult<SyncResult> SyncService::Sync(
    const SyncRequest &request, const ProgressSink &progress, std::optional<std::string> job_id
)
{
    if (request.paths.empty()) {
        return Errc(StorageErrc::InvalidArgument);
    }
    auto sides = ResolveSides_(request);
    if (!sides) {
        return std::unexpected(sides.error());
    }

    if (!job_id) {
        auto created = jobs_->Create("sync", nlohmann::json(request));
        if (!created) {
            return std::unexpected(created.error());
        }
        job_id = std::move(*created);
    }
    Common::Attempt(*ledger_, "sync.job_state", jobs_->MarkProcessing(*job_id));

    spdlog::info(
        "Sync job {}: {} -> {} ({} paths, {}, {})", *job_id, request.source_id,
        request.destination_id.empty() ? "<in place>" : request.destination_id,
        request.paths.size(), SyncDirectionToString(request.direction),
        SyncModeToString(request.mode)
    );

    auto result = Run_(request, *sides, progress, *job_id);
    if (!result) {
        Common::Attempt(*ledger_, "sync.job_state", jobs_->Fail(*job_id, result.error().message()));
        return result;
    }

    Common::Attempt(*ledger_, "sync.job_state", jobs_->Complete(*job_id, nlohmann::json(*result)));
    Publish_(Events::SyncCompleted{
        .job_id       = *job_id,
        .files_synced = result->files_synced,
        .files_failed = result->files_failed,
        .cancelled    = result->cancelled,
    });
    spdlog::info(
        "Sync job {} finished: {} synced, {} skipped, {} failed, {} deleted{}", *job_id,
        result->files_synced, result->files_skipped, result->files_failed, result->files_deleted,
        result->cancelled ? " (cancelled)" : ""
    );
    return result;
}

StorageResult<SyncJobHandle> SyncService::StartSync(
    const SyncRequest &request, std::optional<std::string> job_id
)
{
    if (request.paths.empty()) {
        return Errc(StorageErrc::InvalidArgument);
    }
    if (auto sides = ResolveSides_(request); !sides) {
        return std::unexpected(sides.error());
    }
    if (!job_id) {
        auto created = jobs_->Create("sync", nlohmann::json(request));
        if (!created) {
            return std::unexpected(created.error());
        }
        job_id = std::move(*created);
    }

    auto channel = std::make_shared<ProgressChannel>();
    auto future  = io_.Submit([this, request, id = *job_id, channel]() {
        auto result = Sync(
            request,
            [channel](const SyncProgress &update) {
                if (!channel->Push(update)) {
                    spdlog::trace("Progress consumer detached from job {}", update.job_id);
                }
            },
            id
        );
        channel->Finish();
        return result;
    });

    spdlog::debug("Queued sync job {}", *job_id);
    return SyncJobHandle{*job_id, SyncProgressStream(channel), std::move(future)};
}

StorageResult<bool> SyncService::Cancel(const std::string &job_id) { return jobs_->Cancel(job_id); }

StorageResult<SyncResult> SyncService::ChangeTier(const TieringRequest &request)
{
    if (request.paths.empty()) {
        return Errc(StorageErrc::InvalidArgument);
    }
    auto source = sources_.ResolveSource(request.source_id);
    if (!source) {
        return Errc(StorageErrc::NotFound);
    }
    auto job_id = jobs_->Create("tier", nlohmann::json(request));
    if (!job_id) {
        return std::unexpected(job_id.error());
    }
    Common::Attempt(*ledger_, "sync.job_state", jobs_->MarkProcessing(*job_id));

    spdlog::info(
        "Tier job {}: {} paths of {} to {}", *job_id, request.paths.size(), request.source_id,
        Storage::StorageTierToString(request.target_tier)
    );

    const auto started = std::chrono::steady_clock::now();
    Plan plan;
    for (const auto &raw : request.paths) {
        const auto path = Storage::NormalizeVirtualPath(raw);
        auto entry      = source->GetAdapter()->Stat(path);
        if (!entry) {
            plan.errors.push_back(Describe(path, entry.error()));
            continue;
        }
        PlanEntry_(*source, nullptr, *entry, path, request.recursive, true, plan);
    }

    SyncResult result;
    result.job_id = *job_id;
    for (const auto &error : plan.errors) {
        result.errors.push_back(error);
        ++result.files_failed;
    }

    for (const auto &item : plan.items) {
        if (jobs_->IsCancelled(*job_id)) {
            result.cancelled = true;
            spdlog::info("Tier job {} cancelled", *job_id);
            break;
        }
        const auto &file   = item.source;
        const bool cached  = source->IsHydrated(file.path);
        const auto current = CurrentTier_(*source, file);

        if (request.target_tier == StorageTier::Hot) {
            if (cached || current == StorageTier::Hot) {
                ++result.files_skipped;
                continue;
            }
            if (auto res = source->Hydrate(file.path); !res) {
                result.errors.push_back(Describe(file.path, res.error()));
                ++result.files_failed;
                continue;
            }
            ++result.files_synced;
            result.bytes_transferred += file.size;
            continue;
        }

        if (current == request.target_tier && !cached) {
            ++result.files_skipped;
            continue;
        }
        if (current != request.target_tier) {
            if (auto res = ApplyTier_(*source, file, request.target_tier); !res) {
                result.errors.push_back(Describe(file.path, res.error()));
                ++result.files_failed;
                continue;
            }
            result.bytes_transferred += file.size;
        }
        // A cached copy would keep reporting the file as Hot.
        if (cached) {
            source->Dehydrate(file.path);
        }
        ++result.files_synced;
    }

    result.duration_ms = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started
        )
            .count()
    );
    Common::Attempt(*ledger_, "sync.job_state", jobs_->Complete(*job_id, nlohmann::json(result)));
    Publish_(Events::SyncCompleted{
        .job_id       = *job_id,
        .files_synced = result.files_synced,
        .files_failed = result.files_failed,
        .cancelled    = result.cancelled,
    });
    return result;
}

StorageResult<SyncEstimate> SyncService::EstimateSync(const SyncRequest &request)
{
    if (request.paths.empty()) {
        return Errc(StorageErrc::InvalidArgument);
    }
    auto sides = ResolveSides_(request);
    if (!sides) {
        return std::unexpected(sides.error());
    }

    const auto plan = BuildPlan_(request, *sides);
    SyncEstimate estimate;
    estimate.total_files       = plan.total_files;
    estimate.total_bytes       = plan.total_bytes;
    std::uint64_t stage_bytes  = 0;
    for (const auto &item : plan.items) {
        if (item.source.is_directory) {
            continue;
        }
        const bool needs_stage = item.to == nullptr
                                     ? request.direction == SyncDirection::ToHot &&
                                           !item.from->IsHydrated(item.source.path)
                                     : ShouldStage_(request, item) &&
                                           !item.from->IsHydrated(item.source.path);
        if (needs_stage) {
            ++estimate.files_to_cache;
            stage_bytes += item.source.size;
        }
    }
    const auto ceil_div = [](std::uint64_t a, std::uint64_t b) {
        return (a + b - 1) / b;
    };
    estimate.estimated_duration_secs =
        ceil_div(estimate.total_bytes, Constants::TRANSFER_BYTES_PER_SEC) +
        ceil_div(stage_bytes, Constants::CACHE_BYTES_PER_SEC);
    spdlog::debug(
        "Sync estimate: {} files, {} bytes, {} to stage, ~{}s", estimate.total_files,
        estimate.total_bytes, estimate.files_to_cache, estimate.estimated_duration_secs
    );
    return estimate;
}

std::vector<SyncTarget> SyncService::GetSyncTargets() const { return sources_.DescribeTargets(); }

std::optional<StorageTier> SyncService::RecordedTier(
    const std::string &source_id, const Storage::VirtualFile &file
) const
{
    return tiers_->Lookup(source_id, file.path, file.last_modified);
}

//------------------------------------------------------------------------------//
// Planning
//------------------------------------------------------------------------------//

StorageResult<SyncService::Sides> SyncService::ResolveSides_(const SyncRequest &request) const
{
    Sides sides;
    sides.from = sources_.ResolveSource(request.source_id);
    if (!sides.from) {
        spdlog::error("Sync source {} is not mounted", request.source_id);
        return Errc(StorageErrc::NotFound);
    }
    if (request.destination_id.empty()) {
        if (!IsInPlace(request.direction)) {
            return Errc(StorageErrc::InvalidArgument);
        }
        return sides;
    }
    sides.to = sources_.ResolveSource(request.destination_id);
    if (!sides.to) {
        spdlog::error("Sync destination {} is not mounted", request.destination_id);
        return Errc(StorageErrc::NotFound);
    }
    return sides;
}

SyncService::Plan SyncService::BuildPlan_(const SyncRequest &request, const Sides &sides) const
{
    Plan plan;
    const auto dest_root = Storage::NormalizeVirtualPath(request.destination_path);
    const bool two_way   = request.direction == SyncDirection::Bidirectional && sides.to;

    for (const auto &raw : request.paths) {
        const auto path = Storage::NormalizeVirtualPath(raw);
        auto entry      = sides.from->GetAdapter()->Stat(path);
        if (!entry) {
            plan.errors.push_back(Describe(path, entry.error()));
            continue;
        }
        if (!sides.to) {
            PlanEntry_(*sides.from, nullptr, *entry, path, request.recursive, true, plan);
            continue;
        }

        const auto dest_path = Storage::IsVirtualRoot(path)
                                   ? dest_root
                                   : Storage::JoinVirtualPath(dest_root, Storage::VirtualFileName(path));
        PlanEntry_(*sides.from, sides.to.get(), *entry, dest_path, request.recursive, true, plan);
        if (entry->is_directory && !two_way) {
            plan.dest_roots.emplace_back(sides.to.get(), dest_path);
        }

        if (two_way) {
            auto back = sides.to->GetAdapter()->Stat(dest_path);
            if (back) {
                PlanEntry_(
                    *sides.to, sides.from.get(), *back, path, request.recursive, true, plan
                );
            } else if (back.error() != make_error_code(StorageErrc::NotFound)) {
                plan.errors.push_back(Describe(dest_path, back.error()));
            }
        }
    }
    return plan;
}

void SyncService::PlanEntry_(
    Orchestrator &from, Orchestrator *to, const Storage::VirtualFile &entry,
    const std::string &dest_path, bool recursive, bool top_level, Plan &plan
) const
{
    if (!entry.is_directory) {
        plan.items.push_back(PlanItem{&from, to, entry, dest_path});
        ++plan.total_files;
        plan.total_bytes += entry.size;
        return;
    }
    if (!recursive && !top_level) {
        return;
    }
    if (to) {
        plan.items.push_back(PlanItem{&from, to, entry, dest_path});
    }
    auto children = from.GetAdapter()->List(entry.path);
    if (!children) {
        plan.errors.push_back(Describe(entry.path, children.error()));
        return;
    }
    for (const auto &child : *children) {
        PlanEntry_(
            from, to, child, Storage::JoinVirtualPath(dest_path, child.name), recursive, false,
            plan
        );
    }
}

bool SyncService::ShouldStage_(const SyncRequest &request, const PlanItem &item) const
{
    if (!request.use_cache || item.source.size > cache_stage_limit_) {
        return false;
    }
    return Storage::IsColdTier(CurrentTier_(*item.from, item.source)) ||
           item.from->IsHydrated(item.source.path);
}

//------------------------------------------------------------------------------//
// Execution
//------------------------------------------------------------------------------//

StorageResult<SyncResult> SyncService::Run_(
    const SyncRequest &request, const Sides &sides, const ProgressSink &progress,
    const std::string &job_id
)
{
    const auto started = std::chrono::steady_clock::now();
    const auto plan    = BuildPlan_(request, sides);

    RunState state;
    state.result.job_id = job_id;
    for (const auto &error : plan.errors) {
        spdlog::warn("Sync job {}: {}", job_id, error);
        state.result.errors.push_back(error);
        ++state.result.files_failed;
    }

    for (const auto &item : plan.items) {
        if (jobs_->IsCancelled(job_id)) {
            state.result.cancelled = true;
            spdlog::info(
                "Sync job {} cancelled after {} of {} files", job_id, state.files_completed,
                plan.total_files
            );
            break;
        }
        if (item.to) {
            TransferItem_(request, item, plan, state, progress);
        } else {
            InPlaceItem_(request, item, plan, state, progress);
        }
        if (!item.source.is_directory) {
            Common::Attempt(
                *ledger_, "sync.job_state", jobs_->UpdateProgress(job_id, state.bytes_completed)
            );
        }
    }

    if (request.delete_orphans && !state.result.cancelled) {
        if (state.result.files_failed == 0) {
            DeleteOrphans_(plan, state, progress);
        } else {
            spdlog::warn(
                "Sync job {}: {} failures, keeping orphaned destination files", job_id,
                state.result.files_failed
            );
        }
    }

    state.result.used_cache = state.staged > 0;
    if (state.result.used_cache) {
        state.result.cache_hit_rate =
            static_cast<double>(state.staged_hits) / static_cast<double>(state.staged) * 100.0;
    }
    state.result.duration_ms = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started
        )
            .count()
    );
    return std::move(state.result);
}

void SyncService::TransferItem_(
    const SyncRequest &request, const PlanItem &item, const Plan &plan, RunState &state,
    const ProgressSink &progress
)
{
    auto &result      = state.result;
    const auto &src   = item.source;
    auto dest_adapter = item.to->GetAdapter();

    if (src.is_directory) {
        if (auto res = EnsureDirectory_(*dest_adapter, item.dest_path); !res) {
            result.errors.push_back(Describe(item.dest_path, res.error()));
            ++result.files_failed;
            return;
        }
        state.kept_dest_paths.insert(item.dest_path);
        return;
    }

    const auto fail = [&](const std::string &path, const std::error_code &ec) {
        spdlog::warn("Sync job {}: {} failed: {}", result.job_id, path, ec.message());
        result.errors.push_back(Describe(path, ec));
        ++result.files_failed;
        ++state.files_completed;
    };

    Report_(progress, result.job_id, src.path, SyncOperation::Comparing, state, plan);

    std::string dest_path = item.dest_path;
    bool transfer         = true;
    auto existing         = dest_adapter->Stat(dest_path);
    if (existing) {
        if (existing->is_directory) {
            fail(dest_path, make_error_code(StorageErrc::IsADirectory));
            return;
        }
        switch (request.mode) {
            case SyncMode::NewerWins:
                transfer = src.last_modified > existing->last_modified;
                break;
            case SyncMode::LargerWins:
                transfer = src.size > existing->size;
                break;
            case SyncMode::ForceOverwrite:
                transfer = true;
                break;
            case SyncMode::SkipExisting:
                transfer = false;
                break;
            case SyncMode::Merge: {
                if (existing->size == src.size && existing->last_modified == src.last_modified) {
                    transfer = false;
                    break;
                }
                auto merged = MergeName_(*dest_adapter, dest_path);
                if (!merged) {
                    fail(dest_path, merged.error());
                    return;
                }
                dest_path = std::move(*merged);
                break;
            }
        }
    } else if (existing.error() != make_error_code(StorageErrc::NotFound)) {
        fail(dest_path, existing.error());
        return;
    }

    if (!transfer) {
        spdlog::debug("Sync job {}: keeping {}", result.job_id, dest_path);
        state.kept_dest_paths.insert(dest_path);
        ++result.files_skipped;
        ++state.files_completed;
        return;
    }

    StorageResult<Storage::Bytes> data = std::unexpected(std::error_code{});
    if (ShouldStage_(request, item)) {
        Report_(progress, result.job_id, src.path, SyncOperation::Caching, state, plan);
        ++state.staged;
        if (item.from->IsHydrated(src.path)) {
            ++state.staged_hits;
        }
        data = item.from->Read(src.path);
    } else {
        data = item.from->GetAdapter()->Read(src.path);
    }
    if (!data) {
        fail(src.path, data.error());
        return;
    }

    if (auto res = EnsureDirectory_(*dest_adapter, Storage::VirtualParent(dest_path)); !res) {
        fail(dest_path, res.error());
        return;
    }
    Report_(progress, result.job_id, src.path, SyncOperation::Copying, state, plan);
    if (auto res = dest_adapter->Write(dest_path, *data); !res) {
        fail(dest_path, res.error());
        return;
    }
    item.to->Dehydrate(dest_path);

    Report_(progress, result.job_id, src.path, SyncOperation::UpdatingMetadata, state, plan);
    if (dest_adapter->SupportsFileOperations()) {
        auto res = dest_adapter->SetTimes(dest_path, src.last_accessed, src.last_modified);
        if (!res && res.error() != make_error_code(StorageErrc::Unsupported)) {
            Common::Attempt(*ledger_, "sync.preserve_times", res);
        }
    }
    if (request.preserve_tier) {
        const auto tier = CurrentTier_(*item.from, src);
        auto written    = dest_adapter->Stat(dest_path);
        if (tier != StorageTier::Hot && written) {
            auto res = ApplyTier_(*item.to, *written, tier);
            if (!res && res.error() != make_error_code(StorageErrc::Unsupported)) {
                Common::Attempt(*ledger_, "sync.preserve_tier", res);
            }
        }
    }

    state.kept_dest_paths.insert(dest_path);
    ++result.files_synced;
    result.bytes_transferred += data->size();
    ++state.files_completed;
    state.bytes_completed += data->size();

    const double percent =
        plan.total_files == 0
            ? 100.0
            : static_cast<double>(state.files_completed) * 100.0 /
                  static_cast<double>(plan.total_files);
    Publish_(Events::SyncProgressed{
        .job_id          = result.job_id,
        .current_file    = src.path,
        .files_completed = state.files_completed,
        .total_files     = plan.total_files,
        .percent         = percent,
    });
}

void SyncService::InPlaceItem_(
    const SyncRequest &request, const PlanItem &item, const Plan &plan, RunState &state,
    const ProgressSink &progress
)
{
    auto &result     = state.result;
    const auto &path = item.source.path;
    Report_(progress, result.job_id, path, SyncOperation::Caching, state, plan);
    ++state.files_completed;

    if (request.direction == SyncDirection::FromHot) {
        if (!item.from->IsHydrated(path)) {
            ++result.files_skipped;
            return;
        }
        item.from->Dehydrate(path);
        ++result.files_synced;
        return;
    }

    ++state.staged;
    if (item.from->IsHydrated(path)) {
        ++state.staged_hits;
        ++result.files_skipped;
        return;
    }
    if (auto res = item.from->Hydrate(path); !res) {
        result.errors.push_back(Describe(path, res.error()));
        ++result.files_failed;
        return;
    }
    ++result.files_synced;
    result.bytes_transferred += item.source.size;
    state.bytes_completed += item.source.size;
}

void SyncService::DeleteOrphans_(const Plan &plan, RunState &state, const ProgressSink &progress)
{
    for (const auto &[to, root] : plan.dest_roots) {
        DeleteOrphansUnder_(*to, root, plan, state, progress);
    }
}

void SyncService::DeleteOrphansUnder_(
    Orchestrator &to, const std::string &dir, const Plan &plan, RunState &state,
    const ProgressSink &progress
)
{
    auto children = to.GetAdapter()->List(dir);
    if (!children) {
        state.result.errors.push_back(Describe(dir, children.error()));
        return;
    }
    for (const auto &child : *children) {
        if (state.kept_dest_paths.contains(child.path)) {
            if (child.is_directory) {
                DeleteOrphansUnder_(to, child.path, plan, state, progress);
            }
            continue;
        }
        Report_(progress, state.result.job_id, child.path, SyncOperation::Deleting, state, plan);
        if (auto res = to.Delete(child.path); !res) {
            state.result.errors.push_back(Describe(child.path, res.error()));
            continue;
        }
        spdlog::debug("Deleted orphan {}:{}", to.GetSourceId(), child.path);
        ++state.result.files_deleted;
    }
}

//------------------------------------------------------------------------------//
// Tiers
//------------------------------------------------------------------------------//

StorageResult<void> SyncService::ApplyTier_(
    Orchestrator &orchestrator, const Storage::VirtualFile &file, StorageTier tier
)
{
    const auto &adapter = orchestrator.GetAdapter();
    StorageResult<void> changed;
    switch (adapter->GetKind()) {
        case Storage::StorageSourceType::ObjectStorage: {
            auto object = std::dynamic_pointer_cast<Storage::ObjectStorageAdapter>(adapter);
            if (!object) {
                return Errc(StorageErrc::Unsupported);
            }
            changed = object->ChangeStorageClass(file.path, Storage::StorageClassForTier(tier));
            break;
        }
        case Storage::StorageSourceType::HybridStorage: {
            auto hybrid = std::dynamic_pointer_cast<Storage::HybridStorageAdapter>(adapter);
            if (!hybrid) {
                return Errc(StorageErrc::Unsupported);
            }
            changed = hybrid->ChangeTier(file.path, tier);
            break;
        }
        default:
            return Errc(StorageErrc::Unsupported);
    }
    if (!changed) {
        return changed;
    }

    auto after = adapter->Stat(file.path);
    if (!after) {
        return std::unexpected(after.error());
    }
    Common::Attempt(
        *ledger_, "sync.tier_ledger",
        tiers_->Record(orchestrator.GetSourceId(), file.path, tier, after->last_modified)
    );
    spdlog::debug(
        "Moved {}:{} to {}", orchestrator.GetSourceId(), file.path,
        Storage::StorageTierToString(tier)
    );
    return {};
}

StorageTier SyncService::CurrentTier_(
    const Orchestrator &orchestrator, const Storage::VirtualFile &file
) const
{
    if (auto recorded = tiers_->Lookup(orchestrator.GetSourceId(), file.path, file.last_modified)) {
        return *recorded;
    }
    return file.tier_status.current_tier;
}

//------------------------------------------------------------------------------//
// Helpers
//------------------------------------------------------------------------------//

StorageResult<void> SyncService::EnsureDirectory_(
    Storage::IStorageAdapter &adapter, const std::string &path
)
{
    if (Storage::IsVirtualRoot(path)) {
        return {};
    }
    auto exists = adapter.Exists(path);
    if (!exists) {
        return std::unexpected(exists.error());
    }
    if (*exists) {
        return {};
    }
    if (auto parent = EnsureDirectory_(adapter, Storage::VirtualParent(path)); !parent) {
        return parent;
    }
    auto res = adapter.CreateDirectory(path);
    if (!res && res.error() == make_error_code(StorageErrc::AlreadyExists)) {
        return {};
    }
    return res;
}

StorageResult<std::string> SyncService::MergeName_(
    Storage::IStorageAdapter &adapter, const std::string &path
)
{
    const std::filesystem::path name(Storage::VirtualFileName(path));
    const auto stem   = name.stem().string();
    const auto ext    = name.extension().string();
    const auto parent = Storage::VirtualParent(path);
    for (int n = 1;; ++n) {
        auto candidate = Storage::JoinVirtualPath(parent, stem + " (" + std::to_string(n) + ")" + ext);
        auto exists    = adapter.Exists(candidate);
        if (!exists) {
            return std::unexpected(exists.error());
        }
        if (!*exists) {
            return candidate;
        }
    }
}

void SyncService::Report_(
    const ProgressSink &progress, const std::string &job_id, const std::string &file,
    SyncOperation operation, const RunState &state, const Plan &plan
) const
{
    if (!progress) {
        return;
    }
    SyncProgress update;
    update.job_id          = job_id;
    update.current_file    = file;
    update.operation       = operation;
    update.files_completed = state.files_completed;
    update.total_files     = plan.total_files;
    update.bytes_completed = state.bytes_completed;
    update.total_bytes     = plan.total_bytes;
    update.percent         = plan.total_files == 0
                                 ? 100.0
                                 : static_cast<double>(state.files_completed) * 100.0 /
                               static_cast<double>(plan.total_files);
    progress(update);
}

void SyncService::Publish_(const Events::DomainEvent &event) const
{
    if (events_) {
        events_->Publish(event);
    }
}

}  // namespace TierFS::Sync
