#include "registry/storage_registry.hpp"

#include "storage/storage_factory.hpp"
#include "storage/tier_detection.hpp"
#include "storage/virtual_path.hpp"
#include "sync/cross_storage.hpp"

#include <spdlog/spdlog.h>

#include <mutex>

namespace TierFS::Registry
{

using Storage::StorageErrc;

namespace
{

std::unexpected<std::error_code> Errc(StorageErrc errc)
{
    return std::unexpected(make_error_code(errc));
}

std::vector<Sync::SyncDirection> DirectionsFor(Storage::StorageCategory category)
{
    using Sync::SyncDirection;
    switch (category) {
        case Storage::StorageCategory::Local:
            return {SyncDirection::BlockToObject, SyncDirection::Bidirectional};
        case Storage::StorageCategory::Network:
            return {
                SyncDirection::BlockToObject, SyncDirection::ToHot, SyncDirection::FromHot,
                SyncDirection::Bidirectional
            };
        case Storage::StorageCategory::Cloud:
            return {
                SyncDirection::ObjectToBlock, SyncDirection::ToHot, SyncDirection::FromHot,
                SyncDirection::Bidirectional
            };
        case Storage::StorageCategory::Hybrid:
            return {
                SyncDirection::ObjectToBlock, SyncDirection::BlockToObject, SyncDirection::ToHot,
                SyncDirection::FromHot, SyncDirection::Bidirectional
            };
    }
    return {};
}

}  // namespace

RegistrySettings RegistrySettings::FromConfig(const Config::AppConfig &config)
{
    RegistrySettings settings;
    settings.cache             = config.cache.ToCacheConfig();
    settings.state_dir         = config.global_settings.state_dir;
    settings.io_threads        = config.global_settings.io_threads;
    settings.cache_stage_limit = config.sync.cache_stage_threshold;
    settings.max_job_history   = config.sync.max_job_history;
    settings.network           = config.network;
    return settings;
}

//------------------------------------------------------------------------------//
// Lifecycle
//------------------------------------------------------------------------------//

StorageRegistry::StorageRegistry(
    RegistrySettings settings, std::shared_ptr<Events::IEventBus> events,
    std::shared_ptr<IFileMetadataProvider> metadata
)
    : settings_(std::move(settings)),
      events_(std::move(events)),
      metadata_(std::move(metadata)),
      ledger_(std::make_shared<Common::NonFatalLedger>())
{
    cache_ = std::make_shared<Cache::CacheEngine>(settings_.cache, events_, ledger_);
    jobs_  = std::make_shared<Sync::JobTracker>(
        settings_.state_dir / Constants::JOBS_FILE_NAME, settings_.max_job_history
    );
    tiers_ = std::make_shared<Sync::TierLedger>(settings_.state_dir / Constants::TIER_LEDGER_FILE);
    io_    = std::make_unique<AsyncIoManager>(settings_.io_threads);
    sync_  = std::make_unique<Sync::SyncService>(
        *this, jobs_, tiers_, *io_, events_, ledger_, settings_.cache_stage_limit
    );
}

StorageRegistry::~StorageRegistry()
{
    // Let queued and running jobs finish while the registry is still whole.
    io_.reset();
    if (!shut_down_) {
        Common::Attempt(*ledger_, "registry.shutdown", Shutdown());
    }
}

StorageResult<void> StorageRegistry::Initialize()
{
    spdlog::info("Initializing storage registry, state in {}", settings_.state_dir.string());
    std::error_code ec;
    fs::create_directories(settings_.state_dir, ec);
    if (ec) {
        spdlog::error(
            "Failed to create state directory {}: {}", settings_.state_dir.string(), ec.message()
        );
        return std::unexpected(Storage::MakeErrnoError(ec.value()));
    }
    if (auto res = cache_->Initialize(); !res) {
        spdlog::error("Failed to initialize cache: {}", res.error().message());
        return res;
    }
    if (auto res = jobs_->Load(); !res) {
        spdlog::error("Failed to load job state: {}", res.error().message());
        return res;
    }
    if (auto res = tiers_->Load(); !res) {
        spdlog::error("Failed to load tier ledger: {}", res.error().message());
        return res;
    }
    shut_down_ = false;
    return {};
}

StorageResult<void> StorageRegistry::Shutdown()
{
    if (shut_down_) {
        return {};
    }
    shut_down_ = true;
    spdlog::info("Shutting down storage registry");
    {
        std::unique_lock lock(sources_mutex_);
        for (auto &[id, mount] : sources_) {
            Common::Attempt(
                *ledger_, "registry.adapter_shutdown", mount.orchestrator->GetAdapter()->Shutdown()
            );
        }
        sources_.clear();
    }
    return cache_->Shutdown();
}

//------------------------------------------------------------------------------//
// Sources
//------------------------------------------------------------------------------//

StorageResult<StorageSource> StorageRegistry::AddSource(const Config::SourceDefinition &definition)
{
    if (!definition.IsValid()) {
        return Errc(StorageErrc::InvalidArgument);
    }
    auto adapter = Storage::StorageFactory::Create(definition, settings_.network);
    if (!adapter) {
        spdlog::error(
            "Cannot create adapter for source '{}': {}", definition.id, adapter.error().message()
        );
        return std::unexpected(adapter.error());
    }
    return AddSource(definition, std::move(*adapter));
}

StorageResult<StorageSource> StorageRegistry::AddSource(
    const Config::SourceDefinition &definition, std::shared_ptr<Storage::IStorageAdapter> adapter
)
{
    if (definition.id.empty() || !adapter) {
        return Errc(StorageErrc::InvalidArgument);
    }
    {
        std::shared_lock lock(sources_mutex_);
        if (sources_.contains(definition.id)) {
            spdlog::error("Source '{}' is already mounted", definition.id);
            return Errc(StorageErrc::AlreadyExists);
        }
    }
    if (auto res = adapter->Initialize(); !res) {
        spdlog::error(
            "Failed to initialize source '{}' at {}: {}", definition.id, definition.path.string(),
            res.error().message()
        );
        return std::unexpected(res.error());
    }
    return Mount_(definition, std::move(adapter));
}

StorageResult<StorageSource> StorageRegistry::Mount_(
    const Config::SourceDefinition &definition, std::shared_ptr<Storage::IStorageAdapter> adapter
)
{
    Mount mount;
    mount.info.id            = definition.id;
    mount.info.name          = definition.name.empty() ? definition.id : definition.name;
    mount.info.type          = adapter->GetKind();
    mount.info.category      = Storage::CategoryForType(mount.info.type);
    mount.info.path          = definition.path;
    mount.info.storage_class = definition.storage_class;
    mount.info.status        = adapter->GetConnectionStatus();
    mount.info.mounted_at    = Storage::Clock::now();
    mount.orchestrator       = std::make_shared<Hydration::HydrationOrchestrator>(
        definition.id, std::move(adapter), cache_, events_, ledger_
    );

    StorageSource info = mount.info;
    {
        std::unique_lock lock(sources_mutex_);
        if (!sources_.emplace(definition.id, std::move(mount)).second) {
            return Errc(StorageErrc::AlreadyExists);
        }
    }
    spdlog::info(
        "Mounted source '{}' ({}, {}) at {}", info.id, info.name,
        Storage::StorageSourceTypeToString(info.type), info.path.string()
    );
    if (events_) {
        events_->Publish(Events::StorageMounted{
            .source_id = info.id,
            .name      = info.name,
            .type      = info.type,
        });
    }
    return info;
}

size_t StorageRegistry::AddSources(const std::vector<Config::SourceDefinition> &definitions)
{
    size_t mounted = 0;
    for (const auto &definition : definitions) {
        auto res = AddSource(definition);
        if (!res) {
            ledger_->Record(
                "registry.mount", "source '" + definition.id + "': " + res.error().message(),
                res.error()
            );
            continue;
        }
        ++mounted;
    }
    return mounted;
}

StorageResult<void> StorageRegistry::RemoveSource(const std::string &source_id)
{
    std::shared_ptr<Hydration::HydrationOrchestrator> removed;
    {
        std::unique_lock lock(sources_mutex_);
        auto it = sources_.find(source_id);
        if (it == sources_.end()) {
            return Errc(StorageErrc::NotFound);
        }
        removed = std::move(it->second.orchestrator);
        sources_.erase(it);
    }
    Common::Attempt(*ledger_, "registry.adapter_shutdown", removed->GetAdapter()->Shutdown());
    spdlog::info("Unmounted source '{}'", source_id);
    if (events_) {
        events_->Publish(Events::StorageUnmounted{.source_id = source_id});
    }
    return {};
}

std::vector<StorageSource> StorageRegistry::ListSources() const
{
    std::shared_lock lock(sources_mutex_);
    std::vector<StorageSource> sources;
    sources.reserve(sources_.size());
    for (const auto &[id, mount] : sources_) {
        StorageSource info = mount.info;
        info.status        = mount.orchestrator->GetAdapter()->GetConnectionStatus();
        sources.push_back(std::move(info));
    }
    return sources;
}

StorageResult<StorageSource> StorageRegistry::GetSource(const std::string &source_id) const
{
    std::shared_lock lock(sources_mutex_);
    auto it = sources_.find(source_id);
    if (it == sources_.end()) {
        return Errc(StorageErrc::NotFound);
    }
    StorageSource info = it->second.info;
    info.status        = it->second.orchestrator->GetAdapter()->GetConnectionStatus();
    return info;
}

StorageResult<Storage::ConnectionStatus> StorageRegistry::RefreshStatus(
    const std::string &source_id
)
{
    auto orchestrator = Find_(source_id);
    if (!orchestrator) {
        return std::unexpected(orchestrator.error());
    }
    const auto &adapter = (*orchestrator)->GetAdapter();
    auto reachable      = adapter->TestConnection();
    if (!reachable) {
        spdlog::warn("Connection test for '{}' failed: {}", source_id, reachable.error().message());
    }
    auto status = adapter->GetConnectionStatus();
    {
        std::unique_lock lock(sources_mutex_);
        if (auto it = sources_.find(source_id); it != sources_.end()) {
            it->second.info.status = status;
        }
    }
    spdlog::debug("Source '{}' is {}", source_id, Storage::ConnectionStatusToString(status));
    return status;
}

//------------------------------------------------------------------------------//
// Files
//------------------------------------------------------------------------------//

StorageResult<std::vector<Storage::VirtualFile>> StorageRegistry::ListFiles(
    const std::string &source_id, const std::string &path
) const
{
    auto orchestrator = Find_(source_id);
    if (!orchestrator) {
        return std::unexpected(orchestrator.error());
    }
    auto entries = (*orchestrator)->ListDir(path);
    if (!entries) {
        return Propagate_("list", source_id, path, std::move(entries));
    }
    for (auto &entry : *entries) {
        Annotate_(**orchestrator, entry);
    }
    return entries;
}

StorageResult<Storage::VirtualFile> StorageRegistry::Stat(
    const std::string &source_id, const std::string &path
) const
{
    auto orchestrator = Find_(source_id);
    if (!orchestrator) {
        return std::unexpected(orchestrator.error());
    }
    auto meta = (*orchestrator)->Metadata(path);
    if (!meta) {
        return Propagate_("stat", source_id, path, std::move(meta));
    }
    Annotate_(**orchestrator, *meta);
    return meta;
}

StorageResult<Storage::Bytes> StorageRegistry::Read(
    const std::string &source_id, const std::string &path
)
{
    auto orchestrator = Find_(source_id);
    if (!orchestrator) {
        return std::unexpected(orchestrator.error());
    }
    return Propagate_("read", source_id, path, (*orchestrator)->Read(path));
}

StorageResult<Storage::Bytes> StorageRegistry::ReadRange(
    const std::string &source_id, const std::string &path, std::uint64_t offset,
    std::uint64_t length
)
{
    auto orchestrator = Find_(source_id);
    if (!orchestrator) {
        return std::unexpected(orchestrator.error());
    }
    return Propagate_(
        "read_range", source_id, path, (*orchestrator)->ReadRange(path, offset, length)
    );
}

StorageResult<void> StorageRegistry::Write(
    const std::string &source_id, const std::string &path, std::span<const std::byte> data
)
{
    auto orchestrator = Find_(source_id);
    if (!orchestrator) {
        return std::unexpected(orchestrator.error());
    }
    return Propagate_("write", source_id, path, (*orchestrator)->Write(path, data));
}

StorageResult<void> StorageRegistry::Delete(const std::string &source_id, const std::string &path)
{
    auto orchestrator = Find_(source_id);
    if (!orchestrator) {
        return std::unexpected(orchestrator.error());
    }
    return Propagate_("delete", source_id, path, (*orchestrator)->Delete(path));
}

StorageResult<void> StorageRegistry::Mkdir(const std::string &source_id, const std::string &path)
{
    auto orchestrator = Find_(source_id);
    if (!orchestrator) {
        return std::unexpected(orchestrator.error());
    }
    return Propagate_(
        "mkdir", source_id, path, (*orchestrator)->GetAdapter()->CreateDirectory(path)
    );
}

StorageResult<void> StorageRegistry::Rm(const std::string &source_id, const std::string &path)
{
    auto orchestrator = Find_(source_id);
    if (!orchestrator) {
        return std::unexpected(orchestrator.error());
    }
    const auto &adapter = (*orchestrator)->GetAdapter();
    auto meta           = adapter->Stat(path);
    if (!meta) {
        return Propagate_("rm", source_id, path, StorageResult<void>(std::unexpected(meta.error())));
    }
    if (meta->is_directory) {
        return Propagate_("rm", source_id, path, adapter->RemoveDirectory(path));
    }
    return Propagate_("rm", source_id, path, (*orchestrator)->Delete(path));
}

StorageResult<void> StorageRegistry::RmRf(const std::string &source_id, const std::string &path)
{
    auto orchestrator = Find_(source_id);
    if (!orchestrator) {
        return std::unexpected(orchestrator.error());
    }
    auto res = (*orchestrator)->GetAdapter()->RemoveRecursive(path);
    if (res) {
        InvalidateSubtree_(**orchestrator, path);
    }
    return Propagate_("rm_rf", source_id, path, std::move(res));
}

StorageResult<void> StorageRegistry::Rename(
    const std::string &source_id, const std::string &from, const std::string &to
)
{
    auto orchestrator = Find_(source_id);
    if (!orchestrator) {
        return std::unexpected(orchestrator.error());
    }
    auto res = (*orchestrator)->GetAdapter()->Rename(from, to);
    if (res) {
        InvalidateSubtree_(**orchestrator, from);
        InvalidateSubtree_(**orchestrator, to);
    }
    return Propagate_("rename", source_id, from, std::move(res));
}

StorageResult<void> StorageRegistry::Copy(
    const std::string &source_id, const std::string &from, const std::string &to,
    const Storage::CopyOptions &options
)
{
    auto orchestrator = Find_(source_id);
    if (!orchestrator) {
        return std::unexpected(orchestrator.error());
    }
    auto res = (*orchestrator)->GetAdapter()->Copy(from, to, options);
    if (res) {
        InvalidateSubtree_(**orchestrator, to);
    }
    return Propagate_("copy", source_id, from, std::move(res));
}

StorageResult<void> StorageRegistry::Mv(
    const std::string &source_id, const std::string &from, const std::string &to,
    const Storage::MoveOptions &options
)
{
    auto orchestrator = Find_(source_id);
    if (!orchestrator) {
        return std::unexpected(orchestrator.error());
    }
    auto res = (*orchestrator)->GetAdapter()->Move(from, to, options);
    if (res) {
        InvalidateSubtree_(**orchestrator, from);
        InvalidateSubtree_(**orchestrator, to);
    }
    return Propagate_("mv", source_id, from, std::move(res));
}

StorageResult<void> StorageRegistry::Chmod(
    const std::string &source_id, const std::string &path, mode_t mode
)
{
    auto orchestrator = Find_(source_id);
    if (!orchestrator) {
        return std::unexpected(orchestrator.error());
    }
    return Propagate_(
        "chmod", source_id, path, (*orchestrator)->GetAdapter()->SetPermissions(path, mode)
    );
}

StorageResult<void> StorageRegistry::Touch(const std::string &source_id, const std::string &path)
{
    auto orchestrator = Find_(source_id);
    if (!orchestrator) {
        return std::unexpected(orchestrator.error());
    }
    return Propagate_("touch", source_id, path, (*orchestrator)->GetAdapter()->Touch(path));
}

StorageResult<bool> StorageRegistry::Exists(const std::string &source_id, const std::string &path)
{
    auto orchestrator = Find_(source_id);
    if (!orchestrator) {
        return std::unexpected(orchestrator.error());
    }
    return Propagate_("exists", source_id, path, (*orchestrator)->GetAdapter()->Exists(path));
}

StorageResult<fs::path> StorageRegistry::Hydrate(
    const std::string &source_id, const std::string &path
)
{
    auto orchestrator = Find_(source_id);
    if (!orchestrator) {
        return std::unexpected(orchestrator.error());
    }
    return Propagate_("hydrate", source_id, path, (*orchestrator)->Hydrate(path));
}

//------------------------------------------------------------------------------//
// Cross-Storage
//------------------------------------------------------------------------------//

StorageResult<Sync::CrossStorageResult> StorageRegistry::CopyToSource(
    const std::string &from_id, const std::vector<std::string> &from_paths,
    const std::string &to_id, const std::string &to_dir, const Sync::CrossStorageOptions &options
)
{
    return Transfer_(from_id, from_paths, to_id, to_dir, options);
}

StorageResult<Sync::CrossStorageResult> StorageRegistry::MoveToSource(
    const std::string &from_id, const std::vector<std::string> &from_paths,
    const std::string &to_id, const std::string &to_dir, const Sync::CrossStorageOptions &options
)
{
    auto move_options          = options;
    move_options.delete_source = true;
    return Transfer_(from_id, from_paths, to_id, to_dir, move_options);
}

StorageResult<Sync::CrossStorageResult> StorageRegistry::Transfer_(
    const std::string &from_id, const std::vector<std::string> &from_paths,
    const std::string &to_id, const std::string &to_dir, const Sync::CrossStorageOptions &options
)
{
    if (from_id == to_id) {
        return Errc(StorageErrc::InvalidArgument);
    }
    auto from = Find_(from_id);
    if (!from) {
        return std::unexpected(from.error());
    }
    auto to = Find_(to_id);
    if (!to) {
        return std::unexpected(to.error());
    }
    Sync::CrossStorageTransfer transfer(**from, **to);
    return transfer.Run(from_paths, to_dir, options);
}

std::vector<Sync::SyncTarget> StorageRegistry::GetTransferTargets(
    const std::optional<std::string> &exclude_id
) const
{
    std::vector<Sync::SyncTarget> targets;
    for (auto &target : DescribeTargets()) {
        if (!target.available || (exclude_id && target.source_id == *exclude_id)) {
            continue;
        }
        targets.push_back(std::move(target));
    }
    return targets;
}

StorageResult<void> StorageRegistry::ClearCache()
{
    spdlog::info("Clearing cache at {}", settings_.cache.cache_dir.string());
    return cache_->Clear();
}

//------------------------------------------------------------------------------//
// Sync
//------------------------------------------------------------------------------//

StorageResult<Sync::SyncResult> StorageRegistry::Sync(
    const Sync::SyncRequest &request, const Sync::ProgressSink &progress
)
{
    return sync_->Sync(request, progress);
}

StorageResult<Sync::SyncJobHandle> StorageRegistry::StartSync(const Sync::SyncRequest &request)
{
    return sync_->StartSync(request);
}

StorageResult<bool> StorageRegistry::CancelJob(const std::string &job_id)
{
    return sync_->Cancel(job_id);
}

StorageResult<Sync::SyncResult> StorageRegistry::ChangeTier(const Sync::TieringRequest &request)
{
    return sync_->ChangeTier(request);
}

StorageResult<Sync::SyncEstimate> StorageRegistry::EstimateSync(const Sync::SyncRequest &request)
{
    return sync_->EstimateSync(request);
}

StorageResult<Sync::SyncJobHandle> StorageRegistry::ResumeJob(const std::string &job_id)
{
    auto job = jobs_->Get(job_id);
    if (!job) {
        return Errc(StorageErrc::NotFound);
    }
    if (job->IsFinished()) {
        spdlog::error("Job {} already finished, nothing to resume", job_id);
        return Errc(StorageErrc::InvalidArgument);
    }
    if (job->kind != "sync") {
        return Errc(StorageErrc::Unsupported);
    }
    Sync::SyncRequest request;
    try {
        request = job->request.get<Sync::SyncRequest>();
    } catch (const nlohmann::json::exception &e) {
        spdlog::error("Stored request of job {} is unreadable: {}", job_id, e.what());
        return Errc(StorageErrc::Internal);
    }
    spdlog::info("Resuming sync job {}", job_id);
    return sync_->StartSync(request, job_id);
}

//------------------------------------------------------------------------------//
// ISourceResolver
//------------------------------------------------------------------------------//

std::shared_ptr<Hydration::HydrationOrchestrator> StorageRegistry::ResolveSource(
    const std::string &source_id
) const
{
    std::shared_lock lock(sources_mutex_);
    auto it = sources_.find(source_id);
    return it == sources_.end() ? nullptr : it->second.orchestrator;
}

std::vector<Sync::SyncTarget> StorageRegistry::DescribeTargets() const
{
    std::shared_lock lock(sources_mutex_);
    std::vector<Sync::SyncTarget> targets;
    targets.reserve(sources_.size());
    for (const auto &[id, mount] : sources_) {
        targets.push_back(TargetFor_(mount));
    }
    return targets;
}

Sync::SyncTarget StorageRegistry::TargetFor_(const Mount &mount) const
{
    Sync::SyncTarget target;
    target.source_id            = mount.info.id;
    target.name                 = mount.info.name;
    target.type                 = mount.info.type;
    target.category             = mount.info.category;
    target.supported_directions = DirectionsFor(mount.info.category);
    target.available = mount.orchestrator->GetAdapter()->GetConnectionStatus().IsConnected();
    switch (mount.info.category) {
        case Storage::StorageCategory::Local:
            target.tier = Storage::StorageTier::Hot;
            break;
        case Storage::StorageCategory::Network:
            target.tier = Storage::StorageTier::Warm;
            break;
        case Storage::StorageCategory::Cloud:
            target.tier = Storage::TierForStorageClass(mount.info.storage_class);
            break;
        case Storage::StorageCategory::Hybrid:
            break;
    }
    return target;
}

//------------------------------------------------------------------------------//
// Helpers
//------------------------------------------------------------------------------//

StorageResult<std::shared_ptr<Hydration::HydrationOrchestrator>> StorageRegistry::Find_(
    const std::string &source_id
) const
{
    auto orchestrator = ResolveSource(source_id);
    if (!orchestrator) {
        spdlog::debug("Unknown source '{}'", source_id);
        return Errc(StorageErrc::NotFound);
    }
    return orchestrator;
}

void StorageRegistry::Annotate_(
    const Hydration::HydrationOrchestrator &orchestrator, Storage::VirtualFile &file
) const
{
    if (!file.is_directory && !file.tier_status.is_cached) {
        if (auto recorded = sync_->RecordedTier(orchestrator.GetSourceId(), file)) {
            file.tier_status.current_tier = *recorded;
            file.tier_status.can_warm     = *recorded != Storage::StorageTier::Hot;
        }
    }
    if (metadata_) {
        if (auto meta = metadata_->Get(orchestrator.GetSourceId(), file.path)) {
            ApplyMetadata(file, *meta);
        }
    }
}

void StorageRegistry::InvalidateSubtree_(
    const Hydration::HydrationOrchestrator &orchestrator, const std::string &path
)
{
    const auto dropped = cache_->InvalidatePrefix(orchestrator.CacheKeyFor(path));
    if (dropped > 0) {
        spdlog::debug(
            "Dropped {} cached entries under {}:{}", dropped, orchestrator.GetSourceId(), path
        );
    }
}

template <typename T>
StorageResult<T> StorageRegistry::Propagate_(
    const char *operation, const std::string &source_id, const std::string &path,
    StorageResult<T> result
) const
{
    if (!result) {
        if (result.error() == make_error_code(StorageErrc::NotFound)) {
            spdlog::debug("{} {}:{}: {}", operation, source_id, path, result.error().message());
        } else {
            spdlog::error("{} {}:{} failed: {}", operation, source_id, path, result.error().message());
        }
    }
    return result;
}

}  // namespace TierFS::Registry
