#include "storage/filesystem_object_client.hpp"
#include "storage/object_storage_adapter.hpp"
#include "sync/progress_stream.hpp"
#include "sync/sync_service.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <future>
#include <memory>
#include <optional>
#include <vector>

using namespace TierFS;
using Hydration::HydrationOrchestrator;
using Storage::StorageErrc;
using Storage::StorageTier;
using Sync::SyncDirection;
using Sync::SyncMode;
using Sync::SyncOperation;
using Sync::SyncRequest;
using Testing::FakeStorageAdapter;
using Testing::TempDir;
using Testing::ToBytes;

namespace
{

class MapResolver : public Sync::ISourceResolver
{
    public:
    void Add(std::shared_ptr<HydrationOrchestrator> orchestrator)
    {
        sources_[orchestrator->GetSourceId()] = std::move(orchestrator);
    }

    std::shared_ptr<HydrationOrchestrator> ResolveSource(const std::string &source_id
    ) const override
    {
        auto it = sources_.find(source_id);
        return it == sources_.end() ? nullptr : it->second;
    }

    std::vector<Sync::SyncTarget> DescribeTargets() const override { return {}; }

    private:
    std::map<std::string, std::shared_ptr<HydrationOrchestrator>> sources_;
};

}  // namespace

class SyncServiceTest : public ::testing::Test
{
    protected:
    void SetUp() override
    {
        Cache::CacheConfig config;
        config.cache_dir = dir_ / "cache";
        config.max_size  = 1024 * 1024;
        cache_           = std::make_shared<Cache::CacheEngine>(config);
        ASSERT_TRUE(cache_->Initialize().has_value());

        jobs_ = std::make_shared<Sync::JobTracker>(dir_ / "jobs.json");
        ASSERT_TRUE(jobs_->Load().has_value());
        tiers_ = std::make_shared<Sync::TierLedger>(dir_ / "tiers.json");
        ASSERT_TRUE(tiers_->Load().has_value());

        bus_->Subscribe([this](const Events::DomainEvent &event) {
            names_.push_back(Events::EventTypeName(event));
        });

        s3_ = std::make_shared<FakeStorageAdapter>(Storage::StorageSourceType::ObjectStorage);
        s3_->SetTier(StorageTier::Archive);
        s3_->PutFile("/photos/a.jpg", "alpha", t0_);
        s3_->PutFile("/photos/b.jpg", "bravo!", t0_);
        nas_ = std::make_shared<FakeStorageAdapter>();

        resolver_.Add(std::make_shared<HydrationOrchestrator>("s3", s3_, cache_, bus_, ledger_));
        resolver_.Add(std::make_shared<HydrationOrchestrator>("nas", nas_, cache_, bus_, ledger_));
        service_ = std::make_unique<Sync::SyncService>(
            resolver_, jobs_, tiers_, io_, bus_, ledger_
        );
    }

    SyncRequest PhotosToNas() const
    {
        SyncRequest request;
        request.source_id      = "s3";
        request.destination_id = "nas";
        request.paths          = {"/photos"};
        request.direction      = SyncDirection::ObjectToBlock;
        return request;
    }

    TempDir dir_;
    const Storage::TimePoint t0_{std::chrono::seconds{1700000000}};
    std::shared_ptr<Cache::CacheEngine> cache_;
    std::shared_ptr<Sync::JobTracker> jobs_;
    std::shared_ptr<Sync::TierLedger> tiers_;
    std::shared_ptr<Events::InProcessEventBus> bus_ = std::make_shared<Events::InProcessEventBus>();
    std::shared_ptr<Common::NonFatalLedger> ledger_ = std::make_shared<Common::NonFatalLedger>();
    std::vector<std::string> names_;
    std::shared_ptr<FakeStorageAdapter> s3_;
    std::shared_ptr<FakeStorageAdapter> nas_;
    MapResolver resolver_;
    AsyncIoManager io_{2};
    std::unique_ptr<Sync::SyncService> service_;
};

TEST_F(SyncServiceTest, CopiesDirectoryTreeToDestination)
{
    auto result = service_->Sync(PhotosToNas());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->files_synced, 2u);
    EXPECT_EQ(result->files_failed, 0u);
    EXPECT_EQ(result->bytes_transferred, 11u);
    EXPECT_FALSE(result->cancelled);
    EXPECT_EQ(nas_->Content("/photos/a.jpg"), "alpha");
    EXPECT_EQ(nas_->Content("/photos/b.jpg"), "bravo!");

    auto copied = nas_->Stat("/photos/a.jpg");
    ASSERT_TRUE(copied.has_value());
    EXPECT_EQ(copied->last_modified, t0_);

    auto job = jobs_->Get(result->job_id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, Sync::JobStatus::Completed);
    EXPECT_NE(std::find(names_.begin(), names_.end(), "sync.completed"), names_.end());
}

TEST_F(SyncServiceTest, ColdFilesAreStagedThroughTheCache)
{
    std::vector<SyncOperation> operations;
    auto result = service_->Sync(PhotosToNas(), [&operations](const Sync::SyncProgress &update) {
        if (update.current_file == "/photos/a.jpg") {
            operations.push_back(update.operation);
        }
    });
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->used_cache);
    ASSERT_TRUE(result->cache_hit_rate.has_value());
    EXPECT_DOUBLE_EQ(*result->cache_hit_rate, 0.0);

    const std::vector<SyncOperation> expected{
        SyncOperation::Comparing, SyncOperation::Caching, SyncOperation::Copying,
        SyncOperation::UpdatingMetadata
    };
    EXPECT_EQ(operations, expected);
}

TEST_F(SyncServiceTest, HotFilesBypassTheCache)
{
    s3_->SetTier(StorageTier::Hot);
    auto result = service_->Sync(PhotosToNas());
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->used_cache);
    EXPECT_FALSE(result->cache_hit_rate.has_value());
}

TEST_F(SyncServiceTest, SkipExistingKeepsDestination)
{
    nas_->PutFile("/photos/a.jpg", "old");
    auto request = PhotosToNas();
    request.mode = SyncMode::SkipExisting;

    auto result = service_->Sync(request);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->files_skipped, 1u);
    EXPECT_EQ(result->files_synced, 1u);
    EXPECT_EQ(nas_->Content("/photos/a.jpg"), "old");
}

TEST_F(SyncServiceTest, NewerWinsComparesModificationTimes)
{
    nas_->PutFile("/photos/a.jpg", "newer", t0_ + std::chrono::hours{1});
    nas_->PutFile("/photos/b.jpg", "older", t0_ - std::chrono::hours{1});

    auto result = service_->Sync(PhotosToNas());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->files_skipped, 1u);
    EXPECT_EQ(result->files_synced, 1u);
    EXPECT_EQ(nas_->Content("/photos/a.jpg"), "newer");
    EXPECT_EQ(nas_->Content("/photos/b.jpg"), "bravo!");
}

TEST_F(SyncServiceTest, MergeKeepsBothCopies)
{
    nas_->PutFile("/photos/a.jpg", "different");
    auto request = PhotosToNas();
    request.mode = SyncMode::Merge;

    auto result = service_->Sync(request);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(nas_->Content("/photos/a.jpg"), "different");
    EXPECT_EQ(nas_->Content("/photos/a (1).jpg"), "alpha");
}

TEST_F(SyncServiceTest, CancellationStopsBeforeNextFile)
{
    auto result = service_->Sync(PhotosToNas(), [this](const Sync::SyncProgress &update) {
        if (update.current_file == "/photos/a.jpg") {
            ASSERT_TRUE(service_->Cancel(update.job_id).has_value());
        }
    });
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->cancelled);
    EXPECT_EQ(result->files_synced, 1u);
    EXPECT_TRUE(nas_->Has("/photos/a.jpg"));
    EXPECT_FALSE(nas_->Has("/photos/b.jpg"));
    EXPECT_EQ(jobs_->Get(result->job_id)->status, Sync::JobStatus::Cancelled);
}

TEST_F(SyncServiceTest, DeletesOrphansOnlyWhenNothingFailed)
{
    nas_->PutFile("/photos/stale.jpg", "gone soon");
    auto request           = PhotosToNas();
    request.delete_orphans = true;

    s3_->FailReadsOf("/photos/b.jpg");
    auto failed = service_->Sync(request);
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->files_failed, 1u);
    EXPECT_EQ(failed->files_deleted, 0u);
    EXPECT_TRUE(nas_->Has("/photos/stale.jpg"));
    EXPECT_FALSE(failed->errors.empty());

    request.paths = {"/photos/a.jpg"};
    auto single   = service_->Sync(request);
    ASSERT_TRUE(single.has_value());
    EXPECT_TRUE(nas_->Has("/photos/stale.jpg"));
}

TEST_F(SyncServiceTest, DeletesOrphansAfterCleanRun)
{
    nas_->PutFile("/photos/stale.jpg", "gone soon");
    auto request           = PhotosToNas();
    request.delete_orphans = true;

    auto result = service_->Sync(request);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->files_deleted, 1u);
    EXPECT_FALSE(nas_->Has("/photos/stale.jpg"));
    EXPECT_TRUE(nas_->Has("/photos/a.jpg"));
}

TEST_F(SyncServiceTest, InPlaceDirectionsHydrateAndRelease)
{
    SyncRequest request;
    request.source_id = "s3";
    request.paths     = {"/photos"};
    request.direction = SyncDirection::ToHot;

    auto warmed = service_->Sync(request);
    ASSERT_TRUE(warmed.has_value());
    EXPECT_EQ(warmed->files_synced, 2u);
    auto s3 = resolver_.ResolveSource("s3");
    EXPECT_TRUE(s3->IsHydrated("/photos/a.jpg"));
    EXPECT_TRUE(s3->IsHydrated("/photos/b.jpg"));

    auto again = service_->Sync(request);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->files_skipped, 2u);

    request.direction = SyncDirection::FromHot;
    auto released     = service_->Sync(request);
    ASSERT_TRUE(released.has_value());
    EXPECT_EQ(released->files_synced, 2u);
    EXPECT_FALSE(s3->IsHydrated("/photos/a.jpg"));
}

TEST_F(SyncServiceTest, RejectsInvalidRequests)
{
    SyncRequest request;
    request.source_id = "s3";
    request.paths     = {"/photos"};
    request.direction = SyncDirection::ObjectToBlock;
    auto no_dest      = service_->Sync(request);
    ASSERT_FALSE(no_dest.has_value());
    EXPECT_EQ(no_dest.error(), make_error_code(StorageErrc::InvalidArgument));

    request           = PhotosToNas();
    request.source_id = "missing";
    auto unknown      = service_->Sync(request);
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error(), make_error_code(StorageErrc::NotFound));

    request       = PhotosToNas();
    request.paths = {};
    auto empty    = service_->Sync(request);
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error(), make_error_code(StorageErrc::InvalidArgument));
}

TEST_F(SyncServiceTest, EstimateMatchesPlannedWork)
{
    auto estimate = service_->EstimateSync(PhotosToNas());
    ASSERT_TRUE(estimate.has_value());
    EXPECT_EQ(estimate->total_files, 2u);
    EXPECT_EQ(estimate->total_bytes, 11u);
    EXPECT_EQ(estimate->files_to_cache, 2u);
    EXPECT_GE(estimate->estimated_duration_secs, 1u);
    EXPECT_TRUE(jobs_->List().empty());
}

TEST_F(SyncServiceTest, StartSyncStreamsProgressUntilDone)
{
    auto handle = service_->StartSync(PhotosToNas());
    ASSERT_TRUE(handle.has_value());
    EXPECT_FALSE(handle->job_id.empty());

    size_t updates = 0;
    while (auto update = handle->progress.Next()) {
        EXPECT_EQ(update->job_id, handle->job_id);
        ++updates;
    }
    EXPECT_GE(updates, 6u);

    auto result = handle->result.get();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->job_id, handle->job_id);
    EXPECT_EQ(result->files_synced, 2u);
}

TEST_F(SyncServiceTest, UndrainedProgressDoesNotStallJob)
{
    for (int i = 0; i < 100; ++i) {
        s3_->PutFile("/bulk/f" + std::to_string(i) + ".bin", "payload", t0_);
    }
    auto request  = PhotosToNas();
    request.paths = {"/bulk"};

    auto handle = service_->StartSync(request);
    ASSERT_TRUE(handle.has_value());
    ASSERT_EQ(handle->result.wait_for(std::chrono::seconds{5}), std::future_status::ready);
    auto result = handle->result.get();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->files_synced, 100u);

    size_t updates = 0;
    std::optional<Sync::SyncProgress> last;
    while (auto update = handle->progress.Next()) {
        ++updates;
        last = std::move(update);
    }
    EXPECT_LE(updates, Constants::PROGRESS_QUEUE_CAPACITY);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->total_files, 100u);
    EXPECT_GE(last->files_completed, 99u);
}

TEST(ProgressChannelTest, FullQueueKeepsNewestRecords)
{
    Sync::ProgressChannel channel(2);
    for (std::uint64_t i = 1; i <= 5; ++i) {
        Sync::SyncProgress progress;
        progress.files_completed = i;
        EXPECT_TRUE(channel.Push(progress));
    }
    channel.Finish();
    EXPECT_EQ(channel.Overflowed(), 3u);

    auto first = channel.Pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->files_completed, 4u);
    auto second = channel.Pop();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->files_completed, 5u);
    EXPECT_FALSE(channel.Pop().has_value());

    channel.Close();
    EXPECT_FALSE(channel.Push(Sync::SyncProgress{}));
}

TEST_F(SyncServiceTest, ChangeTierToHotHydrates)
{
    Sync::TieringRequest request;
    request.source_id   = "s3";
    request.paths       = {"/photos/a.jpg"};
    request.target_tier = StorageTier::Hot;

    auto result = service_->ChangeTier(request);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->files_synced, 1u);
    EXPECT_TRUE(resolver_.ResolveSource("s3")->IsHydrated("/photos/a.jpg"));

    auto again = service_->ChangeTier(request);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->files_skipped, 1u);
}

TEST_F(SyncServiceTest, ChangeTierOnPlainBackendFailsPerFile)
{
    nas_->PutFile("/doc.txt", "text");
    Sync::TieringRequest request;
    request.source_id   = "nas";
    request.paths       = {"/doc.txt"};
    request.target_tier = StorageTier::Cold;

    auto result = service_->ChangeTier(request);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->files_failed, 1u);
    ASSERT_EQ(result->errors.size(), 1u);
}

TEST_F(SyncServiceTest, ChangeTierRewritesStorageClassAndRecordsIt)
{
    auto client  = std::make_shared<Storage::FilesystemObjectClient>(dir_ / "bucket");
    auto adapter = std::make_shared<Storage::ObjectStorageAdapter>(client, "media");
    ASSERT_TRUE(adapter->Initialize().has_value());
    const auto clip = ToBytes("frames");
    ASSERT_TRUE(adapter->Write("/clip.mov", clip).has_value());
    resolver_.Add(std::make_shared<HydrationOrchestrator>("media", adapter, cache_, bus_, ledger_));

    Sync::TieringRequest request;
    request.source_id   = "media";
    request.paths       = {"/clip.mov"};
    request.target_tier = StorageTier::Archive;

    auto result = service_->ChangeTier(request);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->files_synced, 1u);

    auto stat = adapter->Stat("/clip.mov");
    ASSERT_TRUE(stat.has_value());
    EXPECT_EQ(stat->tier_status.current_tier, StorageTier::Archive);
    EXPECT_EQ(service_->RecordedTier("media", *stat), StorageTier::Archive);

    auto again = service_->ChangeTier(request);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->files_skipped, 1u);
}
