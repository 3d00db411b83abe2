#include "registry/storage_registry.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>

using namespace TierFS;
using Registry::StorageRegistry;
using Storage::StorageErrc;
using Testing::FakeStorageAdapter;
using Testing::TempDir;
using Testing::ToBytes;
using Testing::ToString;

class StorageRegistryTest : public ::testing::Test
{
    protected:
    void SetUp() override
    {
        settings_.cache.cache_dir = dir_ / "cache";
        settings_.cache.max_size  = 1024 * 1024;
        settings_.state_dir       = dir_ / "state";
        settings_.io_threads      = 2;

        bus_->Subscribe([this](const Events::DomainEvent &event) {
            names_.push_back(Events::EventTypeName(event));
        });
        ASSERT_TRUE(metadata_->Load().has_value());
        registry_ = std::make_unique<StorageRegistry>(settings_, bus_, metadata_);
        ASSERT_TRUE(registry_->Initialize().has_value());
    }

    Config::SourceDefinition LocalDefinition(const std::string &id) const
    {
        Config::SourceDefinition definition;
        definition.id   = id;
        definition.type = Storage::StorageSourceType::Local;
        definition.path = dir_ / id;
        return definition;
    }

    Config::SourceDefinition CustomDefinition(const std::string &id) const
    {
        Config::SourceDefinition definition;
        definition.id   = id;
        definition.name = "In-memory " + id;
        definition.type = Storage::StorageSourceType::Custom;
        return definition;
    }

    bool Saw(const std::string &name) const
    {
        return std::find(names_.begin(), names_.end(), name) != names_.end();
    }

    TempDir dir_;
    Registry::RegistrySettings settings_;
    std::shared_ptr<Events::InProcessEventBus> bus_ = std::make_shared<Events::InProcessEventBus>();
    std::shared_ptr<Registry::JsonMetadataStore> metadata_ =
        std::make_shared<Registry::JsonMetadataStore>(dir_ / "metadata.json");
    std::vector<std::string> names_;
    std::unique_ptr<StorageRegistry> registry_;
};

TEST_F(StorageRegistryTest, MountsLocalSourceAndRoutesFileCalls)
{
    auto mounted = registry_->AddSource(LocalDefinition("disk"));
    ASSERT_TRUE(mounted.has_value());
    EXPECT_EQ(mounted->name, "disk");
    EXPECT_EQ(mounted->type, Storage::StorageSourceType::Local);
    EXPECT_EQ(mounted->category, Storage::StorageCategory::Local);
    EXPECT_TRUE(Saw("storage.mounted"));

    ASSERT_TRUE(registry_->Write("disk", "/hello.txt", ToBytes("hello")).has_value());
    std::ifstream on_disk(dir_ / "disk" / "hello.txt");
    std::string content;
    std::getline(on_disk, content);
    EXPECT_EQ(content, "hello");

    auto listing = registry_->ListFiles("disk", "/");
    ASSERT_TRUE(listing.has_value());
    ASSERT_EQ(listing->size(), 1u);
    EXPECT_EQ(listing->front().name, "hello.txt");

    auto data = registry_->Read("disk", "/hello.txt");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(ToString(*data), "hello");
    EXPECT_EQ(registry_->ListSources().size(), 1u);
}

TEST_F(StorageRegistryTest, DuplicateAndInvalidSourcesAreRejected)
{
    ASSERT_TRUE(registry_->AddSource(LocalDefinition("disk")).has_value());
    auto duplicate = registry_->AddSource(LocalDefinition("disk"));
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(duplicate.error(), make_error_code(StorageErrc::AlreadyExists));

    auto custom = CustomDefinition("mem");
    custom.path = dir_ / "mem";
    auto rejected = registry_->AddSource(custom);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error(), make_error_code(StorageErrc::InvalidArgument));

    const auto mounted = registry_->AddSources({LocalDefinition("other"), custom});
    EXPECT_EQ(mounted, 1u);
    EXPECT_EQ(registry_->Failures().Count("registry.mount"), 1u);
}

TEST_F(StorageRegistryTest, UnknownSourceIsNotFound)
{
    auto read = registry_->Read("nope", "/a");
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error(), make_error_code(StorageErrc::NotFound));
    EXPECT_FALSE(registry_->GetSource("nope").has_value());
}

TEST_F(StorageRegistryTest, RemoveSourceUnmounts)
{
    ASSERT_TRUE(registry_->AddSource(LocalDefinition("disk")).has_value());
    ASSERT_TRUE(registry_->RemoveSource("disk").has_value());
    EXPECT_FALSE(registry_->GetSource("disk").has_value());
    EXPECT_TRUE(Saw("storage.unmounted"));

    auto again = registry_->RemoveSource("disk");
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), make_error_code(StorageErrc::NotFound));
}

TEST_F(StorageRegistryTest, ListingCarriesUserMetadata)
{
    ASSERT_TRUE(registry_->AddSource(LocalDefinition("disk")).has_value());
    ASSERT_TRUE(registry_->Write("disk", "/plan.md", ToBytes("# plan")).has_value());
    ASSERT_TRUE(metadata_->AddTag("disk", "/plan.md", "work").has_value());
    ASSERT_TRUE(metadata_->ToggleFavorite("disk", "/plan.md").has_value());

    auto stat = registry_->Stat("disk", "/plan.md");
    ASSERT_TRUE(stat.has_value());
    EXPECT_EQ(stat->tags, std::vector<std::string>{"work"});
    EXPECT_TRUE(stat->is_favorite);
}

TEST_F(StorageRegistryTest, RenameDropsStaleCacheEntries)
{
    ASSERT_TRUE(registry_->AddSource(LocalDefinition("disk")).has_value());
    ASSERT_TRUE(registry_->Write("disk", "/old.txt", ToBytes("v1")).has_value());
    ASSERT_TRUE(registry_->Read("disk", "/old.txt").has_value());

    ASSERT_TRUE(registry_->Rename("disk", "/old.txt", "/new.txt").has_value());
    auto old_read = registry_->Read("disk", "/old.txt");
    ASSERT_FALSE(old_read.has_value());
    EXPECT_EQ(old_read.error(), make_error_code(StorageErrc::NotFound));

    auto new_read = registry_->Read("disk", "/new.txt");
    ASSERT_TRUE(new_read.has_value());
    EXPECT_EQ(ToString(*new_read), "v1");
}

TEST_F(StorageRegistryTest, CopyToSourceBetweenMounts)
{
    auto memory = std::make_shared<FakeStorageAdapter>();
    memory->PutFile("/reports/q1.csv", "a,b");
    ASSERT_TRUE(registry_->AddSource(CustomDefinition("mem"), memory).has_value());
    ASSERT_TRUE(registry_->AddSource(LocalDefinition("disk")).has_value());

    auto copied = registry_->CopyToSource("mem", {"/reports"}, "disk", "/");
    ASSERT_TRUE(copied.has_value());
    EXPECT_EQ(copied->files_transferred, 1u);
    auto data = registry_->Read("disk", "/reports/q1.csv");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(ToString(*data), "a,b");
    EXPECT_TRUE(memory->Has("/reports/q1.csv"));

    auto moved = registry_->MoveToSource("disk", {"/reports"}, "mem", "/", {});
    ASSERT_TRUE(moved.has_value());
    EXPECT_EQ(moved->files_failed, 1u);  // mem already holds q1.csv
    EXPECT_FALSE(moved->source_deleted);

    auto same = registry_->CopyToSource("disk", {"/reports"}, "disk", "/elsewhere");
    ASSERT_FALSE(same.has_value());
    EXPECT_EQ(same.error(), make_error_code(StorageErrc::InvalidArgument));
}

TEST_F(StorageRegistryTest, TransferTargetsExcludeRequestedSource)
{
    ASSERT_TRUE(registry_->AddSource(LocalDefinition("disk")).has_value());
    ASSERT_TRUE(
        registry_->AddSource(CustomDefinition("mem"), std::make_shared<FakeStorageAdapter>())
            .has_value()
    );

    auto all = registry_->GetTransferTargets();
    EXPECT_EQ(all.size(), 2u);

    auto others = registry_->GetTransferTargets(std::string("mem"));
    ASSERT_EQ(others.size(), 1u);
    EXPECT_EQ(others[0].source_id, "disk");
    EXPECT_EQ(others[0].tier, Storage::StorageTier::Hot);
    EXPECT_TRUE(others[0].available);
    EXPECT_FALSE(others[0].supported_directions.empty());
}

TEST_F(StorageRegistryTest, ClearCacheEmptiesIt)
{
    ASSERT_TRUE(registry_->AddSource(LocalDefinition("disk")).has_value());
    ASSERT_TRUE(registry_->Write("disk", "/a", ToBytes("abc")).has_value());
    EXPECT_GE(registry_->CacheStats().entry_count, 1u);

    ASSERT_TRUE(registry_->ClearCache().has_value());
    EXPECT_EQ(registry_->CacheStats().entry_count, 0u);
}

TEST_F(StorageRegistryTest, ResumeJobRejectsUnknownAndFinishedJobs)
{
    auto memory = std::make_shared<FakeStorageAdapter>();
    memory->PutFile("/x", "1");
    ASSERT_TRUE(registry_->AddSource(CustomDefinition("mem"), memory).has_value());
    ASSERT_TRUE(registry_->AddSource(LocalDefinition("disk")).has_value());

    auto unknown = registry_->ResumeJob("missing");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error(), make_error_code(StorageErrc::NotFound));

    Sync::SyncRequest request;
    request.source_id      = "mem";
    request.destination_id = "disk";
    request.paths          = {"/x"};
    auto result            = registry_->Sync(request);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->files_synced, 1u);

    auto finished = registry_->ResumeJob(result->job_id);
    ASSERT_FALSE(finished.has_value());
    EXPECT_EQ(finished.error(), make_error_code(StorageErrc::InvalidArgument));
}

TEST_F(StorageRegistryTest, InterruptedSyncResumesUnderOriginalId)
{
    registry_.reset();

    Sync::SyncRequest request;
    request.source_id      = "mem";
    request.destination_id = "disk";
    request.paths          = {"/inbox"};
    std::string job_id;
    {
        Sync::JobTracker jobs(settings_.state_dir / Constants::JOBS_FILE_NAME);
        ASSERT_TRUE(jobs.Load().has_value());
        auto created = jobs.Create("sync", nlohmann::json(request));
        ASSERT_TRUE(created.has_value());
        job_id = *created;
        ASSERT_TRUE(jobs.MarkProcessing(job_id).has_value());
    }

    registry_ = std::make_unique<StorageRegistry>(settings_, bus_, metadata_);
    ASSERT_TRUE(registry_->Initialize().has_value());
    auto memory = std::make_shared<FakeStorageAdapter>();
    memory->PutFile("/inbox/one.txt", "1");
    memory->PutFile("/inbox/two.txt", "22");
    ASSERT_TRUE(registry_->AddSource(CustomDefinition("mem"), memory).has_value());
    ASSERT_TRUE(registry_->AddSource(LocalDefinition("disk")).has_value());

    auto resumable = registry_->ListResumableJobs();
    ASSERT_EQ(resumable.size(), 1u);
    EXPECT_EQ(resumable[0].id, job_id);

    auto handle = registry_->ResumeJob(job_id);
    ASSERT_TRUE(handle.has_value());
    EXPECT_EQ(handle->job_id, job_id);
    while (handle->progress.Next()) {
    }
    auto result = handle->result.get();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->files_synced, 2u);

    const auto jobs = registry_->ListJobs();
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].status, Sync::JobStatus::Completed);
    auto data = registry_->Read("disk", "/inbox/two.txt");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(ToString(*data), "22");
    EXPECT_TRUE(registry_->ListResumableJobs().empty());
}
