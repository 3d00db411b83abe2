#include "hydration/hydration_orchestrator.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <variant>
#include <vector>

using namespace TierFS;
using Hydration::HydrationOrchestrator;
using Storage::StorageErrc;
using Storage::StorageTier;
using Testing::FakeStorageAdapter;
using Testing::TempDir;
using Testing::ToBytes;
using Testing::ToString;
namespace fs = std::filesystem;

class HydrationOrchestratorTest : public ::testing::Test
{
    protected:
    void SetUp() override
    {
        Cache::CacheConfig config;
        config.cache_dir = dir_ / "cache";
        config.max_size  = 1024 * 1024;
        cache_           = std::make_shared<Cache::CacheEngine>(config);
        ASSERT_TRUE(cache_->Initialize().has_value());

        adapter_ = std::make_shared<FakeStorageAdapter>(Storage::StorageSourceType::ObjectStorage);
        adapter_->SetTier(StorageTier::Archive);
        adapter_->PutFile("/docs/report.pdf", "quarterly numbers");
        bus_ = std::make_shared<Events::InProcessEventBus>();
        bus_->Subscribe([this](const Events::DomainEvent &event) {
            names_.push_back(Events::EventTypeName(event));
        });
        orchestrator_ =
            std::make_unique<HydrationOrchestrator>("s3", adapter_, cache_, bus_, ledger_);
    }

    TempDir dir_;
    std::shared_ptr<Cache::CacheEngine> cache_;
    std::shared_ptr<FakeStorageAdapter> adapter_;
    std::shared_ptr<Events::InProcessEventBus> bus_;
    std::shared_ptr<Common::NonFatalLedger> ledger_ = std::make_shared<Common::NonFatalLedger>();
    std::vector<std::string> names_;
    std::unique_ptr<HydrationOrchestrator> orchestrator_;
};

TEST_F(HydrationOrchestratorTest, CacheKeysAreNamespacedBySource)
{
    EXPECT_EQ(orchestrator_->CacheKeyFor("/docs/report.pdf"), "/s3/docs/report.pdf");
    EXPECT_EQ(orchestrator_->CacheKeyFor("docs//report.pdf"), "/s3/docs/report.pdf");
    EXPECT_EQ(orchestrator_->CacheKeyFor("/"), "/s3");
}

TEST_F(HydrationOrchestratorTest, FirstReadHydratesSecondReadHitsCache)
{
    auto first = orchestrator_->Read("/docs/report.pdf");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(ToString(*first), "quarterly numbers");
    EXPECT_EQ(adapter_->ReadCount(), 1u);
    EXPECT_TRUE(orchestrator_->IsHydrated("/docs/report.pdf"));

    auto second = orchestrator_->Read("/docs/report.pdf");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, *first);
    EXPECT_EQ(adapter_->ReadCount(), 1u);

    ASSERT_GE(names_.size(), 2u);
    EXPECT_EQ(names_[0], "file.hydration.started");
    EXPECT_EQ(names_[1], "file.hydration.completed");
}

TEST_F(HydrationOrchestratorTest, HydrateIsIdempotent)
{
    auto first = orchestrator_->Hydrate("/docs/report.pdf");
    ASSERT_TRUE(first.has_value());
    auto second = orchestrator_->Hydrate("/docs/report.pdf");
    ASSERT_TRUE(second.has_value());

    EXPECT_EQ(*first, *second);
    EXPECT_TRUE(fs::exists(*first));
    EXPECT_EQ(adapter_->ReadCount(), 1u);
    EXPECT_EQ(cache_->Stats().entry_count, 1u);
}

TEST_F(HydrationOrchestratorTest, CachedFileReportsHotUntilDehydrated)
{
    auto before = orchestrator_->Metadata("/docs/report.pdf");
    ASSERT_TRUE(before.has_value());
    EXPECT_EQ(before->tier_status.current_tier, StorageTier::Archive);

    ASSERT_TRUE(orchestrator_->Hydrate("/docs/report.pdf").has_value());
    auto hot = orchestrator_->Metadata("/docs/report.pdf");
    ASSERT_TRUE(hot.has_value());
    EXPECT_EQ(hot->tier_status.current_tier, StorageTier::Hot);
    EXPECT_TRUE(hot->tier_status.is_cached);

    orchestrator_->Dehydrate("/docs/report.pdf");
    auto after = orchestrator_->Metadata("/docs/report.pdf");
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->tier_status.current_tier, StorageTier::Archive);
    EXPECT_FALSE(orchestrator_->IsHydrated("/docs/report.pdf"));
}

TEST_F(HydrationOrchestratorTest, ConcurrentMissesReadBackendOnce)
{
    std::vector<std::thread> readers;
    for (int i = 0; i < 8; ++i) {
        readers.emplace_back([this]() {
            auto data = orchestrator_->Read("/docs/report.pdf");
            EXPECT_TRUE(data.has_value());
        });
    }
    for (auto &reader : readers) {
        reader.join();
    }
    EXPECT_EQ(adapter_->ReadCount(), 1u);
}

TEST_F(HydrationOrchestratorTest, BackendFailurePublishesFailedAndPropagates)
{
    adapter_->FailReadsOf("/docs/report.pdf");
    auto res = orchestrator_->Read("/docs/report.pdf");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), make_error_code(StorageErrc::IOError));
    EXPECT_FALSE(orchestrator_->IsHydrated("/docs/report.pdf"));
    ASSERT_FALSE(names_.empty());
    EXPECT_EQ(names_.back(), "file.hydration.failed");
}

TEST_F(HydrationOrchestratorTest, ReadOfMissingFileIsNotFound)
{
    auto res = orchestrator_->Read("/missing.bin");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), make_error_code(StorageErrc::NotFound));
}

TEST_F(HydrationOrchestratorTest, PathEscapeIsRejected)
{
    auto res = orchestrator_->Read("/../outside");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), make_error_code(StorageErrc::InvalidPath));
}

TEST_F(HydrationOrchestratorTest, CacheTooSmallStillServesRead)
{
    Cache::CacheConfig tiny;
    tiny.cache_dir = dir_ / "tiny";
    tiny.max_size  = 4;
    auto cache     = std::make_shared<Cache::CacheEngine>(tiny);
    ASSERT_TRUE(cache->Initialize().has_value());
    HydrationOrchestrator orchestrator("s3", adapter_, cache, nullptr, ledger_);

    auto data = orchestrator.Read("/docs/report.pdf");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(ToString(*data), "quarterly numbers");
    EXPECT_FALSE(orchestrator.IsHydrated("/docs/report.pdf"));
    EXPECT_EQ(ledger_->Count("hydration.cache_populate"), 1u);
}

TEST_F(HydrationOrchestratorTest, WriteThroughRefreshesCache)
{
    ASSERT_TRUE(orchestrator_->Read("/docs/report.pdf").has_value());
    ASSERT_TRUE(orchestrator_->Write("/docs/report.pdf", ToBytes("revised")).has_value());

    EXPECT_EQ(adapter_->Content("/docs/report.pdf"), "revised");
    auto data = orchestrator_->Read("/docs/report.pdf");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(ToString(*data), "revised");
    EXPECT_EQ(adapter_->ReadCount(), 1u);
}

TEST_F(HydrationOrchestratorTest, FailedBackendWriteStillServesNewBytes)
{
    adapter_->PutFile("/f.txt", "old");
    ASSERT_TRUE(orchestrator_->Hydrate("/f.txt").has_value());
    adapter_->FailWritesOf("/f.txt");

    auto res = orchestrator_->Write("/f.txt", ToBytes("new"));
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), make_error_code(StorageErrc::IOError));
    EXPECT_EQ(adapter_->Content("/f.txt"), "old");

    auto data = orchestrator_->Read("/f.txt");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(ToString(*data), "new");
    EXPECT_EQ(adapter_->ReadCount(), 1u);
}

TEST_F(HydrationOrchestratorTest, SecondHydrateCountsAsCacheHit)
{
    ASSERT_TRUE(orchestrator_->Hydrate("/docs/report.pdf").has_value());
    ASSERT_TRUE(orchestrator_->Hydrate("/docs/report.pdf").has_value());

    const auto stats = cache_->Stats();
    EXPECT_EQ(stats.hit_count, 1u);
    EXPECT_EQ(stats.miss_count, 1u);
    EXPECT_EQ(adapter_->ReadCount(), 1u);
}

TEST_F(HydrationOrchestratorTest, DeleteDropsCachedCopy)
{
    ASSERT_TRUE(orchestrator_->Hydrate("/docs/report.pdf").has_value());
    ASSERT_TRUE(orchestrator_->Delete("/docs").has_value());
    EXPECT_FALSE(orchestrator_->IsHydrated("/docs/report.pdf"));
    EXPECT_FALSE(adapter_->Has("/docs/report.pdf"));
}

TEST_F(HydrationOrchestratorTest, ReadRangeDoesNotHydrate)
{
    auto slice = orchestrator_->ReadRange("/docs/report.pdf", 0, 9);
    ASSERT_TRUE(slice.has_value());
    EXPECT_EQ(ToString(*slice), "quarterly");
    EXPECT_FALSE(orchestrator_->IsHydrated("/docs/report.pdf"));
}
