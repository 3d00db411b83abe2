#include "cache/cache_engine.hpp"
#include "events/event_bus.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace TierFS;
using namespace TierFS::Cache;
using TierFS::Testing::TempDir;
using TierFS::Testing::ToBytes;
using TierFS::Testing::ToString;

class CacheEngineTest : public ::testing::Test
{
    protected:
    std::unique_ptr<CacheEngine> MakeEngine(
        std::uint64_t max_size, EvictionPolicy policy = EvictionPolicy::Lru,
        std::shared_ptr<Events::IEventBus> events = nullptr
    )
    {
        CacheConfig config;
        config.cache_dir       = dir_ / "cache";
        config.max_size        = max_size;
        config.eviction_policy = policy;
        auto engine            = std::make_unique<CacheEngine>(config, std::move(events));
        EXPECT_TRUE(engine->Initialize().has_value());
        return engine;
    }

    static void Put(CacheEngine &engine, const std::string &path, size_t size)
    {
        auto res = engine.CacheFile(path, ToBytes(std::string(size, 'x')));
        ASSERT_TRUE(res.has_value()) << path << ": " << res.error().message();
    }

    TempDir dir_;
};

TEST_F(CacheEngineTest, CachedBytesReadBackAndCountHits)
{
    auto engine = MakeEngine(1024);
    ASSERT_TRUE(engine->CacheFile("/src/a.txt", ToBytes("hello")).has_value());

    auto first = engine->ReadFromCache("/src/a.txt");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(ToString(*first), "hello");
    ASSERT_TRUE(engine->ReadFromCache("/src/a.txt").has_value());

    const auto stats = engine->Stats();
    EXPECT_EQ(stats.hit_count, 2u);
    EXPECT_EQ(stats.miss_count, 0u);
    EXPECT_EQ(stats.entry_count, 1u);
    EXPECT_EQ(stats.total_size, 5u);
}

TEST_F(CacheEngineTest, MissIsNotFoundAndCounted)
{
    auto engine = MakeEngine(1024);
    auto res    = engine->ReadFromCache("/nothing");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), make_error_code(Storage::StorageErrc::NotFound));
    EXPECT_EQ(engine->Stats().miss_count, 1u);
}

TEST_F(CacheEngineTest, ReadRangeServesSlice)
{
    auto engine = MakeEngine(1024);
    ASSERT_TRUE(engine->CacheFile("/f.bin", ToBytes("0123456789")).has_value());
    auto slice = engine->ReadRangeFromCache("/f.bin", 3, 4);
    ASSERT_TRUE(slice.has_value());
    EXPECT_EQ(ToString(*slice), "3456");
}

TEST_F(CacheEngineTest, InsertBeyondCapacityEvictsLeastRecentlyUsed)
{
    auto bus = std::make_shared<Events::InProcessEventBus>();
    std::vector<std::string> evicted;
    bus->Subscribe([&evicted](const Events::DomainEvent &event) {
        if (const auto *eviction = std::get_if<Events::CacheEviction>(&event)) {
            evicted.push_back(eviction->path);
        }
    });
    auto engine = MakeEngine(100, EvictionPolicy::Lru, bus);

    Put(*engine, "/a", 60);
    Put(*engine, "/b", 60);

    EXPECT_FALSE(engine->IsCached("/a"));
    EXPECT_TRUE(engine->IsCached("/b"));
    const auto stats = engine->Stats();
    EXPECT_EQ(stats.eviction_count, 1u);
    EXPECT_EQ(stats.total_size, 60u);
    EXPECT_LE(stats.total_size, stats.max_size);
    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted.front(), "/a");
    EXPECT_FALSE(fs::exists(engine->CachePathFor("/a")));
}

TEST_F(CacheEngineTest, LruKeepsRecentlyReadEntry)
{
    auto engine = MakeEngine(100, EvictionPolicy::Lru);
    Put(*engine, "/a", 40);
    Put(*engine, "/b", 40);
    ASSERT_TRUE(engine->ReadFromCache("/a").has_value());

    Put(*engine, "/c", 40);
    EXPECT_TRUE(engine->IsCached("/a"));
    EXPECT_FALSE(engine->IsCached("/b"));
    EXPECT_TRUE(engine->IsCached("/c"));
}

TEST_F(CacheEngineTest, LfuEvictsLeastFrequentlyRead)
{
    auto engine = MakeEngine(100, EvictionPolicy::Lfu);
    Put(*engine, "/a", 40);
    Put(*engine, "/b", 40);
    ASSERT_TRUE(engine->ReadFromCache("/b").has_value());
    ASSERT_TRUE(engine->ReadFromCache("/b").has_value());
    ASSERT_TRUE(engine->ReadFromCache("/a").has_value());

    Put(*engine, "/c", 40);
    EXPECT_FALSE(engine->IsCached("/a"));
    EXPECT_TRUE(engine->IsCached("/b"));
}

TEST_F(CacheEngineTest, FifoEvictsOldestRegardlessOfReads)
{
    auto engine = MakeEngine(100, EvictionPolicy::Fifo);
    Put(*engine, "/a", 40);
    Put(*engine, "/b", 40);
    ASSERT_TRUE(engine->ReadFromCache("/a").has_value());

    Put(*engine, "/c", 40);
    EXPECT_FALSE(engine->IsCached("/a"));
    EXPECT_TRUE(engine->IsCached("/b"));
}

TEST_F(CacheEngineTest, FileLargerThanCacheIsRejected)
{
    auto engine = MakeEngine(10);
    auto res    = engine->CacheFile("/big", ToBytes(std::string(11, 'x')));
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), make_error_code(Storage::StorageErrc::CapacityExceeded));
    EXPECT_EQ(engine->Stats().entry_count, 0u);
}

TEST_F(CacheEngineTest, ReplacingEntryDoesNotDoubleCount)
{
    auto engine = MakeEngine(100);
    Put(*engine, "/a", 70);
    Put(*engine, "/a", 80);
    const auto stats = engine->Stats();
    EXPECT_EQ(stats.entry_count, 1u);
    EXPECT_EQ(stats.total_size, 80u);
    EXPECT_EQ(stats.eviction_count, 0u);
}

TEST_F(CacheEngineTest, InvalidatePrefixDropsSubtreeOnly)
{
    auto engine = MakeEngine(1024);
    Put(*engine, "/src/dir/a", 1);
    Put(*engine, "/src/dir/sub/b", 1);
    Put(*engine, "/src/dirx", 1);

    EXPECT_EQ(engine->InvalidatePrefix("/src/dir"), 2u);
    EXPECT_FALSE(engine->IsCached("/src/dir/a"));
    EXPECT_FALSE(engine->IsCached("/src/dir/sub/b"));
    EXPECT_TRUE(engine->IsCached("/src/dirx"));
}

TEST_F(CacheEngineTest, CachePathIsDeterministicAndKeepsExtension)
{
    auto engine = MakeEngine(1024);
    const auto a = engine->CachePathFor("/photos/img.JPG");
    EXPECT_EQ(a, engine->CachePathFor("/photos//img.JPG"));
    EXPECT_EQ(a.extension(), ".JPG");
    EXPECT_NE(a, engine->CachePathFor("/photos/img2.JPG"));
}

TEST_F(CacheEngineTest, IndexSurvivesRestart)
{
    {
        auto engine = MakeEngine(1024);
        ASSERT_TRUE(engine->CacheFile("/keep.txt", ToBytes("persisted")).has_value());
        ASSERT_TRUE(engine->Shutdown().has_value());
    }
    auto engine = MakeEngine(1024);
    EXPECT_TRUE(engine->IsCached("/keep.txt"));
    auto data = engine->ReadFromCache("/keep.txt");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(ToString(*data), "persisted");
    EXPECT_EQ(engine->Stats().total_size, 9u);
}

TEST_F(CacheEngineTest, ClearEmptiesIndexAndDirectory)
{
    auto engine = MakeEngine(1024);
    Put(*engine, "/a", 10);
    Put(*engine, "/b", 10);
    ASSERT_TRUE(engine->Clear().has_value());
    EXPECT_EQ(engine->Stats().entry_count, 0u);
    EXPECT_EQ(engine->Stats().total_size, 0u);
    EXPECT_FALSE(fs::exists(engine->CachePathFor("/a")));
}

TEST_F(CacheEngineTest, ConcurrentInsertsStayWithinCapacity)
{
    auto engine = MakeEngine(200);
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&engine, t]() {
            for (int i = 0; i < 10; ++i) {
                auto res = engine->CacheFile(
                    "/t" + std::to_string(t) + "/" + std::to_string(i),
                    ToBytes(std::string(30, 'y'))
                );
                EXPECT_TRUE(res.has_value());
            }
        });
    }
    for (auto &writer : writers) {
        writer.join();
    }
    const auto stats = engine->Stats();
    EXPECT_LE(stats.total_size, 200u);
    EXPECT_EQ(stats.total_size, stats.entry_count * 30);
}

TEST_F(CacheEngineTest, RecachedPathKeepsFileAfterEviction)
{
    auto engine = MakeEngine(100);
    Put(*engine, "/a", 60);
    Put(*engine, "/b", 60);
    Put(*engine, "/a", 60);

    ASSERT_TRUE(engine->IsCached("/a"));
    EXPECT_TRUE(fs::exists(engine->CachePathFor("/a")));
    auto data = engine->ReadFromCache("/a");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(data->size(), 60u);

    size_t files = 0;
    for (const auto &entry : fs::directory_iterator(dir_ / "cache")) {
        if (entry.is_regular_file() &&
            entry.path().filename().string() != Constants::CACHE_INDEX_FILE_NAME) {
            ++files;
        }
    }
    EXPECT_EQ(files, 1u);
}

TEST_F(CacheEngineTest, ConcurrentEvictionNeverDeletesLiveFile)
{
    auto engine = MakeEngine(100);
    std::vector<std::thread> writers;
    for (int t = 0; t < 2; ++t) {
        writers.emplace_back([&engine, t]() {
            for (int i = 0; i < 200; ++i) {
                const auto path = (i + t) % 2 == 0 ? std::string("/a") : std::string("/b");
                auto res        = engine->CacheFile(path, ToBytes(std::string(60, 'z')));
                if (!res) {
                    // Capacity can be momentarily reserved by the other writer.
                    EXPECT_EQ(res.error(), make_error_code(Storage::StorageErrc::CapacityExceeded));
                }
            }
        });
    }
    for (auto &writer : writers) {
        writer.join();
    }
    for (const auto *path : {"/a", "/b"}) {
        if (auto entry = engine->GetEntry(path)) {
            EXPECT_TRUE(fs::exists(entry->cache_path)) << path;
        }
    }
}

TEST(CacheStatsTest, RatesHandleEmptyAndUnlimited)
{
    CacheStats stats;
    EXPECT_DOUBLE_EQ(stats.HitRate(), 0.0);
    EXPECT_DOUBLE_EQ(stats.UsagePercent(), 0.0);

    stats.hit_count  = 3;
    stats.miss_count = 1;
    stats.total_size = 25;
    stats.max_size   = 100;
    EXPECT_DOUBLE_EQ(stats.HitRate(), 0.75);
    EXPECT_DOUBLE_EQ(stats.UsagePercent(), 25.0);

    stats.max_size = 0;
    EXPECT_DOUBLE_EQ(stats.UsagePercent(), 0.0);
}
