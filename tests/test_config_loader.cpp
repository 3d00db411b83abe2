#include "config/config_loader.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <fstream>

using namespace TierFS;
using Config::LoadError;
using Config::ParseConfig;
using Config::ParseSizeStringToBytes;
using Testing::TempDir;

namespace
{

nlohmann::json SampleConfig()
{
    return nlohmann::json::parse(R"({
        "global_settings": {"log_level": "debug", "state_dir": "/tmp/tierfs-state", "io_threads": 8},
        "cache": {"path": "/tmp/tierfs-cache", "max_size": "2GB", "eviction_policy": "lfu"},
        "sync": {"cache_stage_threshold": "500 MB", "max_job_history": 20},
        "network": {"probe_timeout_ms": 1500, "backoff_base_ms": 250, "max_reconnect_attempts": 5},
        "sources": [
            {"id": "disk", "type": "local", "path": "/srv/data"},
            {"id": "nas", "type": "nas", "path": "/mnt/nas", "protocol": "nfs",
             "host": "filer.local", "share_name": "media", "name": "Media NAS"},
            {"id": "s3", "type": "s3", "path": "/mnt/buckets/archive", "storage_class": "GLACIER"}
        ]
    })");
}

}  // namespace

TEST(ConfigLoaderTest, ParsesFullDocument)
{
    auto config = ParseConfig(SampleConfig());
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->global_settings.log_level, spdlog::level::debug);
    EXPECT_EQ(config->global_settings.state_dir.string(), "/tmp/tierfs-state");
    EXPECT_EQ(config->global_settings.io_threads, 8u);
    EXPECT_EQ(config->cache.path.string(), "/tmp/tierfs-cache");
    EXPECT_EQ(config->cache.max_size, 2ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(config->cache.eviction_policy, Cache::EvictionPolicy::Lfu);
    EXPECT_EQ(config->sync.cache_stage_threshold, 500ULL * 1024 * 1024);
    EXPECT_EQ(config->sync.max_job_history, 20u);
    EXPECT_EQ(config->network.probe_timeout, std::chrono::milliseconds{1500});
    EXPECT_EQ(config->network.backoff_base, std::chrono::milliseconds{250});
    EXPECT_EQ(config->network.max_reconnect_attempts, 5u);

    ASSERT_EQ(config->sources.size(), 3u);
    const auto *nas = config->FindSource("nas");
    ASSERT_NE(nas, nullptr);
    EXPECT_EQ(nas->type, Storage::StorageSourceType::NetworkShare);
    EXPECT_EQ(nas->protocol, Storage::NetworkProtocol::Nfs);
    EXPECT_EQ(nas->host, "filer.local");
    EXPECT_EQ(nas->share_name, "media");
    EXPECT_EQ(nas->name, "Media NAS");

    const auto *s3 = config->FindSource("s3");
    ASSERT_NE(s3, nullptr);
    EXPECT_EQ(s3->type, Storage::StorageSourceType::ObjectStorage);
    EXPECT_EQ(s3->bucket, "archive");
    EXPECT_EQ(s3->storage_class, "GLACIER");
    EXPECT_EQ(config->FindSource("disk")->name, "disk");
    EXPECT_EQ(config->FindSource("missing"), nullptr);
}

TEST(ConfigLoaderTest, MinimalDocumentUsesDefaults)
{
    auto config = ParseConfig(nlohmann::json{{"cache", {{"path", "/tmp/c"}, {"max_size", 4096}}}});
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->cache.max_size, 4096u);
    EXPECT_EQ(config->cache.eviction_policy, Cache::EvictionPolicy::Lru);
    EXPECT_EQ(config->global_settings.io_threads, Constants::DEFAULT_IO_THREADS);
    EXPECT_TRUE(config->sources.empty());
}

TEST(ConfigLoaderTest, RejectsInvalidDocuments)
{
    EXPECT_EQ(ParseConfig(nlohmann::json::array()).error(), LoadError::ValidationError);
    EXPECT_EQ(ParseConfig(nlohmann::json::object()).error(), LoadError::ValidationError);
    EXPECT_EQ(
        ParseConfig(nlohmann::json{{"cache", {{"max_size", "1GB"}}}}).error(),
        LoadError::ValidationError
    );

    auto bad_size            = SampleConfig();
    bad_size["cache"]["max_size"] = "lots";
    EXPECT_EQ(ParseConfig(bad_size).error(), LoadError::ValidationError);

    auto bad_policy                    = SampleConfig();
    bad_policy["cache"]["eviction_policy"] = "random";
    EXPECT_EQ(ParseConfig(bad_policy).error(), LoadError::ValidationError);

    auto wrong_type                   = SampleConfig();
    wrong_type["global_settings"]["io_threads"] = "many";
    EXPECT_EQ(ParseConfig(wrong_type).error(), LoadError::JsonParseError);
}

TEST(ConfigLoaderTest, RejectsBadSources)
{
    auto duplicate = SampleConfig();
    duplicate["sources"].push_back({{"id", "disk"}, {"type", "local"}, {"path", "/other"}});
    EXPECT_EQ(ParseConfig(duplicate).error(), LoadError::ValidationError);

    auto custom = SampleConfig();
    custom["sources"].push_back({{"id", "plugin"}, {"type", "custom"}, {"path", "/x"}});
    EXPECT_EQ(ParseConfig(custom).error(), LoadError::ValidationError);

    auto unknown = SampleConfig();
    unknown["sources"][0]["type"] = "tape";
    EXPECT_EQ(ParseConfig(unknown).error(), LoadError::ValidationError);

    auto no_path = SampleConfig();
    no_path["sources"][0].erase("path");
    EXPECT_EQ(ParseConfig(no_path).error(), LoadError::ValidationError);

    auto bad_protocol                 = SampleConfig();
    bad_protocol["sources"][1]["protocol"] = "ftp";
    EXPECT_EQ(ParseConfig(bad_protocol).error(), LoadError::ValidationError);
}

TEST(ConfigLoaderTest, LoadsFromFile)
{
    TempDir dir;
    const auto path = dir / "config.json";
    {
        std::ofstream out(path);
        out << SampleConfig().dump(2);
    }
    auto config = Config::LoadConfigFromFile(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->sources.size(), 3u);

    EXPECT_EQ(Config::LoadConfigFromFile(dir / "missing.json").error(), LoadError::FileNotFound);

    const auto broken = dir / "broken.json";
    {
        std::ofstream out(broken);
        out << "{ not json";
    }
    EXPECT_EQ(Config::LoadConfigFromFile(broken).error(), LoadError::JsonParseError);

    auto verbose = Config::LoadConfigFromFileVerbose(dir / "missing.json");
    ASSERT_FALSE(verbose.has_value());
    EXPECT_NE(verbose.error().find("File not found"), std::string::npos);
}

TEST(ConfigLoaderTest, SizeStrings)
{
    EXPECT_EQ(ParseSizeStringToBytes("1024"), 1024u);
    EXPECT_EQ(ParseSizeStringToBytes("2GB"), 2ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(ParseSizeStringToBytes("500 MB"), 500ULL * 1024 * 1024);
    EXPECT_EQ(ParseSizeStringToBytes("16k"), 16ULL * 1024);
    EXPECT_EQ(ParseSizeStringToBytes("1T"), 1024ULL * 1024 * 1024 * 1024);
    EXPECT_FALSE(ParseSizeStringToBytes("").has_value());
    EXPECT_FALSE(ParseSizeStringToBytes("MB").has_value());
    EXPECT_FALSE(ParseSizeStringToBytes("10 parsecs").has_value());
    EXPECT_FALSE(ParseSizeStringToBytes("10MB extra").has_value());
}
