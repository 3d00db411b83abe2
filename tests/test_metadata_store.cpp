#include "registry/metadata_store.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace TierFS;
using Registry::FileMetadata;
using Registry::JsonMetadataStore;
using Testing::TempDir;

TEST(MetadataStoreTest, TagsAndFavoritesPersist)
{
    TempDir dir;
    {
        JsonMetadataStore store(dir / "metadata.json");
        ASSERT_TRUE(store.Load().has_value());
        ASSERT_TRUE(store.AddTag("nas", "/a.jpg", "holiday").has_value());
        ASSERT_TRUE(store.AddTag("nas", "a.jpg", "holiday").has_value());
        ASSERT_TRUE(store.AddTag("nas", "/a.jpg", "2024").has_value());
        auto favorite = store.ToggleFavorite("nas", "/b.jpg");
        ASSERT_TRUE(favorite.has_value());
        EXPECT_TRUE(*favorite);
    }

    JsonMetadataStore store(dir / "metadata.json");
    ASSERT_TRUE(store.Load().has_value());
    auto a = store.Get("nas", "/a.jpg");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->tags, (std::vector<std::string>{"holiday", "2024"}));
    EXPECT_EQ(store.ListByTag("nas", "holiday"), std::vector<std::string>{"/a.jpg"});
    EXPECT_EQ(store.ListFavorites("nas"), std::vector<std::string>{"/b.jpg"});
    EXPECT_TRUE(store.ListFavorites("s3").empty());
}

TEST(MetadataStoreTest, EmptyMetadataRemovesRecord)
{
    TempDir dir;
    JsonMetadataStore store(dir / "metadata.json");
    ASSERT_TRUE(store.Load().has_value());

    ASSERT_TRUE(store.AddTag("nas", "/a", "x").has_value());
    ASSERT_TRUE(store.RemoveTag("nas", "/a", "x").has_value());
    EXPECT_FALSE(store.Get("nas", "/a").has_value());

    ASSERT_TRUE(store.ToggleFavorite("nas", "/b").has_value());
    auto off = store.ToggleFavorite("nas", "/b");
    ASSERT_TRUE(off.has_value());
    EXPECT_FALSE(*off);
    EXPECT_FALSE(store.Get("nas", "/b").has_value());

    FileMetadata full;
    full.comment = "draft";
    ASSERT_TRUE(store.Set("nas", "/c", full).has_value());
    EXPECT_EQ(store.Get("nas", "/c")->comment, "draft");
    ASSERT_TRUE(store.Set("nas", "/c", FileMetadata{}).has_value());
    EXPECT_FALSE(store.Get("nas", "/c").has_value());
}

TEST(MetadataStoreTest, RatingIsBounded)
{
    TempDir dir;
    JsonMetadataStore store(dir / "metadata.json");
    ASSERT_TRUE(store.Load().has_value());

    auto bad = store.SetRating("nas", "/a", 6);
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error(), make_error_code(Storage::StorageErrc::InvalidArgument));

    ASSERT_TRUE(store.SetRating("nas", "/a", 4).has_value());
    EXPECT_EQ(store.Get("nas", "/a")->rating, 4);
    ASSERT_TRUE(store.SetRating("nas", "/a", std::nullopt).has_value());
    EXPECT_FALSE(store.Get("nas", "/a").has_value());

    auto empty_tag = store.AddTag("nas", "/a", "");
    ASSERT_FALSE(empty_tag.has_value());
}

TEST(MetadataStoreTest, ApplyCopiesOntoListingEntry)
{
    FileMetadata metadata;
    metadata.tags        = {"red"};
    metadata.is_favorite = true;
    metadata.color_label = "red";
    metadata.rating      = 3;

    Storage::VirtualFile file;
    Registry::ApplyMetadata(file, metadata);
    EXPECT_EQ(file.tags, std::vector<std::string>{"red"});
    EXPECT_TRUE(file.is_favorite);
    EXPECT_EQ(file.color_label, "red");
    EXPECT_EQ(file.rating, 3);
}
