#include "storage/filesystem_object_client.hpp"
#include "storage/object_storage_adapter.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <memory>

using namespace TierFS;
using Storage::FilesystemObjectClient;
using Storage::ObjectStorageAdapter;
using Storage::StorageErrc;
using Storage::StorageTier;
using Testing::TempDir;
using Testing::ToBytes;
using Testing::ToString;

class ObjectStorageAdapterTest : public ::testing::Test
{
    protected:
    void SetUp() override
    {
        client_  = std::make_shared<FilesystemObjectClient>(dir_ / "bucket");
        adapter_ = std::make_unique<ObjectStorageAdapter>(client_, "media", "library");
        ASSERT_TRUE(adapter_->Initialize().has_value());
    }

    TempDir dir_;
    std::shared_ptr<FilesystemObjectClient> client_;
    std::unique_ptr<ObjectStorageAdapter> adapter_;
};

TEST_F(ObjectStorageAdapterTest, ObjectsLiveUnderThePrefix)
{
    ASSERT_TRUE(adapter_->Write("/albums/2019/cover.png", ToBytes("png")).has_value());

    auto head = client_->HeadObject("library/albums/2019/cover.png");
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ(head->size, 3u);
    EXPECT_EQ(head->storage_class, "STANDARD");

    auto data = adapter_->Read("/albums/2019/cover.png");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(ToString(*data), "png");

    auto range = adapter_->ReadRange("/albums/2019/cover.png", 1, 10);
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(ToString(*range), "ng");
}

TEST_F(ObjectStorageAdapterTest, ListingImpliesDirectoriesFromKeys)
{
    ASSERT_TRUE(adapter_->Write("/albums/2019/cover.png", ToBytes("png")).has_value());
    ASSERT_TRUE(adapter_->Write("/albums/notes.txt", ToBytes("hi")).has_value());
    ASSERT_TRUE(adapter_->CreateDirectory("/albums/empty").has_value());

    auto listing = adapter_->List("/albums");
    ASSERT_TRUE(listing.has_value());
    ASSERT_EQ(listing->size(), 3u);
    EXPECT_TRUE((*listing)[0].is_directory);
    EXPECT_TRUE((*listing)[1].is_directory);
    EXPECT_EQ((*listing)[2].name, "notes.txt");
    EXPECT_EQ((*listing)[2].tier_status.current_tier, StorageTier::Cold);

    auto dir = adapter_->Stat("/albums/2019");
    ASSERT_TRUE(dir.has_value());
    EXPECT_TRUE(dir->is_directory);

    auto read_dir = adapter_->Read("/albums/2019");
    ASSERT_FALSE(read_dir.has_value());
    EXPECT_EQ(read_dir.error(), make_error_code(StorageErrc::IsADirectory));

    auto missing = adapter_->List("/nowhere");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), make_error_code(StorageErrc::NotFound));
}

TEST_F(ObjectStorageAdapterTest, DeletingADirectoryRemovesEveryKeyBelowIt)
{
    ASSERT_TRUE(adapter_->Write("/albums/2019/a.png", ToBytes("a")).has_value());
    ASSERT_TRUE(adapter_->Write("/albums/2019/b.png", ToBytes("b")).has_value());
    ASSERT_TRUE(adapter_->Write("/keep.txt", ToBytes("k")).has_value());

    auto not_empty = adapter_->RemoveDirectory("/albums/2019");
    ASSERT_FALSE(not_empty.has_value());
    EXPECT_EQ(not_empty.error(), make_error_code(StorageErrc::NotEmpty));

    ASSERT_TRUE(adapter_->Delete("/albums").has_value());
    EXPECT_FALSE(*adapter_->Exists("/albums/2019/a.png"));
    EXPECT_TRUE(*adapter_->Exists("/keep.txt"));
}

TEST_F(ObjectStorageAdapterTest, PartialWritesKeepTheStorageClass)
{
    ASSERT_TRUE(adapter_->Write("/log.txt", ToBytes("one")).has_value());
    ASSERT_TRUE(adapter_->ChangeStorageClass("/log.txt", "GLACIER_IR").has_value());

    ASSERT_TRUE(adapter_->Append("/log.txt", ToBytes(",two")).has_value());
    auto written = adapter_->WriteAt("/log.txt", 0, ToBytes("ONE"));
    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(*written, 3u);

    auto data = adapter_->Read("/log.txt");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(ToString(*data), "ONE,two");

    auto head = client_->HeadObject("library/log.txt");
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ(head->storage_class, "GLACIER_IR");
}

TEST_F(ObjectStorageAdapterTest, StorageClassDrivesTheTier)
{
    ASSERT_TRUE(adapter_->Write("/raw/shot.cr2", ToBytes("raw")).has_value());
    ASSERT_TRUE(adapter_->ChangeStorageClass("/raw/shot.cr2", "DEEP_ARCHIVE").has_value());

    auto file = adapter_->Stat("/raw/shot.cr2");
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->tier_status.current_tier, StorageTier::Archive);
    EXPECT_FALSE(file->tier_status.is_cached);
    EXPECT_TRUE(file->tier_status.can_warm);

    auto on_dir = adapter_->ChangeStorageClass("/raw", "GLACIER");
    ASSERT_FALSE(on_dir.has_value());
    EXPECT_EQ(on_dir.error(), make_error_code(StorageErrc::IsADirectory));

    auto missing = adapter_->ChangeStorageClass("/raw/none.cr2", "GLACIER");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), make_error_code(StorageErrc::NotFound));
}

TEST_F(ObjectStorageAdapterTest, CopyAndMoveBetweenPrefixes)
{
    ASSERT_TRUE(adapter_->Write("/src/a.txt", ToBytes("a")).has_value());
    ASSERT_TRUE(adapter_->Write("/src/deep/b.txt", ToBytes("b")).has_value());

    auto flat = adapter_->Copy("/src", "/dst", {});
    ASSERT_FALSE(flat.has_value());
    EXPECT_EQ(flat.error(), make_error_code(StorageErrc::IsADirectory));

    Storage::CopyOptions recursive;
    recursive.recursive = true;
    ASSERT_TRUE(adapter_->Copy("/src", "/dst", recursive).has_value());
    EXPECT_EQ(ToString(*adapter_->Read("/dst/deep/b.txt")), "b");

    ASSERT_TRUE(adapter_->Move("/src/a.txt", "/moved.txt", {}).has_value());
    EXPECT_FALSE(*adapter_->Exists("/src/a.txt"));
    EXPECT_EQ(ToString(*adapter_->Read("/moved.txt")), "a");

    auto clash = adapter_->Move("/moved.txt", "/dst/a.txt", {});
    ASSERT_FALSE(clash.has_value());
    EXPECT_EQ(clash.error(), make_error_code(StorageErrc::AlreadyExists));
}

TEST_F(ObjectStorageAdapterTest, SymlinksAreUnsupported)
{
    auto res = adapter_->CreateSymlink("a", "/link");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), make_error_code(StorageErrc::Unsupported));
}

TEST_F(ObjectStorageAdapterTest, ManifestSurvivesReopen)
{
    ASSERT_TRUE(adapter_->Write("/kept.txt", ToBytes("kept")).has_value());
    ASSERT_TRUE(adapter_->ChangeStorageClass("/kept.txt", "GLACIER").has_value());

    auto reopened_client = std::make_shared<FilesystemObjectClient>(dir_ / "bucket");
    ObjectStorageAdapter reopened(reopened_client, "media", "library");
    ASSERT_TRUE(reopened.Initialize().has_value());

    auto file = reopened.Stat("/kept.txt");
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->size, 4u);
    EXPECT_EQ(file->tier_status.current_tier, StorageTier::Archive);
}
