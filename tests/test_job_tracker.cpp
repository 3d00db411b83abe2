#include "sync/job_tracker.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace TierFS;
using Sync::JobStatus;
using Sync::JobTracker;
using Testing::TempDir;

class JobTrackerTest : public ::testing::Test
{
    protected:
    std::filesystem::path JobsFile() const { return dir_ / "jobs.json"; }

    TempDir dir_;
};

TEST_F(JobTrackerTest, LifecycleIsPersisted)
{
    JobTracker tracker(JobsFile());
    ASSERT_TRUE(tracker.Load().has_value());

    auto id = tracker.Create("sync", {{"source_id", "nas"}});
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(tracker.Get(*id)->status, JobStatus::Pending);

    ASSERT_TRUE(tracker.MarkProcessing(*id).has_value());
    ASSERT_TRUE(tracker.UpdateProgress(*id, 4096).has_value());
    ASSERT_TRUE(tracker.Complete(*id, {{"files_copied", 3}}).has_value());

    JobTracker reloaded(JobsFile());
    ASSERT_TRUE(reloaded.Load().has_value());
    auto record = reloaded.Get(*id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->kind, "sync");
    EXPECT_EQ(record->status, JobStatus::Completed);
    EXPECT_EQ(record->bytes_done, 4096u);
    EXPECT_EQ(record->request.at("source_id"), "nas");
    EXPECT_EQ(record->result.at("files_copied"), 3);
    EXPECT_TRUE(record->IsFinished());
    EXPECT_TRUE(reloaded.ListResumable().empty());
}

TEST_F(JobTrackerTest, InterruptedJobsAreResumableAfterReload)
{
    std::string pending;
    std::string running;
    {
        JobTracker tracker(JobsFile());
        ASSERT_TRUE(tracker.Load().has_value());
        pending = *tracker.Create("sync", nlohmann::json::object());
        running = *tracker.Create("tier", nlohmann::json::object());
        ASSERT_TRUE(tracker.MarkProcessing(running).has_value());
        auto done = *tracker.Create("sync", nlohmann::json::object());
        ASSERT_TRUE(tracker.Complete(done, nlohmann::json::object()).has_value());
    }

    JobTracker tracker(JobsFile());
    ASSERT_TRUE(tracker.Load().has_value());
    auto resumable = tracker.ListResumable();
    ASSERT_EQ(resumable.size(), 2u);

    std::set<std::string> ids;
    for (const auto &record : resumable) {
        ids.insert(record.id);
    }
    EXPECT_TRUE(ids.contains(pending));
    EXPECT_TRUE(ids.contains(running));

    ASSERT_TRUE(tracker.MarkProcessing(pending).has_value());
    EXPECT_EQ(tracker.ListResumable().size(), 1u);
}

TEST_F(JobTrackerTest, CancelOnlyAffectsUnfinishedJobs)
{
    JobTracker tracker(JobsFile());
    ASSERT_TRUE(tracker.Load().has_value());
    auto active = *tracker.Create("sync", nlohmann::json::object());
    auto done   = *tracker.Create("sync", nlohmann::json::object());
    ASSERT_TRUE(tracker.Complete(done, nlohmann::json::object()).has_value());

    auto cancelled = tracker.Cancel(active);
    ASSERT_TRUE(cancelled.has_value());
    EXPECT_TRUE(*cancelled);
    EXPECT_TRUE(tracker.IsCancelled(active));

    auto again = tracker.Cancel(done);
    ASSERT_TRUE(again.has_value());
    EXPECT_FALSE(*again);
    EXPECT_EQ(tracker.Get(done)->status, JobStatus::Completed);

    // The worker finishing afterwards must not overwrite the cancellation.
    ASSERT_TRUE(tracker.Complete(active, nlohmann::json::object()).has_value());
    EXPECT_EQ(tracker.Get(active)->status, JobStatus::Cancelled);
}

TEST_F(JobTrackerTest, UnknownJobIsNotFound)
{
    JobTracker tracker(JobsFile());
    ASSERT_TRUE(tracker.Load().has_value());
    auto res = tracker.Cancel("no-such-job");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), make_error_code(Storage::StorageErrc::NotFound));
    EXPECT_FALSE(tracker.Get("no-such-job").has_value());
}

TEST_F(JobTrackerTest, FailRecordsReason)
{
    JobTracker tracker(JobsFile());
    ASSERT_TRUE(tracker.Load().has_value());
    auto id = *tracker.Create("sync", nlohmann::json::object());
    ASSERT_TRUE(tracker.Fail(id, "destination unavailable").has_value());
    auto record = tracker.Get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, JobStatus::Failed);
    EXPECT_EQ(record->error.value_or(""), "destination unavailable");
}

TEST_F(JobTrackerTest, FinishedHistoryIsTrimmed)
{
    JobTracker tracker(JobsFile(), 2);
    ASSERT_TRUE(tracker.Load().has_value());
    auto active = *tracker.Create("sync", nlohmann::json::object());
    for (int i = 0; i < 4; ++i) {
        auto id = *tracker.Create("sync", nlohmann::json::object());
        ASSERT_TRUE(tracker.Complete(id, nlohmann::json::object()).has_value());
    }

    auto all = tracker.List();
    EXPECT_EQ(all.size(), 3u);
    EXPECT_TRUE(tracker.Get(active).has_value());
}

TEST(JobStatusTest, StringsRoundTrip)
{
    for (auto status : {JobStatus::Pending, JobStatus::Processing, JobStatus::Completed,
                        JobStatus::Failed, JobStatus::Cancelled}) {
        EXPECT_EQ(Sync::StringToJobStatus(Sync::JobStatusToString(status)), status);
    }
    EXPECT_FALSE(Sync::StringToJobStatus("paused").has_value());
}
