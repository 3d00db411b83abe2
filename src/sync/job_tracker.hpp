#ifndef TIERFS_SRC_SYNC_JOB_TRACKER_HPP_
#define TIERFS_SRC_SYNC_JOB_TRACKER_HPP_

#include "app_constants.hpp"
#include "persistence/json_record_store.hpp"
#include "storage/storage_types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace TierFS::Sync
{

namespace fs = std::filesystem;

template <typename T>
using StorageResult = Storage::StorageResult<T>;

enum class JobStatus : std::uint8_t { Pending, Processing, Completed, Failed, Cancelled };

const char *JobStatusToString(JobStatus status);
std::optional<JobStatus> StringToJobStatus(const std::string &str);

struct JobRecord {
    std::string id;
    std::string kind;  ///< "sync", "tier", ...
    JobStatus status = JobStatus::Pending;
    nlohmann::json request;
    Storage::TimePoint created_at{};
    Storage::TimePoint updated_at{};
    std::uint64_t bytes_done = 0;
    std::optional<std::string> error;
    nlohmann::json result;

    bool IsFinished() const
    {
        return status == JobStatus::Completed || status == JobStatus::Failed ||
               status == JobStatus::Cancelled;
    }
};

/**
 * @brief Persistent job state, one JSON record per job.
 *
 * Cancellation is cooperative: Cancel() only flips the status and the running
 * task polls IsCancelled() between files. Jobs found Pending or Processing at
 * load time were interrupted by a restart and are reported as resumable.
 */
class JobTracker
{
    public:
    explicit JobTracker(
        fs::path file_path, size_t max_history = Constants::DEFAULT_MAX_JOB_HISTORY
    );
    ~JobTracker() = default;

    JobTracker(const JobTracker &)            = delete;
    JobTracker &operator=(const JobTracker &) = delete;

    StorageResult<void> Load();

    StorageResult<std::string> Create(const std::string &kind, nlohmann::json request);
    StorageResult<void> MarkProcessing(const std::string &id);
    StorageResult<void> UpdateProgress(const std::string &id, std::uint64_t bytes_done);
    /// Records the result. A job cancelled meanwhile stays Cancelled.
    StorageResult<void> Complete(const std::string &id, nlohmann::json result);
    StorageResult<void> Fail(const std::string &id, const std::string &reason);
    /// False when the job had already finished.
    StorageResult<bool> Cancel(const std::string &id);

    bool IsCancelled(const std::string &id) const;
    std::optional<JobRecord> Get(const std::string &id) const;
    /// Newest first.
    std::vector<JobRecord> List() const;
    std::vector<JobRecord> ListResumable() const;

    private:
    StorageResult<void> Transition_(
        const std::string &id, const std::function<void(nlohmann::json &)> &change
    );
    StorageResult<void> TrimHistory_();
    static std::optional<JobRecord> FromJson(const std::string &id, const nlohmann::json &j);

    Persistence::JsonRecordStore store_;
    const size_t max_history_;

    mutable std::mutex resumable_mutex_;
    std::set<std::string> resumable_;
};

}  // namespace TierFS::Sync

#endif  // TIERFS_SRC_SYNC_JOB_TRACKER_HPP_
