#include "sync/job_tracker.hpp"

#include "common/ids.hpp"
#include "common/time_util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace TierFS::Sync
{

using Storage::StorageErrc;

namespace
{

std::int64_t NowMillis() { return Common::ToUnixMillis(Storage::Clock::now()); }

bool IsFinishedStatus(const std::string &status)
{
    return status == "completed" || status == "failed" || status == "cancelled";
}

}  // namespace

const char *JobStatusToString(JobStatus status)
{
    switch (status) {
        case JobStatus::Pending:
            return "pending";
        case JobStatus::Processing:
            return "processing";
        case JobStatus::Completed:
            return "completed";
        case JobStatus::Failed:
            return "failed";
        case JobStatus::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

std::optional<JobStatus> StringToJobStatus(const std::string &str)
{
    if (str == "pending") {
        return JobStatus::Pending;
    }
    if (str == "processing") {
        return JobStatus::Processing;
    }
    if (str == "completed") {
        return JobStatus::Completed;
    }
    if (str == "failed") {
        return JobStatus::Failed;
    }
    if (str == "cancelled") {
        return JobStatus::Cancelled;
    }
    return std::nullopt;
}

JobTracker::JobTracker(fs::path file_path, size_t max_history)
    : store_(std::move(file_path)), max_history_(max_history)
{
}

StorageResult<void> JobTracker::Load()
{
    if (auto res = store_.Load(); !res) {
        return res;
    }
    std::lock_guard lock(resumable_mutex_);
    resumable_.clear();
    for (const auto &[id, j] : store_.Snapshot()) {
        const auto status = j.value("status", std::string{});
        if (status == "pending" || status == "processing") {
            resumable_.insert(id);
        }
    }
    if (!resumable_.empty()) {
        spdlog::info("{} interrupted jobs can be resumed", resumable_.size());
    }
    return {};
}

std::optional<JobRecord> JobTracker::FromJson(const std::string &id, const nlohmann::json &j)
{
    try {
        JobRecord record;
        record.id     = id;
        record.kind   = j.at("kind").get<std::string>();
        record.status = StringToJobStatus(j.at("status").get<std::string>())
                            .value_or(JobStatus::Failed);
        record.request    = j.value("request", nlohmann::json::object());
        record.created_at = Common::FromUnixMillis(j.value("created_at_ms", std::int64_t{0}));
        record.updated_at = Common::FromUnixMillis(j.value("updated_at_ms", std::int64_t{0}));
        record.bytes_done = j.value("bytes_done", std::uint64_t{0});
        if (j.contains("error")) {
            record.error = j.at("error").get<std::string>();
        }
        record.result = j.value("result", nlohmann::json{});
        return record;
    } catch (const nlohmann::json::exception &e) {
        spdlog::warn("Skipping malformed job record {}: {}", id, e.what());
        return std::nullopt;
    }
}

StorageResult<std::string> JobTracker::Create(const std::string &kind, nlohmann::json request)
{
    const auto id  = Common::NewUuid();
    const auto now = NowMillis();
    auto res       = store_.Put(
        id, nlohmann::json{
                      {"kind", kind},
                      {"status", JobStatusToString(JobStatus::Pending)},
                      {"request", std::move(request)},
                      {"created_at_ms", now},
                      {"updated_at_ms", now},
                      {"bytes_done", 0},
        }
    );
    if (!res) {
        return std::unexpected(res.error());
    }
    spdlog::debug("Created {} job {}", kind, id);
    return id;
}

StorageResult<void> JobTracker::Transition_(
    const std::string &id, const std::function<void(nlohmann::json &)> &change
)
{
    bool found = false;
    auto res   = store_.Update([&](std::map<std::string, nlohmann::json> &records) {
        auto it = records.find(id);
        if (it == records.end()) {
            return;
        }
        found = true;
        change(it->second);
        it->second["updated_at_ms"] = NowMillis();
    });
    if (!res) {
        return res;
    }
    if (!found) {
        return std::unexpected(make_error_code(StorageErrc::NotFound));
    }
    return {};
}

StorageResult<void> JobTracker::MarkProcessing(const std::string &id)
{
    {
        std::lock_guard lock(resumable_mutex_);
        resumable_.erase(id);
    }
    return Transition_(id, [](nlohmann::json &j) {
        if (j.value("status", std::string{}) != "cancelled") {
            j["status"] = JobStatusToString(JobStatus::Processing);
        }
    });
}

StorageResult<void> JobTracker::UpdateProgress(const std::string &id, std::uint64_t bytes_done)
{
    return Transition_(id, [bytes_done](nlohmann::json &j) {
        j["bytes_done"] = bytes_done;
    });
}

StorageResult<void> JobTracker::Complete(const std::string &id, nlohmann::json result)
{
    auto res = Transition_(id, [&result](nlohmann::json &j) {
        if (j.value("status", std::string{}) != "cancelled") {
            j["status"] = JobStatusToString(JobStatus::Completed);
        }
        j["result"] = std::move(result);
    });
    if (!res) {
        return res;
    }
    return TrimHistory_();
}

StorageResult<void> JobTracker::Fail(const std::string &id, const std::string &reason)
{
    {
        std::lock_guard lock(resumable_mutex_);
        resumable_.erase(id);
    }
    auto res = Transition_(id, [&reason](nlohmann::json &j) {
        if (j.value("status", std::string{}) != "cancelled") {
            j["status"] = JobStatusToString(JobStatus::Failed);
        }
        j["error"] = reason;
    });
    if (!res) {
        return res;
    }
    return TrimHistory_();
}

StorageResult<bool> JobTracker::Cancel(const std::string &id)
{
    bool changed = false;
    {
        std::lock_guard lock(resumable_mutex_);
        resumable_.erase(id);
    }
    auto res = Transition_(id, [&changed](nlohmann::json &j) {
        if (!IsFinishedStatus(j.value("status", std::string{}))) {
            j["status"] = JobStatusToString(JobStatus::Cancelled);
            changed     = true;
        }
    });
    if (!res) {
        return std::unexpected(res.error());
    }
    if (changed) {
        spdlog::info("Job {} cancelled", id);
    }
    return changed;
}

bool JobTracker::IsCancelled(const std::string &id) const
{
    auto j = store_.Get(id);
    return j && j->value("status", std::string{}) == "cancelled";
}

std::optional<JobRecord> JobTracker::Get(const std::string &id) const
{
    auto j = store_.Get(id);
    if (!j) {
        return std::nullopt;
    }
    return FromJson(id, *j);
}

std::vector<JobRecord> JobTracker::List() const
{
    std::vector<JobRecord> records;
    for (const auto &[id, j] : store_.Snapshot()) {
        if (auto record = FromJson(id, j)) {
            records.push_back(std::move(*record));
        }
    }
    std::ranges::sort(records, [](const JobRecord &a, const JobRecord &b) {
        return a.created_at > b.created_at;
    });
    return records;
}

std::vector<JobRecord> JobTracker::ListResumable() const
{
    std::set<std::string> ids;
    {
        std::lock_guard lock(resumable_mutex_);
        ids = resumable_;
    }
    std::vector<JobRecord> records;
    for (const auto &id : ids) {
        if (auto record = Get(id)) {
            records.push_back(std::move(*record));
        }
    }
    return records;
}

StorageResult<void> JobTracker::TrimHistory_()
{
    return store_.Update([this](std::map<std::string, nlohmann::json> &records) {
        std::vector<std::pair<std::int64_t, std::string>> finished;
        for (const auto &[id, j] : records) {
            if (IsFinishedStatus(j.value("status", std::string{}))) {
                finished.emplace_back(j.value("updated_at_ms", std::int64_t{0}), id);
            }
        }
        if (finished.size() <= max_history_) {
            return;
        }
        std::ranges::sort(finished);
        const auto excess = finished.size() - max_history_;
        for (size_t i = 0; i < excess; ++i) {
            records.erase(finished[i].second);
        }
    });
}

}  // namespace TierFS::Sync
