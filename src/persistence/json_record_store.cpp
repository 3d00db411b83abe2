#include "persistence/json_record_store.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <utility>

namespace TierFS::Persistence
{

using Storage::StorageErrc;

namespace
{
constexpr int kStoreVersion = 1;
}

JsonRecordStore::JsonRecordStore(fs::path file_path) : file_path_(std::move(file_path)) {}

StorageResult<void> JsonRecordStore::Load()
{
    std::lock_guard lock(mutex_);
    records_.clear();

    std::error_code ec;
    if (!fs::exists(file_path_, ec)) {
        return {};
    }

    std::ifstream in(file_path_);
    if (!in.is_open()) {
        spdlog::error("Failed to open record store {}", file_path_.string());
        return std::unexpected(make_error_code(StorageErrc::IOError));
    }

    try {
        nlohmann::json root;
        in >> root;
        if (!root.is_object() || !root.contains("records") || !root.at("records").is_object()) {
            spdlog::error("Record store {} has an unexpected layout", file_path_.string());
            return std::unexpected(make_error_code(StorageErrc::Internal));
        }
        for (const auto& [key, value] : root.at("records").items()) {
            records_.emplace(key, value);
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to parse record store {}: {}", file_path_.string(), e.what());
        records_.clear();
        return std::unexpected(make_error_code(StorageErrc::Internal));
    }

    spdlog::debug("Loaded {} records from {}", records_.size(), file_path_.string());
    return {};
}

StorageResult<void> JsonRecordStore::Persist_() const
{
    std::error_code ec;
    if (file_path_.has_parent_path()) {
        fs::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            spdlog::error(
                "Failed to create directory for {}: {}", file_path_.string(), ec.message()
            );
            return std::unexpected(Storage::MakeErrnoError(ec.value()));
        }
    }

    nlohmann::json root;
    root["version"] = kStoreVersion;
    root["records"] = nlohmann::json::object();
    for (const auto& [key, value] : records_) {
        root["records"][key] = value;
    }

    fs::path tmp_path = file_path_;
    tmp_path += ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            spdlog::error("Failed to open {} for writing", tmp_path.string());
            return std::unexpected(make_error_code(StorageErrc::IOError));
        }
        out << root.dump(2);
        out.flush();
        if (!out) {
            spdlog::error("Failed to write {}", tmp_path.string());
            return std::unexpected(make_error_code(StorageErrc::IOError));
        }
    }
    fs::rename(tmp_path, file_path_, ec);
    if (ec) {
        spdlog::error("Failed to replace {}: {}", file_path_.string(), ec.message());
        return std::unexpected(Storage::MakeErrnoError(ec.value()));
    }
    return {};
}

StorageResult<void> JsonRecordStore::Put(const std::string& key, nlohmann::json record)
{
    std::lock_guard lock(mutex_);
    records_[key] = std::move(record);
    return Persist_();
}

StorageResult<void> JsonRecordStore::Remove(const std::string& key)
{
    std::lock_guard lock(mutex_);
    if (records_.erase(key) == 0) {
        return {};
    }
    return Persist_();
}

StorageResult<void> JsonRecordStore::Update(
    const std::function<void(std::map<std::string, nlohmann::json>&)>& fn
)
{
    std::lock_guard lock(mutex_);
    fn(records_);
    return Persist_();
}

std::optional<nlohmann::json> JsonRecordStore::Get(const std::string& key) const
{
    std::lock_guard lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, nlohmann::json> JsonRecordStore::Snapshot() const
{
    std::lock_guard lock(mutex_);
    return records_;
}

std::vector<std::string> JsonRecordStore::Keys() const
{
    std::lock_guard lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(records_.size());
    for (const auto& [key, value] : records_) {
        keys.push_back(key);
    }
    return keys;
}

size_t JsonRecordStore::Size() const
{
    std::lock_guard lock(mutex_);
    return records_.size();
}

}  // namespace TierFS::Persistence
