#include "cache/file_lock_manager.hpp"

namespace TierFS::Cache
{

void FileLockManager::CleanupExpiredLocks_()
{
    // Caller holds map_mutex_.
    for (auto it = locks_.begin(); it != locks_.end();) {
        if (it->second.expired()) {
            it = locks_.erase(it);
        } else {
            ++it;
        }
    }
}

std::shared_ptr<std::mutex> FileLockManager::GetFileLock(const std::string& key)
{
    size_t old_count = access_count_.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard lock(map_mutex_);

    if (old_count > 0 && (old_count % kCleanupInterval == 0)) {
        CleanupExpiredLocks_();
    }

    auto it = locks_.find(key);
    if (it != locks_.end()) {
        if (auto sp = it->second.lock()) {
            return sp;
        }
    }

    auto new_mutex = std::make_shared<std::mutex>();
    locks_[key]    = new_mutex;
    return new_mutex;
}

size_t FileLockManager::ActiveLocks()
{
    std::lock_guard lock(map_mutex_);
    CleanupExpiredLocks_();
    return locks_.size();
}

}  // namespace TierFS::Cache
