#ifndef TIERFS_SRC_CACHE_FILE_LOCK_MANAGER_HPP_
#define TIERFS_SRC_CACHE_FILE_LOCK_MANAGER_HPP_

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace TierFS::Cache
{

/**
 * @brief Hands out one mutex per key (a namespaced virtual path).
 *
 * Mutexes are held by weak pointers, so a key's mutex is released once no
 * caller holds it and the map is swept of expired entries periodically.
 * Thread-safe.
 */
class FileLockManager
{
    public:
    FileLockManager()  = default;
    ~FileLockManager() = default;

    FileLockManager(const FileLockManager&)            = delete;
    FileLockManager& operator=(const FileLockManager&) = delete;
    FileLockManager(FileLockManager&&)                 = delete;
    FileLockManager& operator=(FileLockManager&&)      = delete;

    /**
     * @brief Returns the mutex for `key`, creating it if none is alive.
     *
     * The caller keeps the shared_ptr for as long as it holds the lock.
     */
    std::shared_ptr<std::mutex> GetFileLock(const std::string& key);

    /// Number of keys with a live mutex; expired entries are swept first.
    size_t ActiveLocks();

    private:
    void CleanupExpiredLocks_();

    std::mutex map_mutex_;
    std::unordered_map<std::string, std::weak_ptr<std::mutex>> locks_;

    std::atomic<size_t> access_count_{0};
    static constexpr size_t kCleanupInterval = 1000;
};

}  // namespace TierFS::Cache

#endif  // TIERFS_SRC_CACHE_FILE_LOCK_MANAGER_HPP_
