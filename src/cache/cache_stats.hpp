#ifndef TIERFS_SRC_CACHE_CACHE_STATS_HPP_
#define TIERFS_SRC_CACHE_CACHE_STATS_HPP_

#include <atomic>
#include <cstdint>

namespace TierFS::Cache
{

/// Lock-free hit/miss/eviction counters.
class CacheCounters
{
    public:
    CacheCounters() = default;

    void IncrementHits() { hits_++; }
    uint64_t GetHits() const { return hits_.load(); }

    void IncrementMisses() { misses_++; }
    uint64_t GetMisses() const { return misses_.load(); }

    void AddItemsEvicted(uint64_t count) { items_evicted_ += count; }
    uint64_t GetItemsEvicted() const { return items_evicted_.load(); }

    void Reset()
    {
        hits_          = 0;
        misses_        = 0;
        items_evicted_ = 0;
    }

    private:
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> items_evicted_{0};
};

}  // namespace TierFS::Cache

#endif  // TIERFS_SRC_CACHE_CACHE_STATS_HPP_
