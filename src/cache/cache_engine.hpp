#ifndef TIERFS_SRC_CACHE_CACHE_ENGINE_HPP_
#define TIERFS_SRC_CACHE_CACHE_ENGINE_HPP_

#include "cache/cache_stats.hpp"
#include "cache/cache_types.hpp"
#include "common/non_fatal.hpp"
#include "events/event_bus.hpp"
#include "persistence/json_record_store.hpp"
#include "storage/storage_error.hpp"

#include "boost/multi_index/composite_key.hpp"
#include "boost/multi_index/hashed_index.hpp"
#include "boost/multi_index/indexed_by.hpp"
#include "boost/multi_index/member.hpp"
#include "boost/multi_index/ordered_index.hpp"
#include "boost/multi_index_container.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace TierFS::Cache
{

namespace bmi = boost::multi_index;

template <typename T>
using StorageResult = Storage::StorageResult<T>;

/**
 * @brief Bounded, content-addressed cache of whole files on fast local storage.
 *
 * Index mutations are serialized by one mutex; file I/O happens outside it.
 * Eviction is two-phase: victims are chosen, unlinked from the index and their
 * files moved to unique retired names under the lock, then the retired files
 * are deleted after the lock is released. A re-cache of the same path therefore
 * never loses its fresh file to a pending delete. Space for
 * an incoming file is reserved before its bytes are written, so concurrent
 * inserts never jointly exceed `max_size`.
 */
class CacheEngine
{
    private:
    //------------------------------------------------------------------------------//
    // Internal Types
    //------------------------------------------------------------------------------//

    struct IndexRecord {
        std::string path;
        fs::path cache_path;
        std::uint64_t size = 0;
        TimePoint cached_at{};
        TimePoint last_accessed{};
        std::uint64_t access_count = 0;
        std::uint64_t seq          = 0;  ///< insertion order, breaks ties
        std::optional<TimePoint> source_modified;
        std::uint32_t pins = 0;  ///< readers currently streaming the file
    };

    struct by_path {
    };
    struct by_recency {
    };
    struct by_frequency {
    };
    struct by_age {
    };

    using IndexContainer = bmi::multi_index_container<
        IndexRecord,
        bmi::indexed_by<
            bmi::hashed_unique<
                bmi::tag<by_path>, bmi::member<IndexRecord, std::string, &IndexRecord::path>>,
            bmi::ordered_non_unique<
                bmi::tag<by_recency>,
                bmi::composite_key<
                    IndexRecord, bmi::member<IndexRecord, TimePoint, &IndexRecord::last_accessed>,
                    bmi::member<IndexRecord, std::uint64_t, &IndexRecord::seq>>>,
            bmi::ordered_non_unique<
                bmi::tag<by_frequency>,
                bmi::composite_key<
                    IndexRecord,
                    bmi::member<IndexRecord, std::uint64_t, &IndexRecord::access_count>,
                    bmi::member<IndexRecord, std::uint64_t, &IndexRecord::seq>>>,
            bmi::ordered_non_unique<
                bmi::tag<by_age>,
                bmi::composite_key<
                    IndexRecord, bmi::member<IndexRecord, TimePoint, &IndexRecord::cached_at>,
                    bmi::member<IndexRecord, std::uint64_t, &IndexRecord::seq>>>>>;

    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//

    explicit CacheEngine(
        CacheConfig config, std::shared_ptr<Events::IEventBus> events = nullptr,
        std::shared_ptr<Common::NonFatalLedger> ledger = nullptr
    );
    ~CacheEngine() = default;

    CacheEngine(const CacheEngine&)            = delete;
    CacheEngine& operator=(const CacheEngine&) = delete;
    CacheEngine(CacheEngine&&)                 = delete;
    CacheEngine& operator=(CacheEngine&&)      = delete;

    /// Creates the cache directory and reloads the persisted index.
    StorageResult<void> Initialize();
    /// Persists the index.
    StorageResult<void> Shutdown();

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    /// `<cache_dir>/<md5(path)><extension of path>`; deterministic.
    fs::path CachePathFor(const std::string& path) const;

    StorageResult<CacheEntry> CacheFile(
        const std::string& path, std::span<const std::byte> bytes,
        std::optional<TimePoint> source_modified = std::nullopt
    );

    /// Whole file; NotFound (and a miss) when absent.
    StorageResult<Storage::Bytes> ReadFromCache(const std::string& path);
    /// Byte range of a cached file; counts as a hit like ReadFromCache.
    StorageResult<Storage::Bytes> ReadRangeFromCache(
        const std::string& path, std::uint64_t offset, std::uint64_t length
    );

    bool IsCached(const std::string& path) const;
    std::optional<CacheEntry> GetEntry(const std::string& path) const;

    /// Removes one entry and its file. Returns whether an entry existed.
    bool Invalidate(const std::string& path);
    /// Removes `prefix` and every entry beneath it. Returns the number removed.
    size_t InvalidatePrefix(const std::string& prefix);
    /// Removes every entry and every file in the cache directory.
    StorageResult<void> Clear();

    /// Evicts until `required_space` more bytes fit. Returns the bytes freed.
    StorageResult<std::uint64_t> EvictIfNeeded(std::uint64_t required_space);

    /// Refreshes recency and frequency without reading.
    bool Touch(const std::string& path);

    CacheStats Stats() const;
    void RecordHit() { counters_.IncrementHits(); }
    void RecordMiss() { counters_.IncrementMisses(); }

    const CacheConfig& GetConfig() const { return config_; }
    const Common::NonFatalLedger& Failures() const { return *ledger_; }

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//

    template <typename Tag>
    std::optional<std::vector<IndexRecord>> CollectVictims_(
        std::uint64_t needed, const std::string& exclude
    ) const;

    /// Caller holds mutex_. Chooses and unlinks victims; nullopt if not enough is evictable.
    std::optional<std::vector<IndexRecord>> TakeVictims_(
        std::uint64_t needed, const std::string& exclude
    );
    std::uint64_t BytesOverLimit_(std::uint64_t incoming) const;
    /// Caller holds mutex_. Renames the record's file to a unique name pending deletion.
    void Retire_(IndexRecord& record);

    void DeleteFiles_(const std::vector<IndexRecord>& victims, Events::EvictionReason reason);
    /// Writes `bytes` beside `target`; the caller renames it into place.
    StorageResult<fs::path> WriteTempFile_(
        const fs::path& target, std::uint64_t ticket, std::span<const std::byte> bytes
    ) const;

    /// Pins the entry and returns its file, or nullopt on a miss.
    std::optional<std::pair<fs::path, std::uint64_t>> Pin_(const std::string& path);
    void Unpin_(const std::string& path, std::uint64_t seq, bool accessed);

    StorageResult<void> LoadIndex_();
    void RemoveOrphans_();
    static CacheEntry ToEntry(const IndexRecord& record);

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//

    const CacheConfig config_;
    std::shared_ptr<Events::IEventBus> events_;
    std::shared_ptr<Common::NonFatalLedger> ledger_;
    Persistence::JsonRecordStore index_store_;

    mutable std::mutex mutex_;
    IndexContainer index_;
    std::uint64_t total_size_ = 0;
    std::uint64_t reserved_   = 0;
    std::uint64_t next_seq_   = 1;
    CacheCounters counters_;
};

}  // namespace TierFS::Cache

#endif  // TIERFS_SRC_CACHE_CACHE_ENGINE_HPP_
