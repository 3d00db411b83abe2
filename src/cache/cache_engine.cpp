#include "cache/cache_engine.hpp"

#include "common/digest.hpp"
#include "common/time_util.hpp"
#include "storage/virtual_path.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <unordered_set>

namespace TierFS::Cache
{

using Storage::Bytes;
using Storage::Clock;
using Storage::StorageErrc;

namespace
{

std::unexpected<std::error_code> Errc(StorageErrc errc)
{
    return std::unexpected(make_error_code(errc));
}

Storage::StorageResult<Bytes> ReadFileRange(
    const fs::path& file, std::uint64_t offset, std::optional<std::uint64_t> length
)
{
    std::error_code ec;
    const auto file_size = fs::file_size(file, ec);
    if (ec) {
        return Errc(
            ec == std::errc::no_such_file_or_directory ? StorageErrc::NotFound
                                                       : StorageErrc::IOError
        );
    }
    if (offset >= file_size) {
        return Bytes{};
    }
    const auto count = std::min<std::uint64_t>(length.value_or(file_size), file_size - offset);

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return Errc(StorageErrc::IOError);
    }
    in.seekg(static_cast<std::streamoff>(offset));
    Bytes data(count);
    in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(count));
    if (static_cast<std::uint64_t>(in.gcount()) != count) {
        return Errc(StorageErrc::IOError);
    }
    return data;
}

}  // namespace

CacheEngine::CacheEngine(
    CacheConfig config, std::shared_ptr<Events::IEventBus> events,
    std::shared_ptr<Common::NonFatalLedger> ledger
)
    : config_(std::move(config)),
      events_(std::move(events)),
      ledger_(ledger ? std::move(ledger) : std::make_shared<Common::NonFatalLedger>()),
      index_store_(config_.cache_dir / Constants::CACHE_INDEX_FILE_NAME)
{
}

//------------------------------------------------------------------------------//
// Lifecycle
//------------------------------------------------------------------------------//

StorageResult<void> CacheEngine::Initialize()
{
    std::error_code ec;
    fs::create_directories(config_.cache_dir, ec);
    if (ec) {
        spdlog::error(
            "Failed to create cache directory {}: {}", config_.cache_dir.string(), ec.message()
        );
        return std::unexpected(Storage::MakeErrnoError(ec.value()));
    }
    if (auto res = LoadIndex_(); !res) {
        return res;
    }
    RemoveOrphans_();
    if (auto freed = EvictIfNeeded(0); !freed) {
        return std::unexpected(freed.error());
    }

    const auto stats = Stats();
    spdlog::info(
        "Cache at {} ready: {} entries, {} of {} bytes, policy {}", config_.cache_dir.string(),
        stats.entry_count, stats.total_size, config_.max_size,
        EvictionPolicyToString(config_.eviction_policy)
    );
    return {};
}

StorageResult<void> CacheEngine::Shutdown()
{
    std::map<std::string, nlohmann::json> snapshot;
    {
        std::lock_guard lock(mutex_);
        for (const auto& record : index_) {
            nlohmann::json j{
                {"file", record.cache_path.filename().string()},
                {"size", record.size},
                {"cached_at_ms", Common::ToUnixMillis(record.cached_at)},
                {"last_accessed_ms", Common::ToUnixMillis(record.last_accessed)},
                {"access_count", record.access_count},
                {"seq", record.seq},
            };
            if (record.source_modified) {
                j["source_modified_ms"] = Common::ToUnixMillis(*record.source_modified);
            }
            snapshot.emplace(record.path, std::move(j));
        }
    }
    spdlog::debug("Persisting cache index with {} entries", snapshot.size());
    return index_store_.Update([&snapshot](std::map<std::string, nlohmann::json>& records) {
        records = std::move(snapshot);
    });
}

StorageResult<void> CacheEngine::LoadIndex_()
{
    if (auto res = index_store_.Load(); !res) {
        // A corrupt index only costs the cached bytes; start empty.
        spdlog::warn("Cache index unreadable, starting with an empty cache");
        ledger_->Record("cache.index_load", res.error().message(), res.error());
    }

    std::lock_guard lock(mutex_);
    index_.clear();
    total_size_ = 0;
    for (const auto& [path, j] : index_store_.Snapshot()) {
        IndexRecord record;
        try {
            record.path          = path;
            record.cache_path    = config_.cache_dir / j.at("file").get<std::string>();
            record.size          = j.at("size").get<std::uint64_t>();
            record.cached_at = Common::FromUnixMillis(j.at("cached_at_ms").get<std::int64_t>());
            record.last_accessed =
                Common::FromUnixMillis(j.at("last_accessed_ms").get<std::int64_t>());
            record.access_count = j.value("access_count", std::uint64_t{0});
            record.seq          = j.at("seq").get<std::uint64_t>();
            if (j.contains("source_modified_ms")) {
                record.source_modified =
                    Common::FromUnixMillis(j.at("source_modified_ms").get<std::int64_t>());
            }
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Dropping malformed cache index entry {}: {}", path, e.what());
            continue;
        }

        std::error_code ec;
        const auto on_disk = fs::file_size(record.cache_path, ec);
        if (ec || on_disk != record.size) {
            spdlog::debug("Dropping stale cache index entry {}", path);
            continue;
        }
        next_seq_ = std::max(next_seq_, record.seq + 1);
        total_size_ += record.size;
        index_.insert(std::move(record));
    }
    return {};
}

void CacheEngine::RemoveOrphans_()
{
    std::unordered_set<std::string> referenced;
    {
        std::lock_guard lock(mutex_);
        for (const auto& record : index_) {
            referenced.insert(record.cache_path.filename().string());
        }
    }

    std::error_code ec;
    for (fs::directory_iterator it(config_.cache_dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (name.starts_with(Constants::CACHE_INDEX_FILE_NAME) || referenced.contains(name)) {
            continue;
        }
        std::error_code remove_ec;
        if (fs::is_regular_file(it->path(), remove_ec) && fs::remove(it->path(), remove_ec)) {
            spdlog::debug("Removed orphaned cache file {}", name);
        }
    }
    if (ec) {
        ledger_->Record("cache.orphan_scan", ec.message(), ec);
    }
}

//------------------------------------------------------------------------------//
// Public Methods
//------------------------------------------------------------------------------//

fs::path CacheEngine::CachePathFor(const std::string& path) const
{
    const auto normalized = Storage::NormalizeVirtualPath(path);
    const auto extension  = fs::path(Storage::VirtualFileName(normalized)).extension().string();
    return config_.cache_dir / (Common::Md5Hex(std::string_view{normalized}) + extension);
}

StorageResult<CacheEntry> CacheEngine::CacheFile(
    const std::string& path, std::span<const std::byte> bytes,
    std::optional<TimePoint> source_modified
)
{
    const std::uint64_t size = bytes.size();
    if (config_.max_size > 0 && size > config_.max_size) {
        spdlog::debug("{} ({} bytes) exceeds cache capacity {}", path, size, config_.max_size);
        return Errc(StorageErrc::CapacityExceeded);
    }

    const auto target = CachePathFor(path);
    std::vector<IndexRecord> victims;
    std::uint64_t ticket = 0;
    {
        std::lock_guard lock(mutex_);
        auto& by_path_idx        = index_.get<by_path>();
        const std::uint64_t prev = [&]() {
            auto it = by_path_idx.find(path);
            return it == by_path_idx.end() ? std::uint64_t{0} : it->size;
        }();

        // The replaced entry's bytes count as already released.
        const auto used  = total_size_ - prev + reserved_ + size;
        const auto over  = (config_.max_size > 0 && used > config_.max_size)
                               ? used - config_.max_size
                               : std::uint64_t{0};
        if (over > 0) {
            auto taken = TakeVictims_(over, path);
            if (!taken) {
                spdlog::debug("Cannot reclaim {} bytes for {}", over, path);
                return Errc(StorageErrc::CapacityExceeded);
            }
            victims = std::move(*taken);
        }

        if (auto it = by_path_idx.find(path); it != by_path_idx.end()) {
            total_size_ -= it->size;
            by_path_idx.erase(it);
        }
        reserved_ += size;
        ticket = next_seq_++;
    }

    DeleteFiles_(victims, Events::EvictionReason::CacheFull);
    auto staged = WriteTempFile_(target, ticket, bytes);

    std::lock_guard lock(mutex_);
    reserved_ -= size;
    if (!staged) {
        spdlog::warn("Failed to write cache file for {}: {}", path, staged.error().message());
        if (index_.get<by_path>().count(path) == 0) {
            std::error_code ec;
            fs::remove(target, ec);
        }
        return std::unexpected(staged.error());
    }
    // Publishing under the lock keeps retirement of this name ordered with it.
    std::error_code rename_ec;
    fs::rename(*staged, target, rename_ec);
    if (rename_ec) {
        std::error_code remove_ec;
        fs::remove(*staged, remove_ec);
        spdlog::warn("Failed to publish cache file for {}: {}", path, rename_ec.message());
        return std::unexpected(Storage::MakeErrnoError(rename_ec.value()));
    }

    const auto now = Clock::now();
    IndexRecord record;
    record.path            = path;
    record.cache_path      = target;
    record.size            = size;
    record.cached_at       = now;
    record.last_accessed   = now;
    record.seq             = ticket;
    record.source_modified = source_modified;

    auto& by_path_idx = index_.get<by_path>();
    if (auto it = by_path_idx.find(path); it != by_path_idx.end()) {
        total_size_ -= it->size;
        by_path_idx.replace(it, record);
    } else {
        index_.insert(record);
    }
    total_size_ += size;
    spdlog::debug("Cached {} ({} bytes) as {}", path, size, target.filename().string());
    return ToEntry(record);
}

std::optional<std::pair<fs::path, std::uint64_t>> CacheEngine::Pin_(const std::string& path)
{
    std::lock_guard lock(mutex_);
    auto& by_path_idx = index_.get<by_path>();
    auto it           = by_path_idx.find(path);
    if (it == by_path_idx.end()) {
        counters_.IncrementMisses();
        return std::nullopt;
    }
    by_path_idx.modify(it, [](IndexRecord& r) {
        ++r.pins;
    });
    return std::make_pair(it->cache_path, it->seq);
}

void CacheEngine::Unpin_(const std::string& path, std::uint64_t seq, bool accessed)
{
    std::lock_guard lock(mutex_);
    auto& by_path_idx = index_.get<by_path>();
    auto it           = by_path_idx.find(path);
    if (it == by_path_idx.end() || it->seq != seq) {
        return;  // replaced or invalidated while being read
    }
    if (accessed) {
        by_path_idx.modify(it, [now = Clock::now()](IndexRecord& r) {
            --r.pins;
            r.last_accessed = now;
            ++r.access_count;
        });
        return;
    }
    // The backing file is gone; drop the entry.
    total_size_ -= it->size;
    by_path_idx.erase(it);
}

StorageResult<Bytes> CacheEngine::ReadFromCache(const std::string& path)
{
    auto pinned = Pin_(path);
    if (!pinned) {
        return Errc(StorageErrc::NotFound);
    }
    auto data = ReadFileRange(pinned->first, 0, std::nullopt);
    if (!data && data.error() == StorageErrc::NotFound) {
        spdlog::warn("Cache file for {} disappeared", path);
        Unpin_(path, pinned->second, false);
        counters_.IncrementMisses();
        return data;
    }
    Unpin_(path, pinned->second, data.has_value());
    if (data) {
        counters_.IncrementHits();
    }
    return data;
}

StorageResult<Bytes> CacheEngine::ReadRangeFromCache(
    const std::string& path, std::uint64_t offset, std::uint64_t length
)
{
    auto pinned = Pin_(path);
    if (!pinned) {
        return Errc(StorageErrc::NotFound);
    }
    auto data = ReadFileRange(pinned->first, offset, length);
    if (!data && data.error() == StorageErrc::NotFound) {
        Unpin_(path, pinned->second, false);
        counters_.IncrementMisses();
        return data;
    }
    Unpin_(path, pinned->second, data.has_value());
    if (data) {
        counters_.IncrementHits();
    }
    return data;
}

bool CacheEngine::IsCached(const std::string& path) const
{
    std::lock_guard lock(mutex_);
    return index_.get<by_path>().count(path) > 0;
}

std::optional<CacheEntry> CacheEngine::GetEntry(const std::string& path) const
{
    std::lock_guard lock(mutex_);
    const auto& by_path_idx = index_.get<by_path>();
    auto it                 = by_path_idx.find(path);
    if (it == by_path_idx.end()) {
        return std::nullopt;
    }
    return ToEntry(*it);
}

bool CacheEngine::Invalidate(const std::string& path)
{
    IndexRecord removed;
    {
        std::lock_guard lock(mutex_);
        auto& by_path_idx = index_.get<by_path>();
        auto it           = by_path_idx.find(path);
        if (it == by_path_idx.end()) {
            return false;
        }
        removed = *it;
        total_size_ -= it->size;
        by_path_idx.erase(it);
        Retire_(removed);
    }
    DeleteFiles_({removed}, Events::EvictionReason::Manual);
    return true;
}

size_t CacheEngine::InvalidatePrefix(const std::string& prefix)
{
    std::vector<IndexRecord> removed;
    {
        std::lock_guard lock(mutex_);
        auto& by_path_idx = index_.get<by_path>();
        for (auto it = by_path_idx.begin(); it != by_path_idx.end();) {
            if (Storage::IsWithinVirtualPath(it->path, prefix)) {
                removed.push_back(*it);
                Retire_(removed.back());
                total_size_ -= it->size;
                it = by_path_idx.erase(it);
            } else {
                ++it;
            }
        }
    }
    DeleteFiles_(removed, Events::EvictionReason::Manual);
    return removed.size();
}

StorageResult<void> CacheEngine::Clear()
{
    std::vector<IndexRecord> removed;
    {
        std::lock_guard lock(mutex_);
        removed.assign(index_.begin(), index_.end());
        for (auto& record : removed) {
            Retire_(record);
        }
        index_.clear();
        total_size_ = 0;
    }
    DeleteFiles_(removed, Events::EvictionReason::Manual);

    std::error_code ec;
    for (fs::directory_iterator it(config_.cache_dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        std::error_code remove_ec;
        if (fs::is_regular_file(it->path(), remove_ec)) {
            fs::remove(it->path(), remove_ec);
        }
    }
    if (ec) {
        spdlog::error("Failed to clear cache directory: {}", ec.message());
        return std::unexpected(Storage::MakeErrnoError(ec.value()));
    }
    spdlog::info("Cache cleared ({} entries)", removed.size());
    return index_store_.Update([](std::map<std::string, nlohmann::json>& records) {
        records.clear();
    });
}

StorageResult<std::uint64_t> CacheEngine::EvictIfNeeded(std::uint64_t required_space)
{
    if (config_.max_size == 0) {
        return std::uint64_t{0};
    }
    std::vector<IndexRecord> victims;
    {
        std::lock_guard lock(mutex_);
        const auto over = BytesOverLimit_(required_space);
        if (over == 0) {
            return std::uint64_t{0};
        }
        auto taken = TakeVictims_(over, {});
        if (!taken) {
            return Errc(StorageErrc::CapacityExceeded);
        }
        victims = std::move(*taken);
    }

    std::uint64_t freed = 0;
    for (const auto& victim : victims) {
        freed += victim.size;
    }
    DeleteFiles_(victims, Events::EvictionReason::CacheFull);
    return freed;
}

bool CacheEngine::Touch(const std::string& path)
{
    std::lock_guard lock(mutex_);
    auto& by_path_idx = index_.get<by_path>();
    auto it           = by_path_idx.find(path);
    if (it == by_path_idx.end()) {
        return false;
    }
    by_path_idx.modify(it, [now = Clock::now()](IndexRecord& r) {
        r.last_accessed = now;
        ++r.access_count;
    });
    return true;
}

CacheStats CacheEngine::Stats() const
{
    std::lock_guard lock(mutex_);
    CacheStats stats;
    stats.total_size     = total_size_;
    stats.max_size       = config_.max_size;
    stats.entry_count    = index_.size();
    stats.hit_count      = counters_.GetHits();
    stats.miss_count     = counters_.GetMisses();
    stats.eviction_count = counters_.GetItemsEvicted();
    return stats;
}

//------------------------------------------------------------------------------//
// Private Methods
//------------------------------------------------------------------------------//

std::uint64_t CacheEngine::BytesOverLimit_(std::uint64_t incoming) const
{
    if (config_.max_size == 0) {
        return 0;
    }
    const auto used = total_size_ + reserved_ + incoming;
    return used > config_.max_size ? used - config_.max_size : 0;
}

template <typename Tag>
std::optional<std::vector<CacheEngine::IndexRecord>> CacheEngine::CollectVictims_(
    std::uint64_t needed, const std::string& exclude
) const
{
    std::vector<IndexRecord> victims;
    std::uint64_t reclaimed = 0;
    for (const auto& record : index_.get<Tag>()) {
        if (reclaimed >= needed) {
            break;
        }
        if (record.pins > 0 || record.path == exclude) {
            continue;
        }
        victims.push_back(record);
        reclaimed += record.size;
    }
    if (reclaimed < needed) {
        return std::nullopt;
    }
    return victims;
}

std::optional<std::vector<CacheEngine::IndexRecord>> CacheEngine::TakeVictims_(
    std::uint64_t needed, const std::string& exclude
)
{
    std::optional<std::vector<IndexRecord>> victims;
    switch (config_.eviction_policy) {
        case EvictionPolicy::Lru:
            victims = CollectVictims_<by_recency>(needed, exclude);
            break;
        case EvictionPolicy::Lfu:
            victims = CollectVictims_<by_frequency>(needed, exclude);
            break;
        case EvictionPolicy::Fifo:
            victims = CollectVictims_<by_age>(needed, exclude);
            break;
    }
    if (!victims) {
        return std::nullopt;
    }

    auto& by_path_idx = index_.get<by_path>();
    for (auto& victim : *victims) {
        by_path_idx.erase(victim.path);
        total_size_ -= victim.size;
        Retire_(victim);
    }
    counters_.AddItemsEvicted(victims->size());
    return victims;
}

void CacheEngine::Retire_(IndexRecord& record)
{
    fs::path retired = record.cache_path;
    retired += std::string(Constants::CACHE_RETIRED_SUFFIX) + std::to_string(next_seq_++);
    std::error_code ec;
    fs::rename(record.cache_path, retired, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        spdlog::warn(
            "Failed to retire cache file {}: {}", record.cache_path.string(), ec.message()
        );
        ledger_->Record("cache.retire_file", ec.message(), ec);
        return;
    }
    record.cache_path = std::move(retired);
}

void CacheEngine::DeleteFiles_(
    const std::vector<IndexRecord>& victims, Events::EvictionReason reason
)
{
    for (const auto& victim : victims) {
        std::error_code ec;
        fs::remove(victim.cache_path, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            spdlog::warn(
                "Failed to delete cache file {}: {}", victim.cache_path.string(), ec.message()
            );
            ledger_->Record("cache.delete_file", ec.message(), ec);
        }
        spdlog::debug(
            "Evicted {} ({} bytes, {})", victim.path, victim.size, EvictionReasonToString(reason)
        );
        if (events_) {
            events_->Publish(Events::CacheEviction{victim.path, victim.size, reason, Clock::now()});
        }
    }
}

StorageResult<fs::path> CacheEngine::WriteTempFile_(
    const fs::path& target, std::uint64_t ticket, std::span<const std::byte> bytes
) const
{
    fs::path tmp = target;
    tmp += ".tmp" + std::to_string(ticket);
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Errc(StorageErrc::IOError);
    }
    out.write(
        reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size())
    );
    out.close();
    if (!out) {
        std::error_code ec;
        fs::remove(tmp, ec);
        return Errc(StorageErrc::IOError);
    }
    return tmp;
}

CacheEntry CacheEngine::ToEntry(const IndexRecord& record)
{
    return CacheEntry{
        record.path,          record.cache_path,   record.size,
        record.cached_at,     record.last_accessed, record.access_count,
        record.source_modified,
    };
}

}  // namespace TierFS::Cache
