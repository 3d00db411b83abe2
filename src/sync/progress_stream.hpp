#ifndef TIERFS_SRC_SYNC_PROGRESS_STREAM_HPP_
#define TIERFS_SRC_SYNC_PROGRESS_STREAM_HPP_

#include "app_constants.hpp"
#include "sync/sync_types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

namespace TierFS::Sync
{

/**
 * @brief Bounded single-producer/single-consumer queue of progress records.
 *
 * The producer never blocks: when the queue is full the oldest record is
 * discarded to make room for the newest. Once the consumer closes, pushes are
 * dropped.
 */
class ProgressChannel
{
    public:
    explicit ProgressChannel(size_t capacity = Constants::PROGRESS_QUEUE_CAPACITY);

    ProgressChannel(const ProgressChannel&)            = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    /// Producer side. Returns false when the consumer has detached.
    bool Push(SyncProgress progress);
    /// Producer side: no more records will follow.
    void Finish();

    /// Consumer side: next record, or nullopt at end of stream.
    std::optional<SyncProgress> Pop();
    std::optional<SyncProgress> PopFor(std::chrono::milliseconds timeout);
    /// Consumer side: detach; later pushes are dropped.
    void Close();

    bool IsFinished() const;
    /// Records discarded because the consumer fell behind.
    std::uint64_t Overflowed() const;

    private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::deque<SyncProgress> queue_;
    std::uint64_t overflowed_ = 0;
    bool finished_            = false;
    bool closed_              = false;
};

/// Consumer handle over a ProgressChannel. Closes the channel on destruction.
class SyncProgressStream
{
    public:
    explicit SyncProgressStream(std::shared_ptr<ProgressChannel> channel);
    ~SyncProgressStream();

    SyncProgressStream(const SyncProgressStream&)            = delete;
    SyncProgressStream& operator=(const SyncProgressStream&) = delete;
    SyncProgressStream(SyncProgressStream&&) noexcept;
    SyncProgressStream& operator=(SyncProgressStream&&) noexcept;

    /// Blocks until the next record; nullopt once the sync has ended.
    std::optional<SyncProgress> Next();
    std::optional<SyncProgress> NextFor(std::chrono::milliseconds timeout);
    void Close();

    private:
    std::shared_ptr<ProgressChannel> channel_;
};

}  // namespace TierFS::Sync

#endif  // TIERFS_SRC_SYNC_PROGRESS_STREAM_HPP_
