#include "sync/progress_stream.hpp"

#include <utility>

namespace TierFS::Sync
{

ProgressChannel::ProgressChannel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool ProgressChannel::Push(SyncProgress progress)
{
    {
        std::lock_guard lock(mutex_);
        if (closed_ || finished_) {
            return false;
        }
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            ++overflowed_;
        }
        queue_.push_back(std::move(progress));
    }
    not_empty_.notify_one();
    return true;
}

void ProgressChannel::Finish()
{
    {
        std::lock_guard lock(mutex_);
        finished_ = true;
    }
    not_empty_.notify_all();
}

std::optional<SyncProgress> ProgressChannel::Pop()
{
    std::unique_lock lock(mutex_);
    not_empty_.wait(lock, [this] {
        return !queue_.empty() || finished_ || closed_;
    });
    if (queue_.empty()) {
        return std::nullopt;
    }
    SyncProgress next = std::move(queue_.front());
    queue_.pop_front();
    return next;
}

std::optional<SyncProgress> ProgressChannel::PopFor(std::chrono::milliseconds timeout)
{
    std::unique_lock lock(mutex_);
    const bool ready = not_empty_.wait_for(lock, timeout, [this] {
        return !queue_.empty() || finished_ || closed_;
    });
    if (!ready || queue_.empty()) {
        return std::nullopt;
    }
    SyncProgress next = std::move(queue_.front());
    queue_.pop_front();
    return next;
}

void ProgressChannel::Close()
{
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
        queue_.clear();
    }
    not_empty_.notify_all();
}

bool ProgressChannel::IsFinished() const
{
    std::lock_guard lock(mutex_);
    return finished_;
}

std::uint64_t ProgressChannel::Overflowed() const
{
    std::lock_guard lock(mutex_);
    return overflowed_;
}

//------------------------------------------------------------------------------//
// SyncProgressStream
//------------------------------------------------------------------------------//

SyncProgressStream::SyncProgressStream(std::shared_ptr<ProgressChannel> channel)
    : channel_(std::move(channel))
{
}

SyncProgressStream::~SyncProgressStream() { Close(); }

SyncProgressStream::SyncProgressStream(SyncProgressStream&& other) noexcept
    : channel_(std::move(other.channel_))
{
}

SyncProgressStream& SyncProgressStream::operator=(SyncProgressStream&& other) noexcept
{
    if (this != &other) {
        Close();
        channel_ = std::move(other.channel_);
    }
    return *this;
}

std::optional<SyncProgress> SyncProgressStream::Next()
{
    if (!channel_) {
        return std::nullopt;
    }
    return channel_->Pop();
}

std::optional<SyncProgress> SyncProgressStream::NextFor(std::chrono::milliseconds timeout)
{
    if (!channel_) {
        return std::nullopt;
    }
    return channel_->PopFor(timeout);
}

void SyncProgressStream::Close()
{
    if (channel_) {
        channel_->Close();
        channel_.reset();
    }
}

}  // namespace TierFS::Sync
