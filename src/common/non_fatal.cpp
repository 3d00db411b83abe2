#include "common/non_fatal.hpp"

namespace TierFS::Common
{

void NonFatalLedger::Record(std::string_view label, std::string message, std::error_code code)
{
    std::lock_guard lock(mutex_);
    ++total_;
    ++per_label_[std::string(label)];
    recent_.push_back(
        Failure{std::string(label), std::move(message), code, std::chrono::system_clock::now()}
    );
    if (recent_.size() > kMaxRecent) {
        recent_.pop_front();
    }
}

std::uint64_t NonFatalLedger::Count() const
{
    std::lock_guard lock(mutex_);
    return total_;
}

std::uint64_t NonFatalLedger::Count(std::string_view label) const
{
    std::lock_guard lock(mutex_);
    auto it = per_label_.find(std::string(label));
    return it == per_label_.end() ? 0 : it->second;
}

std::optional<NonFatalLedger::Failure> NonFatalLedger::Last() const
{
    std::lock_guard lock(mutex_);
    if (recent_.empty()) {
        return std::nullopt;
    }
    return recent_.back();
}

std::vector<NonFatalLedger::Failure> NonFatalLedger::Recent() const
{
    std::lock_guard lock(mutex_);
    return {recent_.begin(), recent_.end()};
}

void NonFatalLedger::Clear()
{
    std::lock_guard lock(mutex_);
    total_ = 0;
    per_label_.clear();
    recent_.clear();
}

}  // namespace TierFS::Common
