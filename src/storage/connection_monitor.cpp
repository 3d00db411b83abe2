#include "storage/connection_monitor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace TierFS::Storage
{

ConnectionMonitor::ConnectionMonitor(std::string name, ProbeFn probe, Settings settings)
    : name_(std::move(name)), probe_(std::move(probe)), settings_(settings)
{
}

ConnectionMonitor::Decision ConnectionMonitor::Decide_(SteadyClock::time_point now)
{
    if (in_flight_.valid() &&
        in_flight_.wait_for(std::chrono::seconds{0}) == std::future_status::ready) {
        // Result of a probe that already timed out; it no longer counts.
        in_flight_ = {};
    }
    if (status_.IsConnected() && last_success_ &&
        now - *last_success_ < settings_.recheck_interval) {
        return Decision::Trusted;
    }
    if (failures_ > 0 && now < next_attempt_) {
        return Decision::FailFast;
    }
    if (in_flight_.valid()) {
        if (now - in_flight_started_ >= settings_.probe_timeout) {
            // Still hung after its timeout and the backoff that followed.
            RecordTimeout_(now);
            return Decision::FailFast;
        }
        return Decision::Wait;
    }
    return Decision::Probe;
}

StorageResult<void> ConnectionMonitor::EnsureAvailable()
{
    Decision decision;
    std::shared_future<bool> pending;
    SteadyClock::time_point deadline;
    {
        std::lock_guard lock(mutex_);
        decision = Decide_(SteadyClock::now());
        pending  = in_flight_;
        deadline = in_flight_started_ + settings_.probe_timeout;
    }

    switch (decision) {
        case Decision::Trusted:
            return {};
        case Decision::FailFast:
            spdlog::debug("{}: inside reconnect backoff, failing fast", name_);
            return std::unexpected(make_error_code(StorageErrc::Unavailable));
        case Decision::Wait:
            if (pending.wait_until(deadline) != std::future_status::ready) {
                std::lock_guard lock(mutex_);
                RecordTimeout_(SteadyClock::now());
                return std::unexpected(make_error_code(StorageErrc::Unavailable));
            }
            if (GetStatus().IsConnected()) {
                return {};
            }
            return std::unexpected(make_error_code(StorageErrc::Unavailable));
        case Decision::Probe:
            break;
    }
    if (!RunProbe_()) {
        return std::unexpected(make_error_code(StorageErrc::Unavailable));
    }
    return {};
}

bool ConnectionMonitor::CheckNow()
{
    {
        std::lock_guard lock(mutex_);
        const auto decision = Decide_(SteadyClock::now());
        if (decision == Decision::Wait || decision == Decision::FailFast) {
            return status_.IsConnected();
        }
    }
    return RunProbe_();
}

bool ConnectionMonitor::RunProbe_()
{
    std::shared_future<bool> probe_future;
    {
        std::lock_guard lock(mutex_);
        if (in_flight_.valid()) {
            probe_future = in_flight_;
        } else {
            if (!status_.IsConnected()) {
                status_ = ConnectionStatus::Connecting();
            }
            ++probes_;
            in_flight_started_ = SteadyClock::now();
            in_flight_         = probe_pool_
                             .Submit([this]() {
                                 return probe_();
                             })
                             .share();
            probe_future = in_flight_;
        }
    }

    SteadyClock::time_point deadline;
    {
        std::lock_guard lock(mutex_);
        deadline = in_flight_started_ + settings_.probe_timeout;
    }
    if (probe_future.wait_until(deadline) != std::future_status::ready) {
        std::lock_guard lock(mutex_);
        RecordTimeout_(SteadyClock::now());
        return false;
    }

    bool reachable     = false;
    std::string reason = "share unreachable";
    try {
        reachable = probe_future.get();
    } catch (const std::exception& e) {
        reason = e.what();
    }

    std::lock_guard lock(mutex_);
    if (in_flight_.valid() &&
        in_flight_.wait_for(std::chrono::seconds{0}) == std::future_status::ready) {
        in_flight_ = {};
    }
    if (reachable) {
        RecordSuccess_(SteadyClock::now());
    } else {
        RecordFailure_(SteadyClock::now(), reason);
    }
    return reachable;
}

void ConnectionMonitor::RecordSuccess_(SteadyClock::time_point now)
{
    if (!status_.IsConnected()) {
        spdlog::info("{}: connected", name_);
    }
    status_       = ConnectionStatus::Connected();
    failures_     = 0;
    last_success_ = now;
    next_attempt_ = now;
}

void ConnectionMonitor::RecordFailure_(SteadyClock::time_point now, const std::string& reason)
{
    ++failures_;
    last_success_.reset();
    const auto exponent = std::min<std::uint32_t>(failures_ - 1, 16);
    const auto backoff  = settings_.backoff_base * (1LL << exponent);
    next_attempt_       = now + backoff;

    if (failures_ >= settings_.max_attempts) {
        status_ = ConnectionStatus::Error(reason);
        spdlog::error(
            "{}: unreachable after {} attempts ({}), next retry in {}ms", name_, failures_, reason,
            backoff.count()
        );
    } else {
        status_ = ConnectionStatus::Disconnected();
        spdlog::warn(
            "{}: probe failed ({}), attempt {}/{}, retry in {}ms", name_, reason, failures_,
            settings_.max_attempts, backoff.count()
        );
    }
}

void ConnectionMonitor::RecordTimeout_(SteadyClock::time_point now)
{
    // Concurrent waiters on the same probe must not each add a failure.
    if (failures_ > 0 && now < next_attempt_) {
        return;
    }
    RecordFailure_(
        now, "probe timed out after " + std::to_string(settings_.probe_timeout.count()) + "ms"
    );
}

void ConnectionMonitor::Reset()
{
    std::lock_guard lock(mutex_);
    failures_ = 0;
    last_success_.reset();
    next_attempt_ = SteadyClock::time_point{};
    status_       = ConnectionStatus::Disconnected();
}

ConnectionStatus ConnectionMonitor::GetStatus() const
{
    std::lock_guard lock(mutex_);
    return status_;
}

std::uint32_t ConnectionMonitor::ConsecutiveFailures() const
{
    std::lock_guard lock(mutex_);
    return failures_;
}

std::uint64_t ConnectionMonitor::ProbeCount() const
{
    std::lock_guard lock(mutex_);
    return probes_;
}

bool ConnectionMonitor::IsChecking() const
{
    std::lock_guard lock(mutex_);
    return in_flight_.valid() &&
           in_flight_.wait_for(std::chrono::seconds{0}) != std::future_status::ready;
}

}  // namespace TierFS::Storage
