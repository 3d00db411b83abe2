#ifndef TIERFS_SRC_STORAGE_CONNECTION_MONITOR_HPP_
#define TIERFS_SRC_STORAGE_CONNECTION_MONITOR_HPP_

#include "app_constants.hpp"
#include "async_io_manager.hpp"
#include "storage/storage_error.hpp"
#include "storage/storage_types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>

namespace TierFS::Storage
{

/**
 * @brief Tracks reachability of a network-mounted backend.
 *
 * Probes run on a private single-thread pool and are bounded by a timeout, so
 * a stalled share never blocks the caller longer than the timeout. Consecutive
 * failures move the state to Error once the retry threshold is reached; probes
 * are then spaced by exponential backoff and calls inside the backoff window
 * fail fast with Unavailable. A probe that never returns keeps counting as a
 * failure each time its backoff window expires, so a hung share still reaches
 * Error.
 */
class ConnectionMonitor
{
    public:
    using SteadyClock = std::chrono::steady_clock;
    using ProbeFn     = std::function<bool()>;

    struct Settings {
        std::chrono::milliseconds probe_timeout = Constants::DEFAULT_PROBE_TIMEOUT;
        std::chrono::milliseconds backoff_base  = Constants::DEFAULT_BACKOFF_BASE;
        std::uint32_t max_attempts              = Constants::DEFAULT_MAX_RECONNECT_ATTEMPTS;
        /// How long a successful probe is trusted before the next call re-probes.
        std::chrono::milliseconds recheck_interval{30000};
    };

    ConnectionMonitor(std::string name, ProbeFn probe, Settings settings);
    ~ConnectionMonitor() = default;

    ConnectionMonitor(const ConnectionMonitor&)            = delete;
    ConnectionMonitor& operator=(const ConnectionMonitor&) = delete;
    ConnectionMonitor(ConnectionMonitor&&)                 = delete;
    ConnectionMonitor& operator=(ConnectionMonitor&&)      = delete;

    /// Succeeds when the backend is believed reachable, probing if needed.
    StorageResult<void> EnsureAvailable();

    /// Probes now unless inside the backoff window or a probe is already running.
    bool CheckNow();

    void Reset();

    ConnectionStatus GetStatus() const;
    std::uint32_t ConsecutiveFailures() const;
    std::uint64_t ProbeCount() const;
    bool IsChecking() const;

    private:
    enum class Decision { Trusted, Probe, Wait, FailFast };

    Decision Decide_(SteadyClock::time_point now);
    bool RunProbe_();
    void RecordSuccess_(SteadyClock::time_point now);
    void RecordFailure_(SteadyClock::time_point now, const std::string& reason);
    /// Counts a timed-out probe once per backoff window.
    void RecordTimeout_(SteadyClock::time_point now);

    const std::string name_;
    ProbeFn probe_;
    const Settings settings_;

    mutable std::mutex mutex_;
    ConnectionStatus status_ = ConnectionStatus::Disconnected();
    std::uint32_t failures_  = 0;
    std::uint64_t probes_    = 0;
    std::optional<SteadyClock::time_point> last_success_;
    SteadyClock::time_point next_attempt_{};
    std::shared_future<bool> in_flight_;
    SteadyClock::time_point in_flight_started_{};

    // Declared last so pending probes finish before the state above is destroyed.
    AsyncIoManager probe_pool_{1};
};

}  // namespace TierFS::Storage

#endif  // TIERFS_SRC_STORAGE_CONNECTION_MONITOR_HPP_
