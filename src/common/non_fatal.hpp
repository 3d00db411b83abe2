#ifndef TIERFS_SRC_COMMON_NON_FATAL_HPP_
#define TIERFS_SRC_COMMON_NON_FATAL_HPP_

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <deque>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace TierFS::Common
{

/**
 * @brief Record of failures that were observed and deliberately ignored.
 *
 * Best-effort steps (cache population during hydration, cache cleanup after a
 * delete, event delivery) report here instead of discarding their result, so
 * the failure stays visible to logs, stats and tests.
 */
class NonFatalLedger
{
    public:
    struct Failure {
        std::string label;
        std::string message;
        std::error_code code;
        std::chrono::system_clock::time_point at;
    };

    NonFatalLedger()  = default;
    ~NonFatalLedger() = default;

    NonFatalLedger(const NonFatalLedger&)            = delete;
    NonFatalLedger& operator=(const NonFatalLedger&) = delete;
    NonFatalLedger(NonFatalLedger&&)                 = delete;
    NonFatalLedger& operator=(NonFatalLedger&&)      = delete;

    void Record(std::string_view label, std::string message, std::error_code code = {});

    std::uint64_t Count() const;
    std::uint64_t Count(std::string_view label) const;
    std::optional<Failure> Last() const;
    std::vector<Failure> Recent() const;
    void Clear();

    private:
    static constexpr size_t kMaxRecent = 64;

    mutable std::mutex mutex_;
    std::uint64_t total_ = 0;
    std::unordered_map<std::string, std::uint64_t> per_label_;
    std::deque<Failure> recent_;
};

/// Logs and records a failed best-effort step. Returns whether it succeeded.
template <typename T>
bool Attempt(
    NonFatalLedger& ledger, std::string_view label, const std::expected<T, std::error_code>& result
)
{
    if (result.has_value()) {
        return true;
    }
    spdlog::warn("Non-fatal failure in {}: {}", label, result.error().message());
    ledger.Record(label, result.error().message(), result.error());
    return false;
}

}  // namespace TierFS::Common

#endif  // TIERFS_SRC_COMMON_NON_FATAL_HPP_
