#include "storage/connection_monitor.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace TierFS;
using Storage::ConnectionMonitor;
using Storage::ConnectionState;
using Storage::StorageErrc;
using namespace std::chrono_literals;

namespace
{

ConnectionMonitor::Settings FastSettings(std::uint32_t max_attempts, std::chrono::milliseconds backoff)
{
    ConnectionMonitor::Settings settings;
    settings.probe_timeout    = 500ms;
    settings.backoff_base     = backoff;
    settings.max_attempts     = max_attempts;
    settings.recheck_interval = 60s;
    return settings;
}

}  // namespace

TEST(ConnectionMonitorTest, SuccessfulProbeIsTrustedUntilRecheck)
{
    std::atomic<int> calls{0};
    ConnectionMonitor monitor(
        "nas",
        [&calls]() {
            ++calls;
            return true;
        },
        FastSettings(3, 10ms)
    );
    EXPECT_EQ(monitor.GetStatus().state, ConnectionState::Disconnected);

    ASSERT_TRUE(monitor.EnsureAvailable().has_value());
    EXPECT_TRUE(monitor.GetStatus().IsConnected());
    ASSERT_TRUE(monitor.EnsureAvailable().has_value());
    EXPECT_EQ(monitor.ProbeCount(), 1u);
    EXPECT_EQ(calls.load(), 1);
}

TEST(ConnectionMonitorTest, FailsFastInsideBackoffWindow)
{
    ConnectionMonitor monitor("nas", []() { return false; }, FastSettings(3, 10s));

    auto first = monitor.EnsureAvailable();
    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error(), make_error_code(StorageErrc::Unavailable));
    EXPECT_EQ(monitor.ConsecutiveFailures(), 1u);
    EXPECT_EQ(monitor.GetStatus().state, ConnectionState::Disconnected);

    auto second = monitor.EnsureAvailable();
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error(), make_error_code(StorageErrc::Unavailable));
    EXPECT_EQ(monitor.ProbeCount(), 1u);
}

TEST(ConnectionMonitorTest, RepeatedFailuresReachErrorState)
{
    ConnectionMonitor monitor("nas", []() { return false; }, FastSettings(2, 1ms));

    EXPECT_FALSE(monitor.EnsureAvailable().has_value());
    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(monitor.EnsureAvailable().has_value());

    EXPECT_EQ(monitor.ConsecutiveFailures(), 2u);
    const auto status = monitor.GetStatus();
    EXPECT_EQ(status.state, ConnectionState::Error);
    EXPECT_EQ(status.reason, "share unreachable");

    monitor.Reset();
    EXPECT_EQ(monitor.ConsecutiveFailures(), 0u);
    EXPECT_EQ(monitor.GetStatus().state, ConnectionState::Disconnected);
}

TEST(ConnectionMonitorTest, RecoversAfterBackoff)
{
    std::atomic<bool> up{false};
    ConnectionMonitor monitor("nas", [&up]() { return up.load(); }, FastSettings(3, 1ms));

    EXPECT_FALSE(monitor.CheckNow());
    up = true;
    std::this_thread::sleep_for(20ms);
    EXPECT_TRUE(monitor.CheckNow());
    EXPECT_EQ(monitor.ConsecutiveFailures(), 0u);
    EXPECT_TRUE(monitor.GetStatus().IsConnected());
}

TEST(ConnectionMonitorTest, StalledProbeTimesOut)
{
    auto settings          = FastSettings(1, 10s);
    settings.probe_timeout = 20ms;
    ConnectionMonitor monitor(
        "nas",
        []() {
            std::this_thread::sleep_for(300ms);
            return true;
        },
        settings
    );

    const auto started = std::chrono::steady_clock::now();
    auto res           = monitor.EnsureAvailable();
    ASSERT_FALSE(res.has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - started, 250ms);

    const auto status = monitor.GetStatus();
    EXPECT_EQ(status.state, ConnectionState::Error);
    EXPECT_NE(status.reason.find("timed out"), std::string::npos);
}

TEST(ConnectionMonitorTest, ThrowingProbeCountsAsFailure)
{
    ConnectionMonitor monitor(
        "nas", []() -> bool { throw std::runtime_error("mount gone"); }, FastSettings(1, 10s)
    );

    EXPECT_FALSE(monitor.EnsureAvailable().has_value());
    const auto status = monitor.GetStatus();
    EXPECT_EQ(status.state, ConnectionState::Error);
    EXPECT_EQ(status.reason, "mount gone");
}

TEST(ConnectionMonitorTest, HungShareKeepsCountingUntilError)
{
    auto settings          = FastSettings(3, 1ms);
    settings.probe_timeout = 20ms;
    ConnectionMonitor monitor(
        "nas",
        []() {
            std::this_thread::sleep_for(800ms);
            return true;
        },
        settings
    );

    for (int call = 0; call < 20 && monitor.GetStatus().state != ConnectionState::Error; ++call) {
        const auto started = std::chrono::steady_clock::now();
        auto res           = monitor.EnsureAvailable();
        ASSERT_FALSE(res.has_value());
        EXPECT_EQ(res.error(), make_error_code(StorageErrc::Unavailable));
        EXPECT_LT(std::chrono::steady_clock::now() - started, 300ms);
        std::this_thread::sleep_for(10ms);
    }

    EXPECT_EQ(monitor.GetStatus().state, ConnectionState::Error);
    EXPECT_GE(monitor.ConsecutiveFailures(), 3u);
    EXPECT_EQ(monitor.ProbeCount(), 1u);

    auto fast = monitor.EnsureAvailable();
    ASSERT_FALSE(fast.has_value());
    EXPECT_EQ(fast.error(), make_error_code(StorageErrc::Unavailable));
}
