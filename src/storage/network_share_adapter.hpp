#ifndef TIERFS_SRC_STORAGE_NETWORK_SHARE_ADAPTER_HPP_
#define TIERFS_SRC_STORAGE_NETWORK_SHARE_ADAPTER_HPP_

#include "storage/connection_monitor.hpp"
#include "storage/posix_storage_adapter.hpp"

#include <memory>
#include <optional>
#include <string>

namespace TierFS::Storage
{

struct NetworkShareSettings {
    NetworkProtocol protocol = NetworkProtocol::Smb;
    std::string host;
    std::optional<std::string> share_name;
    ConnectionMonitor::Settings monitor;
};

/**
 * @brief NAS share (NFS, SMB or AFP) mounted at a local path.
 *
 * Every call is gated by the connection monitor, so an unreachable share
 * surfaces as Unavailable within the probe timeout instead of hanging.
 */
class NetworkShareAdapter : public PosixStorageAdapter
{
    public:
    NetworkShareAdapter(fs::path mount_point, NetworkShareSettings settings);
    /// Variant with an injected reachability probe.
    NetworkShareAdapter(
        fs::path mount_point, NetworkShareSettings settings, ConnectionMonitor::ProbeFn probe
    );
    ~NetworkShareAdapter() override = default;

    StorageSourceType GetKind() const override { return StorageSourceType::NetworkShare; }
    TierStrategy GetTierStrategy() const override { return NetworkShareTier{}; }

    StorageResult<void> Initialize() override;
    StorageResult<bool> TestConnection() override;
    ConnectionStatus GetConnectionStatus() const override;

    const NetworkShareSettings& GetSettings() const { return settings_; }
    ConnectionMonitor& GetMonitor() { return *monitor_; }

    /// Default probe: the mount point is a listable directory.
    static bool ProbeMountPoint(const fs::path& mount_point);

    protected:
    StorageResult<void> EnsureAvailable() override;

    private:
    NetworkShareSettings settings_;
    std::unique_ptr<ConnectionMonitor> monitor_;
};

}  // namespace TierFS::Storage

#endif  // TIERFS_SRC_STORAGE_NETWORK_SHARE_ADAPTER_HPP_
