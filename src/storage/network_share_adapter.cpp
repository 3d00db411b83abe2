#include "storage/network_share_adapter.hpp"

#include <dirent.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace TierFS::Storage
{

NetworkShareAdapter::NetworkShareAdapter(fs::path mount_point, NetworkShareSettings settings)
    : NetworkShareAdapter(mount_point, std::move(settings), [mount_point]() {
          return ProbeMountPoint(mount_point);
      })
{
}

NetworkShareAdapter::NetworkShareAdapter(
    fs::path mount_point, NetworkShareSettings settings, ConnectionMonitor::ProbeFn probe
)
    : PosixStorageAdapter(mount_point, false), settings_(std::move(settings))
{
    const std::string name = settings_.host.empty()
                                 ? mount_point.string()
                                 : std::string(NetworkProtocolToString(settings_.protocol)) +
                                       "://" + settings_.host;
    monitor_ = std::make_unique<ConnectionMonitor>(name, std::move(probe), settings_.monitor);
}

bool NetworkShareAdapter::ProbeMountPoint(const fs::path& mount_point)
{
    DIR* dir = ::opendir(mount_point.c_str());
    if (dir == nullptr) {
        return false;
    }
    ::closedir(dir);
    return true;
}

StorageResult<void> NetworkShareAdapter::Initialize()
{
    if (auto res = EnsureAvailable(); !res) {
        spdlog::warn("Network share {} not reachable at startup", GetRoot().string());
        return res;
    }
    return PosixStorageAdapter::Initialize();
}

StorageResult<void> NetworkShareAdapter::EnsureAvailable() { return monitor_->EnsureAvailable(); }

StorageResult<bool> NetworkShareAdapter::TestConnection() { return monitor_->CheckNow(); }

ConnectionStatus NetworkShareAdapter::GetConnectionStatus() const { return monitor_->GetStatus(); }

}  // namespace TierFS::Storage
