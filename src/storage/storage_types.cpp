#include "storage/storage_types.hpp"

#include "common/ids.hpp"
#include "storage/virtual_path.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace TierFS::Storage
{

namespace
{

constexpr std::array<std::string_view, 16> kTranscodableExtensions = {
    ".mp4", ".mov", ".mkv", ".avi", ".webm", ".m4v", ".mxf", ".wmv",
    ".mp3", ".wav", ".flac", ".aac", ".ogg", ".m4a", ".braw", ".r3d",
};

}  // namespace

const char *StorageTierToString(StorageTier tier)
{
    switch (tier) {
        case StorageTier::Hot:
            return "hot";
        case StorageTier::Warm:
            return "warm";
        case StorageTier::Cold:
            return "cold";
        case StorageTier::Nearline:
            return "nearline";
        case StorageTier::Archive:
            return "archive";
    }
    return "unknown";
}

std::optional<StorageTier> StringToStorageTier(const std::string &tier_str)
{
    if (tier_str == "hot") {
        return StorageTier::Hot;
    }
    if (tier_str == "warm") {
        return StorageTier::Warm;
    }
    if (tier_str == "cold") {
        return StorageTier::Cold;
    }
    if (tier_str == "nearline") {
        return StorageTier::Nearline;
    }
    if (tier_str == "archive") {
        return StorageTier::Archive;
    }
    return std::nullopt;
}

void VirtualFile::SetRating(int value) { rating = static_cast<std::uint8_t>(std::clamp(value, 0, 5)); }

std::optional<bool> IsTranscodable(const std::string &name, bool is_directory)
{
    if (is_directory) {
        return std::nullopt;
    }
    const auto dot = name.rfind('.');
    if (dot == std::string::npos) {
        return false;
    }
    std::string ext = name.substr(dot);
    std::ranges::transform(ext, ext.begin(), [](unsigned char c) {
        return std::tolower(c);
    });
    return std::ranges::find(kTranscodableExtensions, ext) != kTranscodableExtensions.end();
}

VirtualFile MakeVirtualFile(const std::string &virtual_path, const FileStat &stat)
{
    VirtualFile file;
    file.id            = Common::NewUuid();
    file.path          = NormalizeVirtualPath(virtual_path);
    file.name          = VirtualFileName(file.path);
    file.size          = stat.is_directory ? 0 : stat.size;
    file.is_directory  = stat.is_directory;
    file.is_symlink    = stat.is_symlink;
    file.is_hidden     = !file.name.empty() && file.name.front() == '.';
    file.last_modified = stat.modified;
    file.last_accessed = stat.accessed;
    file.mode          = stat.mode;
    file.uid           = stat.uid;
    file.gid           = stat.gid;
    file.transcodable  = IsTranscodable(file.name, file.is_directory);
    return file;
}

const char *StorageSourceTypeToString(StorageSourceType type)
{
    switch (type) {
        case StorageSourceType::Local:
            return "local";
        case StorageSourceType::NetworkShare:
            return "network_share";
        case StorageSourceType::ObjectStorage:
            return "object";
        case StorageSourceType::HybridStorage:
            return "hybrid";
        case StorageSourceType::Custom:
            return "custom";
    }
    return "unknown";
}

std::optional<StorageSourceType> StringToStorageSourceType(const std::string &type_str)
{
    if (type_str == "local") {
        return StorageSourceType::Local;
    }
    if (type_str == "network_share" || type_str == "nas") {
        return StorageSourceType::NetworkShare;
    }
    if (type_str == "object" || type_str == "s3") {
        return StorageSourceType::ObjectStorage;
    }
    if (type_str == "hybrid" || type_str == "fsxn") {
        return StorageSourceType::HybridStorage;
    }
    if (type_str == "custom") {
        return StorageSourceType::Custom;
    }
    return std::nullopt;
}

StorageCategory CategoryForType(StorageSourceType type)
{
    switch (type) {
        case StorageSourceType::Local:
            return StorageCategory::Local;
        case StorageSourceType::NetworkShare:
            return StorageCategory::Network;
        case StorageSourceType::ObjectStorage:
        case StorageSourceType::Custom:
            return StorageCategory::Cloud;
        case StorageSourceType::HybridStorage:
            return StorageCategory::Hybrid;
    }
    return StorageCategory::Cloud;
}

const char *StorageCategoryToString(StorageCategory category)
{
    switch (category) {
        case StorageCategory::Local:
            return "local";
        case StorageCategory::Network:
            return "network";
        case StorageCategory::Cloud:
            return "cloud";
        case StorageCategory::Hybrid:
            return "hybrid";
    }
    return "unknown";
}

const char *NetworkProtocolToString(NetworkProtocol protocol)
{
    switch (protocol) {
        case NetworkProtocol::Nfs:
            return "nfs";
        case NetworkProtocol::Smb:
            return "smb";
        case NetworkProtocol::Afp:
            return "afp";
    }
    return "unknown";
}

std::optional<NetworkProtocol> StringToNetworkProtocol(const std::string &protocol_str)
{
    if (protocol_str == "nfs") {
        return NetworkProtocol::Nfs;
    }
    if (protocol_str == "smb" || protocol_str == "cifs") {
        return NetworkProtocol::Smb;
    }
    if (protocol_str == "afp") {
        return NetworkProtocol::Afp;
    }
    return std::nullopt;
}

std::string ConnectionStatusToString(const ConnectionStatus &status)
{
    switch (status.state) {
        case ConnectionState::Connected:
            return "connected";
        case ConnectionState::Disconnected:
            return "disconnected";
        case ConnectionState::Connecting:
            return "connecting";
        case ConnectionState::Error:
            return "error: " + status.reason;
    }
    return "unknown";
}

}  // namespace TierFS::Storage
