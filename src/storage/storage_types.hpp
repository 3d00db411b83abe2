#ifndef TIERFS_SRC_STORAGE_STORAGE_TYPES_HPP_
#define TIERFS_SRC_STORAGE_STORAGE_TYPES_HPP_

#include <sys/types.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace TierFS::Storage
{

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Bytes     = std::vector<std::byte>;

//------------------------------------------------------------------------------//
// Storage Tiers
//------------------------------------------------------------------------------//

enum class StorageTier : std::uint8_t { Hot, Warm, Cold, Nearline, Archive };

/// Latency/cost rank. Cold and Nearline share a rank.
constexpr int TierRank(StorageTier tier)
{
    switch (tier) {
        case StorageTier::Hot:
            return 0;
        case StorageTier::Warm:
            return 1;
        case StorageTier::Cold:
        case StorageTier::Nearline:
            return 2;
        case StorageTier::Archive:
            return 3;
    }
    return 2;
}

constexpr bool IsColdTier(StorageTier tier) { return TierRank(tier) >= 2; }

const char *StorageTierToString(StorageTier tier);
std::optional<StorageTier> StringToStorageTier(const std::string &tier_str);

struct TierStatus {
    StorageTier current_tier = StorageTier::Cold;
    bool is_cached           = false;
    bool can_warm            = true;
    std::optional<std::chrono::seconds> retrieval_time_estimate;

    static TierStatus Hot()
    {
        return TierStatus{StorageTier::Hot, true, false, std::chrono::seconds{0}};
    }

    bool operator==(const TierStatus &) const = default;
};

//------------------------------------------------------------------------------//
// File Descriptions
//------------------------------------------------------------------------------//

struct FileStat {
    std::uint64_t size = 0;
    bool is_directory  = false;
    bool is_symlink    = false;
    mode_t mode        = 0644;
    uid_t uid          = 0;
    gid_t gid          = 0;
    TimePoint accessed{};
    TimePoint modified{};
    TimePoint created{};
};

struct VirtualFile {
    std::string id;
    std::string name;
    std::string path;  ///< forward-slash, source-relative, leading '/'
    std::uint64_t size = 0;
    bool is_directory  = false;
    bool is_hidden     = false;
    bool is_symlink    = false;
    TimePoint last_modified{};
    TimePoint last_accessed{};
    mode_t mode = 0644;
    uid_t uid   = 0;
    gid_t gid   = 0;
    TierStatus tier_status;
    std::optional<bool> transcodable;

    // User metadata, filled from the metadata provider
    std::vector<std::string> tags;
    bool is_favorite = false;
    std::optional<std::string> color_label;
    std::uint8_t rating = 0;
    std::optional<std::string> comment;

    void SetRating(int value);
};

/// Builds a fresh VirtualFile from backend metadata with a new id.
VirtualFile MakeVirtualFile(const std::string &virtual_path, const FileStat &stat);

/// Guesses whether a media pipeline can transcode the file by extension.
std::optional<bool> IsTranscodable(const std::string &name, bool is_directory);

//------------------------------------------------------------------------------//
// File Operation Options
//------------------------------------------------------------------------------//

struct CopyOptions {
    bool overwrite           = false;
    bool preserve_attributes = false;
    bool recursive           = false;
    bool follow_symlinks     = false;
};

struct MoveOptions {
    bool overwrite = false;
};

//------------------------------------------------------------------------------//
// Storage Sources
//------------------------------------------------------------------------------//

enum class StorageSourceType : std::uint8_t {
    Local,
    NetworkShare,
    ObjectStorage,
    HybridStorage,
    Custom,
};

enum class StorageCategory : std::uint8_t { Local, Network, Cloud, Hybrid };

enum class NetworkProtocol : std::uint8_t { Nfs, Smb, Afp };

const char *StorageSourceTypeToString(StorageSourceType type);
std::optional<StorageSourceType> StringToStorageSourceType(const std::string &type_str);
StorageCategory CategoryForType(StorageSourceType type);
const char *StorageCategoryToString(StorageCategory category);
const char *NetworkProtocolToString(NetworkProtocol protocol);
std::optional<NetworkProtocol> StringToNetworkProtocol(const std::string &protocol_str);

enum class ConnectionState : std::uint8_t { Connected, Disconnected, Connecting, Error };

struct ConnectionStatus {
    ConnectionState state = ConnectionState::Disconnected;
    std::string reason;  ///< set when state == Error

    static ConnectionStatus Connected() { return {ConnectionState::Connected, {}}; }
    static ConnectionStatus Disconnected() { return {ConnectionState::Disconnected, {}}; }
    static ConnectionStatus Connecting() { return {ConnectionState::Connecting, {}}; }
    static ConnectionStatus Error(std::string why)
    {
        return {ConnectionState::Error, std::move(why)};
    }

    bool IsConnected() const { return state == ConnectionState::Connected; }
    bool operator==(const ConnectionStatus &) const = default;
};

std::string ConnectionStatusToString(const ConnectionStatus &status);

}  // namespace TierFS::Storage

#endif  // TIERFS_SRC_STORAGE_STORAGE_TYPES_HPP_
