#ifndef TIERFS_SRC_STORAGE_STORAGE_FACTORY_HPP_
#define TIERFS_SRC_STORAGE_STORAGE_FACTORY_HPP_

#include "config/config_types.hpp"
#include "storage/filesystem_object_client.hpp"
#include "storage/hybrid_storage_adapter.hpp"
#include "storage/i_storage_adapter.hpp"
#include "storage/local_storage_adapter.hpp"
#include "storage/network_share_adapter.hpp"
#include "storage/object_storage_adapter.hpp"

#include <memory>

namespace TierFS::Storage
{

class StorageFactory
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    StorageFactory()                                 = delete;
    StorageFactory(const StorageFactory&)            = delete;
    StorageFactory& operator=(const StorageFactory&) = delete;
    StorageFactory(StorageFactory&&)                 = delete;
    StorageFactory& operator=(StorageFactory&&)      = delete;
    ~StorageFactory()                                = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    /// Builds an uninitialized adapter for the definition.
    static StorageResult<std::shared_ptr<IStorageAdapter>> Create(
        const Config::SourceDefinition& definition, const Config::NetworkSettings& network
    )
    {
        switch (definition.type) {
            case StorageSourceType::Local:
                return std::make_shared<LocalStorageAdapter>(definition.path);
            case StorageSourceType::NetworkShare: {
                NetworkShareSettings settings;
                settings.protocol               = definition.protocol.value_or(NetworkProtocol::Smb);
                settings.host                   = definition.host;
                settings.share_name             = definition.share_name;
                settings.monitor.probe_timeout  = network.probe_timeout;
                settings.monitor.backoff_base   = network.backoff_base;
                settings.monitor.max_attempts   = network.max_reconnect_attempts;
                return std::make_shared<NetworkShareAdapter>(definition.path, std::move(settings));
            }
            case StorageSourceType::ObjectStorage:
                return std::make_shared<ObjectStorageAdapter>(
                    std::make_shared<FilesystemObjectClient>(definition.path), definition.bucket,
                    definition.prefix, definition.storage_class
                );
            case StorageSourceType::HybridStorage:
                return std::make_shared<HybridStorageAdapter>(definition.path);
            default:
                return std::unexpected(make_error_code(StorageErrc::Unsupported));
        }
    }
};

}  // namespace TierFS::Storage

#endif  // TIERFS_SRC_STORAGE_STORAGE_FACTORY_HPP_
