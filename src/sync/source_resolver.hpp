#ifndef TIERFS_SRC_SYNC_SOURCE_RESOLVER_HPP_
#define TIERFS_SRC_SYNC_SOURCE_RESOLVER_HPP_

#include "hydration/hydration_orchestrator.hpp"
#include "sync/sync_types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace TierFS::Sync
{

/// Lookup of mounted sources by id, implemented by the registry.
class ISourceResolver
{
    public:
    virtual ~ISourceResolver() = default;

    /// nullptr when no source has this id.
    virtual std::shared_ptr<Hydration::HydrationOrchestrator> ResolveSource(
        const std::string &source_id
    ) const = 0;

    virtual std::vector<SyncTarget> DescribeTargets() const = 0;
};

}  // namespace TierFS::Sync

#endif  // TIERFS_SRC_SYNC_SOURCE_RESOLVER_HPP_
