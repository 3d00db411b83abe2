#include "events/domain_events.hpp"

#include "common/overloaded.hpp"

namespace TierFS::Events
{

const char *EvictionReasonToString(EvictionReason reason)
{
    switch (reason) {
        case EvictionReason::CacheFull:
            return "cache_full";
        case EvictionReason::Expired:
            return "expired";
        case EvictionReason::Manual:
            return "manual";
    }
    return "unknown";
}

const char *EventTypeName(const DomainEvent &event)
{
    return std::visit(
        Common::Overloaded{
            [](const HydrationStarted &) { return "file.hydration.started"; },
            [](const HydrationCompleted &) { return "file.hydration.completed"; },
            [](const HydrationFailed &) { return "file.hydration.failed"; },
            [](const StorageMounted &) { return "storage.mounted"; },
            [](const StorageUnmounted &) { return "storage.unmounted"; },
            [](const TranscodeStarted &) { return "transcode.started"; },
            [](const TranscodeProgress &) { return "transcode.progress"; },
            [](const TranscodeCompleted &) { return "transcode.completed"; },
            [](const CacheEviction &) { return "cache.eviction"; },
            [](const SyncProgressed &) { return "sync.progress"; },
            [](const SyncCompleted &) { return "sync.completed"; },
        },
        event
    );
}

TimePoint EventTimestamp(const DomainEvent &event)
{
    return std::visit(
        [](const auto &e) {
            return e.timestamp;
        },
        event
    );
}

}  // namespace TierFS::Events
