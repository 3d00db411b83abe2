#include "events/event_bus.hpp"

#include "storage/storage_error.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <string>
#include <vector>

namespace TierFS::Events
{

InProcessEventBus::InProcessEventBus(std::shared_ptr<Common::NonFatalLedger> ledger)
    : ledger_(ledger ? std::move(ledger) : std::make_shared<Common::NonFatalLedger>())
{
}

void InProcessEventBus::Publish(const DomainEvent& event)
{
    std::vector<std::shared_ptr<Handler>> targets;
    {
        std::lock_guard lock(mutex_);
        targets.reserve(handlers_.size());
        for (const auto& [id, handler] : handlers_) {
            targets.push_back(handler);
        }
    }

    const char* name = EventTypeName(event);
    spdlog::trace("Publishing {} to {} subscribers", name, targets.size());
    for (const auto& handler : targets) {
        try {
            (*handler)(event);
        } catch (const std::exception& e) {
            spdlog::warn("Subscriber failed handling {}: {}", name, e.what());
            ledger_->Record(
                std::string("event.") + name, e.what(),
                make_error_code(Storage::StorageErrc::Internal)
            );
        }
    }
}

IEventBus::SubscriptionId InProcessEventBus::Subscribe(Handler handler)
{
    std::lock_guard lock(mutex_);
    const auto id = next_id_++;
    handlers_.emplace(id, std::make_shared<Handler>(std::move(handler)));
    return id;
}

void InProcessEventBus::Unsubscribe(SubscriptionId id)
{
    std::lock_guard lock(mutex_);
    handlers_.erase(id);
}

size_t InProcessEventBus::SubscriberCount() const
{
    std::lock_guard lock(mutex_);
    return handlers_.size();
}

}  // namespace TierFS::Events
