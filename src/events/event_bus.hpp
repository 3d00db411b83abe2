#ifndef TIERFS_SRC_EVENTS_EVENT_BUS_HPP_
#define TIERFS_SRC_EVENTS_EVENT_BUS_HPP_

#include "common/non_fatal.hpp"
#include "events/domain_events.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace TierFS::Events
{

class IEventBus
{
    public:
    using Handler        = std::function<void(const DomainEvent&)>;
    using SubscriptionId = std::uint64_t;

    virtual ~IEventBus() = default;

    /// Delivers to every subscriber. Subscriber failures never reach the publisher.
    virtual void Publish(const DomainEvent& event)    = 0;
    virtual SubscriptionId Subscribe(Handler handler) = 0;
    virtual void Unsubscribe(SubscriptionId id)       = 0;
};

/**
 * @brief Synchronous, in-process event bus.
 *
 * Handlers run on the publishing thread, outside the bus lock, so a handler may
 * subscribe or unsubscribe. A handler that throws is logged and recorded in the
 * non-fatal ledger under "event.<name>".
 */
class InProcessEventBus : public IEventBus
{
    public:
    explicit InProcessEventBus(std::shared_ptr<Common::NonFatalLedger> ledger = nullptr);
    ~InProcessEventBus() override = default;

    InProcessEventBus(const InProcessEventBus&)            = delete;
    InProcessEventBus& operator=(const InProcessEventBus&) = delete;

    void Publish(const DomainEvent& event) override;
    SubscriptionId Subscribe(Handler handler) override;
    void Unsubscribe(SubscriptionId id) override;

    size_t SubscriberCount() const;
    const Common::NonFatalLedger& Failures() const { return *ledger_; }

    private:
    std::shared_ptr<Common::NonFatalLedger> ledger_;
    mutable std::mutex mutex_;
    std::map<SubscriptionId, std::shared_ptr<Handler>> handlers_;
    SubscriptionId next_id_ = 1;
};

}  // namespace TierFS::Events

#endif  // TIERFS_SRC_EVENTS_EVENT_BUS_HPP_
