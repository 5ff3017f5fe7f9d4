#pragma once

#include "../ports/IEventBus.hpp"
#include <unordered_map>
#include <vector>
#include <queue>
#include <mutex>

namespace triplog::domain {

// Queued dispatch: publish() may be called from any thread, handlers run on
// the thread that calls processEvents().
class EventBus : public ports::IEventBus {
public:
    EventBus() = default;
    ~EventBus() override = default;

    void publish(const Event& event) override;
    SubscriptionId subscribe(EventType eventType, Handler handler) override;
    void unsubscribe(SubscriptionId id) override;
    void processEvents() override;

    size_t pendingCount() const;
    size_t handlerCount(EventType eventType) const;

private:
    struct Subscription {
        SubscriptionId id;
        Handler handler;
    };

    std::unordered_map<EventType, std::vector<Subscription>> handlers_;
    SubscriptionId nextId_ = 1;
    std::queue<Event> eventQueue_;
    mutable std::mutex queueMutex_;
    mutable std::mutex handlersMutex_;
    bool processing_ = false;
};

} // namespace triplog::domain
