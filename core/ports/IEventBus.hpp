#pragma once

#include "../Event.hpp"
#include <cstddef>
#include <functional>

namespace triplog::ports {

class IEventBus {
public:
    virtual ~IEventBus() = default;

    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = size_t;

    virtual void publish(const Event& event) = 0;
    // Returns a token that removes only this handler.
    virtual SubscriptionId subscribe(EventType eventType, Handler handler) = 0;
    virtual void unsubscribe(SubscriptionId id) = 0;
    virtual void processEvents() = 0;
};

} // namespace triplog::ports
