#include "EventBus.hpp"
#include "../Log.hpp"
#include <algorithm>

namespace triplog::domain {

void EventBus::publish(const Event& event) {
    std::lock_guard<std::mutex> lock(queueMutex_);
    eventQueue_.push(event);
}

EventBus::SubscriptionId EventBus::subscribe(EventType eventType, Handler handler) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    SubscriptionId id = nextId_++;
    handlers_[eventType].push_back(Subscription{id, std::move(handler)});
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    for (auto& [type, subscriptions] : handlers_) {
        subscriptions.erase(std::remove_if(subscriptions.begin(), subscriptions.end(),
                                           [id](const Subscription& s) { return s.id == id; }),
                            subscriptions.end());
    }
}

size_t EventBus::handlerCount(EventType eventType) const {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    auto it = handlers_.find(eventType);
    return it == handlers_.end() ? 0 : it->second.size();
}

size_t EventBus::pendingCount() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return eventQueue_.size();
}

void EventBus::processEvents() {
    if (processing_) return; // Prevent recursive processing

    processing_ = true;

    while (true) {
        Event event;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (eventQueue_.empty()) break;

            event = std::move(eventQueue_.front());
            eventQueue_.pop();
        }

        std::vector<Handler> handlers;
        {
            std::lock_guard<std::mutex> lock(handlersMutex_);
            auto it = handlers_.find(event.eventType);
            if (it != handlers_.end()) {
                for (const auto& subscription : it->second) handlers.push_back(subscription.handler);
            }
        }

        for (const auto& handler : handlers) {
            try {
                handler(event);
            } catch (const std::exception& e) {
                Log::error("EventBus", "Handler for " + eventTypeToString(event.eventType) +
                           " failed: " + e.what());
            }
        }
    }

    processing_ = false;
}

} // namespace triplog::domain
