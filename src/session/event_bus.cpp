#include "meshload/session/event_bus.h"
#include "meshload/base/logger.h"
#include <vector>

namespace meshload {

EventBus::SubscriptionId EventBus::subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    handlers_.emplace(id, std::move(handler));
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(id);
}

void EventBus::publish(const SessionEvent& event) {
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers.reserve(handlers_.size());
        for (const auto& [id, handler] : handlers_) {
            handlers.push_back(handler);
        }
    }

    for (const auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            Logger::instance().error("Event handler threw: " + std::string(e.what()));
        }
    }
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}

} // namespace meshload
