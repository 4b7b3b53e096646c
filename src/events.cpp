#include "licenseguard/events.hpp"

#include "logging.hpp"

#include <exception>

namespace licenseguard {

void EventBus::emit(const std::string& event, const EventData& data) {
    std::vector<EventHandler> handlers_copy;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event);
        if (it != handlers_.end()) {
            for (const auto& entry : it->second) {
                handlers_copy.push_back(entry.handler);
            }
        }
    }

    // Call handlers outside the lock so they may subscribe or cancel
    for (const auto& handler : handlers_copy) {
        try {
            handler(data);
        } catch (const std::exception& e) {
            detail::logger()->warn("handler for '{}' threw: {}", event, e.what());
        } catch (...) {
            detail::logger()->warn("handler for '{}' threw a non-standard exception", event);
        }
    }
}

}  // namespace licenseguard
