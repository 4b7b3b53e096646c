#pragma once

/**
 * @file events.hpp
 * @brief Event bus for license state notifications
 *
 * Lets the host react to a license expiring or being revoked mid-session
 * without polling.
 */

#include "licenseguard.hpp"

#include <algorithm>
#include <any>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace licenseguard {

/// Event data type - can hold any value
using EventData = std::any;

/**
 * @brief Event bus for engine-wide event handling
 *
 * Supports the following events (payload type in brackets):
 * - "activation:success" - License activated [ActivatedLicenseData]
 * - "activation:error" - Activation rejected [ErrorCode]
 * - "deactivation:success" - License released and erased [std::string license id]
 * - "deactivation:error" - Deactivation failed [ErrorCode]
 * - "validation:success" - A check reported VALID [LicenseValidationResult]
 * - "validation:failed" - A check reported anything else [LicenseValidationResult]
 * - "license:status-changed" - Status differs from the previous check [LicenseValidationResult]
 * - "license:blocked" - A check denied the host from proceeding [LicenseValidationResult]
 * - "guard:cycle" - Periodic check completed [LicenseValidationResult]
 * - "guard:stopped" - Periodic checks stopped [none]
 *
 * Handlers run on the emitting thread, outside the bus lock. Exceptions
 * thrown by a handler are logged and do not reach the emitter.
 */
class EventBus {
  public:
    EventBus() = default;
    ~EventBus() = default;

    // Non-copyable
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // Not movable (contains mutex)
    EventBus(EventBus&&) = delete;
    EventBus& operator=(EventBus&&) = delete;

    /**
     * @brief Subscribe to an event
     *
     * @param event Event name
     * @param handler Callback function
     * @return Subscription handle to unsubscribe; must not outlive the bus
     */
    Subscription on(const std::string& event, EventHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto id = next_id_++;
        handlers_[event].push_back({id, std::move(handler)});

        return Subscription([this, event, id]() { this->remove_handler(event, id); });
    }

    /**
     * @brief Emit an event to all subscribers
     *
     * @param event Event name
     * @param data Event data (optional)
     */
    void emit(const std::string& event, const EventData& data = {});

    /// Number of handlers subscribed to event
    [[nodiscard]] size_t handler_count(const std::string& event) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event);
        return it == handlers_.end() ? 0 : it->second.size();
    }

    /**
     * @brief Remove all handlers for all events
     */
    void clear_all() {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.clear();
    }

  private:
    struct HandlerEntry {
        uint64_t id;
        EventHandler handler;
    };

    void remove_handler(const std::string& event, uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event);
        if (it != handlers_.end()) {
            auto& vec = it->second;
            vec.erase(std::remove_if(vec.begin(), vec.end(),
                                     [id](const HandlerEntry& e) { return e.id == id; }),
                      vec.end());
        }
    }

    std::unordered_map<std::string, std::vector<HandlerEntry>> handlers_;
    mutable std::mutex mutex_;
    uint64_t next_id_ = 0;
};

// Event names as constants
namespace events {
constexpr const char* ACTIVATION_SUCCESS = "activation:success";
constexpr const char* ACTIVATION_ERROR = "activation:error";
constexpr const char* DEACTIVATION_SUCCESS = "deactivation:success";
constexpr const char* DEACTIVATION_ERROR = "deactivation:error";
constexpr const char* VALIDATION_SUCCESS = "validation:success";
constexpr const char* VALIDATION_FAILED = "validation:failed";
constexpr const char* STATUS_CHANGED = "license:status-changed";
constexpr const char* LICENSE_BLOCKED = "license:blocked";
constexpr const char* GUARD_CYCLE = "guard:cycle";
constexpr const char* GUARD_STOPPED = "guard:stopped";
}  // namespace events

}  // namespace licenseguard
