#pragma once

/**
 * @file events.hpp
 * @brief Diagnostic event sink for mqttident
 *
 * The library has no global logger. Callers that want to observe fact
 * probing and identifier composition pass an EventBus and subscribe to the
 * event names below.
 */

#include <algorithm>
#include <any>
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mqttident {

/// Event data type - can hold any value
using EventData = std::any;

/// Event handler callback type
using EventHandler = std::function<void(const EventData&)>;

/// Subscription handle returned by EventBus::on
class EventSubscription {
  public:
    EventSubscription() = default;
    explicit EventSubscription(std::function<void()> unsubscribe) : unsubscribe_(std::move(unsubscribe)) {}

    /// Cancel this subscription
    void cancel() {
        if (unsubscribe_) {
            unsubscribe_();
            unsubscribe_ = nullptr;
        }
    }

    [[nodiscard]] bool is_active() const { return unsubscribe_ != nullptr; }

  private:
    std::function<void()> unsubscribe_;
};

/**
 * @brief Payload of probe diagnostics
 *
 * `source` is the file path or command that was consulted, `detail` a short
 * human-readable note ("missing", "timeout", "no public address signal").
 */
struct ProbeEvent {
    std::string platform;
    std::string source;
    std::string detail;
};

/**
 * @brief Event bus used as the diagnostic sink
 *
 * Events emitted by the library:
 * - "probe:start" - fact probing started (std::string platform name)
 * - "probe:source-absent" - a probe source yielded no data (ProbeEvent)
 * - "probe:complete" - fact probing finished (DeviceFacts)
 * - "fingerprint:resolved" - fingerprint chosen (std::string kind: sn/mac/bluetooth/host)
 * - "client-id:built" - identifier composed (std::string)
 * - "client-id:error" - identifier composition rejected its input (std::string)
 */
class EventBus {
  public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;
    EventBus(EventBus&&) = delete;
    EventBus& operator=(EventBus&&) = delete;

    /**
     * @brief Subscribe to an event
     *
     * @param event Event name
     * @param handler Callback function
     * @return Subscription handle to unsubscribe
     */
    EventSubscription on(const std::string& event, EventHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto id = next_id_++;
        handlers_[event].push_back({id, std::move(handler)});

        return EventSubscription([this, event, id]() { this->remove_handler(event, id); });
    }

    /**
     * @brief Emit an event to all subscribers
     *
     * Handlers run outside the lock. A handler that throws a std::exception
     * is counted and skipped; anything else it throws is not caught and
     * reaches the caller of emit().
     */
    void emit(const std::string& event, const EventData& data = {}) {
        std::vector<EventHandler> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(event);
            if (it == handlers_.end()) {
                return;
            }
            snapshot.reserve(it->second.size());
            for (const auto& entry : it->second) {
                snapshot.push_back(entry.handler);
            }
        }

        for (const auto& handler : snapshot) {
            try {
                handler(data);
            } catch (const std::exception&) {
                ++failed_handlers_;
            }
        }
    }

    /// Number of handler invocations that threw
    [[nodiscard]] uint64_t failed_handler_count() const noexcept { return failed_handlers_; }

    /// Remove all handlers for an event
    void clear(const std::string& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.erase(event);
    }

    /// Remove all handlers for all events
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
    std::mutex mutex_;
    uint64_t next_id_ = 0;
    std::atomic<uint64_t> failed_handlers_{0};
};

/// Emit on an optional sink
inline void emit_event(EventBus* bus, const std::string& event, const EventData& data = {}) {
    if (bus != nullptr) {
        bus->emit(event, data);
    }
}

// Event names as constants
namespace events {
constexpr const char* PROBE_START = "probe:start";
constexpr const char* PROBE_SOURCE_ABSENT = "probe:source-absent";
constexpr const char* PROBE_COMPLETE = "probe:complete";
constexpr const char* FINGERPRINT_RESOLVED = "fingerprint:resolved";
constexpr const char* CLIENT_ID_BUILT = "client-id:built";
constexpr const char* CLIENT_ID_ERROR = "client-id:error";
}  // namespace events

}  // namespace mqttident
