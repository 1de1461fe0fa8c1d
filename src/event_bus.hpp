// =============================================================================
// AutoScene - Event Bus
// =============================================================================
// Thread-safe, type-erased publish/subscribe event system.
// Decouples the scenario processor from observers (runner output, logs, UI).
// Usage:
//   auto sub = autoscene::bus().subscribe<EventMatchEvent>([](const auto& e) { ... });
//   autoscene::bus().publish(EventMatchEvent{...});
// =============================================================================
#pragma once
#include <functional>
#include <mutex>
#include <utility>
#include <vector>
#include <unordered_map>
#include <typeindex>
#include <memory>
#include <string>
#include <cstdint>
#include <algorithm>
#include <type_traits>
#include "autoscene_log.hpp"

namespace autoscene {

// =============================================================================
// Event Types
// =============================================================================

struct BusEvent {
    virtual ~BusEvent() = default;
};

// Frame pass lifecycle
struct FrameProcessingEvent : BusEvent {
    enum class Phase { STARTED, COMPLETED };
    Phase phase = Phase::STARTED;
    uint64_t frame_index = 0;
};

// One event evaluated (matched or not)
struct EventMatchEvent : BusEvent {
    int event_id = -1;
    std::string event_name;
    bool matched = false;
    std::string condition_name;   // deciding condition (empty if none)
    int x = 0, y = 0;
    double confidence = 0.0;
    uint64_t frame_index = 0;
};

// One condition checked
struct ConditionCheckedEvent : BusEvent {
    std::string condition_name;
    bool detected = false;
    double confidence = 0.0;
};

// Resolved action handed to the input layer
struct ActionExecutedEvent : BusEvent {
    std::string action_type;
    std::string action_name;
    int x = 0, y = 0, x2 = 0, y2 = 0;
    int duration_ms = 0;
};

// Scenario termination request
struct ScenarioStopEvent : BusEvent {
    std::string scenario_name;
    std::string reason;   // "end_condition", "all_disabled", "cancelled", "frames_exhausted", "no_loadable_frames"
};

// =============================================================================
// SubscriptionHandle - RAII unsubscribe
// =============================================================================

class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    explicit SubscriptionHandle(std::function<void()> unsub) : unsub_(std::move(unsub)) {}
    ~SubscriptionHandle() { if (unsub_) unsub_(); }

    SubscriptionHandle(SubscriptionHandle&& o) noexcept : unsub_(std::move(o.unsub_)) { o.unsub_ = nullptr; }
    SubscriptionHandle& operator=(SubscriptionHandle&& o) noexcept {
        if (unsub_) unsub_();
        unsub_ = std::move(o.unsub_);
        o.unsub_ = nullptr;
        return *this;
    }
    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    void release() { unsub_ = nullptr; } // detach: subscription lives forever

private:
    std::function<void()> unsub_;
};

// =============================================================================
// EventBus - Thread-safe publish/subscribe
// =============================================================================

class EventBus {
public:
    using HandlerId = uint64_t;

    template<typename T>
    SubscriptionHandle subscribe(std::function<void(const T&)> handler) {
        static_assert(std::is_base_of_v<BusEvent, T>, "T must derive from BusEvent");

        std::lock_guard<std::mutex> lock(mutex_);
        auto id = next_id_++;
        auto key = std::type_index(typeid(T));

        handlers_[key].push_back({id, [handler](const BusEvent& e) {
            handler(static_cast<const T&>(e));
        }});

        ALOG_TRACE("eventbus", "Subscribed handler %llu for %s",
                   (unsigned long long)id, typeid(T).name());

        return SubscriptionHandle([this, key, id]() {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(key);
            if (it != handlers_.end()) {
                auto& vec = it->second;
                vec.erase(std::remove_if(vec.begin(), vec.end(),
                    [id](const HandlerEntry& h) { return h.id == id; }), vec.end());
            }
        });
    }

    // Handler exceptions are logged and do not reach the publisher.
    template<typename T>
    void publish(const T& event) {
        static_assert(std::is_base_of_v<BusEvent, T>, "T must derive from BusEvent");

        std::vector<HandlerEntry> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(T)));
            if (it != handlers_.end()) {
                snapshot = it->second;
            }
        }

        for (auto& entry : snapshot) {
            try {
                entry.fn(event);
            } catch (const std::exception& e) {
                ALOG_ERROR("eventbus", "Handler %llu threw: %s",
                           (unsigned long long)entry.id, e.what());
            }
        }
    }

    template<typename T>
    bool has_subscribers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(T)));
        return it != handlers_.end() && !it->second.empty();
    }

private:
    struct HandlerEntry {
        HandlerId id;
        std::function<void(const BusEvent&)> fn;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, std::vector<HandlerEntry>> handlers_;
    HandlerId next_id_ = 1;
};

// Global event bus singleton
inline EventBus& bus() {
    static EventBus instance;
    return instance;
}

} // namespace autoscene
