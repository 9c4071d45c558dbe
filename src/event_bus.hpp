#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <mutex>
#include <cstdint>

namespace docrelay {

using EventHandler = std::function<void(const Event&)>;

// Synchronous publish/subscribe hub between the stream consumer and whatever
// renders its state (CLI progress line, tests).
class EventBus {
public:
    // Subscribe to events with a given tag. Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Publish an event synchronously to its tag's handlers, in subscription
    // order. Handlers run without the lock held and may (un)subscribe.
    void publish(const Event& event);

    // Number of subscriptions for a given tag (0 if none).
    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        std::string tag;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::vector<Subscription> subscriptions_;
    uint64_t next_id_ = 1;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

} // namespace docrelay
