#pragma once
#include "event.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace wacast {

using EventHandler = std::function<void(const Event&)>;

// Synchronous publish/subscribe used to push campaign progress out of the
// dispatcher thread. Handlers run on the publishing thread, in registration
// order, with no bus lock held. A handler that throws is logged and skipped;
// it never reaches the publisher.
class EventBus {
public:
    // Subscribe to events with a given tag. Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    void publish(const Event& event) const;

    void clear();

    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        std::string tag;
        std::shared_ptr<const EventHandler> handler;
    };

    mutable std::mutex mutex_;
    std::vector<Subscription> subs_;
    uint64_t next_id_ = 1;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

} // namespace wacast
