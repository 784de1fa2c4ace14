#include "event_bus.hpp"
#include <algorithm>
#include <cstring>
#include <iostream>

namespace wacast {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    subs_.push_back(Subscription{
        id, tag, std::make_shared<const EventHandler>(std::move(handler))});
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(subs_.begin(), subs_.end(),
                           [id](const Subscription& s) { return s.id == id; });
    if (it == subs_.end()) return false;
    subs_.erase(it);
    return true;
}

void EventBus::publish(const Event& event) const {
    std::vector<std::shared_ptr<const EventHandler>> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& sub : subs_) {
            if (std::strcmp(sub.tag.c_str(), event.type_tag) == 0) {
                to_call.push_back(sub.handler);
            }
        }
    }
    for (const auto& handler : to_call) {
        try {
            (*handler)(event);
        } catch (const std::exception& e) {
            std::cerr << "[events] " << event.type_tag << " handler failed: "
                      << e.what() << "\n";
        }
    }
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    subs_.clear();
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(
        subs_.begin(), subs_.end(),
        [&tag](const Subscription& s) { return s.tag == tag; }));
}

} // namespace wacast
