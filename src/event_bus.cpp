#include "event_bus.hpp"

namespace chorus {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    by_tag_[tag].push_back(id);
    subscriptions_.emplace(id, Subscription{id, tag, std::move(handler)});
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscriptions_.find(id);
    if (it == subscriptions_.end()) return false;

    auto tag_it = by_tag_.find(it->second.tag);
    if (tag_it != by_tag_.end()) {
        auto& ids = tag_it->second;
        for (auto id_it = ids.begin(); id_it != ids.end(); ++id_it) {
            if (*id_it == id) {
                ids.erase(id_it);
                break;
            }
        }
        if (ids.empty()) by_tag_.erase(tag_it);
    }
    subscriptions_.erase(it);
    return true;
}

void EventBus::publish(const Event& event) {
    // Copy handlers out under lock, then call without lock held.
    std::vector<EventHandler> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = by_tag_.find(event.type_tag);
        if (it == by_tag_.end()) return;
        to_call.reserve(it->second.size());
        for (uint64_t id : it->second) {
            to_call.push_back(subscriptions_.at(id).handler);
        }
    }
    for (const auto& handler : to_call) {
        handler(event);
    }
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    by_tag_.clear();
    subscriptions_.clear();
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_tag_.find(tag);
    if (it == by_tag_.end()) return 0;
    return it->second.size();
}

} // namespace chorus
