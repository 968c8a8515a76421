#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace chorus {

using EventHandler = std::function<void(const Event&)>;

// Lifecycle notifications. Publishers are the registry and the
// per-conversation workers, so publish() runs on arbitrary threads.
class EventBus {
public:
    // Subscribe to events with a given tag. Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Publish synchronously on the caller's thread, in registration order.
    // Handlers run without the bus mutex held, so they may publish or
    // unsubscribe themselves.
    void publish(const Event& event);

    // Remove all subscriptions.
    void clear();

    // Number of subscriptions for a given tag (0 if none).
    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        std::string tag;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<uint64_t>> by_tag_;
    std::unordered_map<uint64_t, Subscription> subscriptions_;
    uint64_t next_id_ = 1;
};

// Unsubscribes on destruction. Must not outlive the bus.
class ScopedSubscription {
public:
    ScopedSubscription() = default;
    ScopedSubscription(EventBus& bus, uint64_t id) : bus_(&bus), id_(id) {}
    ~ScopedSubscription() { reset(); }

    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;
    ScopedSubscription(ScopedSubscription&& other) noexcept
        : bus_(other.bus_), id_(other.id_) {
        other.bus_ = nullptr;
    }
    ScopedSubscription& operator=(ScopedSubscription&& other) noexcept {
        if (this != &other) {
            reset();
            bus_ = other.bus_;
            id_ = other.id_;
            other.bus_ = nullptr;
        }
        return *this;
    }

    void reset() {
        if (bus_) bus_->unsubscribe(id_);
        bus_ = nullptr;
    }

private:
    EventBus* bus_ = nullptr;
    uint64_t id_ = 0;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

template<typename E>
ScopedSubscription subscribe_scoped(EventBus& bus, std::function<void(const E&)> handler) {
    return ScopedSubscription(bus, subscribe<E>(bus, std::move(handler)));
}

} // namespace chorus
