#pragma once
#include "event.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmgw {

using EventHandler = std::function<void(const Event&)>;

// Subscribing under this tag receives every event.
constexpr const char* kAllEvents = "*";

// Publishing happens on every provider attempt, subscribing almost never.
// Subscriptions live in an immutable table replaced on change, so publish()
// only takes an atomic snapshot and never contends with other publishers.
class EventBus {
public:
    EventBus();

    // Subscribe to events with a given tag. Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Publish an event synchronously on the calling thread. Tag subscribers
    // run in registration order, then wildcard subscribers.
    void publish(const Event& event) const;

    // Remove all subscriptions.
    void clear();

    // Number of subscriptions for a given tag (0 if none).
    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        std::shared_ptr<const EventHandler> handler;
    };
    using Table = std::unordered_map<std::string, std::vector<Subscription>>;

    std::shared_ptr<const Table> table() const { return std::atomic_load(&table_); }

    std::mutex write_mutex_;
    std::shared_ptr<const Table> table_;
    uint64_t next_id_ = 1;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

} // namespace llmgw
