#include "event_bus.hpp"

namespace llmgw {

EventBus::EventBus() : table_(std::make_shared<Table>()) {}

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto next = std::make_shared<Table>(*table());
    uint64_t id = next_id_++;
    (*next)[tag].push_back(
        Subscription{id, std::make_shared<EventHandler>(std::move(handler))});
    std::atomic_store(&table_, std::shared_ptr<const Table>(std::move(next)));
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto next = std::make_shared<Table>(*table());
    for (auto& [tag, subs] : *next) {
        for (auto it = subs.begin(); it != subs.end(); ++it) {
            if (it->id == id) {
                subs.erase(it);
                std::atomic_store(&table_, std::shared_ptr<const Table>(std::move(next)));
                return true;
            }
        }
    }
    return false;
}

void EventBus::publish(const Event& event) const {
    // The snapshot keeps handlers alive even if they unsubscribe mid-call.
    auto snapshot = table();
    if (snapshot->empty()) return;

    auto it = snapshot->find(event.type_tag);
    if (it != snapshot->end()) {
        for (const auto& sub : it->second) {
            (*sub.handler)(event);
        }
    }
    auto all = snapshot->find(kAllEvents);
    if (all != snapshot->end()) {
        for (const auto& sub : all->second) {
            (*sub.handler)(event);
        }
    }
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    std::atomic_store(&table_, std::shared_ptr<const Table>(std::make_shared<Table>()));
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    auto snapshot = table();
    auto it = snapshot->find(tag);
    if (it == snapshot->end()) return 0;
    return it->second.size();
}

} // namespace llmgw
