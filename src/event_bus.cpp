#include "event_bus.hpp"

namespace toolgate {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    auto entry = std::make_shared<Entry>();
    entry->id = id;
    entry->handler = std::move(handler);
    handlers_[tag].push_back(std::move(entry));
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& kv : handlers_) {
        auto& entries = kv.second;
        for (auto it = entries.begin(); it != entries.end(); ++it) {
            if ((*it)->id != id) continue;
            (*it)->active = false;
            entries.erase(it);
            return true;
        }
    }
    return false;
}

void EventBus::publish(const Event& event) {
    // Snapshot so handlers may subscribe or unsubscribe while we deliver.
    std::vector<std::shared_ptr<Entry>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event.type_tag);
        if (it == handlers_.end()) return;
        snapshot = it->second;
    }
    for (const auto& entry : snapshot) {
        bool active;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            active = entry->active;
        }
        if (active) entry->handler(event);
    }
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& kv : handlers_)
        for (auto& entry : kv.second) entry->active = false;
    handlers_.clear();
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(tag);
    return it == handlers_.end() ? 0 : it->second.size();
}

} // namespace toolgate
