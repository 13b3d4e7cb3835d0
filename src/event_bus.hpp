#pragma once
#include "event.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolgate {

using EventHandler = std::function<void(const Event&)>;

class ScopedSubscription;

// Synchronous tag-keyed dispatcher. Handlers run on the publishing thread,
// in subscription order, with the bus lock released.
class EventBus {
public:
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // A handler removed while an event is being delivered does not see that
    // event if it has not run yet. Returns false for unknown ids.
    bool unsubscribe(uint64_t id);

    void publish(const Event& event);

    void clear();

    size_t subscriber_count(const std::string& tag) const;

private:
    struct Entry {
        uint64_t id;
        EventHandler handler;
        bool active = true;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<std::shared_ptr<Entry>>> handlers_;
    uint64_t next_id_ = 1;
};

// Owns one subscription and drops it on destruction. The bus must outlive it.
class ScopedSubscription {
public:
    ScopedSubscription() = default;
    ScopedSubscription(EventBus& bus, uint64_t id) : bus_(&bus), id_(id) {}
    ~ScopedSubscription() { reset(); }

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
    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

    void reset() {
        if (bus_) bus_->unsubscribe(id_);
        bus_ = nullptr;
    }
    bool active() const { return bus_ != nullptr; }

private:
    EventBus* bus_ = nullptr;
    uint64_t id_ = 0;
};

// Subscribes to E::TAG with a handler taking the concrete event type.
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

} // namespace toolgate
