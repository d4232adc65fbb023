// Funding Arb Engine - Event Bus
// In-process publish/subscribe for domain events

#pragma once

#include <fundarb/events.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fundarb {

using EventHandler = std::function<void(const Event&)>;
using SubscriptionId = uint64_t;

class Subscription;

class EventBusPort {
public:
    virtual ~EventBusPort() = default;

    virtual void publish(const Event& event) = 0;
    virtual SubscriptionId subscribe(EventType type, EventHandler handler) = 0;
    virtual SubscriptionId subscribe_all(EventHandler handler) = 0;

    // Removes a handler. Returns once no call of it is still running, so it
    // must not be called from inside that handler.
    virtual void unsubscribe(SubscriptionId id) = 0;

    // Typed convenience wrapper
    template <typename T>
    SubscriptionId subscribe(std::function<void(const T&)> handler) {
        return subscribe(T::kType, [h = std::move(handler)](const Event& e) {
            h(static_cast<const T&>(e));
        });
    }

    // Handlers that capture their owner; the bus must outlive the handle
    template <typename T>
    Subscription subscribe_scoped(std::function<void(const T&)> handler);
    Subscription subscribe_all_scoped(EventHandler handler);
};

// Owns one registration and removes it on destruction
class Subscription {
public:
    Subscription() = default;
    Subscription(EventBusPort& bus, SubscriptionId id) noexcept : bus_(&bus), id_(id) {}
    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept
        : bus_(std::exchange(other.bus_, nullptr)), id_(other.id_) {}

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            bus_ = std::exchange(other.bus_, nullptr);
            id_ = other.id_;
        }
        return *this;
    }

    void reset() {
        if (bus_) {
            std::exchange(bus_, nullptr)->unsubscribe(id_);
        }
    }

    [[nodiscard]] bool active() const noexcept { return bus_ != nullptr; }
    [[nodiscard]] SubscriptionId id() const noexcept { return id_; }

private:
    EventBusPort* bus_ = nullptr;
    SubscriptionId id_ = 0;
};

template <typename T>
Subscription EventBusPort::subscribe_scoped(std::function<void(const T&)> handler) {
    return Subscription(*this, subscribe<T>(std::move(handler)));
}

inline Subscription EventBusPort::subscribe_all_scoped(EventHandler handler) {
    return Subscription(*this, subscribe_all(std::move(handler)));
}

// Synchronous dispatch on the publishing thread.
// A throwing handler is logged and never blocks the remaining handlers.
class EventBus : public EventBusPort {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    using EventBusPort::subscribe;

    void publish(const Event& event) override;
    SubscriptionId subscribe(EventType type, EventHandler handler) override;
    SubscriptionId subscribe_all(EventHandler handler) override;
    void unsubscribe(SubscriptionId id) override;

    [[nodiscard]] uint64_t published() const noexcept;
    [[nodiscard]] uint64_t handler_failures() const noexcept;
    [[nodiscard]] size_t subscriber_count() const;

private:
    struct Slot;
    using SlotPtr = std::shared_ptr<Slot>;

    SlotPtr make_slot(EventHandler handler);
    void dispatch(Slot& slot, const Event& event);

    mutable std::mutex mutex_;
    std::unordered_map<EventType, std::vector<SlotPtr>> handlers_;
    std::vector<SlotPtr> wildcard_;
    SubscriptionId next_id_ = 0;
    uint64_t published_ = 0;
    uint64_t failures_ = 0;
};

using EventBusPtr = std::shared_ptr<EventBusPort>;

}  // namespace fundarb
