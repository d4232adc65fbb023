// Funding Arb Engine - Event Bus Implementation

#include <fundarb/event_bus.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <condition_variable>

namespace fundarb {

// One registered handler. in_flight counts calls running outside the bus lock.
struct EventBus::Slot {
    SubscriptionId id = 0;
    EventHandler handler;
    std::mutex mutex;
    std::condition_variable idle;
    int in_flight = 0;
    bool active = true;
};

void EventBus::publish(const Event& event) {
    std::vector<SlotPtr> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++published_;
        auto it = handlers_.find(event.type());
        if (it != handlers_.end()) {
            targets = it->second;
        }
        targets.insert(targets.end(), wildcard_.begin(), wildcard_.end());
    }

    // Handlers run unlocked so they may publish follow-up events
    for (const auto& slot : targets) {
        dispatch(*slot, event);
    }
}

void EventBus::dispatch(Slot& slot, const Event& event) {
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        if (!slot.active) return;
        ++slot.in_flight;
    }

    struct Release {
        Slot& slot;
        ~Release() {
            std::lock_guard<std::mutex> lock(slot.mutex);
            if (--slot.in_flight == 0) slot.idle.notify_all();
        }
    } release{slot};

    try {
        slot.handler(event);
    } catch (const std::exception& e) {
        spdlog::error("Event handler failed for {} ({}): {}",
                      to_string(event.type()), event.event_id, e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        ++failures_;
    }
}

EventBus::SlotPtr EventBus::make_slot(EventHandler handler) {
    auto slot = std::make_shared<Slot>();
    slot->id = ++next_id_;
    slot->handler = std::move(handler);
    return slot;
}

SubscriptionId EventBus::subscribe(EventType type, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto slot = make_slot(std::move(handler));
    handlers_[type].push_back(slot);
    return slot->id;
}

SubscriptionId EventBus::subscribe_all(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto slot = make_slot(std::move(handler));
    wildcard_.push_back(slot);
    return slot->id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    SlotPtr removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto take = [&](std::vector<SlotPtr>& slots) {
            auto it = std::find_if(slots.begin(), slots.end(),
                                   [id](const SlotPtr& s) { return s->id == id; });
            if (it == slots.end()) return false;
            removed = *it;
            slots.erase(it);
            return true;
        };
        if (!take(wildcard_)) {
            for (auto& [type, slots] : handlers_) {
                if (take(slots)) break;
            }
        }
    }
    if (!removed) return;

    // Publishers may still hold the slot; wait out their calls
    std::unique_lock<std::mutex> lock(removed->mutex);
    removed->active = false;
    removed->idle.wait(lock, [&] { return removed->in_flight == 0; });
}

uint64_t EventBus::published() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

uint64_t EventBus::handler_failures() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = wildcard_.size();
    for (const auto& [type, slots] : handlers_) n += slots.size();
    return n;
}

}  // namespace fundarb
