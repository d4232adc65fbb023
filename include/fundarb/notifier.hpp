// Funding Arb Engine - Alert Notifier
// Turns bus events into throttled operator messages

#pragma once

#include <fundarb/config.hpp>
#include <fundarb/event_bus.hpp>
#include <fundarb/notification.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fundarb {

class AlertNotifier {
public:
    AlertNotifier(NotificationPtr port, const NotificationConfig& config, ClockFn clock = now_ms);
    ~AlertNotifier();

    AlertNotifier(const AlertNotifier&) = delete;
    AlertNotifier& operator=(const AlertNotifier&) = delete;

    // Subscribe to alerts, broken hedges, breaker trips, failed rollbacks and trade summaries.
    // The bus must outlive the notifier; handlers are removed on destruction.
    void attach(EventBusPort& bus);
    void detach();

    // Deliver on a background thread; until started, delivery is inline
    void start();
    void stop();

    // Returns false when the level is filtered or the key is inside its throttle window
    bool notify(const std::string& key, AlertLevel level, const std::string& text);

    [[nodiscard]] int sent() const noexcept { return sent_.load(); }
    [[nodiscard]] int suppressed() const noexcept { return suppressed_.load(); }
    [[nodiscard]] int failed() const noexcept { return failed_.load(); }

    [[nodiscard]] static std::string format(AlertLevel level, const std::string& text);

private:
    void deliver(const std::string& text);
    void worker_loop();

    NotificationPtr port_;
    NotificationConfig config_;
    AlertLevel min_level_;
    ClockFn clock_;

    std::mutex mutex_;
    std::map<std::string, int64_t> last_sent_;

    std::atomic<int> sent_{0};
    std::atomic<int> suppressed_{0};
    std::atomic<int> failed_{0};

    std::atomic<bool> running_{false};
    std::unique_ptr<std::thread> worker_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::string> queue_;

    std::vector<Subscription> subscriptions_;
};

}  // namespace fundarb
