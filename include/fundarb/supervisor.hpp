// Funding Arb Engine - Supervisor
// Runs periodic loops on worker threads, restarting failed loops with backoff,
// and holds the entry pause raised by hedge-integrity incidents

#pragma once

#include <fundarb/async.hpp>
#include <fundarb/config.hpp>
#include <fundarb/event_bus.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fundarb {

class Supervisor {
public:
    // One iteration of a loop body
    using LoopFn = std::function<void()>;

    Supervisor(EventBusPtr bus, ShutdownSignal& shutdown, const SupervisorConfig& config);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // Register before start()
    void add_loop(std::string name, std::chrono::milliseconds interval, LoopFn body);

    void start();

    // Requests shutdown and joins every loop thread
    void shutdown();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] int restarts(const std::string& name) const;

    // Entry pause. Only acknowledge() clears it.
    void pause(const std::string& reason);
    void acknowledge();
    [[nodiscard]] bool entries_paused() const noexcept { return paused_.load(); }
    [[nodiscard]] std::string pause_reason() const;

private:
    struct Loop {
        std::string name;
        std::chrono::milliseconds interval;
        LoopFn body;
        std::atomic<int> restarts{0};
        std::unique_ptr<std::thread> thread;
    };

    void run_loop(Loop& loop);

    EventBusPtr bus_;
    ShutdownSignal& shutdown_;
    SupervisorConfig config_;

    std::atomic<bool> running_{false};
    std::vector<std::unique_ptr<Loop>> loops_;

    std::atomic<bool> paused_{false};
    mutable std::mutex pause_mutex_;
    std::string pause_reason_;

    std::vector<Subscription> subscriptions_;
};

}  // namespace fundarb
