// Funding Arb Engine - Supervisor Implementation

#include <fundarb/supervisor.hpp>
#include <fundarb/errors.hpp>
#include <spdlog/spdlog.h>

namespace fundarb {

Supervisor::Supervisor(EventBusPtr bus, ShutdownSignal& shutdown, const SupervisorConfig& config)
    : bus_(std::move(bus)), shutdown_(shutdown), config_(config) {
    if (!bus_) return;

    subscriptions_.push_back(bus_->subscribe_scoped<BrokenHedgeDetected>([this](const BrokenHedgeDetected& e) {
        // Entry-time hedge failures are compensated in place
        if (e.source != "position_monitor") return;
        pause("broken hedge on " + e.symbol + " (" + e.trade_id + ")");
    }));

    subscriptions_.push_back(bus_->subscribe_scoped<RollbackCompleted>([this](const RollbackCompleted& e) {
        if (!e.success) pause("rollback failed on " + e.symbol + " (" + e.trade_id + ")");
    }));
}

Supervisor::~Supervisor() {
    subscriptions_.clear();
    shutdown();
}

void Supervisor::add_loop(std::string name, std::chrono::milliseconds interval, LoopFn body) {
    if (running_.load()) {
        throw ValidationError("Cannot add loop " + name + " while the supervisor is running");
    }
    auto loop = std::make_unique<Loop>();
    loop->name = std::move(name);
    loop->interval = interval;
    loop->body = std::move(body);
    loops_.push_back(std::move(loop));
}

void Supervisor::start() {
    if (running_.exchange(true)) return;
    for (auto& loop : loops_) {
        Loop* l = loop.get();
        l->thread = std::make_unique<std::thread>([this, l] { run_loop(*l); });
    }
    spdlog::info("Supervisor started {} loops", loops_.size());
}

void Supervisor::shutdown() {
    shutdown_.request();
    if (!running_.exchange(false)) return;

    for (auto& loop : loops_) {
        if (loop->thread && loop->thread->joinable()) {
            loop->thread->join();
        }
        loop->thread.reset();
    }
    spdlog::info("Supervisor stopped");
}

int Supervisor::restarts(const std::string& name) const {
    for (const auto& loop : loops_) {
        if (loop->name == name) return loop->restarts.load();
    }
    return 0;
}

void Supervisor::pause(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(pause_mutex_);
        if (paused_.load()) return;
        pause_reason_ = reason;
        paused_.store(true);
    }
    spdlog::critical("New entries PAUSED: {}. Acknowledge to resume.", reason);
}

void Supervisor::acknowledge() {
    std::lock_guard<std::mutex> lock(pause_mutex_);
    if (!paused_.load()) return;
    spdlog::info("Entry pause acknowledged (was: {})", pause_reason_);
    pause_reason_.clear();
    paused_.store(false);
}

std::string Supervisor::pause_reason() const {
    std::lock_guard<std::mutex> lock(pause_mutex_);
    return pause_reason_;
}

void Supervisor::run_loop(Loop& loop) {
    Backoff backoff(std::chrono::milliseconds(config_.backoff_base_ms),
                    std::chrono::milliseconds(config_.backoff_cap_ms));
    spdlog::debug("Loop {} started ({}ms)", loop.name, loop.interval.count());

    while (!shutdown_.requested()) {
        try {
            loop.body();
            backoff.reset();
            if (!shutdown_.sleep_for(loop.interval)) break;
        } catch (const CancelledError& e) {
            if (shutdown_.requested()) break;
            spdlog::warn("Loop {} cancelled without shutdown: {}", loop.name, e.what());
            if (!shutdown_.sleep_for(loop.interval)) break;
        } catch (const std::exception& e) {
            if (shutdown_.requested()) break;

            auto delay = backoff.next();
            int n = ++loop.restarts;
            spdlog::error("Loop {} failed: {}. Restart #{} in {}ms", loop.name, e.what(), n, delay.count());
            if (bus_) {
                bus_->publish(AlertEvent(AlertLevel::Warning, "Loop " + loop.name + " restarting",
                                         {{"incident", "loop_restart:" + loop.name},
                                          {"error", e.what()},
                                          {"restarts", std::to_string(n)},
                                          {"delay_ms", std::to_string(delay.count())}}));
            }
            if (!shutdown_.sleep_for(delay)) break;
        }
    }
    spdlog::debug("Loop {} stopped", loop.name);
}

}  // namespace fundarb
