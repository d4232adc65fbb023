// Funding Arb Engine - Circuit Breaker
// Pauses new entries after repeated failures or a drawdown

#pragma once

#include <fundarb/config.hpp>
#include <fundarb/event_bus.hpp>
#include <fundarb/types.hpp>
#include <deque>
#include <mutex>
#include <string>
#include <utility>

namespace fundarb {

class CircuitBreaker {
public:
    CircuitBreaker(const CircuitBreakerConfig& config, EventBusPtr bus, ClockFn clock = now_ms);

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    // True while tripped. Clears itself once a non-zero cooldown has elapsed.
    [[nodiscard]] bool is_tripped();
    [[nodiscard]] bool allows_entry() { return !is_tripped(); }

    // Entry outcomes
    void record_success();
    void record_failure(const std::string& reason);

    // Realised result of a closed trade, for the drawdown check
    void record_pnl(Decimal pnl);

    // Equity the drawdown percentage is measured against
    void set_equity(Decimal equity);

    // Manual clear
    void reset();

    [[nodiscard]] int consecutive_failures() const;
    [[nodiscard]] std::string trip_reason() const;
    [[nodiscard]] Decimal window_pnl() const;

private:
    // Caller holds mutex_; returns true when this call tripped the breaker
    bool trip_locked(const std::string& reason);
    void prune_locked(int64_t now);
    void announce(const std::string& reason, int failures);

    CircuitBreakerConfig config_;
    EventBusPtr bus_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    bool tripped_ = false;
    int64_t tripped_at_ = 0;
    std::string reason_;
    int failures_ = 0;
    Decimal equity_;
    std::deque<std::pair<int64_t, Decimal>> pnl_window_;
};

}  // namespace fundarb
