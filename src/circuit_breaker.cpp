// Funding Arb Engine - Circuit Breaker Implementation

#include <fundarb/circuit_breaker.hpp>
#include <spdlog/spdlog.h>

namespace fundarb {

CircuitBreaker::CircuitBreaker(const CircuitBreakerConfig& config, EventBusPtr bus, ClockFn clock)
    : config_(config), bus_(std::move(bus)), clock_(std::move(clock)) {}

bool CircuitBreaker::is_tripped() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!tripped_) return false;

    if (config_.cooldown_ms > 0 && clock_() - tripped_at_ >= config_.cooldown_ms) {
        spdlog::info("Circuit breaker cooldown elapsed, resuming entries (was: {})", reason_);
        tripped_ = false;
        failures_ = 0;
        reason_.clear();
        return false;
    }
    return true;
}

void CircuitBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_ = 0;
}

void CircuitBreaker::record_failure(const std::string& reason) {
    int failures = 0;
    bool tripped = false;
    std::string why;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failures = ++failures_;
        spdlog::warn("Entry failure {}/{}: {}", failures, config_.max_consecutive_failures, reason);
        if (config_.max_consecutive_failures > 0 && failures >= config_.max_consecutive_failures) {
            why = std::to_string(failures) + " consecutive entry failures, last: " + reason;
            tripped = trip_locked(why);
        }
    }
    if (tripped) announce(why, failures);
}

void CircuitBreaker::record_pnl(Decimal pnl) {
    int failures = 0;
    bool tripped = false;
    std::string why;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now = clock_();
        pnl_window_.emplace_back(now, pnl);
        prune_locked(now);

        if (!config_.max_drawdown_pct.is_positive() || !equity_.is_positive()) return;

        Decimal total;
        for (const auto& [ts, p] : pnl_window_) total += p;
        Decimal limit = equity_ * config_.max_drawdown_pct;
        if (total.is_negative() && total.abs() >= limit) {
            why = "drawdown " + total.abs().to_string() + " USD exceeds " + limit.to_string() +
                  " USD within window";
            failures = failures_;
            tripped = trip_locked(why);
        }
    }
    if (tripped) announce(why, failures);
}

void CircuitBreaker::set_equity(Decimal equity) {
    std::lock_guard<std::mutex> lock(mutex_);
    equity_ = equity;
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tripped_) spdlog::info("Circuit breaker reset manually (was: {})", reason_);
    tripped_ = false;
    failures_ = 0;
    reason_.clear();
    pnl_window_.clear();
}

int CircuitBreaker::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

std::string CircuitBreaker::trip_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

Decimal CircuitBreaker::window_pnl() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Decimal total;
    for (const auto& [ts, p] : pnl_window_) total += p;
    return total;
}

bool CircuitBreaker::trip_locked(const std::string& reason) {
    if (tripped_) return false;
    tripped_ = true;
    tripped_at_ = clock_();
    reason_ = reason;
    return true;
}

void CircuitBreaker::prune_locked(int64_t now) {
    while (!pnl_window_.empty() && now - pnl_window_.front().first > config_.drawdown_window_ms) {
        pnl_window_.pop_front();
    }
}

void CircuitBreaker::announce(const std::string& reason, int failures) {
    spdlog::error("Circuit breaker tripped: {}{}", reason,
                  config_.cooldown_ms > 0 ? "" : " (manual reset required)");
    if (!bus_) return;

    CircuitBreakerTripped ev;
    ev.reason = reason;
    ev.consecutive_failures = failures;
    ev.cooldown_ms = config_.cooldown_ms;
    bus_->publish(ev);
}

}  // namespace fundarb
