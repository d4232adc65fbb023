// Funding Arb Engine - Execution Engine
// Two-leg hedged entry: chased maker leg 1, IOC hedge leg 2, rollback on failure

#pragma once

#include <fundarb/async.hpp>
#include <fundarb/config.hpp>
#include <fundarb/event_bus.hpp>
#include <fundarb/market_data.hpp>
#include <fundarb/models.hpp>
#include <fundarb/store.hpp>
#include <chrono>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fundarb {

// Outcome of one entry attempt
struct ExecutionResult {
    bool success = false;
    std::optional<Trade> trade;
    std::string error;
    std::string error_code;

    static ExecutionResult ok(Trade trade) {
        ExecutionResult r;
        r.success = true;
        r.trade = std::move(trade);
        return r;
    }

    static ExecutionResult failed(std::string error, std::string code,
                                  std::optional<Trade> trade = std::nullopt) {
        ExecutionResult r;
        r.error = std::move(error);
        r.error_code = std::move(code);
        r.trade = std::move(trade);
        return r;
    }
};

// Volume-weighted fills accumulated across orders
class FillTracker {
public:
    void add(Decimal qty, Decimal price, Decimal fee = Decimal::zero()) noexcept {
        if (!qty.is_positive()) return;
        qty_ += qty;
        notional_ += qty * price;
        fees_ += fee;
        ++count_;
    }

    // Record what an order reports as filled; returns the quantity added
    Decimal add_order(const Order& order) noexcept;

    [[nodiscard]] Decimal filled() const noexcept { return qty_; }
    [[nodiscard]] Decimal notional() const noexcept { return notional_; }
    [[nodiscard]] Decimal fees() const noexcept { return fees_; }
    [[nodiscard]] int count() const noexcept { return count_; }

    [[nodiscard]] Decimal average_price() const noexcept {
        return qty_.is_positive() ? notional_ / qty_ : Decimal::zero();
    }

private:
    Decimal qty_;
    Decimal notional_;
    Decimal fees_;
    int count_ = 0;
};

// Per-symbol entry guard
class SymbolLocks {
public:
    // RAII hold on one symbol
    class Guard {
    public:
        Guard() = default;
        Guard(SymbolLocks* owner, std::string symbol) : owner_(owner), symbol_(std::move(symbol)) {}
        ~Guard() { release(); }

        Guard(Guard&& other) noexcept : owner_(other.owner_), symbol_(std::move(other.symbol_)) {
            other.owner_ = nullptr;
        }
        Guard& operator=(Guard&& other) noexcept {
            if (this != &other) {
                release();
                owner_ = other.owner_;
                symbol_ = std::move(other.symbol_);
                other.owner_ = nullptr;
            }
            return *this;
        }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        explicit operator bool() const noexcept { return owner_ != nullptr; }

    private:
        void release() noexcept {
            if (owner_) owner_->release(symbol_);
            owner_ = nullptr;
        }

        SymbolLocks* owner_ = nullptr;
        std::string symbol_;
    };

    // Empty guard when the symbol is already held
    [[nodiscard]] Guard try_acquire(const std::string& symbol);
    [[nodiscard]] bool is_locked(const std::string& symbol) const;

private:
    void release(const std::string& symbol) noexcept;

    mutable std::mutex mutex_;
    std::set<std::string> held_;
};

struct Leg1PriceInput {
    Side side = Side::Buy;
    Decimal best_bid;
    Decimal best_ask;
    Decimal mid;          // fallback reference for a missing or crossed book
    Decimal l1_qty;       // top-of-book size on our own side
    Decimal remaining;
    Decimal tick;
    int attempt = 0;
    int max_attempts = 1;
};

struct Leg1Price {
    Decimal price;
    Decimal aggressiveness;  // before the cap
    Decimal capped;
    Decimal smart_floor;
    Decimal best_bid;
    Decimal best_ask;
};

// Maker price for attempt i: moves from our best toward the opposite best
// minus one tick as aggressiveness rises
[[nodiscard]] Leg1Price compute_leg1_price(const Leg1PriceInput& in, const ExecutionConfig& config) noexcept;

// Split of the leg 1 total timeout across attempts
[[nodiscard]] std::vector<int64_t> attempt_timeouts(int64_t total_ms, int attempts, AttemptSchedule schedule);

// Slippage allowance of hedge attempt i
[[nodiscard]] Decimal leg2_slippage(int attempt, const ExecutionConfig& config) noexcept;

// Poll an order until it is done or the timeout passes, then cancel it and
// return its final state. A null shutdown makes the wait uninterruptible.
Order follow_order(ExchangePort& ex, const Order& placed, std::chrono::milliseconds timeout,
                   int64_t poll_ms, std::chrono::milliseconds call_timeout,
                   ShutdownSignal* shutdown = nullptr);

class ExecutionEngine {
public:
    // Throws ValidationError when no execution mode is configured
    ExecutionEngine(MarketDataService& market_data, TradeStorePtr store, EventBusPtr bus,
                    const Config& config, ShutdownSignal& shutdown, ClockFn clock = now_ms);

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    // Enter one opportunity. Failures come back in the result, never as exceptions.
    ExecutionResult execute(const Opportunity& opportunity);

    // Flatten every filled leg with reduce-only market orders. Shutdown does
    // not interrupt it. Returns true once both legs are flat.
    bool rollback(Trade& trade, const std::string& reason);

    [[nodiscard]] bool is_executing(const std::string& symbol) const { return locks_.is_locked(symbol); }
    [[nodiscard]] ExecutionMode mode() const noexcept { return mode_; }

private:
    // Signed live position on each venue before the entry started
    struct Baseline {
        Decimal leg1;
        Decimal leg2;
    };

    void pre_check(const Opportunity& opp);
    Trade open_trade(const Opportunity& opp);
    Baseline read_baseline(const Trade& trade);

    void run_sequential(Trade& trade, const Baseline& base);
    void run_parallel(Trade& trade, const Baseline& base);

    // Fill leg 1 up to leg.qty; throws Leg1FailedError below the hedgeable minimum
    Decimal execute_leg1(const Trade& trade, TradeLeg& leg, Decimal baseline);

    // Hedge exactly qty; throws Leg2FailedError when the remainder is not a microfill
    void execute_leg2(const Trade& trade, TradeLeg& leg, Decimal qty, Decimal baseline);

    void apply_leg1_result(Trade& trade);
    void trim_excess(Trade& trade);
    void complete(Trade& trade);
    void compensate(Trade& trade, const std::string& reason);
    ExecutionResult fail_entry(std::optional<Trade>& trade, const DomainError& error);

    bool flatten_leg(const Trade& trade, TradeLeg& leg, Decimal& loss);
    void absorb_ghost_fill(const std::string& symbol, const TradeLeg& leg, Decimal baseline,
                           FillTracker& fills, Decimal attempt_price);
    std::optional<Position> read_position(const std::string& venue, const std::string& symbol);
    PairBook current_book(const std::string& symbol);
    MarketInfo market_info(const std::string& venue, const std::string& symbol);

    void persist(const Trade& trade);
    void publish_fill(const Trade& trade, const TradeLeg& leg, const Order& order, Decimal qty);
    void publish_state(const Trade& trade, TradeStatus from, const std::string& reason);

    MarketDataService& market_data_;
    TradeStorePtr store_;
    EventBusPtr bus_;
    const Config& config_;
    ShutdownSignal& shutdown_;
    ClockFn clock_;
    ExecutionMode mode_;
    std::chrono::milliseconds call_timeout_;
    RetryPolicy retry_;
    SymbolLocks locks_;
};

}  // namespace fundarb
