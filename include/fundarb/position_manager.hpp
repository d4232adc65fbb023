// Funding Arb Engine - Position Manager
// Monitors open hedges: exits, rebalances, broken-hedge detection and funding accrual

#pragma once

#include <fundarb/async.hpp>
#include <fundarb/config.hpp>
#include <fundarb/event_bus.hpp>
#include <fundarb/execution.hpp>
#include <fundarb/exit_rules.hpp>
#include <fundarb/market_data.hpp>
#include <fundarb/models.hpp>
#include <fundarb/store.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace fundarb {

struct CloseResult {
    bool success = false;
    bool skipped = false;  // another close owns the trade, or it is no longer OPEN
    std::string error;
    std::optional<Trade> trade;
};

class PositionManager {
public:
    // Best APY available for a rotation away from `symbol`
    using BestApyFn = std::function<std::optional<Decimal>(const std::string& symbol)>;

    PositionManager(MarketDataService& market_data, TradeStorePtr store, EventBusPtr bus,
                    const Config& config, ClockFn clock = now_ms);

    PositionManager(const PositionManager&) = delete;
    PositionManager& operator=(const PositionManager&) = delete;

    void set_best_apy_provider(BestApyFn fn) { best_apy_ = std::move(fn); }

    // One monitoring pass over every OPEN trade; returns how many were acted on
    int check_trades();

    // Evaluate one trade and act on the decision; returns true if it acted
    bool check_trade(const Trade& trade);

    // Idempotent: only the caller that moves the trade OPEN -> CLOSING sends orders
    CloseResult close_trade(const std::string& trade_id, const std::string& reason, bool emergency = false);

    // Partial reduce-only close of the larger leg to pull delta drift back in
    bool rebalance(const std::string& trade_id);

    // Broken-hedge debounce. Records one observation of a missing leg and
    // returns true once enough spaced confirmations have accumulated.
    bool observe_missing_leg(const std::string& trade_id, int64_t now);
    void clear_missing_leg(const std::string& trade_id);
    [[nodiscard]] int missing_leg_confirmations(const std::string& trade_id) const;

    // Market view of a trade from its live positions and cached market data
    [[nodiscard]] rules::ExitContext build_context(const Trade& trade,
                                                   const std::optional<Position>& live1,
                                                   const std::optional<Position>& live2) const;

    // Taker fees plus half the spread on both legs at the given marks
    [[nodiscard]] Decimal estimate_exit_cost(const Trade& trade, Decimal mark1, Decimal mark2) const;

private:
    struct HedgeWatch {
        int confirmations = 0;
        int64_t first_seen = 0;
        int64_t last_seen = 0;
    };

    bool leg_present(const TradeLeg& leg, const std::optional<Position>& live) const noexcept;
    Decimal mark_for(const TradeLeg& leg, const std::string& symbol, const std::optional<Position>& live) const;

    void handle_broken_hedge(const Trade& trade, const TradeLeg& survivor, const TradeLeg& missing,
                             const Position& live);
    void check_imbalance(const Trade& trade, const Position& live1, const Position& live2);
    Trade update_marks(const Trade& trade, const rules::ExitContext& ctx);

    bool close_coordinated(Trade& trade);
    bool close_market(Trade& trade);
    bool sweep_leg(Trade& trade, TradeLeg& leg, FillTracker& fills, int round);
    bool legs_flat(const Trade& trade);
    void apply_exit_fills(Trade& trade, TradeLeg& leg, const FillTracker& fills);
    CloseResult finish_close(const Trade& trade, const std::string& reason);
    CloseResult revert_close(const Trade& trade, const std::string& error);

    std::optional<Position> read_position(const std::string& venue, const std::string& symbol);
    void publish_state(const Trade& trade, TradeStatus from, const std::string& reason);

    MarketDataService& market_data_;
    TradeStorePtr store_;
    EventBusPtr bus_;
    const Config& config_;
    ClockFn clock_;
    std::chrono::milliseconds call_timeout_;
    RetryPolicy retry_;
    BestApyFn best_apy_;

    SymbolLocks closing_;  // keyed by trade id

    mutable std::mutex mutex_;
    std::map<std::string, HedgeWatch> watches_;
    std::map<std::string, Decimal> pending_funding_;
};

}  // namespace fundarb
