// Funding Arb Engine - Exit Rules
// Pure exit evaluation for an open hedged trade

#pragma once

#include <fundarb/config.hpp>
#include <fundarb/models.hpp>
#include <optional>
#include <string>

namespace fundarb::rules {

inline constexpr const char* REASON_EMERGENCY = "EMERGENCY";
inline constexpr const char* REASON_REBALANCE = "REBALANCE";
inline constexpr const char* REASON_EARLY_TP = "EARLY_TAKE_PROFIT";
inline constexpr const char* REASON_NETEV = "NetEV";

// Market view of a trade at evaluation time
struct ExitContext {
    int64_t now = 0;

    // Price PnL plus funding net of fees, and price PnL alone
    Decimal current_pnl;
    Decimal price_pnl;

    // Estimated USD cost of closing both legs
    Decimal exit_cost;

    Decimal leg1_rate_hourly;
    Decimal leg2_rate_hourly;

    std::optional<Decimal> leg1_mark;
    std::optional<Decimal> leg2_mark;
    std::optional<Decimal> leg1_liquidation_distance;
    std::optional<Decimal> leg2_liquidation_distance;

    // Best APY available elsewhere, if a scan has produced one
    std::optional<Decimal> best_alternative_apy;
};

struct ExitDecision {
    bool should_exit = false;
    bool rebalance = false;
    bool emergency = false;
    std::string reason;

    static ExitDecision hold(std::string why) { return ExitDecision{false, false, false, std::move(why)}; }
    static ExitDecision exit(std::string why) { return ExitDecision{true, false, false, std::move(why)}; }
};

// base + max(exit_cost * slippage_multiple, min_buffer) + execution_buffer
[[nodiscard]] Decimal effective_take_profit_threshold(Decimal exit_cost, const ExitRulesConfig& config) noexcept;

// Hourly funding earned by the trade's direction; negative when it pays
[[nodiscard]] Decimal funding_diff_hourly(const Trade& trade, Decimal leg1_rate, Decimal leg2_rate) noexcept;

// |net signed notional| / gross notional, using marks when present
[[nodiscard]] Decimal delta_drift(const Trade& trade,
                                  std::optional<Decimal> leg1_mark,
                                  std::optional<Decimal> leg2_mark) noexcept;

// Notional the trade was sized for, falling back to leg 1 fill value
[[nodiscard]] Decimal trade_notional(const Trade& trade) noexcept;

// Ordered rule chain. Emergency checks and early take profit bypass the
// minimum hold; everything else waits for it.
[[nodiscard]] ExitDecision evaluate_exit(const Trade& trade, const ExitContext& ctx,
                                         const ExitRulesConfig& config);

}  // namespace fundarb::rules
