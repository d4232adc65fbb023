// Funding Arb Engine - Domain Models
// Trades, legs and opportunities

#pragma once

#include <fundarb/types.hpp>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace fundarb {

enum class TradeStatus : uint8_t {
    Pending = 0,
    Opening = 1,
    Open = 2,
    Closing = 3,
    Closed = 4,
    Aborted = 5
};

inline constexpr const char* to_string(TradeStatus s) noexcept {
    switch (s) {
        case TradeStatus::Pending: return "PENDING";
        case TradeStatus::Opening: return "OPENING";
        case TradeStatus::Open: return "OPEN";
        case TradeStatus::Closing: return "CLOSING";
        case TradeStatus::Closed: return "CLOSED";
        case TradeStatus::Aborted: return "ABORTED";
    }
    return "UNKNOWN";
}

// Holds a symbol against new entries
inline constexpr bool is_active(TradeStatus s) noexcept {
    return s == TradeStatus::Opening || s == TradeStatus::Open || s == TradeStatus::Closing;
}

inline constexpr bool is_terminal(TradeStatus s) noexcept {
    return s == TradeStatus::Closed || s == TradeStatus::Aborted;
}

// Ordinal order is the only permitted direction of travel
enum class ExecutionState : uint8_t {
    Pending = 0,
    Leg1Submitted = 1,
    Leg1Filled = 2,
    Leg2Submitted = 3,
    Complete = 4,
    RollbackQueued = 5,
    RollbackInProgress = 6,
    RollbackDone = 7,
    RollbackFailed = 8,
    Aborted = 9
};

inline constexpr const char* to_string(ExecutionState s) noexcept {
    switch (s) {
        case ExecutionState::Pending: return "PENDING";
        case ExecutionState::Leg1Submitted: return "LEG1_SUBMITTED";
        case ExecutionState::Leg1Filled: return "LEG1_FILLED";
        case ExecutionState::Leg2Submitted: return "LEG2_SUBMITTED";
        case ExecutionState::Complete: return "COMPLETE";
        case ExecutionState::RollbackQueued: return "ROLLBACK_QUEUED";
        case ExecutionState::RollbackInProgress: return "ROLLBACK_IN_PROGRESS";
        case ExecutionState::RollbackDone: return "ROLLBACK_DONE";
        case ExecutionState::RollbackFailed: return "ROLLBACK_FAILED";
        case ExecutionState::Aborted: return "ABORTED";
    }
    return "UNKNOWN";
}

// COMPLETE and ABORTED absorb; everything else only moves forward
inline constexpr bool can_transition(ExecutionState from, ExecutionState to) noexcept {
    if (from == ExecutionState::Complete || from == ExecutionState::Aborted) return false;
    return static_cast<uint8_t>(to) > static_cast<uint8_t>(from);
}

// One side of the hedge, held on one venue
struct TradeLeg {
    std::string venue;
    Side side = Side::Buy;
    std::string order_id;
    Decimal qty;
    Decimal filled_qty;
    Decimal entry_price;
    Decimal exit_price;
    Decimal fees;

    [[nodiscard]] Decimal notional() const noexcept { return filled_qty * entry_price; }

    // Realised price PnL net of fees; zero until an exit price is known
    [[nodiscard]] Decimal pnl() const noexcept;

    // Mark-to-market price PnL excluding fees
    [[nodiscard]] Decimal unrealized_pnl(Decimal mark) const noexcept;
};

struct Trade {
    std::string id;
    std::string symbol;
    TradeLeg leg1;
    TradeLeg leg2;
    Decimal target_qty;
    Decimal target_notional_usd;
    Decimal entry_apy;
    Decimal entry_spread;
    Decimal current_apy;
    TradeStatus status = TradeStatus::Pending;
    ExecutionState execution_state = ExecutionState::Pending;

    Decimal funding_collected;
    Decimal realized_pnl;
    Decimal high_water_mark;
    int64_t last_funding_at = 0;
    int64_t last_funding_event_at = 0;

    std::string close_reason;
    std::string error;
    int close_attempts = 0;
    int64_t last_close_attempt_at = 0;

    int64_t created_at = 0;
    int64_t opened_at = 0;
    int64_t closed_at = 0;

    // Build a PENDING trade with leg 2 on the opposite side of leg 1
    static Trade create(std::string_view symbol,
                        std::string_view leg1_venue, Side leg1_side,
                        std::string_view leg2_venue,
                        Decimal target_qty, Decimal target_notional,
                        Decimal entry_apy, int64_t now);

    [[nodiscard]] Decimal total_fees() const noexcept { return leg1.fees + leg2.fees; }
    [[nodiscard]] Decimal total_pnl() const noexcept { return realized_pnl + funding_collected; }

    [[nodiscard]] int64_t hold_duration_ms(int64_t now) const noexcept {
        if (opened_at == 0) return 0;
        return (closed_at != 0 ? closed_at : now) - opened_at;
    }

    [[nodiscard]] bool is_active() const noexcept { return fundarb::is_active(status); }

    // Throws ValidationError on a backwards transition
    void advance(ExecutionState next);

    void mark_opened(int64_t now);
    void mark_closed(std::string_view reason, int64_t now);
    void mark_aborted(std::string_view reason, int64_t now);

    [[nodiscard]] const TradeLeg& leg_on(std::string_view venue) const;
    [[nodiscard]] TradeLeg& leg_on(std::string_view venue);
};

// Ranked candidate produced by the opportunity engine
struct Opportunity {
    std::string symbol;
    int64_t timestamp = 0;

    std::string leg1_venue;
    std::string leg2_venue;
    Decimal leg1_rate_hourly;
    Decimal leg2_rate_hourly;
    Decimal net_funding_hourly;
    Decimal apy;
    Decimal spread_pct;
    Decimal mid_price;

    Decimal leg1_bid;
    Decimal leg1_ask;
    Decimal leg2_bid;
    Decimal leg2_ask;

    Decimal suggested_qty;
    Decimal suggested_notional;
    Decimal expected_value_usd;
    Decimal entry_cost_usd;
    Decimal breakeven_hours;
    Decimal liquidity_score;

    std::string long_venue;
    std::string short_venue;

    // Direction of leg 1 on its venue
    [[nodiscard]] Side leg1_side() const noexcept {
        return long_venue == leg1_venue ? Side::Buy : Side::Sell;
    }
};

std::string generate_trade_id();

// JSON forms used by the trade journal
void to_json(nlohmann::json& j, const TradeLeg& leg);
void from_json(const nlohmann::json& j, TradeLeg& leg);
void to_json(nlohmann::json& j, const Trade& trade);
void from_json(const nlohmann::json& j, Trade& trade);

}  // namespace fundarb
