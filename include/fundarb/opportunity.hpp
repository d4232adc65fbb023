// Funding Arb Engine - Opportunity Engine
// Filters and scores funding spreads between the two venues

#pragma once

#include <fundarb/config.hpp>
#include <fundarb/market_data.hpp>
#include <fundarb/models.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fundarb {

inline constexpr int64_t HOURS_PER_YEAR = 24 * 365;

// Breakeven reported when the position never pays back its entry cost
inline constexpr int64_t NEVER_BREAKEVEN_HOURS = 999;

// Cost and value of entering one opportunity
struct EntryScore {
    Decimal fees;
    Decimal spread_cost;
    Decimal entry_cost;
    Decimal funding_per_hour;
    Decimal hold_hours;
    Decimal expected_value;
    Decimal ev_per_hour;
    Decimal breakeven_hours;
};

struct EntryScoreInput {
    Decimal notional;
    Decimal net_rate_hourly;
    Decimal long_exec_price;   // ask on the long venue
    Decimal short_exec_price;  // bid on the short venue
    Decimal fees;
    Decimal hold_hours;
};

[[nodiscard]] EntryScore score_entry(const EntryScoreInput& in) noexcept;

// 1.0 when the order is a small fraction of the average top-of-book size,
// falling to 0.2 when it exceeds it
[[nodiscard]] Decimal liquidity_score(const PairBook& book, Decimal qty) noexcept;

// Fractional fee rate of a round trip: maker-chased leg 1 entry weighted by
// fill probability, taker leg 2 entry, and a weighted exit on both legs
[[nodiscard]] Decimal round_trip_fee_rate(const FeeConfig& leg1, const FeeConfig& leg2,
                                          Decimal maker_fill_probability) noexcept;

class OpportunityEngine {
public:
    OpportunityEngine(const MarketDataService& market_data, const Config& config,
                      ClockFn clock = now_ms);

    OpportunityEngine(const OpportunityEngine&) = delete;
    OpportunityEngine& operator=(const OpportunityEngine&) = delete;

    // Score one symbol. On rejection returns nullopt and fills reject_reason.
    std::optional<Opportunity> evaluate(const std::string& symbol,
                                        std::string* reject_reason = nullptr) const;

    // Every tradable opportunity, best expected value first
    std::vector<Opportunity> scan(const std::vector<std::string>& symbols,
                                  const std::set<std::string>& exclude = {}) const;

    std::optional<Opportunity> best_opportunity(const std::vector<std::string>& symbols,
                                                const std::set<std::string>& exclude = {}) const;

    // Highest APY among tradable symbols, used for rotation decisions
    [[nodiscard]] std::optional<Decimal> best_apy(const std::vector<std::string>& symbols,
                                                  const std::set<std::string>& exclude = {}) const;

private:
    [[nodiscard]] bool is_blacklisted(const std::string& symbol) const;
    [[nodiscard]] Decimal size_quantity(const std::string& symbol, Decimal mid) const;

    const MarketDataService& market_data_;
    const Config& config_;
    ClockFn clock_;
};

}  // namespace fundarb
