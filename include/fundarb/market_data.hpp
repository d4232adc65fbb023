// Funding Arb Engine - Market Data Service
// Cached funding, price and orderbook snapshots for both venues

#pragma once

#include <fundarb/config.hpp>
#include <fundarb/exchange.hpp>
#include <fundarb/orderbook.hpp>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace fundarb {

// Hourly funding of one symbol on both venues
struct FundingSnapshot {
    std::string symbol;
    Decimal leg1_rate;
    Decimal leg2_rate;
    int64_t updated_at = 0;

    // Hourly carry of being short leg 1 and long leg 2
    [[nodiscard]] Decimal spread() const noexcept { return leg1_rate - leg2_rate; }
};

struct PriceSnapshot {
    std::string symbol;
    Decimal leg1_mid;
    Decimal leg2_mid;
    int64_t updated_at = 0;

    [[nodiscard]] Decimal mid() const noexcept {
        if (leg1_mid.is_positive() && leg2_mid.is_positive()) {
            return (leg1_mid + leg2_mid) / Decimal::from_int(2);
        }
        return leg1_mid.is_positive() ? leg1_mid : leg2_mid;
    }
};

class MarketDataService {
public:
    MarketDataService(ExchangePtr leg1, ExchangePtr leg2,
                      MarketDataConfig config,
                      std::chrono::milliseconds call_timeout = std::chrono::milliseconds(5000),
                      ClockFn clock = now_ms);

    MarketDataService(const MarketDataService&) = delete;
    MarketDataService& operator=(const MarketDataService&) = delete;

    // Pull funding, top of book and market info for every symbol.
    // Per-venue failures are logged; returns how many symbols refreshed cleanly.
    int refresh(const std::vector<std::string>& symbols);

    [[nodiscard]] std::optional<FundingSnapshot> get_funding(const std::string& symbol) const;
    [[nodiscard]] std::optional<PriceSnapshot> get_price(const std::string& symbol) const;
    [[nodiscard]] std::optional<PairBook> get_orderbook(const std::string& symbol) const;
    [[nodiscard]] std::optional<MarketInfo> get_market_info(const std::string& venue,
                                                            const std::string& symbol) const;

    // Bounded retries until both venues quote both sides; otherwise the cached
    // book if younger than max_fallback_age; otherwise ExchangeError
    PairBook get_fresh_orderbook(const std::string& symbol);

    // Multi-level book of one venue, fetched now
    OrderbookDepthSnapshot get_fresh_depth(const std::string& venue, const std::string& symbol,
                                           int levels = 0);

    // A refresh succeeded recently and at least one venue feed is up
    [[nodiscard]] bool is_healthy() const;

    [[nodiscard]] std::vector<std::string> known_symbols() const;
    [[nodiscard]] int64_t last_refresh_at() const;

    [[nodiscard]] const std::string& leg1_venue() const noexcept { return leg1_name_; }
    [[nodiscard]] const std::string& leg2_venue() const noexcept { return leg2_name_; }

    [[nodiscard]] ExchangePort& exchange(const std::string& venue) const;

    // Test and bootstrap hook: seed the cache directly
    void put_orderbook(const std::string& symbol, PairBook book);
    void put_funding(FundingSnapshot snapshot);

private:
    OrderbookSnapshot fetch_l1(ExchangePort& ex, const std::string& symbol);
    static OrderbookSnapshot merge_l1(const OrderbookSnapshot& fresh, const OrderbookSnapshot* prev);

    ExchangePtr leg1_;
    ExchangePtr leg2_;
    std::string leg1_name_;
    std::string leg2_name_;
    MarketDataConfig config_;
    std::chrono::milliseconds call_timeout_;
    ClockFn clock_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, FundingSnapshot> funding_;
    std::map<std::string, PriceSnapshot> prices_;
    std::map<std::string, PairBook> books_;
    std::map<std::string, MarketInfo> markets_;  // keyed venue + "/" + symbol

    int64_t last_success_at_ = 0;
    bool leg1_feed_ok_ = false;
    bool leg2_feed_ok_ = false;
};

}  // namespace fundarb
