// Funding Arb Engine - Orderbook Snapshots
// Top-of-book and depth views of a single venue, plus the paired view used for entries

#pragma once

#include <fundarb/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace fundarb {

// Best bid/ask of one venue
struct OrderbookSnapshot {
    std::string symbol;
    std::string venue;
    Decimal bid;
    Decimal bid_qty;
    Decimal ask;
    Decimal ask_qty;
    int64_t updated_at = 0;

    // Both sides quoted with non-zero size
    [[nodiscard]] bool has_depth() const noexcept {
        return bid.is_positive() && ask.is_positive() &&
               bid_qty.is_positive() && ask_qty.is_positive();
    }

    [[nodiscard]] bool is_crossed() const noexcept {
        return bid.is_positive() && ask.is_positive() && bid >= ask;
    }

    [[nodiscard]] std::optional<Decimal> mid_price() const noexcept {
        if (!bid.is_positive() || !ask.is_positive()) return std::nullopt;
        return (bid + ask) / Decimal::from_int(2);
    }

    [[nodiscard]] std::optional<Decimal> spread_pct() const noexcept {
        auto mid = mid_price();
        if (!mid || !mid->is_positive()) return std::nullopt;
        return (ask - bid) / *mid;
    }

    // Price and size a taker on `side` would hit first
    [[nodiscard]] Decimal touch_price(Side side) const noexcept { return side == Side::Buy ? ask : bid; }
    [[nodiscard]] Decimal touch_qty(Side side) const noexcept { return side == Side::Buy ? ask_qty : bid_qty; }

    [[nodiscard]] bool is_stale(int64_t now, int64_t max_age_ms) const noexcept {
        return updated_at == 0 || now - updated_at > max_age_ms;
    }
};

// Result of walking the book for a taker order
struct VwapEstimate {
    Decimal vwap;
    Decimal filled_qty;
    Decimal worst_price;
    bool ok = false;  // target filled completely inside the impact window
};

// Multi-level book of one venue; bids descending, asks ascending
struct OrderbookDepthSnapshot {
    std::string symbol;
    std::string venue;
    std::vector<PriceLevel> bids;
    std::vector<PriceLevel> asks;
    int64_t updated_at = 0;

    [[nodiscard]] std::optional<Decimal> best_bid() const noexcept {
        return bids.empty() ? std::nullopt : std::optional<Decimal>(bids.front().price);
    }

    [[nodiscard]] std::optional<Decimal> best_ask() const noexcept {
        return asks.empty() ? std::nullopt : std::optional<Decimal>(asks.front().price);
    }

    [[nodiscard]] OrderbookSnapshot top() const;

    // Sort levels into canonical order
    void normalize();

    // VWAP for consuming `quantity` on `side` without moving beyond
    // best * (1 +/- max_impact)
    [[nodiscard]] VwapEstimate vwap_within_impact(Side side, Decimal quantity, Decimal max_impact) const;

    // Unbounded VWAP for `quantity`, nullopt on an empty side
    [[nodiscard]] std::optional<Decimal> vwap(Side side, Decimal quantity) const;
};

// Leg 1 venue and leg 2 venue books for one symbol
struct PairBook {
    OrderbookSnapshot leg1;
    OrderbookSnapshot leg2;

    [[nodiscard]] bool has_depth() const noexcept { return leg1.has_depth() && leg2.has_depth(); }

    [[nodiscard]] int64_t oldest_update() const noexcept {
        return leg1.updated_at < leg2.updated_at ? leg1.updated_at : leg2.updated_at;
    }
};

}  // namespace fundarb
