// Funding Arb Engine - Orderbook Snapshot Implementation

#include <fundarb/orderbook.hpp>
#include <algorithm>

namespace fundarb {

namespace {

VwapEstimate walk_levels(const std::vector<PriceLevel>& levels, Decimal quantity,
                         std::optional<Decimal> price_limit, bool ascending) {
    VwapEstimate est;
    Decimal remaining = quantity;
    Decimal total_value;

    for (const auto& level : levels) {
        if (!remaining.is_positive()) break;
        if (price_limit) {
            bool beyond = ascending ? level.price > *price_limit : level.price < *price_limit;
            if (beyond) break;
        }

        Decimal fill_qty = min(remaining, level.quantity);
        total_value += fill_qty * level.price;
        est.filled_qty += fill_qty;
        est.worst_price = level.price;
        remaining -= fill_qty;
    }

    if (est.filled_qty.is_positive()) {
        est.vwap = total_value / est.filled_qty;
    }
    est.ok = est.filled_qty.is_positive() && !remaining.is_positive();
    return est;
}

}  // namespace

OrderbookSnapshot OrderbookDepthSnapshot::top() const {
    OrderbookSnapshot snap;
    snap.symbol = symbol;
    snap.venue = venue;
    snap.updated_at = updated_at;
    if (!bids.empty()) {
        snap.bid = bids.front().price;
        snap.bid_qty = bids.front().quantity;
    }
    if (!asks.empty()) {
        snap.ask = asks.front().price;
        snap.ask_qty = asks.front().quantity;
    }
    return snap;
}

void OrderbookDepthSnapshot::normalize() {
    std::sort(bids.begin(), bids.end(),
        [](const PriceLevel& a, const PriceLevel& b) { return a.price > b.price; });
    std::sort(asks.begin(), asks.end(),
        [](const PriceLevel& a, const PriceLevel& b) { return a.price < b.price; });
}

VwapEstimate OrderbookDepthSnapshot::vwap_within_impact(
    Side side, Decimal quantity, Decimal max_impact) const {
    // Buyer consumes asks upward, seller consumes bids downward
    const auto& levels = (side == Side::Buy) ? asks : bids;
    if (levels.empty() || !quantity.is_positive()) return {};

    Decimal best = levels.front().price;
    Decimal limit = (side == Side::Buy)
        ? best * (Decimal::one() + max_impact)
        : best * (Decimal::one() - max_impact);
    return walk_levels(levels, quantity, limit, side == Side::Buy);
}

std::optional<Decimal> OrderbookDepthSnapshot::vwap(Side side, Decimal quantity) const {
    const auto& levels = (side == Side::Buy) ? asks : bids;
    auto est = walk_levels(levels, quantity, std::nullopt, side == Side::Buy);
    if (est.filled_qty.is_zero()) return std::nullopt;
    return est.vwap;
}

}  // namespace fundarb
