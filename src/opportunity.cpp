// Funding Arb Engine - Opportunity Engine Implementation

#include <fundarb/opportunity.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace fundarb {

// =============================================================================
// Scoring
// =============================================================================

EntryScore score_entry(const EntryScoreInput& in) noexcept {
    EntryScore s;
    s.fees = in.fees;
    s.hold_hours = max(Decimal::one(), in.hold_hours);

    // Directional cost of crossing both books: buy the ask, sell the bid
    if (in.long_exec_price.is_positive()) {
        s.spread_cost = (in.long_exec_price - in.short_exec_price) * in.notional / in.long_exec_price;
    }

    s.entry_cost = s.fees + s.spread_cost;
    s.funding_per_hour = in.notional * in.net_rate_hourly;
    s.expected_value = s.funding_per_hour * s.hold_hours - s.entry_cost;
    s.ev_per_hour = s.funding_per_hour - s.entry_cost / s.hold_hours;

    if (s.ev_per_hour.is_positive()) {
        s.breakeven_hours = s.entry_cost / s.ev_per_hour;
    } else {
        s.breakeven_hours = Decimal::from_int(NEVER_BREAKEVEN_HOURS);
    }
    return s;
}

Decimal liquidity_score(const PairBook& book, Decimal qty) noexcept {
    if (!book.leg1.updated_at && !book.leg2.updated_at) {
        return Decimal::from_double(0.5);
    }

    Decimal avg = (book.leg1.bid_qty + book.leg1.ask_qty +
                   book.leg2.bid_qty + book.leg2.ask_qty) / Decimal::from_int(4);
    if (!avg.is_positive()) return Decimal::zero();

    Decimal ratio = qty / avg;
    if (ratio < Decimal::from_double(0.1)) return Decimal::one();
    if (ratio < Decimal::from_double(0.5)) return Decimal::from_double(0.8);
    if (ratio < Decimal::one()) return Decimal::from_double(0.5);
    return Decimal::from_double(0.2);
}

Decimal round_trip_fee_rate(const FeeConfig& leg1, const FeeConfig& leg2,
                            Decimal maker_fill_probability) noexcept {
    Decimal p = clamp(maker_fill_probability, Decimal::zero(), Decimal::one());
    Decimal q = Decimal::one() - p;

    Decimal leg1_weighted = leg1.maker * p + leg1.taker * q;
    Decimal leg2_weighted = leg2.maker * p + leg2.taker * q;

    Decimal entry = leg1_weighted + leg2.taker;
    Decimal exit = leg1_weighted + leg2_weighted;
    return entry + exit;
}

// =============================================================================
// OpportunityEngine
// =============================================================================

OpportunityEngine::OpportunityEngine(const MarketDataService& market_data, const Config& config,
                                     ClockFn clock)
    : market_data_(market_data), config_(config), clock_(std::move(clock)) {}

bool OpportunityEngine::is_blacklisted(const std::string& symbol) const {
    const auto& bl = config_.trading.blacklist;
    return std::find(bl.begin(), bl.end(), symbol) != bl.end();
}

// Target notional at mid, rounded down to the coarser lot of the two venues
Decimal OpportunityEngine::size_quantity(const std::string& symbol, Decimal mid) const {
    if (!mid.is_positive()) return Decimal::zero();
    Decimal qty = config_.trading.notional_usd / mid;

    auto info1 = market_data_.get_market_info(market_data_.leg1_venue(), symbol);
    auto info2 = market_data_.get_market_info(market_data_.leg2_venue(), symbol);

    Decimal lot;
    Decimal min_qty;
    for (const auto* info : {info1 ? &*info1 : nullptr, info2 ? &*info2 : nullptr}) {
        if (!info) continue;
        lot = max(lot, info->lot_size);
        min_qty = max(min_qty, info->min_quantity);
        if (info->min_notional && qty * mid < *info->min_notional) {
            return Decimal::zero();
        }
    }
    if (lot.is_positive()) qty = qty.floor_to(lot);
    if (qty < min_qty) return Decimal::zero();
    return qty;
}

std::optional<Opportunity> OpportunityEngine::evaluate(const std::string& symbol,
                                                       std::string* reject_reason) const {
    auto reject = [&](const std::string& why) -> std::optional<Opportunity> {
        spdlog::debug("Opportunity {} rejected: {}", symbol, why);
        if (reject_reason) *reject_reason = why;
        return std::nullopt;
    };

    const auto& trading = config_.trading;
    int64_t now = clock_();

    if (is_blacklisted(symbol)) return reject("blacklisted");

    auto price = market_data_.get_price(symbol);
    if (!price || !price->mid().is_positive()) return reject("no price");
    if (now - price->updated_at > trading.max_price_age_ms) return reject("stale price");

    auto funding = market_data_.get_funding(symbol);
    if (!funding) return reject("no funding");

    // Short the venue paying the higher rate, long the other
    const bool short_leg1 = funding->leg1_rate > funding->leg2_rate;
    Decimal net_hourly = (funding->leg1_rate - funding->leg2_rate).abs();
    Decimal apy = net_hourly * Decimal::from_int(HOURS_PER_YEAR);
    if (apy < trading.min_apy) return reject("apy " + apy.to_string() + " below minimum");

    auto book = market_data_.get_orderbook(symbol);
    if (!book) return reject("no orderbook");
    if (book->oldest_update() == 0 || now - book->oldest_update() > trading.max_price_age_ms) {
        return reject("stale orderbook");
    }

    const OrderbookSnapshot& long_book = short_leg1 ? book->leg2 : book->leg1;
    const OrderbookSnapshot& short_book = short_leg1 ? book->leg1 : book->leg2;
    if (!long_book.ask.is_positive() || !long_book.ask_qty.is_positive()) {
        return reject("no ask on long venue");
    }
    if (!short_book.bid.is_positive() || !short_book.bid_qty.is_positive()) {
        return reject("no bid on short venue");
    }

    Decimal mid = price->mid();
    Decimal spread_pct = (long_book.ask - short_book.bid) / mid;
    if (spread_pct > trading.max_spread_pct) {
        return reject("entry spread " + spread_pct.to_string() + " too wide");
    }

    Decimal qty = size_quantity(symbol, mid);
    if (!qty.is_positive()) return reject("size below venue minimum");
    Decimal notional = qty * mid;

    Decimal fee_rate = round_trip_fee_rate(config_.fees_for(market_data_.leg1_venue()),
                                           config_.fees_for(market_data_.leg2_venue()),
                                           trading.maker_fill_probability);

    EntryScoreInput in;
    in.notional = notional;
    in.net_rate_hourly = net_hourly;
    in.long_exec_price = long_book.ask;
    in.short_exec_price = short_book.bid;
    in.fees = notional * fee_rate;
    in.hold_hours = min(trading.hold_hours_for_ev, config_.exit.max_hold_hours);
    EntryScore score = score_entry(in);

    if (score.expected_value < trading.min_expected_value_usd) {
        return reject("expected value " + score.expected_value.to_string() + " too low");
    }
    if (score.breakeven_hours > trading.max_breakeven_hours) {
        return reject("breakeven " + score.breakeven_hours.to_string() + "h too long");
    }

    Decimal liquidity = liquidity_score(*book, qty);
    if (liquidity < trading.min_liquidity_score) {
        return reject("liquidity score " + liquidity.to_string() + " too low");
    }

    Opportunity opp;
    opp.symbol = symbol;
    opp.timestamp = now;
    opp.leg1_venue = market_data_.leg1_venue();
    opp.leg2_venue = market_data_.leg2_venue();
    opp.leg1_rate_hourly = funding->leg1_rate;
    opp.leg2_rate_hourly = funding->leg2_rate;
    opp.net_funding_hourly = net_hourly;
    opp.apy = apy;
    opp.spread_pct = spread_pct;
    opp.mid_price = mid;
    opp.leg1_bid = book->leg1.bid;
    opp.leg1_ask = book->leg1.ask;
    opp.leg2_bid = book->leg2.bid;
    opp.leg2_ask = book->leg2.ask;
    opp.suggested_qty = qty;
    opp.suggested_notional = notional;
    opp.expected_value_usd = score.expected_value;
    opp.entry_cost_usd = score.entry_cost;
    opp.breakeven_hours = score.breakeven_hours;
    opp.liquidity_score = liquidity;
    opp.long_venue = short_leg1 ? opp.leg2_venue : opp.leg1_venue;
    opp.short_venue = short_leg1 ? opp.leg1_venue : opp.leg2_venue;
    return opp;
}

std::vector<Opportunity> OpportunityEngine::scan(const std::vector<std::string>& symbols,
                                                 const std::set<std::string>& exclude) const {
    std::vector<Opportunity> out;
    for (const auto& symbol : symbols) {
        if (exclude.count(symbol) != 0) continue;
        if (auto opp = evaluate(symbol)) out.push_back(std::move(*opp));
    }

    std::sort(out.begin(), out.end(), [](const Opportunity& a, const Opportunity& b) {
        if (a.expected_value_usd != b.expected_value_usd) {
            return a.expected_value_usd > b.expected_value_usd;
        }
        return a.apy > b.apy;
    });

    if (!out.empty()) {
        spdlog::debug("Scan found {} opportunities, best {} at APY {}",
                      out.size(), out.front().symbol, out.front().apy.to_string());
    }
    return out;
}

std::optional<Opportunity> OpportunityEngine::best_opportunity(
    const std::vector<std::string>& symbols, const std::set<std::string>& exclude) const {
    auto all = scan(symbols, exclude);
    if (all.empty()) return std::nullopt;
    return all.front();
}

std::optional<Decimal> OpportunityEngine::best_apy(const std::vector<std::string>& symbols,
                                                   const std::set<std::string>& exclude) const {
    std::optional<Decimal> best;
    for (const auto& opp : scan(symbols, exclude)) {
        if (!best || opp.apy > *best) best = opp.apy;
    }
    return best;
}

}  // namespace fundarb
