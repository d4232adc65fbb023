// Funding Arb Engine - Market Data Service Implementation

#include <fundarb/market_data.hpp>
#include <fundarb/async.hpp>
#include <fundarb/errors.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

namespace fundarb {

namespace {

std::string market_key(const std::string& venue, const std::string& symbol) {
    return venue + "/" + symbol;
}

}  // namespace

MarketDataService::MarketDataService(ExchangePtr leg1, ExchangePtr leg2,
                                     MarketDataConfig config,
                                     std::chrono::milliseconds call_timeout,
                                     ClockFn clock)
    : leg1_(std::move(leg1)),
      leg2_(std::move(leg2)),
      config_(config),
      call_timeout_(call_timeout),
      clock_(std::move(clock)) {
    if (!leg1_ || !leg2_) {
        throw ValidationError("MarketDataService needs both venue adapters");
    }
    leg1_name_ = std::string(leg1_->name());
    leg2_name_ = std::string(leg2_->name());
}

ExchangePort& MarketDataService::exchange(const std::string& venue) const {
    if (venue == leg1_name_) return *leg1_;
    if (venue == leg2_name_) return *leg2_;
    throw ValidationError("Unknown venue " + venue);
}

OrderbookSnapshot MarketDataService::fetch_l1(ExchangePort& ex, const std::string& symbol) {
    std::string venue{ex.name()};
    auto snap = await_future(ex.get_orderbook_l1(symbol), call_timeout_,
                             "get_orderbook_l1(" + symbol + ")", venue);
    snap.symbol = symbol;
    snap.venue = venue;
    if (snap.updated_at == 0) snap.updated_at = clock_();
    return snap;
}

// Zero fields fall back to the previous snapshot; an inverted fresh book is discarded
OrderbookSnapshot MarketDataService::merge_l1(const OrderbookSnapshot& fresh, const OrderbookSnapshot* prev) {
    if (!prev) return fresh;
    OrderbookSnapshot out = fresh;
    if (!out.bid.is_positive()) out.bid = prev->bid;
    if (!out.ask.is_positive()) out.ask = prev->ask;
    if (!out.bid_qty.is_positive()) out.bid_qty = prev->bid_qty;
    if (!out.ask_qty.is_positive()) out.ask_qty = prev->ask_qty;
    if (out.is_crossed()) {
        out = *prev;
    }
    return out;
}

int MarketDataService::refresh(const std::vector<std::string>& symbols) {
    int clean = 0;
    bool leg1_ok = false;
    bool leg2_ok = false;

    for (const auto& symbol : symbols) {
        bool symbol_ok = true;
        FundingSnapshot funding;
        funding.symbol = symbol;
        std::optional<OrderbookSnapshot> book1;
        std::optional<OrderbookSnapshot> book2;
        std::optional<MarketInfo> info1;
        std::optional<MarketInfo> info2;

        bool need_info1 = !get_market_info(leg1_name_, symbol);
        bool need_info2 = !get_market_info(leg2_name_, symbol);

        try {
            funding.leg1_rate = await_future(leg1_->get_funding_rate(symbol), call_timeout_,
                                             "get_funding_rate(" + symbol + ")", leg1_name_).rate_hourly;
            book1 = fetch_l1(*leg1_, symbol);
            if (need_info1) {
                info1 = await_future(leg1_->get_market_info(symbol), call_timeout_,
                                     "get_market_info(" + symbol + ")", leg1_name_);
            }
            leg1_ok = true;
        } catch (const ExchangeError& e) {
            spdlog::warn("Market data refresh failed for {} on {}: {}", symbol, leg1_name_, e.what());
            symbol_ok = false;
        }

        try {
            funding.leg2_rate = await_future(leg2_->get_funding_rate(symbol), call_timeout_,
                                             "get_funding_rate(" + symbol + ")", leg2_name_).rate_hourly;
            book2 = fetch_l1(*leg2_, symbol);
            if (need_info2) {
                info2 = await_future(leg2_->get_market_info(symbol), call_timeout_,
                                     "get_market_info(" + symbol + ")", leg2_name_);
            }
            leg2_ok = true;
        } catch (const ExchangeError& e) {
            spdlog::warn("Market data refresh failed for {} on {}: {}", symbol, leg2_name_, e.what());
            symbol_ok = false;
        }

        int64_t now = clock_();
        std::unique_lock lock(mutex_);
        if (info1) markets_[market_key(leg1_name_, symbol)] = *info1;
        if (info2) markets_[market_key(leg2_name_, symbol)] = *info2;

        if (book1 || book2) {
            auto& pair = books_[symbol];
            if (book1) pair.leg1 = merge_l1(*book1, pair.leg1.updated_at ? &pair.leg1 : nullptr);
            if (book2) pair.leg2 = merge_l1(*book2, pair.leg2.updated_at ? &pair.leg2 : nullptr);

            auto& price = prices_[symbol];
            price.symbol = symbol;
            price.leg1_mid = pair.leg1.mid_price().value_or(price.leg1_mid);
            price.leg2_mid = pair.leg2.mid_price().value_or(price.leg2_mid);
            price.updated_at = now;
        }

        if (symbol_ok) {
            funding.updated_at = now;
            funding_[symbol] = funding;
            ++clean;
        }
    }

    std::unique_lock lock(mutex_);
    leg1_feed_ok_ = leg1_ok;
    leg2_feed_ok_ = leg2_ok;
    if (leg1_ok || leg2_ok || symbols.empty()) {
        last_success_at_ = clock_();
    }
    spdlog::debug("Market data refreshed: {}/{} symbols clean", clean, symbols.size());
    return clean;
}

std::optional<FundingSnapshot> MarketDataService::get_funding(const std::string& symbol) const {
    std::shared_lock lock(mutex_);
    auto it = funding_.find(symbol);
    if (it == funding_.end()) return std::nullopt;
    return it->second;
}

std::optional<PriceSnapshot> MarketDataService::get_price(const std::string& symbol) const {
    std::shared_lock lock(mutex_);
    auto it = prices_.find(symbol);
    if (it == prices_.end()) return std::nullopt;
    return it->second;
}

std::optional<PairBook> MarketDataService::get_orderbook(const std::string& symbol) const {
    std::shared_lock lock(mutex_);
    auto it = books_.find(symbol);
    if (it == books_.end()) return std::nullopt;
    return it->second;
}

std::optional<MarketInfo> MarketDataService::get_market_info(const std::string& venue,
                                                             const std::string& symbol) const {
    std::shared_lock lock(mutex_);
    auto it = markets_.find(market_key(venue, symbol));
    if (it == markets_.end()) return std::nullopt;
    return it->second;
}

PairBook MarketDataService::get_fresh_orderbook(const std::string& symbol) {
    const int attempts = std::max(1, config_.fresh_retries);
    std::string last_error = "no depth";

    for (int attempt = 0; attempt < attempts; ++attempt) {
        try {
            PairBook pair;
            pair.leg1 = fetch_l1(*leg1_, symbol);
            pair.leg2 = fetch_l1(*leg2_, symbol);

            if (pair.has_depth() && !pair.leg1.is_crossed() && !pair.leg2.is_crossed()) {
                std::unique_lock lock(mutex_);
                books_[symbol] = pair;
                return pair;
            }
            last_error = "incomplete depth";
        } catch (const ExchangeError& e) {
            last_error = e.what();
        }

        if (attempt + 1 < attempts) {
            spdlog::debug("Fresh orderbook for {} not ready ({}), attempt {}/{}",
                          symbol, last_error, attempt + 1, attempts);
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.fresh_retry_delay_ms * (attempt + 1)));
        }
    }

    auto cached = get_orderbook(symbol);
    if (cached && cached->has_depth()) {
        int64_t age = clock_() - cached->oldest_update();
        if (age <= config_.max_fallback_age_ms) {
            spdlog::warn("Using cached orderbook for {} ({}ms old) after fresh fetch failed: {}",
                         symbol, age, last_error);
            return *cached;
        }
    }

    throw ExchangeError("No usable orderbook for " + symbol + ": " + last_error, true);
}

OrderbookDepthSnapshot MarketDataService::get_fresh_depth(const std::string& venue,
                                                          const std::string& symbol, int levels) {
    ExchangePort& ex = exchange(venue);
    int n = levels > 0 ? levels : config_.depth_levels;
    auto depth = await_future(ex.get_orderbook_depth(symbol, n), call_timeout_,
                              "get_orderbook_depth(" + symbol + ")", venue);
    depth.symbol = symbol;
    depth.venue = venue;
    if (depth.updated_at == 0) depth.updated_at = clock_();
    depth.normalize();
    return depth;
}

bool MarketDataService::is_healthy() const {
    std::shared_lock lock(mutex_);
    if (last_success_at_ == 0) return false;
    int64_t window = config_.health_check_interval_ms * config_.health_multiple;
    if (clock_() - last_success_at_ > window) return false;
    return leg1_feed_ok_ || leg2_feed_ok_;
}

std::vector<std::string> MarketDataService::known_symbols() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> out;
    out.reserve(funding_.size());
    for (const auto& [symbol, snap] : funding_) out.push_back(symbol);
    return out;
}

int64_t MarketDataService::last_refresh_at() const {
    std::shared_lock lock(mutex_);
    return last_success_at_;
}

void MarketDataService::put_orderbook(const std::string& symbol, PairBook book) {
    std::unique_lock lock(mutex_);
    books_[symbol] = std::move(book);
}

void MarketDataService::put_funding(FundingSnapshot snapshot) {
    std::unique_lock lock(mutex_);
    leg1_feed_ok_ = true;
    leg2_feed_ok_ = true;
    last_success_at_ = clock_();
    funding_[snapshot.symbol] = std::move(snapshot);
}

}  // namespace fundarb
