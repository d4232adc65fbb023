// Funding Arb Engine - Execution Engine Implementation

#include <fundarb/execution.hpp>
#include <fundarb/errors.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <future>
#include <thread>

namespace fundarb {

namespace {

// Leg 1 counts as filled at 99.9% of target
const Decimal kLeg1SuccessRatio = Decimal::from_double(0.999);

// Book offset used when a side is missing or the book is crossed
const Decimal kFallbackOffset = Decimal::from_double(0.0001);

const Decimal kDefaultTick = Decimal::from_double(0.01);

std::string order_tag(const Trade& trade, const char* what, int attempt) {
    return trade.id + "-" + what + "-" + std::to_string(attempt);
}

Decimal signed_position(const std::optional<Position>& p) {
    return p ? p->signed_quantity() : Decimal::zero();
}

}  // namespace

// =============================================================================
// Helpers
// =============================================================================

Decimal FillTracker::add_order(const Order& order) noexcept {
    Decimal qty = order.filled_quantity;
    if (!qty.is_positive()) return Decimal::zero();
    Decimal price = order.average_price.value_or(order.price.value_or(Decimal::zero()));
    add(qty, price, order.total_fee());
    return qty;
}

SymbolLocks::Guard SymbolLocks::try_acquire(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!held_.insert(symbol).second) return Guard{};
    return Guard{this, symbol};
}

bool SymbolLocks::is_locked(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.count(symbol) != 0;
}

void SymbolLocks::release(const std::string& symbol) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    held_.erase(symbol);
}

Leg1Price compute_leg1_price(const Leg1PriceInput& in, const ExecutionConfig& config) noexcept {
    Leg1Price out;
    const Decimal tick = in.tick.is_positive() ? in.tick : kDefaultTick;

    out.aggressiveness = in.max_attempts > 1
        ? Decimal::from_int(in.attempt) / Decimal::from_int(in.max_attempts - 1)
        : Decimal::zero();

    Decimal bid = in.best_bid.is_positive() ? in.best_bid : in.mid * (Decimal::one() - kFallbackOffset);
    Decimal ask = in.best_ask.is_positive() ? in.best_ask : in.mid * (Decimal::one() + kFallbackOffset);
    if (bid >= ask && in.mid.is_positive()) {
        bid = in.mid * (Decimal::one() - kFallbackOffset);
        ask = in.mid * (Decimal::one() + kFallbackOffset);
    }
    out.best_bid = bid;
    out.best_ask = ask;

    // Thin top of book: start further inside the spread
    if (config.leg1_smart_pricing && config.leg1_maker_floor.is_positive()) {
        Decimal util = in.l1_qty.is_positive() ? in.remaining / in.l1_qty : Decimal::from_int(1000000);
        if (util > config.leg1_depth_trigger) {
            Decimal scale = clamp((util - config.leg1_depth_trigger) / Decimal::from_int(2),
                                  Decimal::zero(), Decimal::one());
            out.smart_floor = clamp(config.leg1_maker_floor +
                                        (Decimal::one() - config.leg1_maker_floor) * scale,
                                    Decimal::zero(), Decimal::one());
            out.aggressiveness = max(out.aggressiveness, out.smart_floor);
        }
    }

    out.capped = min(out.aggressiveness, config.leg1_max_aggressiveness);

    if (in.side == Side::Buy) {
        Decimal target = ask - tick;
        out.price = bid >= target ? bid : (bid + (target - bid) * out.capped).ceil_to(tick);
    } else {
        Decimal target = bid + tick;
        out.price = ask <= target ? ask : (ask - (ask - target) * out.capped).floor_to(tick);
    }
    return out;
}

std::vector<int64_t> attempt_timeouts(int64_t total_ms, int attempts, AttemptSchedule schedule) {
    const int n = std::max(1, attempts);
    std::vector<int64_t> out(static_cast<size_t>(n));

    if (schedule == AttemptSchedule::Equal) {
        for (auto& t : out) t = total_ms / n;
    } else {
        // Weights 1..n so later, more aggressive attempts get longer to fill
        const int64_t weight_sum = static_cast<int64_t>(n) * (n + 1) / 2;
        for (int i = 0; i < n; ++i) out[static_cast<size_t>(i)] = total_ms * (i + 1) / weight_sum;
    }

    int64_t used = 0;
    for (auto t : out) used += t;
    out.back() += total_ms - used;
    return out;
}

Decimal leg2_slippage(int attempt, const ExecutionConfig& config) noexcept {
    return min(config.leg2_base_slippage + config.leg2_slippage_step * Decimal::from_int(attempt),
               config.leg2_max_slippage);
}

Order follow_order(ExchangePort& ex, const Order& placed, std::chrono::milliseconds timeout,
                   int64_t poll_ms, std::chrono::milliseconds call_timeout, ShutdownSignal* shutdown) {
    if (placed.is_done()) return placed;

    Order current = placed;
    const std::string venue{ex.name()};
    auto deadline = std::chrono::steady_clock::now() + timeout;
    auto poll = std::chrono::milliseconds(std::max<int64_t>(1, poll_ms));

    while (std::chrono::steady_clock::now() < deadline) {
        if (shutdown) {
            if (!shutdown->sleep_for(poll)) break;
        } else {
            std::this_thread::sleep_for(poll);
        }
        try {
            auto latest = await_future(ex.get_order(placed.symbol, placed.order_id), call_timeout,
                                       "get_order(" + placed.order_id + ")", venue);
            if (latest) current = *latest;
        } catch (const ExchangeError& e) {
            spdlog::debug("Polling {} on {} failed: {}", placed.order_id, venue, e.what());
        }
        if (current.is_done()) return current;
    }

    try {
        bool cancelled = await_future(ex.cancel_order(placed.symbol, placed.order_id), call_timeout,
                                      "cancel_order(" + placed.order_id + ")", venue);
        if (!cancelled) spdlog::debug("Cancel of {} on {} was a no-op", placed.order_id, venue);
        auto latest = await_future(ex.get_order(placed.symbol, placed.order_id), call_timeout,
                                   "get_order(" + placed.order_id + ")", venue);
        if (latest) current = *latest;
    } catch (const ExchangeError& e) {
        spdlog::warn("Cancel of {} on {} failed: {}", placed.order_id, venue, e.what());
    }
    return current;
}

// =============================================================================
// ExecutionEngine
// =============================================================================

ExecutionEngine::ExecutionEngine(MarketDataService& market_data, TradeStorePtr store, EventBusPtr bus,
                                 const Config& config, ShutdownSignal& shutdown, ClockFn clock)
    : market_data_(market_data),
      store_(std::move(store)),
      bus_(std::move(bus)),
      config_(config),
      shutdown_(shutdown),
      clock_(std::move(clock)),
      mode_(ExecutionMode::Sequential),
      call_timeout_(config.execution.call_timeout_ms) {
    if (!config.execution.mode) {
        throw ValidationError("execution.mode must be set to sequential or parallel");
    }
    if (!store_ || !bus_) {
        throw ValidationError("ExecutionEngine needs a trade store and an event bus");
    }
    mode_ = *config.execution.mode;
    retry_.max_attempts = config.execution.retry_attempts;
    retry_.base_delay = std::chrono::milliseconds(config.execution.retry_base_delay_ms);
}

ExecutionResult ExecutionEngine::execute(const Opportunity& opp) {
    auto guard = locks_.try_acquire(opp.symbol);
    if (!guard) {
        return ExecutionResult::failed("Entry already in progress for " + opp.symbol, "SYMBOL_BUSY");
    }

    std::optional<Trade> trade;
    try {
        pre_check(opp);
        trade = open_trade(opp);
        Baseline base = read_baseline(*trade);

        spdlog::info("Executing {} ({} mode): {} {} on {}, hedge on {}, qty {}, APY {}",
                     trade->symbol, to_string(mode_), to_string(trade->leg1.side),
                     trade->symbol, trade->leg1.venue, trade->leg2.venue,
                     trade->target_qty.to_string(), trade->entry_apy.to_string());

        if (mode_ == ExecutionMode::Sequential) {
            run_sequential(*trade, base);
        } else {
            run_parallel(*trade, base);
        }
        return ExecutionResult::ok(*trade);
    } catch (const DomainError& e) {
        return fail_entry(trade, e);
    }
}

void ExecutionEngine::pre_check(const Opportunity& opp) {
    const auto& exec = config_.execution;

    int active = 0;
    for (const auto& t : store_->list_open_trades()) {
        if (t.symbol == opp.symbol) {
            throw ValidationError("Symbol " + opp.symbol + " already has trade " + t.id, opp.symbol);
        }
        ++active;
    }
    if (active >= config_.trading.max_open_trades) {
        throw ValidationError("Max open trades (" + std::to_string(config_.trading.max_open_trades) +
                              ") reached", opp.symbol);
    }
    if (!opp.suggested_qty.is_positive()) {
        throw ValidationError("Opportunity has no size", opp.symbol);
    }

    PairBook book = market_data_.get_fresh_orderbook(opp.symbol);
    for (const auto* side : {&book.leg1, &book.leg2}) {
        auto spread = side->spread_pct();
        if (!spread || *spread > exec.max_entry_spread_pct) {
            throw ExecutionError("Spread on " + side->venue + " too wide for entry: " +
                                 (spread ? spread->to_string() : std::string("n/a")),
                                 opp.symbol, "SPREAD_TOO_WIDE");
        }
    }

    Decimal leverage = config_.trading.leverage.is_positive() ? config_.trading.leverage : Decimal::one();
    Decimal required = opp.suggested_notional / leverage * exec.balance_buffer;
    for (const auto& venue : {opp.leg1_venue, opp.leg2_venue}) {
        ExchangePort& ex = market_data_.exchange(venue);
        Decimal available = with_retry(retry_, "get_available_balance(" + venue + ")", [&] {
            return await_future(ex.get_available_balance(), call_timeout_,
                                "get_available_balance", venue, &shutdown_);
        }, &shutdown_);
        if (available < required) {
            throw InsufficientBalanceError("Insufficient balance on " + venue + ": need " +
                                           required.to_string() + ", have " + available.to_string(),
                                           required, available, venue);
        }
    }
}

Trade ExecutionEngine::open_trade(const Opportunity& opp) {
    Trade trade = Trade::create(opp.symbol, opp.leg1_venue, opp.leg1_side(), opp.leg2_venue,
                                opp.suggested_qty, opp.suggested_notional, opp.apy, clock_());
    trade.entry_spread = opp.spread_pct;
    store_->create_trade(trade);

    // Persisted as OPENING before any order goes out, so a crash leaves a trail
    trade.status = TradeStatus::Opening;
    persist(trade);
    publish_state(trade, TradeStatus::Pending, "entry started");
    return trade;
}

ExecutionEngine::Baseline ExecutionEngine::read_baseline(const Trade& trade) {
    Baseline base;
    base.leg1 = signed_position(read_position(trade.leg1.venue, trade.symbol));
    base.leg2 = signed_position(read_position(trade.leg2.venue, trade.symbol));
    return base;
}

// =============================================================================
// Modes
// =============================================================================

void ExecutionEngine::run_sequential(Trade& trade, const Baseline& base) {
    try {
        trade.advance(ExecutionState::Leg1Submitted);
        persist(trade);
        execute_leg1(trade, trade.leg1, base.leg1);
        apply_leg1_result(trade);
    } catch (const DomainError& e) {
        if (trade.leg1.filled_qty.is_positive()) {
            compensate(trade, std::string("leg 1 failed: ") + e.what());
        }
        throw;
    }

    try {
        trade.advance(ExecutionState::Leg2Submitted);
        persist(trade);
        execute_leg2(trade, trade.leg2, trade.leg1.filled_qty, base.leg2);
    } catch (const DomainError& e) {
        spdlog::critical("Hedge leg failed for {} with {} live on {}: {}",
                         trade.symbol, trade.leg1.filled_qty.to_string(), trade.leg1.venue, e.what());

        BrokenHedgeDetected ev;
        ev.trade_id = trade.id;
        ev.symbol = trade.symbol;
        ev.missing_venue = trade.leg2.venue;
        ev.remaining_qty = trade.leg1.filled_qty - trade.leg2.filled_qty;
        ev.source = "execution";
        ev.details = {{"error", e.what()}};
        bus_->publish(ev);

        compensate(trade, std::string("leg 2 failed: ") + e.what());
        throw Leg2FailedError(std::string("Hedge leg failed: ") + e.what(), trade.symbol);
    }

    complete(trade);
}

void ExecutionEngine::run_parallel(Trade& trade, const Baseline& base) {
    trade.advance(ExecutionState::Leg1Submitted);
    trade.advance(ExecutionState::Leg2Submitted);
    persist(trade);

    const Trade snapshot = trade;
    TradeLeg leg1 = trade.leg1;
    TradeLeg leg2 = trade.leg2;

    auto run1 = std::async(std::launch::async, [&] { execute_leg1(snapshot, leg1, base.leg1); });
    auto run2 = std::async(std::launch::async, [&] {
        execute_leg2(snapshot, leg2, snapshot.target_qty, base.leg2);
    });

    std::string err1;
    std::string err2;
    try {
        run1.get();
    } catch (const std::exception& e) {
        err1 = e.what();
    }
    try {
        run2.get();
    } catch (const std::exception& e) {
        err2 = e.what();
    }

    trade.leg1 = leg1;
    trade.leg2 = leg2;

    if (!err1.empty() || !err2.empty()) {
        std::string reason = !err1.empty() ? "leg 1 failed: " + err1 : "leg 2 failed: " + err2;
        if (!err1.empty() && !err2.empty()) reason += "; leg 2 failed: " + err2;

        const TradeLeg& survivor = err1.empty() ? trade.leg1 : trade.leg2;
        const TradeLeg& missing = err1.empty() ? trade.leg2 : trade.leg1;
        if (survivor.filled_qty > missing.filled_qty) {
            spdlog::critical("Parallel entry for {} left {} unhedged on {}: {}",
                             trade.symbol, (survivor.filled_qty - missing.filled_qty).to_string(),
                             survivor.venue, reason);
            BrokenHedgeDetected ev;
            ev.trade_id = trade.id;
            ev.symbol = trade.symbol;
            ev.missing_venue = missing.venue;
            ev.remaining_qty = survivor.filled_qty - missing.filled_qty;
            ev.source = "execution";
            ev.details = {{"error", reason}};
            bus_->publish(ev);
        }

        if (trade.leg1.filled_qty.is_positive() || trade.leg2.filled_qty.is_positive()) {
            compensate(trade, reason);
        }
        if (!err1.empty()) throw Leg1FailedError(reason, trade.symbol);
        throw Leg2FailedError(reason, trade.symbol);
    }

    try {
        trim_excess(trade);
        apply_leg1_result(trade);
        trade.leg2.qty = trade.leg1.filled_qty;
    } catch (const DomainError& e) {
        compensate(trade, std::string("size matching failed: ") + e.what());
        throw;
    }
    complete(trade);
}

// =============================================================================
// Leg 1
// =============================================================================

Decimal ExecutionEngine::execute_leg1(const Trade& trade, TradeLeg& leg, Decimal baseline) {
    const auto& cfg = config_.execution;
    ExchangePort& ex = market_data_.exchange(leg.venue);
    const MarketInfo info = market_info(leg.venue, trade.symbol);
    const Decimal target = leg.qty;
    const Decimal done_at = target * kLeg1SuccessRatio;
    const auto timeouts = attempt_timeouts(cfg.leg1_total_timeout_ms, cfg.leg1_max_attempts, cfg.leg1_schedule);
    const int attempts = static_cast<int>(timeouts.size());

    FillTracker fills;
    Decimal last_price;
    auto sync = [&] {
        leg.filled_qty = fills.filled();
        leg.entry_price = fills.average_price();
        leg.fees = fills.fees();
    };

    for (int i = 0; i < attempts; ++i) {
        if (i > 0) {
            absorb_ghost_fill(trade.symbol, leg, baseline, fills, last_price);
            sync();
        }
        if (fills.filled() >= done_at) break;
        shutdown_.check("leg 1 of " + trade.symbol);

        Decimal remaining = target - fills.filled();
        Decimal qty = info.lot_size.is_positive() ? remaining.floor_to(info.lot_size) : remaining;
        if (!qty.is_positive()) break;

        PairBook book = current_book(trade.symbol);
        const OrderbookSnapshot& l1 = book.leg1.venue == leg.venue ? book.leg1 : book.leg2;

        Leg1PriceInput in;
        in.side = leg.side;
        in.best_bid = l1.bid;
        in.best_ask = l1.ask;
        in.mid = l1.mid_price().value_or(last_price);
        in.l1_qty = leg.side == Side::Buy ? l1.bid_qty : l1.ask_qty;
        in.remaining = remaining;
        in.tick = info.tick_size;
        in.attempt = i;
        in.max_attempts = attempts;
        Leg1Price px = compute_leg1_price(in, cfg);
        if (!px.price.is_positive()) {
            spdlog::warn("Leg 1 {} attempt {}: no usable price", trade.symbol, i + 1);
            continue;
        }

        const bool final_attempt = i == attempts - 1;
        TimeInForce tif = (final_attempt && cfg.leg1_final_taker) ? TimeInForce::GTC : TimeInForce::PostOnly;
        auto request = OrderRequest::limit(trade.symbol, leg.side, qty, px.price)
                           .with_tif(tif)
                           .with_client_id(order_tag(trade, "l1", i));
        last_price = px.price;

        spdlog::info("Leg 1 {} attempt {}/{}: {} {} @ {} (aggr {}, book {}/{})",
                     trade.symbol, i + 1, attempts, to_string(leg.side), qty.to_string(),
                     px.price.to_string(), px.capped.to_string(),
                     px.best_bid.to_string(), px.best_ask.to_string());

        try {
            Order placed = await_order(ex.place_order(request), call_timeout_, trade.symbol, leg.venue, &shutdown_);
            leg.order_id = placed.order_id;
            if (placed.status == OrderStatus::Rejected) {
                spdlog::warn("Leg 1 {} attempt {} rejected (post-only would cross)", trade.symbol, i + 1);
                continue;
            }

            Order last = follow_order(ex, placed, std::chrono::milliseconds(timeouts[static_cast<size_t>(i)]),
                                       cfg.leg1_poll_interval_ms, call_timeout_, &shutdown_);
            Decimal got = fills.add_order(last);
            sync();
            if (got.is_positive()) publish_fill(trade, leg, last, got);
        } catch (const OrderRejectedError& e) {
            spdlog::warn("Leg 1 {} attempt {} rejected: {}", trade.symbol, i + 1, e.what());
        } catch (const OrderTimeoutError& e) {
            spdlog::warn("Leg 1 {} attempt {} unconfirmed: {}", trade.symbol, i + 1, e.what());
        } catch (const ExchangeError& e) {
            if (!e.retryable()) throw;
            spdlog::warn("Leg 1 {} attempt {} failed: {}", trade.symbol, i + 1, e.what());
        }
    }

    absorb_ghost_fill(trade.symbol, leg, baseline, fills, last_price);
    sync();

    // Maker attempts exhausted: optionally sweep the remainder
    if (fills.filled() < done_at && cfg.leg1_escalate_to_taker) {
        shutdown_.check("leg 1 escalation of " + trade.symbol);
        Decimal remaining = target - fills.filled();
        Decimal qty = info.lot_size.is_positive() ? remaining.floor_to(info.lot_size) : remaining;
        if (qty.is_positive()) {
            PairBook book = current_book(trade.symbol);
            const OrderbookSnapshot& l1 = book.leg1.venue == leg.venue ? book.leg1 : book.leg2;
            Decimal touch = l1.touch_price(leg.side);
            if (touch.is_positive()) {
                Decimal limit = leg.side == Side::Buy
                    ? (touch * (Decimal::one() + cfg.leg2_max_slippage)).ceil_to(info.tick_size)
                    : (touch * (Decimal::one() - cfg.leg2_max_slippage)).floor_to(info.tick_size);
                auto request = OrderRequest::limit(trade.symbol, leg.side, qty, limit)
                                   .with_tif(TimeInForce::IOC)
                                   .with_client_id(order_tag(trade, "l1-ioc", attempts));
                spdlog::info("Leg 1 {} escalating to taker: {} {} limit {}",
                             trade.symbol, to_string(leg.side), qty.to_string(), limit.to_string());
                try {
                    Order placed = await_order(ex.place_order(request), call_timeout_, trade.symbol,
                                               leg.venue, &shutdown_);
                    leg.order_id = placed.order_id;
                    Order last = follow_order(ex, placed, call_timeout_, cfg.leg1_poll_interval_ms,
                                              call_timeout_, &shutdown_);
                    Decimal got = fills.add_order(last);
                    sync();
                    if (got.is_positive()) publish_fill(trade, leg, last, got);
                } catch (const OrderRejectedError& e) {
                    spdlog::warn("Leg 1 {} taker escalation rejected: {}", trade.symbol, e.what());
                } catch (const OrderTimeoutError& e) {
                    spdlog::warn("Leg 1 {} taker escalation unconfirmed: {}", trade.symbol, e.what());
                    absorb_ghost_fill(trade.symbol, leg, baseline, fills, limit);
                    sync();
                } catch (const ExchangeError& e) {
                    spdlog::warn("Leg 1 {} taker escalation failed: {}", trade.symbol, e.what());
                }
            }
        }
    }

    Decimal notional = fills.notional();
    if (fills.filled() < done_at && notional < cfg.min_hedge_notional_usd) {
        throw Leg1FailedError("Leg 1 filled " + fills.filled().to_string() + " of " + target.to_string() +
                              " (notional " + notional.to_string() + ") below hedgeable minimum " +
                              cfg.min_hedge_notional_usd.to_string(), trade.symbol);
    }

    spdlog::info("Leg 1 {} filled {} of {} @ {} across {} fills",
                 trade.symbol, fills.filled().to_string(), target.to_string(),
                 fills.average_price().to_string(), fills.count());
    return fills.filled();
}

void ExecutionEngine::apply_leg1_result(Trade& trade) {
    if (trade.leg1.filled_qty < trade.target_qty) {
        if (trade.leg1.filled_qty < trade.target_qty * kLeg1SuccessRatio) {
            spdlog::info("Clamping {} target from {} to partial fill {}",
                         trade.symbol, trade.target_qty.to_string(), trade.leg1.filled_qty.to_string());
        }
        trade.target_qty = trade.leg1.filled_qty;
        trade.target_notional_usd = trade.leg1.notional();
    }
    if (can_transition(trade.execution_state, ExecutionState::Leg1Filled)) {
        trade.advance(ExecutionState::Leg1Filled);
    }
    persist(trade);
}

// =============================================================================
// Leg 2
// =============================================================================

void ExecutionEngine::execute_leg2(const Trade& trade, TradeLeg& leg, Decimal qty, Decimal baseline) {
    const auto& cfg = config_.execution;
    ExchangePort& ex = market_data_.exchange(leg.venue);
    const MarketInfo info = market_info(leg.venue, trade.symbol);
    const Decimal tick = info.tick_size.is_positive() ? info.tick_size : kDefaultTick;

    leg.qty = qty;
    FillTracker fills;
    Decimal reference;
    auto sync = [&] {
        leg.filled_qty = fills.filled();
        leg.entry_price = fills.average_price();
        leg.fees = fills.fees();
    };

    for (int attempt = 0; attempt < std::max(1, cfg.leg2_max_attempts); ++attempt) {
        if (attempt > 0) {
            absorb_ghost_fill(trade.symbol, leg, baseline, fills, reference);
            sync();
        }
        Decimal remaining = qty - fills.filled();
        if (!remaining.is_positive()) break;
        if (reference.is_positive() && remaining * reference < cfg.leg2_microfill_usd) break;
        shutdown_.check("leg 2 of " + trade.symbol);

        try {
            OrderbookDepthSnapshot depth = with_retry(retry_, "depth(" + leg.venue + ")", [&] {
                return market_data_.get_fresh_depth(leg.venue, trade.symbol, cfg.leg2_depth_levels);
            }, &shutdown_);

            auto best = leg.side == Side::Buy ? depth.best_ask() : depth.best_bid();
            if (!best) {
                spdlog::warn("Leg 2 {} attempt {}: empty {} book", trade.symbol, attempt + 1, leg.venue);
                continue;
            }
            reference = *best;

            // Beyond the top level, price against the impact-bounded VWAP
            Decimal touch_qty = depth.top().touch_qty(leg.side);
            if (remaining > touch_qty) {
                VwapEstimate est = depth.vwap_within_impact(leg.side, remaining, cfg.leg2_max_impact);
                if (est.ok) {
                    reference = est.worst_price;
                } else {
                    reference = leg.side == Side::Buy ? *best * (Decimal::one() + cfg.leg2_max_impact)
                                                      : *best * (Decimal::one() - cfg.leg2_max_impact);
                }
            }

            Decimal slip = leg2_slippage(attempt, cfg);
            Decimal limit = leg.side == Side::Buy ? (reference * (Decimal::one() + slip)).ceil_to(tick)
                                                  : (reference * (Decimal::one() - slip)).floor_to(tick);
            Decimal size = info.lot_size.is_positive() && remaining >= info.lot_size
                ? remaining.floor_to(info.lot_size) : remaining;

            auto request = OrderRequest::limit(trade.symbol, leg.side, size, limit)
                               .with_tif(TimeInForce::IOC)
                               .with_client_id(order_tag(trade, "l2", attempt));
            spdlog::info("Leg 2 {} attempt {}/{}: {} {} IOC limit {} (slippage {})",
                         trade.symbol, attempt + 1, cfg.leg2_max_attempts, to_string(leg.side),
                         size.to_string(), limit.to_string(), slip.to_string());

            Order placed = await_order(ex.place_order(request),
                                       std::chrono::milliseconds(cfg.leg2_fill_timeout_ms),
                                       trade.symbol, leg.venue, &shutdown_);
            leg.order_id = placed.order_id;
            Order last = follow_order(ex, placed, std::chrono::milliseconds(cfg.leg2_fill_timeout_ms),
                                       cfg.leg1_poll_interval_ms, call_timeout_, &shutdown_);
            Decimal got = fills.add_order(last);
            sync();
            if (got.is_positive()) publish_fill(trade, leg, last, got);
        } catch (const OrderRejectedError& e) {
            spdlog::warn("Leg 2 {} attempt {} rejected: {}", trade.symbol, attempt + 1, e.what());
        } catch (const OrderTimeoutError& e) {
            spdlog::warn("Leg 2 {} attempt {} unconfirmed: {}", trade.symbol, attempt + 1, e.what());
        } catch (const ExchangeError& e) {
            if (!e.retryable()) throw Leg2FailedError(e.what(), trade.symbol);
            spdlog::warn("Leg 2 {} attempt {} failed: {}", trade.symbol, attempt + 1, e.what());
        }
    }

    absorb_ghost_fill(trade.symbol, leg, baseline, fills, reference);
    sync();

    Decimal remaining = qty - fills.filled();
    if (remaining.is_positive()) {
        Decimal price = reference.is_positive() ? reference : fills.average_price();
        if (!price.is_positive() || remaining * price >= cfg.leg2_microfill_usd) {
            throw Leg2FailedError("Hedge filled " + fills.filled().to_string() + " of " + qty.to_string() +
                                  " on " + leg.venue, trade.symbol);
        }
        spdlog::info("Leg 2 {} accepting microfill remainder {}", trade.symbol, remaining.to_string());
    }

    spdlog::info("Leg 2 {} filled {} @ {}", trade.symbol, fills.filled().to_string(),
                 fills.average_price().to_string());
}

// Parallel legs can finish with different sizes; cut the larger back to the smaller
void ExecutionEngine::trim_excess(Trade& trade) {
    Decimal diff = trade.leg1.filled_qty - trade.leg2.filled_qty;
    if (diff.abs() <= config_.close.dust_qty) return;

    TradeLeg& larger = diff.is_positive() ? trade.leg1 : trade.leg2;
    Decimal excess = diff.abs();
    ExchangePort& ex = market_data_.exchange(larger.venue);

    spdlog::warn("Trimming {} excess {} on {}", trade.symbol, excess.to_string(), larger.venue);
    auto request = OrderRequest::market(trade.symbol, opposite(larger.side), excess)
                       .with_reduce_only()
                       .with_client_id(order_tag(trade, "trim", 0));
    Order placed = await_order(ex.place_order(request), call_timeout_, trade.symbol, larger.venue);
    Order last = follow_order(ex, placed, call_timeout_, config_.execution.leg1_poll_interval_ms,
                              call_timeout_, nullptr);
    if (last.filled_quantity < excess * kLeg1SuccessRatio) {
        throw ExecutionError("Could not trim excess on " + larger.venue, trade.symbol);
    }
    larger.filled_qty -= last.filled_quantity;
    larger.fees += last.total_fee();
}

void ExecutionEngine::complete(Trade& trade) {
    trade.advance(ExecutionState::Complete);
    trade.mark_opened(clock_());
    persist(trade);
    publish_state(trade, TradeStatus::Opening, "both legs filled");

    TradeOpened ev;
    ev.trade_id = trade.id;
    ev.symbol = trade.symbol;
    ev.qty = trade.leg1.filled_qty;
    ev.notional_usd = trade.target_notional_usd;
    ev.entry_apy = trade.entry_apy;
    ev.leg1_price = trade.leg1.entry_price;
    ev.leg2_price = trade.leg2.entry_price;
    bus_->publish(ev);

    spdlog::info("Trade {} open: {} qty {} ({} @ {}, {} @ {}), fees {}",
                 trade.id, trade.symbol, trade.leg1.filled_qty.to_string(),
                 trade.leg1.venue, trade.leg1.entry_price.to_string(),
                 trade.leg2.venue, trade.leg2.entry_price.to_string(),
                 trade.total_fees().to_string());
}

// =============================================================================
// Rollback
// =============================================================================

void ExecutionEngine::compensate(Trade& trade, const std::string& reason) {
    if (!rollback(trade, reason)) {
        throw RollbackError("Rollback failed for " + trade.symbol + " after " + reason, trade.symbol);
    }
}

bool ExecutionEngine::rollback(Trade& trade, const std::string& reason) {
    spdlog::warn("Rolling back {} ({}): {}", trade.symbol, trade.id, reason);

    if (can_transition(trade.execution_state, ExecutionState::RollbackQueued)) {
        trade.advance(ExecutionState::RollbackQueued);
    }
    for (const TradeLeg* leg : {&trade.leg1, &trade.leg2}) {
        if (!leg->filled_qty.is_positive()) continue;
        RollbackInitiated ev;
        ev.trade_id = trade.id;
        ev.symbol = trade.symbol;
        ev.reason = reason;
        ev.leg_venue = leg->venue;
        ev.qty = leg->filled_qty;
        bus_->publish(ev);
    }
    if (can_transition(trade.execution_state, ExecutionState::RollbackInProgress)) {
        trade.advance(ExecutionState::RollbackInProgress);
    }
    persist(trade);

    Decimal loss;
    bool ok = true;
    const Decimal fees_before = trade.total_fees();
    for (TradeLeg* leg : {&trade.leg1, &trade.leg2}) {
        if (!leg->filled_qty.is_positive()) continue;
        if (!flatten_leg(trade, *leg, loss)) ok = false;
    }

    // Rollback fees already sit in the legs; only the slippage is realised here
    trade.realized_pnl -= loss - (trade.total_fees() - fees_before);
    if (ok) {
        if (can_transition(trade.execution_state, ExecutionState::RollbackDone)) {
            trade.advance(ExecutionState::RollbackDone);
        }
        spdlog::info("Rollback of {} complete, loss {}", trade.symbol, loss.to_string());
    } else {
        if (can_transition(trade.execution_state, ExecutionState::RollbackFailed)) {
            trade.advance(ExecutionState::RollbackFailed);
        }
        spdlog::critical("ROLLBACK FAILED for {} ({}): exposure may remain. {}", trade.symbol, trade.id, reason);
        bus_->publish(AlertEvent(AlertLevel::Critical, "Rollback failed for " + trade.symbol,
                                 {{"incident", "rollback:" + trade.id},
                                  {"trade_id", trade.id},
                                  {"reason", reason}}));
    }
    persist(trade);

    RollbackCompleted done;
    done.trade_id = trade.id;
    done.symbol = trade.symbol;
    done.success = ok;
    done.loss_usd = loss;
    bus_->publish(done);
    return ok;
}

// Reduce-only market close sized to the live position. Confirmed by the fill,
// then by order status, then by a flat position.
bool ExecutionEngine::flatten_leg(const Trade& trade, TradeLeg& leg, Decimal& loss) {
    const auto& cfg = config_.execution;
    ExchangePort& ex = market_data_.exchange(leg.venue);
    const auto timeout = std::chrono::milliseconds(cfg.rollback_timeout_ms);
    Backoff backoff(std::chrono::milliseconds(cfg.retry_base_delay_ms), std::chrono::milliseconds(5000));

    for (int attempt = 0; attempt < std::max(1, cfg.rollback_max_attempts); ++attempt) {
        try {
            auto live = await_future(ex.get_position(trade.symbol), call_timeout_,
                                     "get_position(" + trade.symbol + ")", leg.venue);
            if (!live || live->side != leg.side || live->quantity <= config_.close.dust_qty) {
                spdlog::info("Rollback {} on {}: already flat", trade.symbol, leg.venue);
                return true;
            }

            Decimal qty = live->quantity;
            auto request = OrderRequest::market(trade.symbol, opposite(leg.side), qty)
                               .with_reduce_only()
                               .with_client_id(order_tag(trade, "rb", attempt));
            Order placed = await_order(ex.place_order(request), timeout, trade.symbol, leg.venue);
            Order last = follow_order(ex, placed, timeout, config_.close.poll_interval_ms,
                                      call_timeout_, nullptr);

            if (last.filled_quantity.is_positive()) {
                Decimal px = last.average_price.value_or(leg.entry_price);
                Decimal fee = last.total_fee();
                loss += (px - leg.entry_price).abs() * last.filled_quantity + fee;
                leg.exit_price = px;
                leg.fees += fee;
            }

            if (last.filled_quantity >= qty || last.status == OrderStatus::Filled) return true;

            auto after = await_future(ex.get_position(trade.symbol), call_timeout_,
                                      "get_position(" + trade.symbol + ")", leg.venue);
            if (!after || after->side != leg.side || after->quantity <= config_.close.dust_qty) return true;

            spdlog::warn("Rollback {} on {}: {} still open after attempt {}",
                         trade.symbol, leg.venue, after->quantity.to_string(), attempt + 1);
        } catch (const DomainError& e) {
            spdlog::error("Rollback {} on {} attempt {} failed: {}", trade.symbol, leg.venue, attempt + 1, e.what());
        }
        std::this_thread::sleep_for(backoff.next());
    }
    return false;
}

// =============================================================================
// Order and venue plumbing
// =============================================================================

// A fill the order channel never reported shows up in the live position
void ExecutionEngine::absorb_ghost_fill(const std::string& symbol, const TradeLeg& leg, Decimal baseline,
                                        FillTracker& fills, Decimal attempt_price) {
    std::optional<Position> live;
    try {
        live = read_position(leg.venue, symbol);
    } catch (const ExchangeError& e) {
        spdlog::warn("Ghost fill check for {} on {} skipped: {}", symbol, leg.venue, e.what());
        return;
    }

    Decimal moved = signed_position(live) - baseline;
    if (leg.side == Side::Sell) moved = -moved;
    Decimal ghost = moved - fills.filled();
    Decimal tolerance = leg.qty * config_.execution.ghost_fill_tolerance;
    if (ghost <= tolerance) return;

    Decimal price = fills.filled().is_positive() ? fills.average_price() : attempt_price;
    spdlog::warn("Ghost fill on {} {}: position shows {} untracked, valued at {}",
                 leg.venue, symbol, ghost.to_string(), price.to_string());
    fills.add(ghost, price);
}

std::optional<Position> ExecutionEngine::read_position(const std::string& venue, const std::string& symbol) {
    ExchangePort& ex = market_data_.exchange(venue);
    return with_retry(retry_, "get_position(" + symbol + "@" + venue + ")", [&] {
        return await_future(ex.get_position(symbol), call_timeout_, "get_position(" + symbol + ")", venue);
    });
}

PairBook ExecutionEngine::current_book(const std::string& symbol) {
    try {
        return market_data_.get_fresh_orderbook(symbol);
    } catch (const ExchangeError& e) {
        auto cached = market_data_.get_orderbook(symbol);
        if (!cached) throw;
        spdlog::warn("Using cached book for {}: {}", symbol, e.what());
        return *cached;
    }
}

MarketInfo ExecutionEngine::market_info(const std::string& venue, const std::string& symbol) {
    if (auto cached = market_data_.get_market_info(venue, symbol)) return *cached;
    ExchangePort& ex = market_data_.exchange(venue);
    return with_retry(retry_, "get_market_info(" + symbol + "@" + venue + ")", [&] {
        return await_future(ex.get_market_info(symbol), call_timeout_, "get_market_info(" + symbol + ")", venue);
    });
}

void ExecutionEngine::persist(const Trade& trade) {
    auto stored = store_->modify_trade(trade.id, [&trade](Trade& t) {
        // The reconciler may already have finished this trade
        if (is_terminal(t.status) && !is_terminal(trade.status)) return false;
        t = trade;
        return true;
    });
    if (!stored) {
        throw ExecutionError("Trade " + trade.id + " vanished from the store", trade.symbol);
    }
    if (is_terminal(stored->status) && !is_terminal(trade.status)) {
        spdlog::warn("Trade {} was closed externally ({}) during entry", trade.id, to_string(stored->status));
    }
}

void ExecutionEngine::publish_fill(const Trade& trade, const TradeLeg& leg, const Order& order, Decimal qty) {
    LegFilled ev;
    ev.trade_id = trade.id;
    ev.symbol = trade.symbol;
    ev.venue = leg.venue;
    ev.side = leg.side;
    ev.order_id = order.order_id;
    ev.qty = qty;
    ev.price = order.average_price.value_or(order.price.value_or(Decimal::zero()));
    ev.fee = order.total_fee();
    bus_->publish(ev);
}

void ExecutionEngine::publish_state(const Trade& trade, TradeStatus from, const std::string& reason) {
    TradeStateChanged ev;
    ev.trade_id = trade.id;
    ev.symbol = trade.symbol;
    ev.old_status = from;
    ev.new_status = trade.status;
    ev.reason = reason;
    bus_->publish(ev);
}

ExecutionResult ExecutionEngine::fail_entry(std::optional<Trade>& trade, const DomainError& error) {
    spdlog::error("Entry for {} failed [{}]: {}", error.symbol(), error.code(), error.what());
    if (!trade) {
        return ExecutionResult::failed(error.what(), error.code());
    }

    TradeStatus from = trade->status;
    trade->error = error.what();
    try {
        if (trade->execution_state == ExecutionState::RollbackFailed) {
            // Exposure remains; hand the trade to position management
            trade->mark_opened(clock_());
            persist(*trade);
            publish_state(*trade, from, "rollback failed, monitoring live legs");
        } else if (!is_terminal(trade->status)) {
            trade->mark_aborted(error.code(), clock_());
            persist(*trade);
            publish_state(*trade, from, error.what());
        }
    } catch (const DomainError& e) {
        spdlog::error("Could not record failed entry {}: {}", trade->id, e.what());
    }
    return ExecutionResult::failed(error.what(), error.code(), trade);
}

}  // namespace fundarb
