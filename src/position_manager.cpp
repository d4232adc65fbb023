// Funding Arb Engine - Position Manager Implementation

#include <fundarb/position_manager.hpp>
#include <fundarb/errors.hpp>
#include <fundarb/opportunity.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace fundarb {

namespace {

std::string close_tag(const Trade& trade, const char* what, int n) {
    return trade.id + "-" + what + "-" + std::to_string(n);
}

}  // namespace

PositionManager::PositionManager(MarketDataService& market_data, TradeStorePtr store, EventBusPtr bus,
                                 const Config& config, ClockFn clock)
    : market_data_(market_data),
      store_(std::move(store)),
      bus_(std::move(bus)),
      config_(config),
      clock_(std::move(clock)),
      call_timeout_(config.execution.call_timeout_ms) {
    retry_.max_attempts = config.execution.retry_attempts;
    retry_.base_delay = std::chrono::milliseconds(config.execution.retry_base_delay_ms);
}

// =============================================================================
// Monitoring
// =============================================================================

int PositionManager::check_trades() {
    int acted = 0;
    for (const auto& trade : store_->list_trades(TradeStatus::Open)) {
        try {
            if (check_trade(trade)) ++acted;
        } catch (const DomainError& e) {
            spdlog::error("Position check for {} ({}) failed: {}", trade.symbol, trade.id, e.what());
        }
    }
    return acted;
}

bool PositionManager::check_trade(const Trade& trade) {
    if (trade.status != TradeStatus::Open) return false;
    const int64_t now = clock_();

    std::optional<Position> live1;
    std::optional<Position> live2;
    try {
        live1 = read_position(trade.leg1.venue, trade.symbol);
        live2 = read_position(trade.leg2.venue, trade.symbol);
    } catch (const ExchangeError& e) {
        spdlog::warn("Skipping {} this pass, positions unavailable: {}", trade.symbol, e.what());
        return false;
    }

    const bool has1 = leg_present(trade.leg1, live1);
    const bool has2 = leg_present(trade.leg2, live2);

    if (has1 != has2) {
        if (trade.opened_at != 0 && now - trade.opened_at < config_.close.broken_hedge_min_age_ms) {
            spdlog::debug("{} leg missing but trade is younger than the broken-hedge minimum age", trade.symbol);
            return false;
        }
        const TradeLeg& survivor = has1 ? trade.leg1 : trade.leg2;
        const TradeLeg& missing = has1 ? trade.leg2 : trade.leg1;
        if (observe_missing_leg(trade.id, now)) {
            handle_broken_hedge(trade, survivor, missing, has1 ? *live1 : *live2);
            return true;
        }
        spdlog::warn("{} leg missing on {} (confirmation {}/{})", trade.symbol, missing.venue,
                     missing_leg_confirmations(trade.id), config_.close.broken_hedge_confirmations);
        return false;
    }

    clear_missing_leg(trade.id);
    if (!has1) {
        spdlog::warn("{} ({}) has no live legs on either venue; leaving it to reconciliation",
                     trade.symbol, trade.id);
        return false;
    }

    check_imbalance(trade, *live1, *live2);

    rules::ExitContext ctx = build_context(trade, live1, live2);
    Trade current = update_marks(trade, ctx);
    if (current.status != TradeStatus::Open) return false;

    if (current.close_attempts > 0 &&
        now - current.last_close_attempt_at < config_.close.retry_cooldown_ms) {
        spdlog::debug("{} close retry cooling down", current.symbol);
        return false;
    }

    rules::ExitDecision decision = rules::evaluate_exit(current, ctx, config_.exit);
    if (!decision.should_exit) {
        spdlog::debug("{}: {}", current.symbol, decision.reason);
        return false;
    }

    spdlog::info("Exit signal for {} ({}): {}", current.symbol, current.id, decision.reason);
    if (decision.rebalance) return rebalance(current.id);

    CloseResult r = close_trade(current.id, decision.reason, decision.emergency);
    return r.success;
}

bool PositionManager::leg_present(const TradeLeg& leg, const std::optional<Position>& live) const noexcept {
    return live && live->side == leg.side && live->quantity > config_.close.dust_qty;
}

Decimal PositionManager::mark_for(const TradeLeg& leg, const std::string& symbol,
                                  const std::optional<Position>& live) const {
    if (live && live->mark_price.is_positive()) return live->mark_price;
    if (auto price = market_data_.get_price(symbol)) {
        Decimal mid = leg.venue == market_data_.leg1_venue() ? price->leg1_mid : price->leg2_mid;
        if (mid.is_positive()) return mid;
    }
    return leg.entry_price;
}

rules::ExitContext PositionManager::build_context(const Trade& trade, const std::optional<Position>& live1,
                                                  const std::optional<Position>& live2) const {
    rules::ExitContext ctx;
    ctx.now = clock_();

    Decimal m1 = mark_for(trade.leg1, trade.symbol, live1);
    Decimal m2 = mark_for(trade.leg2, trade.symbol, live2);
    ctx.leg1_mark = m1;
    ctx.leg2_mark = m2;

    ctx.price_pnl = trade.leg1.unrealized_pnl(m1) + trade.leg2.unrealized_pnl(m2);
    ctx.current_pnl = ctx.price_pnl + trade.funding_collected + trade.realized_pnl - trade.total_fees();
    ctx.exit_cost = estimate_exit_cost(trade, m1, m2);

    if (auto funding = market_data_.get_funding(trade.symbol)) {
        ctx.leg1_rate_hourly = funding->leg1_rate;
        ctx.leg2_rate_hourly = funding->leg2_rate;
    }
    if (live1) ctx.leg1_liquidation_distance = live1->liquidation_distance();
    if (live2) ctx.leg2_liquidation_distance = live2->liquidation_distance();
    if (best_apy_) ctx.best_alternative_apy = best_apy_(trade.symbol);
    return ctx;
}

Decimal PositionManager::estimate_exit_cost(const Trade& trade, Decimal mark1, Decimal mark2) const {
    auto book = market_data_.get_orderbook(trade.symbol);
    auto leg_cost = [&](const TradeLeg& leg, Decimal mark, const OrderbookSnapshot* l1) {
        Decimal notional = leg.filled_qty * mark;
        Decimal cost = notional * config_.fees_for(leg.venue).taker;
        if (l1 && l1->bid.is_positive() && l1->ask.is_positive() && !l1->is_crossed()) {
            cost += (l1->ask - l1->bid) / Decimal::from_int(2) * leg.filled_qty;
        }
        return cost;
    };
    const OrderbookSnapshot* b1 = nullptr;
    const OrderbookSnapshot* b2 = nullptr;
    if (book) {
        b1 = book->leg1.venue == trade.leg1.venue ? &book->leg1 : &book->leg2;
        b2 = book->leg2.venue == trade.leg2.venue ? &book->leg2 : &book->leg1;
    }
    return leg_cost(trade.leg1, mark1, b1) + leg_cost(trade.leg2, mark2, b2);
}

// Accrue funding since the last pass and track the high-water mark
Trade PositionManager::update_marks(const Trade& trade, const rules::ExitContext& ctx) {
    Decimal diff_hourly = rules::funding_diff_hourly(trade, ctx.leg1_rate_hourly, ctx.leg2_rate_hourly);
    Decimal accrued;
    bool emit = false;
    Decimal emit_amount;

    auto stored = store_->modify_trade(trade.id, [&](Trade& t) {
        if (t.status != TradeStatus::Open) return false;

        int64_t since = t.last_funding_at != 0 ? t.last_funding_at : t.opened_at;
        if (since != 0 && ctx.now > since) {
            Decimal hours = Decimal::from_int(ctx.now - since) / Decimal::from_int(MS_PER_HOUR);
            accrued = diff_hourly * rules::trade_notional(t) * hours;
            t.funding_collected += accrued;
        }
        t.last_funding_at = ctx.now;
        t.current_apy = diff_hourly * Decimal::from_int(HOURS_PER_YEAR);

        Decimal pnl = ctx.current_pnl + accrued;
        if (pnl > t.high_water_mark) t.high_water_mark = pnl;

        std::lock_guard<std::mutex> lock(mutex_);
        Decimal& pending = pending_funding_[t.id];
        pending += accrued;
        if (ctx.now - t.last_funding_event_at >= MS_PER_HOUR && !pending.is_zero()) {
            emit = true;
            emit_amount = pending;
            pending = Decimal::zero();
            t.last_funding_event_at = ctx.now;
        }
        return true;
    });
    if (!stored) return trade;

    if (emit) {
        FundingCollected ev;
        ev.trade_id = stored->id;
        ev.symbol = stored->symbol;
        ev.amount = emit_amount;
        ev.total = stored->funding_collected;
        bus_->publish(ev);
        spdlog::info("Funding on {}: {} this period, {} total", stored->symbol,
                     emit_amount.to_string(), stored->funding_collected.to_string());
    }
    return *stored;
}

// =============================================================================
// Broken hedge and imbalance
// =============================================================================

bool PositionManager::observe_missing_leg(const std::string& trade_id, int64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = watches_.find(trade_id);
    if (it == watches_.end() || now - it->second.last_seen > config_.close.broken_hedge_reset_ms) {
        watches_[trade_id] = HedgeWatch{1, now, now};
        return config_.close.broken_hedge_confirmations <= 1;
    }

    HedgeWatch& w = it->second;
    if (now - w.last_seen >= config_.close.broken_hedge_spacing_ms) {
        ++w.confirmations;
        w.last_seen = now;
    }
    return w.confirmations >= config_.close.broken_hedge_confirmations;
}

void PositionManager::clear_missing_leg(const std::string& trade_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    watches_.erase(trade_id);
}

int PositionManager::missing_leg_confirmations(const std::string& trade_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = watches_.find(trade_id);
    return it == watches_.end() ? 0 : it->second.confirmations;
}

void PositionManager::handle_broken_hedge(const Trade& trade, const TradeLeg& survivor,
                                          const TradeLeg& missing, const Position& live) {
    spdlog::critical("BROKEN HEDGE on {} ({}): {} {} live on {}, nothing on {}. Emergency close.",
                     trade.symbol, trade.id, to_string(live.side), live.quantity.to_string(),
                     survivor.venue, missing.venue);

    EventDetails details{{"incident", "broken_hedge:" + trade.id},
                         {"trade_id", trade.id},
                         {"surviving_venue", survivor.venue},
                         {"missing_venue", missing.venue},
                         {"qty", live.quantity.to_string()}};
    bus_->publish(AlertEvent(AlertLevel::Critical, "Broken hedge on " + trade.symbol, details));

    BrokenHedgeDetected ev;
    ev.trade_id = trade.id;
    ev.symbol = trade.symbol;
    ev.missing_venue = missing.venue;
    ev.remaining_qty = live.quantity;
    ev.source = "position_monitor";
    ev.details = details;
    bus_->publish(ev);

    CloseResult r = close_trade(trade.id, "broken_hedge: missing leg on " + missing.venue, true);
    if (r.success) clear_missing_leg(trade.id);
}

void PositionManager::check_imbalance(const Trade& trade, const Position& live1, const Position& live2) {
    Decimal diff = (live1.quantity - live2.quantity).abs();
    Decimal limit = trade.target_qty * config_.close.imbalance_pct;
    if (!limit.is_positive() || diff <= limit) return;

    spdlog::warn("Leg imbalance on {}: {} on {} vs {} on {}", trade.symbol,
                 live1.quantity.to_string(), trade.leg1.venue, live2.quantity.to_string(), trade.leg2.venue);
    bus_->publish(AlertEvent(AlertLevel::Warning, "Leg imbalance on " + trade.symbol,
                             {{"incident", "imbalance:" + trade.id},
                              {"trade_id", trade.id},
                              {"leg1_qty", live1.quantity.to_string()},
                              {"leg2_qty", live2.quantity.to_string()},
                              {"diff", diff.to_string()}}));
}

// =============================================================================
// Closing
// =============================================================================

CloseResult PositionManager::close_trade(const std::string& trade_id, const std::string& reason, bool emergency) {
    CloseResult result;
    auto guard = closing_.try_acquire(trade_id);
    if (!guard) {
        result.skipped = true;
        result.error = "close already in progress";
        return result;
    }

    const int64_t now = clock_();
    bool claimed = false;
    auto stored = store_->modify_trade(trade_id, [&](Trade& t) {
        if (t.status != TradeStatus::Open) return false;
        t.status = TradeStatus::Closing;
        t.close_reason = reason;
        ++t.close_attempts;
        t.last_close_attempt_at = now;
        claimed = true;
        return true;
    });
    if (!stored) {
        result.error = "unknown trade " + trade_id;
        return result;
    }
    if (!claimed) {
        spdlog::info("Close of {} skipped: trade is {}", trade_id, to_string(stored->status));
        result.skipped = true;
        result.error = std::string("trade is ") + to_string(stored->status);
        result.trade = stored;
        return result;
    }

    Trade trade = *stored;
    publish_state(trade, TradeStatus::Open, reason);
    spdlog::info("Closing {} ({}){}: {}", trade.symbol, trade.id, emergency ? " [emergency]" : "", reason);

    std::string error;
    bool flat = false;
    try {
        flat = emergency ? close_market(trade) : close_coordinated(trade);
        if (!flat) error = "positions still open after close";
    } catch (const DomainError& e) {
        error = e.what();
    }

    if (flat) return finish_close(trade, reason);
    return revert_close(trade, error);
}

// Maker orders on both legs under one shared deadline, then IOC on whatever is left
bool PositionManager::close_coordinated(Trade& trade) {
    const auto& cfg = config_.close;
    auto book = market_data_.get_orderbook(trade.symbol);

    struct Working {
        TradeLeg* leg;
        ExchangePort* ex;
        std::optional<Order> order;
        FillTracker fills;
        bool settled = false;
        bool applied = false;
    };
    Working work[2] = {{&trade.leg1, &market_data_.exchange(trade.leg1.venue), std::nullopt, {}},
                       {&trade.leg2, &market_data_.exchange(trade.leg2.venue), std::nullopt, {}}};

    try {
        for (int i = 0; i < 2; ++i) {
            Working& w = work[i];
            auto live = read_position(w.leg->venue, trade.symbol);
            if (!leg_present(*w.leg, live)) continue;

            Side close_side = opposite(w.leg->side);
            Decimal price;
            if (book) {
                const OrderbookSnapshot& l1 = book->leg1.venue == w.leg->venue ? book->leg1 : book->leg2;
                price = close_side == Side::Sell ? l1.ask : l1.bid;
            }
            if (!price.is_positive()) continue;

            auto request = OrderRequest::limit(trade.symbol, close_side, live->quantity, price)
                               .with_post_only()
                               .with_reduce_only()
                               .with_client_id(close_tag(trade, i == 0 ? "cl1" : "cl2", trade.close_attempts));
            try {
                Order placed = await_order(w.ex->place_order(request), call_timeout_, trade.symbol, w.leg->venue);
                if (placed.status == OrderStatus::Rejected) {
                    spdlog::info("Maker close on {} {} rejected, will sweep", w.leg->venue, trade.symbol);
                    continue;
                }
                w.order = placed;
            } catch (const DomainError& e) {
                spdlog::warn("Maker close on {} {} failed: {}", w.leg->venue, trade.symbol, e.what());
            }
        }

        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(cfg.maker_timeout_ms);
        for (auto& w : work) {
            if (!w.order) continue;
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            Order last = follow_order(*w.ex, *w.order, std::max(left, std::chrono::milliseconds(0)),
                                      cfg.poll_interval_ms, call_timeout_);
            w.settled = true;
            w.fills.add_order(last);
        }

        // Only legs with size left escalate
        for (auto& w : work) {
            sweep_leg(trade, *w.leg, w.fills, 0);
            w.applied = true;
            apply_exit_fills(trade, *w.leg, w.fills);
        }
    } catch (const DomainError& e) {
        // No maker order may stay resting once the close is abandoned
        spdlog::warn("Coordinated close of {} interrupted: {}", trade.symbol, e.what());
        for (auto& w : work) {
            if (w.order && !w.settled) {
                w.settled = true;
                try {
                    w.fills.add_order(follow_order(*w.ex, *w.order, std::chrono::milliseconds(0),
                                                   cfg.poll_interval_ms, call_timeout_));
                } catch (const DomainError& inner) {
                    spdlog::error("Cancel of maker close {} on {} failed: {}",
                                  w.order->order_id, w.leg->venue, inner.what());
                }
            }
            if (!w.applied && w.fills.filled().is_positive()) {
                w.applied = true;
                apply_exit_fills(trade, *w.leg, w.fills);
            }
        }
        throw;
    }
    return legs_flat(trade);
}

bool PositionManager::close_market(Trade& trade) {
    for (TradeLeg* leg : {&trade.leg1, &trade.leg2}) {
        FillTracker fills;
        for (int round = 0; round < std::max(1, config_.close.max_close_attempts); ++round) {
            if (sweep_leg(trade, *leg, fills, round)) break;
        }
        apply_exit_fills(trade, *leg, fills);
    }
    return legs_flat(trade);
}

// Reduce-only IOC for whatever the venue still shows; returns true when the leg is flat
bool PositionManager::sweep_leg(Trade& trade, TradeLeg& leg, FillTracker& fills, int round) {
    auto live = read_position(leg.venue, trade.symbol);
    if (!leg_present(leg, live)) return true;

    ExchangePort& ex = market_data_.exchange(leg.venue);
    auto request = OrderRequest::market(trade.symbol, opposite(leg.side), live->quantity)
                       .with_reduce_only()
                       .with_client_id(close_tag(trade, leg.venue == trade.leg1.venue ? "sw1" : "sw2",
                                                 trade.close_attempts * 10 + round));
    try {
        Order placed = await_order(ex.place_order(request), call_timeout_, trade.symbol, leg.venue);
        Order last = follow_order(ex, placed, call_timeout_, config_.close.poll_interval_ms, call_timeout_);
        fills.add_order(last);
        return last.filled_quantity >= live->quantity;
    } catch (const OrderRejectedError& e) {
        spdlog::warn("Close sweep on {} {} rejected: {}", leg.venue, trade.symbol, e.what());
    } catch (const OrderTimeoutError& e) {
        spdlog::warn("Close sweep on {} {} unconfirmed: {}", leg.venue, trade.symbol, e.what());
    }
    return false;
}

void PositionManager::apply_exit_fills(Trade& trade, TradeLeg& leg, const FillTracker& fills) {
    if (fills.filled().is_positive()) {
        leg.exit_price = fills.average_price();
        leg.fees += fills.fees();
        return;
    }
    if (leg.exit_price.is_zero() && leg.filled_qty.is_positive()) {
        // Closed outside our orders; value it at the last known mark
        leg.exit_price = mark_for(leg, trade.symbol, std::nullopt);
    }
}

bool PositionManager::legs_flat(const Trade& trade) {
    auto live1 = read_position(trade.leg1.venue, trade.symbol);
    auto live2 = read_position(trade.leg2.venue, trade.symbol);
    return !leg_present(trade.leg1, live1) && !leg_present(trade.leg2, live2);
}

CloseResult PositionManager::finish_close(const Trade& trade, const std::string& reason) {
    const int64_t now = clock_();
    auto stored = store_->modify_trade(trade.id, [&](Trade& t) {
        if (t.status != TradeStatus::Closing) return false;
        t.leg1 = trade.leg1;
        t.leg2 = trade.leg2;
        t.realized_pnl += t.leg1.pnl() + t.leg2.pnl();
        t.error.clear();
        t.mark_closed(reason, now);
        return true;
    });

    CloseResult result;
    if (!stored || stored->status != TradeStatus::Closed) {
        result.error = "trade left CLOSING during close";
        return result;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        watches_.erase(trade.id);
        pending_funding_.erase(trade.id);
    }

    publish_state(*stored, TradeStatus::Closing, reason);

    TradeClosed ev;
    ev.trade_id = stored->id;
    ev.symbol = stored->symbol;
    ev.reason = reason;
    ev.realized_pnl = stored->realized_pnl;
    ev.funding_collected = stored->funding_collected;
    ev.total_fees = stored->total_fees();
    ev.hold_duration_ms = stored->hold_duration_ms(now);
    bus_->publish(ev);

    spdlog::info("Trade {} closed: {} realized {}, funding {}, fees {}", stored->id, stored->symbol,
                 stored->realized_pnl.to_string(), stored->funding_collected.to_string(),
                 stored->total_fees().to_string());
    result.success = true;
    result.trade = stored;
    return result;
}

CloseResult PositionManager::revert_close(const Trade& trade, const std::string& error) {
    auto stored = store_->modify_trade(trade.id, [&](Trade& t) {
        if (t.status != TradeStatus::Closing) return false;
        t.leg1.fees = trade.leg1.fees;
        t.leg2.fees = trade.leg2.fees;
        t.status = TradeStatus::Open;
        t.error = error;
        return true;
    });

    CloseResult result;
    result.error = error;
    result.trade = stored;
    if (!stored) return result;

    publish_state(*stored, TradeStatus::Closing, "close failed: " + error);
    if (stored->close_attempts >= config_.close.max_close_attempts) {
        spdlog::critical("Close of {} ({}) failed {} times: {}", stored->symbol, stored->id,
                         stored->close_attempts, error);
        bus_->publish(AlertEvent(AlertLevel::Critical, "Repeated close failure on " + stored->symbol,
                                 {{"incident", "close_failed:" + stored->id},
                                  {"trade_id", stored->id},
                                  {"attempts", std::to_string(stored->close_attempts)},
                                  {"error", error}}));
    } else {
        spdlog::error("Close of {} failed (attempt {}/{}): {}", stored->symbol, stored->close_attempts,
                      config_.close.max_close_attempts, error);
    }
    return result;
}

bool PositionManager::rebalance(const std::string& trade_id) {
    auto guard = closing_.try_acquire(trade_id);
    if (!guard) return false;

    auto trade = store_->get_trade(trade_id);
    if (!trade || trade->status != TradeStatus::Open) return false;

    auto live1 = read_position(trade->leg1.venue, trade->symbol);
    auto live2 = read_position(trade->leg2.venue, trade->symbol);
    if (!leg_present(trade->leg1, live1) || !leg_present(trade->leg2, live2)) return false;

    Decimal m1 = mark_for(trade->leg1, trade->symbol, live1);
    Decimal m2 = mark_for(trade->leg2, trade->symbol, live2);
    Decimal n1 = live1->quantity * m1;
    Decimal n2 = live2->quantity * m2;

    const bool first_larger = n1 > n2;
    TradeLeg leg = first_larger ? trade->leg1 : trade->leg2;
    Decimal mark = first_larger ? m1 : m2;
    Decimal qty = (n1 - n2).abs() / mark;
    if (auto info = market_data_.get_market_info(leg.venue, trade->symbol)) {
        qty = qty.floor_to(info->lot_size);
    }
    if (qty <= config_.close.dust_qty) return false;

    spdlog::info("Rebalancing {}: reducing {} by {} ({} vs {} notional)", trade->symbol, leg.venue,
                 qty.to_string(), n1.to_string(), n2.to_string());

    ExchangePort& ex = market_data_.exchange(leg.venue);
    auto request = OrderRequest::market(trade->symbol, opposite(leg.side), qty)
                       .with_reduce_only()
                       .with_client_id(close_tag(*trade, "rebal", static_cast<int>(clock_() % 100000)));
    Order last;
    try {
        Order placed = await_order(ex.place_order(request), call_timeout_, trade->symbol, leg.venue);
        last = follow_order(ex, placed, call_timeout_, config_.close.poll_interval_ms, call_timeout_);
    } catch (const DomainError& e) {
        spdlog::error("Rebalance of {} on {} failed: {}", trade->symbol, leg.venue, e.what());
        return false;
    }

    Decimal filled = last.filled_quantity;
    if (!filled.is_positive()) return false;
    Decimal px = last.average_price.value_or(mark);
    Decimal fee = last.total_fee();
    // The record follows what the venue holds after the reduction
    Decimal left = (first_larger ? live1->quantity : live2->quantity) - filled;

    store_->modify_trade(trade_id, [&](Trade& t) {
        if (t.status != TradeStatus::Open) return false;
        TradeLeg& target = first_larger ? t.leg1 : t.leg2;
        Decimal move = target.side == Side::Buy ? px - target.entry_price : target.entry_price - px;
        target.filled_qty = max(left, Decimal::zero());
        target.fees += fee;
        t.realized_pnl += move * filled;
        return true;
    });
    return true;
}

// =============================================================================
// Plumbing
// =============================================================================

std::optional<Position> PositionManager::read_position(const std::string& venue, const std::string& symbol) {
    ExchangePort& ex = market_data_.exchange(venue);
    return with_retry(retry_, "get_position(" + symbol + "@" + venue + ")", [&] {
        return await_future(ex.get_position(symbol), call_timeout_, "get_position(" + symbol + ")", venue);
    });
}

void PositionManager::publish_state(const Trade& trade, TradeStatus from, const std::string& reason) {
    TradeStateChanged ev;
    ev.trade_id = trade.id;
    ev.symbol = trade.symbol;
    ev.old_status = from;
    ev.new_status = trade.status;
    ev.reason = reason;
    bus_->publish(ev);
}

}  // namespace fundarb
