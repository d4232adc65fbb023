// Funding Arb Engine - Reconciler Implementation

#include <fundarb/reconciler.hpp>
#include <fundarb/errors.hpp>
#include <fundarb/execution.hpp>
#include <spdlog/spdlog.h>

namespace fundarb {

namespace {

const Position* find_live(const std::map<std::string, Position>& index, const std::string& symbol) {
    auto it = index.find(symbol);
    return it == index.end() ? nullptr : &it->second;
}

}  // namespace

Reconciler::Reconciler(MarketDataService& market_data, TradeStorePtr store, EventBusPtr bus,
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

ReconcileResult Reconciler::reconcile(bool startup) {
    ReconcileResult result;
    PositionIndex leg1;
    PositionIndex leg2;

    bool ok1 = index_venue(market_data_.leg1_venue(), leg1, result);
    bool ok2 = index_venue(market_data_.leg2_venue(), leg2, result);
    if (!ok1 || !ok2) {
        spdlog::error("Reconciliation skipped: venue positions unavailable");
        return result;
    }
    result.positions_seen = static_cast<int>(leg1.size() + leg2.size());

    std::set<std::string> claimed;
    for (const auto& trade : store_->list_open_trades()) {
        claimed.insert(trade.symbol);
        if (trade.status != TradeStatus::Opening && trade.status != TradeStatus::Open) continue;
        ++result.trades_checked;

        const auto& idx1 = trade.leg1.venue == market_data_.leg1_venue() ? leg1 : leg2;
        const auto& idx2 = trade.leg2.venue == market_data_.leg2_venue() ? leg2 : leg1;
        const Position* live1 = find_live(idx1, trade.symbol);
        const Position* live2 = find_live(idx2, trade.symbol);

        try {
            if (trade.status == TradeStatus::Opening) {
                check_opening(trade, live1, live2, startup, result);
            } else {
                check_open(trade, live1, live2, result);
            }
        } catch (const DomainError& e) {
            spdlog::error("Reconciling {} ({}) failed: {}", trade.symbol, trade.id, e.what());
            result.errors.push_back(trade.id + ": " + e.what());
        }
    }

    handle_ghosts(leg1, leg2, claimed, result);

    if (!result.actions.empty()) {
        spdlog::info("Reconciliation: {} trades checked, {} positions, {} actions",
                     result.trades_checked, result.positions_seen, result.actions.size());
    }
    return result;
}

bool Reconciler::index_venue(const std::string& venue, PositionIndex& index, ReconcileResult& result) {
    ExchangePort& ex = market_data_.exchange(venue);
    try {
        auto positions = with_retry(retry_, "list_positions(" + venue + ")", [&] {
            return await_future(ex.list_positions(), call_timeout_, "list_positions", venue);
        });
        for (auto& p : positions) {
            if (p.quantity <= config_.reconcile.dust_qty) continue;
            p.venue = venue;
            index[p.symbol] = p;
        }
        return true;
    } catch (const ExchangeError& e) {
        spdlog::error("Listing positions on {} failed: {}", venue, e.what());
        result.errors.push_back(venue + ": " + e.what());
        return false;
    }
}

// =============================================================================
// Trade checks
// =============================================================================

void Reconciler::check_opening(const Trade& trade, const Position* live1, const Position* live2,
                               bool startup, ReconcileResult& result) {
    if (executing_ && executing_(trade.symbol)) return;
    const int64_t now = clock_();
    if (!startup && now - trade.created_at <= config_.reconcile.opening_stale_ms) return;

    if (live1 && live2 && live1->side == trade.leg1.side && live2->side == trade.leg2.side) {
        // Entry finished on the venues but never got recorded
        bool recovered = false;
        auto stored = store_->modify_trade(trade.id, [&](Trade& t) {
            if (t.status != TradeStatus::Opening) return false;
            t.leg1.filled_qty = live1->quantity;
            t.leg1.entry_price = live1->entry_price;
            t.leg2.filled_qty = live2->quantity;
            t.leg2.entry_price = live2->entry_price;
            t.leg2.qty = live1->quantity;
            if (can_transition(t.execution_state, ExecutionState::Complete)) {
                t.execution_state = ExecutionState::Complete;
            }
            t.mark_opened(now);
            recovered = true;
            return true;
        });
        if (stored && recovered) {
            record(result, {trade.symbol, trade.leg1.venue, ACTION_RECOVERED_OPENING, trade.id,
                            {{"leg1_qty", live1->quantity.to_string()},
                             {"leg2_qty", live2->quantity.to_string()}}});
        }
        return;
    }

    cancel_resting(trade);

    std::string flattened;
    for (const Position* live : {live1, live2}) {
        if (!live) continue;
        if (flatten_cooling_down(live->venue, live->symbol)) return;
        if (!flatten(live->venue, *live, trade.id + "-rz-" + live->venue)) {
            throw ReconciliationError("Could not flatten " + live->venue + " leg of stale entry " + trade.id,
                                      trade.symbol);
        }
        flattened += flattened.empty() ? live->venue : "," + live->venue;
    }

    bool aborted = false;
    store_->modify_trade(trade.id, [&](Trade& t) {
        if (t.status != TradeStatus::Opening) return false;
        t.mark_aborted(ACTION_ABORTED_ZOMBIE, now);
        aborted = true;
        return true;
    });
    if (!aborted) return;

    TradeStateChanged ev;
    ev.trade_id = trade.id;
    ev.symbol = trade.symbol;
    ev.old_status = TradeStatus::Opening;
    ev.new_status = TradeStatus::Aborted;
    ev.reason = ACTION_ABORTED_ZOMBIE;
    bus_->publish(ev);

    EventDetails details{{"age_ms", std::to_string(now - trade.created_at)},
                         {"startup", startup ? "true" : "false"}};
    if (!flattened.empty()) details["flattened"] = flattened;
    record(result, {trade.symbol, trade.leg1.venue, ACTION_ABORTED_ZOMBIE, trade.id, details});
}

void Reconciler::check_open(const Trade& trade, const Position* live1, const Position* live2,
                            ReconcileResult& result) {
    if (!live1 && !live2) {
        close_record(trade, "closed_externally", result,
                     {trade.symbol, trade.leg1.venue, ACTION_MARKED_ZOMBIE, trade.id, {}});
        return;
    }

    // One leg missing is a broken hedge; position monitoring owns that case
    if (!live1 || !live2) return;

    if (live1->side != trade.leg1.side || live2->side != trade.leg2.side) {
        spdlog::warn("Side conflict on {} ({}): record {} {} / {} {}, live {} {} / {} {}",
                     trade.symbol, trade.id,
                     trade.leg1.venue, to_string(trade.leg1.side), trade.leg2.venue, to_string(trade.leg2.side),
                     live1->venue, to_string(live1->side), live2->venue, to_string(live2->side));

        for (const Position* live : {live1, live2}) {
            if (!flatten(live->venue, *live, trade.id + "-rc-" + live->venue)) {
                throw ReconciliationError("Could not force-close " + live->venue + " leg of " + trade.id,
                                          trade.symbol);
            }
        }
        close_record(trade, ACTION_CLOSED_CONFLICT, result,
                     {trade.symbol, trade.leg1.venue, ACTION_CLOSED_CONFLICT, trade.id,
                      {{"record_leg1_side", to_string(trade.leg1.side)},
                       {"record_leg2_side", to_string(trade.leg2.side)},
                       {"live_leg1_side", to_string(live1->side)},
                       {"live_leg2_side", to_string(live2->side)}}});
        return;
    }

    check_quantity(trade, trade.leg1, *live1, result);
    check_quantity(trade, trade.leg2, *live2, result);
}

// Alert only; the record is never rewritten from a venue quantity
void Reconciler::check_quantity(const Trade& trade, const TradeLeg& leg, const Position& live,
                                ReconcileResult& result) {
    Decimal db_qty = leg.filled_qty;
    if (!db_qty.is_positive()) return;

    Decimal delta = (db_qty - live.quantity).abs();
    if (delta / db_qty <= config_.reconcile.qty_tolerance) return;

    spdlog::warn("Quantity mismatch on {} {}: record {} vs live {}", leg.venue, trade.symbol,
                 db_qty.to_string(), live.quantity.to_string());
    record(result, {trade.symbol, leg.venue, ACTION_QUANTITY_MISMATCH, trade.id,
                    {{"db_qty", db_qty.to_string()},
                     {"live_qty", live.quantity.to_string()},
                     {"delta", delta.to_string()}}},
           true);
}

// =============================================================================
// Ghost positions
// =============================================================================

void Reconciler::handle_ghosts(const PositionIndex& leg1, const PositionIndex& leg2,
                               const std::set<std::string>& claimed, ReconcileResult& result) {
    std::set<std::string> symbols;
    for (const auto& [symbol, p] : leg1) symbols.insert(symbol);
    for (const auto& [symbol, p] : leg2) symbols.insert(symbol);

    const GhostPolicy policy = config_.reconcile.ghost_policy;
    for (const auto& symbol : symbols) {
        if (claimed.count(symbol) != 0) continue;
        if (executing_ && executing_(symbol)) continue;

        const Position* p1 = find_live(leg1, symbol);
        const Position* p2 = find_live(leg2, symbol);

        if (policy == GhostPolicy::Ignore) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (reported_.insert("ghost|" + symbol).second) {
                spdlog::warn("Untracked position on {} ({}{}{}), ghost policy is ignore", symbol,
                             p1 ? p1->venue : "", p1 && p2 ? "," : "", p2 ? p2->venue : "");
            }
            continue;
        }

        try {
            if (policy == GhostPolicy::Adopt && p1 && p2 && p1->side != p2->side) {
                Decimal diff = (p1->quantity - p2->quantity).abs();
                if (diff / max(p1->quantity, p2->quantity) <= config_.reconcile.qty_tolerance &&
                    adopt_ghost(*p1, *p2)) {
                    record(result, {symbol, p1->venue, ACTION_ADOPTED_GHOST, {},
                                    {{"leg1_side", to_string(p1->side)},
                                     {"leg1_qty", p1->quantity.to_string()},
                                     {"leg2_qty", p2->quantity.to_string()}}});
                    continue;
                }
            }

            for (const Position* p : {p1, p2}) {
                if (!p || flatten_cooling_down(p->venue, symbol)) continue;
                if (flatten(p->venue, *p, "ghost-" + symbol + "-" + p->venue)) {
                    record(result, {symbol, p->venue, ACTION_CLOSED_ZOMBIE, {},
                                    {{"side", to_string(p->side)}, {"qty", p->quantity.to_string()}}});
                } else {
                    result.errors.push_back("could not flatten ghost " + symbol + " on " + p->venue);
                }
            }
        } catch (const DomainError& e) {
            spdlog::error("Handling ghost {} failed: {}", symbol, e.what());
            result.errors.push_back(symbol + ": " + e.what());
        }
    }
}

bool Reconciler::adopt_ghost(const Position& leg1, const Position& leg2) {
    const int64_t now = clock_();
    Decimal qty = min(leg1.quantity, leg2.quantity);
    Trade trade = Trade::create(leg1.symbol, leg1.venue, leg1.side, leg2.venue, qty,
                                qty * leg1.entry_price, Decimal::zero(), now);
    trade.leg1.filled_qty = leg1.quantity;
    trade.leg1.entry_price = leg1.entry_price;
    trade.leg2.filled_qty = leg2.quantity;
    trade.leg2.entry_price = leg2.entry_price;
    trade.advance(ExecutionState::Complete);
    trade.mark_opened(now);

    try {
        store_->create_trade(trade);
    } catch (const ValidationError& e) {
        spdlog::warn("Could not adopt {}: {}", leg1.symbol, e.what());
        return false;
    }
    spdlog::info("Adopted untracked hedge on {} as trade {}", trade.symbol, trade.id);
    return true;
}

// =============================================================================
// Plumbing
// =============================================================================

bool Reconciler::flatten(const std::string& venue, const Position& live, const std::string& tag) {
    ExchangePort& ex = market_data_.exchange(venue);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_flatten_[venue + "/" + live.symbol] = clock_();
    }

    spdlog::warn("Flattening {} {} {} on {}", to_string(live.side), live.quantity.to_string(),
                 live.symbol, venue);
    auto request = OrderRequest::market(live.symbol, opposite(live.side), live.quantity)
                       .with_reduce_only()
                       .with_client_id(tag);
    Order placed = await_order(ex.place_order(request), call_timeout_, live.symbol, venue);
    follow_order(ex, placed, call_timeout_, config_.close.poll_interval_ms, call_timeout_);

    auto after = with_retry(retry_, "get_position(" + live.symbol + "@" + venue + ")", [&] {
        return await_future(ex.get_position(live.symbol), call_timeout_, "get_position", venue);
    });
    return !after || after->side != live.side || after->quantity <= config_.reconcile.dust_qty;
}

bool Reconciler::flatten_cooling_down(const std::string& venue, const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_flatten_.find(venue + "/" + symbol);
    return it != last_flatten_.end() && clock_() - it->second < config_.reconcile.flatten_cooldown_ms;
}

void Reconciler::cancel_resting(const Trade& trade) {
    for (const TradeLeg* leg : {&trade.leg1, &trade.leg2}) {
        if (leg->order_id.empty()) continue;
        ExchangePort& ex = market_data_.exchange(leg->venue);
        try {
            await_future(ex.cancel_order(trade.symbol, leg->order_id), call_timeout_, "cancel_order", leg->venue);
        } catch (const ExchangeError& e) {
            spdlog::warn("Cancel of {} on {} failed: {}", leg->order_id, leg->venue, e.what());
        }
    }
}

void Reconciler::record(ReconcileResult& result, ReconcileAction action, bool dedupe) {
    if (dedupe) {
        auto delta = action.details.find("delta");
        std::string key = action.trade_id + "|" + action.venue + "|" + action.action + "|" +
                          (delta != action.details.end() ? delta->second : std::string());
        std::lock_guard<std::mutex> lock(mutex_);
        if (!reported_.insert(key).second) return;
    }

    if (!action.trade_id.empty()) action.details["trade_id"] = action.trade_id;

    PositionReconciled ev;
    ev.symbol = action.symbol;
    ev.venue = action.venue;
    ev.action = action.action;
    ev.details = action.details;
    bus_->publish(ev);

    spdlog::info("Reconciled {} on {}: {}", action.symbol, action.venue, action.action);
    result.actions.push_back(std::move(action));
}

void Reconciler::close_record(const Trade& trade, const std::string& reason, ReconcileResult& result,
                              ReconcileAction action) {
    const int64_t now = clock_();
    TradeStatus from = trade.status;
    bool closed = false;
    store_->modify_trade(trade.id, [&](Trade& t) {
        if (t.status != TradeStatus::Open && t.status != TradeStatus::Opening) return false;
        t.mark_closed(reason, now);
        closed = true;
        return true;
    });
    if (!closed) return;

    TradeStateChanged ev;
    ev.trade_id = trade.id;
    ev.symbol = trade.symbol;
    ev.old_status = from;
    ev.new_status = TradeStatus::Closed;
    ev.reason = reason;
    bus_->publish(ev);

    record(result, std::move(action));
}

}  // namespace fundarb
