// Funding Arb Engine - Execution Engine Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <fundarb/adapters/paper.hpp>
#include <fundarb/errors.hpp>
#include <fundarb/event_bus.hpp>
#include <fundarb/execution.hpp>
#include <fundarb/memory_store.hpp>
#include <fundarb/notifier.hpp>
#include <fundarb/supervisor.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace fundarb;
using namespace fundarb::adapters;
using Catch::Approx;

namespace {

Config fast_config(ExecutionMode mode = ExecutionMode::Sequential) {
    Config config;
    config.general.symbols = {"BTC"};
    config.execution.mode = mode;
    config.execution.leg1_max_attempts = 3;
    config.execution.leg1_total_timeout_ms = 150;
    config.execution.leg1_poll_interval_ms = 5;
    config.execution.leg1_escalate_to_taker = false;
    config.execution.leg2_fill_timeout_ms = 200;
    config.execution.call_timeout_ms = 1000;
    config.execution.retry_base_delay_ms = 1;
    config.execution.rollback_timeout_ms = 200;
    config.market_data.fresh_retries = 1;
    config.market_data.fresh_retry_delay_ms = 1;
    return config;
}

// Two venues quoting BTC at 99.99 / 100.01 with deep books
struct Harness {
    Config config;
    std::shared_ptr<PaperExchange> leg1 = std::make_shared<PaperExchange>("lighter");
    std::shared_ptr<PaperExchange> leg2 = std::make_shared<PaperExchange>("x10");
    std::shared_ptr<MemoryTradeStore> store = std::make_shared<MemoryTradeStore>();
    std::shared_ptr<EventBus> bus = std::make_shared<EventBus>();
    ShutdownSignal shutdown;
    MarketDataService md;
    ExecutionEngine engine;

    explicit Harness(Config cfg = fast_config())
        : config(std::move(cfg)),
          md(leg1, leg2, config.market_data, std::chrono::milliseconds(config.execution.call_timeout_ms)),
          engine(md, store, bus, config, shutdown) {
        for (auto* ex : {leg1.get(), leg2.get()}) {
            ex->set_l1("BTC", Decimal::from_double(99.99), Decimal::from_int(100),
                       Decimal::from_double(100.01), Decimal::from_int(100));
            ex->set_funding_rate("BTC", Decimal::from_double(0.0001));
        }
    }
};

Opportunity btc_long_leg1() {
    Opportunity opp;
    opp.symbol = "BTC";
    opp.leg1_venue = "lighter";
    opp.leg2_venue = "x10";
    opp.long_venue = "lighter";
    opp.short_venue = "x10";
    opp.apy = Decimal::from_double(0.5);
    opp.spread_pct = Decimal::from_double(0.0002);
    opp.mid_price = Decimal::from_int(100);
    opp.suggested_qty = Decimal::one();
    opp.suggested_notional = Decimal::from_int(100);
    return opp;
}

// Leaves every reduce-only order unfilled so a rollback cannot flatten
void refuse_reduce_only(PaperExchange& ex) {
    ex.set_fill_policy([](const OrderRequest& request, int) -> std::optional<PaperFill> {
        if (!request.reduce_only) return std::nullopt;
        return PaperFill{Decimal::zero(), Decimal::zero(), false, OrderStatus::Rejected};
    });
}

class CapturingPort : public NotificationPort {
public:
    bool send_message(const std::string& text) override {
        messages.push_back(text);
        return true;
    }

    std::vector<std::string> messages;
};

}  // namespace

// ============================================
// Pricing helpers
// ============================================

TEST_CASE("Leg 1 price walks toward the opposite touch", "[execution]") {
    ExecutionConfig cfg;
    cfg.leg1_smart_pricing = false;

    Leg1PriceInput in;
    in.best_bid = Decimal::from_int(100);
    in.best_ask = Decimal::from_int(101);
    in.mid = Decimal::from_double(100.5);
    in.l1_qty = Decimal::from_int(100);
    in.remaining = Decimal::one();
    in.tick = Decimal::from_double(0.01);
    in.max_attempts = 5;

    SECTION("First attempt joins our own best") {
        in.side = Side::Buy;
        REQUIRE(compute_leg1_price(in, cfg).price.to_double() == Approx(100.0));
        in.side = Side::Sell;
        REQUIRE(compute_leg1_price(in, cfg).price.to_double() == Approx(101.0));
    }

    SECTION("Last attempt is capped below the opposite touch") {
        in.attempt = 4;
        in.side = Side::Buy;
        Leg1Price buy = compute_leg1_price(in, cfg);
        REQUIRE(buy.aggressiveness.to_double() == Approx(1.0));
        REQUIRE(buy.capped.to_double() == Approx(0.9));
        REQUIRE(buy.price.to_double() == Approx(100.90));

        in.side = Side::Sell;
        REQUIRE(compute_leg1_price(in, cfg).price.to_double() == Approx(100.10));
    }

    SECTION("Large remainder lifts the aggressiveness floor") {
        cfg.leg1_smart_pricing = true;
        in.side = Side::Buy;
        in.remaining = Decimal::from_int(60);
        Leg1Price px = compute_leg1_price(in, cfg);
        REQUIRE(px.smart_floor.to_double() == Approx(0.335));
        REQUIRE(px.capped.to_double() == Approx(0.335));
        REQUIRE(px.price.to_double() == Approx(100.34));
    }

    SECTION("One-tick book stays at our best") {
        in.best_ask = Decimal::from_double(100.01);
        in.attempt = 4;
        in.side = Side::Buy;
        REQUIRE(compute_leg1_price(in, cfg).price.to_double() == Approx(100.0));
    }

    SECTION("Missing book prices off the mid") {
        in.best_bid = Decimal::zero();
        in.best_ask = Decimal::zero();
        in.mid = Decimal::from_int(100);
        Leg1Price px = compute_leg1_price(in, cfg);
        REQUIRE(px.best_bid.to_double() == Approx(99.99));
        REQUIRE(px.best_ask.to_double() == Approx(100.01));
    }
}

TEST_CASE("Attempt timeouts split the leg 1 budget", "[execution]") {
    SECTION("Equal") {
        REQUIRE(attempt_timeouts(1000, 4, AttemptSchedule::Equal) == std::vector<int64_t>{250, 250, 250, 250});
        REQUIRE(attempt_timeouts(1000, 3, AttemptSchedule::Equal) == std::vector<int64_t>{333, 333, 334});
    }

    SECTION("Increasing") {
        REQUIRE(attempt_timeouts(600, 3, AttemptSchedule::Increasing) == std::vector<int64_t>{100, 200, 300});
        auto split = attempt_timeouts(1000, 3, AttemptSchedule::Increasing);
        REQUIRE(split.size() == 3);
        REQUIRE(split[0] + split[1] + split[2] == 1000);
        REQUIRE(split[0] < split[1]);
        REQUIRE(split[1] < split[2]);
    }
}

TEST_CASE("Hedge slippage widens per attempt up to the cap", "[execution]") {
    ExecutionConfig cfg;
    REQUIRE(leg2_slippage(0, cfg).to_double() == Approx(0.001));
    REQUIRE(leg2_slippage(1, cfg).to_double() == Approx(0.002));
    REQUIRE(leg2_slippage(10, cfg).to_double() == Approx(0.005));
}

TEST_CASE("FillTracker weights prices by quantity", "[execution]") {
    FillTracker fills;
    fills.add(Decimal::from_double(0.6), Decimal::from_int(100), Decimal::from_double(0.01));
    fills.add(Decimal::zero(), Decimal::from_int(500));

    Order order;
    order.filled_quantity = Decimal::from_double(0.4);
    order.price = Decimal::from_int(120);
    order.average_price = Decimal::from_int(110);
    order.fees.push_back(Fee{"USD", Decimal::from_double(0.02), Decimal::from_double(0.0005)});
    REQUIRE(fills.add_order(order).to_double() == Approx(0.4));

    REQUIRE(fills.count() == 2);
    REQUIRE(fills.filled().to_double() == Approx(1.0));
    REQUIRE(fills.average_price().to_double() == Approx(104.0));
    REQUIRE(fills.fees().to_double() == Approx(0.03));

    Order empty;
    REQUIRE(fills.add_order(empty).is_zero());
}

TEST_CASE("SymbolLocks hold one entry per symbol", "[execution]") {
    SymbolLocks locks;
    {
        auto first = locks.try_acquire("BTC");
        REQUIRE(first);
        REQUIRE(locks.is_locked("BTC"));
        REQUIRE_FALSE(locks.try_acquire("BTC"));
        REQUIRE(locks.try_acquire("ETH"));
    }
    REQUIRE_FALSE(locks.is_locked("BTC"));
    REQUIRE_FALSE(locks.is_locked("ETH"));
}

TEST_CASE("follow_order cancels a resting order at the deadline", "[execution]") {
    PaperExchange ex("lighter");
    ex.set_l1("BTC", Decimal::from_int(100), Decimal::one(), Decimal::from_int(101), Decimal::one());
    ex.set_maker_fill_ratio(Decimal::zero());

    auto req = OrderRequest::limit("BTC", Side::Buy, Decimal::one(), Decimal::from_int(100))
                   .with_tif(TimeInForce::PostOnly);
    Order placed = ex.place_order(req).get();
    REQUIRE_FALSE(placed.is_done());

    Order last = follow_order(ex, placed, std::chrono::milliseconds(30), 5, std::chrono::milliseconds(500));
    REQUIRE(last.status == OrderStatus::Cancelled);
    REQUIRE(ex.cancel_count() == 1);

    SECTION("A finished order is returned as is") {
        Order done = placed;
        done.status = OrderStatus::Filled;
        REQUIRE(follow_order(ex, done, std::chrono::milliseconds(30), 5, std::chrono::milliseconds(500))
                    .status == OrderStatus::Filled);
        REQUIRE(ex.cancel_count() == 1);
    }
}

// ============================================
// Engine
// ============================================

TEST_CASE("Execution mode is required", "[execution]") {
    Config config = fast_config();
    config.execution.mode.reset();
    auto leg1 = std::make_shared<PaperExchange>("lighter");
    auto leg2 = std::make_shared<PaperExchange>("x10");
    MarketDataService md(leg1, leg2, config.market_data, std::chrono::milliseconds(100));
    ShutdownSignal shutdown;
    REQUIRE_THROWS_AS(ExecutionEngine(md, std::make_shared<MemoryTradeStore>(), std::make_shared<EventBus>(),
                                      config, shutdown),
                      ValidationError);
}

TEST_CASE("Sequential entry hedges the leg 1 fill", "[execution]") {
    Harness h;
    std::vector<std::string> opened;
    h.bus->subscribe<TradeOpened>([&](const TradeOpened& e) { opened.push_back(e.trade_id); });

    ExecutionResult r = h.engine.execute(btc_long_leg1());
    REQUIRE(r.success);
    REQUIRE(r.trade.has_value());

    const Trade& t = *r.trade;
    REQUIRE(t.status == TradeStatus::Open);
    REQUIRE(t.execution_state == ExecutionState::Complete);
    REQUIRE(t.leg1.side == Side::Buy);
    REQUIRE(t.leg2.side == Side::Sell);
    REQUIRE(t.leg1.filled_qty.to_double() == Approx(1.0));
    REQUIRE(t.leg1.entry_price.to_double() == Approx(99.99));
    REQUIRE(t.leg2.qty == t.leg1.filled_qty);
    REQUIRE(t.leg2.filled_qty.to_double() == Approx(1.0));
    REQUIRE(t.leg2.entry_price.to_double() == Approx(99.99));

    // Leg 1 rests as a maker, the hedge is an IOC limit
    auto l1_orders = h.leg1->placed_orders("BTC");
    REQUIRE(l1_orders.size() == 1);
    REQUIRE(l1_orders[0].time_in_force == TimeInForce::PostOnly);
    auto l2_orders = h.leg2->placed_orders("BTC");
    REQUIRE(l2_orders.size() == 1);
    REQUIRE(l2_orders[0].time_in_force == TimeInForce::IOC);

    REQUIRE(h.leg1->position("BTC")->side == Side::Buy);
    REQUIRE(h.leg2->position("BTC")->side == Side::Sell);

    auto stored = h.store->get_trade(t.id);
    REQUIRE(stored.has_value());
    REQUIRE(stored->status == TradeStatus::Open);
    REQUIRE(opened == std::vector<std::string>{t.id});
    REQUIRE_FALSE(h.engine.is_executing("BTC"));

    SECTION("A second entry for the same symbol is refused") {
        ExecutionResult again = h.engine.execute(btc_long_leg1());
        REQUIRE_FALSE(again.success);
        REQUIRE(again.error_code == "VALIDATION_ERROR");
        REQUIRE_FALSE(again.trade.has_value());
        REQUIRE(h.leg1->placed_orders("BTC").size() == 1);
    }
}

TEST_CASE("Leg 1 fills are volume weighted across attempts", "[execution]") {
    Harness h;
    h.leg1->set_fill_policy([](const OrderRequest&, int seq) -> std::optional<PaperFill> {
        if (seq == 1) return PaperFill{Decimal::from_double(0.6), Decimal::from_int(100), true, OrderStatus::Cancelled};
        if (seq == 2) return PaperFill{Decimal::from_double(0.4), Decimal::from_int(110), true, std::nullopt};
        return std::nullopt;
    });

    ExecutionResult r = h.engine.execute(btc_long_leg1());
    REQUIRE(r.success);
    const Trade& t = *r.trade;

    REQUIRE(h.leg1->placed_orders("BTC").size() == 2);
    REQUIRE(h.leg1->placed_orders("BTC")[1].quantity.to_double() == Approx(0.4));
    REQUIRE(t.leg1.filled_qty.to_double() == Approx(1.0));
    REQUIRE(t.leg1.entry_price.to_double() == Approx(104.0));
    REQUIRE(t.leg1.fees.to_double() == Approx(0.6 * 100 * 0.0002 + 0.4 * 110 * 0.0002));
    REQUIRE(t.leg2.qty == t.leg1.filled_qty);
}

TEST_CASE("Untracked leg 1 fills are assimilated from the position", "[execution]") {
    Harness h;
    h.leg1->set_fill_policy([](const OrderRequest&, int seq) -> std::optional<PaperFill> {
        if (seq == 1) return PaperFill{Decimal::from_double(0.4), Decimal::from_int(100), true, OrderStatus::Cancelled};
        return std::nullopt;
    });
    // The venue ends up holding more than the order reports
    bool ghosted = false;
    h.leg1->subscribe_orders([&](const Order&) {
        if (ghosted) return;
        ghosted = true;
        Position p;
        p.symbol = "BTC";
        p.side = Side::Buy;
        p.quantity = Decimal::one();
        p.entry_price = Decimal::from_int(100);
        h.leg1->set_position(p);
    });

    ExecutionResult r = h.engine.execute(btc_long_leg1());
    REQUIRE(r.success);
    const Trade& t = *r.trade;

    REQUIRE(h.leg1->placed_orders("BTC").size() == 1);
    REQUIRE(t.leg1.filled_qty.to_double() == Approx(1.0));
    REQUIRE(t.leg1.entry_price.to_double() == Approx(100.0));
    REQUIRE(t.leg2.qty.to_double() == Approx(1.0));
}

TEST_CASE("Unfilled leg 1 aborts without touching the hedge venue", "[execution]") {
    Harness h;
    h.leg1->set_maker_fill_ratio(Decimal::zero());

    ExecutionResult r = h.engine.execute(btc_long_leg1());
    REQUIRE_FALSE(r.success);
    REQUIRE(r.error_code == "LEG1_FAILED");
    REQUIRE(r.trade.has_value());
    REQUIRE(r.trade->status == TradeStatus::Aborted);
    REQUIRE(r.trade->close_reason == "LEG1_FAILED");
    REQUIRE(h.leg1->cancel_count() == 3);
    REQUIRE(h.store->list_open_trades().empty());
}

TEST_CASE("Taker escalation completes an unfilled leg 1", "[execution]") {
    Config config = fast_config();
    config.execution.leg1_escalate_to_taker = true;
    Harness h(config);
    h.leg1->set_maker_fill_ratio(Decimal::zero());

    ExecutionResult r = h.engine.execute(btc_long_leg1());
    REQUIRE(r.success);

    auto orders = h.leg1->placed_orders("BTC");
    REQUIRE(orders.size() == 4);
    REQUIRE(orders.back().time_in_force == TimeInForce::IOC);
    REQUIRE(r.trade->leg1.entry_price.to_double() == Approx(100.01));
    REQUIRE(r.trade->leg2.filled_qty.to_double() == Approx(1.0));
}

TEST_CASE("Failed hedge rolls back leg 1", "[execution]") {
    Harness h;
    h.leg2->reject_next_orders(10);

    std::vector<BrokenHedgeDetected> broken;
    std::vector<RollbackCompleted> rollbacks;
    h.bus->subscribe<BrokenHedgeDetected>([&](const BrokenHedgeDetected& e) { broken.push_back(e); });
    h.bus->subscribe<RollbackCompleted>([&](const RollbackCompleted& e) { rollbacks.push_back(e); });

    ExecutionResult r = h.engine.execute(btc_long_leg1());
    REQUIRE_FALSE(r.success);
    REQUIRE(r.error_code == "LEG2_FAILED");
    REQUIRE(r.trade->status == TradeStatus::Aborted);
    REQUIRE(r.trade->execution_state == ExecutionState::Aborted);

    REQUIRE(broken.size() == 1);
    REQUIRE(broken[0].source == "execution");
    REQUIRE(broken[0].missing_venue == "x10");
    REQUIRE(broken[0].remaining_qty.to_double() == Approx(1.0));

    REQUIRE(rollbacks.size() == 1);
    REQUIRE(rollbacks[0].success);

    // Leg 1 flattened with a reduce-only market sell
    auto orders = h.leg1->placed_orders("BTC");
    REQUIRE(orders.size() == 2);
    REQUIRE(orders.back().side == Side::Sell);
    REQUIRE(orders.back().order_type == OrderType::Market);
    REQUIRE(orders.back().reduce_only);
    auto pos = h.leg1->position("BTC");
    REQUIRE((!pos || pos->quantity.is_zero()));
}

TEST_CASE("Wide entry spread is refused before any order", "[execution]") {
    Harness h;
    h.leg2->set_l1("BTC", Decimal::from_int(99), Decimal::from_int(100), Decimal::from_int(101), Decimal::from_int(100));

    ExecutionResult r = h.engine.execute(btc_long_leg1());
    REQUIRE_FALSE(r.success);
    REQUIRE(r.error_code == "SPREAD_TOO_WIDE");
    REQUIRE_FALSE(r.trade.has_value());
    REQUIRE(h.leg1->placed_orders().empty());
    REQUIRE(h.store->list_trades().empty());
}

TEST_CASE("Entry needs margin on both venues", "[execution]") {
    Harness h;
    h.leg2->set_balance(Decimal::from_int(10));

    ExecutionResult r = h.engine.execute(btc_long_leg1());
    REQUIRE_FALSE(r.success);
    REQUIRE_FALSE(r.trade.has_value());
    REQUIRE(h.leg1->placed_orders().empty());
}

TEST_CASE("Parallel entry trims the hedge to leg 1", "[execution]") {
    Harness h(fast_config(ExecutionMode::Parallel));
    h.leg1->set_maker_fill_ratio(Decimal::from_double(0.5));

    ExecutionResult r = h.engine.execute(btc_long_leg1());
    REQUIRE(r.success);
    const Trade& t = *r.trade;

    // 0.5 + 0.25 + 0.125 over three maker attempts
    REQUIRE(t.leg1.filled_qty.to_double() == Approx(0.875));
    REQUIRE(t.leg2.filled_qty.to_double() == Approx(0.875));
    REQUIRE(t.leg2.qty == t.leg1.filled_qty);
    REQUIRE(t.target_qty.to_double() == Approx(0.875));

    auto trims = h.leg2->placed_orders("BTC");
    REQUIRE(trims.size() == 2);
    REQUIRE(trims.back().reduce_only);
    REQUIRE(trims.back().side == Side::Buy);
    REQUIRE(trims.back().quantity.to_double() == Approx(0.125));
    REQUIRE(h.leg2->position("BTC")->quantity.to_double() == Approx(0.875));
}

TEST_CASE("Failed rollback keeps the trade open and pauses entries", "[execution]") {
    Config config = fast_config();
    config.execution.rollback_max_attempts = 2;
    Harness h(config);
    h.leg2->reject_next_orders(10);
    refuse_reduce_only(*h.leg1);

    Supervisor sup(h.bus, h.shutdown, SupervisorConfig{});

    std::vector<AlertEvent> alerts;
    std::vector<RollbackCompleted> rollbacks;
    h.bus->subscribe<AlertEvent>([&](const AlertEvent& e) { alerts.push_back(e); });
    h.bus->subscribe<RollbackCompleted>([&](const RollbackCompleted& e) { rollbacks.push_back(e); });

    ExecutionResult r = h.engine.execute(btc_long_leg1());
    REQUIRE_FALSE(r.success);
    REQUIRE(r.error_code == "ROLLBACK_FAILED");
    REQUIRE(r.trade->status == TradeStatus::Open);
    REQUIRE(r.trade->execution_state == ExecutionState::RollbackFailed);

    // Handed to position management with the exposure still live
    auto open = h.store->list_open_trades();
    REQUIRE(open.size() == 1);
    REQUIRE(open[0].id == r.trade->id);
    REQUIRE(h.leg1->position("BTC")->quantity.to_double() == Approx(1.0));

    int critical = 0;
    for (const auto& a : alerts) {
        if (a.level != AlertLevel::Critical) continue;
        ++critical;
        REQUIRE(a.details.at("incident") == "rollback:" + r.trade->id);
    }
    REQUIRE(critical == 1);

    REQUIRE(rollbacks.size() == 1);
    REQUIRE_FALSE(rollbacks[0].success);
    REQUIRE(sup.entries_paused());
    REQUIRE(sup.pause_reason() == "rollback failed on BTC (" + r.trade->id + ")");
}

TEST_CASE("Parallel entry rolls back the surviving leg", "[execution]") {
    Harness h(fast_config(ExecutionMode::Parallel));
    h.leg2->reject_next_orders(10);

    std::vector<BrokenHedgeDetected> broken;
    std::vector<RollbackCompleted> rollbacks;
    h.bus->subscribe<BrokenHedgeDetected>([&](const BrokenHedgeDetected& e) { broken.push_back(e); });
    h.bus->subscribe<RollbackCompleted>([&](const RollbackCompleted& e) { rollbacks.push_back(e); });

    ExecutionResult r = h.engine.execute(btc_long_leg1());
    REQUIRE_FALSE(r.success);
    REQUIRE(r.error_code == "LEG2_FAILED");
    REQUIRE(r.trade->status == TradeStatus::Aborted);

    REQUIRE(broken.size() == 1);
    REQUIRE(broken[0].missing_venue == "x10");
    REQUIRE(rollbacks.size() == 1);
    REQUIRE(rollbacks[0].success);

    auto orders = h.leg1->placed_orders("BTC");
    REQUIRE(orders.size() == 2);
    REQUIRE(orders.back().side == Side::Sell);
    REQUIRE(orders.back().reduce_only);
    auto pos = h.leg1->position("BTC");
    REQUIRE((!pos || pos->quantity.is_zero()));
    REQUIRE(h.store->list_open_trades().empty());
}

TEST_CASE("Failed rollback is notified once", "[execution]") {
    Config config = fast_config();
    config.execution.rollback_max_attempts = 1;
    Harness h(config);
    h.leg2->reject_next_orders(10);
    refuse_reduce_only(*h.leg1);

    auto port = std::make_shared<CapturingPort>();
    NotificationConfig cfg;
    cfg.enabled = true;
    cfg.min_level = "WARNING";
    AlertNotifier notifier(port, cfg);
    notifier.attach(*h.bus);

    ExecutionResult r = h.engine.execute(btc_long_leg1());
    REQUIRE(r.error_code == "ROLLBACK_FAILED");

    int rollback_messages = 0;
    for (const auto& m : port->messages) {
        if (m.rfind("[CRITICAL] Rollback failed", 0) == 0 || m.rfind("[CRITICAL] ROLLBACK FAILED", 0) == 0) {
            ++rollback_messages;
        }
    }
    REQUIRE(rollback_messages == 1);
    REQUIRE(notifier.suppressed() == 1);
}
