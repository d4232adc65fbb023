// Funding Arb Engine - Reconciler Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <fundarb/adapters/paper.hpp>
#include <fundarb/event_bus.hpp>
#include <fundarb/memory_store.hpp>
#include <fundarb/reconciler.hpp>
#include <memory>
#include <vector>

using namespace fundarb;
using namespace fundarb::adapters;
using Catch::Approx;

namespace {

constexpr int64_t kNow = 50'000'000;

Position live(Side side, double qty, double entry = 100.0) {
    Position p;
    p.symbol = "BTC";
    p.side = side;
    p.quantity = Decimal::from_double(qty);
    p.entry_price = Decimal::from_double(entry);
    return p;
}

struct Books {
    Config config;
    int64_t now = kNow;
    std::shared_ptr<PaperExchange> leg1 = std::make_shared<PaperExchange>("lighter");
    std::shared_ptr<PaperExchange> leg2 = std::make_shared<PaperExchange>("x10");
    std::shared_ptr<MemoryTradeStore> store = std::make_shared<MemoryTradeStore>();
    std::shared_ptr<EventBus> bus = std::make_shared<EventBus>();
    MarketDataService md;
    Reconciler reconciler;
    std::vector<PositionReconciled> events;

    Books()
        : config(make_config()),
          md(leg1, leg2, config.market_data, std::chrono::milliseconds(1000), [this] { return now; }),
          reconciler(md, store, bus, config, [this] { return now; }) {
        for (auto* ex : {leg1.get(), leg2.get()}) {
            ex->set_l1("BTC", Decimal::from_double(99.99), Decimal::from_int(100),
                       Decimal::from_double(100.01), Decimal::from_int(100));
        }
        bus->subscribe<PositionReconciled>([this](const PositionReconciled& e) { events.push_back(e); });
    }

    static Config make_config() {
        Config config;
        config.execution.mode = ExecutionMode::Sequential;
        config.execution.call_timeout_ms = 1000;
        config.execution.retry_base_delay_ms = 1;
        config.close.poll_interval_ms = 5;
        return config;
    }

    // Long BTC on lighter, short on x10
    Trade add_trade(TradeStatus status, double qty, int64_t created_at = kNow - 3'600'000) {
        Trade t = Trade::create("BTC", "lighter", Side::Buy, "x10", Decimal::from_double(qty),
                                Decimal::from_double(qty * 100), Decimal::from_double(0.4), created_at);
        if (status == TradeStatus::Open) {
            for (auto* leg : {&t.leg1, &t.leg2}) {
                leg->qty = Decimal::from_double(qty);
                leg->filled_qty = Decimal::from_double(qty);
                leg->entry_price = Decimal::from_int(100);
            }
            t.mark_opened(created_at);
        } else {
            t.status = status;
        }
        store->create_trade(t);
        return t;
    }
};

}  // namespace

TEST_CASE("Matching positions need no action", "[reconciler]") {
    Books b;
    Trade t = b.add_trade(TradeStatus::Open, 1.0);
    b.leg1->set_position(live(Side::Buy, 1.0));
    b.leg2->set_position(live(Side::Sell, 1.0));

    ReconcileResult r = b.reconciler.reconcile();
    REQUIRE(r.ok());
    REQUIRE(r.trades_checked == 1);
    REQUIRE(r.positions_seen == 2);
    REQUIRE(r.actions.empty());
    REQUIRE(b.store->get_trade(t.id)->status == TradeStatus::Open);
}

TEST_CASE("Side conflict force-closes both legs", "[reconciler]") {
    Books b;
    Trade t = b.add_trade(TradeStatus::Open, 1.0);
    b.leg1->set_position(live(Side::Sell, 1.0));
    b.leg2->set_position(live(Side::Buy, 1.0));

    ReconcileResult r = b.reconciler.reconcile();
    REQUIRE(r.count(ACTION_CLOSED_CONFLICT) == 1);

    auto stored = b.store->get_trade(t.id);
    REQUIRE(stored->status == TradeStatus::Closed);
    REQUIRE(stored->close_reason == ACTION_CLOSED_CONFLICT);
    REQUIRE_FALSE(b.leg1->position("BTC").has_value());
    REQUIRE_FALSE(b.leg2->position("BTC").has_value());
    REQUIRE(b.leg1->placed_orders("BTC").back().reduce_only);

    REQUIRE(b.events.size() == 1);
    REQUIRE(b.events[0].action == ACTION_CLOSED_CONFLICT);
    REQUIRE(b.events[0].details.at("trade_id") == t.id);
}

TEST_CASE("Quantity drift is reported, not rewritten", "[reconciler]") {
    Books b;

    SECTION("Beyond tolerance") {
        Trade t = b.add_trade(TradeStatus::Open, 100.0);
        b.leg1->set_position(live(Side::Buy, 50.0));
        b.leg2->set_position(live(Side::Sell, 100.0));

        ReconcileResult r = b.reconciler.reconcile();
        REQUIRE(r.count(ACTION_QUANTITY_MISMATCH) == 1);
        REQUIRE(r.actions[0].venue == "lighter");
        REQUIRE(r.actions[0].details.at("delta") == "50");
        REQUIRE(b.store->get_trade(t.id)->leg1.filled_qty.to_double() == Approx(100.0));
        REQUIRE(b.leg1->placed_orders().empty());

        // Same drift is reported once
        ReconcileResult again = b.reconciler.reconcile();
        REQUIRE(again.count(ACTION_QUANTITY_MISMATCH) == 0);
    }

    SECTION("Within tolerance") {
        b.add_trade(TradeStatus::Open, 1.0);
        b.leg1->set_position(live(Side::Buy, 0.99));
        b.leg2->set_position(live(Side::Sell, 1.0));

        ReconcileResult r = b.reconciler.reconcile();
        REQUIRE(r.actions.empty());
    }
}

TEST_CASE("Open trade with no positions is marked zombie", "[reconciler]") {
    Books b;
    Trade t = b.add_trade(TradeStatus::Open, 1.0);

    ReconcileResult r = b.reconciler.reconcile();
    REQUIRE(r.count(ACTION_MARKED_ZOMBIE) == 1);

    auto stored = b.store->get_trade(t.id);
    REQUIRE(stored->status == TradeStatus::Closed);
    REQUIRE(stored->close_reason == "closed_externally");
    REQUIRE(stored->closed_at == kNow);
}

TEST_CASE("One missing leg is left to position monitoring", "[reconciler]") {
    Books b;
    Trade t = b.add_trade(TradeStatus::Open, 1.0);
    b.leg1->set_position(live(Side::Buy, 1.0));

    ReconcileResult r = b.reconciler.reconcile();
    REQUIRE(r.actions.empty());
    REQUIRE(b.store->get_trade(t.id)->status == TradeStatus::Open);
    REQUIRE(b.leg1->placed_orders().empty());
}

TEST_CASE("Stale opening trades", "[reconciler]") {
    Books b;

    SECTION("Aborted at startup and any leg flattened") {
        Trade t = b.add_trade(TradeStatus::Opening, 1.0, kNow - 1'000);
        b.leg1->set_position(live(Side::Buy, 1.0));

        ReconcileResult r = b.reconciler.reconcile(true);
        REQUIRE(r.count(ACTION_ABORTED_ZOMBIE) == 1);
        REQUIRE(r.actions[0].details.at("flattened") == "lighter");

        auto stored = b.store->get_trade(t.id);
        REQUIRE(stored->status == TradeStatus::Aborted);
        REQUIRE(stored->close_reason == ACTION_ABORTED_ZOMBIE);
        REQUIRE_FALSE(b.leg1->position("BTC").has_value());
    }

    SECTION("A young opening trade is left alone outside startup") {
        Trade t = b.add_trade(TradeStatus::Opening, 1.0, kNow - 1'000);
        ReconcileResult r = b.reconciler.reconcile(false);
        REQUIRE(r.actions.empty());
        REQUIRE(b.store->get_trade(t.id)->status == TradeStatus::Opening);
    }

    SECTION("An entry in flight is never touched") {
        Trade t = b.add_trade(TradeStatus::Opening, 1.0, kNow - 1'000);
        b.reconciler.set_executing_check([](const std::string& symbol) { return symbol == "BTC"; });
        ReconcileResult r = b.reconciler.reconcile(true);
        REQUIRE(r.actions.empty());
        REQUIRE(b.store->get_trade(t.id)->status == TradeStatus::Opening);
    }

    SECTION("Both legs live recovers the trade") {
        Trade t = b.add_trade(TradeStatus::Opening, 1.0, kNow - 600'000);
        b.leg1->set_position(live(Side::Buy, 1.0, 100.5));
        b.leg2->set_position(live(Side::Sell, 1.0, 101.0));

        ReconcileResult r = b.reconciler.reconcile(false);
        REQUIRE(r.count(ACTION_RECOVERED_OPENING) == 1);

        auto stored = b.store->get_trade(t.id);
        REQUIRE(stored->status == TradeStatus::Open);
        REQUIRE(stored->execution_state == ExecutionState::Complete);
        REQUIRE(stored->leg1.entry_price.to_double() == Approx(100.5));
        REQUIRE(stored->leg2.filled_qty.to_double() == Approx(1.0));
        REQUIRE(b.leg1->placed_orders().empty());
    }
}

TEST_CASE("Ghost positions follow the configured policy", "[reconciler]") {
    Books b;
    b.leg1->set_position(live(Side::Buy, 2.0));
    b.leg2->set_position(live(Side::Sell, 2.0));

    SECTION("Ignore leaves them") {
        b.config.reconcile.ghost_policy = GhostPolicy::Ignore;
        ReconcileResult r = b.reconciler.reconcile();
        REQUIRE(r.actions.empty());
        REQUIRE(b.leg1->position("BTC").has_value());
    }

    SECTION("Close flattens each venue") {
        b.config.reconcile.ghost_policy = GhostPolicy::Close;
        ReconcileResult r = b.reconciler.reconcile();
        REQUIRE(r.count(ACTION_CLOSED_ZOMBIE) == 2);
        REQUIRE_FALSE(b.leg1->position("BTC").has_value());
        REQUIRE_FALSE(b.leg2->position("BTC").has_value());
        REQUIRE(b.store->list_trades().empty());

        // Cooldown holds off a second flatten of a reappearing ghost
        b.leg1->set_position(live(Side::Buy, 2.0));
        b.now += 1'000;
        ReconcileResult again = b.reconciler.reconcile();
        REQUIRE(again.count(ACTION_CLOSED_ZOMBIE) == 0);
        REQUIRE(b.leg1->position("BTC").has_value());
    }

    SECTION("Adopt records a matched hedge") {
        b.config.reconcile.ghost_policy = GhostPolicy::Adopt;
        ReconcileResult r = b.reconciler.reconcile();
        REQUIRE(r.count(ACTION_ADOPTED_GHOST) == 1);

        auto open = b.store->list_open_trades();
        REQUIRE(open.size() == 1);
        REQUIRE(open[0].symbol == "BTC");
        REQUIRE(open[0].leg1.side == Side::Buy);
        REQUIRE(open[0].leg2.side == Side::Sell);
        REQUIRE(open[0].status == TradeStatus::Open);
        REQUIRE(b.leg1->placed_orders().empty());
    }
}

TEST_CASE("Unavailable venue skips the pass", "[reconciler]") {
    Books b;
    Trade t = b.add_trade(TradeStatus::Open, 1.0);
    b.leg2->fail_next(PaperOp::ListPositions, 10, false);

    ReconcileResult r = b.reconciler.reconcile();
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.trades_checked == 0);
    REQUIRE(b.store->get_trade(t.id)->status == TradeStatus::Open);
}
