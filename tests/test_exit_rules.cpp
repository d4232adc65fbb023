// Funding Arb Engine - Exit Rules Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <fundarb/exit_rules.hpp>

using namespace fundarb;
using namespace fundarb::rules;
using Catch::Approx;

namespace {

constexpr int64_t kHour = MS_PER_HOUR;

// Short 1 on lighter, long 1 on x10, both at 100, opened at t=1ms
Trade hedged_trade() {
    Trade t = Trade::create("BTC", "lighter", Side::Sell, "x10", Decimal::one(),
                            Decimal::from_int(100), Decimal::from_double(0.5), 0);
    for (auto* leg : {&t.leg1, &t.leg2}) {
        leg->filled_qty = Decimal::one();
        leg->entry_price = Decimal::from_int(100);
    }
    t.mark_opened(1);
    return t;
}

ExitContext context_at(int64_t now) {
    ExitContext ctx;
    ctx.now = now;
    ctx.leg1_mark = Decimal::from_int(100);
    ctx.leg2_mark = Decimal::from_int(100);
    return ctx;
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

}  // namespace

TEST_CASE("Early take profit threshold", "[exit_rules]") {
    ExitRulesConfig config;

    // 0.30 + max(0 * 1.5, 0.50) + 0
    REQUIRE(effective_take_profit_threshold(Decimal::zero(), config).to_double() == Approx(0.80));
    // 0.30 + max(1.0 * 1.5, 0.50)
    REQUIRE(effective_take_profit_threshold(Decimal::one(), config).to_double() == Approx(1.80));

    config.early_take_profit_execution_buffer_usd = Decimal::from_double(0.1);
    REQUIRE(effective_take_profit_threshold(Decimal::zero(), config).to_double() == Approx(0.90));
}

TEST_CASE("Early take profit bypasses the minimum hold", "[exit_rules]") {
    ExitRulesConfig config;
    Trade trade = hedged_trade();
    ExitContext ctx = context_at(60 * 1000);

    SECTION("Above threshold exits") {
        ctx.price_pnl = Decimal::from_double(0.85);
        ctx.current_pnl = Decimal::from_double(0.85);
        auto d = evaluate_exit(trade, ctx, config);
        REQUIRE(d.should_exit);
        REQUIRE_FALSE(d.emergency);
        REQUIRE(starts_with(d.reason, REASON_EARLY_TP));
    }

    SECTION("Below threshold waits for the minimum hold") {
        ctx.price_pnl = Decimal::from_double(0.50);
        ctx.current_pnl = Decimal::from_double(0.50);
        auto d = evaluate_exit(trade, ctx, config);
        REQUIRE_FALSE(d.should_exit);
        REQUIRE(starts_with(d.reason, "Min hold"));
    }

    SECTION("Net loss blocks the early exit") {
        ctx.price_pnl = Decimal::from_double(0.85);
        ctx.current_pnl = Decimal::from_double(-0.01);
        REQUIRE_FALSE(evaluate_exit(trade, ctx, config).should_exit);
    }

    SECTION("Disabled") {
        config.early_take_profit = false;
        ctx.price_pnl = Decimal::from_int(10);
        ctx.current_pnl = Decimal::from_int(10);
        REQUIRE_FALSE(evaluate_exit(trade, ctx, config).should_exit);
    }
}

TEST_CASE("Emergency exits", "[exit_rules]") {
    ExitRulesConfig config;
    Trade trade = hedged_trade();
    ExitContext ctx = context_at(60 * 1000);

    SECTION("Nearest liquidation distance") {
        ctx.leg1_liquidation_distance = Decimal::from_double(0.5);
        ctx.leg2_liquidation_distance = Decimal::from_double(0.05);
        auto d = evaluate_exit(trade, ctx, config);
        REQUIRE(d.should_exit);
        REQUIRE(d.emergency);
        REQUIRE(starts_with(d.reason, REASON_EMERGENCY));
    }

    SECTION("Liquidation comfortably far") {
        ctx.leg1_liquidation_distance = Decimal::from_double(0.3);
        REQUIRE_FALSE(evaluate_exit(trade, ctx, config).should_exit);
    }

    SECTION("Delta beyond the bound") {
        trade.leg2.filled_qty = Decimal::from_double(1.1);
        auto d = evaluate_exit(trade, ctx, config);
        REQUIRE(d.emergency);
        REQUIRE_FALSE(d.rebalance);
    }

    SECTION("Catastrophic funding flip") {
        // Short leg pays 0.05%/h: -438% APY
        ctx.leg1_rate_hourly = Decimal::from_double(-0.0005);
        auto d = evaluate_exit(trade, ctx, config);
        REQUIRE(d.emergency);
        REQUIRE(d.reason.find("catastrophic") != std::string::npos);
    }
}

TEST_CASE("Delta drift and rebalance", "[exit_rules]") {
    ExitRulesConfig config;
    Trade trade = hedged_trade();
    ExitContext ctx = context_at(60 * 1000);

    REQUIRE(delta_drift(trade, ctx.leg1_mark, ctx.leg2_mark).is_zero());

    SECTION("Inside the rebalance band") {
        trade.leg2.filled_qty = Decimal::from_double(1.03);
        // 3 / 203
        REQUIRE(delta_drift(trade, ctx.leg1_mark, ctx.leg2_mark).to_double() == Approx(3.0 / 203.0).margin(1e-7));

        auto d = evaluate_exit(trade, ctx, config);
        REQUIRE(d.should_exit);
        REQUIRE(d.rebalance);
        REQUIRE_FALSE(d.emergency);
        REQUIRE(starts_with(d.reason, REASON_REBALANCE));
    }

    SECTION("Below the band") {
        trade.leg2.filled_qty = Decimal::from_double(1.02);
        REQUIRE_FALSE(evaluate_exit(trade, ctx, config).should_exit);
    }

    SECTION("Marks move the drift") {
        ctx.leg2_mark = Decimal::from_int(110);
        // |-100 + 110| / 210
        REQUIRE(delta_drift(trade, ctx.leg1_mark, ctx.leg2_mark).to_double() == Approx(10.0 / 210.0).margin(1e-7));
    }

    SECTION("Missing marks use entry prices") {
        trade.leg2.filled_qty = Decimal::from_double(1.03);
        REQUIRE(delta_drift(trade, std::nullopt, std::nullopt).to_double() == Approx(3.0 / 203.0).margin(1e-7));
    }
}

TEST_CASE("Hold limits", "[exit_rules]") {
    ExitRulesConfig config;
    Trade trade = hedged_trade();

    SECTION("Minimum hold") {
        auto d = evaluate_exit(trade, context_at(kHour), config);
        REQUIRE_FALSE(d.should_exit);
        REQUIRE(starts_with(d.reason, "Min hold"));
    }

    SECTION("Maximum hold") {
        auto d = evaluate_exit(trade, context_at(241 * kHour), config);
        REQUIRE(d.should_exit);
        REQUIRE(starts_with(d.reason, "Max hold"));
    }
}

TEST_CASE("Funding flip after the minimum hold", "[exit_rules]") {
    ExitRulesConfig config;
    Trade trade = hedged_trade();
    ExitContext ctx = context_at(3 * kHour);
    // -8.76% APY on the trade's direction
    ctx.leg1_rate_hourly = Decimal::from_double(-0.00001);
    ctx.exit_cost = Decimal::from_double(0.1);

    REQUIRE(funding_diff_hourly(trade, ctx.leg1_rate_hourly, ctx.leg2_rate_hourly).to_double() ==
            Approx(-0.00001));

    SECTION("Exit cost outweighs the projected loss") {
        auto d = evaluate_exit(trade, ctx, config);
        REQUIRE_FALSE(d.should_exit);
        REQUIRE(starts_with(d.reason, "Holding despite flip"));
    }

    SECTION("Profit above exit cost is locked in") {
        ctx.current_pnl = Decimal::from_double(0.5);
        auto d = evaluate_exit(trade, ctx, config);
        REQUIRE(d.should_exit);
        REQUIRE(starts_with(d.reason, "Funding flipped"));
    }
}

TEST_CASE("NetEV", "[exit_rules]") {
    ExitRulesConfig config;
    Trade trade = hedged_trade();
    ExitContext ctx = context_at(3 * kHour);
    ctx.exit_cost = Decimal::from_double(0.1);

    SECTION("Funding too thin to cover the exit") {
        // 0.00002 * 100 * 24 = 0.048 < 0.1
        ctx.leg1_rate_hourly = Decimal::from_double(0.00002);
        auto d = evaluate_exit(trade, ctx, config);
        REQUIRE(d.should_exit);
        REQUIRE(starts_with(d.reason, REASON_NETEV));
    }

    SECTION("Good edge holds past the profit target") {
        // 0.0001 * 100 * 24 = 0.24 >= 0.1
        ctx.leg1_rate_hourly = Decimal::from_double(0.0001);
        ctx.current_pnl = Decimal::from_int(50);
        auto d = evaluate_exit(trade, ctx, config);
        REQUIRE_FALSE(d.should_exit);
        REQUIRE(starts_with(d.reason, "Hold (NetEV)"));
    }
}

TEST_CASE("Profit target and opportunity cost", "[exit_rules]") {
    ExitRulesConfig config;
    config.net_ev = false;
    Trade trade = hedged_trade();
    ExitContext ctx = context_at(3 * kHour);
    // 43.8% APY
    ctx.leg1_rate_hourly = Decimal::from_double(0.00005);

    SECTION("Profit target") {
        ctx.current_pnl = Decimal::from_int(6);
        auto d = evaluate_exit(trade, ctx, config);
        REQUIRE(d.should_exit);
        REQUIRE(starts_with(d.reason, "Profit target"));
    }

    SECTION("Much better alternative with free exit") {
        ctx.best_alternative_apy = Decimal::one();
        auto d = evaluate_exit(trade, ctx, config);
        REQUIRE(d.should_exit);
        REQUIRE(starts_with(d.reason, "Opportunity cost"));
    }

    SECTION("Switch cost exceeds the gain") {
        ctx.best_alternative_apy = Decimal::one();
        ctx.exit_cost = Decimal::one();
        REQUIRE_FALSE(evaluate_exit(trade, ctx, config).should_exit);
    }

    SECTION("Alternative not far enough ahead") {
        ctx.best_alternative_apy = Decimal::from_double(0.6);
        auto d = evaluate_exit(trade, ctx, config);
        REQUIRE_FALSE(d.should_exit);
        REQUIRE(d.reason == "Hold: no exit conditions met");
    }
}

TEST_CASE("Trade notional", "[exit_rules]") {
    Trade trade = hedged_trade();
    REQUIRE(trade_notional(trade) == Decimal::from_int(100));

    trade.target_notional_usd = Decimal::zero();
    trade.leg1.entry_price = Decimal::from_int(120);
    REQUIRE(trade_notional(trade) == Decimal::from_int(120));
}
