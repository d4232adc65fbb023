// Funding Arb Engine - Trading Bot Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <fundarb/adapters/paper.hpp>
#include <fundarb/bot.hpp>
#include <fundarb/errors.hpp>
#include <fundarb/memory_store.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace fundarb;
using namespace fundarb::adapters;
using Catch::Approx;

namespace {

class RecordingPort : public NotificationPort {
public:
    bool send_message(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(text);
        return true;
    }

    std::vector<std::string> messages() {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

private:
    std::mutex mutex_;
    std::vector<std::string> messages_;
};

Config bot_config() {
    Config config;
    config.with_mode(ExecutionMode::Sequential).with_symbols({"BTC"});
    config.execution.call_timeout_ms = 1000;
    config.execution.retry_base_delay_ms = 1;
    config.execution.leg1_total_timeout_ms = 200;
    config.execution.leg1_poll_interval_ms = 5;
    config.supervisor.backoff_base_ms = 10;
    config.supervisor.backoff_cap_ms = 100;
    return config;
}

// BTC pays more on lighter, so the bot shorts it there and hedges long on x10
struct Venues {
    std::shared_ptr<PaperExchange> leg1 = std::make_shared<PaperExchange>("lighter");
    std::shared_ptr<PaperExchange> leg2 = std::make_shared<PaperExchange>("x10");
    std::shared_ptr<MemoryTradeStore> store = std::make_shared<MemoryTradeStore>();

    Venues() {
        for (auto* ex : {leg1.get(), leg2.get()}) {
            ex->set_l1("BTC", Decimal::from_double(99.99), Decimal::from_int(100),
                       Decimal::from_double(100.01), Decimal::from_int(100));
        }
        leg1->set_funding_rate("BTC", Decimal::from_double(0.0003));
        leg2->set_funding_rate("BTC", Decimal::from_double(0.00001));
    }
};

template <typename Pred>
bool eventually(Pred pred) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

}  // namespace

TEST_CASE("Bot validates its wiring", "[bot]") {
    Venues v;

    SECTION("Missing execution mode") {
        Config config = bot_config();
        config.execution.mode.reset();
        REQUIRE_THROWS_AS(TradingBot(config, v.leg1, v.leg2, v.store), ConfigError);
    }

    SECTION("Adapters must match the configured venues") {
        auto other = std::make_shared<PaperExchange>("paradex");
        REQUIRE_THROWS_AS(TradingBot(bot_config(), v.leg1, other, v.store), ConfigError);
        REQUIRE_THROWS_AS(TradingBot(bot_config(), v.leg2, v.leg1, v.store), ConfigError);
    }
}

TEST_CASE("Entry scan opens a hedged trade", "[bot]") {
    Venues v;
    TradingBot bot(bot_config(), v.leg1, v.leg2, v.store);

    REQUIRE(bot.refresh_market_data() == 1);
    REQUIRE(bot.scan_and_enter() == 1);

    auto open = v.store->list_open_trades();
    REQUIRE(open.size() == 1);
    const Trade& t = open[0];
    REQUIRE(t.symbol == "BTC");
    REQUIRE(t.leg1.venue == "lighter");
    REQUIRE(t.leg1.side == Side::Sell);
    REQUIRE(t.leg2.side == Side::Buy);
    REQUIRE(t.leg1.filled_qty.to_double() == Approx(5.0));
    REQUIRE(t.leg2.filled_qty.to_double() == Approx(5.0));

    BotStatus s = bot.status();
    REQUIRE_FALSE(s.running);
    REQUIRE(s.open_trades == 1);
    REQUIRE(s.market_data_healthy);
    REQUIRE_FALSE(s.entries_paused);
    REQUIRE_FALSE(s.breaker_tripped);
    // Every event is journaled
    REQUIRE(s.stats.events > 0);

    SECTION("An open symbol is not entered again") {
        REQUIRE(bot.scan_and_enter() == 0);
        REQUIRE(v.leg1->placed_orders().size() == 1);
    }

    SECTION("Position pass holds a fresh trade") {
        REQUIRE(bot.manage_positions() == 0);
        REQUIRE(v.store->list_open_trades().size() == 1);
    }

    SECTION("Reconciliation agrees with the venues") {
        ReconcileResult r = bot.reconcile();
        REQUIRE(r.ok());
        REQUIRE(r.actions.empty());
    }
}

TEST_CASE("Entry scan respects the gates", "[bot]") {
    Venues v;
    TradingBot bot(bot_config(), v.leg1, v.leg2, v.store);

    SECTION("Stale market data") {
        REQUIRE(bot.scan_and_enter() == 0);
    }

    bot.refresh_market_data();

    SECTION("Paused entries") {
        bot.supervisor().pause("operator");
        REQUIRE(bot.scan_and_enter() == 0);
        REQUIRE(bot.status().pause_reason == "operator");
    }

    SECTION("Open circuit breaker") {
        for (int i = 0; i < bot.config().circuit_breaker.max_consecutive_failures; ++i) {
            bot.circuit_breaker().record_failure("LEG2_FAILED");
        }
        REQUIRE(bot.scan_and_enter() == 0);
        REQUIRE(bot.status().breaker_tripped);
    }

    REQUIRE(v.leg1->placed_orders().empty());
    REQUIRE(v.store->list_trades().empty());
}

TEST_CASE("Failed hedge counts against the circuit breaker", "[bot]") {
    Venues v;
    Config config = bot_config();
    config.execution.leg2_fill_timeout_ms = 100;
    TradingBot bot(config, v.leg1, v.leg2, v.store);
    v.leg2->reject_next_orders(100);

    bot.refresh_market_data();
    REQUIRE(bot.scan_and_enter() == 0);
    REQUIRE(bot.circuit_breaker().consecutive_failures() == 1);
    REQUIRE(v.store->list_open_trades().empty());
    // Entry-time hedge failures are rolled back without pausing
    REQUIRE_FALSE(bot.status().entries_paused);
}

TEST_CASE("Started bot trades and notifies", "[bot]") {
    Venues v;
    Config config = bot_config();
    config.with_webhook("http://localhost/hook");
    config.notification.min_level = "INFO";
    auto port = std::make_shared<RecordingPort>();

    TradingBot bot(config, v.leg1, v.leg2, v.store, port);
    bot.start();
    REQUIRE(bot.status().running);

    REQUIRE(eventually([&] { return v.store->list_open_trades().size() == 1; }));
    bot.stop();
    REQUIRE_FALSE(bot.status().running);
    REQUIRE(bot.shutdown_signal().requested());

    bool opened = false;
    for (const auto& m : port->messages()) {
        if (m.rfind("Opened BTC", 0) == 0) opened = true;
    }
    REQUIRE(opened);
}
