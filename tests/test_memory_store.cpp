// Funding Arb Engine - Memory Trade Store Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <fundarb/errors.hpp>
#include <fundarb/memory_store.hpp>
#include <filesystem>
#include <fstream>

using namespace fundarb;
using Catch::Approx;

namespace {

Trade make_trade(const std::string& symbol, int64_t created_at,
                 TradeStatus status = TradeStatus::Opening) {
    Trade t = Trade::create(symbol, "lighter", Side::Buy, "x10",
                            Decimal::one(), Decimal::from_int(100), Decimal::from_double(0.3), created_at);
    t.status = status;
    return t;
}

std::string temp_journal(const char* name) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove(path);
    return path.string();
}

}  // namespace

TEST_CASE("One active trade per symbol", "[store]") {
    MemoryTradeStore store;
    Trade first = make_trade("BTC", 1000);
    store.create_trade(first);

    SECTION("Second active trade is rejected") {
        REQUIRE_THROWS_AS(store.create_trade(make_trade("BTC", 2000)), ValidationError);
    }

    SECTION("Duplicate id is rejected") {
        Trade dup = first;
        dup.symbol = "ETH";
        REQUIRE_THROWS_AS(store.create_trade(dup), ValidationError);
    }

    SECTION("Other symbols are free") {
        REQUIRE_NOTHROW(store.create_trade(make_trade("ETH", 2000)));
    }

    SECTION("Symbol frees up once the trade is terminal") {
        first.mark_closed("take_profit", 1500);
        store.update_trade(first);
        REQUIRE_NOTHROW(store.create_trade(make_trade("BTC", 2000)));
    }

    SECTION("Update of an unknown id") {
        REQUIRE_THROWS_AS(store.update_trade(make_trade("SOL", 1)), ValidationError);
    }
}

TEST_CASE("Serialized modify", "[store]") {
    MemoryTradeStore store;
    Trade t = make_trade("BTC", 1000, TradeStatus::Open);
    store.create_trade(t);

    SECTION("Mutator applies") {
        auto after = store.modify_trade(t.id, [](Trade& tr) {
            tr.status = TradeStatus::Closing;
            return true;
        });
        REQUIRE(after.has_value());
        REQUIRE(after->status == TradeStatus::Closing);
        REQUIRE(store.get_trade(t.id)->status == TradeStatus::Closing);
    }

    SECTION("Declining mutator leaves the trade unchanged") {
        auto after = store.modify_trade(t.id, [](Trade& tr) {
            tr.status = TradeStatus::Closing;
            return false;
        });
        REQUIRE(after->status == TradeStatus::Open);
        REQUIRE(store.get_trade(t.id)->status == TradeStatus::Open);
    }

    SECTION("Throwing mutator leaves the trade unchanged") {
        REQUIRE_THROWS_AS(store.modify_trade(t.id, [](Trade& tr) -> bool {
            tr.close_reason = "half written";
            throw ValidationError("nope");
        }), ValidationError);
        REQUIRE(store.get_trade(t.id)->close_reason.empty());
    }

    SECTION("Unknown id") {
        REQUIRE_FALSE(store.modify_trade("missing", [](Trade&) { return true; }).has_value());
    }
}

TEST_CASE("Listing and stats", "[store]") {
    MemoryTradeStore store;

    Trade won = make_trade("BTC", 1000, TradeStatus::Closed);
    won.realized_pnl = Decimal::from_double(2.0);
    won.funding_collected = Decimal::from_double(0.5);
    won.leg1.fees = Decimal::from_double(0.1);
    won.closed_at = 5000;

    Trade lost = make_trade("ETH", 2000, TradeStatus::Closed);
    lost.realized_pnl = Decimal::from_double(-1.0);
    lost.closed_at = 6000;

    Trade aborted = make_trade("SOL", 3000, TradeStatus::Aborted);
    aborted.realized_pnl = Decimal::from_double(-0.25);
    aborted.closed_at = 3500;

    Trade open_old = make_trade("AVAX", 4000, TradeStatus::Open);
    Trade open_new = make_trade("ARB", 5000, TradeStatus::Closing);

    for (const auto& t : {won, lost, aborted, open_old, open_new}) store.create_trade(t);

    SECTION("Open trades oldest first") {
        auto open = store.list_open_trades();
        REQUIRE(open.size() == 2);
        REQUIRE(open[0].symbol == "AVAX");
        REQUIRE(open[1].symbol == "ARB");
    }

    SECTION("Filtered list newest first with limit") {
        auto closed = store.list_trades(TradeStatus::Closed);
        REQUIRE(closed.size() == 2);
        REQUIRE(closed[0].symbol == "ETH");

        auto latest = store.list_trades(std::nullopt, 1);
        REQUIRE(latest.size() == 1);
        REQUIRE(latest[0].symbol == "ARB");
    }

    SECTION("Aggregates") {
        StoreStats s = store.stats();
        REQUIRE(s.total_trades == 5);
        REQUIRE(s.open_trades == 2);
        REQUIRE(s.closed_trades == 2);
        REQUIRE(s.aborted_trades == 1);
        REQUIRE(s.winning_trades == 1);
        // 2.5 - 1.0 - 0.25
        REQUIRE(s.total_pnl.to_double() == Approx(1.25));
        REQUIRE(s.total_funding.to_double() == Approx(0.5));
        REQUIRE(s.total_fees.to_double() == Approx(0.1));
    }

    SECTION("Cleanup drops only old terminal trades") {
        REQUIRE(store.cleanup_closed(5500) == 2);
        REQUIRE(store.stats().total_trades == 3);
        REQUIRE(store.get_trade(lost.id).has_value());
    }
}

TEST_CASE("Event log", "[store]") {
    MemoryTradeStore store;
    for (int i = 0; i < 3; ++i) {
        store.append_event(AlertEvent(AlertLevel::Info, "event " + std::to_string(i)));
    }

    REQUIRE(store.stats().events == 3);
    auto recent = store.recent_events(2);
    REQUIRE(recent.size() == 2);
    REQUIRE(recent.back().find("event 2") != std::string::npos);
}

TEST_CASE("Journal replay", "[store]") {
    const std::string path = temp_journal("fundarb_store_test.jsonl");
    Trade open = make_trade("BTC", 1000, TradeStatus::Open);
    Trade done = make_trade("ETH", 2000, TradeStatus::Opening);

    {
        MemoryTradeStore store(path);
        store.create_trade(open);
        store.create_trade(done);
        done.mark_closed("take_profit", 3000);
        store.update_trade(done);
        store.append_event(AlertEvent(AlertLevel::Warning, "journaled"));
    }

    // Torn trailing write
    {
        std::ofstream out(path, std::ios::app);
        out << "{\"kind\": \"trade\", \"data\": {";
    }

    MemoryTradeStore replayed(path);
    REQUIRE(replayed.replay_journal() == 2);
    REQUIRE(replayed.get_trade(done.id)->status == TradeStatus::Closed);
    REQUIRE(replayed.get_trade(done.id)->close_reason == "take_profit");
    REQUIRE(replayed.list_open_trades().size() == 1);
    REQUIRE(replayed.stats().events == 1);

    SECTION("Replayed state still guards the symbol") {
        REQUIRE_THROWS_AS(replayed.create_trade(make_trade("BTC", 4000)), ValidationError);
    }

    std::filesystem::remove(path);
}

TEST_CASE("Replay without a journal", "[store]") {
    MemoryTradeStore in_memory;
    REQUIRE(in_memory.replay_journal() == 0);

    MemoryTradeStore missing(temp_journal("fundarb_store_missing.jsonl"));
    REQUIRE(missing.replay_journal() == 0);
}
