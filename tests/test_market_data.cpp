// Funding Arb Engine - Market Data Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <fundarb/adapters/paper.hpp>
#include <fundarb/errors.hpp>
#include <fundarb/market_data.hpp>
#include <memory>

using namespace fundarb;
using namespace fundarb::adapters;
using Catch::Approx;

namespace {

struct Venues {
    std::shared_ptr<PaperExchange> leg1 = std::make_shared<PaperExchange>("lighter");
    std::shared_ptr<PaperExchange> leg2 = std::make_shared<PaperExchange>("x10");

    Venues() {
        leg1->set_l1("BTC", Decimal::from_int(100), Decimal::from_int(5),
                     Decimal::from_double(100.1), Decimal::from_int(5));
        leg2->set_l1("BTC", Decimal::from_double(100.2), Decimal::from_int(5),
                     Decimal::from_double(100.3), Decimal::from_int(5));
        leg1->set_funding_rate("BTC", Decimal::from_double(0.0001));
        leg2->set_funding_rate("BTC", Decimal::from_double(-0.00005));
    }
};

MarketDataConfig fast_config() {
    MarketDataConfig cfg;
    cfg.fresh_retries = 2;
    cfg.fresh_retry_delay_ms = 1;
    return cfg;
}

OrderbookSnapshot quote(double bid, double ask, int64_t at) {
    OrderbookSnapshot s;
    s.bid = Decimal::from_double(bid);
    s.bid_qty = Decimal::one();
    s.ask = Decimal::from_double(ask);
    s.ask_qty = Decimal::one();
    s.updated_at = at;
    return s;
}

}  // namespace

TEST_CASE("Refresh caches funding, prices and market info", "[market_data]") {
    Venues v;
    int64_t now = 1'000'000;
    MarketDataService md(v.leg1, v.leg2, fast_config(), std::chrono::milliseconds(1000),
                         [&now] { return now; });

    REQUIRE_FALSE(md.is_healthy());
    REQUIRE(md.refresh({"BTC"}) == 1);

    auto funding = md.get_funding("BTC");
    REQUIRE(funding.has_value());
    REQUIRE(funding->leg1_rate.to_double() == Approx(0.0001));
    REQUIRE(funding->spread().to_double() == Approx(0.00015));
    REQUIRE(funding->updated_at == now);

    auto price = md.get_price("BTC");
    REQUIRE(price->leg1_mid.to_double() == Approx(100.05));
    REQUIRE(price->mid().to_double() == Approx(100.15));

    auto book = md.get_orderbook("BTC");
    REQUIRE(book->has_depth());
    REQUIRE(book->leg2.venue == "x10");

    REQUIRE(md.get_market_info("lighter", "BTC")->lot_size.to_double() == Approx(0.001));
    REQUIRE(md.known_symbols() == std::vector<std::string>{"BTC"});
    REQUIRE(md.is_healthy());

    SECTION("Health lapses without refreshes") {
        now += 30'001;
        REQUIRE_FALSE(md.is_healthy());
    }
}

TEST_CASE("Refresh tolerates a failing venue", "[market_data]") {
    Venues v;
    MarketDataService md(v.leg1, v.leg2, fast_config());

    v.leg2->fail_next(PaperOp::Funding);
    REQUIRE(md.refresh({"BTC"}) == 0);
    REQUIRE_FALSE(md.get_funding("BTC").has_value());
    // Leg 1 prices still land
    REQUIRE(md.get_price("BTC")->leg1_mid.is_positive());
    REQUIRE(md.is_healthy());

    SECTION("Unknown symbol fails on both venues") {
        MarketDataService fresh(v.leg1, v.leg2, fast_config());
        REQUIRE(fresh.refresh({"DOGE"}) == 0);
        REQUIRE_FALSE(fresh.is_healthy());
    }
}

TEST_CASE("Fresh orderbook", "[market_data]") {
    Venues v;
    int64_t now = 5'000'000;
    MarketDataService md(v.leg1, v.leg2, fast_config(), std::chrono::milliseconds(1000),
                         [&now] { return now; });

    SECTION("Both venues quoting") {
        PairBook pair = md.get_fresh_orderbook("BTC");
        REQUIRE(pair.leg1.bid.to_double() == Approx(100.0));
        REQUIRE(pair.leg2.ask.to_double() == Approx(100.3));
        REQUIRE(md.get_orderbook("BTC").has_value());
    }

    SECTION("Falls back to a young cached book") {
        v.leg2->clear_book("BTC");
        md.put_orderbook("BTC", PairBook{quote(99, 101, now - 5000), quote(99.5, 100.5, now - 2000)});

        PairBook pair = md.get_fresh_orderbook("BTC");
        REQUIRE(pair.leg1.bid.to_double() == Approx(99.0));
        REQUIRE(pair.oldest_update() == now - 5000);
    }

    SECTION("Stale cache is not used") {
        v.leg2->clear_book("BTC");
        md.put_orderbook("BTC", PairBook{quote(99, 101, now - 20000), quote(99.5, 100.5, now)});
        REQUIRE_THROWS_AS(md.get_fresh_orderbook("BTC"), ExchangeError);
    }

    SECTION("Venue errors exhaust the retries") {
        v.leg1->fail_next(PaperOp::Orderbook, 5);
        REQUIRE_THROWS_AS(md.get_fresh_orderbook("BTC"), ExchangeError);
    }

    SECTION("Crossed venue book is not fresh") {
        v.leg1->set_l1("BTC", Decimal::from_int(101), Decimal::one(), Decimal::from_int(100), Decimal::one());
        REQUIRE_THROWS_AS(md.get_fresh_orderbook("BTC"), ExchangeError);
    }
}

TEST_CASE("Fresh depth", "[market_data]") {
    Venues v;
    OrderbookDepthSnapshot book;
    book.symbol = "ETH";
    for (int i = 0; i < 5; ++i) {
        book.asks.push_back({Decimal::from_int(3000 + i), Decimal::one()});
        book.bids.push_back({Decimal::from_int(2999 - i), Decimal::one()});
    }
    v.leg2->set_book(book);

    MarketDataService md(v.leg1, v.leg2, fast_config());
    auto depth = md.get_fresh_depth("x10", "ETH", 3);
    REQUIRE(depth.asks.size() == 3);
    REQUIRE(depth.best_ask()->to_double() == Approx(3000.0));
    REQUIRE(depth.venue == "x10");

    REQUIRE_THROWS_AS(md.get_fresh_depth("binance", "ETH"), ValidationError);
    REQUIRE(&md.exchange("lighter") == v.leg1.get());
}

TEST_CASE("Seeded cache", "[market_data]") {
    Venues v;
    int64_t now = 42;
    MarketDataService md(v.leg1, v.leg2, fast_config(), std::chrono::milliseconds(1000),
                         [&now] { return now; });

    md.put_funding(FundingSnapshot{"SOL", Decimal::from_double(0.0002), Decimal::zero(), now});
    REQUIRE(md.is_healthy());
    REQUIRE(md.last_refresh_at() == 42);
    REQUIRE(md.get_funding("SOL")->spread().to_double() == Approx(0.0002));
}
