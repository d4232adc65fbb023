// Funding Arb Engine - Orderbook Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <fundarb/orderbook.hpp>

using namespace fundarb;
using Catch::Approx;

namespace {

PriceLevel level(double price, double qty) {
    return {Decimal::from_double(price), Decimal::from_double(qty)};
}

}  // namespace

TEST_CASE("Top of book snapshot", "[orderbook]") {
    OrderbookSnapshot snap;
    snap.bid = Decimal::from_double(100.0);
    snap.bid_qty = Decimal::from_double(1.0);
    snap.ask = Decimal::from_double(102.0);
    snap.ask_qty = Decimal::from_double(2.0);
    snap.updated_at = 1000;

    SECTION("Mid price and spread") {
        REQUIRE(snap.has_depth());
        REQUIRE_FALSE(snap.is_crossed());
        REQUIRE(snap.mid_price()->to_double() == Approx(101.0));
        REQUIRE(snap.spread_pct()->to_double() == Approx(2.0 / 101.0).margin(1e-7));
    }

    SECTION("Touch for takers") {
        REQUIRE(snap.touch_price(Side::Buy) == snap.ask);
        REQUIRE(snap.touch_qty(Side::Sell) == snap.bid_qty);
    }

    SECTION("Missing side has no mid") {
        snap.ask = Decimal::zero();
        REQUIRE_FALSE(snap.has_depth());
        REQUIRE_FALSE(snap.mid_price().has_value());
    }

    SECTION("Staleness") {
        REQUIRE_FALSE(snap.is_stale(5000, 10000));
        REQUIRE(snap.is_stale(20000, 10000));
        snap.updated_at = 0;
        REQUIRE(snap.is_stale(1, 10000));
    }

    SECTION("Crossed book") {
        snap.bid = Decimal::from_double(103.0);
        REQUIRE(snap.is_crossed());
    }
}

TEST_CASE("Depth snapshot ordering", "[orderbook]") {
    OrderbookDepthSnapshot book;
    book.bids = {level(99.0, 2.0), level(100.0, 1.0)};
    book.asks = {level(102.0, 2.5), level(101.0, 1.5)};
    book.normalize();

    REQUIRE(book.best_bid()->to_double() == Approx(100.0));
    REQUIRE(book.best_ask()->to_double() == Approx(101.0));

    auto top = book.top();
    REQUIRE(top.bid_qty.to_double() == Approx(1.0));
    REQUIRE(top.ask_qty.to_double() == Approx(1.5));
}

TEST_CASE("Depth snapshot VWAP", "[orderbook]") {
    OrderbookDepthSnapshot book;
    book.asks = {level(100.0, 1.0), level(101.0, 2.0), level(102.0, 3.0)};
    book.bids = {level(99.0, 1.0), level(98.0, 1.0)};

    SECTION("Inside the first level") {
        REQUIRE(book.vwap(Side::Buy, Decimal::from_double(0.5))->to_double() == Approx(100.0));
    }

    SECTION("Across multiple levels") {
        // (1.0 * 100 + 1.5 * 101) / 2.5
        REQUIRE(book.vwap(Side::Buy, Decimal::from_double(2.5))->to_double() == Approx(100.6));
    }

    SECTION("Seller walks the bids") {
        REQUIRE(book.vwap(Side::Sell, Decimal::from_double(2.0))->to_double() == Approx(98.5));
    }

    SECTION("Empty side") {
        OrderbookDepthSnapshot empty;
        REQUIRE_FALSE(empty.vwap(Side::Buy, Decimal::one()).has_value());
    }

    SECTION("Impact window stops the walk") {
        // 100 * 1.005 = 100.5 excludes the 101 level
        auto est = book.vwap_within_impact(Side::Buy, Decimal::from_double(2.0), Decimal::from_double(0.005));
        REQUIRE_FALSE(est.ok);
        REQUIRE(est.filled_qty.to_double() == Approx(1.0));
        REQUIRE(est.worst_price.to_double() == Approx(100.0));
    }

    SECTION("Impact window wide enough") {
        auto est = book.vwap_within_impact(Side::Buy, Decimal::from_double(3.0), Decimal::from_double(0.02));
        REQUIRE(est.ok);
        // (100 + 2 * 101) / 3
        REQUIRE(est.vwap.to_double() == Approx(100.6667).margin(1e-3));
        REQUIRE(est.worst_price.to_double() == Approx(101.0));
    }

    SECTION("Book too thin") {
        auto est = book.vwap_within_impact(Side::Sell, Decimal::from_double(5.0), Decimal::from_double(0.5));
        REQUIRE_FALSE(est.ok);
        REQUIRE(est.filled_qty.to_double() == Approx(2.0));
    }
}

TEST_CASE("Pair book", "[orderbook]") {
    PairBook pair;
    pair.leg1.bid = Decimal::from_int(100);
    pair.leg1.bid_qty = Decimal::one();
    pair.leg1.ask = Decimal::from_int(101);
    pair.leg1.ask_qty = Decimal::one();
    pair.leg1.updated_at = 500;
    pair.leg2 = pair.leg1;
    pair.leg2.updated_at = 300;

    REQUIRE(pair.has_depth());
    REQUIRE(pair.oldest_update() == 300);

    pair.leg2.bid_qty = Decimal::zero();
    REQUIRE_FALSE(pair.has_depth());
}
