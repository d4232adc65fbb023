// Funding Arb Engine - Exchange Port
// Abstract interface every venue adapter implements

#pragma once

#include <fundarb/orderbook.hpp>
#include <fundarb/types.hpp>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fundarb {

// One perpetual-futures venue.
// Every call returns a future; callers await it with an explicit timeout and
// may abandon it, so implementations must not rely on the future being read.
class ExchangePort {
public:
    virtual ~ExchangePort() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;

    // Orders
    virtual std::future<Order> place_order(const OrderRequest& request) = 0;
    virtual std::future<bool> cancel_order(const std::string& symbol, const std::string& order_id) = 0;
    virtual std::future<std::optional<Order>> get_order(const std::string& symbol,
                                                        const std::string& order_id) = 0;

    // Account
    virtual std::future<std::optional<Position>> get_position(const std::string& symbol) = 0;
    virtual std::future<std::vector<Position>> list_positions() = 0;
    virtual std::future<Decimal> get_available_balance() = 0;

    // Market data
    virtual std::future<OrderbookSnapshot> get_orderbook_l1(const std::string& symbol) = 0;
    virtual std::future<OrderbookDepthSnapshot> get_orderbook_depth(const std::string& symbol,
                                                                    int levels) = 0;
    virtual std::future<FundingRate> get_funding_rate(const std::string& symbol) = 0;
    virtual std::future<MarketInfo> get_market_info(const std::string& symbol) = 0;

    // Streaming
    using OrderCallback = std::function<void(const Order&)>;
    virtual void subscribe_orders(OrderCallback cb) { (void)cb; }
};

using ExchangePtr = std::shared_ptr<ExchangePort>;

}  // namespace fundarb
