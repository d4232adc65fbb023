// Funding Arb Engine - Paper Exchange Adapter
// Deterministic in-process venue with scripted books, positions and failures

#pragma once

#include <fundarb/config.hpp>
#include <fundarb/exchange.hpp>
#include <fundarb/types.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fundarb::adapters {

// Scripted outcome for one order; status defaults from the fill size
struct PaperFill {
    Decimal quantity;
    Decimal price;
    bool maker = false;
    std::optional<OrderStatus> status;
};

// Operations that can be made to fail
enum class PaperOp : uint8_t {
    PlaceOrder = 0,
    CancelOrder,
    GetOrder,
    GetPosition,
    ListPositions,
    Balance,
    Orderbook,
    Funding,
    MarketInfo
};

// Return nullopt to fall through to default matching
using FillPolicy = std::function<std::optional<PaperFill>(const OrderRequest&, int seq)>;

class PaperExchange : public ExchangePort {
public:
    explicit PaperExchange(std::string name, FeeConfig fees = {});

    PaperExchange(const PaperExchange&) = delete;
    PaperExchange& operator=(const PaperExchange&) = delete;

    // ExchangePort
    [[nodiscard]] std::string_view name() const override { return name_; }

    std::future<Order> place_order(const OrderRequest& request) override;
    std::future<bool> cancel_order(const std::string& symbol, const std::string& order_id) override;
    std::future<std::optional<Order>> get_order(const std::string& symbol,
                                                const std::string& order_id) override;

    std::future<std::optional<Position>> get_position(const std::string& symbol) override;
    std::future<std::vector<Position>> list_positions() override;
    std::future<Decimal> get_available_balance() override;

    std::future<OrderbookSnapshot> get_orderbook_l1(const std::string& symbol) override;
    std::future<OrderbookDepthSnapshot> get_orderbook_depth(const std::string& symbol, int levels) override;
    std::future<FundingRate> get_funding_rate(const std::string& symbol) override;
    std::future<MarketInfo> get_market_info(const std::string& symbol) override;

    void subscribe_orders(OrderCallback cb) override;

    // Scenario setup
    void set_book(OrderbookDepthSnapshot book);
    void set_l1(const std::string& symbol, Decimal bid, Decimal bid_qty, Decimal ask, Decimal ask_qty);
    void clear_book(const std::string& symbol);
    void set_funding_rate(const std::string& symbol, Decimal rate_hourly);
    void set_market(MarketInfo info);
    void set_position(Position position);
    void clear_position(const std::string& symbol);
    void set_balance(Decimal available);

    // Fraction of a resting maker order filled on placement (default 1)
    void set_maker_fill_ratio(Decimal ratio);
    void set_fill_policy(FillPolicy policy);

    // Next `count` calls of `op` fail with an ExchangeError
    void fail_next(PaperOp op, int count = 1, bool retryable = true);

    // Next `count` orders come back rejected
    void reject_next_orders(int count = 1);

    // Fill a resting order out of band, as a venue would
    void fill_resting(const std::string& order_id, Decimal quantity, std::optional<Decimal> price = std::nullopt);

    // Inspection
    [[nodiscard]] std::vector<OrderRequest> placed_orders() const;
    [[nodiscard]] std::vector<OrderRequest> placed_orders(const std::string& symbol) const;
    [[nodiscard]] int cancel_count() const;
    [[nodiscard]] std::optional<Position> position(const std::string& symbol) const;
    void reset_history();

private:
    bool consume_failure(PaperOp op, bool& retryable);
    PaperFill match(const OrderRequest& request, const OrderbookDepthSnapshot* book, int seq) const;
    void apply_fill(const std::string& symbol, Side side, Decimal qty, Decimal price);
    Decimal reduce_only_cap(const OrderRequest& request) const;
    Decimal mark_price(const std::string& symbol) const;
    void notify(const Order& order);

    std::string name_;
    FeeConfig fees_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, OrderbookDepthSnapshot> books_;
    std::unordered_map<std::string, Decimal> funding_;
    std::unordered_map<std::string, MarketInfo> markets_;
    std::map<std::string, Position> positions_;
    std::unordered_map<std::string, Order> orders_;
    std::vector<OrderRequest> placed_;
    std::map<PaperOp, std::pair<int, bool>> failures_;
    Decimal balance_ = Decimal::from_int(100000);
    Decimal maker_fill_ratio_ = Decimal::one();
    FillPolicy fill_policy_;
    int rejects_pending_ = 0;
    int cancels_ = 0;
    int seq_ = 0;

    std::mutex callbacks_mutex_;
    std::vector<OrderCallback> callbacks_;
};

}  // namespace fundarb::adapters
