// Funding Arb Engine - Paper Exchange Implementation

#include <fundarb/adapters/paper.hpp>
#include <fundarb/errors.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>

namespace fundarb::adapters {

namespace {

template <typename T>
std::future<T> ready(T value) {
    std::promise<T> p;
    p.set_value(std::move(value));
    return p.get_future();
}

template <typename T, typename E>
std::future<T> failed(E error) {
    std::promise<T> p;
    p.set_exception(std::make_exception_ptr(std::move(error)));
    return p.get_future();
}

const char* op_name(PaperOp op) {
    switch (op) {
        case PaperOp::PlaceOrder: return "place_order";
        case PaperOp::CancelOrder: return "cancel_order";
        case PaperOp::GetOrder: return "get_order";
        case PaperOp::GetPosition: return "get_position";
        case PaperOp::ListPositions: return "list_positions";
        case PaperOp::Balance: return "get_available_balance";
        case PaperOp::Orderbook: return "get_orderbook";
        case PaperOp::Funding: return "get_funding_rate";
        case PaperOp::MarketInfo: return "get_market_info";
    }
    return "unknown";
}

bool is_taker_only(const OrderRequest& r) {
    return r.order_type == OrderType::Market ||
           r.time_in_force == TimeInForce::IOC ||
           r.time_in_force == TimeInForce::FOK;
}

}  // namespace

PaperExchange::PaperExchange(std::string name, FeeConfig fees)
    : name_(std::move(name)), fees_(fees) {}

// =============================================================================
// Orders
// =============================================================================

std::future<Order> PaperExchange::place_order(const OrderRequest& request) {
    Order order;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int seq = ++seq_;
        placed_.push_back(request);

        bool retryable = true;
        if (consume_failure(PaperOp::PlaceOrder, retryable)) {
            return failed<Order>(ExchangeError(name_ + ": injected place_order failure", retryable, name_));
        }
        if (rejects_pending_ > 0) {
            --rejects_pending_;
            return failed<Order>(OrderRejectedError(name_ + ": order rejected", request.symbol, name_));
        }
        if (!request.quantity.is_positive()) {
            return failed<Order>(OrderRejectedError(name_ + ": quantity must be positive", request.symbol, name_));
        }
        if (request.order_type == OrderType::Limit && !request.price) {
            return failed<Order>(OrderRejectedError(name_ + ": limit order without price", request.symbol, name_));
        }

        auto book_it = books_.find(request.symbol);
        const OrderbookDepthSnapshot* book = book_it != books_.end() ? &book_it->second : nullptr;

        std::optional<PaperFill> scripted;
        if (fill_policy_) scripted = fill_policy_(request, seq);
        PaperFill fill = scripted ? *scripted : match(request, book, seq);

        if (request.reduce_only) {
            fill.quantity = min(fill.quantity, reduce_only_cap(request));
        }
        fill.quantity = min(fill.quantity, request.quantity);

        order.order_id = name_ + "-" + std::to_string(seq);
        order.client_order_id = request.client_order_id;
        order.symbol = request.symbol;
        order.venue = name_;
        order.side = request.side;
        order.order_type = request.order_type;
        order.time_in_force = request.time_in_force;
        order.quantity = request.quantity;
        order.price = request.price;
        order.filled_quantity = fill.quantity;
        order.created_at = now_ms();
        order.updated_at = order.created_at;

        if (fill.quantity.is_positive()) {
            order.average_price = fill.price;
            Decimal rate = fill.maker ? fees_.maker : fees_.taker;
            order.fees.push_back(Fee{"USD", fill.quantity * fill.price * rate, rate});
            apply_fill(request.symbol, request.side, fill.quantity, fill.price);
        }

        if (fill.status) {
            order.status = *fill.status;
        } else if (fill.quantity >= request.quantity) {
            order.status = OrderStatus::Filled;
        } else if (is_taker_only(request)) {
            order.status = OrderStatus::Cancelled;
        } else {
            order.status = fill.quantity.is_positive() ? OrderStatus::PartiallyFilled : OrderStatus::Open;
        }

        orders_[order.order_id] = order;
    }

    if (order.filled_quantity.is_positive()) notify(order);
    return ready(order);
}

std::future<bool> PaperExchange::cancel_order(const std::string& symbol, const std::string& order_id) {
    std::optional<Order> cancelled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++cancels_;
        bool retryable = true;
        if (consume_failure(PaperOp::CancelOrder, retryable)) {
            return failed<bool>(ExchangeError(name_ + ": injected cancel failure", retryable, name_));
        }
        auto it = orders_.find(order_id);
        if (it == orders_.end() || it->second.symbol != symbol || !it->second.is_open()) {
            return ready(false);
        }
        it->second.status = OrderStatus::Cancelled;
        it->second.updated_at = now_ms();
        cancelled = it->second;
    }
    notify(*cancelled);
    return ready(true);
}

std::future<std::optional<Order>> PaperExchange::get_order(const std::string& symbol,
                                                           const std::string& order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool retryable = true;
    if (consume_failure(PaperOp::GetOrder, retryable)) {
        return failed<std::optional<Order>>(ExchangeError(name_ + ": injected get_order failure", retryable, name_));
    }
    auto it = orders_.find(order_id);
    if (it == orders_.end() || it->second.symbol != symbol) {
        return ready(std::optional<Order>{});
    }
    return ready(std::optional<Order>(it->second));
}

PaperFill PaperExchange::match(const OrderRequest& request, const OrderbookDepthSnapshot* book, int seq) const {
    (void)seq;
    PaperFill fill;
    fill.price = request.price.value_or(Decimal::zero());

    const std::vector<PriceLevel>* opposite = nullptr;
    if (book) opposite = request.side == Side::Buy ? &book->asks : &book->bids;

    auto crosses = [&](Decimal px) {
        if (!opposite || opposite->empty()) return false;
        const Decimal best = opposite->front().price;
        return request.side == Side::Buy ? px >= best : px <= best;
    };

    // Sweep the opposite side up to the limit price
    auto sweep = [&]() {
        PaperFill taken;
        if (!opposite) return taken;
        Decimal remaining = request.quantity;
        Decimal notional;
        for (const auto& level : *opposite) {
            if (!remaining.is_positive()) break;
            if (request.price) {
                bool beyond = request.side == Side::Buy ? level.price > *request.price
                                                        : level.price < *request.price;
                if (beyond) break;
            }
            Decimal take = min(remaining, level.quantity);
            notional += take * level.price;
            taken.quantity += take;
            remaining -= take;
        }
        if (taken.quantity.is_positive()) taken.price = notional / taken.quantity;
        return taken;
    };

    if (is_taker_only(request)) {
        fill = sweep();
        if (request.time_in_force == TimeInForce::FOK && fill.quantity < request.quantity) {
            fill = PaperFill{};
        }
        return fill;
    }

    const Decimal px = *request.price;
    if (request.post_only || request.time_in_force == TimeInForce::PostOnly) {
        if (crosses(px)) {
            fill.status = OrderStatus::Rejected;
            return fill;
        }
    } else if (crosses(px)) {
        fill = sweep();
        return fill;
    }

    // Resting maker order
    fill.maker = true;
    fill.quantity = request.quantity * maker_fill_ratio_;
    return fill;
}

Decimal PaperExchange::reduce_only_cap(const OrderRequest& request) const {
    auto it = positions_.find(request.symbol);
    if (it == positions_.end()) return Decimal::zero();
    // Only the side opposite to the position reduces it
    if (it->second.side == request.side) return Decimal::zero();
    return it->second.quantity;
}

void PaperExchange::apply_fill(const std::string& symbol, Side side, Decimal qty, Decimal price) {
    Decimal delta = side == Side::Buy ? qty : -qty;
    auto it = positions_.find(symbol);

    if (it == positions_.end()) {
        Position p;
        p.symbol = symbol;
        p.venue = name_;
        p.side = side;
        p.quantity = qty;
        p.entry_price = price;
        p.mark_price = price;
        positions_[symbol] = p;
        return;
    }

    Position& p = it->second;
    Decimal before = p.signed_quantity();
    Decimal after = before + delta;

    if (after.is_zero()) {
        positions_.erase(it);
        return;
    }

    bool same_direction = (before.is_positive() && delta.is_positive()) ||
                          (before.is_negative() && delta.is_negative());
    if (same_direction) {
        p.entry_price = (p.entry_price * before.abs() + price * qty) / after.abs();
    } else if ((before.is_positive() && after.is_negative()) ||
               (before.is_negative() && after.is_positive())) {
        p.entry_price = price;
    }
    p.side = after.is_positive() ? Side::Buy : Side::Sell;
    p.quantity = after.abs();
}

void PaperExchange::fill_resting(const std::string& order_id, Decimal quantity, std::optional<Decimal> price) {
    Order snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(order_id);
        if (it == orders_.end() || !it->second.is_open()) {
            throw ValidationError("No resting order " + order_id + " on " + name_);
        }
        Order& o = it->second;
        Decimal qty = min(quantity, o.remaining());
        if (!qty.is_positive()) return;
        Decimal px = price.value_or(o.price.value_or(Decimal::zero()));

        Decimal prior_notional = o.filled_quantity * o.average_price.value_or(Decimal::zero());
        o.filled_quantity += qty;
        o.average_price = (prior_notional + qty * px) / o.filled_quantity;
        o.fees.push_back(Fee{"USD", qty * px * fees_.maker, fees_.maker});
        o.status = o.filled_quantity >= o.quantity ? OrderStatus::Filled : OrderStatus::PartiallyFilled;
        o.updated_at = now_ms();
        apply_fill(o.symbol, o.side, qty, px);
        snapshot = o;
    }
    notify(snapshot);
}

// =============================================================================
// Account
// =============================================================================

std::future<std::optional<Position>> PaperExchange::get_position(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool retryable = true;
    if (consume_failure(PaperOp::GetPosition, retryable)) {
        return failed<std::optional<Position>>(
            ExchangeError(name_ + ": injected get_position failure", retryable, name_));
    }
    auto it = positions_.find(symbol);
    if (it == positions_.end()) return ready(std::optional<Position>{});
    Position p = it->second;
    Decimal mark = mark_price(symbol);
    if (mark.is_positive()) p.mark_price = mark;
    p.unrealized_pnl = (p.mark_price - p.entry_price) * p.signed_quantity();
    return ready(std::optional<Position>(p));
}

std::future<std::vector<Position>> PaperExchange::list_positions() {
    std::lock_guard<std::mutex> lock(mutex_);
    bool retryable = true;
    if (consume_failure(PaperOp::ListPositions, retryable)) {
        return failed<std::vector<Position>>(
            ExchangeError(name_ + ": injected list_positions failure", retryable, name_));
    }
    std::vector<Position> out;
    out.reserve(positions_.size());
    for (const auto& [symbol, p] : positions_) {
        Position copy = p;
        Decimal mark = mark_price(symbol);
        if (mark.is_positive()) copy.mark_price = mark;
        out.push_back(copy);
    }
    return ready(std::move(out));
}

std::future<Decimal> PaperExchange::get_available_balance() {
    std::lock_guard<std::mutex> lock(mutex_);
    bool retryable = true;
    if (consume_failure(PaperOp::Balance, retryable)) {
        return failed<Decimal>(ExchangeError(name_ + ": injected balance failure", retryable, name_));
    }
    return ready(balance_);
}

// =============================================================================
// Market data
// =============================================================================

std::future<OrderbookSnapshot> PaperExchange::get_orderbook_l1(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool retryable = true;
    if (consume_failure(PaperOp::Orderbook, retryable)) {
        return failed<OrderbookSnapshot>(ExchangeError(name_ + ": injected orderbook failure", retryable, name_));
    }
    auto it = books_.find(symbol);
    if (it == books_.end()) {
        OrderbookSnapshot empty;
        empty.symbol = symbol;
        empty.venue = name_;
        empty.updated_at = now_ms();
        return ready(empty);
    }
    OrderbookSnapshot top = it->second.top();
    top.updated_at = now_ms();
    return ready(top);
}

std::future<OrderbookDepthSnapshot> PaperExchange::get_orderbook_depth(const std::string& symbol, int levels) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool retryable = true;
    if (consume_failure(PaperOp::Orderbook, retryable)) {
        return failed<OrderbookDepthSnapshot>(ExchangeError(name_ + ": injected depth failure", retryable, name_));
    }
    OrderbookDepthSnapshot depth;
    auto it = books_.find(symbol);
    if (it != books_.end()) depth = it->second;
    depth.symbol = symbol;
    depth.venue = name_;
    depth.updated_at = now_ms();
    if (levels > 0) {
        auto n = static_cast<size_t>(levels);
        if (depth.bids.size() > n) depth.bids.resize(n);
        if (depth.asks.size() > n) depth.asks.resize(n);
    }
    return ready(depth);
}

std::future<FundingRate> PaperExchange::get_funding_rate(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool retryable = true;
    if (consume_failure(PaperOp::Funding, retryable)) {
        return failed<FundingRate>(ExchangeError(name_ + ": injected funding failure", retryable, name_));
    }
    auto it = funding_.find(symbol);
    if (it == funding_.end()) {
        return failed<FundingRate>(ExchangeError(name_ + ": no funding rate for " + symbol, false, name_));
    }
    FundingRate fr;
    fr.symbol = symbol;
    fr.venue = name_;
    fr.rate_hourly = it->second;
    fr.updated_at = now_ms();
    fr.next_funding_at = fr.updated_at - fr.updated_at % MS_PER_HOUR + MS_PER_HOUR;
    return ready(fr);
}

std::future<MarketInfo> PaperExchange::get_market_info(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool retryable = true;
    if (consume_failure(PaperOp::MarketInfo, retryable)) {
        return failed<MarketInfo>(ExchangeError(name_ + ": injected market info failure", retryable, name_));
    }
    auto it = markets_.find(symbol);
    if (it != markets_.end()) return ready(it->second);

    MarketInfo info;
    info.symbol = symbol;
    info.venue = name_;
    info.min_quantity = Decimal::from_double(0.001);
    info.tick_size = Decimal::from_double(0.01);
    info.lot_size = Decimal::from_double(0.001);
    return ready(info);
}

void PaperExchange::subscribe_orders(OrderCallback cb) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.push_back(std::move(cb));
}

// =============================================================================
// Scenario setup
// =============================================================================

void PaperExchange::set_book(OrderbookDepthSnapshot book) {
    book.venue = name_;
    book.normalize();
    std::lock_guard<std::mutex> lock(mutex_);
    books_[book.symbol] = std::move(book);
}

void PaperExchange::set_l1(const std::string& symbol, Decimal bid, Decimal bid_qty,
                           Decimal ask, Decimal ask_qty) {
    OrderbookDepthSnapshot book;
    book.symbol = symbol;
    if (bid.is_positive() && bid_qty.is_positive()) book.bids.push_back(PriceLevel{bid, bid_qty});
    if (ask.is_positive() && ask_qty.is_positive()) book.asks.push_back(PriceLevel{ask, ask_qty});
    set_book(std::move(book));
}

void PaperExchange::clear_book(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    books_.erase(symbol);
}

void PaperExchange::set_funding_rate(const std::string& symbol, Decimal rate_hourly) {
    std::lock_guard<std::mutex> lock(mutex_);
    funding_[symbol] = rate_hourly;
}

void PaperExchange::set_market(MarketInfo info) {
    info.venue = name_;
    std::lock_guard<std::mutex> lock(mutex_);
    markets_[info.symbol] = std::move(info);
}

void PaperExchange::set_position(Position position) {
    position.venue = name_;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!position.quantity.is_positive()) {
        positions_.erase(position.symbol);
        return;
    }
    positions_[position.symbol] = std::move(position);
}

void PaperExchange::clear_position(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    positions_.erase(symbol);
}

void PaperExchange::set_balance(Decimal available) {
    std::lock_guard<std::mutex> lock(mutex_);
    balance_ = available;
}

void PaperExchange::set_maker_fill_ratio(Decimal ratio) {
    std::lock_guard<std::mutex> lock(mutex_);
    maker_fill_ratio_ = clamp(ratio, Decimal::zero(), Decimal::one());
}

void PaperExchange::set_fill_policy(FillPolicy policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    fill_policy_ = std::move(policy);
}

void PaperExchange::fail_next(PaperOp op, int count, bool retryable) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_[op] = {count, retryable};
}

void PaperExchange::reject_next_orders(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    rejects_pending_ = count;
}

// =============================================================================
// Inspection
// =============================================================================

std::vector<OrderRequest> PaperExchange::placed_orders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return placed_;
}

std::vector<OrderRequest> PaperExchange::placed_orders(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OrderRequest> out;
    std::copy_if(placed_.begin(), placed_.end(), std::back_inserter(out),
                 [&symbol](const OrderRequest& r) { return r.symbol == symbol; });
    return out;
}

int PaperExchange::cancel_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancels_;
}

std::optional<Position> PaperExchange::position(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(symbol);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

void PaperExchange::reset_history() {
    std::lock_guard<std::mutex> lock(mutex_);
    placed_.clear();
    cancels_ = 0;
}

bool PaperExchange::consume_failure(PaperOp op, bool& retryable) {
    auto it = failures_.find(op);
    if (it == failures_.end() || it->second.first <= 0) return false;
    --it->second.first;
    retryable = it->second.second;
    spdlog::debug("{}: injecting {} failure", name_, op_name(op));
    return true;
}

Decimal PaperExchange::mark_price(const std::string& symbol) const {
    auto it = books_.find(symbol);
    if (it == books_.end()) return Decimal::zero();
    return it->second.top().mid_price().value_or(Decimal::zero());
}

void PaperExchange::notify(const Order& order) {
    std::vector<OrderCallback> targets;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        targets = callbacks_;
    }
    for (const auto& cb : targets) {
        try {
            cb(order);
        } catch (const std::exception& e) {
            spdlog::error("{}: order callback failed for {}: {}", name_, order.order_id, e.what());
        }
    }
}

}  // namespace fundarb::adapters
