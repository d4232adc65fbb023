// Funding Arb Engine - Core Types
// Fixed-point money, order and position primitives shared by every component

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fundarb {

// Fixed-point decimal for exact financial arithmetic
// Stores value as integer * 10^(-precision)
class Decimal {
public:
    static constexpr int PRECISION = 8;
    static constexpr int64_t SCALE = 100000000LL;

    constexpr Decimal() noexcept : value_(0) {}
    constexpr explicit Decimal(int64_t scaled) noexcept : value_(scaled) {}

    static Decimal from_double(double d) noexcept;
    static constexpr Decimal from_int(int64_t v) noexcept { return Decimal(v * SCALE); }

    // Throws std::invalid_argument on malformed input
    static Decimal from_string(std::string_view s);

    [[nodiscard]] double to_double() const noexcept {
        return static_cast<double>(value_) / SCALE;
    }

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] constexpr int64_t scaled_value() const noexcept { return value_; }

    constexpr Decimal operator+(Decimal rhs) const noexcept {
        return Decimal(value_ + rhs.value_);
    }
    constexpr Decimal operator-(Decimal rhs) const noexcept {
        return Decimal(value_ - rhs.value_);
    }
    constexpr Decimal operator-() const noexcept { return Decimal(-value_); }

    // 128-bit intermediates keep price * quantity exact for realistic magnitudes
    constexpr Decimal operator*(Decimal rhs) const noexcept {
        __int128 wide = static_cast<__int128>(value_) * rhs.value_;
        return Decimal(static_cast<int64_t>(wide / SCALE));
    }
    // Division by zero yields zero
    constexpr Decimal operator/(Decimal rhs) const noexcept {
        if (rhs.value_ == 0) return Decimal(0);
        __int128 wide = static_cast<__int128>(value_) * SCALE;
        return Decimal(static_cast<int64_t>(wide / rhs.value_));
    }

    Decimal& operator+=(Decimal rhs) noexcept { value_ += rhs.value_; return *this; }
    Decimal& operator-=(Decimal rhs) noexcept { value_ -= rhs.value_; return *this; }

    constexpr bool operator==(Decimal rhs) const noexcept { return value_ == rhs.value_; }
    constexpr bool operator!=(Decimal rhs) const noexcept { return value_ != rhs.value_; }
    constexpr bool operator<(Decimal rhs) const noexcept { return value_ < rhs.value_; }
    constexpr bool operator<=(Decimal rhs) const noexcept { return value_ <= rhs.value_; }
    constexpr bool operator>(Decimal rhs) const noexcept { return value_ > rhs.value_; }
    constexpr bool operator>=(Decimal rhs) const noexcept { return value_ >= rhs.value_; }

    constexpr Decimal abs() const noexcept { return Decimal(value_ < 0 ? -value_ : value_); }
    constexpr bool is_zero() const noexcept { return value_ == 0; }
    constexpr bool is_positive() const noexcept { return value_ > 0; }
    constexpr bool is_negative() const noexcept { return value_ < 0; }

    // Round to a multiple of step; a non-positive step returns the value unchanged
    [[nodiscard]] Decimal floor_to(Decimal step) const noexcept;
    [[nodiscard]] Decimal ceil_to(Decimal step) const noexcept;

    static constexpr Decimal zero() noexcept { return Decimal(0); }
    static constexpr Decimal one() noexcept { return Decimal(SCALE); }

private:
    int64_t value_;
};

inline constexpr Decimal min(Decimal a, Decimal b) noexcept { return a < b ? a : b; }
inline constexpr Decimal max(Decimal a, Decimal b) noexcept { return a > b ? a : b; }
inline constexpr Decimal clamp(Decimal v, Decimal lo, Decimal hi) noexcept {
    return v < lo ? lo : (v > hi ? hi : v);
}

// Trading side
enum class Side : uint8_t {
    Buy = 0,
    Sell = 1
};

inline constexpr const char* to_string(Side s) noexcept {
    return s == Side::Buy ? "buy" : "sell";
}

inline constexpr Side opposite(Side s) noexcept {
    return s == Side::Buy ? Side::Sell : Side::Buy;
}

// Order types
enum class OrderType : uint8_t {
    Market = 0,
    Limit = 1
};

inline constexpr const char* to_string(OrderType t) noexcept {
    return t == OrderType::Market ? "market" : "limit";
}

// Time in force
enum class TimeInForce : uint8_t {
    GTC = 0,  // Good till cancelled
    IOC = 1,  // Immediate or cancel
    FOK = 2,  // Fill or kill
    PostOnly = 3
};

inline constexpr const char* to_string(TimeInForce tif) noexcept {
    switch (tif) {
        case TimeInForce::GTC: return "GTC";
        case TimeInForce::IOC: return "IOC";
        case TimeInForce::FOK: return "FOK";
        case TimeInForce::PostOnly: return "POST_ONLY";
    }
    return "unknown";
}

// Order status
enum class OrderStatus : uint8_t {
    Pending = 0,
    Open = 1,
    PartiallyFilled = 2,
    Filled = 3,
    Cancelled = 4,
    Rejected = 5,
    Expired = 6
};

inline constexpr const char* to_string(OrderStatus s) noexcept {
    switch (s) {
        case OrderStatus::Pending: return "pending";
        case OrderStatus::Open: return "open";
        case OrderStatus::PartiallyFilled: return "partially_filled";
        case OrderStatus::Filled: return "filled";
        case OrderStatus::Cancelled: return "cancelled";
        case OrderStatus::Rejected: return "rejected";
        case OrderStatus::Expired: return "expired";
    }
    return "unknown";
}

// Fee information
struct Fee {
    std::string asset;
    Decimal amount;
    std::optional<Decimal> rate;
};

// Balance
struct Balance {
    std::string asset;
    std::string venue;
    Decimal free;
    Decimal locked;

    [[nodiscard]] Decimal total() const noexcept { return free + locked; }
};

// Price level in orderbook
struct PriceLevel {
    Decimal price;
    Decimal quantity;

    [[nodiscard]] Decimal value() const noexcept { return price * quantity; }
};

// Order request - builder pattern
class OrderRequest {
public:
    std::string symbol;
    Side side = Side::Buy;
    OrderType order_type = OrderType::Market;
    Decimal quantity;
    std::optional<Decimal> price;
    TimeInForce time_in_force = TimeInForce::GTC;
    bool reduce_only = false;
    bool post_only = false;
    std::string client_order_id;

    OrderRequest() = default;

    static OrderRequest market(std::string_view symbol, Side side, Decimal quantity);
    static OrderRequest limit(std::string_view symbol, Side side, Decimal quantity, Decimal price);

    OrderRequest& with_post_only() {
        post_only = true;
        time_in_force = TimeInForce::PostOnly;
        return *this;
    }

    OrderRequest& with_tif(TimeInForce tif) {
        time_in_force = tif;
        post_only = (tif == TimeInForce::PostOnly);
        return *this;
    }

    OrderRequest& with_reduce_only() {
        reduce_only = true;
        return *this;
    }

    OrderRequest& with_client_id(std::string_view id) {
        client_order_id = std::string(id);
        return *this;
    }
};

// Order
struct Order {
    std::string order_id;
    std::string client_order_id;
    std::string symbol;
    std::string venue;
    Side side = Side::Buy;
    OrderType order_type = OrderType::Limit;
    OrderStatus status = OrderStatus::Pending;
    TimeInForce time_in_force = TimeInForce::GTC;
    Decimal quantity;
    Decimal filled_quantity;
    std::optional<Decimal> price;
    std::optional<Decimal> average_price;
    int64_t created_at = 0;
    int64_t updated_at = 0;
    std::vector<Fee> fees;

    [[nodiscard]] bool is_open() const noexcept {
        return status == OrderStatus::Open ||
               status == OrderStatus::PartiallyFilled ||
               status == OrderStatus::Pending;
    }

    [[nodiscard]] bool is_done() const noexcept {
        return status == OrderStatus::Filled ||
               status == OrderStatus::Cancelled ||
               status == OrderStatus::Rejected ||
               status == OrderStatus::Expired;
    }

    [[nodiscard]] Decimal remaining() const noexcept { return quantity - filled_quantity; }

    [[nodiscard]] Decimal total_fee() const noexcept {
        Decimal total;
        for (const auto& f : fees) total += f.amount;
        return total;
    }
};

// Live venue position; quantity is always non-negative, direction is in side
struct Position {
    std::string symbol;
    std::string venue;
    Side side = Side::Buy;
    Decimal quantity;
    Decimal entry_price;
    Decimal mark_price;
    std::optional<Decimal> liquidation_price;
    Decimal unrealized_pnl;
    Decimal leverage = Decimal::one();

    // Signed size: positive long, negative short
    [[nodiscard]] Decimal signed_quantity() const noexcept {
        return side == Side::Buy ? quantity : -quantity;
    }

    // Fractional distance from mark to liquidation, if known
    [[nodiscard]] std::optional<Decimal> liquidation_distance() const noexcept {
        if (!liquidation_price || !mark_price.is_positive()) return std::nullopt;
        return (mark_price - *liquidation_price).abs() / mark_price;
    }
};

// Funding rate as reported by a venue, normalised to an hourly rate
struct FundingRate {
    std::string symbol;
    std::string venue;
    Decimal rate_hourly;
    int64_t next_funding_at = 0;
    int64_t updated_at = 0;
};

// Market information
struct MarketInfo {
    std::string symbol;
    std::string venue;
    Decimal min_quantity;
    std::optional<Decimal> min_notional;
    Decimal tick_size;
    Decimal lot_size;
};

// Timestamp utilities
inline int64_t now_ms() noexcept {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// Injectable wall clock in milliseconds
using ClockFn = std::function<int64_t()>;

inline constexpr int64_t MS_PER_HOUR = 3600000;

}  // namespace fundarb
