// Funding Arb Engine - Types Implementation

#include <fundarb/types.hpp>
#include <charconv>
#include <cmath>
#include <stdexcept>

namespace fundarb {

Decimal Decimal::from_double(double d) noexcept {
    return Decimal(static_cast<int64_t>(std::llround(d * SCALE)));
}

Decimal Decimal::from_string(std::string_view s) {
    std::string_view text = s;
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);
    if (text.empty()) {
        throw std::invalid_argument("Empty decimal string");
    }

    bool negative = false;
    if (text.front() == '-' || text.front() == '+') {
        negative = (text.front() == '-');
        text.remove_prefix(1);
    }

    auto dot = text.find('.');
    std::string_view int_part = text.substr(0, dot);
    std::string_view frac_part = (dot == std::string_view::npos) ? std::string_view{} : text.substr(dot + 1);

    if (int_part.empty() && frac_part.empty()) {
        throw std::invalid_argument("Malformed decimal: " + std::string(s));
    }

    int64_t int_val = 0;
    if (!int_part.empty()) {
        auto [ptr, ec] = std::from_chars(int_part.data(), int_part.data() + int_part.size(), int_val);
        if (ec != std::errc{} || ptr != int_part.data() + int_part.size()) {
            throw std::invalid_argument("Malformed decimal: " + std::string(s));
        }
    }

    int64_t frac_val = 0;
    if (!frac_part.empty()) {
        // Pad or truncate to PRECISION digits
        std::string frac_str(frac_part);
        if (frac_str.size() < PRECISION) {
            frac_str.append(PRECISION - frac_str.size(), '0');
        } else if (frac_str.size() > PRECISION) {
            frac_str = frac_str.substr(0, PRECISION);
        }
        auto [ptr, ec] = std::from_chars(frac_str.data(), frac_str.data() + frac_str.size(), frac_val);
        if (ec != std::errc{} || ptr != frac_str.data() + frac_str.size()) {
            throw std::invalid_argument("Malformed decimal: " + std::string(s));
        }
    }

    int64_t magnitude = int_val * SCALE + frac_val;
    return Decimal(negative ? -magnitude : magnitude);
}

std::string Decimal::to_string() const {
    int64_t abs_val = value_ < 0 ? -value_ : value_;
    int64_t int_part = abs_val / SCALE;
    int64_t frac_part = abs_val % SCALE;

    std::string result;
    if (value_ < 0) result += '-';
    result += std::to_string(int_part);

    if (frac_part != 0) {
        std::string frac_str = std::to_string(frac_part);
        frac_str.insert(0, PRECISION - frac_str.size(), '0');
        while (!frac_str.empty() && frac_str.back() == '0') frac_str.pop_back();
        result += '.';
        result += frac_str;
    }
    return result;
}

Decimal Decimal::floor_to(Decimal step) const noexcept {
    if (!step.is_positive()) return *this;
    int64_t q = value_ / step.value_;
    if (value_ % step.value_ != 0 && value_ < 0) --q;
    return Decimal(q * step.value_);
}

Decimal Decimal::ceil_to(Decimal step) const noexcept {
    if (!step.is_positive()) return *this;
    int64_t q = value_ / step.value_;
    if (value_ % step.value_ != 0 && value_ > 0) ++q;
    return Decimal(q * step.value_);
}

// OrderRequest factory methods
OrderRequest OrderRequest::market(std::string_view symbol, Side side, Decimal quantity) {
    OrderRequest req;
    req.symbol = std::string(symbol);
    req.side = side;
    req.order_type = OrderType::Market;
    req.quantity = quantity;
    req.time_in_force = TimeInForce::IOC;
    return req;
}

OrderRequest OrderRequest::limit(std::string_view symbol, Side side, Decimal quantity, Decimal price) {
    OrderRequest req;
    req.symbol = std::string(symbol);
    req.side = side;
    req.order_type = OrderType::Limit;
    req.quantity = quantity;
    req.price = price;
    req.time_in_force = TimeInForce::GTC;
    return req;
}

}  // namespace fundarb
