// Funding Arb Engine - Domain Models Implementation

#include <fundarb/models.hpp>
#include <fundarb/errors.hpp>
#include <nlohmann/json.hpp>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

namespace fundarb {

using json = nlohmann::json;

Decimal TradeLeg::pnl() const noexcept {
    if (filled_qty.is_zero() || exit_price.is_zero()) return Decimal::zero();
    Decimal move = (side == Side::Buy) ? exit_price - entry_price : entry_price - exit_price;
    return move * filled_qty - fees;
}

Decimal TradeLeg::unrealized_pnl(Decimal mark) const noexcept {
    if (filled_qty.is_zero() || !mark.is_positive()) return Decimal::zero();
    Decimal move = (side == Side::Buy) ? mark - entry_price : entry_price - mark;
    return move * filled_qty;
}

Trade Trade::create(std::string_view symbol,
                    std::string_view leg1_venue, Side leg1_side,
                    std::string_view leg2_venue,
                    Decimal target_qty, Decimal target_notional,
                    Decimal entry_apy, int64_t now) {
    Trade t;
    t.id = generate_trade_id();
    t.symbol = std::string(symbol);
    t.leg1.venue = std::string(leg1_venue);
    t.leg1.side = leg1_side;
    t.leg1.qty = target_qty;
    t.leg2.venue = std::string(leg2_venue);
    t.leg2.side = opposite(leg1_side);
    t.leg2.qty = target_qty;
    t.target_qty = target_qty;
    t.target_notional_usd = target_notional;
    t.entry_apy = entry_apy;
    t.current_apy = entry_apy;
    t.created_at = now;
    return t;
}

void Trade::advance(ExecutionState next) {
    if (next == execution_state) return;
    if (!can_transition(execution_state, next)) {
        throw ValidationError(
            std::string("Illegal execution transition ") + to_string(execution_state) +
            " -> " + to_string(next), symbol);
    }
    execution_state = next;
}

void Trade::mark_opened(int64_t now) {
    status = TradeStatus::Open;
    opened_at = now;
    last_funding_at = now;
}

void Trade::mark_closed(std::string_view reason, int64_t now) {
    status = TradeStatus::Closed;
    close_reason = std::string(reason);
    closed_at = now;
}

void Trade::mark_aborted(std::string_view reason, int64_t now) {
    status = TradeStatus::Aborted;
    if (close_reason.empty()) close_reason = std::string(reason);
    closed_at = now;
    if (can_transition(execution_state, ExecutionState::Aborted)) {
        execution_state = ExecutionState::Aborted;
    }
}

const TradeLeg& Trade::leg_on(std::string_view venue) const {
    if (leg1.venue == venue) return leg1;
    if (leg2.venue == venue) return leg2;
    throw ValidationError("Trade " + id + " has no leg on " + std::string(venue), symbol);
}

TradeLeg& Trade::leg_on(std::string_view venue) {
    return const_cast<TradeLeg&>(std::as_const(*this).leg_on(venue));
}

std::string generate_trade_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};

    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(8) << (rng() & 0xffffffffULL)
        << '-' << std::setw(8) << (rng() & 0xffffffffULL);
    return oss.str();
}

// =============================================================================
// JSON
// =============================================================================

void to_json(json& j, const TradeLeg& leg) {
    j = json{
        {"venue", leg.venue},
        {"side", to_string(leg.side)},
        {"order_id", leg.order_id},
        {"qty", leg.qty.to_string()},
        {"filled_qty", leg.filled_qty.to_string()},
        {"entry_price", leg.entry_price.to_string()},
        {"exit_price", leg.exit_price.to_string()},
        {"fees", leg.fees.to_string()}
    };
}

void from_json(const json& j, TradeLeg& leg) {
    leg.venue = j.at("venue").get<std::string>();
    leg.side = j.at("side").get<std::string>() == "buy" ? Side::Buy : Side::Sell;
    leg.order_id = j.value("order_id", "");
    leg.qty = Decimal::from_string(j.at("qty").get<std::string>());
    leg.filled_qty = Decimal::from_string(j.at("filled_qty").get<std::string>());
    leg.entry_price = Decimal::from_string(j.at("entry_price").get<std::string>());
    leg.exit_price = Decimal::from_string(j.at("exit_price").get<std::string>());
    leg.fees = Decimal::from_string(j.at("fees").get<std::string>());
}

void to_json(json& j, const Trade& t) {
    j = json{
        {"id", t.id},
        {"symbol", t.symbol},
        {"leg1", t.leg1},
        {"leg2", t.leg2},
        {"target_qty", t.target_qty.to_string()},
        {"target_notional_usd", t.target_notional_usd.to_string()},
        {"entry_apy", t.entry_apy.to_string()},
        {"entry_spread", t.entry_spread.to_string()},
        {"current_apy", t.current_apy.to_string()},
        {"status", static_cast<int>(t.status)},
        {"execution_state", static_cast<int>(t.execution_state)},
        {"funding_collected", t.funding_collected.to_string()},
        {"realized_pnl", t.realized_pnl.to_string()},
        {"high_water_mark", t.high_water_mark.to_string()},
        {"last_funding_at", t.last_funding_at},
        {"close_reason", t.close_reason},
        {"error", t.error},
        {"close_attempts", t.close_attempts},
        {"created_at", t.created_at},
        {"opened_at", t.opened_at},
        {"closed_at", t.closed_at}
    };
}

void from_json(const json& j, Trade& t) {
    auto dec = [&j](const char* key) {
        return Decimal::from_string(j.at(key).get<std::string>());
    };

    t.id = j.at("id").get<std::string>();
    t.symbol = j.at("symbol").get<std::string>();
    t.leg1 = j.at("leg1").get<TradeLeg>();
    t.leg2 = j.at("leg2").get<TradeLeg>();
    t.target_qty = dec("target_qty");
    t.target_notional_usd = dec("target_notional_usd");
    t.entry_apy = dec("entry_apy");
    t.entry_spread = dec("entry_spread");
    t.current_apy = dec("current_apy");
    t.status = static_cast<TradeStatus>(j.at("status").get<int>());
    t.execution_state = static_cast<ExecutionState>(j.at("execution_state").get<int>());
    t.funding_collected = dec("funding_collected");
    t.realized_pnl = dec("realized_pnl");
    t.high_water_mark = dec("high_water_mark");
    t.last_funding_at = j.value("last_funding_at", int64_t{0});
    t.close_reason = j.value("close_reason", "");
    t.error = j.value("error", "");
    t.close_attempts = j.value("close_attempts", 0);
    t.created_at = j.value("created_at", int64_t{0});
    t.opened_at = j.value("opened_at", int64_t{0});
    t.closed_at = j.value("closed_at", int64_t{0});
}

}  // namespace fundarb
