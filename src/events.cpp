// Funding Arb Engine - Domain Events Implementation

#include <fundarb/events.hpp>
#include <fundarb/errors.hpp>
#include <nlohmann/json.hpp>
#include <iomanip>
#include <random>
#include <sstream>

namespace fundarb {

using json = nlohmann::json;

const char* to_string(EventType t) noexcept {
    switch (t) {
        case EventType::TradeOpened: return "TradeOpened";
        case EventType::TradeClosed: return "TradeClosed";
        case EventType::TradeStateChanged: return "TradeStateChanged";
        case EventType::LegFilled: return "LegFilled";
        case EventType::RollbackInitiated: return "RollbackInitiated";
        case EventType::RollbackCompleted: return "RollbackCompleted";
        case EventType::FundingCollected: return "FundingCollected";
        case EventType::PositionReconciled: return "PositionReconciled";
        case EventType::CircuitBreakerTripped: return "CircuitBreakerTripped";
        case EventType::BrokenHedgeDetected: return "BrokenHedgeDetected";
        case EventType::Alert: return "AlertEvent";
    }
    return "Unknown";
}

const char* to_string(AlertLevel level) noexcept {
    switch (level) {
        case AlertLevel::Info: return "INFO";
        case AlertLevel::Warning: return "WARNING";
        case AlertLevel::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

AlertLevel alert_level_from_string(std::string_view s) {
    if (s == "INFO" || s == "info") return AlertLevel::Info;
    if (s == "WARNING" || s == "warning" || s == "warn") return AlertLevel::Warning;
    if (s == "CRITICAL" || s == "critical") return AlertLevel::Critical;
    throw ConfigError("Unknown alert level: " + std::string(s));
}

Event::Event() : timestamp(now_ms()) {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << "evt-" << timestamp << '-' << std::hex << std::setfill('0') << std::setw(12)
        << (rng() & 0xffffffffffffULL);
    event_id = oss.str();
}

json Event::to_json() const {
    return json{
        {"event_id", event_id},
        {"event_type", fundarb::to_string(type())},
        {"timestamp", timestamp},
        {"payload", payload()}
    };
}

json TradeOpened::payload() const {
    return json{
        {"trade_id", trade_id}, {"symbol", symbol},
        {"qty", qty.to_string()}, {"notional_usd", notional_usd.to_string()},
        {"entry_apy", entry_apy.to_string()},
        {"leg1_price", leg1_price.to_string()}, {"leg2_price", leg2_price.to_string()}
    };
}

json TradeClosed::payload() const {
    return json{
        {"trade_id", trade_id}, {"symbol", symbol}, {"reason", reason},
        {"realized_pnl", realized_pnl.to_string()},
        {"funding_collected", funding_collected.to_string()},
        {"total_fees", total_fees.to_string()},
        {"hold_duration_ms", hold_duration_ms}
    };
}

json TradeStateChanged::payload() const {
    return json{
        {"trade_id", trade_id}, {"symbol", symbol},
        {"old_status", fundarb::to_string(old_status)},
        {"new_status", fundarb::to_string(new_status)},
        {"reason", reason}
    };
}

json LegFilled::payload() const {
    return json{
        {"trade_id", trade_id}, {"symbol", symbol}, {"venue", venue},
        {"side", fundarb::to_string(side)}, {"order_id", order_id},
        {"qty", qty.to_string()}, {"price", price.to_string()}, {"fee", fee.to_string()}
    };
}

json RollbackInitiated::payload() const {
    return json{
        {"trade_id", trade_id}, {"symbol", symbol}, {"reason", reason},
        {"leg_venue", leg_venue}, {"qty", qty.to_string()}
    };
}

json RollbackCompleted::payload() const {
    return json{
        {"trade_id", trade_id}, {"symbol", symbol},
        {"success", success}, {"loss_usd", loss_usd.to_string()}
    };
}

json FundingCollected::payload() const {
    return json{
        {"trade_id", trade_id}, {"symbol", symbol},
        {"amount", amount.to_string()}, {"total", total.to_string()}
    };
}

json PositionReconciled::payload() const {
    return json{
        {"symbol", symbol}, {"venue", venue}, {"action", action}, {"details", details}
    };
}

json CircuitBreakerTripped::payload() const {
    return json{
        {"reason", reason},
        {"consecutive_failures", consecutive_failures},
        {"cooldown_ms", cooldown_ms}
    };
}

json BrokenHedgeDetected::payload() const {
    return json{
        {"trade_id", trade_id}, {"symbol", symbol},
        {"missing_venue", missing_venue},
        {"remaining_qty", remaining_qty.to_string()},
        {"source", source}, {"details", details}
    };
}

json AlertEvent::payload() const {
    return json{
        {"level", fundarb::to_string(level)}, {"message", message}, {"details", details}
    };
}

}  // namespace fundarb
