// Funding Arb Engine - Domain Events
// Immutable facts published on the event bus and appended to the trade journal

#pragma once

#include <fundarb/models.hpp>
#include <fundarb/types.hpp>
#include <nlohmann/json_fwd.hpp>
#include <map>
#include <string>

namespace fundarb {

enum class EventType : uint8_t {
    TradeOpened = 0,
    TradeClosed,
    TradeStateChanged,
    LegFilled,
    RollbackInitiated,
    RollbackCompleted,
    FundingCollected,
    PositionReconciled,
    CircuitBreakerTripped,
    BrokenHedgeDetected,
    Alert
};

const char* to_string(EventType t) noexcept;

enum class AlertLevel : uint8_t {
    Info = 0,
    Warning = 1,
    Critical = 2
};

const char* to_string(AlertLevel level) noexcept;
AlertLevel alert_level_from_string(std::string_view s);

using EventDetails = std::map<std::string, std::string>;

// Base event; id and timestamp are stamped at construction
struct Event {
    std::string event_id;
    int64_t timestamp = 0;

    Event();
    virtual ~Event() = default;

    [[nodiscard]] virtual EventType type() const noexcept = 0;
    [[nodiscard]] virtual nlohmann::json payload() const = 0;

    // Envelope plus payload
    [[nodiscard]] nlohmann::json to_json() const;
};

struct TradeOpened : Event {
    static constexpr EventType kType = EventType::TradeOpened;

    std::string trade_id;
    std::string symbol;
    Decimal qty;
    Decimal notional_usd;
    Decimal entry_apy;
    Decimal leg1_price;
    Decimal leg2_price;

    [[nodiscard]] EventType type() const noexcept override { return kType; }
    [[nodiscard]] nlohmann::json payload() const override;
};

struct TradeClosed : Event {
    static constexpr EventType kType = EventType::TradeClosed;

    std::string trade_id;
    std::string symbol;
    std::string reason;
    Decimal realized_pnl;
    Decimal funding_collected;
    Decimal total_fees;
    int64_t hold_duration_ms = 0;

    [[nodiscard]] EventType type() const noexcept override { return kType; }
    [[nodiscard]] nlohmann::json payload() const override;
};

struct TradeStateChanged : Event {
    static constexpr EventType kType = EventType::TradeStateChanged;

    std::string trade_id;
    std::string symbol;
    TradeStatus old_status = TradeStatus::Pending;
    TradeStatus new_status = TradeStatus::Pending;
    std::string reason;

    [[nodiscard]] EventType type() const noexcept override { return kType; }
    [[nodiscard]] nlohmann::json payload() const override;
};

struct LegFilled : Event {
    static constexpr EventType kType = EventType::LegFilled;

    std::string trade_id;
    std::string symbol;
    std::string venue;
    Side side = Side::Buy;
    std::string order_id;
    Decimal qty;
    Decimal price;
    Decimal fee;

    [[nodiscard]] EventType type() const noexcept override { return kType; }
    [[nodiscard]] nlohmann::json payload() const override;
};

struct RollbackInitiated : Event {
    static constexpr EventType kType = EventType::RollbackInitiated;

    std::string trade_id;
    std::string symbol;
    std::string reason;
    std::string leg_venue;
    Decimal qty;

    [[nodiscard]] EventType type() const noexcept override { return kType; }
    [[nodiscard]] nlohmann::json payload() const override;
};

struct RollbackCompleted : Event {
    static constexpr EventType kType = EventType::RollbackCompleted;

    std::string trade_id;
    std::string symbol;
    bool success = false;
    Decimal loss_usd;

    [[nodiscard]] EventType type() const noexcept override { return kType; }
    [[nodiscard]] nlohmann::json payload() const override;
};

struct FundingCollected : Event {
    static constexpr EventType kType = EventType::FundingCollected;

    std::string trade_id;
    std::string symbol;
    Decimal amount;
    Decimal total;

    [[nodiscard]] EventType type() const noexcept override { return kType; }
    [[nodiscard]] nlohmann::json payload() const override;
};

struct PositionReconciled : Event {
    static constexpr EventType kType = EventType::PositionReconciled;

    std::string symbol;
    std::string venue;
    std::string action;
    EventDetails details;

    [[nodiscard]] EventType type() const noexcept override { return kType; }
    [[nodiscard]] nlohmann::json payload() const override;
};

struct CircuitBreakerTripped : Event {
    static constexpr EventType kType = EventType::CircuitBreakerTripped;

    std::string reason;
    int consecutive_failures = 0;
    int64_t cooldown_ms = 0;

    [[nodiscard]] EventType type() const noexcept override { return kType; }
    [[nodiscard]] nlohmann::json payload() const override;
};

struct BrokenHedgeDetected : Event {
    static constexpr EventType kType = EventType::BrokenHedgeDetected;

    std::string trade_id;
    std::string symbol;
    std::string missing_venue;
    Decimal remaining_qty;
    std::string source;  // "execution" or "position_monitor"
    EventDetails details;

    [[nodiscard]] EventType type() const noexcept override { return kType; }
    [[nodiscard]] nlohmann::json payload() const override;
};

struct AlertEvent : Event {
    static constexpr EventType kType = EventType::Alert;

    AlertLevel level = AlertLevel::Info;
    std::string message;
    EventDetails details;

    AlertEvent() = default;
    AlertEvent(AlertLevel lvl, std::string msg, EventDetails det = {})
        : level(lvl), message(std::move(msg)), details(std::move(det)) {}

    [[nodiscard]] EventType type() const noexcept override { return kType; }
    [[nodiscard]] nlohmann::json payload() const override;
};

}  // namespace fundarb
