// Funding Arb Engine - Configuration
// Builder pattern for fluent configuration, loadable from TOML or JSON

#pragma once

#include <fundarb/types.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fundarb {

// Process-level settings
struct GeneralConfig {
    std::string log_level = "info";
    std::string log_file;
    std::string leg1_venue = "lighter";
    std::string leg2_venue = "x10";
    std::vector<std::string> symbols;
    std::string journal_path;
};

struct FeeConfig {
    Decimal maker = Decimal::from_double(0.0002);
    Decimal taker = Decimal::from_double(0.0005);
};

// Entry sizing and opportunity filters
struct TradingConfig {
    Decimal notional_usd = Decimal::from_int(500);
    int max_open_trades = 3;
    Decimal min_apy = Decimal::from_double(0.20);
    Decimal max_spread_pct = Decimal::from_double(0.002);
    Decimal min_expected_value_usd = Decimal::from_double(0.50);
    Decimal max_breakeven_hours = Decimal::from_int(24);
    Decimal min_liquidity_score = Decimal::from_double(0.5);
    std::vector<std::string> blacklist;
    int64_t max_price_age_ms = 30000;
    Decimal maker_fill_probability = Decimal::from_double(0.7);
    Decimal hold_hours_for_ev = Decimal::from_int(24);
    Decimal leverage = Decimal::from_int(3);
};

enum class ExecutionMode : uint8_t {
    Sequential = 0,
    Parallel = 1
};

inline constexpr const char* to_string(ExecutionMode m) noexcept {
    return m == ExecutionMode::Sequential ? "sequential" : "parallel";
}

ExecutionMode execution_mode_from_string(std::string_view s);

enum class AttemptSchedule : uint8_t {
    Equal = 0,
    Increasing = 1
};

AttemptSchedule attempt_schedule_from_string(std::string_view s);

// Two-leg entry tuning
struct ExecutionConfig {
    // No default: a missing mode is a configuration error
    std::optional<ExecutionMode> mode;

    int leg1_max_attempts = 5;
    int64_t leg1_total_timeout_ms = 30000;
    AttemptSchedule leg1_schedule = AttemptSchedule::Increasing;
    int64_t leg1_poll_interval_ms = 250;
    Decimal leg1_max_aggressiveness = Decimal::from_double(0.9);
    bool leg1_smart_pricing = true;
    Decimal leg1_depth_trigger = Decimal::from_double(0.5);
    Decimal leg1_maker_floor = Decimal::from_double(0.3);
    bool leg1_final_taker = false;
    bool leg1_escalate_to_taker = true;
    Decimal ghost_fill_tolerance = Decimal::from_double(0.001);
    Decimal min_hedge_notional_usd = Decimal::from_int(10);

    int leg2_max_attempts = 3;
    int64_t leg2_fill_timeout_ms = 5000;
    Decimal leg2_base_slippage = Decimal::from_double(0.001);
    Decimal leg2_slippage_step = Decimal::from_double(0.001);
    Decimal leg2_max_slippage = Decimal::from_double(0.005);
    Decimal leg2_max_impact = Decimal::from_double(0.0015);
    int leg2_depth_levels = 20;
    Decimal leg2_microfill_usd = Decimal::one();

    Decimal max_entry_spread_pct = Decimal::from_double(0.003);
    Decimal balance_buffer = Decimal::from_double(1.1);

    int64_t rollback_timeout_ms = 10000;
    int rollback_max_attempts = 3;

    int64_t call_timeout_ms = 5000;
    int retry_attempts = 3;
    int64_t retry_base_delay_ms = 200;
};

// Exit rule thresholds
struct ExitRulesConfig {
    int64_t min_hold_seconds = 7200;
    Decimal max_hold_hours = Decimal::from_int(240);
    Decimal profit_target_usd = Decimal::from_int(5);

    bool early_take_profit = true;
    Decimal early_take_profit_usd = Decimal::from_double(0.30);
    Decimal early_take_profit_slippage_multiple = Decimal::from_double(1.5);
    Decimal early_take_profit_min_buffer_usd = Decimal::from_double(0.50);
    Decimal early_take_profit_execution_buffer_usd;

    Decimal funding_flip_hours = Decimal::from_int(4);
    Decimal funding_flip_threshold_apy = Decimal::from_double(-0.05);
    Decimal catastrophic_flip_apy = Decimal::from_double(-2.00);

    bool net_ev = true;
    Decimal net_ev_horizon_hours = Decimal::from_int(24);
    Decimal net_ev_exit_cost_multiple = Decimal::from_double(1.0);

    Decimal opportunity_cost_min_diff_apy = Decimal::from_double(0.30);
    Decimal rotation_roundtrip_multiple = Decimal::from_int(2);
    Decimal rotation_cost_multiple = Decimal::from_double(1.5);

    Decimal liquidation_min_distance = Decimal::from_double(0.10);
    Decimal delta_bound_max = Decimal::from_double(0.03);
    Decimal rebalance_min = Decimal::from_double(0.01);
};

// Close and hedge-integrity tuning
struct CloseConfig {
    int64_t maker_timeout_ms = 15000;
    int64_t poll_interval_ms = 500;
    int64_t retry_cooldown_ms = 60000;
    int max_close_attempts = 5;
    int broken_hedge_confirmations = 2;
    int64_t broken_hedge_spacing_ms = 30000;
    int64_t broken_hedge_reset_ms = 120000;
    int64_t broken_hedge_min_age_ms = 60000;
    Decimal imbalance_pct = Decimal::from_double(0.01);
    Decimal dust_qty = Decimal::from_double(0.00000001);
};

enum class GhostPolicy : uint8_t {
    Ignore = 0,
    Adopt = 1,
    Close = 2
};

inline constexpr const char* to_string(GhostPolicy p) noexcept {
    switch (p) {
        case GhostPolicy::Ignore: return "ignore";
        case GhostPolicy::Adopt: return "adopt";
        case GhostPolicy::Close: return "close";
    }
    return "unknown";
}

GhostPolicy ghost_policy_from_string(std::string_view s);

struct ReconcileConfig {
    int64_t interval_ms = 60000;
    Decimal qty_tolerance = Decimal::from_double(0.02);
    int64_t opening_stale_ms = 300000;
    GhostPolicy ghost_policy = GhostPolicy::Ignore;
    Decimal dust_qty = Decimal::from_double(0.00000001);
    int64_t flatten_cooldown_ms = 300000;
};

struct MarketDataConfig {
    int64_t refresh_interval_ms = 5000;
    int64_t health_check_interval_ms = 10000;
    int health_multiple = 3;
    int fresh_retries = 3;
    int64_t fresh_retry_delay_ms = 200;
    int64_t max_fallback_age_ms = 10000;
    int depth_levels = 20;
};

struct CircuitBreakerConfig {
    int max_consecutive_failures = 3;
    Decimal max_drawdown_pct;  // zero disables
    int64_t drawdown_window_ms = 86400000;
    int64_t cooldown_ms = 0;   // zero means manual reset only
};

struct SupervisorConfig {
    int64_t scan_interval_ms = 30000;
    int64_t position_interval_ms = 10000;
    int64_t heartbeat_interval_ms = 60000;
    int64_t backoff_base_ms = 2000;
    int64_t backoff_cap_ms = 60000;
};

struct NotificationConfig {
    bool enabled = false;
    std::string webhook_url;
    std::string telegram_token;
    std::string telegram_chat_id;
    int64_t throttle_ms = 300000;
    std::string min_level = "WARNING";
};

// Main engine configuration
class Config {
public:
    GeneralConfig general;
    std::unordered_map<std::string, FeeConfig> fees;
    TradingConfig trading;
    ExecutionConfig execution;
    ExitRulesConfig exit;
    CloseConfig close;
    ReconcileConfig reconcile;
    MarketDataConfig market_data;
    CircuitBreakerConfig circuit_breaker;
    SupervisorConfig supervisor;
    NotificationConfig notification;

    Config() = default;

    // Load from file; a .json extension selects the JSON loader
    static Config from_file(std::string_view path);

    // Load from TOML string
    static Config from_toml(std::string_view content);

    // Load from JSON string
    static Config from_json(std::string_view content);

    // Throws ConfigError on a missing mode or an out-of-range value
    void validate() const;

    // Fee schedule of a venue, falling back to defaults
    [[nodiscard]] FeeConfig fees_for(const std::string& venue) const;

    // Builder methods
    Config& with_venues(std::string_view leg1, std::string_view leg2) {
        general.leg1_venue = std::string(leg1);
        general.leg2_venue = std::string(leg2);
        return *this;
    }

    Config& with_symbols(std::vector<std::string> symbols) {
        general.symbols = std::move(symbols);
        return *this;
    }

    Config& with_fees(std::string_view venue, Decimal maker, Decimal taker) {
        fees[std::string(venue)] = FeeConfig{maker, taker};
        return *this;
    }

    Config& with_mode(ExecutionMode mode) {
        execution.mode = mode;
        return *this;
    }

    Config& set_notional(Decimal usd) {
        trading.notional_usd = usd;
        return *this;
    }

    Config& set_max_open_trades(int n) {
        trading.max_open_trades = n;
        return *this;
    }

    Config& set_ghost_policy(GhostPolicy policy) {
        reconcile.ghost_policy = policy;
        return *this;
    }

    Config& with_journal(std::string_view path) {
        general.journal_path = std::string(path);
        return *this;
    }

    Config& with_webhook(std::string_view url) {
        notification.enabled = true;
        notification.webhook_url = std::string(url);
        return *this;
    }

    Config& with_telegram(std::string_view token, std::string_view chat_id) {
        notification.enabled = true;
        notification.telegram_token = std::string(token);
        notification.telegram_chat_id = std::string(chat_id);
        return *this;
    }
};

}  // namespace fundarb
