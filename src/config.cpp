// Funding Arb Engine - Configuration Implementation

#include <fundarb/config.hpp>
#include <fundarb/errors.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace fundarb {

// Simple TOML parser (handles the flat subset the config uses)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// "a, b" or ["a", "b"]
std::vector<std::string> split_list(const std::string& value) {
    std::string body = trim(value);
    if (body.size() >= 2 && body.front() == '[' && body.back() == ']') {
        body = body.substr(1, body.size() - 2);
    }

    std::vector<std::string> out;
    std::istringstream stream{body};
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = unquote(trim(item));
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "true") return true;
    if (value == "false") return false;
    throw ConfigError("Expected true/false for " + key + ", got '" + value + "'");
}

int64_t parse_int(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        int64_t v = std::stoll(value, &pos);
        if (pos != value.size()) throw std::invalid_argument("trailing characters");
        return v;
    } catch (const std::exception&) {
        throw ConfigError("Expected integer for " + key + ", got '" + value + "'");
    }
}

Decimal parse_decimal(const std::string& key, const std::string& value) {
    try {
        return Decimal::from_string(value);
    } catch (const std::invalid_argument&) {
        throw ConfigError("Expected decimal for " + key + ", got '" + value + "'");
    }
}

// Applies one key of one section; shared by the TOML and JSON loaders
void apply_key(Config& config, const std::string& section, const std::string& subsection,
               const std::string& key, const std::string& value) {
    const std::string path = section + (subsection.empty() ? "" : "." + subsection) + "." + key;
    auto i64 = [&] { return parse_int(path, value); };
    auto i32 = [&] { return static_cast<int>(parse_int(path, value)); };
    auto dec = [&] { return parse_decimal(path, value); };
    auto flag = [&] { return parse_bool(path, value); };

    bool known = true;

    if (section == "general") {
        auto& g = config.general;
        if (key == "log_level") g.log_level = value;
        else if (key == "log_file") g.log_file = value;
        else if (key == "leg1_venue") g.leg1_venue = value;
        else if (key == "leg2_venue") g.leg2_venue = value;
        else if (key == "symbols") g.symbols = split_list(value);
        else if (key == "journal_path") g.journal_path = value;
        else known = false;
    }
    else if (section == "fees" && !subsection.empty()) {
        auto& f = config.fees[subsection];
        if (key == "maker") f.maker = dec();
        else if (key == "taker") f.taker = dec();
        else known = false;
    }
    else if (section == "trading") {
        auto& t = config.trading;
        if (key == "notional_usd") t.notional_usd = dec();
        else if (key == "max_open_trades") t.max_open_trades = i32();
        else if (key == "min_apy") t.min_apy = dec();
        else if (key == "max_spread_pct") t.max_spread_pct = dec();
        else if (key == "min_expected_value_usd") t.min_expected_value_usd = dec();
        else if (key == "max_breakeven_hours") t.max_breakeven_hours = dec();
        else if (key == "min_liquidity_score") t.min_liquidity_score = dec();
        else if (key == "blacklist") t.blacklist = split_list(value);
        else if (key == "max_price_age_ms") t.max_price_age_ms = i64();
        else if (key == "maker_fill_probability") t.maker_fill_probability = dec();
        else if (key == "hold_hours_for_ev") t.hold_hours_for_ev = dec();
        else if (key == "leverage") t.leverage = dec();
        else known = false;
    }
    else if (section == "execution") {
        auto& e = config.execution;
        if (key == "mode") e.mode = execution_mode_from_string(value);
        else if (key == "leg1_max_attempts") e.leg1_max_attempts = i32();
        else if (key == "leg1_total_timeout_ms") e.leg1_total_timeout_ms = i64();
        else if (key == "leg1_schedule") e.leg1_schedule = attempt_schedule_from_string(value);
        else if (key == "leg1_poll_interval_ms") e.leg1_poll_interval_ms = i64();
        else if (key == "leg1_max_aggressiveness") e.leg1_max_aggressiveness = dec();
        else if (key == "leg1_smart_pricing") e.leg1_smart_pricing = flag();
        else if (key == "leg1_depth_trigger") e.leg1_depth_trigger = dec();
        else if (key == "leg1_maker_floor") e.leg1_maker_floor = dec();
        else if (key == "leg1_final_taker") e.leg1_final_taker = flag();
        else if (key == "leg1_escalate_to_taker") e.leg1_escalate_to_taker = flag();
        else if (key == "ghost_fill_tolerance") e.ghost_fill_tolerance = dec();
        else if (key == "min_hedge_notional_usd") e.min_hedge_notional_usd = dec();
        else if (key == "leg2_max_attempts") e.leg2_max_attempts = i32();
        else if (key == "leg2_fill_timeout_ms") e.leg2_fill_timeout_ms = i64();
        else if (key == "leg2_base_slippage") e.leg2_base_slippage = dec();
        else if (key == "leg2_slippage_step") e.leg2_slippage_step = dec();
        else if (key == "leg2_max_slippage") e.leg2_max_slippage = dec();
        else if (key == "leg2_max_impact") e.leg2_max_impact = dec();
        else if (key == "leg2_depth_levels") e.leg2_depth_levels = i32();
        else if (key == "leg2_microfill_usd") e.leg2_microfill_usd = dec();
        else if (key == "max_entry_spread_pct") e.max_entry_spread_pct = dec();
        else if (key == "balance_buffer") e.balance_buffer = dec();
        else if (key == "rollback_timeout_ms") e.rollback_timeout_ms = i64();
        else if (key == "rollback_max_attempts") e.rollback_max_attempts = i32();
        else if (key == "call_timeout_ms") e.call_timeout_ms = i64();
        else if (key == "retry_attempts") e.retry_attempts = i32();
        else if (key == "retry_base_delay_ms") e.retry_base_delay_ms = i64();
        else known = false;
    }
    else if (section == "exit") {
        auto& x = config.exit;
        if (key == "min_hold_seconds") x.min_hold_seconds = i64();
        else if (key == "max_hold_hours") x.max_hold_hours = dec();
        else if (key == "profit_target_usd") x.profit_target_usd = dec();
        else if (key == "early_take_profit") x.early_take_profit = flag();
        else if (key == "early_take_profit_usd") x.early_take_profit_usd = dec();
        else if (key == "early_take_profit_slippage_multiple") x.early_take_profit_slippage_multiple = dec();
        else if (key == "early_take_profit_min_buffer_usd") x.early_take_profit_min_buffer_usd = dec();
        else if (key == "early_take_profit_execution_buffer_usd") x.early_take_profit_execution_buffer_usd = dec();
        else if (key == "funding_flip_hours") x.funding_flip_hours = dec();
        else if (key == "funding_flip_threshold_apy") x.funding_flip_threshold_apy = dec();
        else if (key == "catastrophic_flip_apy") x.catastrophic_flip_apy = dec();
        else if (key == "net_ev") x.net_ev = flag();
        else if (key == "net_ev_horizon_hours") x.net_ev_horizon_hours = dec();
        else if (key == "net_ev_exit_cost_multiple") x.net_ev_exit_cost_multiple = dec();
        else if (key == "opportunity_cost_min_diff_apy") x.opportunity_cost_min_diff_apy = dec();
        else if (key == "rotation_roundtrip_multiple") x.rotation_roundtrip_multiple = dec();
        else if (key == "rotation_cost_multiple") x.rotation_cost_multiple = dec();
        else if (key == "liquidation_min_distance") x.liquidation_min_distance = dec();
        else if (key == "delta_bound_max") x.delta_bound_max = dec();
        else if (key == "rebalance_min") x.rebalance_min = dec();
        else known = false;
    }
    else if (section == "close") {
        auto& c = config.close;
        if (key == "maker_timeout_ms") c.maker_timeout_ms = i64();
        else if (key == "poll_interval_ms") c.poll_interval_ms = i64();
        else if (key == "retry_cooldown_ms") c.retry_cooldown_ms = i64();
        else if (key == "max_close_attempts") c.max_close_attempts = i32();
        else if (key == "broken_hedge_confirmations") c.broken_hedge_confirmations = i32();
        else if (key == "broken_hedge_spacing_ms") c.broken_hedge_spacing_ms = i64();
        else if (key == "broken_hedge_reset_ms") c.broken_hedge_reset_ms = i64();
        else if (key == "broken_hedge_min_age_ms") c.broken_hedge_min_age_ms = i64();
        else if (key == "imbalance_pct") c.imbalance_pct = dec();
        else if (key == "dust_qty") c.dust_qty = dec();
        else known = false;
    }
    else if (section == "reconcile") {
        auto& r = config.reconcile;
        if (key == "interval_ms") r.interval_ms = i64();
        else if (key == "qty_tolerance") r.qty_tolerance = dec();
        else if (key == "opening_stale_ms") r.opening_stale_ms = i64();
        else if (key == "ghost_policy") r.ghost_policy = ghost_policy_from_string(value);
        else if (key == "dust_qty") r.dust_qty = dec();
        else if (key == "flatten_cooldown_ms") r.flatten_cooldown_ms = i64();
        else known = false;
    }
    else if (section == "market_data") {
        auto& m = config.market_data;
        if (key == "refresh_interval_ms") m.refresh_interval_ms = i64();
        else if (key == "health_check_interval_ms") m.health_check_interval_ms = i64();
        else if (key == "health_multiple") m.health_multiple = i32();
        else if (key == "fresh_retries") m.fresh_retries = i32();
        else if (key == "fresh_retry_delay_ms") m.fresh_retry_delay_ms = i64();
        else if (key == "max_fallback_age_ms") m.max_fallback_age_ms = i64();
        else if (key == "depth_levels") m.depth_levels = i32();
        else known = false;
    }
    else if (section == "circuit_breaker") {
        auto& cb = config.circuit_breaker;
        if (key == "max_consecutive_failures") cb.max_consecutive_failures = i32();
        else if (key == "max_drawdown_pct") cb.max_drawdown_pct = dec();
        else if (key == "drawdown_window_ms") cb.drawdown_window_ms = i64();
        else if (key == "cooldown_ms") cb.cooldown_ms = i64();
        else known = false;
    }
    else if (section == "supervisor") {
        auto& s = config.supervisor;
        if (key == "scan_interval_ms") s.scan_interval_ms = i64();
        else if (key == "position_interval_ms") s.position_interval_ms = i64();
        else if (key == "heartbeat_interval_ms") s.heartbeat_interval_ms = i64();
        else if (key == "backoff_base_ms") s.backoff_base_ms = i64();
        else if (key == "backoff_cap_ms") s.backoff_cap_ms = i64();
        else known = false;
    }
    else if (section == "notification") {
        auto& n = config.notification;
        if (key == "enabled") n.enabled = flag();
        else if (key == "webhook_url") n.webhook_url = value;
        else if (key == "telegram_token") n.telegram_token = value;
        else if (key == "telegram_chat_id") n.telegram_chat_id = value;
        else if (key == "throttle_ms") n.throttle_ms = i64();
        else if (key == "min_level") n.min_level = value;
        else known = false;
    }
    else {
        known = false;
    }

    if (!known) {
        spdlog::warn("Ignoring unknown config key {}", path);
    }
}

// JSON scalars and arrays flattened to the same text form the TOML loader sees
std::string json_scalar(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
    if (v.is_array()) {
        std::string joined;
        for (const auto& item : v) {
            if (!joined.empty()) joined += ",";
            joined += json_scalar(item);
        }
        return joined;
    }
    return v.dump();
}

}  // namespace

ExecutionMode execution_mode_from_string(std::string_view s) {
    if (s == "sequential") return ExecutionMode::Sequential;
    if (s == "parallel") return ExecutionMode::Parallel;
    throw ConfigError("execution.mode must be 'sequential' or 'parallel', got '" + std::string(s) + "'");
}

AttemptSchedule attempt_schedule_from_string(std::string_view s) {
    if (s == "equal") return AttemptSchedule::Equal;
    if (s == "increasing") return AttemptSchedule::Increasing;
    throw ConfigError("execution.leg1_schedule must be 'equal' or 'increasing', got '" + std::string(s) + "'");
}

GhostPolicy ghost_policy_from_string(std::string_view s) {
    if (s == "ignore") return GhostPolicy::Ignore;
    if (s == "adopt") return GhostPolicy::Adopt;
    if (s == "close") return GhostPolicy::Close;
    throw ConfigError("reconcile.ghost_policy must be ignore, adopt or close, got '" + std::string(s) + "'");
}

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    bool is_json = path_str.size() >= 5 && path_str.compare(path_str.size() - 5, 5, ".json") == 0;
    return is_json ? from_json(buffer.str()) : from_toml(buffer.str());
}

Config Config::from_toml(std::string_view content) {
    Config config;
    std::string current_section;
    std::string current_subsection;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;
    int line_no = 0;

    while (std::getline(stream, line)) {
        ++line_no;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                throw ConfigError("Unterminated section header at line " + std::to_string(line_no));
            }
            std::string section = line.substr(1, end - 1);

            // Check for subsection [section.name]
            auto dot = section.find('.');
            if (dot != std::string::npos) {
                current_section = section.substr(0, dot);
                current_subsection = section.substr(dot + 1);
            } else {
                current_section = section;
                current_subsection.clear();
            }
            continue;
        }

        // Key-value pair
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("Expected key = value at line " + std::to_string(line_no));
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        // Trailing comment on an unquoted value
        if (!value.empty() && value[0] != '"') {
            auto hash = value.find('#');
            if (hash != std::string::npos) value = trim(value.substr(0, hash));
        }
        value = unquote(value);

        apply_key(config, current_section, current_subsection, key, value);
    }

    return config;
}

Config Config::from_json(std::string_view content) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("Invalid JSON config: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("JSON config must be an object");
    }

    Config config;
    for (const auto& [section, body] : root.items()) {
        if (!body.is_object()) {
            throw ConfigError("Section " + section + " must be an object");
        }
        for (const auto& [key, value] : body.items()) {
            // [fees.<venue>] arrives as a nested object
            if (value.is_object()) {
                for (const auto& [sub_key, sub_value] : value.items()) {
                    apply_key(config, section, key, sub_key, json_scalar(sub_value));
                }
                continue;
            }
            apply_key(config, section, "", key, json_scalar(value));
        }
    }
    return config;
}

void Config::validate() const {
    if (!execution.mode) {
        throw ConfigError("execution.mode is required (sequential or parallel)");
    }
    if (general.leg1_venue.empty() || general.leg2_venue.empty()) {
        throw ConfigError("general.leg1_venue and general.leg2_venue are required");
    }
    if (general.leg1_venue == general.leg2_venue) {
        throw ConfigError("leg1 and leg2 venues must differ");
    }
    if (!trading.notional_usd.is_positive()) {
        throw ConfigError("trading.notional_usd must be positive");
    }
    if (trading.max_open_trades < 1) {
        throw ConfigError("trading.max_open_trades must be at least 1");
    }
    if (execution.leg1_max_attempts < 1 || execution.leg2_max_attempts < 1) {
        throw ConfigError("leg attempt counts must be at least 1");
    }
    if (execution.leg1_total_timeout_ms <= 0 || execution.call_timeout_ms <= 0) {
        throw ConfigError("execution timeouts must be positive");
    }
    if (execution.leg1_max_aggressiveness.is_negative() ||
        execution.leg1_max_aggressiveness > Decimal::one()) {
        throw ConfigError("execution.leg1_max_aggressiveness must lie in [0, 1]");
    }
    if (exit.rebalance_min > exit.delta_bound_max) {
        throw ConfigError("exit.rebalance_min must not exceed exit.delta_bound_max");
    }
    if (close.broken_hedge_confirmations < 1) {
        throw ConfigError("close.broken_hedge_confirmations must be at least 1");
    }
    if (reconcile.qty_tolerance.is_negative() || reconcile.qty_tolerance >= Decimal::one()) {
        throw ConfigError("reconcile.qty_tolerance must lie in [0, 1)");
    }
    if (supervisor.backoff_base_ms <= 0 || supervisor.backoff_cap_ms < supervisor.backoff_base_ms) {
        throw ConfigError("supervisor backoff must satisfy 0 < base <= cap");
    }
    if (notification.enabled && notification.webhook_url.empty() &&
        (notification.telegram_token.empty() || notification.telegram_chat_id.empty())) {
        throw ConfigError("notification enabled without webhook_url or telegram credentials");
    }
}

FeeConfig Config::fees_for(const std::string& venue) const {
    auto it = fees.find(venue);
    return it != fees.end() ? it->second : FeeConfig{};
}

}  // namespace fundarb
