// Funding Arb Engine - Exit Rules Implementation

#include <fundarb/exit_rules.hpp>
#include <fundarb/opportunity.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace fundarb::rules {

namespace {

std::string usd(Decimal d) {
    return fmt::format("${:.2f}", d.to_double());
}

std::string pct(Decimal d) {
    return fmt::format("{:.2f}%", d.to_double() * 100.0);
}

std::optional<ExitDecision> check_liquidation(const ExitContext& ctx, const ExitRulesConfig& config) {
    std::optional<Decimal> nearest;
    for (const auto& d : {ctx.leg1_liquidation_distance, ctx.leg2_liquidation_distance}) {
        if (d && (!nearest || *d < *nearest)) nearest = d;
    }
    if (!nearest || !config.liquidation_min_distance.is_positive()) return std::nullopt;
    if (*nearest >= config.liquidation_min_distance) return std::nullopt;

    ExitDecision d = ExitDecision::exit(std::string(REASON_EMERGENCY) + ": liquidation distance " +
                                        pct(*nearest) + " < " + pct(config.liquidation_min_distance));
    d.emergency = true;
    return d;
}

std::optional<ExitDecision> check_delta_bound(const Trade& trade, const ExitContext& ctx,
                                              const ExitRulesConfig& config) {
    if (!config.delta_bound_max.is_positive()) return std::nullopt;
    Decimal drift = delta_drift(trade, ctx.leg1_mark, ctx.leg2_mark);

    if (drift > config.delta_bound_max) {
        ExitDecision d = ExitDecision::exit(std::string(REASON_EMERGENCY) + ": delta drift " +
                                            pct(drift) + " > " + pct(config.delta_bound_max));
        d.emergency = true;
        return d;
    }
    if (config.rebalance_min.is_positive() && drift >= config.rebalance_min) {
        ExitDecision d = ExitDecision::exit(std::string(REASON_REBALANCE) + ": delta drift " +
                                            pct(drift) + " within [" + pct(config.rebalance_min) +
                                            ", " + pct(config.delta_bound_max) + "]");
        d.rebalance = true;
        return d;
    }
    return std::nullopt;
}

std::optional<ExitDecision> check_catastrophic_flip(const Trade& trade, Decimal diff_apy,
                                                    const ExitRulesConfig& config) {
    if (!trade.entry_apy.is_positive()) return std::nullopt;
    if (diff_apy >= config.catastrophic_flip_apy) return std::nullopt;

    spdlog::warn("Catastrophic funding flip on {}: APY {}", trade.symbol, pct(diff_apy));
    ExitDecision d = ExitDecision::exit(std::string(REASON_EMERGENCY) + ": catastrophic funding flip " +
                                        pct(diff_apy) + " APY");
    d.emergency = true;
    return d;
}

std::optional<ExitDecision> check_early_take_profit(const ExitContext& ctx, const ExitRulesConfig& config) {
    if (!config.early_take_profit || !config.early_take_profit_usd.is_positive()) return std::nullopt;

    Decimal threshold = effective_take_profit_threshold(ctx.exit_cost, config);
    if (ctx.price_pnl >= threshold && !ctx.current_pnl.is_negative()) {
        return ExitDecision::exit(std::string(REASON_EARLY_TP) + ": price PnL " + usd(ctx.price_pnl) +
                                  " >= " + usd(threshold));
    }
    return std::nullopt;
}

// Runs after the minimum hold. Returns a hold decision when the flip is not worth paying to exit.
std::optional<ExitDecision> check_funding_flip(const Trade& trade, const ExitContext& ctx,
                                               Decimal diff_hourly, Decimal diff_apy,
                                               const ExitRulesConfig& config) {
    if (!trade.entry_apy.is_positive()) return std::nullopt;
    if (diff_apy >= config.funding_flip_threshold_apy) return std::nullopt;

    if (ctx.current_pnl > ctx.exit_cost) {
        return ExitDecision::exit("Funding flipped (" + pct(diff_apy) + " APY), locking profit " +
                                  usd(ctx.current_pnl));
    }

    Decimal horizon = config.funding_flip_hours.is_positive() ? config.funding_flip_hours
                                                              : Decimal::from_int(8);
    Decimal projected_loss = diff_hourly.abs() * trade_notional(trade) * horizon;
    if (projected_loss > ctx.exit_cost) {
        return ExitDecision::exit("Funding flip: " + horizon.to_string() + "h loss " +
                                  usd(projected_loss) + " > exit cost " + usd(ctx.exit_cost));
    }
    return ExitDecision::hold("Holding despite flip: exit cost " + usd(ctx.exit_cost) +
                              " > projected loss " + usd(projected_loss));
}

// Sets edge_good when projected funding comfortably covers the exit cost
std::optional<ExitDecision> check_net_ev(const Trade& trade, const ExitContext& ctx,
                                         Decimal diff_hourly, const ExitRulesConfig& config,
                                         bool& edge_good) {
    edge_good = false;
    if (!config.net_ev || !config.net_ev_horizon_hours.is_positive()) return std::nullopt;

    Decimal multiple = config.net_ev_exit_cost_multiple.is_positive() ? config.net_ev_exit_cost_multiple
                                                                      : Decimal::one();
    Decimal per_hour = diff_hourly * trade_notional(trade);
    Decimal projected = per_hour * config.net_ev_horizon_hours;
    Decimal threshold = ctx.exit_cost * multiple;

    if (per_hour.is_negative()) {
        if (projected.abs() >= threshold) {
            return ExitDecision::exit(std::string(REASON_NETEV) + ": projected funding loss " +
                                      usd(projected.abs()) + " >= exit cost " + usd(threshold));
        }
        return std::nullopt;
    }
    if (projected < threshold) {
        return ExitDecision::exit(std::string(REASON_NETEV) + ": projected funding " + usd(projected) +
                                  " < exit cost " + usd(threshold));
    }
    edge_good = true;
    return std::nullopt;
}

std::optional<ExitDecision> check_opportunity_cost(const Trade& trade, const ExitContext& ctx,
                                                   Decimal current_apy, const ExitRulesConfig& config) {
    if (!ctx.best_alternative_apy) return std::nullopt;
    Decimal best = *ctx.best_alternative_apy;
    if (best <= current_apy + config.opportunity_cost_min_diff_apy) return std::nullopt;

    std::string apys = "alternative APY " + pct(best) + " vs current " + pct(current_apy);
    if (!ctx.exit_cost.is_positive()) {
        return ExitDecision::exit("Opportunity cost: " + apys);
    }

    Decimal horizon = config.net_ev_horizon_hours.is_positive() ? config.net_ev_horizon_hours
                                                                : Decimal::from_int(24);
    Decimal gain = trade_notional(trade) * (best - current_apy) * horizon /
                   Decimal::from_int(HOURS_PER_YEAR);
    Decimal switch_cost = ctx.exit_cost * config.rotation_roundtrip_multiple * config.rotation_cost_multiple;
    if (gain >= switch_cost) {
        return ExitDecision::exit("Opportunity cost: " + apys + ", gain " + usd(gain) +
                                  " >= switch cost " + usd(switch_cost));
    }
    return std::nullopt;
}

}  // namespace

Decimal effective_take_profit_threshold(Decimal exit_cost, const ExitRulesConfig& config) noexcept {
    Decimal slippage_buffer = exit_cost * config.early_take_profit_slippage_multiple;
    Decimal buffer = max(slippage_buffer, config.early_take_profit_min_buffer_usd);
    return config.early_take_profit_usd + buffer +
           max(config.early_take_profit_execution_buffer_usd, Decimal::zero());
}

Decimal funding_diff_hourly(const Trade& trade, Decimal leg1_rate, Decimal leg2_rate) noexcept {
    return trade.leg1.side == Side::Sell ? leg1_rate - leg2_rate : leg2_rate - leg1_rate;
}

Decimal delta_drift(const Trade& trade, std::optional<Decimal> leg1_mark,
                    std::optional<Decimal> leg2_mark) noexcept {
    auto signed_notional = [](const TradeLeg& leg, std::optional<Decimal> mark) {
        Decimal price = (mark && mark->is_positive()) ? *mark : leg.entry_price;
        Decimal n = leg.filled_qty * price;
        return leg.side == Side::Buy ? n : -n;
    };

    Decimal n1 = signed_notional(trade.leg1, leg1_mark);
    Decimal n2 = signed_notional(trade.leg2, leg2_mark);
    Decimal gross = n1.abs() + n2.abs();
    if (!gross.is_positive()) return Decimal::zero();
    return (n1 + n2).abs() / gross;
}

Decimal trade_notional(const Trade& trade) noexcept {
    if (trade.target_notional_usd.is_positive()) return trade.target_notional_usd;
    return (trade.leg1.filled_qty * trade.leg1.entry_price).abs();
}

ExitDecision evaluate_exit(const Trade& trade, const ExitContext& ctx, const ExitRulesConfig& config) {
    // Emergencies first; they ignore the minimum hold
    if (auto d = check_liquidation(ctx, config)) return *d;
    if (auto d = check_delta_bound(trade, ctx, config)) return *d;

    Decimal diff_hourly = funding_diff_hourly(trade, ctx.leg1_rate_hourly, ctx.leg2_rate_hourly);
    Decimal diff_apy = diff_hourly * Decimal::from_int(HOURS_PER_YEAR);

    if (auto d = check_catastrophic_flip(trade, diff_apy, config)) return *d;
    if (auto d = check_early_take_profit(ctx, config)) return *d;

    int64_t held_ms = trade.hold_duration_ms(ctx.now);
    if (held_ms < config.min_hold_seconds * 1000) {
        return ExitDecision::hold("Min hold not reached (" + std::to_string(held_ms / 1000) + "s of " +
                                  std::to_string(config.min_hold_seconds) + "s)");
    }

    Decimal max_hold_ms = config.max_hold_hours * Decimal::from_int(MS_PER_HOUR);
    if (max_hold_ms.is_positive() && Decimal::from_int(held_ms) >= max_hold_ms) {
        return ExitDecision::exit("Max hold time reached (" + config.max_hold_hours.to_string() + "h)");
    }

    if (auto d = check_funding_flip(trade, ctx, diff_hourly, diff_apy, config)) return *d;

    bool edge_good = false;
    if (auto d = check_net_ev(trade, ctx, diff_hourly, config, edge_good)) return *d;

    if (!edge_good) {
        if (config.profit_target_usd.is_positive() && ctx.current_pnl >= config.profit_target_usd) {
            return ExitDecision::exit("Profit target reached: " + usd(ctx.current_pnl) + " >= " +
                                      usd(config.profit_target_usd));
        }
        if (auto d = check_opportunity_cost(trade, ctx, diff_apy, config)) return *d;
    }

    return ExitDecision::hold(edge_good ? "Hold (NetEV): funding covers exit cost"
                                        : "Hold: no exit conditions met");
}

}  // namespace fundarb::rules
