// Funding Arb Engine - Trading Bot Implementation

#include <fundarb/bot.hpp>
#include <fundarb/errors.hpp>
#include <spdlog/spdlog.h>
#include <set>

namespace fundarb {

namespace {

constexpr int64_t kClosedRetentionMs = 7LL * 24 * MS_PER_HOUR;

}  // namespace

Config TradingBot::validated(Config config) {
    config.validate();
    return config;
}

TradingBot::TradingBot(Config config, ExchangePtr leg1, ExchangePtr leg2, TradeStorePtr store,
                       NotificationPtr notification, ClockFn clock)
    : config_(validated(std::move(config))),
      clock_(std::move(clock)),
      bus_(std::make_shared<EventBus>()),
      store_(std::move(store)),
      market_data_(std::move(leg1), std::move(leg2), config_.market_data,
                   std::chrono::milliseconds(config_.execution.call_timeout_ms), clock_),
      opportunities_(market_data_, config_, clock_),
      execution_(market_data_, store_, bus_, config_, shutdown_, clock_),
      positions_(market_data_, store_, bus_, config_, clock_),
      reconciler_(market_data_, store_, bus_, config_, clock_),
      breaker_(config_.circuit_breaker, bus_, clock_),
      supervisor_(bus_, shutdown_, config_.supervisor) {
    if (market_data_.leg1_venue() != config_.general.leg1_venue ||
        market_data_.leg2_venue() != config_.general.leg2_venue) {
        throw ConfigError("Adapters " + market_data_.leg1_venue() + "/" + market_data_.leg2_venue() +
                          " do not match configured venues " + config_.general.leg1_venue + "/" +
                          config_.general.leg2_venue);
    }

    // Journal every event
    subscriptions_.push_back(bus_->subscribe_all_scoped([store = store_](const Event& e) {
        store->append_event(e);
    }));

    subscriptions_.push_back(bus_->subscribe_scoped<TradeClosed>([this](const TradeClosed& e) {
        breaker_.record_pnl(e.realized_pnl + e.funding_collected);
    }));

    positions_.set_best_apy_provider([this](const std::string& symbol) {
        return opportunities_.best_apy(config_.general.symbols, {symbol});
    });
    reconciler_.set_executing_check([this](const std::string& symbol) {
        return execution_.is_executing(symbol);
    });

    if (notification && config_.notification.enabled) {
        notifier_ = std::make_unique<AlertNotifier>(std::move(notification), config_.notification, clock_);
        notifier_->attach(*bus_);
    }
}

TradingBot::~TradingBot() {
    stop();
}

void TradingBot::start() {
    spdlog::info("Starting funding bot: {} / {}, {} symbols, {} mode", config_.general.leg1_venue,
                 config_.general.leg2_venue, config_.general.symbols.size(),
                 to_string(execution_.mode()));

    refresh_market_data();
    seed_equity();

    ReconcileResult startup = reconcile(true);
    if (!startup.ok()) {
        spdlog::warn("Startup reconciliation reported {} errors", startup.errors.size());
    }

    if (notifier_) notifier_->start();

    const auto& sup = config_.supervisor;
    supervisor_.add_loop("market_data", std::chrono::milliseconds(config_.market_data.refresh_interval_ms),
                         [this] { refresh_market_data(); });
    supervisor_.add_loop("entries", std::chrono::milliseconds(sup.scan_interval_ms),
                         [this] { scan_and_enter(); });
    supervisor_.add_loop("positions", std::chrono::milliseconds(sup.position_interval_ms),
                         [this] { manage_positions(); });
    supervisor_.add_loop("reconcile", std::chrono::milliseconds(config_.reconcile.interval_ms),
                         [this] { reconcile(false); });
    supervisor_.add_loop("heartbeat", std::chrono::milliseconds(sup.heartbeat_interval_ms),
                         [this] { heartbeat(); });
    supervisor_.start();
}

void TradingBot::stop() {
    if (supervisor_.is_running()) {
        spdlog::info("Stopping funding bot");
    }
    supervisor_.shutdown();
    if (notifier_) notifier_->stop();
}

void TradingBot::wait() {
    while (shutdown_.sleep_for(std::chrono::seconds(1))) {
    }
}

int TradingBot::refresh_market_data() {
    return market_data_.refresh(config_.general.symbols);
}

int TradingBot::scan_and_enter() {
    if (supervisor_.entries_paused()) {
        spdlog::debug("Entries paused: {}", supervisor_.pause_reason());
        return 0;
    }
    if (!breaker_.allows_entry()) {
        spdlog::debug("Circuit breaker open: {}", breaker_.trip_reason());
        return 0;
    }
    if (!market_data_.is_healthy()) {
        spdlog::warn("Market data unhealthy, skipping entry scan");
        return 0;
    }

    auto open = store_->list_open_trades();
    int slots = config_.trading.max_open_trades - static_cast<int>(open.size());
    if (slots <= 0) return 0;

    std::set<std::string> exclude;
    for (const auto& t : open) exclude.insert(t.symbol);

    int entered = 0;
    for (const auto& opp : opportunities_.scan(config_.general.symbols, exclude)) {
        if (entered >= slots) break;
        shutdown_.check("entry scan");
        if (supervisor_.entries_paused() || !breaker_.allows_entry()) break;
        if (execution_.is_executing(opp.symbol)) continue;

        spdlog::info("Opportunity {}: APY {}, EV {} USD, breakeven {}h", opp.symbol,
                     opp.apy.to_string(), opp.expected_value_usd.to_string(), opp.breakeven_hours.to_string());

        ExecutionResult r = execution_.execute(opp);
        if (r.success) {
            ++entered;
            breaker_.record_success();
        } else if (r.trade) {
            // Orders reached a venue
            breaker_.record_failure(r.error_code + ": " + r.error);
        } else {
            spdlog::info("Entry for {} not attempted: {} ({})", opp.symbol, r.error, r.error_code);
        }
    }
    return entered;
}

int TradingBot::manage_positions() {
    return positions_.check_trades();
}

ReconcileResult TradingBot::reconcile(bool startup) {
    return reconciler_.reconcile(startup);
}

void TradingBot::heartbeat() {
    BotStatus s = status();
    spdlog::info("Heartbeat: {} open, {} closed, pnl {}, funding {}, fees {}{}{}{}",
                 s.open_trades, s.stats.closed_trades, s.stats.total_pnl.to_string(),
                 s.stats.total_funding.to_string(), s.stats.total_fees.to_string(),
                 s.market_data_healthy ? "" : ", market data UNHEALTHY",
                 s.entries_paused ? ", entries PAUSED: " + s.pause_reason : std::string(),
                 s.breaker_tripped ? ", circuit breaker OPEN" : "");

    int removed = store_->cleanup_closed(clock_() - kClosedRetentionMs);
    if (removed > 0) spdlog::debug("Dropped {} old closed trades", removed);
}

BotStatus TradingBot::status() {
    BotStatus s;
    s.running = supervisor_.is_running();
    s.entries_paused = supervisor_.entries_paused();
    s.pause_reason = supervisor_.pause_reason();
    s.breaker_tripped = breaker_.is_tripped();
    s.market_data_healthy = market_data_.is_healthy();
    s.stats = store_->stats();
    s.open_trades = s.stats.open_trades;
    return s;
}

// Drawdown is measured against the balance both venues hold at startup
void TradingBot::seed_equity() {
    Decimal equity;
    for (const auto& venue : {market_data_.leg1_venue(), market_data_.leg2_venue()}) {
        try {
            equity += await_future(market_data_.exchange(venue).get_available_balance(),
                                   std::chrono::milliseconds(config_.execution.call_timeout_ms),
                                   "get_available_balance", venue);
        } catch (const ExchangeError& e) {
            spdlog::warn("Balance on {} unavailable for drawdown baseline: {}", venue, e.what());
        }
    }
    if (!equity.is_positive()) {
        equity = config_.trading.notional_usd * Decimal::from_int(config_.trading.max_open_trades);
    }
    breaker_.set_equity(equity);
}

}  // namespace fundarb
