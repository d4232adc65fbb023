// Funding Arb Engine - Trading Bot
// Wires market data, entries, position management and reconciliation under one supervisor

#pragma once

#include <fundarb/async.hpp>
#include <fundarb/circuit_breaker.hpp>
#include <fundarb/config.hpp>
#include <fundarb/event_bus.hpp>
#include <fundarb/exchange.hpp>
#include <fundarb/execution.hpp>
#include <fundarb/market_data.hpp>
#include <fundarb/notification.hpp>
#include <fundarb/notifier.hpp>
#include <fundarb/opportunity.hpp>
#include <fundarb/position_manager.hpp>
#include <fundarb/reconciler.hpp>
#include <fundarb/store.hpp>
#include <fundarb/supervisor.hpp>
#include <memory>
#include <string>
#include <vector>

namespace fundarb {

struct BotStatus {
    bool running = false;
    bool entries_paused = false;
    std::string pause_reason;
    bool breaker_tripped = false;
    bool market_data_healthy = false;
    int open_trades = 0;
    StoreStats stats;
};

class TradingBot {
public:
    // Throws ConfigError on an invalid config or adapters that do not match the configured venues
    TradingBot(Config config, ExchangePtr leg1, ExchangePtr leg2, TradeStorePtr store,
               NotificationPtr notification = nullptr, ClockFn clock = now_ms);
    ~TradingBot();

    TradingBot(const TradingBot&) = delete;
    TradingBot& operator=(const TradingBot&) = delete;

    // Startup reconciliation, then the supervised loops
    void start();
    void stop();

    // Blocks until shutdown is requested
    void wait();

    // Loop bodies, callable directly
    int refresh_market_data();
    int scan_and_enter();
    int manage_positions();
    ReconcileResult reconcile(bool startup = false);
    void heartbeat();

    [[nodiscard]] BotStatus status();

    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] ShutdownSignal& shutdown_signal() noexcept { return shutdown_; }
    [[nodiscard]] EventBusPtr bus() const noexcept { return bus_; }
    [[nodiscard]] TradeStorePtr store() const noexcept { return store_; }
    [[nodiscard]] MarketDataService& market_data() noexcept { return market_data_; }
    [[nodiscard]] ExecutionEngine& execution() noexcept { return execution_; }
    [[nodiscard]] PositionManager& positions() noexcept { return positions_; }
    [[nodiscard]] CircuitBreaker& circuit_breaker() noexcept { return breaker_; }
    [[nodiscard]] Supervisor& supervisor() noexcept { return supervisor_; }

private:
    static Config validated(Config config);
    void seed_equity();

    Config config_;
    ClockFn clock_;
    ShutdownSignal shutdown_;
    EventBusPtr bus_;
    TradeStorePtr store_;

    MarketDataService market_data_;
    OpportunityEngine opportunities_;
    ExecutionEngine execution_;
    PositionManager positions_;
    Reconciler reconciler_;
    CircuitBreaker breaker_;
    Supervisor supervisor_;
    std::unique_ptr<AlertNotifier> notifier_;

    // Declared last so handlers go before the members they use
    std::vector<Subscription> subscriptions_;
};

}  // namespace fundarb
