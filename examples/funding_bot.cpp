/**
 * Funding Arbitrage Bot
 *
 * Runs the delta-neutral funding engine against two paper venues seeded
 * with a static market. Swap the PaperExchange instances for live adapters
 * implementing ExchangePort to trade for real.
 *
 * Usage: funding_bot [config.toml]
 */

#include <fundarb/adapters/paper.hpp>
#include <fundarb/adapters/webhook.hpp>
#include <fundarb/bot.hpp>
#include <fundarb/errors.hpp>
#include <fundarb/logging.hpp>
#include <fundarb/memory_store.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>

using namespace fundarb;

// ============================================
// Global state
// ============================================

std::atomic<bool> g_stop{false};

void signal_handler(int) {
    g_stop.store(true);
}

// ============================================
// Paper market
// ============================================

struct SeedMarket {
    const char* symbol;
    double mid;
    double leg1_rate_hourly;
    double leg2_rate_hourly;
};

void seed(adapters::PaperExchange& ex, const SeedMarket& m, double rate, double half_spread) {
    const Decimal depth = Decimal::from_int(50);
    ex.set_l1(m.symbol, Decimal::from_double(m.mid - half_spread), depth,
              Decimal::from_double(m.mid + half_spread), depth);
    ex.set_funding_rate(m.symbol, Decimal::from_double(rate));
    ex.set_balance(Decimal::from_int(10000));
}

int main(int argc, char* argv[]) {
    const std::string path = argc > 1 ? argv[1] : "config/funding_bot.toml";

    Config config;
    try {
        config = Config::from_file(path);
        config.validate();
        init_logging(config.general);
    } catch (const ConfigError& e) {
        std::cerr << "Invalid configuration " << path << ": " << e.what() << std::endl;
        return 1;
    }

    auto leg1 = std::make_shared<adapters::PaperExchange>(config.general.leg1_venue,
                                                          config.fees_for(config.general.leg1_venue));
    auto leg2 = std::make_shared<adapters::PaperExchange>(config.general.leg2_venue,
                                                          config.fees_for(config.general.leg2_venue));

    const SeedMarket markets[] = {
        {"BTC", 65000.0, 0.00002, 0.00009},
        {"ETH", 3200.0, -0.00001, 0.00006},
        {"SOL", 150.0, 0.00004, 0.00005},
    };
    for (const auto& m : markets) {
        seed(*leg1, m, m.leg1_rate_hourly, m.mid * 0.0001);
        seed(*leg2, m, m.leg2_rate_hourly, m.mid * 0.0001);
    }

    auto store = std::make_shared<MemoryTradeStore>(config.general.journal_path);
    if (!config.general.journal_path.empty()) {
        int recovered = store->replay_journal();
        spdlog::info("Recovered {} trades from {}", recovered, config.general.journal_path);
    }

    NotificationPtr notifier;
    if (config.notification.enabled) {
        notifier = std::make_shared<adapters::WebhookNotifier>(config.notification);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        TradingBot bot(config, leg1, leg2, store, notifier);
        bot.start();

        // Signal handlers cannot touch the bot, so a watcher relays the flag
        std::thread watcher([&bot] {
            while (!g_stop.load() && !bot.shutdown_signal().requested()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            bot.shutdown_signal().request();
        });

        bot.wait();
        watcher.join();
        bot.stop();

        BotStatus s = bot.status();
        spdlog::info("Final: {} trades, {} closed, pnl {}, funding {}, fees {}", s.stats.total_trades,
                     s.stats.closed_trades, s.stats.total_pnl.to_string(), s.stats.total_funding.to_string(),
                     s.stats.total_fees.to_string());
    } catch (const DomainError& e) {
        spdlog::critical("Fatal: {}", e.what());
        return 1;
    }
    return 0;
}
