// Funding Arb Engine - Alert Notifier Implementation

#include <fundarb/notifier.hpp>
#include <fundarb/errors.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace fundarb {

namespace {

std::string money(Decimal d) {
    return fmt::format("{:+.2f}", d.to_double());
}

std::string describe(const EventDetails& details) {
    std::string out;
    for (const auto& [k, v] : details) {
        if (k == "incident") continue;
        out += "\n" + k + ": " + v;
    }
    return out;
}

}  // namespace

AlertNotifier::AlertNotifier(NotificationPtr port, const NotificationConfig& config, ClockFn clock)
    : port_(std::move(port)),
      config_(config),
      min_level_(alert_level_from_string(config.min_level)),
      clock_(std::move(clock)) {
    if (!port_) throw ConfigError("AlertNotifier needs a notification port");
}

AlertNotifier::~AlertNotifier() {
    detach();
    stop();
}

void AlertNotifier::detach() {
    subscriptions_.clear();
}

void AlertNotifier::attach(EventBusPort& bus) {
    subscriptions_.push_back(bus.subscribe_scoped<AlertEvent>([this](const AlertEvent& e) {
        // An incident key is shared with the typed event for the same incident
        auto it = e.details.find("incident");
        std::string key = it != e.details.end() ? it->second : "alert:" + e.message;
        notify(key, e.level, e.message + describe(e.details));
    }));

    subscriptions_.push_back(bus.subscribe_scoped<BrokenHedgeDetected>([this](const BrokenHedgeDetected& e) {
        notify("broken_hedge:" + e.trade_id, AlertLevel::Critical,
               "BROKEN HEDGE " + e.symbol + ": missing leg on " + e.missing_venue + ", " +
               e.remaining_qty.to_string() + " unhedged (" + e.source + ")");
    }));

    subscriptions_.push_back(bus.subscribe_scoped<CircuitBreakerTripped>([this](const CircuitBreakerTripped& e) {
        notify("circuit_breaker", AlertLevel::Critical,
               "Circuit breaker tripped: " + e.reason + ". New entries paused.");
    }));

    subscriptions_.push_back(bus.subscribe_scoped<RollbackCompleted>([this](const RollbackCompleted& e) {
        if (e.success) return;
        notify("rollback:" + e.trade_id, AlertLevel::Critical,
               "ROLLBACK FAILED on " + e.symbol + " (" + e.trade_id + "). Exposure may remain.");
    }));

    subscriptions_.push_back(bus.subscribe_scoped<TradeOpened>([this](const TradeOpened& e) {
        notify("opened:" + e.trade_id, AlertLevel::Info,
               "Opened " + e.symbol + ": qty " + e.qty.to_string() + ", notional $" +
               e.notional_usd.to_string() + ", APY " + fmt::format("{:.1f}%", e.entry_apy.to_double() * 100.0));
    }));

    subscriptions_.push_back(bus.subscribe_scoped<TradeClosed>([this](const TradeClosed& e) {
        notify("closed:" + e.trade_id, AlertLevel::Info,
               "Closed " + e.symbol + " (" + e.reason + "): PnL " + money(e.realized_pnl) +
               ", funding " + money(e.funding_collected) + ", fees " + money(e.total_fees));
    }));
}

bool AlertNotifier::notify(const std::string& key, AlertLevel level, const std::string& text) {
    if (!config_.enabled || level < min_level_) return false;

    const int64_t now = clock_();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = last_sent_.find(key);
        if (it != last_sent_.end() && now - it->second < config_.throttle_ms) {
            ++suppressed_;
            spdlog::debug("Notification {} throttled", key);
            return false;
        }
        last_sent_[key] = now;
    }

    std::string message = format(level, text);
    if (running_.load()) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            queue_.push_back(std::move(message));
        }
        queue_cv_.notify_one();
    } else {
        deliver(message);
    }
    return true;
}

std::string AlertNotifier::format(AlertLevel level, const std::string& text) {
    const char* icon = level == AlertLevel::Critical ? "[CRITICAL] "
                     : level == AlertLevel::Warning  ? "[WARNING] "
                                                     : "";
    return std::string(icon) + text;
}

void AlertNotifier::deliver(const std::string& text) {
    try {
        if (port_->send_message(text)) {
            ++sent_;
        } else {
            ++failed_;
        }
    } catch (const std::exception& e) {
        ++failed_;
        spdlog::error("Notification delivery threw: {}", e.what());
    }
}

void AlertNotifier::start() {
    if (running_.exchange(true)) return;
    worker_ = std::make_unique<std::thread>(&AlertNotifier::worker_loop, this);
}

void AlertNotifier::stop() {
    if (!running_.exchange(false)) return;
    queue_cv_.notify_all();
    if (worker_ && worker_->joinable()) {
        worker_->join();
    }
    worker_.reset();
}

void AlertNotifier::worker_loop() {
    while (true) {
        std::string text;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !queue_.empty() || !running_.load(); });
            if (queue_.empty()) return;  // stopped and drained
            text = std::move(queue_.front());
            queue_.pop_front();
        }
        deliver(text);
    }
}

}  // namespace fundarb
