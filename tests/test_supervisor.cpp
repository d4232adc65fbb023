// Funding Arb Engine - Supervisor Tests

#include <catch2/catch_test_macros.hpp>
#include <fundarb/errors.hpp>
#include <fundarb/event_bus.hpp>
#include <fundarb/supervisor.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace fundarb;

namespace {

SupervisorConfig fast_config() {
    SupervisorConfig cfg;
    cfg.backoff_base_ms = 1;
    cfg.backoff_cap_ms = 10;
    return cfg;
}

// Polls until pred holds or two seconds pass
template <typename Pred>
bool eventually(Pred pred) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

}  // namespace

TEST_CASE("Failed loops restart with backoff", "[supervisor]") {
    auto bus = std::make_shared<EventBus>();
    std::mutex mutex;
    std::vector<std::string> incidents;
    bus->subscribe<AlertEvent>([&](const AlertEvent& e) {
        std::lock_guard<std::mutex> lock(mutex);
        incidents.push_back(e.details.at("incident"));
    });

    ShutdownSignal shutdown;
    Supervisor sup(bus, shutdown, fast_config());

    std::atomic<int> calls{0};
    std::atomic<int> healthy{0};
    sup.add_loop("entries", std::chrono::milliseconds(1), [&] {
        if (++calls <= 2) throw ExchangeError("venue down", true, "x10");
        ++healthy;
    });
    sup.start();
    REQUIRE(sup.is_running());
    REQUIRE_THROWS_AS(sup.add_loop("late", std::chrono::milliseconds(1), [] {}), ValidationError);

    REQUIRE(eventually([&] { return healthy.load() >= 3; }));
    sup.shutdown();

    REQUIRE_FALSE(sup.is_running());
    REQUIRE(shutdown.requested());
    REQUIRE(sup.restarts("entries") == 2);
    REQUIRE(sup.restarts("unknown") == 0);

    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(incidents == std::vector<std::string>{"loop_restart:entries", "loop_restart:entries"});
}

TEST_CASE("Shutdown stops idle loops promptly", "[supervisor]") {
    ShutdownSignal shutdown;
    Supervisor sup(nullptr, shutdown, fast_config());

    std::atomic<int> calls{0};
    sup.add_loop("heartbeat", std::chrono::hours(1), [&] { ++calls; });
    sup.start();
    REQUIRE(eventually([&] { return calls.load() == 1; }));

    auto begin = std::chrono::steady_clock::now();
    sup.shutdown();
    REQUIRE(std::chrono::steady_clock::now() - begin < std::chrono::seconds(1));
    REQUIRE(calls.load() == 1);
}

TEST_CASE("Hedge incidents pause entries until acknowledged", "[supervisor]") {
    auto bus = std::make_shared<EventBus>();
    ShutdownSignal shutdown;
    Supervisor sup(bus, shutdown, fast_config());

    SECTION("Entry-time broken hedge does not pause") {
        BrokenHedgeDetected e;
        e.trade_id = "t1";
        e.symbol = "BTC";
        e.source = "execution";
        bus->publish(e);
        REQUIRE_FALSE(sup.entries_paused());
    }

    SECTION("Monitored broken hedge pauses") {
        BrokenHedgeDetected e;
        e.trade_id = "t1";
        e.symbol = "BTC";
        e.source = "position_monitor";
        bus->publish(e);
        REQUIRE(sup.entries_paused());
        REQUIRE(sup.pause_reason() == "broken hedge on BTC (t1)");

        // First reason is kept
        RollbackCompleted r;
        r.trade_id = "t2";
        r.symbol = "ETH";
        bus->publish(r);
        REQUIRE(sup.pause_reason() == "broken hedge on BTC (t1)");

        sup.acknowledge();
        REQUIRE_FALSE(sup.entries_paused());
        REQUIRE(sup.pause_reason().empty());
    }

    SECTION("Failed rollback pauses, a clean one does not") {
        RollbackCompleted r;
        r.trade_id = "t2";
        r.symbol = "ETH";
        r.success = true;
        bus->publish(r);
        REQUIRE_FALSE(sup.entries_paused());

        r.success = false;
        bus->publish(r);
        REQUIRE(sup.entries_paused());
        REQUIRE(sup.pause_reason() == "rollback failed on ETH (t2)");
    }
}

TEST_CASE("Destroyed supervisor leaves the bus", "[supervisor]") {
    auto bus = std::make_shared<EventBus>();
    ShutdownSignal shutdown;
    {
        Supervisor sup(bus, shutdown, fast_config());
        REQUIRE(bus->subscriber_count() == 2);
    }
    REQUIRE(bus->subscriber_count() == 0);

    RollbackCompleted r;
    r.trade_id = "t1";
    r.symbol = "BTC";
    bus->publish(r);
    REQUIRE(bus->published() == 1);
}
