// Funding Arb Engine - Reconciler
// Compares persisted trades with live venue positions and repairs drift

#pragma once

#include <fundarb/async.hpp>
#include <fundarb/config.hpp>
#include <fundarb/event_bus.hpp>
#include <fundarb/market_data.hpp>
#include <fundarb/models.hpp>
#include <fundarb/store.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fundarb {

inline constexpr const char* ACTION_ABORTED_ZOMBIE = "aborted_zombie";
inline constexpr const char* ACTION_MARKED_ZOMBIE = "marked_zombie";
inline constexpr const char* ACTION_CLOSED_CONFLICT = "closed_conflict";
inline constexpr const char* ACTION_ADOPTED_GHOST = "adopted_ghost";
inline constexpr const char* ACTION_CLOSED_ZOMBIE = "closed_zombie";
inline constexpr const char* ACTION_QUANTITY_MISMATCH = "quantity_mismatch";
inline constexpr const char* ACTION_RECOVERED_OPENING = "recovered_opening";

struct ReconcileAction {
    std::string symbol;
    std::string venue;
    std::string action;
    std::string trade_id;
    EventDetails details;
};

struct ReconcileResult {
    int trades_checked = 0;
    int positions_seen = 0;
    std::vector<ReconcileAction> actions;
    std::vector<std::string> errors;

    [[nodiscard]] bool ok() const noexcept { return errors.empty(); }

    [[nodiscard]] int count(std::string_view action) const noexcept {
        int n = 0;
        for (const auto& a : actions) {
            if (a.action == action) ++n;
        }
        return n;
    }
};

class Reconciler {
public:
    // True while an entry for the symbol is in flight
    using ExecutingFn = std::function<bool(const std::string& symbol)>;

    Reconciler(MarketDataService& market_data, TradeStorePtr store, EventBusPtr bus,
               const Config& config, ClockFn clock = now_ms);

    Reconciler(const Reconciler&) = delete;
    Reconciler& operator=(const Reconciler&) = delete;

    void set_executing_check(ExecutingFn fn) { executing_ = std::move(fn); }

    // One pass. At startup every OPENING trade is treated as stale.
    ReconcileResult reconcile(bool startup = false);

private:
    using PositionIndex = std::map<std::string, Position>;

    bool index_venue(const std::string& venue, PositionIndex& index, ReconcileResult& result);

    void check_opening(const Trade& trade, const Position* live1, const Position* live2,
                       bool startup, ReconcileResult& result);
    void check_open(const Trade& trade, const Position* live1, const Position* live2,
                    ReconcileResult& result);
    void check_quantity(const Trade& trade, const TradeLeg& leg, const Position& live,
                        ReconcileResult& result);
    void handle_ghosts(const PositionIndex& leg1, const PositionIndex& leg2,
                       const std::set<std::string>& claimed, ReconcileResult& result);
    bool adopt_ghost(const Position& leg1, const Position& leg2);

    // Reduce-only market order against a live position; true once confirmed flat
    bool flatten(const std::string& venue, const Position& live, const std::string& tag);
    [[nodiscard]] bool flatten_cooling_down(const std::string& venue, const std::string& symbol);
    void cancel_resting(const Trade& trade);

    void record(ReconcileResult& result, ReconcileAction action, bool dedupe = false);
    void close_record(const Trade& trade, const std::string& reason, ReconcileResult& result,
                      ReconcileAction action);

    MarketDataService& market_data_;
    TradeStorePtr store_;
    EventBusPtr bus_;
    const Config& config_;
    ClockFn clock_;
    std::chrono::milliseconds call_timeout_;
    RetryPolicy retry_;
    ExecutingFn executing_;

    std::mutex mutex_;
    std::set<std::string> reported_;               // dedupe keys of alert-only actions
    std::map<std::string, int64_t> last_flatten_;  // venue/symbol -> time
};

}  // namespace fundarb
