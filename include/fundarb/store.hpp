// Funding Arb Engine - Trade Store Port
// The store is the single source of truth for trade state

#pragma once

#include <fundarb/events.hpp>
#include <fundarb/models.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fundarb {

struct StoreStats {
    int total_trades = 0;
    int open_trades = 0;
    int closed_trades = 0;
    int aborted_trades = 0;
    int winning_trades = 0;
    Decimal total_pnl;
    Decimal total_funding;
    Decimal total_fees;
    int events = 0;
};

// Mutator applied under the store lock; return false to leave the trade untouched
using TradeMutator = std::function<bool(Trade&)>;

class TradeStorePort {
public:
    virtual ~TradeStorePort() = default;

    // Throws ValidationError if the symbol already has an active trade
    virtual void create_trade(const Trade& trade) = 0;

    // Replaces the stored copy; throws ValidationError for an unknown id
    virtual void update_trade(const Trade& trade) = 0;

    // Serialized read-modify-write. Returns the stored trade after the mutator
    // ran, or nullopt when the id is unknown.
    virtual std::optional<Trade> modify_trade(const std::string& trade_id, const TradeMutator& mutator) = 0;

    [[nodiscard]] virtual std::optional<Trade> get_trade(const std::string& trade_id) const = 0;

    // PENDING, OPENING, OPEN and CLOSING trades
    [[nodiscard]] virtual std::vector<Trade> list_open_trades() const = 0;

    [[nodiscard]] virtual std::vector<Trade> list_trades(std::optional<TradeStatus> status = std::nullopt,
                                                         size_t limit = 0) const = 0;

    virtual void append_event(const Event& event) = 0;

    [[nodiscard]] virtual StoreStats stats() const = 0;

    // Drops terminal trades closed before the cutoff; returns how many were removed
    virtual int cleanup_closed(int64_t older_than_ms) = 0;
};

using TradeStorePtr = std::shared_ptr<TradeStorePort>;

}  // namespace fundarb
