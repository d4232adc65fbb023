// Funding Arb Engine - In-Memory Trade Store
// Mutex-serialized TradeStorePort with an optional JSON-lines journal

#pragma once

#include <fundarb/store.hpp>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <unordered_map>

namespace fundarb {

class MemoryTradeStore : public TradeStorePort {
public:
    // An empty journal path keeps everything in memory only
    explicit MemoryTradeStore(std::string journal_path = {});

    MemoryTradeStore(const MemoryTradeStore&) = delete;
    MemoryTradeStore& operator=(const MemoryTradeStore&) = delete;

    void create_trade(const Trade& trade) override;
    void update_trade(const Trade& trade) override;
    std::optional<Trade> modify_trade(const std::string& trade_id, const TradeMutator& mutator) override;

    [[nodiscard]] std::optional<Trade> get_trade(const std::string& trade_id) const override;
    [[nodiscard]] std::vector<Trade> list_open_trades() const override;
    [[nodiscard]] std::vector<Trade> list_trades(std::optional<TradeStatus> status = std::nullopt,
                                                 size_t limit = 0) const override;

    void append_event(const Event& event) override;

    [[nodiscard]] StoreStats stats() const override;
    int cleanup_closed(int64_t older_than_ms) override;

    // Rebuilds state from the journal; returns the number of trades recovered
    int replay_journal();

    // Most recent events in JSON form, newest last
    [[nodiscard]] std::vector<std::string> recent_events(size_t limit = 100) const;

    [[nodiscard]] const std::string& journal_path() const noexcept { return journal_path_; }

private:
    void check_symbol_free(const Trade& trade) const;
    void journal_trade(const Trade& trade);
    void journal_line(const std::string& line);

    std::string journal_path_;
    std::ofstream journal_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Trade> trades_;
    std::deque<std::string> events_;
    int event_count_ = 0;

    static constexpr size_t kMaxEventsKept = 1000;
};

}  // namespace fundarb
