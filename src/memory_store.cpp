// Funding Arb Engine - In-Memory Trade Store Implementation

#include <fundarb/memory_store.hpp>
#include <fundarb/errors.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace fundarb {

using json = nlohmann::json;

namespace {

bool holds_symbol(const Trade& t) {
    return !is_terminal(t.status);
}

}  // namespace

MemoryTradeStore::MemoryTradeStore(std::string journal_path)
    : journal_path_(std::move(journal_path)) {}

void MemoryTradeStore::check_symbol_free(const Trade& trade) const {
    for (const auto& [id, existing] : trades_) {
        if (id != trade.id && existing.symbol == trade.symbol && holds_symbol(existing)) {
            throw ValidationError("Symbol " + trade.symbol + " already has active trade " + id +
                                  " (" + to_string(existing.status) + ")", trade.symbol);
        }
    }
}

void MemoryTradeStore::create_trade(const Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (trade.id.empty()) {
        throw ValidationError("Trade id must not be empty", trade.symbol);
    }
    if (trades_.count(trade.id) != 0) {
        throw ValidationError("Duplicate trade id " + trade.id, trade.symbol);
    }
    if (holds_symbol(trade)) {
        check_symbol_free(trade);
    }

    trades_.emplace(trade.id, trade);
    journal_trade(trade);
    spdlog::debug("Trade {} created for {} ({})", trade.id, trade.symbol, to_string(trade.status));
}

void MemoryTradeStore::update_trade(const Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trades_.find(trade.id);
    if (it == trades_.end()) {
        throw ValidationError("Unknown trade " + trade.id, trade.symbol);
    }
    if (holds_symbol(trade)) {
        check_symbol_free(trade);
    }
    it->second = trade;
    journal_trade(trade);
}

std::optional<Trade> MemoryTradeStore::modify_trade(const std::string& trade_id,
                                                    const TradeMutator& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trades_.find(trade_id);
    if (it == trades_.end()) return std::nullopt;

    // Mutate a copy so a throwing mutator leaves the stored trade intact
    Trade working = it->second;
    if (!mutator(working)) {
        return it->second;
    }
    if (working.id != trade_id) {
        throw ValidationError("Mutator must not change trade id " + trade_id, working.symbol);
    }
    if (holds_symbol(working)) {
        check_symbol_free(working);
    }

    it->second = std::move(working);
    journal_trade(it->second);
    return it->second;
}

std::optional<Trade> MemoryTradeStore::get_trade(const std::string& trade_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trades_.find(trade_id);
    if (it == trades_.end()) return std::nullopt;
    return it->second;
}

std::vector<Trade> MemoryTradeStore::list_open_trades() const {
    std::vector<Trade> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, t] : trades_) {
            if (!is_terminal(t.status)) out.push_back(t);
        }
    }
    std::sort(out.begin(), out.end(),
              [](const Trade& a, const Trade& b) { return a.created_at < b.created_at; });
    return out;
}

std::vector<Trade> MemoryTradeStore::list_trades(std::optional<TradeStatus> status, size_t limit) const {
    std::vector<Trade> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, t] : trades_) {
            if (!status || t.status == *status) out.push_back(t);
        }
    }

    // Newest first
    std::sort(out.begin(), out.end(),
              [](const Trade& a, const Trade& b) { return a.created_at > b.created_at; });
    if (limit > 0 && out.size() > limit) out.resize(limit);
    return out;
}

void MemoryTradeStore::append_event(const Event& event) {
    json line{{"kind", "event"}, {"data", event.to_json()}};
    std::string text = line.dump();

    std::lock_guard<std::mutex> lock(mutex_);
    ++event_count_;
    events_.push_back(text);
    while (events_.size() > kMaxEventsKept) events_.pop_front();
    journal_line(text);
}

StoreStats MemoryTradeStore::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StoreStats s;
    s.events = event_count_;
    for (const auto& [id, t] : trades_) {
        ++s.total_trades;
        if (t.status == TradeStatus::Closed) {
            ++s.closed_trades;
            s.total_pnl += t.total_pnl();
            s.total_funding += t.funding_collected;
            s.total_fees += t.total_fees();
            if (t.total_pnl().is_positive()) ++s.winning_trades;
        } else if (t.status == TradeStatus::Aborted) {
            ++s.aborted_trades;
            s.total_pnl += t.realized_pnl;
            s.total_fees += t.total_fees();
        } else {
            ++s.open_trades;
        }
    }
    return s;
}

int MemoryTradeStore::cleanup_closed(int64_t older_than_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    int removed = 0;
    for (auto it = trades_.begin(); it != trades_.end();) {
        const Trade& t = it->second;
        if (is_terminal(t.status) && t.closed_at != 0 && t.closed_at < older_than_ms) {
            it = trades_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        spdlog::info("Removed {} closed trades older than {}", removed, older_than_ms);
    }
    return removed;
}

int MemoryTradeStore::replay_journal() {
    if (journal_path_.empty()) return 0;

    std::ifstream in{journal_path_};
    if (!in.is_open()) {
        spdlog::info("No trade journal at {}; starting empty", journal_path_);
        return 0;
    }

    std::unordered_map<std::string, Trade> recovered;
    int events = 0;
    int line_no = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;
        try {
            auto j = json::parse(line);
            const auto kind = j.at("kind").get<std::string>();
            if (kind == "trade") {
                auto trade = j.at("data").get<Trade>();
                recovered[trade.id] = std::move(trade);
            } else if (kind == "event") {
                ++events;
            }
        } catch (const json::exception& e) {
            // A torn final write is expected after a crash
            spdlog::warn("Skipping unreadable journal line {} in {}: {}", line_no, journal_path_, e.what());
        } catch (const std::invalid_argument& e) {
            spdlog::warn("Skipping journal line {} with bad decimal: {}", line_no, e.what());
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    trades_ = std::move(recovered);
    event_count_ = events;

    int open = 0;
    for (const auto& [id, t] : trades_) {
        if (!is_terminal(t.status)) ++open;
    }
    spdlog::info("Replayed journal {}: {} trades ({} open), {} events",
                 journal_path_, trades_.size(), open, events);
    return static_cast<int>(trades_.size());
}

std::vector<std::string> MemoryTradeStore::recent_events(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = std::min(limit, events_.size());
    return std::vector<std::string>(events_.end() - static_cast<std::ptrdiff_t>(n), events_.end());
}

void MemoryTradeStore::journal_trade(const Trade& trade) {
    if (journal_path_.empty()) return;
    json line{{"kind", "trade"}, {"data", trade}};
    journal_line(line.dump());
}

void MemoryTradeStore::journal_line(const std::string& line) {
    if (journal_path_.empty()) return;
    if (!journal_.is_open()) {
        journal_.open(journal_path_, std::ios::app);
        if (!journal_.is_open()) {
            throw DomainError("Cannot open trade journal " + journal_path_, "JOURNAL_ERROR");
        }
    }
    journal_ << line << '\n';
    journal_.flush();
}

}  // namespace fundarb
