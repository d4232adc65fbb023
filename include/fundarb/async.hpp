// Funding Arb Engine - Async Helpers
// Shutdown signalling, bounded future waits and retry with backoff

#pragma once

#include <fundarb/errors.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>
#include <string>

namespace fundarb {

// Process-wide stop request; waits on it wake immediately once set
class ShutdownSignal {
public:
    ShutdownSignal() = default;

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    void request() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requested_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool requested() const noexcept {
        return requested_.load(std::memory_order_acquire);
    }

    // Returns false if woken by shutdown
    bool sleep_for(std::chrono::milliseconds duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, duration, [this] { return requested(); });
    }

    // Throws CancelledError if shutdown was requested
    void check(const std::string& where) const {
        if (requested()) throw CancelledError("Shutdown requested during " + where);
    }

private:
    std::atomic<bool> requested_{false};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

namespace detail {

constexpr auto kWaitSlice = std::chrono::milliseconds(50);

// Waits for the future in slices; returns false on timeout
template <typename T>
bool wait_bounded(std::future<T>& fut, std::chrono::milliseconds timeout,
                  const ShutdownSignal* shutdown, const std::string& what) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;
        auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, kWaitSlice);
        if (fut.wait_for(slice) == std::future_status::ready) return true;
        if (shutdown) shutdown->check(what);
    }
}

}  // namespace detail

// Await a venue read. A timeout becomes a retryable ExchangeError.
template <typename T>
T await_future(std::future<T> fut, std::chrono::milliseconds timeout,
               const std::string& what, const std::string& venue = {},
               const ShutdownSignal* shutdown = nullptr) {
    if (!fut.valid()) {
        throw ExchangeError(what + ": no result", false, venue);
    }
    if (!detail::wait_bounded(fut, timeout, shutdown, what)) {
        throw ExchangeError(what + " timed out after " + std::to_string(timeout.count()) + "ms",
                            true, venue, "CALL_TIMEOUT");
    }
    return fut.get();
}

// Await an order placement. A timeout is ambiguous (the order may be live)
// so it is never retried blindly.
template <typename T>
T await_order(std::future<T> fut, std::chrono::milliseconds timeout,
              const std::string& symbol, const std::string& venue,
              const ShutdownSignal* shutdown = nullptr) {
    if (!fut.valid()) {
        throw OrderRejectedError("Order submission returned no result", symbol, venue);
    }
    if (!detail::wait_bounded(fut, timeout, shutdown, "order on " + venue)) {
        throw OrderTimeoutError("Order on " + venue + " timed out after " +
                                std::to_string(timeout.count()) + "ms", symbol, venue);
    }
    return fut.get();
}

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds base_delay{200};
    std::chrono::milliseconds max_delay{5000};

    [[nodiscard]] std::chrono::milliseconds delay_for(int attempt) const noexcept {
        auto d = base_delay * (int64_t{1} << std::min(attempt, 16));
        return std::min(d, max_delay);
    }
};

// Runs fn, retrying retryable ExchangeErrors with exponential backoff
template <typename Fn>
auto with_retry(const RetryPolicy& policy, const std::string& what, Fn&& fn,
                ShutdownSignal* shutdown = nullptr) -> decltype(fn()) {
    int attempts = std::max(1, policy.max_attempts);
    for (int attempt = 0;; ++attempt) {
        try {
            return fn();
        } catch (const ExchangeError& e) {
            if (!e.retryable() || attempt + 1 >= attempts) throw;
            auto delay = policy.delay_for(attempt);
            spdlog::warn("{} failed (attempt {}/{}): {}; retrying in {}ms",
                         what, attempt + 1, attempts, e.what(), delay.count());
            if (shutdown) {
                if (!shutdown->sleep_for(delay)) {
                    throw CancelledError("Shutdown requested while retrying " + what);
                }
            } else {
                std::this_thread::sleep_for(delay);
            }
        }
    }
}

// Restart delay for supervised loops: base, 2x base, 4x base ... capped
class Backoff {
public:
    Backoff(std::chrono::milliseconds base, std::chrono::milliseconds cap)
        : base_(base), cap_(cap) {}

    [[nodiscard]] std::chrono::milliseconds next() noexcept {
        auto d = base_ * (int64_t{1} << std::min(failures_, 20));
        ++failures_;
        return std::min(d, cap_);
    }

    void reset() noexcept { failures_ = 0; }
    [[nodiscard]] int failures() const noexcept { return failures_; }

private:
    std::chrono::milliseconds base_;
    std::chrono::milliseconds cap_;
    int failures_ = 0;
};

}  // namespace fundarb
