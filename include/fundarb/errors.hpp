// Funding Arb Engine - Error Taxonomy
// Every failure the engine raises derives from DomainError

#pragma once

#include <fundarb/types.hpp>
#include <stdexcept>
#include <string>

namespace fundarb {

// Base error with a stable code plus the symbol and venue it concerns
class DomainError : public std::runtime_error {
public:
    explicit DomainError(const std::string& msg,
                         std::string code = "DOMAIN_ERROR",
                         std::string symbol = {},
                         std::string venue = {})
        : std::runtime_error(msg),
          code_(std::move(code)),
          symbol_(std::move(symbol)),
          venue_(std::move(venue)) {}

    [[nodiscard]] const std::string& code() const noexcept { return code_; }
    [[nodiscard]] const std::string& symbol() const noexcept { return symbol_; }
    [[nodiscard]] const std::string& venue() const noexcept { return venue_; }

private:
    std::string code_;
    std::string symbol_;
    std::string venue_;
};

class ValidationError : public DomainError {
public:
    explicit ValidationError(const std::string& msg, std::string symbol = {})
        : DomainError(msg, "VALIDATION_ERROR", std::move(symbol)) {}
};

class ConfigError : public DomainError {
public:
    explicit ConfigError(const std::string& msg) : DomainError(msg, "CONFIG_ERROR") {}
};

class InsufficientBalanceError : public DomainError {
public:
    InsufficientBalanceError(const std::string& msg, Decimal required, Decimal available,
                             std::string venue = {})
        : DomainError(msg, "INSUFFICIENT_BALANCE", {}, std::move(venue)),
          required_(required), available_(available) {}

    [[nodiscard]] Decimal required() const noexcept { return required_; }
    [[nodiscard]] Decimal available() const noexcept { return available_; }

private:
    Decimal required_;
    Decimal available_;
};

class OrderRejectedError : public DomainError {
public:
    explicit OrderRejectedError(const std::string& msg, std::string symbol = {}, std::string venue = {})
        : DomainError(msg, "ORDER_REJECTED", std::move(symbol), std::move(venue)) {}
};

class OrderTimeoutError : public DomainError {
public:
    explicit OrderTimeoutError(const std::string& msg, std::string symbol = {}, std::string venue = {})
        : DomainError(msg, "ORDER_TIMEOUT", std::move(symbol), std::move(venue)) {}
};

// Venue I/O failure; retryable errors may be retried with backoff
class ExchangeError : public DomainError {
public:
    explicit ExchangeError(const std::string& msg, bool retryable = true,
                           std::string venue = {}, std::string code = "EXCHANGE_ERROR")
        : DomainError(msg, std::move(code), {}, std::move(venue)), retryable_(retryable) {}

    [[nodiscard]] bool retryable() const noexcept { return retryable_; }

private:
    bool retryable_;
};

class RateLimitError : public ExchangeError {
public:
    explicit RateLimitError(const std::string& msg, std::string venue = {})
        : ExchangeError(msg, true, std::move(venue), "RATE_LIMITED") {}
};

class ExecutionError : public DomainError {
public:
    explicit ExecutionError(const std::string& msg, std::string symbol = {},
                            std::string code = "EXECUTION_ERROR")
        : DomainError(msg, std::move(code), std::move(symbol)) {}
};

// Leg 1 filled too little to hedge; local rollback already attempted
class Leg1FailedError : public ExecutionError {
public:
    explicit Leg1FailedError(const std::string& msg, std::string symbol = {})
        : ExecutionError(msg, std::move(symbol), "LEG1_FAILED") {}
};

// Hedge leg failed while leg 1 was live
class Leg2FailedError : public ExecutionError {
public:
    explicit Leg2FailedError(const std::string& msg, std::string symbol = {})
        : ExecutionError(msg, std::move(symbol), "LEG2_FAILED") {}
};

// Compensation itself failed; exposure may remain and trading must pause
class RollbackError : public ExecutionError {
public:
    explicit RollbackError(const std::string& msg, std::string symbol = {})
        : ExecutionError(msg, std::move(symbol), "ROLLBACK_FAILED") {}
};

class ReconciliationError : public DomainError {
public:
    explicit ReconciliationError(const std::string& msg, std::string symbol = {})
        : DomainError(msg, "RECONCILIATION_ERROR", std::move(symbol)) {}
};

// Raised at interruptible wait points once shutdown has been requested
class CancelledError : public DomainError {
public:
    explicit CancelledError(const std::string& msg) : DomainError(msg, "CANCELLED") {}
};

}  // namespace fundarb
