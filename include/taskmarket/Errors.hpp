#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace taskmarket {

class MarketError : public std::runtime_error {
public:
    MarketError(std::string code, const std::string& message)
        : std::runtime_error("[" + code + "] " + message),
          code_(std::move(code)) {}

    [[nodiscard]] const std::string& code() const noexcept { return code_; }

private:
    std::string code_;
};

// Malformed header or result. Handled locally; no state change.
class ValidationError : public MarketError {
public:
    explicit ValidationError(const std::string& message)
        : MarketError("E_VALIDATION", message) {}
};

// A second result for a subtask that is already queued for delivery.
class DuplicateResultError : public MarketError {
public:
    explicit DuplicateResultError(const std::string& message)
        : MarketError("E_DUPLICATE_RESULT", message) {}
};

// A verification outcome for a subtask that was already resolved.
class AlreadyResolvedError : public MarketError {
public:
    explicit AlreadyResolvedError(const std::string& message)
        : MarketError("E_ALREADY_RESOLVED", message) {}
};

class PaymentError : public MarketError {
public:
    explicit PaymentError(const std::string& message)
        : MarketError("E_PAYMENT", message) {}
};

}  // namespace taskmarket
