#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

enum class OutcomeStatus {
    kSuccess,
    kEmpty,     // Ran fine, nothing to report (no ink, no glyphs kept)
    kFailure
};

/**
 * @class Outcome
 * @brief Result of one pipeline stage: a value, an empty result, or a failure message.
 */
template <typename T>
class Outcome {
public:
    static Outcome Success(T value) {
        Outcome outcome(OutcomeStatus::kSuccess);
        outcome.value_ = std::move(value);
        return outcome;
    }

    static Outcome Empty() { return Outcome(OutcomeStatus::kEmpty); }

    static Outcome Failure(std::string message) {
        Outcome outcome(OutcomeStatus::kFailure);
        outcome.message_ = std::move(message);
        return outcome;
    }

    OutcomeStatus status() const { return status_; }
    bool ok() const { return status_ == OutcomeStatus::kSuccess; }
    bool empty() const { return status_ == OutcomeStatus::kEmpty; }
    bool failed() const { return status_ == OutcomeStatus::kFailure; }
    const std::string& message() const { return message_; }

    const T& value() const {
        if (!value_) throw std::logic_error("Outcome has no value: " + message_);
        return *value_;
    }

    T& value() {
        if (!value_) throw std::logic_error("Outcome has no value: " + message_);
        return *value_;
    }

    // Value on success, the given fallback otherwise.
    T value_or(T fallback) const { return value_ ? *value_ : std::move(fallback); }

private:
    explicit Outcome(OutcomeStatus status) : status_(status) {}

    OutcomeStatus status_;
    std::optional<T> value_;
    std::string message_;
};
