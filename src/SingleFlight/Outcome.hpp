#pragma once

#include "FlightError.hpp"

#include <exception>
#include <optional>
#include <string>
#include <utility>

// Value or error produced by one execution of a work procedure.
template <typename T>
class Outcome {
public:
    enum class Status {
        OK,
        FAILED,
        FAULTED
    };

    static Outcome success(T value) {
        Outcome outcome(Status::OK);
        outcome.value_.emplace(std::move(value));
        return outcome;
    }

    static Outcome failure(std::exception_ptr error) {
        Outcome outcome(Status::FAILED);
        outcome.error_ = error ? std::move(error)
                               : std::make_exception_ptr(FlightError("unspecified failure"));
        return outcome;
    }

    static Outcome failure(const std::string& message) {
        return failure(std::make_exception_ptr(FlightError(message)));
    }

    static Outcome fault(std::exception_ptr cause) {
        Outcome outcome(Status::FAULTED);
        outcome.error_ = std::make_exception_ptr(WorkFault(std::move(cause)));
        return outcome;
    }

    Status status() const { return status_; }
    bool ok() const { return status_ == Status::OK; }
    bool faulted() const { return status_ == Status::FAULTED; }

    // Rethrows the stored error when the outcome is not OK.
    const T& value() const {
        if (!ok()) {
            std::rethrow_exception(error_);
        }
        return *value_;
    }

    std::exception_ptr error() const { return error_; }
    std::string errorMessage() const { return describeError(error_); }

private:
    explicit Outcome(Status status) : status_(status) {}

    Status status_;
    std::optional<T> value_;
    std::exception_ptr error_;
};
