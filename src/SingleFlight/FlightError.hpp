#pragma once

#include <exception>
#include <stdexcept>
#include <string>

class FlightError : public std::runtime_error {
public:
    explicit FlightError(const std::string& message)
        : std::runtime_error(message) {}
};

// Raised in place of whatever a work procedure threw.
class WorkFault : public FlightError {
public:
    explicit WorkFault(std::exception_ptr cause);

    std::exception_ptr cause() const { return cause_; }

private:
    std::exception_ptr cause_;
};

std::string describeError(std::exception_ptr error);
