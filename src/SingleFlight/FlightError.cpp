#include "FlightError.hpp"

#include <utility>

WorkFault::WorkFault(std::exception_ptr cause)
    : FlightError("work procedure faulted: " +
                  (cause ? describeError(cause) : std::string("unknown exception"))),
      cause_(std::move(cause)) {}

std::string describeError(std::exception_ptr error) {
    if (!error) {
        return "";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}
