#pragma once

#include <boost/asio/thread_pool.hpp>
#include <cstddef>

// Worker pool that runs the executor side of non-blocking calls.
class FlightExecutor {
public:
    static FlightExecutor& getInstance();

    boost::asio::thread_pool::executor_type executor() {
        return pool_.get_executor();
    }

    std::size_t threadCount() const { return threads_; }

    FlightExecutor(const FlightExecutor&) = delete;
    FlightExecutor& operator=(const FlightExecutor&) = delete;

private:
    explicit FlightExecutor(std::size_t threads);
    ~FlightExecutor();

    static std::size_t configuredThreads();

    std::size_t threads_;
    boost::asio::thread_pool pool_;
};
