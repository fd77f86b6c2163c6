#include "FlightExecutor.hpp"
#include "../Config/Config.hpp"
#include <spdlog/spdlog.h>

FlightExecutor& FlightExecutor::getInstance() {
    static FlightExecutor instance(configuredThreads());
    return instance;
}

std::size_t FlightExecutor::configuredThreads() {
    const auto& config = Config::getInstance();
    if (!config.isValid()) {
        spdlog::warn("[FlightExecutor] Configuration invalid ({}), using 1 worker thread",
                     config.getError());
        return 1;
    }
    return config.getExecutorThreads();
}

FlightExecutor::FlightExecutor(std::size_t threads)
    : threads_(threads),
      pool_(threads) {
    spdlog::info("[FlightExecutor] Started with {} worker threads", threads_);
}

FlightExecutor::~FlightExecutor() {
    pool_.join();
    spdlog::debug("[FlightExecutor] All worker threads joined");
}
