#pragma once

#include "Flight.hpp"
#include "Outcome.hpp"
#include "../Executor/FlightExecutor.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>

// Collapses concurrent calls sharing a key into one execution of the work.
// Every caller attached while the work runs receives the executor's outcome.
//
// Work is any callable taking no arguments and returning either T or
// Outcome<T>. A returned Outcome<T>::failure is delivered as is; an
// exception thrown by the work becomes a FAULTED outcome.
//
// The group must outlive every future returned by doNonblocking.
template <typename T, typename Key = std::string, typename Hash = std::hash<Key>>
class SingleFlight {
public:
    struct Result {
        Outcome<T> outcome;
        bool shared;
        bool executed;
    };

    SingleFlight() = default;
    ~SingleFlight() = default;

    SingleFlight(const SingleFlight&) = delete;
    SingleFlight& operator=(const SingleFlight&) = delete;

    SingleFlight(SingleFlight&&) = delete;
    SingleFlight& operator=(SingleFlight&&) = delete;

    template <typename Work>
    Result doCall(const Key& key, Work&& work) {
        std::unique_lock<std::mutex> lock(flights_mutex_);
        auto it = flights_.find(key);
        if (it != flights_.end()) {
            FlightPtr flight = it->second;
            flight->attach();
            int waiters = flight->waiters();
            lock.unlock();

            spdlog::debug("[SingleFlight] Waiting for key: {} ({} waiters)",
                          describeKey(key), waiters);
            return Result{flight->await(), true, false};
        }

        auto flight = std::make_shared<Flight<T>>();
        flights_.emplace(key, flight);
        lock.unlock();

        spdlog::debug("[SingleFlight] Leader for key: {}", describeKey(key));
        return execute(key, flight, work);
    }

    template <typename Work>
    std::future<Result> doNonblocking(const Key& key, Work work) {
        return doNonblocking(FlightExecutor::getInstance().executor(), key, std::move(work));
    }

    // Runs the work, if this call becomes the executor, on `executor`.
    template <typename Executor, typename Work>
    std::future<Result> doNonblocking(const Executor& executor, const Key& key, Work work) {
        auto promise = std::make_shared<std::promise<Result>>();
        std::future<Result> handle = promise->get_future();

        FlightPtr flight;
        bool is_new_flight = false;
        {
            std::lock_guard<std::mutex> lock(flights_mutex_);
            auto it = flights_.find(key);
            if (it != flights_.end()) {
                flight = it->second;
                flight->attach();
            } else {
                flight = std::make_shared<Flight<T>>();
                flights_.emplace(key, flight);
                is_new_flight = true;
            }
        }

        if (!is_new_flight) {
            spdlog::debug("[SingleFlight] Waiting asynchronously for key: {}", describeKey(key));
            flight->onFinish([promise](const Outcome<T>& outcome) {
                promise->set_value(Result{outcome, true, false});
            });
            return handle;
        }

        spdlog::debug("[SingleFlight] Leader for key: {} (non-blocking)", describeKey(key));
        boost::asio::post(executor, PendingWork<Work>(this, key, std::move(flight),
                                                      std::move(promise), std::move(work)));
        return handle;
    }

    // Later callers for `key` start a fresh execution. Callers already
    // attached still receive the outcome of the running one.
    void forget(const Key& key) {
        std::lock_guard<std::mutex> lock(flights_mutex_);
        auto it = flights_.find(key);
        if (it == flights_.end()) {
            return;
        }
        it->second->markForgotten();
        flights_.erase(it);
        spdlog::debug("[SingleFlight] Forgot key: {}", describeKey(key));
    }

    void clear() {
        std::lock_guard<std::mutex> lock(flights_mutex_);
        for (auto& entry : flights_) {
            entry.second->markForgotten();
        }
        flights_.clear();
        spdlog::info("[SingleFlight] All flights cleared");
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(flights_mutex_);
        return flights_.size();
    }

    bool inFlight(const Key& key) const {
        std::lock_guard<std::mutex> lock(flights_mutex_);
        return flights_.find(key) != flights_.end();
    }

    int waiterCount(const Key& key) const {
        std::lock_guard<std::mutex> lock(flights_mutex_);
        auto it = flights_.find(key);
        return it == flights_.end() ? 0 : it->second->waiters();
    }

private:
    using FlightPtr = std::shared_ptr<Flight<T>>;
    using PromisePtr = std::shared_ptr<std::promise<Result>>;

    // Executor side of a non-blocking call. If the executor drops it without
    // running it, the flight is still finished so attached callers wake up.
    template <typename Work>
    class PendingWork {
    public:
        PendingWork(SingleFlight* group, Key key, FlightPtr flight,
                    PromisePtr promise, Work work)
            : group_(group), key_(std::move(key)), flight_(std::move(flight)),
              promise_(std::move(promise)), work_(std::move(work)) {}

        PendingWork(PendingWork&&) = default;
        PendingWork& operator=(PendingWork&&) = delete;

        ~PendingWork() {
            if (!flight_) {
                return;
            }
            spdlog::warn("[SingleFlight] Work for key {} was discarded before it ran",
                         describeKey(key_));
            try {
                promise_->set_value(group_->complete(
                    key_, flight_, Outcome<T>::failure("work was discarded before it ran")));
            } catch (const std::exception& e) {
                spdlog::error("[SingleFlight] Failed to release discarded work: {}", e.what());
            }
        }

        void operator()() {
            FlightPtr flight = std::move(flight_);
            promise_->set_value(group_->execute(key_, flight, work_));
        }

    private:
        SingleFlight* group_;
        Key key_;
        FlightPtr flight_;
        PromisePtr promise_;
        Work work_;
    };

    template <typename Work>
    static Outcome<T> run(Work& work) {
        try {
            if constexpr (std::is_same_v<std::decay_t<std::invoke_result_t<Work&>>, Outcome<T>>) {
                return work();
            } else {
                return Outcome<T>::success(work());
            }
        } catch (...) {
            return Outcome<T>::fault(std::current_exception());
        }
    }

    template <typename Work>
    Result execute(const Key& key, const FlightPtr& flight, Work& work) {
        Outcome<T> outcome = run(work);
        if (outcome.faulted()) {
            spdlog::warn("[SingleFlight] Work for key {} faulted: {}",
                         describeKey(key), outcome.errorMessage());
        }
        return complete(key, flight, std::move(outcome));
    }

    Result complete(const Key& key, const FlightPtr& flight, Outcome<T> outcome) {
        flight->finish(std::move(outcome));

        int waiters = 0;
        {
            std::lock_guard<std::mutex> lock(flights_mutex_);
            if (!flight->forgotten()) {
                auto it = flights_.find(key);
                if (it != flights_.end() && it->second == flight) {
                    flights_.erase(it);
                }
            }
            waiters = flight->waiters();
        }

        spdlog::debug("[SingleFlight] Notified {} waiters for key: {}", waiters, describeKey(key));
        return Result{flight->await(), waiters > 1, true};
    }

    static std::string describeKey(const Key& key) {
        if constexpr (std::is_convertible_v<const Key&, std::string_view>) {
            return std::string(std::string_view(key));
        } else if constexpr (std::is_arithmetic_v<Key>) {
            return std::to_string(key);
        } else {
            return "<key>";
        }
    }

    std::unordered_map<Key, FlightPtr, Hash> flights_;
    mutable std::mutex flights_mutex_;
};
