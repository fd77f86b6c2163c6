#pragma once

#include "Outcome.hpp"

#include <spdlog/spdlog.h>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

// Bookkeeping for one in-flight execution. The outcome is written once by
// the executor and read by every attached caller after completion.
template <typename T>
class Flight {
public:
    using Callback = std::function<void(const Outcome<T>&)>;

    Flight() = default;
    ~Flight() = default;

    Flight(const Flight&) = delete;
    Flight& operator=(const Flight&) = delete;

    // waiters_ and forgotten_ are guarded by the owning group's mutex.
    void attach() { waiters_++; }
    int waiters() const { return waiters_; }
    void markForgotten() { forgotten_ = true; }
    bool forgotten() const { return forgotten_; }

    void finish(Outcome<T> outcome) {
        std::vector<Callback> callbacks_to_notify;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (outcome_.has_value()) {
                throw std::logic_error("[Flight] finish called on a completed flight");
            }
            outcome_.emplace(std::move(outcome));
            callbacks_to_notify.swap(callbacks_);
        }
        ready_.notify_all();

        for (auto& callback : callbacks_to_notify) {
            notify(callback);
        }
    }

    const Outcome<T>& await() const {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this] { return outcome_.has_value(); });
        return *outcome_;
    }

    template <typename Rep, typename Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return ready_.wait_for(lock, timeout, [this] { return outcome_.has_value(); });
    }

    bool done() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outcome_.has_value();
    }

    // Runs on the finishing thread, or right away if already finished.
    void onFinish(Callback callback) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!outcome_.has_value()) {
                callbacks_.push_back(std::move(callback));
                return;
            }
        }
        notify(callback);
    }

private:
    void notify(Callback& callback) const {
        try {
            callback(*outcome_);
        } catch (const std::exception& e) {
            spdlog::error("[Flight] Callback error: {}", e.what());
        }
    }

    mutable std::mutex mutex_;
    mutable std::condition_variable ready_;
    std::optional<Outcome<T>> outcome_;
    std::vector<Callback> callbacks_;

    int waiters_ = 1;
    bool forgotten_ = false;
};
