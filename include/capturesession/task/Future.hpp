#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace CS {

/**
 * SharedState<T>: typed shared state for asynchronous results.
 *
 * Stores a single value of type T, supports readiness checks and blocking waits.
 * Thread-safe: multiple waiters permitted; first set_value "wins".
 */
template <typename T>
class SharedState final {
public:
    SharedState() = default;

    SharedState(SharedState const&)            = delete;
    SharedState& operator=(SharedState const&) = delete;

    [[nodiscard]] bool ready() const {
        std::scoped_lock<std::mutex> lg(mutex_);
        return value_.has_value();
    }

    void wait() const {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return value_.has_value(); });
    }

    bool wait_until(std::chrono::time_point<std::chrono::steady_clock> deadline) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_until(lock, deadline, [&] { return value_.has_value(); });
    }

    // Set the result if not already set; returns true on first successful set.
    bool set_value(T v) {
        {
            std::scoped_lock<std::mutex> lg(mutex_);
            if (value_.has_value())
                return false;
            value_.emplace(std::move(v));
        }
        cv_.notify_all();
        return true;
    }

    // Copy of the stored value, std::nullopt if not ready.
    std::optional<T> get() const {
        std::scoped_lock<std::mutex> lg(mutex_);
        return value_;
    }

private:
    mutable std::mutex              mutex_;
    mutable std::condition_variable cv_;
    std::optional<T>                value_;
};

/**
 * FutureT<T>: typed future backed by SharedState<T>.
 */
template <typename T>
class FutureT {
public:
    FutureT() = default;
    explicit FutureT(std::shared_ptr<SharedState<T>> state)
        : state_(std::move(state)) {}

    [[nodiscard]] bool valid() const { return static_cast<bool>(state_); }
    [[nodiscard]] bool ready() const { return state_ ? state_->ready() : false; }

    void wait() const {
        if (state_)
            state_->wait();
    }

    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> const& d) const {
        return wait_until(std::chrono::steady_clock::now()
                          + std::chrono::duration_cast<std::chrono::steady_clock::duration>(d));
    }

    bool wait_until(std::chrono::time_point<std::chrono::steady_clock> deadline) const {
        return state_ ? state_->wait_until(deadline) : true;
    }

    // Non-blocking; std::nullopt if not ready or invalid.
    std::optional<T> try_get() const {
        return state_ ? state_->get() : std::nullopt;
    }

    // Blocking; std::nullopt only if invalid.
    std::optional<T> get() const {
        if (!state_)
            return std::nullopt;
        state_->wait();
        return state_->get();
    }

    std::shared_ptr<SharedState<T>> shared_state() const { return state_; }

private:
    std::shared_ptr<SharedState<T>> state_;
};

/**
 * PromiseT<T>: producer-side handle to fulfill a FutureT<T>.
 */
template <typename T>
class PromiseT {
public:
    PromiseT()
        : state_(std::make_shared<SharedState<T>>()) {}

    [[nodiscard]] FutureT<T> get_future() const {
        return FutureT<T>(state_);
    }

    bool set_value(T v) {
        return state_->set_value(std::move(v));
    }

    std::shared_ptr<SharedState<T>> shared_state() const { return state_; }

private:
    std::shared_ptr<SharedState<T>> state_;
};

// A future that is already resolved with value.
template <typename T>
[[nodiscard]] auto makeReadyFuture(T value) -> FutureT<T> {
    PromiseT<T> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

} // namespace CS
