#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include "errors.h"

namespace txguard {

// Counts detached calls that have not finished yet, including ones nobody
// waits for any more.
class CallBudget {
public:
    explicit CallBudget(std::size_t limit) : limit_(limit) {}

    bool try_acquire() {
        if (in_flight_.fetch_add(1) >= limit_) {
            in_flight_.fetch_sub(1);
            return false;
        }
        return true;
    }
    void release() { in_flight_.fetch_sub(1); }

    std::size_t in_flight() const { return in_flight_.load(); }
    std::size_t limit() const { return limit_; }

private:
    const std::size_t limit_;
    std::atomic<std::size_t> in_flight_{0};
};

// Runs fn on a detached thread and returns a future for its result. The
// caller may stop waiting at any time; fn still runs to completion, so
// anything it captures must be owned by the closure. The budget slot is
// given back before the future becomes ready.
// Throws Overloaded when the budget is spent, std::system_error when no
// thread can be started.
template <typename Fn, typename R = decltype(std::declval<Fn&>()())>
std::future<R> launch_detached(std::shared_ptr<CallBudget> budget, Fn fn, const std::string& what) {
    if (!budget->try_acquire()) {
        throw Overloaded(what + ": " + std::to_string(budget->limit()) + " calls already in flight");
    }
    auto promise = std::make_shared<std::promise<R>>();
    std::future<R> result = promise->get_future();
    try {
        std::thread([budget, promise, fn]() mutable {
            std::optional<R> value;
            std::exception_ptr error;
            try {
                value.emplace(fn());
            } catch (...) {
                error = std::current_exception();
            }
            budget->release();
            if (error) promise->set_exception(error);
            else promise->set_value(std::move(*value));
        }).detach();
    } catch (...) {
        budget->release();
        throw;
    }
    return result;
}

// Waits until the deadline and returns the value, rethrowing whatever fn
// threw. Throws Timeout if the deadline passes first.
template <typename R>
R await_until(std::future<R>& f, std::chrono::steady_clock::time_point deadline, const std::string& what) {
    if (f.wait_until(deadline) != std::future_status::ready) throw Timeout(what + " timed out");
    return f.get();
}

} // namespace txguard
