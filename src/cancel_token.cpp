#include "infer_bench/cancel_token.hpp"

#include <algorithm>

namespace infer_bench {

CancelToken::CancelToken(Clock::time_point deadline)
    : has_deadline_(true), deadline_(deadline) {}

void CancelToken::Cancel() noexcept {
    {
        std::lock_guard<std::mutex> lk(mu_);
        cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool CancelToken::IsCancelled() const noexcept {
    if (cancelled_.load(std::memory_order_acquire)) return true;
    return has_deadline_ && Clock::now() >= deadline_;
}

bool CancelToken::WaitFor(std::chrono::nanoseconds timeout) const {
    auto until = Clock::now() + timeout;
    if (has_deadline_) until = std::min(until, deadline_);
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_until(lk, until, [this] { return cancelled_.load(std::memory_order_acquire); });
    return IsCancelled();
}

void CancelToken::WaitUntilDone() const {
    std::unique_lock<std::mutex> lk(mu_);
    if (has_deadline_) {
        cv_.wait_until(lk, deadline_, [this] { return cancelled_.load(std::memory_order_acquire); });
    } else {
        cv_.wait(lk, [this] { return cancelled_.load(std::memory_order_acquire); });
    }
}

}
