#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace infer_bench {

// One-shot cooperative cancellation shared by the workers and the sampler of a trial.
// Cancel() may be called any number of times from any thread.
class CancelToken {
public:
    using Clock = std::chrono::steady_clock;

    CancelToken() = default;
    explicit CancelToken(Clock::time_point deadline);

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void Cancel() noexcept;

    // True once Cancel() was called or the deadline has passed.
    bool IsCancelled() const noexcept;

    // Blocks up to `timeout` (clamped to the deadline). Returns true if cancelled.
    bool WaitFor(std::chrono::nanoseconds timeout) const;

    // Blocks until the deadline or Cancel(). Without a deadline waits for Cancel().
    void WaitUntilDone() const;

    bool HasDeadline() const noexcept { return has_deadline_; }
    Clock::time_point Deadline() const noexcept { return deadline_; }

private:
    bool has_deadline_ = false;
    Clock::time_point deadline_{};
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
};

}
