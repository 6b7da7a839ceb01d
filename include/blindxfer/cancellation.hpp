#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace blindxfer::upload {

// Cooperative cancel flag shared by the caller and the scheduler.
class CancellationToken {
public:
    void Cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool IsCancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    // Sleeps for `delay` unless cancelled first. Returns true when cancelled.
    template <typename Rep, typename Period>
    bool WaitFor(std::chrono::duration<Rep, Period> delay) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, delay, [this] { return cancelled_; });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

}  // namespace blindxfer::upload
