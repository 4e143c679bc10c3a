#include "Deadline.hpp"

std::chrono::milliseconds Deadline::remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
        return std::chrono::milliseconds::zero();
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(expiry_ - clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds::zero();
}

bool Deadline::isCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool Deadline::expired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_ || clock::now() >= expiry_;
}

void Deadline::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool Deadline::sleepFor(std::chrono::microseconds duration) {
    auto wake_time = clock::now() + duration;
    std::unique_lock<std::mutex> lock(mutex_);
    if (wake_time > expiry_) {
        // Sleeping past the deadline: wait until the deadline, then report interruption.
        cv_.wait_until(lock, expiry_, [this] { return cancelled_; });
        return false;
    }
    bool interrupted = cv_.wait_until(lock, wake_time, [this] { return cancelled_; });
    return !interrupted;
}
