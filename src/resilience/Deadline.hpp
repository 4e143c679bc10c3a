#ifndef DEADLINE_HPP
#define DEADLINE_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>

// Bounds a single dispatch. Expires at a fixed time point or earlier when
// cancelled (e.g. on shutdown). Waiting on it is interruptible by both.
class Deadline {
public:
    using clock = std::chrono::steady_clock;

    explicit Deadline(clock::time_point expiry) : expiry_(expiry) {}

    static Deadline after(std::chrono::milliseconds timeout) {
        return Deadline(clock::now() + timeout);
    }

    Deadline(const Deadline&) = delete;
    Deadline& operator=(const Deadline&) = delete;

    std::chrono::milliseconds remaining() const;

    bool isCancelled() const;
    bool expired() const;

    // Wakes every waiter. Idempotent.
    void cancel();

    // Blocks for `duration`. Returns false if the deadline expired or was
    // cancelled before the full duration elapsed.
    bool sleepFor(std::chrono::microseconds duration);

private:
    clock::time_point expiry_;
    bool cancelled_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

#endif // DEADLINE_HPP
