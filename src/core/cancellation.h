#ifndef CANCELLATION_H
#define CANCELLATION_H

#include <chrono>
#include <condition_variable>
#include <mutex>

// One-shot, process-wide stop request shared by every stream.
// Waiters wake as soon as cancel() is called.
class CancellationSignal {
public:
    using Clock = std::chrono::steady_clock;

    CancellationSignal() = default;
    CancellationSignal(const CancellationSignal&) = delete;
    CancellationSignal& operator=(const CancellationSignal&) = delete;

    void cancel();
    bool isCancelled() const;

    // Sleep until the deadline or cancellation, whichever comes first.
    // Returns true if cancelled.
    bool waitUntil(Clock::time_point deadline) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

#endif // CANCELLATION_H
