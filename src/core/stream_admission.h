#ifndef STREAM_ADMISSION_H
#define STREAM_ADMISSION_H

#include <chrono>
#include <condition_variable>
#include <mutex>

// Bounded counter gating how many animated streams run at once.
// Invariant: 0 <= activeCount() <= maxStreams(). Safe for concurrent use.
class StreamAdmission {
public:
    explicit StreamAdmission(int maxStreams);

    StreamAdmission(const StreamAdmission&) = delete;
    StreamAdmission& operator=(const StreamAdmission&) = delete;

    // Take one slot if one is free. Never over-admits under contention.
    bool tryAcquire();

    // Return one slot. Returns false (and changes nothing) if no slot is held.
    bool release();

    int activeCount() const;
    int maxStreams() const { return max_streams_; }

    // Block until no slot is held or the timeout passes; true if idle
    bool waitIdle(std::chrono::milliseconds timeout);

private:
    const int max_streams_;
    int active_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
};

// Scoped ownership of one admission slot: released exactly once, on whichever path
// leaves the owning scope
class AdmissionSlot {
public:
    AdmissionSlot() = default;
    // Attempts the acquisition; check held() afterwards
    explicit AdmissionSlot(StreamAdmission& admission);
    ~AdmissionSlot();

    AdmissionSlot(AdmissionSlot&& other) noexcept;
    AdmissionSlot& operator=(AdmissionSlot&& other) noexcept;
    AdmissionSlot(const AdmissionSlot&) = delete;
    AdmissionSlot& operator=(const AdmissionSlot&) = delete;

    bool held() const { return admission_ != nullptr && !released_; }

    // Release early; later calls and the destructor do nothing
    void release();

private:
    StreamAdmission* admission_ = nullptr;
    bool released_ = false;
};

#endif // STREAM_ADMISSION_H
