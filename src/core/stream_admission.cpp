#include "stream_admission.h"
#include "../utils/logging.h"
#include <utility>

StreamAdmission::StreamAdmission(int maxStreams) : max_streams_(maxStreams) {}

bool StreamAdmission::tryAcquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ >= max_streams_) {
        return false;
    }
    active_++;
    return true;
}

bool StreamAdmission::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ == 0) {
            LOG_CERR("[WARNING] Stream slot released more often than acquired") << std::endl;
            return false;
        }
        active_--;
        if (active_ != 0) {
            return true;
        }
    }
    idle_cv_.notify_all();
    return true;
}

int StreamAdmission::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

bool StreamAdmission::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return active_ == 0; });
}

AdmissionSlot::AdmissionSlot(StreamAdmission& admission) {
    if (admission.tryAcquire()) {
        admission_ = &admission;
    }
}

AdmissionSlot::~AdmissionSlot() {
    release();
}

AdmissionSlot::AdmissionSlot(AdmissionSlot&& other) noexcept
    : admission_(std::exchange(other.admission_, nullptr)),
      released_(std::exchange(other.released_, false)) {}

AdmissionSlot& AdmissionSlot::operator=(AdmissionSlot&& other) noexcept {
    if (this != &other) {
        release();
        admission_ = std::exchange(other.admission_, nullptr);
        released_ = std::exchange(other.released_, false);
    }
    return *this;
}

void AdmissionSlot::release() {
    if (admission_ == nullptr || released_) {
        return;
    }
    released_ = true;
    admission_->release();
}
