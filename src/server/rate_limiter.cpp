#include "rate_limiter.h"
#include <algorithm>

RateLimiter::RateLimiter(int requestsPerMinute, int burst)
    : tokens_per_second_(requestsPerMinute / 60.0), burst_(burst) {}

void RateLimiter::refill(Bucket& bucket, Clock::time_point now) const {
    std::chrono::duration<double> elapsed = now - bucket.lastRefill;
    if (elapsed.count() > 0) {
        bucket.tokens = std::min(burst_, bucket.tokens + elapsed.count() * tokens_per_second_);
        bucket.lastRefill = now;
    }
}

bool RateLimiter::allow(const std::string& client) {
    return allow(client, Clock::now());
}

bool RateLimiter::allow(const std::string& client, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(client);
    if (it == buckets_.end()) {
        it = buckets_.emplace(client, Bucket{burst_, now, now}).first;
    }
    Bucket& bucket = it->second;
    refill(bucket, now);
    bucket.lastSeen = now;
    if (bucket.tokens < 1.0) {
        return false;
    }
    bucket.tokens -= 1.0;
    return true;
}

size_t RateLimiter::prune(Clock::time_point now, std::chrono::seconds idle) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        if (now - it->second.lastSeen >= idle) {
            it = buckets_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t RateLimiter::trackedClients() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_.size();
}
