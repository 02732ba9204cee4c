#ifndef RATE_LIMITER_H
#define RATE_LIMITER_H

#include <chrono>
#include <map>
#include <mutex>
#include <string>

// Token bucket per client address: `burst` tokens, refilled at requestsPerMinute / 60 per second.
// Governs request rate only; concurrent streams are capped separately by StreamAdmission.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    RateLimiter(int requestsPerMinute, int burst);

    bool allow(const std::string& client);
    bool allow(const std::string& client, Clock::time_point now);

    // Forget clients that have not made a request for at least `idle`
    size_t prune(Clock::time_point now, std::chrono::seconds idle);

    size_t trackedClients() const;

private:
    struct Bucket {
        double tokens;
        Clock::time_point lastRefill;
        Clock::time_point lastSeen;
    };

    void refill(Bucket& bucket, Clock::time_point now) const;

    const double tokens_per_second_;
    const double burst_;
    mutable std::mutex mutex_;
    std::map<std::string, Bucket> buckets_;
};

#endif // RATE_LIMITER_H
