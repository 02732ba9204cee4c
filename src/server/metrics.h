#ifndef METRICS_H
#define METRICS_H

#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>

// Request counters, updated from every connection thread
struct Metrics {
    std::atomic<int64_t> staticRequests{0};
    std::atomic<int64_t> partyRequests{0};
    std::atomic<int64_t> fontRequests{0};
    std::atomic<int64_t> rejectedStreams{0};
    std::atomic<int64_t> totalErrors{0};
};

// Snapshot for the admin /metrics endpoint
nlohmann::json metricsToJson(const Metrics& metrics, int activeStreams, int maxStreams);

#endif // METRICS_H
