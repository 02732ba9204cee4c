#include "metrics.h"
#include "../utils/version.h"

nlohmann::json metricsToJson(const Metrics& metrics, int activeStreams, int maxStreams) {
    nlohmann::json j;
    j["staticRequests"] = metrics.staticRequests.load();
    j["partyRequests"] = metrics.partyRequests.load();
    j["fontRequests"] = metrics.fontRequests.load();
    j["rejectedStreams"] = metrics.rejectedStreams.load();
    j["totalErrors"] = metrics.totalErrors.load();
    j["activeStreams"] = activeStreams;
    j["maxStreams"] = maxStreams;
    j["version"] = getShoutVersion();
    return j;
}
