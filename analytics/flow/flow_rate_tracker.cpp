#include "flow_rate_tracker.h"
#include <cmath>
#include <set>

FlowRateTracker::FlowRateTracker(const FlowConfig& config) : config_(config) {}

void FlowRateTracker::record(int lane, int track_id, double now) {
    entries_[lane].emplace_back(track_id, now);
}

void FlowRateTracker::prune(int lane, double now) {
    auto it = entries_.find(lane);
    if (it == entries_.end()) return;

    double cutoff = now - config_.horizon_sec;
    auto& window = it->second;
    while (!window.empty() && window.front().second < cutoff) {
        window.pop_front();
    }
}

int FlowRateTracker::getUniqueCount(int lane, double now) {
    prune(lane, now);

    auto it = entries_.find(lane);
    if (it == entries_.end()) return 0;

    std::set<int> ids;
    for (const auto& entry : it->second) {
        ids.insert(entry.first);
    }
    return static_cast<int>(ids.size());
}

double FlowRateTracker::getRate(int lane, double now) {
    int unique = getUniqueCount(lane, now);
    double per_min = unique / (config_.horizon_sec / 60.0);
    return std::round(per_min * 10.0) / 10.0;
}
