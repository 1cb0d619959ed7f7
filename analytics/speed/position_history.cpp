#include "position_history.h"
#include "../../common/common_types.h"

PositionHistory::PositionHistory(const SpeedConfig& config) : config_(config) {}

void PositionHistory::update(int track_id, const ObjPoint& position, double now) {
    std::deque<Sample>& samples = history_[track_id];
    samples.push_back({position, now});
    while (samples.size() > static_cast<size_t>(config_.history_size)) {
        samples.pop_front();
    }
}

double PositionHistory::getSpeedKmph(int track_id) const {
    auto it = history_.find(track_id);
    if (it == history_.end() || it->second.size() < 2) {
        return 0.0;
    }

    const Sample& oldest = it->second.front();
    const Sample& newest = it->second.back();
    double dt = newest.timestamp - oldest.timestamp;
    if (dt <= 0) {
        return 0.0;
    }

    double dist_px = calculateDistance(oldest.position, newest.position);
    double mps = dist_px * config_.pixel_to_meter / dt;
    return mps * MPS_TO_KMPH;
}

void PositionHistory::evictInactive(const std::set<int>& active_ids) {
    for (auto it = history_.begin(); it != history_.end();) {
        if (active_ids.find(it->first) == active_ids.end()) {
            it = history_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t PositionHistory::getSampleCount(int track_id) const {
    auto it = history_.find(track_id);
    return it == history_.end() ? 0 : it->second.size();
}
