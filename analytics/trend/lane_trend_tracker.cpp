#include "lane_trend_tracker.h"

LaneTrendTracker::LaneTrendTracker(const TrendConfig& config) : config_(config) {}

void LaneTrendTracker::addSample(int lane, int total) {
    std::deque<int>& window = samples_[lane];
    window.push_back(total);
    while (window.size() > static_cast<size_t>(config_.window_size)) {
        window.pop_front();
    }
}

double LaneTrendTracker::getSlope(int lane) const {
    auto it = samples_.find(lane);
    if (it == samples_.end() || it->second.size() < 3) {
        return 0.0;
    }

    const std::deque<int>& window = it->second;
    const double n = static_cast<double>(window.size());

    // x = 0..n-1
    double sum_x = 0, sum_y = 0, sum_xy = 0, sum_xx = 0;
    for (size_t i = 0; i < window.size(); ++i) {
        double x = static_cast<double>(i);
        double y = static_cast<double>(window[i]);
        sum_x += x;
        sum_y += y;
        sum_xy += x * y;
        sum_xx += x * x;
    }

    double denom = n * sum_xx - sum_x * sum_x;
    if (denom == 0) {
        return 0.0;
    }
    return (n * sum_xy - sum_x * sum_y) / denom;
}

TrendDirection LaneTrendTracker::getDirection(int lane) const {
    double slope = getSlope(lane);
    if (slope > config_.threshold) return TrendDirection::RISING;
    if (slope < -config_.threshold) return TrendDirection::FALLING;
    return TrendDirection::STABLE;
}

size_t LaneTrendTracker::getSampleCount(int lane) const {
    auto it = samples_.find(lane);
    return it == samples_.end() ? 0 : it->second.size();
}

std::string LaneTrendTracker::toGlyph(TrendDirection direction) {
    switch (direction) {
        case TrendDirection::RISING:  return "↑";
        case TrendDirection::FALLING: return "↓";
        default:                      return "→";
    }
}

std::string LaneTrendTracker::toAscii(TrendDirection direction) {
    switch (direction) {
        case TrendDirection::RISING:  return "^";
        case TrendDirection::FALLING: return "v";
        default:                      return "-";
    }
}

int LaneTrendTracker::toSign(TrendDirection direction) {
    switch (direction) {
        case TrendDirection::RISING:  return 1;
        case TrendDirection::FALLING: return -1;
        default:                      return 0;
    }
}
