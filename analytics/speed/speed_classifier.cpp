#include "speed_classifier.h"
#include <cmath>

SpeedClassifier::SpeedClassifier(const SpeedConfig& config) : config_(config) {
    logger = getLogger("LS_Speed_log");
    logger->info("SpeedClassifier 생성 - 제한속도: {}km/h, 긴급차량 기준: {}km/h",
                 config_.limit_kmph, config_.emergency_speed_kmph);
}

void SpeedClassifier::beginFrame() {
    emergency_ = EmergencyState();
}

bool SpeedClassifier::checkViolation(int track_id, const std::string& label, int lane,
                                     double speed_kmph, double now, SpeedViolationEvent& event) {
    if (speed_kmph <= config_.limit_kmph) {
        return false;
    }

    int bucket = static_cast<int>(std::floor(speed_kmph / config_.bucket_kmph));
    auto it = last_bucket_.find(track_id);
    if (it != last_bucket_.end() && it->second == bucket) {
        return false;
    }
    last_bucket_[track_id] = bucket;

    event.timestamp = now;
    event.track_id = track_id;
    event.lane = lane;
    event.speed_kmph = std::round(speed_kmph * 10.0) / 10.0;
    event.label = label;

    logger->info("[과속] id: {}, 차로: {}, 속도: {:.1f}km/h, 차종: {}, 구간: {}",
                 track_id, lane, event.speed_kmph, label, bucket);
    return true;
}

bool SpeedClassifier::checkEmergency(const std::string& label, int lane, double speed_kmph) {
    if (lane <= 0 || speed_kmph <= config_.emergency_speed_kmph) {
        return false;
    }
    if (config_.emergency_classes.find(label) == config_.emergency_classes.end()) {
        return false;
    }

    if (emergency_.active && emergency_.lane != lane) {
        logger->debug("[긴급] 후보 중복 - 차로 {} -> {}", emergency_.lane, lane);
    }
    emergency_.active = true;
    emergency_.lane = lane;
    return true;
}

void SpeedClassifier::evictInactive(const std::set<int>& active_ids) {
    for (auto it = last_bucket_.begin(); it != last_bucket_.end();) {
        if (active_ids.find(it->first) == active_ids.end()) {
            it = last_bucket_.erase(it);
        } else {
            ++it;
        }
    }
}
