#include "incident_detector.h"

IncidentDetector::IncidentDetector(const IncidentConfig& config) : config_(config) {
    logger = getLogger("LS_Incident_log");
    logger->info("IncidentDetector 생성 - 정지 판단: {}초, 허용 거리: {}px",
                 config_.timeout_sec, config_.movement_tolerance_px);
}

bool IncidentDetector::processVehicle(int id, const ObjPoint& position, int lane, double now,
                                      double* stopped_sec) {
    if (lane <= 0) return false;

    auto it = vehicle_states_.find(id);
    if (it == vehicle_states_.end()) {
        VehicleTrackingState state;
        state.anchor_position = position;
        state.last_position = position;
        state.still_since = now;
        state.lane_id = lane;
        vehicle_states_[id] = state;
        return false;
    }

    VehicleTrackingState& state = it->second;
    state.last_position = position;
    state.lane_id = lane;

    double dist = calculateDistance(state.anchor_position, position);
    if (dist > config_.movement_tolerance_px) {
        // 움직이기 시작했으면 정지 상태 해제
        if (state.is_stopped) {
            logger->info("차량정지 해제 - ID: {}, 차로: {}, 정지시간: {:.1f}초",
                         id, lane, now - state.still_since);
        }
        state.anchor_position = position;
        state.still_since = now;
        state.is_stopped = false;
        state.reported = false;
        return false;
    }

    state.is_stopped = (now - state.still_since) >= config_.timeout_sec;
    if (state.is_stopped && !state.reported) {
        state.reported = true;
        double elapsed = now - state.still_since;
        logger->info("차량정지 감지 - ID: {}, 차로: {}, 정지시간: {:.1f}초", id, lane, elapsed);
        if (stopped_sec) *stopped_sec = elapsed;
        return true;
    }
    return false;
}

bool IncidentDetector::hasIncident(int object_id) const {
    auto it = vehicle_states_.find(object_id);
    return it != vehicle_states_.end() && it->second.is_stopped;
}

std::vector<ActiveIncident> IncidentDetector::getActiveIncidents(double now) const {
    std::vector<ActiveIncident> incidents;
    for (const auto& [id, state] : vehicle_states_) {
        if (!state.is_stopped) continue;
        ActiveIncident incident;
        incident.track_id = id;
        incident.lane = state.lane_id;
        incident.position = state.last_position;
        incident.duration = now - state.still_since;
        incidents.push_back(incident);
    }
    return incidents;
}

void IncidentDetector::evictInactive(const std::set<int>& active_ids) {
    for (auto it = vehicle_states_.begin(); it != vehicle_states_.end();) {
        if (active_ids.find(it->first) == active_ids.end()) {
            logger->trace("차량 상태 제거 - ID: {}", it->first);
            it = vehicle_states_.erase(it);
        } else {
            ++it;
        }
    }
}
