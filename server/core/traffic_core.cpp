#include "traffic_core.h"
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include "../../common/common_types.h"

TrafficCore::TrafficCore(const AnalyticsConfig& config, double session_start)
    : config_(config),
      roi_handler_(config.lanes),
      position_history_(config.speed),
      incident_detector_(config.incident),
      speed_classifier_(config.speed),
      trend_tracker_(config.trend),
      flow_tracker_(config.flow),
      scheduler_(config.signal, static_cast<int>(config.lanes.size())),
      session_(session_start) {
    logger = getLogger("LS_Core_log");
    logger->info("TrafficCore 생성 - 차로 수: {}", roi_handler_.getLaneCount());
}

void TrafficCore::updateFps(double now) {
    if (has_frame_) {
        double dt = now - last_timestamp_;
        if (dt > 0) {
            double instant = 1.0 / dt;
            fps_ = (fps_ <= 0) ? instant : fps_ * 0.9 + instant * 0.1;
        }
    }
    has_frame_ = true;
    last_timestamp_ = now;
}

FrameSnapshot TrafficCore::processFrame(const std::vector<VehicleObservation>& observations,
                                        double now) {
    if (!acceptsTimestamp(now)) {
        logger->error("프레임 시각 역행: {:.3f} <= {:.3f}", now, last_timestamp_);
        throw std::logic_error("frame timestamps must be strictly increasing");
    }
    updateFps(now);
    frame_id_++;

    FrameSnapshot snapshot;
    snapshot.frame_id = frame_id_;
    snapshot.timestamp = now;

    const int lane_count = roi_handler_.getLaneCount();

    // 차로별 차종 집계 초기화
    std::map<int, std::map<std::string, int>> lane_counts;
    for (int lane = 1; lane <= lane_count; ++lane) {
        for (const auto& label : VEHICLE_LABELS) {
            lane_counts[lane][label] = 0;
        }
    }

    speed_classifier_.beginFrame();

    std::set<int> active_ids;
    for (const auto& obj : observations) {
        if (!isVehicleLabel(obj.label)) {
            logger->trace("차종 어휘 밖 라벨 무시 - id: {}, label: {}", obj.object_id, obj.label);
            continue;
        }
        active_ids.insert(obj.object_id);

        ObjPoint center = isValidPosition(obj.center) ? obj.center : getCenter(obj.bbox);
        int lane = roi_handler_.resolveLane(obj.object_id, center);

        position_history_.update(obj.object_id, center, now);
        double speed = position_history_.getSpeedKmph(obj.object_id);

        if (lane > 0) {
            lane_counts[lane][obj.label]++;
            flow_tracker_.record(lane, obj.object_id, now);
        }

        double stopped_sec = 0;
        if (incident_detector_.processVehicle(obj.object_id, center, lane, now, &stopped_sec)) {
            ActiveIncident incident;
            incident.track_id = obj.object_id;
            incident.lane = lane;
            incident.position = center;
            incident.duration = stopped_sec;
            snapshot.new_incidents.push_back(incident);
        }

        SpeedViolationEvent event;
        if (speed_classifier_.checkViolation(obj.object_id, obj.label, lane, speed, now, event)) {
            snapshot.new_violations.push_back(event);
        }
        speed_classifier_.checkEmergency(obj.label, lane, speed);
    }

    // 현재 프레임에 없는 차량 상태 정리
    roi_handler_.evictInactive(active_ids);
    position_history_.evictInactive(active_ids);
    incident_detector_.evictInactive(active_ids);
    speed_classifier_.evictInactive(active_ids);

    // 차로별 집계
    std::map<int, LaneSignalInput> signal_inputs;
    int lane_vehicles = 0;
    for (int lane = 1; lane <= lane_count; ++lane) {
        LaneFrameStats stats;
        stats.lane = lane;
        stats.counts = lane_counts[lane];
        for (const auto& [label, count] : stats.counts) {
            stats.total += count;
        }

        trend_tracker_.addSample(lane, stats.total);
        stats.trend_slope = trend_tracker_.getSlope(lane);
        stats.trend = trend_tracker_.getDirection(lane);
        stats.los = gradeLOS(stats.total);
        stats.flow_rate = flow_tracker_.getRate(lane, now);
        stats.status = getLaneStatus(stats.total);

        signal_inputs[lane] = {stats.total, stats.trend_slope};
        lane_vehicles += stats.total;
        snapshot.lanes.push_back(stats);
    }

    snapshot.emergency = speed_classifier_.getEmergency();
    snapshot.signal = scheduler_.update(signal_inputs, snapshot.emergency, now);
    snapshot.incidents = incident_detector_.getActiveIncidents(now);

    session_.update(active_ids, lane_vehicles, static_cast<int>(snapshot.new_incidents.size()),
                    static_cast<int>(snapshot.new_violations.size()), now);
    snapshot.session = session_.getTotals();

    for (const auto& event : snapshot.new_violations) {
        recent_violations_.push_back(event);
        while (recent_violations_.size() > RECENT_VIOLATION_LIMIT) {
            recent_violations_.pop_front();
        }
    }
    snapshot.recent_violations.assign(recent_violations_.begin(), recent_violations_.end());

    // 차로별 차량 수 이력
    if (frame_id_ % HISTORY_INTERVAL_FRAMES == 0) {
        LaneHistoryEntry entry;
        entry.timestamp = now;
        for (const auto& stats : snapshot.lanes) {
            entry.lane_totals[stats.lane] = stats.total;
        }
        history_.push_back(entry);
        while (history_.size() > HISTORY_LIMIT) {
            history_.pop_front();
        }
    }
    snapshot.history.assign(history_.begin(), history_.end());

    snapshot.vehicle_count = static_cast<int>(active_ids.size());
    snapshot.fps = fps_;

    logger->trace("프레임 {} - 차량: {}, 녹색: {}, 잔여: {}초", frame_id_, snapshot.vehicle_count,
                  snapshot.signal.active_lane, snapshot.signal.remaining_seconds);
    return snapshot;
}
