#include "snapshot_json.h"
#include <cmath>
#include "../../common/common_types.h"

static double round1(double v) {
    return std::round(v * 10.0) / 10.0;
}

Json::Value violationToJson(const SpeedViolationEvent& event) {
    Json::Value obj;
    obj["timestamp"] = formatTime(event.timestamp);
    obj["track_id"] = event.track_id;
    obj["lane"] = event.lane > 0 ? Json::Value(event.lane) : Json::Value(Json::nullValue);
    obj["speed"] = event.speed_kmph;
    obj["class"] = event.label;
    return obj;
}

Json::Value incidentToJson(const ActiveIncident& incident) {
    Json::Value obj;
    obj[IncidentJsonKeys::TRACE_ID] = incident.track_id;
    obj[IncidentJsonKeys::LANE] = incident.lane;
    Json::Value position(Json::arrayValue);
    position.append(static_cast<int>(std::lround(incident.position.x)));
    position.append(static_cast<int>(std::lround(incident.position.y)));
    obj[IncidentJsonKeys::POSITION] = position;
    obj[IncidentJsonKeys::DURATION] = round1(incident.duration);
    return obj;
}

Json::Value signalToJson(const SignalPhaseState& signal) {
    Json::Value obj;
    obj["active_lane"] = signal.active_lane;
    obj["remaining_seconds"] = signal.remaining_seconds;
    obj["phase_duration"] = signal.phase_duration;

    Json::Value waits(Json::objectValue);
    for (const auto& [lane, wait] : signal.estimated_wait) {
        waits[std::to_string(lane)] = wait;
    }
    obj["estimated_wait"] = waits;

    if (signal.adjustment.type != AdjustmentType::NONE) {
        obj["adjustment"] = signal.adjustment.banner;
    } else {
        obj["adjustment"] = Json::Value(Json::nullValue);
    }
    return obj;
}

Json::Value sessionToJson(const SessionTotals& session) {
    Json::Value obj;
    obj["session_start"] = formatTime(session.session_start, "%Y-%m-%d %H:%M:%S");
    obj["unique_vehicles"] = session.unique_vehicles;
    obj["peak_count"] = session.peak_count;
    obj["peak_time"] = session.peak_count > 0 ? formatTime(session.peak_time, "%H:%M:%S") : "";
    obj["total_incidents"] = session.total_incidents;
    obj["total_violations"] = session.total_violations;
    obj["frames"] = static_cast<Json::Int64>(session.frames);
    return obj;
}

Json::Value snapshotToJson(const FrameSnapshot& snapshot) {
    Json::Value root;
    root["frame_id"] = static_cast<Json::Int64>(snapshot.frame_id);
    root["timestamp"] = snapshot.timestamp;
    root["fps"] = round1(snapshot.fps);
    root["vehicle_count"] = snapshot.vehicle_count;

    Json::Value lanes(Json::arrayValue);
    for (const auto& stats : snapshot.lanes) {
        Json::Value lane;
        lane["lane"] = stats.lane;

        Json::Value counts(Json::objectValue);
        for (const auto& [label, count] : stats.counts) {
            counts[label] = count;
        }
        lane["counts"] = counts;
        lane["total"] = stats.total;

        Json::Value los;
        los["grade"] = stats.los.grade;
        los["color"] = stats.los.color;
        los["description"] = stats.los.description;
        lane["los"] = los;

        Json::Value trend;
        trend["slope"] = stats.trend_slope;
        trend["label"] = LaneTrendTracker::toGlyph(stats.trend);
        trend["ascii"] = LaneTrendTracker::toAscii(stats.trend);
        trend["sign"] = LaneTrendTracker::toSign(stats.trend);
        lane["trend"] = trend;

        lane["flow_rate"] = stats.flow_rate;
        lane["status"] = stats.status;
        lanes.append(lane);
    }
    root["lanes"] = lanes;

    Json::Value incidents(Json::arrayValue);
    for (const auto& incident : snapshot.incidents) {
        incidents.append(incidentToJson(incident));
    }
    root["incidents"] = incidents;

    Json::Value speeders(Json::arrayValue);
    for (const auto& event : snapshot.recent_violations) {
        speeders.append(violationToJson(event));
    }
    root["speeders"] = speeders;

    Json::Value history(Json::arrayValue);
    for (const auto& entry : snapshot.history) {
        Json::Value item;
        item["t"] = formatTime(entry.timestamp, "%H:%M:%S");
        Json::Value totals(Json::objectValue);
        for (const auto& [lane, total] : entry.lane_totals) {
            totals[std::to_string(lane)] = total;
        }
        item["lanes"] = totals;
        history.append(item);
    }
    root["history"] = history;

    Json::Value emergency;
    emergency["active"] = snapshot.emergency.active;
    emergency["lane"] = snapshot.emergency.active ? Json::Value(snapshot.emergency.lane)
                                                  : Json::Value(Json::nullValue);
    root["emergency"] = emergency;

    root["signal"] = signalToJson(snapshot.signal);
    root["session"] = sessionToJson(snapshot.session);
    return root;
}

std::string writeCompact(const Json::Value& value) {
    Json::FastWriter writer;
    return writer.write(value);
}
