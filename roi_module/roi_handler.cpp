#include "roi_handler.h"
#include <algorithm>
#include <sstream>
#include <stdexcept>

ROIHandler::ROIHandler(const std::vector<LaneRect>& lanes) {
    logger = getLogger("LS_ROI_log");

    if (lanes.empty()) {
        logger->critical("No Lanes Configured");
        throw std::runtime_error("at least one lane is required");
    }

    for (size_t i = 0; i < lanes.size(); i++) {
        LaneRect rect;
        rect.x1 = std::min(lanes[i].x1, lanes[i].x2);
        rect.y1 = std::min(lanes[i].y1, lanes[i].y2);
        rect.x2 = std::max(lanes[i].x1, lanes[i].x2);
        rect.y2 = std::max(lanes[i].y1, lanes[i].y2);
        if (rect.x1 == rect.x2 || rect.y1 == rect.y2) {
            logger->critical("Lane {} has zero area", i + 1);
            throw std::runtime_error("lane " + std::to_string(i + 1) + " has zero area");
        }
        lane_roi.push_back(rect);
    }

    // 차로 좌표 로그 파일 저장
    logROICoords();
}

void ROIHandler::logROICoords() {
    for (size_t i = 0; i < lane_roi.size(); ++i) {
        const LaneRect& r = lane_roi[i];
        std::ostringstream ss;
        ss << "[ROI] lane[" << i + 1 << "]: [(" << r.x1 << ", " << r.y1 << "), ("
           << r.x2 << ", " << r.y2 << ")]";
        logger->info(ss.str());
    }
}

int ROIHandler::getLaneNum(ObjPoint p1) const {
    int n = lane_roi.size();
    for (int i = 0; i < n; i++) {
        const LaneRect& r = lane_roi[i];
        if (r.x1 <= p1.x && p1.x <= r.x2 && r.y1 <= p1.y && p1.y <= r.y2)
            return i + 1;
    }
    return 0;
}

int ROIHandler::resolveLane(int track_id, ObjPoint p1) {
    int lane = getLaneNum(p1);
    if (lane > 0) {
        vehicle_last_lane[track_id] = lane;
        return lane;
    }

    auto it = vehicle_last_lane.find(track_id);
    if (it != vehicle_last_lane.end()) {
        logger->trace("[ROI] id {} 차로 밖, 마지막 차로 {} 유지", track_id, it->second);
        return it->second;
    }
    return 0;
}

void ROIHandler::evictInactive(const std::set<int>& active_ids) {
    for (auto it = vehicle_last_lane.begin(); it != vehicle_last_lane.end();) {
        if (active_ids.find(it->first) == active_ids.end()) {
            it = vehicle_last_lane.erase(it);
        } else {
            ++it;
        }
    }
}
