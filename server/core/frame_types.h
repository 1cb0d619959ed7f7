/**
 * @file frame_types.h
 * @brief 프레임 단위 분석 결과 (스냅샷) 타입 정의
 *
 * TrafficCore가 매 프레임 생성하고 SnapshotStore를 통해
 * 불변 객체로 공유 (리포팅/전송 스레드는 읽기만 함)
 */

#ifndef FRAME_TYPES_H
#define FRAME_TYPES_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "signal_types.h"
#include "../../analytics/incident/incident_types.h"
#include "../../analytics/los/los_grader.h"
#include "../../analytics/speed/speed_types.h"
#include "../../analytics/statistics/stats_types.h"
#include "../../analytics/trend/lane_trend_tracker.h"

/**
 * @brief 차로별 프레임 분석 결과
 */
struct LaneFrameStats {
    int lane = 0;
    std::map<std::string, int> counts;      // 차종 -> 대수
    int total = 0;
    LosGrade los;
    double trend_slope = 0;
    TrendDirection trend = TrendDirection::STABLE;
    double flow_rate = 0;                   // 대/분
    std::string status;                     // CLEAR / MODERATE / CONGESTED
};

/**
 * @brief 차로별 차량 수 이력 항목 (일정 프레임 간격으로 기록)
 */
struct LaneHistoryEntry {
    double timestamp = 0;
    std::map<int, int> lane_totals;         // 차로 -> 대수
};

/**
 * @brief 프레임 스냅샷
 */
struct FrameSnapshot {
    int64_t frame_id = 0;
    double timestamp = 0;
    double fps = 0;
    int vehicle_count = 0;                  // 이번 프레임 전체 차량 수 (차로 미판정 포함)

    std::vector<LaneFrameStats> lanes;      // 1차로부터 순서대로

    std::vector<ActiveIncident> incidents;              // 진행 중인 정지 차량
    std::vector<ActiveIncident> new_incidents;          // 이번 프레임 새로 발생
    std::vector<SpeedViolationEvent> new_violations;    // 이번 프레임 새 과속 이벤트
    std::vector<SpeedViolationEvent> recent_violations; // 최근 과속 이벤트 (최대 10건)
    std::vector<LaneHistoryEntry> history;              // 차로별 차량 수 이력 (오래된 순)

    EmergencyState emergency;
    SignalPhaseState signal;
    SessionTotals session;
};

#endif // FRAME_TYPES_H
