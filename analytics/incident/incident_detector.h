#ifndef INCIDENT_DETECTOR_H
#define INCIDENT_DETECTOR_H

#include <map>
#include <memory>
#include <set>
#include <vector>
#include "incident_types.h"
#include "../../common/config_types.h"
#include "../../common/object_data.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

/**
 * @brief 정지 차량 돌발상황 감지 클래스
 *
 * 차량별 기준 위치(anchor)에서 movement_tolerance_px 이내로 머문 시간을 측정
 * 정지 시간이 timeout_sec 이상이면 돌발, 허용 거리를 넘게 움직이면 즉시 해제
 * (해제 시 히스테리시스 없음, 기준 위치와 정지 시작 시각을 현재로 재설정)
 *
 * 차로가 판정된 차량만 추적하며 매 프레임 현재 ID 집합 기준으로 정리
 */
class IncidentDetector {
private:
    // 차량별 추적 상태
    struct VehicleTrackingState {
        ObjPoint anchor_position;       // 정지 판단 기준 위치
        ObjPoint last_position;         // 최근 위치
        double still_since = 0;         // 정지 시작 시각
        int lane_id = 0;
        bool is_stopped = false;        // 돌발 상태
        bool reported = false;          // 이번 정지 구간 발생 보고 여부
    };

    IncidentConfig config_;

    std::map<int, VehicleTrackingState> vehicle_states_;

    // 로거
    std::shared_ptr<spdlog::logger> logger;

public:
    explicit IncidentDetector(const IncidentConfig& config);
    ~IncidentDetector() = default;

    /**
     * @brief 차량 객체 처리
     * @param id 차량 ID
     * @param position 중심점
     * @param lane 차로 번호 (0이면 추적하지 않음)
     * @param now 현재 시각
     * @param stopped_sec [out] 새 돌발 발생 시 실제 정지 시간 (nullptr 가능)
     * @return 이번 프레임에 새로 돌발이 발생했으면 true (정지 구간당 한 번)
     */
    bool processVehicle(int id, const ObjPoint& position, int lane, double now,
                        double* stopped_sec = nullptr);

    /**
     * @brief 객체의 돌발상황 여부 확인
     * @param object_id 객체 ID
     * @return 돌발상황이 발생 중이면 true
     */
    bool hasIncident(int object_id) const;

    /**
     * @brief 진행 중인 돌발 목록 (차량 ID 순)
     * @param now 현재 시각 (지속 시간 계산용)
     */
    std::vector<ActiveIncident> getActiveIncidents(double now) const;

    /**
     * @brief 현재 프레임에 없는 차량 상태 삭제
     * @param active_ids 현재 프레임의 차량 ID 집합
     */
    void evictInactive(const std::set<int>& active_ids);

    size_t getTrackedCount() const { return vehicle_states_.size(); }
};

#endif // INCIDENT_DETECTOR_H
