#ifndef ROIHANDLER_H
#define ROIHANDLER_H

#include <map>
#include <set>
#include <string>
#include <vector>
#include "../common/config_types.h"
#include "../common/object_data.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

/**
 * @brief 차로 영역 관련 기능을 담당하는 클래스
 * 설정의 차로 사각형 보관 (1번부터 시작, 생성 후 불변)
 * 검지된 객체가 어느 차로 내부에 존재하는지 판단
 * 경계 떨림 억제를 위한 차량별 마지막 차로 유지 (sticky)
 */
class ROIHandler {
private:
    std::vector<LaneRect> lane_roi;

    // 차량별 마지막으로 판정된 차로 (track_id -> lane)
    std::map<int, int> vehicle_last_lane;

    // 로거 인스턴스
    std::shared_ptr<spdlog::logger> logger = NULL;

    /**
     * @brief 로드된 차로 좌표를 로그에 저장하는 함수
     */
    void logROICoords();

public:
    /**
     * @brief 생성자
     * @param lanes 차로 사각형 목록 (0번 요소가 1차로)
     * @throw std::runtime_error 차로가 없거나 면적이 0인 사각형이 있는 경우
     */
    explicit ROIHandler(const std::vector<LaneRect>& lanes);
    ~ROIHandler() = default;

    /**
     * @brief 주어진 점이 어떤 차로 안에 있는지 반환하는 함수
     * 경계 포함, 겹치는 경우 번호가 작은 차로 우선
     * @param p1 점의 좌표
     * @return 차로 내부 이면 차로 번호, 차로 외부 이면 0 반환
     */
    int getLaneNum(ObjPoint p1) const;

    /**
     * @brief 차량의 차로 판정 (sticky)
     * 현재 프레임에서 차로 밖이면 마지막으로 판정된 차로를 유지
     * @param track_id 차량 ID
     * @param p1 차량 중심점
     * @return 차로 번호, 한 번도 판정된 적 없으면 0
     */
    int resolveLane(int track_id, ObjPoint p1);

    /**
     * @brief 현재 프레임에 없는 차량의 마지막 차로 정보 삭제
     * @param active_ids 현재 프레임의 차량 ID 집합
     */
    void evictInactive(const std::set<int>& active_ids);

    int getLaneCount() const { return static_cast<int>(lane_roi.size()); }
    const std::vector<LaneRect>& getLanes() const { return lane_roi; }
    size_t getTrackedCount() const { return vehicle_last_lane.size(); }
};

#endif
