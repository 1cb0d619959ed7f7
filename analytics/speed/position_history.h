#ifndef POSITION_HISTORY_H
#define POSITION_HISTORY_H

#include <deque>
#include <map>
#include <set>
#include "../../common/config_types.h"
#include "../../common/object_data.h"

/**
 * @brief 차량별 위치 이력 및 속도 추정 클래스
 *
 * 차량마다 (중심점, 시각) 샘플을 최대 history_size개까지 보관하고
 * 가장 오래된 샘플과 최신 샘플 사이의 직선 거리로 속도를 추정
 *
 * 추정값은 이력 구간 전체의 평균 속도이므로 저역 통과 특성을 가짐
 * 가감속 직후에는 실제 순간 속도보다 늦게 따라가고
 * 곡선 주행 시에는 직선 거리만 반영되어 실제보다 낮게 추정됨
 */
class PositionHistory {
private:
    struct Sample {
        ObjPoint position;
        double timestamp;
    };

    SpeedConfig config_;
    std::map<int, std::deque<Sample>> history_;

public:
    explicit PositionHistory(const SpeedConfig& config);
    ~PositionHistory() = default;

    /**
     * @brief 샘플 추가 (최대 개수 초과 시 가장 오래된 샘플 삭제)
     * @param track_id 차량 ID
     * @param position 중심점
     * @param now 현재 시각 (초)
     */
    void update(int track_id, const ObjPoint& position, double now);

    /**
     * @brief 속도 추정 (km/h)
     * @param track_id 차량 ID
     * @return 샘플이 2개 미만이거나 경과 시간이 0 이하이면 0
     */
    double getSpeedKmph(int track_id) const;

    /**
     * @brief 현재 프레임에 없는 차량의 이력 삭제
     * @param active_ids 현재 프레임의 차량 ID 집합
     */
    void evictInactive(const std::set<int>& active_ids);

    size_t getSampleCount(int track_id) const;
    size_t getTrackedCount() const { return history_.size(); }
};

#endif // POSITION_HISTORY_H
