#ifndef FLOW_RATE_TRACKER_H
#define FLOW_RATE_TRACKER_H

#include <deque>
#include <map>
#include <utility>
#include "../../common/config_types.h"

/**
 * @brief 차로별 유량 추적 클래스
 *
 * 차로에 판정될 때마다 (차량 ID, 시각)을 기록하고
 * 조회 시 horizon_sec보다 오래된 기록을 정리한 뒤
 * 남은 고유 차량 수를 분당 대수로 환산
 * (여러 프레임에 걸쳐 머무는 차량은 한 대로 계산)
 */
class FlowRateTracker {
private:
    FlowConfig config_;

    // 차로 -> (차량 ID, 시각), 시각 오름차순
    std::map<int, std::deque<std::pair<int, double>>> entries_;

    void prune(int lane, double now);

public:
    explicit FlowRateTracker(const FlowConfig& config);
    ~FlowRateTracker() = default;

    /**
     * @brief 차로 판정 기록
     * @param lane 차로 번호
     * @param track_id 차량 ID
     * @param now 현재 시각
     */
    void record(int lane, int track_id, double now);

    /**
     * @brief 분당 유량 (소수 첫째 자리 반올림)
     * @param lane 차로 번호
     * @param now 현재 시각
     * @return 기록이 없으면 0
     */
    double getRate(int lane, double now);

    /**
     * @brief 윈도우 내 고유 차량 수
     */
    int getUniqueCount(int lane, double now);
};

#endif // FLOW_RATE_TRACKER_H
