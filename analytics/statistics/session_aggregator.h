#ifndef SESSION_AGGREGATOR_H
#define SESSION_AGGREGATOR_H

#include <memory>
#include <set>
#include <string>
#include "stats_types.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

/**
 * @brief 세션 누적 통계 집계 클래스
 *
 * 차로 판정 여부와 무관하게 모든 차량을 고유 ID 수에 포함
 * 최대 차량 수는 차로에 들어온 차량만 기준
 * 종료 시 요약을 로그로 남김
 */
class SessionAggregator {
private:
    SessionTotals totals_;
    std::set<int> all_ids_;

    std::shared_ptr<spdlog::logger> logger = nullptr;

public:
    /**
     * @brief 생성자
     * @param session_start 세션 시작 시각
     */
    explicit SessionAggregator(double session_start);
    ~SessionAggregator() = default;

    /**
     * @brief 프레임 결과 반영
     * @param frame_ids 이번 프레임의 모든 차량 ID
     * @param lane_vehicles 이번 프레임 차로별 차량 수 합계
     * @param new_incidents 이번 프레임에 새로 발생한 돌발 수
     * @param new_violations 이번 프레임에 새로 발생한 과속 이벤트 수
     * @param now 현재 시각
     */
    void update(const std::set<int>& frame_ids, int lane_vehicles, int new_incidents,
                int new_violations, double now);

    const SessionTotals& getTotals() const { return totals_; }

    /**
     * @brief 세션 요약 문자열 (여러 줄)
     */
    std::string formatSummary() const;

    /**
     * @brief 세션 요약을 로그로 출력
     */
    void logSummary() const;
};

#endif // SESSION_AGGREGATOR_H
