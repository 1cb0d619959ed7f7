#ifndef TRAFFIC_CORE_H
#define TRAFFIC_CORE_H

#include <cstdint>
#include <deque>
#include <memory>
#include <vector>
#include "frame_types.h"
#include "../signal/priority_scheduler.h"
#include "../../analytics/flow/flow_rate_tracker.h"
#include "../../analytics/incident/incident_detector.h"
#include "../../analytics/speed/position_history.h"
#include "../../analytics/speed/speed_classifier.h"
#include "../../analytics/statistics/session_aggregator.h"
#include "../../analytics/trend/lane_trend_tracker.h"
#include "../../common/config_types.h"
#include "../../common/object_data.h"
#include "../../roi_module/roi_handler.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

/**
 * @brief 프레임 단위 차로 분석 + 신호 스케줄링 파이프라인
 *
 * 처리 순서 (프레임당 한 번, 동기, 단일 스레드)
 *   차로 판정 -> 위치 이력 -> 돌발/과속 판정 -> 유량 기록
 *   -> 차로별 집계 (추세, LOS) -> 스케줄러 -> 세션 통계
 *
 * 모든 상태는 이 객체가 소유하며 결과는 FrameSnapshot 값으로만 전달
 * 프레임 시각은 반드시 단조 증가해야 함
 */
class TrafficCore {
private:
    static constexpr size_t RECENT_VIOLATION_LIMIT = 10;
    static constexpr int64_t HISTORY_INTERVAL_FRAMES = 90;
    static constexpr size_t HISTORY_LIMIT = 40;

    AnalyticsConfig config_;

    ROIHandler roi_handler_;
    PositionHistory position_history_;
    IncidentDetector incident_detector_;
    SpeedClassifier speed_classifier_;
    LaneTrendTracker trend_tracker_;
    FlowRateTracker flow_tracker_;
    PriorityScheduler scheduler_;
    SessionAggregator session_;

    int64_t frame_id_ = 0;
    bool has_frame_ = false;
    double last_timestamp_ = 0;
    double fps_ = 0;

    std::deque<SpeedViolationEvent> recent_violations_;
    std::deque<LaneHistoryEntry> history_;

    std::shared_ptr<spdlog::logger> logger = nullptr;

    void updateFps(double now);

public:
    /**
     * @brief 생성자
     * @param config 분석 설정 (검증 완료된 값)
     * @param session_start 세션 시작 시각
     * @throw std::runtime_error 차로 설정이 유효하지 않은 경우
     */
    TrafficCore(const AnalyticsConfig& config, double session_start);
    ~TrafficCore() = default;

    /**
     * @brief 한 프레임 처리
     * @param observations 이번 프레임 차량 관측 목록 (차종 어휘 밖 라벨은 무시)
     * @param now 프레임 시각 (초)
     * @return 프레임 스냅샷
     * @throw std::logic_error 시각이 이전 프레임 이하이거나 스케줄러 불변식 위반
     */
    FrameSnapshot processFrame(const std::vector<VehicleObservation>& observations, double now);

    /**
     * @brief 다음 프레임으로 받을 수 있는 시각인지 (이전 프레임보다 큰지)
     */
    bool acceptsTimestamp(double now) const { return !has_frame_ || now > last_timestamp_; }

    int64_t getFrameId() const { return frame_id_; }
    int getLaneCount() const { return roi_handler_.getLaneCount(); }
    const SessionTotals& getSessionTotals() const { return session_.getTotals(); }
    const SessionAggregator& getSession() const { return session_; }
};

#endif // TRAFFIC_CORE_H
