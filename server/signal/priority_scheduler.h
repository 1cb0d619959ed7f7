#ifndef PRIORITY_SCHEDULER_H
#define PRIORITY_SCHEDULER_H

#include <map>
#include <memory>
#include "../core/signal_types.h"
#include "../../analytics/speed/speed_types.h"
#include "../../common/config_types.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

/**
 * @brief 차로 우선순위 신호 스케줄러
 *
 * 항상 한 차로만 녹색(active), 나머지는 대기
 * 첫 update에서 1차로를 녹색으로 시작하고, 타이머 만료 시 대기 차로 중
 * 우선순위가 가장 높은 차로로 전환
 *
 *   score = 점유 + trend_priority_weight * 기울기 + 대기시간 / wait_scale_sec
 *
 * 대기시간이 starvation_ceiling_sec 이상인 차로는 forced로 표시되어
 * 모든 점수보다 우선
 * 후보는 녹색 차로 다음 차로부터 순환 순서로 평가하며, 동점(forced끼리 포함)은
 * 먼저 평가된 차로가 선택됨 (보조 키 없음)
 *
 * 현시 중 단축(trim)은 잔여 시간만 줄이며 녹색 차로는 바꾸지 않음
 * 긴급차량 단축이 혼잡 단축보다 우선, 두 단축은 쿨다운을 공유
 * 현시 전환 시 쿨다운 초기화
 *
 * 한 스레드에서만 호출 (프레임 순서대로, 시각은 단조 증가)
 */
class PriorityScheduler {
private:
    SignalConfig config_;
    int lane_count_;

    // 현시 상태
    bool started_ = false;
    int active_lane_ = 1;
    double phase_start_ = 0;
    double phase_deadline_ = 0;
    int phase_duration_ = 0;

    // 단축 쿨다운 (현시 전환 시 해제)
    bool adjusted_ = false;
    double last_adjust_time_ = 0;

    // 차로별 마지막 녹색 시작 시각
    std::map<int, double> last_green_;

    std::shared_ptr<spdlog::logger> logger = nullptr;

    LaneSignalInput getInput(const std::map<int, LaneSignalInput>& lanes, int lane) const;
    bool cooldownElapsed(double now) const;
    bool applyTrim(AdjustmentType type, int trim_sec, int floor_sec, double now,
                   SignalAdjustment& adjustment);
    void startPhase(int lane, const LaneSignalInput& input, double now);
    std::map<int, int> estimateWaits(const std::map<int, LaneSignalInput>& lanes,
                                     double remaining) const;
    void checkInvariants() const;

public:
    /**
     * @brief 생성자
     * @param config 신호 설정
     * @param lane_count 차로 수
     * @throw std::runtime_error 차로 수가 1 미만인 경우
     */
    PriorityScheduler(const SignalConfig& config, int lane_count);
    ~PriorityScheduler() = default;

    /**
     * @brief 프레임 단위 스케줄러 갱신
     * 단축 판정 -> 만료 시 현시 전환 -> 대기 시간 추정 순으로 처리
     * @param lanes 차로별 점유/추세 (없는 차로는 0으로 간주)
     * @param emergency 이번 프레임 긴급차량 상태
     * @param now 현재 시각 (초, 단조 증가)
     * @return 갱신 후 현시 상태
     * @throw std::logic_error 녹색 차로나 현시 시간이 범위를 벗어난 경우
     */
    SignalPhaseState update(const std::map<int, LaneSignalInput>& lanes,
                            const EmergencyState& emergency, double now);

    /**
     * @brief 현시 시간 계산
     * clamp(점유 * occupancy_weight_sec + round(기울기 * trend_weight_sec), min, max)
     */
    int computeDuration(int occupancy, double trend_slope) const;

    /**
     * @brief 대기 차로 우선순위 평가
     * 녹색을 받은 적 없는 차로는 최대 대기 시간만큼 기다린 것으로 간주
     */
    LanePriority evaluatePriority(int lane, const LaneSignalInput& input, double now) const;

    /**
     * @brief 다음 녹색 차로 선택
     * 녹색 차로 다음 차로부터 순환 순서로 평가, 동점은 먼저 평가된 차로
     * 대기 차로가 없으면 (차로 1개) 순환 다음 차로
     * @param forced [out] 선택된 차로가 forced인지 (nullptr 가능)
     */
    int selectNextLane(const std::map<int, LaneSignalInput>& lanes, double now,
                       bool* forced = nullptr) const;

    /**
     * @brief a가 b보다 우선순위가 높은지 (forced > 점수)
     * 둘 다 forced이거나 점수가 같으면 false
     */
    static bool outranks(const LanePriority& a, const LanePriority& b);

    bool isStarted() const { return started_; }
    int getActiveLane() const { return active_lane_; }
    int getLaneCount() const { return lane_count_; }
    double getPhaseDeadline() const { return phase_deadline_; }
    double getLastGreen(int lane) const;
};

#endif // PRIORITY_SCHEDULER_H
