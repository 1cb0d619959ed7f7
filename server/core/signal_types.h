#ifndef SIGNAL_TYPES_H
#define SIGNAL_TYPES_H

#include <map>
#include <string>

/**
 * @brief 스케줄러에 전달되는 차로별 입력 (프레임 단위)
 */
struct LaneSignalInput {
    int occupancy = 0;                 // 차로 점유 대수
    double trend_slope = 0;            // 점유 추세 기울기
};

/**
 * @brief 녹색 시간 단축(trim) 종류
 */
enum class AdjustmentType {
    NONE,
    EMERGENCY,                         // 긴급차량 감지
    CONGESTION                         // 현 녹색 차로 해소 + 대기 차로 과포화
};

/**
 * @brief 이번 프레임에 발생한 단축 정보 (표시용 배너 포함)
 */
struct SignalAdjustment {
    AdjustmentType type = AdjustmentType::NONE;
    int trimmed_sec = 0;               // 단축 설정값
    double remaining_before = 0;
    double remaining_after = 0;
    std::string banner;
};

/**
 * @brief 신호 변경 이벤트 (현시 전환)
 */
struct SignalChangeEvent {
    int from_lane = 0;
    int to_lane = 0;
    double timestamp = 0;
    int duration_seconds = 0;          // 새 현시 지속 시간
    bool forced = false;               // 최대 대기 초과로 강제 선택
};

/**
 * @brief 차로 우선순위 평가 결과
 * forced가 true이면 점수와 무관하게 모든 점수보다 우선
 */
struct LanePriority {
    int lane = 0;
    bool forced = false;
    double score = 0;
    double waited = 0;                 // 마지막 녹색 이후 경과 시간
};

/**
 * @brief 신호 현시 상태 (프레임 단위 출력)
 */
struct SignalPhaseState {
    int active_lane = 0;
    int remaining_seconds = 0;         // 잔여 시간 (내림)
    int phase_duration = 0;            // 현시 시작 시 계산된 시간
    double phase_start = 0;
    double phase_deadline = 0;
    std::map<int, int> estimated_wait; // 적색 차로별 예상 대기 시간
    SignalAdjustment adjustment;       // 이번 프레임 단축 (없으면 NONE)
    bool phase_changed = false;
    SignalChangeEvent change;          // phase_changed일 때 유효
};

#endif
