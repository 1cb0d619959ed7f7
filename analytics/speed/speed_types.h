/**
 * @file speed_types.h
 * @brief 과속/긴급차량 판정 결과 타입 정의
 */

#ifndef SPEED_TYPES_H
#define SPEED_TYPES_H

#include <string>

/**
 * @brief 과속 이벤트 (구간이 바뀔 때만 발생)
 */
struct SpeedViolationEvent {
    double timestamp = 0;           // 발생 시각 (unix)
    int track_id = -1;
    int lane = 0;                   // 0: 차로 미판정
    double speed_kmph = 0;          // 소수 첫째 자리 반올림
    std::string label;              // 차종
};

/**
 * @brief 프레임 단위 긴급차량 상태
 * 후보가 여러 대이면 마지막으로 판정된 차량의 차로 (순서 비결정)
 */
struct EmergencyState {
    bool active = false;
    int lane = 0;
};

#endif // SPEED_TYPES_H
