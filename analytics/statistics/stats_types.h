#ifndef STATS_TYPES_H
#define STATS_TYPES_H

#include <cstdint>
#include <string>

/**
 * @brief 세션 누적 통계 (프로세스 수명 동안 단조 증가)
 */
struct SessionTotals {
    double session_start = 0;          // 세션 시작 시각 (unix)
    double last_update = 0;            // 마지막 프레임 시각
    int unique_vehicles = 0;           // 지금까지 본 고유 차량 ID 수
    int peak_count = 0;                // 한 프레임 최대 차량 수
    double peak_time = 0;              // 최대 차량 수 발생 시각
    int total_incidents = 0;           // 누적 정지 차량 돌발 수
    int total_violations = 0;          // 누적 과속 이벤트 수
    int64_t frames = 0;                // 처리한 프레임 수
};

#endif // STATS_TYPES_H
