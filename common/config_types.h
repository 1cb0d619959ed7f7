/**
 * @file config_types.h
 * @brief 분석 모듈별 설정 구조체
 * 
 * ConfigManager가 config.json에서 읽어 채우고
 * 각 모듈은 생성 시 자신의 설정 구조체만 전달받음
 * 기본값은 현장 기본 운용값
 */

#ifndef CONFIG_TYPES_H
#define CONFIG_TYPES_H

#include <set>
#include <string>
#include <vector>

/**
 * @brief 차로 사각형 (픽셀 좌표, 경계 포함)
 */
struct LaneRect {
    double x1 = 0;
    double y1 = 0;
    double x2 = 0;
    double y2 = 0;
};

/**
 * @brief 속도 추정 및 과속/긴급차량 판정 설정
 */
struct SpeedConfig {
    double pixel_to_meter = 0.05;               // 픽셀 -> 미터 선형 환산 계수
    int history_size = 8;                       // 차량별 위치 이력 최대 개수
    double limit_kmph = 50.0;                   // 제한 속도 (km/h)
    double bucket_kmph = 10.0;                  // 과속 중복 방지 구간 폭 (km/h)
    double emergency_speed_kmph = 40.0;         // 긴급차량 후보 판정 속도 (km/h)
    std::set<std::string> emergency_classes = {"bus", "truck"};  // 긴급차량 후보 차종
};

/**
 * @brief 정지 차량(돌발) 감지 설정
 */
struct IncidentConfig {
    double timeout_sec = 5.0;                   // 정지 판단 시간 (초)
    double movement_tolerance_px = 15.0;        // 이동 허용 거리 (픽셀)
};

/**
 * @brief 차로 추세 설정
 */
struct TrendConfig {
    int window_size = 20;                       // 회귀 샘플 수 (프레임)
    double threshold = 0.15;                    // 상승/하강 판정 기울기
};

/**
 * @brief 차로 유량 설정
 */
struct FlowConfig {
    double horizon_sec = 60.0;                  // 슬라이딩 윈도우 (초)
};

/**
 * @brief 신호 우선순위 스케줄러 설정
 */
struct SignalConfig {
    int min_phase_sec = 15;                     // 현시 최소 시간
    int max_phase_sec = 90;                     // 현시 최대 시간
    int occupancy_weight_sec = 3;               // 차량 1대당 녹색 시간
    int trend_weight_sec = 4;                   // 추세 기울기 1당 녹색 시간
    double trend_priority_weight = 2.0;         // 우선순위 점수의 추세 가중치
    double wait_scale_sec = 5.0;                // 대기 WAIT_SCALE초당 우선순위 1점
    double starvation_ceiling_sec = 120.0;      // 최대 대기 시간 (초과 시 강제 녹색)
    double adjust_cooldown_sec = 25.0;          // 단축 조정 간 최소 간격
    int emergency_trim_sec = 20;                // 긴급차량 단축 시간
    int emergency_floor_sec = 10;               // 긴급차량 단축 후 최소 잔여 시간
    int congestion_trim_sec = 10;               // 혼잡 단축 시간
    int congestion_floor_sec = 15;              // 혼잡 단축 후 최소 잔여 시간
    double congestion_min_hold_sec = 10.0;      // 혼잡 단축 전 최소 녹색 유지 시간
    int congestion_clear_threshold = 2;         // 현 녹색 차로 해소 판단 대수 (이하)
    int congestion_high_threshold = 10;         // 대기 차로 과포화 판단 대수 (이상)
};

/**
 * @brief 분석 코어 전체 설정
 */
struct AnalyticsConfig {
    std::vector<LaneRect> lanes;
    SpeedConfig speed;
    IncidentConfig incident;
    TrendConfig trend;
    FlowConfig flow;
    SignalConfig signal;
};

#endif // CONFIG_TYPES_H
