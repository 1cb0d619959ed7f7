/**
 * @file common_types.h
 * @brief 전역 상수, 차종 어휘, 시간 헬퍼 정의
 * 
 * 차로 분석 코어 전체에서 사용되는 시스템 전역 상수와
 * 타입 매핑을 포함
 */

#ifndef COMMON_TYPES_H
#define COMMON_TYPES_H

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <map>
#include <string>
#include <vector>

// 콘솔 출력용 ANSI 컬러 코드
#define RED     "\x1b[31m"
#define GRN     "\x1b[32m"
#define YEL     "\x1b[33m"
#define CYN     "\x1b[36m"
#define RESET   "\x1b[0m"

// 시스템 기본값
const std::string DEFAULT_CONFIG_PATH = "config/config.json";

// 트래커가 전달하는 차종 라벨 (고정 어휘)
const std::vector<std::string> VEHICLE_LABELS = {"car", "bus", "truck", "motorbike"};

// 라벨 -> 로그/DB 컬럼명 매핑 (lane_log 테이블 컬럼 순서와 동일)
const std::map<std::string, std::string> VEHICLE_COLUMN_MAP = {
    {"car", "cars"},
    {"bus", "buses"},
    {"truck", "trucks"},
    {"motorbike", "motorbikes"}
};

// 속도 단위 변환 (m/s -> km/h)
const double MPS_TO_KMPH = 3.6;

// 차로 혼잡 상태 문자열 기준 (대수)
const int LANE_STATUS_MODERATE = 5;
const int LANE_STATUS_CONGESTED = 15;

/**
 * @brief 차종 어휘에 포함된 라벨인지 확인
 */
inline bool isVehicleLabel(const std::string& label) {
    return std::find(VEHICLE_LABELS.begin(), VEHICLE_LABELS.end(), label) != VEHICLE_LABELS.end();
}

/**
 * @brief 차로 차량 수에 따른 혼잡 상태 문자열
 */
inline std::string getLaneStatus(int total) {
    if (total < LANE_STATUS_MODERATE) return "CLEAR";
    if (total < LANE_STATUS_CONGESTED) return "MODERATE";
    return "CONGESTED";
}

/**
 * @brief 현재 Unix 시간 (초, 소수점 포함)
 */
inline double getCurTime() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::microseconds>(now).count() / 1e6;
}

/**
 * @brief Unix 시간을 로컬 시각 문자열로 변환
 * @param timestamp Unix 시간 (초)
 * @param format strftime 포맷 (기본: ISO 8601 초 단위)
 */
inline std::string formatTime(double timestamp, const char* format = "%Y-%m-%dT%H:%M:%S") {
    std::time_t t = static_cast<std::time_t>(std::floor(timestamp));
    std::tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[64];
    if (std::strftime(buf, sizeof(buf), format, &tm_buf) == 0) {
        return "";
    }
    return std::string(buf);
}

#endif // COMMON_TYPES_H
