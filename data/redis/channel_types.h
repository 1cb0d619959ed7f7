#ifndef CHANNEL_TYPES_H
#define CHANNEL_TYPES_H

#include <string>
#include "../../utils/config_manager.h"

/**
 * @brief Redis 채널 타입 열거형
 * 
 * 로컬 Redis의 3개 채널을 정의
 */
enum ChannelType {
    CHANNEL_SNAPSHOT = 0,           // lane_signal:snapshot (프레임 스냅샷 전체)
    CHANNEL_SPEED_VIOLATION = 1,    // lane_signal:speed_violation (과속 이벤트)
    CHANNEL_INCIDENT = 2            // lane_signal:incident (정지 차량 발생)
};

/**
 * @brief 채널 타입 -> 설정 키
 * @param type 채널 타입
 * @return 설정 키 (redis.channels.<key>), 알 수 없으면 빈 문자열
 */
inline std::string getChannelKey(int type) {
    switch (type) {
        case CHANNEL_SNAPSHOT:        return "snapshot";
        case CHANNEL_SPEED_VIOLATION: return "speed_violation";
        case CHANNEL_INCIDENT:        return "incident";
        default:                      return "";
    }
}

/**
 * @brief 채널 타입을 채널명으로 변환
 * @param type 채널 타입
 * @return 채널명 문자열
 */
inline std::string getChannelName(int type) {
    std::string key = getChannelKey(type);
    if (key.empty()) {
        return "unknown_channel";
    }
    return ConfigManager::getInstance().getRedisChannel(key);
}

#endif // CHANNEL_TYPES_H
