#ifndef REDIS_CLIENT_H
#define REDIS_CLIENT_H

#include <chrono>
#include <cstdint>
#include <hiredis/hiredis.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

/**
 * @brief Redis PUBLISH 클라이언트
 * 
 * 스냅샷/과속/돌발 채널로 JSON 문자열 전송
 * 채널명은 생성 시 설정에서 한 번 읽어 고정
 * 연결이 끊기면 reconnect_interval 간격으로만 재연결 시도
 * 전송 실패는 반환값으로만 알리며 분석 루프를 멈추지 않음
 */
class RedisClient {
private:
    struct ChannelStats {
        uint64_t published = 0;
        uint64_t failed = 0;
    };

    redisContext* redis_cli = nullptr;
    std::string redis_server_ip;
    int redis_server_port;

    // 채널 타입 -> 채널명
    std::map<int, std::string> channel_names;

    // 연결 및 통계는 connection_mutex로 보호
    mutable std::mutex connection_mutex;
    bool connection_valid = false;
    std::chrono::steady_clock::time_point last_reconnect_attempt;
    const std::chrono::seconds reconnect_interval{5};
    std::map<int, ChannelStats> channel_stats;

    std::shared_ptr<spdlog::logger> logger;

    // 아래 함수들은 connection_mutex를 잡은 상태에서 호출
    int connectLocked();
    bool pingLocked();
    bool ensureConnectionLocked();
    void releaseLocked();

public:
    /**
     * @brief 생성자 (ConfigManager의 redis.host / redis.port 사용)
     */
    RedisClient();

    /**
     * @brief 생성자
     * @param ip Redis 서버 IP
     * @param port Redis 서버 포트
     */
    RedisClient(const std::string& ip, int port);
    ~RedisClient();

    /**
     * @brief 채널로 데이터 전송
     * @param channel_type 채널 타입 (channel_types.h의 ChannelType)
     * @param data JSON 문자열
     * @return 성공 시 0
     *         -1: 연결 없음
     *         -2: PUBLISH 실패
     *         -3: 잘못된 채널 타입
     *         -4: 빈 데이터
     */
    int sendData(int channel_type, const std::string& data);

    /**
     * @brief 연결 해제 (이후 sendData에서 재연결)
     */
    void disconnect();

    bool isConnected() const;

    /**
     * @brief 채널별 전송 성공/실패 건수 로그
     */
    void logStatistics() const;

    uint64_t getPublishedCount(int channel_type) const;
    uint64_t getFailedCount(int channel_type) const;
};

#endif // REDIS_CLIENT_H
