/*
 * redis_client.cpp
 * 
 * Redis PUBLISH 클라이언트 구현
 * 스냅샷은 주기 전송(trace 로그), 과속/돌발 이벤트는 발생 시 전송(info 로그)
 */

#include "redis_client.h"
#include "channel_types.h"
#include "../../utils/config_manager.h"

RedisClient::RedisClient()
    : RedisClient(ConfigManager::getInstance().getRedisHost(),
                  ConfigManager::getInstance().getRedisPort()) {
}

RedisClient::RedisClient(const std::string& ip, int port)
    : redis_server_ip(ip), redis_server_port(port) {
    logger = getLogger("LS_RedisClient_log");
    logger->info("RedisClient 초기화 - {}:{}", redis_server_ip, redis_server_port);

    for (int type : {CHANNEL_SNAPSHOT, CHANNEL_SPEED_VIOLATION, CHANNEL_INCIDENT}) {
        channel_names[type] = getChannelName(type);
        channel_stats[type] = ChannelStats();
        logger->info("  채널 [{}]: {}", getChannelKey(type), channel_names[type]);
    }

    std::lock_guard<std::mutex> lock(connection_mutex);
    last_reconnect_attempt = std::chrono::steady_clock::now();
    if (connectLocked() != 0) {
        logger->warn("초기 Redis 연결 실패 - {}초 간격으로 재시도", reconnect_interval.count());
    }
}

RedisClient::~RedisClient() {
    logStatistics();
    disconnect();
}

void RedisClient::releaseLocked() {
    if (redis_cli) {
        redisFree(redis_cli);
        redis_cli = nullptr;
    }
    connection_valid = false;
}

bool RedisClient::pingLocked() {
    redisReply* reply = static_cast<redisReply*>(redisCommand(redis_cli, "PING"));
    if (!reply) {
        return false;
    }
    bool ok = reply->type != REDIS_REPLY_ERROR;
    freeReplyObject(reply);
    return ok;
}

int RedisClient::connectLocked() {
    releaseLocked();

    struct timeval timeout = {2, 0};
    redis_cli = redisConnectWithTimeout(redis_server_ip.c_str(), redis_server_port, timeout);
    if (!redis_cli) {
        logger->error("Redis 연결 할당 실패");
        return -1;
    }
    if (redis_cli->err) {
        logger->error("Redis 연결 실패: {}", redis_cli->errstr);
        releaseLocked();
        return -1;
    }

    if (!pingLocked()) {
        logger->error("Redis PING 실패");
        releaseLocked();
        return -1;
    }

    connection_valid = true;
    logger->info("Redis 연결 성공: {}:{}", redis_server_ip, redis_server_port);
    return 0;
}

bool RedisClient::ensureConnectionLocked() {
    if (connection_valid && redis_cli && redis_cli->err == 0) {
        return true;
    }

    auto now = std::chrono::steady_clock::now();
    if (now - last_reconnect_attempt < reconnect_interval) {
        return false;
    }
    last_reconnect_attempt = now;

    logger->info("Redis 재연결 시도...");
    return connectLocked() == 0;
}

int RedisClient::sendData(int channel_type, const std::string& data) {
    auto name_it = channel_names.find(channel_type);
    if (name_it == channel_names.end()) {
        logger->error("알 수 없는 채널 타입: {}", channel_type);
        return -3;
    }
    const std::string& channel = name_it->second;

    if (data.empty()) {
        logger->warn("빈 데이터 - 채널: {}", channel);
        return -4;
    }

    std::lock_guard<std::mutex> lock(connection_mutex);
    ChannelStats& stats = channel_stats[channel_type];

    if (!ensureConnectionLocked()) {
        logger->debug("Redis 연결 없음 - 채널: {}", channel);
        stats.failed++;
        return -1;
    }

    // PUBLISH (바이너리 안전)
    redisReply* reply = static_cast<redisReply*>(redisCommand(redis_cli, "PUBLISH %b %b",
        channel.c_str(), channel.length(), data.c_str(), data.length()));

    if (!reply) {
        logger->error("Redis PUBLISH 실패 - 채널: {}, 에러: {}", channel, redis_cli->errstr);
        connection_valid = false;
        stats.failed++;
        return -2;
    }

    if (reply->type == REDIS_REPLY_ERROR) {
        logger->error("Redis PUBLISH 오류 응답 - 채널: {}, 에러: {}", channel, reply->str);
        freeReplyObject(reply);
        stats.failed++;
        return -2;
    }

    // 구독자 수
    long long receivers = reply->type == REDIS_REPLY_INTEGER ? reply->integer : 0;
    freeReplyObject(reply);
    stats.published++;

    if (channel_type == CHANNEL_SNAPSHOT) {
        logger->trace("스냅샷 전송 - {} bytes, 구독자 {}", data.length(), receivers);
    } else {
        logger->info("이벤트 전송 - 채널: {}, {} bytes, 구독자 {}", channel, data.length(), receivers);
    }
    return 0;
}

void RedisClient::disconnect() {
    std::lock_guard<std::mutex> lock(connection_mutex);
    if (redis_cli) {
        releaseLocked();
        logger->info("Redis 연결 해제");
    }
}

bool RedisClient::isConnected() const {
    std::lock_guard<std::mutex> lock(connection_mutex);
    return connection_valid;
}

void RedisClient::logStatistics() const {
    std::lock_guard<std::mutex> lock(connection_mutex);
    for (const auto& [type, stats] : channel_stats) {
        logger->info("[Redis] {} - 전송: {}, 실패: {}", getChannelKey(type), stats.published, stats.failed);
    }
}

uint64_t RedisClient::getPublishedCount(int channel_type) const {
    std::lock_guard<std::mutex> lock(connection_mutex);
    auto it = channel_stats.find(channel_type);
    return it == channel_stats.end() ? 0 : it->second.published;
}

uint64_t RedisClient::getFailedCount(int channel_type) const {
    std::lock_guard<std::mutex> lock(connection_mutex);
    auto it = channel_stats.find(channel_type);
    return it == channel_stats.end() ? 0 : it->second.failed;
}
