#ifndef SNAPSHOT_PUBLISHER_H
#define SNAPSHOT_PUBLISHER_H

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include "redis_client.h"
#include "../../server/core/snapshot_store.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

/**
 * @brief 스냅샷/이벤트 Redis 전송 스레드
 *
 * publish_interval_ms마다 SnapshotStore의 최신 스냅샷을 읽어 전송
 * 과속/돌발 이벤트는 분석 루프가 큐에 넣고 이 스레드가 꺼내서 전송
 * (분석 루프는 Redis I/O를 기다리지 않음)
 */
class SnapshotPublisher {
private:
    static constexpr size_t MAX_PENDING_EVENTS = 1000;

    // 외부 의존성 (포인터로 참조)
    RedisClient* redis_client_ = nullptr;
    const SnapshotStore* store_ = nullptr;
    int interval_ms_ = 500;

    // 스레드 관련
    std::thread publish_thread_;
    std::atomic<bool> running_{false};
    std::condition_variable cv_;
    std::mutex cv_mutex_;

    // 대기 중인 이벤트 (채널 타입, payload)
    std::deque<std::pair<int, std::string>> pending_events_;
    uint64_t dropped_events_ = 0;

    // 마지막으로 전송한 스냅샷 버전
    uint64_t last_version_ = 0;

    std::shared_ptr<spdlog::logger> logger = nullptr;

    void publishThread();
    void flushEvents();
    void publishLatestSnapshot();

public:
    /**
     * @brief 생성자
     * @param redis_client Redis 클라이언트 포인터
     * @param store 스냅샷 보관소 포인터
     * @param interval_ms 스냅샷 전송 주기 (ms)
     */
    SnapshotPublisher(RedisClient* redis_client, const SnapshotStore* store, int interval_ms);
    ~SnapshotPublisher();

    /**
     * @brief 전송 스레드 시작
     * @return 성공 시 true
     */
    bool start();

    /**
     * @brief 전송 스레드 중지 (남은 이벤트는 전송 후 종료)
     */
    void stop();

    /**
     * @brief 이벤트 전송 요청 (가득 차면 가장 오래된 이벤트 삭제)
     * @param channel_type 채널 타입
     * @param payload JSON 문자열
     */
    void enqueueEvent(int channel_type, std::string payload);

    bool isRunning() const { return running_.load(); }
};

#endif // SNAPSHOT_PUBLISHER_H
