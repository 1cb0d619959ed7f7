/*
 * system_manager.h
 * 
 * 차로 분석 시스템 통합 관리 클래스
 * - 분석 코어(TrafficCore)와 I/O 모듈의 초기화 및 생명주기 관리
 * - 프레임 처리 결과를 스냅샷 보관소, Redis, SQLite로 전달
 * - 시스템 시작/중지
 */

#ifndef SYSTEM_MANAGER_H
#define SYSTEM_MANAGER_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "../core/snapshot_store.h"
#include "../core/traffic_core.h"
#include "../../data/redis/redis_client.h"
#include "../../data/redis/snapshot_publisher.h"
#include "../../data/sqlite/sqlite_handler.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

/**
 * @brief 차로 분석 시스템 통합 관리 클래스
 * 
 * 관리 모듈:
 * - TrafficCore: 차로 분석 + 신호 스케줄링 (프레임 루프 스레드 전용)
 * - SnapshotStore: 최신 스냅샷 공유
 * - RedisClient / SnapshotPublisher: 스냅샷 및 이벤트 전송 (별도 스레드)
 * - SQLiteHandler: 차로 로그, 과속 이벤트 저장
 * 
 * Redis/SQLite 실패는 로그만 남기고 분석 루프는 계속 진행
 */
class SystemManager {
private:
    // 핵심 모듈들
    std::unique_ptr<TrafficCore> core_;
    std::unique_ptr<SnapshotStore> snapshot_store_;
    std::unique_ptr<RedisClient> redis_client_;
    std::unique_ptr<SnapshotPublisher> publisher_;
    std::unique_ptr<SQLiteHandler> sqlite_handler_;
    
    // 설정 캐시
    int log_interval_frames_ = 30;
    
    // 상태 추적
    std::atomic<bool> running_{false};
    int64_t skipped_frames_ = 0;
    
    // 로거
    std::shared_ptr<spdlog::logger> logger = nullptr;
    
    // 내부 메서드
    void handleEvents(const FrameSnapshot& snapshot);
    void logPeriodic(const FrameSnapshot& snapshot);

public:
    SystemManager();
    ~SystemManager();
    
    /**
     * @brief 시스템 초기화 (ConfigManager는 이미 초기화되어 있어야 함)
     * @param session_start 세션 시작 시각
     * @return 성공 시 true (차로 설정 오류 시 false)
     */
    bool initialize(double session_start);
    
    /**
     * @brief 시스템 시작 (전송 스레드 시작)
     */
    void start();
    
    /**
     * @brief 시스템 중지
     */
    void stop();
    
    /**
     * @brief 한 프레임 처리
     * @param observations 차량 관측 목록
     * @param now 프레임 시각
     * @return 처리했으면 true, 시각이 역행하여 건너뛰었으면 false
     * @throw std::logic_error 스케줄러 불변식 위반 (복구 불가)
     */
    bool processFrame(const std::vector<VehicleObservation>& observations, double now);
    
    /**
     * @brief 모듈 참조 반환 (외부 모듈에서 사용)
     */
    TrafficCore* getTrafficCore() { return core_.get(); }
    SnapshotStore* getSnapshotStore() { return snapshot_store_.get(); }
    RedisClient* getRedisClient() { return redis_client_.get(); }
    SQLiteHandler* getSQLiteHandler() { return sqlite_handler_.get(); }
    
    int64_t getSkippedFrames() const { return skipped_frames_; }
    bool isRunning() const { return running_.load(); }
};

#endif // SYSTEM_MANAGER_H
