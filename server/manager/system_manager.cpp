/*
 * system_manager.cpp
 * 
 * 차로 분석 시스템 통합 관리 클래스 구현
 * - TrafficCore 결과를 SnapshotStore로 교체 게시
 * - 새 과속/돌발 이벤트를 Redis 큐와 SQLite로 전달
 * - log_interval_frames마다 차로 로그 저장
 */

#include "system_manager.h"
#include <stdexcept>
#include "../core/snapshot_json.h"
#include "../../common/common_types.h"
#include "../../data/redis/channel_types.h"
#include "../../utils/config_manager.h"

SystemManager::SystemManager() {
    logger = getLogger("LS_SystemManager_log");
    logger->info("SystemManager 생성");
}

SystemManager::~SystemManager() {
    stop();
}

bool SystemManager::initialize(double session_start) {
    logger->info("시스템 매니저 초기화 시작");
    
    auto& config = ConfigManager::getInstance();
    log_interval_frames_ = config.getLogIntervalFrames();
    
    // ====== 1단계: 분석 코어 ======
    try {
        core_ = std::make_unique<TrafficCore>(config.getAnalyticsConfig(), session_start);
    } catch (const std::runtime_error& e) {
        logger->critical("TrafficCore 생성 실패: {}", e.what());
        return false;
    }
    snapshot_store_ = std::make_unique<SnapshotStore>();
    logger->info("TrafficCore 초기화 성공 - 차로 수: {}", core_->getLaneCount());
    
    // ====== 2단계: Redis ======
    if (config.isRedisEnabled()) {
        redis_client_ = std::make_unique<RedisClient>();
        if (!redis_client_->isConnected()) {
            logger->warn("Redis 연결 실패 - 재연결하며 계속 진행");
        } else {
            logger->info("Redis 연결 성공");
        }
        publisher_ = std::make_unique<SnapshotPublisher>(redis_client_.get(), snapshot_store_.get(),
                                                         config.getPublishIntervalMs());
    } else {
        logger->info("Redis 비활성 (config.json에서 false로 설정됨)");
    }
    
    // ====== 3단계: SQLite ======
    if (config.isSQLiteEnabled()) {
        sqlite_handler_ = std::make_unique<SQLiteHandler>(config.getDatabasePath(), config.getDBFileName());
        if (!sqlite_handler_->isHealthy()) {
            logger->error("SQLite 초기화 실패 - 저장 비활성화");
            sqlite_handler_.reset();
        } else {
            logger->info("SQLite 초기화 성공");
        }
    } else {
        logger->info("SQLite 비활성 (config.json에서 false로 설정됨)");
    }
    
    logger->info("시스템 매니저 초기화 완료");
    return true;
}

void SystemManager::start() {
    if (running_.load()) {
        logger->warn("시스템 이미 실행 중");
        return;
    }
    
    if (publisher_ && !publisher_->start()) {
        logger->error("전송 스레드 시작 실패 - Redis 전송 비활성화");
        publisher_.reset();
    }
    
    running_ = true;
    logger->info("시스템 시작");
}

void SystemManager::stop() {
    if (!running_.load()) {
        return;
    }
    
    logger->info("시스템 중지 시작");
    running_ = false;
    
    if (publisher_) {
        publisher_->stop();
    }
    
    if (core_) {
        core_->getSession().logSummary();
    }
    
    logger->info("시스템 중지 완료 (건너뛴 프레임: {})", skipped_frames_);
}

bool SystemManager::processFrame(const std::vector<VehicleObservation>& observations, double now) {
    if (!core_->acceptsTimestamp(now)) {
        skipped_frames_++;
        logger->warn("프레임 시각이 증가하지 않음 - 건너뜀 ({:.3f})", now);
        return false;
    }
    
    auto snapshot = std::make_shared<const FrameSnapshot>(core_->processFrame(observations, now));
    
    // 읽는 쪽에는 완성된 스냅샷만 보이도록 한 번에 교체
    snapshot_store_->publish(snapshot);
    
    handleEvents(*snapshot);
    
    if (log_interval_frames_ > 0 && snapshot->frame_id % log_interval_frames_ == 0) {
        logPeriodic(*snapshot);
    }
    return true;
}

void SystemManager::handleEvents(const FrameSnapshot& snapshot) {
    for (const auto& event : snapshot.new_violations) {
        if (sqlite_handler_ && sqlite_handler_->insertSpeedViolation(snapshot.frame_id, event) != 0) {
            logger->error("과속 이벤트 저장 실패 - ID: {}", event.track_id);
        }
        if (publisher_) {
            publisher_->enqueueEvent(CHANNEL_SPEED_VIOLATION, writeCompact(violationToJson(event)));
        }
    }
    
    for (const auto& incident : snapshot.new_incidents) {
        logger->info("[돌발] 정지 차량 발생 - ID: {}, 차로: {}", incident.track_id, incident.lane);
        if (publisher_) {
            Json::Value payload = incidentToJson(incident);
            payload[IncidentJsonKeys::OCCUR_TIME] = formatTime(snapshot.timestamp);
            publisher_->enqueueEvent(CHANNEL_INCIDENT, writeCompact(payload));
        }
    }
}

void SystemManager::logPeriodic(const FrameSnapshot& snapshot) {
    if (sqlite_handler_ && sqlite_handler_->insertLaneLog(snapshot) < 0) {
        logger->error("차로 로그 저장 실패 - frame: {}", snapshot.frame_id);
    }
    
    for (const auto& lane : snapshot.lanes) {
        auto wait_it = snapshot.signal.estimated_wait.find(lane.lane);
        std::string signal = (lane.lane == snapshot.signal.active_lane)
            ? "GO " + std::to_string(snapshot.signal.remaining_seconds) + "s"
            : "RED ~" + std::to_string(wait_it != snapshot.signal.estimated_wait.end() ? wait_it->second : 0) + "s";
        logger->info("[frame {}] Lane {}: {}대 {} LOS {} 유량 {:.1f}/min {} [{}]",
                     snapshot.frame_id, lane.lane, lane.total,
                     LaneTrendTracker::toAscii(lane.trend), lane.los.grade,
                     lane.flow_rate, lane.status, signal);
    }
}
