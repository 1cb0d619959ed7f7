#include "snapshot_publisher.h"
#include "channel_types.h"
#include "../../server/core/snapshot_json.h"

SnapshotPublisher::SnapshotPublisher(RedisClient* redis_client, const SnapshotStore* store,
                                     int interval_ms)
    : redis_client_(redis_client), store_(store), interval_ms_(interval_ms) {
    logger = getLogger("LS_Publisher_log");
    logger->info("SnapshotPublisher 생성 - 주기: {}ms", interval_ms_);
}

SnapshotPublisher::~SnapshotPublisher() {
    stop();
}

bool SnapshotPublisher::start() {
    if (running_.load()) {
        logger->warn("전송 스레드 이미 실행 중");
        return true;
    }

    if (!redis_client_ || !store_) {
        logger->error("RedisClient 또는 SnapshotStore가 NULL");
        return false;
    }

    running_ = true;

    try {
        publish_thread_ = std::thread(&SnapshotPublisher::publishThread, this);
        logger->info("전송 스레드 시작됨");
    } catch (const std::exception& e) {
        running_ = false;
        logger->error("전송 스레드 시작 실패: {}", e.what());
        return false;
    }
    return true;
}

void SnapshotPublisher::stop() {
    if (!running_.load()) {
        return;
    }

    logger->info("전송 스레드 중지 시작");

    running_ = false;
    cv_.notify_all();  // 대기 중인 스레드 즉시 깨우기

    try {
        if (publish_thread_.joinable()) {
            publish_thread_.join();
        }
    } catch (const std::exception& e) {
        logger->error("스레드 종료 중 오류: {}", e.what());
    }

    logger->info("전송 스레드 중지 완료 (버린 이벤트: {})", dropped_events_);
}

void SnapshotPublisher::enqueueEvent(int channel_type, std::string payload) {
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        if (pending_events_.size() >= MAX_PENDING_EVENTS) {
            pending_events_.pop_front();
            dropped_events_++;
            logger->warn("이벤트 큐 가득 참 - 가장 오래된 이벤트 삭제 (누적 {})", dropped_events_);
        }
        pending_events_.emplace_back(channel_type, std::move(payload));
    }
    cv_.notify_one();
}

void SnapshotPublisher::flushEvents() {
    std::deque<std::pair<int, std::string>> events;
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        events.swap(pending_events_);
    }

    for (const auto& [channel_type, payload] : events) {
        int rc = redis_client_->sendData(channel_type, payload);
        if (rc != 0) {
            logger->debug("이벤트 전송 실패 - 채널: {}, 코드: {}", getChannelName(channel_type), rc);
        }
    }
}

void SnapshotPublisher::publishLatestSnapshot() {
    uint64_t version = 0;
    std::shared_ptr<const FrameSnapshot> snapshot = store_->latest(&version);
    if (!snapshot || version == last_version_) {
        return;
    }
    last_version_ = version;

    int rc = redis_client_->sendData(CHANNEL_SNAPSHOT, writeCompact(snapshotToJson(*snapshot)));
    if (rc != 0) {
        logger->debug("스냅샷 전송 실패 - frame: {}, 코드: {}", snapshot->frame_id, rc);
    }
}

void SnapshotPublisher::publishThread() {
    logger->info("전송 스레드 시작 ({}ms 주기)", interval_ms_);

    auto next_publish = std::chrono::steady_clock::now() + std::chrono::milliseconds(interval_ms_);

    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(cv_mutex_);
            cv_.wait_until(lock, next_publish, [this]() {
                return !running_.load() || !pending_events_.empty();
            });
        }

        flushEvents();

        if (std::chrono::steady_clock::now() >= next_publish) {
            publishLatestSnapshot();
            next_publish = std::chrono::steady_clock::now() + std::chrono::milliseconds(interval_ms_);
        }
    }

    // 종료 전 남은 이벤트와 마지막 스냅샷 전송
    flushEvents();
    publishLatestSnapshot();

    logger->info("전송 스레드 종료");
}
