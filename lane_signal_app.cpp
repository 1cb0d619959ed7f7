/*
 * lane_signal_app.cpp
 *
 * 차로 분석 + 신호 우선순위 스케줄러 실행 진입점
 * - 트래커 출력(JSON Lines)을 프레임 단위로 읽어 SystemManager에 전달
 * - SIGINT/SIGTERM 수신 시 현재 프레임 이후 정상 종료
 * - 종료 시 세션 요약 출력
 *
 * 사용법: lane-signal-app [config.json] [tracks.jsonl]
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include "common/common_types.h"
#include "server/manager/system_manager.h"
#include "server/source/jsonl/jsonl_track_source.h"
#include "utils/config_manager.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

static std::shared_ptr<spdlog::logger> logger;
static std::atomic<bool> g_stop_requested{false};

// 모듈 인스턴스
static std::unique_ptr<SystemManager> system_manager;
static std::unique_ptr<JsonLinesTrackSource> track_source;

static bool initializeModules(const std::string& config_path, const std::string& tracks_arg);
static void cleanupModules();
static int runFrameLoop();

static void handleSignal(int) {
    g_stop_requested = true;
}

static bool initializeModules(const std::string& config_path, const std::string& tracks_arg) {
    // 1. 로거 설정 경로 지정 후 ConfigManager 초기화
    setLoggerConfigPath(config_path);
    if (!logger) {
        logger = getLogger("LS_lane_signal_app_log");
    }
    logger->info("=== Initializing lane signal modules ===");

    auto& config_manager = ConfigManager::getInstance();
    if (!config_manager.initialize(config_path)) {
        logger->error("Failed to initialize ConfigManager with path: {}", config_path);
        std::cerr << RED << "[ERROR] 설정 오류: " << config_path << RESET << std::endl;
        for (const auto& err : config_manager.getErrors()) {
            std::cerr << RED << "  - " << err << RESET << std::endl;
        }
        return false;
    }
    logger->info("ConfigManager initialized successfully from: {}", config_path);

    // 2. SystemManager (분석 코어, Redis, SQLite)
    system_manager = std::make_unique<SystemManager>();
    if (!system_manager->initialize(getCurTime())) {
        logger->error("Failed to initialize System Manager");
        return false;
    }
    logger->info("System Manager initialized successfully");

    // 3. 트래커 출력 입력
    std::string tracks_path = tracks_arg.empty() ? config_manager.getTracksPath() : tracks_arg;
    if (tracks_path.empty()) {
        logger->error("트래커 입력 경로 없음 (input.tracks_path 또는 인자로 지정)");
        std::cerr << RED << "[ERROR] 트래커 입력 경로 없음" << RESET << std::endl;
        return false;
    }
    track_source = std::make_unique<JsonLinesTrackSource>();
    if (!track_source->initialize(tracks_path)) {
        logger->error("Failed to open track source: {}", tracks_path);
        std::cerr << RED << "[ERROR] 트래커 입력 열기 실패: " << tracks_path << RESET << std::endl;
        return false;
    }
    logger->info("Track source opened: {}", tracks_path);

    // 4. 시작
    system_manager->start();

    logger->info("=== 활성 모듈 요약 ===");
    logger->info("  차로 수: {}", system_manager->getTrafficCore()->getLaneCount());
    logger->info("  Redis: {}", system_manager->getRedisClient() ? "활성" : "비활성");
    logger->info("  SQLite: {}", system_manager->getSQLiteHandler() ? "활성" : "비활성");
    logger->info("  프레임 시각: {}", config_manager.useFrameTimestamps() ? "입력 시각" : "벽시계");
    logger->info("=== All modules initialized successfully ===");
    return true;
}

static void cleanupModules() {
    if (logger) {
        logger->info("=== Cleaning up modules ===");

        auto start = std::chrono::steady_clock::now();
        auto log_time = [&](const char* module) {
            auto end = std::chrono::steady_clock::now();
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
            logger->info("{} cleanup took {} ms", module, ms);
            start = end;
        };

        // 1. 입력 먼저 정리
        if (track_source) {
            track_source->close();
            track_source.reset();
            log_time("TrackSource");
        }

        // 2. SystemManager 정리 (전송 스레드 종료 포함)
        if (system_manager) {
            system_manager->stop();
            system_manager.reset();
            log_time("SystemManager");
        }

        logger->info("=== All modules cleaned up ===");
    }
    // 모든 로거 플러시 및 종료
    spdlog::shutdown();
}

static int runFrameLoop() {
    bool use_frame_ts = CONFIG.useFrameTimestamps();
    TrackFrame frame;

    while (!g_stop_requested.load() && track_source->next(frame)) {
        double now = (use_frame_ts && frame.has_timestamp) ? frame.timestamp : getCurTime();
        try {
            if (!system_manager->processFrame(frame.objects, now)) {
                logger->debug("line {} 건너뜀", frame.line_no);
            }
        } catch (const std::logic_error& e) {
            // 스케줄러 불변식 위반은 복구하지 않음
            logger->critical("불변식 위반 (line {}): {}", frame.line_no, e.what());
            std::cerr << RED << "[FATAL] " << e.what() << RESET << std::endl;
            return EXIT_FAILURE;
        }
    }

    if (g_stop_requested.load()) {
        logger->info("종료 신호 수신 - 프레임 루프 중지");
    }
    logger->info("입력 처리 완료 - 건너뛴 줄: {}, 제외 객체: {}",
                 track_source->getSkippedLines(), track_source->getDroppedObjects());
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    if (argc > 1) {
        config_path = argv[1];
    } else if (std::getenv("LANE_SIGNAL_CONFIG_PATH")) {
        config_path = std::getenv("LANE_SIGNAL_CONFIG_PATH");
    } else {
        config_path = DEFAULT_CONFIG_PATH;
    }
    std::string tracks_arg = argc > 2 ? argv[2] : "";

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    if (!initializeModules(config_path, tracks_arg)) {
        cleanupModules();
        return EXIT_FAILURE;
    }

    int ret = runFrameLoop();

    // 세션 요약 (콘솔)
    std::cout << CYN << system_manager->getTrafficCore()->getSession().formatSummary() << RESET << std::endl;

    cleanupModules();
    return ret;
}
