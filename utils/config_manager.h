/*
 * config_manager.h
 *
 * 싱글톤 패턴의 설정 관리자 헤더
 * config.json 파일을 읽어서 파싱하고 관리
 *
 * 차로 사각형, 속도/돌발/추세/유량/신호 설정을 초기화 시 한 번
 * AnalyticsConfig로 캐싱하고 검증
 * 차로가 없거나 잘못된 설정이면 초기화 실패 (코어 구동 불가)
 */

#ifndef CONFIG_MANAGER_H
#define CONFIG_MANAGER_H

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <json/json.h>
#include "../common/config_types.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

// 싱글톤 매크로
#define CONFIG ConfigManager::getInstance()

/**
 * @brief 설정 관리자 싱글톤 클래스
 *
 * config.json 파일을 읽고 파싱하여 전역적으로 설정에 접근
 */
class ConfigManager {
private:
    static std::unique_ptr<ConfigManager> instance;
    static std::mutex instance_mutex;

    Json::Value config_root;
    std::string config_path_;
    std::shared_ptr<spdlog::logger> logger = nullptr;

    // 설정값 캐시 (초기화 시 한 번만 계산)
    struct CachedFlags {
        // System
        std::string log_level = "info";
        bool use_frame_timestamps = true;
        int log_interval_frames = 30;

        // Redis
        bool redis_enabled = true;
        std::string redis_host = "127.0.0.1";
        int redis_port = 6379;
        int publish_interval_ms = 500;
        std::map<std::string, std::string> redis_channels;

        // SQLite
        bool sqlite_enabled = true;

        // Paths
        std::string base_path = ".";
        std::string log_path;
        std::string db_path;
        std::string db_filename = "lane_signal.db";
        std::string tracks_path;

        // 분석 설정
        AnalyticsConfig analytics;
    } cached_flags;

    // 설정 오류 메시지 (검증 실패 원인, 값 조회 중 형식 오류 포함)
    mutable std::vector<std::string> errors_;

    // private 생성자 (싱글톤)
    ConfigManager() = default;

    bool loadConfig(const std::string& path);
    bool validate();
    void cacheAllFlags();           // 모든 설정 캐싱
    void logAllSettings() const;    // 모든 설정값 로그 출력
    bool parseLanes();              // lanes 배열 파싱
    const Json::Value* getJsonValue(const std::string& key) const;
    void reportTypeError(const std::string& key, const char* expected) const;

public:
    // 싱글톤 인스턴스 접근
    static ConfigManager& getInstance();

    /**
     * @brief 초기화 (재호출 시 새 파일로 다시 로드)
     * @param config_path config.json 경로
     * @return 로드 및 검증 성공 시 true
     */
    bool initialize(const std::string& config_path = "config/config.json");

    /**
     * @brief 검증 실패 원인 목록
     */
    const std::vector<std::string>& getErrors() const { return errors_; }

    // Path 관련
    std::string getBasePath() const { return cached_flags.base_path; }
    std::string getLogPath() const { return cached_flags.log_path; }
    std::string getDatabasePath() const { return cached_flags.db_path; }
    std::string getDBFileName() const { return cached_flags.db_filename; }
    std::string getTracksPath() const { return cached_flags.tracks_path; }
    std::string getFullPath(const std::string& relative_path) const;

    // System 설정 (캐시된 값 반환)
    std::string getLogLevel() const { return cached_flags.log_level; }
    bool useFrameTimestamps() const { return cached_flags.use_frame_timestamps; }
    int getLogIntervalFrames() const { return cached_flags.log_interval_frames; }

    // 분석 설정 (캐시된 값 반환)
    const AnalyticsConfig& getAnalyticsConfig() const { return cached_flags.analytics; }

    // Redis 설정 (캐시된 값 반환)
    bool isRedisEnabled() const { return cached_flags.redis_enabled; }
    std::string getRedisHost() const { return cached_flags.redis_host; }
    int getRedisPort() const { return cached_flags.redis_port; }
    int getPublishIntervalMs() const { return cached_flags.publish_interval_ms; }
    std::string getRedisChannel(const std::string& channel_key) const;

    // SQLite 설정
    bool isSQLiteEnabled() const { return cached_flags.sqlite_enabled; }

    // Helper methods (키가 있는데 형식이 다르면 오류로 기록하고 기본값 반환)
    std::string getString(const std::string& key, const std::string& default_value = "") const;
    int getInt(const std::string& key, int default_value = 0) const;
    double getDouble(const std::string& key, double default_value = 0.0) const;
    bool getBool(const std::string& key, bool default_value = false) const;
};

#endif // CONFIG_MANAGER_H
