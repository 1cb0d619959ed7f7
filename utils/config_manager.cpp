/*
 * config_manager.cpp
 *
 * 싱글톤 패턴의 설정 관리자 구현
 * config.json 파일을 읽어서 파싱하고 관리
 *
 * 차로 사각형 파싱 및 분석 설정 범위 검증
 */

#include "config_manager.h"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <sys/stat.h>

// 싱글톤 인스턴스 정의
std::unique_ptr<ConfigManager> ConfigManager::instance = nullptr;
std::mutex ConfigManager::instance_mutex;

ConfigManager& ConfigManager::getInstance() {
    std::lock_guard<std::mutex> lock(instance_mutex);
    if (!instance) {
        instance = std::unique_ptr<ConfigManager>(new ConfigManager());
    }
    return *instance;
}

bool ConfigManager::initialize(const std::string& config_path) {
    logger = getLogger("LS_ConfigManager_log");
    logger->info("ConfigManager 초기화 시작: {}", config_path);

    config_path_ = config_path;
    config_root = Json::Value();
    cached_flags = CachedFlags();
    errors_.clear();

    if (!loadConfig(config_path)) {
        logger->error("설정 파일 로드 실패");
        return false;
    }

    // 모든 설정을 캐싱
    cacheAllFlags();

    if (!validate()) {
        for (const auto& err : errors_) {
            logger->error("  - {}", err);
        }
        logger->error("설정 검증 실패 ({}건)", errors_.size());
        return false;
    }

    // 모든 설정 로깅
    logAllSettings();

    logger->info("ConfigManager 초기화 완료");
    return true;
}

void ConfigManager::logAllSettings() const {
    const AnalyticsConfig& a = cached_flags.analytics;

    logger->info("========== CONFIG.JSON 설정값 전체 출력 시작 ==========");

    logger->info("[System 설정]");
    logger->info("  - log_level: {}", cached_flags.log_level);
    logger->info("  - use_frame_timestamps: {}", cached_flags.use_frame_timestamps);
    logger->info("  - log_interval_frames: {}", cached_flags.log_interval_frames);

    logger->info("[차로 설정] {}개", a.lanes.size());
    for (size_t i = 0; i < a.lanes.size(); ++i) {
        logger->info("  - Lane {}: ({}, {}) ~ ({}, {})", i + 1,
                     a.lanes[i].x1, a.lanes[i].y1, a.lanes[i].x2, a.lanes[i].y2);
    }

    logger->info("[속도 설정]");
    logger->info("  - pixel_to_meter: {}", a.speed.pixel_to_meter);
    logger->info("  - history_size: {}", a.speed.history_size);
    logger->info("  - limit_kmph: {}", a.speed.limit_kmph);
    logger->info("  - bucket_kmph: {}", a.speed.bucket_kmph);
    logger->info("  - emergency_speed_kmph: {}", a.speed.emergency_speed_kmph);
    std::ostringstream classes;
    for (const auto& c : a.speed.emergency_classes) classes << c << " ";
    logger->info("  - emergency_classes: {}", classes.str());

    logger->info("[돌발(정지) 설정]");
    logger->info("  - timeout_sec: {}", a.incident.timeout_sec);
    logger->info("  - movement_tolerance_px: {}", a.incident.movement_tolerance_px);

    logger->info("[추세/유량 설정]");
    logger->info("  - trend.window_size: {}", a.trend.window_size);
    logger->info("  - trend.threshold: {}", a.trend.threshold);
    logger->info("  - flow.horizon_sec: {}", a.flow.horizon_sec);

    logger->info("[신호 설정]");
    logger->info("  - phase: {}~{}초", a.signal.min_phase_sec, a.signal.max_phase_sec);
    logger->info("  - occupancy_weight_sec: {}, trend_weight_sec: {}",
                 a.signal.occupancy_weight_sec, a.signal.trend_weight_sec);
    logger->info("  - trend_priority_weight: {}, wait_scale_sec: {}",
                 a.signal.trend_priority_weight, a.signal.wait_scale_sec);
    logger->info("  - starvation_ceiling_sec: {}", a.signal.starvation_ceiling_sec);
    logger->info("  - adjust_cooldown_sec: {}", a.signal.adjust_cooldown_sec);
    logger->debug("    * emergency trim/floor: {}/{}", a.signal.emergency_trim_sec, a.signal.emergency_floor_sec);
    logger->debug("    * congestion trim/floor: {}/{}", a.signal.congestion_trim_sec, a.signal.congestion_floor_sec);
    logger->debug("    * congestion hold/clear/high: {}/{}/{}", a.signal.congestion_min_hold_sec,
                  a.signal.congestion_clear_threshold, a.signal.congestion_high_threshold);

    logger->info("[경로 설정]");
    logger->info("  - base_path: {}", cached_flags.base_path);
    logger->info("  - log_path: {}", cached_flags.log_path);
    logger->info("  - db: {}/{}", getDatabasePath(), cached_flags.db_filename);
    logger->info("  - tracks: {}", cached_flags.tracks_path);

    logger->info("[Redis 설정]");
    logger->info("  - enabled: {}", cached_flags.redis_enabled);
    logger->info("  - host: {}", cached_flags.redis_host);
    logger->info("  - port: {}", cached_flags.redis_port);
    logger->info("  - publish_interval_ms: {}", cached_flags.publish_interval_ms);
    logger->info("  - snapshot: {}", getRedisChannel("snapshot"));
    logger->info("  - speed_violation: {}", getRedisChannel("speed_violation"));
    logger->info("  - incident: {}", getRedisChannel("incident"));

    logger->info("========== CONFIG.JSON 설정값 전체 출력 완료 ==========");
}

bool ConfigManager::loadConfig(const std::string& path) {
    std::ifstream config_file(path);
    if (!config_file.is_open()) {
        logger->error("설정 파일을 열 수 없음: {}", path);
        errors_.push_back("설정 파일을 열 수 없음: " + path);
        return false;
    }

    Json::CharReaderBuilder builder;
    std::string errs;
    if (!Json::parseFromStream(builder, config_file, &config_root, &errs)) {
        logger->error("JSON 파싱 실패: {}", errs);
        errors_.push_back("JSON 파싱 실패: " + errs);
        config_file.close();
        return false;
    }

    config_file.close();

    logger->info("설정 파일 로드 성공");
    return true;
}

void ConfigManager::cacheAllFlags() {
    // System
    cached_flags.log_level = getString("system.log_level", "info");
    cached_flags.use_frame_timestamps = getBool("system.use_frame_timestamps", true);
    cached_flags.log_interval_frames = getInt("system.log_interval_frames", 30);

    // Paths
    cached_flags.base_path = getString("paths.base_path", ".");
    cached_flags.log_path = getFullPath(getString("paths.logs", "logs"));
    cached_flags.db_path = getFullPath(getString("paths.sqlite_db.path", "db"));
    cached_flags.db_filename = getString("paths.sqlite_db.filename", "lane_signal.db");
    cached_flags.tracks_path = getString("input.tracks_path", "");
    if (!cached_flags.tracks_path.empty()) {
        cached_flags.tracks_path = getFullPath(cached_flags.tracks_path);
    }

    // Redis / SQLite
    cached_flags.redis_enabled = getBool("redis.enabled", true);
    cached_flags.redis_host = getString("redis.host", "127.0.0.1");
    cached_flags.redis_port = getInt("redis.port", 6379);
    cached_flags.publish_interval_ms = getInt("redis.publish_interval_ms", 500);
    for (const char* channel : {"snapshot", "speed_violation", "incident"}) {
        cached_flags.redis_channels[channel] =
            getString(std::string("redis.channels.") + channel, std::string("lane_signal:") + channel);
    }
    cached_flags.sqlite_enabled = getBool("paths.sqlite_db.enabled", true);

    // 분석 설정 (기본값은 구조체 초기값)
    AnalyticsConfig& a = cached_flags.analytics;

    a.speed.pixel_to_meter = getDouble("speed.pixel_to_meter", a.speed.pixel_to_meter);
    a.speed.history_size = getInt("speed.history_size", a.speed.history_size);
    a.speed.limit_kmph = getDouble("speed.limit_kmph", a.speed.limit_kmph);
    a.speed.bucket_kmph = getDouble("speed.bucket_kmph", a.speed.bucket_kmph);
    a.speed.emergency_speed_kmph = getDouble("speed.emergency_speed_kmph", a.speed.emergency_speed_kmph);
    const Json::Value* em_classes = getJsonValue("speed.emergency_classes");
    if (em_classes && !em_classes->isArray()) {
        reportTypeError("speed.emergency_classes", "문자열 배열");
    } else if (em_classes) {
        a.speed.emergency_classes.clear();
        for (const auto& c : *em_classes) {
            if (!c.isString()) {
                reportTypeError("speed.emergency_classes", "문자열 배열");
                break;
            }
            a.speed.emergency_classes.insert(c.asString());
        }
    }

    a.incident.timeout_sec = getDouble("incident.timeout_sec", a.incident.timeout_sec);
    a.incident.movement_tolerance_px = getDouble("incident.movement_tolerance_px",
                                                 a.incident.movement_tolerance_px);

    a.trend.window_size = getInt("trend.window_size", a.trend.window_size);
    a.trend.threshold = getDouble("trend.threshold", a.trend.threshold);

    a.flow.horizon_sec = getDouble("flow.horizon_sec", a.flow.horizon_sec);

    SignalConfig& s = a.signal;
    s.min_phase_sec = getInt("signal.min_phase_sec", s.min_phase_sec);
    s.max_phase_sec = getInt("signal.max_phase_sec", s.max_phase_sec);
    s.occupancy_weight_sec = getInt("signal.occupancy_weight_sec", s.occupancy_weight_sec);
    s.trend_weight_sec = getInt("signal.trend_weight_sec", s.trend_weight_sec);
    s.trend_priority_weight = getDouble("signal.trend_priority_weight", s.trend_priority_weight);
    s.wait_scale_sec = getDouble("signal.wait_scale_sec", s.wait_scale_sec);
    s.starvation_ceiling_sec = getDouble("signal.starvation_ceiling_sec", s.starvation_ceiling_sec);
    s.adjust_cooldown_sec = getDouble("signal.adjust_cooldown_sec", s.adjust_cooldown_sec);
    s.emergency_trim_sec = getInt("signal.emergency_trim_sec", s.emergency_trim_sec);
    s.emergency_floor_sec = getInt("signal.emergency_floor_sec", s.emergency_floor_sec);
    s.congestion_trim_sec = getInt("signal.congestion_trim_sec", s.congestion_trim_sec);
    s.congestion_floor_sec = getInt("signal.congestion_floor_sec", s.congestion_floor_sec);
    s.congestion_min_hold_sec = getDouble("signal.congestion_min_hold_sec", s.congestion_min_hold_sec);
    s.congestion_clear_threshold = getInt("signal.congestion_clear_threshold", s.congestion_clear_threshold);
    s.congestion_high_threshold = getInt("signal.congestion_high_threshold", s.congestion_high_threshold);
}

bool ConfigManager::parseLanes() {
    std::vector<LaneRect>& lanes = cached_flags.analytics.lanes;
    lanes.clear();

    if (!config_root.isMember("lanes") || !config_root["lanes"].isArray()) {
        errors_.push_back("lanes 배열이 없음");
        return false;
    }

    const Json::Value& arr = config_root["lanes"];
    for (Json::ArrayIndex i = 0; i < arr.size(); ++i) {
        const Json::Value& item = arr[i];
        if (!item.isArray() || item.size() != 4) {
            errors_.push_back("lanes[" + std::to_string(i) + "]: [x1, y1, x2, y2] 형식이 아님");
            return false;
        }
        for (Json::ArrayIndex k = 0; k < 4; ++k) {
            if (!item[k].isNumeric()) {
                errors_.push_back("lanes[" + std::to_string(i) + "]: 숫자가 아닌 좌표");
                return false;
            }
        }

        // 드래그 방향과 무관하게 좌상단/우하단으로 정규화
        double ax = item[0].asDouble(), ay = item[1].asDouble();
        double bx = item[2].asDouble(), by = item[3].asDouble();
        LaneRect rect;
        rect.x1 = std::min(ax, bx);
        rect.y1 = std::min(ay, by);
        rect.x2 = std::max(ax, bx);
        rect.y2 = std::max(ay, by);

        if (rect.x1 == rect.x2 || rect.y1 == rect.y2) {
            errors_.push_back("lanes[" + std::to_string(i) + "]: 면적이 0인 사각형");
            return false;
        }
        lanes.push_back(rect);
    }

    if (lanes.empty()) {
        errors_.push_back("차로가 0개 - 최소 1개 필요");
        return false;
    }
    return true;
}

// Redis 채널 설정
std::string ConfigManager::getRedisChannel(const std::string& channel_key) const {
    auto it = cached_flags.redis_channels.find(channel_key);
    if (it != cached_flags.redis_channels.end()) {
        return it->second;
    }
    return "lane_signal:" + channel_key;
}

std::string ConfigManager::getFullPath(const std::string& relative_path) const {
    if (relative_path.empty() || relative_path[0] == '/') {
        return relative_path;  // 이미 절대 경로
    }
    return cached_flags.base_path + "/" + relative_path;
}

// Helper 메서드들
std::string ConfigManager::getString(const std::string& key, const std::string& default_value) const {
    const Json::Value* value = getJsonValue(key);
    if (!value) {
        return default_value;
    }
    if (!value->isString()) {
        reportTypeError(key, "문자열");
        return default_value;
    }
    return value->asString();
}

int ConfigManager::getInt(const std::string& key, int default_value) const {
    const Json::Value* value = getJsonValue(key);
    if (!value) {
        return default_value;
    }
    if (!value->isInt()) {
        reportTypeError(key, "정수");
        return default_value;
    }
    return value->asInt();
}

double ConfigManager::getDouble(const std::string& key, double default_value) const {
    const Json::Value* value = getJsonValue(key);
    if (!value) {
        return default_value;
    }
    if (!value->isNumeric()) {
        reportTypeError(key, "숫자");
        return default_value;
    }
    return value->asDouble();
}

bool ConfigManager::getBool(const std::string& key, bool default_value) const {
    const Json::Value* value = getJsonValue(key);
    if (!value) {
        return default_value;
    }
    if (!value->isBool()) {
        reportTypeError(key, "true/false");
        return default_value;
    }
    return value->asBool();
}

void ConfigManager::reportTypeError(const std::string& key, const char* expected) const {
    std::string msg = key + ": " + expected + " 형식이 아님";
    if (logger) logger->error("설정값 형식 오류 - {}", msg);
    errors_.push_back(msg);
}

const Json::Value* ConfigManager::getJsonValue(const std::string& key) const {
    std::vector<std::string> parts;
    std::stringstream ss(key);
    std::string part;

    while (std::getline(ss, part, '.')) {
        parts.push_back(part);
    }

    const Json::Value* current = &config_root;

    for (const auto& p : parts) {
        if (!current->isObject() || !current->isMember(p)) {
            return nullptr;
        }
        current = &(*current)[p];
    }

    return current;
}

bool ConfigManager::validate() {
    if (!config_root.isObject()) {
        errors_.push_back("최상위가 JSON 객체가 아님");
        return false;
    }

    if (!parseLanes()) {
        cached_flags.analytics.lanes.clear();
    }

    // 경로 유효성 확인
    struct stat st;
    if (stat(cached_flags.base_path.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        errors_.push_back("base_path가 유효하지 않음: " + cached_flags.base_path);
    }

    const AnalyticsConfig& a = cached_flags.analytics;

    if (a.speed.pixel_to_meter <= 0) errors_.push_back("speed.pixel_to_meter는 양수여야 함");
    if (a.speed.history_size < 2) errors_.push_back("speed.history_size는 2 이상이어야 함");
    if (a.speed.bucket_kmph <= 0) errors_.push_back("speed.bucket_kmph는 양수여야 함");
    if (a.speed.limit_kmph <= 0) errors_.push_back("speed.limit_kmph는 양수여야 함");

    if (a.incident.timeout_sec <= 0) errors_.push_back("incident.timeout_sec는 양수여야 함");
    if (a.incident.movement_tolerance_px < 0) errors_.push_back("incident.movement_tolerance_px는 음수일 수 없음");

    if (a.trend.window_size < 3) errors_.push_back("trend.window_size는 3 이상이어야 함");
    if (a.trend.threshold < 0) errors_.push_back("trend.threshold는 음수일 수 없음");

    if (a.flow.horizon_sec <= 0) errors_.push_back("flow.horizon_sec는 양수여야 함");

    const SignalConfig& s = a.signal;
    if (s.min_phase_sec <= 0) errors_.push_back("signal.min_phase_sec는 양수여야 함");
    if (s.max_phase_sec < s.min_phase_sec) errors_.push_back("signal.max_phase_sec < min_phase_sec");
    if (s.wait_scale_sec <= 0) errors_.push_back("signal.wait_scale_sec는 양수여야 함");
    if (s.starvation_ceiling_sec <= 0) errors_.push_back("signal.starvation_ceiling_sec는 양수여야 함");
    if (s.adjust_cooldown_sec < 0) errors_.push_back("signal.adjust_cooldown_sec는 음수일 수 없음");
    if (s.emergency_trim_sec < 0 || s.congestion_trim_sec < 0) {
        errors_.push_back("signal trim 값은 음수일 수 없음");
    }
    if (s.emergency_floor_sec < 0 || s.congestion_floor_sec < 0) {
        errors_.push_back("signal floor 값은 음수일 수 없음");
    }

    if (cached_flags.log_interval_frames <= 0) errors_.push_back("system.log_interval_frames는 양수여야 함");
    if (cached_flags.publish_interval_ms <= 0) errors_.push_back("redis.publish_interval_ms는 양수여야 함");

    return errors_.empty();
}
