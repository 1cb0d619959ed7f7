#include "logger.hpp"
#include <sys/stat.h>
#include <sys/types.h>
#include <fstream>
#include <iostream>
#include <mutex>
#include <json/json.h>

// config.json에서 읽은 로거 설정 (최초 getLogger 호출 시 로드)
struct LoggerSettings {
    std::string config_path = "config/config.json";
    std::string log_path = "logs";
    spdlog::level::level_enum level = spdlog::level::info;
    bool loaded = false;
};

static LoggerSettings g_settings;
static std::mutex g_logger_mutex;

// 문자열을 spdlog 레벨로 변환 (알 수 없으면 info)
static spdlog::level::level_enum parseLevel(const std::string& level_str) {
    if (level_str == "trace") return spdlog::level::trace;
    if (level_str == "debug") return spdlog::level::debug;
    if (level_str == "info") return spdlog::level::info;
    if (level_str == "warn" || level_str == "warning") return spdlog::level::warn;
    if (level_str == "error") return spdlog::level::err;
    if (level_str == "critical") return spdlog::level::critical;
    if (level_str == "off") return spdlog::level::off;
    return spdlog::level::info;
}

// paths.logs 해석 (상대 경로는 base_path 기준)
static std::string resolveLogPath(const Json::Value& root) {
    const Json::Value& paths = root["paths"];
    if (!paths.isObject() || !paths["logs"].isString()) {
        return "logs";
    }
    std::string logs = paths["logs"].asString();
    if (logs.empty()) {
        return "logs";
    }
    if (logs[0] == '/') {
        return logs;
    }
    std::string base = paths.get("base_path", "").asString();
    return base.empty() ? logs : base + "/" + logs;
}

static void loadSettings() {
    if (g_settings.loaded) {
        return;
    }
    g_settings.loaded = true;
    g_settings.log_path = "logs";
    g_settings.level = spdlog::level::info;

    std::ifstream config_file(g_settings.config_path);
    if (!config_file.is_open()) {
        std::cerr << "[Logger] config 없음, 기본값 사용: " << g_settings.config_path << std::endl;
        return;
    }

    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errs;
    if (!Json::parseFromStream(builder, config_file, &root, &errs)) {
        std::cerr << "[Logger] config 파싱 실패: " << errs << std::endl;
        return;
    }

    g_settings.log_path = resolveLogPath(root);
    if (root["system"].isObject() && root["system"]["log_level"].isString()) {
        g_settings.level = parseLevel(root["system"]["log_level"].asString());
    }
    auto level_name = spdlog::level::to_string_view(g_settings.level);
    std::cout << "[Logger] Configuration loaded - Path: " << g_settings.log_path
              << ", Level: " << std::string(level_name.data(), level_name.size()) << std::endl;
}

// 로그 디렉토리 생성 (중간 경로 포함), 실패 시 false
static bool ensureDirectory(const std::string& path) {
    struct stat st = {};
    if (stat(path.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }
    size_t slash = path.find_last_of('/');
    if (slash != std::string::npos && slash > 0) {
        if (!ensureDirectory(path.substr(0, slash))) {
            return false;
        }
    }
    return mkdir(path.c_str(), 0755) == 0;
}

void setLoggerConfigPath(const std::string& config_path) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_settings.config_path = config_path;
    g_settings.loaded = false;
    loadSettings();

    // 이미 만들어진 로거에도 새 레벨 적용
    spdlog::level::level_enum level = g_settings.level;
    spdlog::apply_all([level](std::shared_ptr<spdlog::logger> l) { l->set_level(level); });
}

std::shared_ptr<spdlog::logger> getLogger(const char* logger_name) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    loadSettings();

    auto existing_logger = spdlog::get(logger_name);
    if (existing_logger != nullptr) {
        return existing_logger;
    }

    if (!ensureDirectory(g_settings.log_path)) {
        std::cerr << "[Logger] 로그 디렉토리 생성 실패, /tmp 사용: " << g_settings.log_path << std::endl;
        g_settings.log_path = "/tmp";
    }

    // 로거별 날짜 로테이션 파일 (매일 23:59)
    std::string log_file = g_settings.log_path + "/" + std::string(logger_name) + ".txt";
    std::shared_ptr<spdlog::logger> file_logger = spdlog::daily_logger_mt(logger_name, log_file, 23, 59);

    file_logger->set_level(g_settings.level);
    file_logger->flush_on(spdlog::level::info);

    // 첫 번째 로거를 기본 로거로 설정
    static bool first_logger = true;
    if (first_logger) {
        spdlog::set_default_logger(file_logger);
        first_logger = false;
    }

    return file_logger;
}
