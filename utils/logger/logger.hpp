#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>

/**
 * @brief 로거 설정 파일 경로 지정 (getLogger 최초 호출 전에 사용)
 * @param config_path config.json 경로
 */
void setLoggerConfigPath(const std::string& config_path);

/**
 * @brief 이름별 일자 로테이션 파일 로거 반환
 * @param logger_name 로거 이름 (파일명으로 사용)
 */
std::shared_ptr<spdlog::logger> getLogger(const char* logger_name);
