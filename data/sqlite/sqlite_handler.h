/*
 * sqlite_handler.h
 * 
 * SQLite 데이터베이스 핸들러
 * 차로 집계 로그(lane_log)와 과속 이벤트(speed_violation) 저장
 * 두 테이블 모두 24시간 자동 삭제
 */

#ifndef SQLITE_HANDLER_H
#define SQLITE_HANDLER_H

#include <cstdint>
#include <memory>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>
#include "../../server/core/frame_types.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

/**
 * @brief SQLite 데이터베이스 핸들러
 * 
 * 단일 DB 파일에 모든 테이블을 관리
 * 
 * lane_log 스키마 (log_interval_frames 프레임마다 차로별 1행):
 * - row_id: PRIMARY KEY AUTOINCREMENT
 * - frame_unix_tm: 프레임 시각
 * - frame_id: 프레임 번호
 * - lane_no: 차로번호
 * - cars, buses, trucks, motorbikes: 차종별 대수
 * - total: 차로 전체 대수
 * - incident: 해당 차로 정지 차량 돌발 여부 (0/1)
 * - timestamp: DB 저장 시각 (자동)
 * 
 * speed_violation 스키마 (과속 이벤트마다 1행):
 * - row_id, frame_unix_tm, frame_id, track_id
 * - lane_no: 차로번호 (미판정 NULL)
 * - speed_kmh, class
 * - timestamp: DB 저장 시각 (자동)
 */
class SQLiteHandler {
private:
    // 데이터베이스 연결
    sqlite3* main_db = nullptr;
    
    // 데이터베이스 경로 및 파일명
    std::string db_path;
    std::string main_db_name;
    
    // 뮤텍스
    mutable std::mutex db_mutex;
    
    // 로거
    std::shared_ptr<spdlog::logger> logger;
    
    /**
     * @brief 데이터베이스 열기
     * @param db_name 데이터베이스 파일명
     * @return 성공 시 데이터베이스 포인터, 실패 시 nullptr
     */
    sqlite3* openDatabase(const std::string& db_name);
    
    /**
     * @brief SQL 실행 (범용)
     * @param sql SQL 문
     * @return 성공 시 0, 실패 시 음수
     */
    int executeSQL(const std::string& sql);

    /**
     * @brief 테이블, 인덱스, 자동 삭제 트리거 생성
     * @return 성공 시 0, 실패 시 음수
     */
    int createTables();

public:
    /**
     * @brief 생성자
     * @param path DB 디렉토리 (없으면 생성)
     * @param db_name DB 파일명
     */
    SQLiteHandler(const std::string& path, const std::string& db_name);
    
    /**
     * @brief 소멸자
     */
    ~SQLiteHandler();
    
    /**
     * @brief 차로 집계 로그 삽입 (차로별 1행, 한 트랜잭션)
     * @param snapshot 프레임 스냅샷
     * @return 성공 시 삽입한 행 수, 실패 시 음수
     */
    int insertLaneLog(const FrameSnapshot& snapshot);
    
    /**
     * @brief 과속 이벤트 삽입
     * @param frame_id 프레임 번호
     * @param event 과속 이벤트
     * @return 성공 시 0, 실패 시 음수
     */
    int insertSpeedViolation(int64_t frame_id, const SpeedViolationEvent& event);
    
    /**
     * @brief 테이블 행 수 조회
     * @param table_name 테이블명 (lane_log / speed_violation)
     * @return 행 수, 실패 시 음수
     */
    int64_t countRows(const std::string& table_name) const;
    
    /**
     * @brief 데이터베이스 상태 확인
     * @return 정상이면 true
     */
    bool isHealthy() const;
    
    /**
     * @brief 테이블 존재 확인
     * @param table_name 테이블명
     * @return 존재하면 true
     */
    bool tableExists(const std::string& table_name) const;
};

#endif // SQLITE_HANDLER_H
