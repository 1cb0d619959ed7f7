/*
 * sqlite_handler.cpp
 * 
 * SQLite 데이터베이스 핸들러 구현
 * lane_log / speed_violation (24시간 자동 삭제)
 */

#include "sqlite_handler.h"
#include <sys/stat.h>

SQLiteHandler::SQLiteHandler(const std::string& path, const std::string& db_name)
    : db_path(path), main_db_name(db_name) {
    logger = getLogger("LS_SQLite_log");
    logger->info("SQLiteHandler 초기화 시작");
    
    // SQLite 버전 로그
    logger->info("SQLite runtime version: {}", sqlite3_libversion());
    logger->info("Database configuration - Path: {}, DB: {}", db_path, main_db_name);
    
    // 디렉토리 생성 확인
    struct stat st = {0};
    if (stat(db_path.c_str(), &st) == -1) {
        if (mkdir(db_path.c_str(), 0777) == 0) {
            logger->info("Database directory created: {}", db_path);
        } else {
            logger->error("Failed to create database directory: {}", db_path);
        }
    }
    
    main_db = openDatabase(main_db_name);
    if (!main_db) {
        logger->error("Failed to initialize database");
        return;
    }

    if (createTables() != 0) {
        logger->error("Failed to create tables - database disabled");
        sqlite3_close(main_db);
        main_db = nullptr;
        return;
    }

    logger->info("SQLite database initialized successfully");
}

SQLiteHandler::~SQLiteHandler() {
    logger->info("SQLiteHandler 종료");
    
    if (main_db) {
        sqlite3_close(main_db);
        main_db = nullptr;
    }
}

sqlite3* SQLiteHandler::openDatabase(const std::string& db_name) {
    std::string full_path = db_path + "/" + db_name;
    sqlite3* db = nullptr;
    
    int rc = sqlite3_open(full_path.c_str(), &db);
    if (rc != SQLITE_OK) {
        logger->error("Cannot open database {}: {}", full_path, sqlite3_errmsg(db));
        sqlite3_close(db);
        return nullptr;
    }
    
    // 성능 최적화를 위한 PRAGMA 설정
    const char* pragmas[] = {
        "PRAGMA journal_mode=WAL",
        "PRAGMA synchronous=NORMAL",
        "PRAGMA temp_store=MEMORY"
    };
    for (const char* pragma : pragmas) {
        char* error_msg = nullptr;
        if (sqlite3_exec(db, pragma, nullptr, nullptr, &error_msg) != SQLITE_OK) {
            logger->warn("PRAGMA warning ({}): {}", pragma, error_msg ? error_msg : "unknown");
            sqlite3_free(error_msg);
        }
    }
    
    return db;
}

int SQLiteHandler::executeSQL(const std::string& sql) {
    if (!main_db) return -1;
    
    char* error_msg = nullptr;
    int rc = sqlite3_exec(main_db, sql.c_str(), nullptr, nullptr, &error_msg);
    
    if (rc != SQLITE_OK) {
        logger->error("SQL error: {}", error_msg ? error_msg : "Unknown error");
        sqlite3_free(error_msg);
        return -1;
    }
    
    return 0;
}

int SQLiteHandler::createTables() {
    const char* lane_log_sql = R"SQL(
        CREATE TABLE IF NOT EXISTS lane_log(
            row_id INTEGER PRIMARY KEY AUTOINCREMENT,
            frame_unix_tm REAL,
            frame_id INTEGER,
            lane_no INTEGER,
            cars INTEGER,
            buses INTEGER,
            trucks INTEGER,
            motorbikes INTEGER,
            total INTEGER,
            incident INTEGER,
            timestamp INTEGER DEFAULT (strftime('%s', 'now'))
        );
        CREATE INDEX IF NOT EXISTS idx_lane_log_timestamp ON lane_log(timestamp);
        CREATE INDEX IF NOT EXISTS idx_lane_log_lane_no ON lane_log(lane_no);
    )SQL";

    const char* violation_sql = R"SQL(
        CREATE TABLE IF NOT EXISTS speed_violation(
            row_id INTEGER PRIMARY KEY AUTOINCREMENT,
            frame_unix_tm REAL,
            frame_id INTEGER,
            track_id INTEGER,
            lane_no INTEGER,
            speed_kmh REAL,
            class TEXT,
            timestamp INTEGER DEFAULT (strftime('%s', 'now'))
        );
        CREATE INDEX IF NOT EXISTS idx_speed_violation_timestamp ON speed_violation(timestamp);
    )SQL";

    // 자동 삭제 트리거 생성 (24시간)
    const char* trigger_sql = R"SQL(
        CREATE TRIGGER IF NOT EXISTS cleanup_lane_log AFTER INSERT ON lane_log
        BEGIN 
            DELETE FROM lane_log WHERE timestamp < (strftime('%s', 'now') - 86400);
        END;
        CREATE TRIGGER IF NOT EXISTS cleanup_speed_violation AFTER INSERT ON speed_violation
        BEGIN 
            DELETE FROM speed_violation WHERE timestamp < (strftime('%s', 'now') - 86400);
        END;
    )SQL";

    if (executeSQL(lane_log_sql) != 0) {
        logger->error("Failed to create lane_log");
        return -1;
    }
    if (executeSQL(violation_sql) != 0) {
        logger->error("Failed to create speed_violation");
        return -1;
    }
    if (executeSQL(trigger_sql) != 0) {
        logger->error("Failed to create cleanup triggers");
        return -1;
    }
    return 0;
}

int SQLiteHandler::insertLaneLog(const FrameSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(db_mutex);
    
    if (!main_db) return -1;
    
    const char* sql = R"SQL(
        INSERT INTO lane_log (frame_unix_tm, frame_id, lane_no, cars, buses,
                              trucks, motorbikes, total, incident)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    )SQL";
    
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(main_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        logger->error("Failed to prepare lane_log insert: {}", sqlite3_errmsg(main_db));
        return -1;
    }

    if (executeSQL("BEGIN TRANSACTION") != 0) {
        sqlite3_finalize(stmt);
        return -1;
    }

    int inserted = 0;
    for (const auto& lane : snapshot.lanes) {
        bool has_incident = false;
        for (const auto& incident : snapshot.incidents) {
            if (incident.lane == lane.lane) {
                has_incident = true;
                break;
            }
        }

        auto countOf = [&lane](const std::string& label) {
            auto it = lane.counts.find(label);
            return it == lane.counts.end() ? 0 : it->second;
        };

        sqlite3_bind_double(stmt, 1, snapshot.timestamp);                     // frame_unix_tm
        sqlite3_bind_int64(stmt, 2, snapshot.frame_id);                        // frame_id
        sqlite3_bind_int(stmt, 3, lane.lane);                                  // lane_no
        sqlite3_bind_int(stmt, 4, countOf("car"));                             // cars
        sqlite3_bind_int(stmt, 5, countOf("bus"));                             // buses
        sqlite3_bind_int(stmt, 6, countOf("truck"));                           // trucks
        sqlite3_bind_int(stmt, 7, countOf("motorbike"));                       // motorbikes
        sqlite3_bind_int(stmt, 8, lane.total);                                 // total
        sqlite3_bind_int(stmt, 9, has_incident ? 1 : 0);                       // incident

        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            logger->error("Failed to insert lane_log (lane {}): {}", lane.lane, sqlite3_errmsg(main_db));
            sqlite3_finalize(stmt);
            if (executeSQL("ROLLBACK") != 0) {
                logger->error("ROLLBACK 실패");
            }
            return -1;
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        inserted++;
    }
    sqlite3_finalize(stmt);

    if (executeSQL("COMMIT") != 0) {
        return -1;
    }
    
    logger->debug("lane_log inserted: frame={}, rows={}", snapshot.frame_id, inserted);
    return inserted;
}

int SQLiteHandler::insertSpeedViolation(int64_t frame_id, const SpeedViolationEvent& event) {
    std::lock_guard<std::mutex> lock(db_mutex);
    
    if (!main_db) return -1;
    
    const char* sql = R"SQL(
        INSERT INTO speed_violation (frame_unix_tm, frame_id, track_id, lane_no, speed_kmh, class)
        VALUES (?, ?, ?, ?, ?, ?)
    )SQL";
    
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(main_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        logger->error("Failed to prepare speed_violation insert: {}", sqlite3_errmsg(main_db));
        return -1;
    }
    
    // 파라미터 바인딩 - SQLITE_TRANSIENT 사용 (메모리 안전성)
    sqlite3_bind_double(stmt, 1, event.timestamp);                             // frame_unix_tm
    sqlite3_bind_int64(stmt, 2, frame_id);                                     // frame_id
    sqlite3_bind_int(stmt, 3, event.track_id);                                 // track_id
    if (event.lane > 0) {
        sqlite3_bind_int(stmt, 4, event.lane);                                 // lane_no
    } else {
        sqlite3_bind_null(stmt, 4);
    }
    sqlite3_bind_double(stmt, 5, event.speed_kmph);                            // speed_kmh
    sqlite3_bind_text(stmt, 6, event.label.c_str(), -1, SQLITE_TRANSIENT);     // class
    
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (rc != SQLITE_DONE) {
        logger->error("Failed to insert speed_violation: {}", sqlite3_errmsg(main_db));
        return -1;
    }
    
    logger->debug("speed_violation inserted: ID={}, {:.1f}km/h", event.track_id, event.speed_kmph);
    return 0;
}

int64_t SQLiteHandler::countRows(const std::string& table_name) const {
    if (table_name != "lane_log" && table_name != "speed_violation") {
        return -1;
    }

    std::lock_guard<std::mutex> lock(db_mutex);
    if (!main_db) return -1;

    std::string query = "SELECT COUNT(*) FROM " + table_name;
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(main_db, query.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        logger->error("Failed to prepare count: {}", sqlite3_errmsg(main_db));
        return -1;
    }

    int64_t count = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

bool SQLiteHandler::isHealthy() const {
    std::lock_guard<std::mutex> lock(db_mutex);
    return (main_db != nullptr);
}

bool SQLiteHandler::tableExists(const std::string& table_name) const {
    std::lock_guard<std::mutex> lock(db_mutex);
    if (!main_db) return false;
    
    const char* query = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";
    
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(main_db, query, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sqlite3_bind_text(stmt, 1, table_name.c_str(), -1, SQLITE_TRANSIENT);
    
    bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
    sqlite3_finalize(stmt);
    
    return exists;
}
