#include <catch2/catch.hpp>
#include "test_helpers.h"
#include "../data/sqlite/sqlite_handler.h"

static FrameSnapshot makeLaneSnapshot() {
    FrameSnapshot snapshot;
    snapshot.frame_id = 30;
    snapshot.timestamp = 1700000000.0;
    for (int lane = 1; lane <= 2; ++lane) {
        LaneFrameStats stats;
        stats.lane = lane;
        stats.counts = {{"car", lane}, {"truck", 1}};
        stats.total = lane + 1;
        snapshot.lanes.push_back(stats);
    }
    ActiveIncident incident;
    incident.track_id = 4;
    incident.lane = 2;
    snapshot.incidents.push_back(incident);
    return snapshot;
}

TEST_CASE("SQLite handler creates its tables in a new directory", "[sqlite]")
{
    SQLiteHandler db(makeTempDir() + "/db", "lane_signal.db");

    REQUIRE(db.isHealthy());
    REQUIRE(db.tableExists("lane_log"));
    REQUIRE(db.tableExists("speed_violation"));
    REQUIRE_FALSE(db.tableExists("vehicle_log"));
    REQUIRE(db.countRows("lane_log") == 0);
}

TEST_CASE("Lane logs and violations are stored", "[sqlite]")
{
    SQLiteHandler db(makeTempDir(), "lane_signal.db");
    REQUIRE(db.isHealthy());

    REQUIRE(db.insertLaneLog(makeLaneSnapshot()) == 2);
    REQUIRE(db.countRows("lane_log") == 2);

    SpeedViolationEvent event;
    event.timestamp = 1700000000.0;
    event.track_id = 8;
    event.lane = 0;
    event.speed_kmph = 71.2;
    event.label = "bus";
    REQUIRE(db.insertSpeedViolation(30, event) == 0);
    event.lane = 1;
    REQUIRE(db.insertSpeedViolation(31, event) == 0);
    REQUIRE(db.countRows("speed_violation") == 2);

    // 허용된 테이블만 조회
    REQUIRE(db.countRows("sqlite_master") == -1);
}

TEST_CASE("Unopenable database is reported unhealthy", "[sqlite]")
{
    SQLiteHandler db("/proc/lane_signal_no_such_dir", "x.db");

    REQUIRE_FALSE(db.isHealthy());
    REQUIRE(db.insertLaneLog(makeLaneSnapshot()) == -1);
    REQUIRE(db.countRows("lane_log") == -1);
}
