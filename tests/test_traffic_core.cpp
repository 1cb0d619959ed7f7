#include <catch2/catch.hpp>
#include <stdexcept>
#include <vector>
#include "test_helpers.h"
#include "../server/core/traffic_core.h"

// 세로로 긴 두 차로 (속도 시험용)
static AnalyticsConfig makeTallLaneConfig() {
    AnalyticsConfig config;
    config.lanes.push_back(makeLane(0, 0, 99, 1000));
    config.lanes.push_back(makeLane(101, 0, 200, 1000));
    return config;
}

TEST_CASE("Occupied lane holds green for its computed duration", "[core]")
{
    TrafficCore core(makeTwoLaneConfig(), 0.0);

    std::vector<VehicleObservation> frame;
    for (int i = 0; i < 9; ++i) {
        frame.push_back(makeVehicle(i + 1, "car", 10 + i * 9, 50));
    }

    FrameSnapshot snapshot = core.processFrame(frame, 0.0);
    REQUIRE(snapshot.frame_id == 1);
    REQUIRE(snapshot.vehicle_count == 9);
    REQUIRE(snapshot.lanes.size() == 2);
    REQUIRE(snapshot.lanes[0].total == 9);
    REQUIRE(snapshot.lanes[0].counts.at("car") == 9);
    REQUIRE(snapshot.lanes[0].counts.at("bus") == 0);
    REQUIRE(snapshot.lanes[0].los.grade == "C");
    REQUIRE(snapshot.lanes[0].status == "MODERATE");
    REQUIRE(snapshot.lanes[0].flow_rate == Approx(9.0));
    REQUIRE(snapshot.lanes[1].total == 0);
    REQUIRE(snapshot.lanes[1].los.grade == "A");
    REQUIRE(snapshot.signal.active_lane == 1);
    REQUIRE(snapshot.signal.phase_duration == 27);
    REQUIRE(snapshot.signal.remaining_seconds == 27);
    REQUIRE(snapshot.signal.estimated_wait.at(2) == 27 + 15);

    int incidents = 0;
    for (int t = 1; t <= 27; ++t) {
        snapshot = core.processFrame(frame, static_cast<double>(t));
        incidents += static_cast<int>(snapshot.new_incidents.size());
        if (t < 27) {
            REQUIRE(snapshot.signal.active_lane == 1);
        }
    }

    REQUIRE(snapshot.signal.phase_changed);
    REQUIRE(snapshot.signal.active_lane == 2);
    REQUIRE(snapshot.signal.phase_duration == 15);
    REQUIRE(snapshot.signal.estimated_wait.at(1) == 15 + 27);

    // 정지 차량은 각각 한 번씩 보고
    REQUIRE(incidents == 9);
    REQUIRE(snapshot.incidents.size() == 9);
    REQUIRE(snapshot.session.unique_vehicles == 9);
    REQUIRE(snapshot.session.peak_count == 9);
    REQUIRE(snapshot.session.total_incidents == 9);
    REQUIRE(snapshot.session.frames == 28);
}

TEST_CASE("Fast large vehicle raises a violation and trims the green", "[core]")
{
    TrafficCore core(makeTallLaneConfig(), 0.0);

    // 400px/s = 20m/s = 72km/h
    FrameSnapshot first = core.processFrame({makeVehicle(5, "truck", 150, 100)}, 0.0);
    REQUIRE(first.new_violations.empty());
    REQUIRE_FALSE(first.emergency.active);

    FrameSnapshot second = core.processFrame({makeVehicle(5, "truck", 150, 500)}, 1.0);
    REQUIRE(second.new_violations.size() == 1);
    REQUIRE(second.new_violations[0].track_id == 5);
    REQUIRE(second.new_violations[0].lane == 2);
    REQUIRE(second.new_violations[0].label == "truck");
    REQUIRE(second.new_violations[0].speed_kmph == Approx(72.0));
    REQUIRE(second.emergency.active);
    REQUIRE(second.emergency.lane == 2);
    REQUIRE(second.signal.adjustment.type == AdjustmentType::EMERGENCY);
    REQUIRE(second.signal.remaining_seconds == 10);

    FrameSnapshot third = core.processFrame({makeVehicle(5, "truck", 150, 900)}, 2.0);
    REQUIRE(third.new_violations.empty());
    REQUIRE(third.recent_violations.size() == 1);
    REQUIRE(third.session.total_violations == 1);
}

TEST_CASE("Recent violations keep the newest ten", "[core]")
{
    TrafficCore core(makeTallLaneConfig(), 0.0);

    std::vector<VehicleObservation> start, moved;
    for (int id = 1; id <= 12; ++id) {
        start.push_back(makeVehicle(id, "car", 50, 100));
        moved.push_back(makeVehicle(id, "car", 50, 140));
    }
    core.processFrame(start, 0.0);
    FrameSnapshot snapshot = core.processFrame(moved, 0.1);

    REQUIRE(snapshot.new_violations.size() == 12);
    REQUIRE(snapshot.recent_violations.size() == 10);
    REQUIRE(snapshot.recent_violations.front().track_id == 3);
    REQUIRE(snapshot.recent_violations.back().track_id == 12);
}

TEST_CASE("Labels outside the vehicle vocabulary are ignored", "[core]")
{
    TrafficCore core(makeTwoLaneConfig(), 0.0);

    FrameSnapshot snapshot = core.processFrame(
        {makeVehicle(1, "car", 50, 50), makeVehicle(2, "person", 50, 50)}, 1.0);
    REQUIRE(snapshot.vehicle_count == 1);
    REQUIRE(snapshot.lanes[0].total == 1);
}

TEST_CASE("Vehicles between lanes count toward the frame but no lane", "[core]")
{
    TrafficCore core(makeTwoLaneConfig(), 0.0);

    FrameSnapshot snapshot = core.processFrame({makeVehicle(1, "bus", 100, 50)}, 1.0);
    REQUIRE(snapshot.vehicle_count == 1);
    REQUIRE(snapshot.lanes[0].total == 0);
    REQUIRE(snapshot.lanes[1].total == 0);

    // 고유 ID에는 포함, 최대 차량 수에는 불포함
    REQUIRE(snapshot.session.unique_vehicles == 1);
    REQUIRE(snapshot.session.peak_count == 0);

    snapshot = core.processFrame({makeVehicle(1, "bus", 100, 50), makeVehicle(2, "car", 150, 50)}, 2.0);
    REQUIRE(snapshot.session.unique_vehicles == 2);
    REQUIRE(snapshot.session.peak_count == 1);
    REQUIRE(snapshot.session.peak_time == 2.0);
}

TEST_CASE("Lane count history is sampled every 90 frames and keeps 40 entries", "[core]")
{
    TrafficCore core(makeTwoLaneConfig(), 0.0);
    std::vector<VehicleObservation> frame = {makeVehicle(1, "car", 50, 50),
                                             makeVehicle(2, "car", 150, 50),
                                             makeVehicle(3, "truck", 160, 50)};

    FrameSnapshot snapshot;
    for (int i = 1; i <= 89; ++i) {
        snapshot = core.processFrame(frame, i * 0.5);
    }
    REQUIRE(snapshot.history.empty());

    snapshot = core.processFrame(frame, 45.0);
    REQUIRE(snapshot.frame_id == 90);
    REQUIRE(snapshot.history.size() == 1);
    REQUIRE(snapshot.history[0].timestamp == 45.0);
    REQUIRE(snapshot.history[0].lane_totals.at(1) == 1);
    REQUIRE(snapshot.history[0].lane_totals.at(2) == 2);

    for (int i = 91; i <= 41 * 90; ++i) {
        snapshot = core.processFrame({}, i * 0.5);
    }
    REQUIRE(snapshot.history.size() == 40);
    REQUIRE(snapshot.history.front().timestamp == 90.0);
    REQUIRE(snapshot.history.front().lane_totals.at(1) == 0);
    REQUIRE(snapshot.history.back().timestamp == 41 * 90 * 0.5);
}

TEST_CASE("Frame timestamps must strictly increase", "[core]")
{
    TrafficCore core(makeTwoLaneConfig(), 0.0);

    REQUIRE(core.acceptsTimestamp(5.0));
    core.processFrame({}, 5.0);
    REQUIRE_FALSE(core.acceptsTimestamp(5.0));
    REQUIRE_FALSE(core.acceptsTimestamp(4.0));
    REQUIRE(core.acceptsTimestamp(5.1));

    REQUIRE_THROWS_AS(core.processFrame({}, 5.0), std::logic_error);
    REQUIRE(core.getFrameId() == 1);
}

TEST_CASE("Frame rate is smoothed across frames", "[core]")
{
    TrafficCore core(makeTwoLaneConfig(), 0.0);

    REQUIRE(core.processFrame({}, 0.0).fps == 0.0);
    REQUIRE(core.processFrame({}, 0.1).fps == Approx(10.0));
    REQUIRE(core.processFrame({}, 0.3).fps == Approx(9.5));
}
