#include <catch2/catch.hpp>
#include "../analytics/incident/incident_detector.h"

static IncidentConfig makeIncidentConfig() {
    IncidentConfig config;
    config.timeout_sec = 5.0;
    config.movement_tolerance_px = 15.0;
    return config;
}

TEST_CASE("Vehicles outside every lane are not tracked for incidents", "[incident]")
{
    IncidentDetector detector(makeIncidentConfig());

    REQUIRE_FALSE(detector.processVehicle(1, {10, 10}, 0, 0.0));
    REQUIRE_FALSE(detector.processVehicle(1, {10, 10}, 0, 10.0));
    REQUIRE(detector.getTrackedCount() == 0);
    REQUIRE_FALSE(detector.hasIncident(1));
}

TEST_CASE("New incident reports the measured stationary time", "[incident]")
{
    IncidentDetector detector(makeIncidentConfig());

    double stopped_sec = -1;
    REQUIRE_FALSE(detector.processVehicle(4, {50, 50}, 1, 0.0, &stopped_sec));
    REQUIRE_FALSE(detector.processVehicle(4, {50, 50}, 1, 4.6, &stopped_sec));
    REQUIRE(stopped_sec == -1);

    // 프레임 간격 때문에 기준 시간보다 늦게 감지됨
    REQUIRE(detector.processVehicle(4, {50, 50}, 1, 5.4, &stopped_sec));
    REQUIRE(stopped_sec == Approx(5.4));
}

TEST_CASE("A stationary vehicle becomes an incident after the timeout", "[incident]")
{
    IncidentDetector detector(makeIncidentConfig());

    REQUIRE_FALSE(detector.processVehicle(1, {50, 50}, 1, 0.0));
    REQUIRE_FALSE(detector.processVehicle(1, {52, 50}, 1, 4.9));
    REQUIRE_FALSE(detector.hasIncident(1));

    // 발생은 한 번만 보고
    REQUIRE(detector.processVehicle(1, {55, 50}, 1, 5.0));
    REQUIRE(detector.hasIncident(1));
    REQUIRE_FALSE(detector.processVehicle(1, {55, 50}, 1, 6.0));

    auto incidents = detector.getActiveIncidents(6.0);
    REQUIRE(incidents.size() == 1);
    REQUIRE(incidents[0].track_id == 1);
    REQUIRE(incidents[0].lane == 1);
    REQUIRE(incidents[0].position.x == 55);
    REQUIRE(incidents[0].duration == Approx(6.0));
}

TEST_CASE("Jitter within the tolerance does not restart the stop timer", "[incident]")
{
    IncidentDetector detector(makeIncidentConfig());

    detector.processVehicle(2, {100, 100}, 1, 0.0);
    detector.processVehicle(2, {110, 100}, 1, 2.0);
    detector.processVehicle(2, {100, 110}, 1, 4.0);
    REQUIRE(detector.processVehicle(2, {105, 105}, 1, 5.0));
}

TEST_CASE("Moving beyond the tolerance clears the incident", "[incident]")
{
    IncidentDetector detector(makeIncidentConfig());

    detector.processVehicle(3, {0, 50}, 2, 0.0);
    REQUIRE(detector.processVehicle(3, {0, 50}, 2, 5.0));

    REQUIRE_FALSE(detector.processVehicle(3, {40, 50}, 2, 6.0));
    REQUIRE_FALSE(detector.hasIncident(3));
    REQUIRE(detector.getActiveIncidents(6.0).empty());

    // 새 위치에서 다시 정지하면 새로 보고
    REQUIRE_FALSE(detector.processVehicle(3, {40, 50}, 2, 10.0));
    REQUIRE(detector.processVehicle(3, {40, 50}, 2, 11.0));
}

TEST_CASE("Incident state is purged for inactive vehicles", "[incident]")
{
    IncidentDetector detector(makeIncidentConfig());

    detector.processVehicle(1, {0, 0}, 1, 0.0);
    detector.processVehicle(2, {0, 0}, 1, 0.0);
    detector.processVehicle(1, {0, 0}, 1, 5.0);

    detector.evictInactive({2});
    REQUIRE(detector.getTrackedCount() == 1);
    REQUIRE_FALSE(detector.hasIncident(1));
}
