#include <catch2/catch.hpp>
#include "../analytics/flow/flow_rate_tracker.h"
#include "../analytics/los/los_grader.h"
#include "../analytics/trend/lane_trend_tracker.h"

TEST_CASE("LOS grades follow the occupancy table", "[los]")
{
    REQUIRE(gradeLOS(0).grade == "A");
    REQUIRE(gradeLOS(3).grade == "A");
    REQUIRE(gradeLOS(4).grade == "B");
    REQUIRE(gradeLOS(6).grade == "B");
    REQUIRE(gradeLOS(7).grade == "C");
    REQUIRE(gradeLOS(10).grade == "C");
    REQUIRE(gradeLOS(11).grade == "D");
    REQUIRE(gradeLOS(15).grade == "D");
    REQUIRE(gradeLOS(16).grade == "E");
    REQUIRE(gradeLOS(22).grade == "E");

    LosGrade f = gradeLOS(23);
    REQUIRE(f.grade == "F");
    REQUIRE(f.color == "#dc2626");
    REQUIRE(f.description == "Forced / breakdown");
    REQUIRE(gradeLOS(500).grade == "F");
}

TEST_CASE("Trend slope is zero until three samples exist", "[trend]")
{
    LaneTrendTracker tracker(TrendConfig{});

    REQUIRE(tracker.getSlope(1) == 0.0);
    tracker.addSample(1, 0);
    tracker.addSample(1, 10);
    REQUIRE(tracker.getSlope(1) == 0.0);
    REQUIRE(tracker.getDirection(1) == TrendDirection::STABLE);
}

TEST_CASE("Trend direction follows the least-squares slope", "[trend]")
{
    TrendConfig config;
    config.window_size = 20;
    config.threshold = 0.15;
    LaneTrendTracker tracker(config);

    for (int v : {0, 1, 2, 3}) tracker.addSample(1, v);
    REQUIRE(tracker.getSlope(1) == Approx(1.0));
    REQUIRE(tracker.getDirection(1) == TrendDirection::RISING);

    for (int v : {9, 6, 3}) tracker.addSample(2, v);
    REQUIRE(tracker.getSlope(2) == Approx(-3.0));
    REQUIRE(tracker.getDirection(2) == TrendDirection::FALLING);

    for (int v : {4, 4, 4, 4}) tracker.addSample(3, v);
    REQUIRE(tracker.getSlope(3) == Approx(0.0));
    REQUIRE(tracker.getDirection(3) == TrendDirection::STABLE);

    REQUIRE(LaneTrendTracker::toAscii(TrendDirection::RISING) == "^");
    REQUIRE(LaneTrendTracker::toSign(TrendDirection::FALLING) == -1);
    REQUIRE(LaneTrendTracker::toGlyph(TrendDirection::STABLE) == "→");
}

TEST_CASE("Trend window drops the oldest samples", "[trend]")
{
    TrendConfig config;
    config.window_size = 3;
    LaneTrendTracker tracker(config);

    for (int v : {0, 10, 10, 10}) tracker.addSample(1, v);
    REQUIRE(tracker.getSampleCount(1) == 3);
    REQUIRE(tracker.getSlope(1) == Approx(0.0));
}

TEST_CASE("Flow rate counts unique vehicles per minute", "[flow]")
{
    FlowConfig config;
    config.horizon_sec = 60.0;
    FlowRateTracker flow(config);

    for (int t = 0; t <= 10; ++t) {
        flow.record(1, 5, static_cast<double>(t));
    }
    REQUIRE(flow.getUniqueCount(1, 10.0) == 1);
    REQUIRE(flow.getRate(1, 10.0) == Approx(1.0));

    flow.record(1, 6, 10.0);
    REQUIRE(flow.getRate(1, 10.0) == Approx(2.0));
    REQUIRE(flow.getRate(2, 10.0) == 0.0);
}

TEST_CASE("Flow entries expire after the horizon", "[flow]")
{
    FlowConfig config;
    config.horizon_sec = 60.0;
    FlowRateTracker flow(config);

    flow.record(1, 5, 10.0);
    REQUIRE(flow.getRate(1, 70.0) == Approx(1.0));
    REQUIRE(flow.getRate(1, 70.5) == 0.0);
}

TEST_CASE("Flow rate scales with a shorter horizon", "[flow]")
{
    FlowConfig config;
    config.horizon_sec = 30.0;
    FlowRateTracker flow(config);

    flow.record(2, 1, 0.0);
    REQUIRE(flow.getRate(2, 1.0) == Approx(2.0));
}
