#include <catch2/catch.hpp>
#include <algorithm>
#include <map>
#include <stdexcept>
#include <vector>
#include "../server/signal/priority_scheduler.h"

static std::map<int, LaneSignalInput> makeInputs(const std::vector<int>& occupancy) {
    std::map<int, LaneSignalInput> inputs;
    for (size_t i = 0; i < occupancy.size(); ++i) {
        inputs[static_cast<int>(i) + 1] = {occupancy[i], 0.0};
    }
    return inputs;
}

static EmergencyState emergencyIn(int lane) {
    EmergencyState state;
    state.active = true;
    state.lane = lane;
    return state;
}

TEST_CASE("Phase duration is clamped occupancy plus rounded trend", "[signal]")
{
    PriorityScheduler scheduler(SignalConfig{}, 2);

    REQUIRE(scheduler.computeDuration(0, 0.0) == 15);
    REQUIRE(scheduler.computeDuration(9, 0.0) == 27);
    REQUIRE(scheduler.computeDuration(9, 0.5) == 29);
    REQUIRE(scheduler.computeDuration(9, 0.125) == 28);
    REQUIRE(scheduler.computeDuration(9, -10.0) == 15);
    REQUIRE(scheduler.computeDuration(40, 0.0) == 90);
}

TEST_CASE("Scheduler requires at least one lane", "[signal]")
{
    REQUIRE_THROWS_AS(PriorityScheduler(SignalConfig{}, 0), std::runtime_error);
}

TEST_CASE("First update starts lane 1 with its computed duration", "[signal]")
{
    PriorityScheduler scheduler(SignalConfig{}, 3);
    REQUIRE_FALSE(scheduler.isStarted());

    SignalPhaseState state = scheduler.update(makeInputs({9, 0, 4}), EmergencyState(), 100.0);

    REQUIRE(scheduler.isStarted());
    REQUIRE(state.active_lane == 1);
    REQUIRE(state.phase_duration == 27);
    REQUIRE(state.remaining_seconds == 27);
    REQUIRE_FALSE(state.phase_changed);

    // 적색 차로 대기 = 잔여 + 해당 차로까지 순환하며 만나는 차로들의 현시 시간
    REQUIRE(state.estimated_wait.size() == 2);
    REQUIRE(state.estimated_wait.at(2) == 27 + 15);
    REQUIRE(state.estimated_wait.at(3) == 27 + 15 + 15);

    state = scheduler.update(makeInputs({9, 0, 4}), EmergencyState(), 100.5);
    REQUIRE(state.remaining_seconds == 26);
}

TEST_CASE("Forced lanes outrank any score and ties keep lane order", "[signal]")
{
    LanePriority forced_short{2, true, 0.0, 125.0};
    LanePriority forced_long{3, true, 0.0, 140.0};
    LanePriority busy{1, false, 500.0, 100.0};

    REQUIRE(PriorityScheduler::outranks(forced_short, busy));
    REQUIRE_FALSE(PriorityScheduler::outranks(busy, forced_short));
    REQUIRE_FALSE(PriorityScheduler::outranks(forced_long, forced_short));
    REQUIRE_FALSE(PriorityScheduler::outranks(forced_short, forced_long));

    LanePriority a{1, false, 3.0, 10.0};
    LanePriority b{2, false, 3.0, 10.0};
    REQUIRE_FALSE(PriorityScheduler::outranks(a, b));
    REQUIRE_FALSE(PriorityScheduler::outranks(b, a));
}

TEST_CASE("Lanes never served are treated as waiting the full ceiling", "[signal]")
{
    PriorityScheduler scheduler(SignalConfig{}, 3);
    scheduler.update(makeInputs({0, 0, 0}), EmergencyState(), 0.0);

    LanePriority p = scheduler.evaluatePriority(3, LaneSignalInput(), 1.0);
    REQUIRE(p.forced);
    REQUIRE(p.waited == Approx(121.0));

    // forced끼리는 녹색 차로 다음 순서로 먼저 나온 차로
    bool forced = false;
    REQUIRE(scheduler.selectNextLane(makeInputs({0, 0, 0}), 1.0, &forced) == 2);
    REQUIRE(forced);
}

TEST_CASE("Forced lanes are taken in cycle order after the green lane", "[signal]")
{
    PriorityScheduler scheduler(SignalConfig{}, 3);
    auto inputs = makeInputs({0, 40, 0});

    scheduler.update(inputs, EmergencyState(), 0.0);
    SignalPhaseState state = scheduler.update(inputs, EmergencyState(), 15.0);
    REQUIRE(state.active_lane == 2);
    REQUIRE(state.phase_duration == 90);

    // 1차로(대기 125초)와 3차로(대기 245초) 모두 forced
    // 3차로가 순환 순서상 먼저
    REQUIRE(scheduler.evaluatePriority(1, inputs.at(1), 125.0).forced);
    REQUIRE(scheduler.evaluatePriority(3, inputs.at(3), 125.0).forced);
    bool forced = false;
    REQUIRE(scheduler.selectNextLane(inputs, 125.0, &forced) == 3);
    REQUIRE(forced);
}

TEST_CASE("Waiting estimate follows the cycle from the green lane", "[signal]")
{
    PriorityScheduler scheduler(SignalConfig{}, 3);
    auto inputs = makeInputs({0, 10, 0});

    scheduler.update(inputs, EmergencyState(), 0.0);
    SignalPhaseState state = scheduler.update(inputs, EmergencyState(), 15.0);
    REQUIRE(state.active_lane == 2);
    REQUIRE(state.remaining_seconds == 30);

    // 3차로: 잔여 30 + 3차로 15, 1차로: 잔여 30 + 3차로 15 + 1차로 15
    REQUIRE(state.estimated_wait.at(3) == 45);
    REQUIRE(state.estimated_wait.at(1) == 60);
}

TEST_CASE("Highest score wins once every lane has been served", "[signal]")
{
    PriorityScheduler scheduler(SignalConfig{}, 3);
    auto inputs = makeInputs({0, 10, 0});
    std::vector<SignalChangeEvent> changes;

    for (int t = 0; t <= 60; ++t) {
        SignalPhaseState state = scheduler.update(inputs, EmergencyState(), static_cast<double>(t));
        if (state.phase_changed) changes.push_back(state.change);
    }

    REQUIRE(changes.size() == 3);
    REQUIRE(changes[0].timestamp == 15.0);
    REQUIRE(changes[0].to_lane == 2);
    REQUIRE(changes[0].forced);
    REQUIRE(changes[0].duration_seconds == 30);

    REQUIRE(changes[1].timestamp == 45.0);
    REQUIRE(changes[1].to_lane == 3);
    REQUIRE(changes[1].forced);

    // 1차로 9점 (0 + 45/5) < 2차로 19점 (10 + 45/5)
    REQUIRE(changes[2].timestamp == 60.0);
    REQUIRE(changes[2].from_lane == 3);
    REQUIRE(changes[2].to_lane == 2);
    REQUIRE_FALSE(changes[2].forced);
}

TEST_CASE("Single lane cycles back to itself", "[signal]")
{
    PriorityScheduler scheduler(SignalConfig{}, 1);
    scheduler.update(makeInputs({0}), EmergencyState(), 0.0);

    SignalPhaseState state = scheduler.update(makeInputs({0}), EmergencyState(), 15.0);
    REQUIRE(state.phase_changed);
    REQUIRE(state.active_lane == 1);
    REQUIRE(state.estimated_wait.empty());
}

TEST_CASE("Emergency trim shortens green and respects the cooldown", "[signal]")
{
    PriorityScheduler scheduler(SignalConfig{}, 2);
    auto inputs = makeInputs({20, 0});

    SignalPhaseState state = scheduler.update(inputs, EmergencyState(), 0.0);
    REQUIRE(state.remaining_seconds == 60);

    state = scheduler.update(inputs, emergencyIn(2), 1.0);
    REQUIRE(state.adjustment.type == AdjustmentType::EMERGENCY);
    REQUIRE(state.adjustment.banner == "EMERGENCY DETECTED | Green shortened by 20s");
    REQUIRE(state.adjustment.remaining_before == Approx(59.0));
    REQUIRE(state.adjustment.remaining_after == Approx(39.0));
    REQUIRE(state.remaining_seconds == 39);

    state = scheduler.update(inputs, emergencyIn(2), 2.0);
    REQUIRE(state.adjustment.type == AdjustmentType::NONE);
    REQUIRE(state.remaining_seconds == 38);

    // 쿨다운 경과 후 바닥값까지만 단축
    state = scheduler.update(inputs, emergencyIn(2), 26.0);
    REQUIRE(state.adjustment.type == AdjustmentType::EMERGENCY);
    REQUIRE(state.remaining_seconds == 10);

    state = scheduler.update(inputs, emergencyIn(2), 27.0);
    REQUIRE(state.adjustment.type == AdjustmentType::NONE);
    REQUIRE(state.remaining_seconds == 9);
}

TEST_CASE("Trims never extend a phase already below the floor", "[signal]")
{
    PriorityScheduler scheduler(SignalConfig{}, 2);
    auto inputs = makeInputs({0, 0});

    scheduler.update(inputs, EmergencyState(), 0.0);
    SignalPhaseState state = scheduler.update(inputs, emergencyIn(2), 7.0);
    REQUIRE(state.adjustment.type == AdjustmentType::NONE);
    REQUIRE(state.remaining_seconds == 8);
}

TEST_CASE("Emergency in the green lane does not trim", "[signal]")
{
    PriorityScheduler scheduler(SignalConfig{}, 2);
    auto inputs = makeInputs({20, 0});

    scheduler.update(inputs, EmergencyState(), 0.0);
    SignalPhaseState state = scheduler.update(inputs, emergencyIn(1), 1.0);
    REQUIRE(state.adjustment.type == AdjustmentType::NONE);
    REQUIRE(state.remaining_seconds == 59);
}

TEST_CASE("Congestion trim needs a cleared green lane and a saturated queue", "[signal]")
{
    PriorityScheduler scheduler(SignalConfig{}, 2);

    scheduler.update(makeInputs({20, 0}), EmergencyState(), 0.0);

    // 최소 유지 시간 전
    SignalPhaseState state = scheduler.update(makeInputs({1, 12}), EmergencyState(), 9.0);
    REQUIRE(state.adjustment.type == AdjustmentType::NONE);

    // 대기 차로가 과포화가 아님
    state = scheduler.update(makeInputs({1, 9}), EmergencyState(), 10.0);
    REQUIRE(state.adjustment.type == AdjustmentType::NONE);

    state = scheduler.update(makeInputs({1, 12}), EmergencyState(), 10.5);
    REQUIRE(state.adjustment.type == AdjustmentType::CONGESTION);
    REQUIRE(state.adjustment.banner == "CONGESTION | Green shortened by 10s");
    REQUIRE(state.remaining_seconds == 39);

    state = scheduler.update(makeInputs({1, 12}), EmergencyState(), 11.0);
    REQUIRE(state.adjustment.type == AdjustmentType::NONE);

    // 잔여 시간이 바닥값 이하면 단축하지 않음
    state = scheduler.update(makeInputs({1, 12}), EmergencyState(), 35.5);
    REQUIRE(state.adjustment.type == AdjustmentType::NONE);
    REQUIRE(state.remaining_seconds == 14);
}

TEST_CASE("Emergency trim takes precedence over congestion", "[signal]")
{
    PriorityScheduler scheduler(SignalConfig{}, 2);

    scheduler.update(makeInputs({20, 0}), EmergencyState(), 0.0);
    SignalPhaseState state = scheduler.update(makeInputs({1, 12}), emergencyIn(2), 10.0);

    REQUIRE(state.adjustment.type == AdjustmentType::EMERGENCY);
    REQUIRE(state.remaining_seconds == 30);
}

TEST_CASE("Phase advance resets the trim cooldown", "[signal]")
{
    PriorityScheduler scheduler(SignalConfig{}, 2);
    auto inputs = makeInputs({0, 0});

    scheduler.update(inputs, EmergencyState(), 0.0);
    SignalPhaseState state = scheduler.update(inputs, emergencyIn(2), 1.0);
    REQUIRE(state.adjustment.type == AdjustmentType::EMERGENCY);
    REQUIRE(state.remaining_seconds == 10);

    state = scheduler.update(inputs, EmergencyState(), 11.0);
    REQUIRE(state.phase_changed);
    REQUIRE(state.active_lane == 2);

    state = scheduler.update(inputs, emergencyIn(1), 12.0);
    REQUIRE(state.adjustment.type == AdjustmentType::EMERGENCY);
    REQUIRE(state.remaining_seconds == 10);
}

// 적색 시간 = 녹색이 끝난 뒤 다시 녹색을 받기까지의 시간
static double runAndMeasureRedTime(int lane_count, const std::vector<int>& occupancy,
                                   bool with_emergencies, int duration_sec) {
    SignalConfig config;
    PriorityScheduler scheduler(config, lane_count);
    auto inputs = makeInputs(occupancy);

    std::map<int, double> red_since;
    for (int lane = 1; lane <= lane_count; ++lane) red_since[lane] = 0.0;

    SignalPhaseState state = scheduler.update(inputs, EmergencyState(), 0.0);
    red_since.erase(state.active_lane);

    int previous_remaining = state.remaining_seconds;
    double worst = 0;
    for (int t = 1; t <= duration_sec; ++t) {
        EmergencyState emergency;
        if (with_emergencies && t % 7 == 0) {
            emergency = emergencyIn((t % lane_count) + 1);
        }
        double now = static_cast<double>(t);
        state = scheduler.update(inputs, emergency, now);

        if (!state.phase_changed) {
            REQUIRE(state.remaining_seconds <= previous_remaining);
        }
        if (state.adjustment.type == AdjustmentType::EMERGENCY) {
            REQUIRE(state.adjustment.remaining_after >= config.emergency_floor_sec);
        }
        if (state.adjustment.type == AdjustmentType::CONGESTION) {
            REQUIRE(state.adjustment.remaining_after >= config.congestion_floor_sec);
        }
        previous_remaining = state.remaining_seconds;

        for (const auto& entry : red_since) {
            worst = std::max(worst, now - entry.second);
        }
        if (state.phase_changed) {
            red_since[state.change.from_lane] = now;
            red_since.erase(state.change.to_lane);
        }
    }
    return worst;
}

TEST_CASE("No lane starves beyond the ceiling plus one phase", "[signal][starvation]")
{
    SignalConfig config;
    const double bound = config.starvation_ceiling_sec + config.max_phase_sec;

    SECTION("three lanes, two saturated") {
        REQUIRE(runAndMeasureRedTime(3, {40, 40, 0}, false, 3000) <= bound);
    }
    SECTION("three lanes, all saturated") {
        REQUIRE(runAndMeasureRedTime(3, {30, 30, 30}, false, 3000) <= bound);
    }
    SECTION("three lanes, one saturated with emergencies") {
        REQUIRE(runAndMeasureRedTime(3, {5, 40, 2}, true, 3000) <= bound);
    }
    SECTION("two lanes, both saturated with emergencies") {
        REQUIRE(runAndMeasureRedTime(2, {40, 40}, true, 3000) <= bound);
    }
}
