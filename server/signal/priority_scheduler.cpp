#include "priority_scheduler.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

PriorityScheduler::PriorityScheduler(const SignalConfig& config, int lane_count)
    : config_(config), lane_count_(lane_count) {
    logger = getLogger("LS_Signal_log");

    if (lane_count_ < 1) {
        logger->critical("차로 수가 유효하지 않음: {}", lane_count_);
        throw std::runtime_error("scheduler requires at least one lane");
    }

    logger->info("PriorityScheduler 생성 - 차로 수: {}, 현시: {}~{}초, 최대 대기: {}초",
                 lane_count_, config_.min_phase_sec, config_.max_phase_sec,
                 config_.starvation_ceiling_sec);
}

LaneSignalInput PriorityScheduler::getInput(const std::map<int, LaneSignalInput>& lanes,
                                            int lane) const {
    auto it = lanes.find(lane);
    if (it == lanes.end()) {
        return LaneSignalInput();
    }
    return it->second;
}

int PriorityScheduler::computeDuration(int occupancy, double trend_slope) const {
    long raw = static_cast<long>(occupancy) * config_.occupancy_weight_sec +
               std::lround(trend_slope * config_.trend_weight_sec);
    long clamped = std::min<long>(config_.max_phase_sec, std::max<long>(config_.min_phase_sec, raw));
    return static_cast<int>(clamped);
}

double PriorityScheduler::getLastGreen(int lane) const {
    auto it = last_green_.find(lane);
    return it == last_green_.end() ? 0 : it->second;
}

LanePriority PriorityScheduler::evaluatePriority(int lane, const LaneSignalInput& input,
                                                 double now) const {
    LanePriority priority;
    priority.lane = lane;

    auto it = last_green_.find(lane);
    double last_green = (it == last_green_.end()) ? now - config_.starvation_ceiling_sec : it->second;
    priority.waited = now - last_green;

    if (priority.waited >= config_.starvation_ceiling_sec) {
        priority.forced = true;
        return priority;
    }

    priority.score = input.occupancy +
                     config_.trend_priority_weight * input.trend_slope +
                     priority.waited / config_.wait_scale_sec;
    return priority;
}

bool PriorityScheduler::outranks(const LanePriority& a, const LanePriority& b) {
    if (a.forced != b.forced) {
        return a.forced;
    }
    if (a.forced) {
        return false;
    }
    return a.score > b.score;
}

int PriorityScheduler::selectNextLane(const std::map<int, LaneSignalInput>& lanes, double now,
                                      bool* forced) const {
    bool found = false;
    LanePriority best;

    // 녹색 차로 다음 차로부터 순환 순서로 평가
    for (int step = 1; step < lane_count_; ++step) {
        int lane = ((active_lane_ - 1 + step) % lane_count_) + 1;

        LanePriority candidate = evaluatePriority(lane, getInput(lanes, lane), now);
        logger->debug("[신호] 차로 {} 우선순위 - 점수: {:.2f}, 대기: {:.1f}초, forced: {}",
                      lane, candidate.score, candidate.waited, candidate.forced);

        // 동점이면 먼저 나온 차로 유지
        if (!found || outranks(candidate, best)) {
            best = candidate;
            found = true;
        }
    }

    if (!found) {
        if (forced) *forced = false;
        return (active_lane_ % lane_count_) + 1;
    }

    if (forced) *forced = best.forced;
    return best.lane;
}

bool PriorityScheduler::cooldownElapsed(double now) const {
    return !adjusted_ || (now - last_adjust_time_) >= config_.adjust_cooldown_sec;
}

bool PriorityScheduler::applyTrim(AdjustmentType type, int trim_sec, int floor_sec, double now,
                                  SignalAdjustment& adjustment) {
    double remaining = std::max(0.0, phase_deadline_ - now);
    double new_remaining = std::max(static_cast<double>(floor_sec), remaining - trim_sec);

    // 단축만 허용 (연장 금지)
    if (new_remaining >= remaining) {
        return false;
    }

    phase_deadline_ = now + new_remaining;
    adjusted_ = true;
    last_adjust_time_ = now;

    adjustment.type = type;
    adjustment.trimmed_sec = trim_sec;
    adjustment.remaining_before = remaining;
    adjustment.remaining_after = new_remaining;
    if (type == AdjustmentType::EMERGENCY) {
        adjustment.banner = "EMERGENCY DETECTED | Green shortened by " + std::to_string(trim_sec) + "s";
    } else {
        adjustment.banner = "CONGESTION | Green shortened by " + std::to_string(trim_sec) + "s";
    }

    logger->info("[신호] {} - 차로 {} 잔여 {:.1f}초 -> {:.1f}초", adjustment.banner,
                 active_lane_, remaining, new_remaining);
    return true;
}

void PriorityScheduler::startPhase(int lane, const LaneSignalInput& input, double now) {
    active_lane_ = lane;
    phase_duration_ = computeDuration(input.occupancy, input.trend_slope);
    phase_start_ = now;
    phase_deadline_ = now + phase_duration_;
    last_green_[lane] = now;

    // 새 현시에서는 바로 단축 가능
    adjusted_ = false;
    last_adjust_time_ = 0;
}

std::map<int, int> PriorityScheduler::estimateWaits(const std::map<int, LaneSignalInput>& lanes,
                                                    double remaining) const {
    std::map<int, int> waits;
    int base = static_cast<int>(std::floor(remaining));

    for (int lane = 1; lane <= lane_count_; ++lane) {
        if (lane == active_lane_) continue;

        // 녹색 차로 다음부터 해당 차로까지 순환하며 현시 시간 합산
        int wait = base;
        int check = active_lane_;
        do {
            check = (check % lane_count_) + 1;
            LaneSignalInput input = getInput(lanes, check);
            wait += computeDuration(input.occupancy, input.trend_slope);
        } while (check != lane);
        waits[lane] = wait;
    }
    return waits;
}

void PriorityScheduler::checkInvariants() const {
    if (active_lane_ < 1 || active_lane_ > lane_count_) {
        logger->critical("[신호] 녹색 차로 범위 오류: {} (차로 수 {})", active_lane_, lane_count_);
        throw std::logic_error("active lane out of range: " + std::to_string(active_lane_));
    }
    if (phase_duration_ < config_.min_phase_sec || phase_duration_ > config_.max_phase_sec) {
        logger->critical("[신호] 현시 시간 범위 오류: {}초", phase_duration_);
        throw std::logic_error("phase duration out of bounds: " + std::to_string(phase_duration_));
    }
    if (phase_deadline_ - phase_start_ > phase_duration_ + 1e-9) {
        logger->critical("[신호] 현시가 연장됨: {:.3f}초 > {}초",
                         phase_deadline_ - phase_start_, phase_duration_);
        throw std::logic_error("phase deadline extended beyond its duration");
    }
}

SignalPhaseState PriorityScheduler::update(const std::map<int, LaneSignalInput>& lanes,
                                           const EmergencyState& emergency, double now) {
    SignalPhaseState state;

    if (!started_) {
        // 녹색을 받은 적 없는 차로는 시작 시점에 이미 최대 대기 상태
        for (int lane = 1; lane <= lane_count_; ++lane) {
            last_green_[lane] = now - config_.starvation_ceiling_sec;
        }
        startPhase(1, getInput(lanes, 1), now);
        started_ = true;
        logger->info("[신호] 시작 - 녹색 차로: 1, 현시: {}초", phase_duration_);
    }

    double elapsed = now - phase_start_;
    double remaining = std::max(0.0, phase_deadline_ - now);
    bool cooldown_ok = cooldownElapsed(now);

    // 긴급차량 단축
    if (emergency.active && emergency.lane != active_lane_ && cooldown_ok) {
        applyTrim(AdjustmentType::EMERGENCY, config_.emergency_trim_sec,
                  config_.emergency_floor_sec, now, state.adjustment);
    }
    // 혼잡 단축
    else if (cooldown_ok && elapsed >= config_.congestion_min_hold_sec &&
             remaining > config_.congestion_floor_sec) {
        int current = getInput(lanes, active_lane_).occupancy;
        int max_waiting = 0;
        for (int lane = 1; lane <= lane_count_; ++lane) {
            if (lane == active_lane_) continue;
            max_waiting = std::max(max_waiting, getInput(lanes, lane).occupancy);
        }
        if (current <= config_.congestion_clear_threshold &&
            max_waiting >= config_.congestion_high_threshold) {
            applyTrim(AdjustmentType::CONGESTION, config_.congestion_trim_sec,
                      config_.congestion_floor_sec, now, state.adjustment);
        }
    }

    // 타이머 만료 시 현시 전환
    if (now >= phase_deadline_) {
        int previous = active_lane_;
        bool forced = false;
        int next = selectNextLane(lanes, now, &forced);
        startPhase(next, getInput(lanes, next), now);

        state.phase_changed = true;
        state.change.from_lane = previous;
        state.change.to_lane = next;
        state.change.timestamp = now;
        state.change.duration_seconds = phase_duration_;
        state.change.forced = forced;

        logger->info("[신호] 현시 전환 {} -> {} ({}초{})", previous, next, phase_duration_,
                     forced ? ", 최대 대기 초과" : "");
    }

    checkInvariants();

    remaining = std::max(0.0, phase_deadline_ - now);
    state.active_lane = active_lane_;
    state.remaining_seconds = static_cast<int>(std::floor(remaining));
    state.phase_duration = phase_duration_;
    state.phase_start = phase_start_;
    state.phase_deadline = phase_deadline_;
    state.estimated_wait = estimateWaits(lanes, remaining);
    return state;
}
