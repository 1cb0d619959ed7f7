#ifndef SPEED_CLASSIFIER_H
#define SPEED_CLASSIFIER_H

#include <map>
#include <memory>
#include <set>
#include <string>
#include "speed_types.h"
#include "../../common/config_types.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

/**
 * @brief 과속 및 긴급차량 후보 판정 클래스
 *
 * 과속: 추정 속도 > 제한 속도
 * 차량별로 bucket_kmph 단위 구간을 기억하여 구간이 바뀔 때만 이벤트 발생
 * (같은 속도로 계속 달리는 차량은 한 번만 기록)
 *
 * 긴급차량 후보: 대형 차종 && 추정 속도 > emergency_speed_kmph && 차로 판정됨
 */
class SpeedClassifier {
private:
    SpeedConfig config_;

    // 차량별 마지막으로 기록된 과속 구간
    std::map<int, int> last_bucket_;

    // 이번 프레임 긴급차량 상태
    EmergencyState emergency_;

    std::shared_ptr<spdlog::logger> logger = nullptr;

public:
    explicit SpeedClassifier(const SpeedConfig& config);
    ~SpeedClassifier() = default;

    /**
     * @brief 프레임 시작 (긴급차량 상태 초기화)
     */
    void beginFrame();

    /**
     * @brief 과속 판정
     * @param track_id 차량 ID
     * @param label 차종
     * @param lane 차로 번호 (0이면 미판정)
     * @param speed_kmph 추정 속도
     * @param now 현재 시각
     * @param event [out] 새 과속 이벤트
     * @return 새 이벤트가 발생하면 true
     */
    bool checkViolation(int track_id, const std::string& label, int lane,
                        double speed_kmph, double now, SpeedViolationEvent& event);

    /**
     * @brief 긴급차량 후보 판정 (후보면 이번 프레임 긴급 차로를 덮어씀)
     * @return 후보이면 true
     */
    bool checkEmergency(const std::string& label, int lane, double speed_kmph);

    const EmergencyState& getEmergency() const { return emergency_; }

    /**
     * @brief 현재 프레임에 없는 차량의 과속 구간 기록 삭제
     */
    void evictInactive(const std::set<int>& active_ids);
};

#endif // SPEED_CLASSIFIER_H
