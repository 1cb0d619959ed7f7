#ifndef LANE_TREND_TRACKER_H
#define LANE_TREND_TRACKER_H

#include <deque>
#include <map>
#include <string>
#include "../../common/config_types.h"

/**
 * @brief 차로 점유 추세 방향
 */
enum class TrendDirection {
    RISING,
    STABLE,
    FALLING
};

/**
 * @brief 차로별 점유 추세 추적 클래스
 *
 * 차로마다 최근 window_size 프레임의 점유 대수를 보관하고
 * 샘플 순번(시간 아님)에 대한 최소제곱 기울기를 계산
 * 프레임당 한 번 추가, 샘플 3개 미만이면 기울기 0
 */
class LaneTrendTracker {
private:
    TrendConfig config_;
    std::map<int, std::deque<int>> samples_;

public:
    explicit LaneTrendTracker(const TrendConfig& config);
    ~LaneTrendTracker() = default;

    /**
     * @brief 차로 점유 샘플 추가 (윈도우 초과 시 가장 오래된 샘플 삭제)
     * @param lane 차로 번호
     * @param total 이번 프레임 점유 대수
     */
    void addSample(int lane, int total);

    /**
     * @brief 최소제곱 기울기 (대/프레임)
     */
    double getSlope(int lane) const;

    TrendDirection getDirection(int lane) const;

    size_t getSampleCount(int lane) const;

    /**
     * @brief 추세 표시 문자 (↑ ↓ →)
     */
    static std::string toGlyph(TrendDirection direction);

    /**
     * @brief 추세 ASCII 문자 (^ v -), 로그/DB용
     */
    static std::string toAscii(TrendDirection direction);

    /**
     * @brief 추세 부호 (+1 / 0 / -1)
     */
    static int toSign(TrendDirection direction);
};

#endif // LANE_TREND_TRACKER_H
