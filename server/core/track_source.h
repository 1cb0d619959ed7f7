#ifndef TRACK_SOURCE_H
#define TRACK_SOURCE_H

#include <string>
#include <vector>
#include "../../common/object_data.h"

/**
 * @brief 트래커 출력 한 프레임
 */
struct TrackFrame {
    bool has_timestamp = false;                 // 프레임에 시각이 포함되었는지
    double timestamp = 0;                       // 프레임 시각 (unix 초)
    std::vector<VehicleObservation> objects;    // 차종 어휘 안의 차량만
    int line_no = 0;                            // 입력 위치 (로그용)
};

/**
 * @brief 차량 추적 결과 제공자 인터페이스
 */
class TrackSource {
public:
    virtual ~TrackSource() = default;

    // 초기화 및 연결
    virtual bool initialize(const std::string& path) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    /**
     * @brief 다음 프레임 읽기
     * @param frame [out] 프레임
     * @return 프레임이 있으면 true, 입력 끝이면 false
     */
    virtual bool next(TrackFrame& frame) = 0;
};

#endif
