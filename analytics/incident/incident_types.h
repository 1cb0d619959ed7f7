/**
 * @file incident_types.h
 * @brief 돌발상황(정지 차량) 감지 모듈 타입 정의
 */

#ifndef INCIDENT_TYPES_H
#define INCIDENT_TYPES_H

#include <string>
#include "../../common/object_data.h"

/**
 * @brief 진행 중인 정지 차량 돌발 정보 (프레임 단위 출력)
 */
struct ActiveIncident {
    int track_id = -1;
    int lane = 0;
    ObjPoint position = {-1, -1};   // 현재 중심점
    double duration = 0;            // 정지 지속 시간 (초)
};

// 돌발 이벤트 JSON 키
namespace IncidentJsonKeys {
    const std::string TRACE_ID = "track_id";
    const std::string LANE = "lane";
    const std::string POSITION = "position";
    const std::string DURATION = "duration";
    const std::string OCCUR_TIME = "timestamp";
}

#endif // INCIDENT_TYPES_H
