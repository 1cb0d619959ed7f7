/**
 * @file snapshot_json.h
 * @brief 스냅샷/이벤트 JSON 변환 (Redis 전송용)
 */

#ifndef SNAPSHOT_JSON_H
#define SNAPSHOT_JSON_H

#include <string>
#include <json/json.h>
#include "frame_types.h"

/**
 * @brief 과속 이벤트 JSON 객체
 * 차로 미판정(0)은 null
 */
Json::Value violationToJson(const SpeedViolationEvent& event);

/**
 * @brief 정지 차량 돌발 JSON 객체
 */
Json::Value incidentToJson(const ActiveIncident& incident);

/**
 * @brief 신호 현시 상태 JSON 객체
 */
Json::Value signalToJson(const SignalPhaseState& signal);

/**
 * @brief 세션 누적 통계 JSON 객체
 */
Json::Value sessionToJson(const SessionTotals& session);

/**
 * @brief 프레임 스냅샷 전체 JSON 객체
 */
Json::Value snapshotToJson(const FrameSnapshot& snapshot);

/**
 * @brief JSON 객체를 한 줄 문자열로 변환 (전송용)
 */
std::string writeCompact(const Json::Value& value);

#endif // SNAPSHOT_JSON_H
