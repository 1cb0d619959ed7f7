/**
 * @file object_data.h
 * @brief 차량 관측 데이터 구조체
 * 
 * 트래커가 매 프레임 전달하는 차량 관측 정보와
 * 좌표 계산 헬퍼 정의
 */

#ifndef OBJECT_DATA_H
#define OBJECT_DATA_H

#include <cmath>
#include <string>

/**
 * @brief 2D 좌표 구조체 (픽셀)
 */
struct ObjPoint {
    double x;
    double y;
};

/**
 * @brief 바운딩 박스 구조체
 * 매 프레임마다 생성되고 사라지는 임시 데이터
 */
struct box {
    double top = -1;
    double height = -1;
    double left = -1;
    double width = -1;
};

/**
 * @brief 차량 관측 데이터 (프레임 단위, 임시)
 * 
 * === 초기값 정책 ===
 * - object_id: -1 (미설정)
 * - center: {-1, -1} (무효 좌표)
 * 
 * 트래커 ID는 차량이 화면에 있는 동안 유지됨
 */
struct VehicleObservation {
    int object_id = -1;             // 트래커 ID
    std::string label;              // 차종 라벨 (car, bus, truck, motorbike)
    box bbox;                       // 바운딩 박스
    ObjPoint center = {-1, -1};     // 박스 중심점
};

/**
 * @brief x1,y1,x2,y2 좌표로 박스 생성
 */
inline box makeBox(double x1, double y1, double x2, double y2) {
    box b;
    b.left = x1 < x2 ? x1 : x2;
    b.top = y1 < y2 ? y1 : y2;
    b.width = std::fabs(x2 - x1);
    b.height = std::fabs(y2 - y1);
    return b;
}

/**
 * @brief 박스의 중심점 계산
 * @param b 바운딩 박스
 * @return 중심점 좌표
 */
inline ObjPoint getCenter(const box& b) {
    return {b.left + b.width / 2.0, b.top + b.height / 2.0};
}

/**
 * @brief 두 점 사이의 거리 계산
 * @param p1 첫 번째 점
 * @param p2 두 번째 점
 * @return 유클리드 거리
 */
inline double calculateDistance(const ObjPoint& p1, const ObjPoint& p2) {
    double dx = p2.x - p1.x;
    double dy = p2.y - p1.y;
    return sqrt(dx * dx + dy * dy);
}

/**
 * @brief 위치가 유효한지 확인
 * @param pos 확인할 좌표
 * @return 유효하면 true, 무효(-1, -1)이면 false
 */
inline bool isValidPosition(const ObjPoint& pos) {
    return pos.x != -1 && pos.y != -1;
}

#endif // OBJECT_DATA_H
