/**
 * @file los_grader.h
 * @brief 점유 대수 -> 서비스 수준(LOS) 등급 변환
 *
 * 상한 포함 계단 함수, 매 프레임 새로 계산 (히스테리시스 없음)
 * A<=3, B<=6, C<=10, D<=15, E<=22, F 그 외
 */

#ifndef LOS_GRADER_H
#define LOS_GRADER_H

#include <string>

struct LosGrade {
    std::string grade;          // "A" ~ "F"
    std::string color;          // 표시 색상 (#rrggbb)
    std::string description;
};

/**
 * @brief 점유 대수로 LOS 등급 계산
 * @param occupancy 차로 점유 대수
 * @return 등급, 색상, 설명
 */
LosGrade gradeLOS(int occupancy);

#endif // LOS_GRADER_H
