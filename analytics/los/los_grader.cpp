#include "los_grader.h"

struct LosStep {
    int upper;                  // 상한 (포함)
    const char* grade;
    const char* color;
    const char* description;
};

static const LosStep LOS_TABLE[] = {
    {3,  "A", "#4ade80", "Free flow"},
    {6,  "B", "#a3e635", "Reasonable free flow"},
    {10, "C", "#facc15", "Stable flow"},
    {15, "D", "#fb923c", "Approaching unstable"},
    {22, "E", "#f87171", "Unstable flow"},
};

LosGrade gradeLOS(int occupancy) {
    for (const auto& step : LOS_TABLE) {
        if (occupancy <= step.upper) {
            return {step.grade, step.color, step.description};
        }
    }
    return {"F", "#dc2626", "Forced / breakdown"};
}
