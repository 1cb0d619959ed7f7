#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H

#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>
#include "../common/config_types.h"
#include "../common/object_data.h"

// 중심점 기준 20x20 박스 차량 관측
inline VehicleObservation makeVehicle(int id, const std::string& label, double cx, double cy) {
    VehicleObservation obs;
    obs.object_id = id;
    obs.label = label;
    obs.bbox = makeBox(cx - 10, cy - 10, cx + 10, cy + 10);
    obs.center = getCenter(obs.bbox);
    return obs;
}

inline LaneRect makeLane(double x1, double y1, double x2, double y2) {
    LaneRect r;
    r.x1 = x1;
    r.y1 = y1;
    r.x2 = x2;
    r.y2 = y2;
    return r;
}

// 좌우로 나란한 두 차로 (x = 99~101 사이는 차로 밖)
inline AnalyticsConfig makeTwoLaneConfig() {
    AnalyticsConfig config;
    config.lanes.push_back(makeLane(0, 0, 99, 100));
    config.lanes.push_back(makeLane(101, 0, 200, 100));
    return config;
}

inline std::string makeTempDir() {
    char tmpl[] = "/tmp/lane_signal_test_XXXXXX";
    char* dir = mkdtemp(tmpl);
    return dir ? std::string(dir) : std::string("/tmp");
}

inline void writeFile(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

#endif // TEST_HELPERS_H
