#include "session_aggregator.h"
#include <sstream>
#include "../../common/common_types.h"

SessionAggregator::SessionAggregator(double session_start) {
    logger = getLogger("LS_Session_log");
    totals_.session_start = session_start;
    totals_.last_update = session_start;
    logger->info("세션 시작: {}", formatTime(session_start));
}

void SessionAggregator::update(const std::set<int>& frame_ids, int lane_vehicles,
                               int new_incidents, int new_violations, double now) {
    all_ids_.insert(frame_ids.begin(), frame_ids.end());
    totals_.unique_vehicles = static_cast<int>(all_ids_.size());

    if (lane_vehicles > totals_.peak_count) {
        totals_.peak_count = lane_vehicles;
        totals_.peak_time = now;
        logger->debug("최대 차량 수 갱신: {}대 ({})", lane_vehicles, formatTime(now, "%H:%M:%S"));
    }

    totals_.total_incidents += new_incidents;
    totals_.total_violations += new_violations;
    totals_.frames++;
    totals_.last_update = now;
}

std::string SessionAggregator::formatSummary() const {
    std::ostringstream ss;
    double duration = totals_.last_update - totals_.session_start;
    ss << "Session start     : " << formatTime(totals_.session_start, "%Y-%m-%d %H:%M:%S") << "\n"
       << "Duration          : " << static_cast<int>(duration) << "s\n"
       << "Frames            : " << totals_.frames << "\n"
       << "Unique vehicles   : " << totals_.unique_vehicles << "\n"
       << "Peak vehicles     : " << totals_.peak_count;
    if (totals_.peak_count > 0) {
        ss << " at " << formatTime(totals_.peak_time, "%H:%M:%S");
    }
    ss << "\n"
       << "Incidents         : " << totals_.total_incidents << "\n"
       << "Speed violations  : " << totals_.total_violations << "\n";
    return ss.str();
}

void SessionAggregator::logSummary() const {
    logger->info("========== 세션 요약 ==========");
    std::istringstream lines(formatSummary());
    std::string line;
    while (std::getline(lines, line)) {
        logger->info("  {}", line);
    }
    logger->info("===============================");
}
