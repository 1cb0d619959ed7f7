#include "jsonl_track_source.h"
#include <sstream>
#include <json/json.h>
#include "../../../common/common_types.h"

JsonLinesTrackSource::JsonLinesTrackSource() {
    logger = getLogger("LS_TrackSource_log");
    logger->info("JsonLinesTrackSource 생성");
}

JsonLinesTrackSource::~JsonLinesTrackSource() {
    close();
}

bool JsonLinesTrackSource::initialize(const std::string& path) {
    close();

    path_ = path;
    input_.open(path);
    if (!input_.is_open()) {
        logger->error("트랙 파일을 열 수 없음: {}", path);
        return false;
    }

    line_no_ = 0;
    skipped_lines_ = 0;
    dropped_objects_ = 0;
    logger->info("트랙 파일 열기 성공: {}", path);
    return true;
}

void JsonLinesTrackSource::close() {
    if (input_.is_open()) {
        input_.close();
        logger->info("트랙 파일 닫기: {} (읽은 줄: {}, 건너뛴 줄: {}, 제외 객체: {})",
                     path_, line_no_, skipped_lines_, dropped_objects_);
    }
}

bool JsonLinesTrackSource::next(TrackFrame& frame) {
    if (!input_.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(input_, line)) {
        line_no_++;

        // 공백만 있는 줄은 건너뜀
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        TrackFrame parsed;
        if (!parseLine(line, parsed)) {
            skipped_lines_++;
            continue;
        }
        parsed.line_no = line_no_;
        frame = std::move(parsed);
        return true;
    }
    return false;
}

bool JsonLinesTrackSource::parseLine(const std::string& line, TrackFrame& frame) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    std::istringstream stream(line);

    if (!Json::parseFromStream(builder, stream, &root, &errs)) {
        logger->warn("JSON 파싱 실패 (line {}): {}", line_no_, errs);
        return false;
    }

    if (!root.isObject() || !root.isMember("objects") || !root["objects"].isArray()) {
        logger->warn("objects 배열 없음 (line {})", line_no_);
        return false;
    }

    frame.has_timestamp = false;
    if (root.isMember("ts")) {
        if (!root["ts"].isNumeric()) {
            logger->warn("ts가 숫자가 아님 (line {})", line_no_);
            return false;
        }
        frame.has_timestamp = true;
        frame.timestamp = root["ts"].asDouble();
    }

    frame.objects.clear();
    for (const auto& item : root["objects"]) {
        if (!item.isObject() || !item["id"].isInt() || !item["label"].isString() ||
            !item["bbox"].isArray() || item["bbox"].size() != 4) {
            logger->debug("잘못된 객체 제외 (line {})", line_no_);
            dropped_objects_++;
            continue;
        }

        const Json::Value& bbox = item["bbox"];
        bool numeric = true;
        for (Json::ArrayIndex k = 0; k < 4; ++k) {
            if (!bbox[k].isNumeric()) numeric = false;
        }
        if (!numeric) {
            logger->debug("bbox 좌표 오류 - 객체 제외 (line {})", line_no_);
            dropped_objects_++;
            continue;
        }

        std::string label = item["label"].asString();
        if (!isVehicleLabel(label)) {
            logger->trace("차종 어휘 밖 라벨 제외: {} (line {})", label, line_no_);
            dropped_objects_++;
            continue;
        }

        VehicleObservation obs;
        obs.object_id = item["id"].asInt();
        obs.label = label;
        obs.bbox = makeBox(bbox[0].asDouble(), bbox[1].asDouble(),
                           bbox[2].asDouble(), bbox[3].asDouble());
        obs.center = getCenter(obs.bbox);
        frame.objects.push_back(obs);
    }
    return true;
}
