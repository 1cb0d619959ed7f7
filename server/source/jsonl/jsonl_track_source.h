#ifndef JSONL_TRACK_SOURCE_H
#define JSONL_TRACK_SOURCE_H

#include <fstream>
#include <string>
#include "../../core/track_source.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

/**
 * @brief JSON Lines 파일 기반 트랙 소스
 * 
 * 한 줄에 한 프레임
 * {"ts": 1700000000.04, "objects": [{"id": 3, "label": "car", "bbox": [x1, y1, x2, y2]}]}
 * 
 * "ts"는 선택 항목, 빈 줄과 형식이 잘못된 줄은 로그 후 건너뜀
 * 차종 어휘 밖 라벨 또는 필드가 잘못된 객체는 해당 객체만 제외
 */
class JsonLinesTrackSource : public TrackSource {
private:
    std::ifstream input_;
    std::string path_;
    int line_no_ = 0;
    int skipped_lines_ = 0;
    int dropped_objects_ = 0;

    std::shared_ptr<spdlog::logger> logger = nullptr;

public:
    JsonLinesTrackSource();
    ~JsonLinesTrackSource() override;

    // TrackSource 구현
    bool initialize(const std::string& path) override;
    void close() override;
    bool isOpen() const override { return input_.is_open(); }
    bool next(TrackFrame& frame) override;

    /**
     * @brief 한 줄 파싱
     * @param line JSON 문자열
     * @param frame [out] 파싱된 프레임
     * @return 프레임 형식이 유효하면 true
     */
    bool parseLine(const std::string& line, TrackFrame& frame);

    int getSkippedLines() const { return skipped_lines_; }
    int getDroppedObjects() const { return dropped_objects_; }
};

#endif
