#ifndef SNAPSHOT_STORE_H
#define SNAPSHOT_STORE_H

#include <cstdint>
#include <memory>
#include <mutex>
#include "frame_types.h"

/**
 * @brief 최신 프레임 스냅샷 보관소
 *
 * 분석 스레드가 프레임마다 완성된 스냅샷을 통째로 교체하고
 * 리포팅 스레드는 포인터만 복사해서 읽음
 * 읽는 쪽은 항상 이전 프레임 전체 또는 현재 프레임 전체만 보게 됨
 */
class SnapshotStore {
private:
    mutable std::mutex snapshot_mutex_;
    std::shared_ptr<const FrameSnapshot> latest_;
    uint64_t version_ = 0;

public:
    SnapshotStore() = default;
    ~SnapshotStore() = default;

    /**
     * @brief 스냅샷 교체
     * @param snapshot 완성된 스냅샷 (이후 수정 금지)
     */
    void publish(std::shared_ptr<const FrameSnapshot> snapshot);

    /**
     * @brief 최신 스냅샷 조회
     * @return 아직 없으면 nullptr
     */
    std::shared_ptr<const FrameSnapshot> latest() const;

    /**
     * @brief 최신 스냅샷과 교체 횟수를 한 번에 조회
     * @param version [out] 반환한 스냅샷의 교체 횟수
     * @return 아직 없으면 nullptr
     */
    std::shared_ptr<const FrameSnapshot> latest(uint64_t* version) const;

    /**
     * @brief 교체 횟수 (새 스냅샷 여부 판단용)
     */
    uint64_t version() const;
};

#endif // SNAPSHOT_STORE_H
