#include "snapshot_store.h"

void SnapshotStore::publish(std::shared_ptr<const FrameSnapshot> snapshot) {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    latest_ = std::move(snapshot);
    version_++;
}

std::shared_ptr<const FrameSnapshot> SnapshotStore::latest() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return latest_;
}

std::shared_ptr<const FrameSnapshot> SnapshotStore::latest(uint64_t* version) const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    if (version) *version = version_;
    return latest_;
}

uint64_t SnapshotStore::version() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return version_;
}
