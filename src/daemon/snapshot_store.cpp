#include "snapshot_store.hpp"

SnapshotStore::SnapshotStore()
    : current_(std::make_shared<const Snapshot>(Snapshot{{}, {}, Clock::now()})) {}

void SnapshotStore::publish(Snapshot snapshot) {
    auto next = std::make_shared<const Snapshot>(std::move(snapshot));
    std::lock_guard lock(mu_);
    current_ = std::move(next);
}

std::shared_ptr<const Snapshot> SnapshotStore::current() const {
    std::lock_guard lock(mu_);
    return current_;
}
