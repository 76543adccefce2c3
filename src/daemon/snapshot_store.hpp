#pragma once

#include "model/worktree.hpp"

#include <memory>
#include <mutex>

// Holds the most recently published snapshot. Readers get a shared reference
// they can keep using after the next publish replaces it.
class SnapshotStore {
public:
    SnapshotStore();

    void publish(Snapshot snapshot);
    std::shared_ptr<const Snapshot> current() const;

private:
    mutable std::mutex mu_;
    std::shared_ptr<const Snapshot> current_;
};
