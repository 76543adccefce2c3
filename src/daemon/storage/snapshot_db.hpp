#pragma once

#include "model/worktree.hpp"

#include <optional>
#include <sqlite3.h>
#include <string>

// On-disk copy of the latest snapshot for out-of-process readers. Each
// replace() swaps the whole content in one transaction; nothing accumulates.
class SnapshotDb {
public:
    SnapshotDb();
    ~SnapshotDb();

    SnapshotDb(const SnapshotDb&) = delete;
    SnapshotDb& operator=(const SnapshotDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool replace(const Snapshot& snapshot);

    // nullopt when nothing has been written yet.
    std::optional<Snapshot> load();

private:
    bool create_tables();
    bool exec(const char* sql);
    bool insert_worktree(const Worktree& wt);
    bool insert_agent(const AgentRecord& agent);

    sqlite3* db_ = nullptr;
    sqlite3_stmt* worktree_stmt_ = nullptr;
    sqlite3_stmt* agent_stmt_ = nullptr;
    sqlite3_stmt* meta_stmt_ = nullptr;
};
