#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// An agent process whose working directory is a worktree.
struct AgentInfo {
    std::string type;     // "claude", "gemini", ...
    int pid = 0;
    std::string path;     // agent's cwd
    std::optional<TimePoint> start_time;
    std::string command;  // full command line
};

// Dev server state as reported by the external supervisor.
struct ServerInfo {
    int port = 0;
    int pid = 0;
    std::string status;   // "running", "starting", "stopped", "stopping", "crashed"
    std::string url;
    std::string health;   // "healthy", "unhealthy", "unknown" or empty
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> stopped_at;

    bool is_running() const { return status == "running" || status == "starting"; }
};

struct Worktree {
    std::string name;       // sanitized, stable
    std::string path;       // absolute, unique within a discovery run
    std::string branch;     // ref name or "HEAD" when detached
    std::string main_repo;  // first worktree of the listing
    TimePoint discovered_at;
    TimePoint last_activity;

    bool has_server = false;
    bool has_claude = false;
    bool has_vscode = false;
    bool git_dirty = false;

    std::optional<AgentInfo> agent;
    std::optional<ServerInfo> server;
    std::vector<std::string> tags;
};

// Flattened agent view served to observers.
struct AgentRecord {
    std::string worktree;
    std::string path;
    std::string branch;
    std::string type;
    int pid = 0;
    std::optional<TimePoint> start_time;
    std::string duration;
};

// Immutable once published; the next pass replaces it wholesale.
struct Snapshot {
    std::vector<Worktree> worktrees;  // ordered by name
    std::vector<AgentRecord> agents;
    TimePoint taken_at;
};
