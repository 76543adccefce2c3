#include "model/snapshot.hpp"

#include "model/json.hpp"

#include <algorithm>

std::vector<AgentRecord> derive_agents(const std::vector<Worktree>& worktrees, TimePoint now) {
    std::vector<AgentRecord> agents;
    for (const auto& wt : worktrees) {
        if (!wt.agent) continue;

        AgentRecord rec;
        rec.worktree = wt.name;
        rec.path = wt.path;
        rec.branch = wt.branch;
        rec.type = wt.agent->type;
        rec.pid = wt.agent->pid;
        rec.start_time = wt.agent->start_time;
        if (rec.start_time) {
            rec.duration = format_duration(
                std::chrono::duration_cast<std::chrono::seconds>(now - *rec.start_time));
        }
        agents.push_back(std::move(rec));
    }
    return agents;
}

Snapshot make_snapshot(std::vector<Worktree> worktrees, TimePoint now) {
    std::ranges::stable_sort(worktrees, {}, &Worktree::name);

    Snapshot snap;
    snap.agents = derive_agents(worktrees, now);
    snap.worktrees = std::move(worktrees);
    snap.taken_at = now;
    return snap;
}
