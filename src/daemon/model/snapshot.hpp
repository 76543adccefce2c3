#pragma once

#include "model/worktree.hpp"

#include <vector>

// Flatten worktrees that carry a detected agent into agent records.
std::vector<AgentRecord> derive_agents(const std::vector<Worktree>& worktrees, TimePoint now);

// Sorts by name and derives the agent list.
Snapshot make_snapshot(std::vector<Worktree> worktrees, TimePoint now);
