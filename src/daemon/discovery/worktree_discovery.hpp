#pragma once

#include "activity/activity_probe.hpp"
#include "model/worktree.hpp"

#include <expected>
#include <set>
#include <string>
#include <vector>

// Enumerates git worktrees for one repository or a whole directory tree.
class WorktreeDiscovery {
public:
    // probe may be null, in which case records come back unenriched.
    explicit WorktreeDiscovery(const ActivityProbe* probe = nullptr, bool verbose = false);

    // All worktrees of the repository at repo_path, in `git worktree list`
    // order. Fails only if the path cannot be resolved or git cannot list it.
    std::expected<std::vector<Worktree>, std::string> discover(const std::string& repo_path) const;

    // Walk base_path for repositories (not descending into them) and merge
    // their worktrees, first occurrence of a path wins. Negative max_depth
    // means unlimited. Unreadable directories are skipped.
    std::vector<Worktree> find_all(const std::string& base_path, int max_depth) const;

    // Directory names never descended into (besides hidden ones).
    static bool is_skipped_dir(const std::string& name);

private:
    void scan(const std::string& path, int depth, int max_depth,
              std::set<std::string>& seen, std::vector<Worktree>& out) const;

    void log(const std::string& msg) const;

    const ActivityProbe* probe_;
    bool verbose_;
};
