#include "discovery/worktree_discovery.hpp"

#include "discovery/porcelain.hpp"
#include "platform/command.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <print>
#include <string_view>

namespace fs = std::filesystem;

WorktreeDiscovery::WorktreeDiscovery(const ActivityProbe* probe, bool verbose)
    : probe_(probe), verbose_(verbose) {}

std::expected<std::vector<Worktree>, std::string>
WorktreeDiscovery::discover(const std::string& repo_path) const {
    std::error_code ec;
    auto abs = fs::absolute(repo_path, ec);
    if (ec) {
        return std::unexpected("failed to get absolute path of " + repo_path + ": " + ec.message());
    }

    auto result = platform::run_command({"git", "worktree", "list", "--porcelain"}, abs.string());
    if (!result) {
        return std::unexpected("failed to list worktrees in " + abs.string() + ": " + result.error());
    }
    if (!result->ok()) {
        return std::unexpected("failed to list worktrees in " + abs.string() +
                               ": git exited with code " + std::to_string(result->exit_code));
    }

    auto worktrees = discovery::parse_worktree_list(result->output, Clock::now());

    if (probe_) {
        for (auto& wt : worktrees) {
            probe_->detect_activity(wt);
        }
    }

    return worktrees;
}

std::vector<Worktree> WorktreeDiscovery::find_all(const std::string& base_path, int max_depth) const {
    std::vector<Worktree> all;
    std::set<std::string> seen;
    scan(base_path, 0, max_depth, seen, all);
    return all;
}

bool WorktreeDiscovery::is_skipped_dir(const std::string& name) {
    static constexpr std::array<std::string_view, 8> skipped = {
        "node_modules", "vendor", "__pycache__", "venv", ".venv", "target", "build", "dist",
    };
    if (name.starts_with('.')) return true;
    return std::ranges::find(skipped, name) != skipped.end();
}

void WorktreeDiscovery::scan(const std::string& path, int depth, int max_depth,
                             std::set<std::string>& seen, std::vector<Worktree>& out) const {
    if (max_depth >= 0 && depth > max_depth) return;

    std::error_code ec;
    if (fs::is_directory(fs::path(path) / ".git", ec)) {
        auto worktrees = discover(path);
        if (!worktrees) {
            log("skipping " + path + ": " + worktrees.error());
            return;
        }
        for (auto& wt : *worktrees) {
            if (seen.insert(wt.path).second) {
                out.push_back(std::move(wt));
            }
        }
        return;  // don't descend into repositories
    }

    // Sorted for a stable scan order across runs
    std::vector<std::string> children;
    for (auto& entry : fs::directory_iterator(path, ec)) {
        std::error_code type_ec;
        if (!entry.is_directory(type_ec) || entry.is_symlink(type_ec)) continue;

        auto name = entry.path().filename().string();
        if (is_skipped_dir(name)) continue;
        children.push_back(entry.path().string());
    }
    std::ranges::sort(children);

    for (const auto& child : children) {
        scan(child, depth + 1, max_depth, seen, out);
    }
}

void WorktreeDiscovery::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[treewatch] {}", msg);
    }
}
