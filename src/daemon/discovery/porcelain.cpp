#include "discovery/porcelain.hpp"

#include "naming/sanitize.hpp"

#include <optional>

namespace discovery {

namespace {

std::string_view trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

void mark_detached(Worktree& wt) {
    wt.branch = kDetachedBranch;
    wt.name = kDetachedName;
}

// Bare entries carry neither branch nor HEAD; they still need a valid name.
void flush(std::optional<Worktree>& current, std::vector<Worktree>& out) {
    if (!current) return;
    if (current->name.empty()) current->name = naming::sanitize(current->branch);
    out.push_back(std::move(*current));
    current.reset();
}

} // namespace

std::vector<Worktree> parse_worktree_list(std::string_view output, TimePoint now) {
    std::vector<Worktree> worktrees;
    std::optional<Worktree> current;
    std::string main_repo;

    while (!output.empty()) {
        auto nl = output.find('\n');
        auto line = trim(output.substr(0, nl));
        output = nl == std::string_view::npos ? std::string_view{} : output.substr(nl + 1);

        if (line.starts_with("worktree ")) {
            flush(current, worktrees);

            std::string path(trim(line.substr(9)));
            if (main_repo.empty()) main_repo = path;

            current = Worktree{
                .path = std::move(path),
                .main_repo = main_repo,
                .discovered_at = now,
                .last_activity = now,
            };
        } else if (!current) {
            continue;
        } else if (line.starts_with("branch ")) {
            auto ref = trim(line.substr(7));
            if (ref.starts_with("refs/heads/")) ref.remove_prefix(11);
            current->branch = ref;
            current->name = naming::sanitize(ref);
        } else if (line.starts_with("HEAD ") && current->branch.empty()) {
            mark_detached(*current);
        } else if (line.starts_with("detached") && current->branch.empty()) {
            mark_detached(*current);
        }
    }

    flush(current, worktrees);
    return worktrees;
}

} // namespace discovery
