#pragma once

#include "model/worktree.hpp"

#include <string_view>
#include <vector>

namespace discovery {

inline constexpr std::string_view kDetachedBranch = "HEAD";
inline constexpr std::string_view kDetachedName = "detached-head";

// Parse `git worktree list --porcelain`. The first `worktree` path is the
// main repo for every record. Timestamps start at `now`.
std::vector<Worktree> parse_worktree_list(std::string_view output, TimePoint now);

} // namespace discovery
