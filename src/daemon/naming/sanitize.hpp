#pragma once

#include <string>
#include <string_view>

// Stable URL-safe identifiers for worktrees, derived from branch names.
namespace naming {

// Returned when a branch name sanitizes to nothing.
inline constexpr std::string_view kDefaultName = "default";

// "feature/auth" -> "feature-auth", "bugfix/JIRA_123" -> "bugfix-jira-123".
// Always returns a non-empty string of [a-z0-9-] with no leading, trailing or
// doubled hyphens. sanitize(sanitize(x)) == sanitize(x).
std::string sanitize(std::string_view raw);

// Validates externally supplied names: must start with a letter.
bool is_valid_name(std::string_view name);

} // namespace naming
