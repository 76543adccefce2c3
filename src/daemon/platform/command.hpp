#pragma once

#include <expected>
#include <string>
#include <vector>

namespace platform {

struct CommandResult {
    int exit_code = 0;
    std::string output;  // captured stdout

    bool ok() const { return exit_code == 0; }
};

// Run argv[0] (PATH lookup) with stdout captured and stderr discarded.
// An empty working_dir inherits ours. Errors are returned only when the
// process could not be started or reaped; a non-zero exit is a result.
std::expected<CommandResult, std::string>
run_command(const std::vector<std::string>& argv, const std::string& working_dir = {});

} // namespace platform
