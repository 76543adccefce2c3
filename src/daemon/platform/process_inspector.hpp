#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

struct ProcessEntry {
    int pid = 0;
    std::string comm;                  // kernel process name
    std::vector<std::string> argv;     // empty for kernel threads
    std::optional<std::chrono::system_clock::time_point> start_time;

    // argv joined by spaces, or comm when argv is unavailable.
    std::string command_line() const;
};

// Read-only view of the running processes. Every call is best effort:
// processes that exit mid-scan are skipped, unreadable fields come back empty.
class ProcessInspector {
public:
    virtual ~ProcessInspector() = default;

    virtual std::vector<ProcessEntry> list_processes() const = 0;

    // Current working directory of pid, empty when it cannot be resolved.
    virtual std::string working_dir(int pid) const = 0;
};
