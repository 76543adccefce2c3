#pragma once

#include "platform/process_inspector.hpp"

#include <string>
#include <vector>

class ProcfsInspector : public ProcessInspector {
public:
    explicit ProcfsInspector(std::string proc_root = "/proc");

    std::vector<ProcessEntry> list_processes() const override;
    std::string working_dir(int pid) const override;

private:
    std::string read_comm(int pid) const;
    std::vector<std::string> read_cmdline(int pid) const;
    std::optional<std::chrono::system_clock::time_point> read_start_time(int pid) const;

    std::string proc_root_;
    std::chrono::system_clock::time_point boot_time_{};
    long clock_ticks_ = 100;
};
